#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "httplib.h"

namespace dsauth {

class Signer;

inline constexpr const char* ACTOR_COOKIE        = "ds_actor";
inline constexpr const char* BEARER_TOKEN_PREFIX = "dstok_";

enum class ActorSource {
    None,
    Cookie,
    Token,
};

struct ResolvedActor {
    std::optional<nlohmann::json> actor;   // nullopt => anonymous
    ActorSource source = ActorSource::None;

    bool present() const { return actor.has_value(); }
    bool via_token() const { return source == ActorSource::Token; }
};

/*
ActorResolver
=============

Turns request credentials into at most one trusted actor.

Precedence (first present source decides, no fallback):
  1) Authorization: Bearer dstok_<signed>   (namespace "token")
  2) Cookie ds_actor                        (namespace "actor")
  3) anonymous

A bad signature, wrong namespace, malformed payload or expiry all resolve
to anonymous; callers cannot tell them apart. An Authorization header
without the "Bearer dstok_" form is not a token credential and the cookie
is still consulted.

Stateless and thread-safe: one instance serves every request.
*/
class ActorResolver {
public:
    ActorResolver(const Signer& signer, std::function<long()> now_epoch);

    void set_allow_signed_tokens(bool v) { allow_signed_tokens_ = v; }
    bool allow_signed_tokens() const { return allow_signed_tokens_; }

    ResolvedActor resolve(const httplib::Request& req) const;

private:
    const Signer& signer_;
    std::function<long()> now_epoch_;
    bool allow_signed_tokens_ = true;

    // Returns true if the request carried a dstok_ bearer token (valid or not).
    bool bearer_token_(const httplib::Request& req, std::string& out_signed) const;
};

/*
Request-scoped, memoized view of the resolved actor.

Lives on the handler's stack. The first call resolves; later calls return
the same object.
*/
class RequestActor {
public:
    RequestActor(const ActorResolver& resolver, const httplib::Request& req)
        : resolver_(resolver), req_(req) {}

    const ResolvedActor& get();

    // nullptr when anonymous.
    const nlohmann::json* actor() {
        const auto& r = get();
        return r.actor ? &*r.actor : nullptr;
    }

private:
    const ActorResolver& resolver_;
    const httplib::Request& req_;
    std::optional<ResolvedActor> cached_;
};

} // namespace dsauth
