#include "actor_resolver.h"

#include "http_cookies.h"
#include "signer.h"
#include "token_codec.h"

#include <utility>

namespace dsauth {

ActorResolver::ActorResolver(const Signer& signer, std::function<long()> now_epoch)
    : signer_(signer), now_epoch_(std::move(now_epoch)) {}

bool ActorResolver::bearer_token_(const httplib::Request& req, std::string& out_signed) const {
    auto it = req.headers.find("Authorization");
    if (it == req.headers.end()) return false;

    static const std::string kBearer = "Bearer ";
    const std::string& hdr = it->second;
    if (hdr.compare(0, kBearer.size(), kBearer) != 0) return false;

    const std::string token = hdr.substr(kBearer.size());
    const std::string prefix = BEARER_TOKEN_PREFIX;
    if (token.compare(0, prefix.size(), prefix) != 0) return false;

    out_signed = token.substr(prefix.size());
    return true;
}

ResolvedActor ActorResolver::resolve(const httplib::Request& req) const {
    ResolvedActor r;
    const long now = now_epoch_();

    // ---------------------------------------------------------------------
    // 1) Bearer API token. Presence short-circuits the cookie.
    // ---------------------------------------------------------------------
    std::string signed_token;
    if (allow_signed_tokens_ && bearer_token_(req, signed_token)) {
        nlohmann::json payload;
        if (!signer_.unsign(signed_token, NS_TOKEN, payload)) return r;

        auto actor = decode_token(payload, now);
        if (!actor) return r;

        r.actor = std::move(*actor);
        r.source = ActorSource::Token;
        return r;
    }

    // ---------------------------------------------------------------------
    // 2) Signed actor cookie
    // ---------------------------------------------------------------------
    std::string cookie_val;
    if (get_cookie(req, ACTOR_COOKIE, cookie_val) && !cookie_val.empty()) {
        nlohmann::json payload;
        if (!signer_.unsign(cookie_val, NS_ACTOR, payload)) return r;

        auto actor = decode_session(payload, now);
        if (!actor) return r;

        r.actor = std::move(*actor);
        r.source = ActorSource::Cookie;
        return r;
    }

    // 3) anonymous
    return r;
}

const ResolvedActor& RequestActor::get() {
    if (!cached_) cached_ = resolver_.resolve(req_);
    return *cached_;
}

} // namespace dsauth
