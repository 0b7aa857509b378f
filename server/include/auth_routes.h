#pragma once
#include <httplib.h>

#include <functional>
#include <string>

namespace dsauth {
class Signer;
class ActorResolver;
class RootBootstrap;
class AuditLog;
class RequestActor;
} // namespace dsauth

// Everything the auth endpoints need, owned by main.cpp (or by a test).
// Handlers only read through these pointers; RootBootstrap carries its own
// synchronization and AuditLog serializes its writers.
struct AuthRoutesContext {
    const dsauth::Signer* signer = nullptr;
    const dsauth::ActorResolver* resolver = nullptr;

    // nullptr => root bootstrap disabled, /-/auth-token always 403
    dsauth::RootBootstrap* root = nullptr;

    // optional
    dsauth::AuditLog* audit = nullptr;

    bool secure_cookies = false;

    // Verified-POST guarantee supplied by the CSRF layer. Empty => every POST
    // counts as verified (tests, or a front proxy that enforces it).
    // main.cpp installs same_origin_post, which also accepts a POST carrying
    // neither Origin nor Referer: browsers send one of them on form posts, and
    // the SameSite=Lax cookies are not attached to cross-site POSTs anyway.
    std::function<bool(const httplib::Request&)> csrf_ok;

    std::function<long()> now_epoch;
};

// Handlers taking a RequestActor get it already resolved: register_auth_routes
// resolves the actor before the handler body runs.

// GET /
void handle_index(const httplib::Request& req, httplib::Response& res,
                  const AuthRoutesContext& ctx, dsauth::RequestActor& ra);

// GET /-/auth-token?token=<secret>
void handle_auth_token(const httplib::Request& req, httplib::Response& res, const AuthRoutesContext& ctx);

// GET and POST /-/create-token
void handle_create_token_get(const httplib::Request& req, httplib::Response& res,
                             const AuthRoutesContext& ctx, dsauth::RequestActor& ra);
void handle_create_token_post(const httplib::Request& req, httplib::Response& res,
                              const AuthRoutesContext& ctx, dsauth::RequestActor& ra);

// GET /-/actor.json
void handle_actor_json(const httplib::Request& req, httplib::Response& res,
                       const AuthRoutesContext& ctx, dsauth::RequestActor& ra);

// Same-origin check for POSTs: Origin (or Referer) must match `origin`
// when the client sends one. A POST with neither header passes.
bool same_origin_post(const httplib::Request& req, const std::string& origin);

void register_auth_routes(httplib::Server& srv, const AuthRoutesContext& ctx);
