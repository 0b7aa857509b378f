#include "auth_routes.h"

#include "actor_resolver.h"
#include "audit_fields.h"
#include "audit_log.h"
#include "auth_views.h"
#include "flash_messages.h"
#include "http_cookies.h"
#include "root_bootstrap.h"
#include "session_termination.h"
#include "signer.h"
#include "token_codec.h"
#include "token_issuer.h"

#include <iostream>
#include <map>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*
Auth endpoints
==============

Every handler resolves the actor through a request-scoped RequestActor, so
the credential is verified at most once per request no matter how many
decisions read it.

Status policy:
- Forbidden is a bare 403 "Forbidden"; the body never says which check
  failed.
- Validation problems on the create-token form re-render the form with 200.
*/

static void reply_json(httplib::Response& res, int code, const std::string& body_json) {
    res.status = code;
    res.set_header("Content-Type", "application/json");
    res.body = body_json;
}

static void reply_html(httplib::Response& res, int code, const std::string& body) {
    res.status = code;
    res.set_header("Cache-Control", "no-store");
    res.set_content(body, "text/html; charset=utf-8");
}

static void reply_forbidden(httplib::Response& res) {
    res.status = 403;
    res.set_content("Forbidden", "text/plain");
}

static void redirect_root(httplib::Response& res) {
    res.status = 302;
    res.set_header("Location", "/");
}

static void audit_emit(const AuthRoutesContext& ctx,
                       const httplib::Request& req,
                       const std::string& event,
                       const std::string& outcome,
                       dsauth::AuditEvent::Level level,
                       const std::map<std::string, std::string>& fields = {}) {
    if (!ctx.audit) return;
    dsauth::AuditEvent ev;
    ev.event = event;
    ev.outcome = outcome;
    ev.level = level;
    ev.f = fields;
    ev.f["ip"] = dsauth::audit_ip(req);
    ev.f["ua"] = dsauth::audit_ua(req);
    ctx.audit->append(ev);
}

static std::string param_or_empty(const httplib::Request& req, const char* name) {
    return req.has_param(name) ? req.get_param_value(name) : std::string();
}

// -----------------------------------------------------------------------------
// GET /
// -----------------------------------------------------------------------------

void handle_index(const httplib::Request& req, httplib::Response& res,
                  const AuthRoutesContext& ctx, dsauth::RequestActor& ra) {
    std::optional<std::string> label;
    if (const json* actor = ra.actor()) label = actor_display_label(*actor);

    const auto messages = dsauth::consume_messages(*ctx.signer, req, res, ctx.secure_cookies);
    reply_html(res, 200, dsauth::render_index(label ? &*label : nullptr, messages));
}

// -----------------------------------------------------------------------------
// GET /-/auth-token?token=<secret>
// -----------------------------------------------------------------------------

void handle_auth_token(const httplib::Request& req, httplib::Response& res, const AuthRoutesContext& ctx) {
    if (!ctx.root) {
        reply_forbidden(res);
        return;
    }

    const std::string supplied = param_or_empty(req, "token");
    if (ctx.root->redeem(supplied) != dsauth::RootBootstrap::Outcome::Redeemed) {
        audit_emit(ctx, req, "auth.root_redeem", "deny", dsauth::AuditEvent::Level::SECURITY,
                   {{"reason", ctx.root->consumed() ? "consumed" : "mismatch"}});
        reply_forbidden(res);
        return;
    }

    const json root_actor = {{"id", "root"}};
    dsauth::CookieOptions opt;
    opt.secure = ctx.secure_cookies;
    dsauth::set_cookie(res, dsauth::ACTOR_COOKIE,
                       ctx.signer->sign(dsauth::encode_session(root_actor), dsauth::NS_ACTOR),
                       opt);

    audit_emit(ctx, req, "auth.root_redeem", "ok", dsauth::AuditEvent::Level::SECURITY,
               {{"actor", "root"}});
    std::cerr << "[root] bootstrap token redeemed from " << dsauth::audit_ip(req) << std::endl;

    redirect_root(res);
}

// -----------------------------------------------------------------------------
// /-/create-token
// -----------------------------------------------------------------------------

static bool create_token_allowed(const AuthRoutesContext& ctx,
                                 dsauth::RequestActor& ra,
                                 std::string* out_actor_id) {
    if (!ctx.resolver->allow_signed_tokens()) return false;
    return dsauth::may_create_token(ra.get(), out_actor_id);
}

void handle_create_token_get(const httplib::Request&, httplib::Response& res,
                             const AuthRoutesContext& ctx, dsauth::RequestActor& ra) {
    std::string actor_id;
    if (!create_token_allowed(ctx, ra, &actor_id)) {
        reply_forbidden(res);
        return;
    }

    reply_html(res, 200, dsauth::render_create_token(actor_id, {}, nullptr));
}

void handle_create_token_post(const httplib::Request& req, httplib::Response& res,
                              const AuthRoutesContext& ctx, dsauth::RequestActor& ra) {
    std::string actor_id;
    if (!create_token_allowed(ctx, ra, &actor_id)) {
        audit_emit(ctx, req, "auth.token_denied", "deny", dsauth::AuditEvent::Level::INFO,
                   {{"reason", ra.get().via_token() ? "token_actor" : "not_allowed"}});
        reply_forbidden(res);
        return;
    }
    if (ctx.csrf_ok && !ctx.csrf_ok(req)) {
        reply_forbidden(res);
        return;
    }

    const std::string expire_type = param_or_empty(req, "expire_type");
    std::optional<std::string> expire_duration;
    if (req.has_param("expire_duration")) expire_duration = req.get_param_value("expire_duration");

    const long now = ctx.now_epoch();
    std::optional<long> expires_at;
    std::string err;
    if (!dsauth::parse_expiry(expire_type, expire_duration, now, &expires_at, &err)) {
        reply_html(res, 200, dsauth::render_create_token(actor_id, {err}, nullptr));
        return;
    }

    const std::string token = dsauth::mint_api_token(*ctx.signer, actor_id, expires_at);

    audit_emit(ctx, req, "auth.token_created", "ok", dsauth::AuditEvent::Level::ADMIN,
               {{"actor", dsauth::shorten(actor_id)},
                {"expires_at", expires_at ? std::to_string(*expires_at) : "never"}});

    reply_html(res, 200, dsauth::render_create_token(actor_id, {}, &token));
}

// -----------------------------------------------------------------------------
// GET /-/actor.json
// -----------------------------------------------------------------------------

void handle_actor_json(const httplib::Request&, httplib::Response& res,
                       const AuthRoutesContext&, dsauth::RequestActor& ra) {
    json out;
    if (const json* actor = ra.actor()) out["actor"] = *actor;
    else                                out["actor"] = nullptr;

    reply_json(res, 200, out.dump());
}

// -----------------------------------------------------------------------------
// CSRF collaborator (default): same-origin POST
// -----------------------------------------------------------------------------

bool same_origin_post(const httplib::Request& req, const std::string& origin) {
    auto it = req.headers.find("Origin");
    if (it != req.headers.end()) return it->second == origin;

    it = req.headers.find("Referer");
    if (it != req.headers.end()) {
        const std::string& ref = it->second;
        return ref == origin || ref.rfind(origin + "/", 0) == 0;
    }

    // Non-browser clients send neither header.
    return true;
}

// -----------------------------------------------------------------------------
// Registration
// -----------------------------------------------------------------------------

// Resolves the actor before the handler runs and hands it over, so every
// handler sees the same request-scoped result.
template <typename Handler>
static httplib::Server::Handler with_actor(const AuthRoutesContext& ctx, Handler h) {
    return [ctx, h](const httplib::Request& req, httplib::Response& res) {
        dsauth::RequestActor ra(*ctx.resolver, req);
        ra.get();
        h(req, res, ctx, ra);
    };
}

void register_auth_routes(httplib::Server& srv, const AuthRoutesContext& ctx) {
    // ctx is copied into each handler; the pointers it holds must outlive srv.
    srv.Get("/", with_actor(ctx, handle_index));
    srv.Get("/-/auth-token", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_auth_token(req, res, ctx);
    });
    srv.Get("/-/create-token", with_actor(ctx, handle_create_token_get));
    srv.Post("/-/create-token", with_actor(ctx, handle_create_token_post));
    srv.Get("/-/logout", with_actor(ctx, handle_logout_get));
    srv.Post("/-/logout", with_actor(ctx, handle_logout_post));
    srv.Get("/-/actor.json", with_actor(ctx, handle_actor_json));
}
