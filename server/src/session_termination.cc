#include "session_termination.h"

#include "actor_resolver.h"
#include "audit_fields.h"
#include "audit_log.h"
#include "auth_views.h"
#include "flash_messages.h"
#include "http_cookies.h"

using json = nlohmann::json;

std::string actor_display_label(const json& actor) {
    auto it = actor.find("id");
    if (it != actor.end() && !it->is_null()) {
        if (it->is_string()) return it->get<std::string>();
        return it->dump();
    }
    return actor.dump(-1, ' ', false, json::error_handler_t::replace);
}

void handle_logout_get(const httplib::Request&, httplib::Response& res,
                       const AuthRoutesContext&, dsauth::RequestActor& ra) {
    const json* actor = ra.actor();
    if (!actor) {
        // Nothing to log out of.
        res.status = 302;
        res.set_header("Location", "/");
        return;
    }

    res.status = 200;
    res.set_header("Cache-Control", "no-store");
    res.set_content(dsauth::render_logout(actor_display_label(*actor)), "text/html; charset=utf-8");
}

void handle_logout_post(const httplib::Request& req, httplib::Response& res,
                        const AuthRoutesContext& ctx, dsauth::RequestActor& ra) {
    if (ctx.csrf_ok && !ctx.csrf_ok(req)) {
        res.status = 403;
        res.set_content("Forbidden", "text/plain");
        return;
    }

    const json* actor = ra.actor();

    dsauth::delete_cookie(res, dsauth::ACTOR_COOKIE, ctx.secure_cookies);
    dsauth::add_message(*ctx.signer, req, res, LOGGED_OUT_MESSAGE,
                        dsauth::MessageLevel::Warning, ctx.secure_cookies);

    if (ctx.audit) {
        dsauth::AuditEvent ev;
        ev.event = "auth.logout";
        ev.outcome = "ok";
        ev.level = dsauth::AuditEvent::Level::INFO;
        if (actor) ev.f["actor"] = dsauth::shorten(actor_display_label(*actor));
        ev.f["ip"] = dsauth::audit_ip(req);
        ctx.audit->append(ev);
    }

    res.status = 302;
    res.set_header("Location", "/");
}
