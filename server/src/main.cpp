/*
dsauth server
=============

Actor authentication for a multi-user data browser, with no session store:

- Identity travels in signed client-held envelopes (cookie ds_actor,
  bearer dstok_ tokens, flash cookie ds_messages), each bound to its own
  signing namespace.
- Each request resolves at most one actor: bearer token first, then cookie,
  else anonymous. Broken or expired credentials read as anonymous.
- The only server-side state is the one-time root bootstrap flag and the
  audit log.

Environment
-----------
  DSAUTH_SECRET_B64URL   32-byte signing key (base64url, no padding)
  DSAUTH_ORIGIN          public origin, https => Secure cookies
  DSAUTH_LISTEN_PORT     default 8001
  DSAUTH_ROOT=1          enable root bootstrap, print the login URL
  DSAUTH_SETTINGS_PATH   JSON settings (allow_signed_tokens, audit_min_level)
  DSAUTH_AUDIT_DIR       audit log directory
*/

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <limits.h>
#include <unistd.h>

#include <sodium.h>

// header-only HTTP server
#include "httplib.h"

#include "actor_resolver.h"
#include "audit_log.h"
#include "auth_config.h"
#include "auth_routes.h"
#include "dsauth_util.h"
#include "root_bootstrap.h"
#include "signer.h"

// Return directory that contains the running executable
static std::string exe_dir() {
    char buf[PATH_MAX] = {0};
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    std::string p(buf, (size_t)n);
    return std::filesystem::path(p).parent_path().string();
}

// -----------------------------------------------------------------------------
// main
// -----------------------------------------------------------------------------
int main()
{
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    dsauth::AuthConfig cfg;
    std::string err;
    if (!dsauth::load_env_config(cfg, &err)) {
        std::cerr << "[config] FATAL: " << err << std::endl;
        return 2;
    }
    if (!cfg.secret_from_env) {
        std::cerr << "[config] DSAUTH_SECRET_B64URL not set, using a random key; "
                     "cookies and tokens will not survive a restart" << std::endl;
    }

    // build/bin/dsauth_server -> repo root is two levels up
    const std::string repo_root = std::filesystem::weakly_canonical(
        std::filesystem::path(exe_dir()) / ".." / ".."
    ).string();

    if (cfg.settings_path.empty()) {
        cfg.settings_path = (std::filesystem::path(repo_root) / "config" / "settings.json").string();
    }
    if (!dsauth::load_settings_file(cfg.settings_path, cfg, &err)) {
        std::cerr << "[settings] WARNING: " << err << ", using defaults" << std::endl;
    }

    // ---- Audit log (hash-chained JSONL) ----
    if (cfg.audit_dir.empty()) cfg.audit_dir = exe_dir() + "/audit";
    try {
        std::filesystem::create_directories(cfg.audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    dsauth::AuditLog audit(cfg.audit_dir + "/dsauth_audit.jsonl",
                           cfg.audit_dir + "/dsauth_audit.state");
    if (!audit.set_min_level_str(cfg.audit_min_level)) {
        std::cerr << "[settings] WARNING: invalid audit_min_level '" << cfg.audit_min_level
                  << "', keeping " << audit.min_level_str() << std::endl;
    }

    // ---- Auth core ----
    dsauth::Signer signer(cfg.secret);
    sodium_memzero(cfg.secret, sizeof(cfg.secret));

    dsauth::ActorResolver resolver(signer, &dsauth::now_epoch);
    resolver.set_allow_signed_tokens(cfg.allow_signed_tokens);

    std::unique_ptr<dsauth::RootBootstrap> root;
    if (cfg.root_enabled) {
        root = std::make_unique<dsauth::RootBootstrap>();
        // The one place the secret is shown; never logged to the audit file.
        std::cerr << "[root] login once at: " << root->login_url(cfg.origin) << std::endl;
    }

    {
        dsauth::AuditEvent ev;
        ev.event = "server.start";
        ev.outcome = "ok";
        ev.level = dsauth::AuditEvent::Level::ADMIN;
        ev.f["origin"] = cfg.origin;
        ev.f["root_enabled"] = cfg.root_enabled ? "true" : "false";
        ev.f["allow_signed_tokens"] = cfg.allow_signed_tokens ? "true" : "false";
        audit.append(ev);
    }

    AuthRoutesContext ctx;
    ctx.signer = &signer;
    ctx.resolver = &resolver;
    ctx.root = root.get();
    ctx.audit = &audit;
    ctx.secure_cookies = cfg.secure_cookies();
    ctx.now_epoch = &dsauth::now_epoch;
    const std::string origin = cfg.origin;
    ctx.csrf_ok = [origin](const httplib::Request& req) {
        return same_origin_post(req, origin);
    };

    httplib::Server srv;
    register_auth_routes(srv, ctx);

    std::cerr << "dsauth server listening on 0.0.0.0:" << cfg.listen_port << std::endl;
    if (!srv.listen("0.0.0.0", cfg.listen_port)) {
        std::cerr << "[server] FATAL: cannot listen on port " << cfg.listen_port << std::endl;
        return 3;
    }
    return 0;
}
