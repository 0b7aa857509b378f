#pragma once
#include <string>

namespace dsauth {

/*
Process configuration, read once at startup.

Environment (DSAUTH_*) carries deployment values and the signing key; the
optional JSON settings file carries feature switches an operator may edit.
*/
struct AuthConfig {
    unsigned char secret[32] = {0};
    bool secret_from_env = false;

    std::string origin = "http://127.0.0.1:8001";
    int listen_port = 8001;
    bool root_enabled = false;

    std::string settings_path;        // "" => <repo>/config/settings.json
    std::string audit_dir;            // "" => <exe dir>/audit

    // settings.json
    bool allow_signed_tokens = true;
    std::string audit_min_level = "INFO";

    bool secure_cookies() const { return origin.rfind("https://", 0) == 0; }
};

// Reads DSAUTH_* variables. A missing DSAUTH_SECRET_B64URL yields a fresh
// random key (cookies and tokens then die with the process). A present but
// malformed key is an error.
bool load_env_config(AuthConfig& cfg, std::string* err);

// Missing file => defaults, returns true. Unparsable file => false, defaults kept.
bool load_settings_file(const std::string& path, AuthConfig& cfg, std::string* err);

} // namespace dsauth
