#include "auth_config.h"

#include <cstdlib>
#include <cstring>
#include <fstream>

#include <nlohmann/json.hpp>
#include <sodium.h>

namespace dsauth {

static bool load_env_key(const char* name, unsigned char* out, size_t outLenExpected, bool* present) {
    const char* s = std::getenv(name);
    *present = (s != nullptr && *s != '\0');
    if (!*present) return true;

    size_t out_len = 0;
    if (sodium_base642bin(out, outLenExpected, s, std::strlen(s),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) return false;
    return out_len == outLenExpected;
}

static bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    const std::string s = v;
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

bool load_env_config(AuthConfig& cfg, std::string* err) {
    bool present = false;
    if (!load_env_key("DSAUTH_SECRET_B64URL", cfg.secret, sizeof(cfg.secret), &present)) {
        if (err) *err = "DSAUTH_SECRET_B64URL must be 32 bytes, base64url without padding";
        return false;
    }
    cfg.secret_from_env = present;
    if (!present) randombytes_buf(cfg.secret, sizeof(cfg.secret));

    if (const char* v = std::getenv("DSAUTH_ORIGIN")) cfg.origin = v;
    if (const char* v = std::getenv("DSAUTH_LISTEN_PORT")) {
        const int port = std::atoi(v);
        if (port <= 0 || port > 65535) {
            if (err) *err = std::string("invalid DSAUTH_LISTEN_PORT: ") + v;
            return false;
        }
        cfg.listen_port = port;
    }
    cfg.root_enabled = env_flag("DSAUTH_ROOT");
    if (const char* v = std::getenv("DSAUTH_SETTINGS_PATH")) cfg.settings_path = v;
    if (const char* v = std::getenv("DSAUTH_AUDIT_DIR")) cfg.audit_dir = v;

    while (!cfg.origin.empty() && cfg.origin.back() == '/') cfg.origin.pop_back();
    return true;
}

bool load_settings_file(const std::string& path, AuthConfig& cfg, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) return true;

    nlohmann::json j = nlohmann::json::parse(f, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (j.is_discarded() || !j.is_object()) {
        if (err) *err = "invalid JSON in " + path;
        return false;
    }

    AuthConfig next = cfg;

    auto it = j.find("allow_signed_tokens");
    if (it != j.end()) {
        if (!it->is_boolean()) {
            if (err) *err = "allow_signed_tokens must be a boolean";
            return false;
        }
        next.allow_signed_tokens = it->get<bool>();
    }

    it = j.find("audit_min_level");
    if (it != j.end()) {
        if (!it->is_string()) {
            if (err) *err = "audit_min_level must be a string";
            return false;
        }
        next.audit_min_level = it->get<std::string>();
    }

    cfg = next;
    return true;
}

} // namespace dsauth
