#include "token_codec.h"

#include <limits>

namespace dsauth {

static const char kBase62[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

static int base62_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return 10 + (c - 'A');
    if (c >= 'a' && c <= 'z') return 36 + (c - 'a');
    return -1;
}

std::string base62_encode(long long v) {
    if (v <= 0) return "0";
    std::string out;
    while (v > 0) {
        out.insert(out.begin(), kBase62[v % 62]);
        v /= 62;
    }
    return out;
}

bool base62_decode(const std::string& s, long long& out) {
    if (s.empty()) return false;

    const long long max = std::numeric_limits<long long>::max();
    long long v = 0;
    for (char c : s) {
        const int d = base62_digit(c);
        if (d < 0) return false;
        if (v > (max - d) / 62) return false; // overflow
        v = v * 62 + d;
    }
    out = v;
    return true;
}

nlohmann::json encode_session(const nlohmann::json& actor, std::optional<long> expires_at) {
    nlohmann::json p = {{"a", actor}};
    if (expires_at) p["e"] = base62_encode(*expires_at);
    return p;
}

std::optional<nlohmann::json> decode_session(const nlohmann::json& payload, long now) {
    if (!payload.is_object()) return std::nullopt;

    // Exactly "a" plus optional "e"; anything else is not our format.
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (it.key() != "a" && it.key() != "e") return std::nullopt;
    }

    auto a = payload.find("a");
    if (a == payload.end() || !a->is_object()) return std::nullopt;

    auto e = payload.find("e");
    if (e != payload.end()) {
        if (!e->is_string()) return std::nullopt;
        long long expires_at = 0;
        if (!base62_decode(e->get<std::string>(), expires_at)) return std::nullopt;
        if ((long long)now >= expires_at) return std::nullopt;
    }

    return *a;
}

nlohmann::json encode_token(const std::string& actor_id, std::optional<long> expires_at) {
    nlohmann::json p;
    p["a"] = actor_id;
    if (expires_at) p["e"] = *expires_at;
    else            p["e"] = nullptr;
    return p;
}

std::optional<nlohmann::json> decode_token(const nlohmann::json& payload, long now) {
    if (!payload.is_object()) return std::nullopt;

    auto a = payload.find("a");
    if (a == payload.end() || !a->is_string()) return std::nullopt;

    auto e = payload.find("e");
    if (e != payload.end() && !e->is_null()) {
        if (!e->is_number_integer()) return std::nullopt;
        if ((long long)now >= e->get<long long>()) return std::nullopt;
    }

    nlohmann::json actor;
    actor["id"] = a->get<std::string>();
    actor[TOKEN_MARKER_KEY] = TOKEN_MARKER_VALUE;
    return actor;
}

} // namespace dsauth
