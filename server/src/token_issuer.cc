#include "token_issuer.h"

#include "actor_resolver.h"
#include "signer.h"
#include "token_codec.h"

#include <cctype>
#include <limits>

namespace dsauth {

// Whole-string signed decimal; rejects "", "x", "10x", " 10".
static bool parse_int_strict(const std::string& s, long long& out) {
    if (s.empty()) return false;

    size_t i = 0;
    bool neg = false;
    if (s[0] == '-' || s[0] == '+') {
        neg = (s[0] == '-');
        i = 1;
    }
    if (i >= s.size()) return false;

    const long long max = std::numeric_limits<long long>::max();
    long long v = 0;
    for (; i < s.size(); i++) {
        if (!std::isdigit((unsigned char)s[i])) return false;
        const int d = s[i] - '0';
        if (v > (max - d) / 10) return false;
        v = v * 10 + d;
    }
    out = neg ? -v : v;
    return true;
}

static long long seconds_per_unit(const std::string& expire_type) {
    if (expire_type == "minutes") return 60;
    if (expire_type == "hours")   return 60 * 60;
    if (expire_type == "days")    return 60 * 60 * 24;
    return 0;
}

bool parse_expiry(const std::string& expire_type,
                  const std::optional<std::string>& expire_duration,
                  long now,
                  std::optional<long>* out_expires_at,
                  std::string* err) {
    if (expire_type.empty()) {
        if (out_expires_at) *out_expires_at = std::nullopt;
        return true;
    }

    auto fail = [&]() {
        if (err) *err = INVALID_EXPIRE_DURATION;
        return false;
    };

    const long long unit = seconds_per_unit(expire_type);
    if (unit == 0) return fail();
    if (!expire_duration) return fail();

    long long duration = 0;
    if (!parse_int_strict(*expire_duration, duration)) return fail();
    if (duration <= 0) return fail();

    // Keep now + seconds representable.
    const long long room = (long long)std::numeric_limits<long>::max() - (long long)now;
    if (duration > room / unit) return fail();

    if (out_expires_at) *out_expires_at = (long)(now + duration * unit);
    return true;
}

bool may_create_token(const ResolvedActor& ra, std::string* out_actor_id) {
    if (!ra.present() || ra.via_token()) return false;

    const nlohmann::json& actor = *ra.actor;
    auto it = actor.find("id");
    if (it == actor.end() || it->is_null()) return false;

    std::string id;
    if (it->is_string()) id = it->get<std::string>();
    else                 id = it->dump();
    if (id.empty()) return false;

    if (out_actor_id) *out_actor_id = id;
    return true;
}

std::string mint_api_token(const Signer& signer,
                           const std::string& actor_id,
                           std::optional<long> expires_at) {
    return std::string(BEARER_TOKEN_PREFIX) + signer.sign(encode_token(actor_id, expires_at), NS_TOKEN);
}

} // namespace dsauth
