#include "signer.h"
#include "dsauth_util.h"

#include <cstring>
#include <sodium.h>

/*
 * signer.cc
 *
 * Every envelope kind (actor cookie, API token, flash messages) shares one
 * process secret. Mixing the namespace into the key, instead of into the
 * message, means a MAC computed for "actor" is simply a different function
 * from the one for "token": a valid actor cookie replayed as a bearer token
 * fails the same way random bytes would.
 */

namespace dsauth {

Signer::Signer(const unsigned char key32[KEY_BYTES]) {
    std::memcpy(key_, key32, KEY_BYTES);
}

Signer::~Signer() {
    sodium_memzero(key_, sizeof(key_));
}

void Signer::namespace_key_(const std::string& ns, unsigned char out[32]) const {
    const std::string label = "dsauth.signer." + ns;

    crypto_auth_hmacsha256_state st;
    crypto_auth_hmacsha256_init(&st, key_, sizeof(key_));
    crypto_auth_hmacsha256_update(&st,
                                  reinterpret_cast<const unsigned char*>(label.data()),
                                  label.size());
    crypto_auth_hmacsha256_final(&st, out);
}

void Signer::mac_(const std::string& ns, const std::string& payload_json, unsigned char out[32]) const {
    unsigned char k_ns[crypto_auth_hmacsha256_BYTES];
    namespace_key_(ns, k_ns);

    crypto_auth_hmacsha256_state st;
    crypto_auth_hmacsha256_init(&st, k_ns, sizeof(k_ns));
    crypto_auth_hmacsha256_update(&st,
                                  reinterpret_cast<const unsigned char*>(payload_json.data()),
                                  payload_json.size());
    crypto_auth_hmacsha256_final(&st, out);

    sodium_memzero(k_ns, sizeof(k_ns));
}

std::string Signer::sign(const nlohmann::json& payload, const std::string& ns) const {
    const std::string payload_json = payload.dump();

    unsigned char mac[crypto_auth_hmacsha256_BYTES];
    mac_(ns, payload_json, mac);

    return b64url_enc(reinterpret_cast<const unsigned char*>(payload_json.data()), payload_json.size())
        + "."
        + b64url_enc(mac, sizeof(mac));
}

bool Signer::unsign(const std::string& signed_value,
                    const std::string& ns,
                    nlohmann::json& out_payload) const {
    const auto dot = signed_value.find('.');
    if (dot == std::string::npos) return false;

    std::string payload_json;
    if (!b64url_dec(signed_value.substr(0, dot), payload_json)) return false;

    std::string mac_bin;
    if (!b64url_dec(signed_value.substr(dot + 1), mac_bin)) return false;
    if (mac_bin.size() != crypto_auth_hmacsha256_BYTES) return false;

    unsigned char expected[crypto_auth_hmacsha256_BYTES];
    mac_(ns, payload_json, expected);

    if (sodium_memcmp(expected, mac_bin.data(), crypto_auth_hmacsha256_BYTES) != 0) return false;

    // Authentic bytes that fail to parse can only come from a signing bug,
    // but they still must not reach the caller as a payload.
    nlohmann::json parsed = nlohmann::json::parse(payload_json, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) return false;

    out_payload = std::move(parsed);
    return true;
}

} // namespace dsauth
