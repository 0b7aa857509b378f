#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace dsauth {

/*
Signer
======

Namespaced HMAC-SHA256 envelopes for cookies and bearer tokens.

Envelope format:

  signed := b64url_no_pad(payload_json) "." b64url_no_pad(mac)
  mac    := HMAC-SHA256(K_ns, payload_json)
  K_ns   := HMAC-SHA256(secret, "dsauth.signer." + namespace)

payload_json is nlohmann's compact dump, which orders object keys, so the
same payload always produces the same bytes.

The payload is only encoded, not encrypted. Never put secrets in it.

Requires sodium_init() before first use.
*/
class Signer {
public:
    static constexpr size_t KEY_BYTES = 32;

    explicit Signer(const unsigned char key32[KEY_BYTES]);
    ~Signer();

    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;

    // Throws nlohmann::json::type_error if a string in payload is not valid UTF-8.
    std::string sign(const nlohmann::json& payload, const std::string& ns) const;

    // Returns false for any malformed, tampered or wrong-namespace input.
    // The reason is deliberately not reported.
    bool unsign(const std::string& signed_value,
                const std::string& ns,
                nlohmann::json& out_payload) const;

private:
    unsigned char key_[KEY_BYTES];

    void namespace_key_(const std::string& ns, unsigned char out[32]) const;
    void mac_(const std::string& ns, const std::string& payload_json, unsigned char out[32]) const;
};

} // namespace dsauth
