#pragma once
#include <cstddef>
#include <string>

namespace dsauth {

    long now_epoch();
    std::string lower_ascii(std::string s);
    std::string trim_ws(std::string s);

    // URL-safe base64 without padding (cookie and query-string safe).
    std::string b64url_enc(const unsigned char* data, size_t len);
    bool b64url_dec(const std::string& s, std::string& out_bin);

    // nbytes of CSPRNG output, lowercase hex encoded.
    std::string random_hex(size_t nbytes);

    // Constant-time equality for secrets of possibly different length.
    bool secure_equals(const std::string& a, const std::string& b);

    // Minimal escaping for text and attribute values in generated HTML.
    std::string html_escape(const std::string& s);

} // namespace dsauth
