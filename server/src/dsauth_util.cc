#include "dsauth_util.h"

#include <cctype>
#include <cstring>
#include <ctime>
#include <vector>
#include <sodium.h>

namespace dsauth {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string trim_ws(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    size_t i = 0;
    while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
    return s.substr(i);
}

std::string b64url_enc(const unsigned char* data, size_t len) {
    const size_t outLen = sodium_base64_encoded_len(len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    std::string out(outLen, '\0');

    sodium_bin2base64(out.data(), out.size(),
                      data, len,
                      sodium_base64_VARIANT_URLSAFE_NO_PADDING);

    // libsodium writes a trailing NUL; shrink to the C-string length.
    out.resize(std::strlen(out.c_str()));
    return out;
}

// libsodium rejects characters outside the alphabet and non-zero trailing
// bits, so every encoded form maps to exactly one byte string.
bool b64url_dec(const std::string& s, std::string& out_bin) {
    out_bin.resize(s.size());

    size_t out_len = 0;
    const char* b64_end = nullptr;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(out_bin.data()), out_bin.size(),
                          s.c_str(), s.size(),
                          /*ignore=*/nullptr,
                          &out_len,
                          &b64_end,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
        return false;
    }
    // Trailing garbage after the last valid character.
    if (b64_end != s.c_str() + s.size()) return false;

    out_bin.resize(out_len);
    return true;
}

std::string random_hex(size_t nbytes) {
    std::vector<unsigned char> b(nbytes);
    randombytes_buf(b.data(), b.size());

    std::string out(nbytes * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), b.data(), b.size());
    out.resize(nbytes * 2);
    return out;
}

bool secure_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

} // namespace dsauth
