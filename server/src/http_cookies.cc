#include "http_cookies.h"
#include "dsauth_util.h"

/*
Cookie helpers
==============

httplib has no structured cookie API, so Cookie headers are parsed here and
Set-Cookie headers are assembled by hand.

Parsing is lenient on format (a browser's Cookie header is not always
RFC 6265 clean) and strict on nothing else: values are returned raw and
must be verified by the Signer before they are trusted.
*/

namespace dsauth {

std::map<std::string, std::string> parse_cookie_header(const std::string& hdr) {
    std::map<std::string, std::string> out;

    size_t pos = 0;
    while (pos <= hdr.size()) {
        size_t end = hdr.find(';', pos);
        if (end == std::string::npos) end = hdr.size();

        const std::string part = hdr.substr(pos, end - pos);
        const auto eq = part.find('=');
        if (eq != std::string::npos) {
            const std::string name = trim_ws(part.substr(0, eq));
            std::string value = trim_ws(part.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (!name.empty()) out.emplace(name, value);
        }

        pos = end + 1;
    }
    return out;
}

bool get_cookie(const httplib::Request& req, const std::string& name, std::string& out) {
    // Several Cookie headers can arrive through HTTP/2 proxies; check them all.
    const auto range = req.headers.equal_range("Cookie");
    for (auto h = range.first; h != range.second; ++h) {
        const auto cookies = parse_cookie_header(h->second);
        auto it = cookies.find(name);
        if (it != cookies.end()) {
            out = it->second;
            return true;
        }
    }
    return false;
}

void set_cookie(httplib::Response& res,
                const std::string& name,
                const std::string& value,
                const CookieOptions& opt) {
    std::string cookie = name + "=" + value + "; Path=/; HttpOnly; SameSite=Lax";
    if (opt.max_age >= 0) cookie += "; Max-Age=" + std::to_string(opt.max_age);
    if (opt.secure) cookie += "; Secure";
    res.set_header("Set-Cookie", cookie);
}

void delete_cookie(httplib::Response& res, const std::string& name, bool secure) {
    std::string cookie = name + "=; Path=/; HttpOnly; SameSite=Lax"
                         "; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT";
    if (secure) cookie += "; Secure";
    res.set_header("Set-Cookie", cookie);
}

} // namespace dsauth
