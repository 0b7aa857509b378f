#pragma once

#include <map>
#include <string>

#include "httplib.h"

namespace dsauth {

// Parse a Cookie request header into name -> value.
// First occurrence of a name wins; values in double quotes are unquoted.
std::map<std::string, std::string> parse_cookie_header(const std::string& hdr);

// Raw cookie value from the request. Integrity is NOT checked here.
bool get_cookie(const httplib::Request& req, const std::string& name, std::string& out);

struct CookieOptions {
    bool secure = false;
    long max_age = -1;   // < 0 => session cookie
};

// Appends a Set-Cookie header (Path=/; HttpOnly; SameSite=Lax).
void set_cookie(httplib::Response& res,
                const std::string& name,
                const std::string& value,
                const CookieOptions& opt = CookieOptions{});

// Instructs the client to drop the cookie immediately.
void delete_cookie(httplib::Response& res, const std::string& name, bool secure = false);

} // namespace dsauth
