#pragma once
#include <string>

#include "httplib.h"

namespace dsauth {

    // Audit fields stay non-secret metadata.
    //
    // OK to log:
    ///  - actor id
    ///  - client ip / user agent (shortened)
    ///  - expiry timestamps, reason codes
    ///
    /// NOT OK:
    ///  - root bootstrap secret
    ///  - dstok_ tokens or any signed envelope
    ///  - cookie values

    inline std::string shorten(const std::string& s, size_t maxlen = 64) {
        if (s.size() <= maxlen) return s;
        return s.substr(0, maxlen) + "...";
    }

    inline std::string audit_ip(const httplib::Request& req) {
        return req.remote_addr.empty() ? "?" : req.remote_addr;
    }

    inline std::string audit_ua(const httplib::Request& req) {
        auto it = req.headers.find("User-Agent");
        return shorten(it == req.headers.end() ? "" : it->second);
    }

} // namespace dsauth
