#include "flash_messages.h"

#include "http_cookies.h"
#include "signer.h"
#include "token_codec.h"

#include <nlohmann/json.hpp>

namespace dsauth {

static bool level_from_int(int v, MessageLevel& out) {
    switch (v) {
        case 1: out = MessageLevel::Info;    return true;
        case 2: out = MessageLevel::Warning; return true;
        case 3: out = MessageLevel::Error;   return true;
        default: return false;
    }
}

std::vector<FlashMessage> read_messages(const Signer& signer, const httplib::Request& req) {
    std::vector<FlashMessage> out;

    std::string raw;
    if (!get_cookie(req, MESSAGES_COOKIE, raw) || raw.empty()) return out;

    nlohmann::json j;
    if (!signer.unsign(raw, NS_MESSAGES, j) || !j.is_array()) return out;

    for (const auto& item : j) {
        // Skip entries we did not write rather than dropping the whole list.
        if (!item.is_array() || item.size() != 2) continue;
        if (!item[0].is_string() || !item[1].is_number_integer()) continue;

        FlashMessage m;
        if (!level_from_int(item[1].get<int>(), m.level)) continue;
        m.text = item[0].get<std::string>();
        out.push_back(std::move(m));
    }
    return out;
}

void add_message(const Signer& signer,
                 const httplib::Request& req,
                 httplib::Response& res,
                 const std::string& text,
                 MessageLevel level,
                 bool secure) {
    auto msgs = read_messages(signer, req);
    msgs.push_back(FlashMessage{text, level});

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : msgs) {
        arr.push_back(nlohmann::json::array({m.text, static_cast<int>(m.level)}));
    }

    CookieOptions opt;
    opt.secure = secure;
    set_cookie(res, MESSAGES_COOKIE, signer.sign(arr, NS_MESSAGES), opt);
}

std::vector<FlashMessage> consume_messages(const Signer& signer,
                                           const httplib::Request& req,
                                           httplib::Response& res,
                                           bool secure) {
    auto msgs = read_messages(signer, req);

    std::string raw;
    if (get_cookie(req, MESSAGES_COOKIE, raw)) delete_cookie(res, MESSAGES_COOKIE, secure);

    return msgs;
}

const char* message_level_class(MessageLevel level) {
    switch (level) {
        case MessageLevel::Info:    return "message-info";
        case MessageLevel::Warning: return "message-warning";
        case MessageLevel::Error:   return "message-error";
    }
    return "message-info";
}

} // namespace dsauth
