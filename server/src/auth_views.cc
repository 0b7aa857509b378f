#include "auth_views.h"
#include "dsauth_util.h"

namespace dsauth {

static std::string page(const std::string& title, const std::string& body) {
    return std::string("<!DOCTYPE html>\n<html>\n<head>\n")
        + "<meta charset=\"utf-8\">\n"
        + "<title>" + html_escape(title) + "</title>\n"
        + "</head>\n<body>\n"
        + body
        + "</body>\n</html>\n";
}

static std::string logout_form() {
    return "<form action=\"/-/logout\" method=\"post\">\n"
           "  <button type=\"submit\">Log out</button>\n"
           "</form>\n";
}

std::string render_index(const std::string* actor_label,
                         const std::vector<FlashMessage>& messages) {
    std::string body;
    if (actor_label) {
        body += "<nav><strong>" + html_escape(*actor_label) + "</strong>\n";
        body += logout_form();
        body += "</nav>\n";
    }
    for (const auto& m : messages) {
        body += std::string("<p class=\"") + message_level_class(m.level) + "\">"
              + html_escape(m.text) + "</p>\n";
    }
    body += "<h1>Home</h1>\n";
    return page("Home", body);
}

std::string render_create_token(const std::string& actor_label,
                                const std::vector<std::string>& errors,
                                const std::string* token) {
    std::string body;
    body += "<h1>Create an API token</h1>\n";
    body += "<p>This token will allow API access with the same abilities as your current user, <strong>"
          + html_escape(actor_label) + "</strong></p>\n";

    for (const auto& e : errors) {
        body += "<p class=\"message-error\">" + html_escape(e) + "</p>\n";
    }

    if (token) {
        body += "<div>\n<h2>Your API token</h2>\n";
        body += "<input type=\"text\" class=\"copyable\" readonly value=\"" + html_escape(*token) + "\">\n";
        body += "<p>Copy it now: it will not be shown again.</p>\n</div>\n";
    }

    body += "<form action=\"/-/create-token\" method=\"post\">\n"
            "  <select name=\"expire_type\">\n"
            "    <option value=\"\">Token never expires</option>\n"
            "    <option value=\"minutes\">Expires after X minutes</option>\n"
            "    <option value=\"hours\">Expires after X hours</option>\n"
            "    <option value=\"days\">Expires after X days</option>\n"
            "  </select>\n"
            "  <input type=\"text\" name=\"expire_duration\">\n"
            "  <input type=\"submit\" value=\"Create token\">\n"
            "</form>\n";
    return page("Create an API token", body);
}

std::string render_logout(const std::string& actor_label) {
    std::string body;
    body += "<h1>Log out</h1>\n";
    body += "<p>You are logged in as <strong>" + html_escape(actor_label) + "</strong></p>\n";
    body += logout_form();
    return page("Log out", body);
}

} // namespace dsauth
