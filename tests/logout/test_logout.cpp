// tests/logout/test_logout.cpp
//
// Logout confirmation view, POST logout (cookie deletion + flash message)
// and the read-once behaviour of ds_messages on the index page.

#include <string>

#include <nlohmann/json.hpp>

#include "flash_messages.h"
#include "session_termination.h"
#include "test_support.h"

using json = nlohmann::json;
using namespace testsupport;

static void test_logout_get() {
    Harness h;

    auto req = make_request("GET", "/-/logout");
    add_cookie(req, "ds_actor", h.actor_cookie({{"id", "test"}}));
    httplib::Response res;
    h.call(handle_logout_get, req, res);
    expect(res.status == 200, "authenticated GET is 200");
    expect(contains(res.body, "<p>You are logged in as <strong>test</strong></p>"), "label is the id");
    expect(contains(res.body, "<form action=\"/-/logout\" method=\"post\">"), "POST-only logout form");

    // Actors without an id get the full structural form, escaped.
    auto req2 = make_request("GET", "/-/logout");
    add_cookie(req2, "ds_actor", h.actor_cookie({{"name2", "bob"}}));
    httplib::Response res2;
    h.call(handle_logout_get, req2, res2);
    expect(res2.status == 200, "id-less actor GET is 200");
    expect(contains(res2.body, "<p>You are logged in as <strong>{&quot;name2&quot;:&quot;bob&quot;}</strong></p>"),
           "label is the escaped actor mapping");

    auto anon = make_request("GET", "/-/logout");
    httplib::Response res3;
    h.call(handle_logout_get, anon, res3);
    expect(res3.status == 302, "anonymous GET redirects");
    expect(header(res3, "Location") == "/", "redirect target is /");
}

static void test_logout_post() {
    Harness h;

    auto req = make_request("POST", "/-/logout");
    add_cookie(req, "ds_actor", h.actor_cookie({{"id", "test"}}));
    httplib::Response res;
    h.call(handle_logout_post, req, res);

    expect(res.status == 302, "POST redirects");
    expect(header(res, "Location") == "/", "POST redirects to /");
    expect(cookie_was_deleted(res, "ds_actor"), "ds_actor cookie deleted");

    json messages;
    expect(h.signer.unsign(set_cookie_value(res, "ds_messages"), "messages", messages), "messages cookie verifies");
    expect(messages == json::array({json::array({"You are now logged out", 2})}), "logged-out flash message");

    json wrong_ns;
    expect(!h.signer.unsign(set_cookie_value(res, "ds_messages"), "actor", wrong_ns),
           "messages cookie is not an actor cookie");
}

static void test_logout_post_appends_to_existing_messages() {
    Harness h;

    auto req = make_request("POST", "/-/logout");
    const json earlier = json::array({json::array({"Saved", 1})});
    req.headers.emplace("Cookie", "ds_actor=" + h.actor_cookie({{"id", "test"}})
                                  + "; ds_messages=" + h.signer.sign(earlier, "messages"));
    httplib::Response res;
    h.call(handle_logout_post, req, res);

    json messages;
    expect(h.signer.unsign(set_cookie_value(res, "ds_messages"), "messages", messages), "messages verify");
    expect(messages == json::array({json::array({"Saved", 1}), json::array({"You are now logged out", 2})}),
           "new message appended after pending ones");
}

static void test_logout_post_csrf() {
    Harness h;
    h.ctx.csrf_ok = [](const httplib::Request& r) { return same_origin_post(r, "https://data.example.com"); };

    auto cross = make_request("POST", "/-/logout");
    cross.headers.emplace("Origin", "https://evil.example.net");
    add_cookie(cross, "ds_actor", h.actor_cookie({{"id", "test"}}));
    httplib::Response res;
    h.call(handle_logout_post, cross, res);
    expect(res.status == 403, "cross-origin POST is 403");
    expect(set_cookie_line(res, "ds_actor").empty(), "cookie untouched on 403");

    auto same = make_request("POST", "/-/logout");
    same.headers.emplace("Origin", "https://data.example.com");
    httplib::Response res2;
    h.call(handle_logout_post, same, res2);
    expect(res2.status == 302, "same-origin POST accepted");

    auto referer = make_request("POST", "/-/logout");
    referer.headers.emplace("Referer", "https://data.example.com/-/logout");
    expect(same_origin_post(referer, "https://data.example.com"), "same-origin Referer accepted");

    auto prefix_trick = make_request("POST", "/-/logout");
    prefix_trick.headers.emplace("Referer", "https://data.example.com.evil.net/");
    expect(!same_origin_post(prefix_trick, "https://data.example.com"), "origin prefix trick rejected");

    // Scripted clients send neither header; the default check lets them through.
    auto headerless = make_request("POST", "/-/logout");
    add_cookie(headerless, "ds_actor", h.actor_cookie({{"id", "test"}}));
    expect(same_origin_post(headerless, "https://data.example.com"), "POST without Origin or Referer accepted");
    httplib::Response res3;
    h.call(handle_logout_post, headerless, res3);
    expect(res3.status == 302, "headerless POST logs out");
    expect(cookie_was_deleted(res3, "ds_actor"), "headerless POST deletes ds_actor");
}

static void test_index_consumes_messages() {
    Harness h;

    auto logout = make_request("POST", "/-/logout");
    add_cookie(logout, "ds_actor", h.actor_cookie({{"id", "test"}}));
    httplib::Response lres;
    h.call(handle_logout_post, logout, lres);

    auto next = make_request("GET", "/");
    add_cookie(next, "ds_messages", set_cookie_value(lres, "ds_messages"));
    httplib::Response res;
    h.call(handle_index, next, res);
    expect(res.status == 200, "index is 200");
    expect(contains(res.body, "You are now logged out"), "flash message displayed");
    expect(cookie_was_deleted(res, "ds_messages"), "flash cookie cleared after display");
    expect(!contains(res.body, "<form action=\"/-/logout\" method=\"post\">"), "no logout button when anonymous");

    auto logged_in = make_request("GET", "/");
    add_cookie(logged_in, "ds_actor", h.actor_cookie({{"id", "test"}}));
    httplib::Response res2;
    h.call(handle_index, logged_in, res2);
    expect(contains(res2.body, "<strong>test</strong>"), "navigation shows the actor");
    expect(contains(res2.body, "<form action=\"/-/logout\" method=\"post\">"), "navigation has logout button");
    expect(set_cookie_line(res2, "ds_messages").empty(), "no messages cookie touched without messages");
}

static void test_tampered_messages_ignored() {
    Harness h;
    auto req = make_request("GET", "/");
    add_cookie(req, "ds_messages", h.signer.sign(json::array({json::array({"<b>x</b>", 3})}), "actor"));
    const auto msgs = dsauth::read_messages(h.signer, req);
    expect(msgs.empty(), "messages signed under another namespace are ignored");
}

int main() {
    if (!init_sodium()) return 2;

    test_logout_get();
    test_logout_post();
    test_logout_post_appends_to_existing_messages();
    test_logout_post_csrf();
    test_index_consumes_messages();
    test_tampered_messages_ignored();

    return finish("logout");
}
