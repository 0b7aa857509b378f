// tests/actor/test_actor_resolver.cpp
//
// Credential precedence and validity policy of the resolver, observed both
// directly and through GET /-/actor.json.

#include <string>

#include <nlohmann/json.hpp>

#include "actor_resolver.h"
#include "auth_routes.h"
#include "test_support.h"
#include "token_codec.h"

using json = nlohmann::json;
using namespace testsupport;

static json actor_json(Harness& h, const httplib::Request& req) {
    httplib::Response res;
    h.call(handle_actor_json, req, res);
    expect(res.status == 200, "actor.json answers 200");
    expect(header(res, "Content-Type") == "application/json", "actor.json is JSON");
    return json::parse(res.body, nullptr, false);
}

static void test_cookie() {
    Harness h;

    auto req = make_request("GET", "/");
    add_cookie(req, "ds_actor", h.actor_cookie({{"id", "test"}}));
    auto r = h.resolver.resolve(req);
    expect(r.present() && *r.actor == json{{"id", "test"}}, "valid actor cookie resolves");
    expect(r.source == dsauth::ActorSource::Cookie, "source is cookie");

    expect(actor_json(h, req) == json{{"actor", {{"id", "test"}}}}, "actor.json shows cookie actor");

    // Cookie among others, with spacing.
    auto req2 = make_request("GET", "/");
    req2.headers.emplace("Cookie", "theme=dark;  ds_actor=" + h.actor_cookie({{"id", "test"}}) + "; lang=en");
    expect(h.resolver.resolve(req2).present(), "actor cookie found among other cookies");
}

static void test_cookie_invalid() {
    Harness h;
    const std::string cookie = h.actor_cookie({{"id", "test"}});

    auto broken_sig = make_request("GET", "/");
    add_cookie(broken_sig, "ds_actor", cookie.substr(0, cookie.size() - 1) + ".");
    expect(!h.resolver.resolve(broken_sig).present(), "broken signature is anonymous");

    auto wrong_shape = make_request("GET", "/");
    add_cookie(wrong_shape, "ds_actor", h.signer.sign(json{{"b", {{"id", "test"}}}}, "actor"));
    expect(!h.resolver.resolve(wrong_shape).present(), "wrong payload shape is anonymous");

    auto token_as_cookie = make_request("GET", "/");
    add_cookie(token_as_cookie, "ds_actor", h.signer.sign(json{{"a", {{"id", "test"}}}}, "token"));
    expect(!h.resolver.resolve(token_as_cookie).present(), "token-namespace envelope in cookie is anonymous");

    auto empty = make_request("GET", "/");
    add_cookie(empty, "ds_actor", "");
    expect(!h.resolver.resolve(empty).present(), "empty cookie is anonymous");

    expect(actor_json(h, broken_sig) == json{{"actor", nullptr}}, "actor.json null for broken cookie");
}

static void test_cookie_expiry() {
    Harness h;
    const json actor = {{"id", "test"}};

    auto later = make_request("GET", "/");
    add_cookie(later, "ds_actor",
               h.signer.sign(dsauth::encode_session(actor, h.now + 24 * 60 * 60), "actor"));
    auto r = h.resolver.resolve(later);
    expect(r.present() && *r.actor == actor, "cookie expiring tomorrow resolves");

    auto earlier = make_request("GET", "/");
    add_cookie(earlier, "ds_actor",
               h.signer.sign(dsauth::encode_session(actor, h.now - 24 * 60 * 60), "actor"));
    expect(!h.resolver.resolve(earlier).present(), "cookie that expired yesterday is anonymous");

    // Same cookie, clock moves past expiry.
    h.now += 2 * 24 * 60 * 60;
    expect(!h.resolver.resolve(later).present(), "cookie stops resolving once now >= e");
}

static void test_bearer_scenarios() {
    Harness h;
    const json expected = {{"actor", {{"id", "test"}, {"token", "dstok"}}}};
    const json anonymous = {{"actor", nullptr}};

    auto no_token = make_request("GET", "/-/actor.json");
    expect(actor_json(h, no_token) == anonymous, "no token: actor null");

    auto invalid = make_request("GET", "/-/actor.json");
    add_bearer(invalid, "dstok_invalid");
    expect(actor_json(h, invalid) == anonymous, "invalid token: actor null");

    auto expired = make_request("GET", "/-/actor.json");
    add_bearer(expired, "dstok_" + h.signer.sign(json{{"a", "test"}, {"e", h.now - 1000}}, "token"));
    expect(actor_json(h, expired) == anonymous, "expired token: actor null");

    auto unlimited = make_request("GET", "/-/actor.json");
    add_bearer(unlimited, "dstok_" + h.signer.sign(json{{"a", "test"}}, "token"));
    expect(actor_json(h, unlimited) == expected, "unlimited token resolves");

    auto expiring = make_request("GET", "/-/actor.json");
    add_bearer(expiring, "dstok_" + h.signer.sign(json{{"a", "test"}, {"e", h.now + 1000}}, "token"));
    expect(actor_json(h, expiring) == expected, "expiring token resolves");
    expect(h.resolver.resolve(expiring).via_token(), "source is token");

    auto actor_envelope = make_request("GET", "/-/actor.json");
    add_bearer(actor_envelope, "dstok_" + h.actor_cookie({{"id", "test"}}));
    expect(actor_json(h, actor_envelope) == anonymous, "actor cookie replayed as bearer token: null");
}

static void test_precedence() {
    Harness h;
    const std::string cookie = h.actor_cookie({{"id", "cookie-user"}});

    // Invalid bearer token suppresses a valid cookie.
    auto bad_bearer = make_request("GET", "/");
    add_bearer(bad_bearer, "dstok_invalid");
    add_cookie(bad_bearer, "ds_actor", cookie);
    expect(!h.resolver.resolve(bad_bearer).present(), "invalid dstok_ bearer does not fall back to cookie");

    // Valid bearer wins over a valid cookie.
    auto both = make_request("GET", "/");
    add_bearer(both, "dstok_" + h.signer.sign(json{{"a", "token-user"}}, "token"));
    add_cookie(both, "ds_actor", cookie);
    auto r = h.resolver.resolve(both);
    expect(r.present() && (*r.actor)["id"] == "token-user", "bearer token takes precedence");

    // Non-dstok Authorization is not a token credential.
    auto basic = make_request("GET", "/");
    basic.headers.emplace("Authorization", "Basic dXNlcjpwYXNz");
    add_cookie(basic, "ds_actor", cookie);
    auto rb = h.resolver.resolve(basic);
    expect(rb.present() && rb.source == dsauth::ActorSource::Cookie, "unrecognized scheme falls back to cookie");

    auto other_bearer = make_request("GET", "/");
    add_bearer(other_bearer, "some-jwt-value");
    add_cookie(other_bearer, "ds_actor", cookie);
    expect(h.resolver.resolve(other_bearer).present(), "non-dstok bearer falls back to cookie");
}

static void test_signed_tokens_disabled() {
    Harness h;
    h.resolver.set_allow_signed_tokens(false);

    auto req = make_request("GET", "/");
    add_bearer(req, "dstok_" + h.signer.sign(json{{"a", "test"}}, "token"));
    expect(!h.resolver.resolve(req).present(), "tokens ignored when signed tokens are disabled");

    add_cookie(req, "ds_actor", h.actor_cookie({{"id", "test"}}));
    expect(h.resolver.resolve(req).source == dsauth::ActorSource::Cookie,
           "cookie still resolves when tokens are disabled");
}

static void test_memoized() {
    Harness h;
    auto req = make_request("GET", "/");
    add_cookie(req, "ds_actor", h.actor_cookie({{"id", "test"}}));

    dsauth::RequestActor ra(h.resolver, req);
    const dsauth::ResolvedActor* first = &ra.get();
    const nlohmann::json* a1 = ra.actor();

    // A later clock change must not alter what this request already saw.
    h.now = 0;
    expect(&ra.get() == first, "same object on re-read");
    expect(ra.actor() == a1 && a1 && (*a1)["id"] == "test", "actor pointer stable");
}

int main() {
    if (!init_sodium()) return 2;

    test_cookie();
    test_cookie_invalid();
    test_cookie_expiry();
    test_bearer_scenarios();
    test_precedence();
    test_signed_tokens_disabled();
    test_memoized();

    return finish("actor_resolver");
}
