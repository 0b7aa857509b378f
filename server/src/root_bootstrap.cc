#include "root_bootstrap.h"
#include "dsauth_util.h"

#include <utility>

namespace dsauth {

RootBootstrap::RootBootstrap() : secret_(random_hex(32)) {}

RootBootstrap::RootBootstrap(std::string secret) : secret_(std::move(secret)) {}

RootBootstrap::Outcome RootBootstrap::redeem(const std::string& supplied) {
    // An empty secret would match an empty ?token= parameter.
    if (secret_.empty() || !secure_equals(supplied, secret_)) return Outcome::Forbidden;

    State expected = State::Pending;
    if (!state_.compare_exchange_strong(expected, State::Consumed)) return Outcome::Forbidden;

    return Outcome::Redeemed;
}

std::string RootBootstrap::secret() const {
    if (consumed()) return std::string();
    return secret_;
}

std::string RootBootstrap::login_url(const std::string& base_url) const {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/-/auth-token?token=" + secret();
}

} // namespace dsauth
