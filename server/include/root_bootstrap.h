#pragma once

#include <atomic>
#include <string>

namespace dsauth {

/*
RootBootstrap
=============

One-time startup secret that can be exchanged for a root actor cookie.

State machine (irreversible, process lifetime):

  Pending(secret) --redeem(secret)--> Consumed

The secret is generated once in the constructor and never changes; the only
mutable field is the atomic state. Redemption is a single compare-exchange,
so of any number of concurrent callers presenting the right secret exactly
one observes Redeemed.
*/
class RootBootstrap {
public:
    enum class State : int {
        Pending  = 0,
        Consumed = 1,
    };

    enum class Outcome {
        Redeemed,
        Forbidden,
    };

    // Generates a fresh 32-byte secret (hex). Requires sodium_init().
    RootBootstrap();

    // For tests and for operators that supply their own secret.
    explicit RootBootstrap(std::string secret);

    RootBootstrap(const RootBootstrap&) = delete;
    RootBootstrap& operator=(const RootBootstrap&) = delete;

    Outcome redeem(const std::string& supplied);

    bool consumed() const { return state_.load() == State::Consumed; }

    // Empty once consumed, so the secret cannot be displayed again.
    std::string secret() const;

    // "<base_url>/-/auth-token?token=<secret>"
    std::string login_url(const std::string& base_url) const;

private:
    const std::string secret_;
    std::atomic<State> state_{State::Pending};
};

} // namespace dsauth
