#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace dsauth {

/*
Payload shapes carried inside Signer envelopes.

Session payload (namespace "actor", cookie ds_actor):
  {"a": {<actor object>}, "e": "<base62 epoch seconds>"}    e optional

Token payload (namespace "token", bearer dstok_...):
  {"a": "<actor id>", "e": <epoch seconds> | null}

Expiry rule for both: invalid once now >= e.
*/

// Signing namespaces. Each envelope kind verifies only under its own.
inline constexpr const char* NS_ACTOR    = "actor";
inline constexpr const char* NS_TOKEN    = "token";
inline constexpr const char* NS_MESSAGES = "messages";

// Marker attribute added to actors resolved from an API token.
inline constexpr const char* TOKEN_MARKER_KEY   = "token";
inline constexpr const char* TOKEN_MARKER_VALUE = "dstok";

// Base-62 (0-9A-Za-z) for non-negative integers.
std::string base62_encode(long long v);
bool base62_decode(const std::string& s, long long& out);

nlohmann::json encode_session(const nlohmann::json& actor,
                              std::optional<long> expires_at = std::nullopt);

// nullopt for any malformed or expired payload; never throws.
std::optional<nlohmann::json> decode_session(const nlohmann::json& payload, long now);

nlohmann::json encode_token(const std::string& actor_id,
                            std::optional<long> expires_at = std::nullopt);

// Returns {"id": <a>, "token": "dstok"} on success.
std::optional<nlohmann::json> decode_token(const nlohmann::json& payload, long now);

} // namespace dsauth
