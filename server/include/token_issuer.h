#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace dsauth {

class Signer;
struct ResolvedActor;

inline constexpr const char* INVALID_EXPIRE_DURATION = "Invalid expire duration";

// Validate the create-token form.
//
// expire_type ""                       -> ok, no expiry (duration ignored)
// expire_type minutes | hours | days   -> duration must be an integer > 0
// anything else                        -> error
//
// On success *out_expires_at is now + seconds, or nullopt for no expiry.
// On failure *err receives INVALID_EXPIRE_DURATION.
bool parse_expiry(const std::string& expire_type,
                  const std::optional<std::string>& expire_duration,
                  long now,
                  std::optional<long>* out_expires_at,
                  std::string* err);

// Who may mint: a resolved cookie actor with a usable id. Token actors may
// not mint further tokens.
bool may_create_token(const ResolvedActor& ra, std::string* out_actor_id);

// "dstok_" + sign({"a": actor_id, "e": expires_at | null}, "token")
std::string mint_api_token(const Signer& signer,
                           const std::string& actor_id,
                           std::optional<long> expires_at);

} // namespace dsauth
