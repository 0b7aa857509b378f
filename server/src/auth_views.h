#pragma once

#include <string>
#include <vector>

#include "flash_messages.h"

namespace dsauth {

// Server-rendered pages for the auth endpoints. All caller-supplied text is
// HTML escaped here; callers pass plain strings.

std::string render_index(const std::string* actor_label,
                         const std::vector<FlashMessage>& messages);

std::string render_create_token(const std::string& actor_label,
                                const std::vector<std::string>& errors,
                                const std::string* token);

std::string render_logout(const std::string& actor_label);

} // namespace dsauth
