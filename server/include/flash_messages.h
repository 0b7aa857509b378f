#pragma once

#include <string>
#include <vector>

#include "httplib.h"

namespace dsauth {

class Signer;

inline constexpr const char* MESSAGES_COOKIE = "ds_messages";

// Wire values are part of the ds_messages cookie format.
enum class MessageLevel : int {
    Info    = 1,
    Warning = 2,
    Error   = 3,
};

struct FlashMessage {
    std::string text;
    MessageLevel level = MessageLevel::Info;
};

/*
Flash messages
==============

One-shot notices carried across a redirect in the signed ds_messages
cookie (namespace "messages"):

  [["You are now logged out", 2], ...]

A cookie that fails verification reads as "no messages".
*/

// Messages currently carried by the request. Does not modify anything.
std::vector<FlashMessage> read_messages(const Signer& signer, const httplib::Request& req);

// Append to the request's messages and write the whole list back.
void add_message(const Signer& signer,
                 const httplib::Request& req,
                 httplib::Response& res,
                 const std::string& text,
                 MessageLevel level,
                 bool secure = false);

// Read once: returns pending messages and deletes the cookie if one was sent.
std::vector<FlashMessage> consume_messages(const Signer& signer,
                                           const httplib::Request& req,
                                           httplib::Response& res,
                                           bool secure = false);

const char* message_level_class(MessageLevel level);

} // namespace dsauth
