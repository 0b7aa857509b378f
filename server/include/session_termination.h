#pragma once
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>

#include "auth_routes.h"

inline constexpr const char* LOGGED_OUT_MESSAGE = "You are now logged out";

// Display label: the "id" attribute when present, otherwise the compact
// JSON form of the whole actor.
std::string actor_display_label(const nlohmann::json& actor);

// GET /-/logout: 200 confirmation view with an actor, 302 to / without.
void handle_logout_get(const httplib::Request& req, httplib::Response& res,
                       const AuthRoutesContext& ctx, dsauth::RequestActor& ra);

// POST /-/logout: deletes ds_actor, queues the logged-out flash message, 302 to /.
void handle_logout_post(const httplib::Request& req, httplib::Response& res,
                        const AuthRoutesContext& ctx, dsauth::RequestActor& ra);
