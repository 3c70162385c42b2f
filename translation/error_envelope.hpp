#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

/// @brief Caller sent request which cannot be served. Reported as HTTP 400.
class CClientInputError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

/// @returns {"error": {"message", "type", "code"}} body used for every error reply.
inline nlohmann::json BuildErrorEnvelope(const int status, const std::string &message)
{
    nlohmann::json err;
    err["message"] = message;
    err["type"] = "invalid_request_error";
    err["code"] = status;

    nlohmann::json js;
    js["error"] = std::move(err);
    return js;
}
