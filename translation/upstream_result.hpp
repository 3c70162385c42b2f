#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

/// @brief Upstream answered with 2xx status. Body is empty for streamed responses.
struct TUpstreamOk
{
    int status{200};
    nlohmann::json body;
};

/// @brief Probe of model name did not succeed. Never leaves model resolver.
struct TProbeFailed
{
    std::string reason;
};

/// @brief Real request failed. Status is 0 when upstream did not answer with HTTP at all.
struct TUpstreamError
{
    int status{0};
    std::string message;
};

using TUpstreamResult = std::variant<TUpstreamOk, TProbeFailed, TUpstreamError>;
