#pragma once

#include "model_resolver.hpp" // IWYU pragma: keep

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

/// @brief Validated chat completion request as it came from the caller.
struct TInboundChatRequest
{
    std::string model;
    nlohmann::json messages;
    std::optional<double> temperature;
    std::optional<std::int64_t> maxTokens;
    bool stream{false};

    /// @brief Parses and validates caller's body.
    /// @throws CClientInputError if body is not json, "messages" is not a non-empty array or
    /// optional fields have wrong types.
    [[nodiscard]]
    static TInboundChatRequest Parse(const std::string &body);
};

/// @brief Builds request for the upstream out of caller's request and resolved backend model.
class CRequestTranslator
{
  public:
    inline static constexpr double kDefaultTemperature = 0.85;
    inline static constexpr std::int64_t kDefaultMaxTokens = 16384;

    /// @brief Copies messages verbatim and fills defaults. Adds thinking directive only for
    /// eligible backend, otherwise the key is omitted completely.
    [[nodiscard]]
    static nlohmann::json Build(const TInboundChatRequest &request, const TResolution &resolution);
};
