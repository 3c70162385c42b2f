#pragma once

#include "model_resolver.hpp" // IWYU pragma: keep

#include <network/nim_proxy_config.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

/// @brief Translates complete (non-streamed) upstream answer to the caller's dialect.
class CResponseBuilder
{
  public:
    explicit CResponseBuilder(const TNimProxyConfig &config);

    /// @brief Builds caller's response. Echoes @p inboundModel, not the backend name.
    /// @throws std::runtime_error if upstream response has no "choices" array.
    [[nodiscard]]
    nlohmann::json Build(const std::string &inboundModel, const TResolution &resolution,
                         const nlohmann::json &upstreamResponse) const;

    /// @brief Merges reasoning and content of single choice's message according to the display
    /// mode. Models which are not thinking-eligible may embed "<think>...</think>" into content,
    /// such reasoning is extracted out of content.
    [[nodiscard]]
    std::string MergeContent(std::string content, const std::string &reasoning,
                             bool thinkingEligible) const;

  private:
    [[nodiscard]]
    std::string WrapReasoning(const std::string &reasoning, const std::string &content) const;
    void LogRawChoice(const nlohmann::json &upstreamResponse) const;

    std::reference_wrapper<const TNimProxyConfig> config;
};
