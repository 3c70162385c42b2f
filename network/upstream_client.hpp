#pragma once

#include "nim_proxy_config.hpp" // IWYU pragma: keep

#include <translation/upstream_result.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

/// @brief Talks to the upstream (NVIDIA NIM) chat completion API.
/// Each call opens own connection, so one object can be shared by all request threads.
class CUpstreamClient
{
  public:
    /// @brief Called once when upstream status line is received. Return false to cancel.
    using TStatusHandler = std::function<bool(int status)>;
    /// @brief Called for each received piece of streamed body. Return false to cancel.
    using TChunkHandler = std::function<bool(const char *data, std::size_t size)>;

    inline static constexpr std::chrono::seconds kProbeTimeout{10};
    inline static constexpr std::chrono::seconds kRequestTimeout{300};
    inline static constexpr auto kChatEndpoint = "/chat/completions";

    explicit CUpstreamClient(const TNimProxyConfig &config);

    /// @brief Sends minimal 1-token request for @p model.
    /// @returns TUpstreamOk on 2xx status, TProbeFailed otherwise.
    [[nodiscard]]
    TUpstreamResult Probe(const std::string &model) const;

    /// @brief Sends non-streaming request.
    /// @returns TUpstreamOk with parsed body or TUpstreamError.
    [[nodiscard]]
    TUpstreamResult Complete(const nlohmann::json &request) const;

    /// @brief Sends streaming request, body is passed to @p onChunk as it arrives.
    /// @returns TUpstreamOk (with empty body) when upstream finished the stream, TUpstreamError
    /// otherwise, including cancellation by any of handlers.
    [[nodiscard]]
    TUpstreamResult Stream(const nlohmann::json &request, const TStatusHandler &onStatus,
                           const TChunkHandler &onChunk) const;

    [[nodiscard]]
    static bool IsSuccessStatus(const int status)
    {
        return status >= 200 && status < 300;
    }

  private:
    [[nodiscard]]
    httplib::Client CreateUpstreamHttpClient(std::chrono::seconds readTimeout) const;

    [[nodiscard]]
    static std::string StatusFailureText(int status);

    std::reference_wrapper<const TNimProxyConfig> config;
};
