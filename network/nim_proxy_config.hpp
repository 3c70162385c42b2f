#pragma once

#include <date/date.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

enum class ENimProxyVerbosity : std::uint8_t {
    Silent = 0,
    Error = 0x10,
    Warning = 0x20,
    Debug = 0xFF,
};

struct TNimProxyConfig
{
    ENimProxyVerbosity verbosity{ENimProxyVerbosity::Silent};
    int listenPort{3000};
    std::string upstreamBaseUrl{"https://integrate.api.nvidia.com/v1"};
    std::string apiKey;
    /// @brief Wrap reasoning trace into <think></think> and keep it in visible content.
    bool showReasoning{false};
    /// @brief Ask thinking-capable backend models for explicit reasoning trace.
    bool enableThinking{true};
    std::ostream &outStream{std::cout};
    std::ostream &errorStream{std::cerr};

    /// @brief Checks if the verbosity level is fitting.
    [[nodiscard]]
    bool IsFittingVerbosity(const ENimProxyVerbosity value) const
    {
        return static_cast<std::uint8_t>(verbosity) >= static_cast<std::uint8_t>(value);
    }

    /// @brief Executes the given function if the verbosity level is fitting. Usable for logging.
    /// Passes the output stream to the function, the line is already prefixed with UTC time.
    /// @param value The verbosity level to check against.
    /// @param func Callable which accepts std::ostream& and writes single log line.
    template <typename taFunc>
    void ExecIfFittingVerbosity(const ENimProxyVerbosity value, const taFunc &func) const
    {
        if (IsFittingVerbosity(value))
        {
            const std::lock_guard lock(LogMutex());
            auto &os = value == ENimProxyVerbosity::Error ? errorStream : outStream;
            os << GetUtcTime() << ' ';
            func(os);
        }
    }

    /// @brief Single lock for all log lines of the process, whatever site writes them.
    [[nodiscard]]
    static std::mutex &LogMutex()
    {
        static std::mutex logMutex;
        return logMutex;
    }

    /// @brief Checks if the configuration is usable to start proxy.
    [[nodiscard]]
    bool Validate() const
    {
        return !apiKey.empty() && listenPort > 0 && listenPort <= 65535
               && !CreateUpstreamHostUrl().empty();
    }

    /// @returns "scheme://host[:port]" part of the upstream base url or empty string if url is
    /// not http(s).
    [[nodiscard]]
    std::string CreateUpstreamHostUrl() const;

    /// @returns Path on upstream host for @p endpoint, prefixed by base url's path (e.g. "/v1").
    [[nodiscard]]
    std::string CreateUpstreamPath(const std::string &endpoint) const;

    [[nodiscard]]
    static std::string GetUtcTime()
    {
        const auto now = date::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        return date::format("%FT%TZ", now);
    }
};

/// @brief Reads PORT, NIM_API_BASE, NIM_API_KEY, SHOW_REASONING, ENABLE_THINKING and
/// PROXY_VERBOSITY. Missing values keep defaults, unparsable values are reported as warnings.
TNimProxyConfig LoadConfigFromEnv();
