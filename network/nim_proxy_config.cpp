#include "nim_proxy_config.hpp" // IWYU pragma: keep

#include <common/string_utils.h>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {
constexpr std::string_view kHttp = "http://";
constexpr std::string_view kHttps = "https://";

struct TSplitUrl
{
    std::string hostUrl;
    std::string basePath;
};

std::optional<TSplitUrl> SplitBaseUrl(const std::string &url)
{
    std::string_view scheme;
    if (utility::starts_with(url, kHttps))
    {
        scheme = kHttps;
    }
    else if (utility::starts_with(url, kHttp))
    {
        scheme = kHttp;
    }
    else
    {
        return std::nullopt;
    }

    const auto rest = std::string_view(url).substr(scheme.size());
    const auto slashPos = rest.find('/');
    const auto host = rest.substr(0, slashPos);
    if (host.empty())
    {
        return std::nullopt;
    }

    TSplitUrl res;
    res.hostUrl = std::string(scheme) + std::string(host);
    if (slashPos != std::string_view::npos)
    {
        res.basePath = std::string(rest.substr(slashPos));
        while (!res.basePath.empty() && res.basePath.back() == '/')
        {
            res.basePath.pop_back();
        }
    }
    return res;
}

std::string GetEnvStr(const char *name)
{
    const char *value = std::getenv(name); // NOLINT
    return value ? std::string(value) : std::string();
}

std::optional<bool> TryParseBool(const std::string &str)
{
    const auto value = utility::to_lower_copy(utility::trim_copy(str));
    if (value == "1" || value == "true" || value == "yes" || value == "on")
    {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off")
    {
        return false;
    }
    return std::nullopt;
}

std::optional<ENimProxyVerbosity> TryParseVerbosity(const std::string &str)
{
    const auto value = utility::to_lower_copy(utility::trim_copy(str));
    if (value == "silent")
    {
        return ENimProxyVerbosity::Silent;
    }
    if (value == "error")
    {
        return ENimProxyVerbosity::Error;
    }
    if (value == "warning")
    {
        return ENimProxyVerbosity::Warning;
    }
    if (value == "debug")
    {
        return ENimProxyVerbosity::Debug;
    }
    return std::nullopt;
}

std::optional<int> TryParsePort(const std::string &str)
{
    int port = 0;
    const auto *begin = str.data();
    const auto *end = str.data() + str.size(); // NOLINT
    const auto [ptr, ec] = std::from_chars(begin, end, port);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return port;
}

void WarnUnparsed(const TNimProxyConfig &config, const char *name, const std::string &value)
{
    config.ExecIfFittingVerbosity(ENimProxyVerbosity::Warning, [&](auto &os) {
        os << "[WARNING] Ignoring unparsable value of " << name << ": '" << value
           << "', default is kept." << std::endl;
    });
}

template <typename taParser, typename taField>
void ReadEnv(const TNimProxyConfig &config, const char *name, const taParser &parser,
             taField &field)
{
    const auto value = GetEnvStr(name);
    if (value.empty())
    {
        return;
    }
    if (const auto parsed = parser(value))
    {
        field = *parsed;
        return;
    }
    WarnUnparsed(config, name, value);
}
} // namespace

std::string TNimProxyConfig::CreateUpstreamHostUrl() const
{
    const auto split = SplitBaseUrl(upstreamBaseUrl);
    return split ? split->hostUrl : std::string();
}

std::string TNimProxyConfig::CreateUpstreamPath(const std::string &endpoint) const
{
    const auto split = SplitBaseUrl(upstreamBaseUrl);
    const std::string basePath = split ? split->basePath : std::string();
    if (!endpoint.empty() && endpoint.front() != '/')
    {
        return basePath + "/" + endpoint;
    }
    return basePath + endpoint;
}

TNimProxyConfig LoadConfigFromEnv()
{
    TNimProxyConfig config{ENimProxyVerbosity::Debug};

    // Verbosity goes first, so warnings below respect it.
    ReadEnv(config, "PROXY_VERBOSITY", TryParseVerbosity, config.verbosity);
    ReadEnv(config, "PORT", TryParsePort, config.listenPort);
    ReadEnv(config, "SHOW_REASONING", TryParseBool, config.showReasoning);
    ReadEnv(config, "ENABLE_THINKING", TryParseBool, config.enableThinking);

    if (auto base = GetEnvStr("NIM_API_BASE"); !base.empty())
    {
        config.upstreamBaseUrl = std::move(base);
    }
    config.apiKey = GetEnvStr("NIM_API_KEY");

    return config;
}
