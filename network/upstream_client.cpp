#include "upstream_client.hpp" // IWYU pragma: keep

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace {
constexpr auto kJsonContentType = "application/json";
constexpr std::chrono::seconds kConnectionTimeout{10};
constexpr std::chrono::seconds kWriteTimeout{30};
} // namespace

CUpstreamClient::CUpstreamClient(const TNimProxyConfig &config) :
    config(config)
{
}

httplib::Client CUpstreamClient::CreateUpstreamHttpClient(std::chrono::seconds readTimeout) const
{
    httplib::Client cli(config.get().CreateUpstreamHostUrl());
    cli.set_connection_timeout(kConnectionTimeout);
    cli.set_read_timeout(readTimeout);
    cli.set_write_timeout(kWriteTimeout);
    cli.set_bearer_token_auth(config.get().apiKey);
    cli.set_follow_location(true);
    return cli;
}

std::string CUpstreamClient::StatusFailureText(const int status)
{
    return "Request failed with status code " + std::to_string(status);
}

TUpstreamResult CUpstreamClient::Probe(const std::string &model) const
{
    nlohmann::json js;
    js["model"] = model;
    js["messages"] = nlohmann::json::array({{{"role", "user"}, {"content", "test"}}});
    js["max_tokens"] = 1;

    auto cli = CreateUpstreamHttpClient(kProbeTimeout);
    const auto res = cli.Post(config.get().CreateUpstreamPath(kChatEndpoint), js.dump(),
                              kJsonContentType);
    if (!res)
    {
        return TProbeFailed{httplib::to_string(res.error())};
    }
    if (!IsSuccessStatus(res->status))
    {
        return TProbeFailed{StatusFailureText(res->status)};
    }
    return TUpstreamOk{res->status, {}};
}

TUpstreamResult CUpstreamClient::Complete(const nlohmann::json &request) const
{
    auto cli = CreateUpstreamHttpClient(kRequestTimeout);
    const auto res = cli.Post(config.get().CreateUpstreamPath(kChatEndpoint), request.dump(),
                              kJsonContentType);
    if (!res)
    {
        return TUpstreamError{0, httplib::to_string(res.error())};
    }
    if (!IsSuccessStatus(res->status))
    {
        return TUpstreamError{res->status, StatusFailureText(res->status)};
    }

    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (body.is_discarded())
    {
        return TUpstreamError{0, "Invalid JSON received from upstream."};
    }
    return TUpstreamOk{res->status, std::move(body)};
}

TUpstreamResult CUpstreamClient::Stream(const nlohmann::json &request,
                                        const TStatusHandler &onStatus,
                                        const TChunkHandler &onChunk) const
{
    std::optional<int> status;

    httplib::Request req;
    req.method = "POST";
    req.path = config.get().CreateUpstreamPath(kChatEndpoint);
    req.body = request.dump();
    req.set_header("Content-Type", kJsonContentType);
    req.set_header("Accept", "text/event-stream");
    req.response_handler = [&](const httplib::Response &response) {
        status = response.status;
        // Non-2xx body is not an event stream, reading is stopped right away.
        return onStatus(response.status) && IsSuccessStatus(response.status);
    };
    req.content_receiver = [&](const char *data, std::size_t size, std::uint64_t /*offset*/,
                               std::uint64_t /*total*/) {
        return onChunk(data, size);
    };

    auto cli = CreateUpstreamHttpClient(kRequestTimeout);
    httplib::Response response;
    httplib::Error error{httplib::Error::Unknown};
    const bool sent = cli.send(req, response, error);

    if (status.has_value() && !IsSuccessStatus(*status))
    {
        return TUpstreamError{*status, StatusFailureText(*status)};
    }
    if (!sent || httplib::Error::Success != error)
    {
        config.get().ExecIfFittingVerbosity(ENimProxyVerbosity::Debug, [&error](auto &os) {
            os << "[DEBUG] Upstream stream ended with: " << httplib::to_string(error) << std::endl;
        });
        return TUpstreamError{status.value_or(0), httplib::to_string(error)};
    }
    return TUpstreamOk{status.value_or(response.status), {}};
}
