#include "nim_proxy.hpp" // IWYU pragma: keep

#include "nim_proxy_config.hpp"          // IWYU pragma: keep
#include "streamingcontentprovider.hpp" // IWYU pragma: keep

#include <common/lambda_visitors.h>
#include <translation/error_envelope.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace {
constexpr auto kJsonContentType = "application/json";
} // namespace

CNimProxyServer::CNimProxyServer(const TNimProxyConfig &config) :
    CNimProxyServer(config, GetDefaultModelCatalog())
{
}

CNimProxyServer::CNimProxyServer(const TNimProxyConfig &config, const TModelCatalog &catalog) :
    config(config),
    catalog(catalog),
    upstream(this->config),
    resolver(
      catalog,
      [this](const std::string &model) {
          return upstream.Probe(model);
      },
      this->config),
    responseBuilder(this->config)
{
    if (!this->config.Validate())
    {
        throw std::invalid_argument("Invalid configuration for nim proxy server passed.");
    }
}

void CNimProxyServer::Start(int listenOnPort)
{
    InstallHandlers();
    if (!server.listen("0.0.0.0", listenOnPort))
    {
        throw std::runtime_error("Cannot listen on port " + std::to_string(listenOnPort) + ".");
    }
}

void CNimProxyServer::Stop()
{
    server.stop();
}

void CNimProxyServer::InstallHandlers()
{
    const auto handleChat = [this](const httplib::Request &req, httplib::Response &resp) {
        HandlePostChatCompletions(req, resp);
    };

    server.set_payload_max_length(kMaxPayloadLength);
    server.set_default_headers({{"Access-Control-Allow-Origin", "*"}});

    server.Get("/health", [this](const auto & /*req*/, auto &resp) {
        HandleHealth(resp);
    });
    server.Get("/v1/models", [this](const auto & /*req*/, auto &resp) {
        HandleListModels(resp);
    });
    server.Post("/v1/chat/completions", handleChat);
    server.Post("/chat/completions", handleChat);
    server.Options(R"(/(.*))", [](const auto & /*req*/, auto &resp) {
        resp.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        resp.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        resp.status = 204;
    });

    // Unrouted paths and errors produced by server itself get the same envelope as ours.
    server.set_error_handler([this](const httplib::Request &req, httplib::Response &resp) {
        if (!resp.body.empty())
        {
            return;
        }
        const auto message = resp.status == 404 ? "Endpoint " + req.path + " not found"
                                                : std::string(httplib::status_message(resp.status));
        ReplyError(resp, resp.status, message);
    });
}

void CNimProxyServer::HandleHealth(httplib::Response &response) const
{
    nlohmann::json js;
    js["status"] = "ok";
    js["service"] = "OpenAI to NVIDIA NIM Proxy";
    js["reasoning_display"] = config.showReasoning;
    js["thinking_mode"] = config.enableThinking;
    response.set_content(js.dump(), kJsonContentType);
}

void CNimProxyServer::HandleListModels(httplib::Response &response) const
{
    using namespace std::chrono;
    const auto created = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();

    auto data = nlohmann::json::array();
    for (const auto &alias : catalog.aliases.GetAliases())
    {
        nlohmann::json model;
        model["id"] = alias.publicName;
        model["object"] = "model";
        model["created"] = created;
        model["owned_by"] = "nvidia-nim-proxy";
        data.push_back(std::move(model));
    }

    nlohmann::json js;
    js["object"] = "list";
    js["data"] = std::move(data);
    response.set_content(js.dump(), kJsonContentType);
}

void CNimProxyServer::ReplyError(httplib::Response &responseToUser, const int status,
                                 const std::string &message) const
{
    responseToUser.status = status;
    responseToUser.set_content(BuildErrorEnvelope(status, message).dump(), kJsonContentType);
}

// Handles POST /v1/chat/completions. Resolution and upstream call are done here, streaming
// answer is passed to the chunked content provider.
void CNimProxyServer::HandlePostChatCompletions(const httplib::Request &userRequest,
                                                httplib::Response &responseToUser)
{
    config.ExecIfFittingVerbosity(ENimProxyVerbosity::Debug, [&userRequest](auto &ostream) {
        ostream << "[DEBUG] HandlePostChatCompletions(): " << userRequest.method << " "
                << userRequest.path << ", body size: " << userRequest.body.size() << std::endl;
    });

    try
    {
        const auto inbound = TInboundChatRequest::Parse(userRequest.body);
        const auto resolution = resolver.Resolve(inbound.model);
        auto upstreamRequest = CRequestTranslator::Build(inbound, resolution);

        if (inbound.stream)
        {
            ReplyStreaming(std::move(upstreamRequest), responseToUser);
        }
        else
        {
            ReplyComplete(inbound, resolution, upstreamRequest, responseToUser);
        }
    }
    catch (const CClientInputError &e)
    {
        config.ExecIfFittingVerbosity(ENimProxyVerbosity::Warning, [&e](auto &ostream) {
            ostream << "[WARNING] Rejected request: " << e.what() << std::endl;
        });
        ReplyError(responseToUser, 400, e.what());
    }
    catch (std::exception &e)
    {
        config.ExecIfFittingVerbosity(ENimProxyVerbosity::Error, [&e](auto &ostream) {
            ostream << "[ERROR] Proxy error: " << e.what() << std::endl;
        });
        ReplyError(responseToUser, 500, e.what());
    }
}

void CNimProxyServer::ReplyComplete(const TInboundChatRequest &inbound,
                                    const TResolution &resolution,
                                    const nlohmann::json &upstreamRequest,
                                    httplib::Response &responseToUser) const
{
    const LambdaVisitor visitor{
      [&](const TUpstreamOk &ok) {
          const auto js = responseBuilder.Build(inbound.model, resolution, ok.body);
          responseToUser.status = 200;
          responseToUser.set_content(js.dump(), kJsonContentType);
      },
      [&](const TUpstreamError &error) {
          config.ExecIfFittingVerbosity(ENimProxyVerbosity::Error, [&error](auto &ostream) {
              ostream << "[ERROR] Proxy error: " << error.message << std::endl;
          });
          ReplyError(responseToUser, error.status > 0 ? error.status : 500, error.message);
      },
      [&](const TProbeFailed &failed) {
          ReplyError(responseToUser, 500, failed.reason);
      },
    };
    std::visit(visitor, upstream.Complete(upstreamRequest));
}

void CNimProxyServer::ReplyStreaming(nlohmann::json upstreamRequest,
                                     httplib::Response &responseToUser) const
{
    auto ptr = std::make_shared<CStreamingContentProvider>(std::move(upstreamRequest), upstream,
                                                           config);

    // Status must be known before headers go to the user, it cannot be changed later.
    const LambdaVisitor visitor{
      [&](const TUpstreamOk &) {
          responseToUser.status = 200;
          responseToUser.set_header("Cache-Control", "no-cache");
          responseToUser.set_header("Connection", "keep-alive");
          // This is last one, now control is moved to the content provider which can "write"
          // only to the user or disconnect.
          httplib::ContentProviderWithoutLength contentProvider =
            [ptr](std::size_t offset, httplib::DataSink &sink) {
                return (*ptr)(offset, sink);
            };
          responseToUser.set_chunked_content_provider("text/event-stream",
                                                      std::move(contentProvider));
      },
      [&](const TUpstreamError &error) {
          config.ExecIfFittingVerbosity(ENimProxyVerbosity::Error, [&error](auto &ostream) {
              ostream << "[ERROR] Proxy error: " << error.message << std::endl;
          });
          ReplyError(responseToUser, error.status > 0 ? error.status : 500, error.message);
      },
      [&](const TProbeFailed &failed) {
          ReplyError(responseToUser, 500, failed.reason);
      },
    };
    std::visit(visitor, ptr->WaitForUpstreamStatus());
}
