#pragma once

#include "nim_proxy_config.hpp" // IWYU pragma: keep
#include "upstream_client.hpp"  // IWYU pragma: keep

#include <common/cm_ctors.h>
#include <translation/model_catalog.hpp>
#include <translation/model_resolver.hpp>
#include <translation/request_translator.hpp>
#include <translation/response_builder.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

/// @brief OpenAI-compatible front of the NVIDIA NIM API.
class CNimProxyServer
{
  public:
    inline static constexpr std::size_t kMaxPayloadLength = 10u * 1024u * 1024u;

    NO_COPYMOVE(CNimProxyServer);
    CNimProxyServer() = delete;
    ~CNimProxyServer() = default;

    explicit CNimProxyServer(const TNimProxyConfig &config);
    CNimProxyServer(const TNimProxyConfig &config, const TModelCatalog &catalog);

    /// @brief Starts the proxy server on a specified port. Blocks until Stop() is called.
    /// @throws std::runtime_error if port cannot be listened.
    void Start(int listenOnPort);
    /// @brief Stops the proxy server.
    void Stop();

    [[nodiscard]]
    bool IsRunning() const
    {
        return server.is_running();
    }

  private:
    /// @brief Installs the necessary HTTP handlers for the proxy server.
    void InstallHandlers();

    void HandleHealth(httplib::Response &response) const;
    void HandleListModels(httplib::Response &response) const;
    void HandlePostChatCompletions(const httplib::Request &userRequest,
                                   httplib::Response &responseToUser);
    void ReplyComplete(const TInboundChatRequest &inbound, const TResolution &resolution,
                       const nlohmann::json &upstreamRequest,
                       httplib::Response &responseToUser) const;
    void ReplyStreaming(nlohmann::json upstreamRequest, httplib::Response &responseToUser) const;
    void ReplyError(httplib::Response &responseToUser, int status,
                    const std::string &message) const;

    /// @brief handles incoming user's requests.
    httplib::Server server;
    const TNimProxyConfig config;
    const TModelCatalog &catalog;
    CUpstreamClient upstream;
    CModelResolver resolver;
    CResponseBuilder responseBuilder;
};
