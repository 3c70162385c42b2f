#pragma once

#include "nim_proxy_config.hpp" // IWYU pragma: keep
#include "upstream_client.hpp"  // IWYU pragma: keep

#include <common/cm_ctors.h>
#include <common/safe_queue.h>
#include <translation/upstream_result.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

/// @brief Streams upstream answer to the user. Upstream is read by own thread, which transforms
/// events and queues them. Server's chunked writer drains the queue via operator().
/// If user disconnects, upstream reading is aborted on the next received piece.
class CStreamingContentProvider
{
  public:
    CStreamingContentProvider() = delete;
    ~CStreamingContentProvider();
    NO_COPYMOVE(CStreamingContentProvider);

    /// @brief Starts upstream request immediately.
    CStreamingContentProvider(nlohmann::json upstreamRequest, const CUpstreamClient &client,
                              const TNimProxyConfig &proxyConfig);

    /// @brief Blocks until upstream answered with status or failed. Must be called once.
    /// @returns TUpstreamOk if upstream accepted request and streaming began, TUpstreamError
    /// otherwise.
    [[nodiscard]]
    TUpstreamResult WaitForUpstreamStatus();

    /// @brief Called by server wrapper periodically to write to the user.
    bool operator()(std::size_t offset, httplib::DataSink &sink);

  private:
    class TCommObject
    {
      public:
        // Used by upstream thread.
        void SendToUser(std::string what);
        void Finish();

        void DisconnectAll();
        [[nodiscard]]
        bool IsDisconnected() const;
        [[nodiscard]]
        bool IsFinished() const;

        [[nodiscard]]
        std::optional<std::string> GetStringForUser();
        [[nodiscard]]
        std::optional<std::string> WaitStringForUser(std::chrono::milliseconds timeout);

      private:
        SafeQueue<std::string> upstreamToUser;
        std::atomic<bool> disconnectAll{false};
        std::atomic<bool> upstreamFinished{false};
    };

    std::shared_ptr<std::thread> RunUpstreamThread();
    bool WriteToUser(const std::string &what, httplib::DataSink &sink);

    template <typename taFunc>
    void Log(const ENimProxyVerbosity level, const taFunc &func) const
    {
        proxyConfig.get().ExecIfFittingVerbosity(level, func);
    }

    nlohmann::json upstreamRequest;
    std::reference_wrapper<const CUpstreamClient> client;
    std::reference_wrapper<const TNimProxyConfig> proxyConfig;
    TCommObject commObject;
    std::promise<TUpstreamResult> statusPromise;
    std::future<TUpstreamResult> statusFuture;
    std::shared_ptr<std::thread> upstreamThread;
};
