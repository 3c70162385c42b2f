#include <common/runners.h>
#include <network/nim_proxy.hpp>
#include <network/nim_proxy_config.hpp>

#include <atomic>
#include <chrono> // IWYU pragma: keep
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace {
std::atomic<int> retCode{0};
std::atomic<bool> stopRequested{false};

void HandleSignal(int /*signum*/)
{
    stopRequested = true;
}
} // namespace

int main()
{
    using namespace std::chrono_literals;

    const auto config = LoadConfigFromEnv();
    if (config.apiKey.empty())
    {
        std::cerr << "FATAL: NIM_API_KEY environment variable is not set" << std::endl;
        return 1;
    }
    if (!config.Validate())
    {
        std::cerr << "FATAL: invalid configuration, check PORT and NIM_API_BASE." << std::endl;
        return 1;
    }

    signal(SIGINT, HandleSignal);
    signal(SIGTERM, HandleSignal);

    std::unique_ptr<CNimProxyServer> server;
    try
    {
        server = std::make_unique<CNimProxyServer>(config);
    }
    catch (std::exception &e)
    {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    auto proxyServerThread = utility::startNewRunner([&server, &config](const auto &) {
        try
        {
            std::cout << "Proxy running on port " << config.listenPort << std::endl;
            std::cout << "Reasoning: " << std::boolalpha << config.showReasoning
                      << " | Thinking: " << config.enableThinking << std::noboolalpha
                      << std::endl;
            server->Start(config.listenPort);
        }
        catch (std::exception &e)
        {
            std::cerr << "Server thread exception: " << e.what() << ". Exiting." << std::endl;
            retCode = 255;
            stopRequested = true;
        }
    });

    while (!stopRequested)
    {
        std::this_thread::sleep_for(500ms); // NOLINT
    }
    std::cout << "Shutting down..." << std::endl;
    server->Stop();
    proxyServerThread.reset();
    std::cout << "Proxy server stopped." << std::endl;

    return retCode;
}
