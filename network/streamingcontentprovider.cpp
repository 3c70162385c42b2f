#include "streamingcontentprovider.hpp" // IWYU pragma: keep

#include <common/lambda_visitors.h>
#include <common/runners.h>
#include <translation/stream_transformer.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono> // IWYU pragma: keep
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>

using namespace std::chrono_literals;

CStreamingContentProvider::CStreamingContentProvider(nlohmann::json upstreamRequest,
                                                     const CUpstreamClient &client,
                                                     const TNimProxyConfig &proxyConfig) :
    upstreamRequest(std::move(upstreamRequest)),
    client(client),
    proxyConfig(proxyConfig),
    statusFuture(statusPromise.get_future()),
    upstreamThread(nullptr)
{
    upstreamThread = RunUpstreamThread();
}

CStreamingContentProvider::~CStreamingContentProvider()
{
    Log(ENimProxyVerbosity::Debug, [](auto &os) {
        os << "[DEBUG] CStreamingContentProvider: Destructor called, resetting thread."
           << std::endl;
    });
    commObject.DisconnectAll();
    upstreamThread.reset();
}

TUpstreamResult CStreamingContentProvider::WaitForUpstreamStatus()
{
    return statusFuture.get();
}

bool CStreamingContentProvider::WriteToUser(const std::string &what, httplib::DataSink &sink)
{
    if (!sink.is_writable())
    {
        Log(ENimProxyVerbosity::Warning, [](auto &os) {
            os << "[WARNING] Sink is not writable, user has gone." << std::endl;
        });
        return false;
    }
    return sink.write(what.data(), what.size());
}

bool CStreamingContentProvider::operator()(std::size_t /*offset*/, httplib::DataSink &sink)
{
    // Finished flag is read before draining, so nothing queued before it is lost.
    const bool finished = commObject.IsFinished();
    auto what = commObject.WaitStringForUser(100ms);
    while (what)
    {
        if (!WriteToUser(*what, sink))
        {
            commObject.DisconnectAll();
            return false;
        }
        what = commObject.GetStringForUser();
    }

    if (finished)
    {
        Log(ENimProxyVerbosity::Debug, [](auto &os) {
            os << "[DEBUG] Upstream stream is over, closing user's stream." << std::endl;
        });
        sink.done();
    }
    // Keep channel opened to user.
    return true;
}

std::shared_ptr<std::thread> CStreamingContentProvider::RunUpstreamThread()
{
    auto threadedUpstream = [this](const utility::runnerint_t &shouldStopPtr) {
        CStreamTransformer transformer(proxyConfig.get());
        bool statusReported = false;

        const auto isThreadLoopingYet = [&shouldStopPtr, this]() {
            return !(*shouldStopPtr) && !commObject.IsDisconnected();
        };
        const auto sendToUser = [this](CStreamTransformer::TEvents events) {
            for (auto &event : events)
            {
                commObject.SendToUser(std::move(event));
            }
        };
        const auto reportStatus = [&](TUpstreamResult result) {
            if (!statusReported)
            {
                statusReported = true;
                statusPromise.set_value(std::move(result));
            }
        };

        try
        {
            const auto onStatus = [&](const int status) {
                if (CUpstreamClient::IsSuccessStatus(status))
                {
                    reportStatus(TUpstreamOk{status, {}});
                }
                return isThreadLoopingYet();
            };
            const auto onChunk = [&](const char *data, const std::size_t size) {
                sendToUser(transformer.Next(std::string_view(data, size)));
                return isThreadLoopingYet();
            };

            const LambdaVisitor visitor{
              [&](const TUpstreamOk &ok) {
                  reportStatus(ok);
                  sendToUser(transformer.Finish());
              },
              [&](const TUpstreamError &error) {
                  if (!statusReported)
                  {
                      reportStatus(error);
                      return;
                  }
                  // Headers are already sent to the user, the stream just ends.
                  const auto level = commObject.IsDisconnected() ? ENimProxyVerbosity::Debug
                                                                 : ENimProxyVerbosity::Error;
                  Log(level, [&error, level](auto &os) {
                      os << (level == ENimProxyVerbosity::Error ? "[ERROR] " : "[DEBUG] ")
                         << "Stream error: " << error.message << std::endl;
                  });
              },
              [&](const TProbeFailed &failed) {
                  reportStatus(TUpstreamError{0, failed.reason});
              },
            };
            std::visit(visitor, client.get().Stream(upstreamRequest, onStatus, onChunk));
        }
        catch (std::exception &e)
        {
            Log(ENimProxyVerbosity::Error, [&e](auto &os) {
                os << "[ERROR] Exception while reading upstream stream: " << e.what()
                   << std::endl;
            });
            reportStatus(TUpstreamError{0, e.what()});
        }
        commObject.Finish();
    };
    // Warning! The thread uses this object, it is joined by destructor.
    return utility::startNewRunner(std::move(threadedUpstream));
}

void CStreamingContentProvider::TCommObject::SendToUser(std::string what)
{
    if (!IsDisconnected() && !what.empty())
    {
        upstreamToUser.push(std::move(what));
    }
}

void CStreamingContentProvider::TCommObject::Finish()
{
    upstreamFinished.store(true);
    upstreamToUser.wake();
}

void CStreamingContentProvider::TCommObject::DisconnectAll()
{
    disconnectAll.store(true);
    upstreamToUser.wake();
}

bool CStreamingContentProvider::TCommObject::IsDisconnected() const
{
    return disconnectAll.load();
}

bool CStreamingContentProvider::TCommObject::IsFinished() const
{
    return upstreamFinished.load();
}

std::optional<std::string> CStreamingContentProvider::TCommObject::GetStringForUser()
{
    return upstreamToUser.pop();
}

std::optional<std::string>
CStreamingContentProvider::TCommObject::WaitStringForUser(std::chrono::milliseconds timeout)
{
    return upstreamToUser.wait_pop(timeout);
}
