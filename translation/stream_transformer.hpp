#pragma once

#include <network/nim_proxy_config.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

/// @brief Re-frames upstream event stream ("data: <json>" lines) for the caller.
/// Upstream bytes come in arbitrary pieces, this object keeps incomplete line until it is
/// terminated. Each complete event gets reasoning and content channels merged into single
/// "content" field of the first choice's delta. When reasoning display is enabled, reasoning
/// is bracketed by <think>\n ... </think>\n\n, and the closing marker always goes as separate
/// event, never concatenated with real content.
/// One object serves exactly one stream.
class CStreamTransformer
{
  public:
    /// @brief Ready to send events, each is framed as "data: ...\n\n".
    using TEvents = std::vector<std::string>;

    inline static constexpr std::string_view kOpenMarker = "<think>\n";
    inline static constexpr std::string_view kCloseMarker = "</think>\n\n";
    inline static constexpr std::string_view kDoneEvent = "data: [DONE]\n\n";

    explicit CStreamTransformer(const TNimProxyConfig &config);

    /// @brief Consumes next piece of upstream body.
    /// @returns Events which became complete with this piece, may be empty.
    [[nodiscard]]
    TEvents Next(std::string_view chunk);

    /// @brief Upstream body ended. Processes unterminated last line if any and closes reasoning
    /// section which was left open.
    [[nodiscard]]
    TEvents Finish();

    [[nodiscard]]
    bool IsReasoningOpen() const
    {
        return reasoningOpen;
    }

    [[nodiscard]]
    static std::string FrameEvent(const nlohmann::json &payload);

  private:
    void ProcessLine(std::string_view line, TEvents &out);
    void TransformDelta(nlohmann::json &payload, TEvents &out);
    void CloseReasoning(TEvents &out);
    [[nodiscard]]
    nlohmann::json MakeCloseMarkerPayload() const;

    std::reference_wrapper<const TNimProxyConfig> config;
    std::string buffer;
    bool reasoningOpen{false};
    nlohmann::json lastId;
    nlohmann::json lastObject;
};
