#include "stream_transformer.hpp" // IWYU pragma: keep

#include <common/string_utils.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace {
constexpr std::string_view kDataPrefix = "data:";
constexpr std::string_view kDonePayload = "[DONE]";
constexpr auto kReasoningKey = "reasoning_content";
constexpr auto kContentKey = "content";

/// @returns String value of @p key or empty string if it is absent, null or not a string.
std::string GetStringOrEmpty(const nlohmann::json &obj, const char *key)
{
    if (obj.contains(key) && obj[key].is_string())
    {
        return obj[key].get<std::string>();
    }
    return {};
}

/// @returns Delta object of the first choice or nullptr if payload does not have one.
nlohmann::json *FindFirstDelta(nlohmann::json &payload)
{
    if (!payload.is_object() || !payload.contains("choices"))
    {
        return nullptr;
    }
    auto &choices = payload["choices"];
    if (!choices.is_array() || choices.empty() || !choices[0].is_object()
        || !choices[0].contains("delta") || !choices[0]["delta"].is_object())
    {
        return nullptr;
    }
    return &choices[0]["delta"];
}
} // namespace

CStreamTransformer::CStreamTransformer(const TNimProxyConfig &config) :
    config(config)
{
}

std::string CStreamTransformer::FrameEvent(const nlohmann::json &payload)
{
    return "data: " + payload.dump() + "\n\n";
}

CStreamTransformer::TEvents CStreamTransformer::Next(std::string_view chunk)
{
    TEvents out;
    buffer.append(chunk);

    std::size_t lineStart = 0;
    while (true)
    {
        const auto lineEnd = buffer.find('\n', lineStart);
        if (lineEnd == std::string::npos)
        {
            break;
        }
        ProcessLine(std::string_view(buffer).substr(lineStart, lineEnd - lineStart), out);
        lineStart = lineEnd + 1u;
    }
    // Keep unterminated tail for the next chunk.
    buffer.erase(0, lineStart);
    return out;
}

CStreamTransformer::TEvents CStreamTransformer::Finish()
{
    TEvents out;
    if (!buffer.empty())
    {
        const std::string tail = std::move(buffer);
        buffer.clear();
        ProcessLine(tail, out);
    }
    if (reasoningOpen)
    {
        CloseReasoning(out);
    }
    return out;
}

void CStreamTransformer::ProcessLine(std::string_view line, TEvents &out)
{
    if (!line.empty() && line.back() == '\r')
    {
        line.remove_suffix(1u);
    }
    if (!utility::starts_with(line, kDataPrefix))
    {
        return;
    }

    auto payloadText = line.substr(kDataPrefix.size());
    while (!payloadText.empty() && (payloadText.front() == ' ' || payloadText.front() == '\t'))
    {
        payloadText.remove_prefix(1u);
    }

    if (utility::trim_copy(std::string(payloadText)) == kDonePayload)
    {
        if (reasoningOpen)
        {
            CloseReasoning(out);
        }
        out.emplace_back(kDoneEvent);
        return;
    }

    nlohmann::json payload;
    try
    {
        payload = nlohmann::json::parse(payloadText);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        // Single broken event must not stop otherwise healthy stream.
        config.get().ExecIfFittingVerbosity(ENimProxyVerbosity::Warning, [&e](auto &os) {
            os << "[WARNING] SSE parse error: " << e.what() << std::endl;
        });
        return;
    }

    TransformDelta(payload, out);
    out.push_back(FrameEvent(payload));
}

void CStreamTransformer::TransformDelta(nlohmann::json &payload, TEvents &out)
{
    auto *delta = FindFirstDelta(payload);
    if (delta == nullptr)
    {
        return;
    }
    if (payload.contains("id"))
    {
        lastId = payload["id"];
    }
    if (payload.contains("object"))
    {
        lastObject = payload["object"];
    }

    const auto reasoning = GetStringOrEmpty(*delta, kReasoningKey);
    const auto content = GetStringOrEmpty(*delta, kContentKey);

    if (!config.get().showReasoning)
    {
        (*delta)[kContentKey] = content;
        delta->erase(kReasoningKey);
        return;
    }

    // First real content after reasoning: marker goes as its own event, before the content.
    if (reasoningOpen && reasoning.empty() && !content.empty())
    {
        CloseReasoning(out);
    }

    std::string combined;
    if (!reasoning.empty())
    {
        if (!reasoningOpen)
        {
            combined.append(kOpenMarker);
            reasoningOpen = true;
        }
        combined.append(reasoning);
    }
    combined.append(content);

    (*delta)[kContentKey] = std::move(combined);
    delta->erase(kReasoningKey);
}

void CStreamTransformer::CloseReasoning(TEvents &out)
{
    out.push_back(FrameEvent(MakeCloseMarkerPayload()));
    reasoningOpen = false;
}

nlohmann::json CStreamTransformer::MakeCloseMarkerPayload() const
{
    nlohmann::json delta;
    delta[kContentKey] = std::string(kCloseMarker);

    nlohmann::json choice;
    choice["index"] = 0;
    choice["delta"] = std::move(delta);
    choice["finish_reason"] = nullptr;

    nlohmann::json js;
    if (!lastId.is_null())
    {
        js["id"] = lastId;
    }
    if (!lastObject.is_null())
    {
        js["object"] = lastObject;
    }
    js["choices"] = nlohmann::json::array({std::move(choice)});
    return js;
}
