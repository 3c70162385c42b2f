#include "response_builder.hpp" // IWYU pragma: keep

#include "stream_transformer.hpp" // IWYU pragma: keep

#include <common/string_utils.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {
constexpr std::string_view kInlineOpenTag = "<think>";
constexpr std::string_view kInlineCloseTag = "</think>";
constexpr std::size_t kRawSampleLength = 300u;

std::string GetStringOrEmpty(const nlohmann::json &obj, const char *key)
{
    if (obj.is_object() && obj.contains(key) && obj[key].is_string())
    {
        return obj[key].get<std::string>();
    }
    return {};
}

nlohmann::json MakeZeroUsage()
{
    nlohmann::json usage;
    usage["prompt_tokens"] = 0;
    usage["completion_tokens"] = 0;
    usage["total_tokens"] = 0;
    return usage;
}
} // namespace

CResponseBuilder::CResponseBuilder(const TNimProxyConfig &config) :
    config(config)
{
}

std::string CResponseBuilder::WrapReasoning(const std::string &reasoning,
                                            const std::string &content) const
{
    std::string res(CStreamTransformer::kOpenMarker);
    res.append(reasoning);
    res.append("\n");
    res.append(CStreamTransformer::kCloseMarker);
    res.append(content);
    return res;
}

std::string CResponseBuilder::MergeContent(std::string content, const std::string &reasoning,
                                           const bool thinkingEligible) const
{
    const bool showReasoning = config.get().showReasoning;

    if (!thinkingEligible && reasoning.empty() && utility::starts_with(content, kInlineOpenTag))
    {
        const auto closePos = content.find(kInlineCloseTag, kInlineOpenTag.size());
        if (closePos != std::string::npos)
        {
            const auto inlineReasoning = utility::trim_copy(
              content.substr(kInlineOpenTag.size(), closePos - kInlineOpenTag.size()));
            auto realContent = utility::trim_copy(content.substr(closePos + kInlineCloseTag.size()));
            if (showReasoning)
            {
                return WrapReasoning(inlineReasoning, realContent);
            }
            return realContent;
        }
    }

    if (showReasoning && !reasoning.empty())
    {
        return WrapReasoning(reasoning, content);
    }
    return content;
}

void CResponseBuilder::LogRawChoice(const nlohmann::json &upstreamResponse) const
{
    config.get().ExecIfFittingVerbosity(ENimProxyVerbosity::Debug, [&](auto &os) {
        const auto &choices = upstreamResponse["choices"];
        const auto message =
          !choices.empty() && choices[0].is_object() && choices[0].contains("message")
            ? choices[0]["message"]
            : nlohmann::json::object();
        const bool hasContent = message.is_object() && message.contains("content")
                                && message["content"].is_string();
        const auto content = GetStringOrEmpty(message, "content");

        os << "[DEBUG] raw content has newlines: "
           << (hasContent ? (content.find('\n') != std::string::npos ? "true" : "false")
                          : "null")
           << ", sample: "
           << (hasContent ? nlohmann::json(content.substr(0, kRawSampleLength)).dump() : "null")
           << ", reasoning_content exists: " << std::boolalpha
           << !GetStringOrEmpty(message, "reasoning_content").empty() << std::noboolalpha
           << std::endl;
    });
}

nlohmann::json CResponseBuilder::Build(const std::string &inboundModel,
                                       const TResolution &resolution,
                                       const nlohmann::json &upstreamResponse) const
{
    if (!upstreamResponse.is_object() || !upstreamResponse.contains("choices")
        || !upstreamResponse["choices"].is_array())
    {
        throw std::runtime_error("Upstream response does not contain 'choices' array.");
    }
    LogRawChoice(upstreamResponse);

    using namespace std::chrono;
    const auto now = system_clock::now().time_since_epoch();

    nlohmann::json js;
    js["id"] = "chatcmpl-" + std::to_string(duration_cast<milliseconds>(now).count());
    js["object"] = "chat.completion";
    js["created"] = duration_cast<seconds>(now).count();
    js["model"] = inboundModel;

    auto choices = nlohmann::json::array();
    std::size_t position = 0u;
    for (const auto &choice : upstreamResponse["choices"])
    {
        const auto message =
          choice.is_object() && choice.contains("message") ? choice["message"] : nlohmann::json{};

        nlohmann::json outMessage;
        outMessage["role"] = message.is_object() && message.contains("role")
                               ? message["role"]
                               : nlohmann::json("assistant");
        outMessage["content"] =
          MergeContent(GetStringOrEmpty(message, "content"),
                       GetStringOrEmpty(message, "reasoning_content"), resolution.thinkingEligible);

        nlohmann::json outChoice;
        outChoice["index"] =
          choice.is_object() && choice.contains("index") ? choice["index"] : nlohmann::json(position);
        outChoice["message"] = std::move(outMessage);
        outChoice["finish_reason"] = choice.is_object() && choice.contains("finish_reason")
                                       ? choice["finish_reason"]
                                       : nlohmann::json(nullptr);
        choices.push_back(std::move(outChoice));
        ++position;
    }
    js["choices"] = std::move(choices);

    const bool hasUsage =
      upstreamResponse.contains("usage") && upstreamResponse["usage"].is_object();
    js["usage"] = hasUsage ? upstreamResponse["usage"] : MakeZeroUsage();
    return js;
}
