#include "request_translator.hpp" // IWYU pragma: keep

#include "error_envelope.hpp" // IWYU pragma: keep

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace {
constexpr auto kModelKey = "model";
constexpr auto kMessagesKey = "messages";
constexpr auto kTemperatureKey = "temperature";
constexpr auto kMaxTokensKey = "max_tokens";
constexpr auto kStreamKey = "stream";

bool IsAbsent(const nlohmann::json &obj, const char *key)
{
    return !obj.contains(key) || obj[key].is_null();
}
} // namespace

TInboundChatRequest TInboundChatRequest::Parse(const std::string &body)
{
    nlohmann::json parsed;
    try
    {
        parsed = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw CClientInputError(std::string("Request body is not valid JSON: ") + e.what());
    }
    if (!parsed.is_object())
    {
        throw CClientInputError("Request body must be a JSON object");
    }

    // Messages are checked first, nothing else matters if they are absent.
    if (!parsed.contains(kMessagesKey) || !parsed[kMessagesKey].is_array()
        || parsed[kMessagesKey].empty())
    {
        throw CClientInputError("'messages' is required and must be a non-empty array");
    }
    if (!parsed.contains(kModelKey) || !parsed[kModelKey].is_string())
    {
        throw CClientInputError("'model' is required and must be a string");
    }

    TInboundChatRequest req;
    req.model = parsed[kModelKey].get<std::string>();
    req.messages = std::move(parsed[kMessagesKey]);

    if (!IsAbsent(parsed, kTemperatureKey))
    {
        if (!parsed[kTemperatureKey].is_number())
        {
            throw CClientInputError("'temperature' must be a number");
        }
        req.temperature = parsed[kTemperatureKey].get<double>();
    }
    if (!IsAbsent(parsed, kMaxTokensKey))
    {
        const auto &maxTokens = parsed[kMaxTokensKey];
        // Integral float like 100.0 is taken as integer.
        if (maxTokens.is_number_float())
        {
            const auto value = maxTokens.get<double>();
            if (!std::isfinite(value) || std::trunc(value) != value)
            {
                throw CClientInputError("'max_tokens' must be an integer");
            }
            req.maxTokens = static_cast<std::int64_t>(value);
        }
        else if (maxTokens.is_number_integer())
        {
            req.maxTokens = maxTokens.get<std::int64_t>();
        }
        else
        {
            throw CClientInputError("'max_tokens' must be an integer");
        }
    }
    if (!IsAbsent(parsed, kStreamKey))
    {
        if (!parsed[kStreamKey].is_boolean())
        {
            throw CClientInputError("'stream' must be a boolean");
        }
        req.stream = parsed[kStreamKey].get<bool>();
    }
    return req;
}

nlohmann::json CRequestTranslator::Build(const TInboundChatRequest &request,
                                         const TResolution &resolution)
{
    nlohmann::json js;
    js[kModelKey] = resolution.backendName;
    js[kMessagesKey] = request.messages;
    js[kTemperatureKey] = request.temperature.value_or(kDefaultTemperature);
    js[kMaxTokensKey] = request.maxTokens.value_or(kDefaultMaxTokens);
    js[kStreamKey] = request.stream;
    if (resolution.thinkingEligible)
    {
        js["chat_template_kwargs"] = {{"thinking", true}};
    }
    return js;
}
