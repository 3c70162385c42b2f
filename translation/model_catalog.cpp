#include "model_catalog.hpp" // IWYU pragma: keep

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

CAliasTable::CAliasTable(TAliases aliases) :
    aliases(std::move(aliases))
{
}

std::optional<std::string> CAliasTable::Find(const std::string &publicName) const
{
    const auto it = std::find_if(aliases.cbegin(), aliases.cend(), [&publicName](const auto &a) {
        return a.publicName == publicName;
    });
    if (it == aliases.cend())
    {
        return std::nullopt;
    }
    return it->backendName;
}

const TModelCatalog &GetDefaultModelCatalog()
{
    static const TModelCatalog catalog{
      CAliasTable{{
        {"gpt-3.5-turbo", "nvidia/llama-3.1-nemotron-ultra-253b-v1"},
        {"gpt-4", "qwen/qwen3-coder-480b-a35b-instruct"},
        {"gpt-4-turbo", "moonshotai/kimi-k2-instruct-0905"},
        {"gpt-4o", "deepseek-ai/deepseek-v3.1"},
        {"claude-3-opus", "z-ai/glm4.7"},
        {"claude-3-sonnet", "z-ai/glm5"},
        {"gemini-pro", "qwen/qwen3-next-80b-a3b-thinking"},
      }},
      {
        "nvidia/llama-3.1-nemotron-ultra-253b-v1",
        "qwen/qwen3-235b-a22b",
        "qwen/qwen3-next-80b-a3b-thinking",
        "qwen/qwen3-coder-480b-a35b-instruct",
      },
      {
        "meta/llama-3.1-405b-instruct",
        "meta/llama-3.1-70b-instruct",
        "meta/llama-3.1-8b-instruct",
      },
    };
    return catalog;
}
