#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/// @brief Public (caller facing) model name and backend model it is served by.
struct TModelAlias
{
    std::string publicName;
    std::string backendName;
};

/// @brief Immutable mapping of public model names to backend models.
class CAliasTable
{
  public:
    using TAliases = std::vector<TModelAlias>;

    explicit CAliasTable(TAliases aliases);

    /// @returns backend name mapped to @p publicName or std::nullopt if name is not aliased.
    [[nodiscard]]
    std::optional<std::string> Find(const std::string &publicName) const;

    /// @returns All aliases in declaration order.
    [[nodiscard]]
    const TAliases &GetAliases() const
    {
        return aliases;
    }

  private:
    TAliases aliases;
};

using TThinkingCapableSet = std::unordered_set<std::string>;

/// @brief Backend models used when unknown name cannot be served as is.
struct TFallbackTiers
{
    std::string largest;
    std::string mid;
    std::string smallest;
};

/// @brief Everything resolver needs to know about backend models.
struct TModelCatalog
{
    CAliasTable aliases;
    TThinkingCapableSet thinkingCapable;
    TFallbackTiers fallback;

    [[nodiscard]]
    bool IsThinkingCapable(const std::string &backendName) const
    {
        return thinkingCapable.count(backendName) > 0;
    }
};

/// @returns Global static catalog of NVIDIA NIM models the proxy is shipped with.
const TModelCatalog &GetDefaultModelCatalog();
