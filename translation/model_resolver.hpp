#pragma once

#include "model_catalog.hpp"   // IWYU pragma: keep
#include "upstream_result.hpp" // IWYU pragma: keep

#include <common/cm_ctors.h>
#include <network/nim_proxy_config.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/// @brief Backend model chosen for the public name.
struct TResolution
{
    std::string backendName;
    /// @brief Backend is allowed to receive thinking directive and thinking mode is enabled.
    bool thinkingEligible{false};
};

/// @brief Resolves public model names to backend models: alias table first, then cached or
/// freshly probed upstream name, then fallback heuristic. Never fails.
/// Probe results (including failures) are cached for the lifetime of the object, there is no
/// expiry. Resolve() can be called from many threads.
class CModelResolver
{
  public:
    using TProbeFunction = std::function<TUpstreamResult(const std::string &model)>;
    using TCachedValue = std::optional<std::string>;

    NO_COPYMOVE(CModelResolver);
    CModelResolver() = delete;
    ~CModelResolver() = default;

    CModelResolver(const TModelCatalog &catalog, TProbeFunction probe,
                   const TNimProxyConfig &config);

    [[nodiscard]]
    TResolution Resolve(const std::string &publicName);

    /// @returns Cached probe result for @p publicName: outer std::nullopt if name was never
    /// probed, inner std::nullopt if probe failed.
    [[nodiscard]]
    std::optional<TCachedValue> GetCached(const std::string &publicName) const;

    [[nodiscard]]
    std::size_t CacheSize() const;

    /// @brief Picks backend for the name which cannot be served as is. Checks lowercased name,
    /// first match wins: "gpt-4"/"claude-opus"/"405b", then "claude"/"gemini"/"70b".
    [[nodiscard]]
    static const std::string &Fallback(const TFallbackTiers &tiers, const std::string &publicName);

  private:
    [[nodiscard]]
    TCachedValue ResolveUnaliased(const std::string &publicName);
    [[nodiscard]]
    TCachedValue ProbeAndCache(const std::string &publicName);

    const TModelCatalog &catalog;
    TProbeFunction probe;
    std::reference_wrapper<const TNimProxyConfig> config;

    mutable std::mutex cacheMutex;
    std::unordered_map<std::string, TCachedValue> cache;
};
