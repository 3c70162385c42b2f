#include "model_resolver.hpp" // IWYU pragma: keep

#include <common/lambda_visitors.h>
#include <common/string_utils.h>

#include <cstddef>
#include <exception>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

CModelResolver::CModelResolver(const TModelCatalog &catalog, TProbeFunction probe,
                               const TNimProxyConfig &config) :
    catalog(catalog),
    probe(std::move(probe)),
    config(config)
{
}

TResolution CModelResolver::Resolve(const std::string &publicName)
{
    TResolution res;
    if (auto aliased = catalog.aliases.Find(publicName))
    {
        res.backendName = std::move(*aliased);
    }
    else if (auto probed = ResolveUnaliased(publicName))
    {
        res.backendName = std::move(*probed);
    }
    else
    {
        res.backendName = Fallback(catalog.fallback, publicName);
    }

    res.thinkingEligible =
      config.get().enableThinking && catalog.IsThinkingCapable(res.backendName);

    config.get().ExecIfFittingVerbosity(ENimProxyVerbosity::Debug, [&](auto &os) {
        os << "[PROXY] " << publicName << " -> " << res.backendName
           << " | thinking: " << std::boolalpha << res.thinkingEligible << std::noboolalpha
           << std::endl;
    });
    return res;
}

std::optional<CModelResolver::TCachedValue>
CModelResolver::GetCached(const std::string &publicName) const
{
    const std::lock_guard lock(cacheMutex);
    const auto it = cache.find(publicName);
    if (it == cache.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t CModelResolver::CacheSize() const
{
    const std::lock_guard lock(cacheMutex);
    return cache.size();
}

CModelResolver::TCachedValue CModelResolver::ResolveUnaliased(const std::string &publicName)
{
    if (auto cached = GetCached(publicName))
    {
        return std::move(*cached);
    }
    // Lock is not held while probing. Concurrent probes of the same name are possible, they
    // store identical results.
    return ProbeAndCache(publicName);
}

CModelResolver::TCachedValue CModelResolver::ProbeAndCache(const std::string &publicName)
{
    TCachedValue value{std::nullopt};
    std::string failure;
    try
    {
        const LambdaVisitor visitor{
          [&](const TUpstreamOk &) {
              value = publicName;
          },
          [&](const TProbeFailed &failed) {
              failure = failed.reason;
          },
          [&](const TUpstreamError &error) {
              failure = error.message;
          },
        };
        std::visit(visitor, probe(publicName));
    }
    catch (std::exception &e)
    {
        failure = e.what();
    }

    if (!value)
    {
        config.get().ExecIfFittingVerbosity(ENimProxyVerbosity::Warning, [&](auto &os) {
            os << "[WARNING] Model probe failed for '" << publicName << "': " << failure
               << std::endl;
        });
    }

    const std::lock_guard lock(cacheMutex);
    cache.insert_or_assign(publicName, value);
    return value;
}

const std::string &CModelResolver::Fallback(const TFallbackTiers &tiers,
                                            const std::string &publicName)
{
    const auto lower = utility::to_lower_copy(publicName);
    const auto containsAny = [&lower](std::initializer_list<const char *> needles) {
        for (const auto *needle : needles)
        {
            if (utility::contains(lower, needle))
            {
                return true;
            }
        }
        return false;
    };

    if (containsAny({"gpt-4", "claude-opus", "405b"}))
    {
        return tiers.largest;
    }
    if (containsAny({"claude", "gemini", "70b"}))
    {
        return tiers.mid;
    }
    return tiers.smallest;
}
