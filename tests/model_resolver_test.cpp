#include <network/nim_proxy_config.hpp>
#include <translation/model_catalog.hpp>
#include <translation/model_resolver.hpp>
#include <translation/upstream_result.hpp>

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include <gtest/gtest.h>

namespace Testing {

class ModelResolverTest : public ::testing::Test
{
  public:
    // Probe which succeeds only for names listed in servedNames.
    CModelResolver::TProbeFunction MakeProbe()
    {
        return [this](const std::string &model) -> TUpstreamResult {
            ++probeCalls;
            if (servedNames.count(model) > 0)
            {
                return TUpstreamOk{200, {}};
            }
            return TProbeFailed{"Request failed with status code 404"};
        };
    }

    TNimProxyConfig MakeConfig(const bool enableThinking = true)
    {
        return TNimProxyConfig{ENimProxyVerbosity::Debug, 3000, "https://localhost/v1", "key",
                               false, enableThinking, log, log};
    }

    std::ostringstream log;
    std::atomic<int> probeCalls{0};
    std::unordered_set<std::string> servedNames{"qwen/qwen3-235b-a22b", "meta/llama-3.3-70b"};
    const TModelCatalog &catalog = GetDefaultModelCatalog();
};

TEST_F(ModelResolverTest, AliasIsResolvedWithoutProbe)
{
    const auto config = MakeConfig();
    CModelResolver resolver(catalog, MakeProbe(), config);

    const auto res = resolver.Resolve("gpt-4o");
    EXPECT_EQ(res.backendName, "deepseek-ai/deepseek-v3.1");
    EXPECT_FALSE(res.thinkingEligible);
    EXPECT_EQ(probeCalls.load(), 0);
    EXPECT_EQ(resolver.CacheSize(), 0u);
}

TEST_F(ModelResolverTest, AliasToThinkingCapableIsEligible)
{
    const auto config = MakeConfig();
    CModelResolver resolver(catalog, MakeProbe(), config);

    const auto res = resolver.Resolve("gpt-3.5-turbo");
    EXPECT_EQ(res.backendName, "nvidia/llama-3.1-nemotron-ultra-253b-v1");
    EXPECT_TRUE(res.thinkingEligible);
    EXPECT_NE(log.str().find("[PROXY] gpt-3.5-turbo -> nvidia/llama-3.1-nemotron-ultra-253b-v1 "
                             "| thinking: true"),
              std::string::npos);
}

TEST_F(ModelResolverTest, ThinkingDisabledMakesNothingEligible)
{
    const auto config = MakeConfig(false);
    CModelResolver resolver(catalog, MakeProbe(), config);

    EXPECT_FALSE(resolver.Resolve("gpt-4").thinkingEligible);
    EXPECT_FALSE(resolver.Resolve("qwen/qwen3-235b-a22b").thinkingEligible);
}

TEST_F(ModelResolverTest, SuccessfulProbeIsCachedAndUsedAsIs)
{
    const auto config = MakeConfig();
    CModelResolver resolver(catalog, MakeProbe(), config);

    const auto first = resolver.Resolve("qwen/qwen3-235b-a22b");
    const auto second = resolver.Resolve("qwen/qwen3-235b-a22b");

    EXPECT_EQ(first.backendName, "qwen/qwen3-235b-a22b");
    EXPECT_TRUE(first.thinkingEligible);
    EXPECT_EQ(second.backendName, first.backendName);
    EXPECT_EQ(probeCalls.load(), 1);

    const auto cached = resolver.GetCached("qwen/qwen3-235b-a22b");
    ASSERT_TRUE(cached.has_value());
    ASSERT_TRUE(cached->has_value());
    EXPECT_EQ(**cached, "qwen/qwen3-235b-a22b");
}

TEST_F(ModelResolverTest, FailedProbeIsCachedAndFallsBack)
{
    const auto config = MakeConfig();
    CModelResolver resolver(catalog, MakeProbe(), config);

    EXPECT_EQ(resolver.Resolve("my-claude-clone").backendName, "meta/llama-3.1-70b-instruct");
    EXPECT_EQ(resolver.Resolve("my-claude-clone").backendName, "meta/llama-3.1-70b-instruct");
    EXPECT_EQ(probeCalls.load(), 1);

    const auto cached = resolver.GetCached("my-claude-clone");
    ASSERT_TRUE(cached.has_value());
    EXPECT_FALSE(cached->has_value());
    EXPECT_NE(log.str().find("[WARNING] Model probe failed for 'my-claude-clone'"),
              std::string::npos);
}

TEST_F(ModelResolverTest, FailedProbeIsNotRetriedLater)
{
    const auto config = MakeConfig();
    CModelResolver resolver(catalog, MakeProbe(), config);

    EXPECT_EQ(resolver.Resolve("late-model").backendName, "meta/llama-3.1-8b-instruct");
    servedNames.insert("late-model");
    EXPECT_EQ(resolver.Resolve("late-model").backendName, "meta/llama-3.1-8b-instruct");
    EXPECT_EQ(probeCalls.load(), 1);
}

TEST_F(ModelResolverTest, ThrowingProbeIsTreatedAsFailure)
{
    const auto config = MakeConfig();
    CModelResolver resolver(
      catalog,
      [](const std::string &) -> TUpstreamResult {
          throw std::runtime_error("network is down");
      },
      config);

    EXPECT_EQ(resolver.Resolve("GPT-4-32k").backendName, "meta/llama-3.1-405b-instruct");
    EXPECT_NE(log.str().find("network is down"), std::string::npos);
}

TEST_F(ModelResolverTest, UpstreamErrorFromProbeFallsBack)
{
    const auto config = MakeConfig();
    CModelResolver resolver(
      catalog,
      [](const std::string &) -> TUpstreamResult {
          return TUpstreamError{503, "Request failed with status code 503"};
      },
      config);

    EXPECT_EQ(resolver.Resolve("unknown").backendName, "meta/llama-3.1-8b-instruct");
    EXPECT_FALSE(resolver.Resolve("unknown").thinkingEligible);
}

TEST_F(ModelResolverTest, FallbackTiersFirstMatchWins)
{
    const auto &tiers = catalog.fallback;
    EXPECT_EQ(CModelResolver::Fallback(tiers, "gpt-4-vision"), tiers.largest);
    EXPECT_EQ(CModelResolver::Fallback(tiers, "Claude-Opus-Next"), tiers.largest);
    EXPECT_EQ(CModelResolver::Fallback(tiers, "some-405B-model"), tiers.largest);
    // "gpt-4" is checked before "70b".
    EXPECT_EQ(CModelResolver::Fallback(tiers, "gpt-4-70b"), tiers.largest);
    EXPECT_EQ(CModelResolver::Fallback(tiers, "claude-instant"), tiers.mid);
    EXPECT_EQ(CModelResolver::Fallback(tiers, "gemini-ultra"), tiers.mid);
    EXPECT_EQ(CModelResolver::Fallback(tiers, "foo-70b"), tiers.mid);
    EXPECT_EQ(CModelResolver::Fallback(tiers, "mistral-7b"), tiers.smallest);
    EXPECT_EQ(CModelResolver::Fallback(tiers, ""), tiers.smallest);
}

TEST_F(ModelResolverTest, ConcurrentResolveGivesSameAnswer)
{
    const auto config = MakeConfig();
    CModelResolver resolver(catalog, MakeProbe(), config);

    constexpr int kThreads = 8;
    std::vector<std::string> results(kThreads);
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&resolver, &results, i]() {
            results[i] = resolver.Resolve("meta/llama-3.3-70b").backendName;
        });
    }
    for (auto &t : threads)
    {
        t.join();
    }

    for (const auto &r : results)
    {
        EXPECT_EQ(r, "meta/llama-3.3-70b");
    }
    EXPECT_EQ(resolver.CacheSize(), 1u);
    EXPECT_GE(probeCalls.load(), 1);
}

} // namespace Testing
