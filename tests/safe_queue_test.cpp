#include <common/runners.h>
#include <common/safe_queue.h>

#include <atomic>
#include <chrono> // IWYU pragma: keep
#include <string>
#include <thread>

#include <gtest/gtest.h>

namespace Testing {

using namespace utility;
using namespace std::chrono_literals;

class SafeQueueTest : public ::testing::Test
{
  public:
    SafeQueue<std::string> queue;
};

TEST_F(SafeQueueTest, PopFromEmptyQueue)
{
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(SafeQueueTest, KeepsOrder)
{
    queue.push("a");
    queue.push("b");
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.pop(), "a");
    EXPECT_EQ(queue.pop(), "b");
    EXPECT_TRUE(queue.empty());
}

TEST_F(SafeQueueTest, WaitPopTimesOut)
{
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.wait_pop(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST_F(SafeQueueTest, WaitPopReceivesFromOtherThread)
{
    auto producer = startNewRunner([this](const auto &) {
        std::this_thread::sleep_for(30ms); // NOLINT
        queue.push("hello");
    });
    EXPECT_EQ(queue.wait_pop(2s), "hello");
}

TEST_F(SafeQueueTest, WakeReleasesWaiter)
{
    std::atomic<bool> released{false};
    auto consumer = startNewRunner([this, &released](const auto &) {
        EXPECT_FALSE(queue.wait_pop(10s).has_value());
        released = true;
    });
    std::this_thread::sleep_for(50ms); // NOLINT
    queue.wake();
    consumer.reset();
    EXPECT_TRUE(released.load());
}

TEST_F(SafeQueueTest, RunnerIsSignalledOnRelease)
{
    std::atomic<int> loops{0};
    auto runner = startNewRunner([&loops](const runnerint_t &shouldStop) {
        while (!(*shouldStop))
        {
            ++loops;
            std::this_thread::sleep_for(5ms); // NOLINT
        }
    });
    std::this_thread::sleep_for(30ms); // NOLINT
    runner.reset();
    const auto stopped = loops.load();
    std::this_thread::sleep_for(20ms); // NOLINT
    EXPECT_EQ(loops.load(), stopped);
    EXPECT_GT(stopped, 0);
}

} // namespace Testing
