#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <thread>
#include <stats_reporter.hpp>

using namespace voipcap;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& done, std::chrono::milliseconds limit = 2000ms)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return done();
}

}

TEST(StatsReporter, PollsCountersOnEveryTick)
{
    std::atomic<uint64_t> polls{0};
    StatsReporter reporter(BackendType::Live, [&]() -> std::optional<CaptureCounters> {
        uint64_t n = ++polls;
        return CaptureCounters{ .received = n * 10, .dropped_by_os = n, .dropped_by_interface = 0 };
    }, 10ms);

    ASSERT_TRUE(wait_until([&]() { return reporter.ticks() >= 3; }));
    reporter.stop();

    auto last = reporter.last();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->received, polls.load() * 10);
    EXPECT_EQ(reporter.ticks(), polls.load());
}

TEST(StatsReporter, MissingCountersAreTolerated)
{
    StatsReporter reporter(BackendType::RingBuffer, []() { return std::optional<CaptureCounters>{}; }, 10ms);

    ASSERT_TRUE(wait_until([&]() { return reporter.ticks() >= 2; }));
    reporter.stop();
    EXPECT_FALSE(reporter.last().has_value());
}

TEST(StatsReporter, StopDoesNotWaitForTheTimer)
{
    auto start = std::chrono::steady_clock::now();
    {
        StatsReporter reporter(BackendType::Live, []() { return std::optional<CaptureCounters>{}; });
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(StatsReporter, OnlyDeviceBackendsReport)
{
    CaptureConfig live;
    live.device = "eth0";
    EXPECT_TRUE(StatsReporter::supports(live));

    CaptureConfig ring = live;
    ring.backend = BackendType::RingBuffer;
    EXPECT_TRUE(StatsReporter::supports(ring));

    CaptureConfig file;
    file.read_file = "trace.pcap";
    EXPECT_FALSE(StatsReporter::supports(file));

    CaptureConfig tunnel;
    tunnel.backend = BackendType::Tunnel;
    EXPECT_FALSE(StatsReporter::supports(tunnel));
}
