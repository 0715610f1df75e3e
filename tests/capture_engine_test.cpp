#include <gtest/gtest.h>

#include <sstream>
#include <capture_engine.hpp>
#include "test_support.hpp"

using namespace voipcap;
using namespace voipcap::testing;
using namespace std::chrono_literals;

namespace {

CaptureConfig file_config()
{
    CaptureConfig config;
    config.read_file = "replay.pcap";
    config.fast_replay = true;
    return config;
}

CaptureConfig device_config()
{
    CaptureConfig config;
    config.device = "eth0";
    return config;
}

// Hands the engine a FakeBackend and keeps a pointer to it for inspection.
struct FakeFactory
{
    std::vector<ReadResult> script;
    bool reopenable = true;
    FakeBackend* last = nullptr;
    std::string filter;

    CaptureEngine::BackendFactory make()
    {
        return [this](const CaptureConfig&, const std::string& expression) {
            auto backend = std::make_unique<FakeBackend>(script, reopenable);
            backend->install_filter(expression);
            filter = expression;
            last = backend.get();
            return std::unique_ptr<CaptureBackend>(std::move(backend));
        };
    }
};

std::vector<ReadResult> three_packets()
{
    return { packet_result(make_packet("one", make_time(1000, 0))),
             packet_result(make_packet("two", make_time(1000, 10))),
             packet_result(make_packet("three", make_time(1000, 20))) };
}

}

TEST(CaptureEngine, InstallsBuiltFilterOnBackend)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;
    auto config = file_config();
    config.mode = CaptureMode::Sip;

    CaptureEngine engine(config, worker, factory.make());

    EXPECT_EQ(engine.filter_expression(), build_filter_expression(CaptureMode::Sip, "5060-5090", false, false));
    EXPECT_EQ(factory.last->installed_filter, engine.filter_expression());
    EXPECT_EQ(engine.state(), EngineState::Running);
}

TEST(CaptureEngine, SinglePassWithoutLoopCount)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;

    CaptureEngine engine(file_config(), worker, factory.make());
    auto error = engine.run();

    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(worker.payloads(), (std::vector<std::string>{ "one", "two", "three" }));
    EXPECT_EQ(factory.last->reopens, 0);
    EXPECT_EQ(engine.state(), EngineState::Stopped);
    EXPECT_GE(factory.last->closes, 1);
}

TEST(CaptureEngine, LoopCountZeroIsOnePass)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;
    auto config = file_config();
    config.replay_loops = 0;

    CaptureEngine engine(config, worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());
    EXPECT_EQ(worker.packets.size(), 3u);
}

TEST(CaptureEngine, LoopCountTwoReplaysThreeTimes)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;
    auto config = file_config();
    config.replay_loops = 2;

    CaptureEngine engine(config, worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());

    EXPECT_EQ(worker.packets.size(), 9u);
    EXPECT_EQ(factory.last->reopens, 2);
    EXPECT_EQ(engine.state(), EngineState::Stopped);
}

TEST(CaptureEngine, ReplayForeverRunsUntilStopped)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;
    auto config = file_config();
    config.replay_forever = true;

    CaptureEngine engine(config, worker, factory.make());
    worker.on_each = [&](size_t n) { if (n == 12) engine.stop(); };

    EXPECT_FALSE(engine.run().has_value());
    EXPECT_EQ(worker.packets.size(), 12u);
    EXPECT_EQ(factory.last->reopens, 3);
}

TEST(CaptureEngine, IncludeAndExcludeFilters)
{
    FakeFactory factory{ { packet_result(make_packet("INVITE ... OPTIONS")),
                           packet_result(make_packet("BYE")),
                           packet_result(make_packet("INVITE sip:bob")) } };
    RecordingWorker worker;
    auto config = file_config();
    config.include_filters = { "INVITE" };
    config.exclude_filters = { "OPTIONS" };

    CaptureEngine engine(config, worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());
    EXPECT_EQ(worker.payloads(), (std::vector<std::string>{ "INVITE sip:bob" }));
}

TEST(CaptureEngine, TimeoutsAreAbsorbed)
{
    FakeFactory factory{ { ReadResult::timeout(),
                           packet_result(make_packet("a")),
                           ReadResult::timeout(),
                           ReadResult::timeout(),
                           packet_result(make_packet("b")) } };
    RecordingWorker worker;

    CaptureEngine engine(file_config(), worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());
    EXPECT_EQ(worker.payloads(), (std::vector<std::string>{ "a", "b" }));
}

TEST(CaptureEngine, EmptyReadsAreSkipped)
{
    FakeFactory factory{ { packet_result(make_packet("")), packet_result(make_packet("x")) } };
    RecordingWorker worker;

    CaptureEngine engine(file_config(), worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());
    EXPECT_EQ(worker.packets.size(), 1u);
}

TEST(CaptureEngine, HardErrorStopsDispatch)
{
    FakeFactory factory{ { packet_result(make_packet("a")),
                           packet_result(make_packet("b")),
                           ReadResult::failure("device went away"),
                           packet_result(make_packet("c")) } };
    RecordingWorker worker;
    auto config = file_config();
    config.replay_loops = 5;

    CaptureEngine engine(config, worker, factory.make());
    auto error = engine.run();

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "sniffing error: device went away");
    EXPECT_EQ(worker.packets.size(), 2u);
    EXPECT_EQ(engine.state(), EngineState::Failed);
    EXPECT_EQ(factory.last->reopens, 0);
}

TEST(CaptureEngine, ReopenFailureIsReturned)
{
    FakeFactory factory{ three_packets(), false };
    RecordingWorker worker;
    auto config = file_config();
    config.replay_loops = 1;

    CaptureEngine engine(config, worker, factory.make());
    auto error = engine.run();

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message.rfind("error reopening file: ", 0), 0u);
    EXPECT_EQ(worker.packets.size(), 3u);
    EXPECT_EQ(engine.state(), EngineState::Failed);
}

TEST(CaptureEngine, StopEndsLoopAtNextIteration)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;

    CaptureEngine engine(file_config(), worker, factory.make());
    worker.on_each = [&](size_t n) { if (n == 1) engine.stop(); };

    EXPECT_FALSE(engine.run().has_value());
    EXPECT_EQ(worker.packets.size(), 1u);
    EXPECT_FALSE(engine.is_alive());
    EXPECT_EQ(engine.state(), EngineState::Stopped);
}

TEST(CaptureEngine, ReplayPacingFollowsOriginalGaps)
{
    FakeFactory factory{ { packet_result(make_packet("a", make_time(2000, 0))),
                           packet_result(make_packet("b", make_time(2000, 500000))) } };
    RecordingWorker worker;
    auto config = file_config();
    config.fast_replay = false;

    CaptureEngine engine(config, worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());

    ASSERT_EQ(worker.arrivals.size(), 2u);
    auto gap = worker.arrivals[1] - worker.arrivals[0];
    EXPECT_GE(gap, 490ms);
    EXPECT_LT(gap, 1500ms);

    // Timestamps are rewritten to the replay wall-clock.
    EXPECT_GT(worker.packets[0].meta.timestamp.tv_sec, 2000);
}

TEST(CaptureEngine, TimestampRegressionDoesNotSleep)
{
    FakeFactory factory{ { packet_result(make_packet("a", make_time(2000, 0))),
                           packet_result(make_packet("b", make_time(1990, 0))) } };
    RecordingWorker worker;
    auto config = file_config();
    config.fast_replay = false;

    CaptureEngine engine(config, worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());

    ASSERT_EQ(worker.arrivals.size(), 2u);
    EXPECT_LT(worker.arrivals[1] - worker.arrivals[0], 200ms);
}

TEST(CaptureEngine, FastReplayKeepsFileTimestamps)
{
    FakeFactory factory{ { packet_result(make_packet("a", make_time(2000, 0))),
                           packet_result(make_packet("b", make_time(2005, 0))) } };
    RecordingWorker worker;

    CaptureEngine engine(file_config(), worker, factory.make());
    EXPECT_FALSE(engine.run().has_value());

    ASSERT_EQ(worker.packets.size(), 2u);
    EXPECT_EQ(worker.packets[0].meta.timestamp.tv_sec, 2000);
    EXPECT_EQ(worker.packets[1].meta.timestamp.tv_sec, 2005);
    EXPECT_LT(worker.arrivals[1] - worker.arrivals[0], 1s);
}

TEST(CaptureEngine, SingleStepWaitsForInput)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;
    auto config = file_config();
    config.one_at_a_time = true;

    std::istringstream input("\n\n\n\n");
    CaptureEngine engine(config, worker, factory.make());
    engine.set_step_input(input);

    EXPECT_FALSE(engine.run().has_value());
    EXPECT_EQ(worker.packets.size(), 3u);
    EXPECT_EQ(factory.last->reads, 4);
}

TEST(CaptureEngine, NormalizesConfigBeforeOpeningBackend)
{
    CaptureConfig seen;
    RecordingWorker worker;
    auto config = file_config();
    config.snaplen = 0;
    config.buffer_size_mb = -3;

    CaptureEngine engine(config, worker, [&](const CaptureConfig& c, const std::string&) {
        seen = c;
        return std::unique_ptr<CaptureBackend>(std::make_unique<FakeBackend>(three_packets()));
    });

    EXPECT_EQ(seen.snaplen, 65535);
    EXPECT_EQ(seen.buffer_size_mb, 32);
    EXPECT_EQ(engine.config().snaplen, 65535);
}

TEST(CaptureEngine, InvalidConfigIsSetupError)
{
    FakeFactory factory{ three_packets() };
    RecordingWorker worker;
    CaptureConfig config;

    EXPECT_THROW((CaptureEngine{ config, worker, factory.make() }), SetupError);
}

TEST(CaptureEngine, SetupErrorPropagatesFromConstructor)
{
    RecordingWorker worker;
    auto failing = [](const CaptureConfig&, const std::string&) -> std::unique_ptr<CaptureBackend> {
        throw SetupError("couldn't open file");
    };

    EXPECT_THROW((CaptureEngine{ file_config(), worker, failing }), SetupError);
}

TEST(CaptureEngine, LiveSourcePersistsDispatchedPackets)
{
    auto dir = scratch_dir();
    auto out = dir / "dump.pcap";

    FakeFactory factory{ three_packets() };
    RecordingWorker worker;
    auto config = device_config();
    config.write_file = out.string();
    config.include_filters = { "t" };

    {
        CaptureEngine engine(config, worker, factory.make());
        worker.on_each = [&](size_t n) { if (n == 2) engine.stop(); };
        EXPECT_FALSE(engine.run().has_value());
    }

    // "one" has no 't'.
    EXPECT_EQ(worker.payloads(), (std::vector<std::string>{ "two", "three" }));
    EXPECT_EQ(count_pcap_packets(out), 2u);
}

TEST(CaptureEngine, LiveSourceKeepsCaptureTimestamps)
{
    FakeFactory factory{ { packet_result(make_packet("a", make_time(2000, 0))),
                           packet_result(make_packet("b", make_time(1990, 0))) } };
    RecordingWorker worker;

    CaptureEngine engine(device_config(), worker, factory.make());
    worker.on_each = [&](size_t n) { if (n == 2) engine.stop(); };

    EXPECT_FALSE(engine.run().has_value());
    ASSERT_EQ(worker.packets.size(), 2u);
    EXPECT_EQ(worker.packets[1].meta.timestamp.tv_sec, 1990);
}

TEST(CaptureEngine, EndOfStreamWithoutReplayBudgetDrains)
{
    FakeFactory factory{ { packet_result(make_packet("a")) }, false };
    RecordingWorker worker;

    CaptureEngine engine(device_config(), worker, factory.make());
    auto error = engine.run();

    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(engine.state(), EngineState::Stopped);
}
