#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <istream>
#include <optional>
#include <functional>
#include <capture_config.hpp>
#include <capture_backend.hpp>
#include <capture_error.hpp>
#include <content_filter.hpp>
#include <packet_worker.hpp>
#include <pcap_dump_writer.hpp>
#include <stats_reporter.hpp>

namespace voipcap {

enum class EngineState {
    Running,
    Draining,
    Stopped,
    Failed
};

const char* engine_state_name(EngineState state);

// Drives one backend: read, content filter, replay pacing, persistence and
// hand-off to the worker, in read order.
class CaptureEngine {

public:
using BackendFactory =
    std::function<std::unique_ptr<CaptureBackend>(const CaptureConfig&, const std::string&)>;

// Builds the filter, opens the backend and starts the stats and dump
// threads where they apply. Throws SetupError.
CaptureEngine(CaptureConfig config, PacketWorker& worker,
              BackendFactory factory = open_backend);
~CaptureEngine();

CaptureEngine(const CaptureEngine&) = delete;
CaptureEngine& operator=(const CaptureEngine&) = delete;

// Runs until the stream ends, stop() is called or a read fails. Returns
// the fatal error, if any.
std::optional<CaptureError> run();

// Takes effect at the next loop iteration.
void stop();

EngineState state() const { return _state.load(); }
bool is_alive() const { return _alive.load(); }
const std::string& filter_expression() const { return _filter_expression; }
const CaptureConfig& config() const { return _config; }
int link_type() const;
std::optional<CaptureCounters> counters();

// Input used by single-step mode, std::cin by default.
void set_step_input(std::istream& input) { _step_input = &input; }

private:
void log_setup() const;
void wait_for_step();
void handle_end_of_stream();
void process(RawPacket& packet);
void pace(const RawPacket& packet);
void fail(std::string message);
void close_backend();

CaptureConfig _config;
PacketWorker& _worker;
std::string _filter_expression;
ContentFilter _content_filter;

mutable std::mutex _backend_mutex;
std::unique_ptr<CaptureBackend> _backend;

std::atomic<bool> _alive{false};
std::atomic<EngineState> _state{EngineState::Running};
std::optional<CaptureError> _error;

int _passes = 1;
std::optional<struct timeval> _last_packet_time;
std::istream* _step_input;

std::unique_ptr<PcapDumpWriter> _dump_writer;
std::unique_ptr<StatsReporter> _stats_reporter;

};

}
