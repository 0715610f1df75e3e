#pragma once

#include <chrono>
#include <mutex>
#include <thread>
#include <optional>
#include <functional>
#include <condition_variable>
#include <packet_data.hpp>
#include <capture_config.hpp>

namespace voipcap {

// Periodically polls backend counters and logs them in the shape of the
// backend that produced them.
class StatsReporter {

public:
using CounterSource = std::function<std::optional<CaptureCounters>()>;

StatsReporter(BackendType backend, CounterSource source,
              std::chrono::milliseconds interval = timing::stats_interval);
~StatsReporter();

StatsReporter(const StatsReporter&) = delete;
StatsReporter& operator=(const StatsReporter&) = delete;

void stop();

unsigned ticks() const;
std::optional<CaptureCounters> last() const;

// Only live devices and the ring buffer expose counters.
static bool supports(const CaptureConfig& config);

private:
void run();
void report(const CaptureCounters& counters) const;

BackendType _backend;
CounterSource _source;
std::chrono::milliseconds _interval;

mutable std::mutex _mutex;
std::condition_variable _cv;
bool _stopping = false;
unsigned _ticks = 0;
std::optional<CaptureCounters> _last;
std::thread _thread;

};

}
