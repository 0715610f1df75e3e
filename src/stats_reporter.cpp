#include <stats_reporter.hpp>

#include <loguru.hpp>

namespace voipcap {

StatsReporter::StatsReporter(BackendType backend, CounterSource source,
                             std::chrono::milliseconds interval)
    : _backend(backend)
    , _source(std::move(source))
    , _interval(interval)
{
    _thread = std::thread(&StatsReporter::run, this);
}

StatsReporter::~StatsReporter()
{
    stop();
}

bool StatsReporter::supports(const CaptureConfig& config)
{
    if (config.is_file_source()) {
        LOG_F(INFO, "Read in pcap file. Stats won't be generated.");
        return false;
    }
    return config.backend != BackendType::Tunnel;
}

void StatsReporter::run()
{
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_cv.wait_for(lock, _interval, [&]() { return _stopping; })) {
        lock.unlock();
        auto counters = _source();
        lock.lock();

        ++_ticks;
        if (!counters) {
            continue;
        }
        _last = counters;
        report(*counters);
    }
}

void StatsReporter::report(const CaptureCounters& counters) const
{
    switch (_backend) {
        case BackendType::Live:
            LOG_F(INFO, "Stats {received dropped-os dropped-int}: {%llu %llu %llu}",
                  static_cast<unsigned long long>(counters.received),
                  static_cast<unsigned long long>(counters.dropped_by_os),
                  static_cast<unsigned long long>(counters.dropped_by_interface));
            break;
        case BackendType::RingBuffer:
            LOG_F(INFO, "Stats {received dropped}: {%llu %llu}",
                  static_cast<unsigned long long>(counters.received),
                  static_cast<unsigned long long>(counters.dropped_by_os));
            break;
        case BackendType::Tunnel:
            break;
    }
}

void StatsReporter::stop()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
    }
    _cv.notify_all();
    if (_thread.joinable()) {
        _thread.join();
    }
}

unsigned StatsReporter::ticks() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _ticks;
}

std::optional<CaptureCounters> StatsReporter::last() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _last;
}

}
