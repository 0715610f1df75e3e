#include <capture_engine.hpp>

#include <thread>
#include <iostream>
#include <sys/utsname.h>
#include <loguru.hpp>
#include <constants.hpp>
#include <utils.hpp>

namespace voipcap {

const char* engine_state_name(EngineState state)
{
    switch (state) {
        case EngineState::Running:  return "running";
        case EngineState::Draining: return "draining";
        case EngineState::Stopped:  return "stopped";
        case EngineState::Failed:   return "failed";
    }
    return "unknown";
}

CaptureEngine::CaptureEngine(CaptureConfig config, PacketWorker& worker, BackendFactory factory)
    : _config(std::move(config))
    , _worker(worker)
    , _content_filter(_config.include_filters, _config.exclude_filters)
    , _step_input(&std::cin)
{
    _config.normalize();
    _filter_expression = build_filter_expression(_config.mode, _config.port_range,
                                                 _config.with_vlan, _config.with_erspan);
    log_setup();

    _backend = factory(_config, _filter_expression);
    if (!_backend) {
        throw SetupError(std::string("unknown sniffer type: ") + backend_type_name(_config.backend));
    }

    if (!_config.write_file.empty() && _config.is_file_source()) {
        LOG_F(WARNING, "Ignoring %s while replaying a file", _config.write_file.c_str());
    } else if (!_config.write_file.empty()) {
        _dump_writer = std::make_unique<PcapDumpWriter>(
            _config.write_file, _backend->link_type(), _config.snaplen, limits::dump_queue_size);
    }

    _alive.store(true);
    _state.store(EngineState::Running);

    if (StatsReporter::supports(_config)) {
        _stats_reporter = std::make_unique<StatsReporter>(
            _config.backend, [this]() { return counters(); });
    }
}

CaptureEngine::~CaptureEngine()
{
    _alive.store(false);
    if (_stats_reporter) {
        _stats_reporter->stop();
    }
    if (_dump_writer) {
        _dump_writer->stop();
    }
    close_backend();
}

void CaptureEngine::log_setup() const
{
    LOG_F(INFO, "type: %s, mode: %s, device: %s, file: %s",
          backend_type_name(_config.backend), capture_mode_name(_config.mode),
          _config.device.c_str(), _config.read_file.c_str());
    LOG_F(INFO, "bpf: %s", _filter_expression.c_str());

    auto join = [](const std::vector<std::string>& items) {
        std::string out;
        for (const auto& item : items) {
            if (!out.empty()) out += ",";
            out += item;
        }
        return out;
    };
    if (!_config.exclude_filters.empty()) {
        LOG_F(INFO, "discard: %s", join(_config.exclude_filters).c_str());
    }
    if (!_config.include_filters.empty()) {
        LOG_F(INFO, "filter: %s", join(_config.include_filters).c_str());
    }

    struct utsname info{};
    if (uname(&info) == 0) {
        LOG_F(INFO, "ostype: %s, osarch: %s", info.sysname, info.machine);
    }
}

int CaptureEngine::link_type() const
{
    std::lock_guard<std::mutex> lock(_backend_mutex);
    return _backend ? _backend->link_type() : DLT_EN10MB;
}

std::optional<CaptureCounters> CaptureEngine::counters()
{
    std::lock_guard<std::mutex> lock(_backend_mutex);
    if (!_backend) {
        return std::nullopt;
    }
    return _backend->stats();
}

void CaptureEngine::stop()
{
    _alive.store(false);
}

void CaptureEngine::fail(std::string message)
{
    LOG_F(ERROR, "%s", message.c_str());
    _error = CaptureError{ std::move(message) };
    _state.store(EngineState::Failed);
    _alive.store(false);
}

void CaptureEngine::close_backend()
{
    std::lock_guard<std::mutex> lock(_backend_mutex);
    if (_backend) {
        _backend->close();
    }
}

void CaptureEngine::wait_for_step()
{
    std::cout << "Press enter to read next packet" << std::endl;
    std::string line;
    std::getline(*_step_input, line);
}

std::optional<CaptureError> CaptureEngine::run()
{
    while (_alive.load()) {
        if (_config.one_at_a_time) {
            wait_for_step();
        }

        ReadResult result = _backend->read_packet();

        switch (result.status) {
            case ReadStatus::Timeout:
                continue;

            case ReadStatus::EndOfStream:
                handle_end_of_stream();
                continue;

            case ReadStatus::Error:
                fail("sniffing error: " + result.error);
                continue;

            case ReadStatus::Packet:
                if (result.packet.data.empty()) {
                    continue;
                }
                process(result.packet);
                break;
        }
    }

    if (_state.load() != EngineState::Failed) {
        _state.store(EngineState::Stopped);
    }
    close_backend();

    LOG_F(INFO, "Capture loop finished (%s)", engine_state_name(_state.load()));
    return _error;
}

void CaptureEngine::handle_end_of_stream()
{
    LOG_F(1, "End of file");
    ++_passes;

    const bool more_passes = _config.replay_forever ||
        (_config.replay_loops && *_config.replay_loops > 0 && _passes <= *_config.replay_loops + 1);

    if (!more_passes) {
        _state.store(EngineState::Draining);
        // Let asynchronous consumers flush before stopping.
        std::this_thread::sleep_for(timing::flush_grace);
        _alive.store(false);
        return;
    }

    LOG_F(1, "Reopening the file");
    std::this_thread::sleep_for(timing::reopen_grace);
    try {
        std::lock_guard<std::mutex> lock(_backend_mutex);
        _backend->reopen();
    } catch (const std::runtime_error& e) {
        fail(std::string("error reopening file: ") + e.what());
        return;
    }
    _last_packet_time.reset();
}

void CaptureEngine::pace(const RawPacket& packet)
{
    if (!_last_packet_time) {
        return;
    }

    auto delta = utils::to_duration(packet.meta.timestamp) - utils::to_duration(*_last_packet_time);
    if (delta.count() > 0) {
        std::this_thread::sleep_for(delta);
    } else if (delta.count() < 0) {
        LOG_F(WARNING, "Time in pcap went backwards: %lld us", static_cast<long long>(delta.count()));
    }
}

void CaptureEngine::process(RawPacket& packet)
{
    if (!_content_filter.empty() && !_content_filter.match(packet)) {
        return;
    }

    if (_config.is_file_source()) {
        if (!_config.fast_replay) {
            pace(packet);
        }
        _last_packet_time = packet.meta.timestamp;
        if (!_config.fast_replay) {
            // Consumers see capture-time semantics during replay.
            packet.meta.timestamp = utils::now_timeval();
        }
    } else if (_dump_writer) {
        if (!_dump_writer->enqueue(packet)) {
            LOG_F(WARNING, "Dump queue closed, packet not persisted");
        }
    }

    _worker.on_packet(packet);
}

}
