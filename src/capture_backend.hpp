#pragma once

#include <memory>
#include <string>
#include <optional>
#include <packet_data.hpp>
#include <capture_config.hpp>

namespace voipcap {

// Uniform packet source. Exactly one backend is open per engine and only
// the engine thread reads from it; stats() may be called from the stats
// thread.
class CaptureBackend {

public:
virtual ~CaptureBackend() = default;

virtual BackendType type() const = 0;

// Blocks for at most the backend read timeout.
virtual ReadResult read_packet() = 0;

// Throws SetupError when the expression does not compile or attach.
virtual void install_filter(const std::string& expression) = 0;

virtual void close() = 0;

// DLT_* value of the frames returned by read_packet().
virtual int link_type() const = 0;

// Empty when the backend has no counters (files, tunnel).
virtual std::optional<CaptureCounters> stats() { return std::nullopt; }

// Rewinds a file source to its first packet. Throws std::runtime_error for
// sources that cannot be reopened.
virtual void reopen();

};

// Opens the backend selected by config.backend and installs the filter.
// Throws SetupError.
std::unique_ptr<CaptureBackend> open_backend(const CaptureConfig& config,
                                             const std::string& filter_expression);

}
