#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <sys/time.h>

namespace voipcap {

struct CaptureMetadata
{
    struct timeval timestamp{};
    uint32_t orig_len = 0;   // length on the wire
    uint32_t cap_len = 0;    // bytes actually captured
};

struct RawPacket
{
    CaptureMetadata meta;
    std::vector<uint8_t> data;
};

// Snapshot of backend counters. dropped_by_interface is only reported by
// the live backend, the ring buffer folds all drops into dropped_by_os.
struct CaptureCounters
{
    uint64_t received = 0;
    uint64_t dropped_by_os = 0;
    uint64_t dropped_by_interface = 0;
};

enum class ReadStatus {
    Packet,
    Timeout,
    EndOfStream,
    Error
};

struct ReadResult
{
    ReadStatus status = ReadStatus::Timeout;
    RawPacket packet;
    std::string error;

    static ReadResult timeout() { return {}; }
    static ReadResult end_of_stream() { return { .status = ReadStatus::EndOfStream }; }
    static ReadResult failure(std::string message) {
        return { .status = ReadStatus::Error, .error = std::move(message) };
    }
};

}
