#pragma once

#include <string>
#include <mutex>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <capture_backend.hpp>

namespace voipcap {

struct RingGeometry
{
    int frame_size = 0;
    int block_size = 0;
    int block_count = 0;
};

// Fits a TPACKET_V3 ring into buffer_mb megabytes: frames hold at least
// snaplen bytes, blocks are page multiples and block_size * block_count
// never exceeds the budget. Empty when no block fits.
std::optional<RingGeometry> compute_ring_geometry(int buffer_mb, int snaplen, int page_size);

// Re-inserts the VLAN tag the kernel moved into the frame header when
// tp_status says one was present. A missing TPID means 802.1Q.
bool restore_vlan_tag(RawPacket& packet, uint32_t tp_status, uint16_t tpid, uint16_t tci);

// AF_PACKET socket reading a memory-mapped TPACKET_V3 receive ring.
class RingBufferCapture : public CaptureBackend {

public:
RingBufferCapture(const std::string& device, const RingGeometry& geometry, bool with_vlan);
~RingBufferCapture() override;

RingBufferCapture(const RingBufferCapture&) = delete;
RingBufferCapture& operator=(const RingBufferCapture&) = delete;

BackendType type() const override { return BackendType::RingBuffer; }
ReadResult read_packet() override;
void install_filter(const std::string& expression) override;
void close() override;
int link_type() const override;
std::optional<CaptureCounters> stats() override;

// Joins the hash fanout group shared by every reader using the same id.
void set_fanout(uint16_t group_id);

private:
bool next_block_ready() const;
void release_block();
RawPacket take_packet(const uint8_t* frame_hdr) const;

int _fd = -1;
uint8_t* _ring = nullptr;
size_t _ring_size = 0;
RingGeometry _geometry;
bool _with_vlan = false;

int _block_index = 0;
int _packets_left = 0;      // unread packets in the current block
const uint8_t* _next_packet = nullptr;

std::mutex _stats_mutex;
CaptureCounters _counters;

};

}
