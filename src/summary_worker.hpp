#pragma once

#include <atomic>
#include <cstdint>
#include <pcap.h>
#include <packet_worker.hpp>

namespace voipcap {

// Counts frames handed over by the engine and traces them at verbosity 1.
class SummaryWorker : public PacketWorker {

public:

void on_packet(const RawPacket& packet) override;
void report() const;
void set_link_type(int link_type) { _link_type.store(link_type); }

uint64_t packets() const { return _packets.load(); }
uint64_t bytes() const { return _bytes.load(); }

private:
std::atomic<int> _link_type{DLT_EN10MB};
std::atomic<uint64_t> _packets{0};
std::atomic<uint64_t> _bytes{0};

};

}
