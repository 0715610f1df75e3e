#pragma once

#include <packet_data.hpp>

namespace voipcap {

// Downstream consumer of captured frames. Called synchronously from the
// capture loop, a slow worker throttles capture.
class PacketWorker {

public:
virtual ~PacketWorker() = default;

virtual void on_packet(const RawPacket& packet) = 0;

};

}
