#pragma once

#include <packet_data.hpp>

namespace voipcap {

class PacketFilter {

public:
virtual ~PacketFilter() = default;

virtual bool match(const RawPacket& packet) const = 0;

};

}
