#pragma once

#include <string>
#include <vector>
#include <packet_filter.hpp>

namespace voipcap {

// User-space payload filter applied after the kernel filter. A frame
// passes when it contains every include term and none of the exclude terms.
class ContentFilter : public PacketFilter {

public:
ContentFilter(std::vector<std::string> include, std::vector<std::string> exclude);

bool match(const RawPacket& packet) const override;
bool empty() const { return _include.empty() && _exclude.empty(); }

private:
std::vector<std::string> _include;
std::vector<std::string> _exclude;

};

}
