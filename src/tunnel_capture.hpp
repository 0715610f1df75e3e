#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <capture_backend.hpp>

namespace voipcap {

struct TunnelHeader
{
    uint16_t flags = 0;
    uint16_t group_policy_id = 0;
    uint32_t network_id = 0;   // 24-bit VNI
    uint8_t reserved = 0;
};

TunnelHeader parse_tunnel_header(const uint8_t* data);

// UDP listener receiving VXLAN encapsulated frames. The 8-byte VXLAN
// header is stripped and the inner Ethernet frame returned.
class TunnelCapture : public CaptureBackend {

public:
// Port 0 binds an ephemeral port, see local_port().
TunnelCapture(uint16_t port, int snaplen);
~TunnelCapture() override;

TunnelCapture(const TunnelCapture&) = delete;
TunnelCapture& operator=(const TunnelCapture&) = delete;

BackendType type() const override { return BackendType::Tunnel; }
ReadResult read_packet() override;
void install_filter(const std::string& expression) override;
void close() override;
int link_type() const override;

uint16_t local_port() const;

private:
int _sock = -1;
std::vector<uint8_t> _buffer;

};

}
