#include <tunnel_capture.hpp>

#include <pcap.h>
#include <unistd.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>
#include <loguru.hpp>
#include <capture_error.hpp>
#include <constants.hpp>
#include <utils.hpp>

namespace voipcap {

TunnelHeader parse_tunnel_header(const uint8_t* data)
{
    TunnelHeader header;
    header.flags = static_cast<uint16_t>((data[0] << 8) | data[1]);
    header.group_policy_id = static_cast<uint16_t>((data[2] << 8) | data[3]);
    header.network_id = (uint32_t(data[4]) << 16) | (uint32_t(data[5]) << 8) | uint32_t(data[6]);
    header.reserved = data[7];
    return header;
}

TunnelCapture::TunnelCapture(uint16_t port, int snaplen)
    : _buffer(static_cast<size_t>(snaplen))
{
    _sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (_sock < 0) {
        throw SetupError(std::string("tunnel socket: ") + std::strerror(errno));
    }

    int reuse = 1;
    if (setsockopt(_sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_F(WARNING, "SO_REUSEADDR: %s", std::strerror(errno));
    }

    // Bounded reads keep the engine's alive flag responsive.
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timing::read_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timing::read_timeout.count() % 1000) * 1000);
    if (setsockopt(_sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        std::string error = std::strerror(errno);
        close();
        throw SetupError("tunnel socket timeout: " + error);
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (bind(_sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string error = std::strerror(errno);
        close();
        throw SetupError("listen udp :" + std::to_string(port) + ": " + error);
    }

    LOG_F(INFO, "Listening for VXLAN on udp port %u", local_port());
}

TunnelCapture::~TunnelCapture()
{
    close();
}

uint16_t TunnelCapture::local_port() const
{
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (_sock < 0 || getsockname(_sock, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

void TunnelCapture::install_filter(const std::string& expression)
{
    // Decapsulated frames arrive on a plain UDP socket, no kernel filter applies.
    LOG_F(1, "[TunnelCapture] ignoring filter '%s'", expression.c_str());
}

ReadResult TunnelCapture::read_packet()
{
    if (_sock < 0) {
        return ReadResult::failure("read on a closed tunnel socket");
    }

    ssize_t length = 0;
    while (length < static_cast<ssize_t>(limits::tunnel_header_len)) {
        length = recvfrom(_sock, _buffer.data(), _buffer.size(), 0, nullptr, nullptr);
        if (length < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return ReadResult::timeout();
            }
            return ReadResult::failure(std::string("tunnel read: ") + std::strerror(errno));
        }
        if (length < static_cast<ssize_t>(limits::tunnel_header_len)) {
            LOG_F(WARNING, "Too short data for VXLAN header: %zd", length);
        }
    }

    const size_t inner_len = static_cast<size_t>(length) - limits::tunnel_header_len;
    if (inner_len < limits::ethernet_header_len) {
        LOG_F(1, "[TunnelCapture] inner frame of %zu bytes is shorter than an Ethernet header", inner_len);
    }

    TunnelHeader header = parse_tunnel_header(_buffer.data());
    LOG_F(1, "[TunnelCapture] flags=0x%04x vni=%u len=%zu", header.flags, header.network_id, inner_len);

    ReadResult result;
    result.status = ReadStatus::Packet;
    result.packet.meta.timestamp = utils::now_timeval();
    result.packet.meta.orig_len = static_cast<uint32_t>(inner_len);
    result.packet.meta.cap_len = static_cast<uint32_t>(inner_len);
    result.packet.data.assign(_buffer.begin() + limits::tunnel_header_len, _buffer.begin() + length);
    return result;
}

void TunnelCapture::close()
{
    if (_sock >= 0) {
        ::close(_sock);
        _sock = -1;
    }
}

int TunnelCapture::link_type() const
{
    return DLT_EN10MB;
}

}
