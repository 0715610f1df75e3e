#include <ring_buffer_capture.hpp>

#include <pcap.h>
#include <poll.h>
#include <unistd.h>
#include <net/if.h>
#include <net/ethernet.h>
#include <arpa/inet.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <linux/if_packet.h>
#include <linux/filter.h>
#include <cerrno>
#include <cstring>
#include <loguru.hpp>
#include <capture_error.hpp>
#include <constants.hpp>

namespace voipcap {

namespace {

int align_up(int value, int alignment)
{
    return ((value + alignment - 1) / alignment) * alignment;
}

std::string errno_text(const char* what)
{
    return std::string(what) + ": " + std::strerror(errno);
}

}

std::optional<RingGeometry> compute_ring_geometry(int buffer_mb, int snaplen, int page_size)
{
    if (buffer_mb <= 0 || snaplen <= 0 || page_size <= 0) {
        return std::nullopt;
    }

    RingGeometry geometry;
    if (snaplen < page_size) {
        geometry.frame_size = page_size / (page_size / snaplen);
    } else {
        geometry.frame_size = (snaplen / page_size + 1) * page_size;
    }
    geometry.frame_size = align_up(geometry.frame_size, limits::tpacket_alignment);

    const int64_t block = static_cast<int64_t>(geometry.frame_size) * limits::frames_per_block;
    const int64_t block_aligned = ((block + page_size - 1) / page_size) * page_size;
    const int64_t budget = static_cast<int64_t>(buffer_mb) * 1024 * 1024;

    if (block_aligned > budget) {
        return std::nullopt;
    }
    geometry.block_size = static_cast<int>(block_aligned);
    geometry.block_count = static_cast<int>(budget / block_aligned);
    return geometry;
}

bool restore_vlan_tag(RawPacket& packet, uint32_t tp_status, uint16_t tpid, uint16_t tci)
{
    if (!(tp_status & TP_STATUS_VLAN_VALID) || packet.data.size() < 2 * ETH_ALEN) {
        return false;
    }
    if (!(tp_status & TP_STATUS_VLAN_TPID_VALID)) {
        tpid = ETH_P_8021Q;
    }

    // The kernel strips the 802.1Q tag, put it back after the MAC addresses.
    const uint8_t tag[4] = {
        static_cast<uint8_t>(tpid >> 8), static_cast<uint8_t>(tpid),
        static_cast<uint8_t>(tci >> 8), static_cast<uint8_t>(tci)
    };
    packet.data.insert(packet.data.begin() + 2 * ETH_ALEN, tag, tag + sizeof(tag));
    packet.meta.orig_len += sizeof(tag);
    packet.meta.cap_len += sizeof(tag);
    return true;
}

RingBufferCapture::RingBufferCapture(const std::string& device, const RingGeometry& geometry, bool with_vlan)
    : _geometry(geometry)
    , _with_vlan(with_vlan)
{
    _fd = socket(AF_PACKET, SOCK_RAW, htons(ETH_P_ALL));
    if (_fd < 0) {
        throw SetupError(errno_text("setting af_packet handle: socket"));
    }

    try {
        int version = TPACKET_V3;
        if (setsockopt(_fd, SOL_PACKET, PACKET_VERSION, &version, sizeof(version)) < 0) {
            throw SetupError(errno_text("setting af_packet handle: PACKET_VERSION"));
        }

        struct tpacket_req3 req{};
        req.tp_block_size = static_cast<unsigned>(geometry.block_size);
        req.tp_block_nr = static_cast<unsigned>(geometry.block_count);
        req.tp_frame_size = static_cast<unsigned>(geometry.frame_size);
        req.tp_frame_nr = (req.tp_block_size / req.tp_frame_size) * req.tp_block_nr;
        req.tp_retire_blk_tov = static_cast<unsigned>(timing::read_timeout.count());
        if (setsockopt(_fd, SOL_PACKET, PACKET_RX_RING, &req, sizeof(req)) < 0) {
            throw SetupError(errno_text("setting af_packet handle: PACKET_RX_RING"));
        }

        _ring_size = static_cast<size_t>(geometry.block_size) * geometry.block_count;
        void* ring = mmap(nullptr, _ring_size, PROT_READ | PROT_WRITE, MAP_SHARED, _fd, 0);
        if (ring == MAP_FAILED) {
            throw SetupError(errno_text("setting af_packet handle: mmap"));
        }
        _ring = static_cast<uint8_t*>(ring);

        struct sockaddr_ll addr{};
        addr.sll_family = AF_PACKET;
        addr.sll_protocol = htons(ETH_P_ALL);
        if (!device.empty() && device != "any") {
            addr.sll_ifindex = static_cast<int>(if_nametoindex(device.c_str()));
            if (addr.sll_ifindex == 0) {
                throw SetupError("setting af_packet handle: unknown interface " + device);
            }
        }
        if (bind(_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            throw SetupError(errno_text("setting af_packet handle: bind"));
        }
    } catch (const SetupError&) {
        close();
        throw;
    }

    LOG_F(INFO, "af_packet ring on %s: frame=%d block=%d blocks=%d vlan=%s",
          device.c_str(), geometry.frame_size, geometry.block_size,
          geometry.block_count, with_vlan ? "true" : "false");
}

RingBufferCapture::~RingBufferCapture()
{
    close();
}

void RingBufferCapture::set_fanout(uint16_t group_id)
{
    int arg = group_id | (PACKET_FANOUT_HASH << 16);
    if (setsockopt(_fd, SOL_PACKET, PACKET_FANOUT, &arg, sizeof(arg)) < 0) {
        throw SetupError(errno_text(("SetFanout '" + std::to_string(group_id) + "' for af_packet").c_str()));
    }
    LOG_F(INFO, "Joined fanout group %u", group_id);
}

void RingBufferCapture::install_filter(const std::string& expression)
{
    pcap_t* dead = pcap_open_dead(DLT_EN10MB, _geometry.frame_size);
    if (!dead) {
        throw SetupError("pcap_open_dead failed");
    }

    struct bpf_program program;
    if (pcap_compile(dead, &program, expression.c_str(), 1, PCAP_NETMASK_UNKNOWN) == -1) {
        std::string error = pcap_geterr(dead);
        pcap_close(dead);
        throw SetupError("SetBPFFilter '" + expression + "' for af_packet: " + error);
    }

    // struct bpf_insn and struct sock_filter share one layout.
    struct sock_fprog fprog{};
    fprog.len = static_cast<unsigned short>(program.bf_len);
    fprog.filter = reinterpret_cast<struct sock_filter*>(program.bf_insns);

    int rc = setsockopt(_fd, SOL_SOCKET, SO_ATTACH_FILTER, &fprog, sizeof(fprog));
    int saved_errno = errno;
    pcap_freecode(&program);
    pcap_close(dead);

    if (rc < 0) {
        errno = saved_errno;
        throw SetupError(errno_text(("SetBPFFilter '" + expression + "' for af_packet").c_str()));
    }
}

bool RingBufferCapture::next_block_ready() const
{
    auto* block = reinterpret_cast<const struct tpacket_block_desc*>(
        _ring + static_cast<size_t>(_block_index) * _geometry.block_size);
    return (__atomic_load_n(&block->hdr.bh1.block_status, __ATOMIC_ACQUIRE) & TP_STATUS_USER) != 0;
}

void RingBufferCapture::release_block()
{
    auto* block = reinterpret_cast<struct tpacket_block_desc*>(
        _ring + static_cast<size_t>(_block_index) * _geometry.block_size);
    __atomic_store_n(&block->hdr.bh1.block_status, TP_STATUS_KERNEL, __ATOMIC_RELEASE);
    _block_index = (_block_index + 1) % _geometry.block_count;
    _next_packet = nullptr;
}

RawPacket RingBufferCapture::take_packet(const uint8_t* frame_hdr) const
{
    auto* hdr = reinterpret_cast<const struct tpacket3_hdr*>(frame_hdr);
    const uint8_t* data = frame_hdr + hdr->tp_mac;

    RawPacket packet;
    packet.meta.timestamp.tv_sec = hdr->tp_sec;
    packet.meta.timestamp.tv_usec = hdr->tp_nsec / 1000;
    packet.meta.orig_len = hdr->tp_len;
    packet.meta.cap_len = hdr->tp_snaplen;

    packet.data.assign(data, data + hdr->tp_snaplen);
    if (_with_vlan) {
        restore_vlan_tag(packet, hdr->tp_status, hdr->hv1.tp_vlan_tpid, hdr->hv1.tp_vlan_tci);
    }
    return packet;
}

ReadResult RingBufferCapture::read_packet()
{
    if (_fd < 0 || !_ring) {
        return ReadResult::failure("read on a closed af_packet handle");
    }

    if (_packets_left == 0) {
        if (_next_packet) {
            release_block();
        }

        if (!next_block_ready()) {
            struct pollfd pfd{};
            pfd.fd = _fd;
            pfd.events = POLLIN | POLLERR;
            int rc = poll(&pfd, 1, static_cast<int>(timing::read_timeout.count()));
            if (rc < 0) {
                if (errno == EINTR) {
                    return ReadResult::timeout();
                }
                return ReadResult::failure(errno_text("poll"));
            }
            if (pfd.revents & POLLERR) {
                return ReadResult::failure("af_packet socket error");
            }
            if (rc == 0 || !next_block_ready()) {
                return ReadResult::timeout();
            }
        }

        auto* block = reinterpret_cast<const struct tpacket_block_desc*>(
            _ring + static_cast<size_t>(_block_index) * _geometry.block_size);
        _packets_left = static_cast<int>(block->hdr.bh1.num_pkts);
        _next_packet = reinterpret_cast<const uint8_t*>(block) + block->hdr.bh1.offset_to_first_pkt;

        if (_packets_left == 0) {
            // Retired by timeout with nothing in it.
            release_block();
            return ReadResult::timeout();
        }
    }

    ReadResult result;
    result.status = ReadStatus::Packet;
    result.packet = take_packet(_next_packet);

    auto* hdr = reinterpret_cast<const struct tpacket3_hdr*>(_next_packet);
    --_packets_left;
    _next_packet += hdr->tp_next_offset;
    return result;
}

void RingBufferCapture::close()
{
    if (_ring) {
        munmap(_ring, _ring_size);
        _ring = nullptr;
    }
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

int RingBufferCapture::link_type() const
{
    return DLT_EN10MB;
}

std::optional<CaptureCounters> RingBufferCapture::stats()
{
    std::lock_guard<std::mutex> lock(_stats_mutex);
    if (_fd < 0) {
        return std::nullopt;
    }

    // The kernel resets its counters on every read.
    struct tpacket_stats_v3 kstats{};
    socklen_t len = sizeof(kstats);
    if (getsockopt(_fd, SOL_PACKET, PACKET_STATISTICS, &kstats, &len) < 0) {
        LOG_F(WARNING, "Stats err: %s", std::strerror(errno));
        return std::nullopt;
    }
    _counters.received += kstats.tp_packets;
    _counters.dropped_by_os += kstats.tp_drops;
    return _counters;
}

}
