#include <live_capture.hpp>

#include <cerrno>
#include <chrono>
#include <loguru.hpp>
#include <capture_error.hpp>
#include <constants.hpp>
#include <utils.hpp>

namespace voipcap {

LiveCapture::LiveCapture(pcap_t* handle, std::string source, bool offline)
    : _handle(handle)
    , _source(std::move(source))
    , _offline(offline)
{}

LiveCapture::~LiveCapture()
{
    close();
}

pcap_t* LiveCapture::open_offline_handle(const std::string& path)
{
    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_t* handle = pcap_open_offline(path.c_str(), errbuf);
    if (!handle) {
        throw SetupError("couldn't open file " + path + "! " + errbuf);
    }
    return handle;
}

std::unique_ptr<LiveCapture> LiveCapture::open_file(const std::string& path)
{
    std::string file = path;
    if (utils::has_suffix_ci(file, ".gz")) {
        file = utils::ungzip(file);
        LOG_F(INFO, "Inflated %s to %s", path.c_str(), file.c_str());
    }

    pcap_t* handle = open_offline_handle(file);
    LOG_F(INFO, "Reading packets from %s", file.c_str());
    return std::unique_ptr<LiveCapture>(new LiveCapture(handle, file, true));
}

std::unique_ptr<LiveCapture> LiveCapture::open_device(const std::string& device, int snaplen)
{
    char errbuf[PCAP_ERRBUF_SIZE];
    const auto timeout_ms = static_cast<int>(timing::read_timeout.count());

    pcap_t* handle = pcap_open_live(device.c_str(), snaplen, 1, timeout_ms, errbuf);
    if (!handle) {
        throw SetupError(std::string("setting pcap live mode: ") + errbuf);
    }

    LOG_F(INFO, "Starting packet capture on interface: %s, snaplen=%d", device.c_str(), snaplen);
    return std::unique_ptr<LiveCapture>(new LiveCapture(handle, device, false));
}

void LiveCapture::install_filter(const std::string& expression)
{
    if (!_handle) {
        throw SetupError("install_filter on a closed handle");
    }

    struct bpf_program program;
    if (pcap_compile(_handle, &program, expression.c_str(), 1, PCAP_NETMASK_UNKNOWN) == -1) {
        throw SetupError("SetBPFFilter '" + expression + "' for " + _source + ": " + pcap_geterr(_handle));
    }

    if (pcap_setfilter(_handle, &program) == -1) {
        std::string error = pcap_geterr(_handle);
        pcap_freecode(&program);
        throw SetupError("SetBPFFilter '" + expression + "' for " + _source + ": " + error);
    }
    pcap_freecode(&program);

    _filter = expression;
}

ReadResult LiveCapture::read_packet()
{
    if (!_handle) {
        return ReadResult::failure("read on a closed handle");
    }

    struct pcap_pkthdr* header = nullptr;
    const u_char* bytes = nullptr;

    int res = pcap_next_ex(_handle, &header, &bytes);
    switch (res) {
        case 1: {
            ReadResult result;
            result.status = ReadStatus::Packet;
            result.packet.meta.timestamp = header->ts;
            result.packet.meta.orig_len = header->len;
            result.packet.meta.cap_len = header->caplen;
            result.packet.data.assign(bytes, bytes + header->caplen);
            return result;
        }
        case 0:
            return ReadResult::timeout();
        case PCAP_ERROR_BREAK:
            return ReadResult::end_of_stream();
        default:
            if (errno == EINTR) {
                return ReadResult::timeout();
            }
            return ReadResult::failure(pcap_geterr(_handle));
    }
}

void LiveCapture::close()
{
    if (_handle) {
        pcap_close(_handle);
        _handle = nullptr;
    }
}

int LiveCapture::link_type() const
{
    return _handle ? pcap_datalink(_handle) : DLT_EN10MB;
}

std::optional<CaptureCounters> LiveCapture::stats()
{
    if (_offline || !_handle) {
        return std::nullopt;
    }

    struct pcap_stat ps{};
    if (pcap_stats(_handle, &ps) != 0) {
        LOG_F(WARNING, "Stats err: %s", pcap_geterr(_handle));
        return std::nullopt;
    }
    return CaptureCounters{ .received = ps.ps_recv,
                            .dropped_by_os = ps.ps_drop,
                            .dropped_by_interface = ps.ps_ifdrop };
}

void LiveCapture::reopen()
{
    if (!_offline) {
        CaptureBackend::reopen();
    }

    // Only one handle may be open at a time.
    close();
    _handle = open_offline_handle(_source);

    if (!_filter.empty()) {
        install_filter(_filter);
    }
    LOG_F(INFO, "Reopened %s", _source.c_str());
}

}
