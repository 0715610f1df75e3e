#include <pcap_dump_writer.hpp>

#include <loguru.hpp>
#include <capture_error.hpp>

namespace voipcap {

PcapDumpWriter::PcapDumpWriter(const std::string& path, int link_type, int snaplen, size_t queue_size)
    : _path(path)
    , _queue(queue_size)
{
    _dead = pcap_open_dead(link_type, snaplen);
    if (!_dead) {
        throw SetupError("pcap_open_dead failed for " + path);
    }

    _dumper = pcap_dump_open(_dead, path.c_str());
    if (!_dumper) {
        std::string error = pcap_geterr(_dead);
        pcap_close(_dead);
        _dead = nullptr;
        throw SetupError("pcap_dump_open failed: " + error);
    }

    LOG_F(INFO, "Saving captured packets to %s", path.c_str());
    _thread = std::thread(&PcapDumpWriter::run, this);
}

PcapDumpWriter::~PcapDumpWriter()
{
    stop();
}

bool PcapDumpWriter::enqueue(RawPacket packet)
{
    return _queue.push(std::move(packet));
}

void PcapDumpWriter::run()
{
    while (auto packet = _queue.pop()) {
        struct pcap_pkthdr hdr{};
        hdr.ts = packet->meta.timestamp;
        hdr.caplen = static_cast<bpf_u_int32>(packet->data.size());
        hdr.len = packet->meta.orig_len;
        pcap_dump(reinterpret_cast<u_char*>(_dumper), &hdr, packet->data.data());
        _written.fetch_add(1);
    }
}

void PcapDumpWriter::stop()
{
    _queue.close();
    if (_thread.joinable()) {
        _thread.join();
    }

    if (_dumper) {
        if (pcap_dump_flush(_dumper) != 0) {
            LOG_F(WARNING, "pcap_dump_flush failed on %s", _path.c_str());
        }
        pcap_dump_close(_dumper);
        _dumper = nullptr;
        LOG_F(INFO, "Wrote %llu packets to %s",
              static_cast<unsigned long long>(_written.load()), _path.c_str());
    }
    if (_dead) {
        pcap_close(_dead);
        _dead = nullptr;
    }
}

}
