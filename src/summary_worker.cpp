#include <summary_worker.hpp>

#include <algorithm>
#include <loguru.hpp>
#include <utils.hpp>

namespace voipcap {

void SummaryWorker::on_packet(const RawPacket& packet)
{
    _packets.fetch_add(1);
    _bytes.fetch_add(packet.data.size());

    const size_t preview = std::min<size_t>(packet.data.size(), 16);
    LOG_F(1, "[SummaryWorker] ts=%ld.%06ld caplen=%u len=%u link=%d head=%s",
          static_cast<long>(packet.meta.timestamp.tv_sec),
          static_cast<long>(packet.meta.timestamp.tv_usec),
          packet.meta.cap_len, packet.meta.orig_len, _link_type.load(),
          utils::to_hex(packet.data.data(), preview).c_str());
}

void SummaryWorker::report() const
{
    LOG_F(INFO, "Processed %llu packets, %llu bytes",
          static_cast<unsigned long long>(_packets.load()),
          static_cast<unsigned long long>(_bytes.load()));
}

}
