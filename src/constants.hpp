#pragma once

#include <chrono>
#include <cstddef>

namespace voipcap::flags {

inline constexpr const char* type         = "--type";
inline constexpr const char* device       = "--device";
inline constexpr const char* read         = "--read";
inline constexpr const char* snaplen      = "--snaplen";
inline constexpr const char* portrange    = "--portrange";
inline constexpr const char* mode         = "--mode";
inline constexpr const char* vlan         = "--vlan";
inline constexpr const char* erspan       = "--erspan";
inline constexpr const char* buffer_mb    = "--buffer-mb";
inline constexpr const char* fanout       = "--fanout";
inline constexpr const char* tunnel_port  = "--tunnel-port";
inline constexpr const char* loop         = "--loop";
inline constexpr const char* loop_forever = "--loop-forever";
inline constexpr const char* fast_replay  = "--fast-replay";
inline constexpr const char* filter       = "--filter";
inline constexpr const char* discard      = "--discard";
inline constexpr const char* write        = "--write";
inline constexpr const char* step         = "--step";

}

namespace voipcap::limits {

inline constexpr int default_snaplen        = 65535;
inline constexpr int default_buffer_mb      = 32;
inline constexpr int default_tunnel_port    = 4789;
inline constexpr const char* default_ports  = "5060-5090";
inline constexpr std::size_t dump_queue_size = 20000;
inline constexpr std::size_t tunnel_header_len = 8;
inline constexpr std::size_t ethernet_header_len = 14;
inline constexpr int frames_per_block       = 128;
inline constexpr int tpacket_alignment      = 16;

}

namespace voipcap::timing {

using namespace std::chrono_literals;

inline constexpr auto read_timeout    = 1000ms;
inline constexpr auto reopen_grace    = 250ms;
inline constexpr auto flush_grace     = 200ms;
inline constexpr auto shutdown_grace  = 1500ms;  // longer than read_timeout
inline constexpr auto stats_interval  = std::chrono::minutes(1);
inline constexpr auto signal_poll     = 100ms;

}
