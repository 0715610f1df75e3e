#pragma once

#include <string>
#include <vector>
#include <optional>
#include <constants.hpp>
#include <filter_expression.hpp>

namespace voipcap {

enum class BackendType {
    Live,
    RingBuffer,
    Tunnel
};

// Accepts both "live|ring-buffer|tunnel" and "pcap|af_packet|vxlan";
// anything else means Live.
BackendType parse_backend_type(const std::string& name);
const char* backend_type_name(BackendType type);

struct CaptureConfig
{
    BackendType backend = BackendType::Live;
    CaptureMode mode = CaptureMode::SipRtcp;
    std::string device;
    std::string read_file;
    int snaplen = limits::default_snaplen;
    std::string port_range = limits::default_ports;
    bool with_vlan = false;
    bool with_erspan = false;
    int buffer_size_mb = limits::default_buffer_mb;
    int fanout_id = 0;
    int tunnel_port = limits::default_tunnel_port;

    // Extra passes over read_file. Absent, negative or zero means one pass.
    std::optional<int> replay_loops;
    bool replay_forever = false;
    // Skip replay pacing and keep the file timestamps.
    bool fast_replay = false;

    std::vector<std::string> include_filters;
    std::vector<std::string> exclude_filters;
    std::string write_file;
    bool one_at_a_time = false;

    bool is_file_source() const { return !read_file.empty(); }

    // Clamps out-of-range values to their defaults and rejects combinations
    // no backend can serve. Throws SetupError.
    void normalize();

    static CaptureConfig from_args(int argc, char** argv);
};

}
