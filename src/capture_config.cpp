#include <capture_config.hpp>

#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <capture_error.hpp>
#include <utils.hpp>

namespace voipcap {

namespace {

const char* usage =
    "Usage:\n"
    "  ./voipcap --device <iface> [--type live|ring-buffer|tunnel] [options]\n"
    "  ./voipcap --read <file.pcap[.gz]> [--loop <n> | --loop-forever] [--fast-replay]\n"
    "  ./voipcap --type tunnel [--tunnel-port <port>]\n"
    "Options:\n"
    "  --mode SIP|SIPDNS|SIPLOG|SIPRTP|SIPRTCP  --portrange <lo-hi>  --snaplen <n>\n"
    "  --vlan  --erspan  --buffer-mb <n>  --fanout <id>\n"
    "  --filter <a,b>  --discard <a,b>  --write <file.pcap>  --step\n";

int to_int(const std::string& flag, const std::string& value)
{
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw SetupError("Invalid number for " + flag + ": " + value);
    }
}

}

BackendType parse_backend_type(const std::string& name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "ring-buffer" || lower == "af_packet") return BackendType::RingBuffer;
    if (lower == "tunnel" || lower == "vxlan") return BackendType::Tunnel;
    return BackendType::Live;
}

const char* backend_type_name(BackendType type)
{
    switch (type) {
        case BackendType::RingBuffer: return "ring-buffer";
        case BackendType::Tunnel:     return "tunnel";
        case BackendType::Live:       break;
    }
    return "live";
}

void CaptureConfig::normalize()
{
    if (snaplen <= 0) snaplen = limits::default_snaplen;
    if (buffer_size_mb <= 0) buffer_size_mb = limits::default_buffer_mb;

    if (backend == BackendType::Tunnel) {
        if (tunnel_port < 0 || tunnel_port > 65535) {
            throw SetupError("Tunnel port out of range: " + std::to_string(tunnel_port));
        }
        return;
    }

    if (device.empty() && read_file.empty()) {
        throw SetupError("Please specify a capture device with --device or a file with --read");
    }
    if (backend == BackendType::RingBuffer && is_file_source()) {
        throw SetupError("The ring-buffer backend cannot read capture files, use --type live");
    }
    if (fanout_id < 0 || fanout_id > 0xffff) {
        throw SetupError("Fanout id out of range: " + std::to_string(fanout_id));
    }
}

CaptureConfig CaptureConfig::from_args(int argc, char** argv)
{
    CaptureConfig config;
    std::unordered_map<std::string, std::string> options;

    const char* valued[] = {
        flags::type, flags::device, flags::read, flags::snaplen, flags::portrange,
        flags::mode, flags::buffer_mb, flags::fanout, flags::tunnel_port,
        flags::loop, flags::filter, flags::discard, flags::write
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == flags::vlan) {
            config.with_vlan = true;
        } else if (arg == flags::erspan) {
            config.with_erspan = true;
        } else if (arg == flags::loop_forever) {
            config.replay_forever = true;
        } else if (arg == flags::fast_replay) {
            config.fast_replay = true;
        } else if (arg == flags::step) {
            config.one_at_a_time = true;
        } else if (std::find(std::begin(valued), std::end(valued), arg) != std::end(valued)) {
            if (i + 1 >= argc) {
                throw SetupError("Missing value after " + arg);
            }
            options[arg] = argv[++i];
        } else {
            throw SetupError("Unknown argument: " + arg + "\n" + usage);
        }
    }

    auto value = [&](const char* flag) -> const std::string* {
        auto it = options.find(flag);
        return it == options.end() ? nullptr : &it->second;
    };

    if (auto v = value(flags::type))        config.backend = parse_backend_type(*v);
    if (auto v = value(flags::device))      config.device = *v;
    if (auto v = value(flags::read))        config.read_file = *v;
    if (auto v = value(flags::snaplen))     config.snaplen = to_int(flags::snaplen, *v);
    if (auto v = value(flags::portrange))   config.port_range = *v;
    if (auto v = value(flags::mode))        config.mode = parse_capture_mode(*v);
    if (auto v = value(flags::buffer_mb))   config.buffer_size_mb = to_int(flags::buffer_mb, *v);
    if (auto v = value(flags::fanout))      config.fanout_id = to_int(flags::fanout, *v);
    if (auto v = value(flags::tunnel_port)) config.tunnel_port = to_int(flags::tunnel_port, *v);
    if (auto v = value(flags::loop))        config.replay_loops = to_int(flags::loop, *v);
    if (auto v = value(flags::filter))      config.include_filters = utils::split_list(*v);
    if (auto v = value(flags::discard))     config.exclude_filters = utils::split_list(*v);
    if (auto v = value(flags::write))       config.write_file = *v;

    config.normalize();
    return config;
}

}
