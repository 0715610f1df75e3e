#include <capture_backend.hpp>

#include <stdexcept>
#include <unistd.h>
#include <loguru.hpp>
#include <capture_error.hpp>
#include <live_capture.hpp>
#include <ring_buffer_capture.hpp>
#include <tunnel_capture.hpp>

namespace voipcap {

void CaptureBackend::reopen()
{
    throw std::runtime_error("Reopen is only possible for files and in live mode");
}

std::unique_ptr<CaptureBackend> open_backend(const CaptureConfig& config,
                                             const std::string& filter_expression)
{
    std::unique_ptr<CaptureBackend> backend;

    switch (config.backend) {
        case BackendType::Live:
            if (config.is_file_source()) {
                backend = LiveCapture::open_file(config.read_file);
            } else {
                backend = LiveCapture::open_device(config.device, config.snaplen);
            }
            break;

        case BackendType::RingBuffer: {
            auto geometry = compute_ring_geometry(config.buffer_size_mb, config.snaplen, static_cast<int>(sysconf(_SC_PAGESIZE)));
            if (!geometry) {
                throw SetupError("Interface buffer size of " + std::to_string(config.buffer_size_mb) +
                                 " MB is too small for snaplen " + std::to_string(config.snaplen));
            }
            auto ring = std::make_unique<RingBufferCapture>(config.device, *geometry, config.with_vlan);
            if (config.fanout_id > 0) {
                ring->set_fanout(static_cast<uint16_t>(config.fanout_id));
            }
            backend = std::move(ring);
            break;
        }

        case BackendType::Tunnel:
            backend = std::make_unique<TunnelCapture>(static_cast<uint16_t>(config.tunnel_port), config.snaplen);
            break;
    }

    backend->install_filter(filter_expression);

    LOG_F(INFO, "Opened %s backend", backend_type_name(backend->type()));
    return backend;
}

}
