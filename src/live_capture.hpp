#pragma once

#include <pcap.h>
#include <memory>
#include <string>
#include <capture_backend.hpp>

namespace voipcap {

// libpcap source: a live device in promiscuous mode or an offline file.
class LiveCapture : public CaptureBackend {

public:
// A ".gz" file is inflated next to itself first.
static std::unique_ptr<LiveCapture> open_file(const std::string& path);
static std::unique_ptr<LiveCapture> open_device(const std::string& device, int snaplen);

~LiveCapture() override;

BackendType type() const override { return BackendType::Live; }
ReadResult read_packet() override;
void install_filter(const std::string& expression) override;
void close() override;
int link_type() const override;
std::optional<CaptureCounters> stats() override;
void reopen() override;

const std::string& source() const { return _source; }
bool is_offline() const { return _offline; }

private:
LiveCapture(pcap_t* handle, std::string source, bool offline);

static pcap_t* open_offline_handle(const std::string& path);

pcap_t* _handle = nullptr;
std::string _source;
std::string _filter;
bool _offline = false;

};

}
