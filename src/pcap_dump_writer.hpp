#pragma once

#include <pcap.h>
#include <string>
#include <thread>
#include <cstdint>
#include <atomic>
#include <bounded_queue.hpp>
#include <packet_data.hpp>

namespace voipcap {

// Background thread persisting queued packets to a pcap file.
class PcapDumpWriter {

public:
PcapDumpWriter(const std::string& path, int link_type, int snaplen, size_t queue_size);
~PcapDumpWriter();

PcapDumpWriter(const PcapDumpWriter&) = delete;
PcapDumpWriter& operator=(const PcapDumpWriter&) = delete;

// Blocks while the queue is full.
bool enqueue(RawPacket packet);

// Drains what is queued, closes the file and joins the thread.
void stop();

uint64_t written() const { return _written.load(); }

private:
void run();

std::string _path;
pcap_t* _dead = nullptr;
pcap_dumper_t* _dumper = nullptr;
BoundedQueue<RawPacket> _queue;
std::atomic<uint64_t> _written{0};
std::thread _thread;

};

}
