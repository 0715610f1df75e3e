#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <sys/time.h>

namespace voipcap {
namespace utils {

std::string to_hex(const uint8_t* data, size_t len);

// Splits a comma-separated list, dropping empty items.
std::vector<std::string> split_list(const std::string& csv);

bool contains_bytes(const std::vector<uint8_t>& haystack, const std::string& needle);
bool has_suffix_ci(const std::string& value, const std::string& suffix);

std::chrono::microseconds to_duration(const struct timeval& tv);
struct timeval now_timeval();

// Inflates a gzip file next to itself, under the name stored in the gzip
// header (or the input name without ".gz" when the header has none).
// Returns the path written. Throws SetupError.
std::string ungzip(const std::string& input_file);

}
}
