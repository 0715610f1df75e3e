#include <utils.hpp>

#include <sstream>
#include <iomanip>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <zlib.h>
#include <capture_error.hpp>

namespace voipcap {
namespace utils {

std::string to_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << (int)data[i];
    return oss.str();
}

std::vector<std::string> split_list(const std::string& csv) {
    std::vector<std::string> items;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty())
            items.push_back(item);
    }
    return items;
}

bool contains_bytes(const std::vector<uint8_t>& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return std::search(haystack.begin(), haystack.end(),
                       needle.begin(), needle.end(),
                       [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); })
           != haystack.end();
}

bool has_suffix_ci(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size()) return false;
    return std::equal(suffix.rbegin(), suffix.rend(), value.rbegin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::chrono::microseconds to_duration(const struct timeval& tv) {
    return std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
}

struct timeval now_timeval() {
    struct timeval tv{};
    gettimeofday(&tv, nullptr);
    return tv;
}

std::string ungzip(const std::string& input_file) {
    namespace fs = std::filesystem;

    std::ifstream in(input_file, std::ios::binary);
    if (!in) {
        throw SetupError("Cannot open gzip file: " + input_file);
    }

    z_stream strm{};
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        throw SetupError("inflateInit2 failed for " + input_file);
    }

    // The header is filled in as soon as inflate has consumed it.
    char name[1024] = {};
    gz_header header{};
    header.name = reinterpret_cast<Bytef*>(name);
    header.name_max = sizeof(name) - 1;
    if (inflateGetHeader(&strm, &header) != Z_OK) {
        inflateEnd(&strm);
        throw SetupError("inflateGetHeader failed for " + input_file);
    }

    std::vector<char> in_buf(64 * 1024);
    std::vector<char> out_buf(256 * 1024);
    std::vector<char> pending;
    std::ofstream out;
    std::string output_file;

    auto flush = [&](const char* data, size_t len) {
        if (!out.is_open()) {
            if (header.done != 1) {
                pending.insert(pending.end(), data, data + len);
                return;
            }
            std::string base = name[0] != '\0'
                ? fs::path(name).filename().string()
                : fs::path(input_file).stem().string();
            output_file = (fs::path(input_file).parent_path() / base).string();
            out.open(output_file, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw SetupError("Cannot create " + output_file);
            }
            if (!pending.empty()) {
                out.write(pending.data(), static_cast<std::streamsize>(pending.size()));
                pending.clear();
            }
        }
        out.write(data, static_cast<std::streamsize>(len));
        if (!out) {
            throw SetupError("Write failed on " + output_file);
        }
    };

    int ret = Z_OK;
    try {
        while (ret != Z_STREAM_END) {
            in.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
            strm.avail_in = static_cast<uInt>(in.gcount());
            if (strm.avail_in == 0) {
                throw SetupError("Truncated gzip file: " + input_file);
            }
            strm.next_in = reinterpret_cast<Bytef*>(in_buf.data());

            do {
                strm.avail_out = static_cast<uInt>(out_buf.size());
                strm.next_out = reinterpret_cast<Bytef*>(out_buf.data());
                ret = inflate(&strm, Z_NO_FLUSH);
                if (ret != Z_OK && ret != Z_STREAM_END) {
                    throw SetupError("Failed to inflate " + input_file + ": " +
                                     (strm.msg ? strm.msg : "corrupt data"));
                }
                size_t produced = out_buf.size() - strm.avail_out;
                if (produced > 0 || header.done == 1) {
                    flush(out_buf.data(), produced);
                }
            } while (strm.avail_out == 0 && ret != Z_STREAM_END);
        }
    } catch (...) {
        inflateEnd(&strm);
        throw;
    }
    inflateEnd(&strm);

    if (!out.is_open()) {
        flush(nullptr, 0);
    }
    out.close();
    if (!out) {
        throw SetupError("Write failed on " + output_file);
    }
    return output_file;
}

}
}
