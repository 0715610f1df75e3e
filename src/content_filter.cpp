#include <content_filter.hpp>

#include <loguru.hpp>
#include <utils.hpp>

namespace voipcap {

ContentFilter::ContentFilter(std::vector<std::string> include, std::vector<std::string> exclude)
    : _include(std::move(include))
    , _exclude(std::move(exclude))
{}

bool ContentFilter::match(const RawPacket& packet) const
{
    for (const auto& term : _include) {
        if (!utils::contains_bytes(packet.data, term)) {
            LOG_F(1, "[ContentFilter] missing include term '%s'", term.c_str());
            return false;
        }
    }

    for (const auto& term : _exclude) {
        if (utils::contains_bytes(packet.data, term)) {
            LOG_F(1, "[ContentFilter] discarded on '%s'", term.c_str());
            return false;
        }
    }

    return true;
}

}
