#include <filter_expression.hpp>

#include <algorithm>
#include <cctype>

namespace voipcap {

namespace {

std::string sip_base(const std::string& ports)
{
    return "(tcp or sctp) and greater 42 and portrange " + ports +
           " or (udp and greater 128 and portrange " + ports +
           " or ip[6:2] & 0x1fff != 0 or ip6[6]=44)";
}

// Unfragmented IPv4 UDP whose payload starts with an RTP version 2 byte.
constexpr const char* rtp_heuristic =
    "(ip and ip[6] & 0x2 = 0 and ip[6:2] & 0x1fff = 0 and udp and udp[8] & 0xc0 = 0x80)";

// Same as above, narrowed to RTCP packet types 200..204.
constexpr const char* rtcp_heuristic =
    "(ip and ip[6] & 0x2 = 0 and ip[6:2] & 0x1fff = 0 and udp and udp[8] & 0xc0 = 0x80 and udp[9] >= 0xc8 && udp[9] <= 0xcc)";

constexpr const char* dns_heuristic = "(greater 32 and ip and dst port 53)";

constexpr const char* log_heuristic = "(greater 128 and (dst port 514 or port 2223))";

}

CaptureMode parse_capture_mode(const std::string& name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "SIP") return CaptureMode::Sip;
    if (upper == "SIPDNS") return CaptureMode::SipDns;
    if (upper == "SIPLOG") return CaptureMode::SipLog;
    if (upper == "SIPRTP") return CaptureMode::SipRtp;
    return CaptureMode::SipRtcp;
}

const char* capture_mode_name(CaptureMode mode)
{
    switch (mode) {
        case CaptureMode::Sip:    return "SIP";
        case CaptureMode::SipDns: return "SIPDNS";
        case CaptureMode::SipLog: return "SIPLOG";
        case CaptureMode::SipRtp: return "SIPRTP";
        case CaptureMode::SipRtcp: break;
    }
    return "SIPRTCP";
}

std::string build_filter_expression(CaptureMode mode,
                                    const std::string& port_range,
                                    bool with_vlan,
                                    bool with_erspan)
{
    std::string bpf = sip_base(port_range);

    switch (mode) {
        case CaptureMode::Sip:
            break;
        case CaptureMode::SipDns:
            bpf += std::string(" or ") + rtcp_heuristic + " or " + dns_heuristic;
            break;
        case CaptureMode::SipLog:
            bpf += std::string(" or ") + rtcp_heuristic + " or " + log_heuristic;
            break;
        case CaptureMode::SipRtp:
            bpf += std::string(" or ") + rtp_heuristic;
            break;
        case CaptureMode::SipRtcp:
            bpf += std::string(" or ") + rtcp_heuristic;
            break;
    }

    if (with_erspan) {
        bpf += " or proto 47";
    }
    // Every rule is tested a second time behind an 802.1Q tag.
    if (with_vlan) {
        bpf = bpf + " or (vlan and (" + bpf + "))";
    }
    return bpf;
}

}
