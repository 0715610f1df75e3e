#pragma once

#include <string>

namespace voipcap {

// Traffic classes the kernel filter selects, from plain SIP to SIP plus
// media/control heuristics.
enum class CaptureMode {
    Sip,
    SipDns,
    SipLog,
    SipRtp,
    SipRtcp
};

// Unrecognized names select SipRtcp, the richest variant.
CaptureMode parse_capture_mode(const std::string& name);
const char* capture_mode_name(CaptureMode mode);

std::string build_filter_expression(CaptureMode mode,
                                    const std::string& port_range,
                                    bool with_vlan,
                                    bool with_erspan);

}
