#include "ProbeResult.hpp"

std::string_view to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::HostUnreachable:      return "host_unreachable";
        case FailureKind::ProbeToolUnavailable: return "probe_tool_unavailable";
        case FailureKind::InvalidAddress:       return "invalid_address";
        case FailureKind::ServiceCheckFailed:   return "service_check_failed";
        case FailureKind::Unknown:              return "unknown";
    }

    return "unknown";
}

std::string_view troubleshooting_message(FailureKind kind) {
    switch (kind) {
        case FailureKind::HostUnreachable:
            return "Host is unreachable. Please check if:\n"
                   "• Host is powered on\n"
                   "• Connected to the network\n"
                   "• Address is correct";
        case FailureKind::ProbeToolUnavailable:
            return "Ping command not available. Please check system configuration.";
        case FailureKind::InvalidAddress:
            return "Invalid address format";
        case FailureKind::ServiceCheckFailed:
            return "Service check failed. Check that the service is running and the port is correct.";
        case FailureKind::Unknown:
            break;
    }

    return "Connection failed. Check network connectivity.";
}
