#include "PingTransport.hpp"

#include <algorithm>

std::vector<std::string> SystemPing::build_command(const std::string& address, std::chrono::milliseconds timeout) const {
    // ping only takes whole seconds, never go below one
    auto secs = std::max<long long>(1, (timeout.count() + 999) / 1000);

#ifdef __APPLE__
    return { _command, "-c", "1", "-t", std::to_string(secs), address };
#else
    return { _command, "-c", "1", "-W", std::to_string(secs), address };
#endif
}

PingOutput SystemPing::ping(const std::string& address, std::chrono::milliseconds timeout) {
    return run_process(build_command(address, timeout), timeout + KILL_GRACE);
}
