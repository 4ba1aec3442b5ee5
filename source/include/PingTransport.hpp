#pragma once

#include "FailureClassifier.hpp"

#include <string>
#include <chrono>
#include <vector>

class PingTransport {
public:
    virtual ~PingTransport() = default;

    // blocking, runs off the io thread
    virtual PingOutput ping(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

// the system ping utility, one packet
class SystemPing : public PingTransport {
public:
    explicit SystemPing(std::string command = "ping"): _command(std::move(command)) {}

    PingOutput ping(const std::string& address, std::chrono::milliseconds timeout) override;

    std::vector<std::string> build_command(const std::string& address, std::chrono::milliseconds timeout) const;

private:
    std::string _command;

    // on top of the tool's own deadline before the process gets killed
    static constexpr std::chrono::milliseconds KILL_GRACE{1000};
};
