#pragma once

#include "Target.hpp"

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <string_view>

struct MonitorConfig {
    std::vector<Target> targets;

    std::chrono::milliseconds period{10000};
    std::chrono::milliseconds probe_timeout{1000};
    std::chrono::milliseconds service_timeout{2000};
    std::chrono::milliseconds copy_feedback{2000};

    uint16_t api_port = 8080;

    std::string ping_command = "ping";
    std::vector<std::string> clipboard_command; // empty: pick per session
};

MonitorConfig default_config();

// throws std::runtime_error naming the offending key
MonitorConfig parse_config(std::string_view json_text);
MonitorConfig load_config(const std::string& path);
