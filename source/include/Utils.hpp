#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <fstream>
#include <string_view>

struct ProcessOutput {
    bool spawned = false;       // process started at all
    int spawn_errno{};          // errno from the spawn attempt, 0 if it started
    std::optional<int> exit_code = std::nullopt; // empty when killed by a signal
    bool timed_out = false;     // killed after the hard deadline

    std::string stdout_text{}, stderr_text{};
};

std::string read_from_file(const std::string& path);

// runs argv[0] (looked up in PATH) without a shell, feeds stdin_data and
// collects both output streams; the child is killed once deadline passes
ProcessOutput run_process(const std::vector<std::string>& argv, std::chrono::milliseconds deadline, std::string_view stdin_data = {});

// HH:MM:SS in local time
std::string format_clock_time(std::chrono::system_clock::time_point tp);
