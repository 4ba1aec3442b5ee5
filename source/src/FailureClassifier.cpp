#include "FailureClassifier.hpp"

#include <array>
#include <cerrno>
#include <format>
#include <charconv>
#include <cstring>
#include <span>

namespace {

    bool contains_any(std::string_view text, std::span<const std::string_view> needles) {
        for (auto needle: needles) {
            if (text.find(needle) != std::string_view::npos) return true;
        }
        return false;
    }

    // walks left from pos over digits (and a decimal point when allowed)
    std::string_view number_before(std::string_view text, size_t pos, bool allow_fraction) {
        size_t end = pos;
        while (end > 0 && text[end - 1] == ' ') --end;

        size_t begin = end;
        while (begin > 0) {
            char c = text[begin - 1];
            if ((c >= '0' && c <= '9') || (allow_fraction && c == '.')) --begin;
            else break;
        }

        return text.substr(begin, end - begin);
    }

    std::string trimmed(std::string_view text) {
        auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return {};

        auto last = text.find_last_not_of(" \t\r\n");
        return std::string(text.substr(first, last - first + 1));
    }

    constexpr std::array<std::string_view, 3> tool_missing_phrases {
        "command not found",
        "not executable",
        "Permission denied"
    };

    constexpr std::array<std::string_view, 6> resolution_phrases {
        "Name or service not known",
        "cannot resolve",
        "Unknown host",
        "unknown host",
        "Temporary failure in name resolution",
        "nodename nor servname provided"
    };
}

PingReport parse_ping_report(std::string_view text) {
    PingReport report;

    // "1 packets transmitted" on iputils, bsd and busybox; some builds say "packet"
    for (std::string_view marker: { std::string_view{" packets transmitted"}, std::string_view{" packet transmitted"} }) {
        auto pos = text.find(marker);
        if (pos == std::string_view::npos) continue;

        auto digits = number_before(text, pos, false);
        uint32_t value{};

        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec == std::errc{} && !digits.empty()) report.transmitted = value;
        break;
    }

    auto loss_pos = text.find("% packet loss");
    if (loss_pos != std::string_view::npos) {
        auto digits = number_before(text, loss_pos, true);
        double value{};

        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec == std::errc{} && !digits.empty()) report.loss_percent = value;
    }

    return report;
}

FailureKind classify_failure(std::string_view error_text, std::string_view output_text) {
    auto report = parse_ping_report(output_text);

    if ((report.loss_percent && *report.loss_percent >= 100.0) || parse_ping_report(error_text).loss_percent.value_or(0.0) >= 100.0) {
        return FailureKind::HostUnreachable;
    }

    if (contains_any(error_text, tool_missing_phrases)) return FailureKind::ProbeToolUnavailable;

    if (contains_any(error_text, resolution_phrases) || contains_any(output_text, resolution_phrases)) {
        return FailureKind::InvalidAddress;
    }

    return FailureKind::Unknown;
}

ProbeResult evaluate_ping(const PingOutput& output) {
    ProbeResult result;

    std::string error_text = trimmed(output.stderr_text);

    if (!output.spawned) {
        if (output.spawn_errno == ENOENT) error_text = "ping: command not found";
        else if (output.spawn_errno == EACCES) error_text = "ping: not executable";
        else error_text = std::format("ping: could not start ({})", std::strerror(output.spawn_errno));
    }
    else if (output.timed_out) {
        if (!error_text.empty()) error_text += '\n';
        error_text += "ping: killed after deadline";
    }
    else if (!output.exit_code) {
        if (!error_text.empty()) error_text += '\n';
        error_text += "ping: terminated by signal";
    }
    else if (*output.exit_code == 127 || *output.exit_code == 126) {
        // a wrapper shell could not find or run the tool
        if (!error_text.empty()) error_text += '\n';
        error_text += *output.exit_code == 127 ? "ping: command not found" : "ping: not executable";
    }

    auto report = parse_ping_report(output.stdout_text);

    bool clean_exit = output.spawned && !output.timed_out && output.exit_code == 0;

    result.reachable = clean_exit
        && error_text.empty()
        && report.transmitted == 1u
        && report.loss_percent.value_or(0.0) < 100.0;

    if (result.reachable) {
        result.raw_detail = trimmed(output.stdout_text);
        return result;
    }

    result.failure_reason = classify_failure(error_text, output.stdout_text);

    auto out = trimmed(output.stdout_text);

    if (error_text.empty()) result.raw_detail = out;
    else if (out.empty()) result.raw_detail = error_text;
    else result.raw_detail = std::format("{}\n{}", error_text, out);

    if (result.raw_detail.empty() && output.exit_code) {
        result.raw_detail = std::format("ping exited with status {}", *output.exit_code);
    }

    return result;
}
