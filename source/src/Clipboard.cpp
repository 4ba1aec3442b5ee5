#include "Clipboard.hpp"
#include "Utils.hpp"

#include <format>
#include <cstdlib>
#include <cstring>

ClipboardResult CommandClipboard::copy(const std::string& text) {
    if (_command.empty()) return { false, "No clipboard command configured" };

    auto out = run_process(_command, DEADLINE, text);

    if (!out.spawned) return { false, std::format("{}: {}", _command.front(), std::strerror(out.spawn_errno)) };
    if (out.timed_out) return { false, std::format("{} did not finish", _command.front()) };

    if (out.exit_code != 0) {
        auto reason = out.stderr_text.empty() ? std::string("no output") : out.stderr_text;
        return { false, std::format("{} failed: {}", _command.front(), reason) };
    }

    return { true, "" };
}

std::vector<std::string> CommandClipboard::default_command() {
#ifdef __APPLE__
    return { "pbcopy" };
#else
    if (std::getenv("WAYLAND_DISPLAY")) return { "wl-copy" };
    return { "xclip", "-selection", "clipboard" };
#endif
}
