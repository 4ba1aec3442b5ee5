#pragma once

#include <string>
#include <vector>
#include <chrono>

struct ClipboardResult {
    bool success;
    std::string error;
};

class Clipboard {
public:
    virtual ~Clipboard() = default;

    virtual ClipboardResult copy(const std::string& text) = 0;
};

// pipes the text into an external tool such as wl-copy, xclip or pbcopy
class CommandClipboard : public Clipboard {
public:
    explicit CommandClipboard(std::vector<std::string> command): _command(std::move(command)) {}

    ClipboardResult copy(const std::string& text) override;

    const std::vector<std::string>& command() const { return _command; }

    // picked from the session type when the config does not name one
    static std::vector<std::string> default_command();

private:
    std::vector<std::string> _command;

    static constexpr std::chrono::milliseconds DEADLINE{2000};
};
