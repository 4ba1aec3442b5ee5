#include "Monitor.hpp"
#include "Config.hpp"

#include <print>
#include <csignal>

int main(int argc, char** argv) {
    // a clipboard tool that exits early must not take the process down
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto config = argc > 1 ? load_config(argv[1]) : default_config();

        Monitor m(std::move(config));
        m.run();
    }

    catch (const std::exception& ex) {
        std::println(stderr, "{}", ex.what());
        return 1;
    }
}
