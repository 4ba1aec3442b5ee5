#include "Utils.hpp"

#include <array>
#include <algorithm>
#include <cerrno>
#include <ctime>
#include <format>

#include <poll.h>
#include <fcntl.h>
#include <spawn.h>
#include <signal.h>
#include <pthread.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

std::string read_from_file(const std::string& path) {
	std::ifstream file(path, std::ios::binary | std::ios::ate);

	if (!file.is_open()) {
		throw std::runtime_error("Could not open file: " + path);
	}

	std::streamsize size = file.tellg();
	file.seekg(0, std::ios::beg);

	std::string data(size, '\0');
	file.read(data.data(), size);

    return data;
}

namespace {

    constexpr std::chrono::milliseconds POLL_SLICE{50};

    struct Pipe {
        int fds[2] { -1, -1 };

        ~Pipe() { close_read(); close_write(); }

        bool open() { return ::pipe(fds) == 0; }
        void close_read()  { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
        void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
    };

    // reads until the pipe is empty without waiting on a writer that may
    // never close its end
    void drain_nonblocking(Pipe& pipe, std::string& sink) {
        int fd = pipe.fds[0];
        if (fd < 0) return;

        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);

        std::array<char, 4096> buf{};
        for (;;) {
            auto n = ::read(fd, buf.data(), buf.size());
            if (n > 0) {
                sink.append(buf.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break; // EOF or EAGAIN
        }

        pipe.close_read();
    }

    void write_all(int fd, std::string_view data) {
        if (data.empty()) return;

        // a child that exits without reading stdin must not take the
        // calling process down with SIGPIPE
        sigset_t pipe_set, old_set;
        sigemptyset(&pipe_set);
        sigaddset(&pipe_set, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

        bool broken = false;
        while (!data.empty()) {
            auto n = ::write(fd, data.data(), data.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                broken = errno == EPIPE;
                break;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }

        if (broken && !sigismember(&old_set, SIGPIPE)) {
            timespec zero{};
            while (sigtimedwait(&pipe_set, nullptr, &zero) > 0) {}
        }

        pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    }
}

ProcessOutput run_process(const std::vector<std::string>& argv, std::chrono::milliseconds deadline, std::string_view stdin_data) {
    ProcessOutput out;

    if (argv.empty()) {
        out.spawn_errno = EINVAL;
        return out;
    }

    Pipe in, stdout_pipe, stderr_pipe;

    if (!in.open() || !stdout_pipe.open() || !stderr_pipe.open()) {
        out.spawn_errno = errno;
        return out;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);

    posix_spawn_file_actions_adddup2(&actions, in.fds[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdout_pipe.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderr_pipe.fds[1], STDERR_FILENO);

    for (int fd: { in.fds[1], stdout_pipe.fds[0], stderr_pipe.fds[0] }) posix_spawn_file_actions_addclose(&actions, fd);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a: argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid{};
    int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        out.spawn_errno = rc;
        return out;
    }

    out.spawned = true;

    in.close_read();
    stdout_pipe.close_write();
    stderr_pipe.close_write();

    write_all(in.fds[1], stdin_data);
    in.close_write();

    auto until = std::chrono::steady_clock::now() + deadline;
    std::array<char, 4096> buf{};

    int status{};
    bool reaped = false;

    while (stdout_pipe.fds[0] >= 0 || stderr_pipe.fds[0] >= 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now());

        if (left.count() <= 0) {
            ::kill(pid, SIGKILL);
            out.timed_out = true;
            break;
        }

        std::array<pollfd, 2> pfds {{
            { stdout_pipe.fds[0], POLLIN, 0 },
            { stderr_pipe.fds[0], POLLIN, 0 }
        }};

        int ready = ::poll(pfds.data(), pfds.size(), static_cast<int>(std::min(left, POLL_SLICE).count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            ::kill(pid, SIGKILL);
            break;
        }

        if (ready == 0) {
            // xclip and friends leave a forked helper holding our pipes open
            if (::waitpid(pid, &status, WNOHANG) == pid) {
                reaped = true;

                // whatever the child wrote just before exiting is still buffered
                drain_nonblocking(stdout_pipe, out.stdout_text);
                drain_nonblocking(stderr_pipe, out.stderr_text);
                break;
            }
            continue;
        }

        auto drain = [&](pollfd& p, Pipe& pipe, std::string& sink) {
            if (p.fd < 0 || !(p.revents & (POLLIN | POLLHUP | POLLERR))) return;

            auto n = ::read(p.fd, buf.data(), buf.size());
            if (n > 0) sink.append(buf.data(), static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) pipe.close_read();
        };

        drain(pfds[0], stdout_pipe, out.stdout_text);
        drain(pfds[1], stderr_pipe, out.stderr_text);
    }

    while (!reaped && ::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return out;
    }

    if (WIFEXITED(status)) out.exit_code = WEXITSTATUS(status);

    return out;
}

std::string format_clock_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    return std::format("{:02}:{:02}:{:02}", local.tm_hour, local.tm_min, local.tm_sec);
}
