/**
 * @file process_utils.cpp
 * @brief fork/exec process runner with poll()-driven capture
 *
 * **Execution Model**:
 * ```
 * parent                                   child (own process group)
 *   pipe2(stdout), pipe2(stderr)             stdin  ← /dev/null
 *   fork ─────────────────────────────────►  stdout → pipe, stderr → pipe
 *   poll() both pipes until EOF/deadline     execvp(argv)
 *   deadline: on_timeout(), SIGKILL group
 *   waitpid()
 * ```
 *
 * Output beyond `max_output_bytes` is read and discarded so the child never
 * blocks on a full pipe. After a forced kill the pipes are drained for at
 * most one second.
 *
 * @date 2025
 */

#include "coderun/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace coderun {
namespace utils {

namespace {

constexpr std::chrono::milliseconds kDrainAfterKill{1000};

struct CaptureStream {
    int fd{-1};
    std::string* buffer{nullptr};
    bool* truncated{nullptr};
};

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void AppendCapped(std::string& buffer, bool& truncated, const char* data,
                  std::size_t size, std::size_t cap) {
    const std::size_t room = cap > buffer.size() ? cap - buffer.size() : 0;
    const std::size_t take = std::min(room, size);
    buffer.append(data, take);
    if (take < size) {
        truncated = true;
    }
}

// Reads whatever is available; closes the stream on EOF or hard error.
void DrainStream(CaptureStream& stream, std::size_t cap) {
    std::array<char, 4096> chunk;
    while (stream.fd >= 0) {
        const ssize_t n = ::read(stream.fd, chunk.data(), chunk.size());
        if (n > 0) {
            AppendCapped(*stream.buffer, *stream.truncated, chunk.data(),
                         static_cast<std::size_t>(n), cap);
            continue;
        }
        if (n == 0) {
            CloseFd(stream.fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            CloseFd(stream.fd);
        }
        return;
    }
}

void KillGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

int RemainingMs(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return static_cast<int>(std::max<long long>(0, left) + 1);
}

} // anonymous namespace

ProcessResult ProcessUtils::Run(const std::vector<std::string>& argv,
                                const ProcessOptions& options) {
    if (argv.empty() || argv.front().empty()) {
        throw std::invalid_argument("Cannot run an empty command");
    }

    ProcessResult result;
    const auto start = std::chrono::steady_clock::now();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2(stdout)");
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        const int saved = errno;
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "pipe2(stderr)");
    }

    // Everything the child needs is prepared before fork(): only
    // async-signal-safe calls are allowed between fork() and exec.
    std::vector<char*> exec_args;
    exec_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        exec_args.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_args.push_back(nullptr);
    const std::string exec_failure = "failed to execute '" + argv.front() + "'\n";

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int saved = errno;
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]);
        CloseFd(err_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(exec_args[0], exec_args.data());
        const ssize_t ignored = ::write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
        (void)ignored;
        ::_exit(127);
    }

    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    std::array<CaptureStream, 2> streams = {{
        {out_pipe[0], &result.stdout_output, &result.stdout_truncated},
        {err_pipe[0], &result.stderr_output, &result.stderr_truncated},
    }};

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start + options.timeout;
    std::chrono::steady_clock::time_point drain_deadline{};
    bool killed = false;

    auto expire = [&]() {
        result.timed_out = true;
        spdlog::debug("Process '{}' exceeded {} ms, killing", argv.front(), options.timeout.count());
        if (options.on_timeout) {
            options.on_timeout();
        }
        KillGroup(pid);
        killed = true;
        drain_deadline = std::chrono::steady_clock::now() + kDrainAfterKill;
    };

    while (streams[0].fd >= 0 || streams[1].fd >= 0) {
        int wait_ms = -1;
        if (has_deadline && !killed) {
            if (std::chrono::steady_clock::now() >= deadline) {
                expire();
            } else {
                wait_ms = RemainingMs(deadline);
            }
        }
        if (killed) {
            if (std::chrono::steady_clock::now() >= drain_deadline) {
                break;
            }
            wait_ms = RemainingMs(drain_deadline);
        }

        std::array<pollfd, 2> fds{};
        std::array<CaptureStream*, 2> polled{};
        nfds_t count = 0;
        for (auto& stream : streams) {
            if (stream.fd >= 0) {
                fds[count].fd = stream.fd;
                fds[count].events = POLLIN;
                polled[count] = &stream;
                ++count;
            }
        }

        const int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() failed while capturing '{}': {}", argv.front(), std::strerror(errno));
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
                DrainStream(*polled[i], options.max_output_bytes);
            }
        }
    }

    for (auto& stream : streams) {
        CloseFd(stream.fd);
    }

    // Both pipes closed; the process may still be running (it can close its
    // own stdout), so keep honouring the deadline while reaping it.
    int status = 0;
    for (;;) {
        const pid_t waited = ::waitpid(pid, &status, has_deadline && !killed ? WNOHANG : 0);
        if (waited == pid) {
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            spdlog::error("waitpid() failed for '{}': {}", argv.front(), std::strerror(err));
            throw std::system_error(err, std::generic_category(), "waitpid() for '" + argv.front() + "'");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            expire();
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

bool ProcessUtils::Succeeds(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout) {
    ProcessOptions options;
    options.timeout = timeout;
    options.max_output_bytes = 4096;
    try {
        return Run(argv, options).Succeeded();
    }
    catch (const std::system_error& e) {
        spdlog::debug("Could not run '{}': {}", argv.empty() ? "" : argv.front(), e.what());
        return false;
    }
}

} // namespace utils
} // namespace coderun
