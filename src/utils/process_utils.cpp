/**
 * @file process_utils.cpp
 * @brief fork/exec implementation with poll-driven pipe handling
 *
 * The parent multiplexes three pipes with poll(): it writes the stdin
 * payload while draining stdout and stderr, so a child that produces a
 * large archive on stdout while still reading stdin cannot deadlock.
 *
 * @date 2025
 */

#include "sandcell/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandcell {
namespace utils {

namespace {

// Writing to a child that already exited must surface as EPIPE, not kill us
void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Drain whatever is readable; closes the fd on EOF or hard error
void ReadAvailable(int& fd, std::string& sink) {
    std::array<char, 8192> buffer;
    while (fd >= 0) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        CloseFd(fd);
    }
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult ProcessUtils::Run(const std::vector<std::string>& argv,
                                const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("Cannot run an empty command");
    }

    IgnoreSigpipeOnce();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    // Close-on-exec so a concurrent fork in another thread cannot inherit our ends
    if (::pipe2(stdin_pipe, O_CLOEXEC) < 0 || ::pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        throw std::runtime_error("Failed to create pipes: " + reason);
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    auto start_time = std::chrono::steady_clock::now();
    pid_t pid = ::fork();

    if (pid < 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        throw std::runtime_error("Failed to fork process: " + reason);
    }

    if (pid == 0) {
        // Child: wire pipes onto the standard descriptors and exec
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            ::close(p[0]);
            ::close(p[1]);
        }
        std::signal(SIGPIPE, SIG_DFL);
        ::execvp(c_argv[0], c_argv.data());
        const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    CloseFd(stdin_pipe[0]);
    CloseFd(stdout_pipe[1]);
    CloseFd(stderr_pipe[1]);

    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    SetNonBlocking(in_fd);
    SetNonBlocking(out_fd);
    SetNonBlocking(err_fd);

    ProcessResult result;
    std::size_t written = 0;
    if (options.stdin_data.empty()) {
        CloseFd(in_fd);
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = start_time + *options.timeout;
    }

    while (out_fd >= 0 || err_fd >= 0 || in_fd >= 0) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (in_fd >= 0)  fds[count++] = {in_fd, POLLOUT, 0};
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                spdlog::warn("Process '{}' exceeded timeout, killing pid {}", argv[0], pid);
                ::kill(pid, SIGKILL);
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll() failed: {}", std::strerror(errno));
            ::kill(pid, SIGKILL);
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;

            if (fds[i].fd == in_fd) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    CloseFd(in_fd);
                    continue;
                }
                ssize_t n = ::write(in_fd, options.stdin_data.data() + written,
                                    options.stdin_data.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    spdlog::debug("stdin write stopped: {}", std::strerror(errno));
                    CloseFd(in_fd);
                }
                if (written >= options.stdin_data.size()) {
                    CloseFd(in_fd);
                }
            } else if (fds[i].fd == out_fd) {
                ReadAvailable(out_fd, result.stdout_output);
            } else if (fds[i].fd == err_fd) {
                ReadAvailable(err_fd, result.stderr_output);
            }
        }
    }

    CloseFd(in_fd);
    CloseFd(out_fd);
    CloseFd(err_fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    result.exit_code = result.timed_out ? 124 : DecodeWaitStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

bool ProcessUtils::IsOnPath(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::string path_list(path_env);
    std::size_t begin = 0;
    while (begin <= path_list.size()) {
        std::size_t end = path_list.find(':', begin);
        if (end == std::string::npos) end = path_list.size();
        std::filesystem::path candidate = path_list.substr(begin, end - begin);
        candidate /= program;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        begin = end + 1;
    }
    return false;
}

} // namespace utils
} // namespace sandcell
