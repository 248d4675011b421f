#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cbzxl {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// reaps the child, killing it if it outlives the deadline
int reap_child(const pid_t pid,
               const std::chrono::steady_clock::time_point deadline,
               bool& timed_out) {
    int status = 0;
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, timed_out ? 0 : WNOHANG);
        if (r == pid) return decode_status(status);
        if (r < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            ::kill(pid, SIGKILL);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& args,
                          const std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (args.empty()) return result;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        Logger::log(LogLevel::Error, std::string("pipe2 failed: ") + std::strerror(errno), "process");
        return result;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        Logger::log(LogLevel::Error, std::string("pipe2 failed: ") + std::strerror(errno), "process");
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    // argv must be ready before fork: the child may only call async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }
    if (pid < 0) {
        Logger::log(LogLevel::Error, "fork failed for " + args.front() + ": " + std::strerror(errno), "process");
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    result.launched = true;
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&result.out, &result.err};
    std::array<char, 4096> buffer{};
    int open_fds = 2;

    while (open_fds > 0) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            ::kill(pid, SIGKILL);
            break;
        }
        const int rc = ::poll(fds.data(), fds.size(), static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            Logger::log(LogLevel::Warning, std::string("poll failed: ") + std::strerror(errno), "process");
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i].fd);
                --open_fds;
            }
        }
    }

    close_fd(fds[0].fd);
    close_fd(fds[1].fd);

    result.exit_code = reap_child(pid, deadline, result.timed_out);
    return result;
}

std::optional<fs::path> find_executable(const std::string_view name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string_view::npos) {
        const fs::path direct(name);
        if (::access(direct.c_str(), X_OK) == 0) return direct;
        return std::nullopt;
    }

    const char* env = std::getenv("PATH");
    const std::string path_list = env ? env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path_list.size()) {
        const size_t end = path_list.find(':', start);
        std::string dir = path_list.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (dir.empty()) dir = ".";
        const fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace cbzxl
