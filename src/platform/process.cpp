#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (pid_ > 0) terminate();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0) terminate();
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    int status = 0;
    if (timeout_ms < 0) {
        waitpid(pid_, &status, 0);
        pid_ = -1;
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    int elapsed = 0;
    while (elapsed <= timeout_ms) {
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            pid_ = -1;
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        sleep_ms(10);
        elapsed += 10;
    }
    return -1;  // timed out, still running
}

void ProcessHandle::terminate() {
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            pid_ = -1;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    int stdout_fd, int stderr_fd) {
    ProcessHandle handle;

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);
        if (stdout_fd >= 0) dup2(stdout_fd, STDOUT_FILENO);
        if (stderr_fd >= 0) dup2(stderr_fd, STDERR_FILENO);

        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    handle.pid_ = pid;
    return handle;
}

// ── run ──────────────────────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

Result<CommandOutput> run(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms) {
    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0)
        return Result<CommandOutput>::Err(std::string("pipe: ") + std::strerror(errno));
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return Result<CommandOutput>::Err(std::string("pipe: ") + std::strerror(errno));
    }

    ProcessHandle proc = spawn(program, args, out_pipe[1], err_pipe[1]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    if (!proc.valid()) {
        close_fd(out_fd);
        close_fd(err_fd);
        return Result<CommandOutput>::Err("failed to start " + program);
    }

    CommandOutput output;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            close_fd(out_fd);
            close_fd(err_fd);
            proc.terminate();
            return Result<CommandOutput>::Err(program + " timed out");
        }

        struct pollfd fds[2];
        int nfds = 0;
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        int rc = poll(fds, nfds, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < nfds; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            bool is_out = fds[i].fd == out_fd;
            if (n > 0) {
                (is_out ? output.stdout_data : output.stderr_data).append(buf, n);
            } else {
                close_fd(is_out ? out_fd : err_fd);
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    output.exit_code = proc.wait(static_cast<int>(std::max<long long>(remaining, 0)));
    if (proc.valid()) {
        proc.terminate();
        return Result<CommandOutput>::Err(program + " timed out");
    }
    return Result<CommandOutput>::Ok(output);
}

} // namespace platform
