#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns exit code, -1 on timeout or signal.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM then SIGKILL).
    void terminate();

private:
    int pid_ = -1;
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               int stdout_fd, int stderr_fd);
};

// Spawn a child process with stdin closed. stdout_fd / stderr_fd, when >= 0,
// become the child's stdout / stderr.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    int stdout_fd = -1, int stderr_fd = -1);

// Run a program to completion, capturing its output. No shell is involved.
// Fails if the program cannot be started or exceeds timeout_ms.
Result<CommandOutput> run(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms = 5000);

} // namespace platform
