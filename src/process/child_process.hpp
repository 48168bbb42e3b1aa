#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/errors/toolgate_errors.hpp"

namespace toolgate::process {

struct SpawnRequest {
    std::filesystem::path executable;
    std::vector<std::string> arguments;
    // Overlaid on the core's own environment.
    std::map<std::string, std::string> environment;
    std::filesystem::path working_directory;
};

// A long-lived child with its three standard streams piped to the parent.
// The descriptors stay open until the object is destroyed, so readers holding
// a shared_ptr never see a recycled fd.
class ChildProcess {
public:
    static core::errors::Result<std::shared_ptr<ChildProcess>> spawn(
        const SpawnRequest& request);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Reaps the child if it has exited. Safe to call from any thread.
    bool has_exited();
    std::optional<int> exit_code();

    // SIGTERM, wait up to `grace`, then SIGKILL. Returns true if the child
    // had to be killed.
    bool terminate(std::chrono::milliseconds grace);

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    bool reap_locked(bool block);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    std::mutex mutex_;
    bool reaped_ = false;
    int exit_code_ = -1;
};

}  // namespace toolgate::process
