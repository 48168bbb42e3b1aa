#include "process/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace toolgate::process {

using core::errors::ErrorCategory;
using core::errors::ToolgateError;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pipe(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void ignore_sigpipe_once() {
    // A write to a dead child's stdin must surface as EPIPE, not kill the core.
    static std::once_flag once;
    std::call_once(once, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<std::string> merged_environment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string kv(*entry);
        const auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> flattened;
    flattened.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        flattened.push_back(key + "=" + value);
    }
    return flattened;
}

}  // namespace

ChildProcess::ChildProcess(const pid_t pid, const int stdin_fd, const int stdout_fd,
                           const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    if (!has_exited()) {
        static_cast<void>(terminate(std::chrono::milliseconds(0)));
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

core::errors::Result<std::shared_ptr<ChildProcess>> ChildProcess::spawn(
    const SpawnRequest& request) {
    ignore_sigpipe_once();

    // Everything the child needs is built before fork(); the child only
    // calls async-signal-safe functions.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(request.executable.string());
    for (const auto& arg : request.arguments) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = merged_environment(request.environment);
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string cwd = request.working_directory.string();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_error_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_error_pipe, O_CLOEXEC) != 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_error_pipe);
        return ToolgateError{ErrorCategory::Internal, "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_error_pipe);
        return ToolgateError{ErrorCategory::Internal, "Failed to fork process.",
                             "fork_failed"};
    }

    if (pid == 0) {
        // The parent may block SIGTERM (serve) and ignores SIGPIPE; both survive
        // execve, so the server starts from the default signal state.
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        static_cast<void>(sigprocmask(SIG_SETMASK, &empty_mask, nullptr));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const int err = errno;
            static_cast<void>(write(exec_error_pipe[1], &err, sizeof(err)));
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execve(argv[0], argv.data(), envp.data());
        const int err = errno;
        static_cast<void>(write(exec_error_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_error_pipe[1]);

    // The error pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return ToolgateError{ErrorCategory::Startup,
                             "Failed to launch " + request.executable.string() + ": " +
                                 std::strerror(child_errno),
                             "spawn_failed"};
    }

    return std::shared_ptr<ChildProcess>(
        new ChildProcess(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
}

bool ChildProcess::reap_locked(const bool block) {
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid_) {
        reaped_ = true;
        exit_code_ = decode_wait_status(status);
        return true;
    }
    if (waited < 0) {
        // ECHILD: someone else reaped it; it is gone either way.
        reaped_ = true;
        return true;
    }
    return false;
}

bool ChildProcess::has_exited() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reap_locked(false);
}

std::optional<int> ChildProcess::exit_code() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reap_locked(false) || exit_code_ < 0) {
        return std::nullopt;
    }
    return exit_code_;
}

bool ChildProcess::terminate(const std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reap_locked(false)) {
        return false;
    }

    static_cast<void>(kill(pid_, SIGTERM));
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap_locked(false)) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (reap_locked(false)) {
        return false;
    }

    static_cast<void>(kill(pid_, SIGKILL));
    static_cast<void>(reap_locked(true));
    return true;
}

}  // namespace toolgate::process
