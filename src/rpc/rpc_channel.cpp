#include "rpc/rpc_channel.hpp"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/wire_codec.hpp"

namespace toolgate::rpc {

using core::errors::Done;
using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxFrameBytes = 16 * 1024 * 1024;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

int remaining_ms(const std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - std::chrono::steady_clock::now())
                          .count();
    return left > 0 ? static_cast<int>(left) : 0;
}

ToolgateError timeout_error(const std::string& server_id, const std::string& method) {
    return ToolgateError{ErrorCategory::Timeout,
                         "Server " + server_id + " did not answer " + method + " in time.",
                         "rpc_timeout"};
}

ToolgateError closed_error(const std::string& server_id) {
    return ToolgateError{ErrorCategory::Unavailable,
                         "Server " + server_id + " closed its output; the process has exited.",
                         "process_exited"};
}

}  // namespace

RpcChannel::RpcChannel(std::string server_id,
                       std::shared_ptr<process::ChildProcess> process,
                       const std::size_t diagnostics_limit)
    : server_id_(std::move(server_id)),
      process_(std::move(process)),
      diagnostics_limit_(diagnostics_limit) {
    set_nonblocking(process_->stdin_fd());
    set_nonblocking(process_->stdout_fd());
    set_nonblocking(process_->stderr_fd());
    stderr_thread_ = std::thread([this]() { drain_stderr(); });
}

RpcChannel::~RpcChannel() {
    stopping_.store(true);
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

void RpcChannel::drain_stderr() {
    const int fd = process_->stderr_fd();
    char buffer[4096];
    while (!stopping_.load()) {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::lock_guard<std::mutex> lock(diagnostics_mutex_);
            diagnostics_.append(buffer, static_cast<std::size_t>(n));
            if (diagnostics_.size() > diagnostics_limit_) {
                diagnostics_.erase(0, diagnostics_.size() - diagnostics_limit_);
            }
            continue;
        }
        if (n == 0) {
            return;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            return;
        }
    }
}

std::string RpcChannel::take_diagnostics() {
    std::lock_guard<std::mutex> lock(diagnostics_mutex_);
    std::string taken;
    taken.swap(diagnostics_);
    return taken;
}

core::errors::Result<Done> RpcChannel::write_line(const std::string& line,
                                                   const Clock::time_point deadline) {
    const int fd = process_->stdin_fd();
    const std::string framed = line + "\n";
    std::size_t written = 0;
    while (written < framed.size()) {
        const ssize_t n = write(fd, framed.data() + written, framed.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const int wait_ms = remaining_ms(deadline);
            if (wait_ms == 0) {
                return timeout_error(server_id_, "a request write");
            }
            pollfd pfd{fd, POLLOUT, 0};
            static_cast<void>(poll(&pfd, 1, wait_ms));
            continue;
        }
        return closed_error(server_id_);
    }
    return Done{};
}

core::errors::Result<std::string> RpcChannel::read_line(const Clock::time_point deadline) {
    const int fd = process_->stdout_fd();
    char buffer[8192];
    while (true) {
        const auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = stdout_buffer_.substr(0, newline);
            stdout_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            return line;
        }
        if (stdout_buffer_.size() > kMaxFrameBytes) {
            stdout_buffer_.clear();
            return ToolgateError{ErrorCategory::Protocol,
                                 "Server " + server_id_ + " wrote an oversized frame.",
                                 "frame_too_large"};
        }

        const int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            return ToolgateError{ErrorCategory::Timeout, "", "rpc_timeout"};
        }
        pollfd pfd{fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return closed_error(server_id_);
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            stdout_buffer_.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return closed_error(server_id_);
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            return closed_error(server_id_);
        }
    }
}

void RpcChannel::record_outcome(const ToolgateError* error) {
    if (error == nullptr || error->category == ErrorCategory::ToolExecution) {
        consecutive_failures_.store(0);
        return;
    }
    if (error->code == "channel_busy") {
        return;
    }
    consecutive_failures_.fetch_add(1);
}

core::errors::Result<json> RpcChannel::request(const std::string& method,
                                               const json& params,
                                               const std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    std::unique_lock<std::timed_mutex> lock(call_mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return ToolgateError{ErrorCategory::Timeout,
                             "Server " + server_id_ + " is busy with another call.",
                             "channel_busy"};
    }

    const std::int64_t id = next_id_++;
    auto written = write_line(protocol::encode_request(id, method, params), deadline);
    if (core::errors::is_error(written)) {
        const auto error = core::errors::get_error(written);
        record_outcome(&error);
        return error;
    }

    while (true) {
        auto line = read_line(deadline);
        if (core::errors::is_error(line)) {
            auto error = core::errors::get_error(line);
            if (error.category == ErrorCategory::Timeout) {
                error = timeout_error(server_id_, method);
                LOG_WARN("RpcChannel: timeout on " + method + " to server " + server_id_ +
                         " after " + std::to_string(timeout.count()) + " ms");
            } else if (error.category == ErrorCategory::Protocol) {
                LOG_WARN("RpcChannel: protocol error from server " + server_id_ + ": " +
                         error.message);
            }
            record_outcome(&error);
            return error;
        }

        auto frame = protocol::decode_response_line(core::errors::get_value(line));
        if (core::errors::is_error(frame)) {
            const auto& error = core::errors::get_error(frame);
            LOG_WARN("RpcChannel: protocol error from server " + server_id_ + " [" +
                     error.code + "]: " + error.message);
            record_outcome(&error);
            return error;
        }

        const auto& response = core::errors::get_value(frame);
        if (response.id != id) {
            LOG_DEBUG("RpcChannel: dropping stale frame " + std::to_string(response.id) +
                      " from server " + server_id_);
            continue;
        }

        if (response.is_error) {
            ToolgateError error{ErrorCategory::ToolExecution, response.error_message,
                                response.error_code};
            record_outcome(&error);
            return error;
        }
        record_outcome(nullptr);
        return response.result;
    }
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> RpcChannel::list_tools(
    const std::chrono::milliseconds timeout) {
    auto result = request(protocol::kListToolsMethod, json::object(), timeout);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    auto tools = protocol::decode_tool_list(core::errors::get_value(result), server_id_);
    if (core::errors::is_error(tools)) {
        const auto& error = core::errors::get_error(tools);
        LOG_WARN("RpcChannel: protocol error from server " + server_id_ + ": " +
                 error.message);
        consecutive_failures_.fetch_add(1);
    }
    return tools;
}

core::errors::Result<std::vector<protocol::ContentBlock>> RpcChannel::call_tool(
    const std::string& name, const json& arguments,
    const std::chrono::milliseconds timeout) {
    json params;
    params["name"] = name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;
    auto result = request(protocol::kCallToolMethod, params, timeout);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    auto content = protocol::decode_content(core::errors::get_value(result));
    if (core::errors::is_error(content)) {
        const auto& error = core::errors::get_error(content);
        LOG_WARN("RpcChannel: protocol error from server " + server_id_ + ": " +
                 error.message);
        consecutive_failures_.fetch_add(1);
    }
    return content;
}

}  // namespace toolgate::rpc
