#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolgate_errors.hpp"
#include "process/child_process.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::rpc {

// Duplex line protocol over a tool server's stdin/stdout. Calls are
// serialized; a call that times out is abandoned and its late answer is
// dropped by id. stderr is drained on a background thread and never parsed.
class RpcChannel {
public:
    RpcChannel(std::string server_id, std::shared_ptr<process::ChildProcess> process,
               std::size_t diagnostics_limit = 64 * 1024);
    ~RpcChannel();

    RpcChannel(const RpcChannel&) = delete;
    RpcChannel& operator=(const RpcChannel&) = delete;

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools(
        std::chrono::milliseconds timeout);

    core::errors::Result<std::vector<protocol::ContentBlock>> call_tool(
        const std::string& name, const nlohmann::json& arguments,
        std::chrono::milliseconds timeout);

    // stderr text captured since the previous call to take_diagnostics().
    std::string take_diagnostics();

    // Timeouts, protocol errors and transport failures in a row; any answer
    // from the server resets it.
    int consecutive_failures() const { return consecutive_failures_.load(); }

    const std::string& server_id() const { return server_id_; }

private:
    using Clock = std::chrono::steady_clock;

    core::errors::Result<nlohmann::json> request(const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::chrono::milliseconds timeout);
    core::errors::Result<core::errors::Done> write_line(const std::string& line,
                                                        Clock::time_point deadline);
    core::errors::Result<std::string> read_line(Clock::time_point deadline);
    void record_outcome(const core::errors::ToolgateError* error);
    void drain_stderr();

    std::string server_id_;
    std::shared_ptr<process::ChildProcess> process_;
    std::size_t diagnostics_limit_;

    std::timed_mutex call_mutex_;
    std::int64_t next_id_ = 1;
    std::string stdout_buffer_;

    std::mutex diagnostics_mutex_;
    std::string diagnostics_;

    std::atomic<int> consecutive_failures_{0};
    std::atomic_bool stopping_{false};
    std::thread stderr_thread_;
};

}  // namespace toolgate::rpc
