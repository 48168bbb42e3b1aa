#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/toolgate_errors.hpp"
#include "health/health_monitor.hpp"
#include "policy/policy_guard.hpp"
#include "process/child_process.hpp"
#include "protocol/server_config.hpp"
#include "rpc/rpc_channel.hpp"

namespace toolgate::process {

struct SupervisorOptions {
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds stop_grace{5000};
    health::HealthOptions health;
};

// Owns every ServerProcessState. Operations on one server id are serialized;
// different ids proceed in parallel.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {},
                               policy::PolicyGuard policy_guard = policy::PolicyGuard{});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Errors only for refusals and OS-level spawn failures. A failed handshake
    // is a value with status=error and last_error set.
    core::errors::Result<protocol::ServerProcessState> start(
        const protocol::ServerConfig& config);

    // Never fails; stopping a stopped or unknown server is a no-op.
    protocol::ServerProcessState stop(const std::string& server_id);

    core::errors::Result<protocol::ServerProcessState> restart(
        const protocol::ServerConfig& config);

    protocol::ServerProcessState state(const std::string& server_id) const;
    std::vector<protocol::ServerProcessState> states() const;

    // The channel of a running server, or nullptr.
    std::shared_ptr<rpc::RpcChannel> channel(const std::string& server_id) const;

    void stop_all();
    // Drops all bookkeeping for a server; stops it first.
    void forget(const std::string& server_id);

private:
    struct Slot {
        std::mutex op_mutex;
        protocol::ServerProcessState state;
        std::uint64_t generation = 0;
        std::shared_ptr<ChildProcess> process;
        std::shared_ptr<rpc::RpcChannel> channel;
    };

    std::shared_ptr<Slot> slot_for(const std::string& server_id);
    std::shared_ptr<Slot> find_slot(const std::string& server_id) const;

    core::errors::Result<protocol::ServerProcessState> start_locked(
        Slot& slot, const protocol::ServerConfig& config);
    protocol::ServerProcessState stop_locked(Slot& slot);
    protocol::ServerProcessState fail_locked(Slot& slot, const std::string& reason);
    void transition_locked(Slot& slot, protocol::ServerStatus next);

    void on_probe(const std::string& server_id, std::uint64_t generation);
    void on_unhealthy(const std::string& server_id, std::uint64_t generation,
                      const std::string& reason);

    SupervisorOptions options_;
    policy::PolicyGuard policy_guard_;

    // Guards slots_ and the state/process/channel/generation of every slot.
    mutable std::mutex state_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    health::HealthMonitor monitor_;
};

}  // namespace toolgate::process
