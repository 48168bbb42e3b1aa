#include "process/process_supervisor.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::process {

using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using protocol::ServerConfig;
using protocol::ServerProcessState;
using protocol::ServerStatus;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
            .count());
}

std::string first_line(const std::string& text) {
    constexpr std::size_t kMaxLength = 240;
    std::string line = text.substr(0, text.find('\n'));
    if (line.size() > kMaxLength) {
        line = line.substr(0, kMaxLength) + "...";
    }
    return line;
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options,
                                     policy::PolicyGuard policy_guard)
    : options_(options),
      policy_guard_(std::move(policy_guard)),
      monitor_(options.health,
               health::HealthCallbacks{
                   [this](const std::string& id, std::uint64_t generation) {
                       on_probe(id, generation);
                   },
                   [this](const std::string& id, std::uint64_t generation,
                          const std::string& reason) {
                       on_unhealthy(id, generation, reason);
                   }}) {}

ProcessSupervisor::~ProcessSupervisor() {
    stop_all();
    monitor_.unwatch_all();
}

std::shared_ptr<ProcessSupervisor::Slot> ProcessSupervisor::slot_for(
    const std::string& server_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& slot = slots_[server_id];
    if (!slot) {
        slot = std::make_shared<Slot>();
        slot->state.server_id = server_id;
    }
    return slot;
}

std::shared_ptr<ProcessSupervisor::Slot> ProcessSupervisor::find_slot(
    const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = slots_.find(server_id);
    return it == slots_.end() ? nullptr : it->second;
}

void ProcessSupervisor::transition_locked(Slot& slot, const ServerStatus next) {
    const std::string prev = protocol::to_string(slot.state.status);
    slot.state.status = next;
    LOG_INFO("ProcessSupervisor: server " + slot.state.server_id + " transition " + prev +
             " -> " + protocol::to_string(next));
}

ServerProcessState ProcessSupervisor::fail_locked(Slot& slot, const std::string& reason) {
    std::shared_ptr<ChildProcess> process;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        process = std::move(slot.process);
        slot.channel.reset();
    }
    if (process) {
        static_cast<void>(process->terminate(options_.stop_grace));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    slot.state.process_id.reset();
    slot.state.last_error = reason;
    transition_locked(slot, ServerStatus::Error);
    LOG_ERROR("ProcessSupervisor: server " + slot.state.server_id + " failed to start: " +
              reason);
    return slot.state;
}

core::errors::Result<ServerProcessState> ProcessSupervisor::start(
    const ServerConfig& config) {
    auto slot = slot_for(config.id);
    std::lock_guard<std::mutex> op_lock(slot->op_mutex);
    return start_locked(*slot, config);
}

core::errors::Result<ServerProcessState> ProcessSupervisor::start_locked(
    Slot& slot, const ServerConfig& config) {
    ServerStatus current;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current = slot.state.status;
    }
    if (current == ServerStatus::Running) {
        return ToolgateError{ErrorCategory::Input,
                             "Server is already running: " + config.id,
                             "already_running"};
    }
    if (!config.enabled) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Server is disabled: " + config.id, "server_disabled"};
    }
    if (current == ServerStatus::Error) {
        // An unhealthy process may still be alive; clear it out first.
        static_cast<void>(stop_locked(slot));
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        generation = ++slot.generation;
        slot.state.last_error.reset();
        slot.state.last_health_check_at_ms.reset();
        transition_locked(slot, ServerStatus::Starting);
    }

    auto executable = policy_guard_.validate_command(config.command);
    if (core::errors::is_error(executable)) {
        auto error = core::errors::get_error(executable);
        fail_locked(slot, error.message);
        error.category = ErrorCategory::Startup;
        error.code = "spawn_failed";
        return error;
    }
    auto working_directory = policy_guard_.validate_working_directory(config.working_directory);
    if (core::errors::is_error(working_directory)) {
        auto error = core::errors::get_error(working_directory);
        fail_locked(slot, error.message);
        error.category = ErrorCategory::Startup;
        error.code = "spawn_failed";
        return error;
    }

    SpawnRequest request;
    request.executable = core::errors::get_value(executable);
    request.arguments = config.arguments;
    request.environment = config.environment;
    request.working_directory = core::errors::get_value(working_directory);

    auto spawned = ChildProcess::spawn(request);
    if (core::errors::is_error(spawned)) {
        const auto& error = core::errors::get_error(spawned);
        fail_locked(slot, error.message);
        return error;
    }
    auto process = core::errors::get_value(spawned);
    auto channel = std::make_shared<rpc::RpcChannel>(config.id, process);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        slot.process = process;
        slot.state.process_id = static_cast<int>(process->pid());
    }
    LOG_INFO("ProcessSupervisor: server " + config.id + " spawned pid " +
             std::to_string(process->pid()) + ", awaiting handshake");

    auto handshake = channel->list_tools(options_.handshake_timeout);
    if (core::errors::is_error(handshake)) {
        const auto& error = core::errors::get_error(handshake);
        std::string reason = "handshake failed [" + error.code + "]: " + error.message;
        const std::string diagnostics = first_line(channel->take_diagnostics());
        if (!diagnostics.empty()) {
            reason += " (stderr: " + diagnostics + ")";
        }
        return fail_locked(slot, reason);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        slot.channel = channel;
        slot.state.started_at_ms = now_unix_ms();
        slot.state.last_health_check_at_ms = slot.state.started_at_ms;
        transition_locked(slot, ServerStatus::Running);
    }
    LOG_INFO("ProcessSupervisor: server " + config.id + " ready with " +
             std::to_string(core::errors::get_value(handshake).size()) + " tools");

    health::WatchTarget target;
    target.server_id = config.id;
    target.generation = generation;
    target.interval = std::chrono::seconds(config.health_check_interval_s);
    target.channel = channel;
    target.process = process;
    monitor_.watch(std::move(target));

    std::lock_guard<std::mutex> lock(state_mutex_);
    return slot.state;
}

ServerProcessState ProcessSupervisor::stop(const std::string& server_id) {
    auto slot = find_slot(server_id);
    if (!slot) {
        ServerProcessState state;
        state.server_id = server_id;
        return state;
    }
    std::lock_guard<std::mutex> op_lock(slot->op_mutex);
    return stop_locked(*slot);
}

ServerProcessState ProcessSupervisor::stop_locked(Slot& slot) {
    // Must run without state_mutex_: the probe thread may be inside on_unhealthy.
    monitor_.unwatch(slot.state.server_id);

    std::shared_ptr<ChildProcess> process;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        process = std::move(slot.process);
        slot.channel.reset();
    }

    if (process) {
        const bool forced = process->terminate(options_.stop_grace);
        if (forced) {
            LOG_WARN("ProcessSupervisor: server " + slot.state.server_id +
                     " ignored SIGTERM and was killed");
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    slot.state.process_id.reset();
    if (slot.state.status != ServerStatus::Stopped) {
        transition_locked(slot, ServerStatus::Stopped);
    }
    return slot.state;
}

core::errors::Result<ServerProcessState> ProcessSupervisor::restart(
    const ServerConfig& config) {
    auto slot = slot_for(config.id);
    std::lock_guard<std::mutex> op_lock(slot->op_mutex);
    static_cast<void>(stop_locked(*slot));
    return start_locked(*slot, config);
}

ServerProcessState ProcessSupervisor::state(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = slots_.find(server_id);
    if (it == slots_.end()) {
        ServerProcessState state;
        state.server_id = server_id;
        return state;
    }
    return it->second->state;
}

std::vector<ServerProcessState> ProcessSupervisor::states() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<ServerProcessState> out;
    out.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        out.push_back(slot->state);
    }
    return out;
}

std::shared_ptr<rpc::RpcChannel> ProcessSupervisor::channel(
    const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = slots_.find(server_id);
    if (it == slots_.end() || it->second->state.status != ServerStatus::Running) {
        return nullptr;
    }
    return it->second->channel;
}

void ProcessSupervisor::stop_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [id, slot] : slots_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        static_cast<void>(stop(id));
    }
}

void ProcessSupervisor::forget(const std::string& server_id) {
    auto slot = find_slot(server_id);
    if (!slot) {
        return;
    }
    std::lock_guard<std::mutex> op_lock(slot->op_mutex);
    static_cast<void>(stop_locked(*slot));
    std::lock_guard<std::mutex> lock(state_mutex_);
    slots_.erase(server_id);
}

void ProcessSupervisor::on_probe(const std::string& server_id,
                                 const std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = slots_.find(server_id);
    if (it == slots_.end() || it->second->generation != generation) {
        return;
    }
    it->second->state.last_health_check_at_ms = now_unix_ms();
}

void ProcessSupervisor::on_unhealthy(const std::string& server_id,
                                     const std::uint64_t generation,
                                     const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = slots_.find(server_id);
    if (it == slots_.end()) {
        return;
    }
    Slot& slot = *it->second;
    if (slot.generation != generation || slot.state.status != ServerStatus::Running) {
        return;
    }
    slot.state.last_error = reason;
    if (slot.process && slot.process->has_exited()) {
        slot.state.process_id.reset();
    }
    transition_locked(slot, ServerStatus::Error);
    LOG_ERROR("ProcessSupervisor: server " + server_id +
              " marked error; an explicit restart is required");
}

}  // namespace toolgate::process
