#include "service/tool_service.hpp"

#include <chrono>
#include <future>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::service {

using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using protocol::ServerConfig;
using protocol::ServerProcessState;
using protocol::ServerStatus;

namespace {

policy::PolicyGuard make_policy_guard(const core::config::CoreSettings& settings) {
    policy::LaunchPolicy launch_policy;
    launch_policy.servers_root = settings.servers_root;
    return policy::PolicyGuard(launch_policy);
}

process::SupervisorOptions make_supervisor_options(const core::config::CoreSettings& settings) {
    process::SupervisorOptions options;
    options.handshake_timeout = std::chrono::milliseconds(settings.handshake_timeout_ms);
    options.stop_grace = std::chrono::milliseconds(settings.stop_grace_ms);
    options.health.probe_timeout = std::chrono::milliseconds(settings.probe_timeout_ms);
    options.health.failure_threshold = settings.failure_threshold;
    return options;
}

}  // namespace

ToolService::ToolService(core::config::CoreSettings settings)
    : settings_(std::move(settings)),
      supervisor_(make_supervisor_options(settings_), make_policy_guard(settings_)),
      registry_(settings_.registry_path, supervisor_, make_policy_guard(settings_)),
      fallback_(settings_.fallback_data_path),
      invocation_log_(settings_.audit_dir),
      catalog_builder_(supervisor_, fallback_,
                       std::chrono::milliseconds(settings_.catalog_timeout_ms)),
      dispatcher_(supervisor_, fallback_, invocation_log_,
                  std::chrono::milliseconds(settings_.call_timeout_ms)) {}

ToolService::~ToolService() {
    stop_all();
}

core::errors::Result<std::size_t> ToolService::load_registry() {
    return registry_.load();
}

core::errors::Result<StartAllReport> ToolService::boot() {
    auto loaded = registry_.load();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    // Process state never survives a restart of the core: everything is stopped here.
    auto report = start_all();
    LOG_INFO("ToolService: boot started " + std::to_string(report.started.size()) +
             " servers, " + std::to_string(report.failed.size()) + " failed");
    return report;
}

core::errors::Result<ServerConfig> ToolService::require_config(
    const std::string& server_id) const {
    auto config = registry_.get(server_id);
    if (!config.has_value()) {
        return ToolgateError{ErrorCategory::Input, "Server '" + server_id + "' not found",
                             "server_not_found"};
    }
    return *config;
}

core::errors::Result<std::string> ToolService::register_server(ServerConfig config) {
    return registry_.register_server(std::move(config));
}

core::errors::Result<ServerConfig> ToolService::update_server(
    const std::string& server_id, const registry::ServerConfigPatch& patch) {
    return registry_.update(server_id, patch);
}

core::errors::Result<core::errors::Done> ToolService::remove_server(
    const std::string& server_id) {
    return registry_.remove(server_id);
}

std::optional<ServerConfig> ToolService::get_server(const std::string& server_id) const {
    return registry_.get(server_id);
}

std::vector<ServerConfig> ToolService::list_servers() const {
    return registry_.list();
}

core::errors::Result<ServerProcessState> ToolService::start(const std::string& server_id) {
    auto config = require_config(server_id);
    if (core::errors::is_error(config)) {
        return core::errors::get_error(config);
    }
    return supervisor_.start(core::errors::get_value(config));
}

core::errors::Result<ServerProcessState> ToolService::stop(const std::string& server_id) {
    auto config = require_config(server_id);
    if (core::errors::is_error(config)) {
        return core::errors::get_error(config);
    }
    return supervisor_.stop(server_id);
}

core::errors::Result<ServerProcessState> ToolService::restart(const std::string& server_id) {
    auto config = require_config(server_id);
    if (core::errors::is_error(config)) {
        return core::errors::get_error(config);
    }
    return supervisor_.restart(core::errors::get_value(config));
}

core::errors::Result<ServerProcessState> ToolService::status(
    const std::string& server_id) const {
    auto config = require_config(server_id);
    if (core::errors::is_error(config)) {
        return core::errors::get_error(config);
    }
    return supervisor_.state(server_id);
}

std::vector<ServerProcessState> ToolService::statuses() const {
    std::vector<ServerProcessState> result;
    for (const auto& config : registry_.list()) {
        result.push_back(supervisor_.state(config.id));
    }
    return result;
}

StartAllReport ToolService::start_all() {
    using StartResult = core::errors::Result<ServerProcessState>;

    std::vector<std::pair<std::string, std::future<StartResult>>> pending;
    for (const auto& config : registry_.list()) {
        if (!config.enabled || !config.auto_start) {
            continue;
        }
        if (supervisor_.state(config.id).status == ServerStatus::Running) {
            continue;
        }
        pending.emplace_back(config.id, std::async(std::launch::async, [this, config]() {
                                 return supervisor_.start(config);
                             }));
    }

    StartAllReport report;
    for (auto& [server_id, future] : pending) {
        const auto result = future.get();
        if (core::errors::is_error(result)) {
            report.failed.emplace_back(server_id, core::errors::get_error(result).message);
            continue;
        }
        const auto& state = core::errors::get_value(result);
        if (state.status == ServerStatus::Running) {
            report.started.push_back(server_id);
        } else {
            report.failed.emplace_back(server_id, state.last_error.value_or("not running"));
        }
    }
    return report;
}

std::size_t ToolService::stop_all() {
    std::size_t stopped = 0;
    for (const auto& state : supervisor_.states()) {
        if (state.status == ServerStatus::Running || state.status == ServerStatus::Starting) {
            ++stopped;
        }
    }
    supervisor_.stop_all();
    return stopped;
}

StatusSummary ToolService::summary() const {
    StatusSummary summary;
    for (const auto& state : statuses()) {
        ++summary.total;
        switch (state.status) {
            case ServerStatus::Stopped:
                ++summary.stopped;
                break;
            case ServerStatus::Starting:
                ++summary.starting;
                break;
            case ServerStatus::Running:
                ++summary.running;
                break;
            case ServerStatus::Error:
                ++summary.error;
                break;
        }
    }
    return summary;
}

catalog::ToolCatalog ToolService::get_tool_catalog(
    const std::vector<std::string>& server_ids) const {
    return catalog_builder_.build(server_ids);
}

catalog::ToolCatalog ToolService::get_tool_catalog(
    const protocol::AgentToolBinding& binding) const {
    return catalog_builder_.build_for_agent(binding);
}

protocol::ToolInvocationRecord ToolService::invoke_tool(const std::string& tool_name,
                                                        const nlohmann::json& arguments,
                                                        const catalog::ToolCatalog& catalog) {
    return dispatcher_.invoke_tool(tool_name, arguments, catalog);
}

}  // namespace toolgate::service
