#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "audit/invocation_log.hpp"
#include "catalog/tool_catalog.hpp"
#include "core/config/settings.hpp"
#include "core/errors/toolgate_errors.hpp"
#include "dispatch/tool_dispatcher.hpp"
#include "fallback/fallback_tool_provider.hpp"
#include "policy/policy_guard.hpp"
#include "process/process_supervisor.hpp"
#include "registry/server_registry.hpp"

namespace toolgate::service {

struct StartAllReport {
    std::vector<std::string> started;
    // server id and the reason it is not running
    std::vector<std::pair<std::string, std::string>> failed;
};

struct StatusSummary {
    std::size_t total = 0;
    std::size_t stopped = 0;
    std::size_t starting = 0;
    std::size_t running = 0;
    std::size_t error = 0;
};

// Management and orchestrator surface of the core. Owns every component and
// wires them together from one CoreSettings.
class ToolService {
public:
    explicit ToolService(core::config::CoreSettings settings);
    ~ToolService();

    ToolService(const ToolService&) = delete;
    ToolService& operator=(const ToolService&) = delete;

    core::errors::Result<std::size_t> load_registry();
    // Loads the registry, then starts every enabled auto_start server.
    core::errors::Result<StartAllReport> boot();

    core::errors::Result<std::string> register_server(protocol::ServerConfig config);
    core::errors::Result<protocol::ServerConfig> update_server(
        const std::string& server_id, const registry::ServerConfigPatch& patch);
    core::errors::Result<core::errors::Done> remove_server(const std::string& server_id);
    std::optional<protocol::ServerConfig> get_server(const std::string& server_id) const;
    std::vector<protocol::ServerConfig> list_servers() const;

    core::errors::Result<protocol::ServerProcessState> start(const std::string& server_id);
    core::errors::Result<protocol::ServerProcessState> stop(const std::string& server_id);
    core::errors::Result<protocol::ServerProcessState> restart(const std::string& server_id);
    core::errors::Result<protocol::ServerProcessState> status(const std::string& server_id) const;
    std::vector<protocol::ServerProcessState> statuses() const;

    // Starts concurrently; every server ends running or error.
    StartAllReport start_all();
    // Returns how many servers were running or starting.
    std::size_t stop_all();
    StatusSummary summary() const;

    catalog::ToolCatalog get_tool_catalog(const std::vector<std::string>& server_ids) const;
    catalog::ToolCatalog get_tool_catalog(const protocol::AgentToolBinding& binding) const;
    protocol::ToolInvocationRecord invoke_tool(const std::string& tool_name,
                                               const nlohmann::json& arguments,
                                               const catalog::ToolCatalog& catalog);

    const audit::InvocationLog& invocation_log() const { return invocation_log_; }

private:
    core::errors::Result<protocol::ServerConfig> require_config(
        const std::string& server_id) const;

    core::config::CoreSettings settings_;
    process::ProcessSupervisor supervisor_;
    registry::ServerRegistry registry_;
    fallback::FallbackToolProvider fallback_;
    audit::InvocationLog invocation_log_;
    catalog::CatalogBuilder catalog_builder_;
    dispatch::ToolDispatcher dispatcher_;
};

}  // namespace toolgate::service
