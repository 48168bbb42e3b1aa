#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "fallback/fallback_tool_provider.hpp"
#include "process/process_supervisor.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::catalog {

// Immutable per-turn snapshot. Descriptors keep the order of the requested
// server ids; duplicate names from different servers are separate entries.
class ToolCatalog {
public:
    ToolCatalog() = default;
    ToolCatalog(std::vector<protocol::ToolDescriptor> tools, bool fallback_active,
                std::vector<std::string> skipped_servers);

    const std::vector<protocol::ToolDescriptor>& tools() const { return tools_; }

    // First entry with this name, or nullptr.
    const protocol::ToolDescriptor* find(const std::string& name) const;

    bool fallback_active() const { return fallback_active_; }
    const std::vector<std::string>& skipped_servers() const { return skipped_servers_; }
    std::size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

private:
    std::vector<protocol::ToolDescriptor> tools_;
    bool fallback_active_ = false;
    std::vector<std::string> skipped_servers_;
};

class CatalogBuilder {
public:
    CatalogBuilder(const process::ProcessSupervisor& supervisor,
                   const fallback::FallbackToolProvider& fallback,
                   std::chrono::milliseconds per_server_timeout);

    // An empty id list means the agent is bound to no servers: fallback tools.
    // Otherwise every running server is queried concurrently; servers that
    // are not running, fail or time out are skipped.
    ToolCatalog build(const std::vector<std::string>& server_ids) const;

    // Fallback only when the binding has no servers at all. A binding whose
    // servers are all disabled yields an empty catalog.
    ToolCatalog build_for_agent(const protocol::AgentToolBinding& binding) const;

private:
    ToolCatalog query_servers(const std::vector<std::string>& server_ids) const;

    const process::ProcessSupervisor& supervisor_;
    const fallback::FallbackToolProvider& fallback_;
    std::chrono::milliseconds per_server_timeout_;
};

}  // namespace toolgate::catalog
