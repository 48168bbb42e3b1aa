#include "catalog/tool_catalog.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::catalog {

using protocol::ToolDescriptor;

ToolCatalog::ToolCatalog(std::vector<ToolDescriptor> tools, const bool fallback_active,
                         std::vector<std::string> skipped_servers)
    : tools_(std::move(tools)),
      fallback_active_(fallback_active),
      skipped_servers_(std::move(skipped_servers)) {}

const ToolDescriptor* ToolCatalog::find(const std::string& name) const {
    auto it = std::find_if(tools_.begin(), tools_.end(),
                           [&name](const ToolDescriptor& tool) { return tool.name == name; });
    return it == tools_.end() ? nullptr : &*it;
}

CatalogBuilder::CatalogBuilder(const process::ProcessSupervisor& supervisor,
                               const fallback::FallbackToolProvider& fallback,
                               const std::chrono::milliseconds per_server_timeout)
    : supervisor_(supervisor), fallback_(fallback), per_server_timeout_(per_server_timeout) {}

ToolCatalog CatalogBuilder::build(const std::vector<std::string>& server_ids) const {
    if (server_ids.empty()) {
        LOG_DEBUG("CatalogBuilder: no bound servers, using fallback tools");
        return ToolCatalog(fallback_.descriptors(), true, {});
    }
    return query_servers(server_ids);
}

ToolCatalog CatalogBuilder::build_for_agent(const protocol::AgentToolBinding& binding) const {
    if (binding.servers.empty()) {
        return build({});
    }
    const auto ids = binding.enabled_server_ids();
    if (ids.empty()) {
        LOG_INFO("CatalogBuilder: agent " + binding.agent_id +
                 " has no enabled servers, catalog is empty");
        return ToolCatalog{};
    }
    return query_servers(ids);
}

ToolCatalog CatalogBuilder::query_servers(const std::vector<std::string>& server_ids) const {
    using ListResult = core::errors::Result<std::vector<ToolDescriptor>>;

    struct Pending {
        std::string server_id;
        std::future<ListResult> result;
    };

    std::vector<std::string> skipped;
    std::vector<Pending> pending;
    std::vector<std::string> seen;
    for (const auto& server_id : server_ids) {
        if (std::find(seen.begin(), seen.end(), server_id) != seen.end()) {
            continue;
        }
        seen.push_back(server_id);

        auto channel = supervisor_.channel(server_id);
        if (!channel) {
            LOG_INFO("CatalogBuilder: skipping server " + server_id + " (not running)");
            skipped.push_back(server_id);
            continue;
        }
        const auto timeout = per_server_timeout_;
        pending.push_back(Pending{
            server_id, std::async(std::launch::async, [channel, timeout]() {
                return channel->list_tools(timeout);
            })});
    }

    std::vector<ToolDescriptor> tools;
    for (auto& entry : pending) {
        auto listed = entry.result.get();
        if (core::errors::is_error(listed)) {
            const auto& error = core::errors::get_error(listed);
            LOG_WARN("CatalogBuilder: skipping server " + entry.server_id + " [" +
                     error.code + "]: " + error.message);
            skipped.push_back(entry.server_id);
            continue;
        }
        const auto& listed_tools = core::errors::get_value(listed);
        tools.insert(tools.end(), listed_tools.begin(), listed_tools.end());
    }

    LOG_DEBUG("CatalogBuilder: built catalog with " + std::to_string(tools.size()) +
              " tools from " + std::to_string(pending.size()) + " servers");
    return ToolCatalog(std::move(tools), false, std::move(skipped));
}

}  // namespace toolgate::catalog
