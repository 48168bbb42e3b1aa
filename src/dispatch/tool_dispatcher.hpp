#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "audit/invocation_log.hpp"
#include "catalog/tool_catalog.hpp"
#include "fallback/fallback_tool_provider.hpp"
#include "process/process_supervisor.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::dispatch {

// Routes tool calls to their recorded owner. Every call, successful or not,
// produces a ToolInvocationRecord that is appended to the log before it is
// returned. Failures are carried in the record; nothing is thrown.
class ToolDispatcher {
public:
    ToolDispatcher(const process::ProcessSupervisor& supervisor,
                   const fallback::FallbackToolProvider& fallback,
                   audit::InvocationLog& log, std::chrono::milliseconds call_timeout);

    // Resolves the first catalog entry named tool_name.
    protocol::ToolInvocationRecord invoke_tool(const std::string& tool_name,
                                               const nlohmann::json& arguments,
                                               const catalog::ToolCatalog& catalog);

    // Calls exactly the owner recorded on the descriptor.
    protocol::ToolInvocationRecord invoke(const protocol::ToolDescriptor& descriptor,
                                          const nlohmann::json& arguments);

private:
    core::errors::Result<std::vector<protocol::ContentBlock>> call_server(
        const std::string& server_id, const std::string& tool_name,
        const nlohmann::json& arguments, std::string& diagnostics);
    protocol::ToolInvocationRecord finish(protocol::ToolInvocationRecord record);

    const process::ProcessSupervisor& supervisor_;
    const fallback::FallbackToolProvider& fallback_;
    audit::InvocationLog& log_;
    std::chrono::milliseconds call_timeout_;
};

}  // namespace toolgate::dispatch
