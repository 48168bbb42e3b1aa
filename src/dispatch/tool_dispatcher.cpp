#include "dispatch/tool_dispatcher.hpp"

#include <exception>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace toolgate::dispatch {

using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using nlohmann::json;
using protocol::ContentBlock;
using protocol::ToolInvocationRecord;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
            .count());
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

}  // namespace

ToolDispatcher::ToolDispatcher(const process::ProcessSupervisor& supervisor,
                               const fallback::FallbackToolProvider& fallback,
                               audit::InvocationLog& log,
                               const std::chrono::milliseconds call_timeout)
    : supervisor_(supervisor), fallback_(fallback), log_(log), call_timeout_(call_timeout) {}

ToolInvocationRecord ToolDispatcher::invoke_tool(const std::string& tool_name,
                                                 const json& arguments,
                                                 const catalog::ToolCatalog& catalog) {
    if (const auto* descriptor = catalog.find(tool_name)) {
        return invoke(*descriptor, arguments);
    }

    ToolInvocationRecord record;
    record.tool_name = tool_name;
    record.arguments = arguments;
    record.timestamp_ms = now_unix_ms();
    record.error = ToolgateError{ErrorCategory::Input,
                                 "Tool '" + tool_name + "' is not in the current catalog.",
                                 "unknown_tool"};
    return finish(std::move(record));
}

ToolInvocationRecord ToolDispatcher::invoke(const protocol::ToolDescriptor& descriptor,
                                            const json& arguments) {
    ToolInvocationRecord record;
    record.owner = descriptor.owner;
    record.tool_name = descriptor.name;
    record.arguments = arguments;
    record.timestamp_ms = now_unix_ms();

    const auto started = std::chrono::steady_clock::now();
    core::errors::Result<std::vector<ContentBlock>> outcome = std::vector<ContentBlock>{};
    try {
        if (const auto* server = std::get_if<protocol::ServerOwner>(&descriptor.owner)) {
            outcome = call_server(server->server_id, descriptor.name, arguments,
                                  record.diagnostics);
        } else {
            outcome = fallback_.call(descriptor.name, arguments);
        }
    } catch (const std::exception& e) {
        outcome = ToolgateError{ErrorCategory::Internal,
                                std::string("Dispatch failed: ") + e.what(),
                                "dispatch_failed"};
    }
    record.duration_ms = elapsed_ms(started);

    if (core::errors::is_error(outcome)) {
        record.error = core::errors::get_error(outcome);
    } else {
        record.response = core::errors::get_value(outcome);
        record.success = true;
    }
    return finish(std::move(record));
}

core::errors::Result<std::vector<ContentBlock>> ToolDispatcher::call_server(
    const std::string& server_id, const std::string& tool_name, const json& arguments,
    std::string& diagnostics) {
    auto channel = supervisor_.channel(server_id);
    if (!channel) {
        return ToolgateError{ErrorCategory::Unavailable,
                             "Server '" + server_id + "' is not running.",
                             "server_not_running"};
    }
    auto result = channel->call_tool(tool_name, arguments, call_timeout_);
    diagnostics = channel->take_diagnostics();
    return result;
}

ToolInvocationRecord ToolDispatcher::finish(ToolInvocationRecord record) {
    const std::string owner =
        record.owner.has_value() ? protocol::describe(*record.owner) : "unresolved";
    if (record.success) {
        LOG_INFO("ToolDispatcher: " + record.tool_name + " via " + owner + " succeeded in " +
                 std::to_string(static_cast<long long>(record.duration_ms)) + "ms");
    } else {
        LOG_WARN("ToolDispatcher: " + record.tool_name + " via " + owner + " failed [" +
                 core::errors::to_string(record.error->category) + "/" + record.error->code +
                 "]: " + record.error->message);
    }

    auto appended = log_.append(record);
    if (core::errors::is_error(appended)) {
        LOG_ERROR("ToolDispatcher: audit write failed: " +
                  core::errors::get_error(appended).message);
    }
    return record;
}

}  // namespace toolgate::dispatch
