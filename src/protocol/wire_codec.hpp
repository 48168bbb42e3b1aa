#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolgate_errors.hpp"
#include "protocol/server_config.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::protocol {

inline constexpr const char* kListToolsMethod = "list_tools";
inline constexpr const char* kCallToolMethod = "call_tool";

// A decoded stdout line from a tool server.
struct ResponseFrame {
    std::int64_t id = 0;
    bool is_error = false;
    nlohmann::json result;
    std::string error_code;
    std::string error_message;
};

// Serializes a request as one line, without the trailing newline.
std::string encode_request(std::int64_t id, const std::string& method,
                           const nlohmann::json& params);

core::errors::Result<ResponseFrame> decode_response_line(const std::string& line);

// Decodes a list_tools result, tagging every descriptor with its server.
core::errors::Result<std::vector<ToolDescriptor>> decode_tool_list(
    const nlohmann::json& result, const std::string& server_id);

core::errors::Result<std::vector<ContentBlock>> decode_content(
    const nlohmann::json& result);

nlohmann::json content_to_json(const std::vector<ContentBlock>& content);
nlohmann::json descriptor_to_json(const ToolDescriptor& descriptor);
nlohmann::json record_to_json(const ToolInvocationRecord& record);

nlohmann::json server_config_to_json(const ServerConfig& config);

// Accepts string, number and boolean environment values, coercing them to strings.
core::errors::Result<ServerConfig> server_config_from_json(const nlohmann::json& payload);

}  // namespace toolgate::protocol
