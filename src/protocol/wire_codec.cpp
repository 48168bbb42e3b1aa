#include "protocol/wire_codec.hpp"

#include <utility>

namespace toolgate::protocol {

using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using nlohmann::json;

namespace {

ToolgateError protocol_error(const std::string& message, const std::string& code) {
    return ToolgateError{ErrorCategory::Protocol, message, code};
}

ToolgateError config_error(const std::string& message, const std::string& code) {
    return ToolgateError{ErrorCategory::Configuration, message, code};
}

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

core::errors::Result<std::string> coerce_env_value(const std::string& key,
                                                   const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return std::string(value.get<bool>() ? "true" : "false");
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    if (value.is_number()) {
        return value.dump();
    }
    return config_error("Environment value for '" + key +
                            "' must be a string, number or boolean.",
                        "invalid_environment");
}

}  // namespace

std::string encode_request(const std::int64_t id, const std::string& method,
                           const json& params) {
    json frame;
    frame["id"] = id;
    frame["method"] = method;
    frame["params"] = params.is_null() ? json::object() : params;
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<ResponseFrame> decode_response_line(const std::string& line) {
    const json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        return protocol_error("Server wrote a line that is not JSON.", "invalid_json_frame");
    }
    if (!payload.is_object()) {
        return protocol_error("Server frame is not a JSON object.", "invalid_frame_shape");
    }

    auto id_it = payload.find("id");
    if (id_it == payload.end() || !id_it->is_number_integer()) {
        return protocol_error("Server frame has no integer id.", "missing_frame_id");
    }

    ResponseFrame frame;
    frame.id = id_it->get<std::int64_t>();

    auto error_it = payload.find("error");
    if (error_it != payload.end() && !error_it->is_null()) {
        frame.is_error = true;
        if (error_it->is_object()) {
            frame.error_code = string_field(*error_it, "code");
            frame.error_message = string_field(*error_it, "message");
        } else if (error_it->is_string()) {
            frame.error_message = error_it->get<std::string>();
        }
        if (frame.error_code.empty()) {
            frame.error_code = "tool_error";
        }
        if (frame.error_message.empty()) {
            frame.error_message = "Tool reported an error.";
        }
        return frame;
    }

    auto result_it = payload.find("result");
    if (result_it == payload.end()) {
        return protocol_error("Server frame has neither result nor error.",
                              "missing_frame_result");
    }
    frame.result = *result_it;
    return frame;
}

core::errors::Result<std::vector<ToolDescriptor>> decode_tool_list(
    const json& result, const std::string& server_id) {
    if (!result.is_array()) {
        return protocol_error("list_tools result is not an array.", "invalid_tool_list");
    }

    std::vector<ToolDescriptor> tools;
    tools.reserve(result.size());
    for (const auto& item : result) {
        if (!item.is_object()) {
            return protocol_error("list_tools entry is not an object.", "invalid_tool_list");
        }
        ToolDescriptor descriptor;
        descriptor.name = string_field(item, "name");
        if (descriptor.name.empty()) {
            return protocol_error("list_tools entry has no name.", "invalid_tool_list");
        }
        descriptor.description = string_field(item, "description");
        auto schema_it = item.find("parameter_schema");
        if (schema_it != item.end() && schema_it->is_object()) {
            descriptor.parameter_schema = *schema_it;
        }
        descriptor.owner = ServerOwner{server_id};
        tools.push_back(std::move(descriptor));
    }
    return tools;
}

core::errors::Result<std::vector<ContentBlock>> decode_content(const json& result) {
    if (!result.is_array()) {
        return protocol_error("call_tool result is not an array of content blocks.",
                              "invalid_tool_content");
    }

    std::vector<ContentBlock> blocks;
    blocks.reserve(result.size());
    for (const auto& item : result) {
        if (!item.is_object()) {
            return protocol_error("Content block is not an object.", "invalid_tool_content");
        }
        ContentBlock block;
        block.type = string_field(item, "type");
        if (block.type.empty()) {
            block.type = "text";
        }
        block.text = string_field(item, "text");
        blocks.push_back(std::move(block));
    }
    return blocks;
}

json content_to_json(const std::vector<ContentBlock>& content) {
    json blocks = json::array();
    for (const auto& block : content) {
        blocks.push_back({{"type", block.type}, {"text", block.text}});
    }
    return blocks;
}

json descriptor_to_json(const ToolDescriptor& descriptor) {
    json payload;
    payload["name"] = descriptor.name;
    payload["description"] = descriptor.description;
    payload["parameter_schema"] = descriptor.parameter_schema;
    payload["owner"] = describe(descriptor.owner);
    return payload;
}

json record_to_json(const ToolInvocationRecord& record) {
    json payload;
    payload["owner"] = record.owner.has_value() ? describe(record.owner.value()) : "";
    payload["tool_name"] = record.tool_name;
    payload["arguments"] = record.arguments;
    payload["response"] = content_to_json(record.response);
    payload["success"] = record.success;
    payload["duration_ms"] = record.duration_ms;
    payload["ts_unix_ms"] = record.timestamp_ms;
    payload["diagnostics"] = record.diagnostics;
    if (record.error.has_value()) {
        payload["error"] = {
            {"category", core::errors::to_string(record.error->category)},
            {"code", record.error->code},
            {"message", record.error->message}};
    } else {
        payload["error"] = nullptr;
    }
    return payload;
}

json server_config_to_json(const ServerConfig& config) {
    json payload;
    payload["id"] = config.id;
    payload["name"] = config.name;
    payload["description"] = config.description;
    payload["command"] = config.command;
    payload["arguments"] = config.arguments;
    payload["environment"] = config.environment;
    payload["working_directory"] = config.working_directory.string();
    payload["enabled"] = config.enabled;
    payload["auto_start"] = config.auto_start;
    payload["health_check_interval"] = config.health_check_interval_s;
    payload["created_at"] = config.created_at_ms;
    payload["updated_at"] = config.updated_at_ms;
    return payload;
}

core::errors::Result<ServerConfig> server_config_from_json(const json& payload) {
    if (!payload.is_object()) {
        return config_error("Server config must be a JSON object.", "invalid_config");
    }

    ServerConfig config;
    config.id = string_field(payload, "id");
    config.name = string_field(payload, "name");
    config.description = string_field(payload, "description");
    config.command = string_field(payload, "command");

    if (auto it = payload.find("arguments"); it != payload.end() && !it->is_null()) {
        if (!it->is_array()) {
            return config_error("arguments must be an array of strings.", "invalid_arguments");
        }
        for (const auto& arg : *it) {
            if (!arg.is_string()) {
                return config_error("arguments must be an array of strings.",
                                    "invalid_arguments");
            }
            config.arguments.push_back(arg.get<std::string>());
        }
    }

    if (auto it = payload.find("environment"); it != payload.end() && !it->is_null()) {
        if (!it->is_object()) {
            return config_error("environment must be an object.", "invalid_environment");
        }
        for (auto env_it = it->begin(); env_it != it->end(); ++env_it) {
            auto coerced = coerce_env_value(env_it.key(), env_it.value());
            if (core::errors::is_error(coerced)) {
                return core::errors::get_error(coerced);
            }
            config.environment[env_it.key()] = core::errors::get_value(coerced);
        }
    }

    config.working_directory = string_field(payload, "working_directory");

    if (auto it = payload.find("enabled"); it != payload.end() && it->is_boolean()) {
        config.enabled = it->get<bool>();
    }
    if (auto it = payload.find("auto_start"); it != payload.end() && it->is_boolean()) {
        config.auto_start = it->get<bool>();
    }
    if (auto it = payload.find("health_check_interval"); it != payload.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() < 1) {
            return config_error("health_check_interval must be a positive integer.",
                                "invalid_health_check_interval");
        }
        config.health_check_interval_s = it->get<std::uint32_t>();
    }
    if (auto it = payload.find("created_at"); it != payload.end() && it->is_number_integer()) {
        config.created_at_ms = it->get<std::int64_t>();
    }
    if (auto it = payload.find("updated_at"); it != payload.end() && it->is_number_integer()) {
        config.updated_at_ms = it->get<std::int64_t>();
    }
    return config;
}

}  // namespace toolgate::protocol
