#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolgate_errors.hpp"

namespace toolgate::protocol {

    // Who answers a tool call. Attached when the catalog is built so routing
    // never has to look a name up again.
    struct ServerOwner { std::string server_id; };
    struct FallbackOwner {};
    using ToolOwner = std::variant<ServerOwner, FallbackOwner>;

    inline bool is_fallback(const ToolOwner& owner) {
        return std::holds_alternative<FallbackOwner>(owner);
    }

    inline std::string describe(const ToolOwner& owner) {
        if (const auto* server = std::get_if<ServerOwner>(&owner)) {
            return "server:" + server->server_id;
        }
        return "fallback";
    }

    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json parameter_schema = nlohmann::json::object();
        ToolOwner owner;
    };

    // One block of a call_tool answer, e.g. {"type": "text", "text": "..."}.
    struct ContentBlock {
        std::string type = "text";
        std::string text;
    };

    // Audit entity written after every dispatch, successful or not.
    struct ToolInvocationRecord {
        std::optional<ToolOwner> owner;  // empty when the name was not in the catalog
        std::string tool_name;
        nlohmann::json arguments = nlohmann::json::object();
        std::vector<ContentBlock> response;
        std::optional<core::errors::ToolgateError> error;
        std::string diagnostics;  // stderr captured from the server during the call
        double duration_ms = 0.0;
        std::int64_t timestamp_ms = 0;
        bool success = false;
    };

    // Servers an agent is bound to. Maintained outside the core.
    struct AgentToolBinding {
        struct Entry {
            std::string server_id;
            bool is_enabled = true;
        };

        std::string agent_id;
        std::vector<Entry> servers;

        std::vector<std::string> enabled_server_ids() const {
            std::vector<std::string> ids;
            for (const auto& entry : servers) {
                if (entry.is_enabled) {
                    ids.push_back(entry.server_id);
                }
            }
            return ids;
        }
    };

} // namespace toolgate::protocol
