#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolgate::protocol {

// Launch description of one tool server. Persisted by the registry.
struct ServerConfig {
    std::string id;
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> arguments;
    std::map<std::string, std::string> environment;
    std::filesystem::path working_directory;  // empty: inherit the core's cwd
    bool enabled = true;
    bool auto_start = true;
    std::uint32_t health_check_interval_s = 30;
    std::int64_t created_at_ms = 0;
    std::int64_t updated_at_ms = 0;
};

enum class ServerStatus {
    Stopped,
    Starting,
    Running,
    Error
};

// Runtime view of a server process. Never persisted.
struct ServerProcessState {
    std::string server_id;
    ServerStatus status = ServerStatus::Stopped;
    std::optional<int> process_id;
    std::optional<std::int64_t> started_at_ms;
    std::optional<std::int64_t> last_health_check_at_ms;
    std::optional<std::string> last_error;
};

inline std::string to_string(const ServerStatus status) {
    switch (status) {
        case ServerStatus::Stopped:
            return "stopped";
        case ServerStatus::Starting:
            return "starting";
        case ServerStatus::Running:
            return "running";
        case ServerStatus::Error:
            return "error";
        default:
            return "unknown";
    }
}

}  // namespace toolgate::protocol
