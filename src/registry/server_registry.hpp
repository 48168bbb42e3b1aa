#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/toolgate_errors.hpp"
#include "policy/policy_guard.hpp"
#include "process/process_supervisor.hpp"
#include "protocol/server_config.hpp"

namespace toolgate::registry {

// Partial update; unset fields keep their current value.
struct ServerConfigPatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> arguments;
    std::optional<std::map<std::string, std::string>> environment;
    std::optional<std::filesystem::path> working_directory;
    std::optional<bool> enabled;
    std::optional<bool> auto_start;
    std::optional<std::uint32_t> health_check_interval_s;
};

// Durable store of server configurations, one JSON document on disk.
class ServerRegistry {
public:
    ServerRegistry(std::filesystem::path storage_path,
                   process::ProcessSupervisor& supervisor,
                   policy::PolicyGuard policy_guard = policy::PolicyGuard{});

    // Reads the storage file if it exists. Never starts anything.
    core::errors::Result<std::size_t> load();

    // Validates, persists, then auto-starts when enabled && auto_start.
    // A failed auto-start leaves the config registered.
    core::errors::Result<std::string> register_server(protocol::ServerConfig config);

    core::errors::Result<protocol::ServerConfig> update(const std::string& server_id,
                                                        const ServerConfigPatch& patch);

    // Stops the process first; stop problems never block removal.
    core::errors::Result<core::errors::Done> remove(const std::string& server_id);

    std::optional<protocol::ServerConfig> get(const std::string& server_id) const;
    std::vector<protocol::ServerConfig> list() const;

    const std::filesystem::path& storage_path() const { return storage_path_; }

private:
    core::errors::Result<core::errors::Done> validate(
        const protocol::ServerConfig& config) const;
    core::errors::Result<core::errors::Done> persist_locked() const;
    std::vector<protocol::ServerConfig>::iterator find_locked(const std::string& server_id);
    std::vector<protocol::ServerConfig>::const_iterator find_locked(
        const std::string& server_id) const;
    static bool is_valid_slug(const std::string& id);

    std::filesystem::path storage_path_;
    process::ProcessSupervisor& supervisor_;
    policy::PolicyGuard policy_guard_;

    mutable std::mutex mutex_;
    std::vector<protocol::ServerConfig> servers_;
};

}  // namespace toolgate::registry
