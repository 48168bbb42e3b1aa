#include "registry/server_registry.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "protocol/wire_codec.hpp"

namespace toolgate::registry {

using core::errors::Done;
using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using nlohmann::json;
using protocol::ServerConfig;

namespace {

constexpr std::size_t kMaxIdLength = 64;

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
            .count());
}

}  // namespace

ServerRegistry::ServerRegistry(std::filesystem::path storage_path,
                               process::ProcessSupervisor& supervisor,
                               policy::PolicyGuard policy_guard)
    : storage_path_(std::move(storage_path)),
      supervisor_(supervisor),
      policy_guard_(std::move(policy_guard)) {}

bool ServerRegistry::is_valid_slug(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLength) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](const unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.';
    });
}

std::vector<ServerConfig>::iterator ServerRegistry::find_locked(
    const std::string& server_id) {
    return std::find_if(servers_.begin(), servers_.end(),
                        [&server_id](const ServerConfig& c) { return c.id == server_id; });
}

std::vector<ServerConfig>::const_iterator ServerRegistry::find_locked(
    const std::string& server_id) const {
    return std::find_if(servers_.begin(), servers_.end(),
                        [&server_id](const ServerConfig& c) { return c.id == server_id; });
}

core::errors::Result<std::size_t> ServerRegistry::load() {
    std::error_code ec;
    if (!std::filesystem::exists(storage_path_, ec)) {
        LOG_INFO("ServerRegistry: no registry at " + storage_path_.string() +
                 ", starting empty");
        return std::size_t{0};
    }

    std::ifstream in(storage_path_);
    if (!in.is_open()) {
        return ToolgateError{ErrorCategory::Storage,
                             "Unable to open registry file: " + storage_path_.string(),
                             "registry_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object() ||
        !document.contains("servers") || !document["servers"].is_array()) {
        return ToolgateError{ErrorCategory::Storage,
                             "Registry file is corrupt: " + storage_path_.string(),
                             "registry_corrupt"};
    }

    std::vector<ServerConfig> loaded;
    for (const auto& entry : document["servers"]) {
        auto parsed = protocol::server_config_from_json(entry);
        if (core::errors::is_error(parsed)) {
            const auto& error = core::errors::get_error(parsed);
            return ToolgateError{ErrorCategory::Storage,
                                 "Registry entry is invalid: " + error.message,
                                 "registry_corrupt"};
        }
        loaded.push_back(core::errors::get_value(parsed));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    servers_ = std::move(loaded);
    LOG_INFO("ServerRegistry: loaded " + std::to_string(servers_.size()) + " servers");
    return servers_.size();
}

core::errors::Result<Done> ServerRegistry::validate(const ServerConfig& config) const {
    if (!is_valid_slug(config.id)) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Server id must be 1-64 characters of [A-Za-z0-9_.-]: " +
                                 config.id,
                             "invalid_server_id"};
    }
    if (config.health_check_interval_s < 1) {
        return ToolgateError{ErrorCategory::Configuration,
                             "health_check_interval must be at least 1 second.",
                             "invalid_health_check_interval"};
    }
    for (const auto& [key, value] : config.environment) {
        if (key.empty() || key.find('=') != std::string::npos ||
            key.find('\0') != std::string::npos || value.find('\0') != std::string::npos) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Invalid environment entry: " + key,
                                 "invalid_environment"};
        }
    }

    auto command = policy_guard_.validate_command(config.command);
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }
    // The directory is created at start, never for a config that may still be rejected.
    auto working_directory = policy_guard_.validate_working_directory(
        config.working_directory, policy::DirectoryMode::CheckCreatable);
    if (core::errors::is_error(working_directory)) {
        return core::errors::get_error(working_directory);
    }
    return Done{};
}

core::errors::Result<Done> ServerRegistry::persist_locked() const {
    json document;
    document["servers"] = json::array();
    for (const auto& config : servers_) {
        document["servers"].push_back(protocol::server_config_to_json(config));
    }

    std::error_code ec;
    const auto parent = storage_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return ToolgateError{ErrorCategory::Storage,
                                 "Unable to create registry directory: " + parent.string(),
                                 "registry_dir_create_failed"};
        }
    }

    // Write-then-rename so a crash never leaves a half-written registry.
    auto temp_path = storage_path_;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return ToolgateError{ErrorCategory::Storage,
                                 "Unable to open registry file: " + temp_path.string(),
                                 "registry_open_failed"};
        }
        out << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!out.good()) {
            return ToolgateError{ErrorCategory::Storage,
                                 "Unable to write registry file: " + temp_path.string(),
                                 "registry_write_failed"};
        }
    }
    std::filesystem::rename(temp_path, storage_path_, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return ToolgateError{ErrorCategory::Storage,
                             "Unable to replace registry file: " + storage_path_.string(),
                             "registry_write_failed"};
    }
    return Done{};
}

core::errors::Result<std::string> ServerRegistry::register_server(ServerConfig config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config.id.empty()) {
            constexpr int kMaxAttempts = 16;
            for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
                const std::string candidate = core::config::generate_server_id();
                if (find_locked(candidate) == servers_.end()) {
                    config.id = candidate;
                    break;
                }
            }
            if (config.id.empty()) {
                return ToolgateError{ErrorCategory::Internal,
                                     "Unable to allocate unique server ID.",
                                     "server_id_generation_failed"};
            }
        } else if (find_locked(config.id) != servers_.end()) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Server with ID '" + config.id + "' already exists",
                                 "duplicate_server_id"};
        }
    }

    if (config.name.empty()) {
        config.name = config.id;
    }
    auto valid = validate(config);
    if (core::errors::is_error(valid)) {
        const auto& error = core::errors::get_error(valid);
        LOG_WARN("ServerRegistry: rejected server " + config.id + " [" + error.code +
                 "]: " + error.message);
        return error;
    }

    config.created_at_ms = now_unix_ms();
    config.updated_at_ms = config.created_at_ms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (find_locked(config.id) != servers_.end()) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Server with ID '" + config.id + "' already exists",
                                 "duplicate_server_id"};
        }
        servers_.push_back(config);
        auto persisted = persist_locked();
        if (core::errors::is_error(persisted)) {
            servers_.pop_back();
            return core::errors::get_error(persisted);
        }
    }
    LOG_INFO("ServerRegistry: registered server " + config.id + " (" + config.name + ")");

    if (config.enabled && config.auto_start) {
        auto started = supervisor_.start(config);
        if (core::errors::is_error(started)) {
            LOG_WARN("ServerRegistry: auto-start of " + config.id + " failed: " +
                     core::errors::get_error(started).message);
        }
    }
    return config.id;
}

core::errors::Result<ServerConfig> ServerRegistry::update(const std::string& server_id,
                                                          const ServerConfigPatch& patch) {
    ServerConfig updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = find_locked(server_id);
        if (it == servers_.end()) {
            return ToolgateError{ErrorCategory::Input, "Server '" + server_id + "' not found",
                                 "server_not_found"};
        }
        updated = *it;
    }

    if (patch.name) updated.name = *patch.name;
    if (patch.description) updated.description = *patch.description;
    if (patch.command) updated.command = *patch.command;
    if (patch.arguments) updated.arguments = *patch.arguments;
    if (patch.environment) updated.environment = *patch.environment;
    if (patch.working_directory) updated.working_directory = *patch.working_directory;
    if (patch.enabled) updated.enabled = *patch.enabled;
    if (patch.auto_start) updated.auto_start = *patch.auto_start;
    if (patch.health_check_interval_s) {
        updated.health_check_interval_s = *patch.health_check_interval_s;
    }

    auto valid = validate(updated);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    updated.updated_at_ms = now_unix_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(server_id);
    if (it == servers_.end()) {
        return ToolgateError{ErrorCategory::Input, "Server '" + server_id + "' not found",
                             "server_not_found"};
    }
    const ServerConfig previous = *it;
    *it = updated;
    auto persisted = persist_locked();
    if (core::errors::is_error(persisted)) {
        *it = previous;
        return core::errors::get_error(persisted);
    }
    LOG_INFO("ServerRegistry: updated server " + server_id);
    return updated;
}

core::errors::Result<Done> ServerRegistry::remove(const std::string& server_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (find_locked(server_id) == servers_.end()) {
            return ToolgateError{ErrorCategory::Input, "Server '" + server_id + "' not found",
                                 "server_not_found"};
        }
    }

    supervisor_.forget(server_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(server_id);
    if (it == servers_.end()) {
        return Done{};
    }
    const ServerConfig removed = *it;
    const auto position = it - servers_.begin();
    servers_.erase(it);
    auto persisted = persist_locked();
    if (core::errors::is_error(persisted)) {
        servers_.insert(servers_.begin() + position, removed);
        return core::errors::get_error(persisted);
    }
    LOG_INFO("ServerRegistry: removed server " + server_id);
    return Done{};
}

std::optional<ServerConfig> ServerRegistry::get(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(server_id);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<ServerConfig> ServerRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_;
}

}  // namespace toolgate::registry
