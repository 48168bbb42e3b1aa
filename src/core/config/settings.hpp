#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include "core/logging/logger.hpp"

namespace toolgate::core::config {

    // Tunables shared by every component of the core.
    struct CoreSettings {
        std::filesystem::path registry_path = "toolgate_servers.json";
        std::filesystem::path fallback_data_path = "resource/bill.json";
        std::optional<std::filesystem::path> audit_dir;

        // When set, every server working_directory must resolve inside it.
        std::optional<std::filesystem::path> servers_root;

        std::uint32_t handshake_timeout_ms = 10000;
        std::uint32_t call_timeout_ms = 30000;
        std::uint32_t catalog_timeout_ms = 5000;
        std::uint32_t probe_timeout_ms = 2000;
        std::uint32_t stop_grace_ms = 5000;
        int failure_threshold = 3;

        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

} // namespace toolgate::core::config
