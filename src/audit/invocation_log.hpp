#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/toolgate_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::audit {

// Append-only store of ToolInvocationRecords. The newest memory_capacity
// records are kept in memory; when an audit directory is configured every
// record is also appended as a JSON line on disk.
class InvocationLog {
public:
    static constexpr std::size_t kDefaultMemoryCapacity = 1000;

    explicit InvocationLog(std::optional<std::filesystem::path> audit_dir = std::nullopt,
                           std::string file_name = "audit.jsonl",
                           std::size_t memory_capacity = kDefaultMemoryCapacity);

    // The in-memory append never fails; a disk failure is returned so the
    // caller can log it.
    core::errors::Result<core::errors::Done> append(const protocol::ToolInvocationRecord& record);

    // Retained records, oldest first.
    std::vector<protocol::ToolInvocationRecord> records() const;
    std::size_t size() const;
    // Every record appended since construction, including evicted ones.
    std::size_t total_appended() const;

    core::errors::Result<std::filesystem::path> log_path() const;

private:
    std::optional<std::filesystem::path> audit_dir_;
    std::string file_name_;
    std::size_t memory_capacity_;

    mutable std::mutex mutex_;
    std::deque<protocol::ToolInvocationRecord> records_;
    std::size_t total_appended_ = 0;
};

}  // namespace toolgate::audit
