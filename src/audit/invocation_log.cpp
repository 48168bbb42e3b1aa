#include "audit/invocation_log.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/wire_codec.hpp"

namespace toolgate::audit {

using core::errors::Done;
using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using nlohmann::json;

InvocationLog::InvocationLog(std::optional<std::filesystem::path> audit_dir,
                             std::string file_name, const std::size_t memory_capacity)
    : audit_dir_(std::move(audit_dir)),
      file_name_(std::move(file_name)),
      memory_capacity_(memory_capacity == 0 ? 1 : memory_capacity) {}

core::errors::Result<std::filesystem::path> InvocationLog::log_path() const {
    if (!audit_dir_.has_value()) {
        return ToolgateError{ErrorCategory::Configuration, "No audit directory configured.",
                             "audit_disabled"};
    }

    std::error_code ec;
    std::filesystem::create_directories(*audit_dir_, ec);
    if (ec) {
        return ToolgateError{ErrorCategory::Storage,
                             "Unable to create audit directory: " + audit_dir_->string(),
                             "audit_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(*audit_dir_, ec) || ec) {
        return ToolgateError{ErrorCategory::Storage,
                             "Audit path is not a directory: " + audit_dir_->string(),
                             "audit_dir_create_failed"};
    }
    return *audit_dir_ / file_name_;
}

core::errors::Result<Done> InvocationLog::append(const protocol::ToolInvocationRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    ++total_appended_;
    while (records_.size() > memory_capacity_) {
        records_.pop_front();
    }

    if (!audit_dir_.has_value()) {
        return Done{};
    }

    auto path_result = log_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ToolgateError{ErrorCategory::Storage,
                             "Unable to open audit file: " + path.string(),
                             "audit_open_failed"};
    }

    out << protocol::record_to_json(record).dump(-1, ' ', false,
                                                 json::error_handler_t::replace)
        << "\n";
    if (!out.good()) {
        return ToolgateError{ErrorCategory::Storage,
                             "Unable to write audit record: " + path.string(),
                             "audit_write_failed"};
    }
    return Done{};
}

std::vector<protocol::ToolInvocationRecord> InvocationLog::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<protocol::ToolInvocationRecord>(records_.begin(), records_.end());
}

std::size_t InvocationLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::size_t InvocationLog::total_appended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_appended_;
}

}  // namespace toolgate::audit
