#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolgate_errors.hpp"
#include "fallback/bill_table.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::fallback {

inline constexpr const char* kRmToKwhTool = "tnb_bill_rm_to_kwh";
inline constexpr const char* kKwhToRmTool = "tnb_bill_kwh_to_rm";
inline constexpr const char* kSolarImpactTool = "calculate_solar_impact";

// In-process tools over a preloaded bill table. Used only for agents bound to
// no servers. A missing table never fails a call: every tool then answers
// with an out_of_scope text result.
class FallbackToolProvider {
public:
    explicit FallbackToolProvider(const std::filesystem::path& data_path);
    explicit FallbackToolProvider(std::optional<BillTable> table);

    std::vector<protocol::ToolDescriptor> descriptors() const;

    // ToolExecution errors for unknown tools and missing or non-numeric arguments.
    core::errors::Result<std::vector<protocol::ContentBlock>> call(
        const std::string& name, const nlohmann::json& arguments) const;

    bool has_data() const { return table_.has_value(); }

private:
    std::string out_of_scope_message() const;
    std::string rm_to_kwh(double rm) const;
    std::string kwh_to_rm(double kwh) const;
    std::string solar_impact(double rm, double morning_usage_pct, double sunpeak_hour) const;

    std::optional<BillTable> table_;
};

}  // namespace toolgate::fallback
