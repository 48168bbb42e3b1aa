#pragma once

#include <filesystem>
#include <optional>
#include <vector>
#include "core/errors/toolgate_errors.hpp"

namespace toolgate::fallback {

struct BillRecord {
    double kwh = 0.0;
    double bill = 0.0;
};

// Tariff lookup table, sorted by kWh. Never empty once constructed.
class BillTable {
public:
    static core::errors::Result<BillTable> load(const std::filesystem::path& path);
    static core::errors::Result<BillTable> from_records(std::vector<BillRecord> records);

    // Nearest row by bill amount; nullopt outside [min_bill, max_bill].
    std::optional<BillRecord> nearest_by_bill(double rm) const;
    // Nearest row by usage. Below the table clamps to the first row, above it is nullopt.
    std::optional<BillRecord> nearest_by_kwh(double kwh) const;

    const std::vector<BillRecord>& records() const { return records_; }
    double min_kwh() const { return records_.front().kwh; }
    double max_kwh() const { return records_.back().kwh; }
    double min_bill() const { return min_bill_; }
    double max_bill() const { return max_bill_; }

private:
    explicit BillTable(std::vector<BillRecord> records);

    std::vector<BillRecord> records_;
    double min_bill_ = 0.0;
    double max_bill_ = 0.0;
};

}  // namespace toolgate::fallback
