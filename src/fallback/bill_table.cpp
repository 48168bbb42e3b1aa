#include "fallback/bill_table.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolgate::fallback {

using core::errors::ErrorCategory;
using core::errors::ToolgateError;
using nlohmann::json;

BillTable::BillTable(std::vector<BillRecord> records) : records_(std::move(records)) {
    std::stable_sort(records_.begin(), records_.end(),
                     [](const BillRecord& a, const BillRecord& b) { return a.kwh < b.kwh; });
    const auto [lowest, highest] = std::minmax_element(
        records_.begin(), records_.end(),
        [](const BillRecord& a, const BillRecord& b) { return a.bill < b.bill; });
    min_bill_ = lowest->bill;
    max_bill_ = highest->bill;
}

core::errors::Result<BillTable> BillTable::from_records(std::vector<BillRecord> records) {
    if (records.empty()) {
        return ToolgateError{ErrorCategory::Configuration, "Bill table is empty.",
                             "empty_bill_table"};
    }
    return BillTable(std::move(records));
}

core::errors::Result<BillTable> BillTable::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Unable to open bill table: " + path.string(),
                             "bill_table_unavailable"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return ToolgateError{ErrorCategory::Configuration,
                             "Bill table must be a JSON array: " + path.string(),
                             "invalid_bill_table"};
    }

    std::vector<BillRecord> records;
    records.reserve(document.size());
    for (const auto& row : document) {
        if (!row.is_object() || !row.contains("kwh") || !row.contains("bill") ||
            !row["kwh"].is_number() || !row["bill"].is_number()) {
            return ToolgateError{ErrorCategory::Configuration,
                                 "Bill table rows need numeric kwh and bill: " + path.string(),
                                 "invalid_bill_table"};
        }
        records.push_back(BillRecord{row["kwh"].get<double>(), row["bill"].get<double>()});
    }
    return from_records(std::move(records));
}

std::optional<BillRecord> BillTable::nearest_by_bill(const double rm) const {
    if (rm < min_bill_ || rm > max_bill_) {
        return std::nullopt;
    }
    return *std::min_element(records_.begin(), records_.end(),
                             [rm](const BillRecord& a, const BillRecord& b) {
                                 return std::fabs(a.bill - rm) < std::fabs(b.bill - rm);
                             });
}

std::optional<BillRecord> BillTable::nearest_by_kwh(const double kwh) const {
    if (kwh < min_kwh()) {
        return records_.front();
    }
    if (kwh > max_kwh()) {
        return std::nullopt;
    }
    return *std::min_element(records_.begin(), records_.end(),
                             [kwh](const BillRecord& a, const BillRecord& b) {
                                 return std::fabs(a.kwh - kwh) < std::fabs(b.kwh - kwh);
                             });
}

}  // namespace toolgate::fallback
