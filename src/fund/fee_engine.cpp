// src/fund/fee_engine.cpp

#include "fund_ngin/fund/fee_engine.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

std::string fee_type_to_string(FeeType type) {
    return type == FeeType::MANAGEMENT ? "management" : "performance";
}

Result<FeeType> fee_type_from_string(const std::string& text) {
    std::string lower;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (lower == "management") return FeeType::MANAGEMENT;
    if (lower == "performance") return FeeType::PERFORMANCE;
    return make_error<FeeType>(ErrorCode::PARSE_ERROR, "Unknown fee type: '" + text + "'",
                               "FeeEngine");
}

std::string fee_state_to_string(FeeState state) {
    switch (state) {
        case FeeState::PENDING:
            return "PENDING";
        case FeeState::CALCULATED:
            return "CALCULATED";
        case FeeState::PAID:
            return "PAID";
        default:
            return "UNKNOWN";
    }
}

std::string fee_basis_to_string(FeeBasis basis) {
    return basis == FeeBasis::PERIOD_START ? "PERIOD_START" : "PERIOD_END";
}

nlohmann::json FeeRecord::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["period_start"] = core::format_date(period_start);
    j["period_end"] = core::format_date(period_end);
    j["fee_type"] = fee_type_to_string(fee_type);
    j["nav_start"] = nav_start;
    j["nav_end"] = nav_end;
    j["fee_rate"] = rate;
    j["fee_amount"] = amount;
    j["currency"] = currency;
    j["state"] = fee_state_to_string(state);
    j["paid"] = paid();
    j["payment_date"] = payment_date ? core::format_date(*payment_date) : "";
    if (!investor_id.empty()) {
        j["investor_id"] = investor_id;
    }
    return j;
}

nlohmann::json FeePeriodResult::to_json() const {
    nlohmann::json j;
    j["period_start"] = core::format_date(period_start);
    j["period_end"] = core::format_date(period_end);
    j["nav_start"] = nav_start;
    j["nav_end"] = nav_end;
    j["management_fee"] = management_fee;
    j["performance_fee"] = performance_fee;
    j["total_fees"] = total_fees;
    j["hwm_before"] = hwm_before;
    j["hwm_after"] = hwm_after;
    j["record_ids"] = record_ids;
    return j;
}

nlohmann::json FeeSummary::to_json() const {
    nlohmann::json j;
    j["total_management_fees"] = total_management_fees;
    j["total_performance_fees"] = total_performance_fees;
    j["total_fees"] = total_fees;
    j["outstanding_fees"] = outstanding_fees;
    j["paid_fees"] = paid_fees;
    j["num_payments"] = num_records;
    j["num_outstanding"] = num_outstanding;
    j["high_water_mark"] = high_water_mark ? nlohmann::json(*high_water_mark)
                                           : nlohmann::json(nullptr);
    return j;
}

FeeEngine::FeeEngine(FeeConfig config, NavProvider nav_provider)
    : config_(std::move(config)), nav_provider_(std::move(nav_provider)) {
    hwm_ = config_.initial_hwm;
}

double FeeEngine::management_fee(double basis_nav, int days) const {
    if (basis_nav <= 0 || days <= 0) {
        return 0.0;
    }
    return basis_nav * config_.management_rate / config_.days_per_year * days;
}

std::vector<size_t> FeeEngine::period_records(const Timestamp& period_start,
                                              const Timestamp& period_end) const {
    std::vector<size_t> indices;
    for (size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].period_start == period_start && records_[i].period_end == period_end) {
            indices.push_back(i);
        }
    }
    return indices;
}

FeeRecord FeeEngine::make_record(FeeType type, const Timestamp& period_start,
                                 const Timestamp& period_end) {
    FeeRecord record;
    record.id = next_id_++;
    record.period_start = period_start;
    record.period_end = period_end;
    record.fee_type = type;
    record.currency = config_.currency;
    record.rate = type == FeeType::MANAGEMENT ? config_.management_rate : config_.performance_rate;
    return record;
}

Result<void> FeeEngine::schedule_period(const Timestamp& period_start,
                                        const Timestamp& period_end) {
    const Timestamp start = core::to_date(period_start);
    const Timestamp end = core::to_date(period_end);
    if (end <= start) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Fee period end must follow its start",
                                "FeeEngine");
    }
    if (!period_records(start, end).empty()) {
        return make_error<void>(ErrorCode::INVALID_STATE,
                                "Fee period " + core::format_date(start) + " to " +
                                    core::format_date(end) + " already exists",
                                "FeeEngine");
    }

    records_.push_back(make_record(FeeType::MANAGEMENT, start, end));
    records_.push_back(make_record(FeeType::PERFORMANCE, start, end));
    return Result<void>();
}

Result<FeePeriodResult> FeeEngine::calculate(const Timestamp& period_start,
                                             const Timestamp& period_end) {
    const Timestamp start = core::to_date(period_start);
    const Timestamp end = core::to_date(period_end);
    if (end <= start) {
        return make_error<FeePeriodResult>(ErrorCode::INVALID_ARGUMENT,
                                           "Fee period end must follow its start", "FeeEngine");
    }

    auto existing = period_records(start, end);
    for (size_t index : existing) {
        if (records_[index].state != FeeState::PENDING) {
            return make_error<FeePeriodResult>(
                ErrorCode::INVALID_STATE,
                "Fee period " + core::format_date(start) + " to " + core::format_date(end) +
                    " is already " + fee_state_to_string(records_[index].state),
                "FeeEngine");
        }
    }

    if (!nav_provider_) {
        return make_error<FeePeriodResult>(ErrorCode::PRECONDITION_FAILED,
                                           "No NAV provider configured", "FeeEngine");
    }
    auto nav_start = nav_provider_(start);
    if (nav_start.is_error()) {
        return make_error<FeePeriodResult>(ErrorCode::PRECONDITION_FAILED,
                                           "NAV unavailable for " + core::format_date(start) +
                                               ": " + nav_start.error()->what(),
                                           "FeeEngine");
    }
    auto nav_end = nav_provider_(end);
    if (nav_end.is_error()) {
        return make_error<FeePeriodResult>(ErrorCode::PRECONDITION_FAILED,
                                           "NAV unavailable for " + core::format_date(end) + ": " +
                                               nav_end.error()->what(),
                                           "FeeEngine");
    }

    FeePeriodResult result;
    result.period_start = start;
    result.period_end = end;
    result.nav_start = nav_start.value();
    result.nav_end = nav_end.value();

    const double basis =
        config_.management_basis == FeeBasis::PERIOD_START ? result.nav_start : result.nav_end;
    result.management_fee = management_fee(basis, core::days_between(start, end));

    const double hwm = hwm_.value_or(result.nav_start);
    result.hwm_before = hwm;
    if (result.nav_end > hwm) {
        result.performance_fee = (result.nav_end - hwm) * config_.performance_rate;
    }
    result.hwm_after = std::max(hwm, result.nav_end);
    result.total_fees = result.management_fee + result.performance_fee;

    // Nothing below can fail, so the ledger is only touched from here on
    if (existing.empty()) {
        records_.push_back(make_record(FeeType::MANAGEMENT, start, end));
        records_.push_back(make_record(FeeType::PERFORMANCE, start, end));
        existing = period_records(start, end);
    }

    std::vector<int64_t> zero_performance;
    for (size_t index : existing) {
        FeeRecord& record = records_[index];
        record.nav_start = result.nav_start;
        record.nav_end = result.nav_end;
        record.state = FeeState::CALCULATED;
        if (record.fee_type == FeeType::MANAGEMENT) {
            record.amount = result.management_fee;
        } else {
            record.amount = result.performance_fee;
            if (result.performance_fee <= 0) {
                zero_performance.push_back(record.id);
                continue;
            }
        }
        result.record_ids.push_back(record.id);
    }
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&zero_performance](const FeeRecord& record) {
                                      return std::find(zero_performance.begin(),
                                                       zero_performance.end(),
                                                       record.id) != zero_performance.end();
                                  }),
                   records_.end());

    hwm_ = result.hwm_after;

    INFO("Fees for " << core::format_date(start) << " to " << core::format_date(end)
                     << ": management " << result.management_fee << ", performance "
                     << result.performance_fee << ", HWM " << result.hwm_before << " -> "
                     << result.hwm_after);
    return result;
}

Result<void> FeeEngine::mark_paid(int64_t record_id, const Timestamp& payment_date) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [record_id](const FeeRecord& record) { return record.id == record_id; });
    if (it == records_.end()) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND,
                                "Unknown fee record " + std::to_string(record_id), "FeeEngine");
    }
    if (it->state != FeeState::CALCULATED) {
        return make_error<void>(ErrorCode::INVALID_STATE,
                                "Fee record " + std::to_string(record_id) + " is " +
                                    fee_state_to_string(it->state) + ", cannot mark paid",
                                "FeeEngine");
    }
    it->state = FeeState::PAID;
    it->payment_date = core::to_date(payment_date);
    return Result<void>();
}

std::vector<FeeRecord> FeeEngine::outstanding_records(const Timestamp& as_of) const {
    std::vector<FeeRecord> outstanding;
    for (const auto& record : records_) {
        if (record.period_end > as_of || record.state == FeeState::PENDING) {
            continue;
        }
        bool paid_by_then =
            record.state == FeeState::PAID && record.payment_date && *record.payment_date <= as_of;
        if (!paid_by_then) {
            outstanding.push_back(record);
        }
    }
    return outstanding;
}

double FeeEngine::outstanding_fees(const Timestamp& as_of) const {
    double total = 0.0;
    for (const auto& record : outstanding_records(as_of)) {
        total += record.amount;
    }
    return total;
}

FeeSummary FeeEngine::summary(std::optional<Timestamp> start, std::optional<Timestamp> end) const {
    FeeSummary summary;
    summary.high_water_mark = hwm_;
    for (const auto& record : records_) {
        if (record.state == FeeState::PENDING) continue;
        if (start && record.period_end < *start) continue;
        if (end && record.period_end > *end) continue;

        ++summary.num_records;
        if (record.fee_type == FeeType::MANAGEMENT) {
            summary.total_management_fees += record.amount;
        } else {
            summary.total_performance_fees += record.amount;
        }
        if (record.paid()) {
            summary.paid_fees += record.amount;
        } else {
            summary.outstanding_fees += record.amount;
            ++summary.num_outstanding;
        }
    }
    summary.total_fees = summary.total_management_fees + summary.total_performance_fees;
    return summary;
}

Result<void> FeeEngine::restore(std::vector<FeeRecord> records, std::optional<double> hwm) {
    int64_t max_id = 0;
    for (const auto& record : records) {
        max_id = std::max(max_id, record.id);
    }

    // Records loaded from files carry no id; number them after the known ones
    std::set<int64_t> ids;
    for (auto& record : records) {
        if (record.id <= 0) {
            record.id = ++max_id;
        }
        if (!ids.insert(record.id).second) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Duplicate fee record id " + std::to_string(record.id),
                                    "FeeEngine");
        }
        if (record.amount < 0) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Negative fee amount in record " + std::to_string(record.id),
                                    "FeeEngine");
        }
        if (record.paid() && !record.payment_date) {
            WARN("Paid fee record " << record.id << " has no payment date");
        }
    }

    records_ = std::move(records);
    std::sort(records_.begin(), records_.end(), [](const FeeRecord& a, const FeeRecord& b) {
        if (a.period_end != b.period_end) return a.period_end < b.period_end;
        return a.id < b.id;
    });
    next_id_ = max_id + 1;

    hwm_ = hwm ? hwm : config_.initial_hwm;
    if (!hwm) {
        // Without a persisted mark, the highest NAV fees were charged at stands in
        for (const auto& record : records_) {
            if (record.state == FeeState::PENDING) continue;
            if (!hwm_ || record.nav_end > *hwm_) {
                hwm_ = record.nav_end;
            }
        }
    }

    INFO("Restored " << records_.size() << " fee records");
    return Result<void>();
}

Result<FeeRecord> FeeEngine::record(int64_t record_id) const {
    for (const auto& record : records_) {
        if (record.id == record_id) {
            return record;
        }
    }
    return make_error<FeeRecord>(ErrorCode::DATA_NOT_FOUND,
                                 "Unknown fee record " + std::to_string(record_id), "FeeEngine");
}

}  // namespace fund_ngin
