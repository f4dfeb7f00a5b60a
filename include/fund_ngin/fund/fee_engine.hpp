// include/fund_ngin/fund/fee_engine.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"

namespace fund_ngin {

enum class FeeType {
    MANAGEMENT,
    PERFORMANCE
};

/**
 * @brief Lifecycle of a fee record: PENDING -> CALCULATED -> PAID
 */
enum class FeeState {
    PENDING,
    CALCULATED,
    PAID
};

/**
 * @brief Which NAV the management fee is charged on
 */
enum class FeeBasis {
    PERIOD_END,
    PERIOD_START
};

std::string fee_type_to_string(FeeType type);
Result<FeeType> fee_type_from_string(const std::string& text);
std::string fee_state_to_string(FeeState state);
std::string fee_basis_to_string(FeeBasis basis);

struct FeeRecord {
    int64_t id{0};
    Timestamp period_start;
    Timestamp period_end;
    FeeType fee_type{FeeType::MANAGEMENT};
    double nav_start{0.0};
    double nav_end{0.0};
    double rate{0.0};
    double amount{0.0};
    std::string currency;
    FeeState state{FeeState::PENDING};
    std::optional<Timestamp> payment_date;
    std::string investor_id;  // informational, fees are charged at fund level

    bool paid() const { return state == FeeState::PAID; }

    nlohmann::json to_json() const;
};

/**
 * @brief Fees booked for one period by calculate()
 */
struct FeePeriodResult {
    Timestamp period_start;
    Timestamp period_end;
    double nav_start{0.0};
    double nav_end{0.0};
    double management_fee{0.0};
    double performance_fee{0.0};
    double total_fees{0.0};
    double hwm_before{0.0};
    double hwm_after{0.0};
    std::vector<int64_t> record_ids;

    nlohmann::json to_json() const;
};

struct FeeSummary {
    double total_management_fees{0.0};
    double total_performance_fees{0.0};
    double total_fees{0.0};
    double outstanding_fees{0.0};
    double paid_fees{0.0};
    size_t num_records{0};
    size_t num_outstanding{0};
    std::optional<double> high_water_mark;

    nlohmann::json to_json() const;
};

struct FeeConfig : public ConfigBase {
    double management_rate{0.02};   // annual
    double performance_rate{0.20};  // of gains above the high-water mark
    FeeBasis management_basis{FeeBasis::PERIOD_END};
    std::optional<double> initial_hwm;  // defaults to the first period's nav_start
    double days_per_year{365.0};
    std::string currency{"BRL"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["management_rate"] = management_rate;
        j["performance_rate"] = performance_rate;
        j["management_basis"] = fee_basis_to_string(management_basis);
        j["initial_hwm"] = initial_hwm ? nlohmann::json(*initial_hwm) : nlohmann::json(nullptr);
        j["days_per_year"] = days_per_year;
        j["currency"] = currency;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("management_rate"))
            management_rate = j.at("management_rate").get<double>();
        if (j.contains("performance_rate"))
            performance_rate = j.at("performance_rate").get<double>();
        if (j.contains("management_basis")) {
            management_basis = j.at("management_basis").get<std::string>() == "PERIOD_START"
                                   ? FeeBasis::PERIOD_START
                                   : FeeBasis::PERIOD_END;
        }
        if (j.contains("initial_hwm")) {
            if (j.at("initial_hwm").is_null())
                initial_hwm.reset();
            else
                initial_hwm = j.at("initial_hwm").get<double>();
        }
        if (j.contains("days_per_year"))
            days_per_year = j.at("days_per_year").get<double>();
        if (j.contains("currency"))
            currency = j.at("currency").get<std::string>();
    }
};

/**
 * @brief Supplies the fund NAV at a date, before the fees being calculated
 */
using NavProvider = std::function<Result<double>(const Timestamp&)>;

/**
 * @brief Management and performance fee waterfall against a high-water mark
 */
class FeeEngine {
public:
    explicit FeeEngine(FeeConfig config = FeeConfig{}, NavProvider nav_provider = nullptr);

    void set_nav_provider(NavProvider nav_provider) { nav_provider_ = std::move(nav_provider); }

    /**
     * @brief Open a period whose fees are not yet calculated
     * @return INVALID_STATE when the period already exists
     */
    Result<void> schedule_period(const Timestamp& period_start, const Timestamp& period_end);

    /**
     * @brief Calculate the fees of a pending or new period
     *
     * Fails with PRECONDITION_FAILED, changing nothing, when either NAV is
     * unavailable, and with INVALID_STATE when the period was already
     * calculated or paid.
     */
    Result<FeePeriodResult> calculate(const Timestamp& period_start, const Timestamp& period_end);

    /**
     * @brief CALCULATED -> PAID
     * @return DATA_NOT_FOUND for an unknown id, INVALID_STATE otherwise
     */
    Result<void> mark_paid(int64_t record_id, const Timestamp& payment_date);

    /**
     * @brief Calculated fees of periods ended by as_of and not paid by then
     */
    double outstanding_fees(const Timestamp& as_of) const;

    std::vector<FeeRecord> outstanding_records(const Timestamp& as_of) const;

    /**
     * @brief Totals over records whose period ends within the bounds
     */
    FeeSummary summary(std::optional<Timestamp> start = std::nullopt,
                       std::optional<Timestamp> end = std::nullopt) const;

    /**
     * @brief Replace all state with persisted records
     * @param hwm High-water mark to resume from, if one was reached
     */
    Result<void> restore(std::vector<FeeRecord> records, std::optional<double> hwm);

    /**
     * @brief Management fee for a NAV over a number of days
     */
    double management_fee(double basis_nav, int days) const;

    std::optional<double> high_water_mark() const { return hwm_; }

    const std::vector<FeeRecord>& records() const { return records_; }

    Result<FeeRecord> record(int64_t record_id) const;

    const FeeConfig& config() const { return config_; }

private:
    std::vector<size_t> period_records(const Timestamp& period_start,
                                       const Timestamp& period_end) const;

    FeeRecord make_record(FeeType type, const Timestamp& period_start,
                          const Timestamp& period_end);

    FeeConfig config_;
    NavProvider nav_provider_;
    std::vector<FeeRecord> records_;
    std::optional<double> hwm_;
    int64_t next_id_{1};
};

}  // namespace fund_ngin
