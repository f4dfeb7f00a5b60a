// include/fund_ngin/fund/nav_calculator.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/fx_converter.hpp"
#include "fund_ngin/data/time_series_cache.hpp"
#include "fund_ngin/fund/cash_ledger.hpp"
#include "fund_ngin/fund/fee_engine.hpp"
#include "fund_ngin/ledger/bond_indexation_engine.hpp"
#include "fund_ngin/ledger/position_ledger.hpp"

namespace fund_ngin {

/**
 * @brief Fund NAV at a date, in the base currency
 * nav = portfolio_value + cash_position - outstanding_fees
 */
struct NavSnapshot {
    Timestamp date;
    double equity_value{0.0};
    double crypto_value{0.0};
    double bond_value{0.0};
    double portfolio_value{0.0};
    double cash_position{0.0};
    double outstanding_fees{0.0};
    double nav{0.0};
    std::string currency;
    std::vector<std::string> stale_symbols;
    size_t approximated_bonds{0};

    nlohmann::json to_json() const;
};

struct InvestorAllocation {
    std::string investor_id;
    std::string name;
    double stake_pct{0.0};
    double net_contribution{0.0};
    double investor_nav{0.0};
    double unrealized_gain{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief Components a NAV is assembled from
 * Any of the books may be null; cache and fx are required for priced books.
 */
struct NavInputs {
    std::shared_ptr<const PositionLedger> equities;
    std::shared_ptr<const PositionLedger> crypto;
    std::shared_ptr<const std::vector<BondPosition>> bonds;
    std::shared_ptr<const BondIndexationEngine> bond_engine;
    std::shared_ptr<const CashLedger> cash;
    std::shared_ptr<const FeeEngine> fees;
    std::shared_ptr<const TimeSeriesCache> cache;
    std::shared_ptr<const FxConverter> fx;
    std::string base_currency{"BRL"};
};

/**
 * @brief Computes and memoizes NAV snapshots
 *
 * Snapshots are kept per date until invalidate_from() is called with a date
 * on or before them.
 */
class NavCalculator {
public:
    explicit NavCalculator(NavInputs inputs);

    Result<NavSnapshot> nav(const Timestamp& as_of) const;

    /**
     * @brief Split a snapshot's NAV by stake
     *
     * Allocations are rounded to cents; the rounding residual goes to the
     * largest stake so they sum to the fund NAV.
     */
    Result<std::vector<InvestorAllocation>> allocate_to_investors(
        const NavSnapshot& snapshot) const;

    /**
     * @brief Daily NAV over [start, end]
     */
    Result<Series> nav_series(const Timestamp& start, const Timestamp& end) const;

    /**
     * @brief Drop snapshots dated on or after the date of a new event
     */
    void invalidate_from(const Timestamp& date);

    void invalidate_all();

    size_t cached_snapshots() const;

    const std::string& base_currency() const { return inputs_.base_currency; }

private:
    Result<NavSnapshot> compute(const Timestamp& date) const;

    Result<double> value_ledger(const PositionLedger& ledger, const Timestamp& date,
                                NavSnapshot& snapshot) const;

    Result<double> to_base(const Money& amount, const Timestamp& date) const;

    NavInputs inputs_;
    mutable std::mutex memo_mutex_;
    mutable std::map<Timestamp, NavSnapshot> memo_;
};

}  // namespace fund_ngin
