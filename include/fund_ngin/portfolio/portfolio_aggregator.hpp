// include/fund_ngin/portfolio/portfolio_aggregator.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fund_ngin/analytics/performance_analytics.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/ingest/record_parsers.hpp"
#include "fund_ngin/portfolio/portfolio_context.hpp"

namespace fund_ngin {

/**
 * @brief One holding valued in the summary currency
 */
struct PositionView {
    AssetClass asset_class{AssetClass::UNKNOWN};
    std::string symbol;
    std::string name;
    Quantity quantity{0.0};
    Price avg_cost{0.0};
    Price current_price{0.0};
    double market_value{0.0};
    double cost_basis{0.0};
    double unrealized_pnl{0.0};
    double unrealized_pnl_pct{0.0};
    double realized_pnl{0.0};
    std::string native_currency;
    std::string currency;
    bool stale{false};

    nlohmann::json to_json() const;
};

struct AssetClassAllocation {
    AssetClass asset_class{AssetClass::UNKNOWN};
    double value{0.0};
    double cost_basis{0.0};
    double pnl{0.0};
    double allocation_pct{0.0};
    size_t positions{0};
};

/**
 * @brief Fund-wide figures in one currency
 */
struct ConsolidatedSummary {
    Timestamp as_of;
    std::string currency;
    double total_value{0.0};     // market value of all holdings
    double total_invested{0.0};  // cost basis of open holdings
    double total_pnl{0.0};       // unrealized + realized
    double total_return_pct{0.0};
    double cash_position{0.0};
    double outstanding_fees{0.0};
    double nav{0.0};
    std::vector<AssetClassAllocation> allocation;
    std::map<std::string, double> exchange_rates;
    std::vector<std::string> stale_symbols;
    uint64_t version{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Counts of what an ingest run added to the books
 */
struct IngestSummary {
    size_t transactions{0};
    size_t bonds{0};
    size_t cash_flows{0};
    size_t fee_records{0};
    size_t investors_created{0};
    std::vector<std::string> errors;  // "<source>:<line>: <message>"

    nlohmann::json to_json() const;
};

/**
 * @brief Paths of the CSV exports to load, empty entries are skipped
 */
struct IngestSources {
    std::string equity_transactions;
    std::string crypto_transactions;
    std::string bonds;
    std::string cash_flows;
    std::string fee_records;
};

/**
 * @brief Root facade over one portfolio
 *
 * Mutations take a unique lock, bump the version and invalidate NAV
 * snapshots from the event date on. Reads take a shared lock and observe a
 * committed state. A writer passing expected_version fails with
 * STALE_VERSION when another write happened after its read.
 */
class PortfolioAggregator {
public:
    explicit PortfolioAggregator(std::shared_ptr<PortfolioContext> context,
                                 AnalyticsConfig analytics_config = AnalyticsConfig{});

    uint64_t version() const;

    std::shared_ptr<const PortfolioContext> context() const { return context_; }

    // ========== Writes ==========

    Result<uint64_t> record_transaction(const Transaction& txn,
                                        std::optional<uint64_t> expected_version = std::nullopt);

    /**
     * @brief Apply a batch atomically; nothing is applied when one fails
     */
    Result<uint64_t> record_transactions(const std::vector<Transaction>& transactions,
                                         std::optional<uint64_t> expected_version = std::nullopt);

    Result<uint64_t> add_bond(const BondPosition& bond,
                              std::optional<uint64_t> expected_version = std::nullopt);

    Result<uint64_t> register_investor(const InvestorAccount& account,
                                       std::optional<uint64_t> expected_version = std::nullopt);

    Result<uint64_t> set_investor_status(const std::string& investor_id, InvestorStatus status,
                                         std::optional<uint64_t> expected_version = std::nullopt);

    Result<uint64_t> record_cash_flow(const CashFlow& flow,
                                      std::optional<uint64_t> expected_version = std::nullopt);

    Result<uint64_t> schedule_fee_period(const Timestamp& period_start, const Timestamp& period_end,
                                         std::optional<uint64_t> expected_version = std::nullopt);

    /**
     * @brief Calculate a fee period; NAVs of later dates are recomputed afterwards
     */
    Result<FeePeriodResult> calculate_fees(const Timestamp& period_start,
                                           const Timestamp& period_end,
                                           std::optional<uint64_t> expected_version = std::nullopt);

    Result<uint64_t> mark_fee_paid(int64_t record_id, const Timestamp& payment_date,
                                   std::optional<uint64_t> expected_version = std::nullopt);

    /**
     * @brief Load CSV exports into the books
     *
     * Rows rejected by the parsers or by the books are reported and skipped.
     * Investors named in cash flows are registered on first sight.
     */
    Result<IngestSummary> ingest(const IngestSources& sources);

    /**
     * @brief Bring cached prices of every held symbol and FX pair up to date
     * @param extra_symbols Benchmarks or other symbols to fetch alongside
     */
    std::vector<FetchReport> refresh_prices(const Timestamp& start, const Timestamp& end,
                                            const std::vector<std::string>& extra_symbols = {},
                                            const std::atomic<bool>* cancel_flag = nullptr);

    // ========== Reads ==========

    Result<NavSnapshot> nav(const Timestamp& as_of) const;

    /**
     * @brief Holdings, cash and fees in the requested currency
     * @param currency Empty for the portfolio base currency
     */
    Result<ConsolidatedSummary> consolidated_summary(const Timestamp& as_of,
                                                     const std::string& currency = "") const;

    Result<std::vector<PositionView>> all_positions(const Timestamp& as_of,
                                                    const std::string& currency = "") const;

    /**
     * @brief Holdings ranked by unrealized return, best first
     */
    Result<std::vector<PositionView>> top_performers(const Timestamp& as_of, size_t count = 5,
                                                     const std::string& currency = "") const;

    Result<std::vector<InvestorAllocation>> investor_allocations(const Timestamp& as_of) const;

    FeeSummary fee_summary(std::optional<Timestamp> start = std::nullopt,
                           std::optional<Timestamp> end = std::nullopt) const;

    /**
     * @brief NAV series with risk metrics, drawdowns and an optional benchmark
     * @param benchmark_symbol Cached symbol to compare against, empty for none
     */
    Result<nlohmann::json> performance(const Timestamp& start, const Timestamp& end,
                                       const std::string& benchmark_symbol = "") const;

    nlohmann::json bond_report(const Timestamp& as_of) const;

    std::map<std::string, double> exchange_rates(const Timestamp& as_of,
                                                 const std::string& currency = "") const;

private:
    Result<void> check_version(std::optional<uint64_t> expected_version) const;

    uint64_t commit(const Timestamp& event_date);

    std::string resolve_currency(const std::string& currency) const {
        return currency.empty() ? context_->base_currency() : currency;
    }

    Result<double> convert(double amount, const std::string& from, const std::string& to,
                           const Timestamp& as_of) const;

    Result<std::vector<PositionView>> positions_locked(const Timestamp& as_of,
                                                       const std::string& currency) const;

    Result<Series> benchmark_series(const std::string& symbol, const Timestamp& start,
                                    const Timestamp& end) const;

    std::shared_ptr<PortfolioContext> context_;
    PerformanceAnalytics analytics_;
    mutable std::shared_mutex mutex_;
    uint64_t version_{0};
};

}  // namespace fund_ngin
