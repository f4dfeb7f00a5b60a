// include/fund_ngin/fund/cash_ledger.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/fx_converter.hpp"
#include "fund_ngin/fund/investor_registry.hpp"

namespace fund_ngin {

enum class CashFlowType {
    DEPOSIT,
    WITHDRAWAL
};

std::string cash_flow_type_to_string(CashFlowType type);

/**
 * @brief Parse "deposit"/"withdrawal" in any case
 */
Result<CashFlowType> cash_flow_type_from_string(const std::string& text);

/**
 * @brief Investor deposit or withdrawal; amount is always positive
 */
struct CashFlow {
    Timestamp date;
    std::string investor_id;
    CashFlowType type{CashFlowType::DEPOSIT};
    Money amount;
    std::string description;

    double signed_amount() const {
        return type == CashFlowType::DEPOSIT ? amount.amount : -amount.amount;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief An investor's capital in the fund as of a date, in one currency
 */
struct InvestorStake {
    std::string investor_id;
    std::string name;
    double deposits{0.0};
    double withdrawals{0.0};
    double net_contribution{0.0};
    double stake_pct{0.0};  // share of total net contribution, 0-100
    std::optional<Timestamp> first_investment;
    std::string currency;

    nlohmann::json to_json() const;
};

struct CashHistoryPoint {
    Timestamp date;
    double deposits{0.0};
    double withdrawals{0.0};
    double cash_position{0.0};
};

/**
 * @brief Append-only record of investor cash flows
 *
 * Flows are kept in their recorded currency. Cash balances are marked at the
 * query date's FX rate; contributions are converted at each flow's own date,
 * which is what the investor actually put in.
 */
class CashLedger {
public:
    explicit CashLedger(std::shared_ptr<InvestorRegistry> registry);

    /**
     * @brief Append a flow
     *
     * Rejects non-positive amounts, unknown investors and deposits from
     * inactive investors. Corrections are recorded as offsetting flows.
     */
    Result<void> add_cash_flow(const CashFlow& flow);

    /**
     * @brief Deposits minus withdrawals dated on or before as_of
     * @param fx May be null when every flow is already in base_ccy
     */
    Result<Money> cash_position(const Timestamp& as_of, const std::string& base_ccy,
                                const FxConverter* fx) const;

    Result<Money> net_contribution(const std::string& investor_id, const Timestamp& as_of,
                                   const std::string& base_ccy, const FxConverter* fx) const;

    /**
     * @brief Investor's share of total net contribution, 0-100
     * 0 when the total is not positive
     */
    Result<double> stake_pct(const std::string& investor_id, const Timestamp& as_of,
                             const std::string& base_ccy, const FxConverter* fx) const;

    /**
     * @brief One stake per investor with flows on or before as_of
     */
    Result<std::vector<InvestorStake>> stakes(const Timestamp& as_of, const std::string& base_ccy,
                                              const FxConverter* fx) const;

    /**
     * @brief Flows dated within [start, end], in date order
     */
    std::vector<CashFlow> flows(const Timestamp& start, const Timestamp& end) const;

    std::vector<CashFlow> flows_for(const std::string& investor_id) const;

    /**
     * @brief Daily cumulative deposits, withdrawals and cash over [start, end]
     */
    Result<std::vector<CashHistoryPoint>> cash_history(const Timestamp& start,
                                                       const Timestamp& end,
                                                       const std::string& base_ccy,
                                                       const FxConverter* fx) const;

    /**
     * @brief Daily cumulative contribution of one investor over [start, end]
     */
    Result<std::vector<CashHistoryPoint>> investor_history(const std::string& investor_id,
                                                           const Timestamp& start,
                                                           const Timestamp& end,
                                                           const std::string& base_ccy,
                                                           const FxConverter* fx) const;

    const std::vector<CashFlow>& all_flows() const { return flows_; }

    std::optional<Timestamp> first_flow_date() const;

    size_t size() const { return flows_.size(); }

private:
    /**
     * @brief Amount of a flow in the target currency at the given date
     */
    Result<double> to_currency(const Money& amount, const std::string& currency,
                               const Timestamp& as_of, const FxConverter* fx) const;

    Result<std::vector<CashHistoryPoint>> history(const std::string* investor_id,
                                                  const Timestamp& start, const Timestamp& end,
                                                  const std::string& base_ccy,
                                                  const FxConverter* fx) const;

    std::shared_ptr<InvestorRegistry> registry_;
    std::vector<CashFlow> flows_;  // sorted by date, stable for equal dates
};

}  // namespace fund_ngin
