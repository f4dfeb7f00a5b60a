// src/fund/cash_ledger.cpp

#include "fund_ngin/fund/cash_ledger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

std::string cash_flow_type_to_string(CashFlowType type) {
    return type == CashFlowType::DEPOSIT ? "deposit" : "withdrawal";
}

Result<CashFlowType> cash_flow_type_from_string(const std::string& text) {
    std::string lower;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (lower == "deposit") return CashFlowType::DEPOSIT;
    if (lower == "withdrawal") return CashFlowType::WITHDRAWAL;
    return make_error<CashFlowType>(ErrorCode::PARSE_ERROR,
                                    "Unknown cash flow type: '" + text + "'", "CashLedger");
}

nlohmann::json CashFlow::to_json() const {
    nlohmann::json j;
    j["date"] = core::format_date(date);
    j["investor_id"] = investor_id;
    j["type"] = cash_flow_type_to_string(type);
    j["amount"] = amount.amount;
    j["currency"] = amount.currency;
    j["description"] = description;
    return j;
}

nlohmann::json InvestorStake::to_json() const {
    nlohmann::json j;
    j["investor_id"] = investor_id;
    j["investor_name"] = name;
    j["deposits"] = deposits;
    j["withdrawals"] = withdrawals;
    j["net_contribution"] = net_contribution;
    j["stake_pct"] = stake_pct;
    j["first_investment_date"] = first_investment ? core::format_date(*first_investment) : "";
    j["currency"] = currency;
    return j;
}

CashLedger::CashLedger(std::shared_ptr<InvestorRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        registry_ = std::make_shared<InvestorRegistry>();
    }
}

Result<void> CashLedger::add_cash_flow(const CashFlow& flow) {
    if (!(flow.amount.amount > 0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Cash flow amount must be positive, got " +
                                    std::to_string(flow.amount.amount),
                                "CashLedger");
    }
    if (flow.amount.currency.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Cash flow currency is empty",
                                "CashLedger");
    }

    auto account = registry_->get(flow.investor_id);
    if (account.is_error()) {
        return forward_error<void>(account);
    }
    if (flow.type == CashFlowType::DEPOSIT && !account.value().is_active()) {
        return make_error<void>(ErrorCode::INACTIVE_INVESTOR,
                                "Deposit from inactive investor " + flow.investor_id,
                                "CashLedger");
    }

    CashFlow normalized = flow;
    normalized.date = core::to_date(flow.date);
    auto pos = std::upper_bound(flows_.begin(), flows_.end(), normalized.date,
                                [](const Timestamp& date, const CashFlow& existing) {
                                    return date < existing.date;
                                });
    flows_.insert(pos, normalized);

    DEBUG("Recorded " << cash_flow_type_to_string(flow.type) << " of " << flow.amount.amount
                      << " " << flow.amount.currency << " for " << flow.investor_id << " on "
                      << core::format_date(normalized.date));
    return Result<void>();
}

Result<double> CashLedger::to_currency(const Money& amount, const std::string& currency,
                                       const Timestamp& as_of, const FxConverter* fx) const {
    if (amount.currency == currency) {
        return amount.amount;
    }
    if (!fx) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "No FX converter for " + amount.currency + " -> " + currency,
                                  "CashLedger");
    }
    auto converted = fx->convert(amount, currency, as_of);
    if (converted.is_error()) {
        return forward_error<double>(converted);
    }
    return converted.value().amount;
}

Result<Money> CashLedger::cash_position(const Timestamp& as_of, const std::string& base_ccy,
                                        const FxConverter* fx) const {
    std::map<std::string, double> balances;
    for (const auto& flow : flows_) {
        if (flow.date > as_of) break;
        balances[flow.amount.currency] += flow.signed_amount();
    }

    double total = 0.0;
    for (const auto& [currency, balance] : balances) {
        auto converted = to_currency(Money(balance, currency), base_ccy, as_of, fx);
        if (converted.is_error()) {
            return forward_error<Money>(converted);
        }
        total += converted.value();
    }
    return Money(total, base_ccy);
}

Result<Money> CashLedger::net_contribution(const std::string& investor_id, const Timestamp& as_of,
                                           const std::string& base_ccy,
                                           const FxConverter* fx) const {
    if (!registry_->contains(investor_id)) {
        return make_error<Money>(ErrorCode::UNKNOWN_INVESTOR, "Unknown investor: " + investor_id,
                                 "CashLedger");
    }

    double total = 0.0;
    for (const auto& flow : flows_) {
        if (flow.date > as_of) break;
        if (flow.investor_id != investor_id) continue;
        auto converted = to_currency(flow.amount, base_ccy, flow.date, fx);
        if (converted.is_error()) {
            return forward_error<Money>(converted);
        }
        total += flow.type == CashFlowType::DEPOSIT ? converted.value() : -converted.value();
    }
    return Money(total, base_ccy);
}

Result<double> CashLedger::stake_pct(const std::string& investor_id, const Timestamp& as_of,
                                     const std::string& base_ccy, const FxConverter* fx) const {
    if (!registry_->contains(investor_id)) {
        return make_error<double>(ErrorCode::UNKNOWN_INVESTOR, "Unknown investor: " + investor_id,
                                  "CashLedger");
    }
    auto all = stakes(as_of, base_ccy, fx);
    if (all.is_error()) {
        return forward_error<double>(all);
    }
    for (const auto& stake : all.value()) {
        if (stake.investor_id == investor_id) {
            return stake.stake_pct;
        }
    }
    return 0.0;
}

Result<std::vector<InvestorStake>> CashLedger::stakes(const Timestamp& as_of,
                                                      const std::string& base_ccy,
                                                      const FxConverter* fx) const {
    std::map<std::string, InvestorStake> by_investor;
    for (const auto& flow : flows_) {
        if (flow.date > as_of) break;

        auto converted = to_currency(flow.amount, base_ccy, flow.date, fx);
        if (converted.is_error()) {
            return forward_error<std::vector<InvestorStake>>(converted);
        }

        auto& stake = by_investor[flow.investor_id];
        if (stake.investor_id.empty()) {
            stake.investor_id = flow.investor_id;
            auto account = registry_->get(flow.investor_id);
            stake.name = account.is_ok() ? account.value().name : flow.investor_id;
            stake.currency = base_ccy;
            stake.first_investment = flow.date;
        }
        if (flow.type == CashFlowType::DEPOSIT) {
            stake.deposits += converted.value();
        } else {
            stake.withdrawals += converted.value();
        }
    }

    double total = 0.0;
    for (auto& [id, stake] : by_investor) {
        stake.net_contribution = stake.deposits - stake.withdrawals;
        total += stake.net_contribution;
    }

    std::vector<InvestorStake> result;
    result.reserve(by_investor.size());
    for (auto& [id, stake] : by_investor) {
        stake.stake_pct = total > 0 ? stake.net_contribution / total * 100.0 : 0.0;
        result.push_back(stake);
    }
    return result;
}

std::vector<CashFlow> CashLedger::flows(const Timestamp& start, const Timestamp& end) const {
    std::vector<CashFlow> selected;
    for (const auto& flow : flows_) {
        if (flow.date < start) continue;
        if (flow.date > end) break;
        selected.push_back(flow);
    }
    return selected;
}

std::vector<CashFlow> CashLedger::flows_for(const std::string& investor_id) const {
    std::vector<CashFlow> selected;
    std::copy_if(flows_.begin(), flows_.end(), std::back_inserter(selected),
                 [&investor_id](const CashFlow& flow) { return flow.investor_id == investor_id; });
    return selected;
}

std::optional<Timestamp> CashLedger::first_flow_date() const {
    if (flows_.empty()) return std::nullopt;
    return flows_.front().date;
}

Result<std::vector<CashHistoryPoint>> CashLedger::cash_history(const Timestamp& start,
                                                               const Timestamp& end,
                                                               const std::string& base_ccy,
                                                               const FxConverter* fx) const {
    return history(nullptr, start, end, base_ccy, fx);
}

Result<std::vector<CashHistoryPoint>> CashLedger::investor_history(const std::string& investor_id,
                                                                   const Timestamp& start,
                                                                   const Timestamp& end,
                                                                   const std::string& base_ccy,
                                                                   const FxConverter* fx) const {
    if (!registry_->contains(investor_id)) {
        return make_error<std::vector<CashHistoryPoint>>(
            ErrorCode::UNKNOWN_INVESTOR, "Unknown investor: " + investor_id, "CashLedger");
    }
    return history(&investor_id, start, end, base_ccy, fx);
}

Result<std::vector<CashHistoryPoint>> CashLedger::history(const std::string* investor_id,
                                                          const Timestamp& start,
                                                          const Timestamp& end,
                                                          const std::string& base_ccy,
                                                          const FxConverter* fx) const {
    if (end < start) {
        return make_error<std::vector<CashHistoryPoint>>(
            ErrorCode::INVALID_ARGUMENT, "History end precedes start", "CashLedger");
    }

    // Per-currency running totals, so each day costs one FX lookup per currency
    struct Totals {
        double deposits{0.0};
        double withdrawals{0.0};
    };
    std::map<std::string, Totals> totals;
    double contributed_deposits = 0.0;
    double contributed_withdrawals = 0.0;

    std::vector<CashHistoryPoint> points;
    size_t next = 0;
    const Timestamp last = core::to_date(end);
    for (Timestamp day = core::to_date(start); day <= last; day = core::add_days(day, 1)) {
        while (next < flows_.size() && flows_[next].date <= day) {
            const CashFlow& flow = flows_[next++];
            if (investor_id && flow.investor_id != *investor_id) continue;

            if (investor_id) {
                auto converted = to_currency(flow.amount, base_ccy, flow.date, fx);
                if (converted.is_error()) {
                    return forward_error<std::vector<CashHistoryPoint>>(converted);
                }
                (flow.type == CashFlowType::DEPOSIT ? contributed_deposits
                                                    : contributed_withdrawals) += converted.value();
            } else {
                auto& t = totals[flow.amount.currency];
                (flow.type == CashFlowType::DEPOSIT ? t.deposits : t.withdrawals) +=
                    flow.amount.amount;
            }
        }

        CashHistoryPoint point;
        point.date = day;
        if (investor_id) {
            point.deposits = contributed_deposits;
            point.withdrawals = contributed_withdrawals;
        } else {
            for (const auto& [currency, t] : totals) {
                auto rate = to_currency(Money(1.0, currency), base_ccy, day, fx);
                if (rate.is_error()) {
                    return forward_error<std::vector<CashHistoryPoint>>(rate);
                }
                point.deposits += t.deposits * rate.value();
                point.withdrawals += t.withdrawals * rate.value();
            }
        }
        point.cash_position = point.deposits - point.withdrawals;
        points.push_back(point);
    }
    return points;
}

}  // namespace fund_ngin
