// src/fund/nav_calculator.cpp

#include "fund_ngin/fund/nav_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

namespace {

double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

}  // namespace

nlohmann::json NavSnapshot::to_json() const {
    nlohmann::json j;
    j["date"] = core::format_date(date);
    j["equity_value"] = equity_value;
    j["crypto_value"] = crypto_value;
    j["bond_value"] = bond_value;
    j["portfolio_value"] = portfolio_value;
    j["cash_position"] = cash_position;
    j["outstanding_fees"] = outstanding_fees;
    j["nav"] = nav;
    j["currency"] = currency;
    j["stale_symbols"] = stale_symbols;
    j["approximated_bonds"] = approximated_bonds;
    return j;
}

nlohmann::json InvestorAllocation::to_json() const {
    nlohmann::json j;
    j["investor_id"] = investor_id;
    j["investor_name"] = name;
    j["stake_pct"] = stake_pct;
    j["net_contribution"] = net_contribution;
    j["investor_nav"] = investor_nav;
    j["unrealized_gain"] = unrealized_gain;
    return j;
}

NavCalculator::NavCalculator(NavInputs inputs) : inputs_(std::move(inputs)) {}

Result<double> NavCalculator::to_base(const Money& amount, const Timestamp& date) const {
    if (amount.currency.empty() || amount.currency == inputs_.base_currency) {
        return amount.amount;
    }
    if (!inputs_.fx) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "No FX converter for " + amount.currency + " -> " +
                                      inputs_.base_currency,
                                  "NavCalculator");
    }
    auto converted = inputs_.fx->convert(amount, inputs_.base_currency, date);
    if (converted.is_error()) {
        return forward_error<double>(converted);
    }
    return converted.value().amount;
}

Result<double> NavCalculator::value_ledger(const PositionLedger& ledger, const Timestamp& date,
                                           NavSnapshot& snapshot) const {
    if (!inputs_.cache) {
        return make_error<double>(ErrorCode::NOT_INITIALIZED,
                                  "Price cache required to value " +
                                      asset_class_to_string(ledger.asset_class()) + " positions",
                                  "NavCalculator");
    }

    double total = 0.0;
    for (const auto& valuation : ledger.value_open_positions(date, *inputs_.cache)) {
        auto converted = to_base(valuation.market_value, date);
        if (converted.is_error()) {
            return forward_error<double>(converted);
        }
        total += converted.value();
        if (valuation.stale()) {
            snapshot.stale_symbols.push_back(valuation.position.symbol);
        }
    }
    return total;
}

Result<NavSnapshot> NavCalculator::compute(const Timestamp& date) const {
    NavSnapshot snapshot;
    snapshot.date = date;
    snapshot.currency = inputs_.base_currency;

    if (inputs_.equities && inputs_.equities->transaction_count() > 0) {
        auto equity = value_ledger(*inputs_.equities, date, snapshot);
        if (equity.is_error()) {
            return forward_error<NavSnapshot>(equity);
        }
        snapshot.equity_value = equity.value();
    }
    if (inputs_.crypto && inputs_.crypto->transaction_count() > 0) {
        auto crypto = value_ledger(*inputs_.crypto, date, snapshot);
        if (crypto.is_error()) {
            return forward_error<NavSnapshot>(crypto);
        }
        snapshot.crypto_value = crypto.value();
    }

    if (inputs_.bonds && !inputs_.bonds->empty()) {
        if (!inputs_.bond_engine) {
            return make_error<NavSnapshot>(ErrorCode::NOT_INITIALIZED,
                                           "Bond engine required to value bonds",
                                           "NavCalculator");
        }
        std::vector<BondPosition> held;
        std::copy_if(inputs_.bonds->begin(), inputs_.bonds->end(), std::back_inserter(held),
                     [&date](const BondPosition& bond) { return bond.issue_date <= date; });
        for (const auto& valuation : inputs_.bond_engine->value_all(held, date)) {
            auto converted = to_base(valuation.accrued_value, date);
            if (converted.is_error()) {
                return forward_error<NavSnapshot>(converted);
            }
            snapshot.bond_value += converted.value();
            if (valuation.approximated) {
                ++snapshot.approximated_bonds;
            }
        }
    }

    if (inputs_.cash) {
        auto cash = inputs_.cash->cash_position(date, inputs_.base_currency, inputs_.fx.get());
        if (cash.is_error()) {
            return forward_error<NavSnapshot>(cash);
        }
        snapshot.cash_position = cash.value().amount;
    }

    if (inputs_.fees) {
        auto fees = to_base(Money(inputs_.fees->outstanding_fees(date),
                                  inputs_.fees->config().currency),
                            date);
        if (fees.is_error()) {
            return forward_error<NavSnapshot>(fees);
        }
        snapshot.outstanding_fees = fees.value();
    }

    snapshot.portfolio_value = snapshot.equity_value + snapshot.crypto_value + snapshot.bond_value;
    snapshot.nav = snapshot.portfolio_value + snapshot.cash_position - snapshot.outstanding_fees;
    std::sort(snapshot.stale_symbols.begin(), snapshot.stale_symbols.end());
    return snapshot;
}

Result<NavSnapshot> NavCalculator::nav(const Timestamp& as_of) const {
    const Timestamp date = core::to_date(as_of);
    {
        std::lock_guard<std::mutex> lock(memo_mutex_);
        auto it = memo_.find(date);
        if (it != memo_.end()) {
            return it->second;
        }
    }

    auto computed = compute(date);
    if (computed.is_error()) {
        return forward_error<NavSnapshot>(computed);
    }

    std::lock_guard<std::mutex> lock(memo_mutex_);
    memo_[date] = computed.value();
    return computed.value();
}

Result<std::vector<InvestorAllocation>> NavCalculator::allocate_to_investors(
    const NavSnapshot& snapshot) const {
    std::vector<InvestorAllocation> allocations;
    if (!inputs_.cash) {
        return allocations;
    }

    auto stakes = inputs_.cash->stakes(snapshot.date, inputs_.base_currency, inputs_.fx.get());
    if (stakes.is_error()) {
        return forward_error<std::vector<InvestorAllocation>>(stakes);
    }

    double total_stake = 0.0;
    for (const auto& stake : stakes.value()) {
        total_stake += stake.stake_pct;
    }
    if (total_stake <= 0 && std::abs(snapshot.nav) >= 0.01) {
        return make_error<std::vector<InvestorAllocation>>(
            ErrorCode::PRECONDITION_FAILED,
            "No positive net contribution to allocate a NAV of " + std::to_string(snapshot.nav),
            "NavCalculator");
    }

    double allocated = 0.0;
    size_t largest = 0;
    for (const auto& stake : stakes.value()) {
        InvestorAllocation allocation;
        allocation.investor_id = stake.investor_id;
        allocation.name = stake.name;
        allocation.stake_pct = stake.stake_pct;
        allocation.net_contribution = stake.net_contribution;
        allocation.investor_nav = round_cents(snapshot.nav * stake.stake_pct / 100.0);
        allocated += allocation.investor_nav;
        if (allocations.empty() || stake.stake_pct > allocations[largest].stake_pct) {
            largest = allocations.size();
        }
        allocations.push_back(allocation);
    }

    if (!allocations.empty()) {
        allocations[largest].investor_nav += snapshot.nav - allocated;
    }
    for (auto& allocation : allocations) {
        allocation.unrealized_gain = allocation.investor_nav - allocation.net_contribution;
    }
    return allocations;
}

Result<Series> NavCalculator::nav_series(const Timestamp& start, const Timestamp& end) const {
    if (end < start) {
        return make_error<Series>(ErrorCode::INVALID_ARGUMENT, "Series end precedes start",
                                  "NavCalculator");
    }

    Series series;
    const Timestamp last = core::to_date(end);
    for (Timestamp day = core::to_date(start); day <= last; day = core::add_days(day, 1)) {
        auto snapshot = nav(day);
        if (snapshot.is_error()) {
            return forward_error<Series>(snapshot);
        }
        series.emplace_back(day, snapshot.value().nav);
    }
    return series;
}

void NavCalculator::invalidate_from(const Timestamp& date) {
    std::lock_guard<std::mutex> lock(memo_mutex_);
    memo_.erase(memo_.lower_bound(core::to_date(date)), memo_.end());
}

void NavCalculator::invalidate_all() {
    std::lock_guard<std::mutex> lock(memo_mutex_);
    memo_.clear();
}

size_t NavCalculator::cached_snapshots() const {
    std::lock_guard<std::mutex> lock(memo_mutex_);
    return memo_.size();
}

}  // namespace fund_ngin
