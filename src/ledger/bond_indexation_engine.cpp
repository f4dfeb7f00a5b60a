// src/ledger/bond_indexation_engine.cpp

#include "fund_ngin/ledger/bond_indexation_engine.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

double parse_percent(const std::string& text) {
    std::string last;
    std::string current;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == ',') {
            current += (c == ',') ? '.' : c;
        } else if (!current.empty()) {
            last = current;
            current.clear();
        }
    }
    if (!current.empty()) {
        last = current;
    }
    // Trailing separators belong to the sentence, not the number
    while (!last.empty() && last.back() == '.') {
        last.pop_back();
    }
    if (last.empty()) {
        return 0.0;
    }
    try {
        return std::stod(last);
    } catch (const std::exception&) {
        return 0.0;
    }
}

nlohmann::json BondValuation::to_json() const {
    nlohmann::json j;
    j["issue_id"] = bond.issue_id;
    j["title"] = bond.title;
    j["issuer"] = bond.issuer;
    j["type"] = bond.bond_type;
    j["indexer"] = indexer_to_string(bond.indexer);
    j["rate"] = bond.percent_indexed;
    j["quantity"] = bond.quantity;
    j["currency"] = accrued_value.currency;
    j["invested"] = invested.amount;
    j["current_value"] = accrued_value.amount;
    j["pnl"] = pnl;
    j["pnl_pct"] = pnl_pct;
    j["issue_date"] = core::format_date(bond.issue_date);
    j["maturity_date"] = bond.maturity_date ? core::format_date(*bond.maturity_date) : "";
    j["matured"] = matured;
    j["days_to_maturity"] = days_to_maturity ? nlohmann::json(*days_to_maturity) : nlohmann::json(nullptr);
    j["approximated"] = approximated;
    j["approximated_months"] = approximated_months;
    return j;
}

nlohmann::json BondPortfolioSummary::to_json() const {
    nlohmann::json j;
    j["total_invested"] = total_invested;
    j["total_current_value"] = total_current_value;
    j["total_pnl"] = total_pnl;
    j["total_return_pct"] = total_return_pct;
    j["num_bonds"] = num_bonds;
    j["num_active_bonds"] = num_active_bonds;
    j["bonds_maturing_30days"] = maturing_30_days;
    j["bonds_maturing_90days"] = maturing_90_days;
    j["approximated_bonds"] = approximated_bonds;
    return j;
}

BondIndexationEngine::BondIndexationEngine(std::shared_ptr<IndexerGateway> gateway,
                                           BondConfig config)
    : gateway_(std::move(gateway)), config_(std::move(config)) {}

Result<void> BondIndexationEngine::refresh_series(const Timestamp& start, const Timestamp& end) {
    if (!gateway_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "No indexer gateway configured",
                                "BondIndexationEngine");
    }

    std::string failures;
    for (Indexer indexer : {Indexer::IPCA, Indexer::CDI, Indexer::SELIC}) {
        auto loaded = gateway_->fetch_series(indexer, start, end);
        if (loaded.is_error()) {
            WARN("Could not load " << indexer_to_string(indexer) << " series: "
                                   << loaded.error()->what() << "; valuations will approximate");
            failures += (failures.empty() ? "" : "; ") + indexer_to_string(indexer) + ": " +
                        loaded.error()->what();
            continue;
        }
        set_series(loaded.value());
    }

    if (!failures.empty()) {
        return make_error<void>(ErrorCode::MARKET_DATA_ERROR, failures, "BondIndexationEngine");
    }
    return Result<void>();
}

void BondIndexationEngine::set_series(IndexerSeries series) {
    auto& existing = series_[series.indexer];
    existing.indexer = series.indexer;
    for (const auto& [month, pct] : series.monthly_pct) {
        existing.monthly_pct[month] = pct;
    }
}

const IndexerSeries* BondIndexationEngine::series(Indexer indexer) const {
    auto it = series_.find(indexer);
    return it == series_.end() ? nullptr : &it->second;
}

BondIndexationEngine::Accrual BondIndexationEngine::compound_months(Indexer indexer,
                                                                   const Timestamp& issue,
                                                                   const Timestamp& end,
                                                                   double share,
                                                                   double fallback_annual) const {
    Accrual accrual;
    const IndexerSeries* data = series(indexer);
    const double fallback_pct = (std::pow(1.0 + fallback_annual, 1.0 / 12.0) - 1.0) * 100.0;

    auto [year, month] = core::year_month(issue);
    const auto [end_year, end_month] = core::year_month(end);

    while (true) {
        ++month;
        if (month > 12) {
            month = 1;
            ++year;
        }
        if (year > end_year || (year == end_year && month > end_month)) {
            break;
        }

        std::optional<double> pct = data ? data->rate_for(year, month) : std::nullopt;
        if (!pct) {
            pct = fallback_pct;
            ++accrual.approximated_months;
        }
        accrual.factor *= 1.0 + share * (*pct / 100.0);
    }
    return accrual;
}

Result<BondValuation> BondIndexationEngine::value(const BondPosition& bond,
                                                  const Timestamp& as_of) const {
    const double invested = bond.invested();
    if (invested < 0) {
        return make_error<BondValuation>(ErrorCode::INVALID_DATA,
                                         "Negative principal for " + bond.title,
                                         "BondIndexationEngine");
    }

    BondValuation valuation;
    valuation.bond = bond;
    valuation.valuation_date = core::to_date(as_of);
    valuation.invested = Money(invested, bond.currency);

    Timestamp accrual_end = valuation.valuation_date;
    if (bond.maturity_date) {
        valuation.matured = valuation.valuation_date >= core::to_date(*bond.maturity_date);
        if (valuation.matured) {
            accrual_end = core::to_date(*bond.maturity_date);
        } else {
            valuation.days_to_maturity =
                core::days_between(valuation.valuation_date, *bond.maturity_date);
        }
    }

    double accrued = invested;
    const Timestamp issue = core::to_date(bond.issue_date);
    if (accrual_end > issue) {
        const double years = core::days_between(issue, accrual_end) / config_.days_per_year;
        const double rate = bond.percent_indexed / 100.0;

        switch (bond.indexer) {
            case Indexer::IPCA: {
                Accrual ipca =
                    compound_months(Indexer::IPCA, issue, accrual_end, 1.0,
                                    config_.ipca_fallback_annual);
                valuation.approximated_months = ipca.approximated_months;
                accrued = invested * ipca.factor * std::pow(1.0 + rate, years);
                break;
            }
            case Indexer::CDI:
            case Indexer::SELIC: {
                double share = bond.percent_indexed > 0 ? rate : 1.0;
                double fallback = bond.indexer == Indexer::CDI ? config_.cdi_fallback_annual
                                                               : config_.selic_fallback_annual;
                Accrual floating = compound_months(bond.indexer, issue, accrual_end, share, fallback);
                valuation.approximated_months = floating.approximated_months;
                accrued = invested * floating.factor;
                break;
            }
            case Indexer::PREFIXADO:
                accrued = invested * std::pow(1.0 + rate, years);
                break;
            default:
                WARN("Unknown indexer for " << bond.title << ", carrying at invested value");
                valuation.approximated = true;
                break;
        }
    }

    if (valuation.approximated_months > 0) {
        valuation.approximated = true;
    }
    valuation.accrued_value = Money(accrued, bond.currency);
    valuation.pnl = accrued - invested;
    valuation.pnl_pct = invested > 0 ? valuation.pnl / invested * 100.0 : 0.0;
    return valuation;
}

std::vector<BondValuation> BondIndexationEngine::value_all(const std::vector<BondPosition>& bonds,
                                                           const Timestamp& as_of) const {
    std::vector<BondValuation> valuations;
    for (const auto& bond : bonds) {
        if (bond.quantity == 0) {
            continue;
        }
        auto valued = value(bond, as_of);
        if (valued.is_error()) {
            ERROR("Skipping bond " << bond.title << ": " << valued.error()->what());
            continue;
        }
        valuations.push_back(valued.value());
    }
    std::sort(valuations.begin(), valuations.end(),
              [](const BondValuation& a, const BondValuation& b) {
                  return a.accrued_value.amount > b.accrued_value.amount;
              });
    return valuations;
}

BondPortfolioSummary BondIndexationEngine::summary(const std::vector<BondPosition>& bonds,
                                                   const Timestamp& as_of) const {
    BondPortfolioSummary summary;
    for (const auto& valuation : value_all(bonds, as_of)) {
        ++summary.num_bonds;
        summary.total_invested += valuation.invested.amount;
        summary.total_current_value += valuation.accrued_value.amount;
        summary.total_pnl += valuation.pnl;
        if (valuation.approximated) ++summary.approximated_bonds;
        if (valuation.matured) continue;

        ++summary.num_active_bonds;
        if (valuation.days_to_maturity) {
            if (*valuation.days_to_maturity <= 30) ++summary.maturing_30_days;
            if (*valuation.days_to_maturity <= 90) ++summary.maturing_90_days;
        }
    }
    summary.total_return_pct =
        summary.total_invested > 0 ? summary.total_pnl / summary.total_invested * 100.0 : 0.0;
    return summary;
}

namespace {

template <typename KeyFn>
std::vector<AllocationEntry> group_allocation(const std::vector<BondValuation>& valuations,
                                              KeyFn key_of) {
    std::map<std::string, AllocationEntry> groups;
    double total = 0.0;
    for (const auto& valuation : valuations) {
        auto& entry = groups[key_of(valuation)];
        entry.key = key_of(valuation);
        entry.value += valuation.accrued_value.amount;
        entry.pnl += valuation.pnl;
        total += valuation.accrued_value.amount;
    }

    std::vector<AllocationEntry> entries;
    for (auto& [key, entry] : groups) {
        entry.allocation_pct = total > 0 ? entry.value / total * 100.0 : 0.0;
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const AllocationEntry& a, const AllocationEntry& b) { return a.value > b.value; });
    return entries;
}

}  // namespace

std::vector<AllocationEntry> BondIndexationEngine::allocation_by_indexer(
    const std::vector<BondPosition>& bonds, const Timestamp& as_of) const {
    return group_allocation(value_all(bonds, as_of), [](const BondValuation& v) {
        return indexer_to_string(v.bond.indexer);
    });
}

std::vector<AllocationEntry> BondIndexationEngine::allocation_by_type(
    const std::vector<BondPosition>& bonds, const Timestamp& as_of) const {
    return group_allocation(value_all(bonds, as_of), [](const BondValuation& v) {
        return v.bond.bond_type.empty() ? std::string("Unknown") : v.bond.bond_type;
    });
}

std::vector<MaturityBucket> BondIndexationEngine::maturity_schedule(
    const std::vector<BondPosition>& bonds, const Timestamp& as_of) const {
    std::map<std::pair<int, int>, MaturityBucket> buckets;
    for (const auto& valuation : value_all(bonds, as_of)) {
        if (valuation.matured || !valuation.bond.maturity_date) {
            continue;
        }
        auto [year, month] = core::year_month(*valuation.bond.maturity_date);
        auto& bucket = buckets[{year, month}];
        bucket.year = year;
        bucket.month = month;
        bucket.value_due += valuation.accrued_value.amount;
        ++bucket.count;
    }

    std::vector<MaturityBucket> schedule;
    schedule.reserve(buckets.size());
    for (const auto& [key, bucket] : buckets) {
        schedule.push_back(bucket);
    }
    return schedule;
}

}  // namespace fund_ngin
