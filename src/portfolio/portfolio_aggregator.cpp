// src/portfolio/portfolio_aggregator.cpp

#include "fund_ngin/portfolio/portfolio_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

namespace {

Result<void> validate_bond(const BondPosition& bond) {
    if (bond.title.empty() && bond.issue_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Bond has neither title nor issue id",
                                "PortfolioAggregator");
    }
    if (bond.principal < 0 || bond.quantity < 0) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Bond " + bond.title + " has a negative amount",
                                "PortfolioAggregator");
    }
    if (bond.maturity_date && *bond.maturity_date < bond.issue_date) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Bond " + bond.title + " matures before its issue date",
                                "PortfolioAggregator");
    }
    if (bond.currency.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Bond " + bond.title + " has no currency",
                                "PortfolioAggregator");
    }
    return Result<void>();
}

// Line 0 marks a problem with the file as a whole
std::string source_error(const std::string& path, size_t line, const std::string& message) {
    if (line == 0) {
        return path + ": " + message;
    }
    return path + ":" + std::to_string(line) + ": " + message;
}

}  // namespace

nlohmann::json PositionView::to_json() const {
    nlohmann::json j;
    j["asset_class"] = asset_class_to_string(asset_class);
    j["symbol"] = symbol;
    j["name"] = name;
    j["quantity"] = quantity;
    j["avg_cost"] = avg_cost;
    j["current_price"] = current_price;
    j["market_value"] = market_value;
    j["cost_basis"] = cost_basis;
    j["unrealized_pnl"] = unrealized_pnl;
    j["unrealized_pnl_pct"] = unrealized_pnl_pct;
    j["realized_pnl"] = realized_pnl;
    j["native_currency"] = native_currency;
    j["currency"] = currency;
    j["stale"] = stale;
    return j;
}

nlohmann::json ConsolidatedSummary::to_json() const {
    nlohmann::json j;
    j["as_of"] = core::format_date(as_of);
    j["currency"] = currency;
    j["total_value"] = total_value;
    j["total_invested"] = total_invested;
    j["total_pnl"] = total_pnl;
    j["total_return_pct"] = total_return_pct;
    j["cash_position"] = cash_position;
    j["outstanding_fees"] = outstanding_fees;
    j["nav"] = nav;

    nlohmann::json classes = nlohmann::json::object();
    for (const auto& entry : allocation) {
        classes[asset_class_to_string(entry.asset_class)] = {
            {"value", entry.value},
            {"cost_basis", entry.cost_basis},
            {"pnl", entry.pnl},
            {"allocation_pct", entry.allocation_pct},
            {"positions", entry.positions}};
    }
    j["asset_allocation"] = classes;
    j["exchange_rates"] = exchange_rates;
    j["stale_symbols"] = stale_symbols;
    j["version"] = version;
    return j;
}

nlohmann::json IngestSummary::to_json() const {
    nlohmann::json j;
    j["transactions"] = transactions;
    j["bonds"] = bonds;
    j["cash_flows"] = cash_flows;
    j["fee_records"] = fee_records;
    j["investors_created"] = investors_created;
    j["errors"] = errors;
    return j;
}

PortfolioAggregator::PortfolioAggregator(std::shared_ptr<PortfolioContext> context,
                                         AnalyticsConfig analytics_config)
    : context_(std::move(context)), analytics_(std::move(analytics_config)) {
    if (!context_) {
        throw std::invalid_argument("PortfolioAggregator requires a portfolio context");
    }
}

uint64_t PortfolioAggregator::version() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return version_;
}

Result<void> PortfolioAggregator::check_version(std::optional<uint64_t> expected_version) const {
    if (expected_version && *expected_version != version_) {
        return make_error<void>(ErrorCode::STALE_VERSION,
                                "Expected version " + std::to_string(*expected_version) +
                                    ", current is " + std::to_string(version_),
                                "PortfolioAggregator");
    }
    return Result<void>();
}

uint64_t PortfolioAggregator::commit(const Timestamp& event_date) {
    context_->nav_calculator()->invalidate_from(event_date);
    return ++version_;
}

Result<uint64_t> PortfolioAggregator::record_transaction(const Transaction& txn,
                                                         std::optional<uint64_t> expected_version) {
    return record_transactions({txn}, expected_version);
}

Result<uint64_t> PortfolioAggregator::record_transactions(
    const std::vector<Transaction>& transactions, std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<uint64_t>(version_check);
    }
    if (transactions.empty()) {
        return version_;
    }

    std::vector<std::shared_ptr<PositionLedger>> targets;
    targets.reserve(transactions.size());
    Timestamp earliest = transactions.front().date;
    for (const auto& txn : transactions) {
        auto ledger = context_->ledger_for(txn.asset_class);
        if (ledger.is_error()) {
            return make_error<uint64_t>(ErrorCode::INVALID_TRANSACTION, ledger.error()->what(),
                                        "PortfolioAggregator");
        }
        targets.push_back(ledger.value());
        earliest = std::min(earliest, txn.date);
    }

    // A rejected transaction leaves its ledger unchanged
    if (transactions.size() == 1) {
        auto applied = targets.front()->apply(transactions.front());
        if (applied.is_error()) {
            return forward_error<uint64_t>(applied);
        }
        DEBUG("Recorded " << transactions.front().symbol << " on "
                          << core::format_date(earliest));
        return commit(earliest);
    }

    // Batches stage on copies of the ledgers they touch
    std::map<PositionLedger*, PositionLedger> staged;
    for (size_t i = 0; i < transactions.size(); ++i) {
        auto it = staged.find(targets[i].get());
        if (it == staged.end()) {
            it = staged.emplace(targets[i].get(), *targets[i]).first;
        }
        auto applied = it->second.apply(transactions[i]);
        if (applied.is_error()) {
            return forward_error<uint64_t>(applied);
        }
    }
    for (auto& [live, copy] : staged) {
        *live = std::move(copy);
    }

    DEBUG("Recorded " << transactions.size() << " transaction(s) from "
                      << core::format_date(earliest));
    return commit(earliest);
}

Result<uint64_t> PortfolioAggregator::add_bond(const BondPosition& bond,
                                               std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<uint64_t>(version_check);
    }
    auto valid = validate_bond(bond);
    if (valid.is_error()) {
        return forward_error<uint64_t>(valid);
    }
    context_->bonds()->push_back(bond);
    INFO("Added bond " << bond.title << " (" << indexer_to_string(bond.indexer) << ")");
    return commit(bond.issue_date);
}

Result<uint64_t> PortfolioAggregator::register_investor(const InvestorAccount& account,
                                                        std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<uint64_t>(version_check);
    }
    auto registered = context_->investors()->register_investor(account);
    if (registered.is_error()) {
        return forward_error<uint64_t>(registered);
    }
    return ++version_;
}

Result<uint64_t> PortfolioAggregator::set_investor_status(const std::string& investor_id,
                                                          InvestorStatus status,
                                                          std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<uint64_t>(version_check);
    }
    auto updated = context_->investors()->set_status(investor_id, status);
    if (updated.is_error()) {
        return forward_error<uint64_t>(updated);
    }
    return ++version_;
}

Result<uint64_t> PortfolioAggregator::record_cash_flow(const CashFlow& flow,
                                                       std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<uint64_t>(version_check);
    }
    auto added = context_->cash()->add_cash_flow(flow);
    if (added.is_error()) {
        return forward_error<uint64_t>(added);
    }
    return commit(flow.date);
}

Result<uint64_t> PortfolioAggregator::schedule_fee_period(const Timestamp& period_start,
                                                          const Timestamp& period_end,
                                                          std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<uint64_t>(version_check);
    }
    auto scheduled = context_->fees()->schedule_period(period_start, period_end);
    if (scheduled.is_error()) {
        return forward_error<uint64_t>(scheduled);
    }
    return ++version_;
}

Result<FeePeriodResult> PortfolioAggregator::calculate_fees(
    const Timestamp& period_start, const Timestamp& period_end,
    std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<FeePeriodResult>(version_check);
    }
    auto result = context_->fees()->calculate(period_start, period_end);
    if (result.is_error()) {
        return forward_error<FeePeriodResult>(result);
    }
    // Fees become outstanding at period end, so later NAVs change
    commit(period_end);
    return result.value();
}

Result<uint64_t> PortfolioAggregator::mark_fee_paid(int64_t record_id,
                                                    const Timestamp& payment_date,
                                                    std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto version_check = check_version(expected_version);
    if (version_check.is_error()) {
        return forward_error<uint64_t>(version_check);
    }
    auto paid = context_->fees()->mark_paid(record_id, payment_date);
    if (paid.is_error()) {
        return forward_error<uint64_t>(paid);
    }
    return commit(payment_date);
}

Result<IngestSummary> PortfolioAggregator::ingest(const IngestSources& sources) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    IngestSummary summary;

    if (!sources.cash_flows.empty()) {
        auto report = load_cash_flows(sources.cash_flows);
        if (report.is_error()) {
            return forward_error<IngestSummary>(report);
        }
        for (const auto& error : report.value().errors) {
            summary.errors.push_back(source_error(sources.cash_flows, error.line, error.message));
        }
        const auto& flows = report.value();
        for (size_t i = 0; i < flows.records.size(); ++i) {
            const auto& record = flows.records[i];
            if (context_->investors()->ensure_investor(record.flow.investor_id,
                                                       record.investor_name)) {
                ++summary.investors_created;
            }
            auto added = context_->cash()->add_cash_flow(record.flow);
            if (added.is_error()) {
                summary.errors.push_back(source_error(sources.cash_flows, flows.record_lines[i],
                                                      added.error()->what()));
                continue;
            }
            ++summary.cash_flows;
        }
    }

    const std::pair<const std::string*, AssetClass> transaction_sources[] = {
        {&sources.equity_transactions, AssetClass::EQUITY},
        {&sources.crypto_transactions, AssetClass::CRYPTO}};
    for (const auto& [path, asset_class] : transaction_sources) {
        if (path->empty()) {
            continue;
        }
        auto report = load_transactions(*path, asset_class);
        if (report.is_error()) {
            return forward_error<IngestSummary>(report);
        }
        for (const auto& error : report.value().errors) {
            summary.errors.push_back(source_error(*path, error.line, error.message));
        }

        // Apply in date order, keeping each row's source line
        const auto& parsed = report.value();
        std::vector<size_t> order(parsed.records.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&parsed](size_t a, size_t b) {
            return parsed.records[a].date < parsed.records[b].date;
        });
        auto ledger = context_->ledger_for(asset_class);
        if (ledger.is_error()) {
            return forward_error<IngestSummary>(ledger);
        }
        for (size_t index : order) {
            const Transaction& txn = parsed.records[index];
            auto applied = ledger.value()->apply(txn);
            if (applied.is_error()) {
                summary.errors.push_back(source_error(
                    *path, parsed.record_lines[index],
                    txn.symbol + " " + core::format_date(txn.date) + ": " +
                        applied.error()->what()));
                continue;
            }
            ++summary.transactions;
        }
    }

    if (!sources.bonds.empty()) {
        auto report = load_bonds(sources.bonds);
        if (report.is_error()) {
            return forward_error<IngestSummary>(report);
        }
        for (const auto& error : report.value().errors) {
            summary.errors.push_back(source_error(sources.bonds, error.line, error.message));
        }
        const auto& bonds = report.value();
        for (size_t i = 0; i < bonds.records.size(); ++i) {
            const auto& bond = bonds.records[i];
            auto valid = validate_bond(bond);
            if (valid.is_error()) {
                summary.errors.push_back(
                    source_error(sources.bonds, bonds.record_lines[i], valid.error()->what()));
                continue;
            }
            context_->bonds()->push_back(bond);
            ++summary.bonds;
        }
    }

    if (!sources.fee_records.empty()) {
        auto report = load_fee_records(sources.fee_records, context_->fees()->config().currency);
        if (report.is_error()) {
            return forward_error<IngestSummary>(report);
        }
        for (const auto& error : report.value().errors) {
            summary.errors.push_back(source_error(sources.fee_records, error.line, error.message));
        }

        std::vector<FeeRecord> merged = context_->fees()->records();
        std::optional<double> hwm = context_->fees()->high_water_mark();
        for (const auto& record : report.value().records) {
            merged.push_back(record);
            if (hwm && record.state != FeeState::PENDING) {
                hwm = std::max(*hwm, record.nav_end);
            }
        }
        auto restored = context_->fees()->restore(std::move(merged), hwm);
        if (restored.is_error()) {
            summary.errors.push_back(
                source_error(sources.fee_records, 0, restored.error()->what()));
        } else {
            summary.fee_records = report.value().records.size();
        }
    }

    context_->nav_calculator()->invalidate_all();
    ++version_;

    INFO("Ingested " << summary.transactions << " transactions, " << summary.bonds << " bonds, "
                     << summary.cash_flows << " cash flows, " << summary.fee_records
                     << " fee records into '" << context_->name() << "' ("
                     << summary.errors.size() << " rejected)");
    return summary;
}

std::vector<FetchReport> PortfolioAggregator::refresh_prices(
    const Timestamp& start, const Timestamp& end, const std::vector<std::string>& extra_symbols,
    const std::atomic<bool>* cancel_flag) {
    std::vector<std::string> symbols;
    bool has_bonds = false;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        symbols = context_->market_symbols();
        has_bonds = !context_->bonds()->empty();
    }
    for (const auto& extra : extra_symbols) {
        if (std::find(symbols.begin(), symbols.end(), extra) == symbols.end()) {
            symbols.push_back(extra);
        }
    }

    // Network calls run without holding the portfolio lock
    std::vector<FetchReport> reports;
    if (context_->cache() && !symbols.empty()) {
        reports = context_->cache()->bulk_fetch(symbols, start, end, 0, cancel_flag);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (has_bonds) {
        auto refreshed = context_->bond_engine()->refresh_series(start, end);
        if (refreshed.is_error()) {
            WARN("Indexer refresh incomplete, bonds use approximations: "
                 << refreshed.error()->what());
        }
    }
    context_->nav_calculator()->invalidate_all();

    size_t incomplete = std::count_if(reports.begin(), reports.end(),
                                      [](const FetchReport& report) { return !report.complete(); });
    INFO("Refreshed " << reports.size() << " symbol(s) for '" << context_->name() << "', "
                      << incomplete << " incomplete");
    return reports;
}

Result<NavSnapshot> PortfolioAggregator::nav(const Timestamp& as_of) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return context_->nav_calculator()->nav(core::to_date(as_of));
}

Result<double> PortfolioAggregator::convert(double amount, const std::string& from,
                                            const std::string& to, const Timestamp& as_of) const {
    if (from.empty() || from == to) {
        return amount;
    }
    auto converted = context_->fx()->convert(Money(amount, from), to, as_of);
    if (converted.is_error()) {
        return forward_error<double>(converted);
    }
    return converted.value().amount;
}

Result<std::vector<PositionView>> PortfolioAggregator::positions_locked(
    const Timestamp& as_of, const std::string& currency) const {
    std::vector<PositionView> views;
    if (!context_->cache()) {
        return make_error<std::vector<PositionView>>(ErrorCode::NOT_INITIALIZED,
                                                     "No price cache to value positions",
                                                     "PortfolioAggregator");
    }

    for (const auto* ledger : {context_->equities().get(), context_->crypto().get()}) {
        for (const auto& valuation : ledger->value_open_positions(as_of, *context_->cache())) {
            const std::string& native = valuation.position.currency;
            auto rate = convert(1.0, native, currency, as_of);
            if (rate.is_error()) {
                return forward_error<std::vector<PositionView>>(rate);
            }
            const double fx = rate.value();

            PositionView view;
            view.asset_class = ledger->asset_class();
            view.symbol = valuation.position.symbol;
            view.name = valuation.position.symbol;
            view.quantity = valuation.position.quantity;
            view.avg_cost = valuation.position.avg_cost * fx;
            view.current_price = valuation.quote.price * fx;
            view.market_value = valuation.market_value.amount * fx;
            view.cost_basis = valuation.cost_basis * fx;
            view.unrealized_pnl = valuation.unrealized_pnl * fx;
            view.unrealized_pnl_pct = valuation.unrealized_pnl_pct;
            view.realized_pnl = valuation.position.realized_pnl * fx;
            view.native_currency = native;
            view.currency = currency;
            view.stale = valuation.stale();
            views.push_back(view);
        }
    }

    std::vector<BondPosition> held;
    for (const auto& bond : *context_->bonds()) {
        if (bond.issue_date <= as_of) {
            held.push_back(bond);
        }
    }
    for (const auto& valuation : context_->bond_engine()->value_all(held, as_of)) {
        auto rate = convert(1.0, valuation.accrued_value.currency, currency, as_of);
        if (rate.is_error()) {
            return forward_error<std::vector<PositionView>>(rate);
        }
        const double fx = rate.value();

        PositionView view;
        view.asset_class = AssetClass::FIXED_INCOME;
        view.symbol = valuation.bond.issue_id.empty() ? valuation.bond.title
                                                      : valuation.bond.issue_id;
        view.name = valuation.bond.title;
        view.quantity = valuation.bond.quantity;
        view.avg_cost = valuation.bond.unit_price * fx;
        view.current_price = valuation.bond.quantity > 0
                                 ? valuation.accrued_value.amount / valuation.bond.quantity * fx
                                 : 0.0;
        view.market_value = valuation.accrued_value.amount * fx;
        view.cost_basis = valuation.invested.amount * fx;
        view.unrealized_pnl = valuation.pnl * fx;
        view.unrealized_pnl_pct = valuation.pnl_pct;
        view.native_currency = valuation.accrued_value.currency;
        view.currency = currency;
        view.stale = valuation.approximated;
        views.push_back(view);
    }

    std::sort(views.begin(), views.end(), [](const PositionView& a, const PositionView& b) {
        return a.market_value > b.market_value;
    });
    return views;
}

Result<std::vector<PositionView>> PortfolioAggregator::all_positions(
    const Timestamp& as_of, const std::string& currency) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return positions_locked(core::to_date(as_of), resolve_currency(currency));
}

Result<std::vector<PositionView>> PortfolioAggregator::top_performers(
    const Timestamp& as_of, size_t count, const std::string& currency) const {
    auto positions = all_positions(as_of, currency);
    if (positions.is_error()) {
        return positions;
    }
    std::vector<PositionView> ranked = positions.value();
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const PositionView& a, const PositionView& b) {
                         return a.unrealized_pnl_pct > b.unrealized_pnl_pct;
                     });
    if (ranked.size() > count) {
        ranked.resize(count);
    }
    return ranked;
}

Result<ConsolidatedSummary> PortfolioAggregator::consolidated_summary(
    const Timestamp& as_of, const std::string& currency) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Timestamp day = core::to_date(as_of);
    const std::string target = resolve_currency(currency);

    auto snapshot = context_->nav_calculator()->nav(day);
    if (snapshot.is_error()) {
        return forward_error<ConsolidatedSummary>(snapshot);
    }
    auto positions = positions_locked(day, target);
    if (positions.is_error()) {
        return forward_error<ConsolidatedSummary>(positions);
    }

    ConsolidatedSummary summary;
    summary.as_of = day;
    summary.currency = target;
    summary.version = version_;
    summary.stale_symbols = snapshot.value().stale_symbols;

    const std::string& base = snapshot.value().currency;
    auto cash = convert(snapshot.value().cash_position, base, target, day);
    auto fees = convert(snapshot.value().outstanding_fees, base, target, day);
    auto nav_value = convert(snapshot.value().nav, base, target, day);
    for (const auto* converted : {&cash, &fees, &nav_value}) {
        if (converted->is_error()) {
            return forward_error<ConsolidatedSummary>(*converted);
        }
    }
    summary.cash_position = cash.value();
    summary.outstanding_fees = fees.value();
    summary.nav = nav_value.value();

    std::map<AssetClass, AssetClassAllocation> by_class;
    for (const auto& view : positions.value()) {
        auto& entry = by_class[view.asset_class];
        entry.asset_class = view.asset_class;
        entry.value += view.market_value;
        entry.cost_basis += view.cost_basis;
        entry.pnl += view.unrealized_pnl + view.realized_pnl;
        ++entry.positions;

        summary.total_value += view.market_value;
        summary.total_invested += view.cost_basis;
        summary.total_pnl += view.unrealized_pnl + view.realized_pnl;
    }

    // Realized results of positions closed by as_of
    for (const auto* ledger : {context_->equities().get(), context_->crypto().get()}) {
        for (const auto& symbol : ledger->symbols()) {
            auto held = ledger->position_as_of(symbol, day);
            if (!held || held->has_position() || held->realized_pnl == 0) {
                continue;
            }
            auto realized = convert(held->realized_pnl, held->currency, target, day);
            if (realized.is_error()) {
                return forward_error<ConsolidatedSummary>(realized);
            }
            auto& entry = by_class[ledger->asset_class()];
            entry.asset_class = ledger->asset_class();
            entry.pnl += realized.value();
            summary.total_pnl += realized.value();
        }
    }

    AssetClassAllocation cash_entry;
    cash_entry.asset_class = AssetClass::CASH;
    cash_entry.value = summary.cash_position;
    by_class[AssetClass::CASH] = cash_entry;

    double allocated = 0.0;
    for (const auto& [asset_class, entry] : by_class) {
        allocated += entry.value;
    }
    for (auto& [asset_class, entry] : by_class) {
        entry.allocation_pct = allocated != 0 ? entry.value / allocated * 100.0 : 0.0;
        summary.allocation.push_back(entry);
    }

    summary.total_return_pct =
        summary.total_invested != 0 ? summary.total_pnl / summary.total_invested * 100.0 : 0.0;

    for (const auto& ccy : context_->currencies()) {
        if (ccy == target) {
            continue;
        }
        auto fx = context_->fx()->rate(ccy, target, day);
        if (fx.is_ok()) {
            summary.exchange_rates[ccy + target] = fx.value().rate;
        } else {
            WARN("No rate " << ccy << "/" << target << ": " << fx.error()->what());
        }
    }

    for (const auto& view : positions.value()) {
        if (view.stale && view.asset_class != AssetClass::FIXED_INCOME &&
            std::find(summary.stale_symbols.begin(), summary.stale_symbols.end(), view.symbol) ==
                summary.stale_symbols.end()) {
            summary.stale_symbols.push_back(view.symbol);
        }
    }
    return summary;
}

Result<std::vector<InvestorAllocation>> PortfolioAggregator::investor_allocations(
    const Timestamp& as_of) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto snapshot = context_->nav_calculator()->nav(core::to_date(as_of));
    if (snapshot.is_error()) {
        return forward_error<std::vector<InvestorAllocation>>(snapshot);
    }
    return context_->nav_calculator()->allocate_to_investors(snapshot.value());
}

FeeSummary PortfolioAggregator::fee_summary(std::optional<Timestamp> start,
                                            std::optional<Timestamp> end) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return context_->fees()->summary(start, end);
}

Result<Series> PortfolioAggregator::benchmark_series(const std::string& symbol,
                                                     const Timestamp& start,
                                                     const Timestamp& end) const {
    if (!context_->cache()) {
        return make_error<Series>(ErrorCode::NOT_INITIALIZED, "No price cache for benchmark",
                                  "PortfolioAggregator");
    }
    auto bars = context_->cache()->get_history(symbol, start, end);
    if (bars.is_error()) {
        return forward_error<Series>(bars);
    }
    Series series;
    series.reserve(bars.value().size());
    for (const auto& bar : bars.value()) {
        const double close = bar.adj_close > 0 ? bar.adj_close : bar.close;
        if (close > 0) {
            series.emplace_back(core::to_date(bar.date), close);
        }
    }
    if (series.empty()) {
        return make_error<Series>(ErrorCode::DATA_NOT_FOUND,
                                  "No cached bars for benchmark " + symbol, "PortfolioAggregator");
    }
    return series;
}

Result<nlohmann::json> PortfolioAggregator::performance(const Timestamp& start,
                                                        const Timestamp& end,
                                                        const std::string& benchmark_symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto values = context_->nav_calculator()->nav_series(start, end);
    if (values.is_error()) {
        return forward_error<nlohmann::json>(values);
    }

    std::optional<Series> benchmark;
    if (!benchmark_symbol.empty()) {
        auto series = benchmark_series(benchmark_symbol, start, end);
        if (series.is_ok()) {
            benchmark = series.value();
        } else {
            WARN("Benchmark " << benchmark_symbol
                              << " unavailable: " << series.error()->what());
        }
    }

    nlohmann::json payload =
        analytics_.performance_payload(values.value(), benchmark ? &*benchmark : nullptr);
    payload["portfolio"] = context_->name();
    payload["currency"] = context_->base_currency();
    payload["start"] = core::format_date(start);
    payload["end"] = core::format_date(end);
    payload["benchmark"] = benchmark ? nlohmann::json(benchmark_symbol) : nlohmann::json(nullptr);
    return payload;
}

nlohmann::json PortfolioAggregator::bond_report(const Timestamp& as_of) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Timestamp day = core::to_date(as_of);
    const auto& engine = *context_->bond_engine();
    const auto& bonds = *context_->bonds();

    nlohmann::json report;
    report["as_of"] = core::format_date(day);
    report["summary"] = engine.summary(bonds, day).to_json();

    nlohmann::json valuations = nlohmann::json::array();
    for (const auto& valuation : engine.value_all(bonds, day)) {
        valuations.push_back(valuation.to_json());
    }
    report["bonds"] = valuations;

    auto allocation_json = [](const std::vector<AllocationEntry>& entries) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& entry : entries) {
            out.push_back({{"key", entry.key},
                           {"value", entry.value},
                           {"pnl", entry.pnl},
                           {"allocation_pct", entry.allocation_pct}});
        }
        return out;
    };
    report["allocation_by_indexer"] = allocation_json(engine.allocation_by_indexer(bonds, day));
    report["allocation_by_type"] = allocation_json(engine.allocation_by_type(bonds, day));

    nlohmann::json schedule = nlohmann::json::array();
    for (const auto& bucket : engine.maturity_schedule(bonds, day)) {
        schedule.push_back({{"year", bucket.year},
                            {"month", bucket.month},
                            {"value_due", bucket.value_due},
                            {"count", bucket.count}});
    }
    report["maturity_schedule"] = schedule;
    return report;
}

std::map<std::string, double> PortfolioAggregator::exchange_rates(
    const Timestamp& as_of, const std::string& currency) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const std::string target = resolve_currency(currency);
    std::vector<std::string> others;
    for (const auto& ccy : context_->currencies()) {
        if (ccy != target) {
            others.push_back(ccy);
        }
    }
    return context_->fx()->rates_to(others, target, core::to_date(as_of));
}

}  // namespace fund_ngin
