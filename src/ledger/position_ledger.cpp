// src/ledger/position_ledger.cpp

#include "fund_ngin/ledger/position_ledger.hpp"
#include <algorithm>
#include <cmath>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

namespace {

constexpr double QUANTITY_EPSILON = 1e-9;

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string oversell_policy_to_string(OversellPolicy policy) {
    return policy == OversellPolicy::ALLOW_SHORT ? "ALLOW_SHORT" : "REJECT";
}

nlohmann::json PositionValuation::to_json() const {
    nlohmann::json j;
    j["symbol"] = position.symbol;
    j["asset_class"] = asset_class_to_string(position.asset_class);
    j["market"] = position.market;
    j["currency"] = market_value.currency;
    j["quantity"] = position.quantity;
    j["avg_cost"] = position.avg_cost;
    j["price"] = quote.price;
    j["price_date"] = quote.price_date ? core::format_date(*quote.price_date) : "";
    j["price_source"] = quote.source == PriceSource::CACHE ? "cache" : "last_trade";
    j["stale"] = quote.stale;
    j["market_value"] = market_value.amount;
    j["cost_basis"] = cost_basis;
    j["unrealized_pnl"] = unrealized_pnl;
    j["unrealized_pnl_pct"] = unrealized_pnl_pct;
    j["realized_pnl"] = position.realized_pnl;
    j["total_pnl"] = total_pnl;
    return j;
}

PositionLedger::PositionLedger(AssetClass asset_class, LedgerConfig config)
    : asset_class_(asset_class), config_(std::move(config)) {}

Result<void> PositionLedger::step(Position& position, const Transaction& txn,
                                  OversellPolicy policy) {
    const double qty = txn.signed_quantity;
    const double price = txn.price;

    if (qty > 0) {
        double remaining = qty;
        if (position.quantity < 0) {
            // Buying back a short realizes against the short's average price
            double covered = std::min(remaining, -position.quantity);
            position.realized_pnl += (position.avg_cost - price) * covered;
            position.quantity += covered;
            remaining -= covered;
            if (std::abs(position.quantity) < QUANTITY_EPSILON) {
                position.quantity = 0.0;
            }
        }
        if (remaining > QUANTITY_EPSILON) {
            double total = position.quantity + remaining;
            position.avg_cost = (position.quantity * position.avg_cost + remaining * price) / total;
            position.quantity = total;
        }
    } else {
        const double sell_qty = -qty;
        if (position.quantity < 0) {
            // Extending an existing short
            double held_short = -position.quantity;
            position.avg_cost =
                (held_short * position.avg_cost + sell_qty * price) / (held_short + sell_qty);
            position.quantity -= sell_qty;
        } else if (sell_qty > position.quantity + QUANTITY_EPSILON) {
            if (policy == OversellPolicy::REJECT) {
                return make_error<void>(ErrorCode::INSUFFICIENT_POSITION,
                                        "Sell of " + std::to_string(sell_qty) + " " + txn.symbol +
                                            " exceeds held quantity " +
                                            std::to_string(position.quantity),
                                        "PositionLedger");
            }
            double held = position.quantity;
            position.realized_pnl += held * (price - position.avg_cost);
            position.quantity = -(sell_qty - held);
            position.avg_cost = price;
        } else {
            position.realized_pnl += sell_qty * (price - position.avg_cost);
            position.quantity -= sell_qty;
            if (std::abs(position.quantity) < QUANTITY_EPSILON) {
                position.quantity = 0.0;
            }
        }
    }

    position.last_trade_price = price;
    position.last_update = txn.date;
    return Result<void>();
}

Result<Position> PositionLedger::replay(const std::vector<Transaction>& transactions,
                                        OversellPolicy policy) {
    std::vector<Transaction> ordered = transactions;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Transaction& a, const Transaction& b) { return a.date < b.date; });

    Position position;
    if (!ordered.empty()) {
        position.symbol = ordered.front().symbol;
        position.asset_class = ordered.front().asset_class;
        position.market = ordered.front().market;
        position.currency = ordered.front().currency;
    }

    for (const auto& txn : ordered) {
        if (txn.symbol != position.symbol) {
            return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                        "Replay expects a single symbol, got " + txn.symbol +
                                            " and " + position.symbol,
                                        "PositionLedger");
        }
        if (txn.signed_quantity == 0) {
            return make_error<Position>(ErrorCode::INVALID_TRANSACTION,
                                        "Zero quantity transaction for " + txn.symbol,
                                        "PositionLedger");
        }
        auto stepped = step(position, txn, policy);
        if (stepped.is_error()) {
            return forward_error<Position>(stepped);
        }
    }
    return position;
}

Result<Transaction> PositionLedger::normalize(const Transaction& txn) const {
    if (txn.symbol.empty()) {
        return make_error<Transaction>(ErrorCode::INVALID_TRANSACTION, "Transaction has no symbol",
                                       "PositionLedger");
    }
    if (txn.signed_quantity == 0 || !std::isfinite(txn.signed_quantity)) {
        return make_error<Transaction>(ErrorCode::INVALID_TRANSACTION,
                                       "Transaction quantity must be non-zero for " + txn.symbol,
                                       "PositionLedger");
    }
    if (!(txn.price > 0) || !std::isfinite(txn.price)) {
        return make_error<Transaction>(ErrorCode::INVALID_TRANSACTION,
                                       "Transaction price must be positive for " + txn.symbol,
                                       "PositionLedger");
    }
    if (txn.asset_class != AssetClass::UNKNOWN && txn.asset_class != asset_class_) {
        return make_error<Transaction>(
            ErrorCode::INVALID_TRANSACTION,
            asset_class_to_string(txn.asset_class) + " transaction for " + txn.symbol +
                " sent to the " + asset_class_to_string(asset_class_) + " ledger",
            "PositionLedger");
    }

    Transaction normalized = txn;
    normalized.asset_class = asset_class_;
    normalized.date = core::to_date(txn.date);
    if (normalized.currency.empty()) {
        if (asset_class_ == AssetClass::CRYPTO) {
            normalized.currency = config_.crypto_quote_currency;
        } else if (normalized.market == config_.domestic_market) {
            normalized.currency = config_.domestic_currency;
        } else {
            normalized.currency = config_.foreign_currency;
        }
    }

    auto it = books_.find(txn.symbol);
    if (it != books_.end() && !it->second.checkpoints.empty() &&
        it->second.checkpoints.back().currency != normalized.currency) {
        return make_error<Transaction>(ErrorCode::INVALID_TRANSACTION,
                                       "Currency " + normalized.currency + " differs from " +
                                           it->second.checkpoints.back().currency + " for " +
                                           txn.symbol,
                                       "PositionLedger");
    }
    return normalized;
}

Result<void> PositionLedger::apply(const Transaction& txn) {
    auto normalized = normalize(txn);
    if (normalized.is_error()) {
        return forward_error<void>(normalized);
    }
    const Transaction& t = normalized.value();

    auto it = books_.find(t.symbol);
    if (it == books_.end() || it->second.transactions.empty() ||
        t.date >= it->second.transactions.back().date) {
        Position position;
        if (it != books_.end() && !it->second.checkpoints.empty()) {
            position = it->second.checkpoints.back();
        } else {
            position.symbol = t.symbol;
            position.asset_class = asset_class_;
            position.market = t.market;
            position.currency = t.currency;
        }

        auto stepped = step(position, t, config_.oversell_policy);
        if (stepped.is_error()) {
            return stepped;
        }
        SymbolBook& book = books_[t.symbol];
        book.transactions.push_back(t);
        book.checkpoints.push_back(std::move(position));
        return Result<void>();
    }

    // Back-dated: insert after any same-day events and rebuild from there
    SymbolBook& book = it->second;
    auto insert_at = std::upper_bound(
        book.transactions.begin(), book.transactions.end(), t.date,
        [](const Timestamp& date, const Transaction& existing) { return date < existing.date; });
    size_t index = static_cast<size_t>(insert_at - book.transactions.begin());

    std::vector<Transaction> rebuilt_txns(book.transactions.begin(),
                                          book.transactions.begin() + index);
    std::vector<Position> rebuilt_points(book.checkpoints.begin(),
                                         book.checkpoints.begin() + index);
    Position position;
    if (index > 0) {
        position = rebuilt_points.back();
    } else {
        position.symbol = t.symbol;
        position.asset_class = asset_class_;
        position.market = t.market;
        position.currency = t.currency;
    }

    rebuilt_txns.push_back(t);
    rebuilt_txns.insert(rebuilt_txns.end(), book.transactions.begin() + index,
                        book.transactions.end());
    for (size_t i = index; i < rebuilt_txns.size(); ++i) {
        auto stepped = step(position, rebuilt_txns[i], config_.oversell_policy);
        if (stepped.is_error()) {
            WARN("Back-dated " << t.symbol << " transaction on " << core::format_date(t.date)
                               << " rejected: " << stepped.error()->what());
            return stepped;
        }
        rebuilt_points.push_back(position);
    }

    book.transactions = std::move(rebuilt_txns);
    book.checkpoints = std::move(rebuilt_points);
    DEBUG("Rebuilt " << t.symbol << " history from " << core::format_date(t.date));
    return Result<void>();
}

Result<size_t> PositionLedger::apply_all(const std::vector<Transaction>& transactions) {
    size_t applied = 0;
    for (const auto& txn : transactions) {
        auto result = apply(txn);
        if (result.is_error()) {
            return forward_error<size_t>(result);
        }
        ++applied;
    }
    return applied;
}

std::optional<Position> PositionLedger::position(const std::string& symbol) const {
    auto it = books_.find(symbol);
    if (it == books_.end() || it->second.checkpoints.empty()) {
        return std::nullopt;
    }
    return it->second.checkpoints.back();
}

std::optional<Position> PositionLedger::position_as_of(const std::string& symbol,
                                                       const Timestamp& date) const {
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return std::nullopt;
    }
    const auto& txns = it->second.transactions;
    Timestamp day = core::to_date(date);
    auto after = std::upper_bound(
        txns.begin(), txns.end(), day,
        [](const Timestamp& d, const Transaction& existing) { return d < existing.date; });
    if (after == txns.begin()) {
        return std::nullopt;
    }
    return it->second.checkpoints[static_cast<size_t>(after - txns.begin()) - 1];
}

std::vector<Position> PositionLedger::positions() const {
    std::vector<Position> result;
    result.reserve(books_.size());
    for (const auto& [symbol, book] : books_) {
        if (!book.checkpoints.empty()) {
            result.push_back(book.checkpoints.back());
        }
    }
    return result;
}

std::vector<Position> PositionLedger::open_positions() const {
    std::vector<Position> result;
    for (const auto& [symbol, book] : books_) {
        if (!book.checkpoints.empty() && book.checkpoints.back().has_position()) {
            result.push_back(book.checkpoints.back());
        }
    }
    return result;
}

std::vector<std::string> PositionLedger::symbols() const {
    std::vector<std::string> result;
    result.reserve(books_.size());
    for (const auto& [symbol, book] : books_) {
        result.push_back(symbol);
    }
    return result;
}

std::vector<Transaction> PositionLedger::transactions(const std::string& symbol) const {
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return {};
    }
    return it->second.transactions;
}

std::optional<Timestamp> PositionLedger::last_event_date() const {
    std::optional<Timestamp> latest;
    for (const auto& [symbol, book] : books_) {
        if (!book.transactions.empty() &&
            (!latest || book.transactions.back().date > *latest)) {
            latest = book.transactions.back().date;
        }
    }
    return latest;
}

size_t PositionLedger::transaction_count() const {
    size_t count = 0;
    for (const auto& [symbol, book] : books_) {
        count += book.transactions.size();
    }
    return count;
}

std::string PositionLedger::market_symbol(const Position& position) const {
    if (asset_class_ == AssetClass::CRYPTO) {
        const std::string suffix = "-" + config_.crypto_quote_currency;
        return ends_with(position.symbol, suffix) ? position.symbol : position.symbol + suffix;
    }
    if (position.market == config_.domestic_market &&
        !ends_with(position.symbol, config_.domestic_suffix)) {
        return position.symbol + config_.domestic_suffix;
    }
    return position.symbol;
}

Result<PositionValuation> PositionLedger::value(const std::string& symbol, const Timestamp& as_of,
                                                const TimeSeriesCache& cache) const {
    if (books_.find(symbol) == books_.end()) {
        return make_error<PositionValuation>(ErrorCode::DATA_NOT_FOUND,
                                             "No transactions for " + symbol, "PositionLedger");
    }

    PositionValuation valuation;
    auto held = position_as_of(symbol, as_of);
    if (!held) {
        // Symbol exists but was first traded after as_of
        valuation.position.symbol = symbol;
        valuation.position.asset_class = asset_class_;
        valuation.market_value = Money(0.0, books_.at(symbol).checkpoints.front().currency);
        valuation.quote.symbol = symbol;
        return valuation;
    }
    valuation.position = *held;

    auto quote = cache.latest_price(market_symbol(*held), as_of, held->last_trade_price);
    if (quote.is_error()) {
        return forward_error<PositionValuation>(quote);
    }
    valuation.quote = quote.value();

    const double price = valuation.quote.price;
    valuation.market_value = Money(held->quantity * price, held->currency);
    valuation.cost_basis = held->cost_basis();
    valuation.unrealized_pnl = held->quantity * (price - held->avg_cost);
    valuation.unrealized_pnl_pct = valuation.cost_basis != 0
                                       ? valuation.unrealized_pnl / std::abs(valuation.cost_basis) * 100.0
                                       : 0.0;
    valuation.total_pnl = held->realized_pnl + valuation.unrealized_pnl;
    return valuation;
}

std::vector<PositionValuation> PositionLedger::value_open_positions(
    const Timestamp& as_of, const TimeSeriesCache& cache) const {
    std::vector<PositionValuation> valuations;
    for (const auto& [symbol, book] : books_) {
        auto held = position_as_of(symbol, as_of);
        if (!held || !held->has_position()) {
            continue;
        }
        auto valuation = value(symbol, as_of, cache);
        if (valuation.is_error()) {
            ERROR("Failed to value " << symbol << ": " << valuation.error()->what());
            continue;
        }
        if (valuation.value().stale()) {
            WARN("Stale price for " << symbol << " as of " << core::format_date(as_of));
        }
        valuations.push_back(valuation.value());
    }
    std::sort(valuations.begin(), valuations.end(),
              [](const PositionValuation& a, const PositionValuation& b) {
                  return a.market_value.amount > b.market_value.amount;
              });
    return valuations;
}

}  // namespace fund_ngin
