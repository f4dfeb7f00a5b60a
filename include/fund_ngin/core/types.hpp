// include/fund_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fund_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Calendar dates are stored as timestamps at 00:00:00 UTC
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for positions
 * Double to support fractional crypto quantities
 */
using Quantity = double;

/**
 * @brief Monetary amount tagged with its currency
 */
struct Money {
    double amount{0.0};
    std::string currency;

    Money() = default;
    Money(double amt, std::string ccy) : amount(amt), currency(std::move(ccy)) {}
};

/**
 * @brief Asset class enumeration
 */
enum class AssetClass {
    EQUITY,
    CRYPTO,
    FIXED_INCOME,
    CASH,
    UNKNOWN
};

inline std::string asset_class_to_string(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::EQUITY:
            return "equity";
        case AssetClass::CRYPTO:
            return "crypto";
        case AssetClass::FIXED_INCOME:
            return "fixed_income";
        case AssetClass::CASH:
            return "cash";
        default:
            return "unknown";
    }
}

/**
 * @brief Trading side derived from the sign of a quantity
 */
enum class Side {
    BUY,
    SELL,
    NONE
};

/**
 * @brief Signed transaction record
 * Positive quantity is a buy, negative is a sell
 */
struct Transaction {
    AssetClass asset_class{AssetClass::UNKNOWN};
    std::string symbol;
    Timestamp date;
    Quantity signed_quantity{0.0};
    Price price{0.0};
    std::string currency;
    std::string market;

    Side side() const {
        if (signed_quantity > 0) return Side::BUY;
        if (signed_quantity < 0) return Side::SELL;
        return Side::NONE;
    }
};

/**
 * @brief Position held in a single symbol
 * Owned by its ledger and mutated only by transaction application
 */
struct Position {
    std::string symbol;
    AssetClass asset_class{AssetClass::UNKNOWN};
    std::string market;
    std::string currency;
    Quantity quantity{0.0};
    Price avg_cost{0.0};
    double realized_pnl{0.0};
    Price last_trade_price{0.0};
    Timestamp last_update;

    bool has_position() const { return quantity != 0; }

    double cost_basis() const { return quantity * avg_cost; }

    Side get_side() const {
        if (quantity > 0) return Side::BUY;
        if (quantity < 0) return Side::SELL;
        return Side::NONE;
    }
};

/**
 * @brief Daily OHLC bar with corporate action fields
 * Primary key is (symbol, date)
 */
struct PriceBar {
    std::string symbol;
    Timestamp date;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    Price adj_close{0.0};
    double volume{0.0};
    double dividend{0.0};
    double split{1.0};

    PriceBar() = default;
    PriceBar(std::string sym, Timestamp d, Price o, Price h, Price l, Price c, Price adj,
             double v, double div = 0.0, double spl = 1.0)
        : symbol(std::move(sym)),
          date(d),
          open(o),
          high(h),
          low(l),
          close(c),
          adj_close(adj),
          volume(v),
          dividend(div),
          split(spl) {}
};

/**
 * @brief Coverage information for a cached symbol
 * first_date..last_date is the contiguous range whose fetch windows completed
 */
struct SymbolMetadata {
    std::string symbol;
    Timestamp first_date;
    Timestamp last_date;
    Timestamp last_updated;
    int64_t record_count{0};
};

/**
 * @brief Where a valuation price came from
 */
enum class PriceSource {
    CACHE,
    FALLBACK,
    NONE
};

/**
 * @brief Price lookup result with staleness metadata
 */
struct PriceQuote {
    std::string symbol;
    Price price{0.0};
    std::optional<Timestamp> price_date;
    PriceSource source{PriceSource::NONE};
    bool stale{false};
};

/**
 * @brief Time series point (date, value)
 */
using SeriesPoint = std::pair<Timestamp, double>;
using Series = std::vector<SeriesPoint>;

}  // namespace fund_ngin
