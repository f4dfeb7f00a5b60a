// include/fund_ngin/ledger/position_ledger.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/time_series_cache.hpp"

namespace fund_ngin {

/**
 * @brief What a sell larger than the held quantity does
 */
enum class OversellPolicy {
    REJECT,      // fail with INSUFFICIENT_POSITION
    ALLOW_SHORT  // close the long and open a short at the sell price
};

std::string oversell_policy_to_string(OversellPolicy policy);

struct LedgerConfig : public ConfigBase {
    OversellPolicy oversell_policy{OversellPolicy::REJECT};
    std::string domestic_market{"Nacional"};
    std::string domestic_suffix{".SA"};
    std::string domestic_currency{"BRL"};
    std::string foreign_currency{"USD"};
    std::string crypto_quote_currency{"USD"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["oversell_policy"] = oversell_policy_to_string(oversell_policy);
        j["domestic_market"] = domestic_market;
        j["domestic_suffix"] = domestic_suffix;
        j["domestic_currency"] = domestic_currency;
        j["foreign_currency"] = foreign_currency;
        j["crypto_quote_currency"] = crypto_quote_currency;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("oversell_policy")) {
            oversell_policy = j.at("oversell_policy").get<std::string>() == "ALLOW_SHORT"
                                  ? OversellPolicy::ALLOW_SHORT
                                  : OversellPolicy::REJECT;
        }
        if (j.contains("domestic_market"))
            domestic_market = j.at("domestic_market").get<std::string>();
        if (j.contains("domestic_suffix"))
            domestic_suffix = j.at("domestic_suffix").get<std::string>();
        if (j.contains("domestic_currency"))
            domestic_currency = j.at("domestic_currency").get<std::string>();
        if (j.contains("foreign_currency"))
            foreign_currency = j.at("foreign_currency").get<std::string>();
        if (j.contains("crypto_quote_currency"))
            crypto_quote_currency = j.at("crypto_quote_currency").get<std::string>();
    }
};

/**
 * @brief Mark-to-market view of one position
 */
struct PositionValuation {
    Position position;
    PriceQuote quote;
    Money market_value;
    double cost_basis{0.0};
    double unrealized_pnl{0.0};
    double unrealized_pnl_pct{0.0};
    double total_pnl{0.0};

    bool stale() const { return quote.stale; }

    nlohmann::json to_json() const;
};

/**
 * @brief Weighted-average cost ledger for one asset class
 *
 * Keeps every symbol's transactions in date order together with the position
 * after each of them, so historical positions are read without replaying.
 * Transactions dated on or after a symbol's last event extend it in place;
 * back-dated ones rebuild that symbol only.
 */
class PositionLedger {
public:
    explicit PositionLedger(AssetClass asset_class, LedgerConfig config = LedgerConfig{});

    /**
     * @brief Fold one symbol's transactions into a position
     *
     * Transactions are sorted by date; equal dates keep their input order.
     */
    static Result<Position> replay(const std::vector<Transaction>& transactions,
                                   OversellPolicy policy = OversellPolicy::REJECT);

    /**
     * @brief Record a transaction; a rejected one leaves the ledger unchanged
     */
    Result<void> apply(const Transaction& txn);

    /**
     * @brief Apply in order, stopping at the first rejection
     * @return Number of transactions applied
     */
    Result<size_t> apply_all(const std::vector<Transaction>& transactions);

    std::optional<Position> position(const std::string& symbol) const;

    /**
     * @brief Position after the last transaction dated on or before date
     */
    std::optional<Position> position_as_of(const std::string& symbol, const Timestamp& date) const;

    std::vector<Position> positions() const;

    std::vector<Position> open_positions() const;

    std::vector<std::string> symbols() const;

    std::vector<Transaction> transactions(const std::string& symbol) const;

    /**
     * @brief Value a symbol's position as of a date using cached closes
     *
     * Falls back to the last trade price, flagged stale, when the cache has
     * no bar on or before as_of.
     */
    Result<PositionValuation> value(const std::string& symbol, const Timestamp& as_of,
                                    const TimeSeriesCache& cache) const;

    /**
     * @brief Valuations of every position open as of the date
     */
    std::vector<PositionValuation> value_open_positions(const Timestamp& as_of,
                                                        const TimeSeriesCache& cache) const;

    /**
     * @brief Symbol as quoted by the market data source
     * Domestic equities get the exchange suffix, crypto gets -{quote currency}
     */
    std::string market_symbol(const Position& position) const;

    /**
     * @brief Date of the newest transaction across all symbols
     */
    std::optional<Timestamp> last_event_date() const;

    AssetClass asset_class() const { return asset_class_; }

    size_t transaction_count() const;

    const LedgerConfig& config() const { return config_; }

private:
    struct SymbolBook {
        std::vector<Transaction> transactions;
        std::vector<Position> checkpoints;  // state after transactions[i]
    };

    static Result<void> step(Position& position, const Transaction& txn, OversellPolicy policy);

    Result<Transaction> normalize(const Transaction& txn) const;

    AssetClass asset_class_;
    LedgerConfig config_;
    std::map<std::string, SymbolBook> books_;
};

}  // namespace fund_ngin
