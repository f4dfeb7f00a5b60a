// include/fund_ngin/data/price_store.hpp

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"

namespace fund_ngin {

/**
 * @brief Durable storage for daily bars and per-symbol coverage metadata
 *
 * Bars are keyed by (symbol, date); writing the same key twice replaces the
 * row, so repeated upserts leave the store unchanged.
 */
class PriceStore {
public:
    virtual ~PriceStore() = default;

    /**
     * @brief Insert or replace bars
     * @return Number of rows written
     */
    virtual Result<size_t> upsert_bars(const std::vector<PriceBar>& bars) = 0;

    /**
     * @brief Bars for a symbol with start <= date <= end, ascending
     */
    virtual Result<std::vector<PriceBar>> get_bars(const std::string& symbol,
                                                   const Timestamp& start,
                                                   const Timestamp& end) = 0;

    /**
     * @brief Most recent bar dated on or before as_of
     */
    virtual Result<std::optional<PriceBar>> latest_bar(const std::string& symbol,
                                                       const Timestamp& as_of) = 0;

    virtual Result<int64_t> count_bars(const std::string& symbol) = 0;

    virtual Result<std::optional<SymbolMetadata>> get_metadata(const std::string& symbol) = 0;

    virtual Result<void> put_metadata(const SymbolMetadata& metadata) = 0;

    virtual Result<std::vector<SymbolMetadata>> all_metadata() = 0;

    /**
     * @brief Remove every bar and the metadata row of a symbol
     */
    virtual Result<void> delete_symbol(const std::string& symbol) = 0;

    /**
     * @brief Remove bars dated before cutoff across all symbols
     * @return Number of rows removed
     */
    virtual Result<int64_t> delete_before(const Timestamp& cutoff) = 0;
};

}  // namespace fund_ngin
