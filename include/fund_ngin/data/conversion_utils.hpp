// include/fund_ngin/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"

namespace fund_ngin {

class DataConversionUtils {
public:
    /**
     * @brief Schema of price_history query results
     * date (timestamp[s]), symbol, open, high, low, close, adj_close, volume,
     * dividend, split
     */
    static std::shared_ptr<arrow::Schema> price_bar_schema();

    /**
     * @brief Convert Arrow Table to vector of PriceBars
     * @param table Arrow table with the price_bar_schema columns
     * @return Result containing vector of PriceBars
     */
    static Result<std::vector<PriceBar>> arrow_table_to_price_bars(
        const std::shared_ptr<arrow::Table>& table);

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    /**
     * @brief Extract a double, returning the fallback for null cells
     */
    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index, double fallback);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace fund_ngin
