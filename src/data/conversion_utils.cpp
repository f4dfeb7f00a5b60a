// src/data/conversion_utils.cpp
#include "fund_ngin/data/conversion_utils.hpp"
#include <arrow/type_traits.h>

namespace fund_ngin {

std::shared_ptr<arrow::Schema> DataConversionUtils::price_bar_schema() {
    return arrow::schema({arrow::field("date", arrow::timestamp(arrow::TimeUnit::SECOND)),
                          arrow::field("symbol", arrow::utf8()),
                          arrow::field("open", arrow::float64()),
                          arrow::field("high", arrow::float64()),
                          arrow::field("low", arrow::float64()),
                          arrow::field("close", arrow::float64()),
                          arrow::field("adj_close", arrow::float64()),
                          arrow::field("volume", arrow::float64()),
                          arrow::field("dividend", arrow::float64()),
                          arrow::field("split", arrow::float64())});
}

Result<std::vector<PriceBar>> DataConversionUtils::arrow_table_to_price_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<PriceBar>>(ErrorCode::INVALID_ARGUMENT,
                                                 "Table pointer is null", "DataConversionUtils");
    }

    const std::vector<std::string> required_columns = {"date", "symbol", "open", "high",
                                                       "low",  "close",  "volume"};
    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<PriceBar>>(
                ErrorCode::INVALID_DATA, "Missing required column: " + col, "DataConversionUtils");
        }
    }

    std::vector<PriceBar> bars;
    if (table->num_rows() == 0) {
        return bars;
    }

    try {
        auto combined = table->CombineChunks();
        if (!combined.ok()) {
            return make_error<std::vector<PriceBar>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to combine chunks: " + combined.status().ToString(),
                "DataConversionUtils");
        }
        const auto& flat = *combined;

        auto column = [&flat](const std::string& name) -> std::shared_ptr<arrow::Array> {
            auto chunked = flat->GetColumnByName(name);
            return chunked ? chunked->chunk(0) : nullptr;
        };

        auto date_array = column("date");
        auto symbol_array = column("symbol");
        auto open_array = column("open");
        auto high_array = column("high");
        auto low_array = column("low");
        auto close_array = column("close");
        auto adj_array = column("adj_close");
        auto volume_array = column("volume");
        auto dividend_array = column("dividend");
        auto split_array = column("split");

        bars.reserve(flat->num_rows());
        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts_result = extract_timestamp(date_array, i);
            if (ts_result.is_error()) {
                return forward_error<std::vector<PriceBar>>(ts_result);
            }
            auto symbol_result = extract_string(symbol_array, i);
            if (symbol_result.is_error()) {
                return forward_error<std::vector<PriceBar>>(symbol_result);
            }

            auto close_result = extract_double(close_array, i, 0.0);
            if (close_result.is_error()) {
                return forward_error<std::vector<PriceBar>>(close_result);
            }
            double close = close_result.value();

            auto open_result = extract_double(open_array, i, close);
            auto high_result = extract_double(high_array, i, close);
            auto low_result = extract_double(low_array, i, close);
            auto volume_result = extract_double(volume_array, i, 0.0);
            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                volume_result.is_error()) {
                return make_error<std::vector<PriceBar>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLCV values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            // Optional columns default to no corporate action
            double adj_close = close;
            double dividend = 0.0;
            double split = 1.0;
            if (adj_array) {
                auto r = extract_double(adj_array, i, close);
                if (r.is_ok()) adj_close = r.value();
            }
            if (dividend_array) {
                auto r = extract_double(dividend_array, i, 0.0);
                if (r.is_ok()) dividend = r.value();
            }
            if (split_array) {
                auto r = extract_double(split_array, i, 1.0);
                if (r.is_ok()) split = r.value();
            }

            bars.emplace_back(symbol_result.value(), ts_result.value(), open_result.value(),
                              high_result.value(), low_result.value(), close, adj_close,
                              volume_result.value(), dividend, split);
        }

        return bars;

    } catch (const std::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to bars: ") + e.what(), "DataConversionUtils");
    }
}

Result<Timestamp> DataConversionUtils::extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                                         int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Date column is not a timestamp array",
                                     "DataConversionUtils");
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    if (ts_array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null date value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }
    return Timestamp(std::chrono::seconds(ts_array->Value(index)));
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index, double fallback) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR, "Column is not a double array",
                                  "DataConversionUtils");
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return fallback;
    }
    return double_array->Value(index);
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Symbol column is not a string array",
                                       "DataConversionUtils");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null symbol value at index " + std::to_string(index),
                                       "DataConversionUtils");
    }
    return string_array->GetString(index);
}

}  // namespace fund_ngin
