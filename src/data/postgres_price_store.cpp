// src/data/postgres_price_store.cpp

#include "fund_ngin/data/postgres_price_store.hpp"
#include <cstdio>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"
#include "fund_ngin/data/conversion_utils.hpp"

namespace fund_ngin {

namespace {

const char* BAR_COLUMNS =
    "symbol, to_char(date, 'YYYY-MM-DD') AS date, open, high, low, close, adj_close, volume, "
    "dividend, split";

Result<Timestamp> parse_db_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int fields = std::sscanf(text.c_str(), "%d-%d-%d %d:%d:%d", &year, &month, &day, &hour,
                             &minute, &second);
    if (fields < 3) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Unparseable timestamp '" + text + "'",
                                     "PostgresPriceStore");
    }
    return core::make_date(year, month, day) + std::chrono::hours(hour) +
           std::chrono::minutes(minute) + std::chrono::seconds(second);
}

}  // namespace

PostgresPriceStore::PostgresPriceStore(DatabaseConfig config)
    : config_(std::move(config)), connection_(nullptr) {}

PostgresPriceStore::~PostgresPriceStore() {
    disconnect();
}

Result<void> PostgresPriceStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(config_.get_connection_string());
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresPriceStore");
        }
        INFO("Connected to PostgreSQL database " << config_.host << ":" << config_.port << "/"
                                                 << config_.name);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresPriceStore");
    }
}

void PostgresPriceStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresPriceStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresPriceStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresPriceStore");
    }
    return Result<void>();
}

std::string PostgresPriceStore::price_table() const {
    return connection_->quote_name(config_.price_table);
}

std::string PostgresPriceStore::metadata_table() const {
    return connection_->quote_name(config_.metadata_table);
}

Result<void> PostgresPriceStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec("CREATE TABLE IF NOT EXISTS " + price_table() +
                 " (symbol TEXT NOT NULL, date DATE NOT NULL, open DOUBLE PRECISION, "
                 "high DOUBLE PRECISION, low DOUBLE PRECISION, close DOUBLE PRECISION NOT NULL, "
                 "adj_close DOUBLE PRECISION, volume DOUBLE PRECISION, "
                 "dividend DOUBLE PRECISION DEFAULT 0, split DOUBLE PRECISION DEFAULT 1, "
                 "PRIMARY KEY (symbol, date))");
        txn.exec("CREATE TABLE IF NOT EXISTS " + metadata_table() +
                 " (symbol TEXT PRIMARY KEY, first_date DATE NOT NULL, last_date DATE NOT NULL, "
                 "last_updated TIMESTAMP NOT NULL, total_records BIGINT NOT NULL DEFAULT 0)");
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to create schema: " + std::string(e.what()),
                                "PostgresPriceStore");
    }
}

Result<size_t> PostgresPriceStore::upsert_bars(const std::vector<PriceBar>& bars) {
    if (bars.empty()) {
        return size_t{0};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<size_t>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        const std::string query =
            "INSERT INTO " + price_table() +
            " (symbol, date, open, high, low, close, adj_close, volume, dividend, split) "
            "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, $10) "
            "ON CONFLICT (symbol, date) DO UPDATE SET open = EXCLUDED.open, "
            "high = EXCLUDED.high, low = EXCLUDED.low, close = EXCLUDED.close, "
            "adj_close = EXCLUDED.adj_close, volume = EXCLUDED.volume, "
            "dividend = EXCLUDED.dividend, split = EXCLUDED.split";

        for (const auto& bar : bars) {
            txn.exec_params(query, bar.symbol, core::format_date(bar.date), bar.open, bar.high,
                            bar.low, bar.close, bar.adj_close, bar.volume, bar.dividend,
                            bar.split);
        }
        txn.commit();
        return bars.size();

    } catch (const std::exception& e) {
        return make_error<size_t>(ErrorCode::DATABASE_ERROR,
                                  "Failed to upsert bars: " + std::string(e.what()),
                                  "PostgresPriceStore");
    }
}

Result<std::vector<PriceBar>> PostgresPriceStore::get_bars(const std::string& symbol,
                                                           const Timestamp& start,
                                                           const Timestamp& end) {
    if (start > end) {
        return make_error<std::vector<PriceBar>>(ErrorCode::INVALID_ARGUMENT,
                                                 "Start date must be before end date",
                                                 "PostgresPriceStore");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<PriceBar>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(std::string("SELECT ") + BAR_COLUMNS + " FROM " +
                                          price_table() +
                                          " WHERE symbol = $1 AND date BETWEEN $2::date AND "
                                          "$3::date ORDER BY date",
                                      symbol, core::format_date(start), core::format_date(end));
        txn.commit();
        return bars_from_result(result);

    } catch (const std::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::DATABASE_ERROR, "Failed to fetch bars: " + std::string(e.what()),
            "PostgresPriceStore");
    }
}

Result<std::optional<PriceBar>> PostgresPriceStore::latest_bar(const std::string& symbol,
                                                               const Timestamp& as_of) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::optional<PriceBar>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(std::string("SELECT ") + BAR_COLUMNS + " FROM " +
                                          price_table() +
                                          " WHERE symbol = $1 AND date <= $2::date "
                                          "ORDER BY date DESC LIMIT 1",
                                      symbol, core::format_date(as_of));
        txn.commit();

        auto bars = bars_from_result(result);
        if (bars.is_error()) {
            return forward_error<std::optional<PriceBar>>(bars);
        }
        if (bars.value().empty()) {
            return std::optional<PriceBar>();
        }
        return std::optional<PriceBar>(bars.value().front());

    } catch (const std::exception& e) {
        return make_error<std::optional<PriceBar>>(
            ErrorCode::DATABASE_ERROR, "Failed to fetch latest bar: " + std::string(e.what()),
            "PostgresPriceStore");
    }
}

Result<int64_t> PostgresPriceStore::count_bars(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<int64_t>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT COUNT(*) FROM " + price_table() + " WHERE symbol = $1", symbol);
        txn.commit();
        return result[0][0].as<int64_t>();
    } catch (const std::exception& e) {
        return make_error<int64_t>(ErrorCode::DATABASE_ERROR,
                                   "Failed to count bars: " + std::string(e.what()),
                                   "PostgresPriceStore");
    }
}

Result<std::optional<SymbolMetadata>> PostgresPriceStore::get_metadata(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::optional<SymbolMetadata>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT symbol, to_char(first_date, 'YYYY-MM-DD'), to_char(last_date, 'YYYY-MM-DD'), "
            "to_char(last_updated, 'YYYY-MM-DD HH24:MI:SS'), total_records FROM " +
                metadata_table() + " WHERE symbol = $1",
            symbol);
        txn.commit();

        auto rows = metadata_from_result(result);
        if (rows.is_error()) {
            return forward_error<std::optional<SymbolMetadata>>(rows);
        }
        if (rows.value().empty()) {
            return std::optional<SymbolMetadata>();
        }
        return std::optional<SymbolMetadata>(rows.value().front());

    } catch (const std::exception& e) {
        return make_error<std::optional<SymbolMetadata>>(
            ErrorCode::DATABASE_ERROR, "Failed to fetch metadata: " + std::string(e.what()),
            "PostgresPriceStore");
    }
}

Result<void> PostgresPriceStore::put_metadata(const SymbolMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec_params("INSERT INTO " + metadata_table() +
                            " (symbol, first_date, last_date, last_updated, total_records) "
                            "VALUES ($1, $2::date, $3::date, $4::timestamp, $5) "
                            "ON CONFLICT (symbol) DO UPDATE SET first_date = EXCLUDED.first_date, "
                            "last_date = EXCLUDED.last_date, last_updated = EXCLUDED.last_updated, "
                            "total_records = EXCLUDED.total_records",
                        metadata.symbol, core::format_date(metadata.first_date),
                        core::format_date(metadata.last_date),
                        core::format_timestamp(metadata.last_updated), metadata.record_count);
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store metadata: " + std::string(e.what()),
                                "PostgresPriceStore");
    }
}

Result<std::vector<SymbolMetadata>> PostgresPriceStore::all_metadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<SymbolMetadata>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec(
            "SELECT symbol, to_char(first_date, 'YYYY-MM-DD'), to_char(last_date, 'YYYY-MM-DD'), "
            "to_char(last_updated, 'YYYY-MM-DD HH24:MI:SS'), total_records FROM " +
            metadata_table() + " ORDER BY symbol");
        txn.commit();
        return metadata_from_result(result);
    } catch (const std::exception& e) {
        return make_error<std::vector<SymbolMetadata>>(
            ErrorCode::DATABASE_ERROR, "Failed to list metadata: " + std::string(e.what()),
            "PostgresPriceStore");
    }
}

Result<void> PostgresPriceStore::delete_symbol(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec_params("DELETE FROM " + price_table() + " WHERE symbol = $1", symbol);
        txn.exec_params("DELETE FROM " + metadata_table() + " WHERE symbol = $1", symbol);
        txn.commit();
        INFO("Deleted cached history for " << symbol);
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to delete symbol: " + std::string(e.what()),
                                "PostgresPriceStore");
    }
}

Result<int64_t> PostgresPriceStore::delete_before(const Timestamp& cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<int64_t>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params("DELETE FROM " + price_table() + " WHERE date < $1::date",
                                      core::format_date(cutoff));
        txn.commit();
        return static_cast<int64_t>(result.affected_rows());
    } catch (const std::exception& e) {
        return make_error<int64_t>(ErrorCode::DATABASE_ERROR,
                                   "Failed to prune bars: " + std::string(e.what()),
                                   "PostgresPriceStore");
    }
}

Result<std::vector<PriceBar>> PostgresPriceStore::bars_from_result(
    const pqxx::result& result) const {
    auto table = convert_to_arrow_table(result);
    if (table.is_error()) {
        return forward_error<std::vector<PriceBar>>(table);
    }
    return DataConversionUtils::arrow_table_to_price_bars(table.value());
}

Result<std::vector<SymbolMetadata>> PostgresPriceStore::metadata_from_result(
    const pqxx::result& result) const {
    std::vector<SymbolMetadata> rows;
    rows.reserve(result.size());
    for (const auto& row : result) {
        SymbolMetadata metadata;
        metadata.symbol = row[0].as<std::string>();

        auto first = core::parse_date(row[1].as<std::string>());
        auto last = core::parse_date(row[2].as<std::string>());
        auto updated = parse_db_timestamp(row[3].as<std::string>());
        if (first.is_error()) return forward_error<std::vector<SymbolMetadata>>(first);
        if (last.is_error()) return forward_error<std::vector<SymbolMetadata>>(last);
        if (updated.is_error()) return forward_error<std::vector<SymbolMetadata>>(updated);

        metadata.first_date = first.value();
        metadata.last_date = last.value();
        metadata.last_updated = updated.value();
        metadata.record_count = row[4].as<int64_t>();
        rows.push_back(std::move(metadata));
    }
    return rows;
}

Result<std::shared_ptr<arrow::Table>> PostgresPriceStore::convert_to_arrow_table(
    const pqxx::result& result) const {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    arrow::TimestampBuilder date_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
    arrow::StringBuilder symbol_builder(pool);
    arrow::DoubleBuilder open_builder(pool);
    arrow::DoubleBuilder high_builder(pool);
    arrow::DoubleBuilder low_builder(pool);
    arrow::DoubleBuilder close_builder(pool);
    arrow::DoubleBuilder adj_builder(pool);
    arrow::DoubleBuilder volume_builder(pool);
    arrow::DoubleBuilder dividend_builder(pool);
    arrow::DoubleBuilder split_builder(pool);

    auto handle_builder_error = [](const std::string& operation) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Arrow builder error during " + operation,
            "PostgresPriceStore");
    };

    // Nullable numeric cells become Arrow nulls
    auto append_double = [](arrow::DoubleBuilder& builder, const pqxx::field& field) {
        return field.is_null() ? builder.AppendNull() : builder.Append(field.as<double>());
    };

    try {
        for (const auto& row : result) {
            auto date = core::parse_date(row["date"].as<std::string>());
            if (date.is_error()) {
                return forward_error<std::shared_ptr<arrow::Table>>(date);
            }
            auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                             date.value().time_since_epoch())
                             .count();

            if (!date_builder.Append(epoch).ok() ||
                !symbol_builder.Append(row["symbol"].as<std::string>()).ok() ||
                !append_double(open_builder, row["open"]).ok() ||
                !append_double(high_builder, row["high"]).ok() ||
                !append_double(low_builder, row["low"]).ok() ||
                !append_double(close_builder, row["close"]).ok() ||
                !append_double(adj_builder, row["adj_close"]).ok() ||
                !append_double(volume_builder, row["volume"]).ok() ||
                !append_double(dividend_builder, row["dividend"]).ok() ||
                !append_double(split_builder, row["split"]).ok()) {
                return handle_builder_error("append");
            }
        }

        std::shared_ptr<arrow::Array> date_array, symbol_array, open_array, high_array, low_array,
            close_array, adj_array, volume_array, dividend_array, split_array;

        if (!date_builder.Finish(&date_array).ok() || !symbol_builder.Finish(&symbol_array).ok() ||
            !open_builder.Finish(&open_array).ok() || !high_builder.Finish(&high_array).ok() ||
            !low_builder.Finish(&low_array).ok() || !close_builder.Finish(&close_array).ok() ||
            !adj_builder.Finish(&adj_array).ok() || !volume_builder.Finish(&volume_array).ok() ||
            !dividend_builder.Finish(&dividend_array).ok() ||
            !split_builder.Finish(&split_array).ok()) {
            return handle_builder_error("finish");
        }

        return arrow::Table::Make(DataConversionUtils::price_bar_schema(),
                                  {date_array, symbol_array, open_array, high_array, low_array,
                                   close_array, adj_array, volume_array, dividend_array,
                                   split_array});

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during Arrow table conversion: " + std::string(e.what()),
            "PostgresPriceStore");
    }
}

}  // namespace fund_ngin
