// include/fund_ngin/data/postgres_price_store.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/price_store.hpp"

namespace fund_ngin {

/**
 * @brief Database configuration
 */
struct DatabaseConfig : public ConfigBase {
    std::string host{"localhost"};
    std::string port{"5432"};
    std::string username;
    std::string password;
    std::string name{"fund_ngin"};
    std::string price_table{"price_history"};
    std::string metadata_table{"symbol_metadata"};

    std::string get_connection_string() const {
        return "postgresql://" + username + ":" + password + "@" + host + ":" + port + "/" + name;
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["host"] = host;
        j["port"] = port;
        j["username"] = username;
        j["password"] = password;
        j["name"] = name;
        j["price_table"] = price_table;
        j["metadata_table"] = metadata_table;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port"))
            port = j.at("port").get<std::string>();
        if (j.contains("username"))
            username = j.at("username").get<std::string>();
        if (j.contains("password"))
            password = j.at("password").get<std::string>();
        if (j.contains("name"))
            name = j.at("name").get<std::string>();
        if (j.contains("price_table"))
            price_table = j.at("price_table").get<std::string>();
        if (j.contains("metadata_table"))
            metadata_table = j.at("metadata_table").get<std::string>();
    }
};

/**
 * @brief PriceStore backed by PostgreSQL
 *
 * Query results are materialized as Arrow tables and converted to PriceBars
 * through DataConversionUtils.
 */
class PostgresPriceStore : public PriceStore {
public:
    explicit PostgresPriceStore(DatabaseConfig config);

    ~PostgresPriceStore() override;

    PostgresPriceStore(const PostgresPriceStore&) = delete;
    PostgresPriceStore& operator=(const PostgresPriceStore&) = delete;
    PostgresPriceStore(PostgresPriceStore&&) = delete;
    PostgresPriceStore& operator=(PostgresPriceStore&&) = delete;

    Result<void> connect();

    void disconnect();

    bool is_connected() const;

    /**
     * @brief Create the price and metadata tables if they do not exist
     */
    Result<void> ensure_schema();

    Result<size_t> upsert_bars(const std::vector<PriceBar>& bars) override;

    Result<std::vector<PriceBar>> get_bars(const std::string& symbol, const Timestamp& start,
                                           const Timestamp& end) override;

    Result<std::optional<PriceBar>> latest_bar(const std::string& symbol,
                                               const Timestamp& as_of) override;

    Result<int64_t> count_bars(const std::string& symbol) override;

    Result<std::optional<SymbolMetadata>> get_metadata(const std::string& symbol) override;

    Result<void> put_metadata(const SymbolMetadata& metadata) override;

    Result<std::vector<SymbolMetadata>> all_metadata() override;

    Result<void> delete_symbol(const std::string& symbol) override;

    Result<int64_t> delete_before(const Timestamp& cutoff) override;

private:
    Result<void> validate_connection() const;

    Result<std::shared_ptr<arrow::Table>> convert_to_arrow_table(const pqxx::result& result) const;

    Result<std::vector<PriceBar>> bars_from_result(const pqxx::result& result) const;

    Result<std::vector<SymbolMetadata>> metadata_from_result(const pqxx::result& result) const;

    std::string price_table() const;
    std::string metadata_table() const;

    DatabaseConfig config_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace fund_ngin
