// include/fund_ngin/core/config_loader.hpp
#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "fund_ngin/analytics/performance_analytics.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/data/fx_converter.hpp"
#include "fund_ngin/data/indexer_gateway.hpp"
#include "fund_ngin/data/market_data_gateway.hpp"
#include "fund_ngin/data/postgres_price_store.hpp"
#include "fund_ngin/data/time_series_cache.hpp"
#include "fund_ngin/fund/fee_engine.hpp"
#include "fund_ngin/ledger/bond_indexation_engine.hpp"
#include "fund_ngin/ledger/position_ledger.hpp"
#include "fund_ngin/portfolio/portfolio_context.hpp"

namespace fund_ngin {

/**
 * @brief Complete configuration of one fund
 *
 * Contains all configuration values loaded from:
 * - config/defaults.json (shared defaults)
 * - config/portfolios/{name}/portfolio.json
 */
struct FundConfig {
    // Portfolio identification
    std::string portfolio_name{"default"};
    std::string base_currency{"BRL"};

    LoggerConfig logger;
    DatabaseConfig database;

    // Market data
    YahooConfig yahoo;
    BcbConfig bcb;
    CacheConfig cache;
    FxConfig fx;

    // Books
    LedgerConfig ledger;
    BondConfig bonds;
    FeeConfig fees;

    AnalyticsConfig analytics;

    /**
     * @brief Settings handed to a PortfolioContext
     */
    PortfolioConfig portfolio_config() const {
        PortfolioConfig config;
        config.name = portfolio_name;
        config.base_currency = base_currency;
        config.ledger = ledger;
        config.fees = fees;
        config.fx = fx;
        return config;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["portfolio_name"] = portfolio_name;
        j["base_currency"] = base_currency;
        j["logger"] = logger.to_json();
        j["database"] = database.to_json();
        j["yahoo"] = yahoo.to_json();
        j["bcb"] = bcb.to_json();
        j["cache"] = cache.to_json();
        j["fx"] = fx.to_json();
        j["ledger"] = ledger.to_json();
        j["bonds"] = bonds.to_json();
        j["fees"] = fees.to_json();
        j["analytics"] = analytics.to_json();
        return j;
    }
};

/**
 * @brief Loads FundConfig from layered JSON files
 *
 * Values in portfolio-specific files override defaults. The database
 * password may also come from FUND_NGIN_DB_PASSWORD.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration for a specific portfolio
     * @param config_base_path Base path to config directory (e.g., "./config")
     * @param portfolio_name Name of the portfolio directory under portfolios/
     * @return Result containing FundConfig or error
     */
    static Result<FundConfig> load(const std::filesystem::path& config_base_path,
                                   const std::string& portfolio_name);

    /**
     * @brief Load configuration from a single file
     */
    static Result<FundConfig> load_file(const std::filesystem::path& config_file_path);

    /**
     * @brief Extract FundConfig from merged JSON
     */
    static Result<FundConfig> extract_config(const nlohmann::json& merged);

    /**
     * @brief Validate required fields after extraction
     */
    static Result<void> validate_config(const FundConfig& config);

    /**
     * @brief Recursively merge JSON objects
     * @param target Target JSON object (modified in place)
     * @param source Source JSON object to merge from
     *
     * For nested objects, performs deep merge. For other types, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);

    static void apply_environment(FundConfig& config);

    static void log_config_summary(const FundConfig& config);
};

}  // namespace fund_ngin
