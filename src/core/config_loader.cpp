// src/core/config_loader.cpp

#include "fund_ngin/core/config_loader.hpp"

#include <cstdlib>
#include <fstream>

namespace fund_ngin {

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() + ": " +
                                              e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<FundConfig> ConfigLoader::extract_config(const nlohmann::json& merged) {
    if (!merged.is_object()) {
        return make_error<FundConfig>(ErrorCode::INVALID_DATA,
                                      "Configuration root must be an object", "ConfigLoader");
    }

    try {
        FundConfig config;

        if (merged.contains("portfolio_name")) {
            config.portfolio_name = merged.at("portfolio_name").get<std::string>();
        }
        if (merged.contains("base_currency")) {
            config.base_currency = merged.at("base_currency").get<std::string>();
        }

        if (merged.contains("logger")) {
            config.logger.from_json(merged.at("logger"));
        }
        if (merged.contains("database")) {
            config.database.from_json(merged.at("database"));
        }

        // Market data
        if (merged.contains("yahoo")) {
            config.yahoo.from_json(merged.at("yahoo"));
        }
        if (merged.contains("bcb")) {
            config.bcb.from_json(merged.at("bcb"));
        }
        if (merged.contains("cache")) {
            config.cache.from_json(merged.at("cache"));
        }
        if (merged.contains("fx")) {
            config.fx.from_json(merged.at("fx"));
        } else {
            config.fx.base_currency = config.base_currency;
        }

        // Books
        if (merged.contains("ledger")) {
            config.ledger.from_json(merged.at("ledger"));
        }
        if (merged.contains("bonds")) {
            config.bonds.from_json(merged.at("bonds"));
        }
        if (merged.contains("fees")) {
            config.fees.from_json(merged.at("fees"));
        } else {
            config.fees.currency = config.base_currency;
        }

        if (merged.contains("analytics")) {
            config.analytics.from_json(merged.at("analytics"));
        }

        return config;
    } catch (const std::exception& e) {
        return make_error<FundConfig>(ErrorCode::INVALID_DATA,
                                      "Failed to extract config: " + std::string(e.what()),
                                      "ConfigLoader");
    }
}

Result<void> ConfigLoader::validate_config(const FundConfig& config) {
    if (config.portfolio_name.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Missing portfolio_name", "ConfigLoader");
    }
    if (config.base_currency.size() != 3) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "base_currency must be a 3-letter ISO code, got '" +
                                    config.base_currency + "'",
                                "ConfigLoader");
    }
    if (config.database.host.empty() || config.database.name.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Missing required database configuration fields",
                                "ConfigLoader");
    }
    if (config.cache.batch_days <= 0 || config.cache.max_retries < 0 ||
        config.cache.backoff_multiplier < 1.0) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "cache requires batch_days > 0, max_retries >= 0 and "
                                "backoff_multiplier >= 1",
                                "ConfigLoader");
    }
    if (config.fees.management_rate < 0.0 || config.fees.management_rate >= 1.0 ||
        config.fees.performance_rate < 0.0 || config.fees.performance_rate >= 1.0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Fee rates must be in [0.0, 1.0)",
                                "ConfigLoader");
    }
    if (config.fees.days_per_year <= 0.0 || config.bonds.days_per_year <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "days_per_year must be positive",
                                "ConfigLoader");
    }
    if (config.analytics.periods_per_year <= 0 || config.analytics.rolling_window < 2) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "analytics requires periods_per_year > 0 and rolling_window >= 2",
                                "ConfigLoader");
    }
    return Result<void>();
}

void ConfigLoader::apply_environment(FundConfig& config) {
    if (const char* password = std::getenv("FUND_NGIN_DB_PASSWORD")) {
        config.database.password = password;
    }
}

void ConfigLoader::log_config_summary(const FundConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }
    INFO("Config summary: portfolio=" + config.portfolio_name +
         ", base_currency=" + config.base_currency);
    INFO("Config summary: db=" + config.database.host + ":" + config.database.port + "/" +
         config.database.name + ", batch_days=" + std::to_string(config.cache.batch_days) +
         ", max_retries=" + std::to_string(config.cache.max_retries));
    INFO("Config summary: management_rate=" + std::to_string(config.fees.management_rate) +
         ", performance_rate=" + std::to_string(config.fees.performance_rate) +
         ", oversell_policy=" + oversell_policy_to_string(config.ledger.oversell_policy));
}

Result<FundConfig> ConfigLoader::load(const std::filesystem::path& config_base_path,
                                      const std::string& portfolio_name) {
    // 1. Load defaults.json
    auto defaults_path = config_base_path / "defaults.json";
    auto defaults_result = load_json_file(defaults_path);
    if (defaults_result.is_error()) {
        return make_error<FundConfig>(defaults_result.error()->code(),
                                      "Failed to load defaults.json: " +
                                          std::string(defaults_result.error()->what()),
                                      "ConfigLoader");
    }
    nlohmann::json merged = defaults_result.value();

    // 2. Portfolio overrides
    auto portfolio_json_path = config_base_path / "portfolios" / portfolio_name / "portfolio.json";
    auto portfolio_result = load_json_file(portfolio_json_path);
    if (portfolio_result.is_error()) {
        return make_error<FundConfig>(portfolio_result.error()->code(),
                                      "Failed to load portfolio.json: " +
                                          std::string(portfolio_result.error()->what()),
                                      "ConfigLoader");
    }
    merge_json(merged, portfolio_result.value());
    if (!merged.contains("portfolio_name")) {
        merged["portfolio_name"] = portfolio_name;
    }

    // 3. Extract and validate
    auto config_result = extract_config(merged);
    if (config_result.is_error()) {
        return config_result;
    }
    FundConfig config = config_result.value();
    apply_environment(config);

    auto validation_result = validate_config(config);
    if (validation_result.is_error()) {
        return make_error<FundConfig>(validation_result.error()->code(),
                                      validation_result.error()->what(), "ConfigLoader");
    }

    log_config_summary(config);
    return config;
}

Result<FundConfig> ConfigLoader::load_file(const std::filesystem::path& config_file_path) {
    auto json_result = load_json_file(config_file_path);
    if (json_result.is_error()) {
        return make_error<FundConfig>(json_result.error()->code(),
                                      "Failed to load config: " +
                                          std::string(json_result.error()->what()),
                                      "ConfigLoader");
    }

    auto config_result = extract_config(json_result.value());
    if (config_result.is_error()) {
        return config_result;
    }
    FundConfig config = config_result.value();
    apply_environment(config);

    auto validation_result = validate_config(config);
    if (validation_result.is_error()) {
        return make_error<FundConfig>(validation_result.error()->code(),
                                      validation_result.error()->what(), "ConfigLoader");
    }
    log_config_summary(config);
    return config;
}

}  // namespace fund_ngin
