// include/fund_ngin/data/fx_converter.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/time_series_cache.hpp"

namespace fund_ngin {

struct FxConfig : public ConfigBase {
    std::string base_currency{"BRL"};
    // Used when no cached bar exists, keyed by FROMTO (e.g. USDBRL)
    std::map<std::string, double> default_rates{{"USDBRL", 5.0}, {"EURBRL", 5.5}};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["base_currency"] = base_currency;
        j["default_rates"] = default_rates;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("base_currency"))
            base_currency = j.at("base_currency").get<std::string>();
        if (j.contains("default_rates"))
            default_rates = j.at("default_rates").get<std::map<std::string, double>>();
    }
};

/**
 * @brief Units of `to` per unit of `from`
 */
struct FxRate {
    std::string from;
    std::string to;
    double rate{1.0};
    std::optional<Timestamp> rate_date;
    PriceSource source{PriceSource::CACHE};
    bool stale{false};
};

/**
 * @brief Read-time currency conversion from cached FX bars
 *
 * Looks up FROMTO=X, then the inverse TOFROM=X, then the configured
 * default rates, then a cross through the base currency.
 */
class FxConverter {
public:
    explicit FxConverter(std::shared_ptr<TimeSeriesCache> cache, FxConfig config = FxConfig{});

    /**
     * @brief Market symbol of an FX pair (USD, BRL -> USDBRL=X)
     */
    static std::string pair_symbol(const std::string& from, const std::string& to);

    Result<FxRate> rate(const std::string& from, const std::string& to,
                        const Timestamp& as_of) const;

    Result<Money> convert(const Money& amount, const std::string& to,
                          const Timestamp& as_of) const;

    /**
     * @brief Rates of each currency into the target, skipping unknown pairs
     */
    std::map<std::string, double> rates_to(const std::vector<std::string>& currencies,
                                           const std::string& to, const Timestamp& as_of) const;

    const std::string& base_currency() const { return config_.base_currency; }

private:
    std::optional<FxRate> direct_rate(const std::string& from, const std::string& to,
                                      const Timestamp& as_of) const;

    std::shared_ptr<TimeSeriesCache> cache_;
    FxConfig config_;
};

}  // namespace fund_ngin
