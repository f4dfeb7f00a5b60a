// include/fund_ngin/data/market_data_gateway.hpp
#pragma once

#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/http_client.hpp"

namespace fund_ngin {

/**
 * @brief Source of daily OHLC bars
 *
 * An empty vector means the window had no trading days and is not an error.
 */
class MarketDataGateway {
public:
    virtual ~MarketDataGateway() = default;

    /**
     * @brief Fetch daily bars for a symbol
     * @param symbol Market symbol (e.g. PETR4.SA, BTC-USD, USDBRL=X)
     * @param start First date, inclusive
     * @param end Last date, inclusive
     * @return Bars sorted by date, or the transport/parse error
     */
    virtual Result<std::vector<PriceBar>> fetch_bars(const std::string& symbol,
                                                     const Timestamp& start,
                                                     const Timestamp& end) = 0;
};

struct YahooConfig : public ConfigBase {
    std::string base_url{"https://query1.finance.yahoo.com/v8/finance/chart/"};
    long timeout_seconds{30};
    std::string user_agent{"Mozilla/5.0 (fund_ngin)"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["base_url"] = base_url;
        j["timeout_seconds"] = timeout_seconds;
        j["user_agent"] = user_agent;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("base_url"))
            base_url = j.at("base_url").get<std::string>();
        if (j.contains("timeout_seconds"))
            timeout_seconds = j.at("timeout_seconds").get<long>();
        if (j.contains("user_agent"))
            user_agent = j.at("user_agent").get<std::string>();
    }
};

/**
 * @brief Yahoo Finance chart API client
 */
class YahooMarketDataGateway : public MarketDataGateway {
public:
    explicit YahooMarketDataGateway(YahooConfig config = YahooConfig{});

    Result<std::vector<PriceBar>> fetch_bars(const std::string& symbol, const Timestamp& start,
                                             const Timestamp& end) override;

    /**
     * @brief Build the request URL for a bounded window
     */
    std::string build_url(const std::string& symbol, const Timestamp& start,
                          const Timestamp& end) const;

    /**
     * @brief Parse a chart API response body
     *
     * Rows whose quote values are null are skipped. Dividends and splits are
     * attached to the bar with the same date.
     */
    static Result<std::vector<PriceBar>> parse_chart_response(const std::string& symbol,
                                                              const std::string& body);

private:
    YahooConfig config_;
};

}  // namespace fund_ngin
