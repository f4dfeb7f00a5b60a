// src/data/yahoo_market_data_gateway.cpp

#include <algorithm>
#include <map>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"
#include "fund_ngin/data/market_data_gateway.hpp"

namespace fund_ngin {

namespace {

bool is_number(const nlohmann::json& arr, size_t i) {
    return arr.is_array() && i < arr.size() && arr[i].is_number();
}

double number_at(const nlohmann::json& arr, size_t i, double fallback) {
    return is_number(arr, i) ? arr[i].get<double>() : fallback;
}

int64_t to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

}  // namespace

YahooMarketDataGateway::YahooMarketDataGateway(YahooConfig config) : config_(std::move(config)) {}

std::string YahooMarketDataGateway::build_url(const std::string& symbol, const Timestamp& start,
                                              const Timestamp& end) const {
    // period2 is exclusive, so move it past the last requested day
    int64_t period1 = to_epoch_seconds(core::to_date(start));
    int64_t period2 = to_epoch_seconds(core::add_days(core::to_date(end), 1));
    return config_.base_url + symbol + "?period1=" + std::to_string(period1) +
           "&period2=" + std::to_string(period2) + "&interval=1d&events=div,split";
}

Result<std::vector<PriceBar>> YahooMarketDataGateway::fetch_bars(const std::string& symbol,
                                                                 const Timestamp& start,
                                                                 const Timestamp& end) {
    HttpOptions options;
    options.timeout_seconds = config_.timeout_seconds;
    options.user_agent = config_.user_agent;

    auto response = http_get(build_url(symbol, start, end), options);
    if (response.is_error()) {
        return forward_error<std::vector<PriceBar>>(response);
    }
    if (response.value().status != 200) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::API_ERROR,
            "Yahoo returned HTTP " + std::to_string(response.value().status) + " for " + symbol,
            "YahooMarketDataGateway");
    }

    auto bars = parse_chart_response(symbol, response.value().body);
    if (bars.is_ok()) {
        DEBUG("Fetched " << bars.value().size() << " bars for " << symbol << " "
                         << core::format_date(start) << ".." << core::format_date(end));
    }
    return bars;
}

Result<std::vector<PriceBar>> YahooMarketDataGateway::parse_chart_response(
    const std::string& symbol, const std::string& body) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::JSON_PARSE_ERROR,
            "Malformed chart response for " + symbol + ": " + e.what(), "YahooMarketDataGateway");
    }

    std::vector<PriceBar> bars;
    try {
        if (!data.contains("chart") || !data["chart"].contains("result") ||
            !data["chart"]["result"].is_array() || data["chart"]["result"].empty()) {
            if (data.contains("chart") && data["chart"].contains("error") &&
                !data["chart"]["error"].is_null()) {
                return make_error<std::vector<PriceBar>>(
                    ErrorCode::API_ERROR,
                    "Chart API error for " + symbol + ": " + data["chart"]["error"].dump(),
                    "YahooMarketDataGateway");
            }
            return bars;
        }

        const auto& result = data["chart"]["result"][0];
        if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
            return bars;  // no trading days in window
        }
        const auto& timestamps = result["timestamp"];
        const auto& quote = result["indicators"]["quote"][0];
        nlohmann::json adjclose = nlohmann::json::array();
        if (result["indicators"].contains("adjclose")) {
            adjclose = result["indicators"]["adjclose"][0]["adjclose"];
        }

        std::map<Timestamp, double> dividends;
        std::map<Timestamp, double> splits;
        if (result.contains("events")) {
            const auto& events = result["events"];
            if (events.contains("dividends")) {
                for (const auto& [key, div] : events["dividends"].items()) {
                    auto date = core::to_date(Timestamp(std::chrono::seconds(std::stoll(key))));
                    dividends[date] = div.value("amount", 0.0);
                }
            }
            if (events.contains("splits")) {
                for (const auto& [key, split] : events["splits"].items()) {
                    double numerator = split.value("numerator", 1.0);
                    double denominator = split.value("denominator", 1.0);
                    if (denominator == 0.0) continue;
                    auto date = core::to_date(Timestamp(std::chrono::seconds(std::stoll(key))));
                    splits[date] = numerator / denominator;
                }
            }
        }

        const auto& opens = quote["open"];
        const auto& highs = quote["high"];
        const auto& lows = quote["low"];
        const auto& closes = quote["close"];
        const auto& volumes = quote["volume"];

        bars.reserve(timestamps.size());
        for (size_t i = 0; i < timestamps.size(); ++i) {
            if (!is_number(closes, i) || !timestamps[i].is_number()) {
                continue;
            }
            Timestamp date =
                core::to_date(Timestamp(std::chrono::seconds(timestamps[i].get<int64_t>())));
            double close = closes[i].get<double>();
            PriceBar bar(symbol, date, number_at(opens, i, close), number_at(highs, i, close),
                         number_at(lows, i, close), close, number_at(adjclose, i, close),
                         number_at(volumes, i, 0.0));
            auto div_it = dividends.find(date);
            if (div_it != dividends.end()) bar.dividend = div_it->second;
            auto split_it = splits.find(date);
            if (split_it != splits.end()) bar.split = split_it->second;
            bars.push_back(std::move(bar));
        }
    } catch (const std::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::JSON_PARSE_ERROR,
            "Unexpected chart layout for " + symbol + ": " + e.what(), "YahooMarketDataGateway");
    }

    std::stable_sort(bars.begin(), bars.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });
    // Intraday duplicates collapse to the last bar of the day
    std::vector<PriceBar> unique;
    unique.reserve(bars.size());
    for (auto& bar : bars) {
        if (!unique.empty() && unique.back().date == bar.date) {
            unique.back() = std::move(bar);
        } else {
            unique.push_back(std::move(bar));
        }
    }
    return unique;
}

}  // namespace fund_ngin
