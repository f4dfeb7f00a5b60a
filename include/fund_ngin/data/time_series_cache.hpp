// include/fund_ngin/data/time_series_cache.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/market_data_gateway.hpp"
#include "fund_ngin/data/price_store.hpp"

namespace fund_ngin {

/**
 * @brief Fetch, retry and rate-limit settings of the price cache
 */
struct CacheConfig : public ConfigBase {
    int batch_days{100};               // Days per gateway request
    int max_retries{3};                // Retries after the first attempt
    int initial_backoff_ms{1000};
    double backoff_multiplier{2.0};
    int inter_batch_delay_ms{500};
    int inter_symbol_delay_ms{1000};
    int stale_after_days{5};           // Cached quote older than this is flagged stale

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["batch_days"] = batch_days;
        j["max_retries"] = max_retries;
        j["initial_backoff_ms"] = initial_backoff_ms;
        j["backoff_multiplier"] = backoff_multiplier;
        j["inter_batch_delay_ms"] = inter_batch_delay_ms;
        j["inter_symbol_delay_ms"] = inter_symbol_delay_ms;
        j["stale_after_days"] = stale_after_days;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("batch_days"))
            batch_days = j.at("batch_days").get<int>();
        if (j.contains("max_retries"))
            max_retries = j.at("max_retries").get<int>();
        if (j.contains("initial_backoff_ms"))
            initial_backoff_ms = j.at("initial_backoff_ms").get<int>();
        if (j.contains("backoff_multiplier"))
            backoff_multiplier = j.at("backoff_multiplier").get<double>();
        if (j.contains("inter_batch_delay_ms"))
            inter_batch_delay_ms = j.at("inter_batch_delay_ms").get<int>();
        if (j.contains("inter_symbol_delay_ms"))
            inter_symbol_delay_ms = j.at("inter_symbol_delay_ms").get<int>();
        if (j.contains("stale_after_days"))
            stale_after_days = j.at("stale_after_days").get<int>();
    }
};

/**
 * @brief Blocking wait used for backoff and rate limiting
 */
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class ThreadSleeper : public Sleeper {
public:
    void sleep_for(std::chrono::milliseconds duration) override;
};

/**
 * @brief A gateway window that exhausted its retries
 */
struct FailedWindow {
    Timestamp start;
    Timestamp end;
    ErrorCode code{ErrorCode::NONE};
    std::string message;
    int attempts{0};
};

/**
 * @brief Outcome of one incremental fetch
 */
struct FetchReport {
    std::string symbol;
    int windows_attempted{0};
    int windows_succeeded{0};
    std::vector<FailedWindow> failed_windows;
    size_t rows_written{0};
    bool cancelled{false};
    bool up_to_date{false};
    std::string error;  // set when the fetch failed outside the gateway

    bool complete() const {
        return failed_windows.empty() && !cancelled && error.empty();
    }

    nlohmann::json to_json() const;
};

struct CacheStats {
    size_t total_symbols{0};
    int64_t total_records{0};
    std::optional<Timestamp> earliest;
    std::optional<Timestamp> latest;
    std::vector<SymbolMetadata> symbols;

    nlohmann::json to_json() const;
};

/**
 * @brief Incrementally maintained store of daily bars
 *
 * Only dates outside the recorded coverage are requested from the gateway.
 * Coverage in SymbolMetadata grows only through successfully fetched windows
 * adjacent to it, so a failed window is requested again on the next run.
 */
class TimeSeriesCache {
public:
    TimeSeriesCache(std::shared_ptr<MarketDataGateway> gateway,
                    std::shared_ptr<PriceStore> store, CacheConfig config = CacheConfig{},
                    std::shared_ptr<Sleeper> sleeper = nullptr);

    /**
     * @brief Bring the cache up to date for [start, end]
     * @param batch_days Window size in days, 0 uses the configured default
     * @param force_refresh Drop the symbol's rows and metadata first
     * @param cancel_flag Checked between windows, may be null
     */
    Result<FetchReport> fetch(const std::string& symbol, const Timestamp& start,
                              const Timestamp& end, int batch_days = 0,
                              bool force_refresh = false,
                              const std::atomic<bool>* cancel_flag = nullptr);

    /**
     * @brief Fetch several symbols; a failing symbol does not stop the others
     * @return One report per symbol that was started
     */
    std::vector<FetchReport> bulk_fetch(const std::vector<std::string>& symbols,
                                        const Timestamp& start, const Timestamp& end,
                                        int batch_days = 0,
                                        const std::atomic<bool>* cancel_flag = nullptr);

    Result<std::vector<PriceBar>> get_history(const std::string& symbol, const Timestamp& start,
                                              const Timestamp& end) const;

    /**
     * @brief Close of the latest bar on or before as_of
     *
     * Without a cached bar the fallback price is returned as a stale quote;
     * without a fallback the lookup fails with DATA_NOT_FOUND.
     */
    Result<PriceQuote> latest_price(const std::string& symbol, const Timestamp& as_of,
                                    std::optional<Price> fallback = std::nullopt) const;

    Result<std::optional<SymbolMetadata>> get_metadata(const std::string& symbol) const;

    Result<CacheStats> get_stats() const;

    /**
     * @brief Delete bars dated before cutoff and shrink coverage accordingly
     * @return Number of rows removed
     */
    Result<int64_t> prune_before(const Timestamp& cutoff);

    const CacheConfig& config() const { return config_; }

private:
    struct Window {
        Timestamp start;
        Timestamp end;
        bool succeeded{false};
    };

    static std::vector<Window> split_windows(const Timestamp& start, const Timestamp& end,
                                             int batch_days);

    /**
     * @brief Fetch and store one window with retry and backoff
     */
    Result<size_t> fetch_window(const std::string& symbol, const Window& window,
                                const std::atomic<bool>* cancel_flag, int& attempts);

    /**
     * @brief Run the windows of one gap in order, filling the report
     */
    void run_windows(const std::string& symbol, std::vector<Window>& windows,
                     FetchReport& report, const std::atomic<bool>* cancel_flag);

    static bool is_cancelled(const std::atomic<bool>* cancel_flag) {
        return cancel_flag && cancel_flag->load(std::memory_order_acquire);
    }

    std::shared_ptr<MarketDataGateway> gateway_;
    std::shared_ptr<PriceStore> store_;
    CacheConfig config_;
    std::shared_ptr<Sleeper> sleeper_;
};

}  // namespace fund_ngin
