// src/data/time_series_cache.cpp

#include "fund_ngin/data/time_series_cache.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

void ThreadSleeper::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

nlohmann::json FetchReport::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["windows_attempted"] = windows_attempted;
    j["windows_succeeded"] = windows_succeeded;
    j["rows_written"] = rows_written;
    j["cancelled"] = cancelled;
    j["up_to_date"] = up_to_date;
    if (!error.empty()) {
        j["error"] = error;
    }
    nlohmann::json failed = nlohmann::json::array();
    for (const auto& window : failed_windows) {
        failed.push_back({{"start", core::format_date(window.start)},
                          {"end", core::format_date(window.end)},
                          {"code", static_cast<int>(window.code)},
                          {"message", window.message},
                          {"attempts", window.attempts}});
    }
    j["failed_windows"] = failed;
    return j;
}

nlohmann::json CacheStats::to_json() const {
    nlohmann::json j;
    j["total_symbols"] = total_symbols;
    j["total_records"] = total_records;
    j["date_range"] = {{"start", earliest ? core::format_date(*earliest) : ""},
                       {"end", latest ? core::format_date(*latest) : ""}};
    nlohmann::json per_symbol = nlohmann::json::array();
    for (const auto& meta : symbols) {
        per_symbol.push_back({{"symbol", meta.symbol},
                              {"records", meta.record_count},
                              {"first_date", core::format_date(meta.first_date)},
                              {"last_date", core::format_date(meta.last_date)},
                              {"last_updated", core::format_timestamp(meta.last_updated)}});
    }
    j["symbols"] = per_symbol;
    return j;
}

TimeSeriesCache::TimeSeriesCache(std::shared_ptr<MarketDataGateway> gateway,
                                 std::shared_ptr<PriceStore> store, CacheConfig config,
                                 std::shared_ptr<Sleeper> sleeper)
    : gateway_(std::move(gateway)),
      store_(std::move(store)),
      config_(std::move(config)),
      sleeper_(sleeper ? std::move(sleeper) : std::make_shared<ThreadSleeper>()) {}

std::vector<TimeSeriesCache::Window> TimeSeriesCache::split_windows(const Timestamp& start,
                                                                    const Timestamp& end,
                                                                    int batch_days) {
    std::vector<Window> windows;
    Timestamp cur = start;
    while (cur <= end) {
        Timestamp window_end = std::min(core::add_days(cur, batch_days), end);
        windows.push_back(Window{cur, window_end, false});
        cur = core::add_days(window_end, 1);
    }
    return windows;
}

Result<size_t> TimeSeriesCache::fetch_window(const std::string& symbol, const Window& window,
                                             const std::atomic<bool>* cancel_flag,
                                             int& attempts) {
    double backoff_ms = config_.initial_backoff_ms;
    const int max_attempts = std::max(0, config_.max_retries) + 1;

    for (int attempt = 1;; ++attempt) {
        ++attempts;
        auto bars = gateway_->fetch_bars(symbol, window.start, window.end);
        if (bars.is_ok()) {
            std::vector<PriceBar> in_window;
            in_window.reserve(bars.value().size());
            for (const auto& bar : bars.value()) {
                Timestamp date = core::to_date(bar.date);
                if (date < window.start || date > window.end) continue;
                PriceBar copy = bar;
                copy.symbol = symbol;
                copy.date = date;
                in_window.push_back(std::move(copy));
            }
            return store_->upsert_bars(in_window);
        }

        if (attempt >= max_attempts) {
            return forward_error<size_t>(bars);
        }
        if (is_cancelled(cancel_flag)) {
            return make_error<size_t>(ErrorCode::CANCELLED, "Fetch cancelled during retry",
                                      "TimeSeriesCache");
        }

        WARN("Attempt " << attempt << "/" << max_attempts << " for " << symbol << " "
                        << core::format_date(window.start) << ".."
                        << core::format_date(window.end)
                        << " failed: " << bars.error()->what() << "; retrying in "
                        << static_cast<int64_t>(backoff_ms) << "ms");
        sleeper_->sleep_for(std::chrono::milliseconds(static_cast<int64_t>(backoff_ms)));
        backoff_ms *= config_.backoff_multiplier;
    }
}

void TimeSeriesCache::run_windows(const std::string& symbol, std::vector<Window>& windows,
                                  FetchReport& report, const std::atomic<bool>* cancel_flag) {
    for (auto& window : windows) {
        if (is_cancelled(cancel_flag)) {
            report.cancelled = true;
            return;
        }
        if (report.windows_attempted > 0) {
            sleeper_->sleep_for(std::chrono::milliseconds(config_.inter_batch_delay_ms));
        }

        ++report.windows_attempted;
        int attempts = 0;
        auto written = fetch_window(symbol, window, cancel_flag, attempts);
        if (written.is_ok()) {
            window.succeeded = true;
            ++report.windows_succeeded;
            report.rows_written += written.value();
            DEBUG(symbol << " " << core::format_date(window.start) << ".."
                         << core::format_date(window.end) << ": " << written.value() << " rows");
        } else {
            report.failed_windows.push_back(FailedWindow{window.start, window.end,
                                                         written.error()->code(),
                                                         written.error()->what(), attempts});
            WARN("Window " << core::format_date(window.start) << ".."
                           << core::format_date(window.end) << " for " << symbol
                           << " failed after " << attempts
                           << " attempts: " << written.error()->what());
            if (written.error()->code() == ErrorCode::CANCELLED) {
                report.cancelled = true;
                return;
            }
        }
    }
}

Result<FetchReport> TimeSeriesCache::fetch(const std::string& symbol, const Timestamp& start,
                                           const Timestamp& end, int batch_days,
                                           bool force_refresh,
                                           const std::atomic<bool>* cancel_flag) {
    const Timestamp first_day = core::to_date(start);
    const Timestamp last_day = core::to_date(end);
    if (symbol.empty()) {
        return make_error<FetchReport>(ErrorCode::INVALID_ARGUMENT, "Symbol is empty",
                                       "TimeSeriesCache");
    }
    if (first_day > last_day) {
        return make_error<FetchReport>(ErrorCode::INVALID_ARGUMENT,
                                       "Start date must not be after end date",
                                       "TimeSeriesCache");
    }
    const int batch = batch_days > 0 ? batch_days : config_.batch_days;
    if (batch <= 0) {
        return make_error<FetchReport>(ErrorCode::INVALID_ARGUMENT, "batch_days must be positive",
                                       "TimeSeriesCache");
    }

    FetchReport report;
    report.symbol = symbol;

    if (force_refresh) {
        auto deleted = store_->delete_symbol(symbol);
        if (deleted.is_error()) {
            return forward_error<FetchReport>(deleted);
        }
    }

    auto meta_result = store_->get_metadata(symbol);
    if (meta_result.is_error()) {
        return forward_error<FetchReport>(meta_result);
    }
    const std::optional<SymbolMetadata>& meta = meta_result.value();

    if (meta && first_day >= meta->first_date && last_day <= meta->last_date) {
        report.up_to_date = true;
        DEBUG(symbol << ": all data already cached");
        return report;
    }

    std::optional<Timestamp> covered_first;
    std::optional<Timestamp> covered_last;

    if (!meta) {
        auto windows = split_windows(first_day, last_day, batch);
        run_windows(symbol, windows, report, cancel_flag);

        // Keep the longest run of successful windows as the new coverage
        size_t best_len = 0;
        for (size_t i = 0; i < windows.size();) {
            if (!windows[i].succeeded) {
                ++i;
                continue;
            }
            size_t j = i;
            while (j + 1 < windows.size() && windows[j + 1].succeeded) ++j;
            if (j - i + 1 > best_len) {
                best_len = j - i + 1;
                covered_first = windows[i].start;
                covered_last = windows[j].end;
            }
            i = j + 1;
        }
    } else {
        covered_first = meta->first_date;
        covered_last = meta->last_date;

        if (first_day < meta->first_date) {
            auto windows =
                split_windows(first_day, core::add_days(meta->first_date, -1), batch);
            run_windows(symbol, windows, report, cancel_flag);
            for (auto it = windows.rbegin(); it != windows.rend() && it->succeeded; ++it) {
                covered_first = it->start;
            }
        }
        if (!report.cancelled && last_day > meta->last_date) {
            // Gap always starts right after coverage so it stays contiguous
            auto windows = split_windows(core::add_days(meta->last_date, 1), last_day, batch);
            run_windows(symbol, windows, report, cancel_flag);
            for (auto it = windows.begin(); it != windows.end() && it->succeeded; ++it) {
                covered_last = it->end;
            }
        }
    }

    // Today's bar may still change, so coverage never includes it
    const Timestamp coverage_cap = core::add_days(core::today(), -1);
    if (covered_last && *covered_last > coverage_cap) {
        covered_last = coverage_cap;
    }

    if (covered_first && covered_last && *covered_first <= *covered_last &&
        report.windows_attempted > 0) {
        auto count = store_->count_bars(symbol);
        if (count.is_error()) {
            return forward_error<FetchReport>(count);
        }
        SymbolMetadata updated;
        updated.symbol = symbol;
        updated.first_date = *covered_first;
        updated.last_date = *covered_last;
        updated.last_updated = std::chrono::system_clock::now();
        updated.record_count = count.value();
        auto stored = store_->put_metadata(updated);
        if (stored.is_error()) {
            return forward_error<FetchReport>(stored);
        }
    }

    if (report.complete()) {
        INFO(symbol << ": fetched " << report.rows_written << " rows in "
                    << report.windows_succeeded << " windows");
    } else {
        WARN(symbol << ": " << report.failed_windows.size() << " of "
                    << report.windows_attempted << " windows failed"
                    << (report.cancelled ? " (cancelled)" : ""));
    }
    return report;
}

std::vector<FetchReport> TimeSeriesCache::bulk_fetch(const std::vector<std::string>& symbols,
                                                     const Timestamp& start, const Timestamp& end,
                                                     int batch_days,
                                                     const std::atomic<bool>* cancel_flag) {
    std::vector<FetchReport> reports;
    INFO("Bulk fetching " << symbols.size() << " symbols");

    for (size_t i = 0; i < symbols.size(); ++i) {
        if (is_cancelled(cancel_flag)) {
            INFO("Bulk fetch cancelled after " << i << " symbols");
            break;
        }
        if (i > 0) {
            sleeper_->sleep_for(std::chrono::milliseconds(config_.inter_symbol_delay_ms));
        }

        auto result = fetch(symbols[i], start, end, batch_days, false, cancel_flag);
        if (result.is_error()) {
            ERROR("Fetch failed for " << symbols[i] << ": " << result.error()->what());
            FetchReport failed;
            failed.symbol = symbols[i];
            failed.error = result.error()->what();
            reports.push_back(std::move(failed));
            continue;
        }
        reports.push_back(result.value());
        if (reports.back().cancelled) {
            break;
        }
    }
    return reports;
}

Result<std::vector<PriceBar>> TimeSeriesCache::get_history(const std::string& symbol,
                                                           const Timestamp& start,
                                                           const Timestamp& end) const {
    return store_->get_bars(symbol, core::to_date(start), core::to_date(end));
}

Result<PriceQuote> TimeSeriesCache::latest_price(const std::string& symbol,
                                                 const Timestamp& as_of,
                                                 std::optional<Price> fallback) const {
    PriceQuote quote;
    quote.symbol = symbol;

    auto bar = store_->latest_bar(symbol, core::to_date(as_of));
    if (bar.is_ok() && bar.value()) {
        quote.price = bar.value()->close;
        quote.price_date = bar.value()->date;
        quote.source = PriceSource::CACHE;
        quote.stale = core::days_between(bar.value()->date, as_of) > config_.stale_after_days;
        return quote;
    }

    if (fallback) {
        if (bar.is_error()) {
            WARN("Price lookup for " << symbol << " failed (" << bar.error()->what()
                                     << "), using fallback " << *fallback);
        } else {
            WARN("No cached price for " << symbol << " on or before "
                                        << core::format_date(as_of) << ", using fallback "
                                        << *fallback);
        }
        quote.price = *fallback;
        quote.source = PriceSource::FALLBACK;
        quote.stale = true;
        return quote;
    }

    if (bar.is_error()) {
        return forward_error<PriceQuote>(bar);
    }
    return make_error<PriceQuote>(ErrorCode::DATA_NOT_FOUND,
                                  "No cached price for " + symbol + " on or before " +
                                      core::format_date(as_of),
                                  "TimeSeriesCache");
}

Result<std::optional<SymbolMetadata>> TimeSeriesCache::get_metadata(
    const std::string& symbol) const {
    return store_->get_metadata(symbol);
}

Result<CacheStats> TimeSeriesCache::get_stats() const {
    auto all = store_->all_metadata();
    if (all.is_error()) {
        return forward_error<CacheStats>(all);
    }

    CacheStats stats;
    stats.symbols = all.value();
    std::sort(stats.symbols.begin(), stats.symbols.end(),
              [](const SymbolMetadata& a, const SymbolMetadata& b) {
                  return a.record_count > b.record_count;
              });
    stats.total_symbols = stats.symbols.size();
    for (const auto& meta : stats.symbols) {
        stats.total_records += meta.record_count;
        if (!stats.earliest || meta.first_date < *stats.earliest) stats.earliest = meta.first_date;
        if (!stats.latest || meta.last_date > *stats.latest) stats.latest = meta.last_date;
    }
    return stats;
}

Result<int64_t> TimeSeriesCache::prune_before(const Timestamp& cutoff) {
    const Timestamp cutoff_day = core::to_date(cutoff);
    auto deleted = store_->delete_before(cutoff_day);
    if (deleted.is_error()) {
        return deleted;
    }

    auto all = store_->all_metadata();
    if (all.is_error()) {
        return forward_error<int64_t>(all);
    }
    for (auto meta : all.value()) {
        if (meta.last_date < cutoff_day) {
            auto dropped = store_->delete_symbol(meta.symbol);
            if (dropped.is_error()) return forward_error<int64_t>(dropped);
            continue;
        }
        if (meta.first_date < cutoff_day) {
            auto count = store_->count_bars(meta.symbol);
            if (count.is_error()) return forward_error<int64_t>(count);
            meta.first_date = cutoff_day;
            meta.record_count = count.value();
            auto stored = store_->put_metadata(meta);
            if (stored.is_error()) return forward_error<int64_t>(stored);
        }
    }

    INFO("Deleted " << deleted.value() << " records older than " << core::format_date(cutoff_day));
    return deleted;
}

}  // namespace fund_ngin
