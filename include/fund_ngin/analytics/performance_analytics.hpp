// include/fund_ngin/analytics/performance_analytics.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"

namespace fund_ngin {

struct AnalyticsConfig : public ConfigBase {
    double risk_free_rate{0.0};  // annual, decimal
    int periods_per_year{252};
    int rolling_window{30};      // observations

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["risk_free_rate"] = risk_free_rate;
        j["periods_per_year"] = periods_per_year;
        j["rolling_window"] = rolling_window;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("risk_free_rate"))
            risk_free_rate = j.at("risk_free_rate").get<double>();
        if (j.contains("periods_per_year"))
            periods_per_year = j.at("periods_per_year").get<int>();
        if (j.contains("rolling_window"))
            rolling_window = j.at("rolling_window").get<int>();
    }
};

/**
 * @brief Peak-to-trough decline and its recovery, if any
 */
struct DrawdownEpisode {
    Timestamp peak_date;
    Timestamp trough_date;
    std::optional<Timestamp> recovery_date;  // empty while unrecovered
    double peak_value{0.0};
    double trough_value{0.0};
    double depth{0.0};  // (peak - trough) / peak

    bool recovered() const { return recovery_date.has_value(); }

    nlohmann::json to_json() const;
};

/**
 * @brief Return and risk statistics of one value series
 * Returns are decimals; VaR and CVaR are signed (a loss is negative).
 */
struct RiskMetrics {
    size_t observations{0};
    double total_return{0.0};
    double annualized_return{0.0};
    double volatility_daily{0.0};
    double volatility{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double max_drawdown{0.0};
    double calmar_ratio{0.0};
    double var_95{0.0};
    double var_99{0.0};
    double cvar_95{0.0};
    double cvar_99{0.0};
    double win_rate{0.0};  // percent of positive days
    double best_day{0.0};
    double worst_day{0.0};

    nlohmann::json to_json() const;
};

struct BenchmarkMetrics {
    size_t observations{0};
    double beta{0.0};
    double alpha{0.0};  // annualized mean excess return
    double jensens_alpha{0.0};
    double tracking_error{0.0};
    double information_ratio{0.0};
    double correlation{0.0};
    double win_rate{0.0};  // percent of days beating the benchmark
    double avg_excess_return{0.0};
    double total_excess_return{0.0};

    nlohmann::json to_json() const;
};

struct RollingPoint {
    Timestamp date;
    std::optional<double> annualized_return;
    std::optional<double> volatility;
    std::optional<double> sharpe_ratio;
};

struct MonthlyReturn {
    int year{0};
    int month{0};
    double value{0.0};
};

struct ComparisonPoint {
    Timestamp date;
    double portfolio_cumulative{0.0};
    double benchmark_cumulative{0.0};
    double excess{0.0};
};

/**
 * @brief Two series inner-joined by date
 */
struct AlignedSeries {
    std::vector<Timestamp> dates;
    std::vector<double> portfolio;
    std::vector<double> benchmark;

    size_t size() const { return dates.size(); }
};

/**
 * @brief Stateless return and risk calculations over dated value series
 *
 * All methods are const. Statistics that need more data than given return 0
 * rather than failing; benchmark statistics report the shortfall as an error.
 */
class PerformanceAnalytics {
public:
    explicit PerformanceAnalytics(AnalyticsConfig config = AnalyticsConfig{});

    // ========== Returns ==========

    /**
     * @brief r_t = v_t / v_{t-1} - 1, skipping non-positive bases
     */
    std::vector<double> daily_returns(const Series& values) const;

    /**
     * @brief Daily returns dated at the later observation
     */
    Series return_series(const Series& values) const;

    /**
     * @brief Compounded product of returns
     */
    double cumulative_return(const std::vector<double>& returns) const;

    double annualized_return(const std::vector<double>& returns) const;

    // ========== Risk ==========

    /**
     * @brief Annualized sample standard deviation
     */
    double volatility(const std::vector<double>& returns) const;

    /**
     * @brief Annualized sample standard deviation of the negative returns
     */
    double downside_deviation(const std::vector<double>& returns) const;

    double sharpe_ratio(const std::vector<double>& returns) const;

    double sortino_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Drawdown from the running peak at each date, as a positive decimal
     */
    Series drawdown_series(const Series& values) const;

    double max_drawdown(const Series& values) const;

    std::vector<DrawdownEpisode> drawdown_episodes(const Series& values) const;

    /**
     * @brief Lower-tail percentile of returns with linear interpolation
     * @param confidence 0.95 reads the 5th percentile
     */
    double value_at_risk(const std::vector<double>& returns, double confidence) const;

    /**
     * @brief Mean of the returns at or below the VaR
     */
    double conditional_var(const std::vector<double>& returns, double confidence) const;

    double calmar_ratio(const std::vector<double>& returns, const Series& values) const;

    double win_rate(const std::vector<double>& returns) const;

    RiskMetrics risk_metrics(const Series& values) const;

    // ========== Benchmark ==========

    AlignedSeries align(const Series& portfolio, const Series& benchmark) const;

    /**
     * @brief Cov(p, b) / Var(b) of two equally long return vectors
     */
    Result<double> beta(const std::vector<double>& portfolio_returns,
                        const std::vector<double>& benchmark_returns) const;

    Result<double> correlation(const std::vector<double>& portfolio_returns,
                               const std::vector<double>& benchmark_returns) const;

    /**
     * @brief Alpha, beta and relative statistics of two value series
     * @return INVALID_ARGUMENT when fewer than two common returns exist
     */
    Result<BenchmarkMetrics> benchmark_metrics(const Series& portfolio,
                                               const Series& benchmark) const;

    /**
     * @brief Cumulative portfolio, benchmark and excess return at each common date
     */
    std::vector<ComparisonPoint> benchmark_comparison(const Series& portfolio,
                                                      const Series& benchmark) const;

    // ========== Time breakdowns ==========

    /**
     * @brief Trailing-window statistics; empty until the window is full
     * @param window Observations per window, 0 uses the configured default
     */
    std::vector<RollingPoint> rolling_metrics(const Series& values, int window = 0) const;

    /**
     * @brief Month-end to month-end returns
     * The first month is measured from the first observation.
     */
    std::vector<MonthlyReturn> monthly_returns(const Series& values) const;

    /**
     * @brief Series, risk metrics, drawdown episodes and, when given, benchmark data
     */
    nlohmann::json performance_payload(const Series& values,
                                       const Series* benchmark = nullptr) const;

    const AnalyticsConfig& config() const { return config_; }

private:
    double mean(const std::vector<double>& values) const;

    double sample_std_dev(const std::vector<double>& values) const;

    double periods() const { return static_cast<double>(config_.periods_per_year); }

    AnalyticsConfig config_;
};

}  // namespace fund_ngin
