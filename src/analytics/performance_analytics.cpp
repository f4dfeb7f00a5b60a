// src/analytics/performance_analytics.cpp

#include "fund_ngin/analytics/performance_analytics.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <numeric>
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

namespace {

nlohmann::json series_to_json(const Series& series) {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& [date, value] : series) {
        points.push_back({{"date", core::format_date(date)}, {"value", value}});
    }
    return points;
}

/**
 * @brief 2x2 sample covariance of two equally long vectors
 */
Eigen::Matrix2d sample_covariance(const std::vector<double>& a, const std::vector<double>& b) {
    const Eigen::Index n = static_cast<Eigen::Index>(a.size());
    Eigen::MatrixXd data(n, 2);
    for (Eigen::Index i = 0; i < n; ++i) {
        data(i, 0) = a[static_cast<size_t>(i)];
        data(i, 1) = b[static_cast<size_t>(i)];
    }
    Eigen::MatrixXd centered = data.rowwise() - data.colwise().mean();
    return (centered.transpose() * centered) / static_cast<double>(n - 1);
}

}  // namespace

nlohmann::json DrawdownEpisode::to_json() const {
    nlohmann::json j;
    j["peak_date"] = core::format_date(peak_date);
    j["trough_date"] = core::format_date(trough_date);
    j["recovery_date"] = recovery_date ? nlohmann::json(core::format_date(*recovery_date))
                                       : nlohmann::json(nullptr);
    j["peak_value"] = peak_value;
    j["trough_value"] = trough_value;
    j["depth"] = depth;
    return j;
}

nlohmann::json RiskMetrics::to_json() const {
    nlohmann::json j;
    j["observations"] = observations;
    j["total_return"] = total_return;
    j["annualized_return"] = annualized_return;
    j["volatility_daily"] = volatility_daily;
    j["volatility_annual"] = volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["sortino_ratio"] = sortino_ratio;
    j["max_drawdown"] = max_drawdown;
    j["calmar_ratio"] = calmar_ratio;
    j["var_95"] = var_95;
    j["var_99"] = var_99;
    j["cvar_95"] = cvar_95;
    j["cvar_99"] = cvar_99;
    j["win_rate"] = win_rate;
    j["best_day"] = best_day;
    j["worst_day"] = worst_day;
    return j;
}

nlohmann::json BenchmarkMetrics::to_json() const {
    nlohmann::json j;
    j["observations"] = observations;
    j["beta"] = beta;
    j["alpha_simple"] = alpha;
    j["jensens_alpha"] = jensens_alpha;
    j["tracking_error"] = tracking_error;
    j["information_ratio"] = information_ratio;
    j["correlation"] = correlation;
    j["win_rate"] = win_rate;
    j["avg_excess_return"] = avg_excess_return;
    j["total_excess_return"] = total_excess_return;
    return j;
}

PerformanceAnalytics::PerformanceAnalytics(AnalyticsConfig config) : config_(std::move(config)) {}

// ========== Helpers ==========

double PerformanceAnalytics::mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double PerformanceAnalytics::sample_std_dev(const std::vector<double>& values) const {
    if (values.size() < 2) {
        return 0.0;
    }
    double m = mean(values);
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - m) * (v - m);
    }
    return std::sqrt(sq_sum / (values.size() - 1));
}

// ========== Returns ==========

std::vector<double> PerformanceAnalytics::daily_returns(const Series& values) const {
    std::vector<double> returns;
    if (values.size() < 2) {
        return returns;
    }
    returns.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1].second > 0.0) {
            returns.push_back(values[i].second / values[i - 1].second - 1.0);
        }
    }
    return returns;
}

Series PerformanceAnalytics::return_series(const Series& values) const {
    Series returns;
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1].second > 0.0) {
            returns.emplace_back(values[i].first, values[i].second / values[i - 1].second - 1.0);
        }
    }
    return returns;
}

double PerformanceAnalytics::cumulative_return(const std::vector<double>& returns) const {
    double growth = 1.0;
    for (double r : returns) {
        growth *= 1.0 + r;
    }
    return growth - 1.0;
}

double PerformanceAnalytics::annualized_return(const std::vector<double>& returns) const {
    return mean(returns) * periods();
}

// ========== Risk ==========

double PerformanceAnalytics::volatility(const std::vector<double>& returns) const {
    return sample_std_dev(returns) * std::sqrt(periods());
}

double PerformanceAnalytics::downside_deviation(const std::vector<double>& returns) const {
    std::vector<double> negative;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(negative),
                 [](double r) { return r < 0.0; });
    return sample_std_dev(negative) * std::sqrt(periods());
}

double PerformanceAnalytics::sharpe_ratio(const std::vector<double>& returns) const {
    double vol = volatility(returns);
    if (vol <= 0.0) {
        return 0.0;
    }
    return (annualized_return(returns) - config_.risk_free_rate) / vol;
}

double PerformanceAnalytics::sortino_ratio(const std::vector<double>& returns) const {
    double downside = downside_deviation(returns);
    if (downside <= 0.0) {
        return 0.0;
    }
    return (annualized_return(returns) - config_.risk_free_rate) / downside;
}

Series PerformanceAnalytics::drawdown_series(const Series& values) const {
    Series drawdowns;
    drawdowns.reserve(values.size());
    if (values.empty()) {
        return drawdowns;
    }

    double peak = values[0].second;
    for (const auto& [date, value] : values) {
        peak = std::max(peak, value);
        double drawdown = (value < peak && peak > 0) ? (peak - value) / peak : 0.0;
        drawdowns.emplace_back(date, drawdown);
    }
    return drawdowns;
}

double PerformanceAnalytics::max_drawdown(const Series& values) const {
    double worst = 0.0;
    for (const auto& point : drawdown_series(values)) {
        worst = std::max(worst, point.second);
    }
    return worst;
}

std::vector<DrawdownEpisode> PerformanceAnalytics::drawdown_episodes(const Series& values) const {
    std::vector<DrawdownEpisode> episodes;
    if (values.empty()) {
        return episodes;
    }

    Timestamp peak_date = values[0].first;
    double peak = values[0].second;
    std::optional<DrawdownEpisode> open;

    for (const auto& [date, value] : values) {
        if (value >= peak) {
            if (open) {
                open->recovery_date = date;
                episodes.push_back(*open);
                open.reset();
            }
            peak = value;
            peak_date = date;
            continue;
        }

        if (!open) {
            open = DrawdownEpisode{};
            open->peak_date = peak_date;
            open->peak_value = peak;
            open->trough_date = date;
            open->trough_value = value;
        } else if (value < open->trough_value) {
            open->trough_date = date;
            open->trough_value = value;
        }
        open->depth = peak > 0 ? (peak - open->trough_value) / peak : 0.0;
    }

    if (open) {
        episodes.push_back(*open);
    }
    return episodes;
}

double PerformanceAnalytics::value_at_risk(const std::vector<double>& returns,
                                           double confidence) const {
    if (returns.empty()) {
        return 0.0;
    }
    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());

    const double position = (1.0 - confidence) * (sorted.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double weight = position - lower;
    return sorted[lower] + weight * (sorted[upper] - sorted[lower]);
}

double PerformanceAnalytics::conditional_var(const std::vector<double>& returns,
                                             double confidence) const {
    if (returns.empty()) {
        return 0.0;
    }
    const double var = value_at_risk(returns, confidence);
    std::vector<double> tail;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(tail),
                 [var](double r) { return r <= var; });
    return tail.empty() ? var : mean(tail);
}

double PerformanceAnalytics::calmar_ratio(const std::vector<double>& returns,
                                          const Series& values) const {
    double drawdown = max_drawdown(values);
    if (drawdown <= 0.0) {
        return 0.0;
    }
    return annualized_return(returns) / drawdown;
}

double PerformanceAnalytics::win_rate(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    auto wins = std::count_if(returns.begin(), returns.end(), [](double r) { return r > 0.0; });
    return static_cast<double>(wins) / returns.size() * 100.0;
}

RiskMetrics PerformanceAnalytics::risk_metrics(const Series& values) const {
    RiskMetrics metrics;
    auto returns = daily_returns(values);
    metrics.observations = returns.size();
    if (returns.empty()) {
        return metrics;
    }

    metrics.total_return = cumulative_return(returns);
    metrics.annualized_return = annualized_return(returns);
    metrics.volatility_daily = sample_std_dev(returns);
    metrics.volatility = volatility(returns);
    metrics.sharpe_ratio = sharpe_ratio(returns);
    metrics.sortino_ratio = sortino_ratio(returns);
    metrics.max_drawdown = max_drawdown(values);
    metrics.calmar_ratio = calmar_ratio(returns, values);
    metrics.var_95 = value_at_risk(returns, 0.95);
    metrics.var_99 = value_at_risk(returns, 0.99);
    metrics.cvar_95 = conditional_var(returns, 0.95);
    metrics.cvar_99 = conditional_var(returns, 0.99);
    metrics.win_rate = win_rate(returns);
    auto [worst, best] = std::minmax_element(returns.begin(), returns.end());
    metrics.best_day = *best;
    metrics.worst_day = *worst;
    return metrics;
}

// ========== Benchmark ==========

AlignedSeries PerformanceAnalytics::align(const Series& portfolio, const Series& benchmark) const {
    std::map<Timestamp, double> benchmark_by_date;
    for (const auto& [date, value] : benchmark) {
        benchmark_by_date[core::to_date(date)] = value;
    }

    AlignedSeries aligned;
    for (const auto& [date, value] : portfolio) {
        auto it = benchmark_by_date.find(core::to_date(date));
        if (it == benchmark_by_date.end()) {
            continue;
        }
        aligned.dates.push_back(it->first);
        aligned.portfolio.push_back(value);
        aligned.benchmark.push_back(it->second);
    }
    return aligned;
}

Result<double> PerformanceAnalytics::beta(const std::vector<double>& portfolio_returns,
                                          const std::vector<double>& benchmark_returns) const {
    if (portfolio_returns.size() != benchmark_returns.size() || portfolio_returns.size() < 2) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Beta needs two equally long return series of 2+ points",
                                  "PerformanceAnalytics");
    }
    Eigen::Matrix2d cov = sample_covariance(portfolio_returns, benchmark_returns);
    if (cov(1, 1) <= 0.0) {
        return 0.0;
    }
    return cov(0, 1) / cov(1, 1);
}

Result<double> PerformanceAnalytics::correlation(
    const std::vector<double>& portfolio_returns,
    const std::vector<double>& benchmark_returns) const {
    if (portfolio_returns.size() != benchmark_returns.size() || portfolio_returns.size() < 2) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Correlation needs two equally long return series of 2+ points",
                                  "PerformanceAnalytics");
    }
    Eigen::Matrix2d cov = sample_covariance(portfolio_returns, benchmark_returns);
    double denominator = std::sqrt(cov(0, 0) * cov(1, 1));
    if (denominator <= 0.0) {
        return 0.0;
    }
    return cov(0, 1) / denominator;
}

Result<BenchmarkMetrics> PerformanceAnalytics::benchmark_metrics(const Series& portfolio,
                                                                 const Series& benchmark) const {
    AlignedSeries aligned = align(portfolio, benchmark);

    std::vector<double> p;
    std::vector<double> b;
    for (size_t i = 1; i < aligned.size(); ++i) {
        if (aligned.portfolio[i - 1] > 0.0 && aligned.benchmark[i - 1] > 0.0) {
            p.push_back(aligned.portfolio[i] / aligned.portfolio[i - 1] - 1.0);
            b.push_back(aligned.benchmark[i] / aligned.benchmark[i - 1] - 1.0);
        }
    }
    if (p.size() < 2) {
        return make_error<BenchmarkMetrics>(
            ErrorCode::INVALID_ARGUMENT,
            "Need at least 2 common returns, have " + std::to_string(p.size()),
            "PerformanceAnalytics");
    }

    BenchmarkMetrics metrics;
    metrics.observations = p.size();

    auto beta_result = beta(p, b);
    if (beta_result.is_error()) {
        return forward_error<BenchmarkMetrics>(beta_result);
    }
    metrics.beta = beta_result.value();

    auto corr = correlation(p, b);
    if (corr.is_error()) {
        return forward_error<BenchmarkMetrics>(corr);
    }
    metrics.correlation = corr.value();

    std::vector<double> excess(p.size());
    for (size_t i = 0; i < p.size(); ++i) {
        excess[i] = p[i] - b[i];
    }

    const double rf = config_.risk_free_rate;
    metrics.avg_excess_return = mean(excess);
    metrics.total_excess_return = std::accumulate(excess.begin(), excess.end(), 0.0);
    metrics.alpha = metrics.avg_excess_return * periods();
    metrics.jensens_alpha =
        annualized_return(p) - (rf + metrics.beta * (annualized_return(b) - rf));
    metrics.tracking_error = sample_std_dev(excess) * std::sqrt(periods());
    metrics.information_ratio =
        metrics.tracking_error > 0.0 ? metrics.alpha / metrics.tracking_error : 0.0;
    metrics.win_rate = win_rate(excess);
    return metrics;
}

std::vector<ComparisonPoint> PerformanceAnalytics::benchmark_comparison(
    const Series& portfolio, const Series& benchmark) const {
    std::vector<ComparisonPoint> points;
    AlignedSeries aligned = align(portfolio, benchmark);
    if (aligned.size() == 0 || aligned.portfolio[0] <= 0.0 || aligned.benchmark[0] <= 0.0) {
        return points;
    }

    points.reserve(aligned.size());
    for (size_t i = 0; i < aligned.size(); ++i) {
        ComparisonPoint point;
        point.date = aligned.dates[i];
        point.portfolio_cumulative = aligned.portfolio[i] / aligned.portfolio[0] - 1.0;
        point.benchmark_cumulative = aligned.benchmark[i] / aligned.benchmark[0] - 1.0;
        point.excess = point.portfolio_cumulative - point.benchmark_cumulative;
        points.push_back(point);
    }
    return points;
}

// ========== Time breakdowns ==========

std::vector<RollingPoint> PerformanceAnalytics::rolling_metrics(const Series& values,
                                                                int window) const {
    if (window <= 0) {
        window = config_.rolling_window;
    }
    Series returns = return_series(values);

    std::vector<RollingPoint> points;
    points.reserve(returns.size());
    for (size_t i = 0; i < returns.size(); ++i) {
        RollingPoint point;
        point.date = returns[i].first;
        if (i + 1 >= static_cast<size_t>(window)) {
            std::vector<double> slice;
            slice.reserve(static_cast<size_t>(window));
            for (size_t k = i + 1 - static_cast<size_t>(window); k <= i; ++k) {
                slice.push_back(returns[k].second);
            }
            point.annualized_return = annualized_return(slice);
            point.volatility = volatility(slice);
            if (*point.volatility > 0.0) {
                point.sharpe_ratio =
                    (*point.annualized_return - config_.risk_free_rate) / *point.volatility;
            }
        }
        points.push_back(point);
    }
    return points;
}

std::vector<MonthlyReturn> PerformanceAnalytics::monthly_returns(const Series& values) const {
    std::vector<MonthlyReturn> months;
    if (values.empty()) {
        return months;
    }

    // Last value of each month, in order
    std::map<std::pair<int, int>, double> month_end;
    for (const auto& [date, value] : values) {
        month_end[core::year_month(date)] = value;
    }

    double previous = values.front().second;
    for (const auto& [key, value] : month_end) {
        MonthlyReturn month;
        month.year = key.first;
        month.month = key.second;
        month.value = previous > 0.0 ? value / previous - 1.0 : 0.0;
        months.push_back(month);
        previous = value;
    }
    return months;
}

nlohmann::json PerformanceAnalytics::performance_payload(const Series& values,
                                                         const Series* benchmark) const {
    nlohmann::json payload;
    payload["nav_series"] = series_to_json(values);
    payload["risk_metrics"] = risk_metrics(values).to_json();

    nlohmann::json episodes = nlohmann::json::array();
    for (const auto& episode : drawdown_episodes(values)) {
        episodes.push_back(episode.to_json());
    }
    payload["drawdown_episodes"] = episodes;
    payload["drawdown_series"] = series_to_json(drawdown_series(values));

    nlohmann::json monthly = nlohmann::json::array();
    for (const auto& month : monthly_returns(values)) {
        monthly.push_back({{"year", month.year}, {"month", month.month}, {"return", month.value}});
    }
    payload["monthly_returns"] = monthly;

    if (benchmark) {
        nlohmann::json comparison = nlohmann::json::array();
        for (const auto& point : benchmark_comparison(values, *benchmark)) {
            comparison.push_back({{"date", core::format_date(point.date)},
                                  {"portfolio", point.portfolio_cumulative},
                                  {"benchmark", point.benchmark_cumulative},
                                  {"excess", point.excess}});
        }
        payload["benchmark_comparison"] = comparison;

        auto relative = benchmark_metrics(values, *benchmark);
        payload["benchmark_metrics"] =
            relative.is_ok() ? relative.value().to_json() : nlohmann::json(nullptr);
    }
    return payload;
}

}  // namespace fund_ngin
