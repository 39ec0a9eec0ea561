#include "analytics/PerformanceMetrics.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>

namespace stratlab {
namespace analytics {

namespace {
std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

double sampleStdDev(const std::vector<double>& values, double& mean_out) {
    mean_out = 0.0;
    if (values.size() < 2) {
        return 0.0;
    }
    mean_out = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double sum_sq = 0.0;
    for (double v : values) {
        const double diff = v - mean_out;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / (values.size() - 1));
}
}

double PerformanceMetrics::cagr(const std::vector<double>& equity_curve, int periods_per_year) {
    if (equity_curve.empty() || periods_per_year <= 0) {
        return 0.0;
    }
    const double start = equity_curve.front();
    const double end = equity_curve.back();
    if (start <= 0.0 || end <= 0.0) {
        return 0.0;
    }
    const double years = static_cast<double>(equity_curve.size()) / periods_per_year;
    if (years <= 0.0) {
        return 0.0;
    }
    return std::pow(end / start, 1.0 / years) - 1.0;
}

double PerformanceMetrics::maxDrawdown(const std::vector<double>& equity_curve) {
    double peak = 0.0;
    double worst = 0.0;
    for (size_t i = 0; i < equity_curve.size(); ++i) {
        peak = (i == 0) ? equity_curve[i] : std::max(peak, equity_curve[i]);
        if (peak > 0.0) {
            worst = std::min(worst, equity_curve[i] / peak - 1.0);
        }
    }
    return worst;
}

double PerformanceMetrics::sharpe(const std::vector<double>& daily_returns, int periods_per_year) {
    double mean = 0.0;
    const double std_dev = sampleStdDev(daily_returns, mean);
    if (std_dev == 0.0) {
        return 0.0;
    }
    return (mean / std_dev) * std::sqrt(static_cast<double>(periods_per_year));
}

// Unlike a pandas position.diff(), whose first row is NaN, an entry on bar 0 counts
int PerformanceMetrics::tradeCount(const std::vector<int>& position) {
    int count = 0;
    int prev = 0;
    for (int p : position) {
        if (p == 1 && prev == 0) {
            ++count;
        }
        prev = p;
    }
    return count;
}

double PerformanceMetrics::totalReturn(const std::vector<double>& equity_curve) {
    return equity_curve.empty() ? 0.0 : equity_curve.back() - 1.0;
}

double PerformanceMetrics::exposure(const std::vector<int>& position) {
    if (position.empty()) {
        return 0.0;
    }
    const auto long_days = std::count(position.begin(), position.end(), 1);
    return static_cast<double>(long_days) / position.size();
}

double PerformanceMetrics::annualizedVolatility(const std::vector<double>& daily_returns, int periods_per_year) {
    double mean = 0.0;
    return sampleStdDev(daily_returns, mean) * std::sqrt(static_cast<double>(periods_per_year));
}

double PerformanceMetrics::winRate(const std::vector<backtest::Trade>& trades) {
    int closed = 0;
    int wins = 0;
    for (const auto& t : trades) {
        if (!t.pnl_pct) continue;
        ++closed;
        if (*t.pnl_pct > 0.0) ++wins;
    }
    return closed > 0 ? static_cast<double>(wins) / closed : 0.0;
}

double PerformanceMetrics::averageTradePnlPct(const std::vector<backtest::Trade>& trades) {
    int closed = 0;
    double sum = 0.0;
    for (const auto& t : trades) {
        if (!t.pnl_pct) continue;
        ++closed;
        sum += *t.pnl_pct;
    }
    return closed > 0 ? sum / closed : 0.0;
}

std::map<std::string, double> PerformanceMetrics::compute(const backtest::SimulationResult& sim,
                                                          const std::vector<backtest::Trade>& trades,
                                                          const std::vector<std::string>& requested,
                                                          std::vector<std::string>& unknown,
                                                          int periods_per_year) {
    std::map<std::string, double> metrics;
    metrics["cagr"] = cagr(sim.equity_curve, periods_per_year);
    metrics["max_drawdown"] = maxDrawdown(sim.equity_curve);
    metrics["sharpe"] = sharpe(sim.strategy_return, periods_per_year);
    metrics["num_trades"] = static_cast<double>(tradeCount(sim.position));

    for (const auto& raw : requested) {
        const std::string name = normalizeName(raw);
        if (metrics.count(name)) {
            continue;
        }
        if (name == "total_return") {
            metrics[name] = totalReturn(sim.equity_curve);
        } else if (name == "exposure") {
            metrics[name] = exposure(sim.position);
        } else if (name == "volatility") {
            metrics[name] = annualizedVolatility(sim.strategy_return, periods_per_year);
        } else if (name == "win_rate") {
            metrics[name] = winRate(trades);
        } else if (name == "avg_trade_pnl_pct") {
            metrics[name] = averageTradePnlPct(trades);
        } else {
            unknown.push_back(raw);
        }
    }
    return metrics;
}

} // namespace analytics
} // namespace stratlab
