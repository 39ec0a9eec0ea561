#pragma once

#include <map>
#include <string>
#include <vector>

#include "backtest/PositionSimulator.h"
#include "backtest/TradeReconstructor.h"

namespace stratlab {
namespace analytics {

class PerformanceMetrics {
public:
    // (end / start) ^ (1 / years) - 1, years = bars / periods_per_year
    static double cagr(const std::vector<double>& equity_curve, int periods_per_year = 252);

    // Most negative equity / running peak - 1 (0 for a flat or rising curve)
    static double maxDrawdown(const std::vector<double>& equity_curve);

    // mean / sample std * sqrt(periods_per_year); 0 when std is 0
    static double sharpe(const std::vector<double>& daily_returns, int periods_per_year = 252);

    // FLAT -> LONG transitions, with the day before the first bar treated as flat
    static int tradeCount(const std::vector<int>& position);

    static double totalReturn(const std::vector<double>& equity_curve);
    static double exposure(const std::vector<int>& position);
    static double annualizedVolatility(const std::vector<double>& daily_returns, int periods_per_year = 252);
    static double winRate(const std::vector<backtest::Trade>& trades);
    static double averageTradePnlPct(const std::vector<backtest::Trade>& trades);

    // Always reports cagr, max_drawdown, sharpe and num_trades, plus any other
    // requested metric this class knows. Unknown names are appended to `unknown`.
    static std::map<std::string, double> compute(const backtest::SimulationResult& sim,
                                                 const std::vector<backtest::Trade>& trades,
                                                 const std::vector<std::string>& requested,
                                                 std::vector<std::string>& unknown,
                                                 int periods_per_year = 252);
};

} // namespace analytics
} // namespace stratlab
