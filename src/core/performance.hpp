#pragma once

#include <optional>
#include <vector>
#include "trade.hpp"

namespace backtester {

// Annualization convention for every ratio below.
constexpr double kTradingDaysPerYear = 252.0;

// Profit factor reported when there are winning trades but no losing ones.
constexpr double kProfitFactorNoLosses = 999.0;

struct PerformanceMetrics {
    double total_return{0.0};         // fraction, 0.05 = +5%
    double annualized_return{0.0};
    double volatility{0.0};           // annualized stdev of daily returns
    double sharpe{0.0};
    double sortino{0.0};
    double max_drawdown{0.0};         // <= 0, -0.2 = 20% peak-to-trough
    size_t max_drawdown_duration{0};  // bars spent below the running peak, longest stretch
    double calmar{0.0};
    size_t num_trades{0};
    size_t winning_trades{0};
    size_t losing_trades{0};
    double win_rate{0.0};             // fraction
    double profit_factor{0.0};
    double avg_trade_return_pct{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    std::optional<double> alpha;      // annualized, present only with a benchmark
    std::optional<double> beta;
};

/**
 * Pure performance statistics over a finished run.
 *
 * Degenerate inputs never throw: zero variance, no negative returns, no
 * losing trades and similar cases fall back to 0 (or kProfitFactorNoLosses)
 * as documented per field. The only error is an unusable curve (empty or a
 * non-positive starting equity), reported as InputError.
 */
class MetricsCalculator {
public:
    explicit MetricsCalculator(double risk_free_rate = 0.02);

    PerformanceMetrics compute(const EquityCurve& curve,
                               const TradeLog& trades,
                               const EquityCurve* benchmark = nullptr) const;

    // Percent change between consecutive points; bar 0 has no return.
    static std::vector<double> daily_returns(const EquityCurve& curve);

    double risk_free_rate() const { return risk_free_rate_; }

private:
    void compute_return_stats(const EquityCurve& curve, PerformanceMetrics& out) const;
    static void compute_drawdown(const EquityCurve& curve, PerformanceMetrics& out);
    static void compute_trade_stats(const TradeLog& trades, PerformanceMetrics& out);
    static void compute_alpha_beta(const EquityCurve& curve, const EquityCurve& benchmark,
                                   PerformanceMetrics& out);

    double risk_free_rate_;
};

} // namespace backtester
