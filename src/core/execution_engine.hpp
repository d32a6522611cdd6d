#pragma once

#include <string>
#include <vector>
#include "bar_series.hpp"
#include "config.hpp"
#include "performance.hpp"
#include "portfolio.hpp"
#include "signal_generator.hpp"
#include "trade.hpp"

namespace backtester {

enum class PositionState { FLAT, LONG };

// Cash and shares after a bar has been processed.
struct Holding {
    double cash{0.0};
    double quantity{0.0};
};

struct BacktestResult {
    std::string strategy;              // describe(params)
    std::vector<Signal> signals;       // one per bar
    EquityCurve equity_curve;          // one per bar
    std::vector<Holding> holdings;     // one per bar
    TradeLog trades;
    PortfolioState final_state;
    PerformanceMetrics metrics;
};

/**
 * Bar-by-bar simulation of one strategy over one price series.
 *
 * FLAT + ENTER_LONG buys, LONG + EXIT_LONG sells, every other pair is a
 * no-op. Fills happen at the bar's close adjusted for slippage, with
 * commission charged on both legs. After the signal of a bar is applied the
 * bar's equity (cash + quantity * close) is appended to the curve.
 *
 * If a position is still open after the last bar's signal and
 * liquidate_at_end is set, it is sold at that bar's close under the same cost
 * model before the last equity point is recorded, and the trade is flagged
 * forced_exit. The final equity point then equals the final cash.
 *
 * Configuration, strategy parameters and the price series are validated
 * before any state is created (ConfigError / InputError). The engine keeps
 * no per-run state, so one instance may serve concurrent runs.
 */
class ExecutionEngine {
public:
    explicit ExecutionEngine(ExecutionConfig exec_cfg = {}, MetricsConfig metrics_cfg = {});

    BacktestResult run(const BarSeries& bars,
                       const StrategyParams& params,
                       const EquityCurve* benchmark = nullptr) const;

    /**
     * Shares to buy with `cash` at a bar closing at `close`, per the sizing
     * policy. Zero when not even one whole share is affordable.
     */
    double order_quantity(double cash, double close) const;

    const ExecutionConfig& execution_config() const { return exec_cfg_; }
    const MetricsConfig& metrics_config() const { return metrics_cfg_; }

private:
    ExecutionConfig exec_cfg_;
    MetricsConfig metrics_cfg_;
};

} // namespace backtester
