#include "execution_engine.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace backtester {

namespace {

struct OpenPosition {
    size_t entry_index{0};
    Timestamp entry_time;
    double entry_price{0.0};
    double quantity{0.0};
    double commission{0.0};
};

} // namespace

ExecutionEngine::ExecutionEngine(ExecutionConfig exec_cfg, MetricsConfig metrics_cfg)
    : exec_cfg_(exec_cfg)
    , metrics_cfg_(metrics_cfg) {}

double ExecutionEngine::order_quantity(double cash, double close) const {
    if (!(cash > 0.0) || !(close > 0.0)) return 0.0;
    const double price = exec_cfg_.effective_buy_price(close);
    const double unit_cost = price * (1.0 + exec_cfg_.commission_rate);

    if (exec_cfg_.sizing_policy == SizingPolicy::ALL_IN_FRACTIONAL) {
        return cash / unit_cost;
    }

    double budget = cash;
    if (exec_cfg_.sizing_policy == SizingPolicy::FIXED_FRACTION) {
        budget = cash * exec_cfg_.position_fraction;
    }
    double qty = std::floor(budget / unit_cost);
    // floor() on a rounded quotient can land one share too high.
    while (qty > 0.0 && qty * price + exec_cfg_.commission(qty * price) > budget) {
        qty -= 1.0;
    }
    return qty;
}

BacktestResult ExecutionEngine::run(const BarSeries& bars,
                                    const StrategyParams& params,
                                    const EquityCurve* benchmark) const {
    exec_cfg_.validate();
    validate_params(params);
    validate_bars(bars);

    BacktestResult result;
    result.strategy = describe(params);

    const size_t warmup = minimum_bars_required(params);
    if (bars.size() < warmup) {
        spdlog::warn("{}: {} bars is shorter than the {} bar warm-up, no trades possible",
                     result.strategy, bars.size(), warmup);
    }
    spdlog::info("Running {} over {} bars (sizing={}, commission={}, slippage={})",
                 result.strategy, bars.size(), to_string(exec_cfg_.sizing_policy),
                 exec_cfg_.commission_rate, exec_cfg_.slippage_rate);

    result.signals = generate_signals(bars, params);
    result.equity_curve.reserve(bars.size());
    result.holdings.reserve(bars.size());

    Portfolio portfolio(exec_cfg_.initial_capital);
    PositionState state = PositionState::FLAT;
    OpenPosition open;

    auto buy = [&](size_t i) {
        const Bar& bar = bars[i];
        double qty = order_quantity(portfolio.cash(), bar.close);
        if (qty <= 0.0) {
            spdlog::debug("bar {}: ENTER_LONG skipped, cash {:.2f} buys nothing at {:.4f}",
                          i, portfolio.cash(), bar.close);
            return;
        }
        double price = exec_cfg_.effective_buy_price(bar.close);
        double commission = exec_cfg_.commission(qty * price);
        portfolio.apply_buy(price, qty, commission);
        portfolio.record_slippage(qty * (price - bar.close));

        open = OpenPosition{i, bar.timestamp, price, qty, commission};
        state = PositionState::LONG;
        spdlog::debug("bar {}: BUY {} @ {:.4f} commission {:.4f}", i, qty, price, commission);
    };

    auto sell = [&](size_t i, bool forced) {
        const Bar& bar = bars[i];
        double qty = portfolio.quantity();
        double price = exec_cfg_.effective_sell_price(bar.close);
        double commission = exec_cfg_.commission(qty * price);
        portfolio.apply_sell(price, qty, commission);
        portfolio.record_slippage(qty * (bar.close - price));

        Trade t;
        t.entry_index = open.entry_index;
        t.exit_index = i;
        t.entry_time = open.entry_time;
        t.exit_time = bar.timestamp;
        t.entry_price = open.entry_price;
        t.exit_price = price;
        t.quantity = qty;
        t.commission = open.commission + commission;
        t.pnl = (price - open.entry_price) * qty - t.commission;
        double basis = open.entry_price * qty;
        t.return_pct = basis > 0.0 ? t.pnl / basis * 100.0 : 0.0;
        t.forced_exit = forced;
        result.trades.push_back(t);

        state = PositionState::FLAT;
        spdlog::debug("bar {}: SELL {} @ {:.4f} pnl {:.2f}{}", i, qty, price, t.pnl,
                      forced ? " (end of data)" : "");
    };

    for (size_t i = 0; i < bars.size(); ++i) {
        const Signal sig = result.signals[i];
        if (state == PositionState::FLAT && sig == Signal::ENTER_LONG) {
            buy(i);
        } else if (state == PositionState::LONG && sig == Signal::EXIT_LONG) {
            sell(i, false);
        }

        if (i + 1 == bars.size() && state == PositionState::LONG && exec_cfg_.liquidate_at_end) {
            sell(i, true);
        }

        result.equity_curve.push_back({bars[i].timestamp, portfolio.mark_to_market(bars[i].close)});
        result.holdings.push_back({portfolio.cash(), portfolio.quantity()});
    }

    result.final_state = portfolio.state();
    result.metrics = MetricsCalculator(metrics_cfg_.risk_free_rate)
                         .compute(result.equity_curve, result.trades, benchmark);

    spdlog::info("Done {}. Return: {:.2f}% | Trades: {} | Sharpe: {:.2f} | MaxDD: {:.2f}%",
                 result.strategy, result.metrics.total_return * 100.0, result.metrics.num_trades,
                 result.metrics.sharpe, result.metrics.max_drawdown * 100.0);
    return result;
}

} // namespace backtester
