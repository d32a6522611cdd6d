#include "signal_generator.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include "errors.hpp"
#include "indicators.hpp"

namespace backtester {

namespace {

const char* to_string(ZScoreExit e) {
    return e == ZScoreExit::ZERO_CROSS ? "zero_cross" : "threshold";
}

// Upward cross of a over b between two consecutive bars.
bool crossed_above(double prev_a, double prev_b, double a, double b) {
    return prev_a <= prev_b && a > b;
}

bool crossed_below(double prev_a, double prev_b, double a, double b) {
    return prev_a >= prev_b && a < b;
}

bool valid(double v) { return !std::isnan(v); }

// ---- warm-up ---------------------------------------------------------------

size_t min_bars(const MaCrossoverParams& p) { return static_cast<size_t>(p.slow_window) + 1; }
size_t min_bars(const RsiParams& p) { return static_cast<size_t>(p.period) + 1; }
size_t min_bars(const MacdParams& p) {
    return static_cast<size_t>(p.slow_ema) + static_cast<size_t>(p.signal_ema);
}
size_t min_bars(const BollingerParams& p) { return static_cast<size_t>(p.window); }
size_t min_bars(const MeanReversionParams& p) { return static_cast<size_t>(p.window); }
size_t min_bars(const BuyAndHoldParams&) { return 1; }

// ---- validation ------------------------------------------------------------

void check(const MaCrossoverParams& p) {
    if (p.fast_window <= 0 || p.slow_window <= 0) {
        throw ConfigError(fmt::format("ma_crossover windows must be positive (fast={}, slow={})",
                                      p.fast_window, p.slow_window));
    }
    if (p.fast_window >= p.slow_window) {
        throw ConfigError(fmt::format("ma_crossover fast_window ({}) must be less than slow_window ({})",
                                      p.fast_window, p.slow_window));
    }
}

void check(const RsiParams& p) {
    if (p.period <= 0) {
        throw ConfigError(fmt::format("rsi period must be positive (period={})", p.period));
    }
    if (!(0.0 < p.oversold && p.oversold < p.overbought && p.overbought < 100.0)) {
        throw ConfigError(fmt::format("rsi thresholds must satisfy 0 < oversold < overbought < 100 "
                                      "(oversold={}, overbought={})", p.oversold, p.overbought));
    }
}

void check(const MacdParams& p) {
    if (p.fast_ema <= 0 || p.slow_ema <= 0 || p.signal_ema <= 0) {
        throw ConfigError(fmt::format("macd periods must be positive (fast={}, slow={}, signal={})",
                                      p.fast_ema, p.slow_ema, p.signal_ema));
    }
    if (p.fast_ema >= p.slow_ema) {
        throw ConfigError(fmt::format("macd fast_ema ({}) must be less than slow_ema ({})",
                                      p.fast_ema, p.slow_ema));
    }
}

void check(const BollingerParams& p) {
    if (p.window < 2) {
        throw ConfigError(fmt::format("bollinger window must be at least 2 (window={})", p.window));
    }
    if (!(p.num_stddev > 0.0)) {
        throw ConfigError(fmt::format("bollinger num_stddev must be positive ({})", p.num_stddev));
    }
}

void check(const MeanReversionParams& p) {
    if (p.window < 2) {
        throw ConfigError(fmt::format("mean_reversion window must be at least 2 (window={})", p.window));
    }
    if (!(p.entry_z > 0.0)) {
        throw ConfigError(fmt::format("mean_reversion entry_z must be positive ({})", p.entry_z));
    }
    if (!(p.exit_z > -p.entry_z)) {
        throw ConfigError(fmt::format("mean_reversion exit_z ({}) must be above -entry_z ({})",
                                      p.exit_z, -p.entry_z));
    }
}

void check(const BuyAndHoldParams&) {}

// ---- per-bar signal series -------------------------------------------------
// Each overload fills out[i] for i >= first, where first = min_bars(p) - 1.

void fill(std::vector<Signal>& out, const std::vector<double>& c, const MaCrossoverParams& p) {
    auto fast = ind::sma_series(c, p.fast_window);
    auto slow = ind::sma_series(c, p.slow_window);
    for (size_t i = min_bars(p) - 1; i < c.size(); ++i) {
        if (crossed_above(fast[i - 1], slow[i - 1], fast[i], slow[i])) {
            out[i] = Signal::ENTER_LONG;
        } else if (crossed_below(fast[i - 1], slow[i - 1], fast[i], slow[i])) {
            out[i] = Signal::EXIT_LONG;
        }
    }
}

void fill(std::vector<Signal>& out, const std::vector<double>& c, const RsiParams& p) {
    auto rsi = ind::rsi_series(c, p.period);
    for (size_t i = min_bars(p) - 1; i < c.size(); ++i) {
        if (!valid(rsi[i])) continue;
        if (rsi[i] < p.oversold) {
            out[i] = Signal::ENTER_LONG;
        } else if (rsi[i] > p.overbought) {
            out[i] = Signal::EXIT_LONG;
        }
    }
}

void fill(std::vector<Signal>& out, const std::vector<double>& c, const MacdParams& p) {
    auto fast = ind::ema_series(c, p.fast_ema);
    auto slow = ind::ema_series(c, p.slow_ema);
    std::vector<double> macd(c.size());
    for (size_t i = 0; i < c.size(); ++i) macd[i] = fast[i] - slow[i];
    auto signal = ind::ema_series(macd, p.signal_ema);
    for (size_t i = min_bars(p) - 1; i < c.size(); ++i) {
        if (crossed_above(macd[i - 1], signal[i - 1], macd[i], signal[i])) {
            out[i] = Signal::ENTER_LONG;
        } else if (crossed_below(macd[i - 1], signal[i - 1], macd[i], signal[i])) {
            out[i] = Signal::EXIT_LONG;
        }
    }
}

void fill(std::vector<Signal>& out, const std::vector<double>& c, const BollingerParams& p) {
    auto mid = ind::sma_series(c, p.window);
    auto sd = ind::rolling_stddev_series(c, p.window);
    for (size_t i = min_bars(p) - 1; i < c.size(); ++i) {
        if (!valid(mid[i]) || !valid(sd[i]) || sd[i] <= 0.0) continue;
        const double upper = mid[i] + p.num_stddev * sd[i];
        const double lower = mid[i] - p.num_stddev * sd[i];
        if (c[i] <= lower) {
            out[i] = Signal::ENTER_LONG;
        } else if (c[i] >= upper) {
            out[i] = Signal::EXIT_LONG;
        }
    }
}

void fill(std::vector<Signal>& out, const std::vector<double>& c, const MeanReversionParams& p) {
    auto mean = ind::sma_series(c, p.window);
    auto sd = ind::rolling_stddev_series(c, p.window);
    for (size_t i = min_bars(p) - 1; i < c.size(); ++i) {
        if (!valid(mean[i]) || !valid(sd[i]) || sd[i] <= 0.0) continue;
        const double z = (c[i] - mean[i]) / sd[i];
        const bool exit_now = p.exit_policy == ZScoreExit::ZERO_CROSS ? z >= 0.0 : z > p.exit_z;
        if (z < -p.entry_z) {
            out[i] = Signal::ENTER_LONG;
        } else if (exit_now) {
            out[i] = Signal::EXIT_LONG;
        }
    }
}

void fill(std::vector<Signal>& out, const std::vector<double>& c, const BuyAndHoldParams&) {
    if (!c.empty()) out[0] = Signal::ENTER_LONG;
}

// ---- labels ----------------------------------------------------------------

std::string name_of(const MaCrossoverParams&) { return "ma_crossover"; }
std::string name_of(const RsiParams&) { return "rsi"; }
std::string name_of(const MacdParams&) { return "macd"; }
std::string name_of(const BollingerParams&) { return "bollinger_bands"; }
std::string name_of(const MeanReversionParams&) { return "mean_reversion"; }
std::string name_of(const BuyAndHoldParams&) { return "buy_and_hold"; }

std::string label_of(const MaCrossoverParams& p) {
    return fmt::format("MA Crossover(fast={}, slow={})", p.fast_window, p.slow_window);
}
std::string label_of(const RsiParams& p) {
    return fmt::format("RSI(period={}, oversold={}, overbought={})", p.period, p.oversold, p.overbought);
}
std::string label_of(const MacdParams& p) {
    return fmt::format("MACD(fast={}, slow={}, signal={})", p.fast_ema, p.slow_ema, p.signal_ema);
}
std::string label_of(const BollingerParams& p) {
    return fmt::format("Bollinger Bands(window={}, num_stddev={})", p.window, p.num_stddev);
}
std::string label_of(const MeanReversionParams& p) {
    return fmt::format("Mean Reversion(window={}, entry_z={}, exit_z={}, exit={})",
                       p.window, p.entry_z, p.exit_z, to_string(p.exit_policy));
}
std::string label_of(const BuyAndHoldParams&) { return "Buy and Hold"; }

std::vector<Signal> signals_for(const std::vector<double>& c, const StrategyParams& params) {
    validate_params(params);
    std::vector<Signal> out(c.size(), Signal::HOLD);
    if (c.size() < minimum_bars_required(params)) return out;
    std::visit([&](const auto& p) { fill(out, c, p); }, params);
    return out;
}

} // namespace

size_t minimum_bars_required(const StrategyParams& params) {
    return std::visit([](const auto& p) { return min_bars(p); }, params);
}

void validate_params(const StrategyParams& params) {
    std::visit([](const auto& p) { check(p); }, params);
}

Signal compute_signal(const BarSeries& history, const StrategyParams& params) {
    if (history.empty()) return Signal::HOLD;
    return signals_for(closes(history, history.size()), params).back();
}

std::vector<Signal> generate_signals(const BarSeries& bars, const StrategyParams& params) {
    return signals_for(closes(bars, bars.size()), params);
}

std::string strategy_name(const StrategyParams& params) {
    return std::visit([](const auto& p) { return name_of(p); }, params);
}

std::string describe(const StrategyParams& params) {
    return std::visit([](const auto& p) { return label_of(p); }, params);
}

} // namespace backtester
