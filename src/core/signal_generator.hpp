#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include "bar_series.hpp"

namespace backtester {

enum class Signal { HOLD, ENTER_LONG, EXIT_LONG };

inline const char* to_string(Signal s) {
    switch (s) {
        case Signal::ENTER_LONG: return "ENTER_LONG";
        case Signal::EXIT_LONG:  return "EXIT_LONG";
        default:                 return "HOLD";
    }
}

struct MaCrossoverParams {
    int fast_window{50};
    int slow_window{200};
};

struct RsiParams {
    int period{14};
    double oversold{30.0};
    double overbought{70.0};
};

struct MacdParams {
    int fast_ema{12};
    int slow_ema{26};
    int signal_ema{9};
};

struct BollingerParams {
    int window{20};
    double num_stddev{2.0};
};

enum class ZScoreExit {
    THRESHOLD,   // exit when z > exit_z
    ZERO_CROSS   // exit when z climbs back to the mean (z >= 0)
};

struct MeanReversionParams {
    int window{20};
    double entry_z{2.0};
    double exit_z{0.5};
    ZScoreExit exit_policy{ZScoreExit::THRESHOLD};
};

// Enters on the first bar and never exits; used for the benchmark run.
struct BuyAndHoldParams {};

using StrategyParams = std::variant<MaCrossoverParams,
                                    RsiParams,
                                    MacdParams,
                                    BollingerParams,
                                    MeanReversionParams,
                                    BuyAndHoldParams>;

/**
 * Number of bars a variant needs before it can emit anything but HOLD.
 * Signals for bar indices below minimum_bars_required(params) - 1 are HOLD.
 */
size_t minimum_bars_required(const StrategyParams& params);

/**
 * Throws ConfigError on invalid parameter combinations
 * (non-positive windows, fast >= slow, thresholds out of range).
 */
void validate_params(const StrategyParams& params);

/**
 * Signal for the last bar of `history`. Only bars in `history` are read, so
 * passing bars[0..i] yields the signal for bar i. Returns HOLD during warm-up.
 */
Signal compute_signal(const BarSeries& history, const StrategyParams& params);

/**
 * Signal for every bar in one pass. Element i equals
 * compute_signal(bars[0..i], params).
 */
std::vector<Signal> generate_signals(const BarSeries& bars, const StrategyParams& params);

// Short identifier, e.g. "ma_crossover".
std::string strategy_name(const StrategyParams& params);

// Human-readable label with parameters, e.g. "MA Crossover(fast=3, slow=5)".
std::string describe(const StrategyParams& params);

} // namespace backtester
