#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include "../src/core/errors.hpp"
#include "../src/core/signal_generator.hpp"

using namespace backtester;

namespace {

BarSeries daily(const std::vector<double>& closes) {
    BarSeries bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        Bar b;
        b.timestamp = Timestamp{} + std::chrono::hours(24 * static_cast<int>(i));
        b.open = b.high = b.low = b.close = closes[i];
        bars.push_back(b);
    }
    return bars;
}

// Golden cross at bar 10 and death cross at bar 20 for fast=3, slow=5.
std::vector<double> crossover_closes() {
    std::vector<double> c;
    for (int i = 0; i < 10; ++i) c.push_back(100.0 - i);
    c.push_back(120.0);
    for (int i = 11; i < 20; ++i) c.push_back(110.0 + i);
    c.push_back(80.0);
    for (int i = 21; i < 30; ++i) c.push_back(100.0 - i);
    return c;
}

// Trend plus two cycles, enough to trigger every variant.
std::vector<double> wavy_closes(size_t n) {
    std::vector<double> c;
    for (size_t i = 0; i < n; ++i) {
        double x = static_cast<double>(i);
        c.push_back(100.0 + 0.05 * x + 8.0 * std::sin(x / 6.0) + 3.0 * std::sin(x / 1.7));
    }
    return c;
}

std::vector<size_t> indices_of(const std::vector<Signal>& sigs, Signal s) {
    std::vector<size_t> out;
    for (size_t i = 0; i < sigs.size(); ++i) {
        if (sigs[i] == s) out.push_back(i);
    }
    return out;
}

// Alternating 100/101 for 20 bars, a drop to 90, then a spike to 115.
std::vector<double> band_break_closes() {
    std::vector<double> c;
    for (int i = 0; i < 20; ++i) c.push_back(100.0 + (i % 2));
    c.push_back(90.0);
    c.push_back(115.0);
    return c;
}

} // namespace

TEST(SignalGeneratorTest, MaCrossoverScenario) {
    auto sigs = generate_signals(daily(crossover_closes()), MaCrossoverParams{3, 5});
    ASSERT_EQ(sigs.size(), 30u);
    EXPECT_EQ(indices_of(sigs, Signal::ENTER_LONG), std::vector<size_t>{10});
    EXPECT_EQ(indices_of(sigs, Signal::EXIT_LONG), std::vector<size_t>{20});
}

TEST(SignalGeneratorTest, RsiOversoldThenOverbought) {
    std::vector<double> c;
    for (int i = 0; i < 20; ++i) c.push_back(100.0 - i);
    for (int i = 0; i < 20; ++i) c.push_back(81.0 + 3.0 * (i + 1));
    auto sigs = generate_signals(daily(c), RsiParams{14, 30.0, 70.0});

    for (size_t i = 0; i < 14; ++i) EXPECT_EQ(sigs[i], Signal::HOLD) << "bar " << i;
    EXPECT_EQ(sigs[14], Signal::ENTER_LONG);
    EXPECT_EQ(sigs[19], Signal::ENTER_LONG);
    auto exits = indices_of(sigs, Signal::EXIT_LONG);
    ASSERT_FALSE(exits.empty());
    EXPECT_GT(exits.front(), 19u);
}

TEST(SignalGeneratorTest, MacdEntersAfterBottom) {
    std::vector<double> c;
    for (int i = 0; i < 40; ++i) c.push_back(200.0 - 2.0 * i);
    for (int i = 1; i <= 40; ++i) c.push_back(122.0 + 3.0 * i);
    auto sigs = generate_signals(daily(c), MacdParams{});

    auto enters = indices_of(sigs, Signal::ENTER_LONG);
    ASSERT_FALSE(enters.empty());
    EXPECT_GT(enters.front(), 39u);
    EXPECT_LE(enters.front(), 50u);
}

TEST(SignalGeneratorTest, BollingerBandBreaks) {
    auto sigs = generate_signals(daily(band_break_closes()), BollingerParams{20, 2.0});
    EXPECT_EQ(sigs[20], Signal::ENTER_LONG);
    EXPECT_EQ(sigs[21], Signal::EXIT_LONG);
}

TEST(SignalGeneratorTest, BollingerFlatSeriesHolds) {
    auto sigs = generate_signals(daily(std::vector<double>(40, 50.0)), BollingerParams{});
    EXPECT_TRUE(indices_of(sigs, Signal::HOLD).size() == sigs.size());
}

TEST(SignalGeneratorTest, MeanReversionZScore) {
    MeanReversionParams p{20, 2.0, 0.5, ZScoreExit::THRESHOLD};
    auto sigs = generate_signals(daily(band_break_closes()), p);
    EXPECT_EQ(sigs[20], Signal::ENTER_LONG);
    EXPECT_EQ(sigs[21], Signal::EXIT_LONG);
}

TEST(SignalGeneratorTest, MeanReversionExitPolicies) {
    // z of the last bar is about 0.11: above the mean, below exit_z.
    auto history = daily({100.0, 104.0, 96.0, 100.5});
    MeanReversionParams threshold{4, 2.0, 0.5, ZScoreExit::THRESHOLD};
    MeanReversionParams zero_cross{4, 2.0, 0.5, ZScoreExit::ZERO_CROSS};
    EXPECT_EQ(compute_signal(history, threshold), Signal::HOLD);
    EXPECT_EQ(compute_signal(history, zero_cross), Signal::EXIT_LONG);
}

TEST(SignalGeneratorTest, BuyAndHoldEntersOnce) {
    auto sigs = generate_signals(daily({10.0, 11.0, 9.0, 12.0}), BuyAndHoldParams{});
    EXPECT_EQ(indices_of(sigs, Signal::ENTER_LONG), std::vector<size_t>{0});
    EXPECT_TRUE(indices_of(sigs, Signal::EXIT_LONG).empty());
}

TEST(SignalGeneratorTest, MinimumBarsRequired) {
    EXPECT_EQ(minimum_bars_required(MaCrossoverParams{3, 5}), 6u);
    EXPECT_EQ(minimum_bars_required(RsiParams{14, 30.0, 70.0}), 15u);
    EXPECT_EQ(minimum_bars_required(MacdParams{12, 26, 9}), 35u);
    EXPECT_EQ(minimum_bars_required(BollingerParams{20, 2.0}), 20u);
    EXPECT_EQ(minimum_bars_required(MeanReversionParams{}), 20u);
    EXPECT_EQ(minimum_bars_required(BuyAndHoldParams{}), 1u);

    // Sum of two large periods must not wrap around in int.
    const int big = std::numeric_limits<int>::max();
    EXPECT_EQ(minimum_bars_required(MacdParams{12, big, big}), 2 * static_cast<size_t>(big));
}

TEST(SignalGeneratorTest, WarmupIsHold) {
    auto bars = daily(wavy_closes(120));
    for (const auto& params : std::vector<StrategyParams>{
             MaCrossoverParams{5, 20}, RsiParams{}, MacdParams{}, BollingerParams{},
             MeanReversionParams{}}) {
        auto sigs = generate_signals(bars, params);
        const size_t first = minimum_bars_required(params) - 1;
        for (size_t i = 0; i < first; ++i) {
            EXPECT_EQ(sigs[i], Signal::HOLD) << describe(params) << " bar " << i;
        }
        // Shorter than the warm-up: nothing but HOLD.
        BarSeries short_bars(bars.begin(), bars.begin() + static_cast<long>(first));
        auto short_sigs = generate_signals(short_bars, params);
        EXPECT_EQ(indices_of(short_sigs, Signal::HOLD).size(), short_sigs.size()) << describe(params);
    }
}

TEST(SignalGeneratorTest, SignalsAreCausal) {
    auto bars = daily(wavy_closes(150));
    std::vector<StrategyParams> variants{
        MaCrossoverParams{5, 20},
        RsiParams{14, 40.0, 60.0},
        MacdParams{},
        BollingerParams{20, 1.5},
        MeanReversionParams{20, 1.5, 0.5, ZScoreExit::THRESHOLD},
        MeanReversionParams{20, 1.5, 0.5, ZScoreExit::ZERO_CROSS},
        BuyAndHoldParams{}};

    for (const auto& params : variants) {
        auto full = generate_signals(bars, params);
        ASSERT_EQ(full.size(), bars.size());
        EXPECT_LT(indices_of(full, Signal::HOLD).size(), full.size()) << describe(params);
        for (size_t i = 0; i < bars.size(); ++i) {
            BarSeries prefix(bars.begin(), bars.begin() + static_cast<long>(i + 1));
            ASSERT_EQ(compute_signal(prefix, params), full[i]) << describe(params) << " bar " << i;
        }
    }
}

TEST(SignalGeneratorTest, EmptyHistoryHolds) {
    EXPECT_EQ(compute_signal({}, MaCrossoverParams{}), Signal::HOLD);
    EXPECT_TRUE(generate_signals({}, RsiParams{}).empty());
}

TEST(SignalGeneratorTest, InvalidParamsThrow) {
    EXPECT_THROW(validate_params(MaCrossoverParams{50, 50}), ConfigError);
    EXPECT_THROW(validate_params(MaCrossoverParams{0, 10}), ConfigError);
    EXPECT_THROW(validate_params(RsiParams{14, 70.0, 30.0}), ConfigError);
    EXPECT_THROW(validate_params(RsiParams{-1, 30.0, 70.0}), ConfigError);
    EXPECT_THROW(validate_params(MacdParams{26, 12, 9}), ConfigError);
    EXPECT_THROW(validate_params(MacdParams{12, 26, 0}), ConfigError);
    EXPECT_THROW(validate_params(BollingerParams{1, 2.0}), ConfigError);
    EXPECT_THROW(validate_params(BollingerParams{20, 0.0}), ConfigError);
    EXPECT_THROW(validate_params(MeanReversionParams{20, 0.0, 0.5, ZScoreExit::THRESHOLD}), ConfigError);
    EXPECT_THROW(generate_signals(daily({1.0, 2.0}), MaCrossoverParams{5, 3}), ConfigError);
}

TEST(SignalGeneratorTest, NamesAndLabels) {
    EXPECT_EQ(strategy_name(MaCrossoverParams{}), "ma_crossover");
    EXPECT_EQ(strategy_name(BollingerParams{}), "bollinger_bands");
    EXPECT_EQ(strategy_name(BuyAndHoldParams{}), "buy_and_hold");
    EXPECT_EQ(describe(MaCrossoverParams{3, 5}), "MA Crossover(fast=3, slow=5)");
    EXPECT_STREQ(to_string(Signal::ENTER_LONG), "ENTER_LONG");
}
