#pragma once

#include <cmath>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "signal_generator.hpp"

namespace backtester {

using json = nlohmann::json;

/**
 * How many shares an ENTER_LONG buys.
 */
enum class SizingPolicy {
    ALL_IN,             // max whole shares affordable from cash after commission
    ALL_IN_FRACTIONAL,  // all cash after commission, fractional shares
    FIXED_FRACTION      // whole shares affordable from position_fraction * cash
};

inline const char* to_string(SizingPolicy p) {
    switch (p) {
        case SizingPolicy::ALL_IN_FRACTIONAL: return "all_in_fractional";
        case SizingPolicy::FIXED_FRACTION:    return "fixed_fraction";
        default:                              return "all_in";
    }
}

inline SizingPolicy sizing_policy_from_string(const std::string& s) {
    if (s == "all_in") return SizingPolicy::ALL_IN;
    if (s == "all_in_fractional") return SizingPolicy::ALL_IN_FRACTIONAL;
    if (s == "fixed_fraction") return SizingPolicy::FIXED_FRACTION;
    throw ConfigError("unknown sizing_policy '" + s + "' (expected all_in, all_in_fractional or fixed_fraction)");
}

struct ExecutionConfig {
    double initial_capital{10000.0};
    double commission_rate{0.001};       // fraction of notional, charged on entry and on exit
    double slippage_rate{0.0005};        // adverse fraction of the close
    SizingPolicy sizing_policy{SizingPolicy::ALL_IN};
    double position_fraction{1.0};       // used by FIXED_FRACTION only
    bool liquidate_at_end{true};         // close an open position on the last bar

    /**
     * Fill prices under the slippage model.
     * Buys pay close * (1 + slippage), sells receive close * (1 - slippage).
     */
    double effective_buy_price(double close) const {
        return close * (1.0 + slippage_rate);
    }

    double effective_sell_price(double close) const {
        return close * (1.0 - slippage_rate);
    }

    double commission(double notional) const {
        return notional * commission_rate;
    }

    void validate() const {
        if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
            throw ConfigError("initial_capital must be positive");
        }
        if (!(commission_rate >= 0.0 && commission_rate < 1.0)) {
            throw ConfigError("commission_rate must be in [0, 1)");
        }
        if (!(slippage_rate >= 0.0 && slippage_rate < 1.0)) {
            throw ConfigError("slippage_rate must be in [0, 1)");
        }
        if (sizing_policy == SizingPolicy::FIXED_FRACTION &&
            !(position_fraction > 0.0 && position_fraction <= 1.0)) {
            throw ConfigError("position_fraction must be in (0, 1]");
        }
    }
};

struct MetricsConfig {
    double risk_free_rate{0.02};   // annualized
    bool run_benchmark{true};      // buy-and-hold run used for alpha/beta
};

struct StrategyConfig {
    StrategyParams params{MaCrossoverParams{}};
};

struct DataConfig {
    std::string source{"synthetic"};   // "csv" or "synthetic"
    std::string path{};
    std::string symbol{"SPY"};
    std::string start_date{"2020-01-01"};
    std::string end_date{"2023-12-31"};
    uint64_t seed{42};
};

struct OutputConfig {
    std::string result_json{};   // empty = skip
    std::string equity_csv{};
    std::string trades_csv{};
};

struct LoggingConfig {
    std::string level{"info"};
};

struct Config {
    StrategyConfig strategy;
    ExecutionConfig execution;
    MetricsConfig metrics;
    DataConfig data;
    OutputConfig output;
    LoggingConfig logging;
};

/**
 * Build strategy parameters from a name and a JSON object of overrides.
 * Keys absent from `p` keep the variant defaults. Throws ConfigError for
 * unknown names or invalid values.
 */
inline StrategyParams parse_strategy(const std::string& name, const json& p = json::object()) {
    StrategyParams out;
    if (name == "ma_crossover") {
        MaCrossoverParams s;
        s.fast_window = p.value("fast_window", s.fast_window);
        s.slow_window = p.value("slow_window", s.slow_window);
        out = s;
    } else if (name == "rsi") {
        RsiParams s;
        s.period = p.value("period", s.period);
        s.oversold = p.value("oversold", s.oversold);
        s.overbought = p.value("overbought", s.overbought);
        out = s;
    } else if (name == "macd") {
        MacdParams s;
        s.fast_ema = p.value("fast_ema", s.fast_ema);
        s.slow_ema = p.value("slow_ema", s.slow_ema);
        s.signal_ema = p.value("signal_ema", s.signal_ema);
        out = s;
    } else if (name == "bollinger_bands") {
        BollingerParams s;
        s.window = p.value("window", s.window);
        s.num_stddev = p.value("num_stddev", s.num_stddev);
        out = s;
    } else if (name == "mean_reversion") {
        MeanReversionParams s;
        s.window = p.value("window", s.window);
        s.entry_z = p.value("entry_z", s.entry_z);
        s.exit_z = p.value("exit_z", s.exit_z);
        std::string policy = p.value("exit_policy", std::string("threshold"));
        if (policy == "zero_cross") {
            s.exit_policy = ZScoreExit::ZERO_CROSS;
        } else if (policy != "threshold") {
            throw ConfigError("unknown mean_reversion exit_policy '" + policy + "'");
        }
        out = s;
    } else if (name == "buy_and_hold") {
        out = BuyAndHoldParams{};
    } else {
        throw ConfigError("unknown strategy '" + name + "'");
    }
    validate_params(out);
    return out;
}

// Every strategy variant with default parameters.
inline std::vector<StrategyParams> all_strategies() {
    return {MaCrossoverParams{}, RsiParams{}, MacdParams{},
            BollingerParams{}, MeanReversionParams{}, BuyAndHoldParams{}};
}

inline void validate_config(const Config& cfg) {
    validate_params(cfg.strategy.params);
    cfg.execution.validate();
    if (!std::isfinite(cfg.metrics.risk_free_rate) || cfg.metrics.risk_free_rate <= -1.0) {
        throw ConfigError("risk_free_rate must be greater than -1");
    }
    if (cfg.data.source != "csv" && cfg.data.source != "synthetic") {
        throw ConfigError("data.source must be 'csv' or 'synthetic'");
    }
    if (cfg.data.source == "csv" && cfg.data.path.empty()) {
        throw ConfigError("data.path is required for the csv source");
    }
    // from_str maps unknown names to off, which would hide every error.
    if (cfg.logging.level != "off" && spdlog::level::from_str(cfg.logging.level) == spdlog::level::off) {
        throw ConfigError("unknown logging.level '" + cfg.logging.level +
                          "' (expected trace, debug, info, warn, error, critical or off)");
    }
}

/**
 * Load settings from a JSON file (comments allowed). A missing file keeps the
 * defaults; missing keys keep their current values. Malformed JSON or values
 * of the wrong type throw ConfigError.
 */
inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    try {
        json j = json::parse(f, nullptr, true, true);
        if (j.contains("strategy")) {
            auto& s = j["strategy"];
            std::string name = s.value("name", strategy_name(cfg.strategy.params));
            cfg.strategy.params = parse_strategy(name, s.value("params", json::object()));
        }
        if (j.contains("execution")) {
            auto& e = j["execution"];
            cfg.execution.initial_capital = e.value("initial_capital", cfg.execution.initial_capital);
            cfg.execution.commission_rate = e.value("commission_rate", cfg.execution.commission_rate);
            cfg.execution.slippage_rate = e.value("slippage_rate", cfg.execution.slippage_rate);
            if (e.contains("sizing_policy")) {
                cfg.execution.sizing_policy = sizing_policy_from_string(e["sizing_policy"].get<std::string>());
            }
            cfg.execution.position_fraction = e.value("position_fraction", cfg.execution.position_fraction);
            cfg.execution.liquidate_at_end = e.value("liquidate_at_end", cfg.execution.liquidate_at_end);
        }
        if (j.contains("metrics")) {
            auto& m = j["metrics"];
            cfg.metrics.risk_free_rate = m.value("risk_free_rate", cfg.metrics.risk_free_rate);
            cfg.metrics.run_benchmark = m.value("run_benchmark", cfg.metrics.run_benchmark);
        }
        if (j.contains("data")) {
            auto& d = j["data"];
            cfg.data.source = d.value("source", cfg.data.source);
            cfg.data.path = d.value("path", cfg.data.path);
            cfg.data.symbol = d.value("symbol", cfg.data.symbol);
            cfg.data.start_date = d.value("start_date", cfg.data.start_date);
            cfg.data.end_date = d.value("end_date", cfg.data.end_date);
            cfg.data.seed = d.value("seed", cfg.data.seed);
        }
        if (j.contains("output")) {
            auto& o = j["output"];
            cfg.output.result_json = o.value("result_json", cfg.output.result_json);
            cfg.output.equity_csv = o.value("equity_csv", cfg.output.equity_csv);
            cfg.output.trades_csv = o.value("trades_csv", cfg.output.trades_csv);
        }
        if (j.contains("logging")) {
            auto& l = j["logging"];
            cfg.logging.level = l.value("level", cfg.logging.level);
        }
    } catch (const json::exception& e) {
        throw ConfigError("invalid config " + path + ": " + e.what());
    }
}

} // namespace backtester
