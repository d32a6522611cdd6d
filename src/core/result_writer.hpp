#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>
#include "execution_engine.hpp"
#include "utils.hpp"

namespace backtester {

inline nlohmann::json metrics_to_json(const PerformanceMetrics& m) {
    nlohmann::json j = {
        {"total_return", m.total_return},
        {"annualized_return", m.annualized_return},
        {"volatility", m.volatility},
        {"sharpe", m.sharpe},
        {"sortino", m.sortino},
        {"max_drawdown", m.max_drawdown},
        {"max_drawdown_duration", m.max_drawdown_duration},
        {"calmar", m.calmar},
        {"num_trades", m.num_trades},
        {"winning_trades", m.winning_trades},
        {"losing_trades", m.losing_trades},
        {"win_rate", m.win_rate},
        {"profit_factor", m.profit_factor},
        {"avg_trade_return_pct", m.avg_trade_return_pct},
        {"avg_win", m.avg_win},
        {"avg_loss", m.avg_loss}
    };
    j["alpha"] = m.alpha ? nlohmann::json(*m.alpha) : nlohmann::json(nullptr);
    j["beta"] = m.beta ? nlohmann::json(*m.beta) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json trade_to_json(const Trade& t) {
    return {
        {"entry_index", t.entry_index},
        {"exit_index", t.exit_index},
        {"entry_time", utils::ts_to_iso(t.entry_time)},
        {"exit_time", utils::ts_to_iso(t.exit_time)},
        {"entry_price", t.entry_price},
        {"exit_price", t.exit_price},
        {"quantity", t.quantity},
        {"commission", t.commission},
        {"pnl", t.pnl},
        {"return_pct", t.return_pct},
        {"forced_exit", t.forced_exit}
    };
}

/**
 * Plain-data view of a run: strategy label, metrics, final portfolio state,
 * trades and the per-bar curve (timestamp, equity, cash, quantity, signal).
 */
inline nlohmann::json result_to_json(const BacktestResult& r) {
    nlohmann::json j;
    j["strategy"] = r.strategy;
    j["metrics"] = metrics_to_json(r.metrics);
    j["final_state"] = {
        {"cash", r.final_state.cash},
        {"quantity", r.final_state.quantity},
        {"avg_entry_price", r.final_state.avg_entry_price},
        {"accrued_commission", r.final_state.accrued_commission},
        {"accrued_slippage", r.final_state.accrued_slippage}
    };

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : r.trades) trades.push_back(trade_to_json(t));
    j["trades"] = trades;

    nlohmann::json curve = nlohmann::json::array();
    for (size_t i = 0; i < r.equity_curve.size(); ++i) {
        nlohmann::json p = {
            {"timestamp", utils::ts_to_iso(r.equity_curve[i].timestamp)},
            {"equity", r.equity_curve[i].equity}
        };
        if (i < r.holdings.size()) {
            p["cash"] = r.holdings[i].cash;
            p["quantity"] = r.holdings[i].quantity;
        }
        if (i < r.signals.size()) p["signal"] = to_string(r.signals[i]);
        curve.push_back(p);
    }
    j["equity_curve"] = curve;
    return j;
}

namespace detail {

// Write to path.tmp, then rename over path.
inline bool write_atomically(const std::string& path, const std::string& contents) {
    std::filesystem::path p(path);
    try {
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    } catch (const std::exception& e) {
        spdlog::error("Failed to create directory for {}: {}", path, e.what());
        return false;
    }

    std::string tmp_path = path + ".tmp";
    std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
    if (!f.is_open()) {
        spdlog::error("Failed to open {} for writing", tmp_path);
        return false;
    }
    f << contents;
    f.close();
    if (!f) {
        spdlog::error("Failed to write {}", tmp_path);
        return false;
    }
    try {
        std::filesystem::rename(tmp_path, path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to rename {} to {}: {}", tmp_path, path, e.what());
        return false;
    }
    return true;
}

} // namespace detail

/**
 * Save the run (and optionally its benchmark run) as pretty-printed JSON.
 */
inline bool save_result_json(const BacktestResult& result, const std::string& path,
                             const BacktestResult* benchmark = nullptr) {
    nlohmann::json j = result_to_json(result);
    if (benchmark) {
        j["benchmark"] = {
            {"strategy", benchmark->strategy},
            {"metrics", metrics_to_json(benchmark->metrics)}
        };
    }
    if (!detail::write_atomically(path, j.dump(2))) return false;
    spdlog::info("Saved result to {}", path);
    return true;
}

inline bool save_equity_csv(const BacktestResult& result, const std::string& path) {
    std::ostringstream out;
    out << std::setprecision(10);
    out << "timestamp,equity,cash,quantity,signal\n";
    for (size_t i = 0; i < result.equity_curve.size(); ++i) {
        const auto& p = result.equity_curve[i];
        out << utils::ts_to_iso(p.timestamp) << "," << p.equity;
        if (i < result.holdings.size()) {
            out << "," << result.holdings[i].cash << "," << result.holdings[i].quantity;
        } else {
            out << ",,";
        }
        out << "," << (i < result.signals.size() ? to_string(result.signals[i]) : "") << "\n";
    }
    if (!detail::write_atomically(path, out.str())) return false;
    spdlog::info("Saved equity curve to {}", path);
    return true;
}

inline bool save_trades_csv(const BacktestResult& result, const std::string& path) {
    std::ostringstream out;
    out << std::setprecision(10);
    out << "entry_time,exit_time,entry_index,exit_index,entry_price,exit_price,"
           "quantity,commission,pnl,return_pct,forced_exit\n";
    for (const auto& t : result.trades) {
        out << utils::ts_to_iso(t.entry_time) << "," << utils::ts_to_iso(t.exit_time) << ","
            << t.entry_index << "," << t.exit_index << ","
            << t.entry_price << "," << t.exit_price << ","
            << t.quantity << "," << t.commission << ","
            << t.pnl << "," << t.return_pct << ","
            << (t.forced_exit ? "true" : "false") << "\n";
    }
    if (!detail::write_atomically(path, out.str())) return false;
    spdlog::info("Saved {} trades to {}", result.trades.size(), path);
    return true;
}

} // namespace backtester
