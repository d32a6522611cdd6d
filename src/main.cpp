#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include "core/batch_runner.hpp"
#include "core/config.hpp"
#include "core/data_source_csv.hpp"
#include "core/data_source_synthetic.hpp"
#include "core/execution_engine.hpp"
#include "core/result_writer.hpp"
#include "core/utils.hpp"

namespace {

backtester::Timestamp parse_config_date(const std::string& s, const char* key) {
    auto ts = backtester::utils::parse_date(s);
    if (!ts) ts = backtester::utils::parse_iso_ts(s);
    if (!ts) {
        throw backtester::ConfigError(std::string("data.") + key + " '" + s + "' is not a date");
    }
    return *ts;
}

std::shared_ptr<backtester::DataSource> make_data_source(const backtester::DataConfig& cfg) {
    if (cfg.source == "csv") {
        spdlog::info("Using CSV data source {}", cfg.path);
        return std::make_shared<backtester::CsvDataSource>(cfg.path);
    }
    spdlog::info("Using synthetic data source (seed={})", cfg.seed);
    return std::make_shared<backtester::SyntheticDataSource>(cfg.seed);
}

bool write_outputs(const backtester::OutputConfig& out,
                   const backtester::BacktestResult& result,
                   const backtester::BacktestResult* benchmark) {
    bool ok = true;
    if (!out.result_json.empty()) ok = backtester::save_result_json(result, out.result_json, benchmark) && ok;
    if (!out.equity_csv.empty()) ok = backtester::save_equity_csv(result, out.equity_csv) && ok;
    if (!out.trades_csv.empty()) ok = backtester::save_trades_csv(result, out.trades_csv) && ok;
    return ok;
}

void print_summary(const backtester::BacktestResult& r) {
    const auto& m = r.metrics;
    spdlog::info("{:<40} return {:>8.2f}%  ann {:>7.2f}%  sharpe {:>6.2f}  sortino {:>6.2f}  "
                 "maxdd {:>7.2f}%  trades {:>3}  win {:>5.1f}%",
                 r.strategy, m.total_return * 100.0, m.annualized_return * 100.0,
                 m.sharpe, m.sortino, m.max_drawdown * 100.0, m.num_trades, m.win_rate * 100.0);
    if (m.alpha && m.beta) {
        spdlog::info("{:<40} alpha {:.4f}  beta {:.4f}", "", *m.alpha, *m.beta);
    }
}

int run_compare(const backtester::Config& cfg,
                std::shared_ptr<const backtester::BarSeries> bars,
                std::shared_ptr<const backtester::EquityCurve> benchmark) {
    std::vector<backtester::RunRequest> requests;
    for (const auto& params : backtester::all_strategies()) {
        backtester::RunRequest req;
        req.id = backtester::strategy_name(params);
        req.bars = bars;
        req.params = params;
        req.execution = cfg.execution;
        req.metrics = cfg.metrics;
        req.benchmark = benchmark;
        requests.push_back(std::move(req));
    }

    backtester::BatchRunner runner;
    auto outcomes = runner.run_all(requests);

    int failures = 0;
    for (const auto& o : outcomes) {
        if (o.ok()) {
            print_summary(*o.result);
        } else {
            spdlog::error("{} failed: {}", o.id, o.error);
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    bool compare = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--compare") {
            compare = true;
        } else {
            config_path = arg;
        }
    }

    try {
        backtester::Config cfg;
        backtester::load_config(cfg, config_path);

        backtester::validate_config(cfg);
        spdlog::set_level(spdlog::level::from_str(cfg.logging.level));
        spdlog::info("Backtester starting. strategy={} capital={} data={}:{}",
                     backtester::describe(cfg.strategy.params), cfg.execution.initial_capital,
                     cfg.data.source, cfg.data.symbol);

        auto start = parse_config_date(cfg.data.start_date, "start_date");
        // Inclusive of the whole end day.
        auto end = parse_config_date(cfg.data.end_date, "end_date") + std::chrono::hours(24) - std::chrono::seconds(1);

        auto source = make_data_source(cfg.data);
        auto bars = std::make_shared<const backtester::BarSeries>(
            source->get_bars(cfg.data.symbol, start, end));
        backtester::validate_bars(*bars);

        backtester::ExecutionEngine engine(cfg.execution, cfg.metrics);

        std::unique_ptr<backtester::BacktestResult> benchmark_run;
        std::shared_ptr<const backtester::EquityCurve> benchmark_curve;
        if (cfg.metrics.run_benchmark) {
            benchmark_run = std::make_unique<backtester::BacktestResult>(
                engine.run(*bars, backtester::BuyAndHoldParams{}));
            benchmark_curve = std::make_shared<const backtester::EquityCurve>(benchmark_run->equity_curve);
        }

        if (compare) {
            return run_compare(cfg, bars, benchmark_curve);
        }

        auto result = engine.run(*bars, cfg.strategy.params, benchmark_curve.get());
        print_summary(result);
        if (benchmark_run) print_summary(*benchmark_run);

        if (!write_outputs(cfg.output, result, benchmark_run.get())) {
            spdlog::error("Failed to write one or more outputs");
            return 1;
        }
    } catch (const backtester::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    } catch (const backtester::InputError& e) {
        spdlog::error("Input error: {}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::error("Backtest aborted: {}", e.what());
        return 1;
    }
    return 0;
}
