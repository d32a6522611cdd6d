#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "execution_engine.hpp"

namespace backtester {

struct RunRequest {
    std::string id;
    std::shared_ptr<const BarSeries> bars;         // shared read-only between jobs
    StrategyParams params;
    ExecutionConfig execution;
    MetricsConfig metrics;
    std::shared_ptr<const EquityCurve> benchmark;  // optional, for alpha/beta
};

struct RunOutcome {
    std::string id;
    std::optional<BacktestResult> result;
    std::string error;   // set when the run threw

    bool ok() const { return result.has_value(); }
};

/**
 * Runs independent backtests concurrently, one worker thread per job.
 *
 * Jobs share only immutable inputs; every worker owns its engine and the
 * portfolio, curve and trade log that engine creates. A job that fails with
 * InputError / ConfigError (or anything else derived from std::exception)
 * reports the message in its outcome without affecting the other jobs.
 * Outcomes come back in request order.
 */
class BatchRunner {
public:
    // max_parallel = 0 starts every job at once.
    explicit BatchRunner(size_t max_parallel = 0);
    virtual ~BatchRunner() = default;

    std::vector<RunOutcome> run_all(const std::vector<RunRequest>& requests) const;

    static RunOutcome run_one(const RunRequest& request);

protected:
    // Starts one worker thread. A std::system_error here makes the job run
    // inline on the calling thread instead.
    virtual std::unique_ptr<std::thread> spawn(std::function<void()> job) const;

private:
    size_t max_parallel_;
};

} // namespace backtester
