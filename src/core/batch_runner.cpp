#include "batch_runner.hpp"
#include <algorithm>
#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

namespace backtester {

BatchRunner::BatchRunner(size_t max_parallel)
    : max_parallel_(max_parallel) {}

RunOutcome BatchRunner::run_one(const RunRequest& request) {
    RunOutcome outcome;
    outcome.id = request.id;
    if (!request.bars) {
        outcome.error = "no price series supplied";
        spdlog::error("Run {} failed: {}", request.id, outcome.error);
        return outcome;
    }
    try {
        ExecutionEngine engine(request.execution, request.metrics);
        outcome.result = engine.run(*request.bars, request.params, request.benchmark.get());
    } catch (const std::exception& e) {
        outcome.error = e.what();
        spdlog::error("Run {} failed: {}", request.id, e.what());
    }
    return outcome;
}

std::unique_ptr<std::thread> BatchRunner::spawn(std::function<void()> job) const {
    return std::make_unique<std::thread>(std::move(job));
}

std::vector<RunOutcome> BatchRunner::run_all(const std::vector<RunRequest>& requests) const {
    std::vector<RunOutcome> outcomes(requests.size());
    const size_t wave = max_parallel_ == 0 ? std::max<size_t>(1, requests.size()) : max_parallel_;

    for (size_t start = 0; start < requests.size(); start += wave) {
        const size_t end = std::min(requests.size(), start + wave);
        std::vector<std::unique_ptr<std::thread>> workers;
        workers.reserve(end - start);
        for (size_t k = start; k < end; ++k) {
            // Each worker writes only its own slot.
            auto job = [&requests, &outcomes, k] { outcomes[k] = run_one(requests[k]); };
            try {
                workers.push_back(spawn(job));
            } catch (const std::system_error& e) {
                spdlog::warn("Could not start a worker for {} ({}), running it inline", requests[k].id, e.what());
                job();
            }
        }
        for (auto& t : workers) {
            if (t && t->joinable()) t->join();
        }
    }
    spdlog::info("Batch of {} runs finished", requests.size());
    return outcomes;
}

} // namespace backtester
