#pragma once

#include <cstdint>
#include <string>
#include "data_source.hpp"

namespace backtester {

/**
 * Deterministic demo prices: a geometric random walk over business days
 * (Mon-Fri, no holiday calendar). The generator is seeded from `seed` and the
 * symbol, so the same request always yields the same series. A few well-known
 * tickers get their own starting price, volatility and drift.
 */
class SyntheticDataSource : public DataSource {
public:
    explicit SyntheticDataSource(uint64_t seed = 42);

    BarSeries get_bars(const std::string& symbol,
                       Timestamp start_time,
                       Timestamp end_time) override;

private:
    struct Preset {
        double price;
        double vol;     // daily stdev of log returns
        double trend;   // daily mean of log returns
    };

    static Preset preset_for(const std::string& symbol);

    uint64_t seed_;
};

} // namespace backtester
