#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

namespace backtester {

using Timestamp = std::chrono::system_clock::time_point;

struct Bar {
    Timestamp timestamp;
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

using BarSeries = std::vector<Bar>;

/**
 * Structural validation of a price series.
 * Throws InputError when the series is empty, timestamps are not strictly
 * increasing, or a close is non-finite / non-positive.
 */
void validate_bars(const BarSeries& bars);

// Close prices of bars[0..count), count clamped to bars.size().
std::vector<double> closes(const BarSeries& bars, size_t count);

} // namespace backtester
