#pragma once

#include <cstddef>
#include <vector>

namespace backtester {
namespace ind {

// All series are causal: element i depends only on values[0..i].
// Entries without enough history are NaN.

std::vector<double> sma_series(const std::vector<double>& values, size_t window);

// Exponential moving average, alpha = 2/(span+1), seeded with values[0].
std::vector<double> ema_series(const std::vector<double>& values, size_t span);

// Sample (n-1) standard deviation over a trailing window; window must be >= 2.
std::vector<double> rolling_stddev_series(const std::vector<double>& values, size_t window);

/**
 * Relative Strength Index with Wilder smoothing.
 * The first value (index = period) averages the first `period` price changes;
 * later values use avg = (prev * (period - 1) + current) / period.
 * No losses gives 100, no movement at all gives 50.
 */
std::vector<double> rsi_series(const std::vector<double>& values, size_t period);

} // namespace ind
} // namespace backtester
