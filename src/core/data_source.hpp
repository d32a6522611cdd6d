#pragma once

#include <string>
#include "bar_series.hpp"

namespace backtester {

/**
 * Supplies an already-materialized, chronological daily bar series.
 * The engine validates what it receives; sources do not reorder or repair.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    // Bars for `symbol` with start_time <= timestamp <= end_time.
    virtual BarSeries get_bars(const std::string& symbol,
                               Timestamp start_time,
                               Timestamp end_time) = 0;
};

} // namespace backtester
