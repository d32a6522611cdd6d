#pragma once

#include <cstddef>
#include <vector>
#include "bar_series.hpp"

namespace backtester {

struct EquityPoint {
    Timestamp timestamp;
    double equity;
};

// One entry per bar, index-aligned with the BarSeries it was produced from.
using EquityCurve = std::vector<EquityPoint>;

/**
 * Completed round trip. Prices are effective fill prices (slippage included);
 * pnl is net of the entry and exit commissions.
 */
struct Trade {
    size_t entry_index{0};
    size_t exit_index{0};
    Timestamp entry_time;
    Timestamp exit_time;
    double entry_price{0.0};
    double exit_price{0.0};
    double quantity{0.0};
    double commission{0.0};   // entry + exit
    double pnl{0.0};
    double return_pct{0.0};   // pnl / (entry_price * quantity) * 100
    bool forced_exit{false};  // closed by end-of-data liquidation
};

using TradeLog = std::vector<Trade>;

} // namespace backtester
