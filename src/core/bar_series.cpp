#include "bar_series.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include "errors.hpp"
#include "utils.hpp"

namespace backtester {

void validate_bars(const BarSeries& bars) {
    if (bars.empty()) {
        throw InputError("price series is empty");
    }
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& b = bars[i];
        if (!std::isfinite(b.close) || b.close <= 0.0) {
            throw InputError("bar " + std::to_string(i) + " has invalid close " + std::to_string(b.close));
        }
        if (i == 0) continue;
        const auto& prev = bars[i - 1];
        if (b.timestamp == prev.timestamp) {
            throw InputError("duplicate timestamp " + utils::ts_to_iso(b.timestamp) +
                             " at bar " + std::to_string(i));
        }
        if (b.timestamp < prev.timestamp) {
            throw InputError("non-chronological timestamp " + utils::ts_to_iso(b.timestamp) +
                             " at bar " + std::to_string(i));
        }
    }
}

std::vector<double> closes(const BarSeries& bars, size_t count) {
    count = std::min(count, bars.size());
    std::vector<double> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) out.push_back(bars[i].close);
    return out;
}

} // namespace backtester
