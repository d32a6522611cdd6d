#include "indicators.hpp"
#include <cmath>
#include <limits>

namespace backtester {
namespace ind {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> sma_series(const std::vector<double>& v, size_t window) {
    std::vector<double> out(v.size(), kNaN);
    if (window == 0) return out;
    for (size_t i = window - 1; i < v.size(); ++i) {
        double s = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) s += v[j];
        out[i] = s / static_cast<double>(window);
    }
    return out;
}

std::vector<double> ema_series(const std::vector<double>& v, size_t span) {
    std::vector<double> out(v.size(), kNaN);
    if (v.empty() || span == 0) return out;
    const double k = 2.0 / (static_cast<double>(span) + 1.0);
    double e = v[0];
    out[0] = e;
    for (size_t i = 1; i < v.size(); ++i) {
        e = v[i] * k + e * (1.0 - k);
        out[i] = e;
    }
    return out;
}

std::vector<double> rolling_stddev_series(const std::vector<double>& v, size_t window) {
    std::vector<double> out(v.size(), kNaN);
    if (window < 2) return out;
    for (size_t i = window - 1; i < v.size(); ++i) {
        double mean = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) mean += v[j];
        mean /= static_cast<double>(window);
        double var = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            const double d = v[j] - mean;
            var += d * d;
        }
        var /= static_cast<double>(window - 1);
        out[i] = std::sqrt(var);
    }
    return out;
}

std::vector<double> rsi_series(const std::vector<double>& v, size_t period) {
    std::vector<double> out(v.size(), kNaN);
    if (period == 0 || v.size() <= period) return out;

    auto to_rsi = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) return avg_gain == 0.0 ? 50.0 : 100.0;
        const double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (size_t i = 1; i <= period; ++i) {
        const double d = v[i] - v[i - 1];
        if (d > 0) avg_gain += d; else avg_loss -= d;
    }
    const double p = static_cast<double>(period);
    avg_gain /= p;
    avg_loss /= p;
    out[period] = to_rsi(avg_gain, avg_loss);

    for (size_t i = period + 1; i < v.size(); ++i) {
        const double d = v[i] - v[i - 1];
        const double gain = d > 0 ? d : 0.0;
        const double loss = d < 0 ? -d : 0.0;
        avg_gain = (avg_gain * (p - 1.0) + gain) / p;
        avg_loss = (avg_loss * (p - 1.0) + loss) / p;
        out[i] = to_rsi(avg_gain, avg_loss);
    }
    return out;
}

} // namespace ind
} // namespace backtester
