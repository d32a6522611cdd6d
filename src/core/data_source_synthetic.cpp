#include "data_source_synthetic.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace backtester {

namespace {

// FNV-1a, stable across platforms unlike std::hash.
uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }

} // namespace

SyntheticDataSource::SyntheticDataSource(uint64_t seed)
    : seed_(seed) {}

SyntheticDataSource::Preset SyntheticDataSource::preset_for(const std::string& symbol) {
    static const std::unordered_map<std::string, Preset> presets{
        {"AAPL", {150.0, 0.020, 0.0005}},
        {"MSFT", {350.0, 0.018, 0.0006}},
        {"GOOGL", {140.0, 0.022, 0.0004}},
        {"TSLA", {250.0, 0.035, 0.0008}},
        {"SPY", {450.0, 0.012, 0.0004}},
        {"AMZN", {170.0, 0.025, 0.0005}},
        {"NVDA", {500.0, 0.030, 0.0010}},
        {"QQQ", {380.0, 0.015, 0.0005}},
    };
    auto it = presets.find(symbol);
    return it != presets.end() ? it->second : Preset{100.0, 0.020, 0.0004};
}

BarSeries SyntheticDataSource::get_bars(const std::string& symbol,
                                        Timestamp start_time,
                                        Timestamp end_time) {
    const Preset preset = preset_for(symbol);
    std::mt19937_64 rng(seed_ ^ fnv1a(symbol));
    std::normal_distribution<double> step(preset.trend, preset.vol);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    // Align to midnight UTC.
    const auto day = std::chrono::hours(24);
    Timestamp ts = utils::sec_to_ts(utils::ts_to_sec(start_time) / 86400 * 86400);

    BarSeries bars;
    double log_price = std::log(preset.price);
    for (; ts <= end_time; ts += day) {
        if (ts < start_time) continue;
        int wd = utils::weekday(ts);
        if (wd == 0 || wd == 6) continue;

        log_price += step(rng);
        const double close = std::exp(log_price);
        const double range = close * preset.vol * (0.5 + unit(rng));
        const double high = close + range * unit(rng);
        const double low = close - range * unit(rng);
        const double open = close + range * (unit(rng) - 0.5);

        Bar b;
        b.timestamp = ts;
        b.close = round2(close);
        b.open = round2(std::max(open, low));
        b.high = round2(std::max({high, close, open}));
        b.low = round2(std::min({low, close, open}));
        b.volume = std::floor(10000000.0 * (0.7 + 0.6 * unit(rng)));
        bars.push_back(b);
    }
    spdlog::info("Generated {} synthetic bars for {} ({} to {})", bars.size(), symbol,
                 utils::ts_to_date(start_time), utils::ts_to_date(end_time));
    return bars;
}

} // namespace backtester
