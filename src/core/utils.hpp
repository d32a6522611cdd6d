#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace backtester {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Timestamp helpers shared by the data sources and the result writer.
 */
namespace utils {

// Whole seconds since the Unix epoch.
inline int64_t ts_to_sec(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp sec_to_ts(int64_t sec) {
    return Timestamp{} + std::chrono::seconds(sec);
}

inline std::tm to_utc_tm(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}

inline std::string format_utc(Timestamp ts, const char* fmt) {
    std::tm tm = to_utc_tm(ts);
    char text[40];
    size_t n = std::strftime(text, sizeof(text), fmt, &tm);
    return std::string(text, n);
}

// "2024-01-15T00:00:00Z", used for every timestamp written to results.
inline std::string ts_to_iso(Timestamp ts) {
    return format_utc(ts, "%Y-%m-%dT%H:%M:%SZ");
}

// "2024-01-15"
inline std::string ts_to_date(Timestamp ts) {
    return format_utc(ts, "%Y-%m-%d");
}

inline std::optional<Timestamp> parse_utc(const std::string& text, const char* fmt) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, fmt);
    if (in.fail()) return std::nullopt;
    return sec_to_ts(static_cast<int64_t>(timegm(&tm)));
}

/**
 * "2024-01-15T10:30:00Z", "2024-01-15T10:30:00" or "2024-01-15 10:30:00".
 * Fractional seconds and offsets after the seconds field are ignored.
 */
inline std::optional<Timestamp> parse_iso_ts(const std::string& s) {
    if (s.size() < 19) return std::nullopt;
    std::string norm = s.substr(0, 19);
    if (norm[10] == ' ') norm[10] = 'T';
    return parse_utc(norm, "%Y-%m-%dT%H:%M:%S");
}

// "2024-01-15" as midnight UTC.
inline std::optional<Timestamp> parse_date(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return parse_utc(s, "%Y-%m-%d");
}

/**
 * Price-file timestamps: ISO 8601, a plain date, or an integer epoch whose
 * unit follows from its digit count (<13 s, 13-15 ms, 16-18 us, 19+ ns).
 */
inline std::optional<Timestamp> parse_ts_any(const std::string& s) {
    if (s.empty()) return std::nullopt;

    const bool numeric = std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric) {
        if (auto ts = parse_iso_ts(s)) return ts;
        return parse_date(s);
    }

    const int64_t epoch = std::stoll(s);
    using std::chrono::duration_cast;
    if (s.size() >= 19) return Timestamp{} + duration_cast<Timestamp::duration>(std::chrono::nanoseconds(epoch));
    if (s.size() >= 16) return Timestamp{} + duration_cast<Timestamp::duration>(std::chrono::microseconds(epoch));
    if (s.size() >= 13) return Timestamp{} + duration_cast<Timestamp::duration>(std::chrono::milliseconds(epoch));
    return sec_to_ts(epoch);
}

// 0 = Sunday ... 6 = Saturday, in UTC.
inline int weekday(Timestamp ts) {
    return to_utc_tm(ts).tm_wday;
}

} // namespace utils
} // namespace backtester
