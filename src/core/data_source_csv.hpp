#pragma once

#include <string>
#include <vector>
#include "data_source.hpp"

namespace backtester {

/**
 * Single-symbol OHLCV file with a header row.
 * Recognized columns (case-insensitive): timestamp/date/datetime/time, open,
 * high, low, close, volume. Only the time column and close are required;
 * missing open/high/low default to the close. Timestamps may be ISO 8601,
 * YYYY-MM-DD or numeric epoch (s, ms, us or ns).
 */
class CsvDataSource : public DataSource {
public:
    explicit CsvDataSource(std::string path);

    BarSeries get_bars(const std::string& symbol,
                       Timestamp start_time,
                       Timestamp end_time) override;

    // Every row of the file, no date filter.
    BarSeries load_all();

    const std::string& path() const { return path_; }

private:
    struct Columns {
        int ts{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
        int volume{-1};
    };

    static Columns map_header(const std::vector<std::string>& headers);
    Bar parse_row(const std::vector<std::string>& fields, const Columns& cols, size_t line_no) const;

    std::string path_;
};

} // namespace backtester
