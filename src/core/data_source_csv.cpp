#include "data_source_csv.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "utils.hpp"

namespace backtester {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n\"");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n\"");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) out.push_back(trim(field));
    return out;
}

} // namespace

CsvDataSource::CsvDataSource(std::string path)
    : path_(std::move(path)) {}

CsvDataSource::Columns CsvDataSource::map_header(const std::vector<std::string>& headers) {
    Columns cols;
    for (size_t i = 0; i < headers.size(); ++i) {
        const std::string h = lower(headers[i]);
        const int idx = static_cast<int>(i);
        if (h == "timestamp" || h == "date" || h == "datetime" || h == "time") cols.ts = idx;
        else if (h == "open") cols.open = idx;
        else if (h == "high") cols.high = idx;
        else if (h == "low") cols.low = idx;
        else if (h == "close") cols.close = idx;
        else if (h == "volume") cols.volume = idx;
    }
    return cols;
}

Bar CsvDataSource::parse_row(const std::vector<std::string>& f, const Columns& cols, size_t line_no) const {
    auto field = [&](int idx) -> const std::string& {
        if (idx < 0 || static_cast<size_t>(idx) >= f.size()) {
            throw InputError(path_ + ":" + std::to_string(line_no) + ": missing column");
        }
        return f[static_cast<size_t>(idx)];
    };
    auto number = [&](int idx) {
        const std::string& s = field(idx);
        try {
            size_t used = 0;
            double v = std::stod(s, &used);
            if (used != s.size()) throw std::invalid_argument(s);
            return v;
        } catch (const std::logic_error&) {
            throw InputError(path_ + ":" + std::to_string(line_no) + ": bad number '" + s + "'");
        }
    };

    Bar bar;
    std::optional<Timestamp> ts;
    try {
        ts = utils::parse_ts_any(field(cols.ts));
    } catch (const std::logic_error&) {
        ts = std::nullopt;
    }
    if (!ts) {
        throw InputError(path_ + ":" + std::to_string(line_no) + ": bad timestamp '" + field(cols.ts) + "'");
    }
    bar.timestamp = *ts;
    bar.close = number(cols.close);
    bar.open = cols.open >= 0 ? number(cols.open) : bar.close;
    bar.high = cols.high >= 0 ? number(cols.high) : bar.close;
    bar.low = cols.low >= 0 ? number(cols.low) : bar.close;
    bar.volume = cols.volume >= 0 ? number(cols.volume) : 0.0;
    return bar;
}

BarSeries CsvDataSource::load_all() {
    std::ifstream f(path_);
    if (!f.is_open()) {
        throw InputError("cannot open price file " + path_);
    }

    std::string line;
    if (!std::getline(f, line)) {
        throw InputError("price file " + path_ + " is empty");
    }
    Columns cols = map_header(split(line));
    if (cols.ts < 0 || cols.close < 0) {
        throw InputError("price file " + path_ + " needs a timestamp/date and a close column");
    }

    BarSeries bars;
    size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        bars.push_back(parse_row(split(line), cols, line_no));
    }
    spdlog::info("Loaded {} bars from {}", bars.size(), path_);
    return bars;
}

BarSeries CsvDataSource::get_bars(const std::string& symbol,
                                  Timestamp start_time,
                                  Timestamp end_time) {
    spdlog::debug("CsvDataSource: {} holds a single series, symbol {} not checked", path_, symbol);
    BarSeries all = load_all();
    BarSeries out;
    out.reserve(all.size());
    for (const auto& b : all) {
        if (b.timestamp >= start_time && b.timestamp <= end_time) out.push_back(b);
    }
    return out;
}

} // namespace backtester
