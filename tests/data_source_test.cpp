#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "../src/core/bar_series.hpp"
#include "../src/core/data_source_csv.hpp"
#include "../src/core/data_source_synthetic.hpp"
#include "../src/core/errors.hpp"
#include "../src/core/utils.hpp"

using namespace backtester;

namespace {

std::string write_temp(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream f(path);
    f << contents;
    return path;
}

Timestamp date(const char* s) {
    return *utils::parse_date(s);
}

} // namespace

TEST(CsvDataSourceTest, LoadsOhlcvRows) {
    auto path = write_temp("bt_prices.csv",
        "Date,Open,High,Low,Close,Volume\n"
        "2024-01-02,10.0,11.0,9.5,10.5,1000\n"
        "2024-01-03,10.5,12.0,10.0,11.5,1500\n"
        "\n"
        "2024-01-04,11.5,11.8,10.9,11.0,900\n");
    CsvDataSource src(path);
    auto bars = src.load_all();
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(utils::ts_to_date(bars[0].timestamp), "2024-01-02");
    EXPECT_DOUBLE_EQ(bars[1].open, 10.5);
    EXPECT_DOUBLE_EQ(bars[1].high, 12.0);
    EXPECT_DOUBLE_EQ(bars[1].low, 10.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 11.5);
    EXPECT_DOUBLE_EQ(bars[2].volume, 900.0);
    EXPECT_NO_THROW(validate_bars(bars));
    std::remove(path.c_str());
}

TEST(CsvDataSourceTest, CloseOnlyAndEpochTimestamps) {
    auto path = write_temp("bt_close_only.csv",
        "timestamp,close\n"
        "1704153600,100.0\n"
        "1704240000000,101.0\n");
    auto bars = CsvDataSource(path).load_all();
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(utils::ts_to_iso(bars[0].timestamp), "2024-01-02T00:00:00Z");
    EXPECT_EQ(utils::ts_to_iso(bars[1].timestamp), "2024-01-03T00:00:00Z");
    EXPECT_DOUBLE_EQ(bars[0].open, 100.0);
    EXPECT_DOUBLE_EQ(bars[0].low, 100.0);
    EXPECT_DOUBLE_EQ(bars[1].volume, 0.0);
    std::remove(path.c_str());
}

TEST(CsvDataSourceTest, GetBarsFiltersByDate) {
    auto path = write_temp("bt_range.csv",
        "date,close\n"
        "2024-01-01,1\n2024-01-02,2\n2024-01-03,3\n2024-01-04,4\n");
    CsvDataSource src(path);
    auto bars = src.get_bars("ANY", date("2024-01-02"), date("2024-01-03"));
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[0].close, 2.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 3.0);
    std::remove(path.c_str());
}

TEST(CsvDataSourceTest, MalformedInputThrows) {
    EXPECT_THROW(CsvDataSource(::testing::TempDir() + "bt_missing.csv").load_all(), InputError);

    auto no_close = write_temp("bt_no_close.csv", "date,open\n2024-01-01,1\n");
    EXPECT_THROW(CsvDataSource(no_close).load_all(), InputError);
    std::remove(no_close.c_str());

    auto bad_number = write_temp("bt_bad_number.csv", "date,close\n2024-01-01,abc\n");
    EXPECT_THROW(CsvDataSource(bad_number).load_all(), InputError);
    std::remove(bad_number.c_str());

    auto bad_date = write_temp("bt_bad_date.csv", "date,close\nyesterday,1.0\n");
    EXPECT_THROW(CsvDataSource(bad_date).load_all(), InputError);
    std::remove(bad_date.c_str());

    auto empty = write_temp("bt_empty.csv", "");
    EXPECT_THROW(CsvDataSource(empty).load_all(), InputError);
    std::remove(empty.c_str());
}

TEST(SyntheticDataSourceTest, BusinessDaysOnly) {
    SyntheticDataSource src(7);
    auto bars = src.get_bars("AAPL", date("2024-01-01"), date("2024-01-31"));
    EXPECT_EQ(bars.size(), 23u);
    for (const auto& b : bars) {
        int wd = utils::weekday(b.timestamp);
        EXPECT_NE(wd, 0);
        EXPECT_NE(wd, 6);
        EXPECT_GT(b.close, 0.0);
        EXPECT_LE(b.low, b.close);
        EXPECT_GE(b.high, b.close);
    }
    EXPECT_NO_THROW(validate_bars(bars));
}

TEST(SyntheticDataSourceTest, SeededAndDeterministic) {
    auto a = SyntheticDataSource(42).get_bars("SPY", date("2022-01-01"), date("2022-12-31"));
    auto b = SyntheticDataSource(42).get_bars("SPY", date("2022-01-01"), date("2022-12-31"));
    auto c = SyntheticDataSource(43).get_bars("SPY", date("2022-01-01"), date("2022-12-31"));
    auto d = SyntheticDataSource(42).get_bars("TSLA", date("2022-01-01"), date("2022-12-31"));
    ASSERT_EQ(a.size(), b.size());
    ASSERT_EQ(a.size(), c.size());
    bool differs_by_seed = false;
    bool differs_by_symbol = false;
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].close, b[i].close);
        differs_by_seed = differs_by_seed || a[i].close != c[i].close;
        differs_by_symbol = differs_by_symbol || a[i].close != d[i].close;
    }
    EXPECT_TRUE(differs_by_seed);
    EXPECT_TRUE(differs_by_symbol);
}

TEST(SyntheticDataSourceTest, EmptyRange) {
    SyntheticDataSource src;
    EXPECT_TRUE(src.get_bars("SPY", date("2024-01-06"), date("2024-01-07")).empty());
    EXPECT_TRUE(src.get_bars("SPY", date("2024-02-01"), date("2024-01-01")).empty());
}
