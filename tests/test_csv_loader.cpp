#include <gtest/gtest.h>

#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using data::CsvLoader;

TEST(CsvLoaderTest, ParsesYahooStyleCsv) {
    const std::string csv =
        "Date,Open,High,Low,Close,Adj Close,Volume\n"
        "2023-01-03,130.28,130.90,124.17,125.07,124.21,112117500\n"
        "2023-01-04,126.89,128.66,125.08,126.36,125.50,89113600\n";
    core::PriceTable prices = CsvLoader::parse(csv);
    ASSERT_EQ(prices.size(), 2u);
    EXPECT_EQ(core::utils::timestampToDate(prices[0].timestamp), "2023-01-03");
    EXPECT_DOUBLE_EQ(prices[0].open, 130.28);
    EXPECT_DOUBLE_EQ(prices[0].high, 130.90);
    EXPECT_DOUBLE_EQ(prices[0].low, 124.17);
    EXPECT_DOUBLE_EQ(prices[0].close, 125.07);
    EXPECT_EQ(prices[0].volume, 112117500);
    EXPECT_DOUBLE_EQ(prices[1].close, 126.36);
}

TEST(CsvLoaderTest, ColumnsFoundByNameInAnyOrder) {
    const std::string csv =
        "volume,close,low,high,open,timestamp\n"
        "1000,10.5,9.5,11,10,2023-02-01T00:00:00Z\n"
        "2000,11.5,10.5,12,11,2023-02-02T00:00:00Z\n";
    core::PriceTable prices = CsvLoader::parse(csv);
    ASSERT_EQ(prices.size(), 2u);
    EXPECT_DOUBLE_EQ(prices[1].open, 11.0);
    EXPECT_DOUBLE_EQ(prices[1].close, 11.5);
    EXPECT_EQ(prices[1].volume, 2000);
}

TEST(CsvLoaderTest, SkipsInvalidRows) {
    const std::string csv =
        "date,open,high,low,close,volume\n"
        "2023-01-02,10,11,9,10.5,100\n"
        "2023-01-03,abc,11,9,10.5,100\n"     // Not a number
        "2023-01-04,10,8,9,10.5,100\n"       // high < low
        "2023-01-05,10,11\n"                 // Too few fields
        "\n"
        "2023-01-06,10,11,9,10.8,100\n";
    core::PriceTable prices = CsvLoader::parse(csv);
    ASSERT_EQ(prices.size(), 2u);
    EXPECT_EQ(core::utils::timestampToDate(prices[1].timestamp), "2023-01-06");
}

TEST(CsvLoaderTest, RejectsBadFiles) {
    EXPECT_THROW(CsvLoader::parse(""), core::DataLoadException);
    EXPECT_THROW(CsvLoader::parse("date,open,high,low,volume\n2023-01-02,1,1,1,1\n"), core::DataLoadException);
    EXPECT_THROW(CsvLoader::parse("date,open,high,low,close,volume\n"), core::DataLoadException);
    EXPECT_THROW(CsvLoader::parse("date,open,high,low,close,volume\n"
                                  "2023-01-03,1,1,1,1,1\n"
                                  "2023-01-02,1,1,1,1,1\n"), core::DataLoadException);
    EXPECT_THROW(CsvLoader::load("/nonexistent/prices.csv"), core::DataLoadException);
}

TEST(CsvLoaderTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "quantdsl_csv_loader_test.csv";
    {
        std::ofstream out(path);
        out << "Date,Open,High,Low,Close,Volume\n"
            << "2023-03-01,5,6,4,5.5,10\n"
            << "2023-03-02,5.5,6.5,5,6,20\n"
            << "2023-03-03,6,7,5.5,6.5,30\n";
    }
    core::PriceTable prices = CsvLoader::load(path.string());
    std::filesystem::remove(path);
    ASSERT_EQ(prices.size(), 3u);
    EXPECT_DOUBLE_EQ(prices[2].close, 6.5);
}
