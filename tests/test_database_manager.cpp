#include <gtest/gtest.h>

#include "database_manager.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

using data::DatabaseManager;

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db.connect());
        ASSERT_TRUE(db.initializeSchema());
    }

    DatabaseManager db{":memory:"};
};

TEST_F(DatabaseManagerTest, SaveAndQueryAll) {
    auto prices = test_helpers::makePrices({10, 11, 12, 13});
    ASSERT_TRUE(db.saveCandles(prices, "AAPL", "day"));

    core::PriceTable loaded = db.queryAllCandles("AAPL", "day");
    ASSERT_EQ(loaded.size(), 4u);
    EXPECT_EQ(loaded[0].timestamp, prices[0].timestamp);
    EXPECT_DOUBLE_EQ(loaded[3].close, 13.0);
    EXPECT_EQ(loaded[3].volume, prices[3].volume);

    EXPECT_TRUE(db.queryAllCandles("MSFT", "day").empty());
    EXPECT_TRUE(db.queryAllCandles("AAPL", "minute").empty());
}

TEST_F(DatabaseManagerTest, DuplicatesAreIgnored) {
    auto prices = test_helpers::makePrices({10, 11, 12});
    ASSERT_TRUE(db.saveCandles(prices, "AAPL", "day"));
    ASSERT_TRUE(db.saveCandles(prices, "AAPL", "day"));
    EXPECT_EQ(db.queryAllCandles("AAPL", "day").size(), 3u);
}

TEST_F(DatabaseManagerTest, RangeQueryIsInclusive) {
    auto prices = test_helpers::makePrices({10, 11, 12, 13, 14});
    ASSERT_TRUE(db.saveCandles(prices, "AAPL", "day"));

    core::PriceTable loaded = db.queryCandles("AAPL", "day", prices[1].timestamp, prices[3].timestamp);
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_DOUBLE_EQ(loaded.front().close, 11.0);
    EXPECT_DOUBLE_EQ(loaded.back().close, 13.0);
}

TEST(DatabaseManagerStandaloneTest, QueryWithoutConnectionThrows) {
    DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    EXPECT_THROW(db.queryAllCandles("AAPL", "day"), core::DataLoadException);
    EXPECT_FALSE(db.saveCandles(test_helpers::makePrices({1}), "AAPL", "day"));
}
