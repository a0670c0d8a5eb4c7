// test_conversion_utils.cpp
#include <gtest/gtest.h>
#include "../test_utils.hpp"
#include "finpipe/data/conversion_utils.hpp"

using namespace finpipe;
using namespace finpipe::testing;

class ConversionUtilsTest : public TestBase {};

TEST_F(ConversionUtilsTest, BarsToTablePreservesOrder) {
    auto bars = make_bars("AAPL", "2024-01-02", {185.0, 186.5, 184.0});
    auto table = DataConversionUtils::price_bars_to_table(bars);
    ASSERT_TRUE(table.is_ok()) << table.error()->what();
    EXPECT_EQ(table.value()->num_rows(), 3);
    EXPECT_TRUE(table.value()->schema()->Equals(*DataConversionUtils::price_schema()));

    auto back = DataConversionUtils::arrow_table_to_price_bars(table.value(), "export");
    ASSERT_TRUE(back.is_ok()) << back.error()->what();
    ASSERT_EQ(back.value().size(), 3u);
    EXPECT_EQ(back.value()[1].symbol, "AAPL");
    EXPECT_EQ(back.value()[1].date, day("2024-01-03"));
    EXPECT_DOUBLE_EQ(back.value()[1].close, 186.5);
    EXPECT_EQ(back.value()[1].source, "export");
}

TEST_F(ConversionUtilsTest, EmptyBarsGiveEmptyTable) {
    auto table = DataConversionUtils::price_bars_to_table({});
    ASSERT_TRUE(table.is_ok());
    EXPECT_EQ(table.value()->num_rows(), 0);
    EXPECT_EQ(table.value()->num_columns(), 8);
}

TEST_F(ConversionUtilsTest, MissingColumnRejected) {
    auto schema = arrow::schema({arrow::field("symbol", arrow::utf8())});
    arrow::StringBuilder builder;
    ASSERT_TRUE(builder.Append("AAPL").ok());
    std::shared_ptr<arrow::Array> symbols;
    ASSERT_TRUE(builder.Finish(&symbols).ok());
    auto table = arrow::Table::Make(schema, {symbols});

    auto bars = DataConversionUtils::arrow_table_to_price_bars(table);
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::INVALID_DATA);

    auto null_table = DataConversionUtils::arrow_table_to_price_bars(nullptr);
    ASSERT_TRUE(null_table.is_error());
    EXPECT_EQ(null_table.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
