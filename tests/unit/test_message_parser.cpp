#include <gtest/gtest.h>
#include "binance/message_parser.hpp"

using namespace surge;
using namespace surge::binance;

TEST(MessageParserTest, ParseAggTrade) {
    const char* json = R"({
        "e": "aggTrade",
        "E": 1672515782136,
        "s": "BTCUSDT",
        "a": 5933014,
        "p": "16500.50",
        "q": "0.123",
        "f": 100,
        "l": 105,
        "T": 1672515782136,
        "m": true
    })";

    auto result = MessageParser::parse_agg_trade(json);
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& trade = result.value();
    EXPECT_EQ(trade.event_type, "aggTrade");
    EXPECT_EQ(trade.symbol, "BTCUSDT");
    EXPECT_EQ(trade.agg_trade_id, 5933014u);
    EXPECT_DOUBLE_EQ(trade.price, 16500.50);
    EXPECT_DOUBLE_EQ(trade.quantity, 0.123);
    EXPECT_EQ(trade.trade_time, 1672515782136u);
    EXPECT_TRUE(trade.is_buyer_maker);
}

TEST(MessageParserTest, ToSampleConvertsMillisToSeconds) {
    auto result = MessageParser::parse_agg_trade(
        R"({"e":"aggTrade","s":"BTCUSDT","p":"100","q":"2","T":1700000000500})");
    ASSERT_TRUE(result.is_ok());

    auto sample = result.value().to_sample();
    EXPECT_DOUBLE_EQ(sample.timestamp, 1700000000.5);
    EXPECT_DOUBLE_EQ(sample.notional(), 200.0);
}

TEST(MessageParserTest, OptionalFieldsDefault) {
    auto result = MessageParser::parse_agg_trade(
        R"({"e":"aggTrade","s":"BTCUSDT","p":"100","q":"1","T":5})");
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().event_time, 5u);
    EXPECT_FALSE(result.value().is_buyer_maker);
}

TEST(MessageParserTest, MissingFieldsRejected) {
    auto result = MessageParser::parse_agg_trade(R"({"e":"aggTrade","s":"BTCUSDT","p":"100"})");
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("Missing") != std::string::npos);
}

TEST(MessageParserTest, OtherEventTypesRejected) {
    auto result = MessageParser::parse_agg_trade(
        R"({"e":"depthUpdate","s":"BTCUSDT","p":"100","q":"1","T":5})");
    EXPECT_TRUE(result.is_err());
}

TEST(MessageParserTest, NonPositivePriceOrQuantityRejected) {
    EXPECT_TRUE(MessageParser::parse_agg_trade(
        R"({"e":"aggTrade","s":"BTCUSDT","p":"0","q":"1","T":5})").is_err());
    EXPECT_TRUE(MessageParser::parse_agg_trade(
        R"({"e":"aggTrade","s":"BTCUSDT","p":"100","q":"-1","T":5})").is_err());
}

TEST(MessageParserTest, NonNumericPriceRejected) {
    auto result = MessageParser::parse_agg_trade(
        R"({"e":"aggTrade","s":"BTCUSDT","p":"abc","q":"1","T":5})");
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("price") != std::string::npos);
}

TEST(MessageParserTest, WrongJsonTypesRejected) {
    // Binance sends prices as strings; a bare number is malformed
    EXPECT_TRUE(MessageParser::parse_agg_trade(
        R"({"e":"aggTrade","s":"BTCUSDT","p":100,"q":"1","T":5})").is_err());
}

TEST(MessageParserTest, InvalidJsonRejected) {
    auto result = MessageParser::parse_agg_trade("{ not valid json }");
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("JSON") != std::string::npos);

    EXPECT_TRUE(MessageParser::parse_agg_trade("[1,2]").is_err());
}

TEST(MessageParserTest, ParseDecimalIsStrict) {
    EXPECT_DOUBLE_EQ(MessageParser::parse_decimal("16500.50").value(), 16500.5);
    EXPECT_TRUE(MessageParser::parse_decimal("").is_err());
    EXPECT_TRUE(MessageParser::parse_decimal("1.5abc").is_err());
    EXPECT_TRUE(MessageParser::parse_decimal("inf").is_err());
}
