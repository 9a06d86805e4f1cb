#include <gtest/gtest.h>
#include "negotiate.hpp"

using namespace siphon;

TEST(NegotiateTest, MissingHeaderDefaultsToJson) {
  EXPECT_EQ(best_fit_decode_type(""), DecodeType::Json);
  EXPECT_EQ(best_fit_decode_type("   "), DecodeType::Json);
}

TEST(NegotiateTest, ApplicationJson) {
  EXPECT_EQ(best_fit_decode_type("application/json"), DecodeType::Json);
  EXPECT_EQ(best_fit_decode_type("application/json; charset=utf-8"), DecodeType::Json);
  EXPECT_EQ(best_fit_decode_type("Application/JSON"), DecodeType::Json);
}

TEST(NegotiateTest, WildcardsMatchJson) {
  EXPECT_EQ(best_fit_decode_type("*/*"), DecodeType::Json);
  EXPECT_EQ(best_fit_decode_type("application/*"), DecodeType::Json);
}

TEST(NegotiateTest, TextPlainIsUnknown) {
  EXPECT_EQ(best_fit_decode_type("text/plain"), DecodeType::Unknown);
  EXPECT_EQ(best_fit_decode_type("text/*"), DecodeType::Unknown);
  EXPECT_EQ(best_fit_decode_type("application/xml"), DecodeType::Unknown);
}

TEST(NegotiateTest, LaterJsonCandidateStillMatches) {
  EXPECT_EQ(best_fit_decode_type("text/html, application/json;q=0.9"), DecodeType::Json);
  EXPECT_EQ(best_fit_decode_type("text/html, application/xml"), DecodeType::Unknown);
}

TEST(NegotiateTest, ZeroQualityIsNotAcceptable) {
  EXPECT_EQ(best_fit_decode_type("application/json;q=0, text/plain"), DecodeType::Unknown);
}

TEST(NegotiateTest, ParseAcceptOrdersByQualityThenSpecificity) {
  auto ranges = parse_accept("text/*;q=0.5, application/json, */*;q=0.1, text/html;level=1;q=0.5");
  ASSERT_EQ(ranges.size(), 4u);
  EXPECT_EQ(ranges[0].type, "application");
  EXPECT_EQ(ranges[0].subtype, "json");
  EXPECT_EQ(ranges[1].subtype, "html");
  ASSERT_EQ(ranges[1].params.size(), 1u);
  EXPECT_EQ(ranges[1].params[0].first, "level");
  EXPECT_DOUBLE_EQ(ranges[1].q, 0.5);
  EXPECT_EQ(ranges[2].subtype, "*");
  EXPECT_EQ(ranges[2].type, "text");
  EXPECT_EQ(ranges[3].type, "*");
}

TEST(NegotiateTest, ParseAcceptKeepsHeaderOrderForTies) {
  auto ranges = parse_accept("text/csv, application/json");
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_EQ(ranges[0].subtype, "csv");
  EXPECT_EQ(ranges[1].subtype, "json");
}

TEST(NegotiateTest, ParseAcceptDropsMalformedCandidates) {
  auto ranges = parse_accept("garbage, application/json, text/plain;q=abc, */json, ");
  ASSERT_EQ(ranges.size(), 1u);
  EXPECT_EQ(ranges[0].subtype, "json");
}

TEST(NegotiateTest, DecodeTypeNames) {
  EXPECT_EQ(decode_type_name(DecodeType::Json), "json");
  EXPECT_EQ(decode_type_name(DecodeType::Unknown), "unknown");
}
