/**
 * @file request_target_test.cc
 * @brief Unit tests for request target parsing
 */

#include <core/util/request_target.h>
#include <gtest/gtest.h>

using namespace filerelay::core;

//===========================================================================
// PercentDecode
//===========================================================================

TEST(PercentDecodeTest, DecodesEscapes) {
    EXPECT_EQ(PercentDecode("%41bc"), "Abc");
    EXPECT_EQ(PercentDecode("r%C3%A9sum%C3%A9.pdf"), "résumé.pdf");
    EXPECT_EQ(PercentDecode("a%2fb"), "a/b");
}

TEST(PercentDecodeTest, PlusStaysLiteral) {
    EXPECT_EQ(PercentDecode("a+b.txt"), "a+b.txt");
}

TEST(PercentDecodeTest, BadEscapesFail) {
    EXPECT_FALSE(PercentDecode("%").has_value());
    EXPECT_FALSE(PercentDecode("abc%4").has_value());
    EXPECT_FALSE(PercentDecode("%zz").has_value());
}

//===========================================================================
// ParseRequestTarget
//===========================================================================

TEST(ParseRequestTargetTest, PathOnly) {
    auto target = ParseRequestTarget("/ping");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->path, "/ping");
    EXPECT_TRUE(target->params.empty());
}

TEST(ParseRequestTargetTest, SplitsAndDecodesParams) {
    auto target = ParseRequestTarget("/begin?host=my+host&port=5001&flag&x=%3D");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->path, "/begin");
    EXPECT_EQ(target->params.at("host"), "my host");
    EXPECT_EQ(target->params.at("port"), "5001");
    EXPECT_EQ(target->params.at("flag"), "");
    EXPECT_EQ(target->params.at("x"), "=");
}

TEST(ParseRequestTargetTest, EmptyPairsAreSkipped) {
    auto target = ParseRequestTarget("/end?&&id=abc&");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->params.size(), 1u);
    EXPECT_EQ(target->params.at("id"), "abc");
}

TEST(ParseRequestTargetTest, LaterDuplicateWins) {
    auto target = ParseRequestTarget("/chunk?id=a&id=b");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->params.at("id"), "b");
}

TEST(ParseRequestTargetTest, MalformedEscapeFails) {
    EXPECT_FALSE(ParseRequestTarget("/end?id=%G1").has_value());
}

TEST(ParseRequestTargetTest, AbsoluteUrlIsNotOriginForm) {
    EXPECT_FALSE(ParseRequestTarget("http://host/ping").has_value());
}
