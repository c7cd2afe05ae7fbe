/**
 * @file test_format_tools.cpp
 * @brief format_tools: delimiter splitting, buffers, timestamps.
 */
#include "test_patterns.h"
#include "utils/format_tools.hpp"

#include <chrono>
#include <regex>
#include <string>

using namespace simpub::format_tools;
using simpub::tests::PureApiTest;

class FormatToolsTest : public PureApiTest
{
};

TEST_F(FormatToolsTest, SplitFirst_SplitsAtFirstDelimiterOnly)
{
    auto [head, tail] = split_first("Register:{\"Host\":\"10.0.0.2:1\"}", ':');
    EXPECT_EQ(head, "Register");
    EXPECT_EQ(tail, "{\"Host\":\"10.0.0.2:1\"}");
}

TEST_F(FormatToolsTest, SplitFirst_NoDelimiterYieldsWholeInputAndEmptyTail)
{
    auto [head, tail] = split_first("Ping", ':');
    EXPECT_EQ(head, "Ping");
    EXPECT_TRUE(tail.empty());
}

TEST_F(FormatToolsTest, SplitFirst_EmptyFields)
{
    auto [head, tail] = split_first(":body", ':');
    EXPECT_TRUE(head.empty());
    EXPECT_EQ(tail, "body");

    auto [head2, tail2] = split_first("name:", ':');
    EXPECT_EQ(head2, "name");
    EXPECT_TRUE(tail2.empty());
}

TEST_F(FormatToolsTest, MakeBuffer_FormatsArguments)
{
    auto mb = make_buffer("{} topics from {}", 3, "10.0.0.2");
    EXPECT_EQ(std::string(mb.data(), mb.size()), "3 topics from 10.0.0.2");
}

TEST_F(FormatToolsTest, FormattedTime_HasMicrosecondPrecision)
{
    const auto text = formatted_time(std::chrono::system_clock::now());
    const std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})");
    EXPECT_TRUE(std::regex_match(text, pattern)) << text;
}
