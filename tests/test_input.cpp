#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include "input.hpp"

TEST(Input, TrimsWhitespace) {
    EXPECT_EQ(trim("  abc \r"), "abc");
    EXPECT_EQ(trim(" \t\n"), "");
    EXPECT_EQ(trim(""), "");
}

TEST(Input, ParsesNumbers) {
    EXPECT_EQ(parse_number<uint32_t>("1721"), 1721u);
    EXPECT_THROW((void)parse_number<uint32_t>("17a"), parse_error);
    EXPECT_THROW((void)parse_number<uint32_t>(""), parse_error);
    EXPECT_THROW((void)parse_number<uint8_t>("300"), parse_error);
}

TEST(Input, LinesSkipBlankLines) {
    auto lines = Lines<uint64_t>::parse("1\n\n  2 \r\n3");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], 1u);
    EXPECT_EQ(lines[1], 2u);
    EXPECT_EQ(lines[2], 3u);
}

TEST(Input, LinesReportTheFailingLine) {
    try {
        (void)Lines<uint64_t>::parse("1\n\nx\n");
        FAIL() << "expected parse_error";
    } catch (const parse_error &e) {
        EXPECT_EQ(std::string{ e.what() }.rfind("line 3: ", 0), 0u) << e.what();
    }
}

TEST(Input, GroupsSplitOnBlankLines) {
    auto groups = split_groups("\na\nb\n\n\nc\n  \nd");
    ASSERT_EQ(groups.size(), 3u);
    ASSERT_EQ(groups[0].size(), 2u);
    EXPECT_EQ(groups[0][0].text, "a");
    EXPECT_EQ(groups[0][0].number, 2u);
    EXPECT_EQ(groups[0][1].text, "b");
    ASSERT_EQ(groups[1].size(), 1u);
    EXPECT_EQ(groups[1][0].text, "c");
    EXPECT_EQ(groups[1][0].number, 6u);
    EXPECT_EQ(groups[2][0].text, "d");
    EXPECT_EQ(groups[2][0].number, 8u);
}

TEST(Input, EmptyTextHasNoGroups) {
    EXPECT_TRUE(split_groups("").empty());
    EXPECT_TRUE(split_groups("\n\n").empty());
}

TEST(Input, AcceptsUtf8) {
    EXPECT_NO_THROW(check_utf8("plain ascii\n"));
    EXPECT_NO_THROW(check_utf8("café € \U0001F384"));
    EXPECT_EQ(decode_utf8("aé€"), U"aé€");
    EXPECT_EQ(encode_utf8(U'é'), "é");
}

TEST(Input, RejectsMalformedUtf8) {
    try {
        check_utf8("ab\xff");
        FAIL() << "expected input_error";
    } catch (const input_error &e) {
        EXPECT_NE(std::string{ e.what() }.find("byte 2"), std::string::npos) << e.what();
    }
    EXPECT_THROW(check_utf8("\xc3"), input_error);           // truncated
    EXPECT_THROW(check_utf8("\xc0\xaf"), input_error);       // overlong
    EXPECT_THROW(check_utf8("\xed\xa0\x80"), input_error);   // surrogate
    EXPECT_THROW((void)decode_utf8("a\x80"), parse_error);
}

TEST(Input, FirstCodePointKeepsMultibyteCharactersWhole) {
    EXPECT_EQ(first_code_point("éx"), "é");
    EXPECT_EQ(first_code_point("xy"), "x");
    EXPECT_EQ(first_code_point("\xffy"), "\xff");
    EXPECT_EQ(first_code_point(""), "");
}
