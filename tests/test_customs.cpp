#include <gtest/gtest.h>

#include "customs.hpp"
#include "error.hpp"

namespace {

const char *example = "abc\n\na\nb\nc\n\nab\nac\n\na\na\na\na\n\nb\n";

} // namespace

TEST(Customs, ParsesResponses) {
    auto r = Response::parse("abcx");
    for (auto q = 'a'; q <= 'z'; q++)
        EXPECT_EQ(r.test(q), q <= 'c' || q == 'x') << q;
    EXPECT_EQ(r.pop_count(), 4u);
    EXPECT_EQ(Response::parse("z").get_value(), 1u << 25);
    EXPECT_EQ(Response::parse("aa"), Response::parse("a"));
}

TEST(Customs, RejectsNonLetters) {
    EXPECT_THROW((void)Response::parse("abC"), parse_error);
    EXPECT_THROW((void)Response::parse("a1"), parse_error);
    EXPECT_THROW((void)Responses::parse("ab\n\na b\n"), parse_error);
}

TEST(Customs, ReportsWholeNonAsciiCharacters) {
    try {
        (void)Response::parse("ab\u00e9");
        FAIL() << "expected parse_error";
    } catch (const parse_error &e) {
        EXPECT_STREQ(e.what(), "Expected a lowercase letter, found \"\u00e9\"");
    }
}

TEST(Customs, TestOutsideQuestionsIsFalse) {
    auto r = Response{ Response::ALL };
    EXPECT_TRUE(r.test('a'));
    EXPECT_TRUE(r.test('z'));
    EXPECT_FALSE(r.test('A'));
    EXPECT_FALSE(r.test('{'));
    EXPECT_FALSE(r.test('\0'));
    EXPECT_FALSE(r.test(static_cast<char>(0xff)));
}

TEST(Customs, SingleLineGroupMergesToItself) {
    ResponseGroup g;
    g.members.push_back(Response::parse("qxz"));
    EXPECT_EQ(g.merge_any(), g.members.front());
    EXPECT_EQ(g.merge_all(), g.members.front());
}

TEST(Customs, MergesGroups) {
    ResponseGroup g;
    g.members.push_back(Response::parse("ab"));
    g.members.push_back(Response::parse("ac"));
    EXPECT_EQ(g.merge_any(), Response::parse("abc"));
    EXPECT_EQ(g.merge_all(), Response::parse("a"));
}

TEST(Customs, SumsExample) {
    auto groups = Responses::parse(example);
    ASSERT_EQ(groups.size(), 5u);
    EXPECT_EQ(questions_anyone_answered(groups), 11u);
    EXPECT_EQ(questions_everyone_answered(groups), 6u);
}
