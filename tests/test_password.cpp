#include <string>

#include <gtest/gtest.h>

#include "error.hpp"
#include "password.hpp"

TEST(Password, ParsesEntry) {
    auto e = Entry::parse("2-15 x: xxabc");
    EXPECT_EQ(e.rule, (Rule{ 2, 15, 'x' }));
    EXPECT_EQ(e.password, "xxabc");
    EXPECT_EQ(Rule::parse("1-3a"), (Rule{ 1, 3, 'a' }));
}

TEST(Password, RejectsMalformedEntries) {
    EXPECT_THROW((void)Entry::parse("1-3 a abcde"), parse_error);
    EXPECT_THROW((void)Entry::parse("1-3: abcde"), parse_error);
    EXPECT_THROW((void)Entry::parse("13 a: abcde"), parse_error);
    EXPECT_THROW((void)Entry::parse("1-3 ab: abcde"), parse_error);
    EXPECT_THROW((void)Entry::parse("-3 a: abcde"), parse_error);
    EXPECT_THROW((void)Entry::parse("99999999999999999999999-3 a: abcde"), parse_error);
}

TEST(Password, RuleLetterMustBeAWordCharacter) {
    EXPECT_THROW((void)Rule::parse("1-3 !"), parse_error);
    EXPECT_THROW((void)Entry::parse("1-3 -: a-b"), parse_error);
    EXPECT_EQ(Rule::parse("1-3 _"), (Rule{ 1, 3, U'_' }));
    EXPECT_EQ(Rule::parse("1-3 7"), (Rule{ 1, 3, U'7' }));
}

TEST(Password, CountsCodePointsNotBytes) {
    auto e = Entry::parse("1-1 \u00e9: \u00e9");
    EXPECT_EQ(e.rule, (Rule{ 1, 1, U'\u00e9' }));
    EXPECT_TRUE(occurrence_policy(e.rule, e.password));
    EXPECT_TRUE(position_policy(e.rule, e.password));

    // "\u00e9" takes two bytes; the 'a' is still the second character
    Rule r{ 2, 3, 'a' };
    EXPECT_TRUE(position_policy(r, "\u00e9ab"));
    EXPECT_THROW((void)position_policy(Rule{ 1, 3, 'a' }, "\u00e9a"), solve_error);
    EXPECT_EQ(fmt::format("{}", e.rule), "1-1 \u00e9");

    auto entries = Lines<Entry>::parse("1-1 \u00e9: \u00e9\n");
    EXPECT_EQ(password_philosophy_occurrences(entries), 1u);
}

TEST(Password, RejectsMalformedUtf8) {
    EXPECT_THROW((void)Rule::parse("1-3 \xff"), parse_error);
    EXPECT_THROW((void)Entry::parse("1-3 a: ab\xc3"), parse_error);
}

TEST(Password, OccurrencePolicyBoundsAreInclusive) {
    Rule r{ 2, 4, 'a' };
    EXPECT_FALSE(occurrence_policy(r, "bcd"));
    EXPECT_FALSE(occurrence_policy(r, "abcd"));
    EXPECT_TRUE(occurrence_policy(r, "aabcd"));
    EXPECT_TRUE(occurrence_policy(r, "aaab"));
    EXPECT_TRUE(occurrence_policy(r, "aaaab"));
    EXPECT_FALSE(occurrence_policy(r, "aaaaab"));
}

TEST(Password, OccurrencePolicyOutsideRangeIsInvalid) {
    for (auto min = 0u; min < 5; min++)
        for (auto max = min; max < 5; max++)
            for (auto count = 0u; count < 7; count++) {
                Rule r{ min, max, 'z' };
                auto pw = std::string(count, 'z') + "abc";
                EXPECT_EQ(occurrence_policy(r, pw), min <= count && count <= max)
                    << min << "-" << max << " with " << count;
            }
}

TEST(Password, PositionPolicyIsExclusiveOr) {
    Rule r{ 1, 3, 'a' };
    EXPECT_TRUE(position_policy(r, "abcde"));  // first only
    EXPECT_TRUE(position_policy(r, "bca"));    // second only
    EXPECT_FALSE(position_policy(r, "aba"));   // both
    EXPECT_FALSE(position_policy(r, "bbb"));   // neither
    EXPECT_FALSE(position_policy(Rule{ 2, 9, 'c' }, "ccccccccc"));
}

TEST(Password, PositionPolicyIsOneBased) {
    EXPECT_TRUE(position_policy(Rule{ 1, 2, 'x' }, "xy"));
    EXPECT_FALSE(position_policy(Rule{ 1, 2, 'y' }, "yy"));
    EXPECT_TRUE(position_policy(Rule{ 1, 2, 'y' }, "xy"));
}

TEST(Password, PositionOutsidePasswordIsAnError) {
    EXPECT_THROW((void)position_policy(Rule{ 1, 6, 'a' }, "abcde"), solve_error);
    EXPECT_THROW((void)position_policy(Rule{ 0, 2, 'a' }, "abcde"), solve_error);
}

TEST(Password, CountsExampleEntries) {
    auto entries = Lines<Entry>::parse("1-3 a: abcde\n1-3 b: cdefg\n2-9 c: ccccccccc\n");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(password_philosophy_occurrences(entries), 2u);
    EXPECT_EQ(password_philosophy_positions(entries), 1u);
}

TEST(Password, FormatsRule) {
    EXPECT_EQ(fmt::format("{}", Rule{ 1, 3, 'a' }), "1-3 a");
}
