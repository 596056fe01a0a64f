#include <gtest/gtest.h>

#include "grep/compiler.hpp"
#include "grep/matcher.hpp"

using grep::CaptureState;
using grep::Pattern;
using grep::Span;


TEST(CaptureState, StartsEmpty) {
    CaptureState captures(2);
    EXPECT_EQ(captures.group_count(), 2u);
    EXPECT_EQ(captures.filled(), 0u);
    EXPECT_EQ(captures.get(1), nullptr);
    EXPECT_EQ(captures.get(0), nullptr);
    EXPECT_EQ(captures.get(3), nullptr);
}


TEST(CaptureState, RollbackRestoresOverwrittenSlot) {
    CaptureState captures(2);
    captures.set(1, Span{0, 3});
    std::size_t mark = captures.checkpoint();

    captures.set(1, Span{4, 5});
    captures.set(2, Span{5, 6});
    EXPECT_EQ(captures.filled(), 2u);
    EXPECT_EQ(captures.get(1)->begin, 4u);

    captures.rollback(mark);
    EXPECT_EQ(captures.filled(), 1u);
    ASSERT_NE(captures.get(1), nullptr);
    EXPECT_EQ(captures.get(1)->begin, 0u);
    EXPECT_EQ(captures.get(1)->end, 3u);
    EXPECT_EQ(captures.get(2), nullptr);
    EXPECT_EQ(captures.checkpoint(), mark);
}


TEST(CaptureState, FailedSequenceLeavesNoCapture) {
    // (a)(b)c against "abx": both groups match before 'c' fails
    Pattern p = grep::compile("(a)(b)c");
    CaptureState captures(2);
    EXPECT_FALSE(grep::consume(p, "abx", 0, captures).has_value());
    EXPECT_EQ(captures.filled(), 0u);
    EXPECT_EQ(captures.checkpoint(), 0u);
}


TEST(CaptureState, FailedBranchLeavesNoCapture) {
    // the first branch captures group 1 and then fails on 'z'
    Pattern p = grep::compile("(x)z|xy");
    CaptureState captures(1);
    auto end = grep::consume(p, "xy", 0, captures);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 2u);
    EXPECT_EQ(captures.get(1), nullptr);
}


TEST(CaptureState, FailedRepeatLeavesNoCapture) {
    // two repetitions capture, the third is missing
    Pattern p = grep::compile("(a){3}");
    CaptureState captures(1);
    EXPECT_FALSE(grep::matches_here(p, "aab", 0, captures));
    EXPECT_EQ(captures.filled(), 0u);
}


TEST(CaptureState, RepeatKeepsLastIteration) {
    Pattern p = grep::compile("(\\w)+");
    CaptureState captures(1);
    auto end = grep::consume(p, "abc!", 0, captures);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 3u);
    ASSERT_NE(captures.get(1), nullptr);
    EXPECT_EQ(captures.get(1)->begin, 2u);
    EXPECT_EQ(captures.get(1)->end, 3u);
}


TEST(CaptureState, BackreferenceSeesOnlyCommittedCaptures) {
    // group 2 is set by the abandoned first branch; the second branch must not see it
    Pattern p = grep::compile("((a)x|a\\2)");
    EXPECT_FALSE(grep::is_match(p, "aa"));
    EXPECT_TRUE(grep::is_match(p, "ax"));
}
