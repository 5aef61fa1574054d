#include "imagespan/kmp_matcher.h"

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

namespace imagespan {
namespace {

    // Offsets of the last byte of every match of `m` in `text`.
    static std::vector<size_t> match_ends(const KmpMatcher& m,
                                          std::string_view text)
    {
        std::vector<size_t> ends;
        uint32_t state = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            state = m.advance(state, std::byte(static_cast<uint8_t>(text[i])));
            if (m.is_complete(state)) {
                ends.push_back(i);
            }
        }
        return ends;
    }

}  // namespace

TEST(KmpMatcher, FindsLiteralAfterPartialPrefix)
{
    const KmpMatcher m("data:image");
    ASSERT_TRUE(m.valid());
    EXPECT_EQ(m.size(), 10U);

    const std::vector<size_t> ends = match_ends(m, "dat data:data:image/png");
    ASSERT_EQ(ends.size(), 1U);
    EXPECT_EQ(ends[0], 18U);
}


TEST(KmpMatcher, OverlappingMatchesAreReported)
{
    const KmpMatcher m("aa");
    const std::vector<size_t> ends = match_ends(m, "aaaa");
    ASSERT_EQ(ends.size(), 3U);
    EXPECT_EQ(ends[0], 1U);
    EXPECT_EQ(ends[1], 2U);
    EXPECT_EQ(ends[2], 3U);
}


TEST(KmpMatcher, FailureLinksRecoverBorder)
{
    const KmpMatcher m("abab");
    const std::vector<size_t> ends = match_ends(m, "abaabababx");
    ASSERT_EQ(ends.size(), 2U);
    EXPECT_EQ(ends[0], 6U);
    EXPECT_EQ(ends[1], 8U);
}


TEST(KmpMatcher, StateSurvivesChunkBoundaries)
{
    const KmpMatcher m(";base64,");
    uint32_t state = 0;
    for (const char c : std::string_view("image/png;bas")) {
        state = m.advance(state, std::byte(static_cast<uint8_t>(c)));
    }
    EXPECT_FALSE(m.is_complete(state));
    for (const char c : std::string_view("e64,")) {
        state = m.advance(state, std::byte(static_cast<uint8_t>(c)));
    }
    EXPECT_TRUE(m.is_complete(state));
}


TEST(KmpMatcher, EmptyOrOversizedPatternNeverMatches)
{
    const KmpMatcher empty("");
    EXPECT_FALSE(empty.valid());
    EXPECT_TRUE(match_ends(empty, "anything").empty());

    const KmpMatcher big("0123456789012345678901234567890123456789");
    EXPECT_FALSE(big.valid());
    EXPECT_TRUE(
        match_ends(big, "0123456789012345678901234567890123456789").empty());
}

}  // namespace imagespan
