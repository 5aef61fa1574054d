#include "imagespan/span_locator.h"

#include "test_files.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace imagespan {
namespace {

    static constexpr std::string_view kTwoImageDocument
        = R"({"messages":[{"role":"user","parts":[{"text":"hi"}]},{"role":"user","parts":[{"inlineData":{"mimeType":"image/png","data":"AAAA"}},{"inlineData":{"data":"QUJDRA","mimeType":"image/jpeg"}}]}]})";

    static std::vector<LocatedSpan>
    scan_gemini(std::string_view text,
                const SpanScanOptions& options = SpanScanOptions {})
    {
        std::vector<LocatedSpan> spans;
        scan_bytes(as_bytes(text), Dialect::GeminiJson, &spans, options);
        return spans;
    }

}  // namespace

TEST(GeminiJsonScan, InlineDataTaggedWithMessageIndex)
{
    const std::vector<LocatedSpan> spans = scan_gemini(kTwoImageDocument);

    ASSERT_EQ(spans.size(), 2U);
    EXPECT_EQ(spans[0].tag_kind, SpanTagKind::ItemIndex);
    EXPECT_EQ(spans[0].tag, 1U);
    EXPECT_EQ(spans[0].span.payload_offset, 123U);
    EXPECT_EQ(spans[0].span.payload_length, 4U);
    EXPECT_EQ(spans[0].span.end_offset, 127U);
    EXPECT_EQ(spans[0].span.media_type, "image/png");

    EXPECT_EQ(spans[1].tag, 1U);
    EXPECT_EQ(spans[1].span.payload_offset, 154U);
    EXPECT_EQ(spans[1].span.payload_length, 6U);
    EXPECT_EQ(spans[1].span.media_type, "image/jpeg");
}


TEST(GeminiJsonScan, PrettyPrintedDocument)
{
    const std::string_view text = "{\n"
                                  "  \"history\": [\n"
                                  "    { \"parts\": [] },\n"
                                  "    { \"parts\": [] },\n"
                                  "    {\n"
                                  "      \"parts\": [\n"
                                  "        { \"inlineData\": {\n"
                                  "            \"mimeType\": \"image\\/png\",\n"
                                  "            \"data\": \"iVBORw0KGgo=\"\n"
                                  "        } }\n"
                                  "      ]\n"
                                  "    }\n"
                                  "  ]\n"
                                  "}\n";
    const std::vector<LocatedSpan> spans = scan_gemini(text);
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].tag, 2U);
    EXPECT_EQ(spans[0].span.media_type, "image/png");
    EXPECT_EQ(spans[0].span.payload_length, 12U);
}


TEST(GeminiJsonScan, NonImageMimeTypeIsSkipped)
{
    const std::vector<LocatedSpan> spans = scan_gemini(
        R"({"items":[{"inlineData":{"mimeType":"application/pdf","data":"JVBERi0x"}},{"inlineData":{"data":"AAAA"}}]})");
    EXPECT_TRUE(spans.empty());
}


TEST(GeminiJsonScan, WhitespaceOrEscapeInvalidatesPayload)
{
    const std::vector<LocatedSpan> spans = scan_gemini(
        R"({"messages":[{"inlineData":{"mimeType":"image/png","data":"AAAA BBBB"}},{"inlineData":{"mimeType":"image/png","data":"AA\/A"}},{"inlineData":{"mimeType":"image/png","data":"CCCC"}}]})");
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].tag, 2U);
}


TEST(GeminiJsonScan, DataOutsideInlineDataIsIgnored)
{
    const std::vector<LocatedSpan> spans = scan_gemini(
        R"({"messages":[{"mimeType":"image/png","data":"AAAA"},{"blob":{"mimeType":"image/png","data":"BBBB"}}]})");
    EXPECT_TRUE(spans.empty());
}


TEST(GeminiJsonScan, NoIndexedArrayTagsZero)
{
    const std::vector<LocatedSpan> spans = scan_gemini(
        R"({"parts":[{"inlineData":{"mimeType":"image/gif","data":"R0lGODlh"}}]})");
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].tag_kind, SpanTagKind::ItemIndex);
    EXPECT_EQ(spans[0].tag, 0U);
}


TEST(GeminiJsonScan, MatchCapReported)
{
    SpanScanOptions options;
    options.limits.max_matches = 1;

    std::vector<LocatedSpan> spans;
    const SpanScanResult r = scan_bytes(as_bytes(kTwoImageDocument),
                                        Dialect::GeminiJson, &spans, options);
    EXPECT_EQ(r.status, SpanScanStatus::MatchLimitReached);
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.media_type, "image/png");
}


TEST(GeminiJsonScan, DeepNestingBeyondLimitIsSkipped)
{
    std::string text = R"({"messages":[)";
    for (int i = 0; i < 200; ++i) {
        text += "[";
    }
    text += R"({"inlineData":{"mimeType":"image/png","data":"AAAA"}})";
    for (int i = 0; i < 200; ++i) {
        text += "]";
    }
    text += R"(,{"inlineData":{"mimeType":"image/png","data":"BBBB"}}]})";

    SpanScanOptions options;
    options.limits.tracker.max_depth = 64;
    const std::vector<LocatedSpan> spans = scan_gemini(text, options);
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].tag, 1U);
}


TEST(GeminiJsonScan, NestedInlineDataIsSkipped)
{
    const std::string_view text
        = R"({"messages":[{"parts":[{"inlineData":{"mimeType":"image/png","data":"AAAA","extra":{"inlineData":{"mimeType":"image/png","data":"BBBB"}}}},{"inlineData":{"mimeType":"image/gif","data":"CCCC"}}]}]})";
    const std::vector<LocatedSpan> spans = scan_gemini(text);

    ASSERT_EQ(spans.size(), 2U);
    EXPECT_EQ(spans[0].span.payload_offset, text.find("AAAA"));
    EXPECT_EQ(spans[1].span.payload_offset, text.find("CCCC"));
    EXPECT_EQ(spans[1].span.media_type, "image/gif");
    EXPECT_LT(spans[0].span.start_offset, spans[1].span.start_offset);
}

}  // namespace imagespan
