#include "imagespan/dialect_scan.h"
#include "imagespan/span_locator.h"

#include "test_files.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace imagespan {
namespace {

    static SpanScanResult scan_text(std::string_view text,
                                    std::vector<LocatedSpan>* out,
                                    const SpanScanOptions& options = {})
    {
        return scan_bytes(as_bytes(text), Dialect::DataUrl, out, options);
    }

}  // namespace

TEST(DataUrlScan, FindsQuotedJpegPayload)
{
    std::vector<LocatedSpan> spans;
    const SpanScanResult r
        = scan_text("say \"data:image/jpeg;base64,////\" ok", &spans);

    ASSERT_EQ(r.status, SpanScanStatus::Ok);
    ASSERT_EQ(r.written, 1U);
    ASSERT_EQ(spans.size(), 1U);
    const ImageSpan& s = spans[0].span;
    EXPECT_EQ(s.start_offset, 5U);
    EXPECT_EQ(s.payload_offset, 28U);
    EXPECT_EQ(s.payload_length, 4U);
    EXPECT_EQ(s.end_offset, 32U);
    EXPECT_EQ(s.approx_decoded_bytes, 3U);
    EXPECT_EQ(s.media_type, "image/jpeg");
    EXPECT_EQ(spans[0].tag_kind, SpanTagKind::LineIndex);
    EXPECT_EQ(spans[0].tag, 0U);
    EXPECT_TRUE(span_is_consistent(s));
}


TEST(DataUrlScan, EveryTerminatorEndsPayload)
{
    const std::string_view terminators = "\"' \t\n\r)]}>";
    for (const char term : terminators) {
        std::string text = "x data:image/png;base64,QUJD";
        text.push_back(term);
        text += "tail";

        std::vector<LocatedSpan> spans;
        const SpanScanResult r = scan_text(text, &spans);
        ASSERT_EQ(r.status, SpanScanStatus::Ok);
        ASSERT_EQ(spans.size(), 1U) << "terminator " << int(term);
        EXPECT_EQ(spans[0].span.payload_length, 4U);
        EXPECT_EQ(spans[0].span.end_offset, 28U);
    }
}


TEST(DataUrlScan, PaddingIsPartOfPayload)
{
    std::vector<LocatedSpan> spans;
    scan_text("(data:image/gif;base64,QQ==)", &spans);
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.payload_length, 4U);
    EXPECT_EQ(spans[0].span.media_type, "image/gif");
}


TEST(DataUrlScan, TerminatorInHeaderAbortsCandidate)
{
    std::vector<LocatedSpan> spans;
    scan_text("data:image/png base64,AAAA\" then data:image/png;base64,BBBB'",
              &spans);
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.start_offset, 33U);
}


TEST(DataUrlScan, OversizedHeaderIsDropped)
{
    std::string text = "data:image/";
    text.append(600, 'x');
    text += ";base64,AAAA\"";

    std::vector<LocatedSpan> spans;
    scan_text(text, &spans);
    EXPECT_TRUE(spans.empty());
}


TEST(DataUrlScan, EmptyOrUnterminatedPayloadIsDropped)
{
    std::vector<LocatedSpan> spans;
    scan_text("\"data:image/png;base64,\" and data:image/png;base64,AAAA",
              &spans);
    EXPECT_TRUE(spans.empty());
}


TEST(DataUrlScan, TagsSpansWithLineIndex)
{
    std::vector<LocatedSpan> spans;
    scan_text("one\ntwo\nx data:image/png;base64,AAAA)\n"
              "data:image/webp;base64,BBBBBBBB\n",
              &spans);
    ASSERT_EQ(spans.size(), 2U);
    EXPECT_EQ(spans[0].tag, 2U);
    EXPECT_EQ(spans[0].span.start_offset, 10U);
    EXPECT_EQ(spans[0].span.end_offset, 36U);
    EXPECT_EQ(spans[1].tag, 3U);
    EXPECT_EQ(spans[1].span.media_type, "image/webp");
    EXPECT_LT(spans[0].span.start_offset, spans[1].span.start_offset);
}


TEST(DataUrlScan, ByteAtATimeFeedFindsSameSpan)
{
    const std::string_view text = "xx data:data:image/png;base64,AAAABBBB\"";

    std::vector<LocatedSpan> spans;
    SpanCollector collector(&spans, 10, SpanFilter {});
    std::unique_ptr<DialectScanner> scanner
        = make_dialect_scanner(Dialect::DataUrl, &collector,
                               DialectScanOptions {});
    ASSERT_NE(scanner, nullptr);
    for (size_t i = 0; i < text.size(); ++i) {
        scanner->feed(as_bytes(text.substr(i, 1)), i);
    }
    scanner->finish();

    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.start_offset, 8U);
    EXPECT_EQ(spans[0].span.payload_offset, 30U);
    EXPECT_EQ(spans[0].span.payload_length, 8U);
    EXPECT_EQ(spans[0].span.end_offset, 38U);
}


TEST(DataUrlScan, PresenceModeStopsAtThreshold)
{
    std::string text = "\"data:image/png;base64,";
    text.append(100, 'A');
    text += "\" data:image/png;base64,BBBB\"";

    std::vector<LocatedSpan> spans;
    SpanCollector collector(&spans, 10, SpanFilter {});
    DialectScanOptions options;
    options.presence_only              = true;
    options.presence_min_payload_chars = 16;
    std::unique_ptr<DialectScanner> scanner
        = make_dialect_scanner(Dialect::DataUrl, &collector, options);
    ASSERT_NE(scanner, nullptr);
    scanner->feed(as_bytes(text), 0);
    scanner->finish();

    EXPECT_TRUE(scanner->done());
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.payload_length, 16U);
}


TEST(DataUrlScan, PresenceModeIgnoresShortPayloads)
{
    std::vector<LocatedSpan> spans;
    SpanCollector collector(&spans, 10, SpanFilter {});
    DialectScanOptions options;
    options.presence_only = true;
    std::unique_ptr<DialectScanner> scanner
        = make_dialect_scanner(Dialect::DataUrl, &collector, options);
    ASSERT_NE(scanner, nullptr);
    scanner->feed(as_bytes("\"data:image/png;base64,AAAA\""), 0);
    scanner->finish();

    EXPECT_FALSE(scanner->done());
    EXPECT_TRUE(spans.empty());
}


TEST(DataUrlScan, FilterDropsSmallSpansWithoutCounting)
{
    SpanScanOptions options;
    options.limits.max_matches       = 1;
    options.filter.min_payload_chars = 8;

    std::vector<LocatedSpan> spans;
    const SpanScanResult r = scan_text(
        "data:image/png;base64,AAAA\" data:image/png;base64,BBBBBBBB\"",
        &spans, options);
    EXPECT_EQ(r.status, SpanScanStatus::MatchLimitReached);
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.payload_length, 8U);
}

}  // namespace imagespan
