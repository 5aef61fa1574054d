#include "imagespan/span_locator.h"

#include "test_files.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace imagespan {
namespace {

    static std::vector<LocatedSpan> scan_openclaw(std::string_view text)
    {
        std::vector<LocatedSpan> spans;
        const SpanScanResult r = scan_bytes(as_bytes(text),
                                            Dialect::OpenClawJsonl, &spans,
                                            SpanScanOptions {});
        EXPECT_EQ(r.status, SpanScanStatus::Ok);
        return spans;
    }

}  // namespace

TEST(OpenClawJsonlScan, UserMessageImageBlock)
{
    const std::vector<LocatedSpan> spans = scan_openclaw(
        R"({"type":"message","message":{"role":"user","content":[{"type":"text","text":"look"},{"type":"image","mimeType":"image/png","data":"iVBORw0K"}]}})"
        "\n");
    ASSERT_EQ(spans.size(), 1U);
    const ImageSpan& s = spans[0].span;
    EXPECT_EQ(s.payload_offset, 131U);
    EXPECT_EQ(s.payload_length, 8U);
    EXPECT_EQ(s.end_offset, 139U);
    EXPECT_EQ(s.media_type, "image/png");
    EXPECT_EQ(spans[0].tag, 0U);
}


TEST(OpenClawJsonlScan, RoleAndMimeTypeMayFollowData)
{
    const std::vector<LocatedSpan> spans = scan_openclaw(
        R"({"message":{"content":[{"type":"image","data":"QUJD","mimeType":"image/jpeg"}],"role":"user"}})");
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.payload_offset, 47U);
    EXPECT_EQ(spans[0].span.media_type, "image/jpeg");
}


TEST(OpenClawJsonlScan, FirstRoleDecidesLine)
{
    const std::vector<LocatedSpan> spans = scan_openclaw(
        R"({"role":"assistant","content":[{"type":"image","mimeType":"image/png","data":"AAAA"}],"meta":{"role":"user"}})"
        "\n"
        R"({"role":"user","content":[{"type":"image","mimeType":"image/png","data":"BBBB"}],"meta":{"role":"tool"}})"
        "\n");
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].tag, 1U);
}


TEST(OpenClawJsonlScan, NonUserRolesAreDropped)
{
    EXPECT_TRUE(scan_openclaw(
                    R"({"role":"toolResult","content":[{"type":"image","mimeType":"image/png","data":"AAAA"}]})")
                    .empty());
    EXPECT_TRUE(scan_openclaw(
                    R"({"content":[{"type":"image","mimeType":"image/png","data":"AAAA"}]})")
                    .empty());
}


TEST(OpenClawJsonlScan, TypeMustBeExactlyImage)
{
    const std::vector<LocatedSpan> spans = scan_openclaw(
        R"({"role":"user","content":[{"type":"Image","data":"AAAA"},{"type":"image_url","data":"BBBB"},{"type":"image","data":"CCCC"}]})");
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].span.media_type, "image");
}


TEST(OpenClawJsonlScan, EscapedOrEmptyDataIsRejected)
{
    EXPECT_TRUE(scan_openclaw(
                    R"({"role":"user","content":[{"type":"image","mimeType":"image/png","data":"AA\nA"},{"type":"image","data":""}]})")
                    .empty());
}

}  // namespace imagespan
