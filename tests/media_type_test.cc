#include "imagespan/image_span.h"
#include "imagespan/media_type.h"

#include <gtest/gtest.h>

#include <string>

namespace imagespan {

TEST(MediaType, NormalizesEscapedSlashAndWhitespace)
{
    EXPECT_EQ(normalize_media_type("image\\/png"), "image/png");
    EXPECT_EQ(normalize_media_type("  image/jpeg\t"), "image/jpeg");
    EXPECT_EQ(normalize_media_type("   "), "");
}


TEST(MediaType, ExtractsFromDataUrlHeader)
{
    EXPECT_EQ(media_type_from_data_url_header("data:image/png;base64,"),
              "image/png");
    EXPECT_EQ(media_type_from_data_url_header("data:image\\/webp;base64,"),
              "image/webp");
    EXPECT_EQ(media_type_from_data_url_header("data:;base64,"), "image");
    EXPECT_EQ(media_type_from_data_url_header("nothing here"), "image");
}


TEST(MediaType, SuggestsFileExtension)
{
    EXPECT_EQ(suggested_file_extension("image/png"), "png");
    EXPECT_EQ(suggested_file_extension("IMAGE/JPEG"), "jpg");
    EXPECT_EQ(suggested_file_extension("image/jpg"), "jpg");
    EXPECT_EQ(suggested_file_extension("image/webp"), "webp");
    EXPECT_EQ(suggested_file_extension("image"), "img");
    EXPECT_EQ(suggested_file_extension("application/octet-stream"), "img");
}


TEST(MediaType, InlineTextTruncates)
{
    InlineText t;
    t.assign("image/png");
    EXPECT_EQ(t.view(), "image/png");
    EXPECT_FALSE(t.truncated);

    const std::string long_text(InlineText::kCapacity + 5U, 'x');
    t.assign(long_text);
    EXPECT_EQ(t.view().size(), InlineText::kCapacity);
    EXPECT_TRUE(t.truncated);

    t.clear();
    EXPECT_TRUE(t.empty());
}


TEST(MediaType, CaseInsensitiveHelpers)
{
    EXPECT_TRUE(ascii_iequals("User", "user"));
    EXPECT_FALSE(ascii_iequals("users", "user"));
}


TEST(ImageSpan, ApproxDecodedSizeAndConsistency)
{
    EXPECT_EQ(approx_decoded_size(0U), 0U);
    EXPECT_EQ(approx_decoded_size(4U), 3U);
    EXPECT_EQ(approx_decoded_size(10U), 7U);
    EXPECT_EQ(approx_decoded_size(40000000U), 30000000U);

    ImageSpan span = make_image_span(10U, 32U, 8U, 40U, "image/png");
    EXPECT_EQ(span.approx_decoded_bytes, 6U);
    EXPECT_TRUE(span_is_consistent(span));

    span.payload_length = 9U;
    EXPECT_FALSE(span_is_consistent(span));

    ImageSpan backwards = make_image_span(40U, 32U, 0U, 32U, "image");
    EXPECT_FALSE(span_is_consistent(backwards));
}


TEST(ImageSpan, DialectNamesRoundTrip)
{
    Dialect d = Dialect::DataUrl;
    ASSERT_TRUE(parse_dialect_name("gemini_json", &d));
    EXPECT_EQ(d, Dialect::GeminiJson);
    EXPECT_STREQ(dialect_name(Dialect::ClaudeJsonl), "claude_jsonl");
    EXPECT_FALSE(parse_dialect_name("markdown", &d));
    EXPECT_FALSE(parse_dialect_name(nullptr, &d));
}

}  // namespace imagespan
