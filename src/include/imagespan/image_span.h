#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * \file image_span.h
 * \brief Located base64 image payloads and the transcript dialects that carry them.
 */

namespace imagespan {

/// Transcript schema variant scanned for embedded images.
enum class Dialect : uint8_t {
    /// Raw `data:image/...;base64,...` URLs anywhere in the file.
    DataUrl,
    /// JSONL with `{"type":"image","source":{"type":"base64",...}}` blocks.
    ClaudeJsonl,
    /// JSONL with flat `{"type":"image","mimeType":...,"data":...}` blocks.
    OpenClawJsonl,
    /// Single JSON document with `inlineData` objects under a message array.
    GeminiJson,
    /// Session file whose images live in per-message part files.
    OpenCodeParts,
};

/// Every dialect, in declaration order.
inline constexpr Dialect kAllDialects[] = {
    Dialect::DataUrl,    Dialect::ClaudeJsonl,   Dialect::OpenClawJsonl,
    Dialect::GeminiJson, Dialect::OpenCodeParts,
};


/**
 * \brief Byte range of one base64 image payload within a file.
 *
 * All offsets are absolute file offsets. \ref end_offset is exclusive and
 * points at the closing delimiter (quote or terminator byte).
 */
struct ImageSpan final {
    uint64_t start_offset   = 0;
    uint64_t end_offset     = 0;
    uint64_t payload_offset = 0;
    /// Count of base64 characters (not decoded bytes).
    uint64_t payload_length = 0;
    /// `floor(payload_length * 3 / 4)`.
    uint64_t approx_decoded_bytes = 0;
    std::string media_type;
};

/// Which positional tag a \ref LocatedSpan carries.
enum class SpanTagKind : uint8_t {
    /// 0-based count of `\n` bytes before the span.
    LineIndex,
    /// 0-based index of the enclosing message array element.
    ItemIndex,
};

/**
 * \brief A span plus dialect context for the caller.
 *
 * \ref source_path names the file \ref span offsets refer to; for
 * \ref Dialect::OpenCodeParts that is the part file, not the session file.
 * \ref message_id is only set by \ref Dialect::OpenCodeParts.
 */
struct LocatedSpan final {
    ImageSpan span;
    SpanTagKind tag_kind = SpanTagKind::LineIndex;
    uint64_t tag         = 0;
    std::string source_path;
    std::string message_id;
};

/// Decoded-size estimate used before any payload bytes are read.
constexpr uint64_t
approx_decoded_size(uint64_t payload_length) noexcept
{
    return (payload_length / 4U) * 3U + ((payload_length % 4U) * 3U) / 4U;
}

/// Builds a span from payload bounds; the caller provides the media type.
ImageSpan
make_image_span(uint64_t start_offset, uint64_t payload_offset,
                uint64_t payload_length, uint64_t end_offset,
                std::string media_type);

/// Returns true when the offset/length invariants of \p span hold.
bool
span_is_consistent(const ImageSpan& span) noexcept;

/// Stable lowercase name for \p dialect (e.g. "claude_jsonl").
const char*
dialect_name(Dialect dialect) noexcept;

/// Parses a name produced by \ref dialect_name.
bool
parse_dialect_name(const char* name, Dialect* out) noexcept;

}  // namespace imagespan
