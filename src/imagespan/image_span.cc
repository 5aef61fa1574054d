#include "imagespan/image_span.h"

#include <cstring>
#include <utility>

namespace imagespan {

ImageSpan
make_image_span(uint64_t start_offset, uint64_t payload_offset,
                uint64_t payload_length, uint64_t end_offset,
                std::string media_type)
{
    ImageSpan span;
    span.start_offset         = start_offset;
    span.end_offset           = end_offset;
    span.payload_offset       = payload_offset;
    span.payload_length       = payload_length;
    span.approx_decoded_bytes = approx_decoded_size(payload_length);
    span.media_type           = std::move(media_type);
    return span;
}


bool
span_is_consistent(const ImageSpan& span) noexcept
{
    if (span.start_offset > span.payload_offset) {
        return false;
    }
    if (span.payload_offset > span.end_offset
        || span.payload_length > span.end_offset - span.payload_offset) {
        return false;
    }
    return span.approx_decoded_bytes
           == approx_decoded_size(span.payload_length);
}


const char*
dialect_name(Dialect dialect) noexcept
{
    switch (dialect) {
    case Dialect::DataUrl: return "data_url";
    case Dialect::ClaudeJsonl: return "claude_jsonl";
    case Dialect::OpenClawJsonl: return "openclaw_jsonl";
    case Dialect::GeminiJson: return "gemini_json";
    case Dialect::OpenCodeParts: return "opencode_parts";
    }
    return "unknown";
}


bool
parse_dialect_name(const char* name, Dialect* out) noexcept
{
    if (!name || !out) {
        return false;
    }
    for (const Dialect d : kAllDialects) {
        if (std::strcmp(name, dialect_name(d)) == 0) {
            *out = d;
            return true;
        }
    }
    return false;
}

}  // namespace imagespan
