#include "imagespan/dialect_scan.h"

#include "dialect_scan_internal.h"

#include <algorithm>
#include <utility>

namespace imagespan {

bool
span_passes_filter(const ImageSpan& span, const SpanFilter& filter) noexcept
{
    if (span.payload_length < filter.min_payload_chars) {
        return false;
    }
    return span.approx_decoded_bytes >= filter.min_approx_bytes;
}


SpanCollector::SpanCollector(std::vector<LocatedSpan>* out,
                             uint32_t max_matches,
                             const SpanFilter& filter) noexcept
    : out_(out)
    , max_matches_(max_matches)
    , filter_(filter)
{
}


void
SpanCollector::set_source(std::string_view source_path,
                          std::string_view message_id) noexcept
{
    source_path_.assign(source_path.data(), source_path.size());
    message_id_.assign(message_id.data(), message_id.size());
}


bool
SpanCollector::emit(ImageSpan span, SpanTagKind tag_kind,
                    uint64_t tag) noexcept
{
    if (full()) {
        return false;
    }
    if (!span_passes_filter(span, filter_)) {
        return true;
    }
    if (out_) {
        LocatedSpan located;
        located.span        = std::move(span);
        located.tag_kind    = tag_kind;
        located.tag         = tag;
        located.source_path = source_path_;
        located.message_id  = message_id_;
        out_->push_back(std::move(located));
    }
    written_ += 1U;
    return !full();
}


LineSpanBuffer::LineSpanBuffer(uint32_t capacity,
                               const SpanFilter& filter) noexcept
    : capacity_(capacity)
    , filter_(filter)
{
}


void
LineSpanBuffer::add(ImageSpan span) noexcept
{
    if (capacity_ == 0U || !span_passes_filter(span, filter_)) {
        return;
    }
    spans_.push_back(std::move(span));
    if (spans_.size() <= capacity_) {
        return;
    }
    // Over capacity: drop the latest span in file order.
    auto latest = std::max_element(spans_.begin(), spans_.end(),
                                   [](const ImageSpan& a, const ImageSpan& b) {
                                       return a.start_offset < b.start_offset;
                                   });
    spans_.erase(latest);
}


void
LineSpanBuffer::flush(SpanCollector* collector, uint64_t line_index,
                      bool emit) noexcept
{
    if (emit && collector) {
        // Nested image objects close inner-first.
        std::stable_sort(spans_.begin(), spans_.end(),
                         [](const ImageSpan& a, const ImageSpan& b) {
                             return a.start_offset < b.start_offset;
                         });
        for (ImageSpan& span : spans_) {
            if (!collector->emit(std::move(span), SpanTagKind::LineIndex,
                                 line_index)) {
                break;
            }
        }
    }
    spans_.clear();
}


std::unique_ptr<DialectScanner>
make_dialect_scanner(Dialect dialect, SpanCollector* collector,
                     const DialectScanOptions& options) noexcept
{
    if (!collector) {
        return nullptr;
    }
    switch (dialect) {
    case Dialect::DataUrl: return make_data_url_scanner(collector, options);
    case Dialect::ClaudeJsonl:
        return make_claude_jsonl_scanner(collector, options);
    case Dialect::OpenClawJsonl:
        return make_openclaw_jsonl_scanner(collector, options);
    case Dialect::GeminiJson:
        return make_gemini_json_scanner(collector, options);
    case Dialect::OpenCodeParts: return nullptr;
    }
    return nullptr;
}

}  // namespace imagespan
