#pragma once

#include "imagespan/dialect_scan.h"

#include <memory>
#include <vector>

namespace imagespan {

/**
 * \brief Spans of one JSONL line held until the line's gating is known.
 *
 * Role-gated dialects may see the role after the image, so nothing is
 * emitted before the line ends.
 */
class LineSpanBuffer final {
public:
    /// Keeps the \p capacity earliest spans of a line that pass \p filter.
    LineSpanBuffer(uint32_t capacity, const SpanFilter& filter) noexcept;

    void add(ImageSpan span) noexcept;

    /// Emits the buffered spans in file order when \p emit is true, then
    /// clears the buffer.
    void flush(SpanCollector* collector, uint64_t line_index,
               bool emit) noexcept;

private:
    std::vector<ImageSpan> spans_;
    uint32_t capacity_ = 0;
    SpanFilter filter_;
};

/**
 * \brief Adapts a \ref JsonScanPolicy to the \ref DialectScanner interface.
 *
 * `Policy` is constructed from the collector and must stop the tracker once
 * the collector is full.
 */
template <typename Policy>
class TrackedDialectScanner final : public DialectScanner {
public:
    TrackedDialectScanner(SpanCollector* collector,
                          const DialectScanOptions& options,
                          bool line_delimited) noexcept
        : collector_(collector)
        , policy_(collector)
        , tracker_(&policy_, tracker_options(options, line_delimited))
    {
    }

    void feed(std::span<const std::byte> bytes,
              uint64_t base_offset) noexcept override
    {
        tracker_.feed(bytes, base_offset);
    }

    void finish() noexcept override { tracker_.finish(); }

    bool done() const noexcept override
    {
        return tracker_.stopped() || collector_->full();
    }

private:
    static JsonTrackerOptions
    tracker_options(const DialectScanOptions& options,
                    bool line_delimited) noexcept
    {
        JsonTrackerOptions o;
        o.line_delimited = line_delimited;
        o.limits         = options.tracker_limits;
        return o;
    }

    SpanCollector* collector_ = nullptr;
    Policy policy_;
    JsonStructureTracker tracker_;
};

std::unique_ptr<DialectScanner>
make_data_url_scanner(SpanCollector* collector,
                      const DialectScanOptions& options) noexcept;

std::unique_ptr<DialectScanner>
make_claude_jsonl_scanner(SpanCollector* collector,
                          const DialectScanOptions& options) noexcept;

std::unique_ptr<DialectScanner>
make_openclaw_jsonl_scanner(SpanCollector* collector,
                            const DialectScanOptions& options) noexcept;

std::unique_ptr<DialectScanner>
make_gemini_json_scanner(SpanCollector* collector,
                         const DialectScanOptions& options) noexcept;

}  // namespace imagespan
