#pragma once

#include "imagespan/image_span.h"
#include "imagespan/json_structure_tracker.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file dialect_scan.h
 * \brief Single-pass dialect scanners fed with file-ordered byte chunks.
 */

namespace imagespan {

/// Post-filter applied to every span before it counts against the cap.
struct SpanFilter final {
    /// Minimum base64 character count (0 = no minimum).
    uint64_t min_payload_chars = 0;
    /// Minimum \ref ImageSpan::approx_decoded_bytes (0 = no minimum).
    uint64_t min_approx_bytes = 0;
};

/// Returns true when \p span passes \p filter.
bool
span_passes_filter(const ImageSpan& span, const SpanFilter& filter) noexcept;

/**
 * \brief Appends located spans to a caller-owned vector under a hard cap.
 *
 * Scanners call \ref emit; once \ref full returns true they stop.
 */
class SpanCollector final {
public:
    SpanCollector(std::vector<LocatedSpan>* out, uint32_t max_matches,
                  const SpanFilter& filter) noexcept;

    /// Sets the context copied into every following span.
    void set_source(std::string_view source_path,
                    std::string_view message_id) noexcept;

    /**
     * \brief Adds one span unless it is filtered out or the cap is reached.
     *
     * Returns false when the collector is (or just became) full.
     */
    bool emit(ImageSpan span, SpanTagKind tag_kind, uint64_t tag) noexcept;

    bool full() const noexcept { return written_ >= max_matches_; }
    uint32_t written() const noexcept { return written_; }
    uint32_t max_matches() const noexcept { return max_matches_; }
    const SpanFilter& filter() const noexcept { return filter_; }

private:
    std::vector<LocatedSpan>* out_ = nullptr;
    uint32_t max_matches_          = 0;
    uint32_t written_              = 0;
    SpanFilter filter_;
    std::string source_path_;
    std::string message_id_;
};

/// Options shared by the in-memory dialect scanners.
struct DialectScanOptions final {
    /// DataUrl: report a candidate as soon as it has
    /// \ref presence_min_payload_chars payload characters.
    bool presence_only = false;
    uint32_t presence_min_payload_chars = 64;
    JsonTrackerLimits tracker_limits;
};

/**
 * \brief One forward pass over a single file's bytes.
 *
 * Chunks must be fed contiguously and in file order; `base_offset` is the
 * absolute offset of the chunk's first byte.
 */
class DialectScanner {
public:
    virtual ~DialectScanner() = default;

    virtual void feed(std::span<const std::byte> bytes,
                      uint64_t base_offset) noexcept
        = 0;

    /// End of input: flushes spans a dialect defers to line/file end.
    virtual void finish() noexcept = 0;

    /// True once further input cannot produce spans (cap or presence hit).
    virtual bool done() const noexcept = 0;
};

/**
 * \brief Creates the scanner for \p dialect.
 *
 * Returns nullptr for \ref Dialect::OpenCodeParts, which delegates to part
 * files instead of scanning the session file itself.
 */
std::unique_ptr<DialectScanner>
make_dialect_scanner(Dialect dialect, SpanCollector* collector,
                     const DialectScanOptions& options) noexcept;

}  // namespace imagespan
