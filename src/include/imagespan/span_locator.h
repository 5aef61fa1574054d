#pragma once

#include "imagespan/dialect_scan.h"
#include "imagespan/image_span.h"
#include "imagespan/json_structure_tracker.h"
#include "imagespan/scan_cancel.h"
#include "imagespan/storage_layout.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file span_locator.h
 * \brief File-level entry points: enumerate image spans or test presence.
 */

namespace imagespan {

/// Status for \ref scan_file and \ref scan_bytes.
enum class SpanScanStatus : uint8_t {
    Ok,
    /// `max_matches` spans were found; the rest of the input was skipped.
    MatchLimitReached,
    /// The cancel predicate fired; spans found before that are kept.
    Cancelled,
    IoError,
    /// The dialect needs a \ref StorageLayoutResolver and none was given.
    Unsupported,
};

/// Resource limits for one scan call.
struct SpanScanLimits final {
    /// Hard cap on spans per call (0 returns immediately).
    uint32_t max_matches = 200;
    /// Bytes read per \ref ByteStreamReader::next_chunk call.
    uint32_t chunk_bytes = 64U * 1024U;
    /// Bytes processed between two cancel checks.
    uint32_t cancel_check_interval_bytes = 32U * 1024U;
    JsonTrackerLimits tracker;
};

/// Options for \ref scan_file, \ref scan_bytes and \ref file_contains_image.
struct SpanScanOptions final {
    SpanScanLimits limits;
    /// Presence mode: payload characters that prove a data URL.
    uint32_t presence_min_payload_chars = 64;
    SpanFilter filter;
    ScanCancel cancel;

    /// Required by \ref Dialect::OpenCodeParts; not owned.
    StorageLayoutResolver* resolver = nullptr;
    /// Messages to resolve for \ref Dialect::OpenCodeParts (empty = all).
    std::span<const std::string> message_ids;
};

/// Result for \ref scan_file and \ref scan_bytes.
struct SpanScanResult final {
    SpanScanStatus status = SpanScanStatus::Ok;
    /// Spans appended to the output vector by this call.
    uint32_t written = 0;
    /// Input bytes fed to the dialect scanner(s).
    uint64_t bytes_scanned = 0;
    /// Files opened (1 for single-file dialects, part files otherwise).
    uint32_t files_scanned = 0;
};

/**
 * \brief Enumerates image spans of \p path in one forward pass.
 *
 * Spans are appended to \p out in ascending start offset per source file.
 * For \ref Dialect::OpenCodeParts, \p path is the session file and spans
 * refer to part files, ordered by message id.
 */
SpanScanResult
scan_file(const char* path, Dialect dialect, std::vector<LocatedSpan>* out,
          const SpanScanOptions& options) noexcept;

/**
 * \brief Runs a single-file dialect over an in-memory buffer.
 *
 * Offsets are relative to `bytes.data()`. \ref Dialect::OpenCodeParts is
 * \ref SpanScanStatus::Unsupported.
 */
SpanScanResult
scan_bytes(std::span<const std::byte> bytes, Dialect dialect,
           std::vector<LocatedSpan>* out,
           const SpanScanOptions& options) noexcept;

/**
 * \brief Cheap "does this file carry at least one image" query.
 *
 * DataUrl stops after the first payload reaches
 * `presence_min_payload_chars`; JSON dialects stop at their first span.
 * Every error and cancellation yields false.
 */
bool
file_contains_image(const char* path, Dialect dialect,
                    const SpanScanOptions& options) noexcept;

/// Bytes re-read before and after a span start by
/// \ref check_image_url_context.
inline constexpr uint32_t kImageUrlContextLookbehind = 160;
inline constexpr uint32_t kImageUrlContextLookahead  = 64;

/**
 * \brief Tells whether a DataUrl span sits in a JSON `image_url` field.
 *
 * Re-reads the line around `span.start_offset` (bounded by the lookbehind
 * and lookahead windows) and looks for `"image_url": "data:image` or
 * `"image_url": {"url": "data:image` with unescaped quotes. Used to tell
 * attached images from data URLs quoted in code or tool output.
 */
bool
check_image_url_context(const char* path, const ImageSpan& span) noexcept;

/// Same check over an in-memory line window.
bool
has_image_url_context(std::span<const std::byte> window,
                      uint64_t center) noexcept;

/// Filter the delegated dialect applies to part-file spans (tiny icons).
inline constexpr SpanFilter kPartFileSpanFilter = { 64U, 32U };

}  // namespace imagespan
