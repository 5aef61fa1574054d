#include "imagespan/span_locator.h"

#include "imagespan/byte_stream_reader.h"

#include <algorithm>
#include <array>
#include <memory>
#include <string_view>

namespace imagespan {
namespace {

    static constexpr uint32_t kMinChunkBytes = 4096;

    static uint32_t effective_interval(const SpanScanLimits& limits) noexcept
    {
        return limits.cancel_check_interval_bytes == 0U
                   ? 32U * 1024U
                   : limits.cancel_check_interval_bytes;
    }


    static DialectScanOptions
    dialect_options(const SpanScanOptions& options, bool presence) noexcept
    {
        DialectScanOptions o;
        o.presence_only              = presence;
        o.presence_min_payload_chars = options.presence_min_payload_chars;
        o.tracker_limits             = options.limits.tracker;
        return o;
    }


    enum class FeedOutcome : uint8_t {
        Continue,
        Done,
        Cancelled,
    };

    // Feeds `bytes` in cancel-interval slices. `since_check` carries the
    // byte count processed since the last check across calls.
    static FeedOutcome feed_with_cancel(DialectScanner* scanner,
                                        std::span<const std::byte> bytes,
                                        uint64_t base_offset,
                                        const SpanScanOptions& options,
                                        uint64_t* since_check,
                                        uint64_t* bytes_scanned) noexcept
    {
        const uint64_t interval = effective_interval(options.limits);
        size_t pos              = 0;
        while (pos < bytes.size()) {
            const uint64_t room = interval - *since_check;
            const size_t n      = static_cast<size_t>(
                std::min<uint64_t>(room, bytes.size() - pos));
            scanner->feed(bytes.subspan(pos, n),
                          base_offset + static_cast<uint64_t>(pos));
            pos += n;
            *since_check += n;
            *bytes_scanned += n;
            if (scanner->done()) {
                return FeedOutcome::Done;
            }
            if (*since_check >= interval) {
                *since_check = 0;
                if (options.cancel.requested()) {
                    return FeedOutcome::Cancelled;
                }
            }
        }
        return FeedOutcome::Continue;
    }


    enum class FileScanOutcome : uint8_t {
        Finished,
        Cancelled,
        OpenFailed,
        ReadFailed,
    };

    static FileScanOutcome scan_one_file(const char* path,
                                         DialectScanner* scanner,
                                         const SpanScanOptions& options,
                                         std::vector<std::byte>* buffer,
                                         uint64_t* bytes_scanned) noexcept
    {
        ByteStreamReader reader;
        if (reader.open(path) != ByteStreamStatus::Ok) {
            return FileScanOutcome::OpenFailed;
        }

        uint64_t since_check = 0;
        for (;;) {
            if (options.cancel.requested()) {
                return FileScanOutcome::Cancelled;
            }
            const uint64_t base = reader.offset();
            uint64_t read       = 0;
            if (reader.next_chunk(std::span<std::byte>(buffer->data(),
                                                       buffer->size()),
                                  &read)
                != ByteStreamStatus::Ok) {
                return FileScanOutcome::ReadFailed;
            }
            if (read == 0U) {
                break;
            }
            const FeedOutcome outcome = feed_with_cancel(
                scanner,
                std::span<const std::byte>(buffer->data(),
                                           static_cast<size_t>(read)),
                base, options, &since_check, bytes_scanned);
            if (outcome == FeedOutcome::Cancelled) {
                return FileScanOutcome::Cancelled;
            }
            if (outcome == FeedOutcome::Done) {
                break;
            }
        }
        scanner->finish();
        return FileScanOutcome::Finished;
    }


    static uint32_t chunk_size(const SpanScanOptions& options) noexcept
    {
        return std::max(options.limits.chunk_bytes, kMinChunkBytes);
    }


    static SpanFilter merge_filters(const SpanFilter& a,
                                    const SpanFilter& b) noexcept
    {
        SpanFilter f;
        f.min_payload_chars = std::max(a.min_payload_chars,
                                       b.min_payload_chars);
        f.min_approx_bytes  = std::max(a.min_approx_bytes, b.min_approx_bytes);
        return f;
    }


    static void finish_status(const SpanCollector& collector,
                              SpanScanResult* result) noexcept
    {
        result->written = collector.written();
        if (result->status == SpanScanStatus::Ok && collector.full()) {
            result->status = SpanScanStatus::MatchLimitReached;
        }
    }


    static SpanScanResult scan_part_files(const char* session_path,
                                          std::vector<LocatedSpan>* out,
                                          const SpanScanOptions& options,
                                          uint32_t max_matches,
                                          bool presence) noexcept
    {
        SpanScanResult result;
        if (!options.resolver) {
            result.status = SpanScanStatus::Unsupported;
            return result;
        }

        StorageLayout layout;
        const StorageLayoutStatus resolved
            = options.resolver->resolve(session_path, options.message_ids,
                                        options.cancel, &layout);
        switch (resolved) {
        case StorageLayoutStatus::Ok: break;
        case StorageLayoutStatus::NotFound: return result;
        case StorageLayoutStatus::Cancelled:
            result.status = SpanScanStatus::Cancelled;
            return result;
        case StorageLayoutStatus::IoError:
            result.status = SpanScanStatus::IoError;
            return result;
        }

        std::stable_sort(layout.part_files.begin(), layout.part_files.end(),
                         [](const PartFileRef& a, const PartFileRef& b) {
                             return a.message_id < b.message_id;
                         });

        SpanCollector collector(out, max_matches,
                                merge_filters(options.filter,
                                              kPartFileSpanFilter));
        std::vector<std::byte> buffer(chunk_size(options));
        const DialectScanOptions dialect = dialect_options(options, presence);

        for (const PartFileRef& part : layout.part_files) {
            if (collector.full()) {
                break;
            }
            if (options.cancel.requested()) {
                result.status = SpanScanStatus::Cancelled;
                break;
            }
            if (part.message_id.empty()) {
                continue;
            }
            collector.set_source(part.path, part.message_id);
            std::unique_ptr<DialectScanner> scanner
                = make_dialect_scanner(Dialect::DataUrl, &collector, dialect);
            if (!scanner) {
                result.status = SpanScanStatus::IoError;
                break;
            }
            const FileScanOutcome outcome
                = scan_one_file(part.path.c_str(), scanner.get(), options,
                                &buffer, &result.bytes_scanned);
            if (outcome == FileScanOutcome::Cancelled) {
                result.status = SpanScanStatus::Cancelled;
                break;
            }
            // Unreadable part files are skipped.
            if (outcome != FileScanOutcome::OpenFailed) {
                result.files_scanned += 1U;
            }
        }

        finish_status(collector, &result);
        return result;
    }


    static SpanScanResult scan_file_impl(const char* path, Dialect dialect,
                                         std::vector<LocatedSpan>* out,
                                         const SpanScanOptions& options,
                                         uint32_t max_matches,
                                         bool presence) noexcept
    {
        SpanScanResult result;
        if (!path) {
            result.status = SpanScanStatus::IoError;
            return result;
        }
        if (max_matches == 0U) {
            return result;
        }
        if (dialect == Dialect::OpenCodeParts) {
            return scan_part_files(path, out, options, max_matches, presence);
        }

        SpanCollector collector(out, max_matches, options.filter);
        collector.set_source(path, std::string_view());
        std::unique_ptr<DialectScanner> scanner
            = make_dialect_scanner(dialect, &collector,
                                   dialect_options(options, presence));
        if (!scanner) {
            result.status = SpanScanStatus::Unsupported;
            return result;
        }

        std::vector<std::byte> buffer(chunk_size(options));
        const FileScanOutcome outcome = scan_one_file(path, scanner.get(),
                                                      options, &buffer,
                                                      &result.bytes_scanned);
        switch (outcome) {
        case FileScanOutcome::Finished: result.files_scanned = 1U; break;
        case FileScanOutcome::Cancelled:
            result.files_scanned = 1U;
            result.status        = SpanScanStatus::Cancelled;
            break;
        case FileScanOutcome::OpenFailed:
            result.status = SpanScanStatus::IoError;
            break;
        case FileScanOutcome::ReadFailed:
            result.files_scanned = 1U;
            result.status        = SpanScanStatus::IoError;
            break;
        }
        finish_status(collector, &result);
        return result;
    }


    static bool is_space(uint8_t c) noexcept
    {
        return c == 0x20U || c == 0x09U || c == 0x0DU || c == 0x0AU;
    }


    static uint8_t lower(uint8_t c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<uint8_t>(c - 'A' + 'a')
                                      : c;
    }


    // Case-insensitive literal match of `lit` at `pos`.
    static bool match_at(std::span<const std::byte> s, size_t pos,
                         std::string_view lit) noexcept
    {
        if (pos > s.size() || s.size() - pos < lit.size()) {
            return false;
        }
        for (size_t i = 0; i < lit.size(); ++i) {
            if (lower(static_cast<uint8_t>(s[pos + i]))
                != static_cast<uint8_t>(lit[i])) {
                return false;
            }
        }
        return true;
    }


    static bool unescaped_quote_at(std::span<const std::byte> s,
                                   size_t pos) noexcept
    {
        return pos < s.size() && static_cast<uint8_t>(s[pos]) == '"'
               && (pos == 0U || static_cast<uint8_t>(s[pos - 1U]) != '\\');
    }


    static size_t skip_space(std::span<const std::byte> s, size_t pos) noexcept
    {
        while (pos < s.size() && is_space(static_cast<uint8_t>(s[pos]))) {
            pos += 1U;
        }
        return pos;
    }


    // `"image_url"\s*:\s*({\s*"url"\s*:\s*)?"data:image` with every quote
    // unescaped, starting at `pos`.
    static bool image_url_field_at(std::span<const std::byte> s,
                                   size_t pos) noexcept
    {
        if (!unescaped_quote_at(s, pos) || !match_at(s, pos, "\"image_url\"")) {
            return false;
        }
        size_t p = skip_space(s, pos + 11U);
        if (p >= s.size() || static_cast<uint8_t>(s[p]) != ':') {
            return false;
        }
        p = skip_space(s, p + 1U);
        if (p < s.size() && static_cast<uint8_t>(s[p]) == '{') {
            p = skip_space(s, p + 1U);
            if (!unescaped_quote_at(s, p) || !match_at(s, p, "\"url\"")) {
                return false;
            }
            p = skip_space(s, p + 5U);
            if (p >= s.size() || static_cast<uint8_t>(s[p]) != ':') {
                return false;
            }
            p = skip_space(s, p + 1U);
        }
        return unescaped_quote_at(s, p) && match_at(s, p, "\"data:image");
    }

}  // namespace

SpanScanResult
scan_file(const char* path, Dialect dialect, std::vector<LocatedSpan>* out,
          const SpanScanOptions& options) noexcept
{
    return scan_file_impl(path, dialect, out, options,
                          options.limits.max_matches, false);
}


SpanScanResult
scan_bytes(std::span<const std::byte> bytes, Dialect dialect,
           std::vector<LocatedSpan>* out,
           const SpanScanOptions& options) noexcept
{
    SpanScanResult result;
    if (options.limits.max_matches == 0U) {
        return result;
    }
    SpanCollector collector(out, options.limits.max_matches, options.filter);
    std::unique_ptr<DialectScanner> scanner
        = make_dialect_scanner(dialect, &collector,
                               dialect_options(options, false));
    if (!scanner) {
        result.status = SpanScanStatus::Unsupported;
        return result;
    }
    if (options.cancel.requested()) {
        result.status = SpanScanStatus::Cancelled;
        return result;
    }

    uint64_t since_check = 0;
    const FeedOutcome outcome = feed_with_cancel(scanner.get(), bytes, 0,
                                                 options, &since_check,
                                                 &result.bytes_scanned);
    if (outcome == FeedOutcome::Cancelled) {
        result.status = SpanScanStatus::Cancelled;
    } else {
        scanner->finish();
    }
    finish_status(collector, &result);
    return result;
}


bool
file_contains_image(const char* path, Dialect dialect,
                    const SpanScanOptions& options) noexcept
{
    const bool data_url = dialect == Dialect::DataUrl
                          || dialect == Dialect::OpenCodeParts;
    std::vector<LocatedSpan> found;
    const SpanScanResult r = scan_file_impl(path, dialect, &found, options, 1U,
                                            data_url);
    if (r.status != SpanScanStatus::Ok
        && r.status != SpanScanStatus::MatchLimitReached) {
        return false;
    }
    return r.written != 0U;
}


bool
has_image_url_context(std::span<const std::byte> window,
                      uint64_t center) noexcept
{
    const size_t c = static_cast<size_t>(
        std::min<uint64_t>(center, window.size()));
    size_t line_begin = 0;
    for (size_t i = c; i > 0U; --i) {
        if (static_cast<uint8_t>(window[i - 1U]) == 0x0AU) {
            line_begin = i;
            break;
        }
    }
    size_t line_end = window.size();
    for (size_t i = c; i < window.size(); ++i) {
        if (static_cast<uint8_t>(window[i]) == 0x0AU) {
            line_end = i;
            break;
        }
    }
    if (line_begin >= line_end) {
        return false;
    }

    const std::span<const std::byte> line
        = window.subspan(line_begin, line_end - line_begin);
    for (size_t i = 0; i < line.size(); ++i) {
        if (image_url_field_at(line, i)) {
            return true;
        }
    }
    return false;
}


bool
check_image_url_context(const char* path, const ImageSpan& span) noexcept
{
    if (!path) {
        return false;
    }
    ByteStreamReader reader;
    if (reader.open(path) != ByteStreamStatus::Ok) {
        return false;
    }

    const uint64_t back = std::min<uint64_t>(kImageUrlContextLookbehind,
                                             span.start_offset);
    std::array<std::byte,
               kImageUrlContextLookbehind + kImageUrlContextLookahead>
        buf {};
    const size_t want = static_cast<size_t>(back) + kImageUrlContextLookahead;
    uint64_t read     = 0;
    if (reader.read_slice(span.start_offset - back,
                          std::span<std::byte>(buf.data(), want), &read)
        != ByteStreamStatus::Ok) {
        return false;
    }
    return has_image_url_context(
        std::span<const std::byte>(buf.data(), static_cast<size_t>(read)),
        back);
}

}  // namespace imagespan
