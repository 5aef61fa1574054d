#include "imagespan/dialect_scan.h"
#include "imagespan/span_locator.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <span>
#include <vector>

namespace imagespan {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_spans(std::span<const std::byte> bytes,
             const std::vector<LocatedSpan>& spans) noexcept
{
    const uint64_t size = static_cast<uint64_t>(bytes.size());
    for (size_t i = 0; i < spans.size(); ++i) {
        const ImageSpan& s = spans[i].span;
        if (!span_is_consistent(s) || s.end_offset > size
            || s.payload_length == 0U) {
            fuzz_trap();
        }
        if (i != 0U
            && spans[i - 1U].span.start_offset > s.start_offset) {
            fuzz_trap();
        }
    }
}


static void
verify_same(const std::vector<LocatedSpan>& a,
            const std::vector<LocatedSpan>& b) noexcept
{
    if (a.size() != b.size()) {
        fuzz_trap();
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].span.start_offset != b[i].span.start_offset
            || a[i].span.end_offset != b[i].span.end_offset
            || a[i].span.payload_length != b[i].span.payload_length
            || a[i].span.media_type != b[i].span.media_type
            || a[i].tag != b[i].tag) {
            fuzz_trap();
        }
    }
}

}  // namespace imagespan

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace imagespan;

    if (size < 2U) {
        return 0;
    }
    static constexpr Dialect kDialects[] = {
        Dialect::DataUrl,
        Dialect::ClaudeJsonl,
        Dialect::OpenClawJsonl,
        Dialect::GeminiJson,
    };
    const Dialect dialect = kDialects[data[0] % 4U];
    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data + 2),
                                           size - 2U);
    const size_t split = bytes.empty() ? 0U : (data[1] % bytes.size());

    SpanScanOptions options;
    options.limits.max_matches       = 32;
    options.limits.tracker.max_depth = 16;

    std::vector<LocatedSpan> whole;
    const SpanScanResult res = scan_bytes(bytes, dialect, &whole, options);
    if (res.written != whole.size() || res.written > 32U) {
        fuzz_trap();
    }
    verify_spans(bytes, whole);

    std::vector<LocatedSpan> split_spans;
    SpanCollector collector(&split_spans, 32, SpanFilter {});
    DialectScanOptions dialect_options;
    dialect_options.tracker_limits.max_depth = 16;
    std::unique_ptr<DialectScanner> scanner
        = make_dialect_scanner(dialect, &collector, dialect_options);
    if (!scanner) {
        fuzz_trap();
    }
    scanner->feed(bytes.first(split), 0);
    scanner->feed(bytes.subspan(split), split);
    scanner->finish();
    verify_same(whole, split_spans);
    return 0;
}
