#include "imagespan/build_info.h"
#include "imagespan/media_type.h"
#include "imagespan/payload_decode.h"
#include "imagespan/resource_policy.h"
#include "imagespan/span_locator.h"
#include "imagespan/storage_layout.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace imagespan {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Lists base64 image payloads embedded in agent transcript files.\n"
            "\n"
            "Options:\n"
            "  --help                  Show this help\n"
            "  --version               Print ImageSpan build info\n"
            "  --no-build-info         Hide build info header\n"
            "  --dialect <name>        data_url | claude_jsonl | openclaw_jsonl |\n"
            "                          gemini_json | opencode_parts\n"
            "                          (default: data_url)\n"
            "  --presence              Only report whether a file has an image\n"
            "  --context               data_url: flag spans in image_url fields\n"
            "  --message-id <id>       opencode_parts: message to resolve\n"
            "                          (repeatable; default: all)\n"
            "  --max-matches N         Max spans per file (default: 200)\n"
            "  --min-payload-chars N   Skip spans with fewer base64 chars\n"
            "  --min-approx-bytes N    Skip spans with smaller decoded estimate\n"
            "  --max-depth N           Max tracked JSON depth (default: 0=unlimited)\n"
            "  --extract               Decode every span and write it to a file\n"
            "  --out-dir <dir>         Output directory (default: alongside input)\n"
            "  --force                 Overwrite existing files\n"
            "  --max-decoded-bytes N   Refuse payloads larger than N decoded bytes\n"
            "                          (default: 26214400)\n",
            argv0 ? argv0 : "spandump");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static const char* scan_status_name(SpanScanStatus status) noexcept
    {
        switch (status) {
        case SpanScanStatus::Ok: return "ok";
        case SpanScanStatus::MatchLimitReached: return "match_limit_reached";
        case SpanScanStatus::Cancelled: return "cancelled";
        case SpanScanStatus::IoError: return "io_error";
        case SpanScanStatus::Unsupported: return "unsupported";
        }
        return "unknown";
    }


    static const char* decode_status_name(PayloadDecodeStatus status) noexcept
    {
        switch (status) {
        case PayloadDecodeStatus::Ok: return "ok";
        case PayloadDecodeStatus::TooLarge: return "too_large";
        case PayloadDecodeStatus::InvalidBase64: return "invalid_base64";
        case PayloadDecodeStatus::IoError: return "io_error";
        case PayloadDecodeStatus::Cancelled: return "cancelled";
        case PayloadDecodeStatus::Malformed: return "malformed";
        }
        return "unknown";
    }


    // Transcript text is untrusted: keep printable ASCII, hex-escape the
    // rest and cut at `max_bytes`.
    static std::string terminal_safe(std::string_view s, size_t max_bytes)
    {
        std::string out;
        const size_t n = (s.size() < max_bytes) ? s.size() : max_bytes;
        out.reserve(n + 8U);
        for (size_t i = 0; i < n; ++i) {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            if (c >= 0x20U && c < 0x7FU && c != '\\') {
                out.push_back(static_cast<char>(c));
                continue;
            }
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out.append(buf);
        }
        if (n < s.size()) {
            out.append("...");
        }
        return out;
    }


    static std::string magic_hex(const std::vector<std::byte>& bytes)
    {
        std::string out;
        const size_t n = bytes.size() < 8U ? bytes.size() : 8U;
        for (size_t i = 0; i < n; ++i) {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%02X",
                          static_cast<unsigned>(
                              static_cast<uint8_t>(bytes[i])));
            out.append(buf);
        }
        return out;
    }


    static bool file_exists(const std::string& path)
    {
        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            return false;
        }
        std::fclose(f);
        return true;
    }


    static bool write_file_bytes(const std::string& path,
                                 const std::vector<std::byte>& bytes)
    {
        std::FILE* f = std::fopen(path.c_str(), "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool closed = std::fclose(f) == 0;
        return closed && written == bytes.size();
    }


    static std::string basename_only(const std::string& path)
    {
        const size_t sep = path.find_last_of("/\\");
        if (sep == std::string::npos) {
            return path;
        }
        return path.substr(sep + 1);
    }


    static std::string sanitize_filename(std::string s)
    {
        for (size_t i = 0; i < s.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            if (std::isalnum(c) == 0 && c != '.' && c != '_' && c != '-') {
                s[i] = '_';
            }
        }
        return s.empty() ? std::string("file") : s;
    }


    static std::string build_output_path(const std::string& input_path,
                                         const std::string& out_dir,
                                         uint32_t idx,
                                         const std::string& ext)
    {
        char num[16];
        std::snprintf(num, sizeof(num), "%03u", idx);

        std::string name = out_dir.empty()
                               ? input_path
                               : sanitize_filename(basename_only(input_path));
        name.append(".image.");
        name.append(num);
        name.append(".");
        name.append(ext);
        if (out_dir.empty()) {
            return name;
        }
        const char back = out_dir.back();
        if (back == '/' || back == '\\') {
            return out_dir + name;
        }
        return out_dir + "/" + name;
    }


    struct DumpOptions final {
        Dialect dialect   = Dialect::DataUrl;
        bool presence     = false;
        bool context      = false;
        bool extract      = false;
        bool force        = false;
        std::string out_dir;
        SpanScanOptions scan;
        PayloadDecodeOptions decode;
    };


    static void print_span(uint32_t idx, const LocatedSpan& s,
                           const DumpOptions& opts)
    {
        std::printf("  [%u] %s=%llu media=%s payload_off=%llu len=%llu "
                    "approx=%llu",
                    idx,
                    s.tag_kind == SpanTagKind::LineIndex ? "line" : "item",
                    static_cast<unsigned long long>(s.tag),
                    terminal_safe(s.span.media_type, 64).c_str(),
                    static_cast<unsigned long long>(s.span.payload_offset),
                    static_cast<unsigned long long>(s.span.payload_length),
                    static_cast<unsigned long long>(
                        s.span.approx_decoded_bytes));
        if (!s.message_id.empty()) {
            std::printf(" msg=%s part=%s",
                        terminal_safe(s.message_id, 64).c_str(),
                        terminal_safe(basename_only(s.source_path), 96)
                            .c_str());
        }
        if (opts.context && opts.dialect == Dialect::DataUrl) {
            const bool ctx = check_image_url_context(s.source_path.c_str(),
                                                     s.span);
            std::printf(" image_url=%s", ctx ? "yes" : "no");
        }
        std::printf("\n");
    }


    static bool extract_span(uint32_t idx, const LocatedSpan& s,
                             const std::string& input_path,
                             const DumpOptions& opts)
    {
        std::vector<std::byte> decoded;
        const PayloadDecodeResult r = decode_payload(s.source_path.c_str(),
                                                     s.span, &decoded,
                                                     opts.decode);
        if (r.status != PayloadDecodeStatus::Ok) {
            std::printf("      decode: %s\n", decode_status_name(r.status));
            return false;
        }

        const std::string out_path
            = build_output_path(input_path, opts.out_dir, idx,
                                suggested_file_extension(s.span.media_type));
        if (!opts.force && file_exists(out_path)) {
            std::printf("      exists: %s (use --force)\n",
                        terminal_safe(out_path, 256).c_str());
            return false;
        }
        if (!write_file_bytes(out_path, decoded)) {
            std::fprintf(stderr, "spandump: write failed: %s\n",
                         terminal_safe(out_path, 256).c_str());
            return false;
        }
        std::printf("      wrote %llu bytes magic=%s -> %s\n",
                    static_cast<unsigned long long>(r.written),
                    magic_hex(decoded).c_str(),
                    terminal_safe(out_path, 256).c_str());
        return true;
    }


    static bool dump_file(const std::string& path, const DumpOptions& opts)
    {
        std::printf("== %s (%s)\n", terminal_safe(path, 256).c_str(),
                    dialect_name(opts.dialect));

        if (opts.presence) {
            const bool found = file_contains_image(path.c_str(), opts.dialect,
                                                   opts.scan);
            std::printf("  contains_image=%s\n", found ? "yes" : "no");
            return true;
        }

        std::vector<LocatedSpan> spans;
        const SpanScanResult r = scan_file(path.c_str(), opts.dialect, &spans,
                                           opts.scan);
        std::printf("  scan=%s spans=%u bytes=%llu files=%u\n",
                    scan_status_name(r.status), r.written,
                    static_cast<unsigned long long>(r.bytes_scanned),
                    r.files_scanned);

        bool ok = r.status == SpanScanStatus::Ok
                  || r.status == SpanScanStatus::MatchLimitReached;
        for (size_t i = 0; i < spans.size(); ++i) {
            const uint32_t idx = static_cast<uint32_t>(i);
            print_span(idx, spans[i], opts);
            if (opts.extract && !extract_span(idx, spans[i], path, opts)) {
                ok = false;
            }
        }
        return ok;
    }

}  // namespace
}  // namespace imagespan


int
main(int argc, char** argv)
{
    using namespace imagespan;

    bool show_build_info = true;
    DumpOptions opts;
    ImageSpanResourcePolicy policy;
    std::vector<std::string> message_ids;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if (std::strcmp(arg, "--dialect") == 0 && i + 1 < argc) {
            if (!parse_dialect_name(argv[i + 1], &opts.dialect)) {
                std::fprintf(stderr, "unknown --dialect value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--presence") == 0) {
            opts.presence = true;
            continue;
        }
        if (std::strcmp(arg, "--context") == 0) {
            opts.context = true;
            continue;
        }
        if (std::strcmp(arg, "--message-id") == 0 && i + 1 < argc) {
            message_ids.emplace_back(argv[i + 1]);
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-matches") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &policy.scan_limits.max_matches)
                || policy.scan_limits.max_matches == 0U) {
                std::fprintf(stderr, "invalid --max-matches value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--min-payload-chars") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &opts.scan.filter.min_payload_chars)) {
                std::fprintf(stderr, "invalid --min-payload-chars value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--min-approx-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &opts.scan.filter.min_approx_bytes)) {
                std::fprintf(stderr, "invalid --min-approx-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1],
                               &policy.scan_limits.tracker.max_depth)) {
                std::fprintf(stderr, "invalid --max-depth value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--extract") == 0) {
            opts.extract = true;
            continue;
        }
        if (std::strcmp(arg, "--out-dir") == 0 && i + 1 < argc) {
            opts.out_dir = argv[i + 1];
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--force") == 0) {
            opts.force = true;
            continue;
        }
        if (std::strcmp(arg, "--max-decoded-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &policy.decode_limits.max_decoded_bytes)
                || policy.decode_limits.max_decoded_bytes == 0U) {
                std::fprintf(stderr, "invalid --max-decoded-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strncmp(arg, "--", 2) == 0) {
            std::fprintf(stderr, "unknown option: %s\n", arg);
            usage(argv[0]);
            return 2;
        }
        inputs.emplace_back(arg);
    }

    if (inputs.empty()) {
        usage(argv[0]);
        return 2;
    }

    apply_resource_policy(policy, &opts.scan, &opts.decode);
    PartDirectoryResolver resolver;
    opts.scan.resolver    = &resolver;
    opts.scan.message_ids = std::span<const std::string>(message_ids.data(),
                                                         message_ids.size());

    if (show_build_info) {
        print_build_info_header();
    }

    int exit_code = 0;
    for (const std::string& path : inputs) {
        if (!dump_file(path, opts)) {
            exit_code = 1;
        }
    }
    return exit_code;
}
