#include "imagespan/build_info.h"

#include "imagespan/build_info_generated.h"

#include <string>

namespace imagespan {
namespace {

#if defined(IMAGESPAN_BUILD_LINKAGE_SHARED) && IMAGESPAN_BUILD_LINKAGE_SHARED
    static constexpr bool kSharedLibrary = true;
#else
    static constexpr bool kSharedLibrary = false;
#endif

    static const BuildInfo kBuildInfo = {
        IMAGESPAN_BUILDINFO_VERSION,
        IMAGESPAN_BUILDINFO_BUILD_TYPE,
        IMAGESPAN_BUILDINFO_COMPILER,
        kSharedLibrary,
        SpanScanLimits {},
        PayloadDecodeLimits {},
    };

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->assign("ImageSpan ");
        line1->append(bi.version);
        line1->append(" (");
        line1->append(bi.build_type);
        line1->append(bi.shared_library ? ", shared, " : ", static, ");
        line1->append(bi.compiler);
        line1->append(")");
    }

    if (line2) {
        line2->assign("dialects:");
        for (const Dialect d : kAllDialects) {
            line2->append(" ");
            line2->append(dialect_name(d));
        }
        line2->append("; scan cap ");
        line2->append(std::to_string(bi.default_scan_limits.max_matches));
        line2->append(" spans; decode cap ");
        line2->append(
            std::to_string(bi.default_decode_limits.max_decoded_bytes));
        line2->append(" bytes");
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace imagespan
