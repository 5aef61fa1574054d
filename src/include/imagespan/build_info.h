#pragma once

#include "imagespan/payload_decode.h"
#include "imagespan/span_locator.h"

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief What this ImageSpan binary was built as and what it scans.
 */

namespace imagespan {

struct BuildInfo final {
    /// Project version (e.g. "0.1.0").
    std::string_view version;
    /// CMake build type, "multi-config" or "unspecified".
    std::string_view build_type;
    /// Compiler id and version (e.g. "GNU 13.2.0").
    std::string_view compiler;
    bool shared_library = false;

    /// Defaults a caller gets from value-initialized options.
    SpanScanLimits default_scan_limits;
    PayloadDecodeLimits default_decode_limits;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats the two-line banner printed by `spandump`.
 *
 * - `ImageSpan <version> (<build_type>, <linkage>, <compiler>)`
 * - `dialects: <names...>; scan cap <n> spans; decode cap <n> bytes`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace imagespan
