#pragma once

#include "imagespan/payload_decode.h"
#include "imagespan/span_locator.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief One place to set every scan and decode budget.
 */

namespace imagespan {

/**
 * \brief Storage-agnostic resource limits for untrusted transcript input.
 *
 * Scans never cap file size; memory stays bounded by the tracker frame
 * stack and the small-string buffer. Only decode is capped by output size.
 */
struct ImageSpanResourcePolicy final {
    /// Span enumeration budgets (cap, chunking, cancel cadence, depth).
    SpanScanLimits scan_limits;

    /// Presence mode payload threshold.
    uint32_t presence_min_payload_chars = 64;

    /// Payload decode budgets.
    PayloadDecodeLimits decode_limits;
};

inline void
apply_resource_policy(const ImageSpanResourcePolicy& policy,
                      SpanScanOptions* scan,
                      PayloadDecodeOptions* decode) noexcept
{
    if (scan) {
        scan->limits                     = policy.scan_limits;
        scan->presence_min_payload_chars = policy.presence_min_payload_chars;
    }
    if (decode) {
        decode->limits = policy.decode_limits;
    }
}

}  // namespace imagespan
