#pragma once

#include "imagespan/image_span.h"
#include "imagespan/scan_cancel.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file payload_decode.h
 * \brief On-demand base64 decode of one located span under a size budget.
 */

namespace imagespan {

/// Status for \ref decode_payload.
enum class PayloadDecodeStatus : uint8_t {
    Ok,
    /// Estimated or exact decoded size exceeds `max_decoded_bytes`.
    TooLarge,
    /// The payload produced no bytes.
    InvalidBase64,
    /// Open, read or short-read failure.
    IoError,
    Cancelled,
    /// The span's offsets/length are inconsistent.
    Malformed,
};

/// Limits for \ref decode_payload.
struct PayloadDecodeLimits final {
    uint64_t max_decoded_bytes = 25ULL * 1024ULL * 1024ULL;
    /// Payload bytes read per positioned read.
    uint32_t chunk_bytes = 64U * 1024U;
};

/// Options for \ref decode_payload.
struct PayloadDecodeOptions final {
    PayloadDecodeLimits limits;
    /// Polled before each read.
    ScanCancel cancel;
};

/// Result for \ref decode_payload.
struct PayloadDecodeResult final {
    PayloadDecodeStatus status = PayloadDecodeStatus::Ok;
    /// Decoded bytes stored in the output vector.
    uint64_t written = 0;
    /// Payload bytes read from the file.
    uint64_t read = 0;
};

/**
 * \brief Reads exactly the payload bytes of \p span from \p path and
 * base64-decodes them into \p out.
 *
 * Fails with \ref PayloadDecodeStatus::TooLarge before any read when
 * `span.approx_decoded_bytes` exceeds the budget. Bytes outside the base64
 * alphabet are skipped and missing padding is accepted. \p out is cleared
 * on every non-Ok status.
 */
PayloadDecodeResult
decode_payload(const char* path, const ImageSpan& span,
               std::vector<std::byte>* out,
               const PayloadDecodeOptions& options) noexcept;

/**
 * \brief Decodes base64 \p text, skipping bytes outside the alphabet.
 *
 * Returns false (with \p out cleared) when no bytes result.
 */
bool
decode_base64_ignoring_unknown(std::string_view text,
                               std::vector<std::byte>* out) noexcept;

/**
 * \brief Incremental base64 decoder for the standard alphabet.
 *
 * Decoding stops at the first `=`; a trailing group of 2 or 3 symbols
 * yields 1 or 2 bytes, a lone trailing symbol is dropped.
 */
class Base64StreamDecoder final {
public:
    void push(std::span<const std::byte> text,
              std::vector<std::byte>* out) noexcept;
    void finish(std::vector<std::byte>* out) noexcept;

private:
    uint32_t quad_     = 0;
    uint32_t buffered_ = 0;
    bool padded_       = false;
};

}  // namespace imagespan
