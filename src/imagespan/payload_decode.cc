#include "imagespan/payload_decode.h"

#include "imagespan/byte_stream_reader.h"

#include <algorithm>
#include <array>

namespace imagespan {
namespace {

    // 0..63 for alphabet bytes, 64 for '=', 0xFF otherwise.
    static constexpr std::array<uint8_t, 256> make_decode_table() noexcept
    {
        std::array<uint8_t, 256> t {};
        for (size_t i = 0; i < t.size(); ++i) {
            t[i] = 0xFFU;
        }
        constexpr char kEnc[]
            = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (uint8_t i = 0; i < 64U; ++i) {
            t[static_cast<uint8_t>(kEnc[i])] = i;
        }
        t[static_cast<uint8_t>('=')] = 64U;
        return t;
    }

    static constexpr std::array<uint8_t, 256> kDecode = make_decode_table();


    static PayloadDecodeResult fail(PayloadDecodeStatus status,
                                    PayloadDecodeResult result,
                                    std::vector<std::byte>* out) noexcept
    {
        out->clear();
        result.status  = status;
        result.written = 0;
        return result;
    }

}  // namespace

void
Base64StreamDecoder::push(std::span<const std::byte> text,
                          std::vector<std::byte>* out) noexcept
{
    if (padded_) {
        return;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        const uint8_t v = kDecode[static_cast<uint8_t>(text[i])];
        if (v == 0xFFU) {
            continue;
        }
        if (v == 64U) {
            padded_ = true;
            return;
        }
        quad_ = (quad_ << 6) | v;
        buffered_ += 1U;
        if (buffered_ == 4U) {
            out->push_back(static_cast<std::byte>((quad_ >> 16) & 0xFFU));
            out->push_back(static_cast<std::byte>((quad_ >> 8) & 0xFFU));
            out->push_back(static_cast<std::byte>(quad_ & 0xFFU));
            quad_     = 0;
            buffered_ = 0;
        }
    }
}


void
Base64StreamDecoder::finish(std::vector<std::byte>* out) noexcept
{
    if (buffered_ == 2U) {
        out->push_back(static_cast<std::byte>((quad_ >> 4) & 0xFFU));
    } else if (buffered_ == 3U) {
        out->push_back(static_cast<std::byte>((quad_ >> 10) & 0xFFU));
        out->push_back(static_cast<std::byte>((quad_ >> 2) & 0xFFU));
    }
    quad_     = 0;
    buffered_ = 0;
    padded_   = false;
}


bool
decode_base64_ignoring_unknown(std::string_view text,
                               std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return false;
    }
    out->clear();
    out->reserve(static_cast<size_t>(approx_decoded_size(text.size())));
    Base64StreamDecoder decoder;
    decoder.push(std::span<const std::byte>(
                     reinterpret_cast<const std::byte*>(text.data()),
                     text.size()),
                 out);
    decoder.finish(out);
    return !out->empty();
}


PayloadDecodeResult
decode_payload(const char* path, const ImageSpan& span,
               std::vector<std::byte>* out,
               const PayloadDecodeOptions& options) noexcept
{
    PayloadDecodeResult result;
    if (!out) {
        result.status = PayloadDecodeStatus::Malformed;
        return result;
    }
    if (!path || !span_is_consistent(span)) {
        return fail(PayloadDecodeStatus::Malformed, result, out);
    }
    if (span.approx_decoded_bytes > options.limits.max_decoded_bytes) {
        return fail(PayloadDecodeStatus::TooLarge, result, out);
    }
    if (options.cancel.requested()) {
        return fail(PayloadDecodeStatus::Cancelled, result, out);
    }

    ByteStreamReader reader;
    if (reader.open(path) != ByteStreamStatus::Ok) {
        return fail(PayloadDecodeStatus::IoError, result, out);
    }

    out->clear();
    out->reserve(static_cast<size_t>(span.approx_decoded_bytes));

    const uint32_t chunk = std::max<uint32_t>(options.limits.chunk_bytes,
                                              4096U);
    std::vector<std::byte> buffer(
        static_cast<size_t>(std::min<uint64_t>(chunk, span.payload_length)));
    Base64StreamDecoder decoder;

    uint64_t remaining = span.payload_length;
    uint64_t offset    = span.payload_offset;
    while (remaining != 0U) {
        if (options.cancel.requested()) {
            return fail(PayloadDecodeStatus::Cancelled, result, out);
        }
        const size_t want = static_cast<size_t>(
            std::min<uint64_t>(remaining, buffer.size()));
        uint64_t got = 0;
        if (reader.read_slice(offset, std::span<std::byte>(buffer.data(), want),
                              &got)
                != ByteStreamStatus::Ok
            || got != want) {
            return fail(PayloadDecodeStatus::IoError, result, out);
        }
        decoder.push(std::span<const std::byte>(buffer.data(), want), out);
        if (out->size() > options.limits.max_decoded_bytes) {
            return fail(PayloadDecodeStatus::TooLarge, result, out);
        }
        result.read += got;
        offset += got;
        remaining -= got;
    }
    decoder.finish(out);

    if (out->empty()) {
        return fail(PayloadDecodeStatus::InvalidBase64, result, out);
    }
    if (out->size() > options.limits.max_decoded_bytes) {
        return fail(PayloadDecodeStatus::TooLarge, result, out);
    }
    result.written = out->size();
    return result;
}

}  // namespace imagespan
