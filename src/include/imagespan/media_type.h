#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file media_type.h
 * \brief Media-type text helpers shared by the dialect scanners.
 */

namespace imagespan {

/**
 * \brief Fixed-capacity text stored inline in parser frames.
 *
 * Longer input is truncated; \ref truncated reports it. Keeping the storage
 * inline keeps each parser frame O(1)-sized.
 */
struct InlineText final {
    static constexpr uint32_t kCapacity = 64;

    std::array<char, kCapacity> bytes {};
    uint8_t size   = 0;
    bool truncated = false;

    void assign(std::string_view text) noexcept;
    void clear() noexcept
    {
        size      = 0;
        truncated = false;
    }
    bool empty() const noexcept { return size == 0U; }
    std::string_view view() const noexcept
    {
        return std::string_view(bytes.data(), size);
    }
};

/// ASCII case-insensitive equality.
bool
ascii_iequals(std::string_view a, std::string_view b) noexcept;

/**
 * \brief Normalizes raw (still JSON-escaped) media type text.
 *
 * Replaces `\/` with `/` and trims ASCII whitespace. Returns an empty string
 * when nothing remains.
 */
std::string
normalize_media_type(std::string_view raw);

/**
 * \brief Extracts the media type from a data URL header.
 *
 * \p header is the text starting at `data:` up to and including the base64
 * marker (e.g. `data:image/png;base64,`). Returns "image" when the header
 * carries no usable media type.
 */
std::string
media_type_from_data_url_header(std::string_view header);

/// Suggested file extension (without dot) for a decoded payload.
std::string
suggested_file_extension(std::string_view media_type);

}  // namespace imagespan
