#include "imagespan/media_type.h"

#include <cstring>

namespace imagespan {
namespace {

    static char ascii_lower(char c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return static_cast<char>(c - 'A' + 'a');
        }
        return c;
    }


    static bool is_ascii_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'
               || c == '\v';
    }


    static std::string_view trim_ascii(std::string_view s) noexcept
    {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && is_ascii_space(s[b])) {
            b += 1;
        }
        while (e > b && is_ascii_space(s[e - 1])) {
            e -= 1;
        }
        return s.substr(b, e - b);
    }

}  // namespace

void
InlineText::assign(std::string_view text) noexcept
{
    const size_t n = (text.size() < kCapacity) ? text.size() : kCapacity;
    if (n != 0U) {
        std::memcpy(bytes.data(), text.data(), n);
    }
    size      = static_cast<uint8_t>(n);
    truncated = n < text.size();
}


bool
ascii_iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) {
            return false;
        }
    }
    return true;
}


std::string
normalize_media_type(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == '/') {
            out.push_back('/');
            i += 1;
            continue;
        }
        out.push_back(raw[i]);
    }
    const std::string_view trimmed = trim_ascii(out);
    return std::string(trimmed);
}


std::string
media_type_from_data_url_header(std::string_view header)
{
    const size_t data = header.find("data:");
    if (data == std::string_view::npos) {
        return "image";
    }
    const size_t begin = data + 5U;
    const size_t semi  = header.find(';', begin);
    if (semi == std::string_view::npos) {
        return "image";
    }
    std::string media = normalize_media_type(header.substr(begin,
                                                           semi - begin));
    if (media.empty()) {
        return "image";
    }
    return media;
}


std::string
suggested_file_extension(std::string_view media_type)
{
    const std::string normalized = normalize_media_type(media_type);
    std::string lower;
    lower.reserve(normalized.size());
    for (const char c : normalized) {
        lower.push_back(ascii_lower(c));
    }

    if (lower == "image/png") {
        return "png";
    }
    if (lower == "image/jpeg" || lower == "image/jpg") {
        return "jpg";
    }
    if (lower == "image/gif") {
        return "gif";
    }
    if (lower == "image/tiff" || lower == "image/tif") {
        return "tiff";
    }
    if (lower == "image/heic") {
        return "heic";
    }
    if (lower == "image/heif") {
        return "heif";
    }
    static constexpr std::string_view kImagePrefix = "image/";
    if (lower.size() > kImagePrefix.size()
        && lower.compare(0, kImagePrefix.size(), kImagePrefix) == 0) {
        return lower.substr(kImagePrefix.size());
    }
    return "img";
}

}  // namespace imagespan
