#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

/**
 * \file kmp_matcher.h
 * \brief Knuth-Morris-Pratt matcher for short literal byte patterns.
 */

namespace imagespan {

/**
 * \brief Streaming literal matcher advanced one byte at a time.
 *
 * The matcher itself is immutable; callers keep the match cursor (`state`)
 * so one matcher can serve several concurrent scans. Total work is linear in
 * the number of bytes fed regardless of partial matches.
 */
class KmpMatcher final {
public:
    static constexpr uint32_t kMaxPatternBytes = 32;

    /// Builds the failure table. Patterns longer than \ref kMaxPatternBytes
    /// or empty patterns produce a matcher that never completes.
    explicit KmpMatcher(std::string_view pattern) noexcept;

    /// Returns the cursor after consuming \p byte from cursor \p state.
    uint32_t advance(uint32_t state, std::byte byte) const noexcept;

    /// True when \p state denotes a full match of the pattern.
    bool is_complete(uint32_t state) const noexcept
    {
        return size_ != 0U && state == size_;
    }

    uint32_t size() const noexcept { return size_; }
    bool valid() const noexcept { return size_ != 0U; }

private:
    std::array<uint8_t, kMaxPatternBytes> pattern_ {};
    std::array<uint8_t, kMaxPatternBytes> failure_ {};
    uint32_t size_ = 0;
};

}  // namespace imagespan
