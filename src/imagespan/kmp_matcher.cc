#include "imagespan/kmp_matcher.h"

namespace imagespan {

KmpMatcher::KmpMatcher(std::string_view pattern) noexcept
{
    if (pattern.empty() || pattern.size() > kMaxPatternBytes) {
        return;
    }
    size_ = static_cast<uint32_t>(pattern.size());
    for (uint32_t i = 0; i < size_; ++i) {
        pattern_[i] = static_cast<uint8_t>(pattern[i]);
    }

    uint32_t j  = 0;
    failure_[0] = 0;
    for (uint32_t i = 1; i < size_; ++i) {
        while (j > 0U && pattern_[i] != pattern_[j]) {
            j = failure_[j - 1U];
        }
        if (pattern_[i] == pattern_[j]) {
            j += 1U;
        }
        failure_[i] = static_cast<uint8_t>(j);
    }
}


uint32_t
KmpMatcher::advance(uint32_t state, std::byte byte) const noexcept
{
    if (size_ == 0U) {
        return 0;
    }
    const uint8_t b = static_cast<uint8_t>(byte);

    // A completed match restarts from its longest proper border.
    uint32_t m = (state >= size_) ? failure_[size_ - 1U] : state;
    while (m > 0U && b != pattern_[m]) {
        m = failure_[m - 1U];
    }
    if (b == pattern_[m]) {
        m += 1U;
    }
    return m;
}

}  // namespace imagespan
