#include "dialect_scan_internal.h"

#include "imagespan/kmp_matcher.h"
#include "imagespan/media_type.h"

#include <array>
#include <string_view>

namespace imagespan {
namespace {

    static constexpr std::string_view kStartMarker  = "data:image";
    static constexpr std::string_view kBase64Marker = ";base64,";
    static constexpr uint32_t kMaxHeaderBytes       = 512;

    static bool is_terminator(uint8_t c) noexcept
    {
        switch (c) {
        case 0x22U:  // '"'
        case 0x27U:  // '\''
        case 0x20U:
        case 0x09U:
        case 0x0AU:
        case 0x0DU:
        case 0x29U:  // ')'
        case 0x5DU:  // ']'
        case 0x7DU:  // '}'
        case 0x3EU:  // '>'
            return true;
        default: return false;
        }
    }


    enum class CandidateState : uint8_t {
        Searching,
        Header,
        Payload,
    };

    /// Finds `data:image/<type>;base64,<payload>` URLs anywhere in the
    /// input. The payload ends at the first terminator byte.
    class DataUrlScanner final : public DialectScanner {
    public:
        DataUrlScanner(SpanCollector* collector,
                       const DialectScanOptions& options) noexcept
            : collector_(collector)
            , presence_only_(options.presence_only)
            , presence_min_chars_(options.presence_min_payload_chars == 0U
                                      ? 1U
                                      : options.presence_min_payload_chars)
            , start_matcher_(kStartMarker)
            , base64_matcher_(kBase64Marker)
        {
        }

        void feed(std::span<const std::byte> bytes,
                  uint64_t base_offset) noexcept override
        {
            for (size_t i = 0; i < bytes.size(); ++i) {
                if (done_) {
                    return;
                }
                step(bytes[i], base_offset + static_cast<uint64_t>(i));
            }
        }

        // An unterminated payload at end of input is dropped.
        void finish() noexcept override {}

        bool done() const noexcept override
        {
            return done_ || collector_->full();
        }

    private:
        void abort_candidate() noexcept
        {
            state_        = CandidateState::Searching;
            base64_state_ = 0;
            header_size_  = 0;
        }

        void step(std::byte byte, uint64_t pos) noexcept
        {
            const uint8_t c = static_cast<uint8_t>(byte);

            switch (state_) {
            case CandidateState::Searching:
                start_state_ = start_matcher_.advance(start_state_, byte);
                if (start_matcher_.is_complete(start_state_)) {
                    state_            = CandidateState::Header;
                    candidate_start_  = pos + 1U - kStartMarker.size();
                    candidate_line_   = line_index_;
                    base64_state_     = 0;
                    payload_offset_   = 0;
                    payload_length_   = 0;
                    start_state_      = 0;
                    header_size_      = 0;
                    for (const char ch : kStartMarker) {
                        header_[header_size_] = ch;
                        header_size_ += 1U;
                    }
                }
                break;
            case CandidateState::Header:
                if (is_terminator(c) || header_size_ >= kMaxHeaderBytes) {
                    abort_candidate();
                    break;
                }
                header_[header_size_] = static_cast<char>(c);
                header_size_ += 1U;
                base64_state_ = base64_matcher_.advance(base64_state_, byte);
                if (base64_matcher_.is_complete(base64_state_)) {
                    state_          = CandidateState::Payload;
                    payload_offset_ = pos + 1U;
                    media_type_     = media_type_from_data_url_header(
                        std::string_view(header_.data(), header_size_));
                }
                break;
            case CandidateState::Payload:
                if (is_terminator(c)) {
                    if (!presence_only_ && payload_length_ != 0U) {
                        if (!collector_->emit(
                                make_image_span(candidate_start_,
                                                payload_offset_,
                                                payload_length_, pos,
                                                media_type_),
                                SpanTagKind::LineIndex, candidate_line_)) {
                            done_ = true;
                        }
                    }
                    abort_candidate();
                    break;
                }
                payload_length_ += 1U;
                if (presence_only_ && payload_length_ >= presence_min_chars_
                    && partial_passes_filter()) {
                    collector_->emit(make_image_span(candidate_start_,
                                                     payload_offset_,
                                                     payload_length_,
                                                     pos + 1U, media_type_),
                                     SpanTagKind::LineIndex, candidate_line_);
                    done_ = true;
                }
                break;
            }

            if (c == 0x0AU) {
                line_index_ += 1U;
            }
        }

        // Presence stops at the first partial payload the collector keeps.
        bool partial_passes_filter() const noexcept
        {
            const SpanFilter& f = collector_->filter();
            return payload_length_ >= f.min_payload_chars
                   && approx_decoded_size(payload_length_)
                          >= f.min_approx_bytes;
        }

        SpanCollector* collector_ = nullptr;
        bool presence_only_       = false;
        uint32_t presence_min_chars_ = 64;
        KmpMatcher start_matcher_;
        KmpMatcher base64_matcher_;

        CandidateState state_ = CandidateState::Searching;
        uint32_t start_state_  = 0;
        uint32_t base64_state_ = 0;
        std::array<char, kMaxHeaderBytes> header_ {};
        uint32_t header_size_ = 0;

        uint64_t candidate_start_ = 0;
        uint64_t candidate_line_  = 0;
        uint64_t payload_offset_  = 0;
        uint64_t payload_length_  = 0;
        std::string media_type_;

        uint64_t line_index_ = 0;
        bool done_           = false;
    };

}  // namespace

std::unique_ptr<DialectScanner>
make_data_url_scanner(SpanCollector* collector,
                      const DialectScanOptions& options) noexcept
{
    return std::make_unique<DataUrlScanner>(collector, options);
}

}  // namespace imagespan
