#include "dialect_scan_internal.h"

#include "imagespan/media_type.h"

#include <utility>

namespace imagespan {
namespace {

    enum ClaudeKey : uint16_t {
        kKeyNone      = 0,
        kKeyRole      = 1,
        kKeyType      = 2,
        kKeyMediaType = 3,
        kKeyData      = 4,
    };

    enum ClaudeFrameFlag : uint32_t {
        kFlagImage        = 1U << 0,
        kFlagUnderImage   = 1U << 1,
        kFlagBase64Source = 1U << 2,
    };

    static constexpr uint32_t kImageContext = kFlagImage | kFlagUnderImage;

    static bool is_user_role(std::string_view v) noexcept
    {
        return ascii_iequals(v, "user") || ascii_iequals(v, "human");
    }


    static bool is_user_line_type(std::string_view v) noexcept
    {
        static constexpr std::string_view kTypes[] = {
            "user", "user_input", "user-input", "input", "prompt", "human",
        };
        for (const std::string_view t : kTypes) {
            if (ascii_iequals(v, t)) {
                return true;
            }
        }
        return false;
    }


    /// Image blocks of the form
    /// `{"type":"image","source":{"type":"base64","media_type":...,"data":...}}`.
    ///
    /// A span is built when the source object closes and is held until the
    /// end of the line; it is emitted only if some `role` on the line was
    /// user/human or the top-level `type` names a user message.
    class ClaudePolicy final : public JsonScanPolicy {
    public:
        explicit ClaudePolicy(SpanCollector* collector) noexcept
            : collector_(collector)
            , line_spans_(collector->max_matches(), collector->filter())
        {
        }

        uint16_t key_id(std::string_view key) const noexcept override
        {
            if (key == "role") {
                return kKeyRole;
            }
            if (key == "type") {
                return kKeyType;
            }
            if (key == "media_type") {
                return kKeyMediaType;
            }
            if (key == "data") {
                return kKeyData;
            }
            return kKeyNone;
        }

        JsonStringClass
        classify_value(const JsonFrame& container) const noexcept override
        {
            if (container.kind != JsonContainerKind::Object) {
                return JsonStringClass::Ignored;
            }
            switch (container.key) {
            case kKeyRole:
            case kKeyType:
            case kKeyMediaType: return JsonStringClass::SmallValue;
            case kKeyData: return JsonStringClass::LargeValue;
            default: return JsonStringClass::Ignored;
            }
        }

        void on_open(JsonFrame& child, JsonFrame* parent,
                     uint32_t) noexcept override
        {
            if (parent && (parent->flags & kImageContext) != 0U) {
                child.flags |= kFlagUnderImage;
            }
        }

        void on_value(JsonFrame& container, const JsonStringToken& token,
                      uint32_t depth) noexcept override
        {
            switch (container.key) {
            case kKeyRole:
                if (is_user_role(token.text)) {
                    user_line_ = true;
                }
                break;
            case kKeyType:
                if (depth == 1U && is_user_line_type(token.text)) {
                    user_line_ = true;
                }
                if (ascii_iequals(token.text, "image")) {
                    container.flags |= kFlagImage;
                } else if (ascii_iequals(token.text, "base64")) {
                    container.flags |= kFlagBase64Source;
                }
                break;
            case kKeyMediaType:
                if (!token.text.empty()) {
                    container.text.assign(token.text);
                }
                break;
            case kKeyData:
                if (!token.has_escape && token.length != 0U) {
                    container.payload.content_offset = token.content_offset;
                    container.payload.end_offset     = token.end_offset;
                    container.payload.length         = token.length;
                    container.payload.present        = true;
                } else {
                    container.payload.present = false;
                }
                break;
            default: break;
            }
        }

        void on_close(JsonFrame& frame, JsonFrame* parent,
                      uint32_t) noexcept override
        {
            if (!frame.payload.present
                || (frame.flags & kFlagBase64Source) == 0U) {
                return;
            }
            const bool image_context
                = (frame.flags & kImageContext) != 0U
                  || (parent && (parent->flags & kImageContext) != 0U);
            if (!image_context) {
                return;
            }
            std::string media = normalize_media_type(frame.text.view());
            if (media.empty()) {
                media = "image";
            }
            line_spans_.add(make_image_span(frame.payload.content_offset,
                                            frame.payload.content_offset,
                                            frame.payload.length,
                                            frame.payload.end_offset,
                                            std::move(media)));
        }

        void on_line_end(uint64_t line_index) noexcept override
        {
            line_spans_.flush(collector_, line_index, user_line_);
            user_line_ = false;
        }

        bool stop_requested() const noexcept override
        {
            return collector_->full();
        }

    private:
        SpanCollector* collector_ = nullptr;
        LineSpanBuffer line_spans_;
        bool user_line_ = false;
    };

}  // namespace

std::unique_ptr<DialectScanner>
make_claude_jsonl_scanner(SpanCollector* collector,
                          const DialectScanOptions& options) noexcept
{
    return std::make_unique<TrackedDialectScanner<ClaudePolicy>>(collector,
                                                                 options,
                                                                 true);
}

}  // namespace imagespan
