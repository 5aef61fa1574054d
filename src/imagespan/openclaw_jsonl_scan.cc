#include "dialect_scan_internal.h"

#include "imagespan/media_type.h"

#include <utility>

namespace imagespan {
namespace {

    enum OpenClawKey : uint16_t {
        kKeyNone     = 0,
        kKeyRole     = 1,
        kKeyType     = 2,
        kKeyMimeType = 3,
        kKeyData     = 4,
    };

    enum OpenClawFrameFlag : uint32_t {
        kFlagImage = 1U << 0,
    };

    enum class LineRole : uint8_t {
        Unknown,
        User,
        Other,
    };

    /// Flat image blocks `{"type":"image","mimeType":...,"data":...}`.
    ///
    /// The first `role` value on a line decides the line; it may follow the
    /// content, so spans wait for the line end.
    class OpenClawPolicy final : public JsonScanPolicy {
    public:
        explicit OpenClawPolicy(SpanCollector* collector) noexcept
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
            if (key == "mimeType") {
                return kKeyMimeType;
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
            case kKeyMimeType: return JsonStringClass::SmallValue;
            case kKeyData: return JsonStringClass::LargeValue;
            default: return JsonStringClass::Ignored;
            }
        }

        void on_value(JsonFrame& container, const JsonStringToken& token,
                      uint32_t) noexcept override
        {
            switch (container.key) {
            case kKeyRole:
                if (line_role_ == LineRole::Unknown) {
                    line_role_ = (token.text == "user") ? LineRole::User
                                                        : LineRole::Other;
                }
                break;
            case kKeyType:
                if (token.text == "image") {
                    container.flags |= kFlagImage;
                } else {
                    container.flags &= ~static_cast<uint32_t>(kFlagImage);
                }
                break;
            case kKeyMimeType:
                if (!token.text.empty()) {
                    container.text.assign(token.text);
                }
                break;
            case kKeyData:
                container.payload.present = !token.has_escape
                                            && token.length != 0U;
                container.payload.content_offset = token.content_offset;
                container.payload.end_offset     = token.end_offset;
                container.payload.length         = token.length;
                break;
            default: break;
            }
        }

        void on_close(JsonFrame& frame, JsonFrame*, uint32_t) noexcept override
        {
            if ((frame.flags & kFlagImage) == 0U || !frame.payload.present) {
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
            line_spans_.flush(collector_, line_index,
                              line_role_ == LineRole::User);
            line_role_ = LineRole::Unknown;
        }

        bool stop_requested() const noexcept override
        {
            return collector_->full();
        }

    private:
        SpanCollector* collector_ = nullptr;
        LineSpanBuffer line_spans_;
        LineRole line_role_ = LineRole::Unknown;
    };

}  // namespace

std::unique_ptr<DialectScanner>
make_openclaw_jsonl_scanner(SpanCollector* collector,
                            const DialectScanOptions& options) noexcept
{
    return std::make_unique<TrackedDialectScanner<OpenClawPolicy>>(collector,
                                                                   options,
                                                                   true);
}

}  // namespace imagespan
