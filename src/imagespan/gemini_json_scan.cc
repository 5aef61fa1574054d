#include "dialect_scan_internal.h"

#include "imagespan/media_type.h"

#include <utility>

namespace imagespan {
namespace {

    enum GeminiKey : uint16_t {
        kKeyNone         = 0,
        kKeyIndexedArray = 1,
        kKeyInlineData   = 2,
        kKeyMimeType     = 3,
        kKeyData         = 4,
    };

    enum GeminiFrameFlag : uint32_t {
        kFlagIndexedArray = 1U << 0,
        kFlagInlineData   = 1U << 1,
        kFlagInsideInline = 1U << 2,
    };

    /// `{"inlineData":{"mimeType":"image/png","data":"..."}}` objects in a
    /// single JSON document. Elements of `messages`, `history` or `items`
    /// arrays number the spans found beneath them. An `inlineData` nested
    /// in another one is not an image part and is skipped.
    class GeminiPolicy final : public JsonScanPolicy {
    public:
        explicit GeminiPolicy(SpanCollector* collector) noexcept
            : collector_(collector)
        {
        }

        uint16_t key_id(std::string_view key) const noexcept override
        {
            if (key == "messages" || key == "history" || key == "items") {
                return kKeyIndexedArray;
            }
            if (key == "inlineData") {
                return kKeyInlineData;
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
            if (container.kind != JsonContainerKind::Object
                || (container.flags & kFlagInlineData) == 0U) {
                return JsonStringClass::Ignored;
            }
            switch (container.key) {
            case kKeyMimeType: return JsonStringClass::SmallValue;
            case kKeyData: return JsonStringClass::LargeValue;
            default: return JsonStringClass::Ignored;
            }
        }

        void on_open(JsonFrame& child, JsonFrame* parent,
                     uint32_t) noexcept override
        {
            if (parent) {
                child.item_index = parent->item_index;
                if ((parent->flags & kFlagIndexedArray) != 0U) {
                    child.item_index = child.element_index;
                }
                if ((parent->flags & (kFlagInlineData | kFlagInsideInline))
                    != 0U) {
                    child.flags |= kFlagInsideInline;
                }
            }
            if (child.kind == JsonContainerKind::Array
                && child.opened_under_key == kKeyIndexedArray) {
                child.flags |= kFlagIndexedArray;
            }
            if (child.kind == JsonContainerKind::Object
                && child.opened_under_key == kKeyInlineData
                && (child.flags & kFlagInsideInline) == 0U) {
                child.flags |= kFlagInlineData;
            }
        }

        void on_value(JsonFrame& container, const JsonStringToken& token,
                      uint32_t) noexcept override
        {
            switch (container.key) {
            case kKeyMimeType: container.text.assign(token.text); break;
            case kKeyData:
                container.payload.present = !token.has_escape
                                            && !token.has_whitespace
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
            if ((frame.flags & kFlagInlineData) == 0U
                || !frame.payload.present || frame.text.truncated) {
                return;
            }
            std::string media = normalize_media_type(frame.text.view());
            if (media.compare(0, 6, "image/") != 0) {
                return;
            }
            const uint64_t item = (frame.item_index == kJsonNoIndex)
                                      ? 0U
                                      : frame.item_index;
            collector_->emit(make_image_span(frame.payload.content_offset,
                                             frame.payload.content_offset,
                                             frame.payload.length,
                                             frame.payload.end_offset,
                                             std::move(media)),
                             SpanTagKind::ItemIndex, item);
        }

        bool stop_requested() const noexcept override
        {
            return collector_->full();
        }

    private:
        SpanCollector* collector_ = nullptr;
    };

}  // namespace

std::unique_ptr<DialectScanner>
make_gemini_json_scanner(SpanCollector* collector,
                         const DialectScanOptions& options) noexcept
{
    return std::make_unique<TrackedDialectScanner<GeminiPolicy>>(collector,
                                                                 options,
                                                                 false);
}

}  // namespace imagespan
