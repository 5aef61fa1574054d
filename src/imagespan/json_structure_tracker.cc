#include "imagespan/json_structure_tracker.h"

namespace imagespan {
namespace {

    static bool is_json_space(uint8_t c) noexcept
    {
        return c == 0x20U || c == 0x09U || c == 0x0DU || c == 0x0AU;
    }


    // Marks the value slot of `frame` as consumed.
    static void consume_slot(JsonFrame* frame) noexcept
    {
        if (frame->kind == JsonContainerKind::Object) {
            if (frame->object_state == JsonObjectState::ExpectValue) {
                frame->object_state = JsonObjectState::ExpectCommaOrEnd;
                frame->key          = 0;
            }
            return;
        }
        if (frame->array_state == JsonArrayState::ExpectValueOrEnd) {
            frame->array_state = JsonArrayState::ExpectCommaOrEnd;
            frame->element_count += 1U;
        }
    }


    static bool expects_value(const JsonFrame& frame) noexcept
    {
        if (frame.kind == JsonContainerKind::Object) {
            return frame.object_state == JsonObjectState::ExpectValue;
        }
        return frame.array_state == JsonArrayState::ExpectValueOrEnd;
    }

}  // namespace

void
JsonScanPolicy::on_open(JsonFrame&, JsonFrame*, uint32_t) noexcept
{
}


void
JsonScanPolicy::on_close(JsonFrame&, JsonFrame*, uint32_t) noexcept
{
}


void
JsonScanPolicy::on_line_end(uint64_t) noexcept
{
}


bool
JsonScanPolicy::stop_requested() const noexcept
{
    return false;
}


JsonStructureTracker::JsonStructureTracker(
    JsonScanPolicy* policy, const JsonTrackerOptions& options) noexcept
    : policy_(policy)
    , options_(options)
{
}


void
JsonStructureTracker::reset() noexcept
{
    stack_.clear();
    overflow_depth_        = 0;
    in_string_             = false;
    escaped_               = false;
    string_role_           = StringRole::None;
    string_class_          = JsonStringClass::Ignored;
    string_content_offset_ = 0;
    string_length_         = 0;
    string_has_escape_     = false;
    string_has_whitespace_ = false;
    small_size_            = 0;
    small_truncated_       = false;
}


void
JsonStructureTracker::check_stop() noexcept
{
    if (policy_ && policy_->stop_requested()) {
        stopped_ = true;
    }
}


void
JsonStructureTracker::begin_string(uint64_t quote_offset) noexcept
{
    in_string_             = true;
    escaped_               = false;
    string_role_           = StringRole::None;
    string_class_          = JsonStringClass::Ignored;
    string_content_offset_ = quote_offset + 1U;
    string_length_         = 0;
    string_has_escape_     = false;
    string_has_whitespace_ = false;
    small_size_            = 0;
    small_truncated_       = false;

    if (overflow_depth_ != 0U || stack_.empty() || !policy_) {
        return;
    }

    const JsonFrame& top = stack_.back();
    if (top.kind == JsonContainerKind::Object
        && top.object_state == JsonObjectState::ExpectKeyOrEnd) {
        string_role_  = StringRole::Key;
        string_class_ = JsonStringClass::Key;
        return;
    }
    if (!expects_value(top)) {
        // Stray string (e.g. a second value without a comma); skip it.
        return;
    }

    string_role_               = StringRole::Value;
    const JsonStringClass kind = policy_->classify_value(top);
    string_class_ = (kind == JsonStringClass::Key) ? JsonStringClass::Ignored
                                                   : kind;
}


void
JsonStructureTracker::string_byte(uint8_t c) noexcept
{
    string_length_ += 1U;
    switch (string_class_) {
    case JsonStringClass::Key:
    case JsonStringClass::SmallValue:
        if (small_size_ < kJsonSmallStringBytes) {
            small_[small_size_] = static_cast<char>(c);
            small_size_ += 1U;
        } else {
            small_truncated_ = true;
        }
        break;
    case JsonStringClass::LargeValue:
        if (is_json_space(c)) {
            string_has_whitespace_ = true;
        }
        break;
    case JsonStringClass::Ignored: break;
    }
}


void
JsonStructureTracker::end_string(uint64_t quote_offset) noexcept
{
    in_string_ = false;
    escaped_   = false;

    const StringRole role = string_role_;
    string_role_          = StringRole::None;
    if (role == StringRole::None || stack_.empty()) {
        return;
    }

    JsonFrame& top = stack_.back();
    if (role == StringRole::Key) {
        if (top.kind == JsonContainerKind::Object
            && top.object_state == JsonObjectState::ExpectKeyOrEnd) {
            top.key = small_truncated_
                          ? 0
                          : policy_->key_id(
                                std::string_view(small_.data(), small_size_));
            top.object_state = JsonObjectState::ExpectColon;
        }
        return;
    }

    if (string_class_ != JsonStringClass::Ignored) {
        JsonStringToken token;
        token.string_class   = string_class_;
        token.content_offset = string_content_offset_;
        token.end_offset     = quote_offset;
        token.length         = string_length_;
        if (string_class_ == JsonStringClass::SmallValue) {
            token.text = std::string_view(small_.data(), small_size_);
        }
        token.truncated      = small_truncated_;
        token.has_escape     = string_has_escape_;
        token.has_whitespace = string_has_whitespace_;
        policy_->on_value(top, token,
                          static_cast<uint32_t>(stack_.size()));
    }
    consume_slot(&stack_.back());
    check_stop();
}


void
JsonStructureTracker::open_container(JsonContainerKind kind) noexcept
{
    if (overflow_depth_ != 0U) {
        overflow_depth_ += 1U;
        return;
    }
    if (options_.limits.max_depth != 0U
        && stack_.size() >= options_.limits.max_depth) {
        if (!stack_.empty()) {
            consume_slot(&stack_.back());
        }
        overflow_depth_ = 1U;
        return;
    }

    JsonFrame child;
    child.kind = kind;
    if (!stack_.empty()) {
        const JsonFrame& parent = stack_.back();
        if (parent.kind == JsonContainerKind::Object
            && parent.object_state == JsonObjectState::ExpectValue) {
            child.opened_under_key = parent.key;
        } else if (parent.kind == JsonContainerKind::Array
                   && parent.array_state
                          == JsonArrayState::ExpectValueOrEnd) {
            child.element_index = parent.element_count;
        }
    }

    stack_.push_back(child);
    const size_t n     = stack_.size();
    JsonFrame* parent  = (n >= 2U) ? &stack_[n - 2U] : nullptr;
    JsonFrame* current = &stack_[n - 1U];
    if (policy_) {
        policy_->on_open(*current, parent, static_cast<uint32_t>(n));
    }
    if (parent) {
        consume_slot(parent);
    }
}


void
JsonStructureTracker::close_container() noexcept
{
    if (overflow_depth_ != 0U) {
        overflow_depth_ -= 1U;
        return;
    }
    if (stack_.empty()) {
        return;
    }

    const size_t n    = stack_.size();
    JsonFrame* parent = (n >= 2U) ? &stack_[n - 2U] : nullptr;
    if (policy_) {
        policy_->on_close(stack_[n - 1U], parent, static_cast<uint32_t>(n));
    }
    stack_.pop_back();
    check_stop();
}


void
JsonStructureTracker::consume_value_slot() noexcept
{
    if (overflow_depth_ != 0U || stack_.empty()) {
        return;
    }
    consume_slot(&stack_.back());
}


void
JsonStructureTracker::end_line() noexcept
{
    if (policy_) {
        policy_->on_line_end(line_index_);
    }
    reset();
    line_index_ += 1U;
    line_dirty_ = false;
    check_stop();
}


void
JsonStructureTracker::feed(std::span<const std::byte> bytes,
                           uint64_t base_offset) noexcept
{
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (stopped_) {
            return;
        }
        const uint8_t c    = static_cast<uint8_t>(bytes[i]);
        const uint64_t pos = base_offset + static_cast<uint64_t>(i);

        if (c == 0x0AU) {
            if (options_.line_delimited) {
                end_line();
                continue;
            }
            line_index_ += 1U;
            if (in_string_) {
                escaped_ = false;
                string_byte(c);
            }
            continue;
        }
        line_dirty_ = true;

        if (in_string_) {
            if (escaped_) {
                escaped_ = false;
                string_byte(c);
                continue;
            }
            if (c == 0x5CU) {  // '\\'
                escaped_           = true;
                string_has_escape_ = true;
                string_byte(c);
                continue;
            }
            if (c == 0x22U) {  // '"'
                end_string(pos);
                continue;
            }
            string_byte(c);
            continue;
        }

        if (overflow_depth_ != 0U) {
            if (c == 0x22U) {
                begin_string(pos);
            } else if (c == 0x7BU || c == 0x5BU) {
                open_container(c == 0x7BU ? JsonContainerKind::Object
                                          : JsonContainerKind::Array);
            } else if (c == 0x7DU || c == 0x5DU) {
                close_container();
            }
            continue;
        }

        switch (c) {
        case 0x20U:
        case 0x09U:
        case 0x0DU: break;
        case 0x22U: begin_string(pos); break;
        case 0x7BU: open_container(JsonContainerKind::Object); break;
        case 0x5BU: open_container(JsonContainerKind::Array); break;
        case 0x7DU:
        case 0x5DU: close_container(); break;
        case 0x3AU:  // ':'
            if (!stack_.empty()) {
                JsonFrame& top = stack_.back();
                if (top.kind == JsonContainerKind::Object
                    && top.object_state == JsonObjectState::ExpectColon) {
                    top.object_state = JsonObjectState::ExpectValue;
                }
            }
            break;
        case 0x2CU:  // ','
            if (!stack_.empty()) {
                JsonFrame& top = stack_.back();
                if (top.kind == JsonContainerKind::Object) {
                    if (top.object_state == JsonObjectState::ExpectCommaOrEnd) {
                        top.object_state = JsonObjectState::ExpectKeyOrEnd;
                        top.key          = 0;
                    }
                } else if (top.array_state
                           == JsonArrayState::ExpectCommaOrEnd) {
                    top.array_state = JsonArrayState::ExpectValueOrEnd;
                }
            }
            break;
        default:
            // Numbers, true/false/null or garbage: fills the pending slot.
            consume_value_slot();
            break;
        }
    }
}


void
JsonStructureTracker::finish() noexcept
{
    if (stopped_) {
        return;
    }
    if (options_.line_delimited && line_dirty_) {
        if (policy_) {
            policy_->on_line_end(line_index_);
        }
        line_dirty_ = false;
        check_stop();
    }
}

}  // namespace imagespan
