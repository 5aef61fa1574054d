#pragma once

#include "imagespan/media_type.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file json_structure_tracker.h
 * \brief Non-recursive JSON structure tracker with policy-driven string capture.
 *
 * The tracker is not a validating parser. It follows object/array nesting
 * and key/value positions closely enough for a policy to recognize fields,
 * while never buffering more than a small, fixed number of string bytes.
 */

namespace imagespan {

/// Max bytes buffered for a key or small value string.
inline constexpr uint32_t kJsonSmallStringBytes = 512;

/// Sentinel for "no element/item index".
inline constexpr uint32_t kJsonNoIndex = 0xFFFFFFFFU;

enum class JsonContainerKind : uint8_t {
    Object,
    Array,
};

enum class JsonObjectState : uint8_t {
    ExpectKeyOrEnd,
    ExpectColon,
    ExpectValue,
    ExpectCommaOrEnd,
};

enum class JsonArrayState : uint8_t {
    ExpectValueOrEnd,
    ExpectCommaOrEnd,
};

/// How the tracker treats the bytes of one string token.
enum class JsonStringClass : uint8_t {
    /// Skipped; only escapes and the closing quote are recognized.
    Ignored,
    /// Object key; buffered and mapped to a policy key id.
    Key,
    /// Buffered value (role, type, media type, ...).
    SmallValue,
    /// Length-counted value that is never buffered (base64 payloads).
    LargeValue,
};

/// Location of a LargeValue string kept in a frame until the frame closes.
struct JsonLargeString final {
    uint64_t content_offset = 0;
    uint64_t end_offset     = 0;
    uint64_t length         = 0;
    bool present            = false;
};

/**
 * \brief One container on the explicit parse stack.
 *
 * `flags`, `item_index`, `text` and `payload` belong to the policy; the
 * tracker only initializes them.
 */
struct JsonFrame final {
    JsonContainerKind kind       = JsonContainerKind::Object;
    JsonObjectState object_state = JsonObjectState::ExpectKeyOrEnd;
    JsonArrayState array_state   = JsonArrayState::ExpectValueOrEnd;

    /// Policy key id of the current key (objects; 0 = none or unknown).
    uint16_t key = 0;
    /// Policy key id under which this container is the value (0 = none).
    uint16_t opened_under_key = 0;
    /// Position within the parent array, or \ref kJsonNoIndex.
    uint32_t element_index = kJsonNoIndex;
    /// Arrays: number of elements started so far.
    uint32_t element_count = 0;

    uint32_t flags      = 0;
    uint32_t item_index = kJsonNoIndex;
    InlineText text;
    JsonLargeString payload;
};

/// A completed string token handed to \ref JsonScanPolicy::on_value.
struct JsonStringToken final {
    JsonStringClass string_class = JsonStringClass::Ignored;
    /// Offset of the first byte after the opening quote.
    uint64_t content_offset = 0;
    /// Offset of the closing quote.
    uint64_t end_offset = 0;
    /// Raw byte count between the quotes (escapes not decoded).
    uint64_t length = 0;
    /// Buffered raw text (Key/SmallValue only, capped).
    std::string_view text;
    bool truncated = false;
    /// LargeValue contained a backslash.
    bool has_escape = false;
    /// LargeValue contained ASCII whitespace.
    bool has_whitespace = false;
};

/**
 * \brief Dialect rules plugged into \ref JsonStructureTracker.
 *
 * `depth` is the 1-based stack depth of the frame in question.
 */
class JsonScanPolicy {
public:
    virtual ~JsonScanPolicy() = default;

    /// Maps key text to a small id; 0 marks a key the policy ignores.
    virtual uint16_t key_id(std::string_view key) const noexcept = 0;

    /// Classifies a value string about to start inside \p container.
    virtual JsonStringClass
    classify_value(const JsonFrame& container) const noexcept = 0;

    /// Called for every non-ignored value string while \p container still
    /// holds the key the value belongs to.
    virtual void on_value(JsonFrame& container, const JsonStringToken& token,
                          uint32_t depth) noexcept = 0;

    /// Called after \p child is pushed; \p parent still holds its key.
    virtual void on_open(JsonFrame& child, JsonFrame* parent,
                         uint32_t depth) noexcept;

    /// Called before \p frame is popped.
    virtual void on_close(JsonFrame& frame, JsonFrame* parent,
                          uint32_t depth) noexcept;

    /// Line-delimited mode: a line ended (newline byte or end of input).
    virtual void on_line_end(uint64_t line_index) noexcept;

    /// Lets the policy end the scan early (match cap reached).
    virtual bool stop_requested() const noexcept;
};

/// Resource limits for \ref JsonStructureTracker.
struct JsonTrackerLimits final {
    /// Max frames kept on the stack (0 = unlimited). Deeper containers are
    /// only counted so brackets stay balanced.
    uint32_t max_depth = 0;
};

struct JsonTrackerOptions final {
    /// Reset all state at every `\n` byte (JSONL).
    bool line_delimited = false;
    JsonTrackerLimits limits;
};

/**
 * \brief Streaming JSON structure tracker with an explicit frame stack.
 *
 * Feed bytes in file order with their absolute offset. Malformed input is
 * tolerated: pops on an empty stack are ignored and unexpected bytes are
 * skipped.
 */
class JsonStructureTracker final {
public:
    JsonStructureTracker(JsonScanPolicy* policy,
                         const JsonTrackerOptions& options) noexcept;

    /// Processes \p bytes, whose first byte sits at \p base_offset.
    void feed(std::span<const std::byte> bytes, uint64_t base_offset) noexcept;

    /// Signals end of input (flushes an unterminated last line).
    void finish() noexcept;

    /// Drops all parse state; the line counter is kept.
    void reset() noexcept;

    /// Number of `\n` bytes consumed so far.
    uint64_t line_index() const noexcept { return line_index_; }
    uint32_t depth() const noexcept
    {
        return static_cast<uint32_t>(stack_.size());
    }
    bool stopped() const noexcept { return stopped_; }

private:
    enum class StringRole : uint8_t {
        None,
        Key,
        Value,
    };

    void begin_string(uint64_t quote_offset) noexcept;
    void string_byte(uint8_t c) noexcept;
    void end_string(uint64_t quote_offset) noexcept;
    void open_container(JsonContainerKind kind) noexcept;
    void close_container() noexcept;
    void consume_value_slot() noexcept;
    void end_line() noexcept;
    void check_stop() noexcept;

    JsonScanPolicy* policy_ = nullptr;
    JsonTrackerOptions options_;

    std::vector<JsonFrame> stack_;
    uint64_t overflow_depth_ = 0;

    bool in_string_                 = false;
    bool escaped_                   = false;
    StringRole string_role_         = StringRole::None;
    JsonStringClass string_class_   = JsonStringClass::Ignored;
    uint64_t string_content_offset_ = 0;
    uint64_t string_length_         = 0;
    bool string_has_escape_         = false;
    bool string_has_whitespace_     = false;
    std::array<char, kJsonSmallStringBytes> small_ {};
    uint32_t small_size_  = 0;
    bool small_truncated_ = false;

    uint64_t line_index_ = 0;
    bool line_dirty_     = false;
    bool stopped_        = false;
};

}  // namespace imagespan
