#pragma once

#include "imagespan/scan_cancel.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file storage_layout.h
 * \brief Maps a session file to the per-message part files that hold its
 * content.
 */

namespace imagespan {

/// On-disk schema generation of a part-file store.
enum class StorageSchema : uint8_t {
    Legacy = 1,
    /// `part/<message_id>/*.json`.
    V2 = 2,
};

/// One part file and the message it belongs to.
struct PartFileRef final {
    std::string message_id;
    std::string path;
};

/// Resolved part files, grouped by message id in resolver order.
struct StorageLayout final {
    StorageSchema schema = StorageSchema::Legacy;
    std::vector<PartFileRef> part_files;
};

enum class StorageLayoutStatus : uint8_t {
    Ok,
    /// The storage root or its part directory does not exist.
    NotFound,
    IoError,
    Cancelled,
};

/**
 * \brief Abstract session-to-part-file mapping for delegated dialects.
 *
 * Implementations must not read part file contents; they only list files.
 */
class StorageLayoutResolver {
public:
    virtual ~StorageLayoutResolver() = default;

    /**
     * \brief Lists the part files of \p session_path.
     *
     * \p message_ids restricts the result to those messages; an empty list
     * means every message found. \p out is cleared first.
     */
    virtual StorageLayoutStatus
    resolve(std::string_view session_path,
            std::span<const std::string> message_ids, const ScanCancel& cancel,
            StorageLayout* out) noexcept
        = 0;
};

/**
 * \brief Resolver for the `storage/{session,part,migration}` directory
 * layout.
 *
 * Session files live at `<root>/session/<project>/<session>.json`, so the
 * storage root is three levels up. A `migration` file whose trimmed content
 * is `2` selects \ref StorageSchema::V2; anything else walks the whole
 * `part/` tree and groups files by their parent directory name. Only
 * `.json` files are listed, hidden entries are skipped, and files of one
 * message are sorted by name.
 */
class PartDirectoryResolver final : public StorageLayoutResolver {
public:
    StorageLayoutStatus resolve(std::string_view session_path,
                                std::span<const std::string> message_ids,
                                const ScanCancel& cancel,
                                StorageLayout* out) noexcept override;
};

/// Storage root for \p session_path (three directory levels up).
std::string
storage_root_for_session(std::string_view session_path);

/// Reads `<storage_root>/migration`; a missing or unreadable file is Legacy.
StorageSchema
read_storage_schema(std::string_view storage_root) noexcept;

}  // namespace imagespan
