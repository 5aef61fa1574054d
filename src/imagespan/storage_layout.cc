#include "imagespan/storage_layout.h"

#include "imagespan/byte_stream_reader.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <map>
#include <system_error>
#include <utility>

namespace imagespan {
namespace {

    namespace fs = std::filesystem;

    static bool is_hidden(const fs::path& p) noexcept
    {
        const std::string name = p.filename().string();
        return !name.empty() && name[0] == '.';
    }


    static bool has_json_extension(const fs::path& p) noexcept
    {
        const std::string ext = p.extension().string();
        if (ext.size() != 5U) {
            return false;
        }
        static constexpr char kJson[] = ".json";
        for (size_t i = 0; i < 5U; ++i) {
            char c = ext[i];
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            if (c != kJson[i]) {
                return false;
            }
        }
        return true;
    }


    static bool existing_directory(const fs::path& p) noexcept
    {
        std::error_code ec;
        return fs::is_directory(p, ec) && !ec;
    }


    static bool regular_file_entry(const fs::directory_entry& entry) noexcept
    {
        std::error_code ec;
        return entry.is_regular_file(ec) && !ec;
    }


    static bool by_file_name(const fs::path& a, const fs::path& b) noexcept
    {
        return a.filename().string() < b.filename().string();
    }


    // Lists `.json` files directly inside `dir`, sorted by name.
    static void list_part_dir(const fs::path& dir,
                              std::vector<fs::path>* out) noexcept
    {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            return;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            const fs::path& p = it->path();
            if (is_hidden(p) || !has_json_extension(p)
                || !regular_file_entry(*it)) {
                continue;
            }
            out->push_back(p);
        }
        std::sort(out->begin(), out->end(), by_file_name);
    }


    static void append_message(const std::string& message_id,
                               const std::vector<fs::path>& files,
                               StorageLayout* out)
    {
        for (const fs::path& f : files) {
            PartFileRef ref;
            ref.message_id = message_id;
            ref.path       = f.string();
            out->part_files.push_back(std::move(ref));
        }
    }


    static StorageLayoutStatus
    resolve_v2(const fs::path& part_root,
               std::span<const std::string> message_ids,
               const ScanCancel& cancel, StorageLayout* out) noexcept
    {
        std::vector<std::string> ids(message_ids.begin(), message_ids.end());
        if (ids.empty()) {
            std::error_code ec;
            fs::directory_iterator it(part_root, ec);
            if (ec) {
                return StorageLayoutStatus::IoError;
            }
            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) {
                    break;
                }
                if (!is_hidden(it->path()) && existing_directory(it->path())) {
                    ids.push_back(it->path().filename().string());
                }
            }
            std::sort(ids.begin(), ids.end());
        }

        for (const std::string& id : ids) {
            if (cancel.requested()) {
                return StorageLayoutStatus::Cancelled;
            }
            if (id.empty()) {
                continue;
            }
            const fs::path dir = part_root / id;
            if (!existing_directory(dir)) {
                continue;
            }
            std::vector<fs::path> files;
            list_part_dir(dir, &files);
            append_message(id, files, out);
        }
        return StorageLayoutStatus::Ok;
    }


    static StorageLayoutStatus
    resolve_legacy(const fs::path& part_root,
                   std::span<const std::string> message_ids,
                   const ScanCancel& cancel, StorageLayout* out) noexcept
    {
        std::error_code ec;
        fs::recursive_directory_iterator it(part_root, ec);
        if (ec) {
            return StorageLayoutStatus::IoError;
        }

        std::map<std::string, std::vector<fs::path>> by_message;
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            if (cancel.requested()) {
                return StorageLayoutStatus::Cancelled;
            }
            const fs::path& p = it->path();
            if (is_hidden(p)) {
                if (existing_directory(p)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!has_json_extension(p) || !regular_file_entry(*it)) {
                continue;
            }
            std::string parent = p.parent_path().filename().string();
            if (parent.empty()) {
                continue;
            }
            if (!message_ids.empty()
                && std::find(message_ids.begin(), message_ids.end(), parent)
                       == message_ids.end()) {
                continue;
            }
            by_message[std::move(parent)].push_back(p);
        }

        for (auto& [id, files] : by_message) {
            std::sort(files.begin(), files.end(), by_file_name);
            append_message(id, files, out);
        }
        return StorageLayoutStatus::Ok;
    }

}  // namespace

std::string
storage_root_for_session(std::string_view session_path)
{
    const fs::path p(session_path);
    return p.parent_path().parent_path().parent_path().string();
}


StorageSchema
read_storage_schema(std::string_view storage_root) noexcept
{
    const std::string path = (fs::path(storage_root) / "migration").string();
    ByteStreamReader reader;
    if (reader.open(path.c_str()) != ByteStreamStatus::Ok) {
        return StorageSchema::Legacy;
    }
    std::array<std::byte, 64> buf {};
    uint64_t read = 0;
    if (reader.next_chunk(std::span<std::byte>(buf.data(), buf.size()), &read)
        != ByteStreamStatus::Ok) {
        return StorageSchema::Legacy;
    }

    size_t b = 0;
    size_t e = static_cast<size_t>(read);
    const auto space = [&](size_t i) {
        const uint8_t c = static_cast<uint8_t>(buf[i]);
        return c == 0x20U || c == 0x09U || c == 0x0AU || c == 0x0DU;
    };
    while (b < e && space(b)) {
        b += 1;
    }
    while (e > b && space(e - 1U)) {
        e -= 1;
    }
    if (e - b == 1U && static_cast<uint8_t>(buf[b]) == '2') {
        return StorageSchema::V2;
    }
    return StorageSchema::Legacy;
}


StorageLayoutStatus
PartDirectoryResolver::resolve(std::string_view session_path,
                               std::span<const std::string> message_ids,
                               const ScanCancel& cancel,
                               StorageLayout* out) noexcept
{
    if (!out) {
        return StorageLayoutStatus::IoError;
    }
    out->part_files.clear();
    out->schema = StorageSchema::Legacy;

    const std::string root = storage_root_for_session(session_path);
    if (root.empty() || !existing_directory(fs::path(root))) {
        return StorageLayoutStatus::NotFound;
    }
    if (cancel.requested()) {
        return StorageLayoutStatus::Cancelled;
    }

    out->schema              = read_storage_schema(root);
    const fs::path part_root = fs::path(root) / "part";
    if (!existing_directory(part_root)) {
        return StorageLayoutStatus::NotFound;
    }
    if (out->schema == StorageSchema::V2) {
        return resolve_v2(part_root, message_ids, cancel, out);
    }
    return resolve_legacy(part_root, message_ids, cancel, out);
}

}  // namespace imagespan
