#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file byte_stream_reader.h
 * \brief Sequential chunked file reader with positioned slice reads.
 */

namespace imagespan {

/// Status code for \ref ByteStreamReader operations.
enum class ByteStreamStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    ReadFailed,
    SeekFailed,
};

/// Size and modification time used by callers to key cached scan results.
struct FileSignature final {
    uint64_t size_bytes           = 0;
    int64_t modified_unix_seconds = 0;
};

/**
 * \brief Read-only file handle exposing a forward byte cursor.
 *
 * Scans call \ref next_chunk repeatedly; only payload decoding uses
 * \ref read_slice, which never moves the sequential cursor. The reader never
 * holds more than the caller-provided buffer in memory.
 */
class ByteStreamReader final {
public:
    ByteStreamReader() noexcept;
    ~ByteStreamReader() noexcept;

    ByteStreamReader(const ByteStreamReader&)            = delete;
    ByteStreamReader& operator=(const ByteStreamReader&) = delete;

    ByteStreamReader(ByteStreamReader&& other) noexcept;
    ByteStreamReader& operator=(ByteStreamReader&& other) noexcept;

    /// Opens \p path read-only and records its size.
    ByteStreamStatus open(const char* path) noexcept;

    /// Closes the file (idempotent).
    void close() noexcept;

    /**
     * \brief Reads the next sequential bytes into \p buffer.
     *
     * \p read receives the byte count; 0 with status Ok signals end of file.
     * Short reads from the OS are retried until the buffer is full or EOF.
     */
    ByteStreamStatus next_chunk(std::span<std::byte> buffer,
                                uint64_t* read) noexcept;

    /**
     * \brief Positioned read of up to `out.size()` bytes at \p offset.
     *
     * \p read may be smaller than `out.size()` only at end of file.
     */
    ByteStreamStatus read_slice(uint64_t offset, std::span<std::byte> out,
                                uint64_t* read) noexcept;

    bool is_open() const noexcept;
    /// Size observed at open time (the file may still be growing).
    uint64_t size() const noexcept;
    /// Absolute offset of the next byte \ref next_chunk returns.
    uint64_t offset() const noexcept;
    FileSignature signature() const noexcept;

private:
#if defined(_WIN32)
    void* file_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
    uint64_t size_                 = 0;
    uint64_t offset_               = 0;
    int64_t modified_unix_seconds_ = 0;
};

/// Stats \p path without keeping it open.
ByteStreamStatus
read_file_signature(const char* path, FileSignature* out) noexcept;

}  // namespace imagespan
