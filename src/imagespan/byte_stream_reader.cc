#include "imagespan/byte_stream_reader.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace imagespan {
namespace {

#if defined(_WIN32)
    static int64_t filetime_to_unix_seconds(const FILETIME& ft) noexcept
    {
        ULARGE_INTEGER v;
        v.LowPart  = ft.dwLowDateTime;
        v.HighPart = ft.dwHighDateTime;
        // 100ns ticks since 1601-01-01.
        static constexpr uint64_t kEpochDelta = 116444736000000000ULL;
        if (v.QuadPart < kEpochDelta) {
            return 0;
        }
        return static_cast<int64_t>((v.QuadPart - kEpochDelta) / 10000000ULL);
    }

    static bool read_at(HANDLE h, uint64_t offset, std::byte* dst,
                        uint64_t want, uint64_t* got) noexcept
    {
        *got = 0;
        while (*got < want) {
            const uint64_t remaining = want - *got;
            const DWORD n            = (remaining > 0x40000000ULL)
                                           ? 0x40000000U
                                           : static_cast<DWORD>(remaining);
            OVERLAPPED ov {};
            const uint64_t at = offset + *got;
            ov.Offset         = static_cast<DWORD>(at & 0xFFFFFFFFULL);
            ov.OffsetHigh     = static_cast<DWORD>((at >> 32) & 0xFFFFFFFFULL);
            DWORD done        = 0;
            if (!::ReadFile(h, dst + *got, n, &done, &ov)) {
                if (::GetLastError() == ERROR_HANDLE_EOF) {
                    return true;
                }
                return false;
            }
            if (done == 0U) {
                return true;
            }
            *got += static_cast<uint64_t>(done);
        }
        return true;
    }
#else
    static bool read_sequential(int fd, std::byte* dst, uint64_t want,
                                uint64_t* got) noexcept
    {
        *got = 0;
        while (*got < want) {
            const uint64_t remaining = want - *got;
            const size_t n = (remaining > static_cast<uint64_t>(1U << 30))
                                 ? static_cast<size_t>(1U << 30)
                                 : static_cast<size_t>(remaining);
            const ssize_t r = ::read(fd, dst + *got, n);
            if (r < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            if (r == 0) {
                return true;
            }
            *got += static_cast<uint64_t>(r);
        }
        return true;
    }

    static bool read_at(int fd, uint64_t offset, std::byte* dst,
                        uint64_t want, uint64_t* got) noexcept
    {
        *got = 0;
        while (*got < want) {
            const uint64_t remaining = want - *got;
            const size_t n = (remaining > static_cast<uint64_t>(1U << 30))
                                 ? static_cast<size_t>(1U << 30)
                                 : static_cast<size_t>(remaining);
            const ssize_t r = ::pread(fd, dst + *got, n,
                                      static_cast<off_t>(offset + *got));
            if (r < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            if (r == 0) {
                return true;
            }
            *got += static_cast<uint64_t>(r);
        }
        return true;
    }
#endif

}  // namespace

ByteStreamReader::ByteStreamReader() noexcept = default;


ByteStreamReader::~ByteStreamReader() noexcept
{
    close();
}


ByteStreamReader::ByteStreamReader(ByteStreamReader&& other) noexcept
{
    *this = std::move(other);
}


ByteStreamReader&
ByteStreamReader::operator=(ByteStreamReader&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

#if defined(_WIN32)
    file_handle_       = other.file_handle_;
    other.file_handle_ = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif

    size_                        = other.size_;
    offset_                      = other.offset_;
    modified_unix_seconds_       = other.modified_unix_seconds_;
    other.size_                  = 0;
    other.offset_                = 0;
    other.modified_unix_seconds_ = 0;
    return *this;
}


ByteStreamStatus
ByteStreamReader::open(const char* path) noexcept
{
    close();

    if (!path || !*path) {
        return ByteStreamStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE h = ::CreateFileA(path, GENERIC_READ,
                             FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                             OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return ByteStreamStatus::OpenFailed;
    }

    LARGE_INTEGER sz;
    FILETIME mtime {};
    if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0
        || !::GetFileTime(h, nullptr, nullptr, &mtime)) {
        ::CloseHandle(h);
        return ByteStreamStatus::StatFailed;
    }

    file_handle_           = static_cast<void*>(h);
    size_                  = static_cast<uint64_t>(sz.QuadPart);
    modified_unix_seconds_ = filetime_to_unix_seconds(mtime);
    offset_                = 0;
    return ByteStreamStatus::Ok;
#else
    int fd = -1;
    do {
        fd = ::open(path, O_RDONLY);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return ByteStreamStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        ::close(fd);
        return ByteStreamStatus::StatFailed;
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        return ByteStreamStatus::OpenFailed;
    }

    fd_                    = fd;
    size_                  = static_cast<uint64_t>(st.st_size);
    modified_unix_seconds_ = static_cast<int64_t>(st.st_mtime);
    offset_                = 0;
    return ByteStreamStatus::Ok;
#endif
}


void
ByteStreamReader::close() noexcept
{
#if defined(_WIN32)
    if (file_handle_) {
        ::CloseHandle(static_cast<HANDLE>(file_handle_));
    }
    file_handle_ = nullptr;
#else
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif

    size_                  = 0;
    offset_                = 0;
    modified_unix_seconds_ = 0;
}


ByteStreamStatus
ByteStreamReader::next_chunk(std::span<std::byte> buffer,
                             uint64_t* read) noexcept
{
    if (!read) {
        return ByteStreamStatus::ReadFailed;
    }
    *read = 0;
    if (!is_open()) {
        return ByteStreamStatus::ReadFailed;
    }
    if (buffer.empty()) {
        return ByteStreamStatus::Ok;
    }

    uint64_t got = 0;
#if defined(_WIN32)
    const bool ok = read_at(static_cast<HANDLE>(file_handle_), offset_,
                            buffer.data(), buffer.size(), &got);
#else
    const bool ok = read_sequential(fd_, buffer.data(), buffer.size(), &got);
#endif
    if (!ok) {
        return ByteStreamStatus::ReadFailed;
    }
    offset_ += got;
    *read = got;
    return ByteStreamStatus::Ok;
}


ByteStreamStatus
ByteStreamReader::read_slice(uint64_t offset, std::span<std::byte> out,
                             uint64_t* read) noexcept
{
    if (!read) {
        return ByteStreamStatus::ReadFailed;
    }
    *read = 0;
    if (!is_open()) {
        return ByteStreamStatus::ReadFailed;
    }
    if (out.empty()) {
        return ByteStreamStatus::Ok;
    }
    if (offset > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
        || out.size() > static_cast<uint64_t>(
               std::numeric_limits<int64_t>::max())
                            - offset) {
        return ByteStreamStatus::SeekFailed;
    }

    uint64_t got = 0;
#if defined(_WIN32)
    const bool ok = read_at(static_cast<HANDLE>(file_handle_), offset,
                            out.data(), out.size(), &got);
#else
    const bool ok = read_at(fd_, offset, out.data(), out.size(), &got);
#endif
    if (!ok) {
        return ByteStreamStatus::ReadFailed;
    }
    *read = got;
    return ByteStreamStatus::Ok;
}


bool
ByteStreamReader::is_open() const noexcept
{
#if defined(_WIN32)
    return file_handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


uint64_t
ByteStreamReader::size() const noexcept
{
    return size_;
}


uint64_t
ByteStreamReader::offset() const noexcept
{
    return offset_;
}


FileSignature
ByteStreamReader::signature() const noexcept
{
    FileSignature sig;
    sig.size_bytes            = size_;
    sig.modified_unix_seconds = modified_unix_seconds_;
    return sig;
}


ByteStreamStatus
read_file_signature(const char* path, FileSignature* out) noexcept
{
    if (!out) {
        return ByteStreamStatus::StatFailed;
    }
    ByteStreamReader reader;
    const ByteStreamStatus st = reader.open(path);
    if (st != ByteStreamStatus::Ok) {
        return st;
    }
    *out = reader.signature();
    return ByteStreamStatus::Ok;
}

}  // namespace imagespan
