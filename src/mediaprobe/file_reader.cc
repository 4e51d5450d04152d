#include "mediaprobe/file_reader.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/stat.h>
#    include <sys/types.h>
#    include <unistd.h>
#endif

namespace mediaprobe {

FileReader::FileReader() noexcept = default;


FileReader::~FileReader() noexcept
{
    close();
}


FileReader::FileReader(FileReader&& other) noexcept
{
    *this = std::move(other);
}


FileReader&
FileReader::operator=(FileReader&& other) noexcept
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

    size_       = other.size_;
    other.size_ = 0;
    return *this;
}


FileReaderStatus
FileReader::open(const char* path) noexcept
{
    close();

    if (!path || !*path) {
        return FileReaderStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                             OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return FileReaderStatus::OpenFailed;
    }

    LARGE_INTEGER sz;
    if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
        ::CloseHandle(h);
        return FileReaderStatus::StatFailed;
    }

    file_handle_ = static_cast<void*>(h);
    size_        = static_cast<uint64_t>(sz.QuadPart);
    return FileReaderStatus::Ok;
#else
    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return FileReaderStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        ::close(fd);
        return FileReaderStatus::StatFailed;
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return FileReaderStatus::StatFailed;
    }

    fd_   = fd;
    size_ = static_cast<uint64_t>(st.st_size);
    return FileReaderStatus::Ok;
#endif
}


void
FileReader::close() noexcept
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
    size_ = 0;
}


bool
FileReader::is_open() const noexcept
{
#if defined(_WIN32)
    return file_handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


uint64_t
FileReader::size() const noexcept
{
    return size_;
}


FileReaderStatus
FileReader::read_at(uint64_t offset, std::span<std::byte> out,
                    size_t* bytes_read) const noexcept
{
    if (bytes_read) {
        *bytes_read = 0;
    }
    if (!is_open()) {
        return FileReaderStatus::ReadFailed;
    }
    if (offset > size_) {
        return FileReaderStatus::OutOfRange;
    }

    size_t total = 0;
    while (total < out.size()) {
        const uint64_t pos = offset + total;
        if (pos >= size_) {
            break;
        }
#if defined(_WIN32)
        const size_t want = out.size() - total;
        const DWORD chunk = static_cast<DWORD>(
            want < 0x40000000U ? want : 0x40000000U);
        OVERLAPPED ov {};
        ov.Offset     = static_cast<DWORD>(pos & 0xFFFFFFFFu);
        ov.OffsetHigh = static_cast<DWORD>((pos >> 32) & 0xFFFFFFFFu);
        DWORD got     = 0;
        if (!::ReadFile(static_cast<HANDLE>(file_handle_), out.data() + total,
                        chunk, &got, &ov)) {
            return FileReaderStatus::ReadFailed;
        }
        if (got == 0U) {
            break;
        }
        total += static_cast<size_t>(got);
#else
        const ssize_t got = ::pread(fd_, out.data() + total, out.size() - total,
                                    static_cast<off_t>(pos));
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return FileReaderStatus::ReadFailed;
        }
        if (got == 0) {
            break;
        }
        total += static_cast<size_t>(got);
#endif
    }

    if (bytes_read) {
        *bytes_read = total;
    }
    return FileReaderStatus::Ok;
}


FileReaderStatus
stat_file_size(const char* path, uint64_t* size) noexcept
{
    if (!size) {
        return FileReaderStatus::StatFailed;
    }
    *size = 0;
    if (!path || !*path) {
        return FileReaderStatus::OpenFailed;
    }

#if defined(_WIN32)
    WIN32_FILE_ATTRIBUTE_DATA data;
    if (!::GetFileAttributesExA(path, GetFileExInfoStandard, &data)) {
        return FileReaderStatus::StatFailed;
    }
    if ((data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0U) {
        return FileReaderStatus::StatFailed;
    }
    *size = (static_cast<uint64_t>(data.nFileSizeHigh) << 32)
            | static_cast<uint64_t>(data.nFileSizeLow);
    return FileReaderStatus::Ok;
#else
    struct stat st {};
    if (::stat(path, &st) != 0 || st.st_size < 0 || !S_ISREG(st.st_mode)) {
        return FileReaderStatus::StatFailed;
    }
    *size = static_cast<uint64_t>(st.st_size);
    return FileReaderStatus::Ok;
#endif
}

}  // namespace mediaprobe
