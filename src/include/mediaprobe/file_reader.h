#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file file_reader.h
 * \brief Read-only positional file reader.
 */

namespace mediaprobe {

/// Status code for \ref FileReader operations.
enum class FileReaderStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    ReadFailed,
    /// The requested range starts past the end of the file.
    OutOfRange,
};

/**
 * \brief Read-only file handle with positional reads.
 *
 * Unlike a whole-file mapping, the reader never touches bytes the caller does
 * not ask for, so peak memory is bounded by the caller's window buffer.
 */
class FileReader final {
public:
    FileReader() noexcept;
    ~FileReader() noexcept;

    FileReader(const FileReader&)            = delete;
    FileReader& operator=(const FileReader&) = delete;

    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;

    /// Opens \p path read-only and records its size.
    FileReaderStatus open(const char* path) noexcept;

    /// Closes the file (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;

    /**
     * \brief Reads up to `out.size()` bytes starting at \p offset.
     *
     * Short reads are retried until \p out is full or end of file is reached;
     * \p bytes_read receives the number of bytes stored.
     */
    FileReaderStatus read_at(uint64_t offset, std::span<std::byte> out,
                             size_t* bytes_read) const noexcept;

private:
#if defined(_WIN32)
    void* file_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
    uint64_t size_ = 0;
};

/**
 * \brief Reads the size of the regular file at \p path without opening it.
 *
 * Used to report the size of a file whose contents cannot be read.
 */
FileReaderStatus
stat_file_size(const char* path, uint64_t* size) noexcept;

}  // namespace mediaprobe
