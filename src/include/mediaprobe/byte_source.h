#pragma once

#include "mediaprobe/file_reader.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file byte_source.h
 * \brief Asynchronous, cancellable byte sources read through an \ref EventLoop.
 */

namespace mediaprobe {

class EventLoop;

enum class ReadStatus : uint8_t {
    Ok,
    Failed,
};

/// Completion callback. \p bytes is valid only for the duration of the call.
using ReadCallback
    = std::function<void(ReadStatus status, std::span<const std::byte> bytes)>;

/**
 * \brief A byte-addressable input of known length.
 *
 * Contract:
 * - \ref read_async never invokes its callback synchronously.
 * - At most one read is outstanding; the caller waits for completion before
 *   issuing the next one.
 * - After \ref cancel, the callback of an outstanding read never runs.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Display name (file name without directories).
    virtual std::string_view name() const noexcept = 0;
    virtual uint64_t size() const noexcept         = 0;
    /// False when the input could not be opened; every read would fail.
    virtual bool ready() const noexcept { return true; }

    virtual void read_async(uint64_t offset, uint32_t length,
                            ReadCallback done)
        = 0;
    virtual void cancel() noexcept = 0;
};

/**
 * \brief Shared implementation for sources whose reads complete on the loop.
 *
 * A read is posted to the loop as a task; the task reads into a single
 * window buffer owned by the source, so at most one window is resident.
 */
class LoopByteSource : public ByteSource {
public:
    ~LoopByteSource() override;

    void read_async(uint64_t offset, uint32_t length,
                    ReadCallback done) final;
    void cancel() noexcept final;

    bool read_pending() const noexcept;

protected:
    explicit LoopByteSource(EventLoop& loop);

    /// Fills \p out from \p offset; returns false on an I/O error.
    virtual bool read_window(uint64_t offset, std::span<std::byte> out,
                             size_t* got)
        = 0;

private:
    void complete(uint64_t offset, uint32_t length, ReadCallback done);

    EventLoop* loop_ = nullptr;
    std::shared_ptr<uint64_t> generation_;
    std::vector<std::byte> window_;
    bool pending_ = false;
};

/// Local file read with positional reads.
class FileByteSource final : public LoopByteSource {
public:
    FileByteSource(EventLoop& loop, std::string path);

    std::string_view name() const noexcept override;
    /// Size on disk, also known for a file that exists but cannot be opened.
    uint64_t size() const noexcept override;
    bool ready() const noexcept override;

    const std::string& path() const noexcept;
    /// Result of opening the file; reads fail when this is not Ok.
    FileReaderStatus open_status() const noexcept;

protected:
    bool read_window(uint64_t offset, std::span<std::byte> out,
                     size_t* got) override;

private:
    std::string path_;
    std::string name_;
    FileReader reader_;
    FileReaderStatus open_status_ = FileReaderStatus::OpenFailed;
    uint64_t size_                = 0;
};

/// In-memory bytes (bindings, tests).
class MemoryByteSource final : public LoopByteSource {
public:
    MemoryByteSource(EventLoop& loop, std::string name,
                     std::vector<std::byte> bytes);

    std::string_view name() const noexcept override;
    uint64_t size() const noexcept override;

protected:
    bool read_window(uint64_t offset, std::span<std::byte> out,
                     size_t* got) override;

private:
    std::string name_;
    std::vector<std::byte> bytes_;
};

/// Returns the last path component of \p path.
std::string_view
path_basename(std::string_view path) noexcept;

}  // namespace mediaprobe
