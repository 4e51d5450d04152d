#include "mediaprobe/byte_source.h"

#include "mediaprobe/event_loop.h"

#include <cstring>
#include <utility>

namespace mediaprobe {

LoopByteSource::LoopByteSource(EventLoop& loop)
    : loop_(&loop)
    , generation_(std::make_shared<uint64_t>(0))
{
}


LoopByteSource::~LoopByteSource() = default;


void
LoopByteSource::read_async(uint64_t offset, uint32_t length,
                           ReadCallback done)
{
    if (!done) {
        return;
    }

    if (pending_) {
        // Single-flight violation: fail the new request, keep the old one.
        loop_->post([cb = std::move(done)]() {
            cb(ReadStatus::Failed, std::span<const std::byte>());
        });
        return;
    }

    pending_ = true;
    const std::weak_ptr<uint64_t> token = generation_;
    const uint64_t gen                  = *generation_;
    loop_->post([this, token, gen, offset, length,
                 cb = std::move(done)]() mutable {
        const std::shared_ptr<uint64_t> live = token.lock();
        if (!live || *live != gen) {
            return;
        }
        complete(offset, length, std::move(cb));
    });
}


void
LoopByteSource::complete(uint64_t offset, uint32_t length, ReadCallback done)
{
    pending_ = false;

    if (offset > size()) {
        done(ReadStatus::Failed, std::span<const std::byte>());
        return;
    }

    window_.resize(length);
    size_t got = 0;
    if (!read_window(offset,
                     std::span<std::byte>(window_.data(), window_.size()),
                     &got)) {
        done(ReadStatus::Failed, std::span<const std::byte>());
        return;
    }
    done(ReadStatus::Ok, std::span<const std::byte>(window_.data(), got));
}


void
LoopByteSource::cancel() noexcept
{
    *generation_ += 1;
    pending_ = false;
}


bool
LoopByteSource::read_pending() const noexcept
{
    return pending_;
}


std::string_view
path_basename(std::string_view path) noexcept
{
    const size_t sep = path.find_last_of("/\\");
    if (sep == std::string_view::npos) {
        return path;
    }
    return path.substr(sep + 1);
}


FileByteSource::FileByteSource(EventLoop& loop, std::string path)
    : LoopByteSource(loop)
    , path_(std::move(path))
{
    name_        = std::string(path_basename(path_));
    open_status_ = reader_.open(path_.c_str());
    if (open_status_ == FileReaderStatus::Ok) {
        size_ = reader_.size();
    } else if (stat_file_size(path_.c_str(), &size_) != FileReaderStatus::Ok) {
        size_ = 0;
    }
}


std::string_view
FileByteSource::name() const noexcept
{
    return name_;
}


uint64_t
FileByteSource::size() const noexcept
{
    return size_;
}


bool
FileByteSource::ready() const noexcept
{
    return open_status_ == FileReaderStatus::Ok;
}


const std::string&
FileByteSource::path() const noexcept
{
    return path_;
}


FileReaderStatus
FileByteSource::open_status() const noexcept
{
    return open_status_;
}


bool
FileByteSource::read_window(uint64_t offset, std::span<std::byte> out,
                            size_t* got)
{
    if (open_status_ != FileReaderStatus::Ok) {
        return false;
    }
    return reader_.read_at(offset, out, got) == FileReaderStatus::Ok;
}


MemoryByteSource::MemoryByteSource(EventLoop& loop, std::string name,
                                   std::vector<std::byte> bytes)
    : LoopByteSource(loop)
    , name_(std::move(name))
    , bytes_(std::move(bytes))
{
}


std::string_view
MemoryByteSource::name() const noexcept
{
    return name_;
}


uint64_t
MemoryByteSource::size() const noexcept
{
    return static_cast<uint64_t>(bytes_.size());
}


bool
MemoryByteSource::read_window(uint64_t offset, std::span<std::byte> out,
                              size_t* got)
{
    const uint64_t avail = static_cast<uint64_t>(bytes_.size()) - offset;
    const size_t n       = (avail < out.size()) ? static_cast<size_t>(avail)
                                                : out.size();
    if (n != 0U) {
        std::memcpy(out.data(), bytes_.data() + static_cast<size_t>(offset),
                    n);
    }
    *got = n;
    return true;
}

}  // namespace mediaprobe
