#include "mediaprobe/bmff_probe.h"

#include <cstdio>
#include <cstring>
#include <limits>

namespace mediaprobe {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        *out = static_cast<uint16_t>(
            (static_cast<uint16_t>(u8(bytes[offset + 0])) << 8)
            | static_cast<uint16_t>(u8(bytes[offset + 1])));
        return true;
    }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
        return true;
    }


    static bool read_u64be(std::span<const std::byte> bytes, uint64_t offset,
                           uint64_t* out) noexcept
    {
        uint32_t hi = 0;
        uint32_t lo = 0;
        if (!read_u32be(bytes, offset + 0, &hi)
            || !read_u32be(bytes, offset + 4, &lo)) {
            return false;
        }
        *out = (static_cast<uint64_t>(hi) << 32) | static_cast<uint64_t>(lo);
        return true;
    }


    static bool type_looks_ascii(uint32_t type) noexcept
    {
        for (uint32_t i = 0; i < 4; ++i) {
            const uint8_t c = static_cast<uint8_t>((type >> (24 - i * 8))
                                                   & 0xFFU);
            if (c < 0x20U || c > 0x7EU) {
                return false;
            }
        }
        return true;
    }


    struct BmffBox final {
        uint64_t offset      = 0;
        uint64_t size        = 0;
        uint64_t header_size = 0;
        uint32_t type        = 0;
    };

    // In-memory child box parse (bytes hold a complete structural box payload).
    static bool parse_bmff_box(std::span<const std::byte> bytes,
                               uint64_t offset, uint64_t parent_end,
                               BmffBox* out) noexcept
    {
        if (offset + 8 > parent_end || offset + 8 > bytes.size()) {
            return false;
        }
        uint32_t size32 = 0;
        uint32_t type   = 0;
        if (!read_u32be(bytes, offset + 0, &size32)
            || !read_u32be(bytes, offset + 4, &type)) {
            return false;
        }

        uint64_t header_size = 8;
        uint64_t box_size    = size32;
        if (size32 == 1) {
            uint64_t size64 = 0;
            if (!read_u64be(bytes, offset + 8, &size64)) {
                return false;
            }
            header_size = 16;
            box_size    = size64;
        } else if (size32 == 0) {
            box_size = parent_end - offset;
        }

        if (box_size < header_size) {
            return false;
        }
        if (box_size > parent_end - offset) {
            return false;
        }

        out->offset      = offset;
        out->size        = box_size;
        out->header_size = header_size;
        out->type        = type;
        return true;
    }


    enum class Walk : uint8_t {
        Found,
        Missing,
        Malformed,
    };

    static Walk find_child(std::span<const std::byte> bytes, uint64_t begin,
                           uint64_t end, uint32_t type, BmffBox* out) noexcept
    {
        uint64_t offset = begin;
        while (offset < end) {
            // Trailing padding shorter than a box header is tolerated.
            if (end - offset < 8) {
                return Walk::Missing;
            }
            BmffBox box;
            if (!parse_bmff_box(bytes, offset, end, &box)) {
                return Walk::Malformed;
            }
            if (box.type == type) {
                *out = box;
                return Walk::Found;
            }
            offset += box.size;
        }
        return Walk::Missing;
    }


    static uint64_t payload_begin(const BmffBox& box) noexcept
    {
        return box.offset + box.header_size;
    }


    static uint64_t payload_end(const BmffBox& box) noexcept
    {
        return box.offset + box.size;
    }


    static bool parse_ftyp(std::span<const std::byte> payload,
                           ContainerInfo* info)
    {
        uint32_t major = 0;
        uint32_t minor = 0;
        if (!read_u32be(payload, 0, &major) || !read_u32be(payload, 4, &minor)) {
            return false;
        }
        info->major_brand   = fourcc_to_string(major);
        info->minor_version = minor;
        info->compatible_brands.clear();
        for (uint64_t off = 8; off + 4 <= payload.size(); off += 4) {
            uint32_t brand = 0;
            if (!read_u32be(payload, off, &brand)) {
                return false;
            }
            info->compatible_brands.push_back(fourcc_to_string(brand));
        }
        return true;
    }


    static void parse_mvhd(std::span<const std::byte> bytes,
                           const BmffBox& mvhd, ContainerInfo* info) noexcept
    {
        const uint64_t p = payload_begin(mvhd);
        if (p >= bytes.size()) {
            return;
        }
        const uint8_t version = u8(bytes[p]);
        uint32_t timescale    = 0;
        uint64_t duration     = 0;
        if (version == 1) {
            if (!read_u32be(bytes, p + 20, &timescale)
                || !read_u64be(bytes, p + 24, &duration)) {
                return;
            }
        } else {
            uint32_t d32 = 0;
            if (!read_u32be(bytes, p + 12, &timescale)
                || !read_u32be(bytes, p + 16, &d32)) {
                return;
            }
            duration = d32;
        }
        info->movie_timescale = timescale;
        info->movie_duration  = duration;
    }


    // Offset of child boxes inside a sample entry payload.
    static bool sample_entry_children_offset(std::span<const std::byte> bytes,
                                             const BmffBox& entry,
                                             uint32_t handler,
                                             uint64_t* out) noexcept
    {
        const uint64_t p = payload_begin(entry);
        if (handler == fourcc('v', 'i', 'd', 'e')) {
            *out = p + 78;
            return true;
        }
        if (handler == fourcc('s', 'o', 'u', 'n')) {
            uint16_t version = 0;
            if (!read_u16be(bytes, p + 8, &version)) {
                return false;
            }
            uint64_t extra = 0;
            if (version == 1) {
                extra = 16;
            } else if (version == 2) {
                extra = 36;
            }
            *out = p + 28 + extra;
            return true;
        }
        return false;
    }


    static std::string describe_sample_entry(std::span<const std::byte> bytes,
                                             const BmffBox& entry,
                                             uint32_t handler)
    {
        uint32_t type = entry.type;

        uint64_t children = 0;
        const bool has_children
            = sample_entry_children_offset(bytes, entry, handler, &children)
              && children < payload_end(entry);

        if (has_children
            && (type == fourcc('e', 'n', 'c', 'v')
                || type == fourcc('e', 'n', 'c', 'a'))) {
            BmffBox sinf;
            BmffBox frma;
            if (find_child(bytes, children, payload_end(entry),
                           fourcc('s', 'i', 'n', 'f'), &sinf)
                    == Walk::Found
                && find_child(bytes, payload_begin(sinf), payload_end(sinf),
                              fourcc('f', 'r', 'm', 'a'), &frma)
                       == Walk::Found) {
                uint32_t original = 0;
                if (payload_begin(frma) + 4 <= payload_end(frma)
                    && read_u32be(bytes, payload_begin(frma), &original)) {
                    type = original;
                }
            }
        }

        std::string codec = fourcc_to_string(type);
        if (has_children
            && (type == fourcc('a', 'v', 'c', '1')
                || type == fourcc('a', 'v', 'c', '3'))) {
            BmffBox avcc;
            if (find_child(bytes, children, payload_end(entry),
                           fourcc('a', 'v', 'c', 'C'), &avcc)
                    == Walk::Found
                && avcc.size - avcc.header_size >= 4) {
                const uint64_t p = payload_begin(avcc);
                char buf[16];
                std::snprintf(buf, sizeof(buf), ".%02x%02x%02x",
                              static_cast<unsigned>(u8(bytes[p + 1])),
                              static_cast<unsigned>(u8(bytes[p + 2])),
                              static_cast<unsigned>(u8(bytes[p + 3])));
                codec.append(buf);
            }
        }
        return codec;
    }


    static bool parse_track(std::span<const std::byte> bytes,
                            const BmffBox& trak, ContainerInfo* info)
    {
        info->track_count += 1;

        BmffBox mdia;
        Walk w = find_child(bytes, payload_begin(trak), payload_end(trak),
                            fourcc('m', 'd', 'i', 'a'), &mdia);
        if (w != Walk::Found) {
            return w != Walk::Malformed;
        }

        BmffBox hdlr;
        w = find_child(bytes, payload_begin(mdia), payload_end(mdia),
                       fourcc('h', 'd', 'l', 'r'), &hdlr);
        if (w != Walk::Found) {
            return w != Walk::Malformed;
        }
        // hdlr: FullBox header (4) + pre_defined (4) + handler_type (4).
        uint32_t handler = 0;
        if (payload_begin(hdlr) + 12 > payload_end(hdlr)
            || !read_u32be(bytes, payload_begin(hdlr) + 8, &handler)) {
            return false;
        }

        const bool is_video = handler == fourcc('v', 'i', 'd', 'e');
        const bool is_audio = handler == fourcc('s', 'o', 'u', 'n');
        if ((!is_video || info->has_video) && (!is_audio || info->has_audio)) {
            return true;
        }

        BmffBox minf;
        BmffBox stbl;
        BmffBox stsd;
        w = find_child(bytes, payload_begin(mdia), payload_end(mdia),
                       fourcc('m', 'i', 'n', 'f'), &minf);
        if (w == Walk::Found) {
            w = find_child(bytes, payload_begin(minf), payload_end(minf),
                           fourcc('s', 't', 'b', 'l'), &stbl);
        }
        if (w == Walk::Found) {
            w = find_child(bytes, payload_begin(stbl), payload_end(stbl),
                           fourcc('s', 't', 's', 'd'), &stsd);
        }
        if (w != Walk::Found) {
            return w != Walk::Malformed;
        }

        // stsd: FullBox header (4) + entry_count (4) + sample entries.
        uint32_t entry_count = 0;
        if (payload_begin(stsd) + 8 > payload_end(stsd)
            || !read_u32be(bytes, payload_begin(stsd) + 4, &entry_count)) {
            return false;
        }
        if (entry_count == 0U) {
            return true;
        }
        BmffBox entry;
        if (!parse_bmff_box(bytes, payload_begin(stsd) + 8, payload_end(stsd),
                            &entry)) {
            return false;
        }

        const std::string codec = describe_sample_entry(bytes, entry, handler);
        if (is_video) {
            info->has_video   = true;
            info->video_codec = codec;
        } else {
            info->has_audio   = true;
            info->audio_codec = codec;
        }
        return true;
    }


    /// Walks the `moov` children; the nesting below `trak` is fixed
    /// (mdia/minf/stbl/stsd/entry), so only the track count needs a budget.
    static ProbeError parse_movie(std::span<const std::byte> payload,
                                  uint32_t max_tracks, ContainerInfo* info)
    {
        uint64_t offset    = 0;
        const uint64_t end = payload.size();
        while (offset < end) {
            if (end - offset < 8) {
                break;
            }
            BmffBox box;
            if (!parse_bmff_box(payload, offset, end, &box)) {
                return ProbeError::Malformed;
            }
            if (box.type == fourcc('m', 'v', 'h', 'd')) {
                parse_mvhd(payload, box, info);
            } else if (box.type == fourcc('t', 'r', 'a', 'k')) {
                if (info->track_count >= max_tracks) {
                    return ProbeError::LimitExceeded;
                }
                if (!parse_track(payload, box, info)) {
                    return ProbeError::Malformed;
                }
            }
            offset += box.size;
        }
        return ProbeError::None;
    }

}  // namespace


std::string
fourcc_to_string(uint32_t type)
{
    std::string out(4, '.');
    for (uint32_t i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>((type >> (24 - i * 8)) & 0xFFU);
        if (c >= 0x20U && c <= 0x7EU) {
            out[i] = static_cast<char>(c);
        }
    }
    return out;
}


const char*
probe_status_name(ProbeStatus status) noexcept
{
    switch (status) {
    case ProbeStatus::NeedMore: return "need_more";
    case ProbeStatus::Ready: return "ready";
    case ProbeStatus::Failed: return "failed";
    }
    return "unknown";
}


const char*
probe_error_name(ProbeError error) noexcept
{
    switch (error) {
    case ProbeError::None: return "none";
    case ProbeError::NotBmff: return "not_bmff";
    case ProbeError::Malformed: return "malformed";
    case ProbeError::MissingMovie: return "missing_movie";
    case ProbeError::LimitExceeded: return "limit_exceeded";
    case ProbeError::OutOfOrder: return "out_of_order";
    case ProbeError::Discontiguous: return "discontiguous";
    }
    return "unknown";
}


BmffProbeParser::BmffProbeParser(const ProbeLimits& limits)
    : limits_(limits)
{
}


ProbeStatus
BmffProbeParser::status() const noexcept
{
    return status_;
}


ProbeError
BmffProbeParser::error() const noexcept
{
    return error_;
}


const ContainerInfo&
BmffProbeParser::info() const noexcept
{
    return info_;
}


uint64_t
BmffProbeParser::position() const noexcept
{
    return pos_;
}


size_t
BmffProbeParser::buffered_bytes() const noexcept
{
    return box_buf_.size();
}


uint64_t
BmffProbeParser::next_offset() const noexcept
{
    if (phase_ == Phase::SkipBox) {
        return box_open_ended_ ? std::numeric_limits<uint64_t>::max()
                               : box_end_;
    }
    return pos_;
}


ProbeStatus
BmffProbeParser::fail(ProbeError error)
{
    status_ = ProbeStatus::Failed;
    error_  = error;
    box_buf_.clear();
    box_buf_.shrink_to_fit();
    return status_;
}


ProbeStatus
BmffProbeParser::append(uint64_t file_offset, std::span<const std::byte> bytes)
{
    if (status_ != ProbeStatus::NeedMore) {
        return status_;
    }
    if (have_window_ && file_offset < last_window_offset_) {
        return fail(ProbeError::OutOfOrder);
    }
    have_window_        = true;
    last_window_offset_ = file_offset;

    if (bytes.empty()) {
        return status_;
    }
    const uint64_t window_end = file_offset + bytes.size();
    if (window_end <= pos_) {
        return status_;
    }
    if (file_offset > pos_) {
        if (phase_ == Phase::SkipBox
            && (box_open_ended_ || file_offset <= box_end_)) {
            pos_ = file_offset;
            if (!box_open_ended_ && pos_ == box_end_) {
                phase_ = Phase::BoxHeader;
            }
        } else {
            return fail(ProbeError::Discontiguous);
        }
    }

    std::span<const std::byte> in = bytes.subspan(
        static_cast<size_t>(pos_ - file_offset));
    while (!in.empty() && status_ == ProbeStatus::NeedMore) {
        size_t used = 0;
        switch (phase_) {
        case Phase::BoxHeader: used = consume_header(in); break;
        case Phase::CollectBox: used = consume_collect(in); break;
        case Phase::SkipBox: used = consume_skip(in); break;
        }
        pos_ += used;
        in = in.subspan(used);
    }
    return status_;
}


size_t
BmffProbeParser::consume_header(std::span<const std::byte> in)
{
    size_t used = 0;
    auto fill   = [&](uint32_t target) {
        const size_t want = static_cast<size_t>(target - header_len_);
        const size_t have = in.size() - used;
        const size_t n    = want < have ? want : have;
        std::memcpy(header_.data() + header_len_, in.data() + used, n);
        header_len_ += static_cast<uint32_t>(n);
        used += n;
    };

    if (header_len_ < 8) {
        fill(8);
        if (header_len_ < 8) {
            return used;
        }
    }

    const std::span<const std::byte> hdr(header_.data(), header_.size());
    uint32_t size32 = 0;
    uint32_t type   = 0;
    (void)read_u32be(hdr, 0, &size32);
    (void)read_u32be(hdr, 4, &type);

    if (top_level_boxes_ == 0U && !type_looks_ascii(type)) {
        fail(ProbeError::NotBmff);
        return used;
    }

    uint64_t header_size = 8;
    uint64_t box_size    = size32;
    if (size32 == 1) {
        fill(16);
        if (header_len_ < 16) {
            return used;
        }
        (void)read_u64be(hdr, 8, &box_size);
        header_size = 16;
    }
    header_len_ = 0;

    top_level_boxes_ += 1;
    if (top_level_boxes_ > limits_.max_top_level_boxes) {
        fail(ProbeError::LimitExceeded);
        return used;
    }
    if (!type_looks_ascii(type)) {
        fail(ProbeError::Malformed);
        return used;
    }

    box_start_       = pos_ + used - header_size;
    box_type_        = type;
    box_header_size_ = header_size;
    box_open_ended_  = size32 == 0;
    if (box_open_ended_) {
        box_end_ = std::numeric_limits<uint64_t>::max();
    } else {
        if (box_size < header_size
            || box_size > std::numeric_limits<uint64_t>::max() - box_start_) {
            fail(ProbeError::Malformed);
            return used;
        }
        box_end_ = box_start_ + box_size;
    }

    const bool structural = type == fourcc('f', 't', 'y', 'p')
                            || type == fourcc('m', 'o', 'o', 'v');
    if (structural) {
        box_buf_.clear();
        if (!box_open_ended_) {
            const uint64_t payload = box_size - header_size;
            if (payload > limits_.max_structural_box_bytes) {
                fail(ProbeError::LimitExceeded);
                return used;
            }
            box_buf_.reserve(static_cast<size_t>(payload));
            if (payload == 0U) {
                finish_box();
                return used;
            }
        }
        phase_ = Phase::CollectBox;
        return used;
    }

    if (!box_open_ended_ && box_end_ == box_start_ + header_size) {
        phase_ = Phase::BoxHeader;
    } else {
        phase_ = Phase::SkipBox;
    }
    return used;
}


size_t
BmffProbeParser::consume_collect(std::span<const std::byte> in)
{
    size_t n = in.size();
    if (!box_open_ended_) {
        const uint64_t remaining = box_end_ - pos_;
        if (remaining < n) {
            n = static_cast<size_t>(remaining);
        }
    } else if (box_buf_.size() + n > limits_.max_structural_box_bytes) {
        fail(ProbeError::LimitExceeded);
        return 0;
    }

    box_buf_.insert(box_buf_.end(), in.begin(),
                    in.begin() + static_cast<std::ptrdiff_t>(n));
    if (!box_open_ended_ && pos_ + n == box_end_) {
        finish_box();
    }
    return n;
}


size_t
BmffProbeParser::consume_skip(std::span<const std::byte> in) noexcept
{
    if (box_open_ended_) {
        return in.size();
    }
    size_t n                 = in.size();
    const uint64_t remaining = box_end_ - pos_;
    if (remaining <= n) {
        n      = static_cast<size_t>(remaining);
        phase_ = Phase::BoxHeader;
    }
    return n;
}


void
BmffProbeParser::finish_box()
{
    const std::span<const std::byte> payload(box_buf_.data(), box_buf_.size());
    phase_ = Phase::BoxHeader;

    if (box_type_ == fourcc('f', 't', 'y', 'p')) {
        if (!parse_ftyp(payload, &info_)) {
            fail(ProbeError::Malformed);
            return;
        }
    } else if (box_type_ == fourcc('m', 'o', 'o', 'v')) {
        info_.movie_offset   = box_start_;
        const ProbeError err = parse_movie(payload, limits_.max_tracks, &info_);
        if (err != ProbeError::None) {
            fail(err);
            return;
        }
        seen_movie_ = true;
        status_     = ProbeStatus::Ready;
    }

    box_buf_.clear();
    box_buf_.shrink_to_fit();
}


ProbeStatus
BmffProbeParser::flush()
{
    if (status_ != ProbeStatus::NeedMore) {
        return status_;
    }

    if (phase_ == Phase::CollectBox) {
        if (!box_open_ended_) {
            return fail(ProbeError::Malformed);
        }
        finish_box();
        if (status_ != ProbeStatus::NeedMore) {
            return status_;
        }
    }
    if (phase_ == Phase::BoxHeader && header_len_ != 0U) {
        return fail(ProbeError::Malformed);
    }
    if (top_level_boxes_ == 0U) {
        return fail(ProbeError::NotBmff);
    }
    return fail(ProbeError::MissingMovie);
}

}  // namespace mediaprobe
