#include "zip_writer_internal.h"

#include <limits>
#include <utility>

#if defined(MEDIAPROBE_HAS_ZLIB) && MEDIAPROBE_HAS_ZLIB
#    include <zlib.h>
#endif

namespace mediaprobe::detail {
namespace {

    static constexpr uint16_t kDosTime       = 0x0000;
    static constexpr uint16_t kDosDate       = 0x0021;  // 1980-01-01
    static constexpr uint16_t kVersionNeeded = 20;
    static constexpr uint16_t kMethodDeflate = 8;
    static constexpr uint16_t kFlagUtf8Names = 0x0800;

    static void append_u16le(std::vector<std::byte>* out, uint16_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>(v & 0xFFU) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFFU) });
    }


    static void append_u32le(std::vector<std::byte>* out, uint32_t v)
    {
        append_u16le(out, static_cast<uint16_t>(v & 0xFFFFU));
        append_u16le(out, static_cast<uint16_t>((v >> 16) & 0xFFFFU));
    }


    static void append_text(std::vector<std::byte>* out, std::string_view s)
    {
        for (size_t i = 0; i < s.size(); ++i) {
            out->push_back(std::byte { static_cast<uint8_t>(s[i]) });
        }
    }

#if defined(MEDIAPROBE_HAS_ZLIB) && MEDIAPROBE_HAS_ZLIB
    static bool deflate_raw(std::string_view in, std::vector<std::byte>* out)
    {
        z_stream zs {};
        if (deflateInit2(&zs, 6, Z_DEFLATED, -MAX_WBITS, 8,
                         Z_DEFAULT_STRATEGY)
            != Z_OK) {
            return false;
        }

        const uLong bound = deflateBound(&zs, static_cast<uLong>(in.size()));
        out->resize(static_cast<size_t>(bound));

        zs.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
        zs.avail_in  = static_cast<uInt>(in.size());
        zs.next_out  = reinterpret_cast<Bytef*>(out->data());
        zs.avail_out = static_cast<uInt>(out->size());

        const int rc = deflate(&zs, Z_FINISH);
        const uLong produced = zs.total_out;
        deflateEnd(&zs);
        if (rc != Z_STREAM_END) {
            out->clear();
            return false;
        }
        out->resize(static_cast<size_t>(produced));
        return true;
    }
#endif

}  // namespace


size_t
ZipWriter::entry_count() const noexcept
{
    return entries_.size();
}


ZipStatus
ZipWriter::add(std::string_view name, std::string_view data)
{
#if defined(MEDIAPROBE_HAS_ZLIB) && MEDIAPROBE_HAS_ZLIB
    if (data.size() > std::numeric_limits<uInt>::max()
        || name.size() > std::numeric_limits<uint16_t>::max()) {
        return ZipStatus::TooLarge;
    }

    std::vector<std::byte> packed;
    if (!deflate_raw(data, &packed)) {
        return ZipStatus::CompressFailed;
    }

    if (bytes_.size() > std::numeric_limits<uint32_t>::max()
        || packed.size() > std::numeric_limits<uint32_t>::max()) {
        return ZipStatus::TooLarge;
    }

    Entry e;
    e.name              = std::string(name);
    e.crc               = static_cast<uint32_t>(
        crc32(crc32(0L, Z_NULL, 0),
              reinterpret_cast<const Bytef*>(data.data()),
              static_cast<uInt>(data.size())));
    e.compressed_size   = static_cast<uint32_t>(packed.size());
    e.uncompressed_size = static_cast<uint32_t>(data.size());
    e.local_offset      = static_cast<uint32_t>(bytes_.size());

    append_u32le(&bytes_, 0x04034B50U);
    append_u16le(&bytes_, kVersionNeeded);
    append_u16le(&bytes_, kFlagUtf8Names);
    append_u16le(&bytes_, kMethodDeflate);
    append_u16le(&bytes_, kDosTime);
    append_u16le(&bytes_, kDosDate);
    append_u32le(&bytes_, e.crc);
    append_u32le(&bytes_, e.compressed_size);
    append_u32le(&bytes_, e.uncompressed_size);
    append_u16le(&bytes_, static_cast<uint16_t>(e.name.size()));
    append_u16le(&bytes_, 0);
    append_text(&bytes_, e.name);
    bytes_.insert(bytes_.end(), packed.begin(), packed.end());

    entries_.push_back(std::move(e));
    return ZipStatus::Ok;
#else
    (void)name;
    (void)data;
    return ZipStatus::Unsupported;
#endif
}


ZipStatus
ZipWriter::finish(std::vector<std::byte>* out)
{
    if (!out) {
        return ZipStatus::Ok;
    }
    if (entries_.size() > std::numeric_limits<uint16_t>::max()
        || bytes_.size() > std::numeric_limits<uint32_t>::max()) {
        return ZipStatus::TooLarge;
    }

    const uint32_t cd_offset = static_cast<uint32_t>(bytes_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        const Entry& e = entries_[i];
        append_u32le(&bytes_, 0x02014B50U);
        append_u16le(&bytes_, kVersionNeeded);  // version made by (MS-DOS)
        append_u16le(&bytes_, kVersionNeeded);
        append_u16le(&bytes_, kFlagUtf8Names);
        append_u16le(&bytes_, kMethodDeflate);
        append_u16le(&bytes_, kDosTime);
        append_u16le(&bytes_, kDosDate);
        append_u32le(&bytes_, e.crc);
        append_u32le(&bytes_, e.compressed_size);
        append_u32le(&bytes_, e.uncompressed_size);
        append_u16le(&bytes_, static_cast<uint16_t>(e.name.size()));
        append_u16le(&bytes_, 0);  // extra
        append_u16le(&bytes_, 0);  // comment
        append_u16le(&bytes_, 0);  // disk
        append_u16le(&bytes_, 0);  // internal attributes
        append_u32le(&bytes_, 0);  // external attributes
        append_u32le(&bytes_, e.local_offset);
        append_text(&bytes_, e.name);
    }
    if (bytes_.size() > std::numeric_limits<uint32_t>::max()) {
        return ZipStatus::TooLarge;
    }
    const uint32_t cd_size = static_cast<uint32_t>(bytes_.size()) - cd_offset;

    append_u32le(&bytes_, 0x06054B50U);
    append_u16le(&bytes_, 0);
    append_u16le(&bytes_, 0);
    append_u16le(&bytes_, static_cast<uint16_t>(entries_.size()));
    append_u16le(&bytes_, static_cast<uint16_t>(entries_.size()));
    append_u32le(&bytes_, cd_size);
    append_u32le(&bytes_, cd_offset);
    append_u16le(&bytes_, 0);

    *out = std::move(bytes_);
    bytes_.clear();
    entries_.clear();
    return ZipStatus::Ok;
}

}  // namespace mediaprobe::detail
