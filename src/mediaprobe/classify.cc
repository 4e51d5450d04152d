#include "mediaprobe/classify.h"

#include "mediaprobe/byte_source.h"

namespace mediaprobe {
namespace {

    static bool contains(std::string_view haystack,
                         std::string_view needle) noexcept
    {
        return haystack.find(needle) != std::string_view::npos;
    }


    static std::string_view trim(std::string_view s) noexcept
    {
        while (!s.empty()
               && (s.front() == ' ' || s.front() == '\t' || s.front() == '\0'
                   || s.front() == '\r' || s.front() == '\n')) {
            s.remove_prefix(1);
        }
        while (!s.empty()
               && (s.back() == ' ' || s.back() == '\t' || s.back() == '\0'
                   || s.back() == '\r' || s.back() == '\n')) {
            s.remove_suffix(1);
        }
        return s;
    }


    static bool in_list(std::string_view value,
                        const std::vector<std::string>& list)
    {
        const std::string v = ascii_lower(value);
        for (size_t i = 0; i < list.size(); ++i) {
            if (ascii_lower(list[i]) == v) {
                return true;
            }
        }
        return false;
    }

}  // namespace


const char*
flag_name(Flag flag) noexcept
{
    return flag == Flag::Pass ? "pass" : "fail";
}


const char*
flag_label(Flag flag) noexcept
{
    return flag == Flag::Pass ? "good to go" : "error";
}


bool
parse_flag(std::string_view text, Flag* out) noexcept
{
    if (text.size() != 4) {
        return false;
    }
    char buf[4];
    for (size_t i = 0; i < 4; ++i) {
        const char c = text[i];
        buf[i]       = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
    }
    const std::string_view lower(buf, 4);
    if (lower == "pass") {
        *out = Flag::Pass;
        return true;
    }
    if (lower == "fail") {
        *out = Flag::Fail;
        return true;
    }
    return false;
}


std::string
ascii_lower(std::string_view s)
{
    std::string out(s);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c + ('a' - 'A'));
        }
    }
    return out;
}


std::string
normalize_brand(std::string_view raw_brand)
{
    const std::string brand = ascii_lower(trim(raw_brand));
    if (contains(brand, "qt")) {
        return "mov";
    }
    if (contains(brand, "mp4") || contains(brand, "isom")) {
        return "mp4";
    }
    if (brand.empty()) {
        return "mp4";
    }
    return brand;
}


std::string
normalize_video_codec(std::string_view raw_codec)
{
    const std::string codec = ascii_lower(trim(raw_codec));
    if (codec.empty()) {
        return "unknown";
    }
    if (contains(codec, "avc") || contains(codec, "h264")) {
        return "h264";
    }
    if (contains(codec, "hvc") || contains(codec, "hev")
        || contains(codec, "h265")) {
        return "hevc";
    }
    return codec;
}


std::string
normalize_audio_codec(std::string_view raw_codec)
{
    const std::string codec = ascii_lower(trim(raw_codec));
    if (codec.empty()) {
        return "none";
    }
    if (contains(codec, "mp4a")) {
        return "aac";
    }
    return codec;
}


std::string
file_extension(std::string_view name)
{
    const std::string_view base = path_basename(name);
    const size_t dot            = base.find_last_of('.');
    if (dot == std::string_view::npos || dot + 1 >= base.size()) {
        return std::string();
    }
    return ascii_lower(base.substr(dot + 1));
}


bool
is_container_extension(std::string_view extension,
                       const std::vector<std::string>& container_extensions)
{
    if (extension.empty()) {
        return false;
    }
    return in_list(extension, container_extensions);
}


const std::vector<std::string>&
default_container_extensions()
{
    static const std::vector<std::string> kExtensions = { "mp4", "mov",
                                                          "m4v" };
    return kExtensions;
}


void
evaluate_policy(FileRecord* record, const ValidationPolicy& policy)
{
    if (!record) {
        return;
    }
    record->format_flag = in_list(record->container_format,
                                  policy.allowed_formats)
                              ? Flag::Pass
                              : Flag::Fail;
    record->codec_flag  = in_list(record->video_codec,
                                  policy.allowed_video_codecs)
                              ? Flag::Pass
                              : Flag::Fail;

    // byte_size / 2^20 <= max  <=>  byte_size <= max * 2^20.
    const uint64_t max_mib = policy.max_size_mib;
    const uint64_t limit   = (max_mib > (UINT64_MAX >> 20))
                                 ? UINT64_MAX
                                 : (max_mib << 20);
    record->size_flag = record->byte_size <= limit ? Flag::Pass : Flag::Fail;
}


FileRecord
classify_media(std::string_view name, std::string_view raw_brand,
               std::string_view raw_video_codec,
               std::string_view raw_audio_codec, uint64_t byte_size,
               const ValidationPolicy& policy)
{
    FileRecord r;
    r.name             = std::string(name);
    r.byte_size        = byte_size;
    r.container_format = normalize_brand(raw_brand);
    r.video_codec      = normalize_video_codec(raw_video_codec);
    r.audio_codec      = normalize_audio_codec(raw_audio_codec);
    evaluate_policy(&r, policy);
    return r;
}


FileRecord
make_extension_record(std::string_view name, uint64_t byte_size,
                      const ValidationPolicy& policy)
{
    FileRecord r;
    r.name             = std::string(name);
    r.byte_size        = byte_size;
    r.container_format = file_extension(name);
    if (r.container_format.empty()) {
        r.container_format = "unknown";
    }
    r.video_codec = "unknown";
    r.audio_codec = "unknown";
    evaluate_policy(&r, policy);
    return r;
}


FileRecord
make_error_record(std::string_view name, uint64_t byte_size,
                  std::string_view reason, const ValidationPolicy& policy)
{
    FileRecord r;
    r.name             = std::string(name);
    r.byte_size        = byte_size;
    r.container_format = "error";
    r.video_codec      = "error";
    r.audio_codec      = std::string(reason);
    evaluate_policy(&r, policy);
    return r;
}

}  // namespace mediaprobe
