#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file classify.h
 * \brief Canonical format/codec tags and policy flags for probed files.
 */

namespace mediaprobe {

enum class Flag : uint8_t {
    Pass,
    Fail,
};

/// One validated input file. Immutable once produced by a batch.
struct FileRecord final {
    std::string name;
    uint64_t byte_size = 0;
    std::string container_format;
    std::string video_codec;
    /// Audio codec tag, `"none"` when no audio track exists. Error records
    /// carry the failure reason here.
    std::string audio_codec;

    Flag format_flag = Flag::Fail;
    Flag codec_flag  = Flag::Fail;
    Flag size_flag   = Flag::Fail;

    bool operator==(const FileRecord&) const = default;
};

/// Validation rules. Values are compared lower-cased.
struct ValidationPolicy final {
    std::vector<std::string> allowed_formats = { "mp4", "mov" };
    std::vector<std::string> allowed_video_codecs
        = { "h264",       "avc",        "hevc",   "h265",
            "mpeg1video", "mpeg2video", "mpeg1", "mpeg2" };
    /// Largest accepted size in MiB (inclusive).
    uint64_t max_size_mib = 200;
};

/// `"pass"` / `"fail"`.
const char*
flag_name(Flag flag) noexcept;

/// Report cell text: `"good to go"` / `"error"`.
const char*
flag_label(Flag flag) noexcept;

/// Parses `"pass"` / `"fail"` (case-insensitive).
bool
parse_flag(std::string_view text, Flag* out) noexcept;

std::string
ascii_lower(std::string_view s);

/// Maps a container brand to `mp4` / `mov`, or the trimmed lower-cased brand.
std::string
normalize_brand(std::string_view raw_brand);

/// Maps codec identifiers to `h264` / `hevc`; empty input yields `unknown`.
std::string
normalize_video_codec(std::string_view raw_codec);

/// Maps `mp4a*` to `aac`; empty input yields `none`.
std::string
normalize_audio_codec(std::string_view raw_codec);

/// Lower-cased suffix after the last dot of the last path component.
std::string
file_extension(std::string_view name);

bool
is_container_extension(std::string_view extension,
                       const std::vector<std::string>& container_extensions);

/// Default container family extensions: mp4, mov, m4v.
const std::vector<std::string>&
default_container_extensions();

/// Recomputes the three flags of \p record from its tag fields.
void
evaluate_policy(FileRecord* record, const ValidationPolicy& policy);

/**
 * \brief Builds a record from raw container identifiers.
 *
 * Pure: equal inputs always produce equal records.
 */
FileRecord
classify_media(std::string_view name, std::string_view raw_brand,
               std::string_view raw_video_codec,
               std::string_view raw_audio_codec, uint64_t byte_size,
               const ValidationPolicy& policy);

/// Record for files whose extension bypasses the container parser.
FileRecord
make_extension_record(std::string_view name, uint64_t byte_size,
                      const ValidationPolicy& policy);

/// Record for files whose probe failed; \p reason lands in the audio slot.
FileRecord
make_error_record(std::string_view name, uint64_t byte_size,
                  std::string_view reason, const ValidationPolicy& policy);

}  // namespace mediaprobe
