#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file bmff_probe.h
 * \brief Incremental ISO-BMFF / QuickTime structure probe.
 */

namespace mediaprobe {

/// Parser state reported after each input window.
enum class ProbeStatus : uint8_t {
    /// More input (or a flush) is required.
    NeedMore,
    /// The movie header was parsed; \ref BmffProbeParser::info is final.
    Ready,
    /// Terminal failure; see \ref BmffProbeParser::error.
    Failed,
};

enum class ProbeError : uint8_t {
    None,
    /// The first box header does not look like ISO-BMFF.
    NotBmff,
    /// Box sizes or nesting are inconsistent, or the input is truncated.
    Malformed,
    /// End of input reached without a `moov` box.
    MissingMovie,
    /// A structural box or the track count exceeds \ref ProbeLimits.
    LimitExceeded,
    /// A window started before the previous window (caller error).
    OutOfOrder,
    /// A window skipped bytes the parser still needed.
    Discontiguous,
};

/// Budgets for untrusted container input.
struct ProbeLimits final {
    /// Largest `ftyp`/`moov` payload buffered in memory.
    uint64_t max_structural_box_bytes = 64ULL * 1024ULL * 1024ULL;
    /// Largest number of top-level boxes walked before giving up.
    uint32_t max_top_level_boxes = 1U << 16;
    /// Largest number of `trak` boxes walked inside `moov`.
    uint32_t max_tracks = 256;
};

/// Structural identifiers discovered in a container.
struct ContainerInfo final {
    /// `ftyp` major brand as 4 characters (e.g. "isom", "qt  "); empty if absent.
    std::string major_brand;
    uint32_t minor_version = 0;
    std::vector<std::string> compatible_brands;

    /// First video track codec (sample entry type, e.g. "avc1.64001f").
    bool has_video = false;
    std::string video_codec;

    /// First audio track codec (sample entry type, e.g. "mp4a").
    bool has_audio = false;
    std::string audio_codec;

    uint32_t track_count     = 0;
    uint32_t movie_timescale = 0;
    uint64_t movie_duration  = 0;
    /// Absolute offset of the `moov` box.
    uint64_t movie_offset = 0;
};

static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/// Renders a FourCC; bytes outside printable ASCII become '.'.
std::string
fourcc_to_string(uint32_t type);

const char*
probe_status_name(ProbeStatus status) noexcept;
const char*
probe_error_name(ProbeError error) noexcept;

/**
 * \brief Streaming box scanner fed with absolute-offset byte windows.
 *
 * Top-level `ftyp` and `moov` boxes are buffered whole; every other top-level
 * box (typically `mdat`) is skipped without buffering. The parser reaches
 * \ref ProbeStatus::Ready as soon as `moov` has been parsed, so callers may
 * stop feeding input early.
 *
 * Windows must be supplied in non-decreasing offset order. Overlapping bytes
 * already consumed are ignored. A gap is accepted only while skipping a box
 * and only up to that box's end (see \ref next_offset).
 *
 * Exactly one terminal status is produced; input after it is ignored.
 */
class BmffProbeParser final {
public:
    explicit BmffProbeParser(const ProbeLimits& limits = ProbeLimits {});

    ProbeStatus append(uint64_t file_offset, std::span<const std::byte> bytes);
    /// Signals end of input.
    ProbeStatus flush();

    ProbeStatus status() const noexcept;
    ProbeError error() const noexcept;
    const ContainerInfo& info() const noexcept;

    /// First absolute offset the parser still needs.
    uint64_t next_offset() const noexcept;
    /// Absolute position of the next unconsumed byte.
    uint64_t position() const noexcept;
    /// Bytes currently buffered for a structural box.
    size_t buffered_bytes() const noexcept;

private:
    enum class Phase : uint8_t {
        BoxHeader,
        CollectBox,
        SkipBox,
    };

    size_t consume_header(std::span<const std::byte> in);
    size_t consume_collect(std::span<const std::byte> in);
    size_t consume_skip(std::span<const std::byte> in) noexcept;
    void finish_box();
    ProbeStatus fail(ProbeError error);

    ProbeLimits limits_;
    ContainerInfo info_;
    ProbeStatus status_ = ProbeStatus::NeedMore;
    ProbeError error_   = ProbeError::None;
    Phase phase_        = Phase::BoxHeader;

    uint64_t pos_                = 0;
    uint64_t last_window_offset_ = 0;
    bool have_window_            = false;

    std::array<std::byte, 16> header_ {};
    uint32_t header_len_ = 0;

    uint64_t box_start_       = 0;
    uint64_t box_end_         = 0;
    uint64_t box_header_size_ = 0;
    uint32_t box_type_        = 0;
    bool box_open_ended_      = false;
    uint32_t top_level_boxes_ = 0;
    bool seen_movie_          = false;

    std::vector<std::byte> box_buf_;
};

}  // namespace mediaprobe
