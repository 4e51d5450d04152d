#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version, optional features and compiled-in defaults of this build.
 */

namespace mediaprobe {

/// Facts about the linked mediaprobe library, fixed at build time.
struct BuildInfo final {
    std::string_view version;
    /// CMake build type ("Release", "Debug", "multi-config", ...).
    std::string_view build_type;
    /// Configure time in UTC (ISO-8601); may be empty.
    std::string_view build_timestamp_utc;
    std::string_view compiler_id;
    std::string_view compiler_version;
    bool shared_library = false;

    /// nlohmann/json release used by the results codec, e.g. "3.11.3".
    std::string_view json_version;
    /// True when XLSX export is compiled in (requires zlib).
    bool xlsx_export = false;
    /// zlib release behind XLSX export; empty without it.
    std::string_view zlib_version;

    /// Defaults applied when no policy overrides them.
    uint32_t default_chunk_size   = 0;
    uint64_t default_timeout_ms   = 0;
    uint64_t default_max_size_mib = 0;
};

const BuildInfo&
build_info();

/**
 * \brief Formats the two-line header printed by the tools.
 *
 * - `mediaprobe v<version> <build_type> <static|shared> (<compiler>[, <timestamp>])`
 * - `json <version>, xlsx <zlib version|off>, chunk <MB>, timeout <ms> ms`
 *
 * Either output may be null.
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace mediaprobe
