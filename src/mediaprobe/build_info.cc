#include "mediaprobe/build_info.h"

#include "mediaprobe/build_info_generated.h"
#include "mediaprobe/chunk_scheduler.h"
#include "mediaprobe/classify.h"

#include <nlohmann/json.hpp>

#if defined(MEDIAPROBE_HAS_ZLIB) && MEDIAPROBE_HAS_ZLIB
#    include <zlib.h>
// zlib.h defines zlib_version as a macro; it collides with BuildInfo::zlib_version.
#    undef zlib_version
#endif

#include <cstdio>

#define MEDIAPROBE_STRINGIFY_IMPL(x) #x
#define MEDIAPROBE_STRINGIFY(x) MEDIAPROBE_STRINGIFY_IMPL(x)

namespace mediaprobe {
namespace {

    static BuildInfo make_build_info()
    {
        BuildInfo bi;
        bi.version             = MEDIAPROBE_BUILDINFO_VERSION;
        bi.build_type          = MEDIAPROBE_BUILDINFO_BUILD_TYPE;
        bi.build_timestamp_utc = MEDIAPROBE_BUILDINFO_BUILD_TIMESTAMP_UTC;
        bi.compiler_id         = MEDIAPROBE_BUILDINFO_CXX_COMPILER_ID;
        bi.compiler_version    = MEDIAPROBE_BUILDINFO_CXX_COMPILER_VERSION;
#if defined(MEDIAPROBE_BUILD_LINKAGE_SHARED) && MEDIAPROBE_BUILD_LINKAGE_SHARED
        bi.shared_library = true;
#endif

        bi.json_version = MEDIAPROBE_STRINGIFY(NLOHMANN_JSON_VERSION_MAJOR) "."
            MEDIAPROBE_STRINGIFY(NLOHMANN_JSON_VERSION_MINOR) "."
            MEDIAPROBE_STRINGIFY(NLOHMANN_JSON_VERSION_PATCH);
#if defined(MEDIAPROBE_HAS_ZLIB) && MEDIAPROBE_HAS_ZLIB
        bi.xlsx_export  = true;
        bi.zlib_version = ZLIB_VERSION;
#endif

        const SchedulerOptions scheduler;
        const ValidationPolicy validation;
        bi.default_chunk_size   = scheduler.chunk_size;
        bi.default_timeout_ms   = scheduler.timeout_ms;
        bi.default_max_size_mib = validation.max_size_mib;
        return bi;
    }


    static void append_sv(std::string* out, std::string_view s)
    {
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info()
{
    static const BuildInfo info = make_build_info();
    return info;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->clear();
        line1->append("mediaprobe v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(bi.shared_library ? " shared (" : " static (");
        append_sv(line1, bi.compiler_id);
        line1->append(" ");
        append_sv(line1, bi.compiler_version);
        if (!bi.build_timestamp_utc.empty()) {
            line1->append(", ");
            append_sv(line1, bi.build_timestamp_utc);
        }
        line1->append(")");
    }

    if (line2) {
        line2->clear();
        line2->append("json ");
        append_sv(line2, bi.json_version);
        line2->append(", xlsx ");
        if (bi.xlsx_export) {
            line2->append("zlib ");
            append_sv(line2, bi.zlib_version);
        } else {
            line2->append("off");
        }
        char buf[96];
        std::snprintf(buf, sizeof(buf), ", chunk %.1f MB, timeout %llu ms",
                      static_cast<double>(bi.default_chunk_size)
                          / (1024.0 * 1024.0),
                      static_cast<unsigned long long>(bi.default_timeout_ms));
        line2->append(buf);
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace mediaprobe
