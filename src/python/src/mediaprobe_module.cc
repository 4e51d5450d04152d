#include "mediaprobe/batch_codec.h"
#include "mediaprobe/batch_probe.h"
#include "mediaprobe/build_info.h"
#include "mediaprobe/classify.h"
#include "mediaprobe/event_loop.h"
#include "mediaprobe/probe_timeline.h"
#include "mediaprobe/report.h"
#include "mediaprobe/resource_policy.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace mediaprobe {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static std::pair<std::vector<FileRecord>, std::vector<std::string>>
    probe_files(const std::vector<std::string>& paths,
                const MediaProbePolicy& policy)
    {
        std::vector<FileRecord> records;
        std::vector<std::string> lines;
        {
            nb::gil_scoped_release gil_release;

            EventLoop loop(LoopClock::Steady);
            ProbeTimeline timeline(loop);
            BatchOptions options;
            apply_resource_policy(policy, &options);
            BatchProbe batch(loop, options, &timeline);

            bool done = false;
            const bool started
                = batch.run(open_file_sources(loop, paths),
                            [&](const std::vector<FileRecord>& out) {
                                records = out;
                                done    = true;
                            });
            if (started) {
                loop.run_until([&]() { return done; });
            }
            lines = timeline.lines();
        }
        return { std::move(records), std::move(lines) };
    }


    static nb::bytes export_xlsx_to_python(
        const std::vector<FileRecord>& records,
        const std::vector<std::string>& timeline)
    {
        std::vector<std::byte> out;
        ReportStatus st = ReportStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            st = export_report_xlsx(records, timeline, &out);
        }
        if (st != ReportStatus::Ok) {
            throw std::runtime_error(std::string("XLSX export failed: ")
                                     + report_status_name(st));
        }
        return nb::bytes(reinterpret_cast<const char*>(out.data()),
                         out.size());
    }


    static nb::object decode_results_to_python(const std::string& value,
                                               const ValidationPolicy& policy)
    {
        ProbePayload payload;
        std::string error;
        const ResultsDecodeStatus st = decode_results_param(value, policy,
                                                            &payload, &error);
        if (st == ResultsDecodeStatus::Absent) {
            return nb::none();
        }
        if (st != ResultsDecodeStatus::Ok) {
            throw std::invalid_argument(error);
        }
        nb::dict d;
        d["metadata"]          = nb::cast(std::move(payload.metadata));
        d["timeline"]          = nb::cast(std::move(payload.timeline));
        d["payload_size_hint"] = payload.payload_size_hint;
        return d;
    }

}  // namespace
}  // namespace mediaprobe


NB_MODULE(_mediaprobe, m)
{
    using namespace mediaprobe;

    m.doc()               = "mediaprobe container validation bindings (nanobind).";
    m.attr("__version__") = MEDIAPROBE_VERSION_STRING;

    nb::enum_<Flag>(m, "Flag")
        .value("Pass", Flag::Pass)
        .value("Fail", Flag::Fail);

    nb::class_<FileRecord>(m, "FileRecord")
        .def(nb::init<>())
        .def_rw("name", &FileRecord::name)
        .def_rw("byte_size", &FileRecord::byte_size)
        .def_rw("container_format", &FileRecord::container_format)
        .def_rw("video_codec", &FileRecord::video_codec)
        .def_rw("audio_codec", &FileRecord::audio_codec)
        .def_rw("format_flag", &FileRecord::format_flag)
        .def_rw("codec_flag", &FileRecord::codec_flag)
        .def_rw("size_flag", &FileRecord::size_flag)
        .def("__eq__", [](const FileRecord& a, const FileRecord& b) {
            return a == b;
        })
        .def("__repr__", [](const FileRecord& r) {
            return "FileRecord(" + r.name + ", " + r.container_format + ", "
                   + r.video_codec + ", " + r.audio_codec + ", "
                   + std::to_string(r.byte_size) + ")";
        });

    nb::class_<ValidationPolicy>(m, "ValidationPolicy")
        .def(nb::init<>())
        .def_rw("allowed_formats", &ValidationPolicy::allowed_formats)
        .def_rw("allowed_video_codecs", &ValidationPolicy::allowed_video_codecs)
        .def_rw("max_size_mib", &ValidationPolicy::max_size_mib);

    nb::class_<ProbeLimits>(m, "ProbeLimits")
        .def(nb::init<>())
        .def_rw("max_structural_box_bytes",
                &ProbeLimits::max_structural_box_bytes)
        .def_rw("max_top_level_boxes", &ProbeLimits::max_top_level_boxes)
        .def_rw("max_tracks", &ProbeLimits::max_tracks);

    nb::class_<SchedulerOptions>(m, "SchedulerOptions")
        .def(nb::init<>())
        .def_rw("chunk_size", &SchedulerOptions::chunk_size)
        .def_rw("timeout_ms", &SchedulerOptions::timeout_ms)
        .def_rw("follow_skip_hints", &SchedulerOptions::follow_skip_hints);

    nb::class_<MediaProbePolicy>(m, "ResourcePolicy")
        .def(nb::init<>())
        .def_rw("scheduler", &MediaProbePolicy::scheduler)
        .def_rw("probe_limits", &MediaProbePolicy::probe_limits)
        .def_rw("validation", &MediaProbePolicy::validation)
        .def_rw("container_extensions",
                &MediaProbePolicy::container_extensions);

    m.def(
        "classify",
        [](const std::string& name, const std::string& brand,
           const std::string& video_codec, const std::string& audio_codec,
           uint64_t byte_size, nb::object policy_obj) {
            ValidationPolicy policy;
            if (!policy_obj.is_none()) {
                policy = nb::cast<ValidationPolicy>(policy_obj);
            }
            return classify_media(name, brand, video_codec, audio_codec,
                                  byte_size, policy);
        },
        "name"_a, "brand"_a, "video_codec"_a, "audio_codec"_a,
        "byte_size"_a, "policy"_a = nb::none());

    m.def(
        "evaluate_policy",
        [](FileRecord record, const ValidationPolicy& policy) {
            evaluate_policy(&record, policy);
            return record;
        },
        "record"_a, "policy"_a);

    m.def(
        "probe_files",
        [](const std::vector<std::string>& paths, nb::object policy_obj) {
            MediaProbePolicy policy;
            if (!policy_obj.is_none()) {
                policy = nb::cast<MediaProbePolicy>(policy_obj);
            }
            return probe_files(paths, policy);
        },
        "paths"_a, "policy"_a = nb::none());

    m.def(
        "encode_results",
        [](std::vector<FileRecord> records, std::vector<std::string> timeline) {
            return encode_results_param(
                make_probe_payload(std::move(records), std::move(timeline)));
        },
        "records"_a, "timeline"_a = std::vector<std::string> {});

    m.def(
        "decode_results",
        [](const std::string& value, nb::object policy_obj) {
            ValidationPolicy policy;
            if (!policy_obj.is_none()) {
                policy = nb::cast<ValidationPolicy>(policy_obj);
            }
            return decode_results_to_python(value, policy);
        },
        "value"_a, "policy"_a = nb::none());

    m.def(
        "build_redirect_url",
        [](const std::string& base_url, const std::string& encoded) {
            return build_redirect_url(base_url, encoded);
        },
        "base_url"_a, "encoded"_a);

    m.def(
        "report_table",
        [](const std::vector<FileRecord>& records) {
            ReportTable t = build_report_table(records);
            return std::make_pair(std::move(t.header), std::move(t.rows));
        },
        "records"_a);

    m.def("export_xlsx", &export_xlsx_to_python, "records"_a,
          "timeline"_a = std::vector<std::string> {});

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["compiler_id"]          = sv_to_py(bi.compiler_id);
        d["compiler_version"]     = sv_to_py(bi.compiler_version);
        d["shared_library"]       = nb::bool_(bi.shared_library);
        d["json_version"]         = sv_to_py(bi.json_version);
        d["xlsx_export"]          = nb::bool_(bi.xlsx_export);
        d["zlib_version"]         = sv_to_py(bi.zlib_version);
        d["default_chunk_size"]   = bi.default_chunk_size;
        d["default_timeout_ms"]   = bi.default_timeout_ms;
        d["default_max_size_mib"] = bi.default_max_size_mib;
        return d;
    });

    m.def("info_lines", &info_lines);
}
