#include "mediaprobe/batch_codec.h"
#include "mediaprobe/batch_probe.h"
#include "mediaprobe/build_info.h"
#include "mediaprobe/event_loop.h"
#include "mediaprobe/probe_sandbox.h"
#include "mediaprobe/probe_timeline.h"
#include "mediaprobe/report.h"
#include "mediaprobe/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprobe {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "       %s [options] --decode <value|url>\n"
            "\n"
            "Validates media files against the format/codec/size policy by\n"
            "probing their container structure.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print mediaprobe build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --chunk-bytes N        Read window size (default: 4194304)\n"
            "  --timeout-ms N         Per-file timeout (default: 45000, 0=none)\n"
            "  --max-size-mib N       Size policy limit in MiB (default: 200)\n"
            "  --skip-payload         Jump over payload boxes instead of reading them\n"
            "  --timeline             Print the diagnostic timeline\n"
            "  --host-url URL         Deliver results through a host redirect URL\n"
            "  --direct               Deliver results through a direct host object\n"
            "  --xlsx PATH            Write an XLSX report ('-' = suggested name)\n"
            "  --decode VALUE         Decode a 'results' value (or URL) and print it\n",
            argv0 ? argv0 : "mediaprobe", argv0 ? argv0 : "mediaprobe");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static void print_table(const ReportTable& table)
    {
        std::vector<size_t> widths(table.header.size(), 0);
        for (size_t c = 0; c < table.header.size(); ++c) {
            widths[c] = table.header[c].size();
        }
        for (const auto& row : table.rows) {
            for (size_t c = 0; c < row.size() && c < widths.size(); ++c) {
                if (row[c].size() > widths[c]) {
                    widths[c] = row[c].size();
                }
            }
        }

        auto print_row = [&](const std::vector<std::string>& cells) {
            for (size_t c = 0; c < cells.size(); ++c) {
                std::printf("%s%-*s", c == 0 ? "" : "  ",
                            static_cast<int>(widths[c]), cells[c].c_str());
            }
            std::printf("\n");
        };
        print_row(table.header);
        for (const auto& row : table.rows) {
            print_row(row);
        }
    }


    static void print_timeline(const std::vector<std::string>& lines)
    {
        std::printf("timeline:\n");
        for (size_t i = 0; i < lines.size(); ++i) {
            std::printf("  %s\n", lines[i].c_str());
        }
    }


    static bool write_file_bytes(const std::string& path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path.c_str(), "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool closed = std::fclose(f) == 0;
        return closed && written == bytes.size();
    }


    static bool export_xlsx(const std::vector<FileRecord>& records,
                            const std::vector<std::string>& timeline,
                            std::string path)
    {
        std::vector<std::byte> bytes;
        const ReportStatus st = export_report_xlsx(records, timeline, &bytes);
        if (st != ReportStatus::Ok) {
            std::fprintf(stderr, "xlsx export failed: %s\n",
                         report_status_name(st));
            return false;
        }
        if (path == "-") {
            path = suggested_report_filename();
        }
        if (!write_file_bytes(path, bytes)) {
            std::fprintf(stderr, "cannot write %s\n", path.c_str());
            return false;
        }
        std::printf("xlsx: %s (%zu bytes, %.*s)\n", path.c_str(), bytes.size(),
                    static_cast<int>(kXlsxContentType.size()),
                    kXlsxContentType.data());
        return true;
    }


    /// Host object that prints the delivered value.
    class PrintingDirectHost final : public DirectHost {
    public:
        bool set_component_value(const ProbePayload& payload) override
        {
            std::printf("value: %s\n", outbound_value_json(payload).c_str());
            return true;
        }
        bool set_component_ready() override { return true; }
        bool set_frame_height(uint32_t) override { return true; }
    };


    /// Environment of a command-line run: no parent frame to message.
    class CliHostEnvironment final : public HostEnvironment {
    public:
        CliHostEnvironment(std::string host_url, bool direct)
            : host_url_(std::move(host_url))
            , direct_(direct)
        {
        }

        DirectHost* find_direct_host() override
        {
            return direct_ ? &printer_ : nullptr;
        }

        bool post_message(const OutboundMessage&) override { return false; }

        std::string host_base_url() const override { return host_url_; }

        bool navigate_top(const std::string& url) override
        {
            std::printf("redirect: %s\n", url.c_str());
            return true;
        }

    private:
        std::string host_url_;
        bool direct_ = false;
        PrintingDirectHost printer_;
    };


    static int run_decode(std::string_view value, const ValidationPolicy& policy,
                          bool show_timeline)
    {
        std::string param;
        if (value.find("://") != std::string_view::npos
            || value.find('?') != std::string_view::npos) {
            if (!extract_query_param(value, "results", &param)) {
                std::printf("no results parameter\n");
                return 0;
            }
            value = param;
        }

        ProbePayload payload;
        std::string error;
        const ResultsDecodeStatus st = decode_results_param(value, policy,
                                                            &payload, &error);
        if (st == ResultsDecodeStatus::Absent) {
            std::printf("no results parameter\n");
            return 0;
        }
        if (st != ResultsDecodeStatus::Ok) {
            std::fprintf(stderr, "%s\n", error.c_str());
            return 1;
        }
        std::printf("decoded %zu record(s) (payload %llu characters)\n",
                    payload.metadata.size(),
                    static_cast<unsigned long long>(
                        payload.payload_size_hint));
        print_table(build_report_table(payload.metadata));
        if (show_timeline) {
            print_timeline(payload.timeline);
        }
        return 0;
    }

}  // namespace
}  // namespace mediaprobe


int
main(int argc, char** argv)
{
    using namespace mediaprobe;

    bool show_build_info = true;
    bool show_timeline   = false;
    bool direct          = false;
    bool decode_mode     = false;
    std::string host_url;
    std::string xlsx_path;
    std::string decode_value;
    std::vector<std::string> paths;
    MediaProbePolicy policy;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if (std::strcmp(arg, "--timeline") == 0) {
            show_timeline = true;
            continue;
        }
        if (std::strcmp(arg, "--skip-payload") == 0) {
            policy.scheduler.follow_skip_hints = true;
            continue;
        }
        if (std::strcmp(arg, "--direct") == 0) {
            direct = true;
            continue;
        }
        if (std::strcmp(arg, "--chunk-bytes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v) || v == 0U) {
                std::fprintf(stderr, "invalid --chunk-bytes value\n");
                return 2;
            }
            policy.scheduler.chunk_size = v;
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--timeout-ms") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --timeout-ms value\n");
                return 2;
            }
            policy.scheduler.timeout_ms = v;
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-size-mib") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-size-mib value\n");
                return 2;
            }
            policy.validation.max_size_mib = v;
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--host-url") == 0 && i + 1 < argc) {
            host_url = argv[i + 1];
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--xlsx") == 0 && i + 1 < argc) {
            xlsx_path = argv[i + 1];
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--decode") == 0 && i + 1 < argc) {
            decode_mode  = true;
            decode_value = argv[i + 1];
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "unknown option: %s\n", arg);
            usage(argv[0]);
            return 2;
        }
        paths.emplace_back(arg);
    }

    if (show_build_info) {
        print_build_info_header();
    }

    if (decode_mode) {
        return run_decode(decode_value, policy.validation, show_timeline);
    }
    if (paths.empty()) {
        usage(argv[0]);
        return 2;
    }

    EventLoop loop(LoopClock::Steady);
    std::vector<FileRecord> records;
    std::vector<std::string> timeline;
    bool delivery_failed = false;

    if (host_url.empty() && !direct) {
        // Local run: no host to hand results to.
        ProbeTimeline local_timeline(loop);
        BatchOptions options;
        apply_resource_policy(policy, &options);
        BatchProbe batch(loop, options, &local_timeline);
        bool done = false;
        (void)batch.run(open_file_sources(loop, paths),
                        [&](const std::vector<FileRecord>& out) {
                            records = out;
                            done    = true;
                        });
        loop.run_until([&]() { return done; });
        timeline = local_timeline.lines();
    } else {
        CliHostEnvironment env(host_url, direct);
        SandboxOptions options;
        apply_resource_policy(policy, &options);
        ProbeSandbox sandbox(loop, env, options);
        sandbox.load();

        bool done = false;
        SandboxResult result;
        (void)sandbox.analyze(open_file_sources(loop, paths),
                              [&](const SandboxResult& r) {
                                  result = r;
                                  done   = true;
                              });
        loop.run_until([&]() { return done; });
        records  = result.records;
        timeline = result.timeline;
        if (result.delivery.status != DeliveryStatus::Delivered) {
            delivery_failed = true;
            std::fprintf(stderr, "delivery failed\n");
        } else {
            std::printf("delivered via %s\n",
                        delivery_channel_name(result.delivery.channel));
        }
    }

    print_table(build_report_table(records));
    if (show_timeline) {
        print_timeline(timeline);
    }

    bool export_failed = false;
    if (!xlsx_path.empty()) {
        export_failed = !export_xlsx(records, timeline, xlsx_path);
    }
    return (delivery_failed || export_failed) ? 1 : 0;
}
