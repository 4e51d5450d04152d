#include "mediaprobe/batch_codec.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mediaprobe {

struct RecordSeed final {
    std::string name;
    std::string brand;
    std::string video;
    std::string audio;
    uint64_t size = 0;
};


static void
batch_survives_redirect_url(const std::vector<RecordSeed>& seeds,
                            const std::vector<std::string>& timeline)
{
    const ValidationPolicy policy;
    std::vector<FileRecord> records;
    records.reserve(seeds.size());
    for (size_t i = 0; i < seeds.size(); ++i) {
        records.push_back(classify_media(seeds[i].name, seeds[i].brand,
                                         seeds[i].video, seeds[i].audio,
                                         seeds[i].size, policy));
    }
    const ProbePayload payload = make_probe_payload(records, timeline);
    const std::string url      = build_redirect_url(
        "https://host/app?x=1", encode_results_param(payload));

    std::string raw;
    ASSERT_TRUE(extract_query_param(url, "results", &raw));
    ProbePayload decoded;
    std::string error;
    ASSERT_EQ(decode_results_param(raw, policy, &decoded, &error),
              ResultsDecodeStatus::Ok)
        << error;
    ASSERT_EQ(decoded.metadata.size(), records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        ASSERT_EQ(decoded.metadata[i].byte_size, records[i].byte_size);
        ASSERT_EQ(decoded.metadata[i].size_flag, records[i].size_flag);
        ASSERT_EQ(decoded.metadata[i].format_flag, records[i].format_flag);
    }
    ASSERT_EQ(decoded.timeline.size(), timeline.size());
}


static void
base64_round_trip(const std::string& text)
{
    std::string out;
    ASSERT_TRUE(base64_decode(base64_encode(text), &out));
    ASSERT_EQ(out, text);

    std::string unescaped;
    ASSERT_TRUE(percent_decode(url_encode(text), &unescaped));
    ASSERT_EQ(unescaped, text);
}


FUZZ_TEST(BatchCodecFuzz, batch_survives_redirect_url)
    .WithDomains(
        fuzztest::VectorOf(
            fuzztest::StructOf<RecordSeed>(
                fuzztest::PrintableAsciiString().WithMaxSize(32),
                fuzztest::ElementOf<std::string>({ "isom", "qt  ", "mp42",
                                                   "" }),
                fuzztest::PrintableAsciiString().WithMaxSize(16),
                fuzztest::PrintableAsciiString().WithMaxSize(16),
                fuzztest::Arbitrary<uint64_t>()))
            .WithMaxSize(16),
        fuzztest::VectorOf(fuzztest::PrintableAsciiString().WithMaxSize(64))
            .WithMaxSize(16));

FUZZ_TEST(BatchCodecFuzz, base64_round_trip);

}  // namespace mediaprobe
