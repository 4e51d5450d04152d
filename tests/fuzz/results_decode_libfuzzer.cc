#include "mediaprobe/batch_codec.h"
#include "mediaprobe/host_bridge.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace mediaprobe {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

}  // namespace mediaprobe

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace mediaprobe;

    const std::string_view text(reinterpret_cast<const char*>(data), size);
    const ValidationPolicy policy;

    // Raw query value.
    ProbePayload out;
    std::string error;
    ResultsDecodeStatus st = decode_results_param(text, policy, &out, &error);
    if (st != ResultsDecodeStatus::Ok && !out.metadata.empty()) {
        fuzz_trap();
    }
    if (st != ResultsDecodeStatus::Ok && st != ResultsDecodeStatus::Absent
        && error.empty()) {
        fuzz_trap();
    }

    // Same bytes as a JSON document behind a valid transport encoding.
    st = decode_results_param(base64_encode(text), policy, &out, &error);
    if (st == ResultsDecodeStatus::Ok) {
        // Whatever decoded must survive our own encoding.
        ProbePayload again;
        const ProbePayload payload = make_probe_payload(out.metadata,
                                                        out.timeline);
        if (decode_results_param(encode_results_param(payload), policy,
                                 &again, &error)
            != ResultsDecodeStatus::Ok) {
            fuzz_trap();
        }
        if (again.metadata.size() != out.metadata.size()) {
            fuzz_trap();
        }
    }

    InboundMessage message;
    (void)parse_inbound_message(text, &message);
    return 0;
}
