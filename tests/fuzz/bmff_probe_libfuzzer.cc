#include "mediaprobe/bmff_probe.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

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

    if (size == 0) {
        return 0;
    }

    // First byte picks the window size so chunk boundaries land everywhere.
    const size_t window = static_cast<size_t>(data[0]) + 1U;
    const std::span<const std::byte> file(
        reinterpret_cast<const std::byte*>(data + 1), size - 1);

    ProbeLimits limits;
    limits.max_structural_box_bytes = 1U << 20;

    BmffProbeParser parser(limits);
    ProbeStatus st = ProbeStatus::NeedMore;
    size_t off     = 0;
    while (off < file.size() && st == ProbeStatus::NeedMore) {
        const size_t n = (file.size() - off) < window ? (file.size() - off)
                                                      : window;
        st = parser.append(off, file.subspan(off, n));
        if (parser.buffered_bytes() > limits.max_structural_box_bytes + 16U) {
            fuzz_trap();
        }
        off += n;
    }
    if (st == ProbeStatus::NeedMore) {
        st = parser.flush();
    }
    if (st == ProbeStatus::NeedMore) {
        fuzz_trap();
    }
    if ((st == ProbeStatus::Failed) != (parser.error() != ProbeError::None)) {
        fuzz_trap();
    }
    if (st == ProbeStatus::Ready
        && parser.info().movie_offset >= static_cast<uint64_t>(file.size())) {
        fuzz_trap();
    }

    // Terminal status is sticky.
    const ProbeError err = parser.error();
    if (parser.append(off, file) != st || parser.flush() != st
        || parser.error() != err) {
        fuzz_trap();
    }
    return 0;
}
