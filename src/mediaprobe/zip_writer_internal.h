#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprobe::detail {

/// Result of \ref ZipWriter operations.
enum class ZipStatus : uint8_t {
    Ok,
    /// Built without zlib.
    Unsupported,
    CompressFailed,
    /// Entry or archive exceeds the classic (non-ZIP64) format.
    TooLarge,
};

/**
 * \brief Minimal deterministic ZIP archive builder (deflate, no ZIP64).
 *
 * Every entry carries the same fixed DOS timestamp (1980-01-01 00:00) so the
 * archive bytes depend only on entry names, contents and order.
 */
class ZipWriter final {
public:
    ZipStatus add(std::string_view name, std::string_view data);
    /// Appends the central directory; the writer is empty afterwards.
    ZipStatus finish(std::vector<std::byte>* out);

    size_t entry_count() const noexcept;

private:
    struct Entry final {
        std::string name;
        uint32_t crc               = 0;
        uint32_t compressed_size   = 0;
        uint32_t uncompressed_size = 0;
        uint32_t local_offset      = 0;
    };

    std::vector<std::byte> bytes_;
    std::vector<Entry> entries_;
};

}  // namespace mediaprobe::detail
