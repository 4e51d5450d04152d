#pragma once

#include "mediaprobe/classify.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file batch_codec.h
 * \brief JSON/base64/URL encodings used to hand a batch to the host.
 *
 * Wire formats:
 * - outbound value: `{"metadata": [...], "timeline": [...],
 *   "payloadSizeHint": N}`;
 * - redirect: `<base>?results=<urlEncode(base64(utf8(JSON)))>` where the JSON
 *   object holds `metadata` and `timeline` only.
 *
 * Record keys: `fileName`, `format`, `videoCodec`, `audioCodec`, `size`,
 * `formatFlag`, `codecFlag`, `sizeFlag`.
 */

namespace mediaprobe {

/// Batch as exchanged with the host.
struct ProbePayload final {
    std::vector<FileRecord> metadata;
    /// Rendered timeline lines.
    std::vector<std::string> timeline;
    /// Length of the base64 encoding of `{metadata, timeline}`.
    uint64_t payload_size_hint = 0;
};

/// Builds a payload and computes its size hint.
ProbePayload
make_probe_payload(std::vector<FileRecord> metadata,
                   std::vector<std::string> timeline);

/// Compact JSON text of `{metadata, timeline}`.
std::string
results_json(const ProbePayload& payload);

/// Compact JSON text of `{metadata, timeline, payloadSizeHint}`.
std::string
outbound_value_json(const ProbePayload& payload);

/// base64(utf8(results_json(payload))), not URL-encoded.
std::string
encode_results_param(const ProbePayload& payload);

/// Standard alphabet, padded.
std::string
base64_encode(std::span<const std::byte> bytes);

std::string
base64_encode(std::string_view text);

/// Encoded length for \p byte_count input bytes.
uint64_t
base64_encoded_size(uint64_t byte_count) noexcept;

/**
 * \brief Decodes standard base64.
 *
 * Padding is optional; ASCII whitespace is ignored. Any other character
 * outside the alphabet fails the decode.
 */
bool
base64_decode(std::string_view text, std::string* out);

/// Percent-encodes everything except `A-Z a-z 0-9 - _ . ! ~ * ' ( )`.
std::string
url_encode(std::string_view text);

/// Decodes `%XX` escapes; `+` is kept literally. Fails on a bad escape.
bool
percent_decode(std::string_view text, std::string* out);

/**
 * \brief Appends `results=<urlEncode(encoded)>` to \p base_url.
 *
 * Uses `?` or `&` depending on whether \p base_url already has a query; any
 * fragment of \p base_url is dropped.
 */
std::string
build_redirect_url(std::string_view base_url, std::string_view encoded);

/// Finds the raw (still percent-encoded) value of \p key in \p url's query.
bool
extract_query_param(std::string_view url, std::string_view key,
                    std::string* out);

enum class ResultsDecodeStatus : uint8_t {
    Ok,
    /// Empty value: nothing to decode.
    Absent,
    BadPercentEncoding,
    BadBase64,
    BadJson,
    /// Valid JSON that is not a batch.
    BadShape,
};

const char*
results_decode_status_name(ResultsDecodeStatus status) noexcept;

/**
 * \brief Decodes an inbound `results` value.
 *
 * Accepts `{metadata, timeline}` or a bare record list. Missing record
 * fields default to `unknown`/0; records without valid flags are re-evaluated
 * against \p policy. On failure \p error receives a message suitable for
 * display and \p out is left empty.
 */
ResultsDecodeStatus
decode_results_param(std::string_view value, const ValidationPolicy& policy,
                     ProbePayload* out, std::string* error);

}  // namespace mediaprobe
