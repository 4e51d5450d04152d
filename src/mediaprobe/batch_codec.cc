#include "mediaprobe/batch_codec.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <utility>

namespace mediaprobe {
namespace {

    using json = nlohmann::json;

    static constexpr char kBase64Alphabet[]
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";


    struct Base64Encoder final {
        std::string* out  = nullptr;
        uint8_t buf[3]    = { 0, 0, 0 };
        uint32_t buffered = 0;

        explicit Base64Encoder(std::string* sink) noexcept
            : out(sink)
        {
        }

        void emit_triplet(uint8_t a, uint8_t b, uint8_t c)
        {
            char out4[4];
            out4[0] = kBase64Alphabet[(a >> 2) & 0x3F];
            out4[1] = kBase64Alphabet[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
            out4[2] = kBase64Alphabet[((b & 0x0F) << 2) | ((c >> 6) & 0x03)];
            out4[3] = kBase64Alphabet[c & 0x3F];
            out->append(out4, 4);
        }

        void append_u8(uint8_t v)
        {
            buf[buffered] = v;
            buffered += 1;
            if (buffered == 3U) {
                emit_triplet(buf[0], buf[1], buf[2]);
                buffered = 0;
            }
        }

        void finish()
        {
            if (buffered == 0U) {
                return;
            }
            const uint8_t a = buf[0];
            const uint8_t b = buffered == 2U ? buf[1] : 0;
            char out4[4];
            out4[0] = kBase64Alphabet[(a >> 2) & 0x3F];
            out4[1] = kBase64Alphabet[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
            out4[2] = buffered == 2U ? kBase64Alphabet[(b & 0x0F) << 2] : '=';
            out4[3] = '=';
            out->append(out4, 4);
            buffered = 0;
        }
    };


    static int base64_value(char c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '+') {
            return 62;
        }
        if (c == '/') {
            return 63;
        }
        return -1;
    }


    static int hex_value(char c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }


    static bool is_url_unreserved(unsigned char c) noexcept
    {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
            || (c >= '0' && c <= '9')) {
            return true;
        }
        switch (c) {
        case '-':
        case '_':
        case '.':
        case '!':
        case '~':
        case '*':
        case '\'':
        case '(':
        case ')': return true;
        default: return false;
        }
    }


    static json record_to_json(const FileRecord& r)
    {
        json j = json::object();
        j["fileName"]   = r.name;
        j["format"]     = r.container_format;
        j["videoCodec"] = r.video_codec;
        j["audioCodec"] = r.audio_codec;
        j["size"]       = r.byte_size;
        j["formatFlag"] = flag_name(r.format_flag);
        j["codecFlag"]  = flag_name(r.codec_flag);
        j["sizeFlag"]   = flag_name(r.size_flag);
        return j;
    }


    static std::string string_field(const json& j, const char* key,
                                    const char* fallback)
    {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return fallback;
        }
        return it->get<std::string>();
    }


    static uint64_t size_field(const json& j)
    {
        const auto it = j.find("size");
        if (it == j.end()) {
            return 0;
        }
        if (it->is_number_unsigned()) {
            return it->get<uint64_t>();
        }
        if (it->is_number_integer()) {
            const int64_t v = it->get<int64_t>();
            return v < 0 ? 0 : static_cast<uint64_t>(v);
        }
        if (it->is_number_float()) {
            const double v = it->get<double>();
            if (!(v > 0.0) || !std::isfinite(v) || v >= 18446744073709551616.0) {
                return 0;
            }
            return static_cast<uint64_t>(v);
        }
        return 0;
    }


    static bool flag_field(const json& j, const char* key, Flag* out)
    {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return false;
        }
        return parse_flag(it->get_ref<const std::string&>(), out);
    }


    static bool record_from_json(const json& j, const ValidationPolicy& policy,
                                 FileRecord* out)
    {
        if (!j.is_object()) {
            return false;
        }
        FileRecord r;
        r.name             = string_field(j, "fileName", "unknown");
        r.container_format = string_field(j, "format", "unknown");
        r.video_codec      = string_field(j, "videoCodec", "unknown");
        r.audio_codec      = string_field(j, "audioCodec", "unknown");
        r.byte_size        = size_field(j);

        Flag format_flag = Flag::Fail;
        Flag codec_flag  = Flag::Fail;
        Flag size_flag   = Flag::Fail;
        if (flag_field(j, "formatFlag", &format_flag)
            && flag_field(j, "codecFlag", &codec_flag)
            && flag_field(j, "sizeFlag", &size_flag)) {
            r.format_flag = format_flag;
            r.codec_flag  = codec_flag;
            r.size_flag   = size_flag;
        } else {
            evaluate_policy(&r, policy);
        }
        *out = std::move(r);
        return true;
    }


    static json payload_to_json(const ProbePayload& payload)
    {
        json metadata = json::array();
        for (size_t i = 0; i < payload.metadata.size(); ++i) {
            metadata.push_back(record_to_json(payload.metadata[i]));
        }
        json timeline = json::array();
        for (size_t i = 0; i < payload.timeline.size(); ++i) {
            timeline.push_back(payload.timeline[i]);
        }
        json j        = json::object();
        j["metadata"] = std::move(metadata);
        j["timeline"] = std::move(timeline);
        return j;
    }


    static std::string dump_compact(const json& j)
    {
        // File names are not guaranteed to be valid UTF-8.
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }


    static ResultsDecodeStatus decode_fail(ResultsDecodeStatus status,
                                           std::string message,
                                           std::string* error)
    {
        if (error) {
            *error = std::move(message);
        }
        return status;
    }

}  // namespace


uint64_t
base64_encoded_size(uint64_t byte_count) noexcept
{
    return ((byte_count + 2U) / 3U) * 4U;
}


std::string
base64_encode(std::span<const std::byte> bytes)
{
    std::string out;
    out.reserve(static_cast<size_t>(base64_encoded_size(bytes.size())));
    Base64Encoder b64(&out);
    for (size_t i = 0; i < bytes.size(); ++i) {
        b64.append_u8(static_cast<uint8_t>(bytes[i]));
    }
    b64.finish();
    return out;
}


std::string
base64_encode(std::string_view text)
{
    return base64_encode(std::as_bytes(std::span<const char>(text.data(),
                                                             text.size())));
}


bool
base64_decode(std::string_view text, std::string* out)
{
    if (!out) {
        return false;
    }
    out->clear();
    out->reserve(text.size() / 4U * 3U + 3U);

    uint32_t acc     = 0;
    uint32_t bits    = 0;
    uint32_t symbols = 0;
    uint32_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        if (c == '=') {
            padding += 1;
            continue;
        }
        if (padding != 0U) {
            // Data after padding.
            return false;
        }
        const int v = base64_value(c);
        if (v < 0) {
            return false;
        }
        symbols += 1;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out->push_back(static_cast<char>((acc >> bits) & 0xFFU));
        }
    }
    if (symbols % 4U == 1U || padding > 2U) {
        return false;
    }
    if (padding != 0U && (symbols + padding) % 4U != 0U) {
        return false;
    }
    return true;
}


std::string
url_encode(std::string_view text)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() + text.size() / 2U);
    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (is_url_unreserved(c)) {
            out.push_back(static_cast<char>(c));
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[(c >> 4) & 0x0F]);
        out.push_back(kHex[c & 0x0F]);
    }
    return out;
}


bool
percent_decode(std::string_view text, std::string* out)
{
    if (!out) {
        return false;
    }
    out->clear();
    out->reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c != '%') {
            out->push_back(c);
            continue;
        }
        if (i + 2 >= text.size()) {
            return false;
        }
        const int hi = hex_value(text[i + 1]);
        const int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out->push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}


std::string
build_redirect_url(std::string_view base_url, std::string_view encoded)
{
    const size_t hash = base_url.find('#');
    if (hash != std::string_view::npos) {
        base_url = base_url.substr(0, hash);
    }

    std::string url(base_url);
    const size_t q = base_url.find('?');
    if (q == std::string_view::npos) {
        url.push_back('?');
    } else if (q + 1 < base_url.size() && base_url.back() != '&') {
        url.push_back('&');
    }
    url.append("results=");
    url.append(url_encode(encoded));
    return url;
}


bool
extract_query_param(std::string_view url, std::string_view key,
                    std::string* out)
{
    const size_t hash = url.find('#');
    if (hash != std::string_view::npos) {
        url = url.substr(0, hash);
    }
    const size_t q = url.find('?');
    if (q == std::string_view::npos) {
        return false;
    }
    std::string_view query = url.substr(q + 1);
    while (!query.empty()) {
        const size_t amp          = query.find('&');
        const std::string_view kv = query.substr(0, amp);
        const size_t eq           = kv.find('=');
        const std::string_view k  = kv.substr(0, eq);
        if (k == key) {
            if (out) {
                if (eq == std::string_view::npos) {
                    out->clear();
                } else {
                    out->assign(kv.substr(eq + 1));
                }
            }
            return true;
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return false;
}


ProbePayload
make_probe_payload(std::vector<FileRecord> metadata,
                   std::vector<std::string> timeline)
{
    ProbePayload p;
    p.metadata          = std::move(metadata);
    p.timeline          = std::move(timeline);
    p.payload_size_hint = base64_encoded_size(results_json(p).size());
    return p;
}


std::string
results_json(const ProbePayload& payload)
{
    return dump_compact(payload_to_json(payload));
}


std::string
outbound_value_json(const ProbePayload& payload)
{
    json j               = payload_to_json(payload);
    j["payloadSizeHint"] = payload.payload_size_hint;
    return dump_compact(j);
}


std::string
encode_results_param(const ProbePayload& payload)
{
    return base64_encode(results_json(payload));
}


const char*
results_decode_status_name(ResultsDecodeStatus status) noexcept
{
    switch (status) {
    case ResultsDecodeStatus::Ok: return "ok";
    case ResultsDecodeStatus::Absent: return "absent";
    case ResultsDecodeStatus::BadPercentEncoding: return "bad_percent_encoding";
    case ResultsDecodeStatus::BadBase64: return "bad_base64";
    case ResultsDecodeStatus::BadJson: return "bad_json";
    case ResultsDecodeStatus::BadShape: return "bad_shape";
    }
    return "unknown";
}


ResultsDecodeStatus
decode_results_param(std::string_view value, const ValidationPolicy& policy,
                     ProbePayload* out, std::string* error)
{
    if (error) {
        error->clear();
    }
    if (out) {
        *out = ProbePayload {};
    }
    if (value.empty()) {
        return ResultsDecodeStatus::Absent;
    }

    std::string unescaped;
    if (value.find('%') != std::string_view::npos) {
        if (!percent_decode(value, &unescaped)) {
            return decode_fail(ResultsDecodeStatus::BadPercentEncoding,
                               "Error decoding results: invalid percent "
                               "escape",
                               error);
        }
        value = unescaped;
    }

    std::string text;
    if (!base64_decode(value, &text)) {
        return decode_fail(ResultsDecodeStatus::BadBase64,
                           "Error decoding results: invalid base64", error);
    }

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        return decode_fail(ResultsDecodeStatus::BadJson,
                           std::string("Error decoding results: ") + e.what(),
                           error);
    }

    const json* records  = nullptr;
    const json* timeline = nullptr;
    if (doc.is_array()) {
        records = &doc;
    } else if (doc.is_object()) {
        const auto m = doc.find("metadata");
        if (m == doc.end() || !m->is_array()) {
            return decode_fail(ResultsDecodeStatus::BadShape,
                               "Error decoding results: missing metadata "
                               "list",
                               error);
        }
        records      = &*m;
        const auto t = doc.find("timeline");
        if (t != doc.end()) {
            if (!t->is_array()) {
                return decode_fail(ResultsDecodeStatus::BadShape,
                                   "Error decoding results: timeline is "
                                   "not a list",
                                   error);
            }
            timeline = &*t;
        }
    } else {
        return decode_fail(ResultsDecodeStatus::BadShape,
                           "Error decoding results: unexpected payload type",
                           error);
    }

    ProbePayload payload;
    payload.metadata.reserve(records->size());
    for (const json& item : *records) {
        FileRecord r;
        if (!record_from_json(item, policy, &r)) {
            return decode_fail(ResultsDecodeStatus::BadShape,
                               "Error decoding results: record is not an "
                               "object",
                               error);
        }
        payload.metadata.push_back(std::move(r));
    }
    if (timeline) {
        payload.timeline.reserve(timeline->size());
        for (const json& line : *timeline) {
            if (line.is_string()) {
                payload.timeline.push_back(line.get<std::string>());
            } else {
                payload.timeline.push_back(dump_compact(line));
            }
        }
    }
    payload.payload_size_hint = value.size();

    if (out) {
        *out = std::move(payload);
    }
    return ResultsDecodeStatus::Ok;
}

}  // namespace mediaprobe
