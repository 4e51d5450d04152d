#pragma once

#include "mediaprobe/classify.h"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file report.h
 * \brief Tabular report and styled XLSX export of a probed batch.
 */

namespace mediaprobe {

inline constexpr std::string_view kXlsxContentType
    = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";

inline constexpr std::string_view kReportSheetName = "Video Metadata";

/// Column order of \ref ReportTable.
enum class ReportColumn : uint8_t {
    FileName,
    Format,
    FormatFlag,
    Codecs,
    CodecFlag,
    Size,
    SizeFlag,
};

inline constexpr size_t kReportColumnCount = 7;

struct ReportTable final {
    std::vector<std::string> header;
    /// One row per record, \ref kReportColumnCount cells each.
    std::vector<std::vector<std::string>> rows;
};

/// `"12.34 MB"` (MiB, two decimals).
std::string
format_size_mib(uint64_t byte_size);

/// `"Video: h264, Audio: aac"`.
std::string
format_codec_summary(const FileRecord& record);

ReportTable
build_report_table(const std::vector<FileRecord>& records);

enum class ReportStatus : uint8_t {
    Ok,
    /// Built without zlib.
    Unsupported,
    /// The archive exceeds the classic ZIP limits.
    LimitExceeded,
    InternalError,
};

const char*
report_status_name(ReportStatus status) noexcept;

/**
 * \brief Writes the batch as an XLSX workbook.
 *
 * Sheet \ref kReportSheetName holds the report table (header frozen,
 * auto-filter over the full range, pass/fail cells colored). When
 * \p timeline is non-empty a second sheet `Timeline` lists it.
 *
 * Output is byte-for-byte reproducible for equal input.
 */
ReportStatus
export_report_xlsx(const std::vector<FileRecord>& records,
                   const std::vector<std::string>& timeline,
                   std::vector<std::byte>* out);

/// `video_metadata_YYYY-MM-DDTHH-MM-SS.xlsx`.
std::string
suggested_report_filename(const std::tm& when);

/// As above, for the current local time.
std::string
suggested_report_filename();

}  // namespace mediaprobe
