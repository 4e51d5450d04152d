#include "mediaprobe/report.h"

#include "zip_writer_internal.h"

#include <cstdio>
#include <iterator>
#include <utility>

namespace mediaprobe {
namespace {

    enum StyleId : uint32_t {
        kStyleDefault = 0,
        kStyleHeader  = 1,
        kStylePass    = 2,
        kStyleFail    = 3,
        kStyleCell    = 4,
        kStyleWrapped = 5,
    };

    static constexpr const char* kHeader[kReportColumnCount] = {
        "File Name",    "Video Format",      "Video Format Flag",
        "Video Codecs", "Video Codecs Flag", "File Size",
        "File Size Flag",
    };

    static constexpr uint32_t kColumnWidths[kReportColumnCount] = {
        50, 15, 18, 35, 18, 15, 15,
    };

    static constexpr std::string_view kMainNs
        = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
    static constexpr std::string_view kRelNs
        = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
    static constexpr std::string_view kPkgRelNs
        = "http://schemas.openxmlformats.org/package/2006/relationships";


    // Length of the valid UTF-8 sequence at s[i], or 0.
    static size_t utf8_sequence_length(std::string_view s, size_t i) noexcept
    {
        const uint8_t c = static_cast<uint8_t>(s[i]);
        size_t n        = 0;
        uint32_t cp     = 0;
        if (c < 0x80U) {
            return 1;
        } else if ((c & 0xE0U) == 0xC0U) {
            n  = 2;
            cp = c & 0x1FU;
        } else if ((c & 0xF0U) == 0xE0U) {
            n  = 3;
            cp = c & 0x0FU;
        } else if ((c & 0xF8U) == 0xF0U) {
            n  = 4;
            cp = c & 0x07U;
        } else {
            return 0;
        }
        if (i + n > s.size()) {
            return 0;
        }
        for (size_t k = 1; k < n; ++k) {
            const uint8_t cc = static_cast<uint8_t>(s[i + k]);
            if ((cc & 0xC0U) != 0x80U) {
                return 0;
            }
            cp = (cp << 6) | (cc & 0x3FU);
        }
        if ((n == 2 && cp < 0x80U) || (n == 3 && cp < 0x800U)
            || (n == 4 && (cp < 0x10000U || cp > 0x10FFFFU))
            || (cp >= 0xD800U && cp <= 0xDFFFU) || cp == 0xFFFEU
            || cp == 0xFFFFU) {
            return 0;
        }
        return n;
    }


    // XML text escaping; invalid UTF-8 becomes U+FFFD, disallowed controls
    // are dropped.
    static void append_xml_text(std::string* out, std::string_view s)
    {
        for (size_t i = 0; i < s.size();) {
            const char c = s[i];
            switch (c) {
            case '&': out->append("&amp;"); ++i; continue;
            case '<': out->append("&lt;"); ++i; continue;
            case '>': out->append("&gt;"); ++i; continue;
            case '"': out->append("&quot;"); ++i; continue;
            default: break;
            }
            const uint8_t u = static_cast<uint8_t>(c);
            if (u < 0x20U) {
                if (c == '\t' || c == '\n' || c == '\r') {
                    out->push_back(c);
                }
                ++i;
                continue;
            }
            const size_t n = utf8_sequence_length(s, i);
            if (n == 0) {
                out->append("\xEF\xBF\xBD");
                ++i;
                continue;
            }
            out->append(s.data() + i, n);
            i += n;
        }
    }


    static std::string column_letter(size_t col)
    {
        return std::string(1, static_cast<char>('A' + col));
    }


    static void append_inline_cell(std::string* out, size_t col, size_t row,
                                   uint32_t style, std::string_view text)
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "<c r=\"%s%zu\" s=\"%u\" t=\"inlineStr\">",
                      column_letter(col).c_str(), row, style);
        out->append(buf);
        out->append("<is><t xml:space=\"preserve\">");
        append_xml_text(out, text);
        out->append("</t></is></c>");
    }


    static uint32_t cell_style(size_t col, Flag flag_for_col,
                               bool is_flag_col) noexcept
    {
        if (is_flag_col) {
            return flag_for_col == Flag::Pass ? kStylePass : kStyleFail;
        }
        if (col == static_cast<size_t>(ReportColumn::FileName)
            || col == static_cast<size_t>(ReportColumn::Codecs)) {
            return kStyleWrapped;
        }
        return kStyleCell;
    }


    static std::string content_types_xml(bool with_timeline)
    {
        std::string x;
        x.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
        x.append("<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/"
                 "content-types\">");
        x.append("<Default Extension=\"rels\" ContentType=\"application/"
                 "vnd.openxmlformats-package.relationships+xml\"/>");
        x.append("<Default Extension=\"xml\" ContentType=\"application/xml\"/>");
        x.append("<Override PartName=\"/xl/workbook.xml\" ContentType=\""
                 "application/vnd.openxmlformats-officedocument.spreadsheetml."
                 "sheet.main+xml\"/>");
        x.append("<Override PartName=\"/xl/worksheets/sheet1.xml\" "
                 "ContentType=\"application/vnd.openxmlformats-officedocument."
                 "spreadsheetml.worksheet+xml\"/>");
        if (with_timeline) {
            x.append("<Override PartName=\"/xl/worksheets/sheet2.xml\" "
                     "ContentType=\"application/vnd.openxmlformats-"
                     "officedocument.spreadsheetml.worksheet+xml\"/>");
        }
        x.append("<Override PartName=\"/xl/styles.xml\" ContentType=\""
                 "application/vnd.openxmlformats-officedocument.spreadsheetml."
                 "styles+xml\"/>");
        x.append("</Types>");
        return x;
    }


    static std::string root_rels_xml()
    {
        std::string x;
        x.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
        x.append("<Relationships xmlns=\"");
        x.append(kPkgRelNs);
        x.append("\"><Relationship Id=\"rId1\" Type=\"");
        x.append(kRelNs);
        x.append("/officeDocument\" Target=\"xl/workbook.xml\"/>");
        x.append("</Relationships>");
        return x;
    }


    static std::string workbook_xml(size_t data_rows, bool with_timeline)
    {
        std::string x;
        x.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
        x.append("<workbook xmlns=\"");
        x.append(kMainNs);
        x.append("\" xmlns:r=\"");
        x.append(kRelNs);
        x.append("\"><sheets><sheet name=\"");
        append_xml_text(&x, kReportSheetName);
        x.append("\" sheetId=\"1\" r:id=\"rId1\"/>");
        if (with_timeline) {
            x.append("<sheet name=\"Timeline\" sheetId=\"2\" r:id=\"rId3\"/>");
        }
        x.append("</sheets><definedNames>");
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "<definedName name=\"_xlnm._FilterDatabase\" "
                      "localSheetId=\"0\" hidden=\"1\">'%s'!$A$1:$G$%zu"
                      "</definedName>",
                      kReportSheetName.data(), data_rows + 1U);
        x.append(buf);
        x.append("</definedNames></workbook>");
        return x;
    }


    static std::string workbook_rels_xml(bool with_timeline)
    {
        std::string x;
        x.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
        x.append("<Relationships xmlns=\"");
        x.append(kPkgRelNs);
        x.append("\"><Relationship Id=\"rId1\" Type=\"");
        x.append(kRelNs);
        x.append("/worksheet\" Target=\"worksheets/sheet1.xml\"/>");
        x.append("<Relationship Id=\"rId2\" Type=\"");
        x.append(kRelNs);
        x.append("/styles\" Target=\"styles.xml\"/>");
        if (with_timeline) {
            x.append("<Relationship Id=\"rId3\" Type=\"");
            x.append(kRelNs);
            x.append("/worksheet\" Target=\"worksheets/sheet2.xml\"/>");
        }
        x.append("</Relationships>");
        return x;
    }


    static std::string styles_xml()
    {
        std::string x;
        x.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
        x.append("<styleSheet xmlns=\"");
        x.append(kMainNs);
        x.append("\">");
        x.append("<fonts count=\"4\">"
                 "<font><sz val=\"11\"/><name val=\"Calibri\"/></font>"
                 "<font><b/><sz val=\"11\"/><color rgb=\"FFFFFFFF\"/>"
                 "<name val=\"Calibri\"/></font>"
                 "<font><b/><sz val=\"11\"/><color rgb=\"FF006100\"/>"
                 "<name val=\"Calibri\"/></font>"
                 "<font><b/><sz val=\"11\"/><color rgb=\"FF9C0006\"/>"
                 "<name val=\"Calibri\"/></font>"
                 "</fonts>");
        x.append("<fills count=\"5\">"
                 "<fill><patternFill patternType=\"none\"/></fill>"
                 "<fill><patternFill patternType=\"gray125\"/></fill>"
                 "<fill><patternFill patternType=\"solid\">"
                 "<fgColor rgb=\"FF4472C4\"/><bgColor indexed=\"64\"/>"
                 "</patternFill></fill>"
                 "<fill><patternFill patternType=\"solid\">"
                 "<fgColor rgb=\"FFC6EFCE\"/><bgColor indexed=\"64\"/>"
                 "</patternFill></fill>"
                 "<fill><patternFill patternType=\"solid\">"
                 "<fgColor rgb=\"FFFFC7CE\"/><bgColor indexed=\"64\"/>"
                 "</patternFill></fill>"
                 "</fills>");
        x.append("<borders count=\"3\">"
                 "<border><left/><right/><top/><bottom/><diagonal/></border>"
                 "<border>"
                 "<left style=\"thin\"><color rgb=\"FF000000\"/></left>"
                 "<right style=\"thin\"><color rgb=\"FF000000\"/></right>"
                 "<top style=\"thin\"><color rgb=\"FF000000\"/></top>"
                 "<bottom style=\"thin\"><color rgb=\"FF000000\"/></bottom>"
                 "<diagonal/></border>"
                 "<border>"
                 "<left style=\"thin\"><color rgb=\"FFD3D3D3\"/></left>"
                 "<right style=\"thin\"><color rgb=\"FFD3D3D3\"/></right>"
                 "<top style=\"thin\"><color rgb=\"FFD3D3D3\"/></top>"
                 "<bottom style=\"thin\"><color rgb=\"FFD3D3D3\"/></bottom>"
                 "<diagonal/></border>"
                 "</borders>");
        x.append("<cellStyleXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" "
                 "fillId=\"0\" borderId=\"0\"/></cellStyleXfs>");
        x.append("<cellXfs count=\"6\">"
                 "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\" "
                 "xfId=\"0\"/>"
                 "<xf numFmtId=\"0\" fontId=\"1\" fillId=\"2\" borderId=\"1\" "
                 "xfId=\"0\" applyFont=\"1\" applyFill=\"1\" applyBorder=\"1\" "
                 "applyAlignment=\"1\"><alignment horizontal=\"center\" "
                 "vertical=\"center\" wrapText=\"1\"/></xf>"
                 "<xf numFmtId=\"0\" fontId=\"2\" fillId=\"3\" borderId=\"2\" "
                 "xfId=\"0\" applyFont=\"1\" applyFill=\"1\" applyBorder=\"1\" "
                 "applyAlignment=\"1\"><alignment horizontal=\"center\"/></xf>"
                 "<xf numFmtId=\"0\" fontId=\"3\" fillId=\"4\" borderId=\"2\" "
                 "xfId=\"0\" applyFont=\"1\" applyFill=\"1\" applyBorder=\"1\" "
                 "applyAlignment=\"1\"><alignment horizontal=\"center\"/></xf>"
                 "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"2\" "
                 "xfId=\"0\" applyBorder=\"1\"/>"
                 "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"2\" "
                 "xfId=\"0\" applyBorder=\"1\" applyAlignment=\"1\">"
                 "<alignment vertical=\"top\" wrapText=\"1\"/></xf>"
                 "</cellXfs>");
        x.append("<cellStyles count=\"1\"><cellStyle name=\"Normal\" "
                 "xfId=\"0\" builtinId=\"0\"/></cellStyles>");
        x.append("</styleSheet>");
        return x;
    }


    static std::string report_sheet_xml(const std::vector<FileRecord>& records,
                                        const ReportTable& table)
    {
        std::string x;
        x.reserve(1024 + records.size() * 512U);
        x.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
        x.append("<worksheet xmlns=\"");
        x.append(kMainNs);
        x.append("\">");
        x.append("<sheetViews><sheetView tabSelected=\"1\" workbookViewId=\"0\">"
                 "<pane ySplit=\"1\" topLeftCell=\"A2\" activePane=\"bottomLeft\" "
                 "state=\"frozen\"/>"
                 "<selection pane=\"bottomLeft\" activeCell=\"A2\" sqref=\"A2\"/>"
                 "</sheetView></sheetViews>");
        x.append("<sheetFormatPr defaultRowHeight=\"15\"/>");

        x.append("<cols>");
        char buf[128];
        for (size_t c = 0; c < kReportColumnCount; ++c) {
            std::snprintf(buf, sizeof(buf),
                          "<col min=\"%zu\" max=\"%zu\" width=\"%u\" "
                          "customWidth=\"1\"/>",
                          c + 1U, c + 1U, kColumnWidths[c]);
            x.append(buf);
        }
        x.append("</cols>");

        x.append("<sheetData>");
        x.append("<row r=\"1\">");
        for (size_t c = 0; c < kReportColumnCount; ++c) {
            append_inline_cell(&x, c, 1, kStyleHeader, table.header[c]);
        }
        x.append("</row>");

        for (size_t i = 0; i < table.rows.size(); ++i) {
            const size_t row    = i + 2U;
            const FileRecord& r = records[i];
            const auto& cells   = table.rows[i];
            std::snprintf(buf, sizeof(buf), "<row r=\"%zu\">", row);
            x.append(buf);
            for (size_t c = 0; c < kReportColumnCount; ++c) {
                bool is_flag = true;
                Flag flag    = Flag::Fail;
                switch (static_cast<ReportColumn>(c)) {
                case ReportColumn::FormatFlag: flag = r.format_flag; break;
                case ReportColumn::CodecFlag: flag = r.codec_flag; break;
                case ReportColumn::SizeFlag: flag = r.size_flag; break;
                default: is_flag = false; break;
                }
                append_inline_cell(&x, c, row, cell_style(c, flag, is_flag),
                                   cells[c]);
            }
            x.append("</row>");
        }
        x.append("</sheetData>");

        std::snprintf(buf, sizeof(buf), "<autoFilter ref=\"A1:G%zu\"/>",
                      table.rows.size() + 1U);
        x.append(buf);
        x.append("<pageMargins left=\"0.7\" right=\"0.7\" top=\"0.75\" "
                 "bottom=\"0.75\" header=\"0.3\" footer=\"0.3\"/>");
        x.append("</worksheet>");
        return x;
    }


    static std::string timeline_sheet_xml(const std::vector<std::string>& lines)
    {
        std::string x;
        x.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
        x.append("<worksheet xmlns=\"");
        x.append(kMainNs);
        x.append("\"><cols><col min=\"1\" max=\"1\" width=\"100\" "
                 "customWidth=\"1\"/></cols><sheetData>");
        for (size_t i = 0; i < lines.size(); ++i) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "<row r=\"%zu\">", i + 1U);
            x.append(buf);
            append_inline_cell(&x, 0, i + 1U, kStyleDefault, lines[i]);
            x.append("</row>");
        }
        x.append("</sheetData></worksheet>");
        return x;
    }


    static ReportStatus from_zip_status(detail::ZipStatus st) noexcept
    {
        switch (st) {
        case detail::ZipStatus::Ok: return ReportStatus::Ok;
        case detail::ZipStatus::Unsupported: return ReportStatus::Unsupported;
        case detail::ZipStatus::TooLarge: return ReportStatus::LimitExceeded;
        case detail::ZipStatus::CompressFailed:
            return ReportStatus::InternalError;
        }
        return ReportStatus::InternalError;
    }

}  // namespace


std::string
format_size_mib(uint64_t byte_size)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f MB",
                  static_cast<double>(byte_size) / (1024.0 * 1024.0));
    return buf;
}


std::string
format_codec_summary(const FileRecord& record)
{
    std::string s("Video: ");
    s.append(record.video_codec);
    s.append(", Audio: ");
    s.append(record.audio_codec);
    return s;
}


ReportTable
build_report_table(const std::vector<FileRecord>& records)
{
    ReportTable t;
    t.header.assign(std::begin(kHeader), std::end(kHeader));
    t.rows.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        const FileRecord& r = records[i];
        std::vector<std::string> row;
        row.reserve(kReportColumnCount);
        row.push_back(r.name);
        row.push_back(r.container_format);
        row.push_back(flag_label(r.format_flag));
        row.push_back(format_codec_summary(r));
        row.push_back(flag_label(r.codec_flag));
        row.push_back(format_size_mib(r.byte_size));
        row.push_back(flag_label(r.size_flag));
        t.rows.push_back(std::move(row));
    }
    return t;
}


const char*
report_status_name(ReportStatus status) noexcept
{
    switch (status) {
    case ReportStatus::Ok: return "ok";
    case ReportStatus::Unsupported: return "unsupported";
    case ReportStatus::LimitExceeded: return "limit_exceeded";
    case ReportStatus::InternalError: return "internal_error";
    }
    return "unknown";
}


ReportStatus
export_report_xlsx(const std::vector<FileRecord>& records,
                   const std::vector<std::string>& timeline,
                   std::vector<std::byte>* out)
{
    if (!out) {
        return ReportStatus::InternalError;
    }
    out->clear();

    const ReportTable table  = build_report_table(records);
    const bool with_timeline = !timeline.empty();

    detail::ZipWriter zip;
    detail::ZipStatus st = zip.add("[Content_Types].xml",
                                   content_types_xml(with_timeline));
    if (st == detail::ZipStatus::Ok) {
        st = zip.add("_rels/.rels", root_rels_xml());
    }
    if (st == detail::ZipStatus::Ok) {
        st = zip.add("xl/workbook.xml",
                     workbook_xml(table.rows.size(), with_timeline));
    }
    if (st == detail::ZipStatus::Ok) {
        st = zip.add("xl/_rels/workbook.xml.rels",
                     workbook_rels_xml(with_timeline));
    }
    if (st == detail::ZipStatus::Ok) {
        st = zip.add("xl/styles.xml", styles_xml());
    }
    if (st == detail::ZipStatus::Ok) {
        st = zip.add("xl/worksheets/sheet1.xml",
                     report_sheet_xml(records, table));
    }
    if (st == detail::ZipStatus::Ok && with_timeline) {
        st = zip.add("xl/worksheets/sheet2.xml", timeline_sheet_xml(timeline));
    }
    if (st == detail::ZipStatus::Ok) {
        st = zip.finish(out);
    }
    if (st != detail::ZipStatus::Ok) {
        out->clear();
    }
    return from_zip_status(st);
}


std::string
suggested_report_filename(const std::tm& when)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf),
                  "video_metadata_%04d-%02d-%02dT%02d-%02d-%02d.xlsx",
                  when.tm_year + 1900, when.tm_mon + 1, when.tm_mday,
                  when.tm_hour, when.tm_min, when.tm_sec);
    return buf;
}


std::string
suggested_report_filename()
{
    const std::time_t now = std::time(nullptr);
    std::tm local {};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return suggested_report_filename(local);
}

}  // namespace mediaprobe
