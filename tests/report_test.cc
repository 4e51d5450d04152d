#include "mediaprobe/report.h"

#include "mediaprobe/build_info.h"

#include <gtest/gtest.h>

#include <cstring>
#include <ctime>
#include <string>
#include <vector>

namespace mediaprobe {
namespace {

    static std::vector<FileRecord> sample_records()
    {
        const ValidationPolicy policy;
        std::vector<FileRecord> r;
        r.push_back(classify_media("clip.mp4", "isom", "avc1", "mp4a",
                                   10ULL * 1024ULL * 1024ULL, policy));
        r.push_back(classify_media("big <&> \"one\".mov", "qt  ", "hvc1", "",
                                   200ULL * 1024ULL * 1024ULL + 1ULL, policy));
        r.push_back(make_extension_record("clip.avi", 1536, policy));
        return r;
    }


    static uint16_t read_u16le(const std::vector<std::byte>& b, size_t off)
    {
        return static_cast<uint16_t>(static_cast<uint16_t>(b[off])
                                     | (static_cast<uint16_t>(b[off + 1])
                                        << 8));
    }


    static bool contains_text(const std::vector<std::byte>& b,
                              std::string_view s)
    {
        const std::string_view hay(reinterpret_cast<const char*>(b.data()),
                                   b.size());
        return hay.find(s) != std::string_view::npos;
    }

}  // namespace


TEST(Report, FormatsSizesAndCodecs)
{
    EXPECT_EQ(format_size_mib(0), "0.00 MB");
    EXPECT_EQ(format_size_mib(200ULL * 1024ULL * 1024ULL), "200.00 MB");
    EXPECT_EQ(format_size_mib(1536ULL * 1024ULL), "1.50 MB");

    FileRecord r;
    r.video_codec = "h264";
    r.audio_codec = "aac";
    EXPECT_EQ(format_codec_summary(r), "Video: h264, Audio: aac");
}


TEST(Report, TableHasOneRowPerRecord)
{
    const ReportTable t = build_report_table(sample_records());
    ASSERT_EQ(t.header.size(), kReportColumnCount);
    EXPECT_EQ(t.header[0], "File Name");
    EXPECT_EQ(t.header[6], "File Size Flag");
    ASSERT_EQ(t.rows.size(), 3U);

    const std::vector<std::string>& mp4 = t.rows[0];
    ASSERT_EQ(mp4.size(), kReportColumnCount);
    EXPECT_EQ(mp4[static_cast<size_t>(ReportColumn::FileName)], "clip.mp4");
    EXPECT_EQ(mp4[static_cast<size_t>(ReportColumn::Format)], "mp4");
    EXPECT_EQ(mp4[static_cast<size_t>(ReportColumn::FormatFlag)],
              "good to go");
    EXPECT_EQ(mp4[static_cast<size_t>(ReportColumn::Codecs)],
              "Video: h264, Audio: aac");
    EXPECT_EQ(mp4[static_cast<size_t>(ReportColumn::Size)], "10.00 MB");

    const std::vector<std::string>& mov = t.rows[1];
    EXPECT_EQ(mov[static_cast<size_t>(ReportColumn::Codecs)],
              "Video: hevc, Audio: none");
    EXPECT_EQ(mov[static_cast<size_t>(ReportColumn::SizeFlag)], "error");

    const std::vector<std::string>& avi = t.rows[2];
    EXPECT_EQ(avi[static_cast<size_t>(ReportColumn::FormatFlag)], "error");
    EXPECT_EQ(avi[static_cast<size_t>(ReportColumn::CodecFlag)], "error");
    EXPECT_EQ(avi[static_cast<size_t>(ReportColumn::SizeFlag)], "good to go");
}


TEST(Report, EmptyBatchStillHasHeader)
{
    const ReportTable t = build_report_table({});
    EXPECT_EQ(t.header.size(), kReportColumnCount);
    EXPECT_TRUE(t.rows.empty());
}


TEST(Report, XlsxExportIsAZipWorkbook)
{
    std::vector<std::byte> xlsx;
    const ReportStatus st = export_report_xlsx(sample_records(), {}, &xlsx);
    if (!build_info().xlsx_export) {
        EXPECT_EQ(st, ReportStatus::Unsupported);
        EXPECT_TRUE(xlsx.empty());
        return;
    }
    ASSERT_EQ(st, ReportStatus::Ok);
    ASSERT_GT(xlsx.size(), 22U);
    EXPECT_EQ(std::memcmp(xlsx.data(), "PK\x03\x04", 4), 0);
    const size_t eocd = xlsx.size() - 22U;
    EXPECT_EQ(std::memcmp(xlsx.data() + eocd, "PK\x05\x06", 4), 0);
    EXPECT_EQ(read_u16le(xlsx, eocd + 10U), 6U);

    EXPECT_TRUE(contains_text(xlsx, "xl/worksheets/sheet1.xml"));
    EXPECT_FALSE(contains_text(xlsx, "xl/worksheets/sheet2.xml"));
}


TEST(Report, TimelineSheetIsAddedWhenPresent)
{
    if (!build_info().xlsx_export) {
        GTEST_SKIP() << "built without zlib";
    }
    const std::vector<std::string> timeline = {
        "[+0.000s] Processing 3 file(s).",
        "[+0.120s] Processed 3 file(s).",
    };
    std::vector<std::byte> xlsx;
    ASSERT_EQ(export_report_xlsx(sample_records(), timeline, &xlsx),
              ReportStatus::Ok);
    const size_t eocd = xlsx.size() - 22U;
    EXPECT_EQ(read_u16le(xlsx, eocd + 10U), 7U);
    EXPECT_TRUE(contains_text(xlsx, "xl/worksheets/sheet2.xml"));
}


TEST(Report, XlsxExportIsDeterministic)
{
    if (!build_info().xlsx_export) {
        GTEST_SKIP() << "built without zlib";
    }
    std::vector<std::byte> a;
    std::vector<std::byte> b;
    ASSERT_EQ(export_report_xlsx(sample_records(), { "line" }, &a),
              ReportStatus::Ok);
    ASSERT_EQ(export_report_xlsx(sample_records(), { "line" }, &b),
              ReportStatus::Ok);
    EXPECT_EQ(a, b);
}


TEST(Report, NullOutputIsAnError)
{
    EXPECT_EQ(export_report_xlsx(sample_records(), {}, nullptr),
              ReportStatus::InternalError);
    EXPECT_STREQ(report_status_name(ReportStatus::Unsupported), "unsupported");
}


TEST(Report, SuggestedFilename)
{
    std::tm when {};
    when.tm_year = 2024 - 1900;
    when.tm_mon  = 2;
    when.tm_mday = 5;
    when.tm_hour = 7;
    when.tm_min  = 8;
    when.tm_sec  = 9;
    EXPECT_EQ(suggested_report_filename(when),
              "video_metadata_2024-03-05T07-08-09.xlsx");

    const std::string now = suggested_report_filename();
    EXPECT_EQ(now.rfind("video_metadata_", 0), 0U);
    EXPECT_EQ(now.size(), std::string("video_metadata_2024-03-05T07-08-09.xlsx")
                              .size());
}

}  // namespace mediaprobe
