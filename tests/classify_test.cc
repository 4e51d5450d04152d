#include "mediaprobe/classify.h"

#include <gtest/gtest.h>

#include <cstdint>

namespace mediaprobe {

TEST(Classify, NormalizesBrands)
{
    EXPECT_EQ(normalize_brand("isom"), "mp4");
    EXPECT_EQ(normalize_brand("mp42"), "mp4");
    EXPECT_EQ(normalize_brand("qt  "), "mov");
    EXPECT_EQ(normalize_brand("QT"), "mov");
    EXPECT_EQ(normalize_brand(""), "mp4");
    EXPECT_EQ(normalize_brand("3gp5"), "3gp5");
    EXPECT_EQ(normalize_brand(" M4V "), "m4v");
}


TEST(Classify, NormalizesCodecs)
{
    EXPECT_EQ(normalize_video_codec("avc1.64001f"), "h264");
    EXPECT_EQ(normalize_video_codec("AVC3"), "h264");
    EXPECT_EQ(normalize_video_codec("hvc1"), "hevc");
    EXPECT_EQ(normalize_video_codec("hev1"), "hevc");
    EXPECT_EQ(normalize_video_codec("vp09"), "vp09");
    EXPECT_EQ(normalize_video_codec(""), "unknown");

    EXPECT_EQ(normalize_audio_codec("mp4a"), "aac");
    EXPECT_EQ(normalize_audio_codec("mp4a.40.2"), "aac");
    EXPECT_EQ(normalize_audio_codec("Opus"), "opus");
    EXPECT_EQ(normalize_audio_codec(""), "none");
}


TEST(Classify, FileExtensions)
{
    EXPECT_EQ(file_extension("clip.MP4"), "mp4");
    EXPECT_EQ(file_extension("/videos/v1.final/clip"), "");
    EXPECT_EQ(file_extension("archive.tar.gz"), "gz");
    EXPECT_EQ(file_extension("trailing."), "");

    EXPECT_TRUE(
        is_container_extension("MOV", default_container_extensions()));
    EXPECT_TRUE(
        is_container_extension("m4v", default_container_extensions()));
    EXPECT_FALSE(
        is_container_extension("avi", default_container_extensions()));
    EXPECT_FALSE(is_container_extension("", default_container_extensions()));
}


TEST(Classify, SizeLimitIsInclusive)
{
    const ValidationPolicy policy;
    const uint64_t limit = 200ULL * 1024ULL * 1024ULL;

    const FileRecord at_limit = classify_media("a.mp4", "isom", "avc1", "mp4a",
                                               limit, policy);
    EXPECT_EQ(at_limit.size_flag, Flag::Pass);

    const FileRecord over = classify_media("b.mp4", "isom", "avc1", "mp4a",
                                           limit + 1, policy);
    EXPECT_EQ(over.size_flag, Flag::Fail);

    ValidationPolicy huge;
    huge.max_size_mib = UINT64_MAX;
    const FileRecord big = classify_media("c.mp4", "isom", "avc1", "mp4a",
                                          UINT64_MAX, huge);
    EXPECT_EQ(big.size_flag, Flag::Pass);
}


TEST(Classify, ClipScenarios)
{
    const ValidationPolicy policy;
    const uint64_t ten_mib = 10ULL * 1024ULL * 1024ULL;

    const FileRecord mp4 = classify_media("clip.mp4", "isom", "avc1.64001f",
                                          "mp4a", ten_mib, policy);
    EXPECT_EQ(mp4.container_format, "mp4");
    EXPECT_EQ(mp4.video_codec, "h264");
    EXPECT_EQ(mp4.audio_codec, "aac");
    EXPECT_EQ(mp4.format_flag, Flag::Pass);
    EXPECT_EQ(mp4.codec_flag, Flag::Pass);
    EXPECT_EQ(mp4.size_flag, Flag::Pass);

    const FileRecord mov = classify_media("clip.mov", "qt  ", "hvc1", "",
                                          ten_mib, policy);
    EXPECT_EQ(mov.container_format, "mov");
    EXPECT_EQ(mov.video_codec, "hevc");
    EXPECT_EQ(mov.audio_codec, "none");
    EXPECT_EQ(mov.format_flag, Flag::Pass);
    EXPECT_EQ(mov.codec_flag, Flag::Pass);

    const FileRecord avi = make_extension_record("clip.avi", ten_mib, policy);
    EXPECT_EQ(avi.container_format, "avi");
    EXPECT_EQ(avi.video_codec, "unknown");
    EXPECT_EQ(avi.audio_codec, "unknown");
    EXPECT_EQ(avi.format_flag, Flag::Fail);
    EXPECT_EQ(avi.codec_flag, Flag::Fail);
    EXPECT_EQ(avi.size_flag, Flag::Pass);
}


TEST(Classify, ErrorRecordCarriesReason)
{
    const FileRecord r = make_error_record("broken.mp4", 1024,
                                           "Processing timeout",
                                           ValidationPolicy {});
    EXPECT_EQ(r.container_format, "error");
    EXPECT_EQ(r.video_codec, "error");
    EXPECT_EQ(r.audio_codec, "Processing timeout");
    EXPECT_EQ(r.format_flag, Flag::Fail);
    EXPECT_EQ(r.codec_flag, Flag::Fail);
    EXPECT_EQ(r.size_flag, Flag::Pass);
}


TEST(Classify, IsIdempotent)
{
    const ValidationPolicy policy;
    const FileRecord a = classify_media("x.mov", "qt  ", "avc1", "mp4a", 42,
                                        policy);
    FileRecord b = a;
    evaluate_policy(&b, policy);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, classify_media("x.mov", "qt  ", "avc1", "mp4a", 42, policy));
}


TEST(Classify, CustomPolicyIsCaseInsensitive)
{
    ValidationPolicy policy;
    policy.allowed_formats      = { "MOV" };
    policy.allowed_video_codecs = { "HEVC" };
    policy.max_size_mib         = 1;

    const FileRecord r = classify_media("x.mp4", "isom", "avc1", "", 2 << 20,
                                        policy);
    EXPECT_EQ(r.format_flag, Flag::Fail);
    EXPECT_EQ(r.codec_flag, Flag::Fail);
    EXPECT_EQ(r.size_flag, Flag::Fail);

    const FileRecord m = classify_media("y.mov", "qt  ", "hvc1", "", 1 << 20,
                                        policy);
    EXPECT_EQ(m.format_flag, Flag::Pass);
    EXPECT_EQ(m.codec_flag, Flag::Pass);
    EXPECT_EQ(m.size_flag, Flag::Pass);
}


TEST(Classify, FlagNames)
{
    EXPECT_STREQ(flag_name(Flag::Pass), "pass");
    EXPECT_STREQ(flag_label(Flag::Fail), "error");

    Flag f = Flag::Fail;
    EXPECT_TRUE(parse_flag("PASS", &f));
    EXPECT_EQ(f, Flag::Pass);
    EXPECT_TRUE(parse_flag("fail", &f));
    EXPECT_EQ(f, Flag::Fail);
    EXPECT_FALSE(parse_flag("ok", &f));
    EXPECT_FALSE(parse_flag("passed", &f));
}

}  // namespace mediaprobe
