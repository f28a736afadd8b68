// ==============================================================================
// test_probe_gtest.cpp - Тесты пробника и сводки отчёта (GoogleTest)
// ==============================================================================
//
// Вместо ffprobe запускается сгенерированный shell-скрипт.
//
// ==============================================================================

#include "mediascope/probe.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

namespace mediascope::probe::test {

namespace {

class FakeProbeScript : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("mediascope_probe_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" + std::to_string(getpid());
        dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_script(const std::string& name, const std::string& body) {
        auto path = dir_ / name;
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n" << body;
        }
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_all |
                                         std::filesystem::perms::group_read |
                                         std::filesystem::perms::group_exec);
        return path.string();
    }

    std::filesystem::path dir_;
};

}  // anonymous namespace

// ==============================================================================
// Аргументы
// ==============================================================================

TEST(ProbeTest, Arguments_RequestJsonStreamsAndFormat) {
    auto args = FfprobeProber::arguments("/media/a b.mp4");

    std::vector<std::string> expected = {"-i",           "/media/a b.mp4", "-show_streams",
                                         "-show_format", "-hide_banner",   "-of",
                                         "json"};
    EXPECT_EQ(args, expected);
}

TEST(ProbeTest, Name_IsBinary) {
    FfprobeProber prober("/opt/ffmpeg/bin/ffprobe");
    EXPECT_EQ(prober.name(), "/opt/ffmpeg/bin/ffprobe");
}

// ==============================================================================
// Запуск
// ==============================================================================

TEST_F(FakeProbeScript, Probe_CapturesStdout) {
    // Arrange
    auto script = write_script("ok.sh", "printf '%s\\n' \"$@\"\necho 'noise' >&2\n");
    FfprobeProber prober(script);

    // Act
    auto result = prober.probe("/media/clip.mp4");

    // Assert
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.report,
              "-i\n/media/clip.mp4\n-show_streams\n-show_format\n-hide_banner\n-of\njson\n");
}

TEST_F(FakeProbeScript, Probe_NonZeroExit_StillOk) {
    auto script = write_script("fail.sh", "echo 'partial'\nexit 3\n");
    FfprobeProber prober(script);

    auto result = prober.probe("/media/clip.mp4");

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.report, "partial\n");
}

TEST_F(FakeProbeScript, Probe_InvalidUtf8_Replaced) {
    auto script = write_script("bytes.sh", "printf 'a\\377b'\n");
    FfprobeProber prober(script);

    auto result = prober.probe("x");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.report, "a\xef\xbf\xbd" "b");
}

TEST(ProbeTest, Probe_MissingBinary_NotOk) {
    FfprobeProber prober("/nonexistent/mediascope/ffprobe");

    auto result = prober.probe("/media/clip.mp4");

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("failed to launch"), std::string::npos);
    EXPECT_NE(result.error.find("/nonexistent/mediascope/ffprobe"), std::string::npos);
}

// ==============================================================================
// Сводка (RapidJSON)
// ==============================================================================

TEST(ProbeTest, Summary_ParsesFormatAndStreams) {
    // Arrange
    std::string report = R"({
        "streams": [
            {"index": 0, "codec_name": "h264", "codec_type": "video"},
            {"index": 1, "codec_name": "aac", "codec_type": "audio"}
        ],
        "format": {
            "format_name": "mov,mp4,m4a,3gp,3g2,mj2",
            "duration": "12.500000",
            "size": "1048576",
            "bit_rate": "671088"
        }
    })";

    // Act
    auto s = summarize_report(report);

    // Assert
    ASSERT_TRUE(s.valid);
    EXPECT_EQ(s.format_name, "mov,mp4,m4a,3gp,3g2,mj2");
    ASSERT_TRUE(s.duration_seconds.has_value());
    EXPECT_DOUBLE_EQ(*s.duration_seconds, 12.5);
    EXPECT_EQ(s.size_bytes.value_or(0), 1048576u);
    EXPECT_EQ(s.bit_rate.value_or(0), 671088u);
    ASSERT_EQ(s.streams.size(), 2u);
    EXPECT_EQ(s.streams[0].codec_type, "video");
    EXPECT_EQ(s.streams[1].codec_name, "aac");
}

TEST(ProbeTest, Summary_NumericValues) {
    auto s = summarize_report(R"({"format": {"duration": 3, "size": 42}})");

    ASSERT_TRUE(s.valid);
    EXPECT_DOUBLE_EQ(s.duration_seconds.value_or(0), 3.0);
    EXPECT_EQ(s.size_bytes.value_or(0), 42u);
    EXPECT_FALSE(s.bit_rate.has_value());
    EXPECT_TRUE(s.streams.empty());
}

TEST(ProbeTest, Summary_NotJson_Invalid) {
    EXPECT_FALSE(summarize_report("clip.mp4: Invalid data found").valid);
    EXPECT_FALSE(summarize_report("").valid);
    EXPECT_FALSE(summarize_report("[1, 2]").valid);
}

TEST(ProbeTest, Summary_NonNumericBitRate_Absent) {
    auto s = summarize_report(R"({"format": {"bit_rate": "N/A"}})");

    ASSERT_TRUE(s.valid);
    EXPECT_FALSE(s.bit_rate.has_value());
}

TEST(ProbeTest, Summary_OverflowingSize_Absent) {
    // Arrange: 2^64 и длинная строка цифр не помещаются в uint64
    auto edge = summarize_report(
        R"({"format": {"size": "18446744073709551615", "bit_rate": "18446744073709551616"}})");
    auto huge = summarize_report(R"({"format": {"size": "99999999999999999999999"}})");

    // Assert
    ASSERT_TRUE(edge.valid);
    EXPECT_EQ(edge.size_bytes.value_or(0), 18446744073709551615u);
    EXPECT_FALSE(edge.bit_rate.has_value());
    ASSERT_TRUE(huge.valid);
    EXPECT_FALSE(huge.size_bytes.has_value());
}

TEST(ProbeTest, SummaryCache_SameReport_ParsedOnce) {
    // Arrange
    SummaryCache cache;
    std::string first = R"({"format": {"format_name": "matroska,webm"}})";
    std::string second = R"({"format": {"format_name": "mov,mp4,m4a"}})";

    // Act & Assert
    EXPECT_EQ(cache.get(first).format_name, "matroska,webm");
    EXPECT_EQ(cache.get(first).format_name, "matroska,webm");
    EXPECT_EQ(cache.parse_count(), 1u);

    EXPECT_EQ(cache.get(second).format_name, "mov,mp4,m4a");
    EXPECT_EQ(cache.parse_count(), 2u);

    EXPECT_FALSE(cache.get("not json").valid);
    EXPECT_EQ(cache.get(first).format_name, "matroska,webm");
    EXPECT_EQ(cache.parse_count(), 4u);
}

}  // namespace mediascope::probe::test
