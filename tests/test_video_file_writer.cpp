#include <gtest/gtest.h>

#include <filesystem>
#include <opencv2/core.hpp>

#include "TestSupport.hpp"
#include "recorder/VideoFileWriter.hpp"

namespace fs = std::filesystem;

class VideoFileWriterTest : public ::testing::Test {
   protected:
    void SetUp() override { dir_ = testsupport::make_temp_dir("video_writer"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static cv::Mat gradient(int w, int h, int shift) {
        cv::Mat m(h, w, CV_8UC3);
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                m.at<cv::Vec3b>(y, x) = cv::Vec3b(
                    static_cast<uchar>((x + shift) & 0xFF),
                    static_cast<uchar>((y + shift) & 0xFF),
                    static_cast<uchar>((x + y) & 0xFF));
            }
        }
        return m;
    }

    fs::path dir_;
};

TEST_F(VideoFileWriterTest, WritesDecodableMjpegAvi) {
    const fs::path file = dir_ / "clip.avi";
    {
        VideoFileWriter writer(file.string(), 320, 240, 30.0);
        ASSERT_TRUE(writer.is_open());
        for (int i = 0; i < 12; ++i) {
            ASSERT_TRUE(writer.write(gradient(320, 240, i))) << "第 " << i << " 帧";
        }
        EXPECT_EQ(writer.frames_written(), 12);
        writer.close();
        EXPECT_FALSE(writer.is_open());
    }
    const auto info = testsupport::read_video_info(file.string());
    ASSERT_TRUE(info.opened);
    EXPECT_EQ(info.codec, AV_CODEC_ID_MJPEG);
    EXPECT_EQ(info.width, 320);
    EXPECT_EQ(info.height, 240);
    EXPECT_EQ(info.packets, 12);
    EXPECT_EQ(info.decoded, 12);
}

TEST_F(VideoFileWriterTest, AcceptsMismatchedAndGrayFrames) {
    const fs::path file = dir_ / "mixed.avi";
    {
        VideoFileWriter writer(file.string(), 160, 120, 15.0);
        EXPECT_TRUE(writer.write(gradient(640, 480, 0)));
        EXPECT_TRUE(writer.write(cv::Mat(120, 160, CV_8UC1, cv::Scalar(90))));
        EXPECT_TRUE(writer.write(cv::Mat(120, 160, CV_8UC4, cv::Scalar(1, 2, 3, 4))));
        EXPECT_FALSE(writer.write(cv::Mat()));
        EXPECT_FALSE(writer.write(cv::Mat(120, 160, CV_32FC3)));
        EXPECT_EQ(writer.frames_written(), 3);
    }
    const auto info = testsupport::read_video_info(file.string());
    EXPECT_EQ(info.width, 160);
    EXPECT_EQ(info.packets, 3);
}

TEST_F(VideoFileWriterTest, RejectsFramesThatAreNotThreeChannelBytes) {
    const fs::path file = dir_ / "yuyv.avi";
    {
        VideoFileWriter writer(file.string(), 160, 120, 15.0);
        // 未转换的 YUYV 帧是 2 通道
        EXPECT_FALSE(writer.write(cv::Mat(120, 160, CV_8UC2, cv::Scalar(16, 128))));
        EXPECT_FALSE(writer.write(cv::Mat(480, 640, CV_8UC2, cv::Scalar(16, 128))));
        EXPECT_FALSE(writer.write(cv::Mat(120, 160, CV_16UC3)));
        EXPECT_EQ(writer.frames_written(), 0);
        EXPECT_TRUE(writer.write(gradient(160, 120, 1)));
        EXPECT_EQ(writer.frames_written(), 1);
    }
    EXPECT_EQ(testsupport::read_video_info(file.string()).packets, 1);
}

TEST_F(VideoFileWriterTest, FractionalFrameRate) {
    const fs::path file = dir_ / "ntsc.avi";
    {
        VideoFileWriter writer(file.string(), 64, 48, 29.97);
        for (int i = 0; i < 5; ++i) ASSERT_TRUE(writer.write(gradient(64, 48, i)));
    }
    EXPECT_EQ(testsupport::read_video_info(file.string()).packets, 5);
}

TEST_F(VideoFileWriterTest, WriteAfterCloseFails) {
    VideoFileWriter writer((dir_ / "closed.avi").string(), 64, 48, 30.0);
    writer.close();
    writer.close();
    EXPECT_FALSE(writer.write(gradient(64, 48, 0)));
}

TEST_F(VideoFileWriterTest, ThrowsOnInvalidArguments) {
    const std::string file = (dir_ / "bad.avi").string();
    EXPECT_THROW(VideoFileWriter(file, 0, 48, 30.0), std::runtime_error);
    EXPECT_THROW(VideoFileWriter(file, 64, 48, 0.0), std::runtime_error);
    EXPECT_THROW(VideoFileWriter((dir_ / "missing" / "x.avi").string(), 64, 48, 30.0),
                 std::runtime_error);
    EXPECT_FALSE(fs::exists(dir_ / "missing"));
}
