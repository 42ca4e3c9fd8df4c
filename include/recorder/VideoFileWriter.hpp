#pragma once
#include <opencv2/core/mat.hpp>
#include <cstdint>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

// 把 BGR 帧编码成 Motion-JPEG 并封装进 AVI 文件
class VideoFileWriter {
    public:
        // 打开失败时抛出 std::runtime_error
        VideoFileWriter(const std::string& path, int w, int h, double fps);
        ~VideoFileWriter();

        VideoFileWriter(const VideoFileWriter&) = delete;
        VideoFileWriter& operator=(const VideoFileWriter&) = delete;

        // 编码一帧。尺寸不一致时先缩放；失败返回 false
        bool write(const cv::Mat& bgrFrame);
        // 冲刷编码器、写 trailer、关闭文件。可重复调用
        void close();

        bool is_open() const { return output_ctx != nullptr; }
        int64_t frames_written() const { return frames; }
        const std::string& path() const { return file_path; }

    private:
        void InitEncoder(double fps);
        bool DrainPackets();
        void FreeContexts();

        std::string file_path;
        int width, height;
        int64_t pts;
        int64_t frames;

        AVFormatContext* output_ctx;
        AVCodecContext* codec_ctx;
        AVFrame* frame;
        AVPacket* packet;
        SwsContext* sws_ctx;
        AVStream* video_stream;
};
