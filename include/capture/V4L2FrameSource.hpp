#pragma once
#include <linux/videodev2.h>

#include <cstdint>
#include <string>
#include <vector>

#include "capture/FrameSource.hpp"

// 对底层 Linux 视频接口进行抽象，输出解码后的 BGR 帧
class V4L2FrameSource : public FrameSource {
public:
    enum class PixelFormat { MJPEG, YUYV };

    explicit V4L2FrameSource(const std::string& device = "/dev/video0",
                             PixelFormat fmt = PixelFormat::YUYV);
    ~V4L2FrameSource() override;

    V4L2FrameSource(const V4L2FrameSource&) = delete;
    V4L2FrameSource& operator=(const V4L2FrameSource&) = delete;

    // 设置格式、映射缓冲区并开启视频流 (VIDIOC_STREAMON)
    bool initialize(unsigned width = 1280, unsigned height = 720);

    bool is_open() const override;
    bool read_frame(cv::Mat& frame) override;
    void release() override;
    int frame_width() const override { return static_cast<int>(width_); }
    int frame_height() const override { return static_cast<int>(height_); }

private:
    // 摄像头设备文件描述符
    int fd_ = -1;
    bool streaming_ = false;
    PixelFormat pixel_format_;
    unsigned width_ = 0;
    unsigned height_ = 0;
    // mmap 映射的缓冲区地址和长度，避免每帧 read() 拷贝
    std::vector<void*> mapped_buffers_;
    std::vector<size_t> buffer_lengths_;
    // 最近一次出队的原始数据
    std::vector<uint8_t> raw_;

    bool set_format(unsigned width, unsigned height);
    bool init_mmap();
    bool dequeue_raw();
    bool decode(cv::Mat& frame) const;
};
