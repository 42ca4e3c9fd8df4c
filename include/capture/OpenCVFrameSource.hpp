#pragma once
#include <opencv2/videoio.hpp>
#include <string>

#include "capture/FrameSource.hpp"

// 基于 cv::VideoCapture 的帧来源，构造时打开设备
class OpenCVFrameSource : public FrameSource {
public:
    explicit OpenCVFrameSource(int index, int api = cv::CAP_ANY);
    // device 可以是设备路径、视频文件或 GStreamer 管线
    explicit OpenCVFrameSource(const std::string& device, int api = cv::CAP_ANY);
    ~OpenCVFrameSource() override;

    bool is_open() const override;
    bool read_frame(cv::Mat& frame) override;
    void release() override;
    int frame_width() const override;
    int frame_height() const override;

private:
    cv::VideoCapture cap_;
};
