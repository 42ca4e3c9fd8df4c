#pragma once
#include <opencv2/core/mat.hpp>

// 已经打开的视频帧来源。由上层（UI 线程）负责打开，交给录制控制器后
// 只由控制器线程读取和释放，控制器不会重新打开它
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool is_open() const = 0;
    // 读取一帧 BGR 图像到 frame；没有可用帧时返回 false
    virtual bool read_frame(cv::Mat& frame) = 0;
    virtual void release() = 0;
    virtual int frame_width() const = 0;
    virtual int frame_height() const = 0;
};
