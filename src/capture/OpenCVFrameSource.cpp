#include "capture/OpenCVFrameSource.hpp"

#include <iostream>
#include <stdexcept>

OpenCVFrameSource::OpenCVFrameSource(int index, int api) {
    if (!cap_.open(index, api)) {
        throw std::runtime_error("Failed to open camera index " +
                                 std::to_string(index));
    }
    std::cout << "[OpenCVFrameSource] 摄像头 " << index << " 已打开 ("
              << frame_width() << "x" << frame_height() << ")" << std::endl;
}

OpenCVFrameSource::OpenCVFrameSource(const std::string& device, int api) {
    if (!cap_.open(device, api)) {
        throw std::runtime_error("Failed to open capture device: " + device);
    }
    std::cout << "[OpenCVFrameSource] " << device << " 已打开 ("
              << frame_width() << "x" << frame_height() << ")" << std::endl;
}

OpenCVFrameSource::~OpenCVFrameSource() {
    release();
}

bool OpenCVFrameSource::is_open() const {
    return cap_.isOpened();
}

bool OpenCVFrameSource::read_frame(cv::Mat& frame) {
    if (!cap_.isOpened()) return false;
    if (!cap_.read(frame)) return false;
    return !frame.empty();
}

void OpenCVFrameSource::release() {
    if (cap_.isOpened()) {
        cap_.release();
    }
}

int OpenCVFrameSource::frame_width() const {
    return static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
}

int OpenCVFrameSource::frame_height() const {
    return static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
}
