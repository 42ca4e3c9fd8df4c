#include "capture/V4L2FrameSource.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/select.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

V4L2FrameSource::V4L2FrameSource(const std::string& device, PixelFormat fmt)
    : pixel_format_(fmt) {
    // 读写 非阻塞
    fd_ = open(device.c_str(), O_RDWR | O_NONBLOCK);
    if (fd_ < 0) {
        throw std::runtime_error("Failed to open V4L2 device: " + device);
    }
}

V4L2FrameSource::~V4L2FrameSource() {
    release();
}

bool V4L2FrameSource::initialize(unsigned width, unsigned height) {
    if (fd_ < 0) return false;
    if (!set_format(width, height)) return false;
    streaming_ = init_mmap();
    if (!streaming_) {
        std::cerr << "[V4L2FrameSource] 缓冲区映射或 STREAMON 失败" << std::endl;
    }
    return streaming_;
}

bool V4L2FrameSource::set_format(unsigned width, unsigned height) {
    v4l2_format fmt{};
    fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    fmt.fmt.pix.width = width;
    fmt.fmt.pix.height = height;
    fmt.fmt.pix.pixelformat = pixel_format_ == PixelFormat::MJPEG
                                  ? V4L2_PIX_FMT_MJPEG
                                  : V4L2_PIX_FMT_YUYV;
    if (ioctl(fd_, VIDIOC_S_FMT, &fmt) < 0) {
        std::cerr << "[V4L2FrameSource] VIDIOC_S_FMT 失败" << std::endl;
        return false;
    }
    // 驱动可能调整到最接近的分辨率，以实际生效的为准
    width_ = fmt.fmt.pix.width;
    height_ = fmt.fmt.pix.height;
    return true;
}

bool V4L2FrameSource::init_mmap() {
    // 1) 请求 4 个缓冲区：视频捕捉、内存映射
    v4l2_requestbuffers req{};
    req.count = 4;
    req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;
    if (ioctl(fd_, VIDIOC_REQBUFS, &req) < 0) return false;

    mapped_buffers_.assign(req.count, nullptr);
    buffer_lengths_.assign(req.count, 0);
    // 2) 查询每个缓冲区的长度和偏移，并映射到用户空间
    for (unsigned i = 0; i < req.count; ++i) {
        v4l2_buffer buf{};
        buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;
        buf.index = i;
        if (ioctl(fd_, VIDIOC_QUERYBUF, &buf) < 0) return false;

        void* addr = mmap(nullptr, buf.length, PROT_READ | PROT_WRITE,
                          MAP_SHARED, fd_, buf.m.offset);
        if (addr == MAP_FAILED) return false;
        mapped_buffers_[i] = addr;
        buffer_lengths_[i] = buf.length;
    }
    // 3) 所有缓冲区入队，驱动往里面填帧
    for (unsigned i = 0; i < req.count; ++i) {
        v4l2_buffer buf{};
        buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;
        buf.index = i;
        if (ioctl(fd_, VIDIOC_QBUF, &buf) < 0) return false;
    }
    // 4) 启动数据流
    v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    return ioctl(fd_, VIDIOC_STREAMON, &type) >= 0;
}

bool V4L2FrameSource::is_open() const {
    return fd_ >= 0 && streaming_;
}

bool V4L2FrameSource::dequeue_raw() {
    // 等待 fd_ 可读，最长 2 秒
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    timeval tv{2, 0};
    int ret = select(fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (ret <= 0) {
        // 0 超时，<0 出错
        return false;
    }

    v4l2_buffer buf{};
    buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    for (int attempts = 0; attempts < 3; ++attempts) {
        if (ioctl(fd_, VIDIOC_DQBUF, &buf) == 0) {
            const auto* src = static_cast<uint8_t*>(mapped_buffers_[buf.index]);
            raw_.assign(src, src + buf.bytesused);
            // 拷贝完立即重新入队
            if (ioctl(fd_, VIDIOC_QBUF, &buf) < 0) {
                std::cerr << "[V4L2FrameSource] VIDIOC_QBUF 失败" << std::endl;
            }
            return !raw_.empty();
        }
        if (errno != EAGAIN) {
            return false;
        }
        usleep(1000);  // 1 ms
    }
    return false;
}

bool V4L2FrameSource::decode(cv::Mat& frame) const {
    if (pixel_format_ == PixelFormat::MJPEG) {
        cv::Mat raw_mat(1, static_cast<int>(raw_.size()), CV_8UC1,
                        const_cast<uint8_t*>(raw_.data()));
        frame = cv::imdecode(raw_mat, cv::IMREAD_COLOR);
        return !frame.empty();
    }
    // YUYV 每像素 2 字节
    const size_t expected_size = static_cast<size_t>(width_) * height_ * 2;
    if (raw_.size() != expected_size) {
        std::cerr << "[V4L2FrameSource] YUYV 数据大小错误: 期望 "
                  << expected_size << " 字节，实际 " << raw_.size()
                  << std::endl;
        return false;
    }
    cv::Mat yuyv(static_cast<int>(height_), static_cast<int>(width_), CV_8UC2,
                 const_cast<uint8_t*>(raw_.data()));
    cv::cvtColor(yuyv, frame, cv::COLOR_YUV2BGR_YUYV);
    return true;
}

bool V4L2FrameSource::read_frame(cv::Mat& frame) {
    if (!is_open()) return false;
    if (!dequeue_raw()) return false;
    return decode(frame);
}

void V4L2FrameSource::release() {
    if (fd_ < 0) return;
    if (streaming_) {
        v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        if (ioctl(fd_, VIDIOC_STREAMOFF, &type) < 0) {
            std::cerr << "[V4L2FrameSource] VIDIOC_STREAMOFF 失败" << std::endl;
        }
        streaming_ = false;
    }
    for (size_t i = 0; i < mapped_buffers_.size(); ++i) {
        if (mapped_buffers_[i]) {
            munmap(mapped_buffers_[i], buffer_lengths_[i]);
        }
    }
    mapped_buffers_.clear();
    buffer_lengths_.clear();
    close(fd_);
    fd_ = -1;
}
