#pragma once
#include <array>
#include <atomic>
#include <cstdint>

#include "capture/FrameSource.hpp"

// 离线测试用的帧来源：每个颜色通道的亮度按正弦波变化，
// 不需要任何摄像头。可以限制总帧数，也可以周期性地模拟丢帧
class SyntheticFrameSource : public FrameSource {
public:
    struct Waveform {
        double baseline;
        double amplitude;
        double freq_hz;
    };

    struct Options {
        int width = 640;
        int height = 480;
        // 每读一帧时间前进 1 / sample_rate 秒
        double sample_rate = 30.0;
        // B, G, R
        std::array<Waveform, 3> channels{{{128.0, 5.0, 0.05},
                                          {128.0, 50.0, 0.25},
                                          {128.0, 75.0, 1.2}}};
        // 0 表示不限；超过后所有读取都失败
        uint64_t frame_budget = 0;
        // 每 miss_every 次读取失败一次，0 表示从不
        uint64_t miss_every = 0;
        bool start_open = true;
    };

    SyntheticFrameSource();
    explicit SyntheticFrameSource(const Options& options);

    bool is_open() const override { return open_; }
    bool read_frame(cv::Mat& frame) override;
    void release() override;
    int frame_width() const override { return options_.width; }
    int frame_height() const override { return options_.height; }

    // 以下计数可在其它线程读取
    uint64_t reads_attempted() const { return reads_attempted_; }
    uint64_t frames_served() const { return frames_served_; }
    bool released() const { return released_; }

private:
    Options options_;
    double t_ = 0.0;
    std::atomic<bool> open_;
    std::atomic<bool> released_{false};
    std::atomic<uint64_t> reads_attempted_{0};
    std::atomic<uint64_t> frames_served_{0};
};
