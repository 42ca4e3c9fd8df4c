#include "capture/SyntheticFrameSource.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/core.hpp>
#include <stdexcept>

namespace {

constexpr double kTwoPi = 6.283185307179586;

double clamp_pixel(double v) {
    return std::min(255.0, std::max(0.0, v));
}

}  // namespace

SyntheticFrameSource::SyntheticFrameSource()
    : SyntheticFrameSource(Options{}) {}

SyntheticFrameSource::SyntheticFrameSource(const Options& options)
    : options_(options), open_(options.start_open) {
    if (options_.width <= 0 || options_.height <= 0) {
        throw std::invalid_argument("SyntheticFrameSource: 分辨率必须为正");
    }
    if (options_.sample_rate <= 0.0) {
        throw std::invalid_argument("SyntheticFrameSource: sample_rate 必须为正");
    }
}

bool SyntheticFrameSource::read_frame(cv::Mat& frame) {
    if (!open_) return false;
    const uint64_t attempt = ++reads_attempted_;
    if (options_.miss_every != 0 && attempt % options_.miss_every == 0) {
        return false;
    }
    if (options_.frame_budget != 0 && frames_served_ >= options_.frame_budget) {
        return false;
    }

    cv::Scalar color;
    for (size_t c = 0; c < options_.channels.size(); ++c) {
        const Waveform& w = options_.channels[c];
        color[static_cast<int>(c)] = clamp_pixel(
            w.baseline + w.amplitude * std::sin(kTwoPi * w.freq_hz * t_));
    }
    frame.create(options_.height, options_.width, CV_8UC3);
    frame.setTo(color);
    t_ += 1.0 / options_.sample_rate;
    ++frames_served_;
    return true;
}

void SyntheticFrameSource::release() {
    open_ = false;
    released_ = true;
}
