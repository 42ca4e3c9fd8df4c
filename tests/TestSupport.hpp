#pragma once
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

namespace testsupport {

// 每个测试一个独立的临时目录
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(gen()));
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::vector<std::string> read_lines(const std::filesystem::path& file) {
    std::vector<std::string> lines;
    std::ifstream in(file);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

inline size_t count_files(const std::filesystem::path& dir) {
    size_t n = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

// 收集状态消息，支持按内容等待
class StatusLog {
public:
    void operator()(const std::string& msg) {
        std::lock_guard<std::mutex> lk(m_);
        messages_.push_back(msg);
        cv_.notify_all();
    }

    bool wait_for(const std::string& needle,
                  std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, timeout, [&] {
            for (const auto& m : messages_) {
                if (m.find(needle) != std::string::npos) return true;
            }
            return false;
        });
    }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lk(m_);
        return messages_;
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::vector<std::string> messages_;
};

struct VideoInfo {
    bool opened = false;
    AVCodecID codec = AV_CODEC_ID_NONE;
    int width = 0;
    int height = 0;
    int packets = 0;
    int decoded = 0;
};

// 用 libavformat / libavcodec 读回视频，统计包数和可解码帧数
inline VideoInfo read_video_info(const std::string& path) {
    VideoInfo info;
    AVFormatContext* fmt = nullptr;
    if (avformat_open_input(&fmt, path.c_str(), nullptr, nullptr) < 0) {
        return info;
    }
    if (avformat_find_stream_info(fmt, nullptr) < 0) {
        avformat_close_input(&fmt);
        return info;
    }
    int stream = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (stream < 0) {
        avformat_close_input(&fmt);
        return info;
    }
    AVCodecParameters* par = fmt->streams[stream]->codecpar;
    info.opened = true;
    info.codec = par->codec_id;
    info.width = par->width;
    info.height = par->height;

    const AVCodec* decoder = avcodec_find_decoder(par->codec_id);
    AVCodecContext* dec = decoder ? avcodec_alloc_context3(decoder) : nullptr;
    if (dec && (avcodec_parameters_to_context(dec, par) < 0 ||
                avcodec_open2(dec, decoder, nullptr) < 0)) {
        avcodec_free_context(&dec);
    }

    AVPacket* pkt = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();
    auto drain = [&] {
        while (dec && avcodec_receive_frame(dec, frame) == 0) {
            ++info.decoded;
            av_frame_unref(frame);
        }
    };
    while (av_read_frame(fmt, pkt) >= 0) {
        if (pkt->stream_index == stream) {
            ++info.packets;
            if (dec && avcodec_send_packet(dec, pkt) >= 0) drain();
        }
        av_packet_unref(pkt);
    }
    if (dec && avcodec_send_packet(dec, nullptr) >= 0) drain();

    av_frame_free(&frame);
    av_packet_free(&pkt);
    if (dec) avcodec_free_context(&dec);
    avformat_close_input(&fmt);
    return info;
}

}  // namespace testsupport
