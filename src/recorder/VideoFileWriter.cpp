#include "recorder/VideoFileWriter.hpp"

#include <iostream>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/rational.h>
}

namespace {

std::string av_error_text(int err) {
    char errbuf[256];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

}  // namespace

VideoFileWriter::VideoFileWriter(const std::string& path, int w, int h,
                                 double fps)
    : file_path(path), width(w), height(h), pts(0), frames(0),
      output_ctx(nullptr), codec_ctx(nullptr), frame(nullptr),
      packet(nullptr), sws_ctx(nullptr), video_stream(nullptr) {
    if (w <= 0 || h <= 0 || fps <= 0.0) {
        throw std::runtime_error("VideoFileWriter: 无效的尺寸或帧率");
    }
    try {
        InitEncoder(fps);
    } catch (...) {
        // 构造失败时析构函数不会运行，这里自己回收
        FreeContexts();
        throw;
    }
    std::cout << "[VideoFileWriter] 开始写入: " << file_path << " (" << width
              << "x" << height << " @ " << fps << " fps)" << std::endl;
}

void VideoFileWriter::InitEncoder(double fps) {
    // 1. 输出上下文，容器固定为 AVI
    if (avformat_alloc_output_context2(&output_ctx, nullptr, "avi",
                                       file_path.c_str()) < 0 ||
        !output_ctx) {
        throw std::runtime_error("创建输出上下文失败: " + file_path);
    }

    // 2. MJPEG 编码器
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
    if (!codec) {
        throw std::runtime_error("未找到MJPEG编码器");
    }

    // 3. 编码器上下文：帧率可以是小数，例如 29.97
    codec_ctx = avcodec_alloc_context3(codec);
    if (!codec_ctx) {
        throw std::runtime_error("分配编码器上下文失败");
    }
    const AVRational rate = av_d2q(fps, 1001000);
    codec_ctx->width = width;
    codec_ctx->height = height;
    codec_ctx->framerate = rate;
    codec_ctx->time_base = av_inv_q(rate);
    // MJPEG 使用全范围 YUV
    codec_ctx->pix_fmt = AV_PIX_FMT_YUVJ420P;
    codec_ctx->color_range = AVCOL_RANGE_JPEG;
    // 固定量化，画质与 OpenCV 的 MJPG 默认接近
    codec_ctx->flags |= AV_CODEC_FLAG_QSCALE;
    codec_ctx->global_quality = FF_QP2LAMBDA * 3;
    if (output_ctx->oformat->flags & AVFMT_GLOBALHEADER) {
        codec_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    int ret = avcodec_open2(codec_ctx, codec, nullptr);
    if (ret < 0) {
        throw std::runtime_error("打开编码器失败: " + av_error_text(ret));
    }

    // 4. 输出流
    video_stream = avformat_new_stream(output_ctx, nullptr);
    if (!video_stream) {
        throw std::runtime_error("创建输出流失败");
    }
    video_stream->time_base = codec_ctx->time_base;
    video_stream->avg_frame_rate = rate;
    if (avcodec_parameters_from_context(video_stream->codecpar, codec_ctx) < 0) {
        throw std::runtime_error("从 codec context 设置 stream parameters 失败");
    }

    // 5. 打开文件并写头
    if (!(output_ctx->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&output_ctx->pb, file_path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            throw std::runtime_error("无法打开输出文件 " + file_path + ": " +
                                     av_error_text(ret));
        }
    }
    ret = avformat_write_header(output_ctx, nullptr);
    if (ret < 0) {
        throw std::runtime_error("写入头部失败: " + av_error_text(ret));
    }

    // 6. BGR24 (OpenCV) → YUVJ420P
    sws_ctx = sws_getContext(width, height, AV_PIX_FMT_BGR24, width, height,
                             AV_PIX_FMT_YUVJ420P, SWS_BILINEAR, nullptr,
                             nullptr, nullptr);
    if (!sws_ctx) {
        throw std::runtime_error("初始化颜色转换器失败");
    }

    // 7. 帧和包
    frame = av_frame_alloc();
    packet = av_packet_alloc();
    if (!frame || !packet) {
        throw std::runtime_error("分配帧或包失败");
    }
    frame->format = codec_ctx->pix_fmt;
    frame->width = width;
    frame->height = height;
    frame->color_range = AVCOL_RANGE_JPEG;
    if (av_frame_get_buffer(frame, 32) < 0) {
        throw std::runtime_error("分配帧缓冲区失败");
    }
}

bool VideoFileWriter::write(const cv::Mat& bgrFrame) {
    if (!output_ctx || bgrFrame.empty()) {
        return false;
    }

    // 统一成 8 位 BGR，尺寸与编码器一致
    cv::Mat bgr;
    if (bgrFrame.channels() == 1) {
        cv::cvtColor(bgrFrame, bgr, cv::COLOR_GRAY2BGR);
    } else if (bgrFrame.channels() == 4) {
        cv::cvtColor(bgrFrame, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = bgrFrame;
    }
    // sws_scale 按 BGR24 读取，每像素必须正好 3 字节
    if (bgr.type() != CV_8UC3) {
        std::cerr << "[VideoFileWriter] 不支持的像素格式: depth=" << bgr.depth()
                  << " channels=" << bgr.channels() << std::endl;
        return false;
    }
    if (bgr.cols != width || bgr.rows != height) {
        cv::Mat resized;
        cv::resize(bgr, resized, cv::Size(width, height));
        bgr = resized;
    }

    // 编码器可能还持有上一帧的缓冲区
    int ret = av_frame_make_writable(frame);
    if (ret < 0) {
        std::cerr << "[VideoFileWriter] av_frame_make_writable 错误: "
                  << av_error_text(ret) << std::endl;
        return false;
    }

    const uint8_t* srcData[1] = {bgr.data};
    const int srcLinesize[1] = {static_cast<int>(bgr.step)};
    sws_scale(sws_ctx, srcData, srcLinesize, 0, height, frame->data,
              frame->linesize);
    frame->pts = pts++;

    ret = avcodec_send_frame(codec_ctx, frame);
    if (ret < 0) {
        std::cerr << "[VideoFileWriter] avcodec_send_frame 错误: "
                  << av_error_text(ret) << std::endl;
        return false;
    }
    if (!DrainPackets()) {
        return false;
    }
    ++frames;
    return true;
}

// 取出编码器里所有可用的包并写入文件
bool VideoFileWriter::DrainPackets() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx, packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            std::cerr << "[VideoFileWriter] avcodec_receive_packet 错误: "
                      << av_error_text(ret) << std::endl;
            return false;
        }
        packet->stream_index = video_stream->index;
        av_packet_rescale_ts(packet, codec_ctx->time_base,
                             video_stream->time_base);
        ret = av_interleaved_write_frame(output_ctx, packet);
        // av_interleaved_write_frame 会接管并重置 packet
        if (ret < 0) {
            std::cerr << "[VideoFileWriter] av_interleaved_write_frame 错误: "
                      << av_error_text(ret) << std::endl;
            av_packet_unref(packet);
            return false;
        }
    }
}

void VideoFileWriter::close() {
    if (!output_ctx) return;

    // 冲刷编码器
    if (codec_ctx && avcodec_send_frame(codec_ctx, nullptr) >= 0 &&
        !DrainPackets()) {
        std::cerr << "[VideoFileWriter] 冲刷编码器失败: " << file_path
                  << std::endl;
    }
    int ret = av_write_trailer(output_ctx);
    if (ret < 0) {
        std::cerr << "[VideoFileWriter] 写入 trailer 失败: "
                  << av_error_text(ret) << std::endl;
    }
    std::cout << "[VideoFileWriter] 写入结束: " << file_path << " (" << frames
              << " 帧)" << std::endl;
    FreeContexts();
}

void VideoFileWriter::FreeContexts() {
    if (output_ctx) {
        if (!(output_ctx->oformat->flags & AVFMT_NOFILE) && output_ctx->pb) {
            avio_closep(&output_ctx->pb);
        }
        avformat_free_context(output_ctx);
        output_ctx = nullptr;
    }
    video_stream = nullptr;
    if (codec_ctx) avcodec_free_context(&codec_ctx);
    if (frame) av_frame_free(&frame);
    if (packet) av_packet_free(&packet);
    if (sws_ctx) {
        sws_freeContext(sws_ctx);
        sws_ctx = nullptr;
    }
}

VideoFileWriter::~VideoFileWriter() {
    close();
}
