#include "recorder/CaptureController.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "recorder/TimestampWriter.hpp"
#include "recorder/VideoFileWriter.hpp"
#include "util/TimeFormat.hpp"

namespace fs = std::filesystem;

namespace {

const char* const kStatusUnavailable =
    "Webcam not available. Video will not be recorded.";
const char* const kStatusStarted = "Webcam recording started.";

std::string saved_status(uint64_t frames) {
    return "Webcam recording saved (" + std::to_string(frames) + " frames).";
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

}  // namespace

struct CaptureController::Session {
    std::unique_ptr<VideoFileWriter> video;
    std::unique_ptr<TimestampWriter> timestamps;
    uint64_t frame_number = 0;
};

CaptureController::CaptureController(CaptureConfig config)
    : config_(std::move(config)) {
    if (!(config_.target_fps > 0.0)) {
        throw std::invalid_argument("CaptureController: target_fps 必须为正");
    }
    if (config_.working_dir.empty()) {
        config_.working_dir = ".";
    }
}

CaptureController::~CaptureController() {
    terminate();
}

bool CaptureController::start() {
    if (terminated_ || started_.exchange(true)) {
        return false;
    }
    worker_ = std::thread(&CaptureController::run, this);
    std::cout << "[CaptureController] 录制线程已启动 (" << config_.target_fps
              << " fps)" << std::endl;
    return true;
}

void CaptureController::supply_device(std::unique_ptr<FrameSource> device) {
    std::unique_ptr<FrameSource> previous;
    {
        std::lock_guard<std::mutex> lk(handoff_m_);
        previous = std::move(pending_device_);
        pending_device_ = std::move(device);
    }
    // 被替换掉的设备还没交给工作线程，在这里释放
    if (previous) {
        previous->release();
    }
}

void CaptureController::request_begin() {
    std::lock_guard<std::mutex> lk(request_m_);
    begin_requested_ = true;
}

void CaptureController::request_stop() {
    std::lock_guard<std::mutex> lk(request_m_);
    stop_requested_ = true;
}

void CaptureController::set_final_paths(const std::string& video_path,
                                        const std::string& timestamps_path) {
    std::lock_guard<std::mutex> lk(handoff_m_);
    final_video_path_ = video_path;
    final_timestamps_path_ = timestamps_path;
}

int CaptureController::subscribe_status(StatusChannel::Subscriber cb) {
    return status_.subscribe(std::move(cb));
}

void CaptureController::unsubscribe_status(int id) {
    status_.unsubscribe(id);
}

void CaptureController::terminate() {
    if (terminated_.exchange(true)) return;
    stop_flag_ = true;
    stop_requested_ = true;

    if (worker_.joinable()) {
        {
            std::unique_lock<std::mutex> lk(exit_m_);
            if (!exit_cv_.wait_for(lk, config_.grace_period,
                                   [this] { return worker_exited_; })) {
                std::cerr << "[CaptureController] 宽限期内录制线程未退出，"
                             "等待当前帧读取结束"
                          << std::endl;
            }
        }
        worker_.join();
    }

    // 工作线程已经退出，下面的成员不再有并发访问
    if (device_) {
        device_->release();
        device_.reset();
    }
    {
        std::lock_guard<std::mutex> lk(handoff_m_);
        if (pending_device_) {
            pending_device_->release();
            pending_device_.reset();
        }
        final_video_path_.clear();
        final_timestamps_path_.clear();
    }
    discard_working_files();

    state_ = State::Terminated;
    status_.shutdown();
    std::cout << "[CaptureController] 录制线程已终止" << std::endl;
}

void CaptureController::run() {
    while (!stop_flag_) {
        if (begin_requested_.exchange(false)) {
            std::unique_ptr<Session> session = begin_session();
            if (session) {
                record(*session);
                if (stop_flag_) {
                    abort_session(std::move(session));
                } else {
                    finish_session(std::move(session));
                }
            }
            continue;
        }
        {
            // 空闲时收到的结束请求作废；已有开始请求时保留，
            // 紧跟在开始请求后的结束请求要作用于这次录制
            std::lock_guard<std::mutex> lk(request_m_);
            if (!begin_requested_) {
                stop_requested_ = false;
            }
        }
        std::this_thread::sleep_for(config_.idle_interval);
    }

    {
        std::lock_guard<std::mutex> lk(exit_m_);
        worker_exited_ = true;
    }
    exit_cv_.notify_all();
}

std::unique_ptr<CaptureController::Session> CaptureController::begin_session() {
    std::unique_ptr<FrameSource> device;
    {
        std::lock_guard<std::mutex> lk(handoff_m_);
        device = std::move(pending_device_);
    }
    if (!device || !device->is_open()) {
        std::cerr << "[CaptureController] 没有可用的摄像头" << std::endl;
        if (device) {
            std::lock_guard<std::mutex> lk(handoff_m_);
            if (!pending_device_) pending_device_ = std::move(device);
        }
        status_.publish(kStatusUnavailable);
        return nullptr;
    }

    // 同一秒内多次开始录制时加序号区分
    const std::string stamp = format_file_stamp(std::chrono::system_clock::now());
    const fs::path dir(config_.working_dir);
    std::string base = (dir / (stamp + "_webcam_temp")).string();
    for (int n = 1; path_exists(base + ".avi") ||
                    path_exists(base + "_timestamps.csv");
         ++n) {
        base = (dir / (stamp + "_webcam_temp_" + std::to_string(n))).string();
    }
    working_video_path_ = base + ".avi";
    working_timestamps_path_ = base + "_timestamps.csv";

    auto session = std::make_unique<Session>();
    try {
        session->video = std::make_unique<VideoFileWriter>(
            working_video_path_, device->frame_width(), device->frame_height(),
            config_.target_fps);
        session->timestamps =
            std::make_unique<TimestampWriter>(working_timestamps_path_);
    } catch (const std::exception& e) {
        std::cerr << "[CaptureController] 创建录制文件失败: " << e.what()
                  << std::endl;
        session.reset();
        discard_working_files();
        {
            std::lock_guard<std::mutex> lk(handoff_m_);
            if (!pending_device_) pending_device_ = std::move(device);
        }
        status_.publish(std::string("Webcam recording could not be started: ") +
                        e.what());
        return nullptr;
    }

    device_ = std::move(device);
    state_ = State::Recording;
    std::cout << "[CaptureController] 开始录制: " << working_video_path_
              << std::endl;
    status_.publish(kStatusStarted);
    return session;
}

void CaptureController::record(Session& session) {
    const std::chrono::duration<double> period(1.0 / config_.target_fps);

    while (!stop_flag_) {
        const auto loop_start = std::chrono::steady_clock::now();

        try {
            cv::Mat frame;
            if (device_->read_frame(frame)) {
                // 时间戳取实际采集时刻，与节拍无关
                const auto timestamp = std::chrono::system_clock::now();
                if (session.video->write(frame)) {
                    // 帧号跟随视频帧序号；时间戳行写失败时索引留空号，
                    // 后续行仍与视频帧一一对应
                    if (!session.timestamps->append(session.frame_number,
                                                    timestamp)) {
                        std::cerr << "[CaptureController] 第 "
                                  << session.frame_number
                                  << " 帧时间戳写入失败" << std::endl;
                    }
                    ++session.frame_number;
                } else {
                    std::cerr << "[CaptureController] 帧编码失败，按丢帧处理"
                              << std::endl;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[CaptureController] 处理帧时出错: " << e.what()
                      << std::endl;
        }

        if (stop_requested_.exchange(false)) {
            break;
        }
        // 录制中不接受新的开始请求
        begin_requested_ = false;

        const auto elapsed = std::chrono::steady_clock::now() - loop_start;
        if (elapsed < period) {
            std::this_thread::sleep_for(period - elapsed);
        }
    }
}

void CaptureController::finish_session(std::unique_ptr<Session> session) {
    state_ = State::Stopping;

    device_->release();
    device_.reset();

    const uint64_t frames = session->frame_number;
    session->video->close();
    session->timestamps->close();
    session.reset();

    std::string video_target;
    std::string timestamps_target;
    {
        std::lock_guard<std::mutex> lk(handoff_m_);
        video_target.swap(final_video_path_);
        timestamps_target.swap(final_timestamps_path_);
    }
    finalize_file(working_video_path_, video_target);
    finalize_file(working_timestamps_path_, timestamps_target);
    working_video_path_.clear();
    working_timestamps_path_.clear();

    state_ = State::Idle;
    status_.publish(saved_status(frames));
}

void CaptureController::abort_session(std::unique_ptr<Session> session) {
    std::cout << "[CaptureController] 强制停止，丢弃本次录制 ("
              << session->frame_number << " 帧)" << std::endl;
    session->video->close();
    session->timestamps->close();
    session.reset();
    if (device_) {
        device_->release();
        device_.reset();
    }
    discard_working_files();
}

void CaptureController::discard_working_files() {
    remove_quietly(working_video_path_);
    remove_quietly(working_timestamps_path_);
    working_video_path_.clear();
    working_timestamps_path_.clear();
}

void CaptureController::finalize_file(const std::string& working_path,
                                      const std::string& final_path) {
    if (working_path.empty() || !path_exists(working_path)) return;
    if (final_path.empty()) {
        remove_quietly(working_path);
        return;
    }

    std::error_code ec;
    fs::rename(working_path, final_path, ec);
    if (!ec) {
        std::cout << "[CaptureController] 已保存: " << final_path << std::endl;
        return;
    }
    // 跨文件系统时 rename 会失败，改为复制后删除
    std::error_code copy_ec;
    fs::copy_file(working_path, final_path,
                  fs::copy_options::overwrite_existing, copy_ec);
    if (copy_ec) {
        std::cerr << "[CaptureController] 无法移动 " << working_path << " 到 "
                  << final_path << ": " << copy_ec.message() << std::endl;
        return;
    }
    remove_quietly(working_path);
    std::cout << "[CaptureController] 已保存: " << final_path << std::endl;
}

void CaptureController::remove_quietly(const std::string& path) {
    if (path.empty()) return;
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[CaptureController] 删除 " << path
                  << " 失败: " << ec.message() << std::endl;
    }
}

const char* to_string(CaptureController::State state) {
    switch (state) {
        case CaptureController::State::Idle:
            return "Idle";
        case CaptureController::State::Recording:
            return "Recording";
        case CaptureController::State::Stopping:
            return "Stopping";
        case CaptureController::State::Terminated:
            return "Terminated";
    }
    return "Unknown";
}
