#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "capture/FrameSource.hpp"
#include "recorder/StatusChannel.hpp"

class TimestampWriter;
class VideoFileWriter;

struct CaptureConfig {
    double target_fps = 30.0;
    // terminate() 等待正在写的帧完成的最长时间
    std::chrono::milliseconds grace_period{1000};
    // 空闲时每轮循环的休眠
    std::chrono::milliseconds idle_interval{100};
    // 录制中临时文件所在目录
    std::string working_dir = ".";
};

// 在独立线程上运行的录制状态机。
// 观察者（UI 线程）打开设备后通过 supply_device() 交出，再用
// request_begin() / request_stop() 控制录制；terminate() 永久结束线程。
// 录制时视频和时间戳先写到临时文件，正常结束后才移动到 set_final_paths()
// 指定的位置；没有指定则删除。
class CaptureController {
public:
    enum class State { Idle, Recording, Stopping, Terminated };

    // target_fps 不为正时抛出 std::invalid_argument
    explicit CaptureController(CaptureConfig config = CaptureConfig{});
    ~CaptureController();

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    // 启动工作线程；已启动或已终止时返回 false
    bool start();

    void supply_device(std::unique_ptr<FrameSource> device);
    void request_begin();
    // 结束当前录制并回到 Idle
    void request_stop();
    // 强制停止，幂等；之后不能再 start()
    void terminate();

    // 必须在结束录制之前设置才生效，使用一次后清空
    void set_final_paths(const std::string& video_path,
                         const std::string& timestamps_path);

    int subscribe_status(StatusChannel::Subscriber cb);
    void unsubscribe_status(int id);

    State state() const { return state_; }
    double target_fps() const { return config_.target_fps; }

private:
    struct Session;

    void run();
    // 返回 nullptr 表示无法开始，状态保持 Idle
    std::unique_ptr<Session> begin_session();
    void record(Session& session);
    void finish_session(std::unique_ptr<Session> session);
    void abort_session(std::unique_ptr<Session> session);
    void discard_working_files();

    // 把工作文件移到最终位置；final_path 为空时删除工作文件
    static void finalize_file(const std::string& working_path,
                              const std::string& final_path);
    static void remove_quietly(const std::string& path);

    CaptureConfig config_;
    StatusChannel status_;

    std::atomic<State> state_{State::Idle};
    std::atomic<bool> begin_requested_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> stop_flag_{false};
    std::atomic<bool> terminated_{false};
    std::atomic<bool> started_{false};
    // 空闲时清除结束请求要和 request_begin/request_stop 互斥
    std::mutex request_m_;

    std::thread worker_;
    std::mutex exit_m_;
    std::condition_variable exit_cv_;
    bool worker_exited_ = false;

    // 跨线程交接：设备和最终路径
    std::mutex handoff_m_;
    std::unique_ptr<FrameSource> pending_device_;
    std::string final_video_path_;
    std::string final_timestamps_path_;

    // 仅工作线程访问；terminate() 只在 join 之后读取
    std::unique_ptr<FrameSource> device_;
    std::string working_video_path_;
    std::string working_timestamps_path_;
};

const char* to_string(CaptureController::State state);
