// record_app.cpp
#include <SDL2/SDL.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "capture/OpenCVFrameSource.hpp"
#include "capture/SyntheticFrameSource.hpp"
#include "capture/V4L2FrameSource.hpp"
#include "queue/ThreadSafeQueue.hpp"
#include "recorder/CaptureController.hpp"
#include "util/TimeFormat.hpp"

namespace {

struct AppOptions {
    std::string device = "/dev/video0";
    bool use_v4l2 = false;
    bool simulate = false;
    std::string output_dir = "./recordings";
    double fps = 30.0;
};

void print_usage(const char* prog) {
    std::cout << "用法: " << prog
              << " [--device PATH] [--v4l2] [--simulate] [--out DIR] [--fps N]\n"
              << "  R: 开始录制   S: 停止并保存   ESC: 退出" << std::endl;
}

bool parse_args(int argc, char** argv, AppOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--device" && i + 1 < argc) {
            opts.device = argv[++i];
        } else if (arg == "--v4l2") {
            opts.use_v4l2 = true;
        } else if (arg == "--simulate") {
            opts.simulate = true;
        } else if (arg == "--out" && i + 1 < argc) {
            opts.output_dir = argv[++i];
        } else if (arg == "--fps" && i + 1 < argc) {
            opts.fps = std::atof(argv[++i]);
        } else {
            return false;
        }
    }
    return opts.fps > 0.0;
}

// 在主线程打开设备，部分后端要求设备必须在 UI 线程打开
std::unique_ptr<FrameSource> open_device(const AppOptions& opts) {
    if (opts.simulate) {
        SyntheticFrameSource::Options sim;
        sim.sample_rate = opts.fps;
        return std::make_unique<SyntheticFrameSource>(sim);
    }
    try {
        if (opts.use_v4l2) {
            auto v4l2 = std::make_unique<V4L2FrameSource>(opts.device);
            if (!v4l2->initialize(640, 480)) {
                std::cerr << "摄像头初始化失败! 请检查设备权限和格式支持"
                          << std::endl;
                return nullptr;
            }
            return v4l2;
        }
        return std::make_unique<OpenCVFrameSource>(opts.device);
    } catch (const std::exception& e) {
        // 交给控制器去报告 "not available"
        std::cerr << "打开摄像头失败: " << e.what() << std::endl;
        return nullptr;
    }
}

}  // namespace

int main(int argc, char** argv) {
    AppOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return -1;
    }

    std::error_code ec;
    std::filesystem::create_directories(opts.output_dir, ec);
    if (ec) {
        std::cerr << "无法创建输出目录 " << opts.output_dir << ": "
                  << ec.message() << std::endl;
        return -1;
    }

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL 初始化失败: " << SDL_GetError() << std::endl;
        return -1;
    }
    SDL_Window* window = SDL_CreateWindow(
        "PhysioCapture - R: record  S: stop  ESC: quit",
        SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED, 640, 120,
        SDL_WINDOW_SHOWN);
    if (!window) {
        std::cerr << "窗口创建失败: " << SDL_GetError() << std::endl;
        SDL_Quit();
        return -1;
    }

    // 状态回调在分发线程上执行，SDL 窗口只能在主线程操作
    ThreadSafeQueue<std::string> statusQueue;

    CaptureConfig config;
    config.target_fps = opts.fps;
    config.working_dir = opts.output_dir;
    CaptureController controller(config);
    controller.subscribe_status(
        [&statusQueue](const std::string& msg) { statusQueue.push(msg); });
    if (!controller.start()) {
        std::cerr << "录制线程启动失败" << std::endl;
        SDL_DestroyWindow(window);
        SDL_Quit();
        return -1;
    }
    std::cout << "[RecordApp] 输出目录: " << opts.output_dir << std::endl;

    bool recording = false;
    bool quit = false;
    SDL_Event event;
    while (!quit) {
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                quit = true;
            } else if (event.type == SDL_KEYDOWN) {
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        quit = true;
                        break;
                    case SDLK_r:
                        if (!recording) {
                            controller.supply_device(open_device(opts));
                            controller.request_begin();
                        }
                        break;
                    case SDLK_s:
                        if (recording) {
                            const std::string base =
                                (std::filesystem::path(opts.output_dir) /
                                 format_file_stamp(
                                     std::chrono::system_clock::now()))
                                    .string();
                            controller.set_final_paths(
                                base + "_webcam.avi",
                                base + "_webcam_timestamps.csv");
                            controller.request_stop();
                        }
                        break;
                    default:
                        break;
                }
            }
        }

        std::string status;
        while (statusQueue.try_pop(status)) {
            if (status == "Webcam recording started.") {
                recording = true;
            } else if (status.rfind("Webcam recording saved", 0) == 0) {
                recording = false;
            }
            SDL_SetWindowTitle(window, ("PhysioCapture - " + status).c_str());
        }

        SDL_Delay(20);
    }

    // 未保存的录制会被丢弃
    controller.terminate();
    statusQueue.close();

    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
