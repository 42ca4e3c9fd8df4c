#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "queue/ThreadSafeQueue.hpp"

// 控制器 → 观察者的单向状态通知。publish 只入队不等待，
// 由内部分发线程调用订阅者。没有订阅者时发布的消息直接丢弃
class StatusChannel {
public:
    using Subscriber = std::function<void(const std::string&)>;

    StatusChannel();
    ~StatusChannel();

    StatusChannel(const StatusChannel&) = delete;
    StatusChannel& operator=(const StatusChannel&) = delete;

    // 返回订阅 ID，用于 unsubscribe
    int subscribe(Subscriber cb);
    void unsubscribe(int id);

    void publish(const std::string& message);

    // 停止分发线程，已入队的消息先发完
    void shutdown();

private:
    void dispatch_loop();

    ThreadSafeQueue<std::string> queue_;
    std::thread dispatcher_;
    std::atomic<bool> shut_down_{false};

    std::mutex subscribers_m_;
    int next_id_ = 1;
    std::vector<std::pair<int, Subscriber>> subscribers_;
};
