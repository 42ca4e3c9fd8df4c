#include "recorder/StatusChannel.hpp"

#include <exception>
#include <iostream>

StatusChannel::StatusChannel() {
    dispatcher_ = std::thread(&StatusChannel::dispatch_loop, this);
}

StatusChannel::~StatusChannel() {
    shutdown();
}

int StatusChannel::subscribe(Subscriber cb) {
    std::lock_guard<std::mutex> lk(subscribers_m_);
    int id = next_id_++;
    subscribers_.push_back({id, std::move(cb)});
    return id;
}

void StatusChannel::unsubscribe(int id) {
    std::lock_guard<std::mutex> lk(subscribers_m_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        if (it->first == id) {
            subscribers_.erase(it);
            break;
        }
    }
}

void StatusChannel::publish(const std::string& message) {
    std::cout << "[StatusChannel] " << message << std::endl;
    {
        std::lock_guard<std::mutex> lk(subscribers_m_);
        if (subscribers_.empty()) return;
    }
    queue_.push(message);
}

void StatusChannel::shutdown() {
    if (shut_down_.exchange(true)) return;
    queue_.close();
    if (dispatcher_.joinable()) dispatcher_.join();
}

void StatusChannel::dispatch_loop() {
    std::string message;
    while (queue_.pop(message)) {
        // 拷贝一份，回调里可以安全地 subscribe / unsubscribe
        std::vector<std::pair<int, Subscriber>> targets;
        {
            std::lock_guard<std::mutex> lk(subscribers_m_);
            targets = subscribers_;
        }
        for (auto& p : targets) {
            if (!p.second) continue;
            try {
                p.second(message);
            } catch (const std::exception& e) {
                std::cerr << "[StatusChannel] 订阅者 " << p.first
                          << " 抛出异常: " << e.what() << std::endl;
            }
        }
    }
}
