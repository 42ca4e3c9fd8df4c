#pragma once
#include <condition_variable>
#include <mutex>
#include <queue>

template <typename T>
class ThreadSafeQueue {
   public:
    // 关闭后的 push 会被丢弃
    bool push(T value) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_) return false;
        queue_.push(std::move(value));
        cv_.notify_one();
        return true;
    }

    // 阻塞直到取出一个元素；队列已关闭且为空时返回 false
    bool pop(T& value) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return false;
        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    bool try_pop(T& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (queue_.empty()) return false;
        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // 唤醒所有等待者，之后 pop 只会取完剩余元素
    void close() {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
        cv_.notify_all();
    }

   private:
    std::queue<T> queue_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool closed_ = false;
};
