#include "playback/device_worker.h"

#include "logging/logger.h"

#include <exception>
#include <utility>

namespace playback {

DeviceWorker::DeviceWorker(std::string name) : name_(std::move(name)) {
    thread_ = std::thread(&DeviceWorker::run, this);
}

DeviceWorker::~DeviceWorker() {
    stop();
}

bool DeviceWorker::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool DeviceWorker::isBusy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ || !queue_.empty();
}

void DeviceWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void DeviceWorker::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            running_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[Worker {}] Task failed: {}", name_, e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
}

}  // namespace playback
