// Serial task inbox for one device; every call that touches a device runs here.
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace playback {

class DeviceWorker {
   public:
    explicit DeviceWorker(std::string name);
    ~DeviceWorker();

    DeviceWorker(const DeviceWorker&) = delete;
    DeviceWorker& operator=(const DeviceWorker&) = delete;

    // Queues fn and returns its future. After stop() the task runs on the caller's thread.
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F&& fn) {
        using Result = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        if (!post([task]() { (*task)(); })) {
            (*task)();
        }
        return future;
    }

    // Fire-and-forget. Returns false once the worker is stopping.
    bool post(std::function<void()> task);

    // A task is running or queued
    bool isBusy() const;

    // Runs what is already queued, then joins. Idempotent.
    void stop();

    const std::string& name() const {
        return name_;
    }

   private:
    void run();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    bool running_ = false;
    std::thread thread_;
};

}  // namespace playback
