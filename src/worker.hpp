// src/worker.hpp
// Background upload thread: interval timer plus a signal channel.

#pragma once

#include "uploader.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <variant>

namespace datrack {

// Drain the queue as soon as the worker wakes.
struct UploadSignal {};

// Signals carry a per-request completion promise.
struct FlushSignal {
    std::shared_ptr<std::promise<void>> completion;
};
struct CloseSignal {
    std::shared_ptr<std::promise<void>> completion;
};

// Worker message: exactly one variant active at a time.
using WorkerMessage = std::variant<UploadSignal, FlushSignal, CloseSignal>;

// Owns the only thread that calls into the Uploader. Every upload interval it
// runs a scheduled cycle if auto upload is enabled; explicit signals run a
// full drain regardless of the backoff. Closing stops the thread without
// draining: pending records stay in the durable queue.
class Worker {
public:
    Worker(Uploader& uploader, UploadSettings& settings);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Non-blocking.
    void request_upload();
    std::future<void> send_flush();
    std::future<void> send_close();

    // Re-arm the timer after the upload interval changed.
    void reschedule();

    bool running() const noexcept { return running_.load(); }

private:
    void run();
    void enqueue(WorkerMessage msg);
    std::chrono::milliseconds interval() const;

    Uploader& uploader_;
    UploadSettings& settings_;
    std::thread thread_;

    // Channel
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<WorkerMessage> queue_;
    bool reschedule_ = false;
    static constexpr size_t MAX_QUEUE_SIZE = 1000;

    std::atomic<bool> running_{true};
};

} // namespace datrack
