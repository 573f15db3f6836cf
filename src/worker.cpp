// src/worker.cpp
// Background worker thread implementation.

#include "worker.hpp"
#include "logging.hpp"

#include <algorithm>

namespace datrack {

Worker::Worker(Uploader& uploader, UploadSettings& settings)
    : uploader_(uploader), settings_(settings) {
    thread_ = std::thread(&Worker::run, this);
}

Worker::~Worker() {
    if (running_.load()) {
        (void)send_close();  // future ignored; join() ensures completion
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::chrono::milliseconds Worker::interval() const {
    int64_t ms = settings_.interval_ms.load(std::memory_order_relaxed);
    return std::chrono::milliseconds(std::max<int64_t>(ms, 1));
}

void Worker::enqueue(WorkerMessage msg) {
    bool was_empty;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_empty = queue_.empty();
        // Upload requests are idempotent; collapse a flood of them.
        if (std::holds_alternative<UploadSignal>(msg) && queue_.size() >= MAX_QUEUE_SIZE) {
            return;
        }
        queue_.push(std::move(msg));
    }
    // Only wake the worker if it's likely sleeping (queue was empty)
    if (was_empty) {
        cv_.notify_one();
    }
}

void Worker::request_upload() {
    enqueue(UploadSignal{});
}

std::future<void> Worker::send_flush() {
    auto p = std::make_shared<std::promise<void>>();
    auto f = p->get_future();
    enqueue(FlushSignal{std::move(p)});
    return f;
}

std::future<void> Worker::send_close() {
    auto p = std::make_shared<std::promise<void>>();
    auto f = p->get_future();
    enqueue(CloseSignal{std::move(p)});
    return f;
}

void Worker::reschedule() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reschedule_ = true;
    }
    cv_.notify_one();
}

void Worker::run() {
    auto next_tick = std::chrono::steady_clock::now() + interval();

    while (running_.load()) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, next_tick,
                       [this] { return !queue_.empty() || reschedule_ || !running_.load(); });

        // Drain all pending messages
        std::queue<WorkerMessage> local_queue;
        std::swap(local_queue, queue_);
        bool rearm = reschedule_;
        reschedule_ = false;
        lock.unlock();

        bool should_upload = false;
        bool should_close = false;
        std::vector<std::shared_ptr<std::promise<void>>> completions;

        while (!local_queue.empty()) {
            auto& msg = local_queue.front();
            if (std::holds_alternative<UploadSignal>(msg)) {
                should_upload = true;
            } else if (auto* fs = std::get_if<FlushSignal>(&msg)) {
                should_upload = true;
                if (fs->completion) completions.push_back(std::move(fs->completion));
            } else if (auto* cs = std::get_if<CloseSignal>(&msg)) {
                should_close = true;
                if (cs->completion) completions.push_back(std::move(cs->completion));
            }
            local_queue.pop();
        }

        auto now = std::chrono::steady_clock::now();
        if (rearm) {
            next_tick = now + interval();
        }

        if (should_close) {
            for (auto& p : completions) {
                p->set_value();
            }
            running_.store(false);
            DATRACK_LOG_DEBUG("upload worker stopped");
            return;
        }

        if (should_upload) {
            uploader_.drain();
        } else if (now >= next_tick) {
            if (settings_.auto_upload.load(std::memory_order_relaxed)) {
                uploader_.run_scheduled(now);
            }
            next_tick = now + interval();
        }

        for (auto& p : completions) {
            p->set_value();
        }
    }
}

} // namespace datrack
