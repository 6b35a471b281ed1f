#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

// ── Progress snapshot ──────────────────────────────────────────

enum class ProgressPhase {
    Downloading,
    Extracting
};

struct ProgressEvent {
    int64_t bytes_done = 0;
    int64_t bytes_total = 0;  // 0 = unknown
    ProgressPhase phase = ProgressPhase::Downloading;

    float fraction() const {
        if (bytes_total <= 0) return 0.0f;
        if (bytes_done >= bytes_total) return 1.0f;
        return static_cast<float>(bytes_done) / static_cast<float>(bytes_total);
    }
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// ── Bounded single-producer / single-consumer channel ──────────
//
// The worker thread pushes, the UI thread pops. push() never blocks:
// when the queue is full the newest queued event is overwritten.

class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 32) : capacity_(capacity ? capacity : 1) {}

    void push(const ProgressEvent& event) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) return;
            if (queue_.size() >= capacity_) {
                queue_.back() = event;
            } else {
                queue_.push_back(event);
            }
        }
        cv_.notify_one();
    }

    /// Block until an event is available. Returns nullopt once the channel
    /// is closed and drained.
    std::optional<ProgressEvent> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return std::nullopt;
        ProgressEvent ev = queue_.front();
        queue_.pop_front();
        return ev;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    bool closed_ = false;
};
