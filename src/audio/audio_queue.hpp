#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace audio {

// Thread-safe FIFO of sample blocks between a live transport and its session.
// push() never blocks and every block is kept until popped or cleared.
class AudioQueue {
public:
    struct Block {
        std::vector<int16_t> samples;
        int sample_rate = 16000;
    };

    AudioQueue() : stopped_(false) {}

    bool push(Block&& block) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        queue_.push(std::move(block));
        cv_pop_.notify_one();
        return true;
    }

    // Blocks until a block is available; false once stopped and drained.
    bool pop(Block& block) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (stopped_ && queue_.empty()) {
            return false;
        }
        block = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // No more pushes; pop() drains what is left.
    void stop() {
        std::unique_lock<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_pop_.notify_all();
    }

    // Stop and throw away everything still queued.
    void stop_and_clear() {
        std::unique_lock<std::mutex> lock(mutex_);
        stopped_ = true;
        std::queue<Block>().swap(queue_);
        cv_pop_.notify_all();
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;
    std::queue<Block> queue_;
    bool stopped_;
};

}
