#pragma once

#include <condition_variable>
#include <deque>
#include <chrono>
#include <mutex>

namespace cs {
    // capacity 1 gives the single-slot producer/consumer channel used between
    // capture workers and the output writer
    template <class T>
    class BoundedQueue {
    public:
        explicit BoundedQueue(size_t capacity) : cap_(capacity) {}

        // returns false when the queue is stopped
        bool push_drop_oldest(T v) {
            {
                std::lock_guard lk(m_);
                if (stopped_ || cap_ == 0) return false;
                if (q_.size() >= cap_) q_.pop_front();
                q_.push_back(std::move(v));
            }
            cv_.notify_one();
            return true;
        }

        template <class Rep, class Period>
        bool pop_for(T& out, std::chrono::duration<Rep, Period> d) {
            std::unique_lock lk(m_);
            if (!cv_.wait_for(lk, d, [&]{ return stopped_ || !q_.empty(); })) return false;
            if (stopped_ || q_.empty()) return false;
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        void stop() {
            {
                std::lock_guard lk(m_);
                stopped_ = true;
                q_.clear();
            }
            cv_.notify_all();
        }

        // reopens a stopped queue, empty
        void reset() {
            std::lock_guard lk(m_);
            q_.clear();
            stopped_ = false;
        }

        bool stopped() const {
            std::lock_guard lk(m_);
            return stopped_;
        }

    private:
        size_t cap_;
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
        bool stopped_ = false;
    };
}
