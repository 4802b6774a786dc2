#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include <parafetch/fetcher/fetcher.hpp>

namespace parafetch {

// Unbounded MPSC queue of progress reports. send() never blocks the producer; receive()
// blocks until a report arrives and returns std::nullopt once the channel is closed and
// drained, so a consumer loop always terminates.
class ProgressChannel final : public IProgressSink {
public:
    ProgressChannel() = default;
    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    void send(const ProgressReport& report) override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) {
                ++dropped_;
                return;
            }
            queue_.push_back(report);
        }
        cv_.notify_one();
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            ++closeCount_;
        }
        cv_.notify_all();
    }

    std::optional<ProgressReport> receive() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty())
            return std::nullopt;
        ProgressReport out = queue_.front();
        queue_.pop_front();
        return out;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    std::size_t closeCount() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closeCount_;
    }

    // Reports sent after close().
    std::size_t dropped() const {
        std::lock_guard<std::mutex> lk(mu_);
        return dropped_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<ProgressReport> queue_;
    bool closed_{false};
    std::size_t closeCount_{0};
    std::size_t dropped_{0};
};

} // namespace parafetch
