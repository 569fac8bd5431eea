/**
 * @file result_channel.hpp
 * @brief Bounded channel that workers use to hand results to the supervisor.
 * @author DeadlineGroup contributors
 *
 * Delivery is raced against a DeadlineSignal: the expiry check and the push
 * happen under the same lock, so a worker can never deliver after the
 * supervisor has fired the signal and closed the channel. When the deadline
 * and a delivery become ready together, the deadline wins.
 */

#pragma once

#include "group/deadline.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace deadline_group {

enum class SendStatus : uint8_t {
    Delivered,
    DeadlinePassed,
    Closed,
    Full
};

[[nodiscard]] constexpr std::string_view to_string(SendStatus status) noexcept {
    switch (status) {
        case SendStatus::Delivered:      return "delivered";
        case SendStatus::DeadlinePassed: return "deadline_passed";
        case SendStatus::Closed:         return "closed";
        case SendStatus::Full:           return "full";
    }
    return "unknown";
}

template <typename T>
class ResultChannel {
public:
    explicit ResultChannel(size_t capacity) : capacity_(capacity) {}

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    /**
     * @brief Push @p value unless the deadline has fired.
     *
     * @p value is moved from only when the result is Delivered; otherwise
     * the caller still owns it (e.g. to hand it to a timeout handler).
     */
    SendStatus send_before(T& value, DeadlineSignal& deadline) {
        std::lock_guard lock(mutex_);
        if (deadline.expired()) return SendStatus::DeadlinePassed;
        if (closed_) return SendStatus::Closed;
        if (buffer_.size() >= capacity_) return SendStatus::Full;
        buffer_.push_back(std::move(value));
        return SendStatus::Delivered;
    }

    /// Close the channel and return everything buffered, in send order.
    std::vector<T> close_and_drain() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        std::vector<T> drained;
        drained.reserve(buffer_.size());
        while (!buffer_.empty()) {
            drained.push_back(std::move(buffer_.front()));
            buffer_.pop_front();
        }
        return drained;
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return buffer_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> buffer_;
    bool closed_{false};
};

}  // namespace deadline_group
