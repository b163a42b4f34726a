//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Bounded multi-producer message channel.
///
/// Producers never block: when the channel is full the oldest message is
/// dropped and counted. Consumers wait with a timeout.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_SUPPORT_CHANNEL_H
#define LSPBROKER_SUPPORT_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace lspbroker
{

/// @brief Bounded drop-oldest queue shared between threads.
template <typename T>
class Channel final
{
public:
    /// @brief Creates a channel holding at most `capacity` messages.
    explicit Channel(const std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    Channel(const Channel&)            = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Enqueues a message; returns `false` when the channel is closed.
    bool send(T value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
            {
                return false;
            }
            if (queue_.size() >= capacity_)
            {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /// @brief Waits up to `timeout` for a message.
    /// @return The message, or `std::nullopt` on timeout or when closed and drained.
    template <typename Rep, typename Period>
    std::optional<T> receive(const std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
        if (queue_.empty())
        {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /// @brief Returns a queued message without waiting.
    std::optional<T> tryReceive()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
        {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /// @brief Rejects further sends and wakes all receivers.
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /// @brief Number of messages discarded because the channel was full.
    [[nodiscard]] std::uint64_t droppedCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const std::size_t       capacity_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<T>           queue_;
    std::uint64_t           dropped_{0};
    bool                    closed_{false};
};

}  // namespace lspbroker

#endif  // LSPBROKER_SUPPORT_CHANNEL_H
