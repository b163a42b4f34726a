//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements priority-tiered request dispatch and cancellation.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/PriorityDispatcher.h"

#include "lspbroker/Support/Log.h"

#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lspbroker::lsp
{

llvm::StringRef priorityName(const Priority priority)
{
    switch (priority)
    {
    case Priority::Low:
        return "low";
    case Priority::Normal:
        return "normal";
    case Priority::High:
        return "high";
    case Priority::Critical:
        return "critical";
    }
    return "normal";
}

std::optional<Priority> parsePriority(const llvm::StringRef text)
{
    const std::string normalized = text.trim().lower();
    if (normalized == "low")
    {
        return Priority::Low;
    }
    if (normalized == "normal")
    {
        return Priority::Normal;
    }
    if (normalized == "high")
    {
        return Priority::High;
    }
    if (normalized == "critical")
    {
        return Priority::Critical;
    }
    return std::nullopt;
}

CancellationToken::CancellationToken(std::shared_ptr<std::atomic_bool> state)
    : state_(std::move(state))
{
}

bool CancellationToken::isCancellationRequested() const
{
    return state_ && state_->load(std::memory_order_relaxed);
}

class PriorityDispatcher::Impl final
{
public:
    explicit Impl(const std::size_t workers)
    {
        const std::size_t count = workers == 0 ? 1 : workers;
        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            workers_.emplace_back([this]() { run(); });
        }
    }

    ~Impl()
    {
        shutdown();
    }

    bool enqueue(std::string        requestKey,
                 std::string        method,
                 const Priority     priority,
                 DispatchTask       task,
                 DispatchCompletion completion)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            return false;
        }
        if (requestStates_.contains(requestKey))
        {
            return false;
        }

        auto cancellation = std::make_shared<std::atomic_bool>(false);
        requestStates_.emplace(requestKey, cancellation);
        queues_[static_cast<std::size_t>(priority)].push_back(WorkItem{std::move(requestKey),
                                                                       std::move(method),
                                                                       std::move(task),
                                                                       std::move(completion),
                                                                       std::move(cancellation)});
        ++queued_;
        cv_.notify_one();
        return true;
    }

    bool cancel(const std::string& requestKey)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = requestStates_.find(requestKey);
        if (it == requestStates_.end())
        {
            return false;
        }
        it->second->store(true, std::memory_order_relaxed);
        return true;
    }

    void shutdown()
    {
        std::vector<WorkItem> abandoned;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
            for (auto& queue : queues_)
            {
                for (WorkItem& item : queue)
                {
                    requestStates_.erase(item.requestKey);
                    abandoned.push_back(std::move(item));
                }
                queue.clear();
            }
            queued_ = 0;
            for (const auto& [_, state] : requestStates_)
            {
                state->store(true, std::memory_order_relaxed);
            }
        }
        cv_.notify_all();

        for (WorkItem& item : abandoned)
        {
            if (item.completion)
            {
                DispatchResult result;
                result.status  = DispatchStatus::Failed;
                result.failure = FailureInfo{ErrorKind::SessionShuttingDown,
                                             "'" + item.method + "' was queued when its session shut down",
                                             0};
                item.completion(std::move(result), 0);
            }
        }

        for (std::thread& worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    std::size_t queuedCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queued_;
    }

    std::size_t runningCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

private:
    struct WorkItem final
    {
        std::string                       requestKey;
        std::string                       method;
        DispatchTask                      task;
        DispatchCompletion                completion;
        std::shared_ptr<std::atomic_bool> cancellation;
    };

    static constexpr std::size_t TierCount = 4;

    /// Highest non-empty tier first. Caller holds the lock and has checked `queued_ > 0`.
    WorkItem popHighestLocked()
    {
        for (std::size_t tier = TierCount; tier-- > 0;)
        {
            auto& queue = queues_[tier];
            if (!queue.empty())
            {
                WorkItem item = std::move(queue.front());
                queue.pop_front();
                --queued_;
                return item;
            }
        }
        return WorkItem{};
    }

    void run()
    {
        while (true)
        {
            WorkItem item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || queued_ > 0; });
                if (queued_ == 0)
                {
                    if (stopping_)
                    {
                        return;
                    }
                    continue;
                }
                item = popHighestLocked();
                ++running_;
            }

            DispatchResult result;
            const auto     start = std::chrono::steady_clock::now();
            if (item.cancellation->load(std::memory_order_relaxed))
            {
                result.status = DispatchStatus::Cancelled;
            }
            else
            {
                try
                {
                    result = item.task(CancellationToken(item.cancellation));
                } catch (const std::exception& ex)
                {
                    result.status  = DispatchStatus::Failed;
                    result.failure = FailureInfo{ErrorKind::InvalidRequest, ex.what(), 0};
                    logMessage(LogLevel::Error, "dispatch", "'" + item.method + "' threw: " + ex.what());
                }
            }
            const auto finish = std::chrono::steady_clock::now();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                requestStates_.erase(item.requestKey);
                --running_;
            }

            if (item.completion)
            {
                const auto latencyMicros =
                    std::chrono::duration_cast<std::chrono::microseconds>(finish - start).count();
                item.completion(std::move(result), static_cast<std::uint64_t>(latencyMicros));
            }
        }
    }

    mutable std::mutex                                                 mutex_;
    std::condition_variable                                            cv_;
    std::array<std::deque<WorkItem>, TierCount>                        queues_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic_bool>> requestStates_;
    std::size_t                                                        queued_{0};
    std::size_t                                                        running_{0};
    bool                                                               stopping_{false};
    std::vector<std::thread>                                           workers_;
};

PriorityDispatcher::PriorityDispatcher(const std::size_t workers)
    : impl_(std::make_unique<Impl>(workers))
{
}

PriorityDispatcher::~PriorityDispatcher() = default;

bool PriorityDispatcher::enqueue(std::string        requestKey,
                                 std::string        method,
                                 const Priority     priority,
                                 DispatchTask       task,
                                 DispatchCompletion completion)
{
    return impl_->enqueue(std::move(requestKey), std::move(method), priority, std::move(task), std::move(completion));
}

bool PriorityDispatcher::cancel(const std::string& requestKey)
{
    return impl_->cancel(requestKey);
}

void PriorityDispatcher::shutdown()
{
    impl_->shutdown();
}

std::size_t PriorityDispatcher::queuedCount() const
{
    return impl_->queuedCount();
}

std::size_t PriorityDispatcher::runningCount() const
{
    return impl_->runningCount();
}

}  // namespace lspbroker::lsp
