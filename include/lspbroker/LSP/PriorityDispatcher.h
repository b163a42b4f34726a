//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Priority-ordered request dispatch for one session.
///
/// Work is queued per priority tier and executed by a fixed pool of worker
/// threads, which bounds the number of requests in flight to a server. Higher
/// tiers are always served first; within a tier the order is FIFO.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_PRIORITY_DISPATCHER_H
#define LSPBROKER_LSP_PRIORITY_DISPATCHER_H

#include "lspbroker/Support/Error.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lspbroker::lsp
{

/// @brief Priority class of a submitted request.
enum class Priority
{
    Low,
    Normal,
    High,
    Critical,
};

/// @brief Returns `low`, `normal`, `high`, or `critical`.
[[nodiscard]] llvm::StringRef priorityName(Priority priority);

/// @brief Parses a priority name.
[[nodiscard]] std::optional<Priority> parsePriority(llvm::StringRef text);

/// @brief Cooperative cancellation token for a dispatched request.
class CancellationToken final
{
public:
    /// @brief Returns whether cancellation has been requested.
    [[nodiscard]] bool isCancellationRequested() const;

private:
    friend class PriorityDispatcher;
    explicit CancellationToken(std::shared_ptr<std::atomic_bool> state);

    std::shared_ptr<std::atomic_bool> state_;
};

/// @brief Outcome of dispatched work.
enum class DispatchStatus
{
    /// @brief Work completed with a value.
    Completed,

    /// @brief Work was cancelled before or while running.
    Cancelled,

    /// @brief Work failed; see `DispatchResult::failure`.
    Failed,
};

/// @brief Result envelope for dispatched work.
struct DispatchResult final
{
    DispatchStatus    status{DispatchStatus::Failed};
    llvm::json::Value value{nullptr};
    FailureInfo       failure;
};

/// @brief Unit of dispatched work.
using DispatchTask = std::function<DispatchResult(CancellationToken token)>;

/// @brief Completion callback invoked exactly once per accepted task.
using DispatchCompletion = std::function<void(DispatchResult result, std::uint64_t latencyMicros)>;

/// @brief Multi-worker priority scheduler for one session.
class PriorityDispatcher final
{
public:
    /// @brief Starts `workers` worker threads (at least one).
    explicit PriorityDispatcher(std::size_t workers);
    ~PriorityDispatcher();

    PriorityDispatcher(const PriorityDispatcher&)            = delete;
    PriorityDispatcher& operator=(const PriorityDispatcher&) = delete;

    /// @brief Enqueues work.
    /// @param[in] requestKey Unique key used for cancellation.
    /// @param[in] method Request method name for tracing.
    /// @param[in] priority Priority tier.
    /// @param[in] task Work body.
    /// @param[in] completion Completion callback.
    /// @return `false` after shutdown or when the key is already in use.
    [[nodiscard]] bool enqueue(std::string        requestKey,
                               std::string        method,
                               Priority           priority,
                               DispatchTask       task,
                               DispatchCompletion completion);

    /// @brief Requests cancellation. Queued work completes as `Cancelled` without running.
    /// @return `true` when the key is queued or running.
    [[nodiscard]] bool cancel(const std::string& requestKey);

    /// @brief Fails queued work with `SessionShuttingDown`, waits for running work, and stops the workers.
    void shutdown();

    [[nodiscard]] std::size_t queuedCount() const;
    [[nodiscard]] std::size_t runningCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_PRIORITY_DISPATCHER_H
