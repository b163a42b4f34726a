//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Pool of language server sessions and their lifecycle state machine.
///
/// One session exists per (project root, language). Sessions are spawned on
/// first use, initialized, fed documents, monitored for crashes, idleness and
/// memory growth, restarted with exponential backoff after failures, and
/// retired when the pool is full. Results of cacheable requests are served
/// from a shared response cache keyed on document content.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_LIFECYCLE_MANAGER_H
#define LSPBROKER_LSP_LIFECYCLE_MANAGER_H

#include "lspbroker/LSP/BrokerConfig.h"
#include "lspbroker/LSP/LanguageServerRegistry.h"
#include "lspbroker/LSP/PriorityDispatcher.h"
#include "lspbroker/LSP/ProjectDetector.h"
#include "lspbroker/LSP/ProtocolSession.h"
#include "lspbroker/LSP/ResponseCache.h"
#include "lspbroker/LSP/Telemetry.h"
#include "lspbroker/Support/Channel.h"
#include "lspbroker/Support/Error.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lspbroker::lsp
{

/// @brief Lifecycle state of one session.
enum class SessionState
{
    Unspawned,
    Spawning,
    Initializing,
    Ready,
    ShuttingDown,
    Terminated,
    Errored,
};

[[nodiscard]] llvm::StringRef sessionStateName(SessionState state);

/// @brief One observed state change.
struct StateTransition final
{
    ProjectKey                            key;
    SessionState                          from{SessionState::Unspawned};
    SessionState                          to{SessionState::Unspawned};
    std::chrono::steady_clock::time_point at;
    std::string                           reason;
};

/// @brief A request routed to a project's language server.
struct SubmitRequest final
{
    ProjectKey        key;
    std::string       method;
    llvm::json::Value params{nullptr};
    Priority          priority{Priority::Normal};

    /// @brief Absolute deadline. Defaults to now plus the configured request timeout.
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /// @brief File the request is about. It is synchronized before dispatch and
    /// its URI is filled into `params.textDocument.uri` when absent. When unset,
    /// a `file://` URI in `params.textDocument.uri` names the file instead.
    std::optional<std::string> documentPath;
};

/// @brief Point-in-time view of one session.
struct SessionStatus final
{
    ProjectKey                   key;
    SessionState                 state{SessionState::Unspawned};
    std::uint32_t                crashCount{0};
    std::chrono::milliseconds    backoff{0};
    std::optional<int>           pid;
    std::size_t                  pendingRequests{0};
    std::size_t                  openDocuments{0};
    std::optional<std::uint64_t> residentBytes;
    std::optional<FailureInfo>   lastError;
    std::chrono::milliseconds    idleFor{0};
};

/// @brief Source of document text for synchronization.
class FileContentProvider
{
public:
    virtual ~FileContentProvider() = default;

    /// @brief Returns the current content of `path` or an `InvalidRequest` error.
    [[nodiscard]] virtual llvm::Expected<std::string> read(llvm::StringRef path) = 0;
};

/// @brief Reads documents from disk.
class DiskFileContentProvider final : public FileContentProvider
{
public:
    [[nodiscard]] llvm::Expected<std::string> read(llvm::StringRef path) override;
};

/// @brief Memory sampler used by the resource monitor.
class ResourceSampler
{
public:
    virtual ~ResourceSampler() = default;

    [[nodiscard]] virtual std::optional<std::uint64_t> residentBytes(int pid) = 0;
};

/// @brief Samples resident memory from `/proc`.
class ProcStatmSampler final : public ResourceSampler
{
public:
    [[nodiscard]] std::optional<std::uint64_t> residentBytes(int pid) override;
};

/// @brief Cumulative manager counters.
struct ManagerStats final
{
    std::uint64_t spawns{0};
    std::uint64_t crashes{0};
    std::uint64_t resourceRestarts{0};
    std::uint64_t idleShutdowns{0};
    std::uint64_t evictions{0};
};

/// @brief Aggregate health view.
struct HealthReport final
{
    std::vector<SessionStatus> sessions;
    ManagerStats               totals;
    CacheStats                 cache;
    std::size_t                liveSessions{0};

    /// @brief Sessions whose last memory sample exceeded the threshold.
    std::size_t overLimit{0};
};

/// @brief Owns every language server session of a workspace.
class LifecycleManager final
{
public:
    /// @param[in] config Broker settings.
    /// @param[in] registry Server definitions.
    /// @param[in] files Document source; disk when null.
    /// @param[in] sampler Memory sampler; `/proc` when null.
    LifecycleManager(BrokerConfig                         config,
                     LanguageServerRegistry               registry,
                     std::shared_ptr<FileContentProvider> files   = nullptr,
                     std::shared_ptr<ResourceSampler>     sampler = nullptr);

    /// @brief Terminates every live session.
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&)            = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /// @brief Runs one request, spawning and initializing the session when needed.
    [[nodiscard]] llvm::Expected<llvm::json::Value> submit(SubmitRequest request);

    /// @brief Resolves the project of `path` and submits a request about that file.
    [[nodiscard]] llvm::Expected<llvm::json::Value> submitForFile(llvm::StringRef   path,
                                                                  llvm::StringRef   method,
                                                                  llvm::json::Value params,
                                                                  Priority          priority = Priority::Normal);

    [[nodiscard]] llvm::Expected<DetectedProject> resolveProject(llvm::StringRef path) const;

    /// @brief Synchronizes `path` and waits for its next published diagnostics.
    ///
    /// Returns the last published diagnostics immediately when the document was
    /// already current. Servers do not signal analysis completion, so this is
    /// best effort and fails with `RequestTimeout` when nothing arrives.
    [[nodiscard]] llvm::Expected<llvm::json::Value> awaitDiagnostics(const ProjectKey&         key,
                                                                     llvm::StringRef           path,
                                                                     std::chrono::milliseconds timeout);

    /// @brief Drops cached responses that depend on `path`.
    void notifyFileWritten(llvm::StringRef path);

    /// @brief Drops cached responses for `path` and closes it in every session.
    void notifyFileDeleted(llvm::StringRef path);

    /// @brief Retires the session and spawns a fresh one. Clears crash backoff.
    [[nodiscard]] llvm::Error forceRestart(const ProjectKey& key);

    /// @brief Retires the session without respawning it.
    [[nodiscard]] llvm::Error forceStop(const ProjectKey& key);

    [[nodiscard]] SessionStatus              status(const ProjectKey& key) const;
    [[nodiscard]] std::vector<SessionStatus> statusAll() const;
    [[nodiscard]] HealthReport               healthReport() const;

    /// @brief Subscribes to state transitions of every session.
    [[nodiscard]] std::shared_ptr<Channel<StateTransition>> subscribeTransitions(std::size_t capacity = 256);

    /// @brief Subscribes to server notifications of the session, starting it if needed.
    [[nodiscard]] llvm::Expected<std::shared_ptr<Channel<Notification>>> subscribeNotifications(
        const ProjectKey& key,
        std::size_t       capacity = 100);

    /// @brief Retires sessions idle for longer than the idle timeout. Called by the idle monitor.
    void runIdleCheck();

    /// @brief Samples memory and restarts sessions above the threshold. Called by the resource monitor.
    void runResourceCheck();

    /// @brief Terminates every session and rejects further submissions.
    void shutdownAll();

    [[nodiscard]] const BrokerConfig&           config() const;
    [[nodiscard]] const LanguageServerRegistry& registry() const;
    [[nodiscard]] Telemetry&                    telemetry();
    [[nodiscard]] ResponseCache&                cache();
    [[nodiscard]] ManagerStats                  stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_LIFECYCLE_MANAGER_H
