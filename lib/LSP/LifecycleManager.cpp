//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the session pool, its state machine, and its monitors.
///
/// Locking: `mutex_` guards the session table and every `SessionEntry` field.
/// It is held only for state transitions and table edits. Spawning, the
/// initialize handshake, round trips and process teardown all run on a
/// `LiveSession` the caller owns through a shared pointer, with the table
/// unlocked. `LiveSession::close` never runs with `mutex_` held.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/LifecycleManager.h"

#include "lspbroker/LSP/DocumentSynchronizer.h"
#include "lspbroker/LSP/ProcessSupervisor.h"
#include "lspbroker/Support/Log.h"
#include "lspbroker/Support/Uri.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace lspbroker::lsp
{

llvm::StringRef sessionStateName(const SessionState state)
{
    switch (state)
    {
    case SessionState::Unspawned:
        return "Unspawned";
    case SessionState::Spawning:
        return "Spawning";
    case SessionState::Initializing:
        return "Initializing";
    case SessionState::Ready:
        return "Ready";
    case SessionState::ShuttingDown:
        return "ShuttingDown";
    case SessionState::Terminated:
        return "Terminated";
    case SessionState::Errored:
        return "Errored";
    }
    return "Unspawned";
}

llvm::Expected<std::string> DiskFileContentProvider::read(const llvm::StringRef path)
{
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
        llvm::MemoryBuffer::getFile(path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
    if (!buffer)
    {
        return makeBrokerError(ErrorKind::InvalidRequest,
                               "cannot read '" + path + "': " + buffer.getError().message());
    }
    return (*buffer)->getBuffer().str();
}

std::optional<std::uint64_t> ProcStatmSampler::residentBytes(const int pid)
{
    return readResidentSetBytes(pid);
}

namespace
{

using Clock = std::chrono::steady_clock;

/// Running server process with its protocol endpoint, documents and dispatcher.
struct LiveSession final
{
    ProjectKey                          key;
    std::uint64_t                       generation{0};
    std::unique_ptr<ProcessSupervisor>  process;
    std::unique_ptr<ProtocolSession>    protocol;
    DocumentSynchronizer                documents;
    std::unique_ptr<PriorityDispatcher> dispatcher;
    std::shared_ptr<std::atomic_bool>   watcherStop{std::make_shared<std::atomic_bool>(false)};
    std::thread                         watcher;

    /// Set when the session left the pool because the server failed.
    std::atomic_bool crashed{false};

    std::mutex closeMutex;
    bool       closed{false};

    LiveSession() = default;

    LiveSession(const LiveSession&)            = delete;
    LiveSession& operator=(const LiveSession&) = delete;

    ~LiveSession()
    {
        close(false, std::chrono::milliseconds(0));
    }

    /// Idempotent. A graceful close sends `shutdown` and `exit` and waits up to
    /// `timeout` for the process to leave before it is signalled.
    void close(const bool graceful, const std::chrono::milliseconds timeout)
    {
        std::lock_guard<std::mutex> lock(closeMutex);
        if (closed)
        {
            return;
        }
        closed = true;
        watcherStop->store(true);

        if (graceful && protocol && process)
        {
            if (llvm::Error error = protocol->shutdown(timeout))
            {
                logMessage(LogLevel::Info,
                           "lifecycle",
                           key.str() + ": shutdown handshake failed: " + llvm::toString(std::move(error)));
            }
            else if (!process->exitSignal().waitFor(timeout))
            {
                logMessage(LogLevel::Warning, "lifecycle", key.str() + ": server did not exit after 'exit'");
            }
        }
        if (process)
        {
            process->terminate(graceful ? timeout : std::chrono::milliseconds(0));
        }
        if (dispatcher)
        {
            dispatcher->shutdown();
        }
        if (protocol)
        {
            protocol->stop();
        }
        if (watcher.joinable())
        {
            watcher.join();
        }
        documents.clear();
    }
};

struct SessionEntry final
{
    ProjectKey                   key;
    SessionState                 state{SessionState::Unspawned};
    std::shared_ptr<LiveSession> live;
    Clock::time_point            lastActivity{Clock::now()};
    std::uint32_t                crashCount{0};
    std::chrono::milliseconds    backoff{0};
    Clock::time_point            retryNotBefore{};
    std::optional<FailureInfo>   lastError;
    std::optional<std::uint64_t> residentBytes;
    std::size_t                  inflight{0};
    std::uint64_t                generation{0};
};

/// Posted by a session watcher when its server exits or breaks framing.
struct CrashNotice final
{
    ProjectKey    key;
    std::uint64_t generation{0};
};

/// Completion slot shared between a submitter and a dispatcher worker.
struct CallSlot final
{
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    done{false};
    DispatchResult          result;
};

bool isLive(const SessionState state)
{
    return state == SessionState::Spawning || state == SessionState::Initializing || state == SessionState::Ready ||
           state == SessionState::ShuttingDown;
}

std::chrono::milliseconds millisBetween(const Clock::time_point from, const Clock::time_point to)
{
    if (to <= from)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

/// Path named by a `file://` URI in `params.textDocument.uri`, if any.
std::optional<std::string> documentPathFromParams(const llvm::json::Value& params)
{
    const llvm::json::Object* object = params.getAsObject();
    if (object == nullptr)
    {
        return std::nullopt;
    }
    const llvm::json::Object* textDocument = object->getObject("textDocument");
    if (textDocument == nullptr)
    {
        return std::nullopt;
    }
    const auto uri = textDocument->getString("uri");
    if (!uri || !uri->startswith("file://"))
    {
        return std::nullopt;
    }
    std::string path = fileUriToPath(*uri);
    if (path.empty())
    {
        return std::nullopt;
    }
    return path;
}

/// Fills `params.textDocument.uri`. An existing URI is kept unless `replace`
/// is set, which rewrites it to the form used for synchronization.
llvm::json::Value withDocumentUri(llvm::json::Value params, const std::string& uri, const bool replace)
{
    if (params.kind() == llvm::json::Value::Null)
    {
        params = llvm::json::Object{};
    }
    llvm::json::Object* object = params.getAsObject();
    if (object == nullptr)
    {
        return params;
    }
    llvm::json::Object* textDocument = object->getObject("textDocument");
    if (textDocument == nullptr)
    {
        (*object)["textDocument"] = llvm::json::Object{{"uri", uri}};
        return params;
    }
    if (replace || textDocument->find("uri") == textDocument->end())
    {
        (*textDocument)["uri"] = uri;
    }
    return params;
}

}  // namespace

class LifecycleManager::Impl final
{
public:
    Impl(BrokerConfig                         config,
         LanguageServerRegistry               registry,
         std::shared_ptr<FileContentProvider> files,
         std::shared_ptr<ResourceSampler>     sampler)
        : config_(std::move(config))
        , registry_(std::move(registry))
        , detector_(registry_, config_.workspaceRoot)
        , files_(files ? std::move(files) : std::make_shared<DiskFileContentProvider>())
        , sampler_(sampler ? std::move(sampler) : std::make_shared<ProcStatmSampler>())
        , cache_(config_.cacheCapacity)
        , crashes_(std::make_shared<Channel<CrashNotice>>(64))
    {
        reaper_ = std::thread([this]() { reapCrashes(); });
        if (config_.enableIdleMonitor)
        {
            monitors_.emplace_back([this]() { monitorLoop(config_.idleCheckInterval, [this]() { runIdleCheck(); }); });
        }
        if (config_.enableResourceMonitor)
        {
            monitors_.emplace_back(
                [this]() { monitorLoop(config_.resourceCheckInterval, [this]() { runResourceCheck(); }); });
        }
    }

    ~Impl()
    {
        shutdownAll();
    }

    llvm::Expected<llvm::json::Value> submit(SubmitRequest request)
    {
        const Clock::time_point deadline = request.deadline ? *request.deadline : Clock::now() + config_.requestTimeout;
        if (request.method.empty())
        {
            return makeBrokerError(ErrorKind::InvalidRequest, "request method is empty");
        }
        const LanguageServerSpec* spec = registry_.find(request.key.language);
        if (spec == nullptr)
        {
            return makeBrokerError(ErrorKind::ProjectNotFound,
                                   "no language server registered for '" + request.key.language + "'");
        }
        request.key.root = normalizePath(request.key.root);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return makeBrokerError(ErrorKind::SessionShuttingDown, "session manager is shutting down");
            }
        }

        bool uriFromParams = false;
        if (!request.documentPath)
        {
            if (std::optional<std::string> path = documentPathFromParams(request.params))
            {
                request.documentPath = std::move(*path);
                uriFromParams        = true;
            }
        }

        std::string              content;
        std::string              uri;
        std::uint64_t            fingerprint = 0;
        std::vector<std::string> dependencies;
        if (request.documentPath)
        {
            const std::string path = normalizePath(*request.documentPath);
            llvm::Expected<std::string> text = files_->read(path);
            if (!text)
            {
                return takeFailureInfo(text.takeError(), ErrorKind::InvalidRequest).toError();
            }
            content     = std::move(*text);
            uri         = pathToFileUri(path);
            fingerprint = contentFingerprint(content);
            dependencies.push_back(path);
            request.params = withDocumentUri(std::move(request.params), uri, /*replace=*/uriFromParams);
        }

        const std::chrono::milliseconds ttl = cacheTtlFor(config_, request.method);
        const CacheKey                  cacheKey =
            makeCacheKey(request.key.root, request.key.language, request.method, request.params, fingerprint);
        if (ttl.count() > 0)
        {
            if (std::optional<llvm::json::Value> hit = cache_.lookup(cacheKey))
            {
                telemetry_.recordCacheHit(request.method);
                logMessage(LogLevel::Verbose, "cache", "hit for " + request.method + " in " + request.key.str());
                return std::move(*hit);
            }
        }
        const CacheObservation observation = cache_.observe(dependencies);

        llvm::Expected<Lease> lease = acquire(request.key, *spec, deadline);
        if (!lease)
        {
            return lease.takeError();
        }
        LeaseGuard guard(*this, *lease);
        LiveSession& live = *lease->live;

        if (request.documentPath)
        {
            llvm::Expected<SyncAction> action = live.documents.ensureOpen(*live.protocol, uri, spec->languageId, content);
            if (!action)
            {
                FailureInfo failure = takeFailureInfo(action.takeError(), ErrorKind::SessionCrashed);
                sessionFailed(*lease, failure);
                return failure.toError();
            }
            if (*action == SyncAction::Opened && config_.settleDelay.count() > 0)
            {
                std::this_thread::sleep_for(config_.settleDelay);
            }
        }

        auto              slot       = std::make_shared<CallSlot>();
        const std::string requestKey = std::to_string(nextRequestKey_.fetch_add(1) + 1);
        ProtocolSession*  protocol   = live.protocol.get();
        const bool        accepted   = live.dispatcher->enqueue(
            requestKey,
            request.method,
            request.priority,
            [protocol, method = request.method, params = request.params, deadline](
                const CancellationToken token) -> DispatchResult {
                DispatchResult result;
                if (token.isCancellationRequested() || Clock::now() >= deadline)
                {
                    result.status = DispatchStatus::Cancelled;
                    return result;
                }
                llvm::Expected<llvm::json::Value> response = protocol->call(method, params, deadline);
                if (!response)
                {
                    result.status  = DispatchStatus::Failed;
                    result.failure = takeFailureInfo(response.takeError(), ErrorKind::SessionCrashed);
                    return result;
                }
                result.status = DispatchStatus::Completed;
                result.value  = std::move(*response);
                return result;
            },
            [slot](DispatchResult result, std::uint64_t) {
                {
                    std::lock_guard<std::mutex> lock(slot->mutex);
                    slot->result = std::move(result);
                    slot->done   = true;
                }
                slot->cv.notify_all();
            });
        if (!accepted)
        {
            return makeBrokerError(ErrorKind::SessionShuttingDown, request.key.str() + " is shutting down");
        }

        DispatchResult result;
        {
            std::unique_lock<std::mutex> lock(slot->mutex);
            if (!slot->cv.wait_until(lock, deadline, [&slot]() { return slot->done; }))
            {
                lock.unlock();
                (void) live.dispatcher->cancel(requestKey);
                return makeBrokerError(ErrorKind::RequestTimeout, "'" + request.method + "' exceeded its deadline");
            }
            result = std::move(slot->result);
        }

        switch (result.status)
        {
        case DispatchStatus::Completed:
            if (ttl.count() > 0)
            {
                (void) cache_.store(cacheKey, result.value, std::move(dependencies), observation, ttl);
            }
            return std::move(result.value);
        case DispatchStatus::Cancelled:
            return makeBrokerError(ErrorKind::RequestTimeout, "'" + request.method + "' was cancelled at its deadline");
        case DispatchStatus::Failed:
            break;
        }

        FailureInfo failure = std::move(result.failure);
        if (failure.kind == ErrorKind::SessionShuttingDown && live.crashed.load())
        {
            if (std::optional<FailureInfo> crash = live.protocol->failure())
            {
                failure = std::move(*crash);
            }
        }
        if (failure.kind == ErrorKind::SessionCrashed || failure.kind == ErrorKind::FramingFault)
        {
            sessionFailed(*lease, failure);
        }
        return failure.toError();
    }

    llvm::Expected<llvm::json::Value> awaitDiagnostics(const ProjectKey&               rawKey,
                                                       const llvm::StringRef           filePath,
                                                       const std::chrono::milliseconds timeout)
    {
        const Clock::time_point   deadline = Clock::now() + timeout;
        const LanguageServerSpec* spec     = registry_.find(rawKey.language);
        if (spec == nullptr)
        {
            return makeBrokerError(ErrorKind::ProjectNotFound,
                                   "no language server registered for '" + rawKey.language + "'");
        }
        const ProjectKey  key{normalizePath(rawKey.root), rawKey.language};
        const std::string path = normalizePath(filePath.str());
        llvm::Expected<std::string> content = files_->read(path);
        if (!content)
        {
            return takeFailureInfo(content.takeError(), ErrorKind::InvalidRequest).toError();
        }
        const std::string uri = pathToFileUri(path);

        llvm::Expected<Lease> lease = acquire(key, *spec, deadline);
        if (!lease)
        {
            return lease.takeError();
        }
        LeaseGuard   guard(*this, *lease);
        LiveSession& live = *lease->live;

        // Subscribe first so a publish racing the didOpen is not missed.
        std::shared_ptr<Channel<Notification>> channel = live.protocol->subscribe();
        llvm::Expected<SyncAction> action = live.documents.ensureOpen(*live.protocol, uri, spec->languageId, *content);
        if (!action)
        {
            FailureInfo failure = takeFailureInfo(action.takeError(), ErrorKind::SessionCrashed);
            sessionFailed(*lease, failure);
            return failure.toError();
        }
        if (*action == SyncAction::Unchanged)
        {
            if (std::optional<llvm::json::Value> latest = live.protocol->latestDiagnostics(uri))
            {
                return std::move(*latest);
            }
        }

        while (true)
        {
            const Clock::time_point current = Clock::now();
            if (current >= deadline)
            {
                return makeBrokerError(ErrorKind::RequestTimeout, "no diagnostics published for " + uri);
            }
            std::optional<Notification> notification = channel->receive(deadline - current);
            if (!notification)
            {
                if (channel->isClosed())
                {
                    FailureInfo failure = live.protocol->failure().value_or(
                        FailureInfo{ErrorKind::SessionCrashed, "session ended while waiting for diagnostics", 0});
                    return failure.toError();
                }
                continue;
            }
            if (notification->method != "textDocument/publishDiagnostics")
            {
                continue;
            }
            const llvm::json::Object* params = notification->params.getAsObject();
            if (params == nullptr)
            {
                continue;
            }
            const auto published = params->getString("uri");
            if (published && *published == uri)
            {
                return std::move(notification->params);
            }
        }
    }

    void notifyFileWritten(const llvm::StringRef path)
    {
        const std::string normalized = normalizePath(path.str());
        const std::size_t removed    = cache_.invalidate(normalized);
        logMessage(LogLevel::Verbose,
                   "cache",
                   llvm::formatv("{0} written; dropped {1} cached responses", normalized, removed));
    }

    void notifyFileDeleted(const llvm::StringRef path)
    {
        const std::string normalized = normalizePath(path.str());
        (void) cache_.invalidate(normalized);
        const std::string uri = pathToFileUri(normalized);

        std::vector<std::shared_ptr<LiveSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, entry] : sessions_)
            {
                if (entry->state == SessionState::Ready && entry->live)
                {
                    sessions.push_back(entry->live);
                }
            }
        }
        for (const auto& live : sessions)
        {
            if (!live->documents.lookup(uri))
            {
                continue;
            }
            if (llvm::Error error = live->documents.close(*live->protocol, uri))
            {
                logMessage(LogLevel::Info,
                           "documents",
                           live->key.str() + ": didClose for deleted file failed: " + llvm::toString(std::move(error)));
                (void) live->documents.forget(uri);
            }
        }
    }

    llvm::Error forceRestart(const ProjectKey& rawKey)
    {
        const ProjectKey          key{normalizePath(rawKey.root), rawKey.language};
        const LanguageServerSpec* spec = registry_.find(key.language);
        if (spec == nullptr)
        {
            return makeBrokerError(ErrorKind::ProjectNotFound, "no language server registered for '" + key.language + "'");
        }
        if (llvm::Error error = retire(key, "forced restart", /*forgetErrored=*/false))
        {
            return error;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto                  it = sessions_.find(key);
            if (it != sessions_.end() && it->second->state == SessionState::Errored)
            {
                it->second->crashCount     = 0;
                it->second->backoff        = std::chrono::milliseconds(0);
                it->second->retryNotBefore = Clock::time_point{};
            }
        }
        llvm::Expected<Lease> lease = acquire(key, *spec, Clock::now() + config_.handshakeTimeout);
        if (!lease)
        {
            return lease.takeError();
        }
        LeaseGuard guard(*this, *lease);
        return llvm::Error::success();
    }

    llvm::Error forceStop(const ProjectKey& rawKey)
    {
        return retire(ProjectKey{normalizePath(rawKey.root), rawKey.language}, "forced stop", /*forgetErrored=*/true);
    }

    SessionStatus status(const ProjectKey& rawKey) const
    {
        const ProjectKey              key{normalizePath(rawKey.root), rawKey.language};
        std::shared_ptr<LiveSession>  live;
        SessionStatus                 out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto                  it = sessions_.find(key);
            if (it == sessions_.end())
            {
                out.key = key;
                return out;
            }
            out  = snapshotLocked(*it->second);
            live = it->second->live;
        }
        fillLive(out, live);
        return out;
    }

    std::vector<SessionStatus> statusAll() const
    {
        std::vector<std::pair<SessionStatus, std::shared_ptr<LiveSession>>> snapshots;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, entry] : sessions_)
            {
                snapshots.emplace_back(snapshotLocked(*entry), entry->live);
            }
        }
        std::vector<SessionStatus> out;
        out.reserve(snapshots.size());
        for (auto& [status, live] : snapshots)
        {
            fillLive(status, live);
            out.push_back(std::move(status));
        }
        return out;
    }

    HealthReport healthReport() const
    {
        HealthReport report;
        report.sessions = statusAll();
        report.totals   = stats();
        report.cache    = cache_.stats();
        for (const SessionStatus& session : report.sessions)
        {
            if (isLive(session.state))
            {
                ++report.liveSessions;
            }
            if (session.residentBytes && *session.residentBytes > config_.memoryThresholdBytes)
            {
                ++report.overLimit;
            }
        }
        return report;
    }

    std::shared_ptr<Channel<StateTransition>> subscribeTransitions(const std::size_t capacity)
    {
        auto                        channel = std::make_shared<Channel<StateTransition>>(capacity);
        std::lock_guard<std::mutex> lock(mutex_);
        transitionSubscribers_.push_back(channel);
        return channel;
    }

    llvm::Expected<std::shared_ptr<Channel<Notification>>> subscribeNotifications(const ProjectKey& rawKey,
                                                                                   const std::size_t capacity)
    {
        const ProjectKey          key{normalizePath(rawKey.root), rawKey.language};
        const LanguageServerSpec* spec = registry_.find(key.language);
        if (spec == nullptr)
        {
            return makeBrokerError(ErrorKind::ProjectNotFound, "no language server registered for '" + key.language + "'");
        }
        llvm::Expected<Lease> lease = acquire(key, *spec, Clock::now() + config_.requestTimeout);
        if (!lease)
        {
            return lease.takeError();
        }
        LeaseGuard guard(*this, *lease);
        return lease->live->protocol->subscribe(capacity);
    }

    void runIdleCheck()
    {
        reconcileCrashed();

        std::vector<std::pair<std::shared_ptr<SessionEntry>, std::shared_ptr<LiveSession>>> doomed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const Clock::time_point     current = Clock::now();
            for (const auto& [_, entry] : sessions_)
            {
                if (entry->state != SessionState::Ready || entry->inflight != 0)
                {
                    continue;
                }
                if (current - entry->lastActivity < config_.idleTimeout)
                {
                    continue;
                }
                ++stats_.idleShutdowns;
                doomed.emplace_back(entry, beginRetireLocked(*entry, "idle timeout"));
            }
        }
        for (auto& [entry, live] : doomed)
        {
            finishRetire(entry, std::move(live), "idle shutdown complete");
        }
    }

    void runResourceCheck()
    {
        struct Sample final
        {
            std::shared_ptr<SessionEntry> entry;
            std::uint64_t                 generation{0};
            int                           pid{0};
            std::optional<std::uint64_t>  bytes;
        };

        std::vector<Sample> samples;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, entry] : sessions_)
            {
                if (entry->state == SessionState::Ready && entry->live)
                {
                    samples.push_back(Sample{entry, entry->generation, entry->live->process->pid(), std::nullopt});
                }
            }
        }
        for (Sample& sample : samples)
        {
            sample.bytes = sampler_->residentBytes(sample.pid);
        }

        std::vector<std::pair<std::shared_ptr<SessionEntry>, std::shared_ptr<LiveSession>>> doomed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const Sample& sample : samples)
            {
                SessionEntry& entry = *sample.entry;
                if (entry.generation != sample.generation || entry.state != SessionState::Ready)
                {
                    continue;
                }
                entry.residentBytes = sample.bytes;
                if (!sample.bytes || *sample.bytes <= config_.memoryThresholdBytes || entry.inflight != 0)
                {
                    continue;
                }
                logMessage(LogLevel::Warning,
                           "resources",
                           llvm::formatv("{0}: resident memory {1} bytes exceeds {2}; restarting",
                                         entry.key.str(),
                                         *sample.bytes,
                                         config_.memoryThresholdBytes));
                ++stats_.resourceRestarts;
                doomed.emplace_back(sample.entry,
                                    beginRetireLocked(entry, errorKindName(ErrorKind::ResourceExceeded).str()));
            }
        }
        for (auto& [entry, live] : doomed)
        {
            finishRetire(entry, std::move(live), "restart after resource limit");
        }
    }

    void shutdownAll()
    {
        {
            std::lock_guard<std::mutex> lock(monitorMutex_);
            if (monitorsStopping_)
            {
                return;
            }
            monitorsStopping_ = true;
        }
        monitorCv_.notify_all();
        for (std::thread& monitor : monitors_)
        {
            if (monitor.joinable())
            {
                monitor.join();
            }
        }

        std::vector<std::pair<std::shared_ptr<SessionEntry>, std::shared_ptr<LiveSession>>> doomed;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stopping_ = true;
            cv_.notify_all();
            // Let in-progress spawns settle so their processes are not orphaned.
            const Clock::time_point settleDeadline = Clock::now() + config_.handshakeTimeout;
            (void) cv_.wait_until(lock, settleDeadline, [this]() {
                return std::none_of(sessions_.begin(), sessions_.end(), [](const auto& item) {
                    return item.second->state == SessionState::Spawning ||
                           item.second->state == SessionState::Initializing;
                });
            });
            for (const auto& [_, entry] : sessions_)
            {
                if (entry->state == SessionState::Ready)
                {
                    doomed.emplace_back(entry, beginRetireLocked(*entry, "manager shutdown"));
                }
                else if (entry->live)
                {
                    doomed.emplace_back(entry, std::move(entry->live));
                }
            }
        }
        for (auto& [entry, live] : doomed)
        {
            if (live)
            {
                live->close(true, config_.shutdownTimeout);
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, entry] : sessions_)
            {
                if (entry->state != SessionState::Terminated)
                {
                    transitionLocked(*entry, SessionState::Terminated, "manager shutdown");
                }
            }
            sessions_.clear();
            for (const auto& weak : transitionSubscribers_)
            {
                if (auto channel = weak.lock())
                {
                    channel->close();
                }
            }
            transitionSubscribers_.clear();
        }

        crashes_->close();
        if (reaper_.joinable())
        {
            reaper_.join();
        }
    }

    const BrokerConfig& config() const
    {
        return config_;
    }

    const LanguageServerRegistry& registry() const
    {
        return registry_;
    }

    const ProjectDetector& detector() const
    {
        return detector_;
    }

    Telemetry& telemetry()
    {
        return telemetry_;
    }

    ResponseCache& cache()
    {
        return cache_;
    }

    ManagerStats stats() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Lease final
    {
        std::shared_ptr<SessionEntry> entry;
        std::shared_ptr<LiveSession>  live;
        std::uint64_t                 generation{0};
    };

    /// Releases a lease's in-flight slot and refreshes activity.
    class LeaseGuard final
    {
    public:
        LeaseGuard(Impl& owner, const Lease& lease)
            : owner_(owner)
            , entry_(lease.entry)
        {
        }

        ~LeaseGuard()
        {
            {
                std::lock_guard<std::mutex> lock(owner_.mutex_);
                if (entry_->inflight > 0)
                {
                    --entry_->inflight;
                }
                entry_->lastActivity = Clock::now();
            }
            owner_.cv_.notify_all();
        }

        LeaseGuard(const LeaseGuard&)            = delete;
        LeaseGuard& operator=(const LeaseGuard&) = delete;

    private:
        Impl&                         owner_;
        std::shared_ptr<SessionEntry> entry_;
    };

    /// Returns a Ready session for `key` with one in-flight slot reserved,
    /// spawning, waiting, or evicting as the current state requires.
    llvm::Expected<Lease> acquire(const ProjectKey&         key,
                                  const LanguageServerSpec& spec,
                                  const Clock::time_point   deadline)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true)
        {
            if (stopping_)
            {
                return makeBrokerError(ErrorKind::SessionShuttingDown, "session manager is shutting down");
            }

            std::shared_ptr<SessionEntry>& slot = sessions_[key];
            if (!slot)
            {
                slot      = std::make_shared<SessionEntry>();
                slot->key = key;
            }
            const std::shared_ptr<SessionEntry> entry = slot;

            switch (entry->state)
            {
            case SessionState::Ready:
                if (std::optional<FailureInfo> failure = entry->live->protocol->failure())
                {
                    std::shared_ptr<LiveSession> doomed = markErroredLocked(*entry, entry->generation, *failure);
                    lock.unlock();
                    closeAbandoned(std::move(doomed));
                    lock.lock();
                    continue;
                }
                ++entry->inflight;
                entry->lastActivity = Clock::now();
                return Lease{entry, entry->live, entry->generation};

            case SessionState::Spawning:
            case SessionState::Initializing:
                if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && Clock::now() >= deadline)
                {
                    return makeBrokerError(ErrorKind::RequestTimeout, key.str() + " is still starting");
                }
                continue;

            case SessionState::ShuttingDown:
                return makeBrokerError(ErrorKind::SessionShuttingDown, key.str() + " is shutting down");

            case SessionState::Errored:
                if (Clock::now() < entry->retryNotBefore)
                {
                    const FailureInfo last =
                        entry->lastError.value_or(FailureInfo{ErrorKind::SessionCrashed, "session failed", 0});
                    return makeBrokerError(last.kind,
                                           llvm::formatv("{0} (retry in {1} ms)",
                                                         last.message,
                                                         millisBetween(Clock::now(), entry->retryNotBefore).count()));
                }
                break;

            case SessionState::Unspawned:
            case SessionState::Terminated:
                break;
            }

            if (liveCountLocked() >= std::max<std::size_t>(config_.maxSessions, 1))
            {
                if (std::shared_ptr<SessionEntry> victim = evictionCandidateLocked(key))
                {
                    ++stats_.evictions;
                    std::shared_ptr<LiveSession> live = beginRetireLocked(*victim, "evicted for " + key.str());
                    lock.unlock();
                    finishRetire(victim, std::move(live), "eviction complete");
                    lock.lock();
                    continue;
                }
                if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && Clock::now() >= deadline)
                {
                    // Do not leave a placeholder behind for a session that never started.
                    const auto it = sessions_.find(key);
                    if (it != sessions_.end() && it->second == entry && entry->state == SessionState::Unspawned &&
                        entry->inflight == 0)
                    {
                        sessions_.erase(it);
                    }
                    return makeBrokerError(ErrorKind::PoolAtCapacity,
                                           llvm::formatv("all {0} sessions are busy", config_.maxSessions));
                }
                continue;
            }

            ++entry->generation;
            ++entry->inflight;
            entry->lastActivity = Clock::now();
            transitionLocked(*entry,
                             SessionState::Spawning,
                             entry->state == SessionState::Errored ? "retry after backoff" : "first request");
            const std::uint64_t generation = entry->generation;
            lock.unlock();

            llvm::Expected<std::shared_ptr<LiveSession>> live = startSession(entry, spec, generation);
            if (!live)
            {
                return live.takeError();
            }
            return Lease{entry, std::move(*live), generation};
        }
    }

    /// Spawning -> Initializing -> Ready. On failure the entry ends Errored
    /// and its reserved in-flight slot is released.
    llvm::Expected<std::shared_ptr<LiveSession>> startSession(const std::shared_ptr<SessionEntry>& entry,
                                                              const LanguageServerSpec&            spec,
                                                              const std::uint64_t                  generation)
    {
        const ProjectKey& key = entry->key;

        LaunchSpec launch;
        launch.executable       = spec.command;
        launch.arguments        = spec.arguments;
        launch.workingDirectory = key.root;
        launch.environment      = spec.environment;
        launch.inheritStderr    = config_.inheritServerStderr;

        llvm::Expected<std::unique_ptr<ProcessSupervisor>> process = ProcessSupervisor::spawn(launch);
        if (!process)
        {
            const FailureInfo failure = takeFailureInfo(process.takeError(), ErrorKind::SpawnFailed);
            std::shared_ptr<LiveSession> doomed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                doomed = markErroredLocked(*entry, generation, failure);
                releaseLocked(*entry);
            }
            closeAbandoned(std::move(doomed));
            return failure.toError();
        }

        auto live        = std::make_shared<LiveSession>();
        live->key        = key;
        live->generation = generation;
        live->process    = std::move(*process);
        live->protocol   = std::make_unique<ProtocolSession>(*live->process, config_.maxMessageBytes, &telemetry_);
        live->dispatcher = std::make_unique<PriorityDispatcher>(config_.workersPerSession);
        startWatcher(*live);

        bool abandoned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.spawns;
            if (entry->generation != generation || entry->state != SessionState::Spawning || stopping_)
            {
                if (entry->generation == generation && entry->state == SessionState::Spawning)
                {
                    transitionLocked(*entry, SessionState::Terminated, "manager shutdown during spawn");
                }
                releaseLocked(*entry);
                abandoned = true;
            }
            else
            {
                entry->live = live;
                transitionLocked(*entry,
                                 SessionState::Initializing,
                                 llvm::formatv("process {0} started", live->process->pid()).str());
            }
        }
        if (abandoned)
        {
            live->close(false, std::chrono::milliseconds(0));
            return makeBrokerError(ErrorKind::SessionShuttingDown, key.str() + " was stopped while spawning");
        }

        InitializeOptions options;
        options.rootPath              = key.root;
        options.initializationOptions = spec.initializationOptions;
        options.timeout               = config_.handshakeTimeout;
        llvm::Expected<llvm::json::Value> capabilities = live->protocol->initialize(options);
        if (!capabilities)
        {
            FailureInfo failure = takeFailureInfo(capabilities.takeError(), ErrorKind::HandshakeFailed);
            failure.kind        = ErrorKind::HandshakeFailed;
            std::shared_ptr<LiveSession> doomed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                doomed = markErroredLocked(*entry, generation, failure);
                releaseLocked(*entry);
            }
            closeAbandoned(std::move(doomed));
            return failure.toError();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entry->generation != generation || entry->state != SessionState::Initializing)
            {
                releaseLocked(*entry);
                const FailureInfo last =
                    entry->lastError.value_or(FailureInfo{ErrorKind::SessionShuttingDown, "session was stopped", 0});
                return last.toError();
            }
            entry->crashCount     = 0;
            entry->backoff        = std::chrono::milliseconds(0);
            entry->retryNotBefore = Clock::time_point{};
            entry->lastError.reset();
            entry->lastActivity = Clock::now();
            transitionLocked(*entry, SessionState::Ready, "initialize handshake complete");
        }
        return live;
    }

    /// Forwards the first exit or framing event of a session to the reaper.
    void startWatcher(LiveSession& live)
    {
        std::shared_ptr<Channel<SessionEvent>> events = live.protocol->subscribeEvents();
        live.watcher = std::thread([events,
                                    stop       = live.watcherStop,
                                    crashes    = crashes_,
                                    key        = live.key,
                                    generation = live.generation]() {
            while (!stop->load())
            {
                if (std::optional<SessionEvent> event = events->receive(std::chrono::milliseconds(100)))
                {
                    if (!stop->load())
                    {
                        (void) crashes->send(CrashNotice{key, generation});
                    }
                    return;
                }
                if (events->isClosed())
                {
                    return;
                }
            }
        });
    }

    void reapCrashes()
    {
        while (true)
        {
            std::optional<CrashNotice> notice = crashes_->receive(std::chrono::milliseconds(250));
            if (!notice)
            {
                if (crashes_->isClosed())
                {
                    return;
                }
                continue;
            }
            std::shared_ptr<LiveSession> doomed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto                  it = sessions_.find(notice->key);
                // Startup failures are recorded by the spawning thread.
                if (it == sessions_.end() || it->second->state != SessionState::Ready || !it->second->live)
                {
                    continue;
                }
                SessionEntry&     entry   = *it->second;
                const FailureInfo failure = entry.live->protocol->failure().value_or(
                    FailureInfo{ErrorKind::SessionCrashed, "server exited", 0});
                doomed = markErroredLocked(entry, notice->generation, failure);
            }
            closeAbandoned(std::move(doomed));
        }
    }

    /// Moves sessions whose protocol has failed to Errored.
    void reconcileCrashed()
    {
        std::vector<std::shared_ptr<LiveSession>> doomed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, entry] : sessions_)
            {
                if (entry->state != SessionState::Ready || !entry->live)
                {
                    continue;
                }
                if (std::optional<FailureInfo> failure = entry->live->protocol->failure())
                {
                    doomed.push_back(markErroredLocked(*entry, entry->generation, *failure));
                }
            }
        }
        for (auto& live : doomed)
        {
            closeAbandoned(std::move(live));
        }
    }

    void sessionFailed(const Lease& lease, const FailureInfo& failure)
    {
        std::shared_ptr<LiveSession> doomed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            doomed = markErroredLocked(*lease.entry, lease.generation, failure);
        }
        closeAbandoned(std::move(doomed));
    }

    /// Records a crash. Returns the detached live session for closing outside
    /// the lock, or null when the entry has moved on to another generation.
    std::shared_ptr<LiveSession> markErroredLocked(SessionEntry&       entry,
                                                   const std::uint64_t generation,
                                                   const FailureInfo&  failure)
    {
        if (entry.generation != generation)
        {
            return nullptr;
        }
        if (entry.state != SessionState::Spawning && entry.state != SessionState::Initializing &&
            entry.state != SessionState::Ready)
        {
            return nullptr;
        }
        ++entry.crashCount;
        ++stats_.crashes;
        entry.backoff        = backoffForCrashCount(config_, entry.crashCount);
        entry.retryNotBefore = Clock::now() + entry.backoff;
        entry.lastError      = failure;
        logMessage(LogLevel::Warning,
                   "lifecycle",
                   llvm::formatv("{0}: {1}: {2} (crash {3}, backoff {4} ms)",
                                 entry.key.str(),
                                 errorKindName(failure.kind),
                                 failure.message,
                                 entry.crashCount,
                                 entry.backoff.count()));
        transitionLocked(entry, SessionState::Errored, failure.message);
        std::shared_ptr<LiveSession> live = std::move(entry.live);
        if (live)
        {
            live->crashed.store(true);
        }
        return live;
    }

    void closeAbandoned(std::shared_ptr<LiveSession> live)
    {
        if (live)
        {
            live->close(false, std::chrono::milliseconds(0));
        }
    }

    std::shared_ptr<LiveSession> beginRetireLocked(SessionEntry& entry, const std::string& reason)
    {
        transitionLocked(entry, SessionState::ShuttingDown, reason);
        return std::move(entry.live);
    }

    void finishRetire(const std::shared_ptr<SessionEntry>& entry,
                      std::shared_ptr<LiveSession>         live,
                      const std::string&                   reason)
    {
        if (live)
        {
            live->close(true, config_.shutdownTimeout);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transitionLocked(*entry, SessionState::Terminated, reason);
            const auto it = sessions_.find(entry->key);
            if (it != sessions_.end() && it->second == entry)
            {
                sessions_.erase(it);
            }
        }
        cv_.notify_all();
    }

    /// Shared path of forced stops and restarts.
    llvm::Error retire(const ProjectKey& key, const std::string& reason, const bool forgetErrored)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const Clock::time_point      deadline = Clock::now() + config_.handshakeTimeout + config_.shutdownTimeout;
        while (true)
        {
            const auto it = sessions_.find(key);
            if (it == sessions_.end())
            {
                return llvm::Error::success();
            }
            const std::shared_ptr<SessionEntry> entry = it->second;
            switch (entry->state)
            {
            case SessionState::Ready: {
                std::shared_ptr<LiveSession> live = beginRetireLocked(*entry, reason);
                lock.unlock();
                finishRetire(entry, std::move(live), reason + " complete");
                return llvm::Error::success();
            }
            case SessionState::Spawning:
            case SessionState::Initializing:
            case SessionState::ShuttingDown:
                if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && Clock::now() >= deadline)
                {
                    return makeBrokerError(ErrorKind::RequestTimeout, key.str() + " did not settle for " + reason);
                }
                continue;
            case SessionState::Errored:
            case SessionState::Unspawned:
            case SessionState::Terminated:
                if (forgetErrored)
                {
                    transitionLocked(*entry, SessionState::Terminated, reason);
                    sessions_.erase(it);
                    cv_.notify_all();
                }
                return llvm::Error::success();
            }
        }
    }

    void releaseLocked(SessionEntry& entry)
    {
        if (entry.inflight > 0)
        {
            --entry.inflight;
        }
        cv_.notify_all();
    }

    std::size_t liveCountLocked() const
    {
        return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(), [](const auto& item) {
            return isLive(item.second->state);
        }));
    }

    /// Least recently active Ready session with no requests in flight.
    std::shared_ptr<SessionEntry> evictionCandidateLocked(const ProjectKey& requester) const
    {
        std::shared_ptr<SessionEntry> best;
        for (const auto& [key, entry] : sessions_)
        {
            if (key == requester || entry->state != SessionState::Ready || entry->inflight != 0)
            {
                continue;
            }
            if (!best || entry->lastActivity < best->lastActivity)
            {
                best = entry;
            }
        }
        return best;
    }

    void transitionLocked(SessionEntry& entry, const SessionState to, const std::string& reason)
    {
        StateTransition transition{entry.key, entry.state, to, Clock::now(), reason};
        entry.state = to;
        logMessage(LogLevel::Info,
                   "lifecycle",
                   llvm::formatv("{0}: {1} -> {2} ({3})",
                                 entry.key.str(),
                                 sessionStateName(transition.from),
                                 sessionStateName(to),
                                 reason));
        for (auto it = transitionSubscribers_.begin(); it != transitionSubscribers_.end();)
        {
            if (auto channel = it->lock())
            {
                (void) channel->send(transition);
                ++it;
            }
            else
            {
                it = transitionSubscribers_.erase(it);
            }
        }
        cv_.notify_all();
    }

    SessionStatus snapshotLocked(const SessionEntry& entry) const
    {
        SessionStatus out;
        out.key             = entry.key;
        out.state           = entry.state;
        out.crashCount      = entry.crashCount;
        out.backoff         = entry.backoff;
        out.pendingRequests = entry.inflight;
        out.residentBytes   = entry.residentBytes;
        out.lastError       = entry.lastError;
        out.idleFor         = millisBetween(entry.lastActivity, Clock::now());
        return out;
    }

    static void fillLive(SessionStatus& status, const std::shared_ptr<LiveSession>& live)
    {
        if (!live)
        {
            return;
        }
        status.pid           = live->process->pid();
        status.openDocuments = live->documents.size();
    }

    template <typename Action>
    void monitorLoop(const std::chrono::milliseconds interval, Action action)
    {
        const std::chrono::milliseconds period = std::max(interval, std::chrono::milliseconds(10));
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(monitorMutex_);
                if (monitorCv_.wait_for(lock, period, [this]() { return monitorsStopping_; }))
                {
                    return;
                }
            }
            action();
        }
    }

    const BrokerConfig                   config_;
    const LanguageServerRegistry         registry_;
    ProjectDetector                      detector_;
    std::shared_ptr<FileContentProvider> files_;
    std::shared_ptr<ResourceSampler>     sampler_;
    Telemetry                            telemetry_;
    ResponseCache                        cache_;

    mutable std::mutex                                       mutex_;
    std::condition_variable                                  cv_;
    std::map<ProjectKey, std::shared_ptr<SessionEntry>>      sessions_;
    std::vector<std::weak_ptr<Channel<StateTransition>>>     transitionSubscribers_;
    ManagerStats                                             stats_;
    bool                                                     stopping_{false};
    std::atomic<std::uint64_t>                               nextRequestKey_{0};

    std::shared_ptr<Channel<CrashNotice>> crashes_;
    std::thread                           reaper_;

    std::mutex               monitorMutex_;
    std::condition_variable  monitorCv_;
    bool                     monitorsStopping_{false};
    std::vector<std::thread> monitors_;
};

LifecycleManager::LifecycleManager(BrokerConfig                         config,
                                   LanguageServerRegistry               registry,
                                   std::shared_ptr<FileContentProvider> files,
                                   std::shared_ptr<ResourceSampler>     sampler)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(registry), std::move(files), std::move(sampler)))
{
}

LifecycleManager::~LifecycleManager() = default;

llvm::Expected<llvm::json::Value> LifecycleManager::submit(SubmitRequest request)
{
    return impl_->submit(std::move(request));
}

llvm::Expected<llvm::json::Value> LifecycleManager::submitForFile(const llvm::StringRef path,
                                                                  const llvm::StringRef method,
                                                                  llvm::json::Value     params,
                                                                  const Priority        priority)
{
    llvm::Expected<DetectedProject> project = impl_->detector().detectForFile(path);
    if (!project)
    {
        return project.takeError();
    }
    SubmitRequest request;
    request.key          = std::move(project->key);
    request.method       = method.str();
    request.params       = std::move(params);
    request.priority     = priority;
    request.documentPath = path.str();
    return impl_->submit(std::move(request));
}

llvm::Expected<DetectedProject> LifecycleManager::resolveProject(const llvm::StringRef path) const
{
    return impl_->detector().detectForFile(path);
}

llvm::Expected<llvm::json::Value> LifecycleManager::awaitDiagnostics(const ProjectKey&               key,
                                                                     const llvm::StringRef           path,
                                                                     const std::chrono::milliseconds timeout)
{
    return impl_->awaitDiagnostics(key, path, timeout);
}

void LifecycleManager::notifyFileWritten(const llvm::StringRef path)
{
    impl_->notifyFileWritten(path);
}

void LifecycleManager::notifyFileDeleted(const llvm::StringRef path)
{
    impl_->notifyFileDeleted(path);
}

llvm::Error LifecycleManager::forceRestart(const ProjectKey& key)
{
    return impl_->forceRestart(key);
}

llvm::Error LifecycleManager::forceStop(const ProjectKey& key)
{
    return impl_->forceStop(key);
}

SessionStatus LifecycleManager::status(const ProjectKey& key) const
{
    return impl_->status(key);
}

std::vector<SessionStatus> LifecycleManager::statusAll() const
{
    return impl_->statusAll();
}

HealthReport LifecycleManager::healthReport() const
{
    return impl_->healthReport();
}

std::shared_ptr<Channel<StateTransition>> LifecycleManager::subscribeTransitions(const std::size_t capacity)
{
    return impl_->subscribeTransitions(capacity);
}

llvm::Expected<std::shared_ptr<Channel<Notification>>> LifecycleManager::subscribeNotifications(
    const ProjectKey& key,
    const std::size_t capacity)
{
    return impl_->subscribeNotifications(key, capacity);
}

void LifecycleManager::runIdleCheck()
{
    impl_->runIdleCheck();
}

void LifecycleManager::runResourceCheck()
{
    impl_->runResourceCheck();
}

void LifecycleManager::shutdownAll()
{
    impl_->shutdownAll();
}

const BrokerConfig& LifecycleManager::config() const
{
    return impl_->config();
}

const LanguageServerRegistry& LifecycleManager::registry() const
{
    return impl_->registry();
}

Telemetry& LifecycleManager::telemetry()
{
    return impl_->telemetry();
}

ResponseCache& LifecycleManager::cache()
{
    return impl_->cache();
}

ManagerStats LifecycleManager::stats() const
{
    return impl_->stats();
}

}  // namespace lspbroker::lsp
