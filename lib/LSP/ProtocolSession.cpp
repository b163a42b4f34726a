//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON-RPC correlation, the decode loop, and the initialize handshake.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/ProtocolSession.h"

#include "lspbroker/LSP/ProcessSupervisor.h"
#include "lspbroker/LSP/Telemetry.h"
#include "lspbroker/Support/Log.h"
#include "lspbroker/Support/Uri.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Path.h"

#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstdint>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lspbroker::lsp
{
namespace
{

constexpr std::size_t ReadChunkBytes = 64U * 1024U;

llvm::json::Object clientCapabilities()
{
    return llvm::json::Object{
        {"textDocument",
         llvm::json::Object{
             {"synchronization", llvm::json::Object{{"dynamicRegistration", false}, {"didSave", false}}},
             {"hover", llvm::json::Object{{"contentFormat", llvm::json::Array{"markdown", "plaintext"}}}},
             {"completion",
              llvm::json::Object{{"completionItem", llvm::json::Object{{"snippetSupport", true}}}}},
             {"definition", llvm::json::Object{{"linkSupport", true}}},
             {"references", llvm::json::Object{}},
             {"documentSymbol", llvm::json::Object{{"hierarchicalDocumentSymbolSupport", true}}},
             {"publishDiagnostics", llvm::json::Object{{"relatedInformation", true}}},
         }},
        {"workspace",
         llvm::json::Object{
             {"workspaceFolders", true},
             {"configuration", true},
             {"symbol", llvm::json::Object{}},
         }},
        {"window", llvm::json::Object{{"workDoneProgress", false}}},
    };
}

std::string describeId(const llvm::json::Value& id)
{
    return serializeJson(id);
}

}  // namespace

class ProtocolSession::Impl final
{
public:
    Impl(ProcessSupervisor& process, const std::size_t maxMessageBytes, Telemetry* telemetry)
        : process_(process)
        , telemetry_(telemetry)
        , decoder_(maxMessageBytes)
    {
        if (::pipe2(stopPipe_, O_CLOEXEC) != 0)
        {
            stopPipe_[0] = -1;
            stopPipe_[1] = -1;
        }
        reader_ = std::thread([this]() { readLoop(); });
    }

    ~Impl()
    {
        stop();
        for (int& fd : stopPipe_)
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }
    }

    llvm::Expected<llvm::json::Value> call(const llvm::StringRef method,
                                           llvm::json::Value     params,
                                           const Clock::time_point deadline)
    {
        std::int64_t                 id = 0;
        std::shared_ptr<PendingCall> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failure_)
            {
                return failure_->toError();
            }
            id      = nextId_++;
            pending = std::make_shared<PendingCall>();
            pending_.emplace(id, pending);
        }

        llvm::json::Object message{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (params.kind() != llvm::json::Value::Null)
        {
            message["params"] = std::move(params);
        }

        logMessage(LogLevel::Verbose, "rpc", llvm::formatv("--> {0} #{1}", method, id));
        const auto start = Clock::now();
        if (llvm::Error writeError = process_.write(encodeMessage(llvm::json::Value(std::move(message)))))
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                pending_.erase(id);
            }
            recordMetric(method, start, false, true);
            return writeError;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [&pending]() { return pending->done; });
        if (!pending->done)
        {
            // Abandon the entry; a late response for this id is dropped by the reader.
            pending_.erase(id);
            lock.unlock();
            recordMetric(method, start, true, true);
            return makeBrokerError(ErrorKind::RequestTimeout,
                                   llvm::formatv("'{0}' (id {1}) received no response before its deadline", method, id)
                                       .str());
        }

        std::optional<FailureInfo> failure = std::move(pending->failure);
        llvm::json::Value          result  = std::move(pending->result);
        lock.unlock();

        recordMetric(method, start, false, failure.has_value());
        if (failure)
        {
            return failure->toError();
        }
        return result;
    }

    llvm::Error notify(const llvm::StringRef method, llvm::json::Value params)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failure_)
            {
                return failure_->toError();
            }
        }
        llvm::json::Object message{{"jsonrpc", "2.0"}, {"method", method}};
        if (params.kind() != llvm::json::Value::Null)
        {
            message["params"] = std::move(params);
        }
        logMessage(LogLevel::Verbose, "rpc", llvm::formatv("--> {0}", method));
        return process_.write(encodeMessage(llvm::json::Value(std::move(message))));
    }

    llvm::Expected<llvm::json::Value> initialize(const InitializeOptions& options)
    {
        const std::string  rootUri = pathToFileUri(options.rootPath);
        llvm::json::Object params{
            {"processId", static_cast<std::int64_t>(::getpid())},
            {"clientInfo", llvm::json::Object{{"name", "lspbroker"}, {"version", "1.0"}}},
            {"rootUri", rootUri},
            {"rootPath", options.rootPath},
            {"workspaceFolders",
             llvm::json::Array{llvm::json::Object{{"uri", rootUri},
                                                  {"name", llvm::sys::path::filename(options.rootPath)}}}},
            {"capabilities", clientCapabilities()},
        };
        if (options.initializationOptions.kind() != llvm::json::Value::Null)
        {
            params["initializationOptions"] = options.initializationOptions;
        }

        llvm::Expected<llvm::json::Value> response =
            call("initialize", llvm::json::Value(std::move(params)), Clock::now() + options.timeout);
        if (!response)
        {
            return makeBrokerError(ErrorKind::HandshakeFailed,
                                   "initialize failed: " + llvm::toString(response.takeError()));
        }

        const llvm::json::Object* result = response->getAsObject();
        if (!result)
        {
            return makeBrokerError(ErrorKind::HandshakeFailed, "initialize returned a non-object result");
        }
        llvm::json::Value capabilities = llvm::json::Object{};
        if (const llvm::json::Value* reported = result->get("capabilities"))
        {
            capabilities = *reported;
        }

        if (llvm::Error notifyError = notify("initialized", llvm::json::Object{}))
        {
            return makeBrokerError(ErrorKind::HandshakeFailed,
                                   "initialized notification failed: " + llvm::toString(std::move(notifyError)));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            capabilities_ = capabilities;
        }
        return capabilities;
    }

    std::shared_ptr<Channel<Notification>> subscribe(const std::size_t capacity)
    {
        auto                        channel = std::make_shared<Channel<Notification>>(capacity);
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_)
        {
            channel->close();
        }
        else
        {
            subscribers_.push_back(channel);
        }
        return channel;
    }

    std::shared_ptr<Channel<SessionEvent>> subscribeEvents(const std::size_t capacity)
    {
        auto                        channel = std::make_shared<Channel<SessionEvent>>(capacity);
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_)
        {
            channel->send(SessionEvent{failure_->kind == ErrorKind::FramingFault ? SessionEventKind::FramingFault
                                                                                  : SessionEventKind::Exited,
                                       failure_->message});
            channel->close();
        }
        else
        {
            eventSubscribers_.push_back(channel);
        }
        return channel;
    }

    std::optional<llvm::json::Value> latestDiagnostics(const llvm::StringRef uri) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = diagnostics_.find(uri.str());
        if (it == diagnostics_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    llvm::json::Value serverCapabilities() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return capabilities_;
    }

    std::size_t pendingCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    std::optional<FailureInfo> failure() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return failure_;
    }

    void stop()
    {
        std::lock_guard<std::mutex> stopLock(stopMutex_);
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        if (stopPipe_[1] >= 0)
        {
            const char token = 'x';
            (void) ::write(stopPipe_[1], &token, 1);
        }
        if (reader_.joinable())
        {
            reader_.join();
        }
        failAll(FailureInfo{ErrorKind::SessionCrashed, "session stopped", 0});
    }

private:
    struct PendingCall final
    {
        bool                       done{false};
        llvm::json::Value          result{nullptr};
        std::optional<FailureInfo> failure;
    };

    void recordMetric(const llvm::StringRef method, const Clock::time_point start, const bool timedOut, const bool failed)
    {
        if (!telemetry_)
        {
            return;
        }
        const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
        telemetry_->record(method.str(), static_cast<std::uint64_t>(latency), timedOut, failed);
    }

    void readLoop()
    {
        std::vector<char> buffer(ReadChunkBytes);
        const int         stdoutFd = process_.stdoutDescriptor();
        const int         exitFd   = process_.exitSignal().pollDescriptor();

        while (true)
        {
            std::array<pollfd, 3> fds{};
            fds[0] = pollfd{stdoutFd, POLLIN, 0};
            fds[1] = pollfd{exitFd, POLLIN, 0};
            fds[2] = pollfd{stopPipe_[0], POLLIN, 0};
            if (::poll(fds.data(), fds.size(), -1) < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                failAll(FailureInfo{ErrorKind::SessionCrashed, "poll on server output failed", 0});
                return;
            }

            if ((fds[2].revents & POLLIN) != 0)
            {
                return;
            }

            if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0)
            {
                const ssize_t count = ::read(stdoutFd, buffer.data(), buffer.size());
                if (count < 0 && errno == EINTR)
                {
                    continue;
                }
                if (count <= 0)
                {
                    // Output closed: give the waiter a moment to record the exit status.
                    (void) process_.exitSignal().waitFor(std::chrono::milliseconds(200));
                    failAll(FailureInfo{ErrorKind::SessionCrashed, describeExit("server closed its output"), 0});
                    publishEvent(SessionEventKind::Exited);
                    return;
                }
                if (!consume(llvm::StringRef(buffer.data(), static_cast<std::size_t>(count))))
                {
                    return;
                }
                continue;
            }

            if ((fds[1].revents & POLLIN) != 0)
            {
                if (!drainAfterExit(buffer))
                {
                    return;
                }
                failAll(FailureInfo{ErrorKind::SessionCrashed, describeExit("server exited"), 0});
                publishEvent(SessionEventKind::Exited);
                return;
            }
        }
    }

    /// Reads whatever the dead process left in the pipe without blocking.
    bool drainAfterExit(std::vector<char>& buffer)
    {
        const int stdoutFd = process_.stdoutDescriptor();
        while (true)
        {
            pollfd descriptor{stdoutFd, POLLIN, 0};
            if (::poll(&descriptor, 1, 0) <= 0 || (descriptor.revents & (POLLIN | POLLHUP)) == 0)
            {
                return true;
            }
            const ssize_t count = ::read(stdoutFd, buffer.data(), buffer.size());
            if (count <= 0)
            {
                return true;
            }
            if (!consume(llvm::StringRef(buffer.data(), static_cast<std::size_t>(count))))
            {
                return false;
            }
        }
    }

    /// Feeds bytes to the decoder and dispatches complete messages. Returns `false` on a framing fault.
    bool consume(const llvm::StringRef bytes)
    {
        decoder_.feed(bytes);
        while (true)
        {
            llvm::json::Value  message(nullptr);
            const DecodeStatus status = decoder_.next(message);
            if (status == DecodeStatus::NeedMore)
            {
                return true;
            }
            if (status == DecodeStatus::Fault)
            {
                logMessage(LogLevel::Error,
                           "rpc",
                           llvm::formatv("framing fault from pid {0}: {1}", process_.pid(), decoder_.faultReason()));
                failAll(FailureInfo{ErrorKind::FramingFault, decoder_.faultReason(), 0});
                publishEvent(SessionEventKind::FramingFault);
                return false;
            }
            dispatch(std::move(message));
        }
    }

    void dispatch(llvm::json::Value message)
    {
        llvm::json::Object* object = message.getAsObject();
        if (!object)
        {
            logMessage(LogLevel::Warning, "rpc", "ignoring non-object message");
            return;
        }

        const auto               method = object->getString("method");
        const llvm::json::Value* id     = object->get("id");

        if (method && id)
        {
            answerServerRequest(*method, *id, object->get("params"));
            return;
        }
        if (method)
        {
            deliverNotification(method->str(), object->get("params"));
            return;
        }
        if (id)
        {
            resolveResponse(*id, *object);
            return;
        }
        logMessage(LogLevel::Warning, "rpc", "ignoring message without method or id");
    }

    void resolveResponse(const llvm::json::Value& id, llvm::json::Object& object)
    {
        const auto numericId = id.getAsInteger();
        if (!numericId)
        {
            logMessage(LogLevel::Warning, "rpc", "ignoring response with non-integer id " + describeId(id));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto                  it = pending_.find(*numericId);
            if (it == pending_.end())
            {
                logMessage(LogLevel::Verbose, "rpc", llvm::formatv("dropping late response #{0}", *numericId));
                return;
            }
            const std::shared_ptr<PendingCall> pending = it->second;
            pending_.erase(it);

            if (const llvm::json::Object* error = object.getObject("error"))
            {
                pending->failure = takeFailureInfo(makeRemoteError(error->getInteger("code").getValueOr(0),
                                                                   error->getString("message").getValueOr("")),
                                                   ErrorKind::RemoteError);
            }
            else if (llvm::json::Value* result = object.get("result"))
            {
                pending->result = std::move(*result);
            }
            pending->done = true;
        }
        logMessage(LogLevel::Verbose, "rpc", llvm::formatv("<-- #{0}", *numericId));
        cv_.notify_all();
    }

    void answerServerRequest(const llvm::StringRef method, const llvm::json::Value& id, const llvm::json::Value* params)
    {
        logMessage(LogLevel::Verbose, "rpc", llvm::formatv("<-- server request {0}", method));
        llvm::json::Value result(nullptr);
        if (method == "workspace/configuration")
        {
            llvm::json::Array items;
            if (params)
            {
                if (const auto* object = params->getAsObject())
                {
                    if (const auto* requested = object->getArray("items"))
                    {
                        for (std::size_t i = 0; i < requested->size(); ++i)
                        {
                            items.push_back(llvm::json::Value(nullptr));
                        }
                    }
                }
            }
            result = std::move(items);
        }

        llvm::json::Object reply{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
        if (llvm::Error error = process_.write(encodeMessage(llvm::json::Value(std::move(reply)))))
        {
            logMessage(LogLevel::Warning,
                       "rpc",
                       "could not answer server request " + method + ": " + llvm::toString(std::move(error)));
        }
    }

    void deliverNotification(std::string method, const llvm::json::Value* params)
    {
        Notification notification{std::move(method), params ? *params : llvm::json::Value(nullptr)};
        std::vector<std::shared_ptr<Channel<Notification>>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (notification.method == "textDocument/publishDiagnostics")
            {
                if (const auto* object = notification.params.getAsObject())
                {
                    if (const auto uri = object->getString("uri"))
                    {
                        diagnostics_.insert_or_assign(uri->str(), notification.params);
                    }
                }
            }
            for (auto it = subscribers_.begin(); it != subscribers_.end();)
            {
                if (auto channel = it->lock())
                {
                    targets.push_back(std::move(channel));
                    ++it;
                }
                else
                {
                    it = subscribers_.erase(it);
                }
            }
        }
        for (const auto& channel : targets)
        {
            (void) channel->send(notification);
        }
    }

    void failAll(FailureInfo info)
    {
        std::vector<std::shared_ptr<Channel<Notification>>> channels;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failure_)
            {
                return;
            }
            failure_ = info;
            for (auto& [_, pending] : pending_)
            {
                pending->failure = info;
                pending->done    = true;
            }
            pending_.clear();
            for (const auto& weak : subscribers_)
            {
                if (auto channel = weak.lock())
                {
                    channels.push_back(std::move(channel));
                }
            }
            subscribers_.clear();
        }
        cv_.notify_all();
        for (const auto& channel : channels)
        {
            channel->close();
        }
    }

    void publishEvent(const SessionEventKind kind)
    {
        std::vector<std::shared_ptr<Channel<SessionEvent>>> channels;
        std::string                                         detail;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            detail = failure_ ? failure_->message : std::string();
            for (const auto& weak : eventSubscribers_)
            {
                if (auto channel = weak.lock())
                {
                    channels.push_back(std::move(channel));
                }
            }
            eventSubscribers_.clear();
        }
        for (const auto& channel : channels)
        {
            (void) channel->send(SessionEvent{kind, detail});
            channel->close();
        }
    }

    std::string describeExit(const llvm::StringRef prefix) const
    {
        const std::optional<ProcessExit> exit = process_.exitSignal().status();
        if (!exit)
        {
            return prefix.str();
        }
        if (exit->signalNumber != 0)
        {
            return llvm::formatv("{0} (pid {1}, signal {2})", prefix, process_.pid(), exit->signalNumber).str();
        }
        return llvm::formatv("{0} (pid {1}, exit code {2})", prefix, process_.pid(), exit->exitCode).str();
    }

    ProcessSupervisor& process_;
    Telemetry*         telemetry_;
    FrameDecoder       decoder_;

    mutable std::mutex                                          mutex_;
    std::condition_variable                                     cv_;
    std::unordered_map<std::int64_t, std::shared_ptr<PendingCall>> pending_;
    std::int64_t                                                nextId_{1};
    std::optional<FailureInfo>                                  failure_;
    llvm::json::Value                                           capabilities_{nullptr};
    std::unordered_map<std::string, llvm::json::Value>          diagnostics_;
    std::vector<std::weak_ptr<Channel<Notification>>>           subscribers_;
    std::vector<std::weak_ptr<Channel<SessionEvent>>>           eventSubscribers_;

    std::mutex  stopMutex_;
    bool        stopped_{false};
    int         stopPipe_[2]{-1, -1};
    std::thread reader_;
};

ProtocolSession::ProtocolSession(ProcessSupervisor& process, const std::size_t maxMessageBytes, Telemetry* telemetry)
    : impl_(std::make_unique<Impl>(process, maxMessageBytes, telemetry))
{
}

ProtocolSession::~ProtocolSession() = default;

llvm::Expected<llvm::json::Value> ProtocolSession::initialize(const InitializeOptions& options)
{
    return impl_->initialize(options);
}

llvm::Expected<llvm::json::Value> ProtocolSession::call(const llvm::StringRef   method,
                                                        llvm::json::Value       params,
                                                        const Clock::time_point deadline)
{
    return impl_->call(method, std::move(params), deadline);
}

llvm::Error ProtocolSession::notify(const llvm::StringRef method, llvm::json::Value params)
{
    return impl_->notify(method, std::move(params));
}

llvm::Error ProtocolSession::shutdown(const std::chrono::milliseconds timeout)
{
    if (impl_->failure())
    {
        return llvm::Error::success();
    }
    llvm::Expected<llvm::json::Value> response = impl_->call("shutdown", llvm::json::Value(nullptr), Clock::now() + timeout);
    if (!response)
    {
        return response.takeError();
    }
    return impl_->notify("exit", llvm::json::Value(nullptr));
}

std::shared_ptr<Channel<Notification>> ProtocolSession::subscribe(const std::size_t capacity)
{
    return impl_->subscribe(capacity);
}

std::shared_ptr<Channel<SessionEvent>> ProtocolSession::subscribeEvents(const std::size_t capacity)
{
    return impl_->subscribeEvents(capacity);
}

std::optional<llvm::json::Value> ProtocolSession::latestDiagnostics(const llvm::StringRef uri) const
{
    return impl_->latestDiagnostics(uri);
}

llvm::json::Value ProtocolSession::serverCapabilities() const
{
    return impl_->serverCapabilities();
}

std::size_t ProtocolSession::pendingCount() const
{
    return impl_->pendingCount();
}

std::optional<FailureInfo> ProtocolSession::failure() const
{
    return impl_->failure();
}

void ProtocolSession::stop()
{
    impl_->stop();
}

}  // namespace lspbroker::lsp
