//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON-RPC session over one language-server process.
///
/// The session owns a reader thread that decodes the server's stdout,
/// correlates responses with outstanding calls by id, answers requests the
/// server sends to the client, and fans notifications out to subscribers.
/// When the process exits or its output stops decoding, every outstanding call
/// fails with the same error.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_PROTOCOL_SESSION_H
#define LSPBROKER_LSP_PROTOCOL_SESSION_H

#include "lspbroker/LSP/WireCodec.h"
#include "lspbroker/Support/Channel.h"
#include "lspbroker/Support/Error.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace lspbroker::lsp
{

class ProcessSupervisor;
class Telemetry;

/// @brief Server-to-client notification.
struct Notification final
{
    /// @brief Notification method, for example `textDocument/publishDiagnostics`.
    std::string method;

    /// @brief Notification params, `null` when absent.
    llvm::json::Value params{nullptr};
};

/// @brief Kind of session-level event.
enum class SessionEventKind
{
    /// @brief The server process exited.
    Exited,

    /// @brief The server's output could not be decoded.
    FramingFault,
};

/// @brief Session-level event published to event subscribers.
struct SessionEvent final
{
    SessionEventKind kind{SessionEventKind::Exited};
    std::string      detail;
};

/// @brief Minimal outbound interface used by the document synchronizer.
class ProtocolPeer
{
public:
    virtual ~ProtocolPeer() = default;

    /// @brief Sends a notification without awaiting anything.
    /// @param[in] method Notification method.
    /// @param[in] params Notification params.
    /// @return Failure when the message could not be written.
    [[nodiscard]] virtual llvm::Error notify(llvm::StringRef method, llvm::json::Value params) = 0;
};

/// @brief Parameters of the initialize exchange.
struct InitializeOptions final
{
    /// @brief Project root reported as `rootUri` and the single workspace folder.
    std::string rootPath;

    /// @brief Server-specific `initializationOptions`, omitted when `null`.
    llvm::json::Value initializationOptions{nullptr};

    /// @brief Time allowed for the initialize response.
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

/// @brief Request/response correlation and notification delivery for one server.
class ProtocolSession final : public ProtocolPeer
{
public:
    using Clock = std::chrono::steady_clock;

    /// @brief Starts reading from `process`.
    /// @param[in] process Running server process; must outlive the session.
    /// @param[in] maxMessageBytes Largest accepted message body.
    /// @param[in] telemetry Optional round-trip recorder; must outlive the session.
    explicit ProtocolSession(ProcessSupervisor& process,
                             std::size_t         maxMessageBytes = DefaultMaxMessageBytes,
                             Telemetry*          telemetry       = nullptr);

    /// @brief Stops the reader and fails outstanding calls.
    ~ProtocolSession() override;

    ProtocolSession(const ProtocolSession&)            = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    /// @brief Performs `initialize` followed by `initialized`.
    /// @return Server capabilities, or `HandshakeFailed`.
    [[nodiscard]] llvm::Expected<llvm::json::Value> initialize(const InitializeOptions& options);

    /// @brief Sends a request and waits for its response.
    /// @param[in] method Request method.
    /// @param[in] params Request params.
    /// @param[in] deadline Time after which the call is abandoned with `RequestTimeout`.
    /// @return The `result` member, `RemoteError` for an error response, or the session failure.
    [[nodiscard]] llvm::Expected<llvm::json::Value> call(llvm::StringRef   method,
                                                         llvm::json::Value params,
                                                         Clock::time_point deadline);

    [[nodiscard]] llvm::Error notify(llvm::StringRef method, llvm::json::Value params) override;

    /// @brief Sends `shutdown` and, when answered, `exit`.
    [[nodiscard]] llvm::Error shutdown(std::chrono::milliseconds timeout);

    /// @brief Subscribes to notifications received from now on.
    /// @param[in] capacity Channel capacity; the oldest message is dropped on overflow.
    /// @return Channel closed when the session fails or stops.
    [[nodiscard]] std::shared_ptr<Channel<Notification>> subscribe(std::size_t capacity = 100);

    /// @brief Subscribes to session-level events.
    [[nodiscard]] std::shared_ptr<Channel<SessionEvent>> subscribeEvents(std::size_t capacity = 16);

    /// @brief Most recent `publishDiagnostics` params for `uri`.
    [[nodiscard]] std::optional<llvm::json::Value> latestDiagnostics(llvm::StringRef uri) const;

    /// @brief Capabilities returned by `initialize`, `null` before the handshake.
    [[nodiscard]] llvm::json::Value serverCapabilities() const;

    /// @brief Number of calls awaiting a response.
    [[nodiscard]] std::size_t pendingCount() const;

    /// @brief Failure that ended the session, if any.
    [[nodiscard]] std::optional<FailureInfo> failure() const;

    /// @brief Stops the reader thread. Outstanding calls fail with `SessionCrashed`. Idempotent.
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_PROTOCOL_SESSION_H
