//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed error taxonomy shared by every broker component.
///
/// Fallible operations return `llvm::Error` or `llvm::Expected<T>` carrying a
/// `BrokerError`, so callers can branch on the failure kind without parsing
/// message text.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_SUPPORT_ERROR_H
#define LSPBROKER_SUPPORT_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <optional>
#include <string>

namespace lspbroker
{

/// @brief Failure classes surfaced by the broker.
enum class ErrorKind
{
    /// @brief The language server executable could not be located.
    BinaryNotFound,

    /// @brief The operating system refused to start the server process.
    SpawnFailed,

    /// @brief The initialize exchange timed out, was rejected, or broke framing.
    HandshakeFailed,

    /// @brief A request did not receive its response before the deadline.
    RequestTimeout,

    /// @brief The server process exited while requests were outstanding.
    SessionCrashed,

    /// @brief The server produced bytes that do not decode as a framed message.
    FramingFault,

    /// @brief The server exceeded its memory threshold and is being restarted.
    ResourceExceeded,

    /// @brief The session is being retired and no longer accepts work.
    SessionShuttingDown,

    /// @brief No pool slot became free before the request deadline.
    PoolAtCapacity,

    /// @brief The server answered with a JSON-RPC error object.
    RemoteError,

    /// @brief No registered language server claims the file or directory.
    ProjectNotFound,

    /// @brief Caller input could not be used (unreadable file, bad URI, bad params).
    InvalidRequest,
};

/// @brief Returns a stable display name for an error kind.
/// @param[in] kind Error kind.
/// @return Kind name such as `RequestTimeout`.
[[nodiscard]] llvm::StringRef errorKindName(ErrorKind kind);

/// @brief LLVM error payload carrying a broker error kind.
class BrokerError final : public llvm::ErrorInfo<BrokerError>
{
public:
    static char ID;

    /// @brief Creates an error payload.
    /// @param[in] kind Failure class.
    /// @param[in] message Human-readable context.
    /// @param[in] remoteCode JSON-RPC error code for `RemoteError`, zero otherwise.
    BrokerError(ErrorKind kind, std::string message, std::int64_t remoteCode = 0);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] ErrorKind          kind() const;
    [[nodiscard]] const std::string& text() const;
    [[nodiscard]] std::int64_t       remoteCode() const;

private:
    ErrorKind    kind_;
    std::string  message_;
    std::int64_t remoteCode_;
};

/// @brief Builds an `llvm::Error` holding a `BrokerError`.
/// @param[in] kind Failure class.
/// @param[in] message Human-readable context.
/// @return Failure value.
[[nodiscard]] llvm::Error makeBrokerError(ErrorKind kind, const llvm::Twine& message);

/// @brief Builds a `RemoteError` failure from a JSON-RPC error object.
/// @param[in] code JSON-RPC error code.
/// @param[in] message Server-provided message.
/// @return Failure value.
[[nodiscard]] llvm::Error makeRemoteError(std::int64_t code, const llvm::Twine& message);

/// @brief Consumes an error and reports its broker kind.
/// @param[in] error Error to consume. Success values are accepted.
/// @return Kind for broker errors, `std::nullopt` for success or foreign errors.
[[nodiscard]] std::optional<ErrorKind> consumeErrorKind(llvm::Error error);

/// @brief Kind and text of a failure, detached from `llvm::Error` ownership.
///
/// Used where one failure must be reported to many waiters.
struct FailureInfo final
{
    ErrorKind    kind{ErrorKind::SessionCrashed};
    std::string  message;
    std::int64_t remoteCode{0};

    /// @brief Materializes a fresh `llvm::Error` for one waiter.
    [[nodiscard]] llvm::Error toError() const;
};

/// @brief Consumes an error into a detached failure record.
/// @param[in] error Failing error value.
/// @param[in] fallbackKind Kind recorded for non-broker errors.
/// @return Failure record.
[[nodiscard]] FailureInfo takeFailureInfo(llvm::Error error, ErrorKind fallbackKind);

}  // namespace lspbroker

#endif  // LSPBROKER_SUPPORT_ERROR_H
