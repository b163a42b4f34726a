//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the broker error payload and helpers.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/Support/Error.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace lspbroker
{

char BrokerError::ID = 0;

llvm::StringRef errorKindName(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::BinaryNotFound:
        return "BinaryNotFound";
    case ErrorKind::SpawnFailed:
        return "SpawnFailed";
    case ErrorKind::HandshakeFailed:
        return "HandshakeFailed";
    case ErrorKind::RequestTimeout:
        return "RequestTimeout";
    case ErrorKind::SessionCrashed:
        return "SessionCrashed";
    case ErrorKind::FramingFault:
        return "FramingFault";
    case ErrorKind::ResourceExceeded:
        return "ResourceExceeded";
    case ErrorKind::SessionShuttingDown:
        return "SessionShuttingDown";
    case ErrorKind::PoolAtCapacity:
        return "PoolAtCapacity";
    case ErrorKind::RemoteError:
        return "RemoteError";
    case ErrorKind::ProjectNotFound:
        return "ProjectNotFound";
    case ErrorKind::InvalidRequest:
        return "InvalidRequest";
    }
    return "Unknown";
}

BrokerError::BrokerError(const ErrorKind kind, std::string message, const std::int64_t remoteCode)
    : kind_(kind)
    , message_(std::move(message))
    , remoteCode_(remoteCode)
{
}

void BrokerError::log(llvm::raw_ostream& os) const
{
    os << errorKindName(kind_);
    if (kind_ == ErrorKind::RemoteError)
    {
        os << " (" << remoteCode_ << ")";
    }
    if (!message_.empty())
    {
        os << ": " << message_;
    }
}

std::error_code BrokerError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

ErrorKind BrokerError::kind() const
{
    return kind_;
}

const std::string& BrokerError::text() const
{
    return message_;
}

std::int64_t BrokerError::remoteCode() const
{
    return remoteCode_;
}

llvm::Error makeBrokerError(const ErrorKind kind, const llvm::Twine& message)
{
    return llvm::make_error<BrokerError>(kind, message.str());
}

llvm::Error makeRemoteError(const std::int64_t code, const llvm::Twine& message)
{
    return llvm::make_error<BrokerError>(ErrorKind::RemoteError, message.str(), code);
}

std::optional<ErrorKind> consumeErrorKind(llvm::Error error)
{
    std::optional<ErrorKind> kind;
    llvm::handleAllErrors(
        std::move(error),
        [&kind](const BrokerError& brokerError) { kind = brokerError.kind(); },
        [](const llvm::ErrorInfoBase&) {});
    return kind;
}

llvm::Error FailureInfo::toError() const
{
    return llvm::make_error<BrokerError>(kind, message, remoteCode);
}

FailureInfo takeFailureInfo(llvm::Error error, const ErrorKind fallbackKind)
{
    FailureInfo info;
    info.kind = fallbackKind;
    llvm::handleAllErrors(
        std::move(error),
        [&info](const BrokerError& brokerError) {
            info.kind       = brokerError.kind();
            info.message    = brokerError.text();
            info.remoteCode = brokerError.remoteCode();
        },
        [&info](const llvm::ErrorInfoBase& other) { info.message = other.message(); });
    return info;
}

}  // namespace lspbroker
