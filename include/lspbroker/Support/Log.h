//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Leveled stderr logging for broker components.
///
/// Lines are written to `llvm::errs()` as `[lspbroker][component] text` and
/// filtered by a process-wide threshold.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_SUPPORT_LOG_H
#define LSPBROKER_SUPPORT_LOG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <optional>

namespace lspbroker
{

/// @brief Log threshold, ordered from quietest to noisiest.
enum class LogLevel
{
    /// @brief Suppress all output.
    Off,

    /// @brief Failures that affect callers.
    Error,

    /// @brief Recoverable anomalies such as dropped notifications.
    Warning,

    /// @brief Lifecycle transitions and spawns.
    Info,

    /// @brief Per-message traffic.
    Verbose,
};

/// @brief Sets the process-wide log threshold.
void setLogLevel(LogLevel level);

/// @brief Returns the process-wide log threshold.
[[nodiscard]] LogLevel logLevel();

/// @brief Returns whether a message at `level` would be written.
[[nodiscard]] bool shouldLog(LogLevel level);

/// @brief Parses `off`, `error`, `warning`, `info`, or `verbose` (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(llvm::StringRef text);

/// @brief Writes one log line when `level` passes the threshold.
/// @param[in] level Message level.
/// @param[in] component Short component tag.
/// @param[in] text Message text.
void logMessage(LogLevel level, llvm::StringRef component, const llvm::Twine& text);

}  // namespace lspbroker

#endif  // LSPBROKER_SUPPORT_LOG_H
