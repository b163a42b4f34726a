//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements leveled stderr logging.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/Support/Log.h"

#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <mutex>

namespace lspbroker
{
namespace
{

std::atomic<int> gLogLevel{static_cast<int>(LogLevel::Warning)};

std::mutex& logMutex()
{
    static std::mutex mutex;
    return mutex;
}

llvm::StringRef levelTag(const LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Info:
        return "info";
    case LogLevel::Verbose:
        return "trace";
    case LogLevel::Off:
        break;
    }
    return "";
}

}  // namespace

void setLogLevel(const LogLevel level)
{
    gLogLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel logLevel()
{
    return static_cast<LogLevel>(gLogLevel.load(std::memory_order_relaxed));
}

bool shouldLog(const LogLevel level)
{
    return level != LogLevel::Off && static_cast<int>(level) <= gLogLevel.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parseLogLevel(const llvm::StringRef text)
{
    const std::string normalized = text.trim().lower();
    if (normalized == "off")
    {
        return LogLevel::Off;
    }
    if (normalized == "error")
    {
        return LogLevel::Error;
    }
    if (normalized == "warning" || normalized == "warn")
    {
        return LogLevel::Warning;
    }
    if (normalized == "info" || normalized == "basic")
    {
        return LogLevel::Info;
    }
    if (normalized == "verbose" || normalized == "trace")
    {
        return LogLevel::Verbose;
    }
    return std::nullopt;
}

void logMessage(const LogLevel level, const llvm::StringRef component, const llvm::Twine& text)
{
    if (!shouldLog(level))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(logMutex());
    llvm::errs() << "[lspbroker][" << component << "] " << levelTag(level) << ": " << text << "\n";
    llvm::errs().flush();
}

}  // namespace lspbroker
