//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Ownership of one language-server child process.
///
/// A supervisor starts the child with piped stdin/stdout, reaps it from a
/// dedicated waiter thread, and exposes the exit as a one-shot signal that can
/// be waited on or polled as a file descriptor.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_PROCESS_SUPERVISOR_H
#define LSPBROKER_LSP_PROCESS_SUPERVISOR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace lspbroker::lsp
{

/// @brief How to start a language server.
struct LaunchSpec final
{
    /// @brief Executable name (looked up on `PATH`) or path.
    std::string executable;

    /// @brief Arguments after `argv[0]`.
    std::vector<std::string> arguments;

    /// @brief Directory the child starts in. Empty keeps the broker's directory.
    std::string workingDirectory;

    /// @brief Variables added to or replacing entries of the inherited environment.
    std::vector<std::pair<std::string, std::string>> environment;

    /// @brief Forward the child's stderr to the broker's stderr instead of discarding it.
    bool inheritStderr{false};
};

/// @brief How a child process ended.
struct ProcessExit final
{
    /// @brief Exit code for a normal exit, `-1` when killed by a signal.
    int exitCode{-1};

    /// @brief Terminating signal number, zero for a normal exit.
    int signalNumber{0};
};

/// @brief One-shot process-exit notification.
class ExitSignal final
{
public:
    ExitSignal();
    ~ExitSignal();

    ExitSignal(const ExitSignal&)            = delete;
    ExitSignal& operator=(const ExitSignal&) = delete;

    /// @brief Records the exit and wakes every waiter. Later calls are ignored.
    void set(ProcessExit exit);

    [[nodiscard]] bool                       isSet() const;
    [[nodiscard]] std::optional<ProcessExit> status() const;

    /// @brief Blocks until the exit has been recorded.
    void wait() const;

    /// @brief Blocks up to `timeout`.
    /// @return `true` when the exit was recorded.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    /// @brief Descriptor that becomes readable once the exit is recorded, for `poll`.
    [[nodiscard]] int pollDescriptor() const;

private:
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    std::optional<ProcessExit>      exit_;
    int                             pipe_[2]{-1, -1};
};

/// @brief Exclusive owner of one child process and its pipes.
class ProcessSupervisor final
{
public:
    /// @brief Starts a child process.
    /// @param[in] spec Launch parameters.
    /// @return Supervisor, `BinaryNotFound` when the executable cannot be located, or
    ///         `SpawnFailed` for any other launch failure.
    [[nodiscard]] static llvm::Expected<std::unique_ptr<ProcessSupervisor>> spawn(const LaunchSpec& spec);

    /// @brief Terminates the child without a grace period if it is still running.
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&)            = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    [[nodiscard]] int                pid() const;
    [[nodiscard]] const std::string& executablePath() const;

    /// @brief Descriptor of the child's stdout, for reading.
    [[nodiscard]] int stdoutDescriptor() const;

    /// @brief Writes all bytes to the child's stdin. Concurrent writers are serialized.
    /// @return `SessionCrashed` when the child no longer reads its input.
    [[nodiscard]] llvm::Error write(llvm::StringRef bytes);

    /// @brief Closes the child's stdin. Idempotent.
    void closeStdin();

    [[nodiscard]] const ExitSignal& exitSignal() const;
    [[nodiscard]] bool              isRunning() const;

    /// @brief Closes stdin, sends `SIGTERM`, waits up to `gracePeriod`, then sends `SIGKILL`.
    ///
    /// Returns only after the child has been reaped. Idempotent.
    void terminate(std::chrono::milliseconds gracePeriod);

    /// @brief Current resident set size of the child in bytes.
    [[nodiscard]] std::optional<std::uint64_t> residentSetBytes() const;

private:
    ProcessSupervisor(int pid, std::string executablePath, int stdinFd, int stdoutFd);

    void waitForExit();
    void signalIfRunning(int signalNumber);

    int                         pid_;
    std::string                 executablePath_;
    int                         stdinFd_;
    int                         stdoutFd_;
    std::mutex                  writeMutex_;
    std::mutex                  lifecycleMutex_;
    bool                        exited_{false};
    std::unique_ptr<ExitSignal> exitSignal_;
    std::thread                 waiter_;
};

/// @brief Resolves an executable name or path to a runnable file.
/// @param[in] executable Bare name searched on `PATH`, or a path.
/// @return Absolute path, or `BinaryNotFound`.
[[nodiscard]] llvm::Expected<std::string> resolveExecutable(llvm::StringRef executable);

/// @brief Reads the resident set size of a process from `/proc/<pid>/statm`.
[[nodiscard]] std::optional<std::uint64_t> readResidentSetBytes(int pid);

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_PROCESS_SUPERVISOR_H
