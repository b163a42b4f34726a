//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements child-process spawning, exit detection, and termination.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/ProcessSupervisor.h"

#include "lspbroker/Support/Error.h"
#include "lspbroker/Support/Log.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Program.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace lspbroker::lsp
{
namespace
{

void ignoreSigpipeOnce()
{
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void closeDescriptor(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

std::string errnoText(const int error)
{
    return std::strerror(error);
}

/// Inherited environment with `overrides` applied, as `NAME=value` strings.
std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides)
{
    std::vector<std::string> out;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry)
    {
        const llvm::StringRef text(*entry);
        const llvm::StringRef name     = text.split('=').first;
        bool                  replaced = false;
        for (const auto& [key, _] : overrides)
        {
            if (name == key)
            {
                replaced = true;
                break;
            }
        }
        if (!replaced)
        {
            out.emplace_back(text.str());
        }
    }
    for (const auto& [key, value] : overrides)
    {
        out.emplace_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> toPointerArray(std::vector<std::string>& strings)
{
    std::vector<char*> out;
    out.reserve(strings.size() + 1U);
    for (std::string& text : strings)
    {
        out.push_back(text.data());
    }
    out.push_back(nullptr);
    return out;
}

/// Child side after fork: only async-signal-safe calls until exec.
[[noreturn]] void runChild(const int stdinRead,
                           const int stdoutWrite,
                           const int stderrTarget,
                           const int errorWrite,
                           const char* workingDirectory,
                           const char* path,
                           char* const* argv,
                           char* const* envp)
{
    std::signal(SIGPIPE, SIG_DFL);
    if (::dup2(stdinRead, STDIN_FILENO) < 0 || ::dup2(stdoutWrite, STDOUT_FILENO) < 0 ||
        (stderrTarget >= 0 && ::dup2(stderrTarget, STDERR_FILENO) < 0))
    {
        const int error = errno;
        (void) ::write(errorWrite, &error, sizeof(error));
        ::_exit(127);
    }
    if (workingDirectory != nullptr && ::chdir(workingDirectory) != 0)
    {
        const int error = errno;
        (void) ::write(errorWrite, &error, sizeof(error));
        ::_exit(127);
    }
    ::execve(path, argv, envp);
    const int error = errno;
    (void) ::write(errorWrite, &error, sizeof(error));
    ::_exit(127);
}

}  // namespace

ExitSignal::ExitSignal()
{
    if (::pipe2(pipe_, O_CLOEXEC) != 0)
    {
        pipe_[0] = -1;
        pipe_[1] = -1;
    }
}

ExitSignal::~ExitSignal()
{
    closeDescriptor(pipe_[0]);
    closeDescriptor(pipe_[1]);
}

void ExitSignal::set(const ProcessExit exit)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (exit_)
        {
            return;
        }
        exit_ = exit;
        if (pipe_[1] >= 0)
        {
            // The byte is never drained so the read end stays readable.
            const char token = 'x';
            (void) ::write(pipe_[1], &token, 1);
        }
    }
    cv_.notify_all();
}

bool ExitSignal::isSet() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_.has_value();
}

std::optional<ProcessExit> ExitSignal::status() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_;
}

void ExitSignal::wait() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return exit_.has_value(); });
}

bool ExitSignal::waitFor(const std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return exit_.has_value(); });
}

int ExitSignal::pollDescriptor() const
{
    return pipe_[0];
}

llvm::Expected<std::string> resolveExecutable(const llvm::StringRef executable)
{
    if (executable.empty())
    {
        return makeBrokerError(ErrorKind::BinaryNotFound, "empty executable name");
    }
    if (executable.contains('/'))
    {
        if (!llvm::sys::fs::exists(executable) || llvm::sys::fs::is_directory(executable) ||
            !llvm::sys::fs::can_execute(executable))
        {
            return makeBrokerError(ErrorKind::BinaryNotFound, "'" + executable + "' is not an executable file");
        }
        return executable.str();
    }

    llvm::ErrorOr<std::string> found = llvm::sys::findProgramByName(executable);
    if (!found)
    {
        return makeBrokerError(ErrorKind::BinaryNotFound, "'" + executable + "' was not found on PATH");
    }
    return *found;
}

std::optional<std::uint64_t> readResidentSetBytes(const int pid)
{
    std::ifstream statm("/proc/" + std::to_string(pid) + "/statm");
    if (!statm)
    {
        return std::nullopt;
    }
    std::uint64_t totalPages    = 0;
    std::uint64_t residentPages = 0;
    if (!(statm >> totalPages >> residentPages))
    {
        return std::nullopt;
    }
    const long pageSize = ::sysconf(_SC_PAGESIZE);
    return residentPages * static_cast<std::uint64_t>(pageSize > 0 ? pageSize : 4096);
}

llvm::Expected<std::unique_ptr<ProcessSupervisor>> ProcessSupervisor::spawn(const LaunchSpec& spec)
{
    ignoreSigpipeOnce();

    llvm::Expected<std::string> resolved = resolveExecutable(spec.executable);
    if (!resolved)
    {
        return resolved.takeError();
    }

    if (!spec.workingDirectory.empty() && !llvm::sys::fs::is_directory(spec.workingDirectory))
    {
        return makeBrokerError(ErrorKind::SpawnFailed,
                               "working directory '" + spec.workingDirectory + "' does not exist");
    }

    std::vector<std::string> argvStrings;
    argvStrings.reserve(spec.arguments.size() + 1U);
    argvStrings.push_back(*resolved);
    argvStrings.insert(argvStrings.end(), spec.arguments.begin(), spec.arguments.end());
    std::vector<std::string> envStrings = buildEnvironment(spec.environment);
    std::vector<char*>       argv       = toPointerArray(argvStrings);
    std::vector<char*>       envp       = toPointerArray(envStrings);

    int stdinPipe[2]{-1, -1};
    int stdoutPipe[2]{-1, -1};
    int errorPipe[2]{-1, -1};
    int devNull = -1;
    const auto closeAll = [&]() {
        closeDescriptor(stdinPipe[0]);
        closeDescriptor(stdinPipe[1]);
        closeDescriptor(stdoutPipe[0]);
        closeDescriptor(stdoutPipe[1]);
        closeDescriptor(errorPipe[0]);
        closeDescriptor(errorPipe[1]);
        closeDescriptor(devNull);
    };

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0 || ::pipe2(stdoutPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errorPipe, O_CLOEXEC) != 0)
    {
        const int error = errno;
        closeAll();
        return makeBrokerError(ErrorKind::SpawnFailed, "pipe creation failed: " + errnoText(error));
    }
    if (!spec.inheritStderr)
    {
        devNull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    }

    const char* workingDirectory = spec.workingDirectory.empty() ? nullptr : spec.workingDirectory.c_str();
    const pid_t pid              = ::fork();
    if (pid < 0)
    {
        const int error = errno;
        closeAll();
        return makeBrokerError(ErrorKind::SpawnFailed, "fork failed: " + errnoText(error));
    }
    if (pid == 0)
    {
        runChild(stdinPipe[0],
                 stdoutPipe[1],
                 devNull,
                 errorPipe[1],
                 workingDirectory,
                 argv[0],
                 argv.data(),
                 envp.data());
    }

    closeDescriptor(stdinPipe[0]);
    closeDescriptor(stdoutPipe[1]);
    closeDescriptor(errorPipe[1]);
    closeDescriptor(devNull);

    // The error pipe closes on a successful exec and carries errno otherwise.
    int     childErrno = 0;
    ssize_t readCount  = 0;
    do
    {
        readCount = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (readCount < 0 && errno == EINTR);
    closeDescriptor(errorPipe[0]);

    if (readCount > 0)
    {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        closeAll();
        return makeBrokerError(ErrorKind::SpawnFailed,
                               "could not start '" + *resolved + "': " + errnoText(childErrno));
    }

    logMessage(LogLevel::Info, "process", llvm::formatv("spawned '{0}' as pid {1}", *resolved, pid));
    return std::unique_ptr<ProcessSupervisor>(
        new ProcessSupervisor(static_cast<int>(pid), std::move(*resolved), stdinPipe[1], stdoutPipe[0]));
}

ProcessSupervisor::ProcessSupervisor(const int pid, std::string executablePath, const int stdinFd, const int stdoutFd)
    : pid_(pid)
    , executablePath_(std::move(executablePath))
    , stdinFd_(stdinFd)
    , stdoutFd_(stdoutFd)
    , exitSignal_(std::make_unique<ExitSignal>())
{
    waiter_ = std::thread([this]() { waitForExit(); });
}

ProcessSupervisor::~ProcessSupervisor()
{
    terminate(std::chrono::milliseconds(0));
    if (waiter_.joinable())
    {
        waiter_.join();
    }
    closeDescriptor(stdoutFd_);
}

int ProcessSupervisor::pid() const
{
    return pid_;
}

const std::string& ProcessSupervisor::executablePath() const
{
    return executablePath_;
}

int ProcessSupervisor::stdoutDescriptor() const
{
    return stdoutFd_;
}

llvm::Error ProcessSupervisor::write(const llvm::StringRef bytes)
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (stdinFd_ < 0)
    {
        return makeBrokerError(ErrorKind::SessionCrashed, "server input is closed");
    }
    const char* cursor    = bytes.data();
    std::size_t remaining = bytes.size();
    while (remaining > 0)
    {
        const ssize_t written = ::write(stdinFd_, cursor, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return makeBrokerError(ErrorKind::SessionCrashed, "write to server failed: " + errnoText(errno));
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return llvm::Error::success();
}

void ProcessSupervisor::closeStdin()
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    closeDescriptor(stdinFd_);
}

const ExitSignal& ProcessSupervisor::exitSignal() const
{
    return *exitSignal_;
}

bool ProcessSupervisor::isRunning() const
{
    return !exitSignal_->isSet();
}

void ProcessSupervisor::terminate(const std::chrono::milliseconds gracePeriod)
{
    closeStdin();
    if (exitSignal_->isSet())
    {
        return;
    }
    signalIfRunning(SIGTERM);
    if (gracePeriod.count() <= 0 || !exitSignal_->waitFor(gracePeriod))
    {
        if (gracePeriod.count() > 0)
        {
            logMessage(LogLevel::Warning,
                       "process",
                       llvm::formatv("pid {0} ignored SIGTERM for {1} ms; killing", pid_, gracePeriod.count()));
        }
        signalIfRunning(SIGKILL);
    }
    exitSignal_->wait();
}

std::optional<std::uint64_t> ProcessSupervisor::residentSetBytes() const
{
    if (exitSignal_->isSet())
    {
        return std::nullopt;
    }
    return readResidentSetBytes(pid_);
}

void ProcessSupervisor::waitForExit()
{
    // Wait without reaping first so the pid cannot be recycled while a signal is in flight.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR)
    {
    }

    ProcessExit exit;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        int                         status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR)
        {
        }
        exited_ = true;
        if (WIFEXITED(status))
        {
            exit.exitCode = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            exit.signalNumber = WTERMSIG(status);
        }
    }
    logMessage(LogLevel::Info,
               "process",
               llvm::formatv("pid {0} exited (code {1}, signal {2})", pid_, exit.exitCode, exit.signalNumber));
    exitSignal_->set(exit);
}

void ProcessSupervisor::signalIfRunning(const int signalNumber)
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!exited_)
    {
        ::kill(pid_, signalNumber);
    }
}

}  // namespace lspbroker::lsp
