//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `lspbroker-probe` command-line tool.
///
/// The tool resolves the project of one file, starts its language server
/// through a lifecycle manager, runs a single request, and prints the JSON
/// result on stdout.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/BrokerConfig.h"
#include "lspbroker/LSP/LanguageServerRegistry.h"
#include "lspbroker/LSP/LifecycleManager.h"
#include "lspbroker/Support/Error.h"
#include "lspbroker/Support/Log.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace
{

/// @brief Checks whether a token is a help switch.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

void printUsage()
{
    llvm::errs() << "Usage: lspbroker-probe [--config <file>] [--root <dir>] [--trace <level>] <method> <file> "
                    "[<line> <character>]\n"
                 << "Try: lspbroker-probe --help\n";
}

void printHelp()
{
    llvm::errs()
        << "NAME\n"
        << "  lspbroker-probe - run one language server request through the broker\n\n"
        << "SYNOPSIS\n"
        << "  lspbroker-probe [options] <method> <file> [<line> <character>]\n"
        << "  lspbroker-probe [options] diagnostics <file>\n\n"
        << "DESCRIPTION\n"
        << "  The project enclosing <file> is found from its root marker files. Its language server\n"
        << "  is started, the file is opened, and <method> is sent with the file's URI and, when\n"
        << "  given, a zero-based position. The special method 'diagnostics' waits for the next\n"
        << "  published diagnostics of the file instead.\n\n"
        << "OPTIONS\n"
        << "  --config <file>   JSON settings file applied before LSP_* environment overrides.\n"
        << "  --root <dir>      Workspace root bounding project detection.\n"
        << "  --trace <level>   off, error, warning, info, or verbose (default: warning).\n"
        << "  --help, -h        Show this help.\n\n"
        << "EXIT STATUS\n"
        << "  0 on success, 1 on invalid usage or request failure.\n";
}

bool parsePosition(llvm::StringRef text, std::int64_t& out)
{
    return !text.getAsInteger(10, out) && out >= 0;
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    std::string              configPath;
    std::string              root;
    std::string              trace;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (isHelpToken(arg))
        {
            printHelp();
            return 0;
        }
        if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--root")
        {
            root = requireValue(arg);
        }
        else if (arg == "--trace")
        {
            trace = requireValue(arg);
        }
        else if (llvm::StringRef(arg).startswith("--"))
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2U && positional.size() != 4U)
    {
        printUsage();
        return 1;
    }

    lspbroker::lsp::BrokerConfig config;
    if (!configPath.empty())
    {
        llvm::Expected<lspbroker::lsp::BrokerConfig> loaded = lspbroker::lsp::loadBrokerConfigFile(configPath);
        if (!loaded)
        {
            llvm::errs() << "[lspbroker-probe] " << llvm::toString(loaded.takeError()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    lspbroker::lsp::applyEnvironmentOverrides(config);
    if (!root.empty())
    {
        config.workspaceRoot = root;
    }
    if (!trace.empty())
    {
        const auto level = lspbroker::parseLogLevel(trace);
        if (!level)
        {
            llvm::errs() << "Invalid --trace value: " << trace << "\n";
            printUsage();
            return 1;
        }
        config.logLevel = *level;
    }
    lspbroker::setLogLevel(config.logLevel);

    // A single request does not outlive the monitors' periods.
    config.enableIdleMonitor     = false;
    config.enableResourceMonitor = false;
    if (config.settleDelay.count() == 0)
    {
        config.settleDelay = std::chrono::milliseconds(150);
    }

    const std::string& method = positional[0];
    const std::string& file   = positional[1];
    llvm::json::Object params;
    if (positional.size() == 4U)
    {
        std::int64_t line      = 0;
        std::int64_t character = 0;
        if (!parsePosition(positional[2], line) || !parsePosition(positional[3], character))
        {
            llvm::errs() << "Invalid position: " << positional[2] << " " << positional[3] << "\n";
            printUsage();
            return 1;
        }
        params["position"] = llvm::json::Object{{"line", line}, {"character", character}};
    }

    lspbroker::lsp::LanguageServerRegistry registry = lspbroker::lsp::LanguageServerRegistry::withBuiltins();
    registry.applyOverrides(config.servers);
    const std::chrono::milliseconds timeout = config.requestTimeout;
    lspbroker::lsp::LifecycleManager manager(std::move(config), std::move(registry));
    manager.telemetry().setSink([](const lspbroker::lsp::RequestMetric& metric) {
        if (lspbroker::shouldLog(lspbroker::LogLevel::Info))
        {
            llvm::errs() << "[lspbroker-probe][telemetry] method=" << metric.method
                         << " latency_us=" << metric.latencyMicros << " timed_out=" << (metric.timedOut ? "true" : "false")
                         << " failed=" << (metric.failed ? "true" : "false") << "\n";
        }
    });

    auto run = [&]() -> llvm::Expected<llvm::json::Value> {
        if (method != "diagnostics")
        {
            return manager.submitForFile(file, method, llvm::json::Value(std::move(params)));
        }
        llvm::Expected<lspbroker::lsp::DetectedProject> project = manager.resolveProject(file);
        if (!project)
        {
            return project.takeError();
        }
        return manager.awaitDiagnostics(project->key, file, timeout);
    };
    llvm::Expected<llvm::json::Value> result = run();

    int exitCode = 0;
    if (!result)
    {
        const lspbroker::FailureInfo failure =
            lspbroker::takeFailureInfo(result.takeError(), lspbroker::ErrorKind::InvalidRequest);
        llvm::errs() << "[lspbroker-probe] " << lspbroker::errorKindName(failure.kind) << ": " << failure.message
                     << "\n";
        exitCode = 1;
    }
    else
    {
        llvm::outs() << llvm::formatv("{0:2}", *result) << "\n";
    }
    manager.shutdownAll();
    return exitCode;
}
