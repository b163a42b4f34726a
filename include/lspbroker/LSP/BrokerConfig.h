//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration model for the language-server broker.
///
/// Configuration starts from built-in defaults, may be replaced field by field
/// from a JSON settings object or file, and finally from `LSP_*` environment
/// variables. Invalid fields are ignored and keep their previous value.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_BROKER_CONFIG_H
#define LSPBROKER_LSP_BROKER_CONFIG_H

#include "lspbroker/LSP/WireCodec.h"
#include "lspbroker/Support/Log.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace lspbroker::lsp
{

/// @brief Partial replacement of a registered language server definition.
struct ServerOverride final
{
    std::optional<std::string>                       command;
    std::optional<std::vector<std::string>>          arguments;
    std::optional<std::vector<std::string>>          rootMarkers;
    std::optional<std::vector<std::string>>          extensions;
    std::optional<std::string>                       languageId;
    std::optional<llvm::json::Value>                 initializationOptions;
    std::vector<std::pair<std::string, std::string>> environment;
};

/// @brief Mutable runtime configuration for the broker.
struct BrokerConfig final
{
    /// @brief Directory bounding project detection. Empty allows the whole filesystem.
    std::string workspaceRoot;

    /// @brief Default deadline for a submitted request.
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(60)};

    /// @brief Time allowed for the initialize exchange.
    std::chrono::milliseconds handshakeTimeout{std::chrono::seconds(30)};

    /// @brief Ready sessions without activity for this long are shut down.
    std::chrono::milliseconds idleTimeout{std::chrono::minutes(10)};

    /// @brief Period of the idle monitor.
    std::chrono::milliseconds idleCheckInterval{std::chrono::seconds(60)};

    /// @brief Enables the idle monitor thread.
    bool enableIdleMonitor{true};

    /// @brief Time a server gets to exit after `shutdown`/`exit` before it is killed.
    std::chrono::milliseconds shutdownTimeout{std::chrono::seconds(5)};

    /// @brief Respawn backoff after the first crash; doubled per further consecutive crash.
    std::chrono::milliseconds backoffBase{std::chrono::milliseconds(500)};

    /// @brief Upper bound of the respawn backoff.
    std::chrono::milliseconds backoffCap{std::chrono::seconds(30)};

    /// @brief Resident memory above which a ready server is restarted proactively.
    std::uint64_t memoryThresholdBytes{1024ULL * 1024ULL * 1024ULL};

    /// @brief Period of the resource monitor.
    std::chrono::milliseconds resourceCheckInterval{std::chrono::seconds(30)};

    /// @brief Enables the resource monitor thread.
    bool enableResourceMonitor{true};

    /// @brief Maximum number of live (spawning, initializing, ready, or shutting down) sessions.
    std::size_t maxSessions{8};

    /// @brief Dispatcher worker threads, and therefore in-flight requests, per session.
    std::size_t workersPerSession{4};

    /// @brief Maximum number of cached responses.
    std::size_t cacheCapacity{1024};

    /// @brief Cache lifetime for methods without a specific entry.
    std::chrono::milliseconds defaultCacheTtl{std::chrono::seconds(60)};

    /// @brief Cache lifetime per method.
    std::unordered_map<std::string, std::chrono::milliseconds> methodCacheTtls;

    /// @brief Methods whose responses are never cached.
    std::unordered_set<std::string> uncachedMethods;

    /// @brief Pause after a document is first opened, approximating server readiness.
    std::chrono::milliseconds settleDelay{std::chrono::milliseconds(0)};

    /// @brief Largest accepted message from a server.
    std::size_t maxMessageBytes{DefaultMaxMessageBytes};

    /// @brief Forward server stderr instead of discarding it.
    bool inheritServerStderr{false};

    /// @brief Log threshold.
    LogLevel logLevel{LogLevel::Warning};

    /// @brief Language server definition overrides keyed by language name.
    std::map<std::string, ServerOverride> servers;

    BrokerConfig();
};

/// @brief Returns the cache lifetime for `method`; zero means responses are not cached.
[[nodiscard]] std::chrono::milliseconds cacheTtlFor(const BrokerConfig& config, llvm::StringRef method);

/// @brief Returns the respawn backoff after `crashCount` consecutive crashes.
/// @return `min(backoffCap, backoffBase * 2^(crashCount - 1))`, zero for no crashes.
[[nodiscard]] std::chrono::milliseconds backoffForCrashCount(const BrokerConfig& config, std::uint32_t crashCount);

/// @brief Applies a settings object.
/// @param[in] value Either the settings object or `{"settings": {...}}`.
/// @param[in,out] config Configuration instance to update.
/// @return `true` when a settings object was found.
[[nodiscard]] bool applyBrokerSettings(const llvm::json::Value& value, BrokerConfig& config);

/// @brief Reads a JSON settings file on top of `base`.
/// @return Updated configuration, or an `InvalidRequest` error when the file is unreadable or malformed.
[[nodiscard]] llvm::Expected<BrokerConfig> loadBrokerConfigFile(llvm::StringRef path, BrokerConfig base = {});

/// @brief Applies `LSP_TIMEOUT`, `LSP_IDLE_TIMEOUT`, `LSP_CHECK_INTERVAL` (seconds),
///        `LSP_ENABLE_IDLE_MONITOR`, `LSP_MAX_SESSIONS`, and `LSP_MAX_RSS_MB`.
void applyEnvironmentOverrides(BrokerConfig& config);

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_BROKER_CONFIG_H
