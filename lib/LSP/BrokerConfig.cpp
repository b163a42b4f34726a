//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements broker configuration defaults, JSON settings, and environment overrides.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/BrokerConfig.h"

#include "lspbroker/Support/Error.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Process.h"

#include <algorithm>
#include <utility>

namespace lspbroker::lsp
{
namespace
{

std::optional<std::vector<std::string>> parseStringArrayValue(const llvm::json::Value& value)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }

    std::vector<std::string> out;
    out.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return std::nullopt;
        }
        out.emplace_back(text->str());
    }
    return out;
}

std::optional<std::vector<std::string>> parseStringArray(const llvm::json::Object& object, llvm::StringRef key)
{
    const auto* value = object.get(key);
    if (!value)
    {
        return std::nullopt;
    }
    return parseStringArrayValue(*value);
}

/// Non-negative integer field scaled to milliseconds.
void applyDuration(const llvm::json::Object& object,
                   llvm::StringRef           key,
                   const std::int64_t        unitMillis,
                   std::chrono::milliseconds& outValue)
{
    if (const auto parsed = object.getInteger(key))
    {
        if (*parsed >= 0)
        {
            outValue = std::chrono::milliseconds(*parsed * unitMillis);
        }
    }
}

void applyCount(const llvm::json::Object& object, llvm::StringRef key, const std::size_t minimum, std::size_t& outValue)
{
    if (const auto parsed = object.getInteger(key))
    {
        if (*parsed >= static_cast<std::int64_t>(minimum))
        {
            outValue = static_cast<std::size_t>(*parsed);
        }
    }
}

void applyBoolean(const llvm::json::Object& object, llvm::StringRef key, bool& outValue)
{
    if (const auto parsed = object.getBoolean(key))
    {
        outValue = *parsed;
    }
}

const llvm::json::Object* nestedObject(const llvm::json::Object& settings, llvm::StringRef key)
{
    const auto* value = settings.get(key);
    return value ? value->getAsObject() : nullptr;
}

void applyIdleConfig(const llvm::json::Object& settings, BrokerConfig& config)
{
    const auto* idle = nestedObject(settings, "idle");
    if (!idle)
    {
        return;
    }
    applyDuration(*idle, "timeoutSeconds", 1000, config.idleTimeout);
    applyDuration(*idle, "checkIntervalSeconds", 1000, config.idleCheckInterval);
    applyBoolean(*idle, "enabled", config.enableIdleMonitor);
}

void applyBackoffConfig(const llvm::json::Object& settings, BrokerConfig& config)
{
    const auto* backoff = nestedObject(settings, "backoff");
    if (!backoff)
    {
        return;
    }
    applyDuration(*backoff, "baseMs", 1, config.backoffBase);
    applyDuration(*backoff, "capMs", 1, config.backoffCap);
}

void applyResourceConfig(const llvm::json::Object& settings, BrokerConfig& config)
{
    const auto* resources = nestedObject(settings, "resources");
    if (!resources)
    {
        return;
    }
    if (const auto maxRssMb = resources->getInteger("maxRssMb"))
    {
        if (*maxRssMb > 0)
        {
            config.memoryThresholdBytes = static_cast<std::uint64_t>(*maxRssMb) * 1024ULL * 1024ULL;
        }
    }
    applyDuration(*resources, "checkIntervalSeconds", 1000, config.resourceCheckInterval);
    applyBoolean(*resources, "enabled", config.enableResourceMonitor);
}

void applyPoolConfig(const llvm::json::Object& settings, BrokerConfig& config)
{
    const auto* pool = nestedObject(settings, "pool");
    if (!pool)
    {
        return;
    }
    applyCount(*pool, "maxSessions", 1, config.maxSessions);
    applyCount(*pool, "workersPerSession", 1, config.workersPerSession);
}

void applyCacheConfig(const llvm::json::Object& settings, BrokerConfig& config)
{
    const auto* cache = nestedObject(settings, "cache");
    if (!cache)
    {
        return;
    }
    applyCount(*cache, "capacity", 0, config.cacheCapacity);
    applyDuration(*cache, "defaultTtlSeconds", 1000, config.defaultCacheTtl);
    if (const auto* ttls = nestedObject(*cache, "ttlSeconds"))
    {
        for (const auto& [method, value] : *ttls)
        {
            if (const auto seconds = value.getAsInteger())
            {
                if (*seconds >= 0)
                {
                    config.methodCacheTtls.insert_or_assign(method.str(), std::chrono::seconds(*seconds));
                }
            }
        }
    }
    if (const auto uncached = parseStringArray(*cache, "uncachedMethods"))
    {
        config.uncachedMethods = std::unordered_set<std::string>(uncached->begin(), uncached->end());
    }
}

void applyServerOverride(const llvm::json::Object& server, ServerOverride& out)
{
    if (const auto command = server.getString("command"))
    {
        out.command = command->str();
    }
    if (const auto arguments = parseStringArray(server, "args"))
    {
        out.arguments = *arguments;
    }
    if (const auto markers = parseStringArray(server, "rootMarkers"))
    {
        out.rootMarkers = *markers;
    }
    if (const auto extensions = parseStringArray(server, "extensions"))
    {
        out.extensions = *extensions;
    }
    if (const auto languageId = server.getString("languageId"))
    {
        out.languageId = languageId->str();
    }
    if (const auto* options = server.get("initializationOptions"))
    {
        out.initializationOptions = *options;
    }
    if (const auto* env = server.getObject("env"))
    {
        out.environment.clear();
        for (const auto& [name, value] : *env)
        {
            if (const auto text = value.getAsString())
            {
                out.environment.emplace_back(name.str(), text->str());
            }
        }
        std::sort(out.environment.begin(), out.environment.end());
    }
}

void applyServersConfig(const llvm::json::Object& settings, BrokerConfig& config)
{
    const auto* servers = nestedObject(settings, "servers");
    if (!servers)
    {
        return;
    }
    for (const auto& [language, value] : *servers)
    {
        if (const auto* server = value.getAsObject())
        {
            applyServerOverride(*server, config.servers[language.str()]);
        }
    }
}

void applyTraceLevel(const llvm::json::Object& settings, BrokerConfig& config)
{
    if (const auto rawTrace = settings.getString("trace"))
    {
        if (const std::optional<LogLevel> level = parseLogLevel(*rawTrace))
        {
            config.logLevel = *level;
        }
    }
}

std::optional<std::int64_t> readIntegerEnv(llvm::StringRef name)
{
    const auto raw = llvm::sys::Process::GetEnv(name);
    if (!raw)
    {
        return std::nullopt;
    }
    std::int64_t value = 0;
    if (llvm::StringRef(*raw).trim().getAsInteger(10, value) || value < 0)
    {
        logMessage(LogLevel::Warning, "config", llvm::formatv("ignoring {0}='{1}': not a non-negative integer", name, *raw));
        return std::nullopt;
    }
    return value;
}

std::optional<bool> readBooleanEnv(llvm::StringRef name)
{
    const auto raw = llvm::sys::Process::GetEnv(name);
    if (!raw)
    {
        return std::nullopt;
    }
    const std::string normalized = llvm::StringRef(*raw).trim().lower();
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on")
    {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off")
    {
        return false;
    }
    logMessage(LogLevel::Warning, "config", llvm::formatv("ignoring {0}='{1}': not a boolean", name, *raw));
    return std::nullopt;
}

}  // namespace

BrokerConfig::BrokerConfig()
    : methodCacheTtls{
          {"textDocument/diagnostic", std::chrono::seconds(300)},
          {"workspace/diagnostic", std::chrono::seconds(300)},
          {"textDocument/completion", std::chrono::seconds(30)},
          {"textDocument/documentSymbol", std::chrono::seconds(600)},
          {"workspace/symbol", std::chrono::seconds(600)},
          {"textDocument/hover", std::chrono::seconds(60)},
      }
    , uncachedMethods{
          "workspace/executeCommand",
          "textDocument/rename",
          "textDocument/prepareRename",
          "textDocument/formatting",
          "textDocument/rangeFormatting",
          "textDocument/codeAction",
      }
{
}

std::chrono::milliseconds cacheTtlFor(const BrokerConfig& config, const llvm::StringRef method)
{
    const std::string key = method.str();
    if (config.uncachedMethods.count(key) != 0U)
    {
        return std::chrono::milliseconds(0);
    }
    const auto it = config.methodCacheTtls.find(key);
    return it == config.methodCacheTtls.end() ? config.defaultCacheTtl : it->second;
}

std::chrono::milliseconds backoffForCrashCount(const BrokerConfig& config, const std::uint32_t crashCount)
{
    if (crashCount == 0U)
    {
        return std::chrono::milliseconds(0);
    }
    std::chrono::milliseconds backoff = config.backoffBase;
    for (std::uint32_t i = 1; i < crashCount && backoff < config.backoffCap; ++i)
    {
        backoff *= 2;
    }
    return std::min(backoff, config.backoffCap);
}

bool applyBrokerSettings(const llvm::json::Value& value, BrokerConfig& config)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return false;
    }

    const llvm::json::Object* settings = object;
    if (const auto* wrapped = object->get("settings"))
    {
        settings = wrapped->getAsObject();
        if (!settings)
        {
            return false;
        }
    }

    if (const auto workspaceRoot = settings->getString("workspaceRoot"))
    {
        config.workspaceRoot = workspaceRoot->str();
    }
    applyDuration(*settings, "requestTimeoutMs", 1, config.requestTimeout);
    applyDuration(*settings, "handshakeTimeoutMs", 1, config.handshakeTimeout);
    applyDuration(*settings, "shutdownTimeoutMs", 1, config.shutdownTimeout);
    applyDuration(*settings, "settleDelayMs", 1, config.settleDelay);
    applyCount(*settings, "maxMessageBytes", 1, config.maxMessageBytes);
    applyBoolean(*settings, "inheritServerStderr", config.inheritServerStderr);

    applyIdleConfig(*settings, config);
    applyBackoffConfig(*settings, config);
    applyResourceConfig(*settings, config);
    applyPoolConfig(*settings, config);
    applyCacheConfig(*settings, config);
    applyServersConfig(*settings, config);
    applyTraceLevel(*settings, config);
    return true;
}

llvm::Expected<BrokerConfig> loadBrokerConfigFile(const llvm::StringRef path, BrokerConfig base)
{
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return makeBrokerError(ErrorKind::InvalidRequest,
                               "cannot read config '" + path + "': " + buffer.getError().message());
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        return makeBrokerError(ErrorKind::InvalidRequest,
                               "config '" + path + "' is not valid JSON: " + llvm::toString(parsed.takeError()));
    }
    if (!applyBrokerSettings(*parsed, base))
    {
        return makeBrokerError(ErrorKind::InvalidRequest, "config '" + path + "' is not a settings object");
    }
    return std::move(base);
}

void applyEnvironmentOverrides(BrokerConfig& config)
{
    if (const auto seconds = readIntegerEnv("LSP_TIMEOUT"))
    {
        config.requestTimeout = std::chrono::seconds(*seconds);
    }
    if (const auto seconds = readIntegerEnv("LSP_IDLE_TIMEOUT"))
    {
        config.idleTimeout = std::chrono::seconds(*seconds);
    }
    if (const auto seconds = readIntegerEnv("LSP_CHECK_INTERVAL"))
    {
        config.idleCheckInterval = std::chrono::seconds(*seconds);
    }
    if (const auto enabled = readBooleanEnv("LSP_ENABLE_IDLE_MONITOR"))
    {
        config.enableIdleMonitor = *enabled;
    }
    if (const auto maxSessions = readIntegerEnv("LSP_MAX_SESSIONS"))
    {
        if (*maxSessions > 0)
        {
            config.maxSessions = static_cast<std::size_t>(*maxSessions);
        }
    }
    if (const auto maxRssMb = readIntegerEnv("LSP_MAX_RSS_MB"))
    {
        if (*maxRssMb > 0)
        {
            config.memoryThresholdBytes = static_cast<std::uint64_t>(*maxRssMb) * 1024ULL * 1024ULL;
        }
    }
}

}  // namespace lspbroker::lsp
