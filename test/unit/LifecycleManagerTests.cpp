//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <signal.h>

#include "lspbroker/LSP/LifecycleManager.h"
#include "lspbroker/Support/Error.h"
#include "lspbroker/Support/Uri.h"
#include "llvm/Support/JSON.h"

namespace
{

using lspbroker::ErrorKind;
using lspbroker::lsp::BrokerConfig;
using lspbroker::lsp::LanguageServerRegistry;
using lspbroker::lsp::LanguageServerSpec;
using lspbroker::lsp::LifecycleManager;
using lspbroker::lsp::ProjectKey;
using lspbroker::lsp::SessionState;
using lspbroker::lsp::SessionStatus;
using lspbroker::lsp::SubmitRequest;
using std::chrono::milliseconds;

/// Scratch directory removed when the test ends.
struct Workspace final
{
    std::filesystem::path root;

    explicit Workspace(const std::string& name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        root = std::filesystem::temp_directory_path() / ("lspbroker-" + name + "-" + std::to_string(now));
        std::filesystem::create_directories(root);
    }

    ~Workspace()
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::string project(const std::string& name) const
    {
        const auto dir = root / name;
        std::filesystem::create_directories(dir);
        std::ofstream(dir / "fake.toml") << "\n";
        return lspbroker::normalizePath(dir.string());
    }

    std::string write(const std::string& relative, const std::string& content) const
    {
        const auto path = root / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << content;
        return lspbroker::normalizePath(path.string());
    }

    std::string path(const std::string& relative) const
    {
        return (root / relative).string();
    }
};

LanguageServerSpec fakeSpec(const std::string&                                     language,
                            std::vector<std::pair<std::string, std::string>>       environment = {},
                            std::string                                            command = LSPBROKER_FAKE_SERVER_PATH)
{
    LanguageServerSpec spec;
    spec.language    = language;
    spec.languageId  = "fake";
    spec.command     = std::move(command);
    spec.rootMarkers = {"fake.toml"};
    if (language == "fake")
    {
        spec.extensions = {".fake"};
    }
    spec.initializationOptions = llvm::json::Object{{"language", language}};
    spec.environment           = std::move(environment);
    return spec;
}

BrokerConfig testConfig()
{
    BrokerConfig config;
    config.enableIdleMonitor     = false;
    config.enableResourceMonitor = false;
    config.requestTimeout        = std::chrono::seconds(5);
    config.handshakeTimeout      = std::chrono::seconds(5);
    config.shutdownTimeout       = std::chrono::seconds(1);
    config.backoffBase           = milliseconds(50);
    config.backoffCap            = std::chrono::seconds(1);
    config.defaultCacheTtl       = milliseconds(0);
    return config;
}

LanguageServerRegistry registryWith(std::vector<LanguageServerSpec> specs)
{
    LanguageServerRegistry registry;
    for (LanguageServerSpec& spec : specs)
    {
        registry.add(std::move(spec));
    }
    return registry;
}

llvm::json::Value positionParams()
{
    return llvm::json::Object{{"position", llvm::json::Object{{"line", 0}, {"character", 0}}}};
}

SubmitRequest hoverRequest(const ProjectKey& key, const std::string& file)
{
    SubmitRequest request;
    request.key          = key;
    request.method       = "textDocument/hover";
    request.params       = positionParams();
    request.documentPath = file;
    return request;
}

SubmitRequest plainRequest(const ProjectKey& key, std::string method, llvm::json::Value params = nullptr)
{
    SubmitRequest request;
    request.key    = key;
    request.method = std::move(method);
    request.params = std::move(params);
    return request;
}

std::string hoverText(const llvm::json::Value& result)
{
    const auto* object = result.getAsObject();
    if (object == nullptr || object->getObject("contents") == nullptr)
    {
        return {};
    }
    return object->getObject("contents")->getString("value").getValueOr("").str();
}

/// Returns the failure kind of a submission, or nullopt when it succeeded.
std::optional<ErrorKind> failureKind(llvm::Expected<llvm::json::Value> result)
{
    if (result)
    {
        return std::nullopt;
    }
    return lspbroker::consumeErrorKind(result.takeError());
}

bool expectKind(llvm::Expected<llvm::json::Value> result, const ErrorKind expected, const char* what)
{
    const std::optional<ErrorKind> kind = failureKind(std::move(result));
    if (!kind || *kind != expected)
    {
        std::cerr << what << ": expected " << lspbroker::errorKindName(expected).str() << ", got "
                  << (kind ? lspbroker::errorKindName(*kind).str() : std::string("success")) << "\n";
        return false;
    }
    return true;
}

bool submitOk(LifecycleManager& manager, SubmitRequest request, llvm::json::Value* out = nullptr)
{
    const std::string                 method = request.method;
    llvm::Expected<llvm::json::Value> result = manager.submit(std::move(request));
    if (!result)
    {
        std::cerr << "unexpected failure of " << method << ": " << llvm::toString(result.takeError()) << "\n";
        return false;
    }
    if (out != nullptr)
    {
        *out = std::move(*result);
    }
    return true;
}

std::optional<std::int64_t> documentCounter(LifecycleManager& manager, const ProjectKey& key, const char* counter)
{
    llvm::json::Value state(nullptr);
    if (!submitOk(manager, plainRequest(key, "test/documentState"), &state))
    {
        return std::nullopt;
    }
    return state.getAsObject()->getInteger(counter).getValueOr(-1);
}

bool waitForState(LifecycleManager& manager, const ProjectKey& key, const SessionState state)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (manager.status(key).state != state)
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }
    return true;
}

bool processGone(const int pid)
{
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

bool testStartupTransitions()
{
    Workspace        workspace("transitions");
    const ProjectKey key{workspace.project("app"), "fake"};
    const std::string file = workspace.write("app/main.fake", "let x = 1");
    LifecycleManager manager(testConfig(), registryWith({fakeSpec("fake")}));

    auto transitions = manager.subscribeTransitions();
    if (manager.status(key).state != SessionState::Unspawned)
    {
        std::cerr << "expected an unknown project to report Unspawned\n";
        return false;
    }

    llvm::json::Value result(nullptr);
    if (!submitOk(manager, hoverRequest(key, file), &result) || hoverText(result) != "hover:1")
    {
        std::cerr << "expected first hover to see version 1\n";
        return false;
    }

    const SessionState expected[] = {SessionState::Spawning, SessionState::Initializing, SessionState::Ready};
    SessionState       previous   = SessionState::Unspawned;
    for (const SessionState state : expected)
    {
        const auto transition = transitions->tryReceive();
        if (!transition || transition->from != previous || transition->to != state || !(transition->key == key))
        {
            std::cerr << "expected transition to " << lspbroker::lsp::sessionStateName(state).str() << "\n";
            return false;
        }
        previous = state;
    }

    const auto status = manager.status(key);
    if (status.state != SessionState::Ready || !status.pid || status.openDocuments != 1U || status.crashCount != 0U)
    {
        std::cerr << "unexpected status after first request\n";
        return false;
    }

    llvm::json::Value state(nullptr);
    if (!submitOk(manager, plainRequest(key, "test/documentState"), &state))
    {
        return false;
    }
    const auto* options = state.getAsObject()->getObject("initializationOptions");
    if (options == nullptr || options->getString("language").getValueOr("") != "fake")
    {
        std::cerr << "expected registry initialization options to reach the server\n";
        return false;
    }

    manager.shutdownAll();
    if (!expectKind(manager.submit(hoverRequest(key, file)), ErrorKind::SessionShuttingDown, "submit after shutdown"))
    {
        return false;
    }
    if (!processGone(*status.pid))
    {
        std::cerr << "expected shutdown to terminate the server\n";
        return false;
    }
    return true;
}

bool testSingleSpawnUnderConcurrency()
{
    Workspace         workspace("concurrent");
    const ProjectKey  key{workspace.project("app"), "fake"};
    const std::string file     = workspace.write("app/main.fake", "let x = 1");
    const std::string spawnLog = workspace.path("spawns.log");
    LifecycleManager  manager(testConfig(),
                             registryWith({fakeSpec("fake", {{"FAKE_LSP_SPAWN_LOG", spawnLog}, {"FAKE_LSP_INIT_DELAY_MS", "200"}})}));

    std::mutex               mutex;
    std::vector<std::string> results;
    std::vector<std::thread> clients;
    for (int i = 0; i < 6; ++i)
    {
        clients.emplace_back([&]() {
            llvm::Expected<llvm::json::Value> result = manager.submit(hoverRequest(key, file));
            std::lock_guard<std::mutex>       lock(mutex);
            if (result)
            {
                results.push_back(hoverText(*result));
            }
            else
            {
                results.push_back(llvm::toString(result.takeError()));
            }
        });
    }
    for (std::thread& client : clients)
    {
        client.join();
    }

    for (const std::string& result : results)
    {
        if (result != "hover:1")
        {
            std::cerr << "unexpected concurrent result: " << result << "\n";
            return false;
        }
    }
    std::ifstream log(spawnLog);
    std::string   line;
    int           lines = 0;
    while (std::getline(log, line))
    {
        ++lines;
    }
    if (manager.stats().spawns != 1U || lines != 1)
    {
        std::cerr << "expected exactly one spawn, saw " << manager.stats().spawns << " and " << lines << " log lines\n";
        return false;
    }
    return true;
}

bool testCacheAndWriteInvalidation()
{
    Workspace         workspace("cache");
    const ProjectKey  key{workspace.project("app"), "fake"};
    const std::string file = workspace.write("app/main.fake", "let x = 1");
    LifecycleManager  manager(testConfig(), registryWith({fakeSpec("fake")}));

    llvm::json::Value first(nullptr);
    llvm::json::Value second(nullptr);
    if (!submitOk(manager, hoverRequest(key, file), &first) || !submitOk(manager, hoverRequest(key, file), &second))
    {
        return false;
    }
    if (hoverText(first) != "hover:1" || hoverText(second) != "hover:1" ||
        manager.telemetry().requestCount("textDocument/hover") != 1U ||
        manager.telemetry().cacheHitCount("textDocument/hover") != 1U)
    {
        std::cerr << "expected the repeated hover to be served from the cache\n";
        return false;
    }

    (void) workspace.write("app/main.fake", "let x = 2");
    manager.notifyFileWritten(file);
    llvm::json::Value third(nullptr);
    if (!submitOk(manager, hoverRequest(key, file), &third))
    {
        return false;
    }
    if (hoverText(third) != "hover:2" || manager.telemetry().requestCount("textDocument/hover") != 2U)
    {
        std::cerr << "expected a write to force one new round trip at version 2\n";
        return false;
    }
    const auto changes = documentCounter(manager, key, "changes");
    const auto opens   = documentCounter(manager, key, "opens");
    if (!changes || *changes != 1 || !opens || *opens != 1)
    {
        std::cerr << "expected one didOpen followed by one didChange\n";
        return false;
    }
    if (manager.healthReport().cache.hits != 1U)
    {
        std::cerr << "expected the health report to carry cache statistics\n";
        return false;
    }
    return true;
}

bool testUriInParamsIsSynchronized()
{
    Workspace         workspace("uri-params");
    const ProjectKey  key{workspace.project("app"), "fake"};
    const std::string file = workspace.write("app/main.fake", "let x = 1");
    LifecycleManager  manager(testConfig(), registryWith({fakeSpec("fake")}));

    const auto hoverByUri = [&]() {
        return plainRequest(key,
                            "textDocument/hover",
                            llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", lspbroker::pathToFileUri(file)}}},
                                               {"position", llvm::json::Object{{"line", 0}, {"character", 0}}}});
    };

    llvm::json::Value first(nullptr);
    llvm::json::Value second(nullptr);
    if (!submitOk(manager, hoverByUri(), &first) || !submitOk(manager, hoverByUri(), &second))
    {
        return false;
    }
    if (hoverText(first) != "hover:1" || hoverText(second) != "hover:1" ||
        manager.telemetry().cacheHitCount("textDocument/hover") != 1U)
    {
        std::cerr << "expected a URI-only request to open its document before the hover\n";
        return false;
    }

    (void) workspace.write("app/main.fake", "let x = 2");
    manager.notifyFileWritten(file);
    llvm::json::Value third(nullptr);
    if (!submitOk(manager, hoverByUri(), &third))
    {
        return false;
    }
    if (hoverText(third) != "hover:2" || manager.telemetry().requestCount("textDocument/hover") != 2U)
    {
        std::cerr << "expected a write to invalidate the URI-only hover and re-sync the document\n";
        return false;
    }
    return true;
}

bool testIdleShutdown()
{
    Workspace         workspace("idle");
    const ProjectKey  key{workspace.project("app"), "fake"};
    const std::string file   = workspace.write("app/main.fake", "let x = 1");
    BrokerConfig      config = testConfig();
    config.idleTimeout       = milliseconds(50);
    LifecycleManager manager(config, registryWith({fakeSpec("fake")}));

    if (!submitOk(manager, hoverRequest(key, file)))
    {
        return false;
    }
    const auto pid = manager.status(key).pid;
    manager.runIdleCheck();
    if (manager.status(key).state != SessionState::Ready)
    {
        std::cerr << "expected a recently used session to survive the idle check\n";
        return false;
    }

    std::this_thread::sleep_for(milliseconds(120));
    manager.runIdleCheck();
    if (manager.status(key).state != SessionState::Unspawned || manager.stats().idleShutdowns != 1U || !pid ||
        !processGone(*pid))
    {
        std::cerr << "expected idle session to be shut down and its process reaped\n";
        return false;
    }

    // Hover would be answered from the cache; an uncached request needs the server.
    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})) ||
        manager.stats().spawns != 2U || manager.status(key).state != SessionState::Ready)
    {
        std::cerr << "expected the next request to respawn the session\n";
        return false;
    }
    return true;
}

bool testPoolEviction()
{
    Workspace          workspace("pool");
    const ProjectKey   busy{workspace.project("a"), "fake"};
    const ProjectKey   idle{workspace.project("b"), "fake"};
    const ProjectKey   fresh{workspace.project("c"), "fake"};
    BrokerConfig       config = testConfig();
    config.maxSessions        = 2;
    LifecycleManager manager(config, registryWith({fakeSpec("fake")}));

    if (!submitOk(manager, plainRequest(idle, "test/sleep", llvm::json::Object{{"ms", 0}})))
    {
        return false;
    }
    std::atomic_bool busyOk{false};
    std::thread      sleeper([&]() {
        busyOk = submitOk(manager, plainRequest(busy, "test/sleep", llvm::json::Object{{"ms", 800}}));
    });
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (manager.status(busy).pendingRequests == 0U || manager.status(busy).state != SessionState::Ready)
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            sleeper.join();
            std::cerr << "busy session never became ready\n";
            return false;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }

    const bool freshOk = submitOk(manager, plainRequest(fresh, "test/sleep", llvm::json::Object{{"ms", 0}}));
    sleeper.join();
    if (!freshOk || !busyOk)
    {
        std::cerr << "expected both the busy and the new project to be served\n";
        return false;
    }
    if (manager.stats().evictions != 1U || manager.status(idle).state != SessionState::Unspawned ||
        manager.status(busy).state != SessionState::Ready || manager.healthReport().liveSessions != 2U)
    {
        std::cerr << "expected the idle session to be evicted\n";
        return false;
    }
    return true;
}

bool testPoolAtCapacity()
{
    Workspace        workspace("capacity");
    const ProjectKey busy{workspace.project("a"), "fake"};
    const ProjectKey other{workspace.project("b"), "fake"};
    BrokerConfig     config = testConfig();
    config.maxSessions      = 1;
    LifecycleManager manager(config, registryWith({fakeSpec("fake")}));

    std::thread sleeper([&]() {
        (void) submitOk(manager, plainRequest(busy, "test/sleep", llvm::json::Object{{"ms", 1000}}));
    });
    const auto readyBy = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (manager.status(busy).pendingRequests == 0U || manager.status(busy).state != SessionState::Ready)
    {
        if (std::chrono::steady_clock::now() > readyBy)
        {
            break;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }

    SubmitRequest request = plainRequest(other, "test/sleep", llvm::json::Object{{"ms", 0}});
    request.deadline      = std::chrono::steady_clock::now() + milliseconds(200);
    const bool ok = expectKind(manager.submit(std::move(request)), ErrorKind::PoolAtCapacity, "pool at capacity");
    sleeper.join();
    if (!ok)
    {
        return false;
    }
    if (manager.healthReport().sessions.size() != 1U || manager.statusAll().size() != 1U)
    {
        std::cerr << "expected a request refused for capacity to leave no session entry\n";
        return false;
    }
    return true;
}

bool testCrashFailsAllPending()
{
    Workspace        workspace("crash");
    const ProjectKey key{workspace.project("app"), "fake"};
    BrokerConfig     config = testConfig();
    config.workersPerSession = 4;
    LifecycleManager manager(config, registryWith({fakeSpec("fake")}));

    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})))
    {
        return false;
    }
    const int pid = *manager.status(key).pid;

    std::mutex                  mutex;
    std::vector<std::optional<ErrorKind>> kinds;
    std::vector<std::thread>    clients;
    for (int i = 0; i < 3; ++i)
    {
        clients.emplace_back([&, i]() {
            auto kind = failureKind(
                manager.submit(plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 2000 + i}})));
            std::lock_guard<std::mutex> lock(mutex);
            kinds.push_back(kind);
        });
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (manager.status(key).pendingRequests < 3U && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(milliseconds(5));
    }
    // Let the requests reach the server before it dies.
    std::this_thread::sleep_for(milliseconds(100));
    (void) ::kill(pid, SIGKILL);
    for (std::thread& client : clients)
    {
        client.join();
    }

    for (const auto& kind : kinds)
    {
        if (!kind || *kind != ErrorKind::SessionCrashed)
        {
            std::cerr << "expected every pending request to fail with SessionCrashed\n";
            return false;
        }
    }
    if (!waitForState(manager, key, SessionState::Errored))
    {
        std::cerr << "expected crashed session to become Errored\n";
        return false;
    }
    const auto status = manager.status(key);
    if (status.crashCount != 1U || !status.lastError || status.lastError->kind != ErrorKind::SessionCrashed ||
        manager.stats().crashes != 1U)
    {
        std::cerr << "expected one recorded crash\n";
        return false;
    }

    std::this_thread::sleep_for(milliseconds(80));
    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})) ||
        manager.status(key).pid == pid)
    {
        std::cerr << "expected a new process after the backoff\n";
        return false;
    }
    return true;
}

bool testCrashBackoff()
{
    Workspace         workspace("backoff");
    const ProjectKey  key{workspace.project("app"), "fake"};
    const std::string flag = workspace.write("crash.flag", "1");
    BrokerConfig      config = testConfig();
    config.backoffBase       = milliseconds(100);
    config.backoffCap        = milliseconds(250);
    LifecycleManager manager(config, registryWith({fakeSpec("fake", {{"FAKE_LSP_CRASH_ON_INIT_FLAG", flag}})}));

    const milliseconds expected[] = {milliseconds(100), milliseconds(200), milliseconds(250)};
    for (const milliseconds backoff : expected)
    {
        if (!expectKind(manager.submit(plainRequest(key, "test/sleep")), ErrorKind::HandshakeFailed, "crash on init"))
        {
            return false;
        }
        const auto status = manager.status(key);
        if (status.state != SessionState::Errored || status.backoff != backoff)
        {
            std::cerr << "expected backoff " << backoff.count() << " ms, got " << status.backoff.count() << " ms\n";
            return false;
        }
        // Inside the window the last error is returned without spawning.
        const auto spawns = manager.stats().spawns;
        if (!expectKind(manager.submit(plainRequest(key, "test/sleep")), ErrorKind::HandshakeFailed, "fail fast") ||
            manager.stats().spawns != spawns)
        {
            std::cerr << "expected a fast failure inside the backoff window\n";
            return false;
        }
        std::this_thread::sleep_for(backoff + milliseconds(30));
    }
    if (manager.stats().spawns != 3U || manager.status(key).crashCount != 3U)
    {
        std::cerr << "expected three spawns and three crashes\n";
        return false;
    }

    std::filesystem::remove(flag);
    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})))
    {
        return false;
    }
    const auto status = manager.status(key);
    if (status.state != SessionState::Ready || status.crashCount != 0U || status.backoff != milliseconds(0) ||
        status.lastError)
    {
        std::cerr << "expected a successful start to reset the crash history\n";
        return false;
    }
    return true;
}

bool testRequestErrorsKeepSession()
{
    Workspace        workspace("errors");
    const ProjectKey key{workspace.project("app"), "fake"};
    LifecycleManager manager(testConfig(), registryWith({fakeSpec("fake")}));

    if (!expectKind(manager.submit(plainRequest(key, "test/unknownMethod", llvm::json::Object{})),
                    ErrorKind::RemoteError,
                    "unknown method"))
    {
        return false;
    }
    SubmitRequest slow = plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 500}});
    slow.deadline      = std::chrono::steady_clock::now() + milliseconds(100);
    if (!expectKind(manager.submit(std::move(slow)), ErrorKind::RequestTimeout, "slow request"))
    {
        return false;
    }
    const auto status = manager.status(key);
    if (status.state != SessionState::Ready || status.crashCount != 0U)
    {
        std::cerr << "expected remote errors and timeouts to leave the session Ready\n";
        return false;
    }
    if (!expectKind(manager.submit(plainRequest(ProjectKey{key.root, "cobol"}, "textDocument/hover")),
                    ErrorKind::ProjectNotFound,
                    "unregistered language") ||
        !expectKind(manager.submit(plainRequest(key, "")), ErrorKind::InvalidRequest, "empty method"))
    {
        return false;
    }
    SubmitRequest missing = hoverRequest(key, key.root + "/missing.fake");
    return expectKind(manager.submit(std::move(missing)), ErrorKind::InvalidRequest, "unreadable document");
}

/// Reports a fixed resident size for every process.
class FixedSampler final : public lspbroker::lsp::ResourceSampler
{
public:
    explicit FixedSampler(const std::uint64_t bytes)
        : bytes_(bytes)
    {
    }

    std::optional<std::uint64_t> residentBytes(int) override
    {
        return bytes_;
    }

private:
    std::uint64_t bytes_;
};

bool testResourceRestart()
{
    Workspace        workspace("resources");
    const ProjectKey key{workspace.project("app"), "fake"};
    BrokerConfig     config   = testConfig();
    config.memoryThresholdBytes = 1024ULL * 1024ULL;
    LifecycleManager manager(config,
                             registryWith({fakeSpec("fake")}),
                             nullptr,
                             std::make_shared<FixedSampler>(4ULL * 1024ULL * 1024ULL));

    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})))
    {
        return false;
    }
    const auto pid = manager.status(key).pid;
    manager.runResourceCheck();
    if (manager.stats().resourceRestarts != 1U || manager.status(key).state != SessionState::Unspawned || !pid ||
        !processGone(*pid))
    {
        std::cerr << "expected the oversized session to be retired\n";
        return false;
    }
    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})))
    {
        return false;
    }
    const auto status = manager.status(key);
    if (status.crashCount != 0U || manager.stats().crashes != 0U || manager.stats().spawns != 2U)
    {
        std::cerr << "expected a resource restart not to count as a crash\n";
        return false;
    }
    return true;
}

bool testForcedRestartAndStop()
{
    Workspace        workspace("force");
    const ProjectKey key{workspace.project("app"), "fake"};
    LifecycleManager manager(testConfig(), registryWith({fakeSpec("fake")}));

    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})))
    {
        return false;
    }
    const int first = *manager.status(key).pid;
    if (llvm::Error error = manager.forceRestart(key))
    {
        std::cerr << "unexpected restart failure: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    const auto restarted = manager.status(key);
    if (restarted.state != SessionState::Ready || !restarted.pid || *restarted.pid == first || !processGone(first))
    {
        std::cerr << "expected forced restart to replace the process\n";
        return false;
    }

    if (llvm::Error error = manager.forceStop(key))
    {
        std::cerr << "unexpected stop failure: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (manager.status(key).state != SessionState::Unspawned || !processGone(*restarted.pid))
    {
        std::cerr << "expected forced stop to terminate the session\n";
        return false;
    }
    if (llvm::Error error = manager.forceStop(key))
    {
        std::cerr << "expected stopping an absent session to succeed\n";
        llvm::consumeError(std::move(error));
        return false;
    }
    return true;
}

bool testSubmitDuringShutdown()
{
    Workspace        workspace("stopping");
    const ProjectKey key{workspace.project("app"), "fake"};
    BrokerConfig     config = testConfig();
    config.shutdownTimeout  = milliseconds(500);
    LifecycleManager manager(config, registryWith({fakeSpec("fake", {{"FAKE_LSP_IGNORE_EXIT", "1"}})}));

    if (!submitOk(manager, plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})))
    {
        return false;
    }
    std::thread stopper([&]() {
        if (llvm::Error error = manager.forceStop(key))
        {
            std::cerr << "unexpected stop failure: " << llvm::toString(std::move(error)) << "\n";
        }
    });
    const bool shuttingDown = waitForState(manager, key, SessionState::ShuttingDown);
    const bool rejected     = shuttingDown && expectKind(manager.submit(plainRequest(key, "test/sleep")),
                                                     ErrorKind::SessionShuttingDown,
                                                     "submit while shutting down");
    stopper.join();
    if (!shuttingDown || !rejected)
    {
        std::cerr << "expected submissions to be rejected while the session shuts down\n";
        return false;
    }
    return manager.status(key).state == SessionState::Unspawned;
}

bool testDiagnosticsAndDeletion()
{
    Workspace         workspace("diagnostics");
    const ProjectKey  key{workspace.project("app"), "fake"};
    const std::string file = workspace.write("app/broken.fake", "ERROR here");
    LifecycleManager  manager(testConfig(), registryWith({fakeSpec("fake")}));

    auto diagnostics = manager.awaitDiagnostics(key, file, std::chrono::seconds(5));
    if (!diagnostics)
    {
        std::cerr << "unexpected diagnostics failure: " << llvm::toString(diagnostics.takeError()) << "\n";
        return false;
    }
    const auto* items = diagnostics->getAsObject()->getArray("diagnostics");
    if (items == nullptr || items->size() != 1U)
    {
        std::cerr << "expected one published diagnostic\n";
        return false;
    }
    auto again = manager.awaitDiagnostics(key, file, milliseconds(200));
    if (!again || again->getAsObject()->getArray("diagnostics")->size() != 1U)
    {
        std::cerr << "expected unchanged document to return the retained diagnostics\n";
        if (!again)
        {
            llvm::consumeError(again.takeError());
        }
        return false;
    }

    std::filesystem::remove(file);
    manager.notifyFileDeleted(file);
    const auto closes = documentCounter(manager, key, "closes");
    if (!closes || *closes != 1 || manager.status(key).openDocuments != 0U)
    {
        std::cerr << "expected deleted file to be closed in the session\n";
        return false;
    }
    return true;
}

bool testSubmitForFile()
{
    Workspace         workspace("files");
    const std::string root = workspace.project("proj");
    const std::string file = workspace.write("proj/src/main.fake", "let x = 1");
    BrokerConfig      config = testConfig();
    config.workspaceRoot     = workspace.root.string();
    LifecycleManager manager(config, registryWith({fakeSpec("fake")}));

    auto project = manager.resolveProject(file);
    if (!project || project->key.root != root || project->key.language != "fake")
    {
        std::cerr << "expected the file to resolve to its marker directory\n";
        if (!project)
        {
            llvm::consumeError(project.takeError());
        }
        return false;
    }
    auto hover = manager.submitForFile(file, "textDocument/hover", positionParams(), lspbroker::lsp::Priority::High);
    if (!hover || hoverText(*hover) != "hover:1")
    {
        std::cerr << "expected hover through project detection\n";
        if (!hover)
        {
            llvm::consumeError(hover.takeError());
        }
        return false;
    }
    if (manager.status(ProjectKey{root, "fake"}).state != SessionState::Ready)
    {
        std::cerr << "expected the detected project to own the session\n";
        return false;
    }
    const std::string other = workspace.write("proj/notes.txt", "text");
    return expectKind(manager.submitForFile(other, "textDocument/hover", positionParams()),
                      ErrorKind::ProjectNotFound,
                      "file without a language server");
}

bool testStartupFailures()
{
    Workspace        workspace("startup");
    const ProjectKey framing{workspace.project("framing"), "fake"};
    const ProjectKey ghost{workspace.project("ghost"), "ghost"};
    const ProjectKey rejecting{workspace.project("rejecting"), "rejecting"};
    LifecycleManager manager(testConfig(),
                             registryWith({fakeSpec("fake"),
                                           fakeSpec("ghost", {}, "lspbroker-no-such-language-server"),
                                           fakeSpec("rejecting", {{"FAKE_LSP_REJECT_INIT", "1"}})}));

    if (!expectKind(manager.submit(plainRequest(framing, "test/garbage")), ErrorKind::FramingFault, "garbage output"))
    {
        return false;
    }
    if (!waitForState(manager, framing, SessionState::Errored) || manager.status(framing).crashCount != 1U)
    {
        std::cerr << "expected a framing fault to count as a crash\n";
        return false;
    }

    if (!expectKind(manager.submit(plainRequest(ghost, "test/sleep")), ErrorKind::BinaryNotFound, "missing binary"))
    {
        return false;
    }
    const auto ghostStatus = manager.status(ghost);
    if (ghostStatus.state != SessionState::Errored || !ghostStatus.lastError ||
        ghostStatus.lastError->kind != ErrorKind::BinaryNotFound)
    {
        std::cerr << "expected a missing binary to leave the session Errored\n";
        return false;
    }

    if (!expectKind(manager.submit(plainRequest(rejecting, "test/sleep")), ErrorKind::HandshakeFailed, "rejected init"))
    {
        return false;
    }
    const auto rejectedStatus = manager.status(rejecting);
    if (!rejectedStatus.lastError)
    {
        std::cerr << "expected a rejected handshake to be recorded\n";
        return false;
    }
    const std::string& rejectedText = rejectedStatus.lastError->message;
    const std::size_t  prefix       = rejectedText.find("initialize failed");
    if (prefix == std::string::npos || rejectedText.find("initialize failed", prefix + 1) != std::string::npos ||
        rejectedText.find("initialization rejected") == std::string::npos)
    {
        std::cerr << "unexpected handshake failure text '" << rejectedText << "'\n";
        return false;
    }
    const auto report = manager.healthReport();
    if (report.sessions.size() != 3U || report.liveSessions != 0U || report.totals.crashes != 3U)
    {
        std::cerr << "expected three failed sessions in the health report\n";
        return false;
    }
    return true;
}

bool testShutdownRacingSpawn()
{
    Workspace        workspace("shutdown-race");
    const ProjectKey key{workspace.project("app"), "fake"};
    BrokerConfig     config = testConfig();
    config.handshakeTimeout = std::chrono::seconds(3);

    // Sweep the shutdown across the spawn window so that some rounds land
    // between fork and the Initializing transition.
    for (int delayMicros = 0; delayMicros <= 1000; delayMicros += 50)
    {
        LifecycleManager manager(config, registryWith({fakeSpec("fake")}));
        std::thread      submitter([&]() {
            (void) failureKind(manager.submit(plainRequest(key, "test/sleep", llvm::json::Object{{"ms", 0}})));
        });
        std::this_thread::sleep_for(std::chrono::microseconds(delayMicros));

        const auto start = std::chrono::steady_clock::now();
        manager.shutdownAll();
        const auto elapsed = std::chrono::steady_clock::now() - start;
        submitter.join();
        if (elapsed >= std::chrono::seconds(2))
        {
            std::cerr << "shutdown after " << delayMicros << " us waited for the handshake timeout\n";
            return false;
        }
        for (const SessionStatus& status : manager.statusAll())
        {
            if (status.state == SessionState::Spawning || status.state == SessionState::Initializing)
            {
                std::cerr << "expected no session left starting after shutdown\n";
                return false;
            }
        }
    }
    return true;
}

}  // namespace

bool runLifecycleManagerTests()
{
    bool ok = true;
    ok      = testStartupTransitions() && ok;
    ok      = testSingleSpawnUnderConcurrency() && ok;
    ok      = testCacheAndWriteInvalidation() && ok;
    ok      = testUriInParamsIsSynchronized() && ok;
    ok      = testIdleShutdown() && ok;
    ok      = testPoolEviction() && ok;
    ok      = testPoolAtCapacity() && ok;
    ok      = testCrashFailsAllPending() && ok;
    ok      = testCrashBackoff() && ok;
    ok      = testRequestErrorsKeepSession() && ok;
    ok      = testResourceRestart() && ok;
    ok      = testForcedRestartAndStop() && ok;
    ok      = testSubmitDuringShutdown() && ok;
    ok      = testDiagnosticsAndDeletion() && ok;
    ok      = testSubmitForFile() && ok;
    ok      = testStartupFailures() && ok;
    ok      = testShutdownRacingSpawn() && ok;
    return ok;
}
