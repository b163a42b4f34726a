//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Scriptable language server used by the broker tests.
///
/// Speaks `Content-Length` framed JSON-RPC on stdio. Behavior is steered by
/// environment variables read at startup and by `test/...` requests:
///
///   FAKE_LSP_INIT_DELAY_MS       delay before answering `initialize`
///   FAKE_LSP_REJECT_INIT         answer `initialize` with an error
///   FAKE_LSP_CRASH_ON_INIT_FLAG  exit during `initialize` while this file exists
///   FAKE_LSP_SPAWN_LOG           append the process id to this file at startup
///   FAKE_LSP_IGNORE_EXIT         ignore `exit`, SIGTERM, and end of input
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/WireCodec.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/raw_ostream.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

namespace
{

using lspbroker::lsp::DecodeStatus;
using lspbroker::lsp::FrameDecoder;

struct FakeDocument final
{
    std::int64_t version{0};
    std::string  text;
};

struct FakeOptions final
{
    std::int64_t initDelayMs{0};
    bool         rejectInit{false};
    std::string  crashOnInitFlag;
    std::string  spawnLog;
    bool         ignoreExit{false};
};

FakeOptions readOptions()
{
    FakeOptions options;
    if (const auto delay = llvm::sys::Process::GetEnv("FAKE_LSP_INIT_DELAY_MS"))
    {
        long long value = 0;
        if (!llvm::StringRef(*delay).getAsInteger(10, value))
        {
            options.initDelayMs = value;
        }
    }
    options.rejectInit = static_cast<bool>(llvm::sys::Process::GetEnv("FAKE_LSP_REJECT_INIT"));
    if (const auto flag = llvm::sys::Process::GetEnv("FAKE_LSP_CRASH_ON_INIT_FLAG"))
    {
        options.crashOnInitFlag = *flag;
    }
    if (const auto log = llvm::sys::Process::GetEnv("FAKE_LSP_SPAWN_LOG"))
    {
        options.spawnLog = *log;
    }
    options.ignoreExit = static_cast<bool>(llvm::sys::Process::GetEnv("FAKE_LSP_IGNORE_EXIT"));
    return options;
}

bool writeAll(const std::string& bytes)
{
    std::size_t offset = 0;
    while (offset < bytes.size())
    {
        const ssize_t written = ::write(STDOUT_FILENO, bytes.data() + offset, bytes.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        offset += static_cast<std::size_t>(written);
    }
    return true;
}

class FakeServer final
{
public:
    explicit FakeServer(FakeOptions options)
        : options_(std::move(options))
    {
    }

    /// Returns the process exit code once the loop ends.
    int run()
    {
        FrameDecoder decoder;
        char         buffer[4096];
        while (true)
        {
            const ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
            if (count < 0 && errno == EINTR)
            {
                continue;
            }
            if (count <= 0)
            {
                // A hung server keeps running after its input closes.
                while (options_.ignoreExit)
                {
                    ::pause();
                }
                return shutdownRequested_ ? 0 : 1;
            }
            decoder.feed(llvm::StringRef(buffer, static_cast<std::size_t>(count)));
            while (true)
            {
                llvm::json::Value  message(nullptr);
                const DecodeStatus status = decoder.next(message);
                if (status == DecodeStatus::NeedMore)
                {
                    break;
                }
                if (status == DecodeStatus::Fault)
                {
                    llvm::errs() << "[fake-lsp] bad frame: " << decoder.faultReason() << "\n";
                    return 2;
                }
                if (const auto exitCode = handle(message))
                {
                    return *exitCode;
                }
            }
        }
    }

private:
    /// Returns an exit code when the message ends the process.
    std::optional<int> handle(const llvm::json::Value& message)
    {
        const llvm::json::Object* object = message.getAsObject();
        if (object == nullptr)
        {
            return std::nullopt;
        }
        const llvm::json::Value* id     = object->get("id");
        const auto               method = object->getString("method");
        const llvm::json::Value  params = object->get("params") ? *object->get("params") : llvm::json::Value(nullptr);

        if (!method)
        {
            if (id != nullptr)
            {
                handleClientResponse(*object);
            }
            return std::nullopt;
        }
        if (id == nullptr)
        {
            return handleNotification(*method, params);
        }
        handleRequest(*id, *method, params);
        return std::nullopt;
    }

    void handleRequest(const llvm::json::Value& id, const llvm::StringRef method, const llvm::json::Value& params)
    {
        const llvm::json::Object* object = params.getAsObject();
        if (method == "initialize")
        {
            if (options_.initDelayMs > 0)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(options_.initDelayMs));
            }
            if (!options_.crashOnInitFlag.empty() && llvm::sys::fs::exists(options_.crashOnInitFlag))
            {
                ::_exit(3);
            }
            if (options_.rejectInit)
            {
                replyError(id, -32603, "initialization rejected");
                return;
            }
            if (object != nullptr && object->get("initializationOptions") != nullptr)
            {
                initializationOptions_ = *object->get("initializationOptions");
            }
            reply(id,
                  llvm::json::Object{
                      {"capabilities",
                       llvm::json::Object{
                           {"textDocumentSync", 1},
                           {"hoverProvider", true},
                           {"completionProvider", llvm::json::Object{}},
                           {"definitionProvider", true},
                           {"documentSymbolProvider", true},
                           {"workspaceSymbolProvider", true},
                       }},
                      {"serverInfo", llvm::json::Object{{"name", "fake-lsp"}}},
                  });
            return;
        }
        if (method == "shutdown")
        {
            shutdownRequested_ = true;
            reply(id, nullptr);
            return;
        }
        if (method == "textDocument/hover")
        {
            const std::string uri = documentUri(object);
            reply(id,
                  llvm::json::Object{
                      {"contents",
                       llvm::json::Object{{"kind", "markdown"}, {"value", "hover:" + std::to_string(versionOf(uri))}}},
                  });
            return;
        }
        if (method == "textDocument/completion")
        {
            reply(id,
                  llvm::json::Object{
                      {"isIncomplete", false},
                      {"items", llvm::json::Array{llvm::json::Object{{"label", "fakeItem"}, {"kind", 3}}}},
                  });
            return;
        }
        if (method == "textDocument/definition")
        {
            reply(id, llvm::json::Array{llvm::json::Object{{"uri", documentUri(object)}, {"range", zeroRange()}}});
            return;
        }
        if (method == "textDocument/documentSymbol" || method == "workspace/symbol")
        {
            reply(id, llvm::json::Array{});
            return;
        }
        if (method == "test/sleep")
        {
            std::int64_t millis = 0;
            if (object != nullptr)
            {
                millis = object->getInteger("ms").getValueOr(0);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(millis));
            reply(id, llvm::json::Object{{"slept", millis}});
            return;
        }
        if (method == "test/crash")
        {
            ::_exit(1);
        }
        if (method == "test/garbage")
        {
            (void) writeAll("Content-Length: nope\r\n\r\n{}");
            return;
        }
        if (method == "test/allocate")
        {
            std::int64_t megabytes = 0;
            if (object != nullptr)
            {
                megabytes = object->getInteger("mb").getValueOr(0);
            }
            auto block = std::make_unique<std::vector<char>>(static_cast<std::size_t>(megabytes) * 1024U * 1024U, 'x');
            ballast_.push_back(std::move(block));
            reply(id, llvm::json::Object{{"allocated", megabytes}});
            return;
        }
        if (method == "test/documentState")
        {
            llvm::json::Object versions;
            for (const auto& [uri, document] : documents_)
            {
                versions[uri] = document.version;
            }
            reply(id,
                  llvm::json::Object{
                      {"documents", std::move(versions)},
                      {"opens", opens_},
                      {"changes", changes_},
                      {"closes", closes_},
                      {"initializationOptions", initializationOptions_},
                  });
            return;
        }
        if (method == "test/serverRequest")
        {
            pendingServerRequestReply_ = id;
            send(llvm::json::Object{
                {"jsonrpc", "2.0"},
                {"id", "fake-1"},
                {"method", "workspace/configuration"},
                {"params",
                 llvm::json::Object{
                     {"items",
                      llvm::json::Array{llvm::json::Object{{"section", "a"}}, llvm::json::Object{{"section", "b"}}}},
                 }},
            });
            return;
        }
        replyError(id, -32601, ("method not found: " + method).str());
    }

    std::optional<int> handleNotification(const llvm::StringRef method, const llvm::json::Value& params)
    {
        const llvm::json::Object* object = params.getAsObject();
        if (method == "exit")
        {
            if (options_.ignoreExit)
            {
                return std::nullopt;
            }
            return shutdownRequested_ ? 0 : 1;
        }
        if (object == nullptr)
        {
            return std::nullopt;
        }
        if (method == "textDocument/didOpen")
        {
            if (const llvm::json::Object* item = object->getObject("textDocument"))
            {
                const std::string uri = item->getString("uri").getValueOr("").str();
                FakeDocument      document;
                document.version = item->getInteger("version").getValueOr(0);
                document.text    = item->getString("text").getValueOr("").str();
                documents_[uri]  = document;
                ++opens_;
                publishDiagnostics(uri);
            }
            return std::nullopt;
        }
        if (method == "textDocument/didChange")
        {
            const std::string uri = documentUri(object);
            FakeDocument&     document = documents_[uri];
            if (const llvm::json::Object* item = object->getObject("textDocument"))
            {
                document.version = item->getInteger("version").getValueOr(document.version + 1);
            }
            if (const llvm::json::Array* changes = object->getArray("contentChanges"))
            {
                for (const llvm::json::Value& change : *changes)
                {
                    if (const llvm::json::Object* changeObject = change.getAsObject())
                    {
                        document.text = changeObject->getString("text").getValueOr("").str();
                    }
                }
            }
            ++changes_;
            publishDiagnostics(uri);
            return std::nullopt;
        }
        if (method == "textDocument/didClose")
        {
            documents_.erase(documentUri(object));
            ++closes_;
        }
        return std::nullopt;
    }

    void handleClientResponse(const llvm::json::Object& response)
    {
        if (!pendingServerRequestReply_)
        {
            return;
        }
        const llvm::json::Value* result = response.get("result");
        reply(*pendingServerRequestReply_,
              llvm::json::Object{{"reply", result != nullptr ? *result : llvm::json::Value(nullptr)}});
        pendingServerRequestReply_.reset();
    }

    static std::string documentUri(const llvm::json::Object* params)
    {
        if (params == nullptr)
        {
            return {};
        }
        if (const llvm::json::Object* item = params->getObject("textDocument"))
        {
            return item->getString("uri").getValueOr("").str();
        }
        return {};
    }

    static llvm::json::Object zeroRange()
    {
        return llvm::json::Object{
            {"start", llvm::json::Object{{"line", 0}, {"character", 0}}},
            {"end", llvm::json::Object{{"line", 0}, {"character", 1}}},
        };
    }

    std::int64_t versionOf(const std::string& uri) const
    {
        const auto it = documents_.find(uri);
        return it == documents_.end() ? 0 : it->second.version;
    }

    void publishDiagnostics(const std::string& uri)
    {
        const FakeDocument& document = documents_[uri];
        llvm::json::Array   diagnostics;
        if (llvm::StringRef(document.text).contains("ERROR"))
        {
            diagnostics.push_back(llvm::json::Object{
                {"range", zeroRange()},
                {"severity", 1},
                {"message", "found ERROR marker"},
            });
        }
        send(llvm::json::Object{
            {"jsonrpc", "2.0"},
            {"method", "textDocument/publishDiagnostics"},
            {"params",
             llvm::json::Object{{"uri", uri}, {"version", document.version}, {"diagnostics", std::move(diagnostics)}}},
        });
    }

    void reply(const llvm::json::Value& id, llvm::json::Value result)
    {
        send(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
    }

    void replyError(const llvm::json::Value& id, const int code, const std::string& message)
    {
        send(llvm::json::Object{
            {"jsonrpc", "2.0"},
            {"id", id},
            {"error", llvm::json::Object{{"code", code}, {"message", message}}},
        });
    }

    static void send(llvm::json::Object message)
    {
        if (!writeAll(lspbroker::lsp::encodeMessage(llvm::json::Value(std::move(message)))))
        {
            ::_exit(4);
        }
    }

    FakeOptions                                    options_;
    std::map<std::string, FakeDocument>            documents_;
    std::vector<std::unique_ptr<std::vector<char>>> ballast_;
    std::optional<llvm::json::Value>               pendingServerRequestReply_;
    llvm::json::Value                              initializationOptions_{nullptr};
    std::int64_t                                   opens_{0};
    std::int64_t                                   changes_{0};
    std::int64_t                                   closes_{0};
    bool                                           shutdownRequested_{false};
};

}  // namespace

int main()
{
    FakeOptions options = readOptions();
    if (options.ignoreExit)
    {
        std::signal(SIGTERM, SIG_IGN);
    }
    if (!options.spawnLog.empty())
    {
        std::error_code      ec;
        llvm::raw_fd_ostream log(options.spawnLog, ec, llvm::sys::fs::OF_Append);
        if (!ec)
        {
            log << ::getpid() << "\n";
        }
    }
    FakeServer server(std::move(options));
    return server.run();
}
