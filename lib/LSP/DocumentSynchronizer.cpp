//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements open-document tracking and synchronization notifications.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/DocumentSynchronizer.h"

#include "lspbroker/LSP/ProtocolSession.h"

#include "llvm/Support/JSON.h"
#include "llvm/Support/xxhash.h"

#include <algorithm>
#include <utility>

namespace lspbroker::lsp
{

std::uint64_t contentFingerprint(const llvm::StringRef content)
{
    return llvm::xxHash64(content);
}

llvm::Expected<SyncAction> DocumentSynchronizer::ensureOpen(ProtocolPeer&         peer,
                                                            const std::string&    uri,
                                                            const llvm::StringRef languageId,
                                                            const llvm::StringRef content)
{
    const std::uint64_t         fingerprint = contentFingerprint(content);
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = documents_.find(uri);
    if (it == documents_.end())
    {
        llvm::json::Object params{
            {"textDocument",
             llvm::json::Object{
                 {"uri", uri},
                 {"languageId", languageId.str()},
                 {"version", 1},
                 {"text", content.str()},
             }},
        };
        if (llvm::Error error = peer.notify("textDocument/didOpen", std::move(params)))
        {
            return std::move(error);
        }
        documents_.emplace(uri, OpenDocument{uri, languageId.str(), 1, fingerprint});
        return SyncAction::Opened;
    }

    OpenDocument& document = it->second;
    if (document.fingerprint == fingerprint)
    {
        return SyncAction::Unchanged;
    }

    const std::int64_t nextVersion = document.version + 1;
    llvm::json::Object params{
        {"textDocument", llvm::json::Object{{"uri", uri}, {"version", nextVersion}}},
        {"contentChanges", llvm::json::Array{llvm::json::Object{{"text", content.str()}}}},
    };
    if (llvm::Error error = peer.notify("textDocument/didChange", std::move(params)))
    {
        return std::move(error);
    }
    document.version     = nextVersion;
    document.fingerprint = fingerprint;
    return SyncAction::Changed;
}

llvm::Error DocumentSynchronizer::close(ProtocolPeer& peer, const std::string& uri)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = documents_.find(uri);
    if (it == documents_.end())
    {
        return llvm::Error::success();
    }
    documents_.erase(it);
    return peer.notify("textDocument/didClose",
                       llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", uri}}}});
}

bool DocumentSynchronizer::forget(const std::string& uri)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.erase(uri) > 0U;
}

void DocumentSynchronizer::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    documents_.clear();
}

std::optional<OpenDocument> DocumentSynchronizer::lookup(const std::string& uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = documents_.find(uri);
    if (it == documents_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<OpenDocument> DocumentSynchronizer::documents() const
{
    std::vector<OpenDocument> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(documents_.size());
        for (const auto& [_, document] : documents_)
        {
            out.push_back(document);
        }
    }
    std::sort(out.begin(), out.end(), [](const OpenDocument& lhs, const OpenDocument& rhs) {
        return lhs.uri < rhs.uri;
    });
    return out;
}

std::size_t DocumentSynchronizer::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.size();
}

}  // namespace lspbroker::lsp
