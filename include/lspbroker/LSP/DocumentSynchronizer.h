//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Open-document table for one language-server session.
///
/// The synchronizer decides whether a file must be opened, updated, or left
/// alone before a file-scoped request is sent, and emits the matching
/// `didOpen`/`didChange`/`didClose` notifications with monotonic versions.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_DOCUMENT_SYNCHRONIZER_H
#define LSPBROKER_LSP_DOCUMENT_SYNCHRONIZER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lspbroker::lsp
{

class ProtocolPeer;

/// @brief State of one document as last sent to the server.
struct OpenDocument final
{
    /// @brief Document URI.
    std::string uri;

    /// @brief LSP language identifier sent with `didOpen`.
    std::string languageId;

    /// @brief Version of the last content sent.
    std::int64_t version{0};

    /// @brief Fingerprint of the last content sent.
    std::uint64_t fingerprint{0};
};

/// @brief What `ensureOpen` had to do.
enum class SyncAction
{
    /// @brief `didOpen` was sent with version 1.
    Opened,

    /// @brief `didChange` was sent with the next version.
    Changed,

    /// @brief The server already has this content.
    Unchanged,
};

/// @brief Computes the content fingerprint used for change detection.
[[nodiscard]] std::uint64_t contentFingerprint(llvm::StringRef content);

/// @brief Per-session open-document table.
class DocumentSynchronizer final
{
public:
    /// @brief Makes the server's view of `uri` match `content`.
    ///
    /// The table lock is held while the notification is written so that
    /// versions reach the server in increasing order.
    ///
    /// @param[in] peer Session to notify.
    /// @param[in] uri Document URI.
    /// @param[in] languageId Language identifier for `didOpen`.
    /// @param[in] content Current full content.
    /// @return Action taken, or the write failure (the table is left unchanged).
    [[nodiscard]] llvm::Expected<SyncAction> ensureOpen(ProtocolPeer&         peer,
                                                        const std::string&    uri,
                                                        llvm::StringRef       languageId,
                                                        llvm::StringRef       content);

    /// @brief Sends `didClose` and forgets the document. No-op when not open.
    [[nodiscard]] llvm::Error close(ProtocolPeer& peer, const std::string& uri);

    /// @brief Forgets a document without notifying the server.
    /// @return `true` when the document was open.
    bool forget(const std::string& uri);

    /// @brief Forgets every document without notifying the server.
    void clear();

    [[nodiscard]] std::optional<OpenDocument> lookup(const std::string& uri) const;
    [[nodiscard]] std::vector<OpenDocument>   documents() const;
    [[nodiscard]] std::size_t                 size() const;

private:
    mutable std::mutex                            mutex_;
    std::unordered_map<std::string, OpenDocument> documents_;
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_DOCUMENT_SYNCHRONIZER_H
