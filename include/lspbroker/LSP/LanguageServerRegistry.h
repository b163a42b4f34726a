//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Registry of language server launch definitions.
///
/// Each definition names the executable to run for a language, the files
/// that mark a project root, the source extensions it handles, and the
/// options it expects during initialization.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_LANGUAGE_SERVER_REGISTRY_H
#define LSPBROKER_LSP_LANGUAGE_SERVER_REGISTRY_H

#include "lspbroker/LSP/BrokerConfig.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lspbroker::lsp
{

/// @brief How to run and recognize one language server.
struct LanguageServerSpec final
{
    /// @brief Registry key, for example `rust`.
    std::string language;

    /// @brief `languageId` sent with `didOpen`.
    std::string languageId;

    /// @brief Executable name or path.
    std::string command;

    /// @brief Command-line arguments.
    std::vector<std::string> arguments;

    /// @brief File names marking a project root, for example `Cargo.toml`.
    std::vector<std::string> rootMarkers;

    /// @brief Handled source extensions including the dot, for example `.rs`.
    std::vector<std::string> extensions;

    /// @brief `initializationOptions` for the initialize request.
    llvm::json::Value initializationOptions{nullptr};

    /// @brief Extra environment for the server process.
    std::vector<std::pair<std::string, std::string>> environment;
};

/// @brief Ordered set of language server definitions.
class LanguageServerRegistry final
{
public:
    /// @brief Returns a registry holding rust-analyzer, jdtls, pylsp, and clangd.
    [[nodiscard]] static LanguageServerRegistry withBuiltins();

    /// @brief Adds a definition, replacing one with the same language.
    void add(LanguageServerSpec spec);

    /// @brief Applies configured overrides. Unknown languages are added when a command is given.
    void applyOverrides(const std::map<std::string, ServerOverride>& overrides);

    [[nodiscard]] const LanguageServerSpec* find(llvm::StringRef language) const;

    /// @brief Returns the first definition handling the extension of `path`.
    [[nodiscard]] const LanguageServerSpec* findForFile(llvm::StringRef path) const;

    /// @brief Returns the language whose root markers include `fileName`.
    [[nodiscard]] std::optional<std::string> languageForMarker(llvm::StringRef fileName) const;

    [[nodiscard]] const std::vector<LanguageServerSpec>& specs() const;
    [[nodiscard]] std::size_t                            size() const;

private:
    std::vector<LanguageServerSpec> specs_;
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_LANGUAGE_SERVER_REGISTRY_H
