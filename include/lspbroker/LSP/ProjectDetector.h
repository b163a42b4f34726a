//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Maps source files to projects and their language servers.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_PROJECT_DETECTOR_H
#define LSPBROKER_LSP_PROJECT_DETECTOR_H

#include "lspbroker/LSP/LanguageServerRegistry.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <string>
#include <vector>

namespace lspbroker::lsp
{

/// @brief Identity of one managed server instance.
struct ProjectKey final
{
    /// @brief Normalized absolute project root.
    std::string root;

    /// @brief Registry language.
    std::string language;

    /// @brief Returns `<language>@<root>` for logs.
    [[nodiscard]] std::string str() const;

    bool operator==(const ProjectKey& other) const
    {
        return root == other.root && language == other.language;
    }

    bool operator<(const ProjectKey& other) const
    {
        return root == other.root ? language < other.language : root < other.root;
    }
};

/// @brief A project found on disk.
struct DetectedProject final
{
    ProjectKey key;

    /// @brief Marker that identified the root, empty for the workspace fallback.
    std::string markerFile;
};

/// @brief Resolves project roots from root marker files.
class ProjectDetector final
{
public:
    /// @param[in] registry Server definitions. Must outlive the detector.
    /// @param[in] workspaceRoot Upper bound for upward searches. Empty means unbounded.
    ProjectDetector(const LanguageServerRegistry& registry, std::string workspaceRoot);

    /// @brief Finds the nearest enclosing project for a source file.
    ///
    /// Searches upward from the file's directory for a root marker of the language
    /// that handles the file's extension. The search stops at the workspace root;
    /// a file inside the workspace without any marker belongs to the workspace root.
    ///
    /// @return `ProjectNotFound` when no language handles the file or no root applies.
    [[nodiscard]] llvm::Expected<DetectedProject> detectForFile(llvm::StringRef path) const;

    /// @brief Lists every project below the workspace root, sorted by key.
    [[nodiscard]] std::vector<DetectedProject> findAllProjects(std::size_t maxDepth = 10) const;

    [[nodiscard]] const std::string& workspaceRoot() const;

private:
    const LanguageServerRegistry& registry_;
    std::string                   workspaceRoot_;
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_PROJECT_DETECTOR_H
