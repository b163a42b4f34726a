//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements root-marker project detection.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/ProjectDetector.h"

#include "lspbroker/Support/Error.h"
#include "lspbroker/Support/Uri.h"

#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>
#include <utility>

namespace lspbroker::lsp
{
namespace
{

bool isSkippedDirectory(const std::string& name)
{
    static const std::set<std::string> Skipped{".git", ".cache", ".vscode", ".idea", "node_modules", "target"};
    return Skipped.contains(name);
}

bool isWithin(const std::string& path, const std::string& root)
{
    if (root.empty())
    {
        return true;
    }
    if (path.size() < root.size() || path.compare(0, root.size(), root) != 0)
    {
        return false;
    }
    return path.size() == root.size() || path[root.size()] == '/' || root == "/";
}

}  // namespace

std::string ProjectKey::str() const
{
    return language + "@" + root;
}

ProjectDetector::ProjectDetector(const LanguageServerRegistry& registry, std::string workspaceRoot)
    : registry_(registry)
    , workspaceRoot_(workspaceRoot.empty() ? std::string{} : normalizePath(workspaceRoot))
{
}

llvm::Expected<DetectedProject> ProjectDetector::detectForFile(const llvm::StringRef path) const
{
    const std::string normalized = normalizePath(path.str());
    if (normalized.empty())
    {
        return makeBrokerError(ErrorKind::ProjectNotFound, "empty file path");
    }

    const LanguageServerSpec* spec = registry_.findForFile(normalized);
    if (spec == nullptr)
    {
        return makeBrokerError(ErrorKind::ProjectNotFound, "no language server handles '" + normalized + "'");
    }

    const bool insideWorkspace = isWithin(normalized, workspaceRoot_);

    std::error_code       ec;
    std::filesystem::path dir = std::filesystem::path(normalized).parent_path();
    while (!dir.empty())
    {
        for (const std::string& marker : spec->rootMarkers)
        {
            if (std::filesystem::is_regular_file(dir / marker, ec))
            {
                return DetectedProject{ProjectKey{dir.string(), spec->language}, marker};
            }
        }
        if (insideWorkspace && !workspaceRoot_.empty() && dir.string() == workspaceRoot_)
        {
            break;
        }
        const std::filesystem::path parent = dir.parent_path();
        if (parent == dir)
        {
            break;
        }
        dir = parent;
    }

    if (insideWorkspace && !workspaceRoot_.empty())
    {
        return DetectedProject{ProjectKey{workspaceRoot_, spec->language}, std::string{}};
    }
    return makeBrokerError(ErrorKind::ProjectNotFound,
                           "no " + spec->language + " project root encloses '" + normalized + "'");
}

std::vector<DetectedProject> ProjectDetector::findAllProjects(const std::size_t maxDepth) const
{
    std::vector<DetectedProject> out;
    if (workspaceRoot_.empty())
    {
        return out;
    }

    std::set<ProjectKey> seen;
    std::error_code      ec;
    auto                 it = std::filesystem::recursive_directory_iterator(
        workspaceRoot_, std::filesystem::directory_options::skip_permission_denied, ec);
    const auto end = std::filesystem::recursive_directory_iterator();
    for (; !ec && it != end; it.increment(ec))
    {
        const std::filesystem::directory_entry& entry = *it;
        const std::string                       name  = entry.path().filename().string();
        std::error_code                         typeEc;
        if (entry.is_directory(typeEc))
        {
            if (isSkippedDirectory(name) || static_cast<std::size_t>(it.depth()) + 1U >= maxDepth)
            {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(typeEc))
        {
            continue;
        }
        for (const LanguageServerSpec& spec : registry_.specs())
        {
            if (std::find(spec.rootMarkers.begin(), spec.rootMarkers.end(), name) == spec.rootMarkers.end())
            {
                continue;
            }
            ProjectKey key{entry.path().parent_path().string(), spec.language};
            if (seen.insert(key).second)
            {
                out.push_back(DetectedProject{std::move(key), name});
            }
        }
    }

    std::sort(out.begin(), out.end(), [](const DetectedProject& lhs, const DetectedProject& rhs) {
        return lhs.key < rhs.key;
    });
    return out;
}

const std::string& ProjectDetector::workspaceRoot() const
{
    return workspaceRoot_;
}

}  // namespace lspbroker::lsp
