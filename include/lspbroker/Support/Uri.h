//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Filesystem path and `file://` URI conversion helpers.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_SUPPORT_URI_H
#define LSPBROKER_SUPPORT_URI_H

#include <string>
#include <string_view>

namespace lspbroker
{

/// @brief Returns an absolute, lexically normalized path with symlinks resolved where possible.
/// @param[in] pathText Input path; relative paths resolve against the current directory.
/// @return Normalized path, or an empty string for empty input.
[[nodiscard]] std::string normalizePath(std::string_view pathText);

/// @brief Converts a filesystem path to a percent-encoded `file://` URI.
[[nodiscard]] std::string pathToFileUri(std::string_view path);

/// @brief Converts a `file://` URI to a normalized path.
/// @return Normalized path; non-URI input is treated as a path. Empty for URIs with a
///         non-local authority.
[[nodiscard]] std::string fileUriToPath(std::string_view uri);

}  // namespace lspbroker

#endif  // LSPBROKER_SUPPORT_URI_H
