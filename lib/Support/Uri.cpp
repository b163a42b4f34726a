//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements path and `file://` URI conversion.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/Support/Uri.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"

#include <filesystem>
#include <system_error>

namespace lspbroker
{
namespace
{

int hexDigitValue(const char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F')
    {
        return 10 + (c - 'A');
    }
    return -1;
}

std::string decodeUriPath(const std::string_view encoded)
{
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i)
    {
        if (encoded[i] == '%' && i + 2 < encoded.size())
        {
            const int hi = hexDigitValue(encoded[i + 1]);
            const int lo = hexDigitValue(encoded[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(encoded[i]);
    }
    return out;
}

bool isUnreservedPathChar(const unsigned char c)
{
    return llvm::isAlnum(static_cast<char>(c)) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/' ||
           c == ':' || c == '@' || c == '+' || c == '=' || c == ',';
}

}  // namespace

std::string normalizePath(const std::string_view pathText)
{
    if (pathText.empty())
    {
        return {};
    }

    const std::filesystem::path inputPath(pathText);
    std::error_code             ec;
    std::filesystem::path       absolutePath = std::filesystem::absolute(inputPath, ec);
    if (ec)
    {
        absolutePath = inputPath;
    }

    std::filesystem::path canonicalPath = std::filesystem::weakly_canonical(absolutePath, ec);
    if (ec)
    {
        canonicalPath = absolutePath.lexically_normal();
    }

    std::string out = canonicalPath.string();
    while (out.size() > 1 && out.back() == '/')
    {
        out.pop_back();
    }
    return out;
}

std::string pathToFileUri(const std::string_view path)
{
    const std::string normalized = normalizePath(path);
    std::string       out        = "file://";
    if (normalized.empty() || normalized.front() != '/')
    {
        out.push_back('/');
    }
    for (const char ch : normalized)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (isUnreservedPathChar(byte))
        {
            out.push_back(ch);
            continue;
        }
        out.push_back('%');
        out.push_back(llvm::hexdigit(byte >> 4U));
        out.push_back(llvm::hexdigit(byte & 0x0FU));
    }
    return out;
}

std::string fileUriToPath(const std::string_view uri)
{
    llvm::StringRef text(uri.data(), uri.size());
    if (!text.startswith_insensitive("file://"))
    {
        return normalizePath(uri);
    }

    llvm::StringRef path = text.drop_front(7);
    if (!path.empty() && path.front() != '/')
    {
        const std::size_t slash     = path.find('/');
        const auto        authority = path.substr(0, slash);
        if (slash == llvm::StringRef::npos || !authority.equals_insensitive("localhost"))
        {
            return {};
        }
        path = path.substr(slash);
    }

    return normalizePath(decodeUriPath(std::string_view(path.data(), path.size())));
}

}  // namespace lspbroker
