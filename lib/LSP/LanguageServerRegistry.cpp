//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the built-in language server definitions and overrides.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/LanguageServerRegistry.h"

#include "lspbroker/Support/Log.h"

#include "llvm/Support/Path.h"

#include <algorithm>

namespace lspbroker::lsp
{
namespace
{

LanguageServerSpec rustAnalyzer()
{
    LanguageServerSpec spec;
    spec.language    = "rust";
    spec.languageId  = "rust";
    spec.command     = "rust-analyzer";
    spec.rootMarkers = {"Cargo.toml"};
    spec.extensions  = {".rs"};
    return spec;
}

LanguageServerSpec jdtls()
{
    LanguageServerSpec spec;
    spec.language    = "java";
    spec.languageId  = "java";
    spec.command     = "jdtls";
    spec.rootMarkers = {"pom.xml", "build.gradle", "build.gradle.kts"};
    spec.extensions  = {".java"};
    // A null `home` makes jdtls fall back to JAVA_HOME.
    spec.initializationOptions = llvm::json::Object{
        {"settings",
         llvm::json::Object{
             {"java", llvm::json::Object{{"home", nullptr}, {"format", llvm::json::Object{{"enabled", true}}}}},
         }},
    };
    return spec;
}

LanguageServerSpec pylsp()
{
    LanguageServerSpec spec;
    spec.language    = "python";
    spec.languageId  = "python";
    spec.command     = "pylsp";
    spec.rootMarkers = {"pyproject.toml", "setup.py", "requirements.txt"};
    spec.extensions  = {".py"};
    spec.initializationOptions = llvm::json::Object{
        {"pylsp",
         llvm::json::Object{
             {"plugins",
              llvm::json::Object{
                  {"pycodestyle", llvm::json::Object{{"enabled", true}}},
                  {"pyflakes", llvm::json::Object{{"enabled", true}}},
                  {"pylint", llvm::json::Object{{"enabled", false}}},
              }},
         }},
    };
    return spec;
}

LanguageServerSpec clangd()
{
    LanguageServerSpec spec;
    spec.language    = "cpp";
    spec.languageId  = "cpp";
    spec.command     = "clangd";
    spec.arguments   = {"--background-index=false"};
    spec.rootMarkers = {"compile_commands.json", "compile_flags.txt", "CMakeLists.txt"};
    spec.extensions  = {".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx"};
    return spec;
}

bool contains(const std::vector<std::string>& values, const llvm::StringRef needle)
{
    return std::any_of(values.begin(), values.end(), [needle](const std::string& value) { return value == needle; });
}

}  // namespace

LanguageServerRegistry LanguageServerRegistry::withBuiltins()
{
    LanguageServerRegistry registry;
    registry.add(rustAnalyzer());
    registry.add(jdtls());
    registry.add(pylsp());
    registry.add(clangd());
    return registry;
}

void LanguageServerRegistry::add(LanguageServerSpec spec)
{
    if (spec.languageId.empty())
    {
        spec.languageId = spec.language;
    }
    for (LanguageServerSpec& existing : specs_)
    {
        if (existing.language == spec.language)
        {
            existing = std::move(spec);
            return;
        }
    }
    specs_.push_back(std::move(spec));
}

void LanguageServerRegistry::applyOverrides(const std::map<std::string, ServerOverride>& overrides)
{
    for (const auto& [language, override] : overrides)
    {
        LanguageServerSpec spec;
        if (const LanguageServerSpec* existing = find(language))
        {
            spec = *existing;
        }
        else if (!override.command)
        {
            logMessage(LogLevel::Warning, "registry", "ignoring server '" + language + "' without a command");
            continue;
        }
        else
        {
            spec.language = language;
        }

        if (override.command)
        {
            spec.command = *override.command;
        }
        if (override.arguments)
        {
            spec.arguments = *override.arguments;
        }
        if (override.rootMarkers)
        {
            spec.rootMarkers = *override.rootMarkers;
        }
        if (override.extensions)
        {
            spec.extensions = *override.extensions;
        }
        if (override.languageId)
        {
            spec.languageId = *override.languageId;
        }
        if (override.initializationOptions)
        {
            spec.initializationOptions = *override.initializationOptions;
        }
        if (!override.environment.empty())
        {
            spec.environment = override.environment;
        }
        add(std::move(spec));
    }
}

const LanguageServerSpec* LanguageServerRegistry::find(const llvm::StringRef language) const
{
    for (const LanguageServerSpec& spec : specs_)
    {
        if (spec.language == language)
        {
            return &spec;
        }
    }
    return nullptr;
}

const LanguageServerSpec* LanguageServerRegistry::findForFile(const llvm::StringRef path) const
{
    const llvm::StringRef extension = llvm::sys::path::extension(path);
    if (extension.empty())
    {
        return nullptr;
    }
    for (const LanguageServerSpec& spec : specs_)
    {
        if (contains(spec.extensions, extension))
        {
            return &spec;
        }
    }
    return nullptr;
}

std::optional<std::string> LanguageServerRegistry::languageForMarker(const llvm::StringRef fileName) const
{
    for (const LanguageServerSpec& spec : specs_)
    {
        if (contains(spec.rootMarkers, fileName))
        {
            return spec.language;
        }
    }
    return std::nullopt;
}

const std::vector<LanguageServerSpec>& LanguageServerRegistry::specs() const
{
    return specs_;
}

std::size_t LanguageServerRegistry::size() const
{
    return specs_.size();
}

}  // namespace lspbroker::lsp
