//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fingerprint-keyed response cache shared by all sessions.
///
/// Entries are keyed by project, method, canonical params, and the content
/// fingerprint of the request's input file. Each entry lists the files it
/// depends on; a reported write to any of them removes the entry and bumps
/// the file's write generation, so a response computed before the write is
/// refused when it arrives afterwards.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_RESPONSE_CACHE_H
#define LSPBROKER_LSP_RESPONSE_CACHE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lspbroker::lsp
{

/// @brief Identity of a cacheable request.
struct CacheKey final
{
    std::string   projectRoot;
    std::string   language;
    std::string   method;
    std::string   params;
    std::uint64_t inputFingerprint{0};

    /// @brief Flattened key used for indexing.
    [[nodiscard]] std::string str() const;
};

/// @brief Builds a cache key with `params` serialized canonically.
[[nodiscard]] CacheKey makeCacheKey(llvm::StringRef          projectRoot,
                                    llvm::StringRef          language,
                                    llvm::StringRef          method,
                                    const llvm::json::Value& params,
                                    std::uint64_t            inputFingerprint);

/// @brief Write generations of a request's dependencies captured before dispatch.
struct CacheObservation final
{
    std::vector<std::pair<std::string, std::uint64_t>> generations;
};

/// @brief Cache counters and occupancy.
struct CacheStats final
{
    std::size_t                        entries{0};
    std::size_t                        expiredEntries{0};
    std::uint64_t                      hits{0};
    std::uint64_t                      misses{0};
    std::uint64_t                      evictions{0};
    std::uint64_t                      invalidations{0};
    std::uint64_t                      staleRejections{0};
    std::map<std::string, std::size_t> entriesByMethod;
};

/// @brief Thread-safe TTL and LRU bounded response cache.
class ResponseCache final
{
public:
    using Clock   = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /// @brief Creates a cache.
    /// @param[in] capacity Maximum number of entries; zero disables storage.
    /// @param[in] clock Time source; defaults to `steady_clock::now`.
    explicit ResponseCache(std::size_t capacity, ClockFn clock = {});

    /// @brief Returns a live entry and marks it most recently used.
    [[nodiscard]] std::optional<llvm::json::Value> lookup(const CacheKey& key);

    /// @brief Captures the write generations of `dependencies` before a request is sent.
    [[nodiscard]] CacheObservation observe(const std::vector<std::string>& dependencies) const;

    /// @brief Stores a response.
    /// @param[in] key Request identity.
    /// @param[in] value Response value.
    /// @param[in] dependencies Normalized paths the response depends on.
    /// @param[in] observation Generations captured by `observe` before the request was sent.
    /// @param[in] ttl Lifetime; non-positive values skip storage.
    /// @return `false` when nothing was stored, including when a dependency was written meanwhile.
    bool store(const CacheKey&                 key,
               llvm::json::Value               value,
               std::vector<std::string>        dependencies,
               const CacheObservation&         observation,
               std::chrono::milliseconds       ttl);

    /// @brief Drops entries depending on `file` and advances its write generation.
    /// @return Number of entries removed.
    std::size_t invalidate(llvm::StringRef file);

    /// @brief Drops every entry of a project.
    /// @return Number of entries removed.
    std::size_t invalidateProject(llvm::StringRef projectRoot);

    /// @brief Drops expired entries.
    /// @return Number of entries removed.
    std::size_t purgeExpired();

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const;
    [[nodiscard]] CacheStats  stats() const;

private:
    struct Entry final
    {
        std::string              indexKey;
        CacheKey                 key;
        llvm::json::Value        value;
        std::vector<std::string> dependencies;
        Clock::time_point        expiry;
    };
    using EntryList = std::list<Entry>;

    Clock::time_point now() const;
    void              eraseLocked(EntryList::iterator it);

    const std::size_t                                      capacity_;
    ClockFn                                                clock_;
    mutable std::mutex                                     mutex_;
    EntryList                                              entries_;
    std::unordered_map<std::string, EntryList::iterator>  index_;
    std::unordered_map<std::string, std::uint64_t>         generations_;
    std::uint64_t                                          hits_{0};
    std::uint64_t                                          misses_{0};
    std::uint64_t                                          evictions_{0};
    std::uint64_t                                          invalidations_{0};
    std::uint64_t                                          staleRejections_{0};
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_RESPONSE_CACHE_H
