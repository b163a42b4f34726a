//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the response cache.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/ResponseCache.h"

#include "lspbroker/LSP/WireCodec.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace lspbroker::lsp
{

std::string CacheKey::str() const
{
    std::string out;
    out.reserve(projectRoot.size() + language.size() + method.size() + params.size() + 24U);
    out.append(projectRoot).push_back('\0');
    out.append(language).push_back('\0');
    out.append(method).push_back('\0');
    out.append(params).push_back('\0');
    out.append(std::to_string(inputFingerprint));
    return out;
}

CacheKey makeCacheKey(const llvm::StringRef    projectRoot,
                      const llvm::StringRef    language,
                      const llvm::StringRef    method,
                      const llvm::json::Value& params,
                      const std::uint64_t      inputFingerprint)
{
    return CacheKey{projectRoot.str(), language.str(), method.str(), serializeJson(params), inputFingerprint};
}

ResponseCache::ResponseCache(const std::size_t capacity, ClockFn clock)
    : capacity_(capacity)
    , clock_(std::move(clock))
{
}

ResponseCache::Clock::time_point ResponseCache::now() const
{
    return clock_ ? clock_() : Clock::now();
}

std::optional<llvm::json::Value> ResponseCache::lookup(const CacheKey& key)
{
    const auto                  current = now();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = index_.find(key.str());
    if (it == index_.end())
    {
        ++misses_;
        return std::nullopt;
    }
    if (it->second->expiry <= current)
    {
        eraseLocked(it->second);
        ++misses_;
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;
    return it->second->value;
}

CacheObservation ResponseCache::observe(const std::vector<std::string>& dependencies) const
{
    CacheObservation            observation;
    std::lock_guard<std::mutex> lock(mutex_);
    observation.generations.reserve(dependencies.size());
    for (const std::string& path : dependencies)
    {
        const auto it = generations_.find(path);
        observation.generations.emplace_back(path, it == generations_.end() ? 0U : it->second);
    }
    return observation;
}

bool ResponseCache::store(const CacheKey&                 key,
                          llvm::json::Value               value,
                          std::vector<std::string>        dependencies,
                          const CacheObservation&         observation,
                          const std::chrono::milliseconds ttl)
{
    if (capacity_ == 0U || ttl.count() <= 0)
    {
        return false;
    }

    const auto                  current = now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [path, generation] : observation.generations)
    {
        const auto it = generations_.find(path);
        if (it != generations_.end() && it->second != generation)
        {
            ++staleRejections_;
            return false;
        }
    }

    std::string indexKey = key.str();
    if (const auto existing = index_.find(indexKey); existing != index_.end())
    {
        eraseLocked(existing->second);
    }
    while (entries_.size() >= capacity_)
    {
        eraseLocked(std::prev(entries_.end()));
        ++evictions_;
    }

    entries_.push_front(Entry{indexKey, key, std::move(value), std::move(dependencies), current + ttl});
    index_.emplace(std::move(indexKey), entries_.begin());
    return true;
}

std::size_t ResponseCache::invalidate(const llvm::StringRef file)
{
    const std::string           path = file.str();
    std::lock_guard<std::mutex> lock(mutex_);
    ++generations_[path];

    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        const auto next = std::next(it);
        if (std::find(it->dependencies.begin(), it->dependencies.end(), path) != it->dependencies.end())
        {
            eraseLocked(it);
            ++removed;
        }
        it = next;
    }
    invalidations_ += removed;
    return removed;
}

std::size_t ResponseCache::invalidateProject(const llvm::StringRef projectRoot)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        const auto next = std::next(it);
        if (it->key.projectRoot == projectRoot)
        {
            eraseLocked(it);
            ++removed;
        }
        it = next;
    }
    invalidations_ += removed;
    return removed;
}

std::size_t ResponseCache::purgeExpired()
{
    const auto                  current = now();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        const auto next = std::next(it);
        if (it->expiry <= current)
        {
            eraseLocked(it);
            ++removed;
        }
        it = next;
    }
    return removed;
}

void ResponseCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

std::size_t ResponseCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t ResponseCache::capacity() const
{
    return capacity_;
}

CacheStats ResponseCache::stats() const
{
    const auto                  current = now();
    CacheStats                  out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.entries         = entries_.size();
    out.hits            = hits_;
    out.misses          = misses_;
    out.evictions       = evictions_;
    out.invalidations   = invalidations_;
    out.staleRejections = staleRejections_;
    for (const Entry& entry : entries_)
    {
        ++out.entriesByMethod[entry.key.method];
        if (entry.expiry <= current)
        {
            ++out.expiredEntries;
        }
    }
    return out;
}

void ResponseCache::eraseLocked(const EntryList::iterator it)
{
    index_.erase(it->indexKey);
    entries_.erase(it);
}

}  // namespace lspbroker::lsp
