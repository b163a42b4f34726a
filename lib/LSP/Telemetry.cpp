//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/Telemetry.h"

#include <utility>

namespace lspbroker::lsp
{
namespace
{

std::uint64_t lookupCount(const std::unordered_map<std::string, std::uint64_t>& counts, const std::string_view key)
{
    const auto it = counts.find(std::string(key));
    return it == counts.end() ? 0U : it->second;
}

}  // namespace

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(std::string method, const std::uint64_t latencyMicros, const bool timedOut, const bool failed)
{
    RequestMetricSink sink;
    RequestMetric     metric{method, latencyMicros, timedOut, failed};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[method];
        ++totalRequests_;
        if (failed)
        {
            ++failureCounts_[std::move(method)];
        }
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

void Telemetry::recordCacheHit(const std::string_view method)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++cacheHits_[std::string(method)];
}

std::uint64_t Telemetry::requestCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupCount(requestCounts_, method);
}

std::uint64_t Telemetry::totalRequestCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return totalRequests_;
}

std::uint64_t Telemetry::cacheHitCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupCount(cacheHits_, method);
}

std::uint64_t Telemetry::failureCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupCount(failureCounts_, method);
}

}  // namespace lspbroker::lsp
