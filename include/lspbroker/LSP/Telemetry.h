//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry aggregation and sink integration.
///
/// Every request actually sent to a language server is recorded with its
/// latency and outcome; requests answered from the response cache are counted
/// separately.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_TELEMETRY_H
#define LSPBROKER_LSP_TELEMETRY_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lspbroker::lsp
{

/// @brief Immutable telemetry sample for one server round trip.
struct RequestMetric final
{
    /// @brief LSP method name.
    std::string method;

    /// @brief Time from send to resolution in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief Whether the request was abandoned at its deadline.
    bool timedOut{false};

    /// @brief Whether the request resolved with any error.
    bool failed{false};
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one server round trip.
    void record(std::string method, std::uint64_t latencyMicros, bool timedOut, bool failed);

    /// @brief Records one request served from the response cache.
    void recordCacheHit(std::string_view method);

    /// @brief Number of round trips recorded for `method`.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method) const;

    /// @brief Number of round trips recorded for all methods.
    [[nodiscard]] std::uint64_t totalRequestCount() const;

    /// @brief Number of cache hits recorded for `method`.
    [[nodiscard]] std::uint64_t cacheHitCount(std::string_view method) const;

    /// @brief Number of round trips for `method` that failed.
    [[nodiscard]] std::uint64_t failureCount(std::string_view method) const;

private:
    mutable std::mutex                              mutex_;
    RequestMetricSink                               sink_;
    std::unordered_map<std::string, std::uint64_t> requestCounts_;
    std::unordered_map<std::string, std::uint64_t> failureCounts_;
    std::unordered_map<std::string, std::uint64_t> cacheHits_;
    std::uint64_t                                   totalRequests_{0};
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_TELEMETRY_H
