#ifndef DURASYNC_METRICS_HPP
#define DURASYNC_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Prometheus-style counters for the sync connector and uploads.
 *
 * Metrics are opt-in: the connector and the upload manager take an optional
 * `SyncMetrics*` and skip accounting when it is null.
 *
 * Typical usage
 * -------------
 * @code{.cpp}
 * durasync::SyncMetrics metrics;
 * auto connector = durasync::StreamConnector::create(ex, transport, dispatcher, cfg, &metrics);
 * // ...
 * std::cout << metrics.render_prometheus();
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <string>

namespace durasync
{
    /**
     * @struct SyncMetrics
     * @brief Aggregated counters, safe to update from any thread.
     */
    struct SyncMetrics
    {
        // connector
        std::atomic<std::uint64_t> connects_total{0};
        std::atomic<std::uint64_t> reconnects_total{0};
        std::atomic<std::uint64_t> transport_errors_total{0};
        std::atomic<std::uint64_t> protocol_errors_total{0};
        std::atomic<std::uint64_t> gaps_total{0};
        std::atomic<std::uint64_t> resyncs_total{0};
        std::atomic<std::uint64_t> events_received_total{0};
        std::atomic<std::uint64_t> events_dispatched_total{0};
        std::atomic<std::uint64_t> duplicates_dropped_total{0};
        std::atomic<std::uint64_t> polls_total{0};
        std::atomic<std::uint64_t> connected{0};

        // uploads
        std::atomic<std::uint64_t> uploads_started_total{0};
        std::atomic<std::uint64_t> uploads_completed_total{0};
        std::atomic<std::uint64_t> uploads_failed_total{0};
        std::atomic<std::uint64_t> uploads_active{0};
        std::atomic<std::uint64_t> upload_bytes_total{0};
        std::atomic<std::uint64_t> chunk_retries_total{0};

        /// Text exposition format v0.0.4.
        [[nodiscard]] std::string render_prometheus() const;
    };

} // namespace durasync

#endif // DURASYNC_METRICS_HPP
