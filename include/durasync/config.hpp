#ifndef DURASYNC_CONFIG_HPP
#define DURASYNC_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Sync and upload configuration for durasync.
 *
 * @details
 * Wraps the core `vix::config::Config` into a strongly-typed structure used
 * by the stream connector, the upload manager and the HTTP transport. Keeps
 * all retry/backoff/timeout knobs in one place instead of scattering literals
 * across the codebase.
 */

#include <cstddef>
#include <chrono>
#include <vector>

#include <vix/config/Config.hpp>

namespace durasync
{
    /**
     * @struct Config
     * @brief Tunables controlling reconnection, resync and upload behaviour.
     */
    struct Config
    {
        /// Consecutive transport failures tolerated before a terminal error.
        int maxReconnectAttempts = 10;

        /// Delay before the first reconnect; doubles per consecutive failure.
        std::chrono::milliseconds reconnectBaseDelay{1000};

        /// Upper bound for a single reconnect delay (0 = unbounded).
        std::chrono::milliseconds reconnectMaxDelay{60000};

        /// Page size of range reads issued during resync.
        std::size_t rangeReadLimit = 50;

        /// Bounded wait of one long-poll request.
        std::chrono::seconds pollTimeout{30};

        /// Push stream is considered dead after this much silence (0 = disabled).
        std::chrono::seconds idleTimeout{75};

        /// Offsets of one scope are contiguous: a jump is treated as a gap.
        bool denseOffsets = false;

        /// Use the poll data plane even when push is available.
        bool preferLongPoll = false;

        /// Default upload chunk size in bytes.
        std::size_t chunkSize = 5 * 1024 * 1024; // 5 MiB

        /// Wait before each retry of one chunk transfer; one retry per entry, empty = no retries.
        std::vector<std::chrono::milliseconds> chunkRetryDelays{
            std::chrono::milliseconds{0},
            std::chrono::milliseconds{1000},
            std::chrono::milliseconds{3000},
            std::chrono::milliseconds{5000},
            std::chrono::milliseconds{10000},
        };

        /// Timeout of one non-streaming HTTP request.
        std::chrono::seconds requestTimeout{30};

        /**
         * @brief Build a Config from the core Vix config.
         *
         * Expected keys (optional):
         *  - sync.max_reconnect_attempts     (int)
         *  - sync.reconnect_base_delay_ms    (int, milliseconds)
         *  - sync.reconnect_max_delay_ms     (int, milliseconds, 0 = unbounded)
         *  - sync.range_read_limit           (int)
         *  - sync.poll_timeout               (int, seconds)
         *  - sync.idle_timeout               (int, seconds, 0 = disabled)
         *  - sync.dense_offsets              (bool)
         *  - sync.prefer_long_poll           (bool)
         *  - upload.chunk_size               (int, bytes)
         *  - upload.max_chunk_retries        (int, truncates the retry schedule)
         *  - transport.request_timeout       (int, seconds)
         */
        static Config from_core(const vix::config::Config &core);
    };

} // namespace durasync

#endif // DURASYNC_CONFIG_HPP
