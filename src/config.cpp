#include <durasync/config.hpp>

#include <algorithm>

namespace durasync
{
    Config Config::from_core(const vix::config::Config &core)
    {
        Config cfg;

        if (core.has("sync.max_reconnect_attempts"))
        {
            auto v = core.getInt("sync.max_reconnect_attempts", cfg.maxReconnectAttempts);
            cfg.maxReconnectAttempts = std::max(1, v);
        }

        if (core.has("sync.reconnect_base_delay_ms"))
        {
            auto v = core.getInt("sync.reconnect_base_delay_ms",
                                 static_cast<int>(cfg.reconnectBaseDelay.count()));
            cfg.reconnectBaseDelay = std::chrono::milliseconds(std::max(1, v));
        }

        if (core.has("sync.reconnect_max_delay_ms"))
        {
            auto v = core.getInt("sync.reconnect_max_delay_ms",
                                 static_cast<int>(cfg.reconnectMaxDelay.count()));
            cfg.reconnectMaxDelay = std::chrono::milliseconds(std::max(0, v));
        }

        if (core.has("sync.range_read_limit"))
        {
            auto v = core.getInt("sync.range_read_limit", static_cast<int>(cfg.rangeReadLimit));
            cfg.rangeReadLimit = static_cast<std::size_t>(std::clamp(v, 1, 1000));
        }

        if (core.has("sync.poll_timeout"))
        {
            // the endpoint caps a long-poll at 60s
            auto v = core.getInt("sync.poll_timeout", static_cast<int>(cfg.pollTimeout.count()));
            cfg.pollTimeout = std::chrono::seconds(std::clamp(v, 1, 60));
        }

        if (core.has("sync.idle_timeout"))
        {
            auto v = core.getInt("sync.idle_timeout", static_cast<int>(cfg.idleTimeout.count()));
            if (v <= 0)
                cfg.idleTimeout = std::chrono::seconds{0};
            else
                cfg.idleTimeout = std::chrono::seconds(std::max(5, v)); // min 5s
        }

        if (core.has("sync.dense_offsets"))
        {
            cfg.denseOffsets = core.getBool("sync.dense_offsets", cfg.denseOffsets);
        }

        if (core.has("sync.prefer_long_poll"))
        {
            cfg.preferLongPoll = core.getBool("sync.prefer_long_poll", cfg.preferLongPoll);
        }

        if (core.has("upload.chunk_size"))
        {
            auto v = core.getInt("upload.chunk_size", static_cast<int>(cfg.chunkSize));
            cfg.chunkSize = static_cast<std::size_t>(std::max(64 * 1024, v)); // min 64 KiB
        }

        if (core.has("upload.max_chunk_retries"))
        {
            auto v = core.getInt("upload.max_chunk_retries",
                                 static_cast<int>(cfg.chunkRetryDelays.size()));
            const auto n = static_cast<std::size_t>(std::max(0, v)); // 0 = fail on the first error
            if (n < cfg.chunkRetryDelays.size())
                cfg.chunkRetryDelays.resize(n);
        }

        if (core.has("transport.request_timeout"))
        {
            auto v = core.getInt("transport.request_timeout",
                                 static_cast<int>(cfg.requestTimeout.count()));
            cfg.requestTimeout = std::chrono::seconds(std::max(1, v));
        }

        return cfg;
    }

} // namespace durasync
