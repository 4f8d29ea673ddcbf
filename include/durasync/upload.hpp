#ifndef DURASYNC_UPLOAD_HPP
#define DURASYNC_UPLOAD_HPP

/**
 * @file upload.hpp
 * @brief Resumable chunked uploads with pause / resume / abort.
 *
 * Lifecycle of one session:
 *
 *   pending -> uploading -> completed | failed | aborted
 *   uploading <-> paused
 *   pending | paused -> aborted
 *
 * Every state change goes through `is_valid_transition()`. Success and error
 * callbacks are only emitted by a successful transition into a terminal state,
 * which makes them fire at most once per session.
 *
 * Chunk transfers are retried on transport errors following
 * `Config::chunkRetryDelays`. An offset conflict re-runs resume-discovery
 * instead of failing. Capacity and protocol errors fail the session at once.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <durasync/config.hpp>
#include <durasync/errors.hpp>
#include <durasync/Metrics.hpp>
#include <durasync/transport.hpp>

namespace durasync
{
    namespace net = boost::asio;

    enum class UploadState
    {
        Pending,
        Uploading,
        Paused,
        Completed,
        Failed,
        Aborted
    };

    const char *to_string(UploadState s) noexcept;

    [[nodiscard]] bool is_terminal(UploadState s) noexcept;
    [[nodiscard]] bool is_valid_transition(UploadState from, UploadState to) noexcept;

    struct UploadCallbacks
    {
        std::function<void(double percent, std::uint64_t uploaded, std::uint64_t total)> on_progress;
        std::function<void(const std::string &sessionId, const std::string &location)> on_success;
        std::function<void(const SyncError &)> on_error;
    };

    class UploadManager;

    class UploadSession : public std::enable_shared_from_this<UploadSession>
    {
    public:
        ~UploadSession();

        UploadSession(const UploadSession &) = delete;
        UploadSession &operator=(const UploadSession &) = delete;

        /// Stop after the in-flight chunk; its result is discarded.
        bool pause();

        /// Re-run resume-discovery and continue from the endpoint's offset.
        bool resume();

        /// Terminal. No callback fires once this returns.
        bool abort();

        std::string session_id() const;
        UploadState state() const noexcept { return state_.load(std::memory_order_acquire); }
        std::uint64_t bytes_uploaded() const noexcept { return bytesUploaded_.load(std::memory_order_acquire); }
        std::uint64_t total_bytes() const noexcept { return signature_.totalBytes; }
        const UploadSignature &signature() const noexcept { return signature_; }

    private:
        friend class UploadManager;

        UploadSession(net::any_io_executor ex,
                      std::shared_ptr<ITransport> transport,
                      const Config &cfg,
                      SyncMetrics *metrics,
                      std::filesystem::path file,
                      UploadSignature signature,
                      std::size_t chunkSize,
                      UploadMetadata metadata,
                      UploadCallbacks callbacks);

        void begin();
        void discover(std::uint64_t epoch);
        void send_chunk(std::uint64_t epoch);
        void retry_or_fail(std::uint64_t epoch, const boost::system::error_code &ec,
                           bool rediscover);
        void complete();
        void fail(const boost::system::error_code &ec, const char *stage);
        void terminate_remote(const std::string &sessionId);

        bool transition(UploadState to);
        bool current(std::uint64_t epoch) const;
        void on_terminal(UploadState s);

    private:
        net::strand<net::any_io_executor> strand_;
        net::steady_timer timer_;
        std::shared_ptr<ITransport> transport_;
        std::vector<std::chrono::milliseconds> retryDelays_;
        SyncMetrics *metrics_;

        const std::filesystem::path file_;
        std::ifstream in_;
        const UploadSignature signature_;
        const std::size_t chunkSize_;
        const UploadMetadata metadata_;
        UploadCallbacks callbacks_;

        mutable std::recursive_mutex gateMutex_;
        std::atomic<UploadState> state_{UploadState::Pending};
        std::atomic<std::uint64_t> epoch_{1};
        std::atomic<std::uint64_t> bytesUploaded_{0};
        std::string sessionId_;
        std::string location_;

        // strand-confined
        std::size_t attempt_{0};
    };

    class UploadManager : public std::enable_shared_from_this<UploadManager>
    {
    public:
        static std::shared_ptr<UploadManager> create(net::any_io_executor ex,
                                                     std::shared_ptr<ITransport> transport,
                                                     Config cfg,
                                                     SyncMetrics *metrics = nullptr)
        {
            return std::shared_ptr<UploadManager>(
                new UploadManager(std::move(ex), std::move(transport), std::move(cfg), metrics));
        }

        /**
         * @brief Upload `file`, resuming a previous session for the same file.
         *
         * @param chunkSize 0 selects `Config::chunkSize`
         * @param mimeType  part of the session signature; empty = application/octet-stream
         * @throws std::invalid_argument if the file cannot be opened
         */
        std::shared_ptr<UploadSession> start(const std::filesystem::path &file,
                                             std::size_t chunkSize,
                                             UploadMetadata metadata,
                                             UploadCallbacks callbacks,
                                             std::string mimeType = {});

        /// Sessions started by this manager that are still alive and not terminal.
        std::size_t active_count() const;

        void abort_all();

    private:
        UploadManager(net::any_io_executor ex,
                      std::shared_ptr<ITransport> transport,
                      Config cfg,
                      SyncMetrics *metrics);

        std::vector<std::shared_ptr<UploadSession>> live_unlocked() const;

    private:
        net::any_io_executor ex_;
        std::shared_ptr<ITransport> transport_;
        Config cfg_;
        SyncMetrics *metrics_;

        mutable std::mutex mutex_;
        mutable std::vector<std::weak_ptr<UploadSession>> sessions_;
    };

} // namespace durasync

#endif // DURASYNC_UPLOAD_HPP
