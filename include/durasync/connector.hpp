#ifndef DURASYNC_CONNECTOR_HPP
#define DURASYNC_CONNECTOR_HPP

/**
 * @file connector.hpp
 * @brief Stream connector: keeps a cursor in sync with the remote event log.
 *
 * The connector owns the subscription lifecycle:
 *   - opens a push subscription (or a long-poll loop) at the cursor offset
 *   - drops events whose offset was already passed
 *   - detects gaps and bridges them with paged range reads
 *   - reconnects with exponential backoff until the attempt cap is reached
 *
 * State machine:
 *
 *   Disconnected --connect--> Connecting --ack--> Connected
 *   Connected --gap--> Resyncing --range read done--> Connected
 *   any --disconnect | attempts exhausted--> Disconnected
 *
 * All work runs on a strand; `connect()` and `disconnect()` can be called from
 * any thread. After `disconnect()` returns no consumer sees another event,
 * offset or error of that connection.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <durasync/config.hpp>
#include <durasync/cursor.hpp>
#include <durasync/dispatcher.hpp>
#include <durasync/errors.hpp>
#include <durasync/Metrics.hpp>
#include <durasync/transport.hpp>

namespace durasync
{
    enum class ConnectionState
    {
        Disconnected,
        Connecting,
        Connected,
        Resyncing
    };

    const char *to_string(ConnectionState s) noexcept;

    /// Delay before reconnect number `failures` (1-based).
    std::chrono::milliseconds backoff_delay(const Config &cfg, int failures) noexcept;

    class StreamConnector : public std::enable_shared_from_this<StreamConnector>
    {
    public:
        using StateHandler = std::function<void(ConnectionState)>;

        /// @param metrics optional, may be null
        static std::shared_ptr<StreamConnector> create(net::any_io_executor ex,
                                                       std::shared_ptr<ITransport> transport,
                                                       std::shared_ptr<EventDispatcher> dispatcher,
                                                       Config cfg,
                                                       SyncMetrics *metrics = nullptr)
        {
            return std::shared_ptr<StreamConnector>(
                new StreamConnector(std::move(ex), std::move(transport),
                                    std::move(dispatcher), std::move(cfg), metrics));
        }

        ~StreamConnector();

        StreamConnector(const StreamConnector &) = delete;
        StreamConnector &operator=(const StreamConnector &) = delete;

        /// Called on the connector strand for every state transition.
        void on_state_change(StateHandler cb) { onStateChange_ = std::move(cb); }

        /**
         * @brief Open the stream of `owner` (optionally narrowed to `peer`).
         *
         * Without `startOffset` the connector resumes from its cursor when the
         * scope is unchanged, otherwise it starts a fresh stream whose cursor is
         * seeded from the endpoint's first ack. Never throws; failures are
         * retried and reported through the dispatcher's error channel.
         */
        void connect(std::string owner,
                     std::string peer = {},
                     std::optional<std::uint64_t> startOffset = std::nullopt);

        /// Idempotent. Nothing is dispatched for this connection once it returns.
        void disconnect();

        ConnectionState state() const noexcept { return state_.load(std::memory_order_acquire); }

        std::uint64_t last_offset() const;
        std::string scope() const;

        /// True while the long-poll data plane is in use.
        bool polling() const noexcept { return polling_.load(std::memory_order_acquire); }

        int consecutive_failures() const noexcept { return failuresSeen_.load(std::memory_order_acquire); }

    private:
        StreamConnector(net::any_io_executor ex,
                        std::shared_ptr<ITransport> transport,
                        std::shared_ptr<EventDispatcher> dispatcher,
                        Config cfg,
                        SyncMetrics *metrics);

        struct PushPlane
        {
            std::shared_ptr<Subscription> subscription;
        };

        struct PollPlane
        {
            bool inFlight = false;
        };

        using DataPlane = std::variant<std::monostate, PushPlane, PollPlane>;

        // lifecycle (strand only)
        void do_connect(std::uint64_t session,
                        std::uint64_t epoch,
                        StreamScope scope,
                        std::optional<std::uint64_t> startOffset);
        void start_attempt();
        void start_push();
        void start_poll();
        void do_poll();
        void teardown();
        void cancel_plane();
        void set_state(ConnectionState s);

        // plane callbacks (strand only)
        void handle_ack(std::uint64_t head);
        void handle_event(StreamEvent ev);
        void handle_gap();
        void handle_plane_error(const boost::system::error_code &ec, const char *stage);
        void handle_failure(const boost::system::error_code &ec, const char *stage);
        void fail_terminal(const char *stage);

        // resync (strand only)
        void start_resync();
        void read_page(std::uint64_t start);
        void finish_resync();

        void accept(const StreamEvent &ev);
        void surface(const boost::system::error_code &ec, const char *stage);

        /// Wrap a completion so it runs on the strand and only for the current attempt.
        template <typename F>
        auto guarded(F fn);

    private:
        net::strand<net::any_io_executor> strand_;
        net::steady_timer timer_;

        std::shared_ptr<ITransport> transport_;
        std::shared_ptr<EventDispatcher> dispatcher_;
        Config cfg_;
        SyncMetrics *metrics_;

        StateHandler onStateChange_;

        std::atomic<std::uint64_t> session_{0};
        std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
        std::atomic<bool> polling_{false};
        std::atomic<int> failuresSeen_{0};

        // strand-confined
        std::uint64_t attempt_{0};
        std::uint64_t epoch_{0};
        StreamScope scope_;
        DataPlane plane_;
        bool usePoll_{false};
        bool fresh_{false};
        bool resyncOwed_{false};
        bool gapDuringResync_{false};
        bool pollAfterResync_{false};
        int failures_{0};
        int resyncRounds_{0};
        std::deque<StreamEvent> buffered_;

        mutable std::mutex cursorMutex_;
        std::shared_ptr<Cursor> cursor_;
    };

} // namespace durasync

#endif // DURASYNC_CONNECTOR_HPP
