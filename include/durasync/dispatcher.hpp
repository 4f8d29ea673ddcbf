#ifndef DURASYNC_DISPATCHER_HPP
#define DURASYNC_DISPATCHER_HPP

/**
 * @file dispatcher.hpp
 * @brief Ordered fan-out of stream events to registered consumers.
 *
 * Three channels: events, connection offsets and errors. Deliveries run on
 * the dispatcher's own strand in the order they were submitted, so a slow
 * consumer never blocks the connector.
 *
 * Handlers may be added or removed at any time, including from inside a
 * handler. A removed handler is never called again, even by a delivery that
 * is already running. Within one delivery handlers run in registration order.
 *
 * Every submission carries the epoch it was produced in. `invalidate()` bumps
 * the epoch and waits for a running delivery to finish, so once it returns no
 * delivery of an older epoch will reach a consumer.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <durasync/errors.hpp>
#include <durasync/protocol.hpp>

namespace durasync
{
    namespace net = boost::asio;

    class EventDispatcher : public std::enable_shared_from_this<EventDispatcher>
    {
    public:
        using HandlerId = std::uint64_t;
        using EventHandler = std::function<void(const StreamEvent &)>;
        using OffsetHandler = std::function<void(std::uint64_t)>;
        using ErrorHandler = std::function<void(const SyncError &)>;

        static std::shared_ptr<EventDispatcher> create(net::any_io_executor ex)
        {
            return std::shared_ptr<EventDispatcher>(new EventDispatcher(std::move(ex)));
        }

        HandlerId on_event(EventHandler cb);
        HandlerId on_connection_offset(OffsetHandler cb);
        HandlerId on_error(ErrorHandler cb);

        /// Unregister a handler of any channel; false if the id is unknown.
        bool remove(HandlerId id);

        std::size_t handler_count() const;

        std::uint64_t epoch() const noexcept { return epoch_.load(std::memory_order_acquire); }

        /// Start a new delivery epoch and return it. Never waits for a running delivery.
        std::uint64_t begin_epoch();

        /// Discard every queued delivery; blocks while one is running.
        void invalidate();

        void dispatch_event(std::uint64_t epoch, StreamEvent ev);
        void dispatch_offset(std::uint64_t epoch, std::uint64_t offset);
        void dispatch_error(std::uint64_t epoch, SyncError err);

    private:
        explicit EventDispatcher(net::any_io_executor ex);

        template <typename F>
        struct Entry
        {
            HandlerId id;
            std::shared_ptr<std::atomic<bool>> active;
            F fn;
        };

        template <typename F>
        using List = std::shared_ptr<const std::vector<Entry<F>>>;

        template <typename F>
        HandlerId add(List<F> &list, F cb);

        template <typename F>
        bool erase(List<F> &list, HandlerId id);

        template <typename F, typename... Args>
        void deliver(std::uint64_t epoch, const List<F> &snapshot, const Args &...args);

    private:
        net::strand<net::any_io_executor> strand_;

        mutable std::mutex registryMutex_;
        List<EventHandler> eventHandlers_;
        List<OffsetHandler> offsetHandlers_;
        List<ErrorHandler> errorHandlers_;
        HandlerId nextId_{1};

        std::recursive_mutex gateMutex_;
        std::atomic<std::uint64_t> epoch_{1};
    };

} // namespace durasync

#endif // DURASYNC_DISPATCHER_HPP
