#include <durasync/dispatcher.hpp>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace durasync
{
    EventDispatcher::EventDispatcher(net::any_io_executor ex)
        : strand_(net::make_strand(std::move(ex))),
          eventHandlers_(std::make_shared<const std::vector<Entry<EventHandler>>>()),
          offsetHandlers_(std::make_shared<const std::vector<Entry<OffsetHandler>>>()),
          errorHandlers_(std::make_shared<const std::vector<Entry<ErrorHandler>>>())
    {
    }

    template <typename F>
    EventDispatcher::HandlerId EventDispatcher::add(List<F> &list, F cb)
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto next = std::make_shared<std::vector<Entry<F>>>(*list);
        const HandlerId id = nextId_++;
        next->push_back(Entry<F>{id, std::make_shared<std::atomic<bool>>(true), std::move(cb)});
        list = std::move(next);
        return id;
    }

    template <typename F>
    bool EventDispatcher::erase(List<F> &list, HandlerId id)
    {
        auto next = std::make_shared<std::vector<Entry<F>>>();
        next->reserve(list->size());

        bool found = false;
        for (const auto &e : *list)
        {
            if (e.id == id)
            {
                // a snapshot held by a running delivery still sees the entry
                e.active->store(false, std::memory_order_release);
                found = true;
                continue;
            }
            next->push_back(e);
        }

        if (found)
            list = std::move(next);
        return found;
    }

    EventDispatcher::HandlerId EventDispatcher::on_event(EventHandler cb)
    {
        return add(eventHandlers_, std::move(cb));
    }

    EventDispatcher::HandlerId EventDispatcher::on_connection_offset(OffsetHandler cb)
    {
        return add(offsetHandlers_, std::move(cb));
    }

    EventDispatcher::HandlerId EventDispatcher::on_error(ErrorHandler cb)
    {
        return add(errorHandlers_, std::move(cb));
    }

    bool EventDispatcher::remove(HandlerId id)
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        return erase(eventHandlers_, id) ||
               erase(offsetHandlers_, id) ||
               erase(errorHandlers_, id);
    }

    std::size_t EventDispatcher::handler_count() const
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        return eventHandlers_->size() + offsetHandlers_->size() + errorHandlers_->size();
    }

    std::uint64_t EventDispatcher::begin_epoch()
    {
        // no gate: a running delivery of the old epoch stops at its next handler
        return epoch_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    void EventDispatcher::invalidate()
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);
        epoch_.fetch_add(1, std::memory_order_acq_rel);
    }

    template <typename F, typename... Args>
    void EventDispatcher::deliver(std::uint64_t epoch, const List<F> &snapshot, const Args &...args)
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);

        for (const auto &e : *snapshot)
        {
            if (epoch_.load(std::memory_order_acquire) != epoch)
                return;
            if (!e.active->load(std::memory_order_acquire))
                continue;

            try
            {
                e.fn(args...);
            }
            catch (const std::exception &ex)
            {
                vix::utils::Logger::getInstance().log(
                    vix::utils::Logger::Level::ERROR,
                    "[durasync][Dispatcher] handler {} threw: {}", e.id, ex.what());
            }
            catch (...)
            {
                vix::utils::Logger::getInstance().log(
                    vix::utils::Logger::Level::ERROR,
                    "[durasync][Dispatcher] handler {} threw a non-standard exception", e.id);
            }
        }
    }

    void EventDispatcher::dispatch_event(std::uint64_t epoch, StreamEvent ev)
    {
        auto self = shared_from_this();
        net::post(strand_,
                  [self, epoch, ev = std::move(ev)]()
                  {
                      List<EventHandler> snapshot;
                      {
                          std::lock_guard<std::mutex> lock(self->registryMutex_);
                          snapshot = self->eventHandlers_;
                      }
                      self->deliver(epoch, snapshot, ev);
                  });
    }

    void EventDispatcher::dispatch_offset(std::uint64_t epoch, std::uint64_t offset)
    {
        auto self = shared_from_this();
        net::post(strand_,
                  [self, epoch, offset]()
                  {
                      List<OffsetHandler> snapshot;
                      {
                          std::lock_guard<std::mutex> lock(self->registryMutex_);
                          snapshot = self->offsetHandlers_;
                      }
                      self->deliver(epoch, snapshot, offset);
                  });
    }

    void EventDispatcher::dispatch_error(std::uint64_t epoch, SyncError err)
    {
        auto self = shared_from_this();
        net::post(strand_,
                  [self, epoch, err = std::move(err)]()
                  {
                      List<ErrorHandler> snapshot;
                      {
                          std::lock_guard<std::mutex> lock(self->registryMutex_);
                          snapshot = self->errorHandlers_;
                      }
                      self->deliver(epoch, snapshot, err);
                  });
    }

} // namespace durasync
