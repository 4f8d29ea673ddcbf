#include <durasync/connector.hpp>

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace durasync
{
    using Logger = vix::utils::Logger;

    const char *to_string(ConnectionState s) noexcept
    {
        switch (s)
        {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Resyncing:
            return "resyncing";
        }
        return "unknown";
    }

    std::chrono::milliseconds backoff_delay(const Config &cfg, int failures) noexcept
    {
        const int exponent = std::clamp(failures - 1, 0, 30);
        const auto base = cfg.reconnectBaseDelay.count();
        const auto cap = cfg.reconnectMaxDelay.count();

        long long delay = base;
        for (int i = 0; i < exponent; ++i)
        {
            if (cap > 0 && delay >= cap)
                break;
            delay *= 2;
        }

        if (cap > 0)
            delay = std::min<long long>(delay, cap);
        return std::chrono::milliseconds{delay};
    }

    StreamConnector::StreamConnector(net::any_io_executor ex,
                                     std::shared_ptr<ITransport> transport,
                                     std::shared_ptr<EventDispatcher> dispatcher,
                                     Config cfg,
                                     SyncMetrics *metrics)
        : strand_(net::make_strand(std::move(ex))),
          timer_(strand_),
          transport_(std::move(transport)),
          dispatcher_(std::move(dispatcher)),
          cfg_(std::move(cfg)),
          metrics_(metrics)
    {
        if (!transport_ || !dispatcher_)
            throw std::invalid_argument("StreamConnector requires a transport and a dispatcher");
    }

    StreamConnector::~StreamConnector()
    {
        if (auto *sub = std::get_if<PushPlane>(&plane_); sub && sub->subscription)
            sub->subscription->cancel();
    }

    template <typename F>
    auto StreamConnector::guarded(F fn)
    {
        std::weak_ptr<StreamConnector> weak = shared_from_this();
        const auto session = session_.load(std::memory_order_acquire);
        const auto attempt = attempt_;

        return [weak, session, attempt, fn = std::move(fn)](auto &&...args)
        {
            auto self = weak.lock();
            if (!self)
                return;

            net::post(self->strand_,
                      [self, session, attempt, fn,
                       tup = std::make_tuple(std::decay_t<decltype(args)>(
                           std::forward<decltype(args)>(args))...)]() mutable
                      {
                          if (self->session_.load(std::memory_order_acquire) != session ||
                              self->attempt_ != attempt)
                              return; // stale completion
                          std::apply(fn, std::move(tup));
                      });
        };
    }

    // ───────────────────────── public API ─────────────────────────

    void StreamConnector::connect(std::string owner,
                                  std::string peer,
                                  std::optional<std::uint64_t> startOffset)
    {
        const auto session = session_.fetch_add(1, std::memory_order_acq_rel) + 1;
        const auto epoch = dispatcher_->begin_epoch();

        StreamScope scope{std::move(owner), std::move(peer)};

        auto self = shared_from_this();
        net::post(strand_,
                  [self, session, epoch, scope = std::move(scope), startOffset]() mutable
                  {
                      self->do_connect(session, epoch, std::move(scope), startOffset);
                  });
    }

    void StreamConnector::disconnect()
    {
        session_.fetch_add(1, std::memory_order_acq_rel);
        dispatcher_->invalidate();

        auto self = shared_from_this();
        net::post(strand_, [self]()
                  { self->teardown(); });
    }

    std::uint64_t StreamConnector::last_offset() const
    {
        std::lock_guard<std::mutex> lock(cursorMutex_);
        return cursor_ ? cursor_->last() : 0;
    }

    std::string StreamConnector::scope() const
    {
        std::lock_guard<std::mutex> lock(cursorMutex_);
        return cursor_ ? cursor_->scope() : std::string{};
    }

    // ───────────────────────── lifecycle ─────────────────────────

    void StreamConnector::do_connect(std::uint64_t session,
                                     std::uint64_t epoch,
                                     StreamScope scope,
                                     std::optional<std::uint64_t> startOffset)
    {
        if (session_.load(std::memory_order_acquire) != session)
            return; // superseded by a later connect() / disconnect()

        teardown();

        epoch_ = epoch;
        scope_ = std::move(scope);

        const std::string key = scope_.key();
        {
            std::lock_guard<std::mutex> lock(cursorMutex_);
            if (startOffset)
            {
                cursor_ = std::make_shared<Cursor>(key, *startOffset);
                fresh_ = false;
            }
            else if (cursor_ && cursor_->scope() == key)
            {
                fresh_ = !cursor_->advanced() && cursor_->last() == 0;
            }
            else
            {
                cursor_ = std::make_shared<Cursor>(key, 0);
                fresh_ = true;
            }
        }

        const auto caps = transport_->capabilities();
        usePoll_ = !caps.push || (cfg_.preferLongPoll && caps.poll);
        if (usePoll_ && !caps.poll)
            usePoll_ = false;

        failures_ = 0;
        failuresSeen_.store(0, std::memory_order_release);
        resyncRounds_ = 0;
        resyncOwed_ = false;
        gapDuringResync_ = false;
        pollAfterResync_ = false;
        buffered_.clear();

        Logger::getInstance().log(Logger::Level::INFO,
                                  "[durasync][Connector] connect scope={} offset={} plane={}",
                                  key, cursor_->last(), usePoll_ ? "poll" : "push");

        start_attempt();
    }

    void StreamConnector::start_attempt()
    {
        cancel_plane();
        set_state(ConnectionState::Connecting);

        if (usePoll_)
            start_poll();
        else
            start_push();
    }

    void StreamConnector::start_push()
    {
        polling_.store(false, std::memory_order_release);

        StreamHandlers handlers;
        handlers.on_ack = guarded([this](std::uint64_t head)
                                  { handle_ack(head); });
        handlers.on_event = guarded([this](StreamEvent ev)
                                    { handle_event(std::move(ev)); });
        handlers.on_gap = guarded([this]()
                                  { handle_gap(); });
        handlers.on_error = guarded([this](boost::system::error_code ec)
                                    { handle_plane_error(ec, "connector.subscribe"); });

        plane_ = PushPlane{transport_->subscribe(cursor_->last(), scope_, std::move(handlers))};
    }

    void StreamConnector::start_poll()
    {
        polling_.store(true, std::memory_order_release);
        plane_ = PollPlane{};
        do_poll();
    }

    void StreamConnector::do_poll()
    {
        auto *plane = std::get_if<PollPlane>(&plane_);
        if (!plane || plane->inFlight)
            return;

        plane->inFlight = true;
        if (metrics_)
            metrics_->polls_total++;

        transport_->poll(
            scope_,
            cursor_->last(),
            cfg_.pollTimeout,
            guarded([this](boost::system::error_code ec, PollResult result)
                    {
                        if (auto *p = std::get_if<PollPlane>(&plane_))
                            p->inFlight = false;

                        if (ec)
                        {
                            if (classify(ec) == ErrorClass::Protocol)
                                surface(ec, "connector.poll");
                            // a poll can't skip a bad response, so back off either way
                            handle_failure(ec, "connector.poll");
                            return;
                        }

                        if (state() == ConnectionState::Connecting)
                        {
                            // a poll answers with history, there is no head to seed from
                            fresh_ = false;
                            handle_ack(result.nextOffset);
                        }

                        for (auto &ev : result.events)
                            handle_event(std::move(ev));

                        if (state() == ConnectionState::Resyncing)
                        {
                            pollAfterResync_ = true;
                            return;
                        }
                        do_poll();
                    }));
    }

    void StreamConnector::teardown()
    {
        cancel_plane();
        timer_.cancel();
        buffered_.clear();
        set_state(ConnectionState::Disconnected);
    }

    void StreamConnector::cancel_plane()
    {
        ++attempt_; // drops completions of the previous plane
        if (auto *push = std::get_if<PushPlane>(&plane_); push && push->subscription)
            push->subscription->cancel();
        plane_ = std::monostate{};
    }

    void StreamConnector::set_state(ConnectionState s)
    {
        const auto prev = state_.exchange(s, std::memory_order_acq_rel);
        if (prev == s)
            return;

        if (metrics_)
        {
            const bool wasUp = prev == ConnectionState::Connected || prev == ConnectionState::Resyncing;
            const bool isUp = s == ConnectionState::Connected || s == ConnectionState::Resyncing;
            if (!wasUp && isUp)
                metrics_->connected++;
            else if (wasUp && !isUp && metrics_->connected.load() > 0)
                metrics_->connected--;
        }

        Logger::getInstance().log(Logger::Level::DEBUG,
                                  "[durasync][Connector] {} -> {}", to_string(prev), to_string(s));

        if (onStateChange_)
            onStateChange_(s);
    }

    // ───────────────────────── plane callbacks ─────────────────────────

    void StreamConnector::handle_ack(std::uint64_t head)
    {
        if (state() != ConnectionState::Connecting)
            return;

        if (fresh_)
        {
            cursor_->reset(std::max(head, cursor_->last()));
            fresh_ = false;
        }

        failures_ = 0;
        failuresSeen_.store(0, std::memory_order_release);
        if (metrics_)
            metrics_->connects_total++;

        set_state(ConnectionState::Connected);
        dispatcher_->dispatch_offset(epoch_, head);

        if (resyncOwed_)
        {
            resyncOwed_ = false;
            start_resync();
        }
    }

    void StreamConnector::handle_event(StreamEvent ev)
    {
        if (metrics_)
            metrics_->events_received_total++;

        if (state() == ConnectionState::Resyncing)
        {
            buffered_.push_back(std::move(ev));
            return;
        }

        const auto last = cursor_->last();
        if (cfg_.denseOffsets && ev.offset > last + 1)
        {
            Logger::getInstance().log(Logger::Level::DEBUG,
                                      "[durasync][Connector] offset jump {} -> {}", last, ev.offset);
            if (metrics_)
                metrics_->gaps_total++;

            buffered_.push_back(std::move(ev));
            if (state() == ConnectionState::Connecting)
                resyncOwed_ = true;
            else
                start_resync();
            return;
        }

        accept(ev);
    }

    void StreamConnector::handle_gap()
    {
        if (metrics_)
            metrics_->gaps_total++;

        Logger::getInstance().log(Logger::Level::INFO,
                                  "[durasync][Connector] gap signalled at offset {}", cursor_->last());

        switch (state())
        {
        case ConnectionState::Connecting:
            resyncOwed_ = true;
            break;
        case ConnectionState::Connected:
            start_resync();
            break;
        case ConnectionState::Resyncing:
            gapDuringResync_ = true;
            break;
        case ConnectionState::Disconnected:
            break;
        }
    }

    void StreamConnector::handle_plane_error(const boost::system::error_code &ec, const char *stage)
    {
        if (ec == make_error_code(sync_errc::push_unavailable))
        {
            Logger::getInstance().log(Logger::Level::INFO,
                                      "[durasync][Connector] push unavailable, switching to long-poll");
            if (!transport_->capabilities().poll)
            {
                handle_failure(ec, stage);
                return;
            }
            usePoll_ = true;
            start_attempt();
            return;
        }

        if (classify(ec) == ErrorClass::Protocol)
        {
            // frame skipped, stream stays open
            surface(ec, stage);
            return;
        }

        handle_failure(ec, stage);
    }

    void StreamConnector::handle_failure(const boost::system::error_code &ec, const char *stage)
    {
        if (state() == ConnectionState::Disconnected)
            return;

        if (metrics_)
            metrics_->transport_errors_total++;

        if (state() == ConnectionState::Resyncing)
            resyncOwed_ = true;

        cancel_plane();

        ++failures_;
        failuresSeen_.store(failures_, std::memory_order_release);

        Logger::getInstance().log(Logger::Level::WARN,
                                  "[durasync][Connector] {} failed ({}), failure {}/{}",
                                  stage, ec.message(), failures_, cfg_.maxReconnectAttempts);

        if (failures_ >= cfg_.maxReconnectAttempts)
        {
            fail_terminal(stage);
            return;
        }

        set_state(ConnectionState::Connecting);

        const auto delay = backoff_delay(cfg_, failures_);
        if (metrics_)
            metrics_->reconnects_total++;

        const auto session = session_.load(std::memory_order_acquire);
        auto self = shared_from_this();
        timer_.expires_after(delay);
        timer_.async_wait(
            [self, session](const boost::system::error_code &tec)
            {
                if (tec == net::error::operation_aborted)
                    return;
                if (self->session_.load(std::memory_order_acquire) != session ||
                    self->state() != ConnectionState::Connecting)
                    return;
                self->start_attempt();
            });
    }

    void StreamConnector::fail_terminal(const char *stage)
    {
        Logger::getInstance().log(Logger::Level::ERROR,
                                  "[durasync][Connector] giving up after {} attempts ({})",
                                  cfg_.maxReconnectAttempts, stage);

        cancel_plane();
        timer_.cancel();
        buffered_.clear();
        set_state(ConnectionState::Disconnected);

        dispatcher_->dispatch_error(epoch_,
                                    SyncError{make_error_code(sync_errc::reconnect_exhausted), stage});
    }

    // ───────────────────────── resync ─────────────────────────

    void StreamConnector::start_resync()
    {
        ++resyncRounds_;
        if (resyncRounds_ > cfg_.maxReconnectAttempts)
        {
            fail_terminal("connector.resync");
            return;
        }

        if (metrics_)
            metrics_->resyncs_total++;

        gapDuringResync_ = false;
        set_state(ConnectionState::Resyncing);
        read_page(cursor_->last() + 1);
    }

    void StreamConnector::read_page(std::uint64_t start)
    {
        transport_->range_read(
            scope_,
            start,
            std::nullopt,
            cfg_.rangeReadLimit,
            guarded([this, start](boost::system::error_code ec, RangeReadResult result)
                    {
                        if (state() != ConnectionState::Resyncing)
                            return;

                        if (ec)
                        {
                            if (classify(ec) == ErrorClass::Protocol)
                                surface(ec, "connector.range_read");
                            handle_failure(ec, "connector.range_read");
                            return;
                        }

                        std::sort(result.events.begin(), result.events.end(),
                                  [](const StreamEvent &a, const StreamEvent &b)
                                  { return a.offset < b.offset; });

                        for (const auto &ev : result.events)
                        {
                            if (metrics_)
                                metrics_->events_received_total++;
                            accept(ev);
                        }

                        // events outside the scope still move the cursor past the range
                        if (result.endOffset >= start)
                            cursor_->advance(result.endOffset);
                        if (!result.versionTag.empty())
                            cursor_->set_version_tag(result.versionTag);

                        if (result.hasMore && result.endOffset >= start)
                        {
                            read_page(result.endOffset + 1);
                            return;
                        }
                        finish_resync();
                    }));
    }

    void StreamConnector::finish_resync()
    {
        std::stable_sort(buffered_.begin(), buffered_.end(),
                         [](const StreamEvent &a, const StreamEvent &b)
                         { return a.offset < b.offset; });

        while (!buffered_.empty())
        {
            const auto &ev = buffered_.front();
            if (cfg_.denseOffsets && ev.offset > cursor_->last() + 1)
            {
                gapDuringResync_ = true;
                break;
            }
            accept(ev);
            buffered_.pop_front();
        }

        if (gapDuringResync_)
        {
            Logger::getInstance().log(Logger::Level::INFO,
                                      "[durasync][Connector] gap during resync, round {}", resyncRounds_);
            start_resync();
            return;
        }

        resyncRounds_ = 0;
        set_state(ConnectionState::Connected);

        if (pollAfterResync_)
        {
            pollAfterResync_ = false;
            do_poll();
        }
    }

    // ───────────────────────── delivery ─────────────────────────

    void StreamConnector::accept(const StreamEvent &ev)
    {
        if (!cursor_->advance(ev.offset))
        {
            if (metrics_)
                metrics_->duplicates_dropped_total++;
            return;
        }

        if (metrics_)
            metrics_->events_dispatched_total++;
        dispatcher_->dispatch_event(epoch_, ev);
    }

    void StreamConnector::surface(const boost::system::error_code &ec, const char *stage)
    {
        if (metrics_)
            metrics_->protocol_errors_total++;

        Logger::getInstance().log(Logger::Level::WARN,
                                  "[durasync][Connector] {}: {}", stage, ec.message());
        dispatcher_->dispatch_error(epoch_, SyncError{ec, stage});
    }

} // namespace durasync
