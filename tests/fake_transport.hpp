#ifndef DURASYNC_TESTS_FAKE_TRANSPORT_HPP
#define DURASYNC_TESTS_FAKE_TRANSPORT_HPP

/**
 * @file fake_transport.hpp
 * @brief Scripted in-memory ITransport for the connector and upload tests.
 *
 * Everything runs on the test's io_context. Completions are posted, never
 * invoked inline, so the call order matches a real network transport.
 * Push subscriptions are driven by hand from the test through the recorded
 * FakeSubscription handles.
 */

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <durasync/errors.hpp>
#include <durasync/transport.hpp>

#define CHECK(cond)                                                         \
    do                                                                      \
    {                                                                       \
        if (!(cond))                                                        \
        {                                                                   \
            std::cerr << "check failed: " #cond " at " << __FILE__ << ":"   \
                      << __LINE__ << "\n";                                  \
            return 1;                                                       \
        }                                                                   \
    } while (false)

namespace durasync::test
{
    namespace net = boost::asio;
    using namespace std::chrono_literals;

    /// Run handlers until `pred` holds or `limit` elapses.
    template <typename Pred>
    bool run_until(net::io_context &ioc, Pred pred, std::chrono::milliseconds limit = 2000ms)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred())
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            if (ioc.stopped())
                ioc.restart();
            ioc.run_one_for(5ms);
        }
        return true;
    }

    /// Run every handler that is ready now.
    inline void drain(net::io_context &ioc)
    {
        do
        {
            ioc.restart();
        } while (ioc.poll() > 0);
    }

    inline StreamEvent make_event(std::uint64_t offset,
                                  std::string sender = "alice",
                                  std::string recipient = "bob",
                                  EventKind kind = EventKind::Text)
    {
        StreamEvent ev;
        ev.id = "m" + std::to_string(offset);
        ev.offset = offset;
        ev.kind = kind;
        ev.payload = nlohmann::json{{"content", "msg " + std::to_string(offset)}};
        ev.senderId = std::move(sender);
        ev.recipientId = std::move(recipient);
        ev.timestamp = "2024-01-01T00:00:00.000Z";
        return ev;
    }

    class FakeSubscription : public Subscription
    {
    public:
        explicit FakeSubscription(std::uint64_t offset, StreamHandlers h)
            : offset(offset), handlers(std::move(h)) {}

        void cancel() override { cancelled = true; }

        void ack(std::uint64_t head)
        {
            if (!cancelled && handlers.on_ack)
                handlers.on_ack(head);
        }

        void event(StreamEvent ev)
        {
            if (!cancelled && handlers.on_event)
                handlers.on_event(std::move(ev));
        }

        void gap()
        {
            if (!cancelled && handlers.on_gap)
                handlers.on_gap();
        }

        void error(const boost::system::error_code &ec)
        {
            if (!cancelled && handlers.on_error)
                handlers.on_error(ec);
        }

        const std::uint64_t offset;
        StreamHandlers handlers;
        std::atomic<bool> cancelled{false};
    };

    struct RangeCall
    {
        std::uint64_t start;
        std::optional<std::uint64_t> end;
        std::size_t limit;
    };

    struct ChunkCall
    {
        std::string sessionId;
        std::uint64_t offset;
        std::size_t size;
    };

    struct HeldChunk
    {
        std::string sessionId;
        std::uint64_t offset;
        std::string bytes;
        ITransport::Completion<std::uint64_t> done;
    };

    class FakeTransport : public ITransport
    {
    public:
        explicit FakeTransport(net::any_io_executor ex) : ex_(std::move(ex)) {}

        // ───────── scripting ─────────

        TransportCapabilities caps;

        /// Events served by range_read and poll, sorted by offset.
        std::vector<StreamEvent> log;

        /// Each call pops one code; empty deque = success.
        std::deque<ErrorCode> subscribeErrors;
        std::deque<ErrorCode> rangeErrors;
        std::deque<ErrorCode> pollErrors;
        std::deque<ErrorCode> discoverErrors;
        std::deque<ErrorCode> chunkErrors;

        /// Called from subscribe() with the new handle.
        std::function<void(std::shared_ptr<FakeSubscription>)> onSubscribe;

        /// When set, upload_chunk parks its completion in `held`.
        bool holdChunks = false;

        // ───────── observations ─────────

        std::vector<std::shared_ptr<FakeSubscription>> subscriptions;
        std::vector<RangeCall> rangeCalls;
        std::vector<std::uint64_t> pollCalls;
        std::vector<Completion<PollResult>> parkedPolls;
        std::vector<ChunkCall> chunkCalls;
        std::vector<HeldChunk> held;
        std::vector<std::string> terminated;
        int discoverCalls = 0;
        std::uint64_t bytesReceived = 0;

        /// Remote upload state.
        std::map<std::string, std::string> remote;
        std::map<std::string, std::string> byFingerprint;

        std::shared_ptr<FakeSubscription> last_subscription() const
        {
            return subscriptions.empty() ? nullptr : subscriptions.back();
        }

        /// Apply (or drop) a parked chunk and complete it.
        void release_chunk(std::size_t idx, bool commit)
        {
            HeldChunk h = std::move(held.at(idx));
            held.erase(held.begin() + static_cast<std::ptrdiff_t>(idx));

            if (!commit)
            {
                post([done = std::move(h.done)]()
                     { done(make_error_code(sync_errc::transport_failure), 0); });
                return;
            }
            auto [ec, next] = apply_chunk(h.sessionId, h.offset, h.bytes);
            post([done = std::move(h.done), ec = ec, next = next]()
                 { done(ec, next); });
        }

        /// Answer every parked poll with "nothing new".
        void flush_polls(std::uint64_t nextOffset, std::vector<StreamEvent> events = {})
        {
            auto parked = std::move(parkedPolls);
            parkedPolls.clear();
            for (auto &done : parked)
            {
                post([done = std::move(done), nextOffset, events]()
                     { done({}, PollResult{events, nextOffset, false}); });
            }
        }

        // ───────── ITransport ─────────

        TransportCapabilities capabilities() const override { return caps; }

        std::shared_ptr<Subscription> subscribe(std::uint64_t offset,
                                                const StreamScope &,
                                                StreamHandlers handlers) override
        {
            auto sub = std::make_shared<FakeSubscription>(offset, std::move(handlers));
            subscriptions.push_back(sub);
            if (onSubscribe)
                onSubscribe(sub);

            if (!subscribeErrors.empty())
            {
                auto ec = subscribeErrors.front();
                subscribeErrors.pop_front();
                post([sub, ec]()
                     { sub->error(ec); });
            }
            return sub;
        }

        void range_read(const StreamScope &,
                        std::uint64_t start,
                        std::optional<std::uint64_t> end,
                        std::size_t limit,
                        Completion<RangeReadResult> done) override
        {
            rangeCalls.push_back(RangeCall{start, end, limit});

            if (!rangeErrors.empty())
            {
                auto ec = rangeErrors.front();
                rangeErrors.pop_front();
                post([done = std::move(done), ec]()
                     { done(ec, RangeReadResult{}); });
                return;
            }

            RangeReadResult r;
            r.startOffset = start;
            r.endOffset = start - 1;
            r.totalOffset = log.empty() ? 0 : log.back().offset;
            for (const auto &ev : log)
            {
                if (ev.offset < start || (end && ev.offset > *end))
                    continue;
                if (r.events.size() == limit)
                {
                    r.hasMore = true;
                    break;
                }
                r.events.push_back(ev);
                r.endOffset = ev.offset;
            }
            r.versionTag = "v" + std::to_string(r.totalOffset);

            post([done = std::move(done), r = std::move(r)]() mutable
                 { done({}, std::move(r)); });
        }

        void poll(const StreamScope &,
                  std::uint64_t offset,
                  std::chrono::seconds,
                  Completion<PollResult> done) override
        {
            pollCalls.push_back(offset);

            if (!pollErrors.empty())
            {
                auto ec = pollErrors.front();
                pollErrors.pop_front();
                post([done = std::move(done), ec]()
                     { done(ec, PollResult{}); });
                return;
            }

            PollResult r;
            r.nextOffset = offset;
            for (const auto &ev : log)
            {
                if (ev.offset > offset)
                {
                    r.events.push_back(ev);
                    r.nextOffset = ev.offset;
                }
            }

            if (r.events.empty())
            {
                parkedPolls.push_back(std::move(done));
                return;
            }
            post([done = std::move(done), r = std::move(r)]() mutable
                 { done({}, std::move(r)); });
        }

        void send_event(const std::string &senderId,
                        const std::string &recipientId,
                        EventKind kind,
                        nlohmann::json payload,
                        Completion<SendReceipt> done) override
        {
            const std::uint64_t offset = log.empty() ? 1 : log.back().offset + 1;
            auto ev = make_event(offset, senderId, recipientId, kind);
            ev.payload = std::move(payload);
            log.push_back(ev);

            SendReceipt receipt{ev.id, ev.offset, ev.timestamp};
            post([done = std::move(done), receipt]()
                 { done({}, receipt); });
        }

        void create_or_resume_upload(const UploadSignature &signature,
                                     std::uint64_t,
                                     const UploadMetadata &,
                                     Completion<UploadSessionInfo> done) override
        {
            ++discoverCalls;

            if (!discoverErrors.empty())
            {
                auto ec = discoverErrors.front();
                discoverErrors.pop_front();
                post([done = std::move(done), ec]()
                     { done(ec, UploadSessionInfo{}); });
                return;
            }

            const auto fp = signature.fingerprint();
            auto it = byFingerprint.find(fp);
            std::string id;
            if (it != byFingerprint.end() && remote.count(it->second))
            {
                id = it->second;
            }
            else
            {
                id = "up-" + std::to_string(byFingerprint.size() + terminated.size() + 1);
                byFingerprint[fp] = id;
                remote[id] = {};
            }

            UploadSessionInfo info{id, remote[id].size(), signature.totalBytes, "/files/" + id};
            post([done = std::move(done), info]()
                 { done({}, info); });
        }

        void upload_chunk(const std::string &sessionId,
                          std::uint64_t offset,
                          std::string bytes,
                          Completion<std::uint64_t> done) override
        {
            chunkCalls.push_back(ChunkCall{sessionId, offset, bytes.size()});

            if (!chunkErrors.empty())
            {
                auto ec = chunkErrors.front();
                chunkErrors.pop_front();
                post([done = std::move(done), ec]()
                     { done(ec, 0); });
                return;
            }

            if (holdChunks)
            {
                held.push_back(HeldChunk{sessionId, offset, std::move(bytes), std::move(done)});
                return;
            }

            auto [ec, next] = apply_chunk(sessionId, offset, bytes);
            post([done = std::move(done), ec = ec, next = next]()
                 { done(ec, next); });
        }

        void terminate_upload(const std::string &sessionId,
                              std::function<void(const ErrorCode &)> done) override
        {
            terminated.push_back(sessionId);
            remote.erase(sessionId);
            post([done = std::move(done)]()
                 { done({}); });
        }

    private:
        template <typename F>
        void post(F &&fn)
        {
            net::post(ex_, std::forward<F>(fn));
        }

        std::pair<ErrorCode, std::uint64_t> apply_chunk(const std::string &sessionId,
                                                        std::uint64_t offset,
                                                        const std::string &bytes)
        {
            auto it = remote.find(sessionId);
            if (it == remote.end())
                return {make_error_code(sync_errc::session_not_found), 0};
            if (offset != it->second.size())
                return {make_error_code(sync_errc::offset_conflict), 0};

            it->second += bytes;
            bytesReceived += bytes.size();
            return {{}, it->second.size()};
        }

        net::any_io_executor ex_;
    };

} // namespace durasync::test

#endif // DURASYNC_TESTS_FAKE_TRANSPORT_HPP
