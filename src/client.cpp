#include <durasync/client.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <vix/utils/Logger.hpp>

#include <durasync/cursor.hpp>
#include <durasync/SqliteSyncStore.hpp>

namespace durasync
{
    using Logger = vix::utils::Logger;

    namespace
    {
        Logger &logger = Logger::getInstance();

        /// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ".
        std::string now_iso8601()
        {
            const auto now = std::chrono::system_clock::now();
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch()) %
                            1000;
            const std::time_t t = std::chrono::system_clock::to_time_t(now);

            std::tm tm{};
            gmtime_r(&t, &tm);

            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

            char out[40];
            std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms.count()));
            return out;
        }

        void run_io(net::io_context &ioc, const char *name)
        {
            try
            {
                ioc.run();
            }
            catch (const std::exception &e)
            {
                logger.log(Logger::Level::ERROR,
                           "[durasync][Client] {} thread error: {}", name, e.what());
            }

            logger.log(Logger::Level::DEBUG, "[durasync][Client] {} thread finished", name);
        }
    } // namespace

    struct SyncClient::Runtime
    {
        net::io_context netIoc{1};
        net::io_context dispatchIoc{1};
        net::executor_work_guard<net::io_context::executor_type> netWork{net::make_work_guard(netIoc)};
        net::executor_work_guard<net::io_context::executor_type> dispatchWork{net::make_work_guard(dispatchIoc)};
    };

    // ───────────────────────── construction ─────────────────────────

    std::shared_ptr<SyncClient> SyncClient::create(Endpoint endpoint,
                                                   std::string userId,
                                                   Config cfg,
                                                   const std::string &storePath)
    {
        std::shared_ptr<ISyncStore> store;
        if (!storePath.empty())
            store = std::make_shared<SqliteSyncStore>(storePath);

        auto factory = [endpoint = std::move(endpoint), cfg, store](net::any_io_executor ex)
            -> std::shared_ptr<ITransport>
        {
            return HttpTransport::create(std::move(ex), endpoint, cfg, store);
        };

        return create(std::move(userId), std::move(cfg), std::move(factory), std::move(store));
    }

    std::shared_ptr<SyncClient> SyncClient::create(
        std::string userId,
        Config cfg,
        std::function<std::shared_ptr<ITransport>(net::any_io_executor)> makeTransport,
        std::shared_ptr<ISyncStore> store)
    {
        if (userId.empty())
            throw std::invalid_argument("SyncClient: user id must not be empty");
        if (!makeTransport)
            throw std::invalid_argument("SyncClient: transport factory is required");

        std::shared_ptr<SyncClient> client(
            new SyncClient(std::move(userId), std::move(cfg), std::move(store)));
        client->wire(makeTransport(client->rt_->netIoc.get_executor()));
        return client;
    }

    SyncClient::SyncClient(std::string userId, Config cfg, std::shared_ptr<ISyncStore> store)
        : userId_(std::move(userId)),
          cfg_(std::move(cfg)),
          rt_(std::make_shared<Runtime>()),
          store_(std::move(store))
    {
    }

    SyncClient::~SyncClient()
    {
        close();
    }

    void SyncClient::wire(std::shared_ptr<ITransport> transport)
    {
        if (!transport)
            throw std::invalid_argument("SyncClient: transport factory returned null");

        transport_ = std::move(transport);
        dispatcher_ = EventDispatcher::create(rt_->dispatchIoc.get_executor());
        connector_ = StreamConnector::create(rt_->netIoc.get_executor(), transport_, dispatcher_, cfg_, &metrics_);
        uploads_ = UploadManager::create(rt_->netIoc.get_executor(), transport_, cfg_, &metrics_);

        // Registered first so the journal is written before application handlers run.
        if (store_)
        {
            std::weak_ptr<SyncClient> weak = weak_from_this();

            dispatcher_->on_event(
                [weak](const StreamEvent &ev)
                {
                    auto self = weak.lock();
                    if (!self)
                        return;

                    const std::string key = self->current_scope().key();
                    try
                    {
                        self->store_->append_event(key, ev);
                        self->store_->save_cursor(key, CursorCheckpoint{ev.offset, {}});
                    }
                    catch (const std::exception &e)
                    {
                        logger.log(Logger::Level::WARN,
                                   "[durasync][Client] journal write failed at {}: {}", ev.offset, e.what());
                    }
                });

            dispatcher_->on_connection_offset(
                [weak](std::uint64_t)
                {
                    if (auto self = weak.lock())
                        self->checkpoint();
                });
        }

        connector_->on_state_change(
            [user = userId_](ConnectionState s)
            {
                logger.log(Logger::Level::INFO, "[durasync][Client] {} -> {}", user, to_string(s));
            });

        netThread_ = std::thread([rt = rt_]()
                                 { run_io(rt->netIoc, "network"); });
        dispatchThread_ = std::thread([rt = rt_]()
                                      { run_io(rt->dispatchIoc, "dispatch"); });
    }

    StreamScope SyncClient::current_scope() const
    {
        std::lock_guard<std::mutex> lock(scopeMutex_);
        return StreamScope{userId_, peer_};
    }

    void SyncClient::checkpoint()
    {
        if (!store_ || !connector_)
            return;

        const std::string key = connector_->scope();
        if (key.empty())
            return;

        try
        {
            store_->save_cursor(key, CursorCheckpoint{connector_->last_offset(), {}});
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::WARN,
                       "[durasync][Client] cursor checkpoint failed for {}: {}", key, e.what());
        }
    }

    // ───────────────────────── stream ─────────────────────────

    void SyncClient::connect(const std::string &peer, std::optional<std::uint64_t> startOffset)
    {
        if (closed_.load(std::memory_order_acquire))
            throw std::logic_error("SyncClient: connect() after close()");

        {
            std::lock_guard<std::mutex> lock(scopeMutex_);
            peer_ = peer;
        }

        if (!startOffset && store_)
        {
            const std::string key = make_scope(userId_, peer);
            try
            {
                if (auto cp = store_->load_cursor(key); cp && cp->offset > 0)
                {
                    startOffset = cp->offset;
                    logger.log(Logger::Level::INFO,
                               "[durasync][Client] resuming {} from stored offset {}", key, cp->offset);
                }
            }
            catch (const std::exception &e)
            {
                logger.log(Logger::Level::WARN,
                           "[durasync][Client] could not load cursor for {}: {}", key, e.what());
            }
        }

        connector_->connect(userId_, peer, startOffset);
    }

    void SyncClient::disconnect()
    {
        connector_->disconnect();
        checkpoint();
    }

    // ───────────────────────── sending ─────────────────────────

    void SyncClient::send(const std::string &recipient, EventKind kind, nlohmann::json payload, SendHandler done)
    {
        transport_->send_event(
            userId_, recipient, kind, std::move(payload),
            [done = std::move(done), kind](const boost::system::error_code &ec, SendReceipt receipt)
            {
                if (ec)
                {
                    logger.log(Logger::Level::WARN,
                               "[durasync][Client] send {} failed: {}", to_string(kind), ec.message());
                }
                if (done)
                    done(ec, std::move(receipt));
            });
    }

    void SyncClient::send(const std::string &recipient, EventKind kind, const vix::json::kvs &payload, SendHandler done)
    {
        send(recipient, kind, detail::kvs_to_nlohmann(payload), std::move(done));
    }

    void SyncClient::send_text(const std::string &recipient, const std::string &content,
                               const std::string &replyTo, SendHandler done)
    {
        nlohmann::json payload{{"content", content}};
        if (!replyTo.empty())
            payload["reply_to"] = replyTo;
        send(recipient, EventKind::Text, std::move(payload), std::move(done));
    }

    void SyncClient::send_typing(const std::string &recipient, bool isTyping, SendHandler done)
    {
        send(recipient, EventKind::Typing, nlohmann::json{{"is_typing", isTyping}}, std::move(done));
    }

    void SyncClient::send_read_receipt(const std::string &recipient,
                                       const std::vector<std::string> &messageIds,
                                       SendHandler done)
    {
        send(recipient, EventKind::ReadReceipt,
             nlohmann::json{{"message_ids", messageIds}, {"read_at", now_iso8601()}},
             std::move(done));
    }

    void SyncClient::send_delivery_receipt(const std::string &recipient,
                                           const std::vector<std::string> &messageIds,
                                           SendHandler done)
    {
        send(recipient, EventKind::DeliveryReceipt,
             nlohmann::json{{"message_ids", messageIds}, {"delivered_at", now_iso8601()}},
             std::move(done));
    }

    void SyncClient::send_presence(const std::string &recipient, bool online, SendHandler done)
    {
        send(recipient, EventKind::Presence,
             nlohmann::json{{"user_id", userId_}, {"is_online", online}, {"last_seen", now_iso8601()}},
             std::move(done));
    }

    // ───────────────────────── history ─────────────────────────

    void SyncClient::load_history(std::size_t limit, RangeHandler done)
    {
        load_range(1, std::nullopt, limit, std::move(done));
    }

    void SyncClient::load_range(std::uint64_t start, std::optional<std::uint64_t> end,
                                std::size_t limit, RangeHandler done)
    {
        if (start == 0)
            start = 1;
        if (limit == 0)
            limit = cfg_.rangeReadLimit;

        transport_->range_read(current_scope(), start, end, limit,
                               [done = std::move(done)](const boost::system::error_code &ec, RangeReadResult r)
                               {
                                   if (done)
                                       done(ec, std::move(r));
                               });
    }

    std::vector<StreamEvent> SyncClient::journal(std::uint64_t afterOffset, std::size_t limit) const
    {
        if (!store_)
            return {};
        return store_->replay_from(current_scope().key(), afterOffset, limit);
    }

    // ───────────────────────── uploads ─────────────────────────

    std::shared_ptr<UploadSession> SyncClient::upload(const std::filesystem::path &file,
                                                      const std::string &recipient,
                                                      UploadCallbacks callbacks,
                                                      std::string mimeType,
                                                      std::size_t chunkSize)
    {
        UploadMetadata metadata{{"sender_id", userId_}};
        if (!recipient.empty())
            metadata.emplace_back("recipient_id", recipient);

        return uploads_->start(file, chunkSize, std::move(metadata), std::move(callbacks), std::move(mimeType));
    }

    // ───────────────────────── shutdown ─────────────────────────

    void SyncClient::close()
    {
        if (closed_.exchange(true, std::memory_order_acq_rel))
            return;

        if (connector_)
        {
            connector_->disconnect();
            checkpoint();
        }

        // Unfinished uploads stay resumable; their fingerprints remain in the store.
        rt_->netWork.reset();
        rt_->dispatchWork.reset();
        rt_->netIoc.stop();
        rt_->dispatchIoc.stop();

        const auto self = std::this_thread::get_id();
        for (std::thread *t : {&netThread_, &dispatchThread_})
        {
            if (!t->joinable())
                continue;
            if (t->get_id() != self)
                t->join();
            else
                t->detach(); // released from one of our own handlers; the thread keeps rt_ alive
        }
    }

} // namespace durasync
