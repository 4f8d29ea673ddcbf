#ifndef DURASYNC_CLIENT_HPP
#define DURASYNC_CLIENT_HPP

/**
 * @file client.hpp
 * @brief Application-facing facade wiring transport, connector, dispatcher and uploads.
 *
 * This component:
 *   - owns a network io thread and a dispatch io thread
 *   - restores the stream cursor from the local store and journals accepted events
 *   - exposes send helpers for every event kind using nlohmann::json or vix::json::kvs
 *   - starts resumable uploads tagged with sender / recipient metadata
 *
 * Typical usage:
 *
 *   durasync::Endpoint ep;                      // 127.0.0.1:41234 by default
 *   auto client = durasync::SyncClient::create(ep, "alice", cfg, "alice.db");
 *
 *   client->on_event([](const durasync::StreamEvent &ev){
 *       std::cout << ev.offset << " " << ev.get_string("content") << "\n";
 *   });
 *   client->on_error([](const durasync::SyncError &err){
 *       std::cerr << err.message() << "\n";
 *   });
 *
 *   client->connect("bob");
 *   client->send_text("bob", "hello");
 *   ...
 *   client->close();
 */

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include <nlohmann/json.hpp>
#include <vix/json/Simple.hpp>

#include <durasync/config.hpp>
#include <durasync/connector.hpp>
#include <durasync/dispatcher.hpp>
#include <durasync/HttpTransport.hpp>
#include <durasync/Metrics.hpp>
#include <durasync/SyncStore.hpp>
#include <durasync/upload.hpp>

namespace durasync
{
    class SyncClient : public std::enable_shared_from_this<SyncClient>
    {
    public:
        using SendHandler = std::function<void(const boost::system::error_code &, SendReceipt)>;
        using RangeHandler = std::function<void(const boost::system::error_code &, RangeReadResult)>;

        /// @param storePath SQLite file for cursors, journal and upload fingerprints; empty = no persistence
        static std::shared_ptr<SyncClient> create(Endpoint endpoint,
                                                  std::string userId,
                                                  Config cfg = {},
                                                  const std::string &storePath = {});

        /// Same wiring over a caller-provided transport and store.
        static std::shared_ptr<SyncClient> create(std::string userId,
                                                  Config cfg,
                                                  std::function<std::shared_ptr<ITransport>(net::any_io_executor)> makeTransport,
                                                  std::shared_ptr<ISyncStore> store = nullptr);

        ~SyncClient();

        SyncClient(const SyncClient &) = delete;
        SyncClient &operator=(const SyncClient &) = delete;

        EventDispatcher::HandlerId on_event(EventDispatcher::EventHandler cb) { return dispatcher_->on_event(std::move(cb)); }
        EventDispatcher::HandlerId on_connection_offset(EventDispatcher::OffsetHandler cb) { return dispatcher_->on_connection_offset(std::move(cb)); }
        EventDispatcher::HandlerId on_error(EventDispatcher::ErrorHandler cb) { return dispatcher_->on_error(std::move(cb)); }
        bool remove_handler(EventDispatcher::HandlerId id) { return dispatcher_->remove(id); }

        /// Open the stream of this user, optionally narrowed to one peer.
        void connect(const std::string &peer = {}, std::optional<std::uint64_t> startOffset = std::nullopt);
        void disconnect();

        ConnectionState state() const noexcept { return connector_->state(); }
        std::uint64_t last_offset() const { return connector_->last_offset(); }
        const std::string &user_id() const noexcept { return userId_; }

        // ---- Sending ------------------------------------------------------

        void send(const std::string &recipient, EventKind kind, nlohmann::json payload, SendHandler done = {});
        void send(const std::string &recipient, EventKind kind, const vix::json::kvs &payload, SendHandler done = {});

        void send_text(const std::string &recipient, const std::string &content,
                       const std::string &replyTo = {}, SendHandler done = {});
        void send_typing(const std::string &recipient, bool isTyping, SendHandler done = {});
        void send_read_receipt(const std::string &recipient, const std::vector<std::string> &messageIds,
                               SendHandler done = {});
        void send_delivery_receipt(const std::string &recipient, const std::vector<std::string> &messageIds,
                                   SendHandler done = {});
        void send_presence(const std::string &recipient, bool online, SendHandler done = {});

        // ---- History ------------------------------------------------------

        /// First `limit` events of the current scope, straight from the endpoint.
        void load_history(std::size_t limit, RangeHandler done);

        /// Events in [start, end] of the current scope; does not move the cursor.
        void load_range(std::uint64_t start, std::optional<std::uint64_t> end, std::size_t limit, RangeHandler done);

        /// Locally journalled events of the current scope after `afterOffset`.
        std::vector<StreamEvent> journal(std::uint64_t afterOffset, std::size_t limit) const;

        // ---- Uploads ------------------------------------------------------

        std::shared_ptr<UploadSession> upload(const std::filesystem::path &file,
                                              const std::string &recipient,
                                              UploadCallbacks callbacks,
                                              std::string mimeType = {},
                                              std::size_t chunkSize = 0);

        UploadManager &uploads() noexcept { return *uploads_; }

        // ---- Observability ------------------------------------------------

        const SyncMetrics &metrics() const noexcept { return metrics_; }

        /// Disconnect, checkpoint the cursor and join the io threads; unfinished uploads stay resumable.
        void close();

    private:
        SyncClient(std::string userId, Config cfg, std::shared_ptr<ISyncStore> store);

        void wire(std::shared_ptr<ITransport> transport);
        void checkpoint();
        StreamScope current_scope() const;

    private:
        std::string userId_;
        Config cfg_;
        SyncMetrics metrics_;

        /// io contexts and work guards; co-owned by the io threads so a thread
        /// detached in close() never outlives the context it runs.
        struct Runtime;
        std::shared_ptr<Runtime> rt_;
        std::thread netThread_;
        std::thread dispatchThread_;

        std::shared_ptr<ISyncStore> store_;
        std::shared_ptr<ITransport> transport_;
        std::shared_ptr<EventDispatcher> dispatcher_;
        std::shared_ptr<StreamConnector> connector_;
        std::shared_ptr<UploadManager> uploads_;

        mutable std::mutex scopeMutex_;
        std::string peer_;

        std::atomic<bool> closed_{false};
    };

} // namespace durasync

#endif // DURASYNC_CLIENT_HPP
