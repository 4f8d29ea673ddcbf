#ifndef DURASYNC_HTTP_TRANSPORT_HPP
#define DURASYNC_HTTP_TRANSPORT_HPP

/**
 * @file HttpTransport.hpp
 * @brief Boost.Beast implementation of ITransport.
 *
 * Endpoint layout:
 *
 *   GET    {streams}/stream?offset=N[&with_user=P]        SSE push (connected, message, reset, heartbeat)
 *   GET    {streams}/poll?offset=N&timeout_secs=T[...]    long-poll
 *   GET    {streams}/messages?offset=S&limit=L            range read (Range: offset=S-[E])
 *   POST   {streams}/messages                             append an event
 *
 *   POST   {uploads}            tus 1.0.0 create  (Upload-Length, Upload-Metadata)
 *   HEAD   {uploads}/{id}       current Upload-Offset
 *   PATCH  {uploads}/{id}       chunk at Upload-Offset
 *   DELETE {uploads}/{id}       terminate
 *
 * Upload fingerprints are remembered in the optional ISyncStore so that a
 * later start() of the same file resumes the same remote session.
 */

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>

#include <durasync/config.hpp>
#include <durasync/SyncStore.hpp>
#include <durasync/transport.hpp>

namespace durasync
{
    namespace net = boost::asio;

    struct Endpoint
    {
        std::string host{"127.0.0.1"};
        std::string port{"41234"};
        std::string streamsBase{"/api/streams"};
        std::string uploadsBase{"/tus/files"};
    };

    /// Events the endpoint replays after `connected` before going live.
    inline constexpr std::uint64_t kSseReplayLimit = 100;

    class HttpTransport : public ITransport,
                          public std::enable_shared_from_this<HttpTransport>
    {
    public:
        static std::shared_ptr<HttpTransport> create(net::any_io_executor ex,
                                                     Endpoint endpoint,
                                                     Config cfg,
                                                     std::shared_ptr<ISyncStore> store = nullptr)
        {
            return std::shared_ptr<HttpTransport>(
                new HttpTransport(std::move(ex), std::move(endpoint), std::move(cfg), std::move(store)));
        }

        const Endpoint &endpoint() const noexcept { return endpoint_; }

        TransportCapabilities capabilities() const override;

        std::shared_ptr<Subscription> subscribe(std::uint64_t offset,
                                                const StreamScope &scope,
                                                StreamHandlers handlers) override;

        void range_read(const StreamScope &scope,
                        std::uint64_t start,
                        std::optional<std::uint64_t> end,
                        std::size_t limit,
                        Completion<RangeReadResult> done) override;

        void poll(const StreamScope &scope,
                  std::uint64_t offset,
                  std::chrono::seconds timeout,
                  Completion<PollResult> done) override;

        void send_event(const std::string &senderId,
                        const std::string &recipientId,
                        EventKind kind,
                        nlohmann::json payload,
                        Completion<SendReceipt> done) override;

        void create_or_resume_upload(const UploadSignature &signature,
                                     std::uint64_t totalBytes,
                                     const UploadMetadata &metadata,
                                     Completion<UploadSessionInfo> done) override;

        void upload_chunk(const std::string &sessionId,
                          std::uint64_t offset,
                          std::string bytes,
                          Completion<std::uint64_t> done) override;

        void terminate_upload(const std::string &sessionId,
                              std::function<void(const ErrorCode &)> done) override;

    private:
        HttpTransport(net::any_io_executor ex,
                      Endpoint endpoint,
                      Config cfg,
                      std::shared_ptr<ISyncStore> store);

        void create_upload(const UploadSignature &signature,
                           std::uint64_t totalBytes,
                           const UploadMetadata &metadata,
                           Completion<UploadSessionInfo> done);

        std::string upload_target(const std::string &sessionId) const;

    private:
        net::any_io_executor ex_;
        Endpoint endpoint_;
        Config cfg_;
        std::shared_ptr<ISyncStore> store_;
    };

    /// Standard base64 (with padding), used for tus Upload-Metadata values.
    std::string base64_encode(std::string_view in);

    /// "key b64(value),key b64(value)"; keys with empty values are sent bare.
    std::string encode_upload_metadata(const UploadMetadata &metadata);

} // namespace durasync

#endif // DURASYNC_HTTP_TRANSPORT_HPP
