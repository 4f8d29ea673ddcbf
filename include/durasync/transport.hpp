#ifndef DURASYNC_TRANSPORT_HPP
#define DURASYNC_TRANSPORT_HPP

/**
 * @file transport.hpp
 * @brief Capability interface between the sync core and a remote endpoint.
 *
 * The connector and the upload manager only talk to `ITransport`. Every
 * operation is asynchronous: the completion handler receives an
 * `error_code` first, then the result. Completions may run on any thread;
 * callers re-post onto their own strand.
 *
 * Capabilities:
 *  - subscribe()                 : push channel (ack, event, gap, error)
 *  - range_read()                : catch-up from an inclusive start offset
 *  - poll()                      : bounded wait for events after an offset
 *  - send_event()                : append an event to the log
 *  - create_or_resume_upload()   : resume-discovery for a chunked upload
 *  - upload_chunk()              : transfer bytes at an offset
 *  - terminate_upload()          : best-effort removal of a remote session
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/system/error_code.hpp>

#include <durasync/protocol.hpp>

namespace durasync
{
    /// Which events of the log a subscriber is interested in.
    struct StreamScope
    {
        std::string owner;
        std::string peer; ///< empty = every event involving owner

        std::string key() const;

        /// True if the event belongs to this scope.
        bool matches(const StreamEvent &ev) const noexcept
        {
            if (peer.empty())
                return ev.senderId == owner || ev.recipientId == owner;
            return (ev.senderId == owner && ev.recipientId == peer) ||
                   (ev.senderId == peer && ev.recipientId == owner);
        }
    };

    struct TransportCapabilities
    {
        bool push = true;
        bool poll = true;
    };

    struct StreamHandlers
    {
        /// Subscription established; offset is the endpoint's current head.
        std::function<void(std::uint64_t)> on_ack;
        std::function<void(StreamEvent)> on_event;
        /// Endpoint signalled that events may have been missed.
        std::function<void()> on_gap;
        /// Stream ended or a frame was rejected (protocol_violation keeps the stream open).
        std::function<void(const boost::system::error_code &)> on_error;
    };

    /// Handle of a live push subscription.
    class Subscription
    {
    public:
        virtual ~Subscription() = default;

        /// Idempotent; no handler fires after it returns.
        virtual void cancel() = 0;
    };

    /// Stable identity of a local file, used for resume-discovery.
    struct UploadSignature
    {
        std::string filename;
        std::string mimeType;
        std::uint64_t totalBytes = 0;
        std::int64_t lastWrite = 0; ///< seconds since epoch

        std::string fingerprint() const;
    };

    using UploadMetadata = std::vector<std::pair<std::string, std::string>>;

    struct UploadSessionInfo
    {
        std::string sessionId;
        std::uint64_t resumeOffset = 0;
        std::uint64_t totalBytes = 0;
        std::string location;
    };

    class ITransport
    {
    public:
        using ErrorCode = boost::system::error_code;

        template <typename T>
        using Completion = std::function<void(const ErrorCode &, T)>;

        virtual ~ITransport() = default;

        virtual TransportCapabilities capabilities() const = 0;

        virtual std::shared_ptr<Subscription> subscribe(std::uint64_t offset,
                                                        const StreamScope &scope,
                                                        StreamHandlers handlers) = 0;

        /// Events with offset in [start, end], at most limit of them.
        virtual void range_read(const StreamScope &scope,
                                std::uint64_t start,
                                std::optional<std::uint64_t> end,
                                std::size_t limit,
                                Completion<RangeReadResult> done) = 0;

        /// Events with offset > offset, waiting at most timeout for the first one.
        virtual void poll(const StreamScope &scope,
                          std::uint64_t offset,
                          std::chrono::seconds timeout,
                          Completion<PollResult> done) = 0;

        virtual void send_event(const std::string &senderId,
                                const std::string &recipientId,
                                EventKind kind,
                                nlohmann::json payload,
                                Completion<SendReceipt> done) = 0;

        virtual void create_or_resume_upload(const UploadSignature &signature,
                                             std::uint64_t totalBytes,
                                             const UploadMetadata &metadata,
                                             Completion<UploadSessionInfo> done) = 0;

        /// On success the completion carries the endpoint's new offset.
        virtual void upload_chunk(const std::string &sessionId,
                                  std::uint64_t offset,
                                  std::string bytes,
                                  Completion<std::uint64_t> done) = 0;

        virtual void terminate_upload(const std::string &sessionId,
                                      std::function<void(const ErrorCode &)> done) = 0;
    };

} // namespace durasync

#endif // DURASYNC_TRANSPORT_HPP
