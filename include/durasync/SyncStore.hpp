#ifndef DURASYNC_SYNC_STORE_HPP
#define DURASYNC_SYNC_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <durasync/protocol.hpp>

namespace durasync
{
    struct CursorCheckpoint
    {
        std::uint64_t offset = 0;
        std::string versionTag;
    };

    struct RememberedUpload
    {
        std::string sessionId;
        std::string location;
    };

    /**
     * @brief Local persistence used by the client facade and the HTTP transport.
     *
     * Expected semantics:
     *  - save_cursor(scope, ...) : upsert; a lower offset never replaces a higher one
     *  - append_event(scope, ev) : idempotent on (scope, offset)
     *  - replay_from(scope, after, limit) :
     *      -> events with offset STRICTLY > after
     *      -> ordered oldest-first
     *  - remember_upload / find_upload / forget_upload :
     *      session fingerprint -> remote session used by resume-discovery
     */
    class ISyncStore
    {
    public:
        virtual ~ISyncStore() = default;

        virtual void save_cursor(const std::string &scope, const CursorCheckpoint &cp) = 0;
        virtual std::optional<CursorCheckpoint> load_cursor(const std::string &scope) = 0;

        virtual void append_event(const std::string &scope, const StreamEvent &ev) = 0;
        virtual std::vector<StreamEvent> replay_from(const std::string &scope,
                                                     std::uint64_t afterOffset,
                                                     std::size_t limit) = 0;

        virtual void remember_upload(const std::string &fingerprint, const RememberedUpload &up) = 0;
        virtual std::optional<RememberedUpload> find_upload(const std::string &fingerprint) = 0;

        /// Forget by fingerprint or, when `bySession` is set, by remote session id.
        virtual void forget_upload(const std::string &key, bool bySession = false) = 0;
    };

} // namespace durasync

#endif // DURASYNC_SYNC_STORE_HPP
