#ifndef DURASYNC_ERRORS_HPP
#define DURASYNC_ERRORS_HPP

/**
 * @file errors.hpp
 * @brief Error codes and taxonomy for the durasync transport layer.
 *
 * Every asynchronous completion in durasync reports a
 * `boost::system::error_code`. Codes raised by the library itself live in the
 * `durasync::sync_errc` enum and its own category; anything else (Asio socket
 * errors, Beast HTTP errors, timeouts) is a transport error.
 *
 *   - transport  : connection refused / reset / timeout, HTTP 5xx (retryable)
 *   - protocol   : malformed event, invalid offset, unexpected status
 *   - gap        : events may have been missed (triggers a resync, not an error)
 *   - capacity   : the endpoint rejected a request for quota reasons
 *   - not found  : resume-discovery found no session (start fresh)
 *   - terminal   : retry budget exhausted or the operation was aborted
 */

#include <string>
#include <system_error>
#include <type_traits>

#include <boost/system/error_code.hpp>

namespace durasync
{
    enum class sync_errc
    {
        transport_failure = 1,
        protocol_violation,
        gap_detected,
        capacity_exceeded,
        session_not_found,
        offset_conflict,
        push_unavailable,
        reconnect_exhausted,
        chunk_retries_exhausted,
        upload_aborted
    };

    enum class ErrorClass
    {
        Transport,
        Protocol,
        Gap,
        Capacity,
        SessionNotFound,
        Terminal
    };

    const boost::system::error_category &sync_category() noexcept;

    inline boost::system::error_code make_error_code(sync_errc e) noexcept
    {
        return {static_cast<int>(e), sync_category()};
    }

    /// Map any error code onto the durasync taxonomy.
    [[nodiscard]] ErrorClass classify(const boost::system::error_code &ec) noexcept;

    /// Only transport errors are retried automatically.
    [[nodiscard]] inline bool is_retryable(const boost::system::error_code &ec) noexcept
    {
        return ec && classify(ec) == ErrorClass::Transport;
    }

    /// Map an HTTP status returned by the endpoint to a code (success -> empty).
    [[nodiscard]] boost::system::error_code from_http_status(unsigned status) noexcept;

    /// What consumers receive on their error channel.
    struct SyncError
    {
        boost::system::error_code code;
        std::string context; ///< component/stage that raised it, e.g. "connector.reconnect"

        [[nodiscard]] bool terminal() const noexcept
        {
            return classify(code) == ErrorClass::Terminal;
        }

        [[nodiscard]] std::string message() const
        {
            return context.empty() ? code.message() : context + ": " + code.message();
        }
    };

} // namespace durasync

namespace boost::system
{
    template <>
    struct is_error_code_enum<durasync::sync_errc> : std::true_type
    {
    };
} // namespace boost::system

#endif // DURASYNC_ERRORS_HPP
