#include <durasync/errors.hpp>

namespace durasync
{
    namespace
    {
        class SyncCategory final : public boost::system::error_category
        {
        public:
            const char *name() const noexcept override
            {
                return "durasync";
            }

            std::string message(int ev) const override
            {
                switch (static_cast<sync_errc>(ev))
                {
                case sync_errc::transport_failure:
                    return "transport failure";
                case sync_errc::protocol_violation:
                    return "protocol violation";
                case sync_errc::gap_detected:
                    return "events may have been missed";
                case sync_errc::capacity_exceeded:
                    return "capacity exceeded";
                case sync_errc::session_not_found:
                    return "upload session not found";
                case sync_errc::offset_conflict:
                    return "upload offset conflict";
                case sync_errc::push_unavailable:
                    return "push subscription unavailable";
                case sync_errc::reconnect_exhausted:
                    return "reconnect attempts exhausted";
                case sync_errc::chunk_retries_exhausted:
                    return "chunk retries exhausted";
                case sync_errc::upload_aborted:
                    return "upload aborted";
                }
                return "unknown durasync error";
            }
        };
    } // namespace

    const boost::system::error_category &sync_category() noexcept
    {
        static const SyncCategory category;
        return category;
    }

    ErrorClass classify(const boost::system::error_code &ec) noexcept
    {
        if (ec.category() != sync_category())
            return ErrorClass::Transport;

        switch (static_cast<sync_errc>(ec.value()))
        {
        case sync_errc::transport_failure:
        case sync_errc::push_unavailable:
            return ErrorClass::Transport;
        case sync_errc::protocol_violation:
        case sync_errc::offset_conflict:
            return ErrorClass::Protocol;
        case sync_errc::gap_detected:
            return ErrorClass::Gap;
        case sync_errc::capacity_exceeded:
            return ErrorClass::Capacity;
        case sync_errc::session_not_found:
            return ErrorClass::SessionNotFound;
        case sync_errc::reconnect_exhausted:
        case sync_errc::chunk_retries_exhausted:
        case sync_errc::upload_aborted:
            return ErrorClass::Terminal;
        }
        return ErrorClass::Protocol;
    }

    boost::system::error_code from_http_status(unsigned status) noexcept
    {
        if (status >= 200 && status < 300)
            return {};

        switch (status)
        {
        case 304:
            return {};
        case 404:
        case 410:
            return make_error_code(sync_errc::session_not_found);
        case 409:
            return make_error_code(sync_errc::offset_conflict);
        case 413:
        case 507:
            return make_error_code(sync_errc::capacity_exceeded);
        case 408:
        case 429:
            return make_error_code(sync_errc::transport_failure);
        default:
            break;
        }

        if (status >= 500)
            return make_error_code(sync_errc::transport_failure);

        return make_error_code(sync_errc::protocol_violation);
    }

} // namespace durasync
