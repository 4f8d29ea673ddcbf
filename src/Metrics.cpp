#include <durasync/Metrics.hpp>

#include <sstream>

namespace durasync
{
    namespace
    {
        void write_metric(std::ostringstream &os,
                          const char *name,
                          const char *type,
                          const char *help,
                          std::uint64_t value)
        {
            os << "# HELP durasync_" << name << ' ' << help << "\n"
               << "# TYPE durasync_" << name << ' ' << type << "\n"
               << "durasync_" << name << ' ' << value << "\n\n";
        }
    } // namespace

    std::string SyncMetrics::render_prometheus() const
    {
        std::ostringstream os;

        write_metric(os, "connects_total", "counter",
                     "Subscriptions acknowledged by the endpoint", connects_total.load());
        write_metric(os, "reconnects_total", "counter",
                     "Reconnect attempts scheduled after a transport failure", reconnects_total.load());
        write_metric(os, "transport_errors_total", "counter",
                     "Transport failures seen by the connector", transport_errors_total.load());
        write_metric(os, "protocol_errors_total", "counter",
                     "Malformed frames and unexpected responses", protocol_errors_total.load());
        write_metric(os, "gaps_total", "counter",
                     "Gap signals received or detected", gaps_total.load());
        write_metric(os, "resyncs_total", "counter",
                     "Range-read resync rounds started", resyncs_total.load());
        write_metric(os, "events_received_total", "counter",
                     "Events received from push, poll and range reads", events_received_total.load());
        write_metric(os, "events_dispatched_total", "counter",
                     "Events handed to the dispatcher", events_dispatched_total.load());
        write_metric(os, "duplicates_dropped_total", "counter",
                     "Events dropped because their offset was already passed", duplicates_dropped_total.load());
        write_metric(os, "polls_total", "counter",
                     "Long-poll requests issued", polls_total.load());
        write_metric(os, "connected", "gauge",
                     "Connectors currently in the connected state", connected.load());

        write_metric(os, "uploads_started_total", "counter",
                     "Upload sessions started", uploads_started_total.load());
        write_metric(os, "uploads_completed_total", "counter",
                     "Upload sessions completed", uploads_completed_total.load());
        write_metric(os, "uploads_failed_total", "counter",
                     "Upload sessions failed", uploads_failed_total.load());
        write_metric(os, "uploads_active", "gauge",
                     "Upload sessions not yet in a terminal state", uploads_active.load());
        write_metric(os, "upload_bytes_total", "counter",
                     "Bytes acknowledged by the endpoint", upload_bytes_total.load());
        write_metric(os, "chunk_retries_total", "counter",
                     "Chunk transfers retried", chunk_retries_total.load());

        return os.str();
    }

} // namespace durasync
