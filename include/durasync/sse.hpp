#pragma once

/**
 * @file sse.hpp
 * @brief Incremental parser for `text/event-stream` bodies.
 *
 * Bytes arrive in arbitrary slices from the socket; the parser keeps the
 * unfinished line between calls and yields complete frames only once the
 * terminating blank line has been seen.
 */

#include <string>
#include <string_view>
#include <vector>

namespace durasync
{
    struct SseFrame
    {
        std::string event{"message"};
        std::string data;
        std::string id;
    };

    class SseParser
    {
    public:
        /// Feed a slice of the body, returns frames completed by it.
        std::vector<SseFrame> feed(std::string_view chunk);

        /// Drop any partially received frame (new connection).
        void reset();

        /// Last `id:` seen on the stream, empty if none.
        const std::string &last_event_id() const noexcept { return lastEventId_; }

    private:
        void process_line(std::string_view line, std::vector<SseFrame> &out);

    private:
        std::string pending_;
        SseFrame current_;
        bool hasData_{false};
        std::string lastEventId_;
    };

} // namespace durasync
