#include <durasync/sse.hpp>

namespace durasync
{
    std::vector<SseFrame> SseParser::feed(std::string_view chunk)
    {
        std::vector<SseFrame> out;
        pending_.append(chunk.data(), chunk.size());

        std::size_t start = 0;
        for (;;)
        {
            const auto nl = pending_.find('\n', start);
            if (nl == std::string::npos)
                break;

            std::string_view line(pending_.data() + start, nl - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            process_line(line, out);
            start = nl + 1;
        }

        pending_.erase(0, start);
        return out;
    }

    void SseParser::reset()
    {
        pending_.clear();
        current_ = SseFrame{};
        hasData_ = false;
    }

    void SseParser::process_line(std::string_view line, std::vector<SseFrame> &out)
    {
        if (line.empty())
        {
            // blank line dispatches; a frame without data is ignored
            if (hasData_)
            {
                if (!current_.data.empty() && current_.data.back() == '\n')
                    current_.data.pop_back();
                current_.id = lastEventId_;
                out.push_back(std::move(current_));
            }
            current_ = SseFrame{};
            hasData_ = false;
            return;
        }

        if (line.front() == ':')
            return; // comment / keep-alive

        std::string_view field = line;
        std::string_view value;
        if (const auto colon = line.find(':'); colon != std::string_view::npos)
        {
            field = line.substr(0, colon);
            value = line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ')
                value.remove_prefix(1);
        }

        if (field == "event")
        {
            current_.event = value.empty() ? "message" : std::string(value);
        }
        else if (field == "data")
        {
            current_.data.append(value.data(), value.size());
            current_.data.push_back('\n');
            hasData_ = true;
        }
        else if (field == "id")
        {
            if (value.find('\0') == std::string_view::npos)
                lastEventId_ = std::string(value);
        }
        // "retry" and unknown fields are ignored
    }

} // namespace durasync
