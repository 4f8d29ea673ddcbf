#ifndef DURASYNC_PROTOCOL_HPP
#define DURASYNC_PROTOCOL_HPP

/**
 * @file protocol.hpp
 * @brief Event model and JSON codec for the durable event stream.
 *
 * Wire format of one event (as emitted by the endpoint, in SSE `message`
 * frames, range reads and poll batches):
 *
 * {
 *   "id":           "5f0c...",          // required, string
 *   "offset":       42,                 // required, unsigned, > 0
 *   "type":         "text",             // required, see EventKind
 *   "payload":      { ... },            // kind-specific object
 *   "sender_id":    "alice",
 *   "recipient_id": "bob",
 *   "timestamp":    "2025-12-07T10:15:30Z"
 * }
 *
 * Public API :
 *   - StreamEvent::parse(text | json)
 *   - StreamEvent::serialize(event)
 *   - parse_range_read(), parse_poll(), parse_send_receipt()
 *   - payload helpers get_string(), get<T>()
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <vix/json/Simple.hpp> // vix::json::token / kvs

namespace durasync
{
    namespace detail
    {
        inline nlohmann::json token_to_nlohmann(const vix::json::token &t)
        {
            nlohmann::json j = nullptr;
            std::visit(
                [&](auto &&val)
                {
                    using T = std::decay_t<decltype(val)>;
                    if constexpr (std::is_same_v<T, std::monostate>)
                    {
                        j = nullptr;
                    }
                    else if constexpr (std::is_same_v<T, bool> ||
                                       std::is_same_v<T, long long> ||
                                       std::is_same_v<T, double> ||
                                       std::is_same_v<T, std::string>)
                    {
                        j = val;
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<vix::json::array_t>>)
                    {
                        if (!val)
                        {
                            j = nullptr;
                            return;
                        }
                        j = nlohmann::json::array();
                        for (const auto &el : val->elems)
                        {
                            j.push_back(token_to_nlohmann(el));
                        }
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<vix::json::kvs>>)
                    {
                        if (!val)
                        {
                            j = nullptr;
                            return;
                        }
                        nlohmann::json obj = nlohmann::json::object();
                        const auto &a = val->flat;
                        const size_t n = a.size() - (a.size() % 2);
                        for (size_t i = 0; i < n; i += 2)
                        {
                            const auto &k = a[i].v;
                            if (!std::holds_alternative<std::string>(k))
                                continue;
                            obj[std::get<std::string>(k)] = token_to_nlohmann(a[i + 1]);
                        }
                        j = std::move(obj);
                    }
                    else
                    {
                        j = nullptr;
                    }
                },
                t.v);
            return j;
        }

        /// Flat { k, v, k, v, ... } token list -> JSON object.
        inline nlohmann::json kvs_to_nlohmann(const vix::json::kvs &list)
        {
            nlohmann::json obj = nlohmann::json::object();
            const auto &a = list.flat;
            const size_t n = a.size() - (a.size() % 2);

            for (size_t i = 0; i < n; i += 2)
            {
                const auto &k = a[i].v;
                if (!std::holds_alternative<std::string>(k))
                    continue;

                obj[std::get<std::string>(k)] = token_to_nlohmann(a[i + 1]);
            }
            return obj;
        }

        /// Read a string field accepting both snake_case and camelCase spellings.
        inline std::string string_field(const nlohmann::json &j,
                                        const char *snake,
                                        const char *camel)
        {
            if (auto it = j.find(snake); it != j.end() && it->is_string())
                return it->get<std::string>();
            if (auto it = j.find(camel); it != j.end() && it->is_string())
                return it->get<std::string>();
            return {};
        }

        inline std::optional<std::uint64_t> offset_field(const nlohmann::json &j,
                                                         const char *snake,
                                                         const char *camel)
        {
            auto it = j.find(snake);
            if (it == j.end())
                it = j.find(camel);
            if (it == j.end() || !it->is_number_unsigned())
            {
                // a literal 0 is parsed as unsigned; negatives and floats are rejected
                return std::nullopt;
            }
            return it->get<std::uint64_t>();
        }

    } // namespace detail

    /// Kind of a stream event; wire names in to_string().
    enum class EventKind
    {
        Text,
        FileMeta,
        Image,
        Typing,
        ReadReceipt,
        DeliveryReceipt,
        System,
        Presence
    };

    inline const char *to_string(EventKind kind) noexcept
    {
        switch (kind)
        {
        case EventKind::Text:
            return "text";
        case EventKind::FileMeta:
            return "file";
        case EventKind::Image:
            return "image";
        case EventKind::Typing:
            return "typing";
        case EventKind::ReadReceipt:
            return "read_receipt";
        case EventKind::DeliveryReceipt:
            return "delivery_receipt";
        case EventKind::System:
            return "system";
        case EventKind::Presence:
            return "presence";
        }
        return "system";
    }

    inline std::optional<EventKind> parse_event_kind(std::string_view s) noexcept
    {
        if (s == "text")
            return EventKind::Text;
        if (s == "file")
            return EventKind::FileMeta;
        if (s == "image")
            return EventKind::Image;
        if (s == "typing")
            return EventKind::Typing;
        if (s == "read_receipt")
            return EventKind::ReadReceipt;
        if (s == "delivery_receipt")
            return EventKind::DeliveryReceipt;
        if (s == "system")
            return EventKind::System;
        if (s == "presence")
            return EventKind::Presence;
        return std::nullopt;
    }

    /// One entry of the ordered event log.
    struct StreamEvent
    {
        std::string id;
        std::uint64_t offset = 0;
        EventKind kind = EventKind::Text;
        nlohmann::json payload = nlohmann::json::object();
        std::string senderId;
        std::string recipientId;
        std::string timestamp; ///< ISO-8601 / RFC 3339 as sent by the endpoint

        // ---- Payload helpers -----------------------------------------------

        /// Get a string from payload["key"], or empty string if missing.
        std::string get_string(const std::string &key) const
        {
            if (!payload.is_object())
                return {};
            auto it = payload.find(key);
            if (it == payload.end() || !it->is_string())
                return {};
            return it->get<std::string>();
        }

        /// Generic typed getter from payload.
        template <typename T>
        std::optional<T> get(const std::string &key) const
        {
            if (!payload.is_object())
                return std::nullopt;
            auto it = payload.find(key);
            if (it == payload.end() || it->is_null())
                return std::nullopt;
            try
            {
                return it->get<T>();
            }
            catch (const nlohmann::json::exception &)
            {
                return std::nullopt;
            }
        }

        /// Message ids carried by read / delivery receipts.
        std::vector<std::string> message_ids() const
        {
            std::vector<std::string> out;
            if (!payload.is_object())
                return out;
            auto it = payload.find("message_ids");
            if (it == payload.end())
                it = payload.find("messageIds");
            if (it == payload.end() || !it->is_array())
                return out;
            for (const auto &v : *it)
            {
                if (v.is_string())
                    out.push_back(v.get<std::string>());
            }
            return out;
        }

        // ---- Parse ---------------------------------------------------------

        static std::optional<StreamEvent> from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
                return std::nullopt;

            StreamEvent ev;
            ev.id = detail::string_field(j, "id", "id");

            auto offset = detail::offset_field(j, "offset", "offset");
            if (!offset || *offset == 0 || ev.id.empty())
                return std::nullopt;
            ev.offset = *offset;

            auto kind = parse_event_kind(detail::string_field(j, "type", "kind"));
            if (!kind)
                return std::nullopt;
            ev.kind = *kind;

            if (auto it = j.find("payload"); it != j.end())
                ev.payload = *it;

            ev.senderId = detail::string_field(j, "sender_id", "senderId");
            ev.recipientId = detail::string_field(j, "recipient_id", "recipientId");
            ev.timestamp = detail::string_field(j, "timestamp", "ts");

            return ev;
        }

        static std::optional<StreamEvent> parse(std::string_view s)
        {
            auto j = nlohmann::json::parse(s, nullptr, /*allow_exceptions=*/false);
            if (j.is_discarded())
                return std::nullopt;
            return from_json(j);
        }

        // ---- Serialize -----------------------------------------------------

        static nlohmann::json to_json(const StreamEvent &ev)
        {
            return nlohmann::json{
                {"id", ev.id},
                {"offset", ev.offset},
                {"type", to_string(ev.kind)},
                {"payload", ev.payload},
                {"sender_id", ev.senderId},
                {"recipient_id", ev.recipientId},
                {"timestamp", ev.timestamp},
            };
        }

        static std::string serialize(const StreamEvent &ev)
        {
            return to_json(ev).dump();
        }
    };

    /// Result of RangeRead(startOffset, endOffset?, limit).
    struct RangeReadResult
    {
        std::vector<StreamEvent> events;
        std::uint64_t startOffset = 0;
        std::uint64_t endOffset = 0;
        std::uint64_t totalOffset = 0;
        bool hasMore = false;
        std::string versionTag;
    };

    /// Result of Poll(offset, scope, timeout).
    struct PollResult
    {
        std::vector<StreamEvent> events;
        std::uint64_t nextOffset = 0;
        bool hasMore = false;
    };

    /// Result of SendEvent(...).
    struct SendReceipt
    {
        std::string id;
        std::uint64_t offset = 0;
        std::string timestamp;
    };

    namespace detail
    {
        /// Parse a "messages" array; any malformed entry invalidates the batch.
        inline std::optional<std::vector<StreamEvent>> parse_events(const nlohmann::json &j)
        {
            std::vector<StreamEvent> out;
            auto it = j.find("messages");
            if (it == j.end())
                return out;
            if (!it->is_array())
                return std::nullopt;

            out.reserve(it->size());
            for (const auto &item : *it)
            {
                auto ev = StreamEvent::from_json(item);
                if (!ev)
                    return std::nullopt;
                out.push_back(std::move(*ev));
            }
            return out;
        }

        inline bool bool_field(const nlohmann::json &j, const char *snake, const char *camel)
        {
            if (auto it = j.find(snake); it != j.end() && it->is_boolean())
                return it->get<bool>();
            if (auto it = j.find(camel); it != j.end() && it->is_boolean())
                return it->get<bool>();
            return false;
        }
    } // namespace detail

    inline std::optional<RangeReadResult> parse_range_read(std::string_view body)
    {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        auto events = detail::parse_events(j);
        if (!events)
            return std::nullopt;

        RangeReadResult r;
        r.events = std::move(*events);
        r.startOffset = detail::offset_field(j, "start_offset", "startOffset").value_or(0);
        r.endOffset = detail::offset_field(j, "end_offset", "endOffset").value_or(0);
        r.totalOffset = detail::offset_field(j, "total_offset", "totalOffset").value_or(0);
        r.hasMore = detail::bool_field(j, "has_more", "hasMore");
        return r;
    }

    inline std::optional<PollResult> parse_poll(std::string_view body)
    {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        auto events = detail::parse_events(j);
        if (!events)
            return std::nullopt;

        PollResult r;
        r.events = std::move(*events);
        r.nextOffset = detail::offset_field(j, "next_offset", "nextOffset").value_or(0);
        r.hasMore = detail::bool_field(j, "has_more", "hasMore");
        return r;
    }

    inline std::optional<SendReceipt> parse_send_receipt(std::string_view body)
    {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        if (!detail::bool_field(j, "success", "success"))
            return std::nullopt;

        auto it = j.find("message");
        if (it == j.end() || !it->is_object())
            return std::nullopt;

        SendReceipt r;
        r.id = detail::string_field(*it, "id", "id");
        r.offset = detail::offset_field(*it, "offset", "offset").value_or(0);
        r.timestamp = detail::string_field(*it, "timestamp", "ts");
        if (r.id.empty() || r.offset == 0)
            return std::nullopt;
        return r;
    }

    /// Body of POST /messages.
    inline std::string serialize_send_request(const std::string &recipientId,
                                              EventKind kind,
                                              const nlohmann::json &payload)
    {
        nlohmann::json j{
            {"type", to_string(kind)},
            {"recipient_id", recipientId},
            {"payload", payload},
        };
        return j.dump();
    }

} // namespace durasync

#endif // DURASYNC_PROTOCOL_HPP
