#include <durasync/HttpTransport.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <mutex>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <vix/utils/Logger.hpp>

#include <durasync/errors.hpp>
#include <durasync/sse.hpp>

namespace durasync
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = net::ip::tcp;
    using Logger = vix::utils::Logger;

    namespace
    {
        constexpr const char *kUserAgent = "durasync";
        constexpr const char *kTusVersion = "1.0.0";

        std::string url_encode(std::string_view s)
        {
            static const char *hex = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s)
            {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
                {
                    out.push_back(static_cast<char>(c));
                }
                else
                {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

        std::optional<std::uint64_t> header_u64(const http::fields &f, beast::string_view name)
        {
            auto it = f.find(name);
            if (it == f.end())
                return std::nullopt;

            const auto v = it->value();
            std::uint64_t out = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
            if (ec != std::errc{} || ptr != v.data() + v.size())
                return std::nullopt;
            return out;
        }

        /// "/tus/files/abc" or "http://host:port/tus/files/abc" -> "abc"
        std::string session_from_location(std::string_view location)
        {
            while (!location.empty() && location.back() == '/')
                location.remove_suffix(1);
            const auto slash = location.rfind('/');
            return std::string(slash == std::string_view::npos ? location : location.substr(slash + 1));
        }

        template <typename Store, typename F>
        void with_store(const std::shared_ptr<Store> &store, const char *stage, F &&fn)
        {
            if (!store)
                return;
            try
            {
                fn(*store);
            }
            catch (const std::exception &e)
            {
                Logger::getInstance().log(Logger::Level::WARN,
                                          "[durasync][Http] store {} failed: {}", stage, e.what());
            }
        }

        // ───────────────────────── one-shot request ─────────────────────────

        class HttpCall : public std::enable_shared_from_this<HttpCall>
        {
        public:
            using Response = http::response<http::string_body>;
            using Handler = std::function<void(const boost::system::error_code &, Response)>;

            HttpCall(net::any_io_executor ex,
                     const Endpoint &ep,
                     http::request<http::string_body> req,
                     std::chrono::steady_clock::duration timeout,
                     Handler handler)
                : resolver_(net::make_strand(ex)),
                  stream_(resolver_.get_executor()),
                  host_(ep.host),
                  port_(ep.port),
                  req_(std::move(req)),
                  timeout_(timeout),
                  handler_(std::move(handler))
            {
                req_.set(http::field::host, host_ + ":" + port_);
                req_.set(http::field::user_agent, kUserAgent);
                req_.prepare_payload();

                parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
                if (req_.method() == http::verb::head)
                    parser_.skip(true);
            }

            void run()
            {
                resolver_.async_resolve(host_, port_,
                                        beast::bind_front_handler(&HttpCall::on_resolve, shared_from_this()));
            }

        private:
            void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec)
                    return finish(ec);

                stream_.expires_after(timeout_);
                stream_.async_connect(results,
                                      beast::bind_front_handler(&HttpCall::on_connect, shared_from_this()));
            }

            void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (ec)
                    return finish(ec);

                http::async_write(stream_, req_,
                                  beast::bind_front_handler(&HttpCall::on_write, shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return finish(ec);

                http::async_read(stream_, buffer_, parser_,
                                 beast::bind_front_handler(&HttpCall::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return finish(ec);

                beast::error_code sec;
                stream_.socket().shutdown(tcp::socket::shutdown_both, sec);
                if (sec && sec != beast::errc::not_connected)
                {
                    Logger::getInstance().log(Logger::Level::DEBUG,
                                              "[durasync][Http] shutdown: {}", sec.message());
                }

                finish({});
            }

            void finish(beast::error_code ec)
            {
                if (!handler_)
                    return;
                auto h = std::move(handler_);
                handler_ = nullptr;
                if (ec)
                    h(ec, Response{});
                else
                    h(ec, parser_.release());
            }

        private:
            tcp::resolver resolver_;
            beast::tcp_stream stream_;
            std::string host_;
            std::string port_;
            http::request<http::string_body> req_;
            beast::flat_buffer buffer_;
            http::response_parser<http::string_body> parser_;
            std::chrono::steady_clock::duration timeout_;
            Handler handler_;
        };

        http::request<http::string_body> make_request(http::verb verb, std::string target)
        {
            http::request<http::string_body> req{verb, target, 11};
            req.keep_alive(false);
            return req;
        }

        // ───────────────────────── SSE subscription ─────────────────────────

        class SseSubscription : public Subscription,
                                public std::enable_shared_from_this<SseSubscription>
        {
        public:
            SseSubscription(net::any_io_executor ex,
                            const Endpoint &ep,
                            std::string target,
                            std::string userId,
                            std::uint64_t offset,
                            const Config &cfg,
                            StreamHandlers handlers)
                : resolver_(net::make_strand(ex)),
                  stream_(resolver_.get_executor()),
                  host_(ep.host),
                  port_(ep.port),
                  target_(std::move(target)),
                  userId_(std::move(userId)),
                  offset_(offset),
                  connectTimeout_(cfg.requestTimeout),
                  idleTimeout_(cfg.idleTimeout),
                  handlers_(std::move(handlers))
            {
                parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
            }

            void start()
            {
                resolver_.async_resolve(host_, port_,
                                        beast::bind_front_handler(&SseSubscription::on_resolve, shared_from_this()));
            }

            void cancel() override
            {
                {
                    std::lock_guard<std::recursive_mutex> lock(gateMutex_);
                    if (cancelled_)
                        return;
                    cancelled_ = true;
                }

                auto self = shared_from_this();
                net::post(stream_.get_executor(), [self]()
                          {
                              self->resolver_.cancel();
                              self->stream_.cancel();
                              self->stream_.close(); });
            }

        private:
            template <typename F>
            void emit(F &&fn)
            {
                std::lock_guard<std::recursive_mutex> lock(gateMutex_);
                if (cancelled_ || failed_)
                    return;
                fn();
            }

            void fail(const boost::system::error_code &ec)
            {
                emit([&]
                     {
                         failed_ = true;
                         if (handlers_.on_error)
                             handlers_.on_error(ec); });

                beast::error_code ignored;
                stream_.socket().close(ignored);
            }

            void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec)
                    return fail(ec);

                stream_.expires_after(connectTimeout_);
                stream_.async_connect(results,
                                      beast::bind_front_handler(&SseSubscription::on_connect, shared_from_this()));
            }

            void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (ec)
                    return fail(ec);

                req_ = http::request<http::empty_body>{http::verb::get, target_, 11};
                req_.keep_alive(true);
                req_.set(http::field::host, host_ + ":" + port_);
                req_.set(http::field::user_agent, kUserAgent);
                req_.set(http::field::accept, "text/event-stream");
                req_.set(http::field::cache_control, "no-cache");
                req_.set("X-User-Id", userId_);
                if (offset_ > 0)
                    req_.set("Last-Event-ID", std::to_string(offset_)); // resume after the last delivered event

                http::async_write(stream_, req_,
                                  beast::bind_front_handler(&SseSubscription::on_write, shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return fail(ec);

                http::async_read_header(stream_, buffer_, parser_,
                                        beast::bind_front_handler(&SseSubscription::on_header, shared_from_this()));
            }

            void on_header(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return fail(ec);

                const auto status = parser_.get().result_int();
                if (status != 200)
                {
                    Logger::getInstance().log(Logger::Level::WARN,
                                              "[durasync][Http] stream rejected with {}", status);
                    // no SSE route on this endpoint
                    if (status == 404 || status == 405 || status == 501)
                        return fail(make_error_code(sync_errc::push_unavailable));
                    return fail(from_http_status(status));
                }

                read_body();
            }

            void read_body()
            {
                if (idleTimeout_.count() > 0)
                    stream_.expires_after(idleTimeout_);
                else
                    stream_.expires_never();

                parser_.get().body().data = chunk_;
                parser_.get().body().size = sizeof(chunk_);

                http::async_read_some(stream_, buffer_, parser_,
                                      beast::bind_front_handler(&SseSubscription::on_body, shared_from_this()));
            }

            void on_body(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::need_buffer)
                    ec = {};

                const auto n = sizeof(chunk_) - parser_.get().body().size;
                if (n > 0)
                {
                    for (auto &frame : sse_.feed(std::string_view(chunk_, n)))
                        on_frame(frame);
                }

                if (ec)
                {
                    if (ec == beast::error::timeout)
                    {
                        Logger::getInstance().log(Logger::Level::WARN,
                                                  "[durasync][Http] stream idle for {}s", idleTimeout_.count());
                    }
                    return fail(ec);
                }

                if (parser_.is_done())
                    return fail(make_error_code(sync_errc::transport_failure)); // endpoint closed the stream

                read_body();
            }

            void on_frame(const SseFrame &frame)
            {
                if (frame.event == "connected")
                {
                    auto j = nlohmann::json::parse(frame.data, nullptr, false);
                    auto head = j.is_discarded() ? std::nullopt : detail::offset_field(j, "offset", "offset");
                    if (!head)
                    {
                        emit([&]
                             {
                                 if (handlers_.on_error)
                                     handlers_.on_error(make_error_code(sync_errc::protocol_violation)); });
                        return;
                    }

                    emit([&]
                         {
                             if (handlers_.on_ack)
                                 handlers_.on_ack(*head); });

                    // the endpoint replays a bounded backlog and none at all from 0
                    const bool uncovered = *head > offset_ &&
                                           (offset_ == 0 || *head - offset_ > kSseReplayLimit);
                    if (uncovered)
                    {
                        emit([&]
                             {
                                 if (handlers_.on_gap)
                                     handlers_.on_gap(); });
                    }
                }
                else if (frame.event == "message")
                {
                    auto ev = StreamEvent::parse(frame.data);
                    emit([&]
                         {
                             if (!ev)
                             {
                                 if (handlers_.on_error)
                                     handlers_.on_error(make_error_code(sync_errc::protocol_violation));
                                 return;
                             }
                             if (handlers_.on_event)
                                 handlers_.on_event(std::move(*ev)); });
                }
                else if (frame.event == "reset")
                {
                    emit([&]
                         {
                             if (handlers_.on_gap)
                                 handlers_.on_gap(); });
                }
                else if (frame.event != "heartbeat")
                {
                    Logger::getInstance().log(Logger::Level::DEBUG,
                                              "[durasync][Http] ignoring SSE event '{}'", frame.event);
                }
            }

        private:
            tcp::resolver resolver_;
            beast::tcp_stream stream_;
            std::string host_;
            std::string port_;
            std::string target_;
            std::string userId_;
            std::uint64_t offset_;
            std::chrono::seconds connectTimeout_;
            std::chrono::seconds idleTimeout_;
            StreamHandlers handlers_;

            http::request<http::empty_body> req_;
            beast::flat_buffer buffer_;
            http::response_parser<http::buffer_body> parser_;
            char chunk_[8192];
            SseParser sse_;

            std::recursive_mutex gateMutex_;
            bool cancelled_{false};
            bool failed_{false};
        };

    } // namespace

    // ───────────────────────── helpers ─────────────────────────

    std::string base64_encode(std::string_view in)
    {
        static const char *alphabet =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::string out;
        out.reserve(((in.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 2 < in.size(); i += 3)
        {
            const auto n = (static_cast<unsigned char>(in[i]) << 16) |
                           (static_cast<unsigned char>(in[i + 1]) << 8) |
                           static_cast<unsigned char>(in[i + 2]);
            out.push_back(alphabet[(n >> 18) & 0x3F]);
            out.push_back(alphabet[(n >> 12) & 0x3F]);
            out.push_back(alphabet[(n >> 6) & 0x3F]);
            out.push_back(alphabet[n & 0x3F]);
        }

        const auto rest = in.size() - i;
        if (rest == 1)
        {
            const auto n = static_cast<unsigned char>(in[i]) << 16;
            out.push_back(alphabet[(n >> 18) & 0x3F]);
            out.push_back(alphabet[(n >> 12) & 0x3F]);
            out += "==";
        }
        else if (rest == 2)
        {
            const auto n = (static_cast<unsigned char>(in[i]) << 16) |
                           (static_cast<unsigned char>(in[i + 1]) << 8);
            out.push_back(alphabet[(n >> 18) & 0x3F]);
            out.push_back(alphabet[(n >> 12) & 0x3F]);
            out.push_back(alphabet[(n >> 6) & 0x3F]);
            out.push_back('=');
        }
        return out;
    }

    std::string encode_upload_metadata(const UploadMetadata &metadata)
    {
        std::string out;
        for (const auto &[key, value] : metadata)
        {
            if (key.empty())
                continue;
            if (!out.empty())
                out.push_back(',');
            out += key;
            if (!value.empty())
            {
                out.push_back(' ');
                out += base64_encode(value);
            }
        }
        return out;
    }

    // ───────────────────────── HttpTransport ─────────────────────────

    HttpTransport::HttpTransport(net::any_io_executor ex,
                                 Endpoint endpoint,
                                 Config cfg,
                                 std::shared_ptr<ISyncStore> store)
        : ex_(std::move(ex)),
          endpoint_(std::move(endpoint)),
          cfg_(std::move(cfg)),
          store_(std::move(store))
    {
    }

    TransportCapabilities HttpTransport::capabilities() const
    {
        return TransportCapabilities{true, true};
    }

    std::string HttpTransport::upload_target(const std::string &sessionId) const
    {
        return endpoint_.uploadsBase + "/" + url_encode(sessionId);
    }

    std::shared_ptr<Subscription> HttpTransport::subscribe(std::uint64_t offset,
                                                           const StreamScope &scope,
                                                           StreamHandlers handlers)
    {
        std::string target = endpoint_.streamsBase + "/stream?offset=" + std::to_string(offset);
        if (!scope.peer.empty())
            target += "&with_user=" + url_encode(scope.peer);

        auto sub = std::make_shared<SseSubscription>(ex_, endpoint_, std::move(target),
                                                     scope.owner, offset, cfg_, std::move(handlers));
        sub->start();
        return sub;
    }

    void HttpTransport::range_read(const StreamScope &scope,
                                   std::uint64_t start,
                                   std::optional<std::uint64_t> end,
                                   std::size_t limit,
                                   Completion<RangeReadResult> done)
    {
        // the endpoint's range start is exclusive
        const auto after = start > 0 ? start - 1 : 0;

        auto req = make_request(http::verb::get,
                                endpoint_.streamsBase + "/messages?offset=" + std::to_string(after) +
                                    "&limit=" + std::to_string(limit));
        req.set(http::field::range,
                "offset=" + std::to_string(after) + "-" + (end ? std::to_string(*end) : std::string{}));
        req.set("X-User-Id", scope.owner);

        auto call = std::make_shared<HttpCall>(
            ex_, endpoint_, std::move(req), cfg_.requestTimeout,
            [scope, done = std::move(done)](const boost::system::error_code &ec, HttpCall::Response res)
            {
                if (ec)
                    return done(ec, RangeReadResult{});
                if (auto sc = from_http_status(res.result_int()))
                    return done(sc, RangeReadResult{});

                auto parsed = parse_range_read(res.body());
                if (!parsed)
                    return done(make_error_code(sync_errc::protocol_violation), RangeReadResult{});

                auto &events = parsed->events;
                events.erase(std::remove_if(events.begin(), events.end(),
                                            [&](const StreamEvent &ev)
                                            { return !scope.matches(ev); }),
                             events.end());

                parsed->versionTag = std::string(res[http::field::etag]);
                done({}, std::move(*parsed));
            });
        call->run();
    }

    void HttpTransport::poll(const StreamScope &scope,
                             std::uint64_t offset,
                             std::chrono::seconds timeout,
                             Completion<PollResult> done)
    {
        std::string target = endpoint_.streamsBase + "/poll?offset=" + std::to_string(offset) +
                             "&timeout_secs=" + std::to_string(timeout.count());
        if (!scope.peer.empty())
            target += "&with_user=" + url_encode(scope.peer);

        auto req = make_request(http::verb::get, std::move(target));
        req.set("X-User-Id", scope.owner);

        auto call = std::make_shared<HttpCall>(
            ex_, endpoint_, std::move(req), timeout + cfg_.requestTimeout,
            [done = std::move(done)](const boost::system::error_code &ec, HttpCall::Response res)
            {
                if (ec)
                    return done(ec, PollResult{});
                if (auto sc = from_http_status(res.result_int()))
                    return done(sc, PollResult{});

                auto parsed = parse_poll(res.body());
                if (!parsed)
                    return done(make_error_code(sync_errc::protocol_violation), PollResult{});

                // one page per request; a full page means more may be waiting
                if (parsed->events.size() >= kSseReplayLimit)
                    parsed->hasMore = true;
                done({}, std::move(*parsed));
            });
        call->run();
    }

    void HttpTransport::send_event(const std::string &senderId,
                                   const std::string &recipientId,
                                   EventKind kind,
                                   nlohmann::json payload,
                                   Completion<SendReceipt> done)
    {
        auto req = make_request(http::verb::post, endpoint_.streamsBase + "/messages");
        req.set("X-Sender-Id", senderId);
        req.set(http::field::content_type, "application/json");
        req.body() = serialize_send_request(recipientId, kind, payload);

        auto call = std::make_shared<HttpCall>(
            ex_, endpoint_, std::move(req), cfg_.requestTimeout,
            [done = std::move(done)](const boost::system::error_code &ec, HttpCall::Response res)
            {
                if (ec)
                    return done(ec, SendReceipt{});
                if (auto sc = from_http_status(res.result_int()))
                    return done(sc, SendReceipt{});

                auto receipt = parse_send_receipt(res.body());
                if (!receipt)
                    return done(make_error_code(sync_errc::protocol_violation), SendReceipt{});
                done({}, std::move(*receipt));
            });
        call->run();
    }

    void HttpTransport::create_or_resume_upload(const UploadSignature &signature,
                                                std::uint64_t totalBytes,
                                                const UploadMetadata &metadata,
                                                Completion<UploadSessionInfo> done)
    {
        const auto fingerprint = signature.fingerprint();

        std::optional<RememberedUpload> known;
        with_store(store_, "find_upload", [&](ISyncStore &s)
                   { known = s.find_upload(fingerprint); });

        if (!known)
        {
            create_upload(signature, totalBytes, metadata, std::move(done));
            return;
        }

        auto req = make_request(http::verb::head, upload_target(known->sessionId));
        req.set("Tus-Resumable", kTusVersion);

        auto self = shared_from_this();
        auto call = std::make_shared<HttpCall>(
            ex_, endpoint_, std::move(req), cfg_.requestTimeout,
            [self, signature, totalBytes, metadata, fingerprint, known = *known,
             done = std::move(done)](const boost::system::error_code &ec, HttpCall::Response res) mutable
            {
                if (ec)
                    return done(ec, UploadSessionInfo{});

                auto sc = from_http_status(res.result_int());
                const auto remoteLength = header_u64(res.base(), "Upload-Length");
                const bool stale = classify(sc) == ErrorClass::SessionNotFound ||
                                   (!sc && remoteLength && *remoteLength != totalBytes);
                if (stale)
                {
                    Logger::getInstance().log(Logger::Level::INFO,
                                              "[durasync][Http] upload {} no longer resumable, creating a new one",
                                              known.sessionId);
                    with_store(self->store_, "forget_upload", [&](ISyncStore &s)
                               { s.forget_upload(fingerprint); });
                    self->create_upload(signature, totalBytes, metadata, std::move(done));
                    return;
                }
                if (sc)
                    return done(sc, UploadSessionInfo{});

                auto offset = header_u64(res.base(), "Upload-Offset");
                if (!offset)
                    return done(make_error_code(sync_errc::protocol_violation), UploadSessionInfo{});

                UploadSessionInfo info;
                info.sessionId = known.sessionId;
                info.resumeOffset = *offset;
                info.totalBytes = totalBytes;
                info.location = known.location;
                done({}, std::move(info));
            });
        call->run();
    }

    void HttpTransport::create_upload(const UploadSignature &signature,
                                      std::uint64_t totalBytes,
                                      const UploadMetadata &metadata,
                                      Completion<UploadSessionInfo> done)
    {
        UploadMetadata md = metadata;
        auto has = [&](const char *key)
        {
            return std::any_of(md.begin(), md.end(), [&](const auto &kv)
                               { return kv.first == key; });
        };
        if (!has("filename"))
            md.emplace_back("filename", signature.filename);
        if (!has("filetype"))
            md.emplace_back("filetype", signature.mimeType);

        auto req = make_request(http::verb::post, endpoint_.uploadsBase);
        req.set("Tus-Resumable", kTusVersion);
        req.set("Upload-Length", std::to_string(totalBytes));
        req.set("Upload-Metadata", encode_upload_metadata(md));

        const auto fingerprint = signature.fingerprint();
        auto self = shared_from_this();
        auto call = std::make_shared<HttpCall>(
            ex_, endpoint_, std::move(req), cfg_.requestTimeout,
            [self, fingerprint, totalBytes, done = std::move(done)](const boost::system::error_code &ec,
                                                                     HttpCall::Response res)
            {
                if (ec)
                    return done(ec, UploadSessionInfo{});
                if (auto sc = from_http_status(res.result_int()))
                    return done(sc, UploadSessionInfo{});

                const std::string location(res[http::field::location]);
                if (location.empty())
                    return done(make_error_code(sync_errc::protocol_violation), UploadSessionInfo{});

                UploadSessionInfo info;
                info.sessionId = session_from_location(location);
                info.resumeOffset = header_u64(res.base(), "Upload-Offset").value_or(0);
                info.totalBytes = totalBytes;
                info.location = location;

                with_store(self->store_, "remember_upload", [&](ISyncStore &s)
                           { s.remember_upload(fingerprint, RememberedUpload{info.sessionId, info.location}); });

                Logger::getInstance().log(Logger::Level::DEBUG,
                                          "[durasync][Http] created upload {} ({} bytes)",
                                          info.sessionId, totalBytes);
                done({}, std::move(info));
            });
        call->run();
    }

    void HttpTransport::upload_chunk(const std::string &sessionId,
                                     std::uint64_t offset,
                                     std::string bytes,
                                     Completion<std::uint64_t> done)
    {
        auto req = make_request(http::verb::patch, upload_target(sessionId));
        req.set("Tus-Resumable", kTusVersion);
        req.set("Upload-Offset", std::to_string(offset));
        req.set(http::field::content_type, "application/offset+octet-stream");
        req.body() = std::move(bytes);

        auto call = std::make_shared<HttpCall>(
            ex_, endpoint_, std::move(req), cfg_.requestTimeout,
            [done = std::move(done)](const boost::system::error_code &ec, HttpCall::Response res)
            {
                if (ec)
                    return done(ec, 0);

                const auto status = res.result_int();
                if (status == 415)
                    return done(make_error_code(sync_errc::protocol_violation), 0);
                if (auto sc = from_http_status(status))
                    return done(sc, 0);

                auto newOffset = header_u64(res.base(), "Upload-Offset");
                if (!newOffset)
                    return done(make_error_code(sync_errc::protocol_violation), 0);
                done({}, *newOffset);
            });
        call->run();
    }

    void HttpTransport::terminate_upload(const std::string &sessionId,
                                         std::function<void(const ErrorCode &)> done)
    {
        with_store(store_, "forget_upload", [&](ISyncStore &s)
                   { s.forget_upload(sessionId, true); });

        auto req = make_request(http::verb::delete_, upload_target(sessionId));
        req.set("Tus-Resumable", kTusVersion);

        auto call = std::make_shared<HttpCall>(
            ex_, endpoint_, std::move(req), cfg_.requestTimeout,
            [done = std::move(done)](const boost::system::error_code &ec, HttpCall::Response res)
            {
                if (!done)
                    return;
                if (ec)
                    return done(ec);

                auto sc = from_http_status(res.result_int());
                if (classify(sc) == ErrorClass::SessionNotFound)
                    sc = {}; // already gone
                done(sc);
            });
        call->run();
    }

} // namespace durasync
