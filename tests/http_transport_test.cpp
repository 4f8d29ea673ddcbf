#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <durasync/HttpTransport.hpp>

#include "fake_transport.hpp"

using namespace durasync;
using namespace durasync::test;

namespace
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = net::ip::tcp;

    /// Accepts stream requests on loopback and answers each with one `connected` frame.
    struct StreamServer
    {
        explicit StreamServer(net::io_context &ioc, std::uint64_t head)
            : acceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0)),
              head(head)
        {
            accept();
        }

        std::string port() const { return std::to_string(acceptor.local_endpoint().port()); }

        void accept()
        {
            acceptor.async_accept([this](const boost::system::error_code &ec, tcp::socket socket)
                                  {
                if (ec)
                    return;
                auto conn = std::make_shared<Conn>(std::move(socket));
                conns.push_back(conn);
                http::async_read(conn->socket, conn->buffer, conn->req,
                                 [this, conn](const boost::system::error_code &rec, std::size_t)
                                 {
                                     if (rec)
                                         return;
                                     requests.push_back(conn->req);
                                     conn->out = "HTTP/1.1 200 OK\r\n"
                                                 "Content-Type: text/event-stream\r\n"
                                                 "Cache-Control: no-cache\r\n\r\n"
                                                 "event: connected\n"
                                                 "data: {\"offset\":" + std::to_string(head) + "}\n\n";
                                     net::async_write(conn->socket, net::buffer(conn->out),
                                                      [](const boost::system::error_code &, std::size_t) {});
                                 });
                accept(); });
        }

        struct Conn
        {
            explicit Conn(tcp::socket s) : socket(std::move(s)) {}
            tcp::socket socket;
            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            std::string out;
        };

        tcp::acceptor acceptor;
        std::uint64_t head;
        std::vector<std::shared_ptr<Conn>> conns;
        std::vector<http::request<http::string_body>> requests;
    };

    int resubscribe_sends_last_event_id()
    {
        net::io_context ioc;
        StreamServer server(ioc, 9);

        Endpoint ep;
        ep.port = server.port();
        auto transport = HttpTransport::create(ioc.get_executor(), ep, Config{});

        std::vector<std::uint64_t> acks;
        std::vector<boost::system::error_code> errors;
        StreamHandlers handlers;
        handlers.on_ack = [&](std::uint64_t head)
        { acks.push_back(head); };
        handlers.on_error = [&](boost::system::error_code ec)
        { errors.push_back(ec); };

        auto sub = transport->subscribe(7, StreamScope{"alice", "bob"}, handlers);
        CHECK(run_until(ioc, [&]
                        { return acks.size() == 1; }));

        CHECK(server.requests.size() == 1);
        const auto &req = server.requests[0];
        CHECK(req[http::field::accept] == "text/event-stream");
        CHECK(req["X-User-Id"] == "alice");
        CHECK(req["Last-Event-ID"] == "7");
        const std::string target(req.target());
        CHECK(target.find("offset=7") != std::string::npos);
        CHECK(target.find("with_user=bob") != std::string::npos);
        CHECK(acks[0] == 9);
        CHECK(errors.empty());

        sub->cancel();
        drain(ioc);
        return 0;
    }

    int fresh_stream_has_no_last_event_id()
    {
        net::io_context ioc;
        StreamServer server(ioc, 0);

        Endpoint ep;
        ep.port = server.port();
        auto transport = HttpTransport::create(ioc.get_executor(), ep, Config{});

        int acks = 0;
        StreamHandlers handlers;
        handlers.on_ack = [&](std::uint64_t)
        { ++acks; };

        auto sub = transport->subscribe(0, StreamScope{"alice", {}}, handlers);
        CHECK(run_until(ioc, [&]
                        { return acks == 1; }));

        CHECK(server.requests.size() == 1);
        CHECK(server.requests[0].count("Last-Event-ID") == 0);

        sub->cancel();
        drain(ioc);
        return 0;
    }
} // namespace

int main()
{
    if (resubscribe_sends_last_event_id() != 0)
        return 1;
    if (fresh_stream_has_no_last_event_id() != 0)
        return 1;

    std::cout << "http_transport_test passed\n";
    return 0;
}
