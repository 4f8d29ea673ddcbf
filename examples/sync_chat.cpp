/**
 * @file sync_chat.cpp
 * @brief Interactive terminal chat on top of durasync::SyncClient.
 *
 * This example connects to a durable stream endpoint as one user, follows the
 * conversation with one peer and lets the user send messages from the
 * terminal. The stream cursor is checkpointed in a local SQLite file, so
 * restarting the example continues exactly where it stopped: nothing is
 * shown twice and nothing is skipped.
 *
 * Core Features Demonstrated
 * ---------------------------
 * 1. Durable resume:
 *      The cursor of the peer conversation is restored from
 *      "<user>.sync.db" on connect.
 *
 * 2. Typed events:
 *      text, typing, read receipts and presence are printed differently.
 *
 * 3. Resumable uploads:
 *      "/upload <path>" starts a chunked upload that can be paused, resumed
 *      or aborted with "/pause", "/resume" and "/abort".
 *
 * How to Run
 * ----------
 *   ./build/examples/sync_chat alice bob [host] [port]
 *
 * Commands: /history, /typing, /read <id>, /upload <path>, /pause, /resume,
 *           /abort, /metrics, /quit. Any other line is sent as text.
 */

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <vix/config/Config.hpp>

#include <durasync.hpp>

int main(int argc, char **argv)
{
    if (argc < 3)
    {
        std::cerr << "usage: " << argv[0] << " <user> <peer> [host] [port]\n";
        return 1;
    }

    const std::string user = argv[1];
    const std::string peer = argv[2];

    durasync::Endpoint endpoint;
    if (argc > 3)
        endpoint.host = argv[3];
    if (argc > 4)
        endpoint.port = argv[4];

    // ------------------------------------------------------------
    // 1) Load configuration ("sync.*", "upload.*", "transport.*")
    // ------------------------------------------------------------
    vix::config::Config core{"config/config.json"};
    const auto cfg = durasync::Config::from_core(core);

    // ------------------------------------------------------------
    // 2) Create the client with a local store
    // ------------------------------------------------------------
    std::shared_ptr<durasync::SyncClient> client;
    try
    {
        client = durasync::SyncClient::create(endpoint, user, cfg, user + ".sync.db");
    }
    catch (const std::exception &e)
    {
        std::cerr << "[sync] cannot start: " << e.what() << std::endl;
        return 1;
    }

    // ------------------------------------------------------------
    // 3) Print incoming events
    // ------------------------------------------------------------
    client->on_event([&user](const durasync::StreamEvent &ev)
                     {
        switch (ev.kind)
        {
        case durasync::EventKind::Text:
            std::cout << "[" << ev.offset << "] " << ev.senderId << ": "
                      << ev.get_string("content") << std::endl;
            break;
        case durasync::EventKind::Typing:
            if (ev.senderId != user && ev.get<bool>("is_typing").value_or(false))
                std::cout << "  " << ev.senderId << " is typing..." << std::endl;
            break;
        case durasync::EventKind::ReadReceipt:
            std::cout << "  " << ev.senderId << " read " << ev.message_ids().size()
                      << " message(s)" << std::endl;
            break;
        case durasync::EventKind::Presence:
            std::cout << "  " << ev.senderId
                      << (ev.get<bool>("is_online").value_or(false) ? " is online" : " went offline")
                      << std::endl;
            break;
        default:
            std::cout << "[" << ev.offset << "] " << durasync::to_string(ev.kind) << " "
                      << ev.payload.dump() << std::endl;
            break;
        } });

    client->on_connection_offset([](std::uint64_t offset)
                                 { std::cout << "[sync] connected at offset " << offset << std::endl; });

    client->on_error([](const durasync::SyncError &err)
                     { std::cerr << "[sync] error: " << err.message() << std::endl; });

    client->connect(peer);
    client->send_presence(peer, true);

    std::cout << "Type messages, /quit to exit\n";

    // ------------------------------------------------------------
    // 4) Input loop
    // ------------------------------------------------------------
    std::shared_ptr<durasync::UploadSession> upload;

    for (std::string line; std::getline(std::cin, line);)
    {
        if (line == "/quit")
            break;

        if (line == "/history")
        {
            client->load_history(50, [](const boost::system::error_code &ec, durasync::RangeReadResult r)
                                 {
                if (ec)
                {
                    std::cerr << "[sync] history: " << ec.message() << std::endl;
                    return;
                }
                for (const auto &ev : r.events)
                    std::cout << "  (" << ev.offset << ") " << ev.senderId << ": "
                              << ev.get_string("content") << std::endl; });
        }
        else if (line == "/typing")
        {
            client->send_typing(peer, true);
        }
        else if (line.rfind("/read ", 0) == 0)
        {
            client->send_read_receipt(peer, {line.substr(6)});
        }
        else if (line.rfind("/upload ", 0) == 0)
        {
            durasync::UploadCallbacks cb;
            cb.on_progress = [](double pct, std::uint64_t done, std::uint64_t total)
            {
                std::cout << "[upload] " << static_cast<int>(pct) << "% (" << done << "/" << total << ")"
                          << std::endl;
            };
            cb.on_success = [](const std::string &id, const std::string &location)
            {
                std::cout << "[upload] done " << id << " -> " << location << std::endl;
            };
            cb.on_error = [](const durasync::SyncError &err)
            {
                std::cerr << "[upload] failed: " << err.message() << std::endl;
            };

            try
            {
                upload = client->upload(std::filesystem::path(line.substr(8)), peer, std::move(cb));
            }
            catch (const std::invalid_argument &e)
            {
                std::cerr << "[upload] " << e.what() << std::endl;
            }
        }
        else if (line == "/pause" || line == "/resume" || line == "/abort")
        {
            if (!upload)
            {
                std::cerr << "[upload] nothing to control" << std::endl;
                continue;
            }
            const bool ok = line == "/pause"    ? upload->pause()
                            : line == "/resume" ? upload->resume()
                                                : upload->abort();
            std::cout << "[upload] " << (ok ? "" : "cannot ") << line.substr(1)
                      << " (" << durasync::to_string(upload->state()) << ")" << std::endl;
        }
        else if (line == "/metrics")
        {
            std::cout << client->metrics().render_prometheus();
        }
        else if (!line.empty())
        {
            client->send_text(peer, line);
        }
    }

    client->close();
    return 0;
}
