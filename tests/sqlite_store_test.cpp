#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <durasync/cursor.hpp>
#include <durasync/SqliteSyncStore.hpp>

#include "fake_transport.hpp"

using namespace durasync;
using namespace durasync::test;

namespace
{
    int cursors()
    {
        SqliteSyncStore store(":memory:");
        const auto scope = make_scope("alice", "bob");

        CHECK(!store.load_cursor(scope));

        store.save_cursor(scope, CursorCheckpoint{12, "v12"});
        auto cp = store.load_cursor(scope);
        CHECK(cp);
        CHECK(cp->offset == 12);
        CHECK(cp->versionTag == "v12");

        // a stale writer never moves the checkpoint backwards
        store.save_cursor(scope, CursorCheckpoint{7, ""});
        CHECK(store.load_cursor(scope)->offset == 12);

        store.save_cursor(scope, CursorCheckpoint{20, "v20"});
        CHECK(store.load_cursor(scope)->offset == 20);
        CHECK(!store.load_cursor(make_scope("alice")));
        return 0;
    }

    int journal()
    {
        SqliteSyncStore store(":memory:");
        const auto scope = make_scope("alice");

        for (std::uint64_t o : {3, 1, 2, 5})
            store.append_event(scope, make_event(o));
        store.append_event(scope, make_event(2)); // redelivery
        store.append_event(make_scope("carol"), make_event(4, "carol", "dave"));

        auto all = store.replay_from(scope, 0, 100);
        CHECK(all.size() == 4);
        CHECK(all[0].offset == 1);
        CHECK(all[3].offset == 5);
        CHECK(all[1].get_string("content") == "msg 2");

        auto tail = store.replay_from(scope, 2, 1);
        CHECK(tail.size() == 1);
        CHECK(tail[0].offset == 3);

        CHECK(store.replay_from(scope, 0, 0).empty());
        CHECK(store.replay_from(make_scope("carol"), 0, 10).size() == 1);
        return 0;
    }

    int uploads()
    {
        SqliteSyncStore store(":memory:");

        CHECK(!store.find_upload("fp-1"));
        store.remember_upload("fp-1", RememberedUpload{"s1", "/tus/files/s1"});
        store.remember_upload("fp-2", RememberedUpload{"s2", "/tus/files/s2"});

        auto up = store.find_upload("fp-1");
        CHECK(up);
        CHECK(up->sessionId == "s1");
        CHECK(up->location == "/tus/files/s1");

        store.forget_upload("fp-1");
        CHECK(!store.find_upload("fp-1"));

        store.forget_upload("s2", true);
        CHECK(!store.find_upload("fp-2"));
        return 0;
    }

    int survives_reopen()
    {
        std::error_code ec;
        auto path = std::filesystem::temp_directory_path(ec);
        if (ec)
            path = ".";
        path /= "durasync_store_test.db";
        std::filesystem::remove(path, ec);

        {
            SqliteSyncStore store(path.string());
            store.save_cursor("global:alice", CursorCheckpoint{42, ""});
            store.append_event("global:alice", make_event(42));
        }
        {
            SqliteSyncStore store(path.string());
            CHECK(store.load_cursor("global:alice")->offset == 42);
            CHECK(store.replay_from("global:alice", 41, 10).size() == 1);
        }

        std::filesystem::remove(path, ec);
        std::filesystem::remove(path.string() + "-wal", ec);
        std::filesystem::remove(path.string() + "-shm", ec);
        return 0;
    }

    int unopenable_path_throws()
    {
        bool threw = false;
        try
        {
            SqliteSyncStore store("/nonexistent/durasync/dir/store.db");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        CHECK(threw);
        return 0;
    }
} // namespace

int main()
{
    if (cursors() != 0)
        return 1;
    if (journal() != 0)
        return 1;
    if (uploads() != 0)
        return 1;
    if (survives_reopen() != 0)
        return 1;
    if (unopenable_path_throws() != 0)
        return 1;

    std::cout << "sqlite_store_test passed\n";
    return 0;
}
