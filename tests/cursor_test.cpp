#include <iostream>
#include <thread>
#include <vector>

#include <durasync/cursor.hpp>

#include "fake_transport.hpp"

using namespace durasync;

int main()
{
    CHECK(make_scope("alice") == "global:alice");
    CHECK(make_scope("alice", "bob") == "peer:alice:bob");

    {
        Cursor c(make_scope("alice"));
        CHECK(c.last() == 0);
        CHECK(!c.advanced());

        CHECK(c.advance(1));
        CHECK(c.advance(5));
        CHECK(!c.advance(5));
        CHECK(!c.advance(3));
        CHECK(c.last() == 5);
        CHECK(c.advanced());

        c.set_version_tag("v5");
        CHECK(c.version_tag() == "v5");

        c.reset(2);
        CHECK(c.last() == 2);
        CHECK(c.advance(3));
    }

    {
        Cursor c("peer:alice:bob", 40);
        CHECK(c.last() == 40);
        CHECK(!c.advanced());
        CHECK(!c.advance(40));
    }

    // concurrent writers: the highest offset wins, nothing moves backwards
    {
        Cursor c("global:alice");
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t)
        {
            writers.emplace_back([&c, t]()
                                 {
                for (std::uint64_t o = 1; o <= 1000; ++o)
                    c.advance(o * 4 + static_cast<std::uint64_t>(t)); });
        }
        for (auto &w : writers)
            w.join();
        CHECK(c.last() == 4003);
    }

    std::cout << "cursor_test passed\n";
    return 0;
}
