#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>

#include <durasync/dispatcher.hpp>

#include "fake_transport.hpp"

using namespace durasync;
using namespace durasync::test;

namespace
{
    int ordered_fan_out()
    {
        net::io_context ioc;
        auto d = EventDispatcher::create(ioc.get_executor());
        const auto epoch = d->begin_epoch();

        std::vector<std::string> seen;
        d->on_event([&](const StreamEvent &ev)
                    { seen.push_back("a" + std::to_string(ev.offset)); });
        d->on_event([&](const StreamEvent &ev)
                    { seen.push_back("b" + std::to_string(ev.offset)); });

        std::vector<std::uint64_t> offsets;
        d->on_connection_offset([&](std::uint64_t o)
                                { offsets.push_back(o); });

        d->dispatch_offset(epoch, 7);
        for (std::uint64_t o = 8; o <= 10; ++o)
            d->dispatch_event(epoch, make_event(o));
        drain(ioc);

        CHECK((seen == std::vector<std::string>{"a8", "b8", "a9", "b9", "a10", "b10"}));
        CHECK((offsets == std::vector<std::uint64_t>{7}));
        CHECK(d->handler_count() == 3);
        return 0;
    }

    int removal_takes_effect_inside_a_delivery()
    {
        net::io_context ioc;
        auto d = EventDispatcher::create(ioc.get_executor());
        const auto epoch = d->begin_epoch();

        int second = 0;
        EventDispatcher::HandlerId secondId = 0;
        d->on_event([&](const StreamEvent &)
                    { d->remove(secondId); });
        secondId = d->on_event([&](const StreamEvent &)
                               { ++second; });

        d->dispatch_event(epoch, make_event(1));
        d->dispatch_event(epoch, make_event(2));
        drain(ioc);

        CHECK(second == 0);
        CHECK(d->handler_count() == 1);
        CHECK(!d->remove(secondId));
        CHECK(!d->remove(9999));
        return 0;
    }

    int throwing_handler_does_not_stop_others()
    {
        net::io_context ioc;
        auto d = EventDispatcher::create(ioc.get_executor());
        const auto epoch = d->begin_epoch();

        int calls = 0;
        d->on_error([](const SyncError &)
                    { throw std::runtime_error("consumer bug"); });
        d->on_error([&](const SyncError &)
                    { ++calls; });

        d->dispatch_error(epoch, SyncError{make_error_code(sync_errc::protocol_violation), "test"});
        drain(ioc);
        CHECK(calls == 1);

        // not derived from std::exception
        d->on_event([](const StreamEvent &)
                    { throw 42; });
        int events = 0;
        d->on_event([&](const StreamEvent &)
                    { ++events; });
        d->dispatch_event(epoch, make_event(1));
        drain(ioc);
        CHECK(events == 1);
        return 0;
    }

    int invalidate_discards_queued_deliveries()
    {
        net::io_context ioc;
        auto d = EventDispatcher::create(ioc.get_executor());
        const auto stale = d->begin_epoch();

        std::vector<std::uint64_t> offsets;
        d->on_event([&](const StreamEvent &ev)
                    { offsets.push_back(ev.offset); });

        d->dispatch_event(stale, make_event(1));
        d->dispatch_event(stale, make_event(2));
        d->invalidate();
        drain(ioc);
        CHECK(offsets.empty());

        const auto fresh = d->begin_epoch();
        d->dispatch_event(stale, make_event(3));
        d->dispatch_event(fresh, make_event(4));
        drain(ioc);
        CHECK((offsets == std::vector<std::uint64_t>{4}));
        return 0;
    }

    // invalidate() from another thread waits for the running handler
    int invalidate_waits_for_running_delivery()
    {
        net::io_context ioc;
        auto work = net::make_work_guard(ioc);
        auto d = EventDispatcher::create(ioc.get_executor());
        const auto epoch = d->begin_epoch();

        std::atomic<bool> inside{false};
        std::atomic<bool> finished{false};
        std::atomic<int> delivered{0};
        d->on_event([&](const StreamEvent &)
                    {
                        inside = true;
                        std::this_thread::sleep_for(std::chrono::milliseconds{50});
                        finished = true;
                        ++delivered; });

        std::thread runner([&ioc]()
                           { ioc.run(); });

        d->dispatch_event(epoch, make_event(1));
        d->dispatch_event(epoch, make_event(2));
        while (!inside)
            std::this_thread::yield();

        d->invalidate();
        const bool waited = finished.load();
        const int afterInvalidate = delivered.load();

        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        work.reset();
        ioc.stop();
        runner.join();

        CHECK(waited);
        CHECK(afterInvalidate == 1);
        CHECK(delivered.load() == 1);
        return 0;
    }

    // a new epoch starts while a slow handler is still running
    int begin_epoch_does_not_wait_for_running_delivery()
    {
        net::io_context ioc;
        auto work = net::make_work_guard(ioc);
        auto d = EventDispatcher::create(ioc.get_executor());
        const auto epoch = d->begin_epoch();

        std::promise<void> release;
        std::shared_future<void> released = release.get_future().share();
        std::atomic<bool> inside{false};
        std::atomic<bool> sawRelease{false};
        std::atomic<int> later{0};

        d->on_event([&](const StreamEvent &)
                    {
                        inside = true;
                        sawRelease = released.wait_for(std::chrono::seconds{2}) == std::future_status::ready; });
        d->on_event([&](const StreamEvent &)
                    { ++later; });

        std::thread runner([&ioc]()
                           { ioc.run(); });

        d->dispatch_event(epoch, make_event(1));
        while (!inside)
            std::this_thread::yield();

        const auto t0 = std::chrono::steady_clock::now();
        const auto next = d->begin_epoch();
        const auto elapsed = std::chrono::steady_clock::now() - t0;
        release.set_value();

        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        work.reset();
        ioc.stop();
        runner.join();

        CHECK(elapsed < std::chrono::milliseconds{500});
        CHECK(sawRelease);
        CHECK(next == epoch + 1);
        CHECK(later.load() == 0); // the rest of the stale delivery is skipped
        return 0;
    }
} // namespace

int main()
{
    if (ordered_fan_out() != 0)
        return 1;
    if (removal_takes_effect_inside_a_delivery() != 0)
        return 1;
    if (throwing_handler_does_not_stop_others() != 0)
        return 1;
    if (invalidate_discards_queued_deliveries() != 0)
        return 1;
    if (invalidate_waits_for_running_delivery() != 0)
        return 1;
    if (begin_epoch_does_not_wait_for_running_delivery() != 0)
        return 1;

    std::cout << "dispatcher_test passed\n";
    return 0;
}
