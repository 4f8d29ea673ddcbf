#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <durasync/Metrics.hpp>
#include <durasync/upload.hpp>

#include "fake_transport.hpp"

using namespace durasync;
using namespace durasync::test;

namespace
{
    constexpr std::size_t MiB = 1024 * 1024;

    std::filesystem::path write_temp_file(const std::string &name, std::size_t size)
    {
        std::error_code ec;
        auto dir = std::filesystem::temp_directory_path(ec);
        if (ec)
            dir = ".";
        auto path = dir / name;

        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
            data[i] = static_cast<char>((i * 31 + i / 4096) % 251);

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        return path;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    struct Rig
    {
        explicit Rig(Config cfg)
            : transport(std::make_shared<FakeTransport>(ioc.get_executor())),
              manager(UploadManager::create(ioc.get_executor(), transport, cfg, &metrics))
        {
            callbacks.on_progress = [this](double pct, std::uint64_t uploaded, std::uint64_t total)
            {
                progress.push_back(uploaded);
                lastPercent = pct;
                lastTotal = total;
            };
            callbacks.on_success = [this](const std::string &id, const std::string &loc)
            {
                ++successes;
                sessionId = id;
                location = loc;
            };
            callbacks.on_error = [this](const SyncError &e)
            { errors.push_back(e); };
        }

        net::io_context ioc;
        SyncMetrics metrics;
        std::shared_ptr<FakeTransport> transport;
        std::shared_ptr<UploadManager> manager;
        UploadCallbacks callbacks;

        std::vector<std::uint64_t> progress;
        double lastPercent = 0;
        std::uint64_t lastTotal = 0;
        int successes = 0;
        std::string sessionId;
        std::string location;
        std::vector<SyncError> errors;
    };

    Config upload_config(std::size_t chunk)
    {
        Config cfg;
        cfg.chunkSize = chunk;
        cfg.chunkRetryDelays = {std::chrono::milliseconds{0},
                                std::chrono::milliseconds{1},
                                std::chrono::milliseconds{1}};
        return cfg;
    }

    int transition_table()
    {
        CHECK(is_valid_transition(UploadState::Pending, UploadState::Uploading));
        CHECK(is_valid_transition(UploadState::Uploading, UploadState::Paused));
        CHECK(is_valid_transition(UploadState::Paused, UploadState::Uploading));
        CHECK(is_valid_transition(UploadState::Paused, UploadState::Aborted));
        CHECK(!is_valid_transition(UploadState::Paused, UploadState::Completed));
        CHECK(!is_valid_transition(UploadState::Completed, UploadState::Failed));
        CHECK(!is_valid_transition(UploadState::Aborted, UploadState::Uploading));
        CHECK(!is_valid_transition(UploadState::Failed, UploadState::Completed));
        CHECK(is_terminal(UploadState::Aborted));
        CHECK(!is_terminal(UploadState::Paused));
        return 0;
    }

    // 12 MiB in 5 MiB chunks, paused while chunk 2 is in flight.
    int pause_resume_sends_only_the_remainder()
    {
        const auto path = write_temp_file("durasync_upload_pause.bin", 12 * MiB);
        Rig rig(upload_config(5 * MiB));
        rig.transport->holdChunks = true;

        auto session = rig.manager->start(path, 0, {{"sender_id", "alice"}}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return rig.transport->held.size() == 1; }));
        CHECK(rig.transport->held[0].offset == 0);
        rig.transport->release_chunk(0, true);

        CHECK(run_until(rig.ioc, [&]
                        { return rig.transport->held.size() == 1; }));
        CHECK(rig.transport->held[0].offset == 5 * MiB);
        CHECK(session->pause());
        CHECK(session->state() == UploadState::Paused);

        // chunk 2 never lands remotely
        rig.transport->release_chunk(0, false);
        drain(rig.ioc);
        CHECK(session->state() == UploadState::Paused);
        CHECK(session->bytes_uploaded() == 5 * MiB);
        CHECK(rig.errors.empty());

        const auto receivedBefore = rig.transport->bytesReceived;
        const auto callsBefore = rig.transport->chunkCalls.size();
        CHECK(receivedBefore == 5 * MiB);

        rig.transport->holdChunks = false;
        CHECK(session->resume());
        CHECK(run_until(rig.ioc, [&]
                        { return rig.successes == 1; }));
        drain(rig.ioc);

        CHECK(rig.transport->discoverCalls == 2);
        CHECK(rig.transport->bytesReceived - receivedBefore == 7 * MiB);
        CHECK(rig.transport->chunkCalls.size() == callsBefore + 2);
        CHECK(rig.transport->chunkCalls[callsBefore].offset == 5 * MiB);
        CHECK(rig.transport->chunkCalls[callsBefore + 1].offset == 10 * MiB);
        CHECK(rig.transport->chunkCalls[callsBefore + 1].size == 2 * MiB);

        CHECK(rig.transport->remote.at(rig.sessionId) == read_file(path));
        CHECK(rig.location == "/files/" + rig.sessionId);
        CHECK(rig.lastTotal == 12 * MiB);
        CHECK(rig.lastPercent == 100.0);
        CHECK(rig.successes == 1);
        CHECK(rig.errors.empty());
        CHECK(session->state() == UploadState::Completed);
        CHECK(rig.metrics.uploads_completed_total.load() == 1);
        CHECK(rig.metrics.uploads_active.load() == 0);

        std::filesystem::remove(path);
        return 0;
    }

    int abort_with_chunk_in_flight_is_silent()
    {
        const auto path = write_temp_file("durasync_upload_abort.bin", 64 * 1024);
        Rig rig(upload_config(16 * 1024));
        rig.transport->holdChunks = true;

        auto session = rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return rig.transport->held.size() == 1; }));

        const auto id = session->session_id();
        CHECK(session->abort());
        CHECK(!session->abort());
        CHECK(!session->resume());

        rig.transport->release_chunk(0, true);
        run_until(rig.ioc, []
                  { return false; },
                  std::chrono::milliseconds{20});

        CHECK(rig.progress.empty());
        CHECK(rig.successes == 0);
        CHECK(rig.errors.empty());
        CHECK(session->state() == UploadState::Aborted);
        CHECK(rig.transport->terminated.size() == 1);
        CHECK(rig.transport->terminated[0] == id);
        CHECK(rig.manager->active_count() == 0);

        std::filesystem::remove(path);
        return 0;
    }

    int retries_exhaust_into_one_error()
    {
        const auto path = write_temp_file("durasync_upload_retry.bin", 4096);
        Rig rig(upload_config(1024));
        for (int i = 0; i < 10; ++i)
            rig.transport->chunkErrors.push_back(make_error_code(sync_errc::transport_failure));

        auto session = rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return !rig.errors.empty(); }));
        run_until(rig.ioc, []
                  { return false; },
                  std::chrono::milliseconds{20});

        // first attempt plus one retry per scheduled delay
        CHECK(rig.errors.size() == 1);
        CHECK(rig.errors[0].code == make_error_code(sync_errc::chunk_retries_exhausted));
        CHECK(rig.transport->chunkCalls.size() == 4);
        CHECK(rig.metrics.chunk_retries_total.load() == 3);
        CHECK(rig.successes == 0);
        CHECK(session->state() == UploadState::Failed);
        CHECK(rig.metrics.uploads_failed_total.load() == 1);

        std::filesystem::remove(path);
        return 0;
    }

    int last_scheduled_retry_can_succeed()
    {
        const auto path = write_temp_file("durasync_upload_last_retry.bin", 2048);
        Rig rig(upload_config(1024));
        for (int i = 0; i < 3; ++i)
            rig.transport->chunkErrors.push_back(make_error_code(sync_errc::transport_failure));

        auto session = rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return rig.successes == 1; }));

        CHECK(rig.errors.empty());
        CHECK(rig.transport->chunkCalls.size() == 5);
        CHECK(session->state() == UploadState::Completed);
        CHECK(rig.transport->remote.at(rig.sessionId) == read_file(path));

        std::filesystem::remove(path);
        return 0;
    }

    int empty_schedule_fails_on_first_error()
    {
        const auto path = write_temp_file("durasync_upload_no_retry.bin", 2048);
        Config cfg = upload_config(1024);
        cfg.chunkRetryDelays.clear();
        Rig rig(cfg);
        rig.transport->chunkErrors.push_back(make_error_code(sync_errc::transport_failure));

        rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return !rig.errors.empty(); }));
        drain(rig.ioc);

        CHECK(rig.errors.size() == 1);
        CHECK(rig.errors[0].code == make_error_code(sync_errc::chunk_retries_exhausted));
        CHECK(rig.transport->chunkCalls.size() == 1);

        std::filesystem::remove(path);
        return 0;
    }

    int throwing_callback_does_not_stall_transfer()
    {
        const auto path = write_temp_file("durasync_upload_throwing.bin", 3072);
        Rig rig(upload_config(1024));

        int progressCalls = 0;
        UploadCallbacks cb = rig.callbacks;
        cb.on_progress = [&](double, std::uint64_t, std::uint64_t)
        {
            ++progressCalls;
            if (progressCalls == 1)
                throw std::runtime_error("consumer bug");
            if (progressCalls == 2)
                throw 42;
        };

        auto session = rig.manager->start(path, 0, {}, cb);
        CHECK(run_until(rig.ioc, [&]
                        { return rig.successes == 1; }));

        CHECK(progressCalls == 3);
        CHECK(rig.errors.empty());
        CHECK(session->state() == UploadState::Completed);
        CHECK(rig.transport->remote.at(rig.sessionId) == read_file(path));

        std::filesystem::remove(path);
        return 0;
    }

    int capacity_error_is_not_retried()
    {
        const auto path = write_temp_file("durasync_upload_capacity.bin", 4096);
        Rig rig(upload_config(1024));
        rig.transport->chunkErrors.push_back(make_error_code(sync_errc::capacity_exceeded));

        auto session = rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return !rig.errors.empty(); }));
        drain(rig.ioc);

        CHECK(rig.errors.size() == 1);
        CHECK(classify(rig.errors[0].code) == ErrorClass::Capacity);
        CHECK(rig.transport->chunkCalls.size() == 1);
        CHECK(session->state() == UploadState::Failed);

        std::filesystem::remove(path);
        return 0;
    }

    int offset_conflict_rediscovers()
    {
        const auto path = write_temp_file("durasync_upload_conflict.bin", 4096);
        Rig rig(upload_config(1024));
        rig.transport->chunkErrors.push_back(make_error_code(sync_errc::offset_conflict));

        rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return rig.successes == 1; }));

        CHECK(rig.transport->discoverCalls == 2);
        CHECK(rig.errors.empty());
        CHECK(rig.transport->remote.at(rig.sessionId) == read_file(path));
        CHECK((rig.progress == std::vector<std::uint64_t>{1024, 2048, 3072, 4096}));

        std::filesystem::remove(path);
        return 0;
    }

    int finished_file_resumes_as_complete()
    {
        const auto path = write_temp_file("durasync_upload_again.bin", 2048);
        Rig rig(upload_config(1024));

        rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return rig.successes == 1; }));
        const auto calls = rig.transport->chunkCalls.size();

        rig.manager->start(path, 0, {}, rig.callbacks);
        CHECK(run_until(rig.ioc, [&]
                        { return rig.successes == 2; }));

        CHECK(rig.transport->chunkCalls.size() == calls);
        CHECK(rig.errors.empty());

        std::filesystem::remove(path);
        return 0;
    }

    int missing_file_throws()
    {
        Rig rig(upload_config(1024));
        bool threw = false;
        try
        {
            rig.manager->start("/nonexistent/durasync/file.bin", 0, {}, rig.callbacks);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        CHECK(threw);
        CHECK(rig.transport->discoverCalls == 0);
        return 0;
    }
} // namespace

int main()
{
    if (transition_table() != 0)
        return 1;
    if (pause_resume_sends_only_the_remainder() != 0)
        return 1;
    if (abort_with_chunk_in_flight_is_silent() != 0)
        return 1;
    if (retries_exhaust_into_one_error() != 0)
        return 1;
    if (last_scheduled_retry_can_succeed() != 0)
        return 1;
    if (empty_schedule_fails_on_first_error() != 0)
        return 1;
    if (throwing_callback_does_not_stall_transfer() != 0)
        return 1;
    if (capacity_error_is_not_retried() != 0)
        return 1;
    if (offset_conflict_rediscovers() != 0)
        return 1;
    if (finished_file_resumes_as_complete() != 0)
        return 1;
    if (missing_file_throws() != 0)
        return 1;

    std::cout << "upload_test passed\n";
    return 0;
}
