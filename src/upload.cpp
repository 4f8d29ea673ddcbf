#include <durasync/upload.hpp>

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace durasync
{
    using Logger = vix::utils::Logger;

    namespace
    {
        /// Consumer callbacks run on the upload strand; a throw must not reach the io thread.
        template <typename F, typename... Args>
        void notify(const char *name, const std::string &file, const F &cb, Args &&...args)
        {
            if (!cb)
                return;
            try
            {
                cb(std::forward<Args>(args)...);
            }
            catch (const std::exception &e)
            {
                Logger::getInstance().log(Logger::Level::ERROR,
                                          "[durasync][Upload] {} callback for {} threw: {}", name, file, e.what());
            }
            catch (...)
            {
                Logger::getInstance().log(Logger::Level::ERROR,
                                          "[durasync][Upload] {} callback for {} threw a non-standard exception",
                                          name, file);
            }
        }
    } // namespace

    const char *to_string(UploadState s) noexcept
    {
        switch (s)
        {
        case UploadState::Pending:
            return "pending";
        case UploadState::Uploading:
            return "uploading";
        case UploadState::Paused:
            return "paused";
        case UploadState::Completed:
            return "completed";
        case UploadState::Failed:
            return "failed";
        case UploadState::Aborted:
            return "aborted";
        }
        return "unknown";
    }

    bool is_terminal(UploadState s) noexcept
    {
        return s == UploadState::Completed || s == UploadState::Failed || s == UploadState::Aborted;
    }

    bool is_valid_transition(UploadState from, UploadState to) noexcept
    {
        switch (from)
        {
        case UploadState::Pending:
            return to == UploadState::Uploading ||
                   to == UploadState::Failed ||
                   to == UploadState::Aborted;
        case UploadState::Uploading:
            return to == UploadState::Paused ||
                   to == UploadState::Completed ||
                   to == UploadState::Failed ||
                   to == UploadState::Aborted;
        case UploadState::Paused:
            return to == UploadState::Uploading ||
                   to == UploadState::Aborted;
        case UploadState::Completed:
        case UploadState::Failed:
        case UploadState::Aborted:
            return false;
        }
        return false;
    }

    // ───────────────────────── UploadSession ─────────────────────────

    UploadSession::UploadSession(net::any_io_executor ex,
                                 std::shared_ptr<ITransport> transport,
                                 const Config &cfg,
                                 SyncMetrics *metrics,
                                 std::filesystem::path file,
                                 UploadSignature signature,
                                 std::size_t chunkSize,
                                 UploadMetadata metadata,
                                 UploadCallbacks callbacks)
        : strand_(net::make_strand(std::move(ex))),
          timer_(strand_),
          transport_(std::move(transport)),
          retryDelays_(cfg.chunkRetryDelays),
          metrics_(metrics),
          file_(std::move(file)),
          in_(file_, std::ios::binary),
          signature_(std::move(signature)),
          chunkSize_(chunkSize),
          metadata_(std::move(metadata)),
          callbacks_(std::move(callbacks))
    {
        if (!in_)
            throw std::invalid_argument("cannot open " + file_.string());
    }

    UploadSession::~UploadSession() = default;

    std::string UploadSession::session_id() const
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);
        return sessionId_;
    }

    bool UploadSession::transition(UploadState to)
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);
        const auto from = state_.load(std::memory_order_acquire);
        if (!is_valid_transition(from, to))
            return false;

        state_.store(to, std::memory_order_release);
        Logger::getInstance().log(Logger::Level::DEBUG,
                                  "[durasync][Upload] {} {} -> {}",
                                  signature_.filename, to_string(from), to_string(to));

        if (is_terminal(to))
            on_terminal(to);
        return true;
    }

    void UploadSession::on_terminal(UploadState s)
    {
        if (!metrics_)
            return;
        if (metrics_->uploads_active.load() > 0)
            metrics_->uploads_active--;
        if (s == UploadState::Completed)
            metrics_->uploads_completed_total++;
        else if (s == UploadState::Failed)
            metrics_->uploads_failed_total++;
    }

    bool UploadSession::current(std::uint64_t epoch) const
    {
        return epoch_.load(std::memory_order_acquire) == epoch &&
               state() == UploadState::Uploading;
    }

    bool UploadSession::pause()
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);
        if (!transition(UploadState::Paused))
            return false;

        epoch_.fetch_add(1, std::memory_order_acq_rel);

        auto self = shared_from_this();
        net::post(strand_, [self]()
                  { self->timer_.cancel(); });
        return true;
    }

    bool UploadSession::resume()
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);
        if (!transition(UploadState::Uploading))
            return false;

        const auto epoch = epoch_.fetch_add(1, std::memory_order_acq_rel) + 1;

        auto self = shared_from_this();
        net::post(strand_, [self, epoch]()
                  {
                      self->attempt_ = 0;
                      self->discover(epoch); });
        return true;
    }

    bool UploadSession::abort()
    {
        std::string remote;
        {
            std::lock_guard<std::recursive_mutex> gate(gateMutex_);
            if (!transition(UploadState::Aborted))
                return false;
            epoch_.fetch_add(1, std::memory_order_acq_rel);
            remote = sessionId_;
        }

        auto self = shared_from_this();
        net::post(strand_, [self]()
                  { self->timer_.cancel(); });

        Logger::getInstance().log(Logger::Level::INFO,
                                  "[durasync][Upload] {} aborted at {}/{}",
                                  signature_.filename, bytes_uploaded(), total_bytes());

        if (!remote.empty())
            terminate_remote(remote);
        return true;
    }

    void UploadSession::terminate_remote(const std::string &sessionId)
    {
        transport_->terminate_upload(
            sessionId,
            [sessionId](const boost::system::error_code &ec)
            {
                if (ec)
                {
                    Logger::getInstance().log(Logger::Level::WARN,
                                              "[durasync][Upload] terminate {} failed: {}",
                                              sessionId, ec.message());
                }
            });
    }

    void UploadSession::begin()
    {
        const auto epoch = epoch_.load(std::memory_order_acquire);
        auto self = shared_from_this();
        net::post(strand_, [self, epoch]()
                  { self->discover(epoch); });
    }

    void UploadSession::discover(std::uint64_t epoch)
    {
        if (epoch_.load(std::memory_order_acquire) != epoch || is_terminal(state()))
            return;

        auto self = shared_from_this();
        transport_->create_or_resume_upload(
            signature_,
            signature_.totalBytes,
            metadata_,
            [self, epoch](const boost::system::error_code &ec, UploadSessionInfo info)
            {
                net::post(self->strand_, [self, epoch, ec, info = std::move(info)]()
                          {
                    if (self->state() == UploadState::Aborted && !ec && !info.sessionId.empty())
                    {
                        // created after abort(): don't leave it resumable
                        self->terminate_remote(info.sessionId);
                        return;
                    }
                    if (self->epoch_.load(std::memory_order_acquire) != epoch ||
                        is_terminal(self->state()) || self->state() == UploadState::Paused)
                        return;

                    if (ec)
                    {
                        if (!is_retryable(ec))
                        {
                            self->fail(ec, "upload.discover");
                            return;
                        }
                        self->retry_or_fail(epoch, ec, true);
                        return;
                    }

                    {
                        std::lock_guard<std::recursive_mutex> gate(self->gateMutex_);
                        self->sessionId_ = info.sessionId;
                        self->location_ = info.location;
                    }
                    self->bytesUploaded_.store(std::min(info.resumeOffset, self->total_bytes()),
                                               std::memory_order_release);

                    Logger::getInstance().log(Logger::Level::INFO,
                                              "[durasync][Upload] {} session {} resumes at {}/{}",
                                              self->signature_.filename, info.sessionId,
                                              self->bytes_uploaded(), self->total_bytes());

                    if (self->state() == UploadState::Pending &&
                        !self->transition(UploadState::Uploading))
                        return;

                    if (self->bytes_uploaded() >= self->total_bytes())
                    {
                        self->complete();
                        return;
                    }
                    self->send_chunk(epoch); });
            });
    }

    void UploadSession::send_chunk(std::uint64_t epoch)
    {
        if (!current(epoch))
            return;

        const auto offset = bytes_uploaded();
        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunkSize_, total_bytes() - offset));

        std::string bytes(want, '\0');
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(offset));
        in_.read(bytes.data(), static_cast<std::streamsize>(want));
        if (!in_ || static_cast<std::size_t>(in_.gcount()) != want)
        {
            fail(boost::system::errc::make_error_code(boost::system::errc::io_error), "upload.read");
            return;
        }

        std::string sessionId;
        {
            std::lock_guard<std::recursive_mutex> gate(gateMutex_);
            sessionId = sessionId_;
        }

        auto self = shared_from_this();
        transport_->upload_chunk(
            sessionId,
            offset,
            std::move(bytes),
            [self, epoch, offset](const boost::system::error_code &ec, std::uint64_t newOffset)
            {
                net::post(self->strand_, [self, epoch, offset, ec, newOffset]()
                          {
                    if (!self->current(epoch))
                        return; // paused or aborted while in flight

                    if (ec)
                    {
                        const auto cls = classify(ec);
                        const bool rediscover = cls == ErrorClass::SessionNotFound ||
                                                ec == make_error_code(sync_errc::offset_conflict);
                        self->retry_or_fail(epoch, ec, rediscover);
                        return;
                    }

                    if (newOffset <= offset || newOffset > self->total_bytes())
                    {
                        self->fail(make_error_code(sync_errc::protocol_violation), "upload.chunk");
                        return;
                    }

                    self->attempt_ = 0;
                    self->bytesUploaded_.store(newOffset, std::memory_order_release);
                    if (self->metrics_)
                        self->metrics_->upload_bytes_total += newOffset - offset;

                    {
                        std::lock_guard<std::recursive_mutex> gate(self->gateMutex_);
                        if (self->state() != UploadState::Uploading)
                            return;
                        const double total = static_cast<double>(self->total_bytes());
                        const double pct = total > 0 ? (100.0 * static_cast<double>(newOffset) / total) : 100.0;
                        notify("progress", self->signature_.filename, self->callbacks_.on_progress,
                               pct, newOffset, self->total_bytes());
                    }

                    if (newOffset >= self->total_bytes())
                    {
                        self->complete();
                        return;
                    }
                    self->send_chunk(epoch); });
            });
    }

    void UploadSession::retry_or_fail(std::uint64_t epoch,
                                      const boost::system::error_code &ec,
                                      bool rediscover)
    {
        if (!rediscover && !is_retryable(ec))
        {
            fail(ec, "upload.chunk");
            return;
        }

        // retryDelays_[i] is the wait before retry i + 1
        ++attempt_;
        if (attempt_ > retryDelays_.size())
        {
            Logger::getInstance().log(Logger::Level::ERROR,
                                      "[durasync][Upload] {} retries exhausted at {} ({})",
                                      signature_.filename, bytes_uploaded(), ec.message());
            fail(make_error_code(sync_errc::chunk_retries_exhausted), "upload.chunk");
            return;
        }

        if (metrics_)
            metrics_->chunk_retries_total++;

        const auto delay = retryDelays_[attempt_ - 1];
        Logger::getInstance().log(Logger::Level::WARN,
                                  "[durasync][Upload] {} attempt {} failed ({}), retry in {}ms",
                                  signature_.filename, attempt_, ec.message(), delay.count());

        auto self = shared_from_this();
        timer_.expires_after(delay);
        timer_.async_wait(
            [self, epoch, rediscover](const boost::system::error_code &tec)
            {
                if (tec == net::error::operation_aborted)
                    return;
                if (rediscover || self->state() == UploadState::Pending)
                    self->discover(epoch);
                else
                    self->send_chunk(epoch);
            });
    }

    void UploadSession::complete()
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);
        if (!transition(UploadState::Completed))
            return;

        Logger::getInstance().log(Logger::Level::INFO,
                                  "[durasync][Upload] {} completed ({} bytes) -> {}",
                                  signature_.filename, total_bytes(), location_);

        notify("success", signature_.filename, callbacks_.on_success, sessionId_, location_);
    }

    void UploadSession::fail(const boost::system::error_code &ec, const char *stage)
    {
        std::lock_guard<std::recursive_mutex> gate(gateMutex_);
        if (!transition(UploadState::Failed))
            return;

        Logger::getInstance().log(Logger::Level::ERROR,
                                  "[durasync][Upload] {} failed: {}", signature_.filename, ec.message());

        notify("error", signature_.filename, callbacks_.on_error, SyncError{ec, stage});
    }

    // ───────────────────────── UploadManager ─────────────────────────

    UploadManager::UploadManager(net::any_io_executor ex,
                                 std::shared_ptr<ITransport> transport,
                                 Config cfg,
                                 SyncMetrics *metrics)
        : ex_(std::move(ex)),
          transport_(std::move(transport)),
          cfg_(std::move(cfg)),
          metrics_(metrics)
    {
        if (!transport_)
            throw std::invalid_argument("UploadManager requires a transport");
    }

    std::shared_ptr<UploadSession> UploadManager::start(const std::filesystem::path &file,
                                                        std::size_t chunkSize,
                                                        UploadMetadata metadata,
                                                        UploadCallbacks callbacks,
                                                        std::string mimeType)
    {
        std::error_code fsErr;
        const auto size = std::filesystem::file_size(file, fsErr);
        if (fsErr)
            throw std::invalid_argument("cannot stat " + file.string() + ": " + fsErr.message());

        const auto mtime = std::filesystem::last_write_time(file, fsErr);
        if (fsErr)
            throw std::invalid_argument("cannot stat " + file.string() + ": " + fsErr.message());

        UploadSignature sig;
        sig.filename = file.filename().string();
        sig.mimeType = mimeType.empty() ? "application/octet-stream" : std::move(mimeType);
        sig.totalBytes = size;
        sig.lastWrite = std::chrono::duration_cast<std::chrono::seconds>(
                            mtime.time_since_epoch())
                            .count();

        auto session = std::shared_ptr<UploadSession>(new UploadSession(
            ex_, transport_, cfg_, metrics_, file, std::move(sig),
            chunkSize == 0 ? cfg_.chunkSize : chunkSize,
            std::move(metadata), std::move(callbacks)));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                           [](const std::weak_ptr<UploadSession> &w)
                                           { return w.expired(); }),
                            sessions_.end());
            sessions_.push_back(session);
        }

        if (metrics_)
        {
            metrics_->uploads_started_total++;
            metrics_->uploads_active++;
        }

        Logger::getInstance().log(Logger::Level::INFO,
                                  "[durasync][Upload] start {} ({} bytes, chunk {})",
                                  session->signature().filename, size,
                                  chunkSize == 0 ? cfg_.chunkSize : chunkSize);

        session->begin();
        return session;
    }

    std::vector<std::shared_ptr<UploadSession>> UploadManager::live_unlocked() const
    {
        std::vector<std::shared_ptr<UploadSession>> out;
        for (const auto &w : sessions_)
        {
            if (auto s = w.lock(); s && !is_terminal(s->state()))
                out.push_back(std::move(s));
        }
        return out;
    }

    std::size_t UploadManager::active_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_unlocked().size();
    }

    void UploadManager::abort_all()
    {
        std::vector<std::shared_ptr<UploadSession>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            live = live_unlocked();
        }
        for (auto &s : live)
            s->abort();
    }

} // namespace durasync
