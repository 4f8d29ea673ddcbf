#ifndef DURASYNC_SQLITE_SYNC_STORE_HPP
#define DURASYNC_SQLITE_SYNC_STORE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <durasync/SyncStore.hpp>

struct sqlite3;

namespace durasync
{
    class SqliteSyncStore : public ISyncStore
    {
    public:
        /// Opens (or creates) the database in WAL mode. ":memory:" is accepted.
        explicit SqliteSyncStore(const std::string &db_path);
        ~SqliteSyncStore() override;

        SqliteSyncStore(const SqliteSyncStore &) = delete;
        SqliteSyncStore &operator=(const SqliteSyncStore &) = delete;
        SqliteSyncStore(SqliteSyncStore &&) = delete;
        SqliteSyncStore &operator=(SqliteSyncStore &&) = delete;

        void save_cursor(const std::string &scope, const CursorCheckpoint &cp) override;
        [[nodiscard]] std::optional<CursorCheckpoint> load_cursor(const std::string &scope) override;

        void append_event(const std::string &scope, const StreamEvent &ev) override;
        [[nodiscard]] std::vector<StreamEvent> replay_from(const std::string &scope,
                                                           std::uint64_t afterOffset,
                                                           std::size_t limit) override;

        void remember_upload(const std::string &fingerprint, const RememberedUpload &up) override;
        [[nodiscard]] std::optional<RememberedUpload> find_upload(const std::string &fingerprint) override;
        void forget_upload(const std::string &key, bool bySession = false) override;

    private:
        void init_schema();
        void exec(const char *sql, const char *stage);

        std::mutex mutex_;
        sqlite3 *db_{nullptr};
    };

} // namespace durasync

#endif // DURASYNC_SQLITE_SYNC_STORE_HPP
