#include <durasync/SqliteSyncStore.hpp>

#include <stdexcept>

#include <sqlite3.h>

#include <vix/utils/Logger.hpp>

namespace durasync
{
    // ───────────────────────── Helpers ─────────────────────────

    namespace
    {
        void sqlite_check(int rc, sqlite3 *db, const char *stage)
        {
            if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
            {
                std::string msg = "[SqliteSyncStore] ";
                msg += stage;
                msg += " error: ";
                msg += sqlite3_errmsg(db);
                throw std::runtime_error(msg);
            }
        }

        /// Finalizes the statement on every exit path.
        struct Statement
        {
            Statement(sqlite3 *db, const char *sql, const char *stage)
                : db_(db)
            {
                sqlite_check(sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr), db, stage);
            }

            ~Statement()
            {
                if (stmt_)
                    sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            void bind(int idx, const std::string &v, const char *stage)
            {
                sqlite_check(sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT), db_, stage);
            }

            void bind(int idx, std::uint64_t v, const char *stage)
            {
                sqlite_check(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)), db_, stage);
            }

            /// True while a row is available.
            bool step(const char *stage)
            {
                const int rc = sqlite3_step(stmt_);
                sqlite_check(rc, db_, stage);
                return rc == SQLITE_ROW;
            }

            std::string text(int col) const
            {
                const unsigned char *p = sqlite3_column_text(stmt_, col);
                return p ? std::string(reinterpret_cast<const char *>(p)) : std::string{};
            }

            std::uint64_t u64(int col) const
            {
                return static_cast<std::uint64_t>(sqlite3_column_int64(stmt_, col));
            }

            sqlite3 *db_;
            sqlite3_stmt *stmt_{nullptr};
        };
    } // namespace

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteSyncStore::SqliteSyncStore(const std::string &db_path)
    {
        int rc = sqlite3_open(db_path.c_str(), &db_);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteSyncStore] Failed to open DB: ";
            msg += sqlite3_errstr(rc);
            if (db_)
            {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error(msg);
        }

        try
        {
            exec("PRAGMA journal_mode=WAL;", "set WAL");
            init_schema();
        }
        catch (...)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    SqliteSyncStore::~SqliteSyncStore()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteSyncStore::exec(const char *sql, const char *stage)
    {
        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteSyncStore] ";
            msg += stage;
            msg += " failed: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            throw std::runtime_error(msg);
        }
    }

    void SqliteSyncStore::init_schema()
    {
        exec("CREATE TABLE IF NOT EXISTS cursors ("
             "  scope       TEXT PRIMARY KEY,"
             "  last_offset INTEGER NOT NULL,"
             "  version_tag TEXT NOT NULL DEFAULT ''"
             ");"
             "CREATE TABLE IF NOT EXISTS events ("
             "  scope        TEXT NOT NULL,"
             "  event_offset INTEGER NOT NULL,"
             "  id           TEXT NOT NULL,"
             "  event_json   TEXT NOT NULL,"
             "  PRIMARY KEY (scope, event_offset)"
             ");"
             "CREATE TABLE IF NOT EXISTS uploads ("
             "  fingerprint  TEXT PRIMARY KEY,"
             "  session_id   TEXT NOT NULL,"
             "  location     TEXT NOT NULL"
             ");",
             "create tables");
    }

    // ───────────────────────── cursors ─────────────────────────

    void SqliteSyncStore::save_cursor(const std::string &scope, const CursorCheckpoint &cp)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement st(db_,
                     "INSERT INTO cursors (scope, last_offset, version_tag) VALUES (?1, ?2, ?3) "
                     "ON CONFLICT(scope) DO UPDATE SET "
                     "  last_offset = MAX(last_offset, excluded.last_offset),"
                     "  version_tag = excluded.version_tag;",
                     "prepare save_cursor");
        st.bind(1, scope, "bind scope");
        st.bind(2, cp.offset, "bind offset");
        st.bind(3, cp.versionTag, "bind version_tag");
        st.step("step save_cursor");
    }

    std::optional<CursorCheckpoint> SqliteSyncStore::load_cursor(const std::string &scope)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement st(db_,
                     "SELECT last_offset, version_tag FROM cursors WHERE scope = ?1;",
                     "prepare load_cursor");
        st.bind(1, scope, "bind scope");

        if (!st.step("step load_cursor"))
            return std::nullopt;

        CursorCheckpoint cp;
        cp.offset = st.u64(0);
        cp.versionTag = st.text(1);
        return cp;
    }

    // ───────────────────────── journal ─────────────────────────

    void SqliteSyncStore::append_event(const std::string &scope, const StreamEvent &ev)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement st(db_,
                     "INSERT OR IGNORE INTO events (scope, event_offset, id, event_json) "
                     "VALUES (?1, ?2, ?3, ?4);",
                     "prepare append_event");
        st.bind(1, scope, "bind scope");
        st.bind(2, ev.offset, "bind offset");
        st.bind(3, ev.id, "bind id");
        st.bind(4, StreamEvent::serialize(ev), "bind event");
        st.step("step append_event");
    }

    std::vector<StreamEvent> SqliteSyncStore::replay_from(const std::string &scope,
                                                          std::uint64_t afterOffset,
                                                          std::size_t limit)
    {
        std::vector<StreamEvent> out;
        if (limit == 0)
            return out;

        std::lock_guard<std::mutex> lock(mutex_);

        Statement st(db_,
                     "SELECT event_offset, event_json FROM events "
                     "WHERE scope = ?1 AND event_offset > ?2 "
                     "ORDER BY event_offset ASC LIMIT ?3;",
                     "prepare replay_from");
        st.bind(1, scope, "bind scope");
        st.bind(2, afterOffset, "bind offset");
        st.bind(3, static_cast<std::uint64_t>(limit), "bind limit");

        while (st.step("step replay_from"))
        {
            auto ev = StreamEvent::parse(st.text(1));
            if (!ev)
            {
                vix::utils::Logger::getInstance().log(
                    vix::utils::Logger::Level::WARN,
                    "[durasync][Store] skipping unreadable journal row {}:{}", scope, st.u64(0));
                continue;
            }
            out.push_back(std::move(*ev));
        }
        return out; // oldest-first
    }

    // ───────────────────────── uploads ─────────────────────────

    void SqliteSyncStore::remember_upload(const std::string &fingerprint, const RememberedUpload &up)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement st(db_,
                     "INSERT OR REPLACE INTO uploads (fingerprint, session_id, location) "
                     "VALUES (?1, ?2, ?3);",
                     "prepare remember_upload");
        st.bind(1, fingerprint, "bind fingerprint");
        st.bind(2, up.sessionId, "bind session_id");
        st.bind(3, up.location, "bind location");
        st.step("step remember_upload");
    }

    std::optional<RememberedUpload> SqliteSyncStore::find_upload(const std::string &fingerprint)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement st(db_,
                     "SELECT session_id, location FROM uploads WHERE fingerprint = ?1;",
                     "prepare find_upload");
        st.bind(1, fingerprint, "bind fingerprint");

        if (!st.step("step find_upload"))
            return std::nullopt;

        return RememberedUpload{st.text(0), st.text(1)};
    }

    void SqliteSyncStore::forget_upload(const std::string &key, bool bySession)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement st(db_,
                     bySession ? "DELETE FROM uploads WHERE session_id = ?1;"
                               : "DELETE FROM uploads WHERE fingerprint = ?1;",
                     "prepare forget_upload");
        st.bind(1, key, "bind key");
        st.step("step forget_upload");
    }

} // namespace durasync
