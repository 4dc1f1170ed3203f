#include "session_store.hpp"
#include "shuttle/error.hpp"
#include <sqlite3.h>
#include <memory>

namespace shuttle {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw UploadError(errc::storage_failure, std::string("prepare failed: ") + sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void bind_text(sqlite3_stmt* st, int idx, const std::string& value) {
    sqlite3_bind_text(st, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* text = sqlite3_column_text(st, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "sqlite error";
        sqlite3_free(err);
        throw UploadError(errc::storage_failure, msg);
    }
}

// Rolls back unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec_sql(db_, "BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (!done_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }
    void commit() {
        exec_sql(db_, "COMMIT;");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

SessionRecord read_session(sqlite3_stmt* st) {
    SessionRecord r;
    r.id = column_text(st, 0);
    r.fingerprint = column_text(st, 1);
    r.name = column_text(st, 2);
    r.total_size = static_cast<uint64_t>(sqlite3_column_int64(st, 3));
    r.total_chunks = static_cast<uint32_t>(sqlite3_column_int64(st, 4));
    r.status = session_status_from_string(column_text(st, 5));
    if (sqlite3_column_type(st, 6) != SQLITE_NULL) {
        r.final_hash = column_text(st, 6);
    }
    r.created_at = sqlite3_column_int64(st, 7);
    return r;
}

const char* SESSION_COLUMNS =
    "SELECT id,fingerprint,name,total_size,total_chunks,status,final_hash,created_at "
    "FROM sessions ";

} // namespace

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::UPLOADING: return "UPLOADING";
        case SessionStatus::PROCESSING: return "PROCESSING";
        case SessionStatus::COMPLETED: return "COMPLETED";
        case SessionStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

SessionStatus session_status_from_string(const std::string& s) {
    if (s == "UPLOADING") return SessionStatus::UPLOADING;
    if (s == "PROCESSING") return SessionStatus::PROCESSING;
    if (s == "COMPLETED") return SessionStatus::COMPLETED;
    if (s == "FAILED") return SessionStatus::FAILED;
    throw UploadError(errc::storage_failure, "unknown session status '" + s + "'");
}

bool is_valid_transition(SessionStatus from, SessionStatus to) {
    switch (from) {
        case SessionStatus::UPLOADING:
            return to == SessionStatus::PROCESSING;
        case SessionStatus::PROCESSING:
            return to == SessionStatus::COMPLETED || to == SessionStatus::FAILED;
        case SessionStatus::COMPLETED:
        case SessionStatus::FAILED:
            return false;
    }
    return false;
}

SessionStore::SessionStore(const std::filesystem::path& db_path) {
    if (sqlite3_open(db_path.string().c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw UploadError(errc::storage_failure, "sqlite3_open failed: " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");
    ensure_schema();
}

SessionStore::~SessionStore() {
    if (db_) sqlite3_close(db_);
}

void SessionStore::exec(const char* sql) {
    exec_sql(db_, sql);
}

void SessionStore::ensure_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS sessions ("
        "  id TEXT PRIMARY KEY,"
        "  fingerprint TEXT NOT NULL UNIQUE,"
        "  name TEXT NOT NULL,"
        "  total_size INTEGER NOT NULL,"
        "  total_chunks INTEGER NOT NULL,"
        "  status TEXT NOT NULL DEFAULT 'UPLOADING',"
        "  final_hash TEXT,"
        "  created_at INTEGER NOT NULL"
        ");"
    );
    exec(
        "CREATE TABLE IF NOT EXISTS chunks ("
        "  session_id TEXT NOT NULL,"
        "  chunk_index INTEGER NOT NULL,"
        "  status TEXT NOT NULL DEFAULT 'PENDING',"
        "  uploaded_at INTEGER NOT NULL,"
        "  UNIQUE(session_id, chunk_index),"
        "  FOREIGN KEY(session_id) REFERENCES sessions(id) ON DELETE CASCADE"
        ");"
    );
    // One row per archive entry, so names keep every byte and their order
    exec(
        "CREATE TABLE IF NOT EXISTS previews ("
        "  session_id TEXT NOT NULL,"
        "  position INTEGER NOT NULL,"
        "  name TEXT NOT NULL,"
        "  PRIMARY KEY(session_id, position),"
        "  FOREIGN KEY(session_id) REFERENCES sessions(id) ON DELETE CASCADE"
        ");"
    );
    exec("CREATE INDEX IF NOT EXISTS idx_sessions_created_at ON sessions(created_at);");
}

bool SessionStore::insert_if_absent(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto st = prepare(db_,
        "INSERT INTO sessions(id,fingerprint,name,total_size,total_chunks,status,created_at) "
        "VALUES(?,?,?,?,?,?,?) ON CONFLICT(fingerprint) DO NOTHING;");
    bind_text(st.get(), 1, record.id);
    bind_text(st.get(), 2, record.fingerprint);
    bind_text(st.get(), 3, record.name);
    sqlite3_bind_int64(st.get(), 4, static_cast<sqlite3_int64>(record.total_size));
    sqlite3_bind_int64(st.get(), 5, record.total_chunks);
    sqlite3_bind_text(st.get(), 6, to_string(SessionStatus::UPLOADING), -1, SQLITE_STATIC);
    sqlite3_bind_int64(st.get(), 7, record.created_at);

    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("insert session failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) == 1;
}

std::vector<SessionRecord> SessionStore::query_sessions(const char* sql, const std::string& text_arg, int64_t int_arg) {
    auto st = prepare(db_, sql);
    if (!text_arg.empty()) {
        bind_text(st.get(), 1, text_arg);
    } else {
        sqlite3_bind_int64(st.get(), 1, int_arg);
    }

    std::vector<SessionRecord> rows;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        rows.push_back(read_session(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("select sessions failed: ") + sqlite3_errmsg(db_));
    }
    for (auto& row : rows) {
        row.preview_entries = load_preview(row.id);
    }
    return rows;
}

std::vector<std::string> SessionStore::load_preview(const std::string& session_id) {
    auto st = prepare(db_, "SELECT name FROM previews WHERE session_id=? ORDER BY position;");
    bind_text(st.get(), 1, session_id);

    std::vector<std::string> names;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        const void* blob = sqlite3_column_blob(st.get(), 0);
        int len = sqlite3_column_bytes(st.get(), 0);
        names.emplace_back(blob ? static_cast<const char*>(blob) : "", static_cast<size_t>(len));
    }
    if (rc != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("select preview failed: ") + sqlite3_errmsg(db_));
    }
    return names;
}

std::optional<SessionRecord> SessionStore::find_by_id(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(SESSION_COLUMNS) + "WHERE id=?;";
    auto rows = query_sessions(sql.c_str(), id, 0);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<SessionRecord> SessionStore::find_by_fingerprint(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(SESSION_COLUMNS) + "WHERE fingerprint=?;";
    auto rows = query_sessions(sql.c_str(), fingerprint, 0);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<uint32_t> SessionStore::uploaded_chunks(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto st = prepare(db_,
        "SELECT chunk_index FROM chunks WHERE session_id=? AND status='UPLOADED' ORDER BY chunk_index;");
    bind_text(st.get(), 1, session_id);

    std::vector<uint32_t> indices;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        indices.push_back(static_cast<uint32_t>(sqlite3_column_int64(st.get(), 0)));
    }
    if (rc != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("select chunks failed: ") + sqlite3_errmsg(db_));
    }
    return indices;
}

bool SessionStore::is_chunk_uploaded(const std::string& session_id, uint32_t chunk_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto st = prepare(db_,
        "SELECT 1 FROM chunks WHERE session_id=? AND chunk_index=? AND status='UPLOADED';");
    bind_text(st.get(), 1, session_id);
    sqlite3_bind_int64(st.get(), 2, chunk_index);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("select chunk failed: ") + sqlite3_errmsg(db_));
    }
    return rc == SQLITE_ROW;
}

uint32_t SessionStore::count_uploaded(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto st = prepare(db_, "SELECT COUNT(*) FROM chunks WHERE session_id=? AND status='UPLOADED';");
    bind_text(st.get(), 1, session_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw UploadError(errc::storage_failure, std::string("count chunks failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<uint32_t>(sqlite3_column_int64(st.get(), 0));
}

void SessionStore::commit_chunk(const std::string& session_id, uint32_t chunk_index, int64_t uploaded_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto st = prepare(db_,
        "INSERT INTO chunks(session_id,chunk_index,status,uploaded_at) VALUES(?,?,'UPLOADED',?) "
        "ON CONFLICT(session_id,chunk_index) DO UPDATE SET status='UPLOADED', uploaded_at=excluded.uploaded_at "
        "WHERE chunks.status <> 'UPLOADED';");
    bind_text(st.get(), 1, session_id);
    sqlite3_bind_int64(st.get(), 2, chunk_index);
    sqlite3_bind_int64(st.get(), 3, uploaded_at);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_CONSTRAINT) {
        throw UploadError(errc::not_found, "session " + session_id + " no longer exists");
    }
    if (rc != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("commit chunk failed: ") + sqlite3_errmsg(db_));
    }
}

bool SessionStore::compare_and_set_status(const std::string& session_id,
                                          SessionStatus from,
                                          SessionStatus to,
                                          const std::string* final_hash,
                                          const std::vector<std::string>* preview) {
    if (!is_valid_transition(from, to)) {
        throw UploadError(errc::invalid_state,
            std::string("transition ") + to_string(from) + " -> " + to_string(to) + " is not allowed");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto st = prepare(db_,
        "UPDATE sessions SET status=?, final_hash=COALESCE(?, final_hash) WHERE id=? AND status=?;");
    sqlite3_bind_text(st.get(), 1, to_string(to), -1, SQLITE_STATIC);
    if (final_hash) bind_text(st.get(), 2, *final_hash);
    else sqlite3_bind_null(st.get(), 2);
    bind_text(st.get(), 3, session_id);
    sqlite3_bind_text(st.get(), 4, to_string(from), -1, SQLITE_STATIC);

    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("update status failed: ") + sqlite3_errmsg(db_));
    }
    if (sqlite3_changes(db_) != 1) {
        return false;
    }

    if (preview) {
        auto clear = prepare(db_, "DELETE FROM previews WHERE session_id=?;");
        bind_text(clear.get(), 1, session_id);
        if (sqlite3_step(clear.get()) != SQLITE_DONE) {
            throw UploadError(errc::storage_failure, std::string("clear preview failed: ") + sqlite3_errmsg(db_));
        }

        auto ins = prepare(db_, "INSERT INTO previews(session_id,position,name) VALUES(?,?,?);");
        for (size_t i = 0; i < preview->size(); ++i) {
            const std::string& name = (*preview)[i];
            sqlite3_reset(ins.get());
            bind_text(ins.get(), 1, session_id);
            sqlite3_bind_int64(ins.get(), 2, static_cast<sqlite3_int64>(i));
            // Stored as a blob so embedded NULs and newlines come back untouched
            sqlite3_bind_blob(ins.get(), 3, name.data(), static_cast<int>(name.size()), SQLITE_TRANSIENT);
            if (sqlite3_step(ins.get()) != SQLITE_DONE) {
                throw UploadError(errc::storage_failure, std::string("insert preview failed: ") + sqlite3_errmsg(db_));
            }
        }
    }

    tx.commit();
    return true;
}

std::vector<SessionRecord> SessionStore::list_expired(int64_t cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(SESSION_COLUMNS) +
        "WHERE status <> 'COMPLETED' AND created_at < ? ORDER BY created_at;";
    return query_sessions(sql.c_str(), std::string(), cutoff);
}

bool SessionStore::delete_if_incomplete(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto st = prepare(db_, "DELETE FROM sessions WHERE id=? AND status <> 'COMPLETED';");
    bind_text(st.get(), 1, session_id);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw UploadError(errc::storage_failure, std::string("delete session failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) == 1;
}

} // namespace shuttle
