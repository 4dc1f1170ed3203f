#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace shuttle {

enum class SessionStatus { UPLOADING, PROCESSING, COMPLETED, FAILED };

const char* to_string(SessionStatus status);
SessionStatus session_status_from_string(const std::string& s);

// UPLOADING -> PROCESSING -> COMPLETED | FAILED. Nothing else.
bool is_valid_transition(SessionStatus from, SessionStatus to);

struct SessionRecord {
    std::string id;
    std::string fingerprint;
    std::string name;
    uint64_t total_size = 0;
    uint32_t total_chunks = 0;
    SessionStatus status = SessionStatus::UPLOADING;
    std::optional<std::string> final_hash;
    std::vector<std::string> preview_entries;
    int64_t created_at = 0; // unix seconds
};

// SQLite-backed session and chunk records. Every method runs under one
// mutex, so each call is a single atomic step against the database.
class SessionStore {
public:
    explicit SessionStore(const std::filesystem::path& db_path);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // False when a session with the same fingerprint already exists
    bool insert_if_absent(const SessionRecord& record);

    std::optional<SessionRecord> find_by_id(const std::string& id);
    std::optional<SessionRecord> find_by_fingerprint(const std::string& fingerprint);

    // Ascending indices with UPLOADED status
    std::vector<uint32_t> uploaded_chunks(const std::string& session_id);
    bool is_chunk_uploaded(const std::string& session_id, uint32_t chunk_index);
    uint32_t count_uploaded(const std::string& session_id);

    // Marks the chunk UPLOADED. Throws not_found if the session is gone.
    void commit_chunk(const std::string& session_id, uint32_t chunk_index, int64_t uploaded_at);

    // Moves status from `from` to `to` only if it is currently `from`.
    // final_hash and preview are written in the same transaction when given.
    bool compare_and_set_status(const std::string& session_id,
                                SessionStatus from,
                                SessionStatus to,
                                const std::string* final_hash = nullptr,
                                const std::vector<std::string>* preview = nullptr);

    // Sessions not COMPLETED and created strictly before cutoff
    std::vector<SessionRecord> list_expired(int64_t cutoff);

    // Deletes the session (and its chunks) unless it is COMPLETED right now
    bool delete_if_incomplete(const std::string& session_id);

private:
    void exec(const char* sql);
    void ensure_schema();
    std::vector<SessionRecord> query_sessions(const char* sql, const std::string& text_arg, int64_t int_arg);
    std::vector<std::string> load_preview(const std::string& session_id);

    std::mutex mutex_;
    sqlite3* db_ = nullptr;
};

} // namespace shuttle
