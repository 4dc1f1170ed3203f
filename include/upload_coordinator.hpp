#pragma once

#include "chunk_planner.hpp"
#include "config.hpp"
#include "progress.hpp"
#include "protocol.hpp"
#include "upload_client.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace shuttle {

enum class ChunkState { PENDING, DISPATCHED, UPLOADED, FAILED_RETRYABLE, FAILED_PERMANENT };

const char* to_string(ChunkState state);
bool is_valid_transition(ChunkState from, ChunkState to);

// Everything the scheduler mutates, kept in one place
struct UploadState {
    std::string session_id;
    std::vector<ChunkState> chunks;
    std::vector<int> failures;       // failed attempts per chunk
    std::deque<uint32_t> queue;      // indices waiting for a slot
    size_t in_flight = 0;
    size_t backing_off = 0;          // waiting out a retry delay, holds no slot
    uint64_t bytes_confirmed = 0;
    uint32_t resumed_chunks = 0;
    uint32_t uploaded_chunks = 0;
    bool halted = false;
    boost::system::error_code halt_reason;
};

struct UploadOutcome {
    std::string session_id;
    FinalizeResult result;
    uint32_t resumed_chunks = 0;
    uint32_t uploaded_chunks = 0;
};

// Drives one file through handshake, bounded-concurrency chunk upload with
// retry, and finalize. All state changes happen on the io_context thread.
class UploadCoordinator : public std::enable_shared_from_this<UploadCoordinator> {
public:
    using CompletionHandler = std::function<void(const boost::system::error_code&, const UploadOutcome&)>;
    using ProgressHandler = std::function<void(const ProgressSnapshot&)>;

    UploadCoordinator(boost::asio::io_context& io_context,
                      UploadClient& client,
                      FilePlan plan,
                      CoordinatorOptions options = CoordinatorOptions());

    void set_progress_handler(ProgressHandler handler) { progress_handler_ = std::move(handler); }

    // Must be owned by a shared_ptr
    void start(CompletionHandler handler);

    // Marks server-held chunks UPLOADED and queues the rest
    void seed(const HandshakeResult& handshake);

    const UploadState& state() const { return state_; }
    const FilePlan& plan() const { return plan_; }

private:
    void on_handshake(const boost::system::error_code& ec, const HandshakeResult& result);
    void pump();
    void dispatch(uint32_t chunk_index);
    void on_chunk_done(uint32_t chunk_index, boost::system::error_code ec, bool accepted);
    void retry_later(uint32_t chunk_index, const boost::system::error_code& ec);
    void halt(uint32_t chunk_index, const boost::system::error_code& ec);
    void do_finalize();
    void on_finalized(const boost::system::error_code& ec, const FinalizeResult& result);
    void schedule_progress();
    void finish(const boost::system::error_code& ec);
    void set_state(uint32_t chunk_index, ChunkState to);
    std::chrono::milliseconds backoff_delay(int attempt) const;

    boost::asio::io_context& io_context_;
    UploadClient& client_;
    FilePlan plan_;
    ChunkPlanner planner_;
    CoordinatorOptions options_;
    UploadState state_;
    ProgressTracker tracker_;

    boost::asio::steady_timer progress_timer_;
    boost::asio::steady_timer finalize_timer_;
    std::unordered_set<std::shared_ptr<boost::asio::steady_timer>> backoff_timers_;

    CompletionHandler completion_;
    ProgressHandler progress_handler_;
    UploadOutcome outcome_;
    int finalize_failures_ = 0;
    bool finalizing_ = false;
    bool finished_ = false;
};

} // namespace shuttle
