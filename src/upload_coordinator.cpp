#include "upload_coordinator.hpp"
#include "shuttle/error.hpp"
#include <iostream>
#include <stdexcept>

namespace shuttle {

const char* to_string(ChunkState state) {
    switch (state) {
        case ChunkState::PENDING: return "PENDING";
        case ChunkState::DISPATCHED: return "DISPATCHED";
        case ChunkState::UPLOADED: return "UPLOADED";
        case ChunkState::FAILED_RETRYABLE: return "FAILED_RETRYABLE";
        case ChunkState::FAILED_PERMANENT: return "FAILED_PERMANENT";
    }
    return "UNKNOWN";
}

bool is_valid_transition(ChunkState from, ChunkState to) {
    switch (from) {
        case ChunkState::PENDING:
            // UPLOADED directly when the server already holds the chunk
            return to == ChunkState::DISPATCHED || to == ChunkState::UPLOADED;
        case ChunkState::DISPATCHED:
            return to == ChunkState::UPLOADED || to == ChunkState::FAILED_RETRYABLE ||
                   to == ChunkState::FAILED_PERMANENT;
        case ChunkState::FAILED_RETRYABLE:
            return to == ChunkState::DISPATCHED;
        case ChunkState::UPLOADED:
        case ChunkState::FAILED_PERMANENT:
            return false;
    }
    return false;
}

UploadCoordinator::UploadCoordinator(boost::asio::io_context& io_context,
                                     UploadClient& client,
                                     FilePlan plan,
                                     CoordinatorOptions options)
    : io_context_(io_context),
      client_(client),
      plan_(std::move(plan)),
      planner_(plan_.chunk_size),
      options_(options),
      tracker_(plan_.file_size, options.progress_interval),
      progress_timer_(io_context),
      finalize_timer_(io_context) {}

void UploadCoordinator::set_state(uint32_t chunk_index, ChunkState to) {
    ChunkState from = state_.chunks.at(chunk_index);
    if (!is_valid_transition(from, to)) {
        throw std::logic_error(std::string("chunk ") + std::to_string(chunk_index) + ": " +
                               to_string(from) + " -> " + to_string(to));
    }
    state_.chunks[chunk_index] = to;
}

std::chrono::milliseconds UploadCoordinator::backoff_delay(int attempt) const {
    return options_.backoff_base * (1 << attempt);
}

void UploadCoordinator::start(CompletionHandler handler) {
    completion_ = std::move(handler);

    HandshakeRequest req;
    req.fingerprint = plan_.fingerprint;
    req.total_size = plan_.file_size;
    req.total_chunks = plan_.total_chunks;
    req.name = plan_.name;

    std::cout << "[Coordinator] Handshake for " << plan_.name << " (" << plan_.file_size << " bytes, "
              << plan_.total_chunks << " chunks)" << std::endl;

    auto self(shared_from_this());
    client_.async_handshake(req, [this, self](const boost::system::error_code& ec, HandshakeResult result) {
        on_handshake(ec, result);
    });
}

void UploadCoordinator::seed(const HandshakeResult& handshake) {
    state_ = UploadState();
    state_.session_id = handshake.session_id;
    state_.chunks.assign(plan_.total_chunks, ChunkState::PENDING);
    state_.failures.assign(plan_.total_chunks, 0);

    for (uint32_t idx : handshake.uploaded_chunks) {
        if (idx >= plan_.total_chunks || state_.chunks[idx] == ChunkState::UPLOADED) {
            continue;
        }
        set_state(idx, ChunkState::UPLOADED);
        state_.bytes_confirmed += plan_.span(idx).length;
        ++state_.resumed_chunks;
    }
    for (uint32_t idx = 0; idx < plan_.total_chunks; ++idx) {
        if (state_.chunks[idx] != ChunkState::UPLOADED) {
            state_.queue.push_back(idx);
        }
    }
}

void UploadCoordinator::on_handshake(const boost::system::error_code& ec, const HandshakeResult& result) {
    if (ec) {
        std::cerr << "[Coordinator] Handshake failed: " << ec.message() << std::endl;
        finish(ec);
        return;
    }

    seed(result);
    outcome_.session_id = state_.session_id;
    if (state_.resumed_chunks > 0) {
        std::cout << "[Coordinator] Resuming session " << state_.session_id << ", skipping "
                  << state_.resumed_chunks << " chunks" << std::endl;
    } else {
        std::cout << "[Coordinator] Session " << state_.session_id << std::endl;
    }

    tracker_.start(std::chrono::steady_clock::now(), state_.bytes_confirmed);
    schedule_progress();
    pump();
}

void UploadCoordinator::pump() {
    if (finished_ || finalizing_) {
        return;
    }

    while (!state_.halted && state_.in_flight < options_.concurrency && !state_.queue.empty()) {
        uint32_t idx = state_.queue.front();
        state_.queue.pop_front();
        dispatch(idx);
    }

    if (state_.in_flight > 0 || state_.backing_off > 0) {
        return;
    }
    if (state_.halted) {
        finish(state_.halt_reason);
    } else if (state_.queue.empty()) {
        do_finalize();
    }
}

void UploadCoordinator::dispatch(uint32_t chunk_index) {
    ChunkUpload chunk;
    chunk.session_id = state_.session_id;
    chunk.chunk_index = chunk_index;
    chunk.total_chunks = plan_.total_chunks;
    try {
        chunk.payload = planner_.read_chunk(plan_, chunk_index);
    } catch (const UploadError& e) {
        std::cerr << "[Coordinator] Cannot read chunk " << chunk_index << ": " << e.what() << std::endl;
        set_state(chunk_index, ChunkState::DISPATCHED);
        halt(chunk_index, e.code());
        return;
    }

    set_state(chunk_index, ChunkState::DISPATCHED);
    ++state_.in_flight;

    auto self(shared_from_this());
    client_.async_upload_chunk(std::move(chunk),
        [this, self, chunk_index](const boost::system::error_code& ec, bool accepted) {
            on_chunk_done(chunk_index, ec, accepted);
        });
}

void UploadCoordinator::on_chunk_done(uint32_t chunk_index, boost::system::error_code ec, bool accepted) {
    --state_.in_flight;

    if (!ec && !accepted) {
        ec = make_error_code(errc::storage_failure);
    }
    if (!ec) {
        set_state(chunk_index, ChunkState::UPLOADED);
        state_.bytes_confirmed += plan_.span(chunk_index).length;
        ++state_.uploaded_chunks;
    } else if (is_retryable(ec) && state_.failures[chunk_index] < options_.max_retries && !state_.halted) {
        retry_later(chunk_index, ec);
    } else {
        halt(chunk_index, ec);
    }
    pump();
}

void UploadCoordinator::retry_later(uint32_t chunk_index, const boost::system::error_code& ec) {
    set_state(chunk_index, ChunkState::FAILED_RETRYABLE);
    int attempt = state_.failures[chunk_index]++;
    auto delay = backoff_delay(attempt);
    std::cout << "[Coordinator] Chunk " << chunk_index << " failed (" << ec.message() << "). Retrying in "
              << delay.count() << "ms" << std::endl;

    ++state_.backing_off;
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, delay);
    backoff_timers_.insert(timer);

    auto self(shared_from_this());
    timer->async_wait([this, self, timer, chunk_index](const boost::system::error_code& wait_ec) {
        backoff_timers_.erase(timer);
        --state_.backing_off;
        if (!wait_ec && !state_.halted) {
            state_.queue.push_back(chunk_index);
        }
        pump();
    });
}

void UploadCoordinator::halt(uint32_t chunk_index, const boost::system::error_code& ec) {
    set_state(chunk_index, ChunkState::FAILED_PERMANENT);
    std::cerr << "[Coordinator] Chunk " << chunk_index << " failed permanently: " << ec.message() << std::endl;
    if (state_.halted) {
        return;
    }
    state_.halted = true;
    state_.halt_reason = ec;
    // In-flight uploads finish on their own; pending retries are dropped
    for (const auto& timer : backoff_timers_) {
        timer->cancel();
    }
}

void UploadCoordinator::do_finalize() {
    finalizing_ = true;
    std::cout << "[Coordinator] All chunks uploaded, finalizing " << state_.session_id << std::endl;

    auto self(shared_from_this());
    client_.async_finalize(state_.session_id,
        [this, self](const boost::system::error_code& ec, FinalizeResult result) {
            on_finalized(ec, result);
        });
}

void UploadCoordinator::on_finalized(const boost::system::error_code& ec, const FinalizeResult& result) {
    if (!ec) {
        outcome_.result = result;
        finish(ec);
        return;
    }
    if (is_retryable(ec) && finalize_failures_ < options_.max_retries) {
        auto delay = backoff_delay(finalize_failures_++);
        std::cout << "[Coordinator] Finalize failed (" << ec.message() << "). Retrying in "
                  << delay.count() << "ms" << std::endl;
        auto self(shared_from_this());
        finalize_timer_.expires_after(delay);
        finalize_timer_.async_wait([this, self](const boost::system::error_code& wait_ec) {
            if (!wait_ec) {
                do_finalize();
            }
        });
        return;
    }
    std::cerr << "[Coordinator] Finalize failed: " << ec.message() << std::endl;
    finish(ec);
}

void UploadCoordinator::schedule_progress() {
    auto self(shared_from_this());
    progress_timer_.expires_after(options_.progress_interval);
    progress_timer_.async_wait([this, self](const boost::system::error_code& ec) {
        if (ec || finished_) {
            return;
        }
        auto snap = tracker_.sample(std::chrono::steady_clock::now(), state_.bytes_confirmed);
        if (snap && progress_handler_) {
            progress_handler_(*snap);
        }
        schedule_progress();
    });
}

void UploadCoordinator::finish(const boost::system::error_code& ec) {
    if (finished_) {
        return;
    }
    finished_ = true;
    progress_timer_.cancel();
    finalize_timer_.cancel();

    outcome_.session_id = state_.session_id;
    outcome_.resumed_chunks = state_.resumed_chunks;
    outcome_.uploaded_chunks = state_.uploaded_chunks;
    if (completion_) {
        completion_(ec, outcome_);
    }
}

} // namespace shuttle
