#pragma once

#include "chunk_store.hpp"
#include "session_registry.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>

namespace shuttle {

// Periodic sweep that removes sessions which never reached COMPLETED
// within the retention window.
class Reaper {
public:
    Reaper(boost::asio::io_context& io_context,
           SessionRegistry& registry,
           ChunkStore& chunks,
           std::chrono::seconds interval,
           std::chrono::seconds retention);

    // Safe to call from any thread; the timer itself is only touched on strand_
    void start();
    void stop();
    bool running() const { return running_.load(); }

    // One sweep against the registry clock. Returns the number reaped.
    size_t sweep_once();

private:
    void schedule();

    SessionRegistry& registry_;
    ChunkStore& chunks_;
    std::chrono::seconds interval_;
    std::chrono::seconds retention_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
};

} // namespace shuttle
