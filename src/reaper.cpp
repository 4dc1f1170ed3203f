#include "reaper.hpp"
#include "shuttle/error.hpp"
#include <iostream>

namespace shuttle {

Reaper::Reaper(boost::asio::io_context& io_context,
               SessionRegistry& registry,
               ChunkStore& chunks,
               std::chrono::seconds interval,
               std::chrono::seconds retention)
    : registry_(registry),
      chunks_(chunks),
      interval_(interval),
      retention_(retention),
      strand_(boost::asio::make_strand(io_context)),
      timer_(strand_) {}

void Reaper::start() {
    if (running_.exchange(true)) {
        return;
    }
    std::cout << "[Reaper] Sweeping every " << interval_.count() << "s, retention " << retention_.count() << "s" << std::endl;
    boost::asio::post(strand_, [this]() {
        if (running_) {
            schedule();
        }
    });
}

void Reaper::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::asio::post(strand_, [this]() { timer_.cancel(); });
}

void Reaper::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        try {
            sweep_once();
        } catch (const UploadError& e) {
            std::cerr << "[Reaper] Sweep failed: " << e.what() << std::endl;
        }
        schedule();
    });
}

size_t Reaper::sweep_once() {
    int64_t cutoff = registry_.now() - retention_.count();
    auto expired = registry_.store().list_expired(cutoff);

    size_t reaped = 0;
    for (const auto& session : expired) {
        // The delete re-checks status, so a session that completed after the
        // listing survives
        if (!registry_.store().delete_if_incomplete(session.id)) {
            continue;
        }
        chunks_.remove_blob(session.id);
        ++reaped;
        std::cout << "[Reaper] Reaped session " << session.id << " (" << session.name << ", "
                  << to_string(session.status) << ")" << std::endl;
    }
    return reaped;
}

} // namespace shuttle
