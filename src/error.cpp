#include "shuttle/error.hpp"
#include <boost/asio/error.hpp>

namespace shuttle {

namespace {

class UploadCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "shuttle"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::invalid_argument: return "invalid argument";
            case errc::not_found: return "session not found";
            case errc::out_of_range: return "chunk index out of range";
            case errc::incomplete: return "upload incomplete";
            case errc::busy: return "finalize already in progress";
            case errc::invalid_state: return "invalid state transition";
            case errc::storage_failure: return "storage failure";
            case errc::integrity_failure: return "integrity check failed";
            case errc::protocol_error: return "protocol error";
        }
        return "unknown shuttle error";
    }
};

} // namespace

const boost::system::error_category& upload_category() {
    static UploadCategory category;
    return category;
}

bool is_retryable(const boost::system::error_code& ec) {
    if (!ec) {
        return false;
    }
    if (ec.category() == upload_category()) {
        return ec == errc::storage_failure || ec == errc::busy;
    }
    return ec != boost::asio::error::operation_aborted;
}

} // namespace shuttle
