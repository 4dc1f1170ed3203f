#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <string>
#include <type_traits>

namespace shuttle {

// Protocol-level failures. Values travel on the wire in ErrorResponse.code,
// so never renumber them.
enum class errc {
    invalid_argument = 1,
    not_found = 2,
    out_of_range = 3,
    incomplete = 4,
    busy = 5,
    invalid_state = 6,
    storage_failure = 7,
    integrity_failure = 8,
    protocol_error = 9
};

} // namespace shuttle

namespace boost {
namespace system {
template <>
struct is_error_code_enum<shuttle::errc> : std::true_type {};
} // namespace system
} // namespace boost

namespace shuttle {

const boost::system::error_category& upload_category();

inline boost::system::error_code make_error_code(errc e) {
    return boost::system::error_code(static_cast<int>(e), upload_category());
}

// Thrown by the server-side components, converted to ErrorResponse at the wire.
class UploadError : public boost::system::system_error {
public:
    UploadError(errc code, const std::string& what)
        : boost::system::system_error(make_error_code(code), what) {}
};

// Network errors, storage hiccups and a finalize already in flight are
// transient. Everything else from the server is a validation or state error.
bool is_retryable(const boost::system::error_code& ec);

} // namespace shuttle
