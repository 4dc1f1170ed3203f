#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace shuttle {

// Names of the first `limit` entries of a ZIP archive open on `fd`.
// Returns an empty list for anything libarchive cannot read as ZIP.
std::vector<std::string> list_zip_entries(int fd, size_t limit);

} // namespace shuttle
