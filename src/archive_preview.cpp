#include "archive_preview.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <unistd.h>
#include <iostream>
#include <memory>

namespace shuttle {

namespace {

using ArchivePtr = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

const size_t READ_BLOCK_SIZE = 10240;

} // namespace

std::vector<std::string> list_zip_entries(int fd, size_t limit) {
    std::vector<std::string> entries;
    if (limit == 0) {
        return entries;
    }
    // libarchive reads from the descriptor's current offset
    if (::lseek(fd, 0, SEEK_SET) != 0) {
        return entries;
    }

    ArchivePtr a(archive_read_new(), &archive_read_free);
    if (!a) {
        return entries;
    }
    archive_read_support_format_zip(a.get());

    if (archive_read_open_fd(a.get(), fd, READ_BLOCK_SIZE) != ARCHIVE_OK) {
        // Not a ZIP; that is the common case, so no log line
        return entries;
    }

    struct archive_entry* entry;
    while (entries.size() < limit) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r == ARCHIVE_FATAL) {
            std::cerr << "[Preview] Unreadable archive: " << archive_error_string(a.get()) << std::endl;
            return std::vector<std::string>();
        }
        if (r == ARCHIVE_RETRY) {
            break;
        }
        const char* name = archive_entry_pathname(entry);
        entries.emplace_back(name ? name : "");
    }
    return entries;
}

} // namespace shuttle
