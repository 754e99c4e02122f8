#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace jsonhistory {

// Read-only handle on the backing file, held open until close().
class BackingFile {
public:
    explicit BackingFile(std::string path);
    ~BackingFile();

    BackingFile(const BackingFile&) = delete;
    BackingFile& operator=(const BackingFile&) = delete;

    // Positioned read of up to len bytes; returns the number of bytes read,
    // which is short only at end of file.
    size_t readAt(uint64_t offset, char* dst, size_t len);

    // Releases the handle. Throws StateError when already closed.
    void close();

    bool isOpen() const { return stream_.is_open(); }
    uint64_t size() const { return size_; }
    const std::string& path() const { return path_; }

    // Number of positioned reads issued so far.
    uint64_t readCount() const { return reads_; }

private:
    std::string path_;
    std::ifstream stream_;
    uint64_t size_ = 0;
    uint64_t reads_ = 0;
};

} // namespace jsonhistory
