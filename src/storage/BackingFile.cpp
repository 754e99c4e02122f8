#include "jsonhistory/BackingFile.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include "jsonhistory/Errors.hpp"

namespace jsonhistory {

BackingFile::BackingFile(std::string path) : path_(std::move(path)) {
    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw IoFailure("cannot stat " + path_ + ": " + ec.message());
    }
    size_ = static_cast<uint64_t>(fileSize);

    stream_.open(path_, std::ios::binary | std::ios::in);
    if (!stream_) {
        throw IoFailure("cannot open " + path_);
    }
}

BackingFile::~BackingFile() {
    if (stream_.is_open()) {
        stream_.close();
    }
}

size_t BackingFile::readAt(uint64_t offset, char* dst, size_t len) {
    if (!stream_.is_open()) throw StateError("BackingFile: read after close on " + path_);
    if (len == 0 || offset >= size_) return 0;
    ++reads_;

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        throw IoFailure("cannot seek " + path_ + " to offset " + std::to_string(offset));
    }
    stream_.read(dst, static_cast<std::streamsize>(len));
    if (stream_.bad()) {
        throw IoFailure("read failed on " + path_ + " at offset " + std::to_string(offset));
    }
    const auto got = static_cast<size_t>(stream_.gcount());
    stream_.clear();
    return got;
}

void BackingFile::close() {
    if (!stream_.is_open()) throw StateError("BackingFile: " + path_ + " already closed");
    stream_.clear();
    stream_.close();
    if (stream_.fail()) {
        throw IoFailure("close failed on " + path_);
    }
}

} // namespace jsonhistory
