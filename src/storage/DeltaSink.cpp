#include "jsonhistory/DeltaSink.hpp"

#include <filesystem>
#include <iostream>
#include <utility>
#include "jsonhistory/Errors.hpp"

#ifdef JSONHISTORY_USE_ZSTD
#include <zstd.h>
#endif

using json = nlohmann::json;

namespace jsonhistory {

namespace {

constexpr const char* kTypeAdd = "add";
constexpr const char* kTypeChange = "change";
constexpr const char* kTrailer = "{\"done\":true}]\n";

#ifdef JSONHISTORY_USE_ZSTD
constexpr int kZstdLevel = 3;

// One zstd frame holding the whole delta document.
std::string compressFrame(const std::string& document, const std::string& path) {
    std::string frame(ZSTD_compressBound(document.size()), '\0');
    const size_t written = ZSTD_compress(frame.data(), frame.size(), document.data(), document.size(), kZstdLevel);
    if (ZSTD_isError(written)) {
        throw IoFailure("FileSink: zstd compression failed for " + path + ": " + ZSTD_getErrorName(written));
    }
    frame.resize(written);
    return frame;
}
#endif

} // namespace

DeltaRecord DeltaRecord::add(std::string id, json item) {
    DeltaRecord record;
    record.type = Type::Add;
    record.id = std::move(id);
    record.item = std::move(item);
    return record;
}

DeltaRecord DeltaRecord::change(std::string id, json previous, json delta) {
    DeltaRecord record;
    record.type = Type::Change;
    record.id = std::move(id);
    record.item = std::move(previous);
    record.delta = std::move(delta);
    return record;
}

json DeltaRecord::toJson() const {
    json j = {
        {"id", id},
        {"type", type == Type::Add ? kTypeAdd : kTypeChange},
        {"item", item}
    };
    if (type == Type::Change) {
        j["delta"] = delta;
    }
    return j;
}

DeltaRecord DeltaRecord::fromJson(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string() || !j.contains("item")) {
        throw Error("DeltaRecord: malformed record " + j.dump());
    }
    const auto type = j.value("type", "");
    if (type == kTypeAdd) {
        return add(j["id"].get<std::string>(), j["item"]);
    }
    if (type == kTypeChange && j.contains("delta")) {
        return change(j["id"].get<std::string>(), j["item"], j["delta"]);
    }
    throw Error("DeltaRecord: unknown record type '" + type + "'");
}

void MemorySink::store(const std::string& id, const DeltaRecord& record) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) throw StateError("MemorySink: store after close");
    if (keepData_) {
        records_.push_back(record);
        records_.back().id = id;
    }
    ++count_;
}

void MemorySink::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) throw StateError("MemorySink: already closed");
    closed_ = true;
    if (!keepData_) {
        records_.clear();
    }
}

size_t MemorySink::count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return count_;
}

bool MemorySink::closed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
}

FileSink::FileSink(std::string path, bool compress) : path_(std::move(path)), compress_(compress) {
    if (compress_ && !compressionAvailable()) {
        std::cerr << "FileSink: zstd support not built in; writing " << path_ << " uncompressed\n";
        compress_ = false;
    }

    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw IoFailure("FileSink: cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    if (!compress_) {
        stream_.open(path_, std::ios::binary | std::ios::trunc | std::ios::out);
        if (!stream_) {
            throw IoFailure("FileSink: cannot open " + path_);
        }
    }
    write("[");
}

FileSink::~FileSink() {
    if (!closed_) {
        std::cerr << "FileSink: " << path_ << " released without close(); output is incomplete\n";
    }
}

bool FileSink::compressionAvailable() {
#ifdef JSONHISTORY_USE_ZSTD
    return true;
#else
    return false;
#endif
}

void FileSink::store(const std::string& id, const DeltaRecord& record) {
    json j = record.toJson();
    j["id"] = id;
    const std::string line = j.dump() + ",\n";

    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) throw StateError("FileSink: store after close on " + path_);
    write(line);
    ++count_;
}

size_t FileSink::count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return count_;
}

void FileSink::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) throw StateError("FileSink: " + path_ + " already closed");
    closed_ = true;
    write(kTrailer);

#ifdef JSONHISTORY_USE_ZSTD
    if (compress_) {
        const std::string compressed = compressFrame(pending_, path_);
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));
        if (!out) {
            throw IoFailure("FileSink: cannot write " + path_);
        }
        std::string().swap(pending_);
        return;
    }
#endif

    stream_.flush();
    stream_.close();
    if (stream_.fail()) {
        throw IoFailure("FileSink: failed to finish " + path_);
    }
}

void FileSink::write(const std::string& bytes) {
    if (compress_) {
        pending_.append(bytes);
        return;
    }
    stream_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!stream_) {
        throw IoFailure("FileSink: write failed on " + path_);
    }
}

} // namespace jsonhistory
