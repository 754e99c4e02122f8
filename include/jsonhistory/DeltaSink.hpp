#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace jsonhistory {

// One changelog entry: a new item, or the previous item plus the patch that
// turns it into the new one.
struct DeltaRecord {
    enum class Type { Add, Change };

    Type type = Type::Add;
    std::string id;
    nlohmann::json item;
    nlohmann::json delta; // null for Add

    static DeltaRecord add(std::string id, nlohmann::json item);
    static DeltaRecord change(std::string id, nlohmann::json previous, nlohmann::json delta);

    // {"id": .., "type": "add"|"change", "item": .., ["delta": ..]}
    nlohmann::json toJson() const;
    // Throws Error on a malformed record.
    static DeltaRecord fromJson(const nlohmann::json& j);
};

// Destination for changelog entries. Implementations accept store() calls
// from several threads at once.
class DeltaSink {
public:
    virtual ~DeltaSink() = default;

    // Persist one record; throws on failure.
    virtual void store(const std::string& id, const DeltaRecord& record) = 0;

    // Flush and release resources. Must be called exactly once.
    virtual void close() = 0;
};

// Keeps records in memory, or only counts them when keepData is false.
class MemorySink : public DeltaSink {
public:
    explicit MemorySink(bool keepData = true) : keepData_(keepData) {}

    void store(const std::string& id, const DeltaRecord& record) override;
    void close() override;

    size_t count() const;
    // Not synchronized with store(); read once the writers are done.
    const std::vector<DeltaRecord>& records() const { return records_; }
    bool closed() const;

private:
    mutable std::mutex mutex_;
    bool keepData_;
    bool closed_ = false;
    size_t count_ = 0;
    std::vector<DeltaRecord> records_;
};

// Writes records as one JSON array terminated by the {"done":true} sentinel,
// the same layout as a backing file. With compression the document is kept
// in memory and written as a single zstd frame on close().
class FileSink : public DeltaSink {
public:
    explicit FileSink(std::string path, bool compress = false);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void store(const std::string& id, const DeltaRecord& record) override;
    void close() override;

    const std::string& path() const { return path_; }
    size_t count() const;
    bool compressed() const { return compress_; }

    // False when this build carries no zstd support.
    static bool compressionAvailable();

private:
    void write(const std::string& bytes);

    mutable std::mutex mutex_;
    std::string path_;
    bool compress_;
    bool closed_ = false;
    size_t count_ = 0;
    std::ofstream stream_;
    std::string pending_;
};

} // namespace jsonhistory
