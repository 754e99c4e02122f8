//JsonIndex.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "jsonhistory/AppendLog.hpp"
#include "jsonhistory/Errors.hpp"
#include "jsonhistory/KeyMatcher.hpp"
#include "jsonhistory/Location.hpp"

namespace jsonhistory {

class BackingFile;
class RangeBuffer;

// Indexes a huge JSON array file by a key field and lazily retrieves its
// entries. Only a lightweight key -> locations map is kept in memory, plus
// one window of raw bytes; entries are parsed when read.
//
// The backing file stays open until close() is explicitly invoked. Entries
// are indexed in file order, so contiguous keys read sequentially hit the
// cached window.
class JsonIndex {
public:
    using Records = std::vector<nlohmann::json>;

    // Estimated in-memory cost of a single index entry.
    static constexpr uint64_t kEstimatedEntrySize = 20;

    struct Options {
        std::string keyField = "key";
        // Empty selects KeyMatcher::defaultPattern(keyField).
        std::string keyMatcher;
        uint64_t bufferSize = 50ull * 1024 * 1024;
        uint64_t parseChunkSize = 100ull * 1024 * 1024;
        bool verbose = false;

        // Apply JSONHISTORY_* environment overrides on top of base.
        static Options fromEnvironment(Options base);
    };

    explicit JsonIndex(std::string dataFile);
    JsonIndex(std::string dataFile, Options options);
    ~JsonIndex();

    JsonIndex(const JsonIndex&) = delete;
    JsonIndex& operator=(const JsonIndex&) = delete;

    // Scan the whole file once. Must complete before any lookup.
    void build();

    bool has(const std::string& key) const;

    // Every record stored under key, in discovery order; nullopt when the key
    // is unknown.
    std::optional<Records> get(const std::string& key);

    // Serialize item into the append log and register it under key.
    void add(const std::string& key, const nlohmann::json& item);

    // Estimated index memory (entries * kEstimatedEntrySize).
    uint64_t size() const;

    size_t keyCount() const;
    size_t entryCount() const;
    std::vector<Location> locations(const std::string& key) const;
    std::vector<ScanAnomaly> anomalies() const;

    // Positioned reads issued by the range buffer since build().
    uint64_t bufferRefills() const;

    // Release the backing file and every buffer. Must be called exactly once.
    void close();

    bool built() const;
    bool closed() const;
    const Options& options() const { return options_; }
    const std::string& dataFile() const { return dataFile_; }

private:
    void requireReady(const char* op) const;
    void addEntry(const std::string& key, const Location& location);
    void recordAnomaly(uint64_t start, uint64_t end, const std::string& reason, std::string_view text);
    nlohmann::json materialize(const Location& location);

    std::string dataFile_;
    Options options_;
    KeyMatcher matcher_;

    std::unique_ptr<BackingFile> file_;
    std::unique_ptr<RangeBuffer> buffer_;
    AppendLog appendLog_;

    std::unordered_map<std::string, std::vector<Location>> index_;
    size_t entries_ = 0;
    uint64_t indexSize_ = 0;
    std::vector<ScanAnomaly> anomalies_;

    bool built_ = false;
    bool closed_ = false;
    mutable std::recursive_mutex mutex_;
};

} // namespace jsonhistory
