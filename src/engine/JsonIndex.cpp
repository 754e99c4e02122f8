//JsonIndex.cpp
#include "JsonIndex.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>
#include "jsonhistory/BackingFile.hpp"
#include "jsonhistory/ByteScanner.hpp"
#include "jsonhistory/Config.hpp"
#include "jsonhistory/RangeBuffer.hpp"

using json = nlohmann::json;

namespace jsonhistory {

namespace {

constexpr size_t kExcerptLength = 80;

std::string excerpt(std::string_view text) {
    if (text.size() <= kExcerptLength) return std::string(text);
    return std::string(text.substr(0, kExcerptLength)) + "...";
}

void sizeFromEnv(const char* name, uint64_t& target) {
    const char* value = std::getenv(name);
    if (!value) return;
    try {
        const uint64_t parsed = parseSize(value);
        if (parsed == 0) {
            std::cerr << "JsonIndex: ignoring " << name << "=0\n";
            return;
        }
        target = parsed;
    } catch (const std::invalid_argument& e) {
        std::cerr << "JsonIndex: ignoring " << name << "=" << value << " (" << e.what() << ")\n";
    }
}

} // namespace

JsonIndex::Options JsonIndex::Options::fromEnvironment(Options base) {
    if (const char* envKey = std::getenv("JSONHISTORY_KEY_FIELD")) {
        if (*envKey) base.keyField = envKey;
    }
    if (const char* envMatcher = std::getenv("JSONHISTORY_KEY_MATCHER")) {
        base.keyMatcher = envMatcher;
    }
    sizeFromEnv("JSONHISTORY_BUFFER_SIZE", base.bufferSize);
    sizeFromEnv("JSONHISTORY_CHUNK_SIZE", base.parseChunkSize);
    if (const char* envVerbose = std::getenv("JSONHISTORY_VERBOSE")) {
        base.verbose = parseBool(envVerbose, base.verbose);
    }
    return base;
}

JsonIndex::JsonIndex(std::string dataFile) : JsonIndex(std::move(dataFile), Options()) {}

JsonIndex::JsonIndex(std::string dataFile, Options options)
    : dataFile_(std::move(dataFile)),
      options_(std::move(options)),
      matcher_(options_.keyField, options_.keyMatcher) {
    if (dataFile_.empty()) throw Error("JsonIndex: data file cannot be empty");
    if (options_.bufferSize == 0) throw Error("JsonIndex: buffer size must be positive");
    if (options_.parseChunkSize == 0) throw Error("JsonIndex: parse chunk size must be positive");

    file_ = std::make_unique<BackingFile>(dataFile_);
    buffer_ = std::make_unique<RangeBuffer>(*file_, options_.bufferSize, options_.verbose);
}

JsonIndex::~JsonIndex() {
    if (!closed_) {
        std::cerr << "JsonIndex: " << dataFile_ << " released without close()\n";
    }
}

void JsonIndex::build() {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (closed_) throw StateError("JsonIndex: build after close");
    if (built_) throw StateError("JsonIndex: index already built");

    const auto startTime = std::chrono::steady_clock::now();
    std::cerr << "JsonIndex: creating index for " << dataFile_ << " size=" << file_->size()
              << " keyField=" << options_.keyField << "\n";

    ByteScanner scanner([this](const ByteScanner::Span& span) {
        std::string key;
        switch (matcher_.extract(span.text, key)) {
        case KeyMatcher::Result::Matched:
            addEntry(key, Location::file(span.start, span.end));
            break;
        case KeyMatcher::Result::Mismatch:
            recordAnomaly(span.start, span.end, "key pattern does not match", span.text);
            break;
        case KeyMatcher::Result::NoField:
            break;
        }
    });
    scanFile(*file_, static_cast<size_t>(options_.parseChunkSize), scanner);

    if (!scanner.finish()) {
        const uint64_t start = scanner.inObject() ? scanner.objectStart() : scanner.offset();
        recordAnomaly(start, scanner.offset(), "unterminated object at end of file", {});
    }

    if (file_->size() > 0) {
        buffer_->prime(0);
    }
    built_ = true;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    std::cerr << "JsonIndex: index ready entries=" << entries_ << " keys=" << index_.size()
              << " anomalies=" << anomalies_.size() << " size=" << (indexSize_ / 1024) << "KB"
              << " took=" << elapsed.count() << "ms\n";
}

bool JsonIndex::has(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    requireReady("has");
    return index_.count(key) > 0;
}

std::optional<JsonIndex::Records> JsonIndex::get(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    requireReady("get");
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;

    Records items;
    items.reserve(it->second.size());
    for (const auto& location : it->second) {
        items.push_back(materialize(location));
    }
    return items;
}

void JsonIndex::add(const std::string& key, const json& item) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    requireReady("add");
    const std::string raw = item.dump();
    addEntry(key, appendLog_.append(raw));
    if (options_.verbose) {
        std::cerr << "JsonIndex: new item " << key << "\n";
    }
}

uint64_t JsonIndex::size() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return indexSize_;
}

size_t JsonIndex::keyCount() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return index_.size();
}

size_t JsonIndex::entryCount() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return entries_;
}

std::vector<Location> JsonIndex::locations(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    requireReady("locations");
    auto it = index_.find(key);
    if (it == index_.end()) return {};
    return it->second;
}

std::vector<ScanAnomaly> JsonIndex::anomalies() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return anomalies_;
}

uint64_t JsonIndex::bufferRefills() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return buffer_ ? buffer_->refillCount() : 0;
}

void JsonIndex::close() {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (closed_) throw StateError("JsonIndex: " + dataFile_ + " already closed");
    closed_ = true;

    buffer_->release();
    appendLog_.release();
    index_.clear();
    file_->close();
    std::cerr << "JsonIndex: closed " << dataFile_ << "\n";
}

bool JsonIndex::built() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return built_;
}

bool JsonIndex::closed() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return closed_;
}

void JsonIndex::requireReady(const char* op) const {
    if (closed_) throw StateError(std::string("JsonIndex: ") + op + " after close");
    if (!built_) throw StateError(std::string("JsonIndex: ") + op + " before build");
}

void JsonIndex::addEntry(const std::string& key, const Location& location) {
    index_[key].push_back(location);
    ++entries_;
    indexSize_ += kEstimatedEntrySize;
}

void JsonIndex::recordAnomaly(uint64_t start, uint64_t end, const std::string& reason, std::string_view text) {
    anomalies_.push_back(ScanAnomaly{start, end, reason});
    std::cerr << "JsonIndex: scan anomaly at [" << start << ", " << end << "): " << reason;
    if (!text.empty()) std::cerr << ": " << excerpt(text);
    std::cerr << "\n";
}

json JsonIndex::materialize(const Location& location) {
    const std::string raw = location.inFile()
        ? buffer_->read(location.start, location.end)
        : appendLog_.read(location);

    auto item = json::parse(raw, nullptr, false);
    if (item.is_discarded()) {
        throw Error("JsonIndex: malformed record at [" + std::to_string(location.start) + ", " +
                    std::to_string(location.end) + ") in " +
                    (location.inFile() ? dataFile_ : std::string("append log")));
    }
    return item;
}

} // namespace jsonhistory
