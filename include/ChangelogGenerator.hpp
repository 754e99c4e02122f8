//ChangelogGenerator.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "JsonIndex.hpp"
#include "jsonhistory/DeltaSink.hpp"
#include "jsonhistory/algorithms/ChangeFilters.hpp"

namespace jsonhistory {

// Classifies each incoming item against the index of a previous run and
// writes Add/Change records to a sink.
//
// has -> get/add for one key is not atomic: callers must not store the same
// key from two threads at once. Different keys may be stored concurrently;
// the index and the sinks serialize their own state.
class ChangelogGenerator {
public:
    // Whether a known key's latest value moves forward during the run.
    enum class AdvancePolicy {
        Never,    // only new keys are registered
        OnChange, // changed items are registered too
        Always    // changed and unchanged items are registered
    };

    enum class Outcome { Added, Changed, Unchanged };

    struct Options {
        AdvancePolicy advance = AdvancePolicy::Never;
        // Apply each delta to the previous item and require the new item back.
        bool verifyDelta = false;
        bool verbose = false;
    };

    struct Stats {
        size_t added = 0;
        size_t changed = 0;
        size_t unchanged = 0;
    };

    struct IngestResult {
        size_t stored = 0;
        size_t skipped = 0; // no key field, or a null key
        size_t failed = 0;  // unparsable object, or store() raised Error
        bool truncated = false;
    };

    ChangelogGenerator(JsonIndex& index, DeltaSink& sink, ChangeFilter filter);
    ChangelogGenerator(JsonIndex& index, DeltaSink& sink, ChangeFilter filter, Options options);

    // Build the underlying index.
    void load();

    // Classify one item and emit at most one record. Throws DiffFailure when
    // the delta cannot be produced; the index and sink are left untouched.
    Outcome store(const std::string& key, const nlohmann::json& item);

    // Stream every top-level object of a bundle file through store(), keyed
    // by keyField. Per-item failures are logged and counted; IoFailure on the
    // bundle itself propagates.
    IngestResult ingest(const std::string& bundlePath, const std::string& keyField, size_t chunkSize);

    // Estimated index memory.
    uint64_t size() const;

    // Close the sink and the index.
    void close();

    Stats stats() const;
    const Options& options() const { return options_; }

private:
    JsonIndex& index_;
    DeltaSink& sink_;
    ChangeFilter filter_;
    Options options_;
    std::atomic<size_t> added_{0};
    std::atomic<size_t> changed_{0};
    std::atomic<size_t> unchanged_{0};
};

const char* toString(ChangelogGenerator::Outcome outcome);

// "never" | "change" | "always". Throws Error for anything else.
ChangelogGenerator::AdvancePolicy parseAdvancePolicy(const std::string& text);

} // namespace jsonhistory
