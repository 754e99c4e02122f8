//ChangelogGenerator.cpp
#include "ChangelogGenerator.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>
#include "jsonhistory/BackingFile.hpp"
#include "jsonhistory/ByteScanner.hpp"
#include "jsonhistory/algorithms/StructuralDiff.hpp"

using json = nlohmann::json;

namespace jsonhistory {

ChangelogGenerator::ChangelogGenerator(JsonIndex& index, DeltaSink& sink, ChangeFilter filter)
    : ChangelogGenerator(index, sink, std::move(filter), Options()) {}

ChangelogGenerator::ChangelogGenerator(JsonIndex& index, DeltaSink& sink, ChangeFilter filter, Options options)
    : index_(index), sink_(sink), filter_(std::move(filter)), options_(options) {
    if (!filter_.changed) throw std::invalid_argument("ChangelogGenerator: a changed() predicate is required");
}

void ChangelogGenerator::load() {
    std::cerr << "ChangelogGenerator: loading history from " << index_.dataFile() << "\n";
    index_.build();
}

ChangelogGenerator::Outcome ChangelogGenerator::store(const std::string& key, const json& item) {
    // Records reach the sink before the index learns about them, so a failed
    // store leaves the key classified exactly as before.
    if (!index_.has(key)) {
        sink_.store(key, DeltaRecord::add(key, item));
        index_.add(key, item);
        ++added_;
        if (options_.verbose) std::cerr << "ChangelogGenerator: new item " << key << "\n";
        return Outcome::Added;
    }

    auto records = index_.get(key);
    if (!records || records->empty()) {
        throw Error("ChangelogGenerator: index lost the records of " + key);
    }
    if (filter_.compare) {
        std::stable_sort(records->begin(), records->end(), [this](const json& a, const json& b) {
            return filter_.compare(a, b) < 0;
        });
    }

    if (!filter_.changed(*records, item)) {
        if (options_.advance == AdvancePolicy::Always) {
            index_.add(key, item);
        }
        ++unchanged_;
        return Outcome::Unchanged;
    }

    const json& previous = records->back();
    json delta = algo::diff(previous, item);
    if (options_.verifyDelta && algo::apply(previous, delta) != item) {
        throw DiffFailure("delta for " + key + " does not reproduce the new item");
    }

    sink_.store(key, DeltaRecord::change(key, previous, std::move(delta)));
    if (options_.advance != AdvancePolicy::Never) {
        index_.add(key, item);
    }
    ++changed_;
    if (options_.verbose) std::cerr << "ChangelogGenerator: item changed " << key << "\n";
    return Outcome::Changed;
}

ChangelogGenerator::IngestResult ChangelogGenerator::ingest(const std::string& bundlePath,
                                                           const std::string& keyField,
                                                           size_t chunkSize) {
    IngestResult result;
    BackingFile bundle(bundlePath);
    ByteScanner scanner([&](const ByteScanner::Span& span) {
        auto item = json::parse(span.text, nullptr, false);
        if (item.is_discarded() || !item.is_object()) {
            std::cerr << "ChangelogGenerator: invalid object at [" << span.start << ", " << span.end << ") in "
                      << bundlePath << "\n";
            ++result.failed;
            return;
        }
        auto keyIt = item.find(keyField);
        if (keyIt == item.end() || keyIt->is_null()) {
            ++result.skipped;
            return;
        }
        const std::string key = keyIt->is_string() ? keyIt->get<std::string>() : keyIt->dump();
        try {
            store(key, item);
            ++result.stored;
        } catch (const Error& e) {
            std::cerr << "ChangelogGenerator: cannot store " << key << ": " << e.what() << "\n";
            ++result.failed;
        }
    });
    scanFile(bundle, chunkSize, scanner);
    if (!scanner.finish()) {
        std::cerr << "ChangelogGenerator: " << bundlePath << " ends inside an object\n";
        result.truncated = true;
        ++result.failed;
    }
    bundle.close();
    return result;
}

uint64_t ChangelogGenerator::size() const {
    return index_.size();
}

void ChangelogGenerator::close() {
    std::cerr << "ChangelogGenerator: closing; added=" << added_.load() << " changed=" << changed_.load()
              << " unchanged=" << unchanged_.load() << "\n";
    // Close the index even when the sink fails, then report the sink failure.
    try {
        sink_.close();
    } catch (const std::exception&) {
        index_.close();
        throw;
    }
    index_.close();
}

ChangelogGenerator::Stats ChangelogGenerator::stats() const {
    Stats s;
    s.added = added_;
    s.changed = changed_;
    s.unchanged = unchanged_;
    return s;
}

const char* toString(ChangelogGenerator::Outcome outcome) {
    switch (outcome) {
    case ChangelogGenerator::Outcome::Added: return "added";
    case ChangelogGenerator::Outcome::Changed: return "changed";
    case ChangelogGenerator::Outcome::Unchanged: return "unchanged";
    }
    return "unknown";
}

ChangelogGenerator::AdvancePolicy parseAdvancePolicy(const std::string& text) {
    if (text == "never") return ChangelogGenerator::AdvancePolicy::Never;
    if (text == "change") return ChangelogGenerator::AdvancePolicy::OnChange;
    if (text == "always") return ChangelogGenerator::AdvancePolicy::Always;
    throw Error("unknown advance policy '" + text + "' (expected never, change or always)");
}

} // namespace jsonhistory
