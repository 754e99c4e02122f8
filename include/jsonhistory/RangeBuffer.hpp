#pragma once

#include <cstdint>
#include <string>

namespace jsonhistory {

class BackingFile;

// Single-window read-through cache over the backing file. A request outside
// the current window triggers one positioned read of up to budget bytes
// starting at the requested offset.
class RangeBuffer {
public:
    RangeBuffer(BackingFile& file, uint64_t budget, bool verbose = false);

    // Copy of the bytes in [start, end). Throws BudgetExceeded, leaving the
    // window untouched, when the range is wider than the budget; IoFailure
    // when the range runs past the end of the file.
    std::string read(uint64_t start, uint64_t end);

    // Unconditionally reload the window at start.
    void prime(uint64_t start);

    bool contains(uint64_t start, uint64_t end) const;

    uint64_t windowStart() const { return windowStart_; }
    uint64_t windowEnd() const { return windowStart_ + window_.size(); }
    uint64_t budget() const { return budget_; }
    uint64_t refillCount() const { return refills_; }

    // Drop the cached bytes.
    void release();

private:
    void refill(uint64_t start);

    BackingFile& file_;
    uint64_t budget_;
    bool verbose_;
    std::string window_;
    uint64_t windowStart_ = 0;
    uint64_t refills_ = 0;
};

} // namespace jsonhistory
