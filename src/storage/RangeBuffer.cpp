#include "jsonhistory/RangeBuffer.hpp"

#include <algorithm>
#include <iostream>
#include "jsonhistory/BackingFile.hpp"
#include "jsonhistory/Errors.hpp"

namespace jsonhistory {

RangeBuffer::RangeBuffer(BackingFile& file, uint64_t budget, bool verbose)
    : file_(file), budget_(budget), verbose_(verbose) {
    if (budget_ == 0) throw Error("RangeBuffer: buffer size must be positive");
}

bool RangeBuffer::contains(uint64_t start, uint64_t end) const {
    return start >= windowStart_ && end <= windowEnd();
}

std::string RangeBuffer::read(uint64_t start, uint64_t end) {
    if (end < start) {
        throw Error("RangeBuffer: invalid range [" + std::to_string(start) + ", " + std::to_string(end) + ")");
    }
    if (end - start > budget_) {
        throw BudgetExceeded(end - start, budget_);
    }
    if (start == end) return {};

    // Covers a start outside the window as well as an end running past it.
    if (!contains(start, end)) {
        refill(start);
        if (!contains(start, end)) {
            throw IoFailure("range [" + std::to_string(start) + ", " + std::to_string(end) +
                            ") runs past the end of " + file_.path());
        }
    }

    const auto offset = static_cast<size_t>(start - windowStart_);
    return window_.substr(offset, static_cast<size_t>(end - start));
}

void RangeBuffer::prime(uint64_t start) {
    refill(start);
}

void RangeBuffer::refill(uint64_t start) {
    const uint64_t available = start < file_.size() ? file_.size() - start : 0;
    const auto want = static_cast<size_t>(std::min(budget_, available));

    window_.resize(want);
    size_t got = 0;
    try {
        got = file_.readAt(start, window_.data(), want);
    } catch (const std::exception&) {
        window_.clear();
        windowStart_ = 0;
        throw;
    }
    window_.resize(got);
    windowStart_ = start;
    ++refills_;

    if (verbose_) {
        std::cerr << "RangeBuffer: buffering new range [" << windowStart() << ", " << windowEnd() << ")\n";
    }
}

void RangeBuffer::release() {
    std::string().swap(window_);
    windowStart_ = 0;
}

} // namespace jsonhistory
