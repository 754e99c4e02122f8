#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace jsonhistory {

// Base for every recoverable failure surfaced to callers.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A read range wider than the Range Buffer window.
class BudgetExceeded : public Error {
public:
    BudgetExceeded(uint64_t requested, uint64_t budget)
        : Error("read of " + std::to_string(requested) + " bytes exceeds buffer size " + std::to_string(budget)),
          requested_(requested), budget_(budget) {}

    uint64_t requested() const { return requested_; }
    uint64_t budget() const { return budget_; }

private:
    uint64_t requested_;
    uint64_t budget_;
};

// Open/read/write/close failure on a file.
class IoFailure : public Error {
public:
    using Error::Error;
};

// Structural diff could not be computed (or did not reproduce the new value).
class DiffFailure : public Error {
public:
    using Error::Error;
};

// Programmer error: use before build, use after close, double close.
class StateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Candidate span rejected during the index scan. Logged, never thrown.
struct ScanAnomaly {
    uint64_t start = 0;
    uint64_t end = 0;
    std::string reason;
};

} // namespace jsonhistory
