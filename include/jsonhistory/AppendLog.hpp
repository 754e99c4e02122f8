#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "jsonhistory/Location.hpp"

namespace jsonhistory {

// Unbounded in-memory log of records created during the current run. Byte 0
// is a reserved sentinel so no record ever starts at offset zero.
class AppendLog {
public:
    static constexpr char kSentinel = 'N';

    AppendLog();

    // Append raw bytes; the returned location is tagged Region::Appended.
    Location append(std::string_view bytes);

    // Copy of the bytes behind an appended location.
    std::string read(const Location& location) const;

    // Total bytes held, sentinel included.
    uint64_t size() const { return log_.size(); }
    size_t records() const { return records_; }

    void release();

private:
    std::string log_;
    size_t records_ = 0;
};

} // namespace jsonhistory
