#pragma once

#include <cstdint>

namespace jsonhistory {

// Half-open byte range [start, end) inside exactly one region: the backing
// file or the in-memory append log.
struct Location {
    enum class Region { File, Appended };

    Region region = Region::File;
    uint64_t start = 0;
    uint64_t end = 0;

    static Location file(uint64_t start, uint64_t end) { return {Region::File, start, end}; }
    static Location appended(uint64_t start, uint64_t end) { return {Region::Appended, start, end}; }

    uint64_t length() const { return end - start; }
    bool inFile() const { return region == Region::File; }

    bool operator==(const Location& other) const {
        return region == other.region && start == other.start && end == other.end;
    }
    bool operator!=(const Location& other) const { return !(*this == other); }
};

} // namespace jsonhistory
