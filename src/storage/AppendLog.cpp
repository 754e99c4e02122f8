#include "jsonhistory/AppendLog.hpp"

#include "jsonhistory/Errors.hpp"

namespace jsonhistory {

AppendLog::AppendLog() : log_(1, kSentinel) {}

Location AppendLog::append(std::string_view bytes) {
    const uint64_t start = log_.size();
    log_.append(bytes.data(), bytes.size());
    ++records_;
    return Location::appended(start, log_.size());
}

std::string AppendLog::read(const Location& location) const {
    if (location.region != Location::Region::Appended) {
        throw Error("AppendLog: location does not belong to the append log");
    }
    if (location.start == 0 || location.start > location.end || location.end > log_.size()) {
        throw Error("AppendLog: range [" + std::to_string(location.start) + ", " +
                    std::to_string(location.end) + ") is out of bounds");
    }
    return log_.substr(static_cast<size_t>(location.start), static_cast<size_t>(location.length()));
}

void AppendLog::release() {
    std::string(1, kSentinel).swap(log_);
    records_ = 0;
}

} // namespace jsonhistory
