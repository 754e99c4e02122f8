#include "jsonhistory/ByteScanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include "jsonhistory/BackingFile.hpp"
#include "jsonhistory/Errors.hpp"

namespace jsonhistory {

namespace {

constexpr char kOpeningBracket = '{';
constexpr char kClosingBracket = '}';
constexpr char kDoubleQuote = '"';
constexpr char kBackslash = '\\';

} // namespace

ByteScanner::ByteScanner(SpanHandler onSpan) : onSpan_(std::move(onSpan)) {
    if (!onSpan_) throw std::invalid_argument("ByteScanner: span handler is required");
}

void ByteScanner::feed(std::string_view chunk) {
    // Position inside this chunk where the open object's bytes begin.
    size_t segmentStart = inObject() ? 0 : chunk.size();

    for (size_t position = 0; position < chunk.size(); ++position) {
        const char ch = chunk[position];

        switch (state_) {
        case State::Escape:
            state_ = State::InString;
            continue;
        case State::InString:
            if (ch == kBackslash) {
                state_ = State::Escape;
            } else if (ch == kDoubleQuote) {
                state_ = State::Outside;
            }
            continue;
        case State::Outside:
            break;
        }

        if (ch == kDoubleQuote) {
            state_ = State::InString;
        } else if (ch == kOpeningBracket) {
            depth_ += 1;
            if (depth_ == 0) {
                objectStart_ = offset_ + position;
                segmentStart = position;
                carry_.clear();
            }
        } else if (ch == kClosingBracket && depth_ >= 0) {
            depth_ -= 1;
            if (depth_ == -1) {
                const uint64_t end = offset_ + position + 1;
                std::string_view tail = chunk.substr(segmentStart, position + 1 - segmentStart);
                ++spans_;
                if (carry_.empty()) {
                    onSpan_(Span{objectStart_, end, tail});
                } else {
                    carry_.append(tail.data(), tail.size());
                    onSpan_(Span{objectStart_, end, carry_});
                    carry_.clear();
                }
                segmentStart = chunk.size();
            }
        }
    }

    if (inObject() && segmentStart < chunk.size()) {
        carry_.append(chunk.data() + segmentStart, chunk.size() - segmentStart);
    }
    offset_ += chunk.size();
}

bool ByteScanner::finish() const {
    return depth_ == -1 && state_ == State::Outside;
}

void scanFile(BackingFile& file, std::size_t chunkSize, ByteScanner& scanner) {
    if (chunkSize == 0) throw std::invalid_argument("scanFile: chunk size must be positive");

    const uint64_t size = file.size();
    uint64_t bytesRead = 0;
    std::string chunk;

    while (bytesRead < size) {
        const size_t want = static_cast<size_t>(std::min<uint64_t>(chunkSize, size - bytesRead));
        chunk.resize(want);
        const size_t got = file.readAt(bytesRead, chunk.data(), want);
        if (got != want) {
            throw IoFailure("short read from " + file.path() + " at offset " + std::to_string(bytesRead) +
                            " (wanted " + std::to_string(want) + ", got " + std::to_string(got) + ")");
        }
        scanner.feed(chunk);
        bytesRead += got;
    }
}

} // namespace jsonhistory
