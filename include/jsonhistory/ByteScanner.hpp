#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace jsonhistory {

class BackingFile;

// Streaming classifier that reports the byte range of every top-level JSON
// object. Input is fed in file order, one chunk at a time; all state
// survives chunk boundaries.
//
// Lexical states and transitions (any byte not listed keeps the state):
//
//   state     byte   next      effect
//   --------  -----  --------  ---------------------------------------------
//   Outside   '"'    InString
//   Outside   '{'    Outside   depth += 1; depth -1 -> 0 opens a candidate
//   Outside   '}'    Outside   depth -= 1; depth 0 -> -1 closes the candidate
//                              and emits [start, position + 1)
//   InString  '\\'   Escape
//   InString  '"'    Outside
//   Escape    any    InString  escaped byte is consumed
//
// A quote preceded by an even run of backslashes closes the string, an odd
// run escapes it. A '}' seen at depth -1 is a stray byte between objects and
// leaves the depth unchanged.
class ByteScanner {
public:
    enum class State : uint8_t { Outside, InString, Escape };

    struct Span {
        uint64_t start;
        uint64_t end;
        std::string_view text; // valid only for the duration of the callback
    };

    using SpanHandler = std::function<void(const Span&)>;

    explicit ByteScanner(SpanHandler onSpan);

    // Consume the next chunk of the stream.
    void feed(std::string_view chunk);

    // Returns false when the stream ended inside an object or a string.
    bool finish() const;

    State state() const { return state_; }
    bool inString() const { return state_ != State::Outside; }
    int64_t depth() const { return depth_; }
    uint64_t offset() const { return offset_; }
    uint64_t spanCount() const { return spans_; }

    // Start offset of the object currently open, if any.
    bool inObject() const { return depth_ >= 0; }
    uint64_t objectStart() const { return objectStart_; }

private:
    SpanHandler onSpan_;
    State state_ = State::Outside;
    int64_t depth_ = -1;
    uint64_t offset_ = 0;
    uint64_t objectStart_ = 0;
    uint64_t spans_ = 0;
    // Bytes of the open object that arrived in earlier chunks.
    std::string carry_;
};

// Reads the whole file in chunks of chunkSize bytes and feeds them to the
// scanner. Throws IoFailure on short or failed reads.
void scanFile(BackingFile& file, std::size_t chunkSize, ByteScanner& scanner);

} // namespace jsonhistory
