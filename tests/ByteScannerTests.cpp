#include "jsonhistory/ByteScanner.hpp"
#include "jsonhistory/Errors.hpp"
#include "jsonhistory/KeyMatcher.hpp"

#include <string>
#include <vector>
#include "TestSupport.hpp"

using jsonhistory::ByteScanner;
using jsonhistory::KeyMatcher;

namespace {

struct Found {
    uint64_t start;
    uint64_t end;
    std::string text;
};

std::vector<Found> scanChunks(const std::string& input, size_t chunkSize, bool* clean = nullptr) {
    std::vector<Found> found;
    ByteScanner scanner([&](const ByteScanner::Span& span) {
        found.push_back({span.start, span.end, std::string(span.text)});
    });
    for (size_t pos = 0; pos < input.size(); pos += chunkSize) {
        scanner.feed(std::string_view(input).substr(pos, chunkSize));
    }
    if (clean) *clean = scanner.finish();
    return found;
}

std::vector<Found> scanWhole(const std::string& input, bool* clean = nullptr) {
    return scanChunks(input, input.size() == 0 ? 1 : input.size(), clean);
}

// Every split of the input into two chunks, and one-byte chunks, must yield
// the same spans as a single feed.
void expectChunkIndependent(const std::string& input, const std::string& label) {
    const auto whole = scanWhole(input);
    auto same = [&](const std::vector<Found>& other) {
        if (other.size() != whole.size()) return false;
        for (size_t i = 0; i < whole.size(); ++i) {
            if (other[i].start != whole[i].start || other[i].end != whole[i].end || other[i].text != whole[i].text) {
                return false;
            }
        }
        return true;
    };

    expect(same(scanChunks(input, 1)), label + ": one-byte chunks differ");
    for (size_t split = 1; split < input.size(); ++split) {
        std::vector<Found> found;
        ByteScanner scanner([&](const ByteScanner::Span& span) {
            found.push_back({span.start, span.end, std::string(span.text)});
        });
        scanner.feed(std::string_view(input).substr(0, split));
        scanner.feed(std::string_view(input).substr(split));
        expect(same(found), label + ": split at " + std::to_string(split) + " differs");
    }
}

void testTopLevelObjects() {
    const std::string input = R"([{"key":"A","v":1},{"key":"B","v":2}])";
    bool clean = false;
    const auto found = scanWhole(input, &clean);
    expect(clean, "scanner should end outside any object");
    expect(found.size() == 2, "expected two spans");
    expect(found[0].text == R"({"key":"A","v":1})", "first span text");
    expect(found[1].text == R"({"key":"B","v":2})", "second span text");
    expect(found[0].start == 1, "first span starts after '['");
    expect(found[0].end == input.find("},{") + 1, "first span ends at its closing brace");
    expect(input.substr(found[1].start, found[1].end - found[1].start) == found[1].text,
           "offsets address the span text");
}

void testNestingAndBracesInStrings() {
    auto nested = scanWhole(R"([{"a":{"b":{}},"c":[{"d":1}]}])");
    expect(nested.size() == 1, "nested objects yield one top-level span");
    expect(nested[0].text == R"({"a":{"b":{}},"c":[{"d":1}]})", "nested span covers whole object");

    auto quoted = scanWhole(R"([{"s":"}{","t":"{{"}, {"u":1}])");
    expect(quoted.size() == 2, "braces inside strings are ignored");
    expect(quoted[0].text == R"({"s":"}{","t":"{{"})", "quoted braces stay inside the span");

    auto topLevelString = scanWhole(R"(["{", {"k":1}, "}"])");
    expect(topLevelString.size() == 1, "strings between objects do not open objects");
    expect(topLevelString[0].text == R"({"k":1})", "object after a quoted brace");
}

// Object text that must come back as exactly one span.
struct EscapeCase {
    std::string text;
    std::string label;
};

void testEscapedQuoteTable() {
    const std::vector<EscapeCase> table = {
        {R"({"s":"a\"}"})", "one backslash escapes the quote"},
        {R"({"s":"a\\"})", "two backslashes close the string"},
        {R"({"s":"a\\\"}"})", "three backslashes escape the quote"},
        {R"({"s":"a\\\\"})", "four backslashes close the string"},
        {R"({"s":"\\","t":"}"})", "even run before a quote then another string"},
        {R"({"s":"\""})", "string holding only an escaped quote"},
        {R"({"s":"\\\\\\"})", "six backslashes close the string"},
        {R"({"s":"\u0022}"})", "unicode escape is not a quote"},
    };

    for (const auto& row : table) {
        const std::string input = "[" + row.text + ",{\"after\":true}]";
        bool clean = false;
        const auto found = scanWhole(input, &clean);
        expect(clean, row.label + ": scanner should finish outside objects");
        expect(found.size() == 2, row.label + ": expected the object and its successor");
        expect(found[0].text == row.text, row.label + ": span text");
        expect(found[1].text == "{\"after\":true}", row.label + ": successor span");
        expectChunkIndependent(input, row.label);
    }
}

void testChunkBoundaries() {
    const std::string input = R"([{"key":"A","s":"x\"}{"},{"key":"B","n":{"m":"\\"}},{"done":true}])";
    expectChunkIndependent(input, "mixed input");

    bool clean = false;
    const auto found = scanChunks(input, 3, &clean);
    expect(clean, "three-byte chunks end clean");
    expect(found.size() == 3, "three spans across chunks");
    expect(found[2].text == R"({"done":true})", "sentinel span");
    expect(input.substr(found[1].start, found[1].end - found[1].start) == found[1].text,
           "cross-chunk offsets address the span text");
}

void testStrayAndUnterminated() {
    auto stray = scanWhole(R"(}{"k":1}})");
    expect(stray.size() == 1, "stray closing braces are ignored");
    expect(stray[0].start == 1 && stray[0].text == R"({"k":1})", "object after stray brace");

    bool clean = true;
    auto truncated = scanWhole(R"([{"k":1},{"k":)", &clean);
    expect(!clean, "truncated input is reported by finish()");
    expect(truncated.size() == 1, "complete object before truncation is reported");

    ByteScanner scanner([](const ByteScanner::Span&) {});
    scanner.feed(R"([{"k":"ab)");
    expect(scanner.inObject() && scanner.depth() == 0, "open object tracked");
    expect(scanner.inString(), "open string tracked");
    expect(scanner.objectStart() == 1, "object start recorded");
    scanner.feed("\\");
    expect(scanner.state() == ByteScanner::State::Escape, "escape pending across chunks");
    scanner.feed(R"("c"}])");
    expect(scanner.finish(), "escape resolved in next chunk");
    expect(scanner.spanCount() == 1, "one span emitted");
    expect(scanner.offset() == 15, "offset counts every byte fed");
}

void testKeyMatcher() {
    KeyMatcher matcher("key");
    std::string key;

    expect(matcher.extract(R"({"key":"A","v":1})", key) == KeyMatcher::Result::Matched && key == "A",
           "default pattern extracts key");
    expect(matcher.extract(R"({ "key" : "spaced" })", key) == KeyMatcher::Result::Matched && key == "spaced",
           "default pattern tolerates whitespace");
    expect(matcher.extract(R"({"key":"a\"b"})", key) == KeyMatcher::Result::Matched && key == "a\"b",
           "escaped characters are decoded");
    expect(matcher.extract(R"({"key":""})", key) == KeyMatcher::Result::Matched && key.empty(),
           "empty key value");
    expect(matcher.extract(R"({"key":5})", key) == KeyMatcher::Result::Mismatch, "numeric key is a mismatch");
    expect(matcher.extract(R"({"v":1,"monkey":"x"})", key) == KeyMatcher::Result::NoField,
           "field name must appear quoted");
    expect(matcher.extract(R"({"key":"outer","child":{"key":"inner"}})", key) == KeyMatcher::Result::Matched &&
           key == "outer", "first occurrence wins");

    KeyMatcher custom("id", R"re("id":(\d+))re");
    expect(custom.extract(R"({"id":42})", key) == KeyMatcher::Result::Matched && key == "42",
           "custom pattern uses last capture group");

    KeyMatcher dotted("a.b");
    expect(dotted.extract(R"({"axb":"no","a.b":"yes"})", key) == KeyMatcher::Result::Matched && key == "yes",
           "key field is matched literally");

    expect(throws<jsonhistory::Error>([] { KeyMatcher bad("key", "(unclosed"); }), "invalid pattern rejected");
    expect(throws<jsonhistory::Error>([] { KeyMatcher bad(""); }), "empty key field rejected");
}

} // namespace

int main() {
    testTopLevelObjects();
    testNestingAndBracesInStrings();
    testEscapedQuoteTable();
    testChunkBoundaries();
    testStrayAndUnterminated();
    testKeyMatcher();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
