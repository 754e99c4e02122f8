#include "jsonhistory/AppendLog.hpp"
#include "jsonhistory/BackingFile.hpp"
#include "jsonhistory/DeltaSink.hpp"
#include "jsonhistory/Errors.hpp"
#include "jsonhistory/RangeBuffer.hpp"

#include <string>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"

using json = nlohmann::json;
using namespace jsonhistory;

namespace {

std::string digits(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) out.push_back(static_cast<char>('0' + i % 10));
    return out;
}

void testBackingFile(const std::filesystem::path& dir) {
    expect(throws<IoFailure>([&] { BackingFile missing((dir / "missing.json").string()); }),
           "missing file raises IoFailure");

    BackingFile file(writeFile(dir / "plain.txt", "0123456789"));
    expect(file.size() == 10, "size known up front");

    char out[4] = {};
    expect(file.readAt(3, out, 4) == 4 && std::string(out, 4) == "3456", "positioned read");
    expect(file.readAt(8, out, 4) == 2 && std::string(out, 2) == "89", "short read at end of file");
    expect(file.readAt(10, out, 4) == 0, "read at end of file");
    expect(file.readCount() == 2, "only reads inside the file are counted");

    file.close();
    expect(!file.isOpen(), "closed handle");
    expect(throws<StateError>([&] { file.close(); }), "double close rejected");
    expect(throws<StateError>([&] { file.readAt(0, out, 1); }), "read after close rejected");
}

void testRangeBufferLocality(const std::filesystem::path& dir) {
    BackingFile file(writeFile(dir / "digits.txt", digits(4096)));
    RangeBuffer buffer(file, 1024);

    expect(buffer.read(0, 10) == "0123456789", "first read");
    expect(buffer.refillCount() == 1, "first read refills");
    expect(buffer.read(100, 110) == digits(110).substr(100), "second read in same window");
    expect(buffer.refillCount() == 1, "reads inside one window share a single file read");
    expect(file.readCount() == 1, "exactly one positioned file read");

    // Start inside the window, end past it.
    expect(buffer.read(1000, 1030) == digits(1030).substr(1000), "straddling read returns right bytes");
    expect(buffer.refillCount() == 2, "straddling read refills");
    expect(buffer.windowStart() == 1000 && buffer.windowEnd() == 2024, "window moved to request start");

    expect(buffer.read(10, 20) == digits(20).substr(10), "read before window");
    expect(buffer.refillCount() == 3, "backwards read refills");

    expect(buffer.read(4090, 4096) == digits(4096).substr(4090), "read at end of file");
    expect(buffer.windowEnd() == 4096, "window truncated at end of file");
    expect(throws<IoFailure>([&] { buffer.read(4090, 4100); }), "read past end of file");
    expect(buffer.read(5, 5).empty(), "empty range");
}

void testRangeBufferBudget(const std::filesystem::path& dir) {
    BackingFile file(writeFile(dir / "budget.txt", digits(4096)));
    RangeBuffer buffer(file, 1024);
    buffer.prime(0);

    const auto refills = buffer.refillCount();
    const auto windowStart = buffer.windowStart();
    const auto windowEnd = buffer.windowEnd();
    bool caught = false;
    try {
        buffer.read(0, 1025);
    } catch (const BudgetExceeded& e) {
        caught = e.requested() == 1025 && e.budget() == 1024;
    }
    expect(caught, "wider than budget raises BudgetExceeded");
    expect(buffer.refillCount() == refills, "failed read issues no file read");
    expect(buffer.windowStart() == windowStart && buffer.windowEnd() == windowEnd, "window untouched");
    expect(buffer.read(0, 1024) == digits(1024), "read of exactly the budget succeeds");
    expect(buffer.refillCount() == refills, "budget-sized read served from primed window");
    expect(throws<Error>([&] { buffer.read(10, 5); }), "inverted range rejected");
}

void testAppendLog() {
    AppendLog log;
    expect(log.size() == 1, "log starts with the sentinel byte");

    const Location first = log.append(R"({"key":"A"})");
    const Location second = log.append(R"({"key":"B"})");
    expect(first.region == Location::Region::Appended, "append log locations are tagged");
    expect(first.start == 1 && first.end == 12, "first record starts after sentinel");
    expect(second.start == first.end, "records are contiguous");
    expect(log.read(second) == R"({"key":"B"})", "read returns the appended bytes");
    expect(log.records() == 2, "record count");

    expect(throws<Error>([&] { log.read(Location::appended(0, 3)); }), "offset zero is never data");
    expect(throws<Error>([&] { log.read(Location::appended(5, 500)); }), "out of bounds read rejected");
    expect(throws<Error>([&] { log.read(Location::file(1, 3)); }), "file locations rejected");

    log.release();
    expect(log.size() == 1 && log.records() == 0, "release keeps only the sentinel");
}

void testMemorySink() {
    MemorySink keeping;
    keeping.store("A", DeltaRecord::add("A", json{{"key", "A"}}));
    expect(keeping.count() == 1 && keeping.records().size() == 1, "memory sink keeps records");
    keeping.close();
    expect(throws<StateError>([&] { keeping.close(); }), "double close rejected");
    expect(throws<StateError>([&] { keeping.store("B", DeltaRecord::add("B", json::object())); }),
           "store after close rejected");

    MemorySink counting(false);
    counting.store("A", DeltaRecord::add("A", json::object()));
    expect(counting.count() == 1 && counting.records().empty(), "counting sink keeps no data");
    counting.close();
}

void testFileSink(const std::filesystem::path& dir) {
    const auto path = dir / "out" / "delta.json";
    FileSink sink(path.string());
    sink.store("A", DeltaRecord::add("A", json{{"key", "A"}, {"v", 1}}));
    sink.store("B", DeltaRecord::change("B", json{{"key", "B"}, {"v", 1}},
                                        json::array({{{"op", "replace"}, {"path", "/v"}, {"value", 2}}})));
    expect(sink.count() == 2, "file sink counts records");
    sink.close();
    expect(throws<StateError>([&] { sink.close(); }), "file sink double close rejected");

    const auto written = json::parse(readFile(path));
    expect(written.is_array() && written.size() == 3, "delta file is a JSON array with sentinel");
    expect(written[2] == json{{"done", true}}, "sentinel terminates the array");

    const auto add = DeltaRecord::fromJson(written[0]);
    expect(add.type == DeltaRecord::Type::Add && add.id == "A" && add.item["v"] == 1, "add record");
    expect(written[0].contains("delta") == false, "add record carries no delta");

    const auto change = DeltaRecord::fromJson(written[1]);
    expect(change.type == DeltaRecord::Type::Change && change.id == "B", "change record");
    expect(change.item["v"] == 1 && change.delta[0]["value"] == 2, "change keeps old item and delta");

    expect(throws<Error>([] { DeltaRecord::fromJson(json{{"id", "x"}, {"type", "drop"}, {"item", 1}}); }),
           "unknown record type rejected");
    expect(throws<Error>([] { DeltaRecord::fromJson(json::array()); }), "non-object record rejected");

    if (FileSink::compressionAvailable()) {
        FileSink packed((dir / "packed.json.zst").string(), true);
        packed.store("A", DeltaRecord::add("A", json{{"key", "A"}}));
        packed.close();
        const std::string frame = readFile(dir / "packed.json.zst");
        expect(frame.size() > 4 && frame.compare(0, 4, "\x28\xB5\x2F\xFD") == 0, "compressed output is a zstd frame");
    } else {
        FileSink fallback((dir / "raw.json").string(), true);
        expect(!fallback.compressed(), "compression request falls back to raw output");
        fallback.close();
        expect(json::parse(readFile(dir / "raw.json")).size() == 1, "raw fallback holds only the sentinel");
    }
}

} // namespace

int main() {
    const auto dir = freshDir("storage");
    testBackingFile(dir);
    testRangeBufferLocality(dir);
    testRangeBufferBudget(dir);
    testAppendLog();
    testMemorySink();
    testFileSink(dir);
    std::cout << "All tests passed." << std::endl;
    return 0;
}
