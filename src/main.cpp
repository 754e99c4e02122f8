#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "ChangelogGenerator.hpp"
#include "JsonIndex.hpp"
#include "jsonhistory/Config.hpp"
#include "jsonhistory/DeltaSink.hpp"

using json = nlohmann::json;
using namespace jsonhistory;

namespace {

void usage() {
    std::cerr << "usage: jsonhistory <command> [options]\n"
                 "  index --history=<file>                    build the index and print its stats\n"
                 "  get   --history=<file> --key=<key>        print every record stored under key\n"
                 "  diff  --history=<file> --input=<file> --output=<file>\n"
                 "  diff  --dataDir=<dir> --name=<name> --input=<file>\n"
                 "options: --keyField --keyMatcher --bufferSize --chunkSize --changedField\n"
                 "         --orderField --advance=never|change|always --verifyDelta --compress --verbose\n";
}

JsonIndex::Options indexOptions(const Config& config) {
    JsonIndex::Options options = JsonIndex::Options::fromEnvironment(JsonIndex::Options());
    options.keyField = config.getString("keyField", options.keyField);
    options.keyMatcher = config.getString("keyMatcher", options.keyMatcher);
    options.bufferSize = config.getSize("bufferSize", options.bufferSize);
    options.parseChunkSize = config.getSize("chunkSize", options.parseChunkSize);
    options.verbose = config.getBool("verbose", options.verbose);
    return options;
}

std::string required(const Config& config, const std::string& key) {
    if (!config.has(key)) throw Error("missing required option --" + key);
    return config.getString(key, "");
}

int runIndex(const Config& config) {
    JsonIndex index(required(config, "history"), indexOptions(config));
    index.build();
    json out = {
        {"file", index.dataFile()},
        {"keys", index.keyCount()},
        {"entries", index.entryCount()},
        {"anomalies", index.anomalies().size()},
        {"estimatedSize", index.size()}
    };
    index.close();
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int runGet(const Config& config) {
    JsonIndex index(required(config, "history"), indexOptions(config));
    index.build();
    const std::string key = required(config, "key");
    auto records = index.get(key);
    index.close();
    if (!records) {
        std::cerr << "key not found: " << key << "\n";
        return 1;
    }
    std::cout << json(*records).dump(2) << std::endl;
    return 0;
}

int runDiff(const Config& config) {
    const auto now = std::chrono::system_clock::now();
    const std::string dataDir = config.getString("dataDir", "");
    const std::string name = config.getString("name", "");
    const std::string input = required(config, "input");

    std::optional<std::string> history;
    if (config.has("history")) {
        history = config.getString("history", "");
    } else if (!dataDir.empty() && !name.empty()) {
        history = resolveHistoryDataSource(dataDir, name, now);
    }
    if (!history) {
        std::cerr << "jsonhistory: no previous bundle found; history disabled\n";
        return 0;
    }

    std::string output = config.getString("output", "");
    if (output.empty()) {
        if (dataDir.empty() || name.empty()) throw Error("missing required option --output");
        output = resolveDataFileName(dataDir, name, "delta", now);
    }
    std::cerr << "jsonhistory: using history data source " << *history << " and output file " << output << "\n";

    const JsonIndex::Options options = indexOptions(config);
    ChangeFilter filter = config.has("changedField")
        ? filters::fieldChanged(config.getString("changedField", ""))
        : filters::deepInequality();
    if (config.has("orderField")) {
        filter.compare = filters::orderByField(config.getString("orderField", ""));
    }

    ChangelogGenerator::Options generatorOptions;
    generatorOptions.advance = parseAdvancePolicy(config.getString("advance", "never"));
    generatorOptions.verifyDelta = config.getBool("verifyDelta", false);
    generatorOptions.verbose = options.verbose;

    JsonIndex index(*history, options);
    FileSink sink(output, config.getBool("compress", false));
    ChangelogGenerator generator(index, sink, filter, generatorOptions);
    generator.load();

    const auto ingested = generator.ingest(input, options.keyField, static_cast<size_t>(options.parseChunkSize));

    const auto stats = generator.stats();
    generator.close();

    json out = {
        {"history", *history},
        {"output", output},
        {"added", stats.added},
        {"changed", stats.changed},
        {"unchanged", stats.unchanged},
        {"skipped", ingested.skipped},
        {"failed", ingested.failed}
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const Config config = Config::fromArguments(argc, argv);
        if (config.commands().empty()) {
            usage();
            return 1;
        }
        const std::string& command = config.commands().front();
        if (command == "index") return runIndex(config);
        if (command == "get") return runGet(config);
        if (command == "diff") return runDiff(config);
        std::cerr << "Command not found: " << command << "\n";
        usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Fatal unknown error\n";
        return 1;
    }
}
