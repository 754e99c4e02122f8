#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsonhistory {

// Key/value settings parsed from the command line. Accepts key=value,
// --key=value and --key value; anything else is a command.
class Config {
public:
    static Config fromArguments(const std::vector<std::string>& args);
    static Config fromArguments(int argc, char** argv);

    void set(const std::string& key, const std::string& value);
    bool has(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& def) const;
    uint64_t getSize(const std::string& key, uint64_t def) const;
    bool getBool(const std::string& key, bool def) const;

    const std::vector<std::string>& commands() const { return commands_; }

private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> commands_;
};

// "4096", "64K", "50M", "1G" -> bytes. Throws std::invalid_argument.
uint64_t parseSize(const std::string& text);

// 1/true/yes/on and 0/false/no/off; def for anything else.
bool parseBool(const std::string& text, bool def);

// yyyy-mm-dd (UTC).
std::string dateStamp(std::chrono::system_clock::time_point when);

// <dataDir>/<yyyy-mm-dd>-<baseName>[-<suffix>].json for the given day.
std::string resolveDataFileName(const std::string& dataDir,
                                const std::string& baseName,
                                const std::string& suffix,
                                std::chrono::system_clock::time_point now);

// Newest <yyyy-mm-dd>-<baseName>.json bundle in dataDir dated more than a day
// before now; nullopt when there is none.
std::optional<std::string> resolveHistoryDataSource(const std::string& dataDir,
                                                    const std::string& baseName,
                                                    std::chrono::system_clock::time_point now);

} // namespace jsonhistory
