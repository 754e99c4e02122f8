#include "jsonhistory/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <regex>
#include <stdexcept>
#include "jsonhistory/Errors.hpp"

namespace jsonhistory {

namespace {

constexpr auto kOneDay = std::chrono::hours(24);

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Midnight UTC of a yyyy-mm-dd stamp.
std::optional<std::chrono::system_clock::time_point> parseDateStamp(const std::string& stamp) {
    std::tm tm{};
    if (std::sscanf(stamp.c_str(), "%d-%d-%d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday) != 3) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    const std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace

Config Config::fromArguments(const std::vector<std::string>& args) {
    Config config;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& item = args[i];
        const auto equalsPos = item.find('=');
        const bool dashed = item.compare(0, 2, "--") == 0;

        if (equalsPos != std::string::npos) {
            const size_t keyStart = dashed ? 2 : 0;
            config.set(trim(item.substr(keyStart, equalsPos - keyStart)), trim(item.substr(equalsPos + 1)));
        } else if (dashed) {
            // --key value; a trailing --key is a switch.
            if (i + 1 < args.size()) {
                config.set(item.substr(2), args[i + 1]);
                ++i;
            } else {
                config.set(item.substr(2), "true");
            }
        } else {
            config.commands_.push_back(item);
        }
    }
    return config;
}

Config Config::fromArguments(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return fromArguments(args);
}

void Config::set(const std::string& key, const std::string& value) {
    kv_[key] = value;
}

bool Config::has(const std::string& key) const {
    return kv_.count(key) > 0;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    return it == kv_.end() ? def : it->second;
}

uint64_t Config::getSize(const std::string& key, uint64_t def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    try {
        return parseSize(it->second);
    } catch (const std::invalid_argument& e) {
        throw Error("invalid value for " + key + ": " + e.what());
    }
}

bool Config::getBool(const std::string& key, bool def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return parseBool(it->second, def);
}

uint64_t parseSize(const std::string& text) {
    const std::string value = trim(text);
    size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) ++digits;
    if (digits == 0) throw std::invalid_argument("'" + text + "' is not a size");

    uint64_t multiplier = 1;
    const std::string suffix = value.substr(digits);
    if (suffix.empty() || suffix == "B" || suffix == "b") {
        multiplier = 1;
    } else if (suffix == "K" || suffix == "k" || suffix == "KB") {
        multiplier = 1024ull;
    } else if (suffix == "M" || suffix == "m" || suffix == "MB") {
        multiplier = 1024ull * 1024;
    } else if (suffix == "G" || suffix == "g" || suffix == "GB") {
        multiplier = 1024ull * 1024 * 1024;
    } else {
        throw std::invalid_argument("'" + text + "' has an unknown size suffix");
    }

    uint64_t number = 0;
    try {
        number = std::stoull(value.substr(0, digits));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("'" + text + "' is too large");
    }
    return number * multiplier;
}

bool parseBool(const std::string& text, bool def) {
    std::string v = trim(text);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return def;
}

std::string dateStamp(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char out[16];
    std::strftime(out, sizeof(out), "%Y-%m-%d", &tm);
    return out;
}

std::string resolveDataFileName(const std::string& dataDir,
                                const std::string& baseName,
                                const std::string& suffix,
                                std::chrono::system_clock::time_point now) {
    std::string fileName = dateStamp(now) + "-" + baseName;
    if (!suffix.empty()) fileName += "-" + suffix;
    fileName += ".json";
    return (std::filesystem::path(dataDir) / fileName).lexically_normal().string();
}

std::optional<std::string> resolveHistoryDataSource(const std::string& dataDir,
                                                    const std::string& baseName,
                                                    std::chrono::system_clock::time_point now) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dataDir, ec)) return std::nullopt;

    // Escape the base name so it matches literally.
    std::string literal;
    for (char ch : baseName) {
        if (std::string(R"(\^$.|?*+()[]{}/)").find(ch) != std::string::npos) literal.push_back('\\');
        literal.push_back(ch);
    }
    const std::regex bundleName("(\\d{4}-\\d{2}-\\d{2})-" + literal + "\\.json");

    std::vector<std::string> candidates;
    for (const auto& entry : fs::directory_iterator(dataDir, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        std::smatch match;
        if (!std::regex_match(name, match, bundleName)) continue;
        const auto stamped = parseDateStamp(match[1].str());
        if (stamped && now - *stamped > kOneDay) {
            candidates.push_back(name);
        }
    }
    if (ec) {
        throw IoFailure("cannot list " + dataDir + ": " + ec.message());
    }
    if (candidates.empty()) return std::nullopt;

    std::sort(candidates.begin(), candidates.end());
    return (fs::path(dataDir) / candidates.back()).lexically_normal().string();
}

} // namespace jsonhistory
