#include "jsonhistory/KeyMatcher.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "jsonhistory/Errors.hpp"

using json = nlohmann::json;

namespace jsonhistory {

namespace {

std::string escapeRegex(const std::string& text) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{}/)";
    std::string out;
    out.reserve(text.size() * 2);
    for (char ch : text) {
        if (kSpecial.find(ch) != std::string::npos) out.push_back('\\');
        out.push_back(ch);
    }
    return out;
}

// Keys are JSON string bodies; undo escapes only when there are any.
std::string decodeKey(const std::string& raw) {
    if (raw.find('\\') == std::string::npos) return raw;
    auto decoded = json::parse("\"" + raw + "\"", nullptr, false);
    if (decoded.is_discarded() || !decoded.is_string()) return raw;
    return decoded.get<std::string>();
}

} // namespace

std::string KeyMatcher::defaultPattern(const std::string& keyField) {
    return "\"" + escapeRegex(keyField) + R"re("\s*:\s*"((?:[^"\\]|\\.)*)")re";
}

KeyMatcher::KeyMatcher(std::string keyField, std::string pattern)
    : keyField_(std::move(keyField)), pattern_(std::move(pattern)) {
    if (keyField_.empty()) throw Error("KeyMatcher: key field cannot be empty");
    if (pattern_.empty()) pattern_ = defaultPattern(keyField_);
    needle_ = "\"" + keyField_ + "\"";
    try {
        regex_ = std::regex(pattern_, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw Error("KeyMatcher: invalid key pattern '" + pattern_ + "': " + e.what());
    }
}

KeyMatcher::Result KeyMatcher::extract(std::string_view text, std::string& key) const {
    if (text.find(needle_) == std::string_view::npos) return Result::NoField;

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(text.begin(), text.end(), match, regex_)) return Result::Mismatch;

    key = decodeKey(match[match.size() - 1].str());
    return Result::Matched;
}

} // namespace jsonhistory
