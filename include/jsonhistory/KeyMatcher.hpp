#pragma once

#include <regex>
#include <string>
#include <string_view>

namespace jsonhistory {

// Pulls the key field's literal value out of an object's raw text with one
// pattern match, without parsing the object.
class KeyMatcher {
public:
    enum class Result {
        Matched,  // key extracted
        NoField,  // the text never mentions the key field
        Mismatch  // the key field is present but the pattern does not match
    };

    // An empty pattern selects defaultPattern(keyField). The value of the last
    // capture group (or the whole match when there is none) becomes the key.
    explicit KeyMatcher(std::string keyField, std::string pattern = "");

    Result extract(std::string_view text, std::string& key) const;

    const std::string& keyField() const { return keyField_; }
    const std::string& pattern() const { return pattern_; }

    // "<field>" : "<json string body>"
    static std::string defaultPattern(const std::string& keyField);

private:
    std::string keyField_;
    std::string pattern_;
    std::string needle_;
    std::regex regex_;
};

} // namespace jsonhistory
