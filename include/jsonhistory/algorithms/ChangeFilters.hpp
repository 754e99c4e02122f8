#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace jsonhistory {

// Per-entity policy consulted by the changelog generator.
struct ChangeFilter {
    using Records = std::vector<nlohmann::json>;

    // True when newItem differs from what the existing records describe.
    std::function<bool(const Records& existing, const nlohmann::json& newItem)> changed;

    // Optional canonical ordering of same-key records: negative when a sorts
    // before b, positive when after, zero when equivalent.
    std::function<int(const nlohmann::json& a, const nlohmann::json& b)> compare;
};

namespace filters {

// Changed when the new item is not deep-equal to the latest record.
ChangeFilter deepInequality();

// Changed when `field` differs between the latest record and the new item.
// A field missing on one side counts as null.
ChangeFilter fieldChanged(const std::string& field);

// Orders records by the value of `field` (missing sorts first).
std::function<int(const nlohmann::json&, const nlohmann::json&)> orderByField(const std::string& field);

} // namespace filters

} // namespace jsonhistory
