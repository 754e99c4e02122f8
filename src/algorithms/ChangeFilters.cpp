#include "jsonhistory/algorithms/ChangeFilters.hpp"

using json = nlohmann::json;

namespace jsonhistory::filters {

namespace {

json fieldOf(const json& item, const std::string& field) {
    if (!item.is_object()) return nullptr;
    auto it = item.find(field);
    return it == item.end() ? json(nullptr) : *it;
}

} // namespace

ChangeFilter deepInequality() {
    ChangeFilter filter;
    filter.changed = [](const ChangeFilter::Records& existing, const json& newItem) {
        return existing.empty() || existing.back() != newItem;
    };
    return filter;
}

ChangeFilter fieldChanged(const std::string& field) {
    ChangeFilter filter;
    filter.changed = [field](const ChangeFilter::Records& existing, const json& newItem) {
        if (existing.empty()) return true;
        return fieldOf(existing.back(), field) != fieldOf(newItem, field);
    };
    return filter;
}

std::function<int(const json&, const json&)> orderByField(const std::string& field) {
    return [field](const json& a, const json& b) {
        const json left = fieldOf(a, field);
        const json right = fieldOf(b, field);
        if (left < right) return -1;
        if (right < left) return 1;
        return 0;
    };
}

} // namespace jsonhistory::filters
