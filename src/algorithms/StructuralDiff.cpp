#include "jsonhistory/algorithms/StructuralDiff.hpp"

#include <string>
#include "jsonhistory/Errors.hpp"

using json = nlohmann::json;

namespace jsonhistory::algo {

json diff(const json& from, const json& to) {
    try {
        return json::diff(from, to);
    } catch (const json::exception& e) {
        throw DiffFailure(std::string("cannot diff values: ") + e.what());
    }
}

json apply(const json& from, const json& patch) {
    if (!patch.is_array()) throw DiffFailure("patch must be an array of operations");
    try {
        return from.patch(patch);
    } catch (const json::exception& e) {
        throw DiffFailure(std::string("cannot apply patch: ") + e.what());
    }
}

} // namespace jsonhistory::algo
