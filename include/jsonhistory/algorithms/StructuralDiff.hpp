#pragma once

#include <nlohmann/json.hpp>

namespace jsonhistory::algo {

// RFC 6902 patch that turns `from` into `to`. Throws DiffFailure.
nlohmann::json diff(const nlohmann::json& from, const nlohmann::json& to);

// Apply a patch produced by diff(). Throws DiffFailure.
nlohmann::json apply(const nlohmann::json& from, const nlohmann::json& patch);

} // namespace jsonhistory::algo
