#pragma once

#include "crypto/accumulator_set.hpp"
#include "util/result.hpp"

#include <expected>
#include <string>

namespace rehash {

// {"computed": <bytes>, "states": {"<ALG>": "<hex state>", ...}}
std::expected<SavedSession, std::string> ParseSession(const std::string& json_input);
std::string SerializeSession(const SavedSession& session);

// Writes <path>.tmp and renames it over <path>.
Result SaveSession(const std::string& path, const SavedSession& session);
Result LoadSession(const std::string& path, SavedSession& out);

} // namespace rehash
