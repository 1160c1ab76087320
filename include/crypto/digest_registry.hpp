#pragma once

#include "crypto/accumulator.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehash {

// Lexically sorted: CRC-32, MD5, SHA-1, SHA-256, SHA-512.
std::vector<std::string> SupportedAlgorithms();

// Case-insensitive lookup. Returns the canonical (upper-case) name.
std::optional<std::string> CanonicalAlgorithm(std::string_view name);

bool IsSupportedAlgorithm(std::string_view name);

Result NewAccumulator(std::string_view name, std::unique_ptr<IAccumulator>& out);

} // namespace rehash
