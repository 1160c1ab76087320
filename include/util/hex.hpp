#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rehash {

// Lower-case hex.
std::string HexEncode(std::span<const std::uint8_t> bytes);

// Accepts upper and lower case. Fails on odd length or a non-hex digit.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>& out);

std::string NormalizeHex(std::string s);

} // namespace rehash
