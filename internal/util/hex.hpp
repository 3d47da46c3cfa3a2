#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace courier::util {

std::string ToHex(std::span<const uint8_t> bytes);

// nullopt on odd length or non-hex characters.
std::optional<std::vector<uint8_t>> FromHex(std::string_view hex);

// First 12 hex chars, used in log lines.
std::string ShortHex(std::span<const uint8_t> bytes);

} // namespace courier::util
