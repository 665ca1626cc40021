#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace threadnet::util {

// Lowercase hex of raw bytes.
std::string ToHex(std::string_view bytes);

// Raw bytes from hex (either case); nullopt on odd length or non-hex input.
std::optional<std::string> FromHex(std::string_view hex);

bool IsValidUtf8(std::string_view text);

} // namespace threadnet::util
