#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "time.hpp"

namespace threadnet::util {

/*
  ULID helpers

  Dataset ids are 128-bit ULIDs: 48-bit unix millisecond timestamp followed by
  80 random bits, rendered as 26 Crockford base32 characters. Ids generated
  later sort after earlier ones.
*/

using ULID = std::array<uint8_t, 16>;

ULID GenerateULID();
ULID GenerateULID(TimePoint at);

std::string ToString(const ULID& id);
ULID        ParseULID(const std::string& str);

// Millisecond timestamp carried in the id.
uint64_t TimestampMillis(const ULID& id);

} // namespace threadnet::util
