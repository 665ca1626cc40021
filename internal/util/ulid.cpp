#include "ulid.hpp"

#include <random>
#include <stdexcept>

namespace threadnet::util {

namespace {

constexpr char kCrockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

int DecodeCrockford(char c) {
  if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  switch (c) {
    case 'O':
      return 0;
    case 'I':
    case 'L':
      return 1;
    default:
      break;
  }
  for (int i = 0; i < 32; ++i) {
    if (kCrockford[i] == c) return i;
  }
  return -1;
}

} // namespace

ULID GenerateULID() {
  return GenerateULID(Now());
}

ULID GenerateULID(TimePoint at) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  ULID id{};
  const uint64_t ms = ToUnixMillis(at);
  for (int i = 0; i < 6; ++i)
    id[i] = static_cast<uint8_t>(ms >> (8 * (5 - i)));

  for (size_t i = 6; i < id.size(); ++i)
    id[i] = static_cast<uint8_t>(rng());

  return id;
}

std::string ToString(const ULID& id) {
  // 128 bits into 26 groups of 5 bits; the first group only carries 3.
  std::string out(26, '0');
  unsigned __int128 value = 0;
  for (auto b : id)
    value = (value << 8) | b;

  for (int i = 25; i >= 0; --i) {
    out[i] = kCrockford[static_cast<unsigned>(value & 0x1F)];
    value >>= 5;
  }
  return out;
}

ULID ParseULID(const std::string& str) {
  if (str.size() != 26)
    throw std::runtime_error("Invalid ULID string");

  unsigned __int128 value = 0;
  for (size_t i = 0; i < str.size(); ++i) {
    const int digit = DecodeCrockford(str[i]);
    if (digit < 0 || (i == 0 && digit > 7))
      throw std::runtime_error("Invalid ULID string");
    value = (value << 5) | static_cast<unsigned>(digit);
  }

  ULID id{};
  for (int i = 15; i >= 0; --i) {
    id[i] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
  return id;
}

uint64_t TimestampMillis(const ULID& id) {
  uint64_t ms = 0;
  for (int i = 0; i < 6; ++i)
    ms = (ms << 8) | id[i];
  return ms;
}

} // namespace threadnet::util
