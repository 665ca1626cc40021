#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#include "internal/util/ulid.hpp"

namespace {

using namespace threadnet::util;

void TestHexRoundTripIsLowercase() {
  auto bytes = FromHex("DEADbeef");
  assert(bytes.has_value());
  assert(bytes->size() == 4);
  assert(ToHex(*bytes) == "deadbeef");
}

void TestHexRejectsOddLengthAndNonHex() {
  assert(!FromHex("abc").has_value());
  assert(!FromHex("zz").has_value());
  assert(FromHex("").has_value());
}

void TestUtf8Validation() {
  assert(IsValidUtf8("OpenThreadDemo"));
  assert(IsValidUtf8("~\xF0\x9F\x90\xA3\xF0\x9F\x90\xA5\xF0\x9F\x90\xA4~"));
  assert(!IsValidUtf8("\xC0\xAF"));          // overlong
  assert(!IsValidUtf8("\xED\xA0\x80"));      // surrogate
  assert(!IsValidUtf8("\xF0\x9F\x90"));      // truncated
  assert(!IsValidUtf8(std::string("\xFF", 1)));
}

void TestIsoStringKeepsMicrosecondsAndOffset() {
  assert(ToIsoString(FromUnixMicros(1675330873746514)) == "2023-02-02T09:41:13.746514+00:00");
  assert(ToIsoString(FromUnixMicros(1675330873000000)) == "2023-02-02T09:41:13+00:00");
}

void TestUnixMicrosRoundTrip() {
  const auto now = Now();
  assert(ToUnixMicros(FromUnixMicros(ToUnixMicros(now))) == ToUnixMicros(now));
}

void TestUlidEncodesTimestamp() {
  const auto at = FromUnixMicros(1675330873746000);
  const auto id = GenerateULID(at);
  assert(TimestampMillis(id) == 1675330873746ULL);

  const auto text = ToString(id);
  assert(text.size() == 26);
  assert(ParseULID(text) == id);
}

void TestUlidSortsByTime() {
  const auto earlier = ToString(GenerateULID(FromUnixMicros(1000000)));
  const auto later   = ToString(GenerateULID(FromUnixMicros(2000000)));
  assert(earlier < later);
  assert(ToString(GenerateULID()) != ToString(GenerateULID()));
}

void TestParseUlidRejectsGarbage() {
  bool threw = false;
  try {
    (void)ParseULID("not-a-ulid");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestHexRoundTripIsLowercase();
  TestHexRejectsOddLengthAndNonHex();
  TestUtf8Validation();
  TestIsoStringKeepsMicrosecondsAndOffset();
  TestUnixMicrosRoundTrip();
  TestUlidEncodesTimestamp();
  TestUlidSortsByTime();
  TestParseUlidRejectsGarbage();
  std::cout << "threadnet_manager_unit_util: pass\n";
  return 0;
}
