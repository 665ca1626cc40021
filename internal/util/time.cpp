#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace threadnet::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

std::string ToIsoString(TimePoint tp) {
  const auto micros = ToUnixMicros(tp);
  auto       secs   = micros / 1'000'000;
  auto       frac   = micros % 1'000'000;
  if (frac < 0) {
    frac += 1'000'000;
    secs -= 1;
  }

  const std::time_t t = static_cast<std::time_t>(secs);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (frac != 0) {
    out << '.' << std::setw(6) << std::setfill('0') << frac;
  }
  out << "+00:00";
  return out.str();
}

} // namespace threadnet::util
