#include "time.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace deploy::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&t, &utc);
  return utc;
}

int64_t MicrosOfSecond(TimePoint tp) {
  const auto sec = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto       us  = std::chrono::duration_cast<std::chrono::microseconds>(tp - sec).count();
  // pre-epoch times truncate toward zero
  return us < 0 ? us + 1'000'000 : us;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  const auto utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << MicrosOfSecond(tp) << 'Z';
  return out.str();
}

std::string ToCompactStamp(TimePoint tp) {
  const auto utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y%m%d_%H%M%S");
  return out.str();
}

std::string ToMicrosStamp(TimePoint tp) {
  const auto utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y%m%d%H%M%S") << std::setw(6) << std::setfill('0') << MicrosOfSecond(tp);
  return out.str();
}

} // namespace deploy::util
