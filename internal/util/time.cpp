#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace aegis::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string MinuteBucket(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y%m%d%H%M");
  return out.str();
}

std::string ToIso8601(TimePoint tp) {
  const auto        secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto        ms   = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  const std::time_t t    = Clock::to_time_t(secs);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return out.str();
}

} // namespace aegis::util
