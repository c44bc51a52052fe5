#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace resolver::util {

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMs() {
  return ToUnixMillis(Clock::now());
}

std::string FormatUnixMillis(uint64_t ms) {
  if (ms == 0) return "-";

  const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms % 1000 << 'Z';
  return oss.str();
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace resolver::util
