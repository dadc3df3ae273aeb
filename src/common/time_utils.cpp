#include "common/time_utils.h"

#include "common/errors.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rfpos {
namespace {

// Floor division for negative timestamps (pre-1970).
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

} // namespace

Timestamp ParseTimestamp(const std::string& text) {
  std::string s = text;
  // trim simple whitespace
  const auto l = s.find_first_not_of(" \t\r\n");
  const auto r = s.find_last_not_of(" \t\r\n");
  if (l == std::string::npos) {
    throw DataError("Empty timestamp text");
  }
  s = s.substr(l, r - l + 1);
  if (s.size() > 10 && s[10] == 'T') s[10] = ' ';

  std::tm tm{};
  std::istringstream iss(s);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) {
    throw DataError("Malformed timestamp: '" + text + "'");
  }

  std::int64_t micros = 0;
  if (iss.peek() == '.') {
    iss.get();
    int digits = 0;
    while (std::isdigit(iss.peek())) {
      const int d = iss.get() - '0';
      if (digits < 6) {
        micros = micros * 10 + d;
        ++digits;
      }
    }
    if (digits == 0) {
      throw DataError("Malformed timestamp fraction: '" + text + "'");
    }
    for (; digits < 6; ++digits) micros *= 10;
  }
  if (iss.peek() != std::char_traits<char>::eof()) {
    throw DataError("Trailing characters in timestamp: '" + text + "'");
  }

  const std::time_t secs = timegm(&tm);
  return static_cast<Timestamp>(secs) * kMicrosPerSecond + micros;
}

std::string FormatTimestamp(Timestamp ts) {
  const std::int64_t secs = floor_div(ts, kMicrosPerSecond);
  const std::int64_t micros = ts - secs * kMicrosPerSecond;

  const std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (micros != 0) {
    oss << '.' << std::setw(6) << std::setfill('0') << micros;
  }
  return oss.str();
}

} // namespace rfpos
