#include "utils/iso8601.hpp"

#include <cstdio>
#include <regex>
#include <stdexcept>

namespace lingo {
namespace {

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

// Inverse of days_from_civil (H. Hinnant's algorithm).
CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return {m <= 2 ? y + 1 : y, m, d};
}

bool leap_year(std::int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(std::int64_t year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];
}

[[noreturn]] void reject(const std::string& text, const char* why) {
  throw std::invalid_argument("Invalid ISO-8601 timestamp '" + text + "': " + why);
}

} // namespace

std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::string format_iso8601(Timestamp timestamp) {
  using namespace std::chrono;
  const auto ms = floor<milliseconds>(timestamp.time_since_epoch()).count();
  std::int64_t days = ms / 86400000;
  std::int64_t rem = ms % 86400000;
  if (rem < 0) {
    rem += 86400000;
    days -= 1;
  }
  const CivilDate date = civil_from_days(days);
  const int hour = static_cast<int>(rem / 3600000);
  const int minute = static_cast<int>(rem / 60000 % 60);
  const int second = static_cast<int>(rem / 1000 % 60);
  const int millis = static_cast<int>(rem % 1000);

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<long long>(date.year), date.month, date.day, hour, minute, second, millis);
  return buffer;
}

Timestamp parse_iso8601(const std::string& text) {
  static const std::regex pattern(
      R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(\.(\d+))?(Z|([+-])(\d{2}):(\d{2}))$)");
  std::smatch match;
  if (!std::regex_match(text, match, pattern)) {
    reject(text, "expected YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM)");
  }

  const std::int64_t year = std::stoll(match[1].str());
  const auto month = static_cast<unsigned>(std::stoul(match[2].str()));
  const auto day = static_cast<unsigned>(std::stoul(match[3].str()));
  const int hour = std::stoi(match[4].str());
  const int minute = std::stoi(match[5].str());
  const int second = std::stoi(match[6].str());

  if (month < 1 || month > 12) {
    reject(text, "month out of range");
  }
  if (day < 1 || day > days_in_month(year, month)) {
    reject(text, "day out of range");
  }
  if (hour > 23 || minute > 59 || second > 59) {
    reject(text, "time of day out of range");
  }

  std::int64_t nanos = 0;
  if (match[8].matched) {
    std::string digits = match[8].str().substr(0, 9);
    digits.append(9 - digits.size(), '0');
    nanos = std::stoll(digits);
  }

  std::int64_t offset_minutes = 0;
  if (match[10].matched) {
    const int offset_hours = std::stoi(match[11].str());
    const int offset_mins = std::stoi(match[12].str());
    if (offset_hours > 23 || offset_mins > 59) {
      reject(text, "offset out of range");
    }
    offset_minutes = offset_hours * 60 + offset_mins;
    if (match[10].str() == "-") {
      offset_minutes = -offset_minutes;
    }
  }

  using namespace std::chrono;
  const std::int64_t seconds_since_epoch =
      days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
  // One second of headroom keeps the fractional part representable too.
  const auto max_seconds = duration_cast<seconds>(Timestamp::duration::max()).count() - 1;
  const auto min_seconds = duration_cast<seconds>(Timestamp::duration::min()).count() + 1;
  if (seconds_since_epoch > max_seconds || seconds_since_epoch < min_seconds) {
    reject(text, "out of range");
  }
  const auto since_epoch = duration_cast<Timestamp::duration>(seconds(seconds_since_epoch)) +
                           duration_cast<Timestamp::duration>(nanoseconds(nanos));
  return Timestamp(since_epoch);
}

} // namespace lingo
