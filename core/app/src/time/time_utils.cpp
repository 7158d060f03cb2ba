#include "twsgate/time/time_utils.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace twsgate {

namespace {

constexpr std::size_t kMaxEpochDigits = 10;

// Days since 1970-01-01 for a proleptic Gregorian date. Avoids timegm(),
// which is not portable, and mktime(), which reads the process TZ.
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, unsigned& m, unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (m <= 2 ? 1 : 0);
}

bool allDigits(const std::string& s, std::size_t pos, std::size_t len) {
  if (pos + len > s.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

int toInt(const std::string& s, std::size_t pos, std::size_t len) {
  return std::atoi(s.substr(pos, len).c_str());
}

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

// 1970-01-01 was a Thursday. 0 = Sunday.
int weekday(std::int64_t days) {
  return static_cast<int>(((days % 7) + 11) % 7);
}

std::int64_t nthSunday(int year, unsigned month, int n) {
  const std::int64_t first = daysFromCivil(year, month, 1);
  return first + (7 - weekday(first)) % 7 + (n - 1) * 7;
}

std::int64_t lastSunday(int year, unsigned month) {
  const std::int64_t last = month == 12
                                ? daysFromCivil(year + 1, 1, 1) - 1
                                : daysFromCivil(year, month + 1, 1) - 1;
  return last - weekday(last);
}

enum class DstRule {
  None,
  UnitedStates,  // 2nd Sunday March 02:00 local .. 1st Sunday November
  Europe,        // last Sunday March 01:00 UTC .. last Sunday October
};

struct NamedZone {
  const char* name;
  int standard_offset;  // seconds east of UTC
  DstRule rule;
};

// Zones the gateway reports in execution and bar times.
constexpr NamedZone kNamedZones[] = {
    {"UTC", 0, DstRule::None},
    {"GMT", 0, DstRule::None},
    {"Z", 0, DstRule::None},
    {"Etc/UTC", 0, DstRule::None},
    {"Etc/GMT", 0, DstRule::None},
    {"US/Eastern", -5 * 3600, DstRule::UnitedStates},
    {"America/New_York", -5 * 3600, DstRule::UnitedStates},
    {"EST5EDT", -5 * 3600, DstRule::UnitedStates},
    {"EST", -5 * 3600, DstRule::None},
    {"EDT", -4 * 3600, DstRule::None},
    {"US/Central", -6 * 3600, DstRule::UnitedStates},
    {"America/Chicago", -6 * 3600, DstRule::UnitedStates},
    {"CST", -6 * 3600, DstRule::None},
    {"CDT", -5 * 3600, DstRule::None},
    {"US/Pacific", -8 * 3600, DstRule::UnitedStates},
    {"America/Los_Angeles", -8 * 3600, DstRule::UnitedStates},
    {"PST", -8 * 3600, DstRule::None},
    {"PDT", -7 * 3600, DstRule::None},
    {"Europe/London", 0, DstRule::Europe},
    {"BST", 1 * 3600, DstRule::None},
    {"Europe/Berlin", 1 * 3600, DstRule::Europe},
    {"Europe/Paris", 1 * 3600, DstRule::Europe},
    {"Europe/Zurich", 1 * 3600, DstRule::Europe},
    {"Europe/Amsterdam", 1 * 3600, DstRule::Europe},
    {"MET", 1 * 3600, DstRule::Europe},
    {"CET", 1 * 3600, DstRule::None},
    {"CEST", 2 * 3600, DstRule::None},
    {"Asia/Hong_Kong", 8 * 3600, DstRule::None},
    {"HKT", 8 * 3600, DstRule::None},
    {"Asia/Tokyo", 9 * 3600, DstRule::None},
    {"JST", 9 * 3600, DstRule::None},
};

bool daylightSaving(DstRule rule, int standard_offset,
                    std::int64_t local_seconds) {
  if (rule == DstRule::None) {
    return false;
  }
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civilFromDays(local_seconds >= 0 ? local_seconds / 86400
                                   : (local_seconds - 86399) / 86400,
                year, month, day);

  if (rule == DstRule::UnitedStates) {
    const std::int64_t start = nthSunday(year, 3, 2) * 86400 + 2 * 3600;
    const std::int64_t end = nthSunday(year, 11, 1) * 86400 + 2 * 3600;
    return local_seconds >= start && local_seconds < end;
  }

  const std::int64_t utc = local_seconds - standard_offset;
  const std::int64_t start = lastSunday(year, 3) * 86400 + 3600;
  const std::int64_t end = lastSunday(year, 10) * 86400 + 3600;
  return utc >= start && utc < end;
}

// Seconds east of UTC for a zone suffix at the given wall clock (as if it
// were UTC). Unknown names resolve to 0.
std::int64_t zoneOffsetSeconds(const std::string& zone,
                               std::int64_t local_seconds) {
  if (zone.empty()) {
    return 0;
  }
  if (zone[0] != '+' && zone[0] != '-') {
    for (const auto& named : kNamedZones) {
      if (zone == named.name) {
        return named.standard_offset +
               (daylightSaving(named.rule, named.standard_offset,
                               local_seconds)
                    ? 3600
                    : 0);
      }
    }
    return 0;
  }
  std::string digits;
  for (std::size_t i = 1; i < zone.size(); ++i) {
    if (std::isdigit(static_cast<unsigned char>(zone[i]))) {
      digits.push_back(zone[i]);
    }
  }
  if (digits.size() != 2 && digits.size() != 4) {
    return 0;
  }
  const int hours = toInt(digits, 0, 2);
  const int minutes = digits.size() == 4 ? toInt(digits, 2, 2) : 0;
  const std::int64_t offset = hours * 3600 + minutes * 60;
  return zone[0] == '-' ? -offset : offset;
}

std::optional<std::int64_t> dateToEpochDays(const std::string& s) {
  if (!allDigits(s, 0, 8)) {
    return std::nullopt;
  }
  const int year = toInt(s, 0, 4);
  const int month = toInt(s, 4, 2);
  const int day = toInt(s, 6, 2);
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }
  return daysFromCivil(year, static_cast<unsigned>(month),
                       static_cast<unsigned>(day));
}

}  // namespace

// -----------------------------------------------------------------------------
// parseWireTimestamp()
// -----------------------------------------------------------------------------
std::optional<domain::Timestamp> parseWireTimestamp(const std::string& text) {
  const std::string s = trim(text);
  if (s.empty()) {
    return std::nullopt;
  }

  // Epoch seconds, or a bare date when exactly eight digits.
  if (allDigits(s, 0, s.size())) {
    if (s.size() == 8) {
      auto days = dateToEpochDays(s);
      if (!days) {
        return std::nullopt;
      }
      return domain::Timestamp{std::chrono::seconds{*days * 86400}};
    }
    // Ten digits reach the year 2286; anything longer would overflow the
    // nanosecond time_point.
    if (s.size() > kMaxEpochDigits) {
      return std::nullopt;
    }
    return domain::Timestamp{
        std::chrono::seconds{std::strtoll(s.c_str(), nullptr, 10)}};
  }

  auto days = dateToEpochDays(s);
  if (!days || s.size() < 9) {
    return std::nullopt;
  }

  std::size_t pos = 8;
  if (s[pos] == '-') {
    ++pos;
  } else {
    while (pos < s.size() && s[pos] == ' ') ++pos;
  }

  // HH:MM:SS
  if (pos + 8 > s.size() || !allDigits(s, pos, 2) || s[pos + 2] != ':' ||
      !allDigits(s, pos + 3, 2) || s[pos + 5] != ':' ||
      !allDigits(s, pos + 6, 2)) {
    return std::nullopt;
  }
  const int hh = toInt(s, pos, 2);
  const int mm = toInt(s, pos + 3, 2);
  const int ss = toInt(s, pos + 6, 2);
  if (hh > 23 || mm > 59 || ss > 60) {
    return std::nullopt;
  }

  const std::string zone = trim(s.substr(pos + 8));
  const std::int64_t local = *days * 86400 + hh * 3600 + mm * 60 + ss;
  return domain::Timestamp{
      std::chrono::seconds{local - zoneOffsetSeconds(zone, local)}};
}

// -----------------------------------------------------------------------------
// formatWireDateTime() / formatIso8601()
// -----------------------------------------------------------------------------
namespace {

struct CivilTime {
  int year;
  unsigned month;
  unsigned day;
  int hour;
  int minute;
  int second;
};

CivilTime toCivil(domain::Timestamp tp) {
  const std::int64_t secs =
      std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
          .count();
  std::int64_t days = secs / 86400;
  std::int64_t rem = secs % 86400;
  if (rem < 0) {
    rem += 86400;
    --days;
  }
  CivilTime c{};
  civilFromDays(days, c.year, c.month, c.day);
  c.hour = static_cast<int>(rem / 3600);
  c.minute = static_cast<int>((rem % 3600) / 60);
  c.second = static_cast<int>(rem % 60);
  return c;
}

}  // namespace

std::string formatWireDateTime(domain::Timestamp tp) {
  const CivilTime c = toCivil(tp);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u-%02d:%02d:%02d", c.year,
                c.month, c.day, c.hour, c.minute, c.second);
  return buf;
}

std::string formatIso8601(domain::Timestamp tp) {
  const CivilTime c = toCivil(tp);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ", c.year,
                c.month, c.day, c.hour, c.minute, c.second);
  return buf;
}

}  // namespace twsgate
