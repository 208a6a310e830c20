#include "time.hpp"

#include <cstdio>

namespace systock::util {

namespace {

using std::chrono::days;
using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::minutes;
using std::chrono::seconds;

struct ParsedInstant {
  Days         day;
  microseconds time_of_day{0};
  minutes      utc_offset{0};
};

bool ReadDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' || text.back() == '\n')) {
    text.remove_suffix(1);
  }
  return text;
}

bool ParseOffset(std::string_view text, minutes& offset) {
  if (text.empty()) {
    return true;
  }
  if (text == "Z" || text == "z") {
    return true;
  }
  const char sign = text.front();
  if (sign != '+' && sign != '-') {
    return false;
  }
  text.remove_prefix(1);

  int h = 0;
  int m = 0;
  if (!ReadDigits(text, 0, 2, h)) {
    return false;
  }
  if (text.size() == 2) {
    m = 0;
  } else if (text.size() == 5 && text[2] == ':') {
    if (!ReadDigits(text, 3, 2, m)) return false;
  } else if (text.size() == 4) {
    if (!ReadDigits(text, 2, 2, m)) return false;
  } else {
    return false;
  }
  if (h > 23 || m > 59) {
    return false;
  }
  offset = hours(h) + minutes(m);
  if (sign == '-') {
    offset = -offset;
  }
  return true;
}

std::optional<ParsedInstant> ParseInstant(std::string_view text) {
  text = Trim(text);
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int y = 0;
  int mo = 0;
  int d = 0;
  if (!ReadDigits(text, 0, 4, y) || !ReadDigits(text, 5, 2, mo) || !ReadDigits(text, 8, 2, d)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  ParsedInstant parsed;
  parsed.day = Days{ymd};
  if (text.size() == 10) {
    return parsed;
  }

  if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') {
    return std::nullopt;
  }

  std::size_t pos = 11;
  int         h   = 0;
  int         mi  = 0;
  int         s   = 0;
  if (!ReadDigits(text, pos, 2, h) || pos + 2 >= text.size() || text[pos + 2] != ':' || !ReadDigits(text, pos + 3, 2, mi)) {
    return std::nullopt;
  }
  pos += 5;

  if (pos < text.size() && text[pos] == ':') {
    if (!ReadDigits(text, pos + 1, 2, s)) {
      return std::nullopt;
    }
    pos += 3;
  }

  int64_t fraction_us = 0;
  if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        fraction_us = fraction_us * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 6; ++i) {
      fraction_us *= 10;
    }
  }

  if (h > 23 || mi > 59 || s > 60) {
    return std::nullopt;
  }
  if (s == 60) {
    s = 59;
  }

  if (!ParseOffset(text.substr(pos), parsed.utc_offset)) {
    return std::nullopt;
  }

  parsed.time_of_day = hours(h) + minutes(mi) + seconds(s) + microseconds(fraction_us);
  return parsed;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(microseconds(micros));
}

std::optional<Days> ParseDate(std::string_view text) {
  auto parsed = ParseInstant(text);
  if (!parsed) {
    return std::nullopt;
  }
  return parsed->day;
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  auto parsed = ParseInstant(text);
  if (!parsed) {
    return std::nullopt;
  }
  const auto local = std::chrono::time_point_cast<microseconds>(parsed->day) + parsed->time_of_day;
  return std::chrono::time_point_cast<Clock::duration>(local - parsed->utc_offset);
}

std::string FormatTimestamp(TimePoint tp) {
  const auto micros = std::chrono::floor<microseconds>(tp);
  const auto day    = std::chrono::floor<days>(micros);
  const std::chrono::year_month_day ymd{day};
  const std::chrono::hh_mm_ss       hms{micros - day};

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02ld:%02ld:%02ld.%06ld", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), static_cast<long>(hms.hours().count()),
                static_cast<long>(hms.minutes().count()), static_cast<long>(hms.seconds().count()),
                static_cast<long>(hms.subseconds().count()));
  return buffer;
}

std::string FormatDate(Days day) {
  const std::chrono::year_month_day ymd{day};
  char                              buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buffer;
}

int64_t DayKey(Days day) {
  const std::chrono::year_month_day ymd{day};
  return static_cast<int64_t>(static_cast<int>(ymd.year())) * 10000 + static_cast<unsigned>(ymd.month()) * 100 +
         static_cast<unsigned>(ymd.day());
}

unsigned IsoWeekday(Days day) {
  return std::chrono::weekday{day}.iso_encoding();
}

unsigned IsoWeek(Days day) {
  // The ISO week belongs to the year that contains its Thursday.
  const Days                        thursday = day + days(4 - static_cast<int>(IsoWeekday(day)));
  const std::chrono::year_month_day ymd{thursday};
  const Days                        jan1{ymd.year() / std::chrono::January / 1};
  return static_cast<unsigned>((thursday - jan1).count() / 7 + 1);
}

unsigned Quarter(Days day) {
  const std::chrono::year_month_day ymd{day};
  return (static_cast<unsigned>(ymd.month()) - 1) / 3 + 1;
}

} // namespace systock::util
