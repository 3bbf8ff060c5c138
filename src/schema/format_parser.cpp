#include "csvexpr/format_parser.h"

#include <cctype>

namespace csvexpr {

const FormatLocale& FormatLocale::english() {
  static const FormatLocale loc = [] {
    FormatLocale l;
    l.month_names = {"January", "February", "March",     "April",   "May",      "June",
                     "July",    "August",   "September", "October", "November", "December"};
    l.month_abbrev = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    l.day_names = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};
    l.day_abbrev = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    l.am = "AM";
    l.pm = "PM";
    return l;
  }();
  return loc;
}

static inline bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

static const int days_in_month_table[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

static inline int get_days_in_month(int year, int month) {
  if (month == 2 && is_leap_year(year))
    return 29;
  return days_in_month_table[month];
}

static constexpr int64_t MICROS_PER_SECOND = 1000000LL;
static constexpr int64_t MICROS_PER_DAY = 86400LL * MICROS_PER_SECOND;

// Proleptic Gregorian day count (H. Hinnant's days_from_civil)
static int32_t days_from_civil(int y, int m, int d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const int yoe = y - era * 400;
  const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<int32_t>(era * 146097 + doe - 719468);
}

int32_t ParsedDateTime::to_epoch_days() const { return days_from_civil(year, month, day); }

int64_t ParsedDateTime::to_epoch_micros() const {
  int64_t micros = static_cast<int64_t>(to_epoch_days()) * MICROS_PER_DAY +
                   static_cast<int64_t>(hour) * 3600LL * MICROS_PER_SECOND +
                   static_cast<int64_t>(minute) * 60LL * MICROS_PER_SECOND +
                   static_cast<int64_t>(second) * MICROS_PER_SECOND + microsecond;
  micros -= static_cast<int64_t>(tz_offset_minutes) * 60LL * MICROS_PER_SECOND;
  return micros;
}

ParsedDateTime ParsedDateTime::from_epoch_days(int32_t days) {
  int64_t z = static_cast<int64_t>(days) + 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;

  ParsedDateTime dt;
  dt.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  dt.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  dt.year = static_cast<int>(yoe + era * 400 + (dt.month <= 2 ? 1 : 0));
  return dt;
}

ParsedDateTime ParsedDateTime::from_epoch_micros(int64_t micros) {
  int64_t days = micros / MICROS_PER_DAY;
  int64_t rem = micros % MICROS_PER_DAY;
  if (rem < 0) {
    rem += MICROS_PER_DAY;
    --days;
  }
  ParsedDateTime dt = from_epoch_days(static_cast<int32_t>(days));
  dt.hour = static_cast<int>(rem / (3600LL * MICROS_PER_SECOND));
  rem %= 3600LL * MICROS_PER_SECOND;
  dt.minute = static_cast<int>(rem / (60LL * MICROS_PER_SECOND));
  rem %= 60LL * MICROS_PER_SECOND;
  dt.second = static_cast<int>(rem / MICROS_PER_SECOND);
  dt.microsecond = static_cast<int>(rem % MICROS_PER_SECOND);
  return dt;
}

int ParsedDateTime::day_of_week() const {
  // 1970-01-01 was a Thursday
  int64_t days = to_epoch_days();
  int64_t w = (days + 4) % 7;
  return static_cast<int>(w < 0 ? w + 7 : w);
}

// Case-insensitive string prefix match. Returns length matched or 0.
static size_t match_string_ci(const char* pos, const char* end, const std::string& target) {
  size_t len = target.size();
  if (static_cast<size_t>(end - pos) < len)
    return 0;
  for (size_t i = 0; i < len; ++i) {
    if (std::tolower(static_cast<unsigned char>(pos[i])) !=
        std::tolower(static_cast<unsigned char>(target[i])))
      return 0;
  }
  return len;
}

// Parse up to max_digits digits into result. Returns number of digits parsed.
static int parse_digits(const char*& pos, const char* end, int max_digits, int& result) {
  result = 0;
  int count = 0;
  while (count < max_digits && pos < end && *pos >= '0' && *pos <= '9') {
    result = result * 10 + (*pos - '0');
    pos++;
    count++;
  }
  return count;
}

// Four digits, or a sign followed by four to six digits for years outside
// 0000-9999 ("+10183", "-0044").
static bool parse_year(const char*& pos, const char* end, int& year) {
  if (pos < end && (*pos == '+' || *pos == '-')) {
    bool negative = *pos == '-';
    const char* start = pos++;
    if (parse_digits(pos, end, 6, year) < 4) {
      pos = start;
      return false;
    }
    if (negative)
      year = -year;
    return true;
  }
  return parse_digits(pos, end, 4, year) == 4;
}

// One to nine digits; scaled to microseconds.
static bool parse_fraction(const char*& pos, const char* end, int& micros) {
  micros = 0;
  int digits = 0;
  int scale = 100000;
  while (pos < end && *pos >= '0' && *pos <= '9' && digits < 9) {
    if (digits < 6) {
      micros += (*pos - '0') * scale;
      scale /= 10;
    }
    pos++;
    digits++;
  }
  return digits > 0;
}

static bool match_name(const char*& pos, const char* end, const std::string* names, int count,
                       int& index) {
  for (int i = 0; i < count; ++i) {
    size_t len = match_string_ci(pos, end, names[i]);
    if (len > 0) {
      index = i;
      pos += len;
      return true;
    }
  }
  return false;
}

FormatParser::FormatParser(std::string_view format, const FormatLocale& locale)
    : format_(format), locale_(locale) {}

bool FormatParser::parse(std::string_view value, ParsedDateTime& dt) const {
  dt = ParsedDateTime{};
  const char* pos = value.data();
  const char* end = value.data() + value.size();
  const char* fmt = format_.data();
  const char* fmt_end = format_.data() + format_.size();
  int am_pm = -1; // -1 = not set, 0 = AM, 1 = PM

  while (fmt < fmt_end) {
    if (*fmt != '%') {
      if (pos >= end || *pos != *fmt)
        return false;
      pos++;
      fmt++;
      continue;
    }

    fmt++; // skip '%'
    if (fmt >= fmt_end)
      return false;

    char spec = *fmt++;
    int val;
    int index;

    switch (spec) {
    case 'Y':
      if (!parse_year(pos, end, val))
        return false;
      dt.year = val;
      break;
    case 'y':
      // Two-digit years pivot into 2000-2099
      if (parse_digits(pos, end, 2, val) != 2)
        return false;
      dt.year = 2000 + val;
      break;
    case 'm':
      if (parse_digits(pos, end, 2, val) == 0)
        return false;
      dt.month = val;
      break;
    case 'd':
      if (parse_digits(pos, end, 2, val) == 0)
        return false;
      dt.day = val;
      break;
    case 'e':
      if (pos < end && *pos == ' ')
        pos++;
      if (parse_digits(pos, end, 2, val) == 0)
        return false;
      dt.day = val;
      break;
    case 'H':
      if (parse_digits(pos, end, 2, val) == 0 || val > 23)
        return false;
      dt.hour = val;
      break;
    case 'I':
      if (parse_digits(pos, end, 2, val) == 0 || val < 1 || val > 12)
        return false;
      dt.hour = val % 12;
      break;
    case 'M':
      if (parse_digits(pos, end, 2, val) == 0 || val > 59)
        return false;
      dt.minute = val;
      break;
    case 'S':
      if (parse_digits(pos, end, 2, val) == 0 || val > 59)
        return false;
      dt.second = val;
      break;
    case 'O':
      if (fmt >= fmt_end || *fmt != 'S')
        return false;
      fmt++;
      if (parse_digits(pos, end, 2, val) == 0 || val > 59)
        return false;
      dt.second = val;
      if (pos < end && *pos == '.') {
        pos++;
        if (!parse_fraction(pos, end, dt.microsecond))
          return false;
      }
      break;
    case 'f':
      if (!parse_fraction(pos, end, dt.microsecond))
        return false;
      break;
    case 'p': {
      size_t am_len = match_string_ci(pos, end, locale_.am);
      if (am_len > 0) {
        am_pm = 0;
        pos += am_len;
        break;
      }
      size_t pm_len = match_string_ci(pos, end, locale_.pm);
      if (pm_len > 0) {
        am_pm = 1;
        pos += pm_len;
        break;
      }
      return false;
    }
    case 'b':
      if (!match_name(pos, end, locale_.month_abbrev.data(), 12, index))
        return false;
      dt.month = index + 1;
      break;
    case 'B':
      if (!match_name(pos, end, locale_.month_names.data(), 12, index))
        return false;
      dt.month = index + 1;
      break;
    case 'a':
      if (!match_name(pos, end, locale_.day_abbrev.data(), 7, index))
        return false;
      break;
    case 'A':
      if (!match_name(pos, end, locale_.day_names.data(), 7, index))
        return false;
      break;
    case 'z': {
      if (pos < end && *pos == 'Z') {
        dt.tz_offset_minutes = 0;
        dt.has_tz_offset = true;
        pos++;
        break;
      }
      if (pos >= end || (*pos != '+' && *pos != '-'))
        return false;
      bool neg = (*pos == '-');
      pos++;
      int tz_hour;
      if (parse_digits(pos, end, 2, tz_hour) != 2 || tz_hour > 18)
        return false;
      if (pos < end && *pos == ':')
        pos++;
      int tz_min = 0;
      if (pos < end && *pos >= '0' && *pos <= '9') {
        if (parse_digits(pos, end, 2, tz_min) != 2 || tz_min > 59)
          return false;
      }
      dt.tz_offset_minutes = tz_hour * 60 + tz_min;
      if (neg)
        dt.tz_offset_minutes = -dt.tz_offset_minutes;
      dt.has_tz_offset = true;
      break;
    }
    case 'Z': {
      // Zone name: only UTC spellings carry an offset we can apply
      const char* start = pos;
      while (pos < end && (std::isalpha(static_cast<unsigned char>(*pos)) || *pos == '/'))
        pos++;
      std::string name(start, pos);
      for (auto& c : name)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      if (name != "UTC" && name != "GMT" && name != "Z" && name != "UT")
        return false;
      dt.tz_offset_minutes = 0;
      dt.has_tz_offset = true;
      break;
    }
    case '%':
      if (pos >= end || *pos != '%')
        return false;
      pos++;
      break;
    case 'F':
      if (!parse_year(pos, end, val))
        return false;
      dt.year = val;
      if (pos >= end || *pos != '-')
        return false;
      pos++;
      if (parse_digits(pos, end, 2, val) == 0)
        return false;
      dt.month = val;
      if (pos >= end || *pos != '-')
        return false;
      pos++;
      if (parse_digits(pos, end, 2, val) == 0)
        return false;
      dt.day = val;
      break;
    case 'T': {
      int h, m, s;
      if (parse_digits(pos, end, 2, h) == 0 || h > 23)
        return false;
      if (pos >= end || *pos != ':')
        return false;
      pos++;
      if (parse_digits(pos, end, 2, m) == 0 || m > 59)
        return false;
      if (pos >= end || *pos != ':')
        return false;
      pos++;
      if (parse_digits(pos, end, 2, s) == 0 || s > 59)
        return false;
      dt.hour = h;
      dt.minute = m;
      dt.second = s;
      break;
    }
    default:
      return false;
    }
  }

  if (am_pm == 1) {
    if (dt.hour != 12)
      dt.hour += 12;
  } else if (am_pm == 0) {
    if (dt.hour == 12)
      dt.hour = 0;
  }

  // Must consume all input
  if (pos != end)
    return false;

  if (dt.month < 1 || dt.month > 12)
    return false;
  if (dt.day < 1 || dt.day > get_days_in_month(dt.year, dt.month))
    return false;

  return true;
}

} // namespace csvexpr
