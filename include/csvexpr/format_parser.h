#ifndef CSVEXPR_FORMAT_PARSER_H
#define CSVEXPR_FORMAT_PARSER_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace csvexpr {

// Month/day names and AM/PM markers used by %b %B %a %A %p
struct FormatLocale {
  std::array<std::string, 12> month_names;  // Full: January..December
  std::array<std::string, 12> month_abbrev; // Abbreviated: Jan..Dec
  std::array<std::string, 7> day_names;     // Full: Sunday..Saturday
  std::array<std::string, 7> day_abbrev;    // Abbreviated: Sun..Sat
  std::string am = "AM";
  std::string pm = "PM";

  static const FormatLocale& english();
};

// Broken-down result of format-string parsing
struct ParsedDateTime {
  int year = 1970;
  int month = 1;             // 1-12
  int day = 1;               // 1-31
  int hour = 0;              // 0-23
  int minute = 0;            // 0-59
  int second = 0;            // 0-59
  int microsecond = 0;       // 0-999999
  int tz_offset_minutes = 0; // Minutes east of UTC
  bool has_tz_offset = false;

  // Days since 1970-01-01
  int32_t to_epoch_days() const;

  // Microseconds since the epoch, shifted by tz_offset_minutes
  int64_t to_epoch_micros() const;

  // Inverse conversions, UTC based
  static ParsedDateTime from_epoch_days(int32_t days);
  static ParsedDateTime from_epoch_micros(int64_t micros);

  // 0 = Sunday .. 6 = Saturday
  int day_of_week() const;
};

// strptime-style parser.
// Thread-safe after construction; parse() is const.
class FormatParser {
public:
  // Specifiers: %Y %y %m %d %e %b %B %a %A %H %I %M %S %OS %f %p %z %Z %% %F %T
  // %f reads one to nine fraction digits; digits past microseconds are dropped.
  FormatParser(std::string_view format, const FormatLocale& locale = FormatLocale::english());

  // Parse a value according to the format string. Returns true on success,
  // populating dt. The whole value must be consumed.
  bool parse(std::string_view value, ParsedDateTime& dt) const;

  const std::string& format() const { return format_; }

private:
  std::string format_;
  FormatLocale locale_;
};

} // namespace csvexpr

#endif // CSVEXPR_FORMAT_PARSER_H
