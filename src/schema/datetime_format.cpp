#include "csvexpr/datetime_format.h"

#include "csvexpr/error.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace csvexpr {

namespace {

constexpr size_t MAX_OPTIONAL_SECTIONS = 8;

[[noreturn]] void invalid_pattern(const std::string& pattern, const std::string& why) {
  throw ConfigurationError(ErrorCode::INVALID_DATETIME_PATTERN,
                           "Invalid datetime pattern '" + pattern + "': " + why);
}

std::string pad(int64_t value, int width) {
  bool negative = value < 0;
  std::string digits = std::to_string(negative ? -value : value);
  if (static_cast<int>(digits.size()) < width)
    digits.insert(0, width - digits.size(), '0');
  return negative ? "-" + digits : digits;
}

std::string format_offset(int offset_minutes, bool zero_as_z, bool colon, bool minutes_optional) {
  if (offset_minutes == 0 && zero_as_z)
    return "Z";
  char sign = offset_minutes < 0 ? '-' : '+';
  int abs_minutes = std::abs(offset_minutes);
  std::string out(1, sign);
  out += pad(abs_minutes / 60, 2);
  if (minutes_optional && abs_minutes % 60 == 0)
    return out;
  if (colon)
    out += ':';
  out += pad(abs_minutes % 60, 2);
  return out;
}

} // namespace

DateTimeFormat::DateTimeFormat(std::string_view pattern) : pattern_(pattern) {
  compile();
  expand_formats();
  parsers_.reserve(parse_formats_.size());
  for (const auto& f : parse_formats_)
    parsers_.emplace_back(f);
}

void DateTimeFormat::compile() {
  const std::string& p = pattern_;
  int depth = 0;
  size_t optional_sections = 0;
  size_t i = 0;

  auto add_literal = [this](const std::string& text) {
    if (!tokens_.empty() && tokens_.back().field == Field::LITERAL)
      tokens_.back().literal += text;
    else
      tokens_.push_back({Field::LITERAL, 0, text});
  };

  while (i < p.size()) {
    char c = p[i];

    if (c == '\'') {
      size_t close = i + 1;
      std::string text;
      if (close < p.size() && p[close] == '\'') {
        add_literal("'");
        i += 2;
        continue;
      }
      while (true) {
        if (close >= p.size())
          invalid_pattern(p, "unterminated quote");
        if (p[close] == '\'') {
          if (close + 1 < p.size() && p[close + 1] == '\'') {
            text += '\'';
            close += 2;
            continue;
          }
          break;
        }
        text += p[close++];
      }
      add_literal(text);
      i = close + 1;
      continue;
    }

    if (c == '[') {
      if (++optional_sections > MAX_OPTIONAL_SECTIONS)
        invalid_pattern(p, "too many optional sections");
      tokens_.push_back({Field::OPTIONAL_START, 0, ""});
      ++depth;
      ++i;
      continue;
    }
    if (c == ']') {
      if (depth == 0)
        invalid_pattern(p, "unbalanced ']'");
      tokens_.push_back({Field::OPTIONAL_END, 0, ""});
      --depth;
      ++i;
      continue;
    }

    if (!std::isalpha(static_cast<unsigned char>(c))) {
      add_literal(std::string(1, c));
      ++i;
      continue;
    }

    int count = 0;
    while (i < p.size() && p[i] == c) {
      ++count;
      ++i;
    }

    auto check = [&](int max) {
      if (count > max)
        invalid_pattern(p, "too many pattern letters '" + std::string(count, c) + "'");
    };

    switch (c) {
    case 'y':
    case 'u':
      tokens_.push_back({Field::YEAR, count, ""});
      break;
    case 'M':
    case 'L':
      check(4);
      if (count <= 2)
        tokens_.push_back({Field::MONTH, count, ""});
      else if (count == 3)
        tokens_.push_back({Field::MONTH_ABBREV, count, ""});
      else
        tokens_.push_back({Field::MONTH_NAME, count, ""});
      break;
    case 'd':
      check(2);
      tokens_.push_back({Field::DAY, count, ""});
      break;
    case 'H':
      check(2);
      tokens_.push_back({Field::HOUR_OF_DAY, count, ""});
      break;
    case 'h':
      check(2);
      tokens_.push_back({Field::HOUR_OF_AMPM, count, ""});
      break;
    case 'm':
      check(2);
      tokens_.push_back({Field::MINUTE, count, ""});
      break;
    case 's':
      check(2);
      tokens_.push_back({Field::SECOND, count, ""});
      break;
    case 'S':
      check(9);
      tokens_.push_back({Field::FRACTION, count, ""});
      break;
    case 'a':
      check(1);
      tokens_.push_back({Field::AM_PM, count, ""});
      break;
    case 'E':
      check(4);
      tokens_.push_back({count == 4 ? Field::DAY_NAME : Field::DAY_ABBREV, count, ""});
      break;
    case 'X':
      check(3);
      tokens_.push_back({Field::OFFSET_X, count, ""});
      break;
    case 'Z':
      check(3);
      tokens_.push_back({Field::OFFSET_Z, count, ""});
      break;
    case 'x':
      check(3);
      tokens_.push_back({Field::OFFSET_x, count, ""});
      break;
    case 'V':
      if (count != 2)
        invalid_pattern(p, "pattern letter count must be 2: V");
      tokens_.push_back({Field::ZONE_ID, count, ""});
      break;
    case 'z':
      check(3);
      tokens_.push_back({Field::ZONE_ID, count, ""});
      break;
    default:
      invalid_pattern(p, std::string("unknown pattern letter: ") + c);
    }
  }

  if (depth != 0)
    invalid_pattern(p, "unbalanced '['");
}

void DateTimeFormat::expand_formats() {
  // Each entry is one candidate strptime format built so far.
  std::vector<std::vector<std::string>> stack;
  stack.push_back({""});

  auto append_all = [&stack](const std::string& piece) {
    for (auto& f : stack.back())
      f += piece;
  };

  for (const auto& tok : tokens_) {
    switch (tok.field) {
    case Field::OPTIONAL_START:
      stack.push_back({""});
      break;
    case Field::OPTIONAL_END: {
      std::vector<std::string> section = std::move(stack.back());
      stack.pop_back();
      std::vector<std::string> combined;
      for (const auto& prefix : stack.back()) {
        combined.push_back(prefix);
        for (const auto& s : section)
          combined.push_back(prefix + s);
      }
      stack.back() = std::move(combined);
      break;
    }
    case Field::LITERAL: {
      std::string escaped;
      for (char c : tok.literal) {
        if (c == '%')
          escaped += "%%";
        else
          escaped += c;
      }
      append_all(escaped);
      break;
    }
    case Field::YEAR:
      append_all(tok.count == 2 ? "%y" : "%Y");
      break;
    case Field::MONTH:
      append_all("%m");
      break;
    case Field::MONTH_ABBREV:
      append_all("%b");
      break;
    case Field::MONTH_NAME:
      append_all("%B");
      break;
    case Field::DAY:
      append_all("%d");
      break;
    case Field::HOUR_OF_DAY:
      append_all("%H");
      break;
    case Field::HOUR_OF_AMPM:
      append_all("%I");
      break;
    case Field::MINUTE:
      append_all("%M");
      break;
    case Field::SECOND:
      append_all("%S");
      break;
    case Field::FRACTION:
      append_all("%f");
      break;
    case Field::AM_PM:
      append_all("%p");
      break;
    case Field::DAY_ABBREV:
      append_all("%a");
      break;
    case Field::DAY_NAME:
      append_all("%A");
      break;
    case Field::OFFSET_X:
    case Field::OFFSET_Z:
    case Field::OFFSET_x:
      append_all("%z");
      break;
    case Field::ZONE_ID:
      append_all("%Z");
      break;
    }
  }

  for (auto& f : stack.front()) {
    if (std::find(parse_formats_.begin(), parse_formats_.end(), f) == parse_formats_.end())
      parse_formats_.push_back(std::move(f));
  }
  std::stable_sort(parse_formats_.begin(), parse_formats_.end(),
                   [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

bool DateTimeFormat::parse(std::string_view text, ParsedDateTime& dt) const {
  for (const auto& parser : parsers_) {
    if (parser.parse(text, dt))
      return true;
  }
  return false;
}

std::optional<int32_t> DateTimeFormat::parse_date(std::string_view text) const {
  ParsedDateTime dt;
  if (!parse(text, dt))
    return std::nullopt;
  return dt.to_epoch_days();
}

std::optional<int64_t> DateTimeFormat::parse_timestamp(std::string_view text,
                                                       const TimeZone& zone) const {
  ParsedDateTime dt;
  if (!parse(text, dt))
    return std::nullopt;
  if (!dt.has_tz_offset)
    dt.tz_offset_minutes = zone.offset_minutes();
  return dt.to_epoch_micros();
}

std::string DateTimeFormat::format_date(int32_t days) const {
  return format(ParsedDateTime::from_epoch_days(days), TimeZone::utc());
}

std::string DateTimeFormat::format_timestamp(int64_t micros, const TimeZone& zone) const {
  ParsedDateTime dt = ParsedDateTime::from_epoch_micros(micros + zone.offset_micros());
  dt.tz_offset_minutes = zone.offset_minutes();
  dt.has_tz_offset = true;
  return format(dt, zone);
}

std::string DateTimeFormat::format(const ParsedDateTime& dt, const TimeZone& zone) const {
  const FormatLocale& locale = FormatLocale::english();
  std::string out;
  out.reserve(pattern_.size() + 8);

  for (const auto& tok : tokens_) {
    switch (tok.field) {
    case Field::OPTIONAL_START:
    case Field::OPTIONAL_END:
      break;
    case Field::LITERAL:
      out += tok.literal;
      break;
    case Field::YEAR:
      if (tok.count == 2)
        out += pad(((dt.year % 100) + 100) % 100, 2);
      else if (dt.year > 9999)
        out += "+" + pad(dt.year, tok.count);
      else
        out += pad(dt.year, tok.count);
      break;
    case Field::MONTH:
      out += pad(dt.month, tok.count);
      break;
    case Field::MONTH_ABBREV:
      out += locale.month_abbrev[dt.month - 1];
      break;
    case Field::MONTH_NAME:
      out += locale.month_names[dt.month - 1];
      break;
    case Field::DAY:
      out += pad(dt.day, tok.count);
      break;
    case Field::HOUR_OF_DAY:
      out += pad(dt.hour, tok.count);
      break;
    case Field::HOUR_OF_AMPM:
      out += pad(dt.hour % 12 == 0 ? 12 : dt.hour % 12, tok.count);
      break;
    case Field::MINUTE:
      out += pad(dt.minute, tok.count);
      break;
    case Field::SECOND:
      out += pad(dt.second, tok.count);
      break;
    case Field::FRACTION: {
      std::string digits = pad(dt.microsecond, 6);
      if (tok.count <= 6)
        out += digits.substr(0, tok.count);
      else
        out += digits + std::string(tok.count - 6, '0');
      break;
    }
    case Field::AM_PM:
      out += dt.hour < 12 ? locale.am : locale.pm;
      break;
    case Field::DAY_ABBREV:
      out += locale.day_abbrev[dt.day_of_week()];
      break;
    case Field::DAY_NAME:
      out += locale.day_names[dt.day_of_week()];
      break;
    case Field::OFFSET_X:
      out += format_offset(dt.tz_offset_minutes, true, tok.count == 3, tok.count == 1);
      break;
    case Field::OFFSET_Z:
      out += format_offset(dt.tz_offset_minutes, false, tok.count == 3, false);
      break;
    case Field::OFFSET_x:
      out += format_offset(dt.tz_offset_minutes, false, tok.count == 3, tok.count == 1);
      break;
    case Field::ZONE_ID:
      out += zone.id();
      break;
    }
  }
  return out;
}

} // namespace csvexpr
