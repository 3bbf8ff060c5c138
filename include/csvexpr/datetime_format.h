/**
 * @file datetime_format.h
 * @brief SQL datetime patterns (yyyy-MM-dd'T'HH:mm:ss[.SSS][XXX]) for decode and encode.
 *
 * A pattern is compiled once into a token list. Parsing expands every
 * combination of optional [...] sections into strptime formats for
 * FormatParser and tries them longest first. Formatting walks the tokens and
 * always emits optional sections.
 */

#ifndef CSVEXPR_DATETIME_FORMAT_H
#define CSVEXPR_DATETIME_FORMAT_H

#include "csvexpr/format_parser.h"
#include "csvexpr/time_zone.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csvexpr {

class DateTimeFormat {
public:
  enum class Field {
    LITERAL,
    YEAR,
    MONTH,
    MONTH_ABBREV,
    MONTH_NAME,
    DAY,
    HOUR_OF_DAY,  // H: 0-23
    HOUR_OF_AMPM, // h: 1-12
    MINUTE,
    SECOND,
    FRACTION,
    AM_PM,
    DAY_ABBREV,
    DAY_NAME,
    OFFSET_X,    // X, XX, XXX: Z for zero
    OFFSET_Z,    // Z: +0000
    OFFSET_x,    // x, xx, xxx: never Z
    ZONE_ID,     // VV, z
    OPTIONAL_START,
    OPTIONAL_END
  };

  struct Token {
    Field field;
    int count;           // Pattern letter repetitions
    std::string literal; // LITERAL only
  };

  // Throws ConfigurationError(INVALID_DATETIME_PATTERN) on unknown letters,
  // unbalanced brackets or unterminated quotes.
  explicit DateTimeFormat(std::string_view pattern);

  const std::string& pattern() const { return pattern_; }
  const std::vector<Token>& tokens() const { return tokens_; }

  // strptime formats tried by parse, longest first.
  const std::vector<std::string>& parse_formats() const { return parse_formats_; }

  bool parse(std::string_view text, ParsedDateTime& dt) const;

  // Days since the epoch, nullopt if text does not match.
  std::optional<int32_t> parse_date(std::string_view text) const;

  // Microseconds since the epoch. Text without an offset is read in zone.
  std::optional<int64_t> parse_timestamp(std::string_view text, const TimeZone& zone) const;

  std::string format_date(int32_t days) const;
  std::string format_timestamp(int64_t micros, const TimeZone& zone) const;

private:
  void compile();
  void expand_formats();
  std::string format(const ParsedDateTime& dt, const TimeZone& zone) const;

  std::string pattern_;
  std::vector<Token> tokens_;
  std::vector<std::string> parse_formats_;
  std::vector<FormatParser> parsers_;
};

} // namespace csvexpr

#endif // CSVEXPR_DATETIME_FORMAT_H
