/**
 * @file options.h
 * @brief Option maps, resolved CSV options and session configuration.
 */

#ifndef CSVEXPR_OPTIONS_H
#define CSVEXPR_OPTIONS_H

#include "csvexpr/datetime_format.h"
#include "csvexpr/debug.h"
#include "csvexpr/error.h"
#include "csvexpr/time_zone.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csvexpr {

// Case-insensitive name -> value map of user options. Later assignments to
// the same key (in any case) replace earlier ones.
class OptionMap {
public:
  OptionMap() = default;
  OptionMap(std::initializer_list<std::pair<const std::string, std::string>> init);

  void set(const std::string& key, const std::string& value);
  std::optional<std::string> get(const std::string& key) const;
  bool contains(const std::string& key) const { return get(key).has_value(); }

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Original keys as last set, sorted case-insensitively.
  std::vector<std::pair<std::string, std::string>> entries() const;

private:
  static std::string fold(const std::string& key);

  // folded key -> (original key, value)
  std::map<std::string, std::pair<std::string, std::string>> entries_;
};

// Engine-wide settings supplied when an expression binds.
struct SessionConfig {
  std::string session_time_zone = "UTC";
  std::string column_name_of_corrupt_record = "_corrupt_record";
  bool column_pruning = true;
  DebugConfig debug;
};

/**
 * @brief CSV options resolved from an OptionMap.
 *
 * Every option is validated here so that a bad value is reported once, when
 * the codec is built, never per record.
 */
struct CsvOptions {
  CsvOptions(const OptionMap& parameters, bool column_pruning,
             const std::string& default_time_zone_id,
             const std::string& default_column_name_of_corrupt_record = "_corrupt_record");

  OptionMap parameters;

  // Dialect
  std::string delimiter = ",";
  char quote = '"';        // '\0' disables quoting
  char escape = '\\';
  char comment = '\0';     // '\0' disables comments
  bool header = false;
  std::string line_separator = "\n";

  // Value spellings
  std::string null_value;
  std::string empty_value_in_read;
  std::string empty_value_in_write = "\"\"";
  std::string nan_value = "NaN";
  std::string positive_inf = "Inf";
  std::string negative_inf = "-Inf";

  // Whitespace handling differs between read and write
  bool ignore_leading_whitespace_in_read = false;
  bool ignore_trailing_whitespace_in_read = false;
  bool ignore_leading_whitespace_in_write = true;
  bool ignore_trailing_whitespace_in_write = true;

  bool quote_all = false;
  bool escape_quotes = true;
  bool prefer_date = true;
  bool column_pruning = true;

  ParseMode parse_mode = ParseMode::PERMISSIVE;
  std::string column_name_of_corrupt_record;
  // True when columnNameOfCorruptRecord came from the options, not the session.
  bool corrupt_record_explicit = false;

  std::string date_pattern = "yyyy-MM-dd";
  std::string timestamp_pattern = "yyyy-MM-dd'T'HH:mm:ss[.SSS][XXX]";
  std::shared_ptr<const DateTimeFormat> date_format;
  std::shared_ptr<const DateTimeFormat> timestamp_format;

  TimeZone zone;

  // Copy with a different record terminator; used to force the sentinel.
  CsvOptions with_line_separator(const std::string& separator) const;
};

} // namespace csvexpr

#endif // CSVEXPR_OPTIONS_H
