#include "csvexpr/options.h"

#include <cctype>
#include <cstdint>

namespace csvexpr {

// ============================================================================
// OptionMap
// ============================================================================

OptionMap::OptionMap(std::initializer_list<std::pair<const std::string, std::string>> init) {
  for (const auto& kv : init)
    set(kv.first, kv.second);
}

std::string OptionMap::fold(const std::string& key) {
  std::string out(key);
  for (auto& c : out)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

void OptionMap::set(const std::string& key, const std::string& value) {
  entries_[fold(key)] = {key, value};
}

std::optional<std::string> OptionMap::get(const std::string& key) const {
  auto it = entries_.find(fold(key));
  if (it == entries_.end())
    return std::nullopt;
  return it->second.second;
}

std::vector<std::pair<std::string, std::string>> OptionMap::entries() const {
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_)
    out.push_back(kv.second);
  return out;
}

// ============================================================================
// Option value parsing
// ============================================================================

namespace {

[[noreturn]] void invalid_option(const std::string& name, const std::string& why) {
  throw ConfigurationError(ErrorCode::INVALID_OPTION, "Invalid value for option '" + name +
                                                          "': " + why);
}

bool get_bool(const OptionMap& params, const std::string& name, bool default_value) {
  auto value = params.get(name);
  if (!value)
    return default_value;
  std::string lower(*value);
  for (auto& c : lower)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "true")
    return true;
  if (lower == "false")
    return false;
  invalid_option(name, "'" + *value + "' is not a boolean; expected true or false");
}

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Delimiters may be several characters and may use \t, \r, \b, \f, \", \',
// \\ and \uXXXX escapes.
std::string parse_delimiter(const std::string& name, const std::string& raw) {
  if (raw.empty())
    invalid_option(name, "delimiter cannot be empty");
  if (raw == "\\")
    invalid_option(name, "single backslash is prohibited; it has special meaning as the "
                         "beginning of an escape sequence");

  std::string out;
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\') {
      out += raw[i];
      continue;
    }
    if (i + 1 >= raw.size())
      invalid_option(name, "delimiter '" + raw + "' ends with a lone backslash");
    char next = raw[++i];
    switch (next) {
    case 't':
      out += '\t';
      break;
    case 'r':
      out += '\r';
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case '"':
    case '\'':
    case '\\':
      out += next;
      break;
    case 'u': {
      if (i + 4 >= raw.size())
        invalid_option(name, "incomplete unicode escape in '" + raw + "'");
      uint32_t cp = 0;
      for (int k = 1; k <= 4; ++k) {
        char h = raw[i + k];
        cp <<= 4;
        if (h >= '0' && h <= '9')
          cp |= static_cast<uint32_t>(h - '0');
        else if (h >= 'a' && h <= 'f')
          cp |= static_cast<uint32_t>(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F')
          cp |= static_cast<uint32_t>(h - 'A' + 10);
        else
          invalid_option(name, "bad unicode escape in '" + raw + "'");
      }
      append_utf8(out, cp);
      i += 4;
      break;
    }
    default:
      invalid_option(name, std::string("unsupported special character for delimiter: \\") + next);
    }
  }
  return out;
}

// A single character option; empty means "disabled" when allow_empty is set.
char get_char(const OptionMap& params, const std::string& name, char default_value,
              bool allow_empty) {
  auto value = params.get(name);
  if (!value)
    return default_value;
  if (value->empty()) {
    if (allow_empty)
      return '\0';
    invalid_option(name, "cannot be empty");
  }
  if (value->size() != 1)
    invalid_option(name, "'" + *value + "' must be a single character");
  return (*value)[0];
}

std::shared_ptr<const DateTimeFormat> compile_pattern(const std::string& name,
                                                      const std::string& pattern) {
  try {
    return std::make_shared<const DateTimeFormat>(pattern);
  } catch (const ConfigurationError& e) {
    throw ConfigurationError(ErrorCode::INVALID_DATETIME_PATTERN,
                             std::string("Option '") + name + "': " + e.what());
  }
}

} // namespace

// ============================================================================
// CsvOptions
// ============================================================================

CsvOptions::CsvOptions(const OptionMap& params, bool pruning,
                       const std::string& default_time_zone_id,
                       const std::string& default_column_name_of_corrupt_record)
    : parameters(params), column_pruning(pruning) {
  if (auto sep = params.get("sep"))
    delimiter = parse_delimiter("sep", *sep);
  else if (auto delim = params.get("delimiter"))
    delimiter = parse_delimiter("delimiter", *delim);

  quote = get_char(params, "quote", '"', true);
  escape = get_char(params, "escape", '\\', false);
  comment = get_char(params, "comment", '\0', true);
  header = get_bool(params, "header", false);

  if (auto sep = params.get("lineSep")) {
    if (sep->empty())
      invalid_option("lineSep", "cannot be empty");
    line_separator = *sep;
  }

  null_value = params.get("nullValue").value_or("");
  if (auto empty = params.get("emptyValue")) {
    empty_value_in_read = *empty;
    empty_value_in_write = *empty;
  }
  nan_value = params.get("nanValue").value_or("NaN");
  positive_inf = params.get("positiveInf").value_or("Inf");
  negative_inf = params.get("negativeInf").value_or("-Inf");

  ignore_leading_whitespace_in_read = get_bool(params, "ignoreLeadingWhiteSpace", false);
  ignore_trailing_whitespace_in_read = get_bool(params, "ignoreTrailingWhiteSpace", false);
  ignore_leading_whitespace_in_write = get_bool(params, "ignoreLeadingWhiteSpace", true);
  ignore_trailing_whitespace_in_write = get_bool(params, "ignoreTrailingWhiteSpace", true);

  quote_all = get_bool(params, "quoteAll", false);
  escape_quotes = get_bool(params, "escapeQuotes", true);
  prefer_date = get_bool(params, "preferDate", true);

  if (auto mode = params.get("mode")) {
    auto parsed = parse_mode_from_string(*mode);
    if (!parsed)
      invalid_option("mode", "unknown parse mode '" + *mode +
                                 "'; expected PERMISSIVE, DROPMALFORMED or FAILFAST");
    parse_mode = *parsed;
  }

  if (auto name = params.get("columnNameOfCorruptRecord")) {
    column_name_of_corrupt_record = *name;
    corrupt_record_explicit = true;
  } else {
    column_name_of_corrupt_record = default_column_name_of_corrupt_record;
  }

  date_pattern = params.get("dateFormat").value_or(date_pattern);
  timestamp_pattern = params.get("timestampFormat").value_or(timestamp_pattern);
  date_format = compile_pattern("dateFormat", date_pattern);
  timestamp_format = compile_pattern("timestampFormat", timestamp_pattern);

  zone = resolve_time_zone(params.get("timeZone").value_or(default_time_zone_id));
}

CsvOptions CsvOptions::with_line_separator(const std::string& separator) const {
  CsvOptions copy(*this);
  copy.line_separator = separator;
  return copy;
}

} // namespace csvexpr
