#include "csvexpr/line_parser.h"

#include "csvexpr/common_defs.h"

#include <cstring>

namespace csvexpr {

LineParser::LineParser(const CsvOptions& options) : options_(options) {}

bool LineParser::is_comment_line(const char* data, size_t size) const {
  return options_.comment != '\0' && size > 0 && data[0] == options_.comment;
}

size_t LineParser::parse_line(const char* data, size_t size, TokenRecord& tokens,
                              ErrorCollector& errors, size_t record_number,
                              size_t base_offset) const {
  tokens.clear();

  const std::string& separator = options_.delimiter;
  const std::string& terminator = options_.line_separator;
  const char quote = options_.quote;
  const char escape = options_.escape;

  // Helper to match a (possibly multi-byte) marker at a given position
  auto matches_at = [&](size_t pos, const std::string& marker) -> bool {
    if (marker.size() == 1)
      return data[pos] == marker[0];
    return pos + marker.size() <= size &&
           std::memcmp(data + pos, marker.data(), marker.size()) == 0;
  };

  Token current;
  current.offset = base_offset;
  current.text.reserve(64);
  bool in_quote = false;
  bool at_field_start = true;
  // Length of the quoted content; text after the closing quote may be trimmed.
  size_t quoted_length = 0;
  bool reported_text_after_quote = false;

  auto finish_field = [&]() {
    if (options_.ignore_trailing_whitespace_in_read) {
      size_t keep = current.quoted ? quoted_length : 0;
      while (current.text.size() > keep &&
             (current.text.back() == ' ' || current.text.back() == '\t')) {
        current.text.pop_back();
      }
    }
    tokens.push_back(std::move(current));
    current = Token();
    reported_text_after_quote = false;
  };

  size_t i = 0;
  while (i < size) {
    char c = data[i];

    if (in_quote) {
      if (escape != quote && c == escape && i + 1 < size &&
          (data[i + 1] == quote || data[i + 1] == escape)) {
        current.text += data[i + 1];
        i += 2;
        continue;
      }
      if (c == quote) {
        if (i + 1 < size && data[i + 1] == quote) {
          // Escaped quote (doubled)
          current.text += quote;
          i += 2;
          continue;
        }
        in_quote = false;
        quoted_length = current.text.size();
        ++i;
        continue;
      }
      current.text += c;
      ++i;
      continue;
    }

    // End of record (outside quotes)
    if (matches_at(i, terminator)) {
      finish_field();
      return i + terminator.size();
    }

    if (matches_at(i, separator)) {
      finish_field();
      i += separator.size();
      current.offset = base_offset + i;
      at_field_start = true;
      continue;
    }

    if (at_field_start) {
      if (options_.ignore_leading_whitespace_in_read && (c == ' ' || c == '\t')) {
        ++i;
        continue;
      }
      if (quote != '\0' && c == quote) {
        current.quoted = true;
        in_quote = true;
        at_field_start = false;
        ++i;
        continue;
      }
    }

    // Kept as field data, like an unquoted tail
    if (current.quoted && !reported_text_after_quote && c != ' ' && c != '\t') {
      errors.add_error(ErrorCode::INVALID_QUOTE_ESCAPE, ErrorSeverity::WARNING, record_number,
                       tokens.size() + 1, base_offset + i, "Text after the closing quote",
                       current.text.substr(0, 32));
      reported_text_after_quote = true;
    }

    at_field_start = false;
    current.text += c;
    ++i;
  }

  if (unlikely(in_quote)) {
    std::string context = current.text.substr(0, 32);
    errors.add_error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::ERROR, record_number,
                     tokens.size() + 1, current.offset, "Quoted field is not closed", context);
    quoted_length = current.text.size();
  }
  finish_field();
  return i;
}

std::vector<TokenRecord> LineParser::tokenize(std::string_view input,
                                              ErrorCollector& errors) const {
  std::vector<TokenRecord> records;

  if (input.empty()) {
    errors.add_error(ErrorCode::EMPTY_RECORD, ErrorSeverity::ERROR, 1, 0, 0,
                     "Input contains no record");
    return records;
  }

  const std::string& terminator = options_.line_separator;
  size_t pos = 0;
  while (pos < input.size()) {
    const char* data = input.data() + pos;
    size_t remaining = input.size() - pos;

    if (is_comment_line(data, remaining)) {
      size_t next = input.find(terminator, pos);
      pos = next == std::string_view::npos ? input.size() : next + terminator.size();
      continue;
    }

    TokenRecord record;
    pos += parse_line(data, remaining, record, errors, records.size() + 1, pos);
    records.push_back(std::move(record));

    if (unlikely(errors.should_stop()))
      break;
  }

  if (records.empty()) {
    errors.add_error(ErrorCode::EMPTY_RECORD, ErrorSeverity::ERROR, 1, 0, 0,
                     "Input contains only comment lines");
  }

  return records;
}

} // namespace csvexpr
