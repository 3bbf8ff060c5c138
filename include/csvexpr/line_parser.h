#ifndef CSVEXPR_LINE_PARSER_H
#define CSVEXPR_LINE_PARSER_H

#include "csvexpr/error.h"
#include "csvexpr/options.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace csvexpr {

struct Token {
  std::string text;
  bool quoted = false;
  size_t offset = 0; // Byte offset of the field start in the input
};

using TokenRecord = std::vector<Token>;

// Splits delimited text into records of raw tokens. Quotes, escapes,
// multi-byte delimiters and the read-side whitespace options are handled
// here; no type conversion happens.
class LineParser {
public:
  explicit LineParser(const CsvOptions& options);

  // Tokenizes one record starting at data. Stops after the record terminator
  // (options.line_separator) found outside quotes, or at the end of input.
  // Returns the number of bytes consumed, terminator included.
  size_t parse_line(const char* data, size_t size, TokenRecord& tokens, ErrorCollector& errors,
                    size_t record_number = 1, size_t base_offset = 0) const;

  // All records of the input. Comment lines and an empty input produce no
  // record; an empty input also records EMPTY_RECORD.
  std::vector<TokenRecord> tokenize(std::string_view input, ErrorCollector& errors) const;

  const CsvOptions& options() const { return options_; }

private:
  bool is_comment_line(const char* data, size_t size) const;

  CsvOptions options_;
};

} // namespace csvexpr

#endif // CSVEXPR_LINE_PARSER_H
