#ifndef CSVEXPR_ERROR_H
#define CSVEXPR_ERROR_H

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csvexpr {

enum class ErrorCode {
  NONE = 0,

  // Record errors (per row, governed by ParseMode)
  EMPTY_RECORD,             // Input produced no record at all
  UNCLOSED_QUOTE,           // Quoted field not closed before end of record
  INVALID_QUOTE_ESCAPE,     // Text follows the closing quote of a field
  INCONSISTENT_FIELD_COUNT, // Record has a different number of fields than the schema
  FIELD_CONVERSION,         // Token could not be converted to the field type
  MALFORMED_RECORD,         // Record rejected under FAILFAST

  // Configuration errors (bind time)
  UNSUPPORTED_PARSE_MODE,
  INVALID_CORRUPT_RECORD_COLUMN,
  UNSUPPORTED_DATA_TYPE,
  INVALID_OPTION,
  UNKNOWN_TIME_ZONE,
  INVALID_DATETIME_PATTERN,
  INVALID_SCHEMA,

  // Type check failures (analysis)
  NON_FOLDABLE_INPUT,
  UNEXPECTED_NULL,
  UNSUPPORTED_INPUT_TYPE,
  UNEXPECTED_INPUT_TYPE,
  INVALID_OPTIONS,
  WRONG_NUM_ARGS,
  UNRESOLVED_ROUTINE,

  INTERNAL_ERROR
};

enum class ErrorSeverity {
  WARNING, // Informational, the record is still considered well formed
  ERROR    // The record is malformed; a partial result may exist
};

struct ParseError {
  ErrorCode code;
  ErrorSeverity severity;

  size_t line;        // Record number (1-indexed)
  size_t column;      // Field number (1-indexed, 0 when not field specific)
  size_t byte_offset; // Offset of the offending token in the input

  std::string message;
  std::string context; // Offending token or a snippet of the record

  ParseError(ErrorCode c, ErrorSeverity s, size_t l, size_t col, size_t offset,
             const std::string& msg, const std::string& ctx = "")
      : code(c), severity(s), line(l), column(col), byte_offset(offset), message(msg),
        context(ctx) {}

  std::string to_string() const;
};

// Failure policy for malformed records
enum class ParseMode {
  PERMISSIVE,     // Null out what cannot be mapped, keep the raw text if configured
  DROP_MALFORMED, // Drop malformed records entirely
  FAIL_FAST       // Abort on the first malformed record
};

const char* parse_mode_to_string(ParseMode mode);

// Case-insensitive; returns nullopt for unknown names.
std::optional<ParseMode> parse_mode_from_string(std::string_view name);

// Accumulates the errors found while parsing one record.
class ErrorCollector {
public:
  explicit ErrorCollector(ParseMode mode = ParseMode::FAIL_FAST) : mode_(mode) {}

  void add_error(const ParseError& error) { errors_.push_back(error); }

  void add_error(ErrorCode code, ErrorSeverity severity, size_t line, size_t column,
                 size_t offset, const std::string& message, const std::string& context = "") {
    add_error(ParseError(code, severity, line, column, offset, message, context));
  }

  // FAILFAST gives up after the first failure; other modes convert every
  // field so that the partial row is complete.
  bool should_stop() const { return mode_ == ParseMode::FAIL_FAST && has_failures(); }

  bool has_errors() const { return !errors_.empty(); }

  // True if any error makes the record malformed (anything but a warning).
  bool has_failures() const { return first_failure() != nullptr; }

  size_t error_count() const { return errors_.size(); }

  // First error that is not a warning, or nullptr.
  const ParseError* first_failure() const {
    for (const auto& err : errors_) {
      if (err.severity != ErrorSeverity::WARNING)
        return &err;
    }
    return nullptr;
  }

  const std::vector<ParseError>& errors() const { return errors_; }

  ParseMode mode() const { return mode_; }

private:
  ParseMode mode_;
  std::vector<ParseError> errors_;
};

// Base of every user-facing error raised by the library.
class CsvexprException : public std::runtime_error {
public:
  CsvexprException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

// Bind-time configuration problems: bad options, schemas or parse modes.
class ConfigurationError : public CsvexprException {
public:
  using CsvexprException::CsvexprException;
};

// Type check failure of an expression. The error code is the subkind.
class AnalysisException : public CsvexprException {
public:
  using Parameters = std::vector<std::pair<std::string, std::string>>;

  AnalysisException(ErrorCode sub_class, const std::string& message, Parameters params = {})
      : CsvexprException(sub_class, message), parameters_(std::move(params)) {}

  const Parameters& parameters() const { return parameters_; }

  // Value of a message parameter, empty if absent.
  std::string parameter(const std::string& name) const;

private:
  Parameters parameters_;
};

// A record that could not be parsed under FAILFAST.
class MalformedRecordException : public CsvexprException {
public:
  MalformedRecordException(const std::string& record, ParseMode mode,
                           const std::vector<ParseError>& errors)
      : CsvexprException(ErrorCode::MALFORMED_RECORD, format_message(record, mode, errors)),
        record_(record), errors_(errors) {}

  const std::string& record() const { return record_; }
  const std::vector<ParseError>& errors() const { return errors_; }

private:
  std::string record_;
  std::vector<ParseError> errors_;

  static std::string format_message(const std::string& record, ParseMode mode,
                                     const std::vector<ParseError>& errors);
};

// Codec misuse. Never a consequence of malformed input.
class InternalError : public std::logic_error {
public:
  explicit InternalError(const std::string& message) : std::logic_error(message) {}
};

const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace csvexpr

#endif // CSVEXPR_ERROR_H
