#include "csvexpr/error.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace csvexpr {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::EMPTY_RECORD:
    return "EMPTY_RECORD";
  case ErrorCode::UNCLOSED_QUOTE:
    return "UNCLOSED_QUOTE";
  case ErrorCode::INVALID_QUOTE_ESCAPE:
    return "INVALID_QUOTE_ESCAPE";
  case ErrorCode::INCONSISTENT_FIELD_COUNT:
    return "INCONSISTENT_FIELD_COUNT";
  case ErrorCode::FIELD_CONVERSION:
    return "FIELD_CONVERSION";
  case ErrorCode::MALFORMED_RECORD:
    return "MALFORMED_RECORD";
  case ErrorCode::UNSUPPORTED_PARSE_MODE:
    return "UNSUPPORTED_PARSE_MODE";
  case ErrorCode::INVALID_CORRUPT_RECORD_COLUMN:
    return "INVALID_CORRUPT_RECORD_COLUMN";
  case ErrorCode::UNSUPPORTED_DATA_TYPE:
    return "UNSUPPORTED_DATA_TYPE";
  case ErrorCode::INVALID_OPTION:
    return "INVALID_OPTION";
  case ErrorCode::UNKNOWN_TIME_ZONE:
    return "UNKNOWN_TIME_ZONE";
  case ErrorCode::INVALID_DATETIME_PATTERN:
    return "INVALID_DATETIME_PATTERN";
  case ErrorCode::INVALID_SCHEMA:
    return "INVALID_SCHEMA";
  case ErrorCode::NON_FOLDABLE_INPUT:
    return "NON_FOLDABLE_INPUT";
  case ErrorCode::UNEXPECTED_NULL:
    return "UNEXPECTED_NULL";
  case ErrorCode::UNSUPPORTED_INPUT_TYPE:
    return "UNSUPPORTED_INPUT_TYPE";
  case ErrorCode::UNEXPECTED_INPUT_TYPE:
    return "UNEXPECTED_INPUT_TYPE";
  case ErrorCode::INVALID_OPTIONS:
    return "INVALID_OPTIONS";
  case ErrorCode::WRONG_NUM_ARGS:
    return "WRONG_NUM_ARGS";
  case ErrorCode::UNRESOLVED_ROUTINE:
    return "UNRESOLVED_ROUTINE";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

const char* error_severity_to_string(ErrorSeverity severity) {
  switch (severity) {
  case ErrorSeverity::WARNING:
    return "WARNING";
  case ErrorSeverity::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

const char* parse_mode_to_string(ParseMode mode) {
  switch (mode) {
  case ParseMode::PERMISSIVE:
    return "PERMISSIVE";
  case ParseMode::DROP_MALFORMED:
    return "DROPMALFORMED";
  case ParseMode::FAIL_FAST:
    return "FAILFAST";
  }
  return "UNKNOWN";
}

std::optional<ParseMode> parse_mode_from_string(std::string_view name) {
  std::string upper;
  upper.reserve(name.size());
  for (char c : name) {
    upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (upper == "PERMISSIVE")
    return ParseMode::PERMISSIVE;
  if (upper == "DROPMALFORMED")
    return ParseMode::DROP_MALFORMED;
  if (upper == "FAILFAST")
    return ParseMode::FAIL_FAST;
  return std::nullopt;
}

std::string ParseError::to_string() const {
  std::ostringstream ss;
  ss << "[" << error_severity_to_string(severity) << "] " << error_code_to_string(code)
     << " at record " << line << ", field " << column << " (byte " << byte_offset
     << "): " << message;

  if (!context.empty()) {
    ss << "\n  Context: " << context;
  }

  return ss.str();
}

std::string AnalysisException::parameter(const std::string& name) const {
  for (const auto& kv : parameters_) {
    if (kv.first == name)
      return kv.second;
  }
  return "";
}

std::string MalformedRecordException::format_message(const std::string& record, ParseMode mode,
                                                     const std::vector<ParseError>& errors) {
  std::ostringstream ss;
  ss << "Malformed CSV record: '" << record << "'. Parse Mode: " << parse_mode_to_string(mode)
     << ".";
  if (!errors.empty()) {
    // Report the first failure rather than a warning that preceded it
    auto it = std::find_if(errors.begin(), errors.end(), [](const ParseError& e) {
      return e.severity != ErrorSeverity::WARNING;
    });
    const ParseError& first = it != errors.end() ? *it : errors.front();
    ss << " " << error_code_to_string(first.code);
    if (first.column > 0)
      ss << " in field " << first.column;
    ss << ": " << first.message;
    if (errors.size() > 1)
      ss << " (and " << errors.size() - 1 << " more)";
  }
  return ss.str();
}

} // namespace csvexpr
