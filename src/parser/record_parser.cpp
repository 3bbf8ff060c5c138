#include "csvexpr/record_parser.h"

#include "csvexpr/type_support.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fast_float/fast_float.h>
#include <limits>

namespace csvexpr {

namespace {

std::string_view trim_blanks(std::string_view s) {
  size_t start = 0;
  size_t end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

bool parse_integer(std::string_view text, int64_t min, int64_t max, int64_t& out) {
  std::string_view value = trim_blanks(text);
  // std::from_chars does not accept a leading '+'
  if (value.size() > 1 && value[0] == '+' && value[1] != '-')
    value.remove_prefix(1);
  if (value.empty())
    return false;
  int64_t result = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (ec != std::errc() || ptr != value.data() + value.size())
    return false;
  if (result < min || result > max)
    return false;
  out = result;
  return true;
}

template <typename T> bool parse_floating(std::string_view text, const CsvOptions& options,
                                          double& out) {
  if (text == options.nan_value) {
    out = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  if (text == options.positive_inf) {
    out = std::numeric_limits<double>::infinity();
    return true;
  }
  if (text == options.negative_inf) {
    out = -std::numeric_limits<double>::infinity();
    return true;
  }

  std::string_view value = trim_blanks(text);
  // Strip leading '+' that fast_float doesn't accept (from_chars grammar)
  if (value.size() > 1 && value[0] == '+')
    value.remove_prefix(1);
  if (value.empty())
    return false;
  T result;
  auto [ptr, ec] = fast_float::from_chars(value.data(), value.data() + value.size(), result);
  if (ptr != value.data() + value.size())
    return false;
  // fast_float still stores the saturated value (infinity or zero) when it
  // reports result_out_of_range
  if (ec != std::errc() && ec != std::errc::result_out_of_range)
    return false;
  out = static_cast<double>(result);
  return true;
}

} // namespace

RecordParser::RecordParser(const Schema& data_schema, const Schema& required_schema,
                           const CsvOptions& options)
    : data_schema_(data_schema), required_schema_(required_schema), line_parser_(options) {
  for (const auto& field : data_schema_) {
    if (!is_supported_decode_type(field.type)) {
      throw ConfigurationError(ErrorCode::UNSUPPORTED_DATA_TYPE,
                               "CSV data source does not support " + field.type.to_sql() +
                                   " data type (field '" + field.name + "')");
    }
  }

  token_index_.reserve(required_schema_.size());
  for (const auto& field : required_schema_) {
    auto index = data_schema_.index_of(field.name);
    if (!index) {
      throw ConfigurationError(ErrorCode::INVALID_SCHEMA,
                               "Required field '" + field.name + "' is not in the data schema " +
                                   data_schema_.sql());
    }
    token_index_.push_back(*index);
  }
}

std::vector<Row> RecordParser::parse(std::string_view input, ErrorCollector& errors) const {
  std::vector<TokenRecord> records = line_parser_.tokenize(input, errors);

  std::vector<Row> rows;
  rows.reserve(records.size());
  for (size_t r = 0; r < records.size(); ++r) {
    if (errors.should_stop())
      break;
    rows.push_back(convert(records[r], r + 1, errors));
  }
  return rows;
}

Row RecordParser::convert(const TokenRecord& tokens, size_t record_number,
                          ErrorCollector& errors) const {
  const CsvOptions& opts = line_parser_.options();

  if (tokens.size() != data_schema_.size()) {
    size_t offset = tokens.empty() ? 0 : tokens.back().offset;
    errors.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR, record_number, 0,
                     offset,
                     "Expected " + std::to_string(data_schema_.size()) + " fields, found " +
                         std::to_string(tokens.size()));
  }

  auto convert_at = [&](size_t data_index, Value& out) {
    out = Value::null();
    if (data_index >= tokens.size() || errors.should_stop())
      return;
    const StructField& field = data_schema_.field(data_index);
    const Token& token = tokens[data_index];
    std::string message;
    if (!convert_token(token, field.type, out))
      message = "Cannot convert '" + token.text + "' to " + field.type.to_sql();
    else if (out.is_null() && !field.nullable)
      message = "Null value in non-nullable field";
    if (!message.empty()) {
      errors.add_error(ErrorCode::FIELD_CONVERSION, ErrorSeverity::ERROR, record_number,
                       data_index + 1, token.offset, message + " (field '" + field.name + "')",
                       token.text);
    }
  };

  Row row(required_schema_.size());

  if (opts.column_pruning) {
    for (size_t i = 0; i < token_index_.size(); ++i)
      convert_at(token_index_[i], row[i]);
    return row;
  }

  // Without pruning every field is converted, so conversion errors in fields
  // the caller did not ask for still mark the record malformed.
  Row full(data_schema_.size());
  for (size_t i = 0; i < data_schema_.size(); ++i)
    convert_at(i, full[i]);
  for (size_t i = 0; i < token_index_.size(); ++i)
    row[i] = full[token_index_[i]];
  return row;
}

bool RecordParser::convert_token(const Token& token, const DataType& type, Value& out) const {
  const CsvOptions& opts = line_parser_.options();
  out = Value::null();

  // An unquoted empty token reads as nullValue, a quoted one as emptyValue
  const std::string& text =
      token.text.empty() ? (token.quoted ? opts.empty_value_in_read : opts.null_value)
                         : token.text;
  if (text == opts.null_value)
    return true;

  switch (type.id()) {
  case TypeId::NULL_TYPE:
    return true;
  case TypeId::STRING:
    out = Value::string(text);
    return true;
  case TypeId::BOOLEAN: {
    std::string_view value = trim_blanks(text);
    if (equals_ignore_case(value, "true")) {
      out = Value::boolean(true);
      return true;
    }
    if (equals_ignore_case(value, "false")) {
      out = Value::boolean(false);
      return true;
    }
    return false;
  }
  case TypeId::TINYINT:
  case TypeId::SMALLINT:
  case TypeId::INTEGER:
  case TypeId::BIGINT: {
    int64_t min = std::numeric_limits<int64_t>::min();
    int64_t max = std::numeric_limits<int64_t>::max();
    if (type.id() == TypeId::TINYINT) {
      min = std::numeric_limits<int8_t>::min();
      max = std::numeric_limits<int8_t>::max();
    } else if (type.id() == TypeId::SMALLINT) {
      min = std::numeric_limits<int16_t>::min();
      max = std::numeric_limits<int16_t>::max();
    } else if (type.id() == TypeId::INTEGER) {
      min = std::numeric_limits<int32_t>::min();
      max = std::numeric_limits<int32_t>::max();
    }
    int64_t value;
    if (!parse_integer(text, min, max, value))
      return false;
    out = Value::integer(value);
    return true;
  }
  case TypeId::FLOAT: {
    double value;
    if (!parse_floating<float>(text, opts, value))
      return false;
    out = Value::floating(value);
    return true;
  }
  case TypeId::DOUBLE: {
    double value;
    if (!parse_floating<double>(text, opts, value))
      return false;
    out = Value::floating(value);
    return true;
  }
  case TypeId::DATE: {
    auto days = opts.date_format->parse_date(text);
    if (!days)
      return false;
    out = Value::date(*days);
    return true;
  }
  case TypeId::TIMESTAMP: {
    auto micros = opts.timestamp_format->parse_timestamp(text, opts.zone);
    if (!micros)
      return false;
    out = Value::timestamp(*micros);
    return true;
  }
  case TypeId::USER_DEFINED:
    return convert_token(token, type.sql_type(), out);
  default:
    // Rejected in the constructor
    return false;
  }
}

} // namespace csvexpr
