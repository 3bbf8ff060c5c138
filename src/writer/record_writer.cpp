#include "csvexpr/record_writer.h"

#include "csvexpr/type_support.h"

#include <charconv>
#include <cmath>

namespace csvexpr {

namespace {

// Decimal notation in [1e-3, 1e7), scientific with a mantissa that always has
// a fraction outside it.
template <typename T> std::string format_shortest(T value) {
  char buf[64];
  T magnitude = std::fabs(value);
  bool plain = magnitude == 0 || (magnitude >= T(1e-3) && magnitude < T(1e7));

  auto result = plain ? std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed)
                      : std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
  std::string text(buf, result.ptr);

  if (plain) {
    if (text.find('.') == std::string::npos)
      text += ".0";
    return text;
  }

  // 1e+20 -> 1.0E20, 1.5e-05 -> 1.5E-5
  size_t e = text.find('e');
  std::string mantissa = text.substr(0, e);
  std::string exponent = text.substr(e + 1);
  if (mantissa.find('.') == std::string::npos)
    mantissa += ".0";
  bool negative = !exponent.empty() && exponent[0] == '-';
  size_t digits = exponent.find_first_not_of("+-");
  std::string exp_digits = exponent.substr(digits);
  size_t nonzero = exp_digits.find_first_not_of('0');
  exp_digits = nonzero == std::string::npos ? "0" : exp_digits.substr(nonzero);
  return mantissa + "E" + (negative ? "-" : "") + exp_digits;
}

} // namespace

std::string format_double(double value) { return format_shortest(value); }

std::string format_float(float value) { return format_shortest(value); }

RecordWriter::RecordWriter(const Schema& schema, const CsvOptions& options)
    : schema_(schema), options_(options) {
  for (const auto& field : schema_) {
    if (!is_supported_data_type(field.type)) {
      throw ConfigurationError(ErrorCode::UNSUPPORTED_DATA_TYPE,
                               "CSV data source does not support " + field.type.to_sql() +
                                   " data type (field '" + field.name + "')");
    }
  }
  buffer_.reserve(256);
}

std::string RecordWriter::write(const Row& row) {
  if (row.size() != schema_.size()) {
    throw InternalError("Row has " + std::to_string(row.size()) + " values, schema has " +
                        std::to_string(schema_.size()) + " fields");
  }

  buffer_.clear();
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0)
      buffer_ += options_.delimiter;
    append_field(row[i], schema_.field(i).type);
  }
  return buffer_;
}

void RecordWriter::append_field(const Value& value, const DataType& type) {
  if (value.is_null()) {
    buffer_ += options_.null_value;
    return;
  }

  std::string text = render(value, type);
  if (text.empty()) {
    if (options_.quote_all && options_.quote != '\0') {
      buffer_ += options_.quote;
      buffer_ += options_.quote;
    } else {
      buffer_ += options_.empty_value_in_write;
    }
    return;
  }

  if (options_.quote == '\0' || !(options_.quote_all || needs_quotes(text))) {
    buffer_ += text;
    return;
  }

  buffer_ += options_.quote;
  for (char c : text) {
    if (c == options_.quote && options_.escape_quotes) {
      buffer_ += options_.escape;
    } else if (c == options_.escape && options_.escape != options_.quote) {
      buffer_ += options_.escape;
    }
    buffer_ += c;
  }
  buffer_ += options_.quote;
}

bool RecordWriter::needs_quotes(const std::string& text) const {
  // Any delimiter byte, so a multi-char separator cannot form across a field edge
  if (text.find_first_of(options_.delimiter) != std::string::npos)
    return true;
  if (options_.escape_quotes && text.find(options_.quote) != std::string::npos)
    return true;
  if (text.find_first_of("\r\n") != std::string::npos)
    return true;
  if (options_.comment != '\0' && text[0] == options_.comment)
    return true;
  auto is_blank = [](char c) { return c == ' ' || c == '\t'; };
  if (options_.ignore_leading_whitespace_in_write && is_blank(text.front()))
    return true;
  if (options_.ignore_trailing_whitespace_in_write && is_blank(text.back()))
    return true;
  return false;
}

std::string RecordWriter::render_floating(double value, bool is_float) const {
  if (std::isnan(value))
    return options_.nan_value;
  if (std::isinf(value))
    return value > 0 ? options_.positive_inf : options_.negative_inf;
  return is_float ? format_float(static_cast<float>(value)) : format_double(value);
}

std::string RecordWriter::render(const Value& value, const DataType& type) const {
  switch (type.id()) {
  case TypeId::BOOLEAN:
    return value.as_bool() ? "true" : "false";
  case TypeId::TINYINT:
  case TypeId::SMALLINT:
  case TypeId::INTEGER:
  case TypeId::BIGINT:
    return std::to_string(value.as_int());
  case TypeId::FLOAT:
    return render_floating(value.as_double(), true);
  case TypeId::DOUBLE:
    return render_floating(value.as_double(), false);
  case TypeId::STRING:
    return value.as_string();
  case TypeId::DATE:
    return options_.date_format->format_date(value.as_date());
  case TypeId::TIMESTAMP:
    return options_.timestamp_format->format_timestamp(value.as_timestamp(), options_.zone);
  case TypeId::USER_DEFINED:
    return render(value, type.sql_type());
  case TypeId::ARRAY: {
    std::string out = "[";
    const auto& elements = value.elements();
    for (size_t i = 0; i < elements.size(); ++i) {
      if (i > 0)
        out += ", ";
      out += render_nested(elements[i], type.element_type());
    }
    return out + "]";
  }
  case TypeId::MAP: {
    std::string out = "{";
    const auto& keys = value.map_keys();
    const auto& values = value.map_values();
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0)
        out += ", ";
      out += render_nested(keys[i], type.key_type());
      out += " -> ";
      out += render_nested(values[i], type.value_type());
    }
    return out + "}";
  }
  case TypeId::STRUCT: {
    std::string out = "{";
    const Schema& nested = type.struct_schema();
    const auto& fields = value.fields();
    for (size_t i = 0; i < fields.size() && i < nested.size(); ++i) {
      if (i > 0)
        out += ", ";
      out += render_nested(fields[i], nested.field(i).type);
    }
    return out + "}";
  }
  case TypeId::NULL_TYPE:
    return "";
  case TypeId::VARIANT:
    break;
  }
  throw InternalError("Cannot render a value of type " + type.to_sql());
}

std::string RecordWriter::render_nested(const Value& value, const DataType& type) const {
  if (value.is_null())
    return "null";
  return render(value, type);
}

} // namespace csvexpr
