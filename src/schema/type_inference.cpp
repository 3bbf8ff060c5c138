#include "csvexpr/type_inference.h"

#include "csvexpr/common_defs.h"
#include "csvexpr/error.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fast_float/fast_float.h>

namespace csvexpr {

TypeInference::TypeInference(const CsvOptions& options) : options_(options) {}

bool TypeInference::is_null_token(const Token& token) const {
  return token.text.empty() || token.text == options_.null_value;
}

DataType TypeInference::infer_field(const Token& token) const {
  // Empty or null values don't help inference
  if (is_null_token(token)) {
    return TypeId::NULL_TYPE;
  }

  std::string_view value = token.text;

  // Try to parse as integer
  std::string_view digits = value;
  if (digits.size() > 1 && digits[0] == '+' && digits[1] != '-')
    digits.remove_prefix(1);
  int64_t integer = 0;
  auto int_result = std::from_chars(digits.data(), digits.data() + digits.size(), integer);
  if (int_result.ec == std::errc() && int_result.ptr == digits.data() + digits.size()) {
    if (integer >= INT32_MIN && integer <= INT32_MAX)
      return TypeId::INTEGER;
    return TypeId::BIGINT;
  }
  if (int_result.ec == std::errc::result_out_of_range) {
    // Too long for BIGINT but still a number
    return TypeId::DOUBLE;
  }

  // Try to parse as double, including the configured NaN/Inf spellings
  if (value == options_.nan_value || value == options_.positive_inf ||
      value == options_.negative_inf) {
    return TypeId::DOUBLE;
  }
  size_t start = 0;
  size_t end = value.size();
  while (start < end && std::isspace(static_cast<unsigned char>(value[start])))
    ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])))
    --end;
  const char* float_start = value.data() + start;
  size_t float_len = end - start;
  // Strip leading '+' that fast_float doesn't accept (from_chars grammar)
  if (float_len > 1 && *float_start == '+') {
    float_start++;
    float_len--;
  }
  if (float_len > 0) {
    double result;
    auto [ptr, ec] = fast_float::from_chars(float_start, float_start + float_len, result);
    // Out-of-range literals still decode (to infinity or zero)
    if ((ec == std::errc() || ec == std::errc::result_out_of_range) &&
        ptr == float_start + float_len) {
      return TypeId::DOUBLE;
    }
  }

  if (options_.prefer_date && options_.date_format->parse_date(value)) {
    return TypeId::DATE;
  }

  ParsedDateTime dt;
  if (options_.timestamp_format->parse(value, dt)) {
    return TypeId::TIMESTAMP;
  }

  if (value.size() == 4 || value.size() == 5) {
    std::string lower(value);
    for (auto& c : lower)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "false")
      return TypeId::BOOLEAN;
  }

  // Default to string
  return TypeId::STRING;
}

DataType TypeInference::wider_type(const DataType& a, const DataType& b) {
  if (a == b)
    return a;
  if (a.id() == TypeId::NULL_TYPE)
    return b;
  if (b.id() == TypeId::NULL_TYPE)
    return a;

  auto numeric_rank = [](TypeId id) {
    switch (id) {
    case TypeId::INTEGER:
      return 1;
    case TypeId::BIGINT:
      return 2;
    case TypeId::DOUBLE:
      return 3;
    default:
      return 0;
    }
  };
  int ra = numeric_rank(a.id());
  int rb = numeric_rank(b.id());
  if (ra > 0 && rb > 0)
    return ra > rb ? a : b;

  bool a_temporal = a.id() == TypeId::DATE || a.id() == TypeId::TIMESTAMP;
  bool b_temporal = b.id() == TypeId::DATE || b.id() == TypeId::TIMESTAMP;
  if (a_temporal && b_temporal)
    return TypeId::TIMESTAMP;

  return TypeId::STRING;
}

DataType TypeInference::infer_schema(const std::vector<TokenRecord>& records) const {
  std::vector<DataType> types;
  for (const auto& record : records) {
    if (record.size() > types.size())
      types.resize(record.size(), TypeId::NULL_TYPE);
    for (size_t i = 0; i < record.size(); ++i)
      types[i] = wider_type(types[i], infer_field(record[i]));
  }

  std::vector<StructField> fields;
  fields.reserve(types.size());
  for (size_t i = 0; i < types.size(); ++i) {
    DataType t = types[i].id() == TypeId::NULL_TYPE ? DataType(TypeId::STRING) : types[i];
    fields.emplace_back("_c" + std::to_string(i), t, true);
  }
  return DataType::structure(Schema(std::move(fields)));
}

SchemaOfCsvEvaluator::SchemaOfCsvEvaluator(const OptionMap& options,
                                           const std::string& session_time_zone)
    : options_(CsvOptions(options, true, session_time_zone)
                   .with_line_separator(CSVEXPR_LINE_SEP_SENTINEL)),
      parser_(options_), inference_(options_) {}

std::string SchemaOfCsvEvaluator::evaluate(std::string_view csv) const {
  ErrorCollector errors(ParseMode::PERMISSIVE);
  std::vector<TokenRecord> records = parser_.tokenize(csv, errors);
  if (records.empty()) {
    throw MalformedRecordException(std::string(csv), ParseMode::FAIL_FAST, errors.errors());
  }

  // Only the first record is sampled
  records.resize(1);
  return inference_.infer_schema(records).to_sql();
}

} // namespace csvexpr
