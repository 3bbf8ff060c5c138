#ifndef CSVEXPR_RECORD_PARSER_H
#define CSVEXPR_RECORD_PARSER_H

#include "csvexpr/error.h"
#include "csvexpr/line_parser.h"
#include "csvexpr/options.h"
#include "csvexpr/types.h"
#include "csvexpr/value.h"

#include <string_view>
#include <vector>

namespace csvexpr {

/**
 * @brief Converts tokenized records into typed rows.
 *
 * The data schema describes the token positions; the required schema is the
 * subset (by name, in any order) that ends up in each row. A record whose
 * token count differs from the data schema is padded with nulls or
 * truncated, and INCONSISTENT_FIELD_COUNT is recorded. A token that does not
 * convert becomes null and FIELD_CONVERSION is recorded.
 */
class RecordParser {
public:
  // Throws ConfigurationError when a field type cannot be decoded or the
  // required schema names a field the data schema lacks.
  RecordParser(const Schema& data_schema, const Schema& required_schema,
               const CsvOptions& options);

  // Every record of input, converted. Stops early once errors.should_stop().
  std::vector<Row> parse(std::string_view input, ErrorCollector& errors) const;

  // Converts one tokenized record into the required shape.
  Row convert(const TokenRecord& tokens, size_t record_number, ErrorCollector& errors) const;

  const Schema& data_schema() const { return data_schema_; }
  const Schema& required_schema() const { return required_schema_; }
  const CsvOptions& options() const { return line_parser_.options(); }

private:
  // Returns false when the token cannot be converted; out is then null.
  bool convert_token(const Token& token, const DataType& type, Value& out) const;

  Schema data_schema_;
  Schema required_schema_;
  std::vector<size_t> token_index_; // per required field, position in data schema
  LineParser line_parser_;
};

} // namespace csvexpr

#endif // CSVEXPR_RECORD_PARSER_H
