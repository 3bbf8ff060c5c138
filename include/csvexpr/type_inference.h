#ifndef CSVEXPR_TYPE_INFERENCE_H
#define CSVEXPR_TYPE_INFERENCE_H

#include "csvexpr/line_parser.h"
#include "csvexpr/options.h"
#include "csvexpr/types.h"

#include <string>
#include <string_view>
#include <vector>

namespace csvexpr {

// Infers SQL types from CSV tokens.
class TypeInference {
public:
  explicit TypeInference(const CsvOptions& options);

  // NULL_TYPE for empty or null tokens; otherwise the narrowest of INT,
  // BIGINT, DOUBLE, DATE (when preferDate), TIMESTAMP, BOOLEAN, STRING.
  DataType infer_field(const Token& token) const;

  // Least type holding both. NULL widens to anything; INT < BIGINT < DOUBLE;
  // DATE and TIMESTAMP widen to TIMESTAMP; other mixes become STRING.
  static DataType wider_type(const DataType& a, const DataType& b);

  // STRUCT type with columns _c0, _c1, ... for the given records, widening
  // column types across records.
  DataType infer_schema(const std::vector<TokenRecord>& records) const;

private:
  bool is_null_token(const Token& token) const;

  CsvOptions options_;
};

// Evaluator behind schema_of_csv: text in, STRUCT<...> DDL out.
class SchemaOfCsvEvaluator {
public:
  SchemaOfCsvEvaluator(const OptionMap& options, const std::string& session_time_zone);

  // Throws MalformedRecordException if the text holds no record.
  std::string evaluate(std::string_view csv) const;

  const CsvOptions& options() const { return options_; }

private:
  CsvOptions options_;
  LineParser parser_;
  TypeInference inference_;
};

} // namespace csvexpr

#endif // CSVEXPR_TYPE_INFERENCE_H
