#include "csvexpr/function_registry.h"

#include "csvexpr/csv_expressions.h"
#include "csvexpr/ddl_parser.h"

#include <algorithm>
#include <cctype>

namespace csvexpr {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void check_arity(const std::string& name, const std::vector<ExpressionPtr>& args, size_t min,
                 size_t max) {
  if (args.size() >= min && args.size() <= max)
    return;
  std::string expected = std::to_string(min) + (max > min ? " or " + std::to_string(max) : "");
  throw AnalysisException(ErrorCode::WRONG_NUM_ARGS,
                          "The " + to_sql_id(name) + " requires " + expected +
                              " parameters but the actual number is " +
                              std::to_string(args.size()) + ".",
                          {{"functionName", to_sql_id(name)},
                           {"expectedNum", expected},
                           {"actualNum", std::to_string(args.size())}});
}

Schema schema_from_expression(const ExpressionPtr& expr) {
  if (!expr->foldable() || expr->data_type().id() != TypeId::STRING) {
    throw AnalysisException(ErrorCode::INVALID_SCHEMA,
                            "The input schema " + to_sql_expr(*expr) +
                                " is not a valid schema string. The input expression must be "
                                "string literal and not null.",
                            {{"inputSchema", to_sql_expr(*expr)}});
  }
  Value ddl = expr->eval(Row());
  if (ddl.is_null()) {
    throw AnalysisException(ErrorCode::INVALID_SCHEMA,
                            "The input schema " + to_sql_expr(*expr) +
                                " is not a valid schema string. The input expression must be "
                                "string literal and not null.",
                            {{"inputSchema", to_sql_expr(*expr)}});
  }
  return parse_schema_ddl(ddl.as_string());
}

} // namespace

OptionMap options_from_expression(const ExpressionPtr& expr) {
  auto map = dynamic_cast<const MapLiteral*>(expr.get());
  if (map == nullptr || !map->foldable()) {
    throw AnalysisException(ErrorCode::INVALID_OPTIONS,
                            "Must use the `map()` function for options.",
                            {{"funcName", "map"}, {"invalidOptions", to_sql_expr(*expr)}});
  }
  DataType type = map->data_type();
  if (type.key_type().id() != TypeId::STRING || type.value_type().id() != TypeId::STRING) {
    throw AnalysisException(ErrorCode::INVALID_OPTIONS,
                            "A type of keys and values in `map()` must be string, but got " +
                                to_sql_type(type) + ".",
                            {{"mapType", to_sql_type(type)}});
  }

  OptionMap options;
  Value entries = map->eval(Row());
  const std::vector<Value>& keys = entries.map_keys();
  const std::vector<Value>& values = entries.map_values();
  for (size_t i = 0; i < keys.size(); ++i) {
    if (keys[i].is_null()) {
      throw AnalysisException(ErrorCode::INVALID_OPTIONS, "Option names must not be null.",
                              {{"mapType", to_sql_type(type)}});
    }
    // A null value leaves the option unset.
    if (!values[i].is_null())
      options.set(keys[i].as_string(), values[i].as_string());
  }
  return options;
}

FunctionRegistry::FunctionRegistry(SessionConfig session) : session_(std::move(session)) {}

bool FunctionRegistry::contains(const std::string& name) const {
  std::string key = lower(name);
  return key == "from_csv" || key == "to_csv" || key == "schema_of_csv";
}

std::vector<std::string> FunctionRegistry::function_names() const {
  return {"from_csv", "schema_of_csv", "to_csv"};
}

ExpressionPtr FunctionRegistry::create(const std::string& name,
                                       const std::vector<ExpressionPtr>& args) const {
  for (const auto& arg : args) {
    if (!arg)
      throw InternalError("Null argument passed to " + name);
  }
  std::string key = lower(name);
  if (key == "from_csv")
    return create_from_csv(args);
  if (key == "to_csv")
    return create_to_csv(args);
  if (key == "schema_of_csv")
    return create_schema_of_csv(args);
  throw AnalysisException(ErrorCode::UNRESOLVED_ROUTINE,
                          "Cannot resolve function " + to_sql_id(name) + ".",
                          {{"routineName", to_sql_id(name)}});
}

ExpressionPtr FunctionRegistry::create_from_csv(const std::vector<ExpressionPtr>& args) const {
  check_arity("from_csv", args, 2, 3);
  Schema schema = schema_from_expression(args[1]);
  OptionMap options = args.size() == 3 ? options_from_expression(args[2]) : OptionMap();
  return std::make_shared<CsvToStructs>(std::move(schema), std::move(options), args[0],
                                        std::nullopt, std::nullopt, session_);
}

ExpressionPtr FunctionRegistry::create_to_csv(const std::vector<ExpressionPtr>& args) const {
  check_arity("to_csv", args, 1, 2);
  OptionMap options = args.size() == 2 ? options_from_expression(args[1]) : OptionMap();
  return std::make_shared<StructsToCsv>(std::move(options), args[0], std::nullopt, session_);
}

ExpressionPtr FunctionRegistry::create_schema_of_csv(const std::vector<ExpressionPtr>& args) const {
  check_arity("schema_of_csv", args, 1, 2);
  OptionMap options = args.size() == 2 ? options_from_expression(args[1]) : OptionMap();
  return std::make_shared<SchemaOfCsv>(args[0], std::move(options));
}

} // namespace csvexpr
