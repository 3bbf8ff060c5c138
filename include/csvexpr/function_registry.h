#ifndef CSVEXPR_FUNCTION_REGISTRY_H
#define CSVEXPR_FUNCTION_REGISTRY_H

#include "csvexpr/expression.h"
#include "csvexpr/options.h"

#include <string>
#include <vector>

namespace csvexpr {

/**
 * @brief Builds CSV expressions from SQL-style function arguments.
 *
 *   from_csv(csv, schema[, options])
 *   to_csv(struct[, options])
 *   schema_of_csv(csv[, options])
 *
 * Names are case-insensitive. The schema argument must be a constant DDL
 * string and options a constant map(string, string). Argument problems raise
 * AnalysisException (WRONG_NUM_ARGS, INVALID_SCHEMA, INVALID_OPTIONS)
 * and unknown names raise UNRESOLVED_ROUTINE. The
 * returned expressions are unbound; pass them through bind_expression().
 */
class FunctionRegistry {
public:
  explicit FunctionRegistry(SessionConfig session = SessionConfig());

  ExpressionPtr create(const std::string& name, const std::vector<ExpressionPtr>& args) const;

  bool contains(const std::string& name) const;
  std::vector<std::string> function_names() const;

  const SessionConfig& session() const { return session_; }

private:
  ExpressionPtr create_from_csv(const std::vector<ExpressionPtr>& args) const;
  ExpressionPtr create_to_csv(const std::vector<ExpressionPtr>& args) const;
  ExpressionPtr create_schema_of_csv(const std::vector<ExpressionPtr>& args) const;

  SessionConfig session_;
};

// Evaluates a constant map(string, string) argument into options.
OptionMap options_from_expression(const ExpressionPtr& expr);

} // namespace csvexpr

#endif // CSVEXPR_FUNCTION_REGISTRY_H
