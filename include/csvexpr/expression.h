/**
 * @file expression.h
 * @brief Minimal expression tree the CSV functions plug into.
 *
 * Nodes are immutable once built and shared through ExpressionPtr. Binding
 * (bind_expression()) returns a new tree with session settings injected and
 * every type check run; only bound trees are evaluated.
 */

#ifndef CSVEXPR_EXPRESSION_H
#define CSVEXPR_EXPRESSION_H

#include "csvexpr/error.h"
#include "csvexpr/options.h"
#include "csvexpr/types.h"
#include "csvexpr/value.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace csvexpr {

class Expression;
using ExpressionPtr = std::shared_ptr<const Expression>;

// Closure equivalent to Expression::eval, produced once per node.
using CompiledEval = std::function<Value(const Row&)>;

struct TypeCheckResult {
  bool success = true;
  ErrorCode sub_class = ErrorCode::NONE;
  std::string message;
  AnalysisException::Parameters parameters;

  static TypeCheckResult ok() { return TypeCheckResult(); }
  static TypeCheckResult failure(ErrorCode sub_class, std::string message,
                                 AnalysisException::Parameters parameters = {}) {
    TypeCheckResult result;
    result.success = false;
    result.sub_class = sub_class;
    result.message = std::move(message);
    result.parameters = std::move(parameters);
    return result;
  }

  bool is_success() const { return success; }
  bool is_failure() const { return !success; }
};

class Expression {
public:
  virtual ~Expression() = default;

  virtual DataType data_type() const = 0;
  virtual bool nullable() const = 0;
  // Constant for every input row.
  virtual bool foldable() const { return false; }

  virtual Value eval(const Row& input) const = 0;

  virtual std::string pretty_name() const = 0;
  virtual std::string to_sql() const = 0;

  virtual std::vector<ExpressionPtr> children() const { return {}; }
  // Copy with the given children, same arity as children().
  virtual ExpressionPtr with_new_children(std::vector<ExpressionPtr> children) const = 0;

  // Copy of bind-time state. Lazily built resources are not shared.
  virtual ExpressionPtr clone() const = 0;

  // Builds lazily initialized resources now, surfacing configuration errors
  // at bind time rather than on the first row.
  virtual void prepare() const {}
};

// Capability interfaces, mixed into concrete nodes.

class TypeChecked {
public:
  virtual ~TypeChecked() = default;
  virtual TypeCheckResult check_input_data_types() const = 0;
};

class TimeZoneAware {
public:
  virtual ~TimeZoneAware() = default;
  virtual const std::optional<std::string>& time_zone_id() const = 0;
  virtual ExpressionPtr with_time_zone(const std::string& time_zone_id) const = 0;
};

class SchemaBound {
public:
  virtual ~SchemaBound() = default;
  virtual const Schema& schema() const = 0;
};

class CodeGenerable {
public:
  virtual ~CodeGenerable() = default;
  virtual CompiledEval compile() const = 0;
};

class UnaryExpression : public Expression {
public:
  explicit UnaryExpression(ExpressionPtr child);

  const ExpressionPtr& child() const { return child_; }
  std::vector<ExpressionPtr> children() const override { return {child_}; }

protected:
  ExpressionPtr child_;
};

// A constant.
class Literal : public Expression, public CodeGenerable {
public:
  Literal(Value value, DataType type) : value_(std::move(value)), type_(std::move(type)) {}

  static ExpressionPtr string(const std::string& s);
  static ExpressionPtr null(const DataType& type = DataType(TypeId::STRING));
  static ExpressionPtr integer(int64_t v);

  DataType data_type() const override { return type_; }
  bool nullable() const override { return value_.is_null(); }
  bool foldable() const override { return true; }
  Value eval(const Row&) const override { return value_; }
  std::string pretty_name() const override { return "literal"; }
  std::string to_sql() const override;
  ExpressionPtr with_new_children(std::vector<ExpressionPtr> children) const override;
  ExpressionPtr clone() const override { return std::make_shared<Literal>(value_, type_); }
  CompiledEval compile() const override;

  const Value& value() const { return value_; }

private:
  Value value_;
  DataType type_;
};

// Reads one position of the input row.
class BoundReference : public Expression, public CodeGenerable {
public:
  BoundReference(size_t ordinal, DataType type, bool nullable = true)
      : ordinal_(ordinal), type_(std::move(type)), nullable_(nullable) {}

  DataType data_type() const override { return type_; }
  bool nullable() const override { return nullable_; }
  Value eval(const Row& input) const override;
  std::string pretty_name() const override { return "boundreference"; }
  std::string to_sql() const override;
  ExpressionPtr with_new_children(std::vector<ExpressionPtr> children) const override;
  ExpressionPtr clone() const override {
    return std::make_shared<BoundReference>(ordinal_, type_, nullable_);
  }
  CompiledEval compile() const override;

  size_t ordinal() const { return ordinal_; }

private:
  size_t ordinal_;
  DataType type_;
  bool nullable_;
};

// map(k1, v1, k2, v2, ...): used for the options argument.
class MapLiteral : public Expression, public TypeChecked {
public:
  MapLiteral(std::vector<ExpressionPtr> keys, std::vector<ExpressionPtr> values);

  // Convenience: string keys and values.
  static ExpressionPtr from_options(const std::vector<std::pair<std::string, std::string>>& kv);

  DataType data_type() const override;
  bool nullable() const override { return false; }
  bool foldable() const override;
  Value eval(const Row& input) const override;
  std::string pretty_name() const override { return "map"; }
  std::string to_sql() const override;
  std::vector<ExpressionPtr> children() const override;
  ExpressionPtr with_new_children(std::vector<ExpressionPtr> children) const override;
  ExpressionPtr clone() const override { return std::make_shared<MapLiteral>(keys_, values_); }
  TypeCheckResult check_input_data_types() const override;

  const std::vector<ExpressionPtr>& keys() const { return keys_; }
  const std::vector<ExpressionPtr>& values() const { return values_; }

private:
  std::vector<ExpressionPtr> keys_;
  std::vector<ExpressionPtr> values_;
};

// Returns the bound form of expr: children bound first, the session time
// zone injected into TimeZoneAware nodes that lack one, type checks run and
// resources prepared. Throws AnalysisException on a failed check.
// Not called bind: unqualified calls on a shared_ptr would find std::bind.
ExpressionPtr bind_expression(const ExpressionPtr& expr, const SessionConfig& session);

// Evaluates through compile() when the node supports it, eval otherwise.
CompiledEval compile_or_interpret(const ExpressionPtr& expr);

// Quoting used in analysis messages: "STRING", "expr", `name`.
std::string to_sql_type(const DataType& type);
std::string to_sql_expr(const Expression& expr);
std::string to_sql_id(const std::string& name);
std::string to_sql_string_literal(const std::string& s);

} // namespace csvexpr

#endif // CSVEXPR_EXPRESSION_H
