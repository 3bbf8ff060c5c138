#include "csvexpr/expression.h"

namespace csvexpr {

std::string to_sql_type(const DataType& type) { return "\"" + type.to_sql() + "\""; }

std::string to_sql_expr(const Expression& expr) { return "\"" + expr.to_sql() + "\""; }

std::string to_sql_id(const std::string& name) { return "`" + name + "`"; }

std::string to_sql_string_literal(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'' || c == '\\')
      out += '\\';
    out += c;
  }
  out += '\'';
  return out;
}

// ============================================================================
// UnaryExpression
// ============================================================================

UnaryExpression::UnaryExpression(ExpressionPtr child) : child_(std::move(child)) {
  if (!child_)
    throw InternalError("Unary expression built without a child");
}

// ============================================================================
// Literal
// ============================================================================

ExpressionPtr Literal::string(const std::string& s) {
  return std::make_shared<Literal>(Value::string(s), DataType(TypeId::STRING));
}

ExpressionPtr Literal::null(const DataType& type) {
  return std::make_shared<Literal>(Value::null(), type);
}

ExpressionPtr Literal::integer(int64_t v) {
  return std::make_shared<Literal>(Value::integer(v), DataType(TypeId::INTEGER));
}

std::string Literal::to_sql() const {
  switch (value_.kind()) {
  case Value::Kind::NULL_VALUE:
    return "NULL";
  case Value::Kind::STRING:
    return to_sql_string_literal(value_.as_string());
  case Value::Kind::BOOLEAN:
    return value_.as_bool() ? "true" : "false";
  default:
    return value_.to_string();
  }
}

ExpressionPtr Literal::with_new_children(std::vector<ExpressionPtr> children) const {
  if (!children.empty())
    throw InternalError("Literal has no children");
  return clone();
}

CompiledEval Literal::compile() const {
  Value value = value_;
  return [value](const Row&) { return value; };
}

// ============================================================================
// BoundReference
// ============================================================================

Value BoundReference::eval(const Row& input) const {
  if (ordinal_ >= input.size()) {
    throw InternalError("Input row has " + std::to_string(input.size()) +
                        " values, reference needs position " + std::to_string(ordinal_));
  }
  return input[ordinal_];
}

std::string BoundReference::to_sql() const { return "input[" + std::to_string(ordinal_) + "]"; }

ExpressionPtr BoundReference::with_new_children(std::vector<ExpressionPtr> children) const {
  if (!children.empty())
    throw InternalError("BoundReference has no children");
  return clone();
}

CompiledEval BoundReference::compile() const {
  size_t ordinal = ordinal_;
  return [ordinal](const Row& input) {
    if (ordinal >= input.size())
      throw InternalError("Input row too short for position " + std::to_string(ordinal));
    return input[ordinal];
  };
}

// ============================================================================
// MapLiteral
// ============================================================================

MapLiteral::MapLiteral(std::vector<ExpressionPtr> keys, std::vector<ExpressionPtr> values)
    : keys_(std::move(keys)), values_(std::move(values)) {
  if (keys_.size() != values_.size())
    throw InternalError("map() needs as many keys as values");
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (!keys_[i] || !values_[i])
      throw InternalError("map() built with a null child");
  }
}

ExpressionPtr
MapLiteral::from_options(const std::vector<std::pair<std::string, std::string>>& kv) {
  std::vector<ExpressionPtr> keys;
  std::vector<ExpressionPtr> values;
  for (const auto& entry : kv) {
    keys.push_back(Literal::string(entry.first));
    values.push_back(Literal::string(entry.second));
  }
  return std::make_shared<MapLiteral>(std::move(keys), std::move(values));
}

DataType MapLiteral::data_type() const {
  if (keys_.empty())
    return DataType::map(TypeId::STRING, TypeId::STRING);
  return DataType::map(keys_.front()->data_type(), values_.front()->data_type());
}

bool MapLiteral::foldable() const {
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (!keys_[i]->foldable() || !values_[i]->foldable())
      return false;
  }
  return true;
}

Value MapLiteral::eval(const Row& input) const {
  std::vector<Value> keys;
  std::vector<Value> values;
  keys.reserve(keys_.size());
  values.reserve(values_.size());
  for (size_t i = 0; i < keys_.size(); ++i) {
    keys.push_back(keys_[i]->eval(input));
    values.push_back(values_[i]->eval(input));
  }
  return Value::map(std::move(keys), std::move(values));
}

std::string MapLiteral::to_sql() const {
  std::string out = "map(";
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += keys_[i]->to_sql() + ", " + values_[i]->to_sql();
  }
  return out + ")";
}

std::vector<ExpressionPtr> MapLiteral::children() const {
  std::vector<ExpressionPtr> out;
  out.reserve(keys_.size() * 2);
  for (size_t i = 0; i < keys_.size(); ++i) {
    out.push_back(keys_[i]);
    out.push_back(values_[i]);
  }
  return out;
}

ExpressionPtr MapLiteral::with_new_children(std::vector<ExpressionPtr> children) const {
  if (children.size() != keys_.size() * 2)
    throw InternalError("map() child count mismatch");
  std::vector<ExpressionPtr> keys;
  std::vector<ExpressionPtr> values;
  for (size_t i = 0; i < children.size(); i += 2) {
    keys.push_back(children[i]);
    values.push_back(children[i + 1]);
  }
  return std::make_shared<MapLiteral>(std::move(keys), std::move(values));
}

TypeCheckResult MapLiteral::check_input_data_types() const {
  for (size_t i = 1; i < keys_.size(); ++i) {
    if (keys_[i]->data_type() != keys_[0]->data_type()) {
      return TypeCheckResult::failure(
          ErrorCode::UNEXPECTED_INPUT_TYPE, "map() keys must all have the same type",
          {{"functionName", to_sql_id("map")}, {"dataType", to_sql_type(keys_[i]->data_type())}});
    }
    if (values_[i]->data_type() != values_[0]->data_type()) {
      return TypeCheckResult::failure(ErrorCode::UNEXPECTED_INPUT_TYPE,
                                      "map() values must all have the same type",
                                      {{"functionName", to_sql_id("map")},
                                       {"dataType", to_sql_type(values_[i]->data_type())}});
    }
  }
  return TypeCheckResult::ok();
}

// ============================================================================
// Binding
// ============================================================================

ExpressionPtr bind_expression(const ExpressionPtr& expr, const SessionConfig& session) {
  if (!expr)
    throw InternalError("Cannot bind a null expression");

  ExpressionPtr node = expr;

  std::vector<ExpressionPtr> children = node->children();
  if (!children.empty()) {
    bool changed = false;
    std::vector<ExpressionPtr> bound;
    bound.reserve(children.size());
    for (const auto& child : children) {
      bound.push_back(bind_expression(child, session));
      changed = changed || bound.back() != child;
    }
    if (changed)
      node = node->with_new_children(std::move(bound));
  }

  if (auto zone_aware = dynamic_cast<const TimeZoneAware*>(node.get())) {
    if (!zone_aware->time_zone_id())
      node = zone_aware->with_time_zone(session.session_time_zone);
  }

  if (auto checked = dynamic_cast<const TypeChecked*>(node.get())) {
    TypeCheckResult result = checked->check_input_data_types();
    if (result.is_failure()) {
      throw AnalysisException(result.sub_class,
                              "Cannot resolve " + to_sql_expr(*node) +
                                  " due to data type mismatch: " + result.message,
                              result.parameters);
    }
  }

  node->prepare();
  return node;
}

CompiledEval compile_or_interpret(const ExpressionPtr& expr) {
  if (auto generable = dynamic_cast<const CodeGenerable*>(expr.get()))
    return generable->compile();
  return [expr](const Row& input) { return expr->eval(input); };
}

} // namespace csvexpr
