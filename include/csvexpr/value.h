#ifndef CSVEXPR_VALUE_H
#define CSVEXPR_VALUE_H

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace csvexpr {

/**
 * @brief A single SQL value.
 *
 * Integral types of every width share the INTEGER kind and FLOAT/DOUBLE share
 * FLOATING; the schema the value belongs to tells the width. Dates are days
 * since the epoch, timestamps are microseconds since the epoch (UTC).
 */
class Value {
public:
  enum class Kind { NULL_VALUE, BOOLEAN, INTEGER, FLOATING, STRING, DATE, TIMESTAMP, ARRAY, MAP, STRUCT };

  Value() : kind_(Kind::NULL_VALUE) {}

  static Value null() { return Value(); }
  static Value boolean(bool v);
  static Value integer(int64_t v);
  static Value floating(double v);
  static Value string(std::string v);
  static Value date(int32_t days);
  static Value timestamp(int64_t micros);
  static Value array(std::vector<Value> elements);
  // keys and values are parallel and must have the same length.
  static Value map(std::vector<Value> keys, std::vector<Value> values);
  static Value structure(std::vector<Value> fields);

  Kind kind() const { return kind_; }
  bool is_null() const { return kind_ == Kind::NULL_VALUE; }

  // Typed getters; throw InternalError on the wrong kind.
  bool as_bool() const;
  int64_t as_int() const;
  double as_double() const;
  const std::string& as_string() const;
  int32_t as_date() const;
  int64_t as_timestamp() const;
  const std::vector<Value>& elements() const; // ARRAY elements, STRUCT fields or MAP values
  const std::vector<Value>& map_keys() const;
  const std::vector<Value>& map_values() const { return elements(); }
  const std::vector<Value>& fields() const { return elements(); }

  // Debug rendering: 'text', 1, 2.5, [1, 2], {k -> v}, {1, x}, NULL.
  std::string to_string() const;

  // Structural equality; NaN compares equal to NaN.
  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

private:
  explicit Value(Kind kind) : kind_(kind) {}

  const char* kind_name() const;

  Kind kind_;
  bool bool_ = false;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::string string_;
  std::vector<Value> children_;
  std::vector<Value> keys_;
};

// One record, positionally aligned to a schema.
using Row = std::vector<Value>;

std::string row_to_string(const Row& row);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace csvexpr

#endif // CSVEXPR_VALUE_H
