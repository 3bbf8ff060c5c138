#include "csvexpr/value.h"

#include "csvexpr/error.h"

#include <cmath>
#include <ostream>
#include <sstream>

namespace csvexpr {

Value Value::boolean(bool v) {
  Value out(Kind::BOOLEAN);
  out.bool_ = v;
  return out;
}

Value Value::integer(int64_t v) {
  Value out(Kind::INTEGER);
  out.int_ = v;
  return out;
}

Value Value::floating(double v) {
  Value out(Kind::FLOATING);
  out.double_ = v;
  return out;
}

Value Value::string(std::string v) {
  Value out(Kind::STRING);
  out.string_ = std::move(v);
  return out;
}

Value Value::date(int32_t days) {
  Value out(Kind::DATE);
  out.int_ = days;
  return out;
}

Value Value::timestamp(int64_t micros) {
  Value out(Kind::TIMESTAMP);
  out.int_ = micros;
  return out;
}

Value Value::array(std::vector<Value> elements) {
  Value out(Kind::ARRAY);
  out.children_ = std::move(elements);
  return out;
}

Value Value::map(std::vector<Value> keys, std::vector<Value> values) {
  if (keys.size() != values.size()) {
    throw InternalError("Map keys and values differ in length");
  }
  Value out(Kind::MAP);
  out.keys_ = std::move(keys);
  out.children_ = std::move(values);
  return out;
}

Value Value::structure(std::vector<Value> fields) {
  Value out(Kind::STRUCT);
  out.children_ = std::move(fields);
  return out;
}

const char* Value::kind_name() const {
  switch (kind_) {
  case Kind::NULL_VALUE:
    return "NULL";
  case Kind::BOOLEAN:
    return "BOOLEAN";
  case Kind::INTEGER:
    return "INTEGER";
  case Kind::FLOATING:
    return "FLOATING";
  case Kind::STRING:
    return "STRING";
  case Kind::DATE:
    return "DATE";
  case Kind::TIMESTAMP:
    return "TIMESTAMP";
  case Kind::ARRAY:
    return "ARRAY";
  case Kind::MAP:
    return "MAP";
  case Kind::STRUCT:
    return "STRUCT";
  }
  return "UNKNOWN";
}

#define CSVEXPR_CHECK_KIND(expected, getter)                                                     \
  if (kind_ != (expected))                                                                       \
  throw InternalError(std::string(getter "() called on a ") + kind_name() + " value")

bool Value::as_bool() const {
  CSVEXPR_CHECK_KIND(Kind::BOOLEAN, "as_bool");
  return bool_;
}

int64_t Value::as_int() const {
  CSVEXPR_CHECK_KIND(Kind::INTEGER, "as_int");
  return int_;
}

double Value::as_double() const {
  CSVEXPR_CHECK_KIND(Kind::FLOATING, "as_double");
  return double_;
}

const std::string& Value::as_string() const {
  CSVEXPR_CHECK_KIND(Kind::STRING, "as_string");
  return string_;
}

int32_t Value::as_date() const {
  CSVEXPR_CHECK_KIND(Kind::DATE, "as_date");
  return static_cast<int32_t>(int_);
}

int64_t Value::as_timestamp() const {
  CSVEXPR_CHECK_KIND(Kind::TIMESTAMP, "as_timestamp");
  return int_;
}

const std::vector<Value>& Value::elements() const {
  if (kind_ != Kind::ARRAY && kind_ != Kind::MAP && kind_ != Kind::STRUCT)
    throw InternalError(std::string("elements() called on a ") + kind_name() + " value");
  return children_;
}

const std::vector<Value>& Value::map_keys() const {
  CSVEXPR_CHECK_KIND(Kind::MAP, "map_keys");
  return keys_;
}

#undef CSVEXPR_CHECK_KIND

std::string Value::to_string() const {
  std::ostringstream ss;
  switch (kind_) {
  case Kind::NULL_VALUE:
    return "NULL";
  case Kind::BOOLEAN:
    return bool_ ? "true" : "false";
  case Kind::INTEGER:
    return std::to_string(int_);
  case Kind::FLOATING:
    ss.precision(17);
    ss << double_;
    return ss.str();
  case Kind::STRING:
    return "'" + string_ + "'";
  case Kind::DATE:
    return "DATE(" + std::to_string(int_) + ")";
  case Kind::TIMESTAMP:
    return "TIMESTAMP(" + std::to_string(int_) + ")";
  case Kind::ARRAY:
    ss << "[";
    for (size_t i = 0; i < children_.size(); ++i) {
      if (i > 0)
        ss << ", ";
      ss << children_[i].to_string();
    }
    ss << "]";
    return ss.str();
  case Kind::MAP:
    ss << "{";
    for (size_t i = 0; i < children_.size(); ++i) {
      if (i > 0)
        ss << ", ";
      ss << keys_[i].to_string() << " -> " << children_[i].to_string();
    }
    ss << "}";
    return ss.str();
  case Kind::STRUCT:
    ss << "{";
    for (size_t i = 0; i < children_.size(); ++i) {
      if (i > 0)
        ss << ", ";
      ss << children_[i].to_string();
    }
    ss << "}";
    return ss.str();
  }
  return "?";
}

bool Value::operator==(const Value& other) const {
  if (kind_ != other.kind_)
    return false;
  switch (kind_) {
  case Kind::NULL_VALUE:
    return true;
  case Kind::BOOLEAN:
    return bool_ == other.bool_;
  case Kind::INTEGER:
  case Kind::DATE:
  case Kind::TIMESTAMP:
    return int_ == other.int_;
  case Kind::FLOATING:
    if (std::isnan(double_) && std::isnan(other.double_))
      return true;
    return double_ == other.double_;
  case Kind::STRING:
    return string_ == other.string_;
  case Kind::ARRAY:
  case Kind::STRUCT:
    return children_ == other.children_;
  case Kind::MAP:
    return keys_ == other.keys_ && children_ == other.children_;
  }
  return false;
}

std::string row_to_string(const Row& row) {
  std::string out = "(";
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += row[i].to_string();
  }
  out += ")";
  return out;
}

std::ostream& operator<<(std::ostream& os, const Value& value) { return os << value.to_string(); }

} // namespace csvexpr
