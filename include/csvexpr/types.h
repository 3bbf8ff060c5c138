/**
 * @file types.h
 * @brief Data types, struct fields and schemas.
 *
 * DataType is a small value type. Scalar types carry only their TypeId; nested
 * and user-defined types share an immutable payload, so copies are cheap and
 * a schema can be passed around by value.
 */

#ifndef CSVEXPR_TYPES_H
#define CSVEXPR_TYPES_H

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace csvexpr {

enum class TypeId {
  NULL_TYPE,
  BOOLEAN,
  TINYINT,
  SMALLINT,
  INTEGER,
  BIGINT,
  FLOAT,
  DOUBLE,
  STRING,
  DATE,
  TIMESTAMP,
  ARRAY,
  MAP,
  STRUCT,
  VARIANT,
  USER_DEFINED
};

const char* type_id_to_string(TypeId id);

class Schema;
struct TypeInfo;

class DataType {
public:
  DataType() : id_(TypeId::NULL_TYPE) {}
  DataType(TypeId id); // NOLINT: scalar types convert implicitly

  static DataType array(const DataType& element, bool contains_null = true);
  static DataType map(const DataType& key, const DataType& value, bool value_contains_null = true);
  static DataType structure(const Schema& schema);
  // A user-defined type stored as its SQL (physical) type.
  static DataType user_defined(const std::string& name, const DataType& sql_type);

  TypeId id() const { return id_; }

  bool is_scalar() const;
  bool is_integral() const;
  bool is_floating() const;
  bool is_nested() const {
    return id_ == TypeId::ARRAY || id_ == TypeId::MAP || id_ == TypeId::STRUCT;
  }

  // Accessors for nested and user-defined types; throw InternalError when
  // called on the wrong kind.
  const DataType& element_type() const;
  bool contains_null() const;
  const DataType& key_type() const;
  const DataType& value_type() const;
  const Schema& struct_schema() const;
  const std::string& user_type_name() const;
  const DataType& sql_type() const;

  // Same type with every nested nullability flag forced true.
  DataType as_nullable() const;

  // SQL rendering, e.g. INT, ARRAY<STRING>, STRUCT<a: INT, b: STRING>.
  std::string to_sql() const;

  bool operator==(const DataType& other) const;
  bool operator!=(const DataType& other) const { return !(*this == other); }

private:
  DataType(TypeId id, std::shared_ptr<const TypeInfo> info) : id_(id), info_(std::move(info)) {}

  const TypeInfo& info() const;

  TypeId id_;
  std::shared_ptr<const TypeInfo> info_;
};

struct StructField {
  std::string name;
  DataType type;
  bool nullable = true;

  StructField() = default;
  StructField(std::string n, DataType t, bool is_nullable = true)
      : name(std::move(n)), type(std::move(t)), nullable(is_nullable) {}

  // `name` INT NOT NULL style rendering used inside STRUCT<...>.
  std::string to_sql() const;

  bool operator==(const StructField& other) const {
    return name == other.name && type == other.type && nullable == other.nullable;
  }
  bool operator!=(const StructField& other) const { return !(*this == other); }
};

class Schema {
public:
  Schema() = default;
  explicit Schema(std::vector<StructField> fields) : fields_(std::move(fields)) {}

  const std::vector<StructField>& fields() const { return fields_; }
  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }
  const StructField& field(size_t i) const { return fields_.at(i); }

  // Exact, case-sensitive name lookup.
  std::optional<size_t> index_of(const std::string& name) const;
  bool contains(const std::string& name) const { return index_of(name).has_value(); }

  Schema as_nullable() const;
  // Copy without the named field; unchanged if absent.
  Schema without(const std::string& name) const;

  // Comma separated "a INT, b STRING" form accepted by parse_schema_ddl.
  std::string to_ddl() const;
  // STRUCT<a: INT, b: STRING>
  std::string sql() const;

  std::vector<StructField>::const_iterator begin() const { return fields_.begin(); }
  std::vector<StructField>::const_iterator end() const { return fields_.end(); }

  bool operator==(const Schema& other) const { return fields_ == other.fields_; }
  bool operator!=(const Schema& other) const { return !(*this == other); }

private:
  std::vector<StructField> fields_;
};

// Backtick-quotes an identifier unless it is a plain [A-Za-z_][A-Za-z0-9_]*.
std::string quote_identifier_if_needed(const std::string& name);

} // namespace csvexpr

#endif // CSVEXPR_TYPES_H
