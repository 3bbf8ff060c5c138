#include "csvexpr/types.h"

#include "csvexpr/error.h"

#include <cctype>
#include <sstream>

namespace csvexpr {

struct TypeInfo {
  // ARRAY: children[0] is the element; MAP: children[0] key, children[1] value;
  // USER_DEFINED: children[0] is the sql type.
  std::vector<DataType> children;
  bool contains_null = true;
  Schema schema; // STRUCT only
  std::string name; // USER_DEFINED only
};

const char* type_id_to_string(TypeId id) {
  switch (id) {
  case TypeId::NULL_TYPE:
    return "VOID";
  case TypeId::BOOLEAN:
    return "BOOLEAN";
  case TypeId::TINYINT:
    return "TINYINT";
  case TypeId::SMALLINT:
    return "SMALLINT";
  case TypeId::INTEGER:
    return "INT";
  case TypeId::BIGINT:
    return "BIGINT";
  case TypeId::FLOAT:
    return "FLOAT";
  case TypeId::DOUBLE:
    return "DOUBLE";
  case TypeId::STRING:
    return "STRING";
  case TypeId::DATE:
    return "DATE";
  case TypeId::TIMESTAMP:
    return "TIMESTAMP";
  case TypeId::ARRAY:
    return "ARRAY";
  case TypeId::MAP:
    return "MAP";
  case TypeId::STRUCT:
    return "STRUCT";
  case TypeId::VARIANT:
    return "VARIANT";
  case TypeId::USER_DEFINED:
    return "USER_DEFINED";
  }
  return "UNKNOWN";
}

DataType::DataType(TypeId id) : id_(id) {
  if (id == TypeId::ARRAY || id == TypeId::MAP || id == TypeId::STRUCT ||
      id == TypeId::USER_DEFINED) {
    throw InternalError(std::string("Type ") + type_id_to_string(id) +
                        " needs its factory function");
  }
}

DataType DataType::array(const DataType& element, bool contains_null) {
  auto info = std::make_shared<TypeInfo>();
  info->children.push_back(element);
  info->contains_null = contains_null;
  return DataType(TypeId::ARRAY, std::move(info));
}

DataType DataType::map(const DataType& key, const DataType& value, bool value_contains_null) {
  auto info = std::make_shared<TypeInfo>();
  info->children.push_back(key);
  info->children.push_back(value);
  info->contains_null = value_contains_null;
  return DataType(TypeId::MAP, std::move(info));
}

DataType DataType::structure(const Schema& schema) {
  auto info = std::make_shared<TypeInfo>();
  info->schema = schema;
  return DataType(TypeId::STRUCT, std::move(info));
}

DataType DataType::user_defined(const std::string& name, const DataType& sql_type) {
  auto info = std::make_shared<TypeInfo>();
  info->name = name;
  info->children.push_back(sql_type);
  return DataType(TypeId::USER_DEFINED, std::move(info));
}

bool DataType::is_scalar() const {
  switch (id_) {
  case TypeId::ARRAY:
  case TypeId::MAP:
  case TypeId::STRUCT:
  case TypeId::VARIANT:
  case TypeId::USER_DEFINED:
    return false;
  default:
    return true;
  }
}

bool DataType::is_integral() const {
  return id_ == TypeId::TINYINT || id_ == TypeId::SMALLINT || id_ == TypeId::INTEGER ||
         id_ == TypeId::BIGINT;
}

bool DataType::is_floating() const { return id_ == TypeId::FLOAT || id_ == TypeId::DOUBLE; }

const TypeInfo& DataType::info() const {
  if (!info_) {
    throw InternalError(std::string("Type ") + type_id_to_string(id_) + " has no nested info");
  }
  return *info_;
}

const DataType& DataType::element_type() const {
  if (id_ != TypeId::ARRAY)
    throw InternalError("element_type() on " + to_sql());
  return info().children[0];
}

bool DataType::contains_null() const {
  if (id_ != TypeId::ARRAY && id_ != TypeId::MAP)
    throw InternalError("contains_null() on " + to_sql());
  return info().contains_null;
}

const DataType& DataType::key_type() const {
  if (id_ != TypeId::MAP)
    throw InternalError("key_type() on " + to_sql());
  return info().children[0];
}

const DataType& DataType::value_type() const {
  if (id_ != TypeId::MAP)
    throw InternalError("value_type() on " + to_sql());
  return info().children[1];
}

const Schema& DataType::struct_schema() const {
  if (id_ != TypeId::STRUCT)
    throw InternalError("struct_schema() on " + to_sql());
  return info().schema;
}

const std::string& DataType::user_type_name() const {
  if (id_ != TypeId::USER_DEFINED)
    throw InternalError("user_type_name() on " + to_sql());
  return info().name;
}

const DataType& DataType::sql_type() const {
  if (id_ != TypeId::USER_DEFINED)
    throw InternalError("sql_type() on " + to_sql());
  return info().children[0];
}

DataType DataType::as_nullable() const {
  switch (id_) {
  case TypeId::ARRAY:
    return array(element_type().as_nullable(), true);
  case TypeId::MAP:
    // Map keys are never null; only the key's nested types are relaxed.
    return map(key_type().as_nullable(), value_type().as_nullable(), true);
  case TypeId::STRUCT:
    return structure(struct_schema().as_nullable());
  default:
    return *this;
  }
}

std::string DataType::to_sql() const {
  switch (id_) {
  case TypeId::ARRAY:
    return "ARRAY<" + element_type().to_sql() + ">";
  case TypeId::MAP:
    return "MAP<" + key_type().to_sql() + ", " + value_type().to_sql() + ">";
  case TypeId::STRUCT:
    return struct_schema().sql();
  case TypeId::USER_DEFINED:
    return sql_type().to_sql();
  default:
    return type_id_to_string(id_);
  }
}

bool DataType::operator==(const DataType& other) const {
  if (id_ != other.id_)
    return false;
  switch (id_) {
  case TypeId::ARRAY:
  case TypeId::MAP:
    return info().children == other.info().children &&
           info().contains_null == other.info().contains_null;
  case TypeId::STRUCT:
    return struct_schema() == other.struct_schema();
  case TypeId::USER_DEFINED:
    return user_type_name() == other.user_type_name() && sql_type() == other.sql_type();
  default:
    return true;
  }
}

std::string quote_identifier_if_needed(const std::string& name) {
  bool plain = !name.empty() &&
               (std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_');
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      plain = false;
      break;
    }
  }
  if (plain)
    return name;

  std::string quoted = "`";
  for (char c : name) {
    if (c == '`')
      quoted += "``";
    else
      quoted += c;
  }
  quoted += '`';
  return quoted;
}

std::string StructField::to_sql() const {
  std::string out = quote_identifier_if_needed(name) + ": " + type.to_sql();
  if (!nullable)
    out += " NOT NULL";
  return out;
}

std::optional<size_t> Schema::index_of(const std::string& name) const {
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name == name)
      return i;
  }
  return std::nullopt;
}

Schema Schema::as_nullable() const {
  std::vector<StructField> fields;
  fields.reserve(fields_.size());
  for (const auto& f : fields_) {
    fields.emplace_back(f.name, f.type.as_nullable(), true);
  }
  return Schema(std::move(fields));
}

Schema Schema::without(const std::string& name) const {
  std::vector<StructField> fields;
  fields.reserve(fields_.size());
  for (const auto& f : fields_) {
    if (f.name != name)
      fields.push_back(f);
  }
  return Schema(std::move(fields));
}

std::string Schema::to_ddl() const {
  std::ostringstream ss;
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (i > 0)
      ss << ", ";
    ss << quote_identifier_if_needed(fields_[i].name) << " " << fields_[i].type.to_sql();
    if (!fields_[i].nullable)
      ss << " NOT NULL";
  }
  return ss.str();
}

std::string Schema::sql() const {
  std::ostringstream ss;
  ss << "STRUCT<";
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (i > 0)
      ss << ", ";
    ss << fields_[i].to_sql();
  }
  ss << ">";
  return ss.str();
}

} // namespace csvexpr
