#include "csvexpr/schema_resolver.h"

#include "csvexpr/error.h"
#include "csvexpr/type_support.h"

namespace csvexpr {

void SchemaResolver::verify_column_name_of_corrupt_record(const Schema& schema,
                                                          const std::string& corrupt_name,
                                                          bool corrupt_name_explicit) {
  auto index = schema.index_of(corrupt_name);
  if (!index) {
    if (corrupt_name_explicit) {
      throw ConfigurationError(ErrorCode::INVALID_CORRUPT_RECORD_COLUMN,
                               "The field for corrupt records '" + corrupt_name +
                                   "' is not in the schema " + schema.sql());
    }
    return;
  }

  const StructField& field = schema.field(*index);
  if (field.type.id() != TypeId::STRING) {
    throw ConfigurationError(ErrorCode::INVALID_CORRUPT_RECORD_COLUMN,
                             "The field for corrupt records must be string type and nullable, "
                             "but '" + corrupt_name + "' is " + field.to_sql());
  }
}

void SchemaResolver::verify_decodable_schema(const Schema& schema,
                                             const std::string& corrupt_name) {
  for (const auto& field : schema) {
    if (field.name == corrupt_name)
      continue;
    if (!is_supported_decode_type(field.type)) {
      throw ConfigurationError(ErrorCode::UNSUPPORTED_DATA_TYPE,
                               "CSV data source does not support " + field.type.to_sql() +
                                   " data type (field '" + field.name + "')");
    }
  }
}

ResolvedSchema SchemaResolver::resolve(const Schema& declared, const std::string& corrupt_name,
                                       bool corrupt_name_explicit,
                                       const std::optional<Schema>& required) {
  ResolvedSchema resolved;
  resolved.column_name_of_corrupt_record = corrupt_name;
  resolved.nullable_schema = declared.as_nullable();
  // NOT NULL on the corrupt field is lifted along with every other field
  verify_column_name_of_corrupt_record(resolved.nullable_schema, corrupt_name,
                                       corrupt_name_explicit);
  resolved.actual_schema = resolved.nullable_schema.without(corrupt_name);

  if (required) {
    for (const auto& field : *required) {
      if (!declared.contains(field.name)) {
        throw ConfigurationError(ErrorCode::INVALID_SCHEMA,
                                 "Required field '" + field.name + "' is not in the schema " +
                                     declared.sql());
      }
    }
    resolved.required_schema = required->as_nullable();
  } else {
    resolved.required_schema = resolved.nullable_schema;
  }

  resolved.actual_required_schema = resolved.required_schema.without(corrupt_name);
  resolved.corrupt_field_index = resolved.required_schema.index_of(corrupt_name);
  return resolved;
}

} // namespace csvexpr
