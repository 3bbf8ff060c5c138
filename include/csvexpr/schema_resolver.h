#ifndef CSVEXPR_SCHEMA_RESOLVER_H
#define CSVEXPR_SCHEMA_RESOLVER_H

#include "csvexpr/types.h"

#include <optional>
#include <string>

namespace csvexpr {

// Schemas derived from a declared schema, fixed at bind time.
struct ResolvedSchema {
  Schema nullable_schema;        // declared, every field nullable
  Schema actual_schema;          // nullable_schema without the corrupt field
  Schema required_schema;        // requested projection, nullable
  Schema actual_required_schema; // required_schema without the corrupt field
  std::optional<size_t> corrupt_field_index; // position in required_schema
  std::string column_name_of_corrupt_record;

  bool operator==(const ResolvedSchema& other) const {
    return nullable_schema == other.nullable_schema && actual_schema == other.actual_schema &&
           required_schema == other.required_schema &&
           actual_required_schema == other.actual_required_schema &&
           corrupt_field_index == other.corrupt_field_index &&
           column_name_of_corrupt_record == other.column_name_of_corrupt_record;
  }
};

class SchemaResolver {
public:
  // Throws ConfigurationError(INVALID_CORRUPT_RECORD_COLUMN) when the corrupt
  // field is not a nullable STRING, or when corrupt_name_explicit is set and
  // the schema has no such field. Throws ConfigurationError(INVALID_SCHEMA)
  // when required names a field the declared schema lacks.
  static ResolvedSchema resolve(const Schema& declared, const std::string& corrupt_name,
                                bool corrupt_name_explicit = false,
                                const std::optional<Schema>& required = std::nullopt);

  static void verify_column_name_of_corrupt_record(const Schema& schema,
                                                   const std::string& corrupt_name,
                                                   bool corrupt_name_explicit);

  // Rejects field types the text parser cannot produce, naming the first one.
  // Throws ConfigurationError(UNSUPPORTED_DATA_TYPE).
  static void verify_decodable_schema(const Schema& schema,
                                      const std::string& corrupt_name = std::string());
};

} // namespace csvexpr

#endif // CSVEXPR_SCHEMA_RESOLVER_H
