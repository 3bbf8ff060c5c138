#ifndef CSVEXPR_DDL_PARSER_H
#define CSVEXPR_DDL_PARSER_H

#include "csvexpr/types.h"

#include <string_view>

namespace csvexpr {

// Parses "a INT, b STRING NOT NULL" or "STRUCT<a: INT, b: STRING>".
// Type names are case-insensitive and accept the usual aliases (LONG,
// INTEGER, SHORT, BYTE, REAL, VARCHAR(n), ...). Identifiers may be
// backtick-quoted. Throws ConfigurationError(INVALID_SCHEMA).
Schema parse_schema_ddl(std::string_view ddl);

// Parses a single type such as "ARRAY<MAP<STRING, INT>>".
DataType parse_data_type(std::string_view text);

} // namespace csvexpr

#endif // CSVEXPR_DDL_PARSER_H
