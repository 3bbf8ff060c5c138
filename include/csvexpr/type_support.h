#ifndef CSVEXPR_TYPE_SUPPORT_H
#define CSVEXPR_TYPE_SUPPORT_H

#include "csvexpr/types.h"

namespace csvexpr {

// True if values of this type can be rendered as CSV text. Scalars are
// supported, nested types when all their children are, user-defined types
// when their SQL type is. VARIANT is never supported, at any depth.
bool is_supported_data_type(const DataType& type);

// True if a single CSV token can be converted to this type: scalars and
// user-defined types over scalars. Nested types and VARIANT are not.
bool is_supported_decode_type(const DataType& type);

// First field type (depth first) that fails is_supported_data_type, or the
// type itself. Used to name the culprit in error messages.
DataType first_unsupported_type(const DataType& type);

} // namespace csvexpr

#endif // CSVEXPR_TYPE_SUPPORT_H
