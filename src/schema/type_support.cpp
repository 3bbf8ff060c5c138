#include "csvexpr/type_support.h"

namespace csvexpr {

bool is_supported_data_type(const DataType& type) {
  switch (type.id()) {
  case TypeId::VARIANT:
    return false;
  case TypeId::ARRAY:
    return is_supported_data_type(type.element_type());
  case TypeId::MAP:
    return is_supported_data_type(type.key_type()) && is_supported_data_type(type.value_type());
  case TypeId::STRUCT:
    for (const auto& field : type.struct_schema()) {
      if (!is_supported_data_type(field.type))
        return false;
    }
    return true;
  case TypeId::USER_DEFINED:
    return is_supported_data_type(type.sql_type());
  default:
    return true;
  }
}

bool is_supported_decode_type(const DataType& type) {
  if (type.id() == TypeId::USER_DEFINED)
    return is_supported_decode_type(type.sql_type());
  return type.is_scalar();
}

DataType first_unsupported_type(const DataType& type) {
  switch (type.id()) {
  case TypeId::ARRAY:
    if (!is_supported_data_type(type.element_type()))
      return first_unsupported_type(type.element_type());
    break;
  case TypeId::MAP:
    if (!is_supported_data_type(type.key_type()))
      return first_unsupported_type(type.key_type());
    if (!is_supported_data_type(type.value_type()))
      return first_unsupported_type(type.value_type());
    break;
  case TypeId::STRUCT:
    for (const auto& field : type.struct_schema()) {
      if (!is_supported_data_type(field.type))
        return first_unsupported_type(field.type);
    }
    break;
  case TypeId::USER_DEFINED:
    if (!is_supported_data_type(type.sql_type()))
      return first_unsupported_type(type.sql_type());
    break;
  default:
    break;
  }
  return type;
}

} // namespace csvexpr
