#include "csvexpr/ddl_parser.h"
#include "csvexpr/type_support.h"

#include <gtest/gtest.h>

using namespace csvexpr;

TEST(TypeSupportTest, ScalarsAreSupported) {
  for (const char* type : {"BOOLEAN", "TINYINT", "SMALLINT", "INT", "BIGINT", "FLOAT", "DOUBLE",
                           "STRING", "DATE", "TIMESTAMP", "VOID"}) {
    DataType t = parse_data_type(type);
    EXPECT_TRUE(is_supported_data_type(t)) << type;
    EXPECT_TRUE(is_supported_decode_type(t)) << type;
  }
}

TEST(TypeSupportTest, NestedTypesEncodeButDoNotDecode) {
  for (const char* type : {"ARRAY<INT>", "MAP<STRING, DOUBLE>", "STRUCT<a: INT, b: ARRAY<DATE>>"}) {
    DataType t = parse_data_type(type);
    EXPECT_TRUE(is_supported_data_type(t)) << type;
    EXPECT_FALSE(is_supported_decode_type(t)) << type;
  }
}

TEST(TypeSupportTest, VariantIsNeverSupported) {
  for (const char* type : {"VARIANT", "ARRAY<VARIANT>", "MAP<STRING, VARIANT>",
                           "STRUCT<a: INT, b: STRUCT<c: VARIANT>>"}) {
    DataType t = parse_data_type(type);
    EXPECT_FALSE(is_supported_data_type(t)) << type;
    EXPECT_FALSE(is_supported_decode_type(t)) << type;
  }
}

TEST(TypeSupportTest, UserDefinedTypesFollowTheirSqlType) {
  DataType point = DataType::user_defined("point", parse_data_type("ARRAY<DOUBLE>"));
  EXPECT_TRUE(is_supported_data_type(point));
  EXPECT_FALSE(is_supported_decode_type(point));

  DataType id = DataType::user_defined("id", TypeId::BIGINT);
  EXPECT_TRUE(is_supported_data_type(id));
  EXPECT_TRUE(is_supported_decode_type(id));

  DataType opaque = DataType::user_defined("opaque", TypeId::VARIANT);
  EXPECT_FALSE(is_supported_data_type(opaque));
}

TEST(TypeSupportTest, FirstUnsupportedTypeNamesTheCulprit) {
  EXPECT_EQ(first_unsupported_type(parse_data_type("STRUCT<a: INT, b: ARRAY<VARIANT>>")).id(),
            TypeId::VARIANT);
  EXPECT_EQ(first_unsupported_type(parse_data_type("MAP<VARIANT, INT>")).id(), TypeId::VARIANT);
  // A supported type comes back unchanged
  EXPECT_EQ(first_unsupported_type(TypeId::INTEGER).id(), TypeId::INTEGER);
}
