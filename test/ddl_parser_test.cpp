#include "csvexpr/ddl_parser.h"

#include "csvexpr/error.h"

#include <gtest/gtest.h>

using namespace csvexpr;

class DdlParserTest : public ::testing::Test {
protected:
  static bool rejects(const std::string& ddl) {
    try {
      parse_schema_ddl(ddl);
    } catch (const ConfigurationError& e) {
      EXPECT_EQ(e.code(), ErrorCode::INVALID_SCHEMA);
      return true;
    }
    return false;
  }
};

TEST_F(DdlParserTest, FieldList) {
  Schema schema = parse_schema_ddl("a INT, b DOUBLE");
  ASSERT_EQ(schema.size(), 2u);
  EXPECT_EQ(schema.field(0).name, "a");
  EXPECT_EQ(schema.field(0).type.id(), TypeId::INTEGER);
  EXPECT_EQ(schema.field(1).type.id(), TypeId::DOUBLE);
  EXPECT_TRUE(schema.field(1).nullable);
}

TEST_F(DdlParserTest, StructForm) {
  EXPECT_EQ(parse_schema_ddl("STRUCT<a: INT, b: STRING>"), parse_schema_ddl("a INT, b STRING"));
  EXPECT_EQ(parse_schema_ddl("struct<a INT>"), parse_schema_ddl("a: INT"));
}

TEST_F(DdlParserTest, FieldNamedStruct) {
  Schema schema = parse_schema_ddl("struct STRING");
  ASSERT_EQ(schema.size(), 1u);
  EXPECT_EQ(schema.field(0).name, "struct");
}

TEST_F(DdlParserTest, TypeAliases) {
  Schema schema = parse_schema_ddl(
      "a long, b Integer, c short, d byte, e real, f varchar(10), g bool, h TIMESTAMP_LTZ");
  EXPECT_EQ(schema.field(0).type.id(), TypeId::BIGINT);
  EXPECT_EQ(schema.field(1).type.id(), TypeId::INTEGER);
  EXPECT_EQ(schema.field(2).type.id(), TypeId::SMALLINT);
  EXPECT_EQ(schema.field(3).type.id(), TypeId::TINYINT);
  EXPECT_EQ(schema.field(4).type.id(), TypeId::FLOAT);
  EXPECT_EQ(schema.field(5).type.id(), TypeId::STRING);
  EXPECT_EQ(schema.field(6).type.id(), TypeId::BOOLEAN);
  EXPECT_EQ(schema.field(7).type.id(), TypeId::TIMESTAMP);
}

TEST_F(DdlParserTest, NotNullAndComment) {
  Schema schema = parse_schema_ddl("a INT NOT NULL COMMENT 'the key', b STRING COMMENT \"x\"");
  EXPECT_FALSE(schema.field(0).nullable);
  EXPECT_TRUE(schema.field(1).nullable);
}

TEST_F(DdlParserTest, QuotedIdentifiers) {
  Schema schema = parse_schema_ddl("`my field` INT, `a``b` STRING");
  EXPECT_EQ(schema.field(0).name, "my field");
  EXPECT_EQ(schema.field(1).name, "a`b");
}

TEST_F(DdlParserTest, NestedTypes) {
  DataType type = parse_data_type("ARRAY<MAP<STRING, STRUCT<x: INT, y: ARRAY<DATE>>>>");
  EXPECT_EQ(type.to_sql(), "ARRAY<MAP<STRING, STRUCT<x: INT, y: ARRAY<DATE>>>>");
}

TEST_F(DdlParserTest, DdlRoundTrip) {
  Schema schema = parse_schema_ddl("`odd name` MAP<STRING, INT> NOT NULL, b VOID");
  EXPECT_EQ(parse_schema_ddl(schema.to_ddl()), schema);
}

TEST_F(DdlParserTest, Rejects) {
  EXPECT_TRUE(rejects(""));
  EXPECT_TRUE(rejects("a"));
  EXPECT_TRUE(rejects("a INT,"));
  EXPECT_TRUE(rejects("a DECIMAL(10, 2)"));
  EXPECT_TRUE(rejects("a ARRAY<INT"));
  EXPECT_TRUE(rejects("a INT NOT"));
  EXPECT_TRUE(rejects("a INT, a STRING"));
  EXPECT_TRUE(rejects("`open INT"));
  EXPECT_TRUE(rejects("a INT extra"));
}

TEST_F(DdlParserTest, ErrorMessageShowsInput) {
  try {
    parse_schema_ddl("a BLOB");
    FAIL() << "Expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("Cannot parse schema 'a BLOB'"), std::string::npos);
    EXPECT_NE(message.find("unsupported data type 'BLOB'"), std::string::npos);
  }
}
