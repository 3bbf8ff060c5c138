#include "csvexpr/error.h"
#include "csvexpr/ddl_parser.h"
#include "csvexpr/schema_resolver.h"

#include <gtest/gtest.h>

using namespace csvexpr;

class SchemaResolverTest : public ::testing::Test {
protected:
  static ErrorCode resolve_error(const std::string& ddl, const std::string& corrupt, bool explicit_name,
                                 const std::optional<Schema>& required = std::nullopt) {
    try {
      SchemaResolver::resolve(parse_schema_ddl(ddl), corrupt, explicit_name, required);
    } catch (const ConfigurationError& e) {
      return e.code();
    }
    return ErrorCode::NONE;
  }
};

TEST_F(SchemaResolverTest, PlainSchema) {
  ResolvedSchema r = SchemaResolver::resolve(parse_schema_ddl("a INT NOT NULL, b STRING"),
                                             "_corrupt_record");
  EXPECT_EQ(r.nullable_schema, parse_schema_ddl("a INT, b STRING"));
  EXPECT_EQ(r.actual_schema, r.nullable_schema);
  EXPECT_EQ(r.required_schema, r.nullable_schema);
  EXPECT_EQ(r.actual_required_schema, r.nullable_schema);
  EXPECT_FALSE(r.corrupt_field_index.has_value());
  EXPECT_EQ(r.column_name_of_corrupt_record, "_corrupt_record");
}

TEST_F(SchemaResolverTest, CorruptFieldIsSplitOff) {
  ResolvedSchema r = SchemaResolver::resolve(
      parse_schema_ddl("a INT, _corrupt_record STRING, b DOUBLE"), "_corrupt_record");
  EXPECT_EQ(r.actual_schema, parse_schema_ddl("a INT, b DOUBLE"));
  EXPECT_EQ(r.actual_required_schema, parse_schema_ddl("a INT, b DOUBLE"));
  EXPECT_EQ(r.corrupt_field_index, std::optional<size_t>(1));
}

TEST_F(SchemaResolverTest, CustomCorruptName) {
  ResolvedSchema r =
      SchemaResolver::resolve(parse_schema_ddl("a INT, bad STRING"), "bad", true);
  EXPECT_EQ(r.actual_schema, parse_schema_ddl("a INT"));
  EXPECT_EQ(r.corrupt_field_index, std::optional<size_t>(1));
}

TEST_F(SchemaResolverTest, CorruptFieldMustBeString) {
  EXPECT_EQ(resolve_error("a INT, _corrupt_record INT", "_corrupt_record", false),
            ErrorCode::INVALID_CORRUPT_RECORD_COLUMN);
  EXPECT_EQ(resolve_error("a INT, _corrupt_record ARRAY<STRING>", "_corrupt_record", true),
            ErrorCode::INVALID_CORRUPT_RECORD_COLUMN);
}

TEST_F(SchemaResolverTest, NotNullCorruptFieldIsForcedNullable) {
  ResolvedSchema r = SchemaResolver::resolve(
      parse_schema_ddl("a INT, _corrupt_record STRING NOT NULL"), "_corrupt_record", false);
  EXPECT_EQ(r.nullable_schema, parse_schema_ddl("a INT, _corrupt_record STRING"));
  EXPECT_TRUE(r.required_schema.field(1).nullable);
  EXPECT_EQ(r.corrupt_field_index, std::optional<size_t>(1));
}

TEST_F(SchemaResolverTest, ExplicitCorruptNameMustBePresent) {
  EXPECT_EQ(resolve_error("a INT", "bad", true), ErrorCode::INVALID_CORRUPT_RECORD_COLUMN);
  EXPECT_EQ(resolve_error("a INT", "bad", false), ErrorCode::NONE);
}

TEST_F(SchemaResolverTest, RequiredSchemaProjection) {
  ResolvedSchema r = SchemaResolver::resolve(
      parse_schema_ddl("a INT, b STRING, _corrupt_record STRING"), "_corrupt_record", false,
      parse_schema_ddl("_corrupt_record STRING, a INT NOT NULL"));
  EXPECT_EQ(r.required_schema, parse_schema_ddl("_corrupt_record STRING, a INT"));
  EXPECT_EQ(r.actual_required_schema, parse_schema_ddl("a INT"));
  EXPECT_EQ(r.corrupt_field_index, std::optional<size_t>(0));
  EXPECT_EQ(r.actual_schema, parse_schema_ddl("a INT, b STRING"));
}

TEST_F(SchemaResolverTest, RequiredFieldMustBeDeclared) {
  EXPECT_EQ(resolve_error("a INT", "_corrupt_record", false, parse_schema_ddl("z INT")),
            ErrorCode::INVALID_SCHEMA);
}

TEST_F(SchemaResolverTest, ResolutionIsDeterministic) {
  Schema declared = parse_schema_ddl("a INT, _corrupt_record STRING");
  EXPECT_EQ(SchemaResolver::resolve(declared, "_corrupt_record"),
            SchemaResolver::resolve(declared, "_corrupt_record"));
}

TEST_F(SchemaResolverTest, VerifyDecodableSchema) {
  EXPECT_NO_THROW(SchemaResolver::verify_decodable_schema(
      parse_schema_ddl("a INT, b STRING, c DATE, d TIMESTAMP")));
  try {
    SchemaResolver::verify_decodable_schema(parse_schema_ddl("a INT, m MAP<STRING, INT>"));
    FAIL() << "Expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_DATA_TYPE);
    EXPECT_NE(std::string(e.what()).find("MAP<STRING, INT>"), std::string::npos);
  }
}

TEST_F(SchemaResolverTest, VerifyDecodableSchemaSkipsCorruptField) {
  EXPECT_NO_THROW(SchemaResolver::verify_decodable_schema(
      parse_schema_ddl("a INT, _corrupt_record STRING"), "_corrupt_record"));
}
