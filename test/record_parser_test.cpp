#include "csvexpr/ddl_parser.h"
#include "csvexpr/record_parser.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace csvexpr;

class RecordParserTest : public ::testing::Test {
protected:
  // Parses one input against a DDL schema; the required schema is the data schema.
  std::vector<Row> parse(const std::string& ddl, const std::string& input,
                         const OptionMap& params = {}) {
    Schema schema = parse_schema_ddl(ddl);
    RecordParser parser(schema, schema, CsvOptions(params, true, "UTC"));
    errors_ = ErrorCollector(errors_.mode());
    return parser.parse(input, errors_);
  }

  Row parse_one(const std::string& ddl, const std::string& input, const OptionMap& params = {}) {
    auto rows = parse(ddl, input, params);
    EXPECT_EQ(rows.size(), 1u);
    return rows.empty() ? Row() : rows.front();
  }

  size_t count_errors(ErrorCode code) const {
    size_t count = 0;
    for (const auto& err : errors_.errors()) {
      if (err.code == code)
        ++count;
    }
    return count;
  }

  ErrorCollector errors_{ParseMode::PERMISSIVE};
};

// ============================================================================
// Scalar conversion
// ============================================================================

TEST_F(RecordParserTest, IntAndDouble) {
  Row row = parse_one("a INT, b DOUBLE", "1, 0.8");
  ASSERT_EQ(row.size(), 2u);
  EXPECT_EQ(row[0], Value::integer(1));
  EXPECT_EQ(row[1], Value::floating(0.8));
  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(RecordParserTest, IntegerWidths) {
  Row row = parse_one("a TINYINT, b SMALLINT, c INT, d BIGINT",
                      "127,-32768,+2147483647,9223372036854775807");
  EXPECT_EQ(row[0], Value::integer(127));
  EXPECT_EQ(row[1], Value::integer(-32768));
  EXPECT_EQ(row[2], Value::integer(2147483647));
  EXPECT_EQ(row[3], Value::integer(INT64_MAX));
  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(RecordParserTest, IntegerOverflowIsConversionError) {
  Row row = parse_one("a TINYINT, b INT", "128,2147483648");
  EXPECT_TRUE(row[0].is_null());
  EXPECT_TRUE(row[1].is_null());
  EXPECT_EQ(count_errors(ErrorCode::FIELD_CONVERSION), 2u);
}

TEST_F(RecordParserTest, NumbersAreTrimmed) {
  Row row = parse_one("a INT, b DOUBLE, c BOOLEAN", " 7 ,\t2.5 , TRUE ");
  EXPECT_EQ(row[0], Value::integer(7));
  EXPECT_EQ(row[1], Value::floating(2.5));
  EXPECT_EQ(row[2], Value::boolean(true));
}

TEST_F(RecordParserTest, StringsKeepWhitespace) {
  Row row = parse_one("a STRING", "  padded ");
  EXPECT_EQ(row[0], Value::string("  padded "));
}

TEST_F(RecordParserTest, Floats) {
  Row row = parse_one("a FLOAT, b DOUBLE, c DOUBLE", "+1.5,1e10,-0.25");
  EXPECT_EQ(row[0], Value::floating(1.5));
  EXPECT_EQ(row[1], Value::floating(1e10));
  EXPECT_EQ(row[2], Value::floating(-0.25));
}

TEST_F(RecordParserTest, OutOfRangeFloatsSaturate) {
  Row row = parse_one("a FLOAT, b FLOAT, c DOUBLE, d DOUBLE", "1e39,-1e39,1e400,1e-400");
  EXPECT_FALSE(errors_.has_errors());
  EXPECT_EQ(row[0].as_double(), INFINITY);
  EXPECT_EQ(row[1].as_double(), -INFINITY);
  EXPECT_EQ(row[2].as_double(), INFINITY);
  EXPECT_EQ(row[3].as_double(), 0.0);
}

TEST_F(RecordParserTest, NanAndInfinity) {
  Row row = parse_one("a DOUBLE, b DOUBLE, c DOUBLE", "NaN,Inf,-Inf");
  EXPECT_TRUE(std::isnan(row[0].as_double()));
  EXPECT_EQ(row[1].as_double(), INFINITY);
  EXPECT_EQ(row[2].as_double(), -INFINITY);

  Row custom = parse_one("a DOUBLE, b DOUBLE", "nope,big",
                         {{"nanValue", "nope"}, {"positiveInf", "big"}});
  EXPECT_TRUE(std::isnan(custom[0].as_double()));
  EXPECT_EQ(custom[1].as_double(), INFINITY);
}

TEST_F(RecordParserTest, Booleans) {
  Row row = parse_one("a BOOLEAN, b BOOLEAN, c BOOLEAN", "true,False,yes");
  EXPECT_EQ(row[0], Value::boolean(true));
  EXPECT_EQ(row[1], Value::boolean(false));
  EXPECT_TRUE(row[2].is_null());
  EXPECT_EQ(count_errors(ErrorCode::FIELD_CONVERSION), 1u);
}

TEST_F(RecordParserTest, DatesAndTimestamps) {
  Row row = parse_one("d DATE, t TIMESTAMP", "2024-02-29,1970-01-01T00:00:01.5Z");
  EXPECT_EQ(row[0], Value::date(19782));
  EXPECT_EQ(row[1], Value::timestamp(1500000));
}

TEST_F(RecordParserTest, TimestampsUseTimeZoneOption) {
  Row row = parse_one("t TIMESTAMP", "1970-01-01T01:00:00", {{"timeZone", "+01:00"}});
  EXPECT_EQ(row[0], Value::timestamp(0));
}

TEST_F(RecordParserTest, CustomDateFormat) {
  Row row = parse_one("d DATE", "29/02/2024", {{"dateFormat", "dd/MM/yyyy"}});
  EXPECT_EQ(row[0], Value::date(19782));
}

TEST_F(RecordParserTest, DatesAreNotTrimmed) {
  Row row = parse_one("d DATE", " 2024-02-29");
  EXPECT_TRUE(row[0].is_null());
  EXPECT_EQ(count_errors(ErrorCode::FIELD_CONVERSION), 1u);
}

TEST_F(RecordParserTest, UserDefinedTypeConvertsThroughSqlType) {
  Schema schema({StructField("p", DataType::user_defined("point_id", TypeId::BIGINT))});
  RecordParser parser(schema, schema, CsvOptions(OptionMap(), true, "UTC"));
  auto rows = parser.parse("42", errors_);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0][0], Value::integer(42));
}

// ============================================================================
// Nulls and empty values
// ============================================================================

TEST_F(RecordParserTest, EmptyTokensAreNull) {
  Row row = parse_one("a INT, b STRING, c STRING", ",,\"\"");
  EXPECT_TRUE(row[0].is_null());
  EXPECT_TRUE(row[1].is_null());
  EXPECT_TRUE(row[2].is_null());
  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(RecordParserTest, NullValueOption) {
  Row row = parse_one("a INT, b STRING, c STRING", "NA,NA,", {{"nullValue", "NA"}});
  EXPECT_TRUE(row[0].is_null());
  EXPECT_TRUE(row[1].is_null());
  // An empty unquoted token reads as nullValue, which is null.
  EXPECT_TRUE(row[2].is_null());
}

TEST_F(RecordParserTest, EmptyValueOption) {
  Row row = parse_one("a STRING, b STRING", "\"\",", {{"emptyValue", "EMPTY"}});
  EXPECT_EQ(row[0], Value::string("EMPTY"));
  EXPECT_TRUE(row[1].is_null());
}

TEST_F(RecordParserTest, QuotedEmptyIsEmptyStringWhenNullValueDiffers) {
  Row row = parse_one("a STRING", "\"\"", {{"nullValue", "NA"}});
  EXPECT_EQ(row[0], Value::string(""));
}

// ============================================================================
// Shape mismatches
// ============================================================================

TEST_F(RecordParserTest, MissingFieldsArePadded) {
  Row row = parse_one("a INT, b INT, c INT", "1,2");
  EXPECT_EQ(row[0], Value::integer(1));
  EXPECT_EQ(row[1], Value::integer(2));
  EXPECT_TRUE(row[2].is_null());
  EXPECT_EQ(count_errors(ErrorCode::INCONSISTENT_FIELD_COUNT), 1u);
}

TEST_F(RecordParserTest, ExtraFieldsAreTruncated) {
  Row row = parse_one("a INT", "1,2,3");
  ASSERT_EQ(row.size(), 1u);
  EXPECT_EQ(row[0], Value::integer(1));
  EXPECT_EQ(count_errors(ErrorCode::INCONSISTENT_FIELD_COUNT), 1u);
}

TEST_F(RecordParserTest, ConversionErrorKeepsOtherFields) {
  Row row = parse_one("a INT, b STRING", "abc,ok");
  EXPECT_TRUE(row[0].is_null());
  EXPECT_EQ(row[1], Value::string("ok"));
  ASSERT_EQ(errors_.error_count(), 1u);
  const ParseError& err = errors_.errors()[0];
  EXPECT_EQ(err.code, ErrorCode::FIELD_CONVERSION);
  EXPECT_EQ(err.column, 1u);
  EXPECT_EQ(err.context, "abc");
}

TEST_F(RecordParserTest, FailFastStopsAtFirstError) {
  Schema schema = parse_schema_ddl("a INT, b INT");
  RecordParser parser(schema, schema, CsvOptions(OptionMap(), true, "UTC"));
  ErrorCollector errors(ParseMode::FAIL_FAST);
  auto rows = parser.parse("x,y", errors);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(errors.error_count(), 1u);
  EXPECT_TRUE(rows[0][1].is_null());
}

// ============================================================================
// Required schema projection
// ============================================================================

TEST_F(RecordParserTest, RequiredSchemaReordersAndProjects) {
  Schema data = parse_schema_ddl("a INT, b STRING, c DOUBLE");
  Schema required = parse_schema_ddl("c DOUBLE, a INT");
  RecordParser parser(data, required, CsvOptions(OptionMap(), true, "UTC"));
  auto rows = parser.parse("1,x,2.5", errors_);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0], (Row{Value::floating(2.5), Value::integer(1)}));
}

TEST_F(RecordParserTest, PruningSkipsUnrequestedFields) {
  Schema data = parse_schema_ddl("a INT, b INT");
  Schema required = parse_schema_ddl("a INT");
  RecordParser parser(data, required, CsvOptions(OptionMap(), true, "UTC"));
  auto rows = parser.parse("1,bad", errors_);
  EXPECT_EQ(rows[0], Row{Value::integer(1)});
  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(RecordParserTest, WithoutPruningEveryFieldIsChecked) {
  Schema data = parse_schema_ddl("a INT, b INT");
  Schema required = parse_schema_ddl("a INT");
  RecordParser parser(data, required, CsvOptions(OptionMap(), false, "UTC"));
  auto rows = parser.parse("1,bad", errors_);
  EXPECT_EQ(rows[0], Row{Value::integer(1)});
  EXPECT_EQ(count_errors(ErrorCode::FIELD_CONVERSION), 1u);
}

TEST_F(RecordParserTest, RequiredFieldMustExist) {
  Schema data = parse_schema_ddl("a INT");
  Schema required = parse_schema_ddl("z INT");
  try {
    RecordParser parser(data, required, CsvOptions(OptionMap(), true, "UTC"));
    FAIL();
  } catch (const ConfigurationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_SCHEMA);
  }
}

TEST_F(RecordParserTest, RejectsNestedFieldTypes) {
  Schema data = parse_schema_ddl("a ARRAY<INT>");
  try {
    RecordParser parser(data, data, CsvOptions(OptionMap(), true, "UTC"));
    FAIL();
  } catch (const ConfigurationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_DATA_TYPE);
    EXPECT_NE(std::string(e.what()).find("ARRAY<INT>"), std::string::npos);
  }
}

TEST_F(RecordParserTest, EmptyInputProducesNoRow) {
  auto rows = parse("a INT", "");
  EXPECT_TRUE(rows.empty());
  EXPECT_EQ(count_errors(ErrorCode::EMPTY_RECORD), 1u);
}
