#include "csvexpr/error.h"
#include "csvexpr/options.h"

#include <gtest/gtest.h>

using namespace csvexpr;

namespace {

CsvOptions make_options(const OptionMap& params) { return CsvOptions(params, true, "UTC"); }

} // namespace

// ============================================================================
// OptionMap
// ============================================================================

TEST(OptionMapTest, KeysAreCaseInsensitive) {
  OptionMap options{{"nullValue", "NA"}};
  EXPECT_EQ(options.get("nullvalue"), "NA");
  EXPECT_EQ(options.get("NULLVALUE"), "NA");
  EXPECT_TRUE(options.contains("NullValue"));
  EXPECT_FALSE(options.get("sep").has_value());
}

TEST(OptionMapTest, LaterKeyReplacesEarlier) {
  OptionMap options;
  options.set("sep", ";");
  options.set("SEP", "|");
  EXPECT_EQ(options.size(), 1u);
  EXPECT_EQ(options.get("sep"), "|");
  ASSERT_EQ(options.entries().size(), 1u);
  EXPECT_EQ(options.entries()[0].first, "SEP");
}

// ============================================================================
// CsvOptions
// ============================================================================

TEST(CsvOptionsTest, Defaults) {
  CsvOptions options = make_options({});
  EXPECT_EQ(options.delimiter, ",");
  EXPECT_EQ(options.quote, '"');
  EXPECT_EQ(options.escape, '\\');
  EXPECT_EQ(options.comment, '\0');
  EXPECT_FALSE(options.header);
  EXPECT_EQ(options.line_separator, "\n");
  EXPECT_EQ(options.null_value, "");
  EXPECT_EQ(options.empty_value_in_read, "");
  EXPECT_EQ(options.empty_value_in_write, "\"\"");
  EXPECT_EQ(options.nan_value, "NaN");
  EXPECT_EQ(options.positive_inf, "Inf");
  EXPECT_EQ(options.negative_inf, "-Inf");
  EXPECT_FALSE(options.ignore_leading_whitespace_in_read);
  EXPECT_TRUE(options.ignore_leading_whitespace_in_write);
  EXPECT_EQ(options.parse_mode, ParseMode::PERMISSIVE);
  EXPECT_EQ(options.column_name_of_corrupt_record, "_corrupt_record");
  EXPECT_FALSE(options.corrupt_record_explicit);
  EXPECT_EQ(options.date_pattern, "yyyy-MM-dd");
  EXPECT_EQ(options.timestamp_pattern, "yyyy-MM-dd'T'HH:mm:ss[.SSS][XXX]");
  ASSERT_NE(options.date_format, nullptr);
  ASSERT_NE(options.timestamp_format, nullptr);
  EXPECT_EQ(options.zone.offset_minutes(), 0);
}

TEST(CsvOptionsTest, SepAndDelimiterAliases) {
  EXPECT_EQ(make_options({{"sep", ";"}}).delimiter, ";");
  EXPECT_EQ(make_options({{"delimiter", "|"}}).delimiter, "|");
  EXPECT_EQ(make_options({{"sep", "::"}}).delimiter, "::");
}

TEST(CsvOptionsTest, DelimiterEscapes) {
  EXPECT_EQ(make_options({{"sep", "\\t"}}).delimiter, "\t");
  EXPECT_EQ(make_options({{"sep", "\\\\"}}).delimiter, "\\");
  EXPECT_EQ(make_options({{"sep", "\\u0001"}}).delimiter, "\x01");
  EXPECT_EQ(make_options({{"sep", "\\u00e9"}}).delimiter, "\xC3\xA9");
}

TEST(CsvOptionsTest, InvalidDelimiters) {
  for (const char* sep : {"", "\\", "\\x", "\\u12", "\\uZZZZ"}) {
    try {
      make_options({{"sep", sep}});
      FAIL() << "expected failure for '" << sep << "'";
    } catch (const ConfigurationError& e) {
      EXPECT_EQ(e.code(), ErrorCode::INVALID_OPTION) << sep;
    }
  }
}

TEST(CsvOptionsTest, QuoteAndComment) {
  CsvOptions options = make_options({{"quote", "'"}, {"comment", "#"}, {"escape", "'"}});
  EXPECT_EQ(options.quote, '\'');
  EXPECT_EQ(options.comment, '#');
  EXPECT_EQ(options.escape, '\'');

  EXPECT_EQ(make_options({{"quote", ""}}).quote, '\0');
  EXPECT_THROW(make_options({{"quote", "ab"}}), ConfigurationError);
  EXPECT_THROW(make_options({{"escape", ""}}), ConfigurationError);
}

TEST(CsvOptionsTest, Booleans) {
  CsvOptions options = make_options({{"header", "TRUE"}, {"quoteAll", "true"},
                                     {"ignoreLeadingWhiteSpace", "true"},
                                     {"preferDate", "false"}});
  EXPECT_TRUE(options.header);
  EXPECT_TRUE(options.quote_all);
  EXPECT_TRUE(options.ignore_leading_whitespace_in_read);
  EXPECT_TRUE(options.ignore_leading_whitespace_in_write);
  EXPECT_FALSE(options.prefer_date);

  try {
    make_options({{"header", "yes"}});
    FAIL();
  } catch (const ConfigurationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_OPTION);
    EXPECT_NE(std::string(e.what()).find("header"), std::string::npos);
  }
}

TEST(CsvOptionsTest, EmptyValueAppliesToBothDirections) {
  CsvOptions options = make_options({{"emptyValue", "EMPTY"}});
  EXPECT_EQ(options.empty_value_in_read, "EMPTY");
  EXPECT_EQ(options.empty_value_in_write, "EMPTY");
}

TEST(CsvOptionsTest, ParseModes) {
  EXPECT_EQ(make_options({{"mode", "failfast"}}).parse_mode, ParseMode::FAIL_FAST);
  EXPECT_EQ(make_options({{"mode", "DROPMALFORMED"}}).parse_mode, ParseMode::DROP_MALFORMED);
  EXPECT_EQ(make_options({{"mode", "Permissive"}}).parse_mode, ParseMode::PERMISSIVE);

  try {
    make_options({{"mode", "FAILFASTFAIL"}});
    FAIL();
  } catch (const ConfigurationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_OPTION);
  }
}

TEST(CsvOptionsTest, CorruptRecordColumn) {
  CsvOptions session_default(OptionMap(), true, "UTC", "_bad");
  EXPECT_EQ(session_default.column_name_of_corrupt_record, "_bad");
  EXPECT_FALSE(session_default.corrupt_record_explicit);

  CsvOptions explicit_name(OptionMap{{"columnNameOfCorruptRecord", "raw"}}, true, "UTC", "_bad");
  EXPECT_EQ(explicit_name.column_name_of_corrupt_record, "raw");
  EXPECT_TRUE(explicit_name.corrupt_record_explicit);
}

TEST(CsvOptionsTest, DateTimePatterns) {
  CsvOptions options = make_options({{"dateFormat", "dd/MM/yyyy"}, {"timestampFormat", "yyyy"}});
  EXPECT_EQ(options.date_pattern, "dd/MM/yyyy");
  EXPECT_EQ(options.date_format->parse_date("01/01/1970"), 0);

  try {
    make_options({{"dateFormat", "yyyy-qq"}});
    FAIL();
  } catch (const ConfigurationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_DATETIME_PATTERN);
    EXPECT_NE(std::string(e.what()).find("dateFormat"), std::string::npos);
  }
}

TEST(CsvOptionsTest, TimeZoneOptionOverridesSession) {
  EXPECT_EQ(CsvOptions(OptionMap(), true, "+01:00").zone.offset_minutes(), 60);
  EXPECT_EQ(CsvOptions(OptionMap{{"timeZone", "-02:00"}}, true, "+01:00").zone.offset_minutes(),
            -120);
  EXPECT_THROW(CsvOptions(OptionMap(), true, "Mars/Olympus"), ConfigurationError);
}

TEST(CsvOptionsTest, LineSeparator) {
  EXPECT_EQ(make_options({{"lineSep", "\r\n"}}).line_separator, "\r\n");
  EXPECT_THROW(make_options({{"lineSep", ""}}), ConfigurationError);

  CsvOptions options = make_options({{"sep", ";"}});
  CsvOptions copy = options.with_line_separator("|");
  EXPECT_EQ(copy.line_separator, "|");
  EXPECT_EQ(copy.delimiter, ";");
  EXPECT_EQ(options.line_separator, "\n");
}
