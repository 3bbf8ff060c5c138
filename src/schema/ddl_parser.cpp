#include "csvexpr/ddl_parser.h"

#include "csvexpr/error.h"

#include <cctype>
#include <string>

namespace csvexpr {

namespace {

std::string to_upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

// Recursive-descent parser over the DDL text. pos_ always points at the next
// unconsumed byte.
class DdlParser {
public:
  explicit DdlParser(std::string_view text) : text_(text), pos_(0) {}

  Schema parse_schema() {
    skip_ws();
    if (at_end())
      fail("empty schema");

    // A bare STRUCT<...> is accepted as the whole schema.
    size_t saved = pos_;
    std::string word = peek_word();
    if (to_upper(word) == "STRUCT") {
      pos_ += word.size();
      skip_ws();
      if (peek() == '<') {
        DataType t = parse_struct_body();
        expect_end();
        return t.struct_schema();
      }
      pos_ = saved;
    }

    std::vector<StructField> fields;
    fields.push_back(parse_field());
    skip_ws();
    while (peek() == ',') {
      ++pos_;
      fields.push_back(parse_field());
      skip_ws();
    }
    expect_end();
    check_unique(fields);
    return Schema(std::move(fields));
  }

  DataType parse_single_type() {
    DataType t = parse_type();
    expect_end();
    return t;
  }

private:
  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_])))
      ++pos_;
  }

  [[noreturn]] void fail(const std::string& what) const {
    throw ConfigurationError(ErrorCode::INVALID_SCHEMA,
                             "Cannot parse schema '" + std::string(text_) + "': " + what +
                                 " at position " + std::to_string(pos_));
  }

  void expect(char c) {
    skip_ws();
    if (peek() != c)
      fail(std::string("expected '") + c + "'");
    ++pos_;
  }

  void expect_end() {
    skip_ws();
    if (!at_end())
      fail("unexpected trailing input");
  }

  std::string peek_word() const {
    size_t end = pos_;
    while (end < text_.size() &&
           (std::isalnum(static_cast<unsigned char>(text_[end])) || text_[end] == '_'))
      ++end;
    return std::string(text_.substr(pos_, end - pos_));
  }

  std::string read_word() {
    skip_ws();
    std::string word = peek_word();
    pos_ += word.size();
    return word;
  }

  std::string parse_identifier() {
    skip_ws();
    if (peek() == '`') {
      ++pos_;
      std::string name;
      while (true) {
        if (at_end())
          fail("unterminated quoted identifier");
        char c = text_[pos_++];
        if (c == '`') {
          if (peek() == '`') {
            name += '`';
            ++pos_;
            continue;
          }
          break;
        }
        name += c;
      }
      return name;
    }
    std::string word = read_word();
    if (word.empty())
      fail("expected a field name");
    return word;
  }

  bool consume_keyword(const char* keyword) {
    skip_ws();
    size_t saved = pos_;
    std::string word = peek_word();
    if (!word.empty() && to_upper(word) == keyword) {
      pos_ += word.size();
      return true;
    }
    pos_ = saved;
    return false;
  }

  // The colon is optional both at top level and inside STRUCT<...>.
  StructField parse_field() {
    std::string name = parse_identifier();
    skip_ws();
    if (peek() == ':')
      ++pos_;
    DataType type = parse_type();
    bool nullable = true;
    if (consume_keyword("NOT")) {
      if (!consume_keyword("NULL"))
        fail("expected NULL after NOT");
      nullable = false;
    }
    if (consume_keyword("COMMENT")) {
      skip_ws();
      char q = peek();
      if (q != '\'' && q != '"')
        fail("expected a quoted comment");
      ++pos_;
      while (!at_end() && text_[pos_] != q)
        ++pos_;
      if (at_end())
        fail("unterminated comment");
      ++pos_;
    }
    return StructField(std::move(name), std::move(type), nullable);
  }

  // Skips an optional "(n)" or "(n, m)" length suffix.
  void skip_type_params() {
    skip_ws();
    if (peek() != '(')
      return;
    while (!at_end() && text_[pos_] != ')')
      ++pos_;
    if (at_end())
      fail("unterminated type parameters");
    ++pos_;
  }

  DataType parse_struct_body() {
    expect('<');
    std::vector<StructField> fields;
    skip_ws();
    if (peek() != '>') {
      fields.push_back(parse_field());
      skip_ws();
      while (peek() == ',') {
        ++pos_;
        fields.push_back(parse_field());
        skip_ws();
      }
    }
    expect('>');
    check_unique(fields);
    return DataType::structure(Schema(std::move(fields)));
  }

  DataType parse_type() {
    std::string word = read_word();
    if (word.empty())
      fail("expected a type name");
    std::string upper = to_upper(word);

    if (upper == "BOOLEAN" || upper == "BOOL")
      return TypeId::BOOLEAN;
    if (upper == "TINYINT" || upper == "BYTE")
      return TypeId::TINYINT;
    if (upper == "SMALLINT" || upper == "SHORT")
      return TypeId::SMALLINT;
    if (upper == "INT" || upper == "INTEGER")
      return TypeId::INTEGER;
    if (upper == "BIGINT" || upper == "LONG")
      return TypeId::BIGINT;
    if (upper == "FLOAT" || upper == "REAL")
      return TypeId::FLOAT;
    if (upper == "DOUBLE")
      return TypeId::DOUBLE;
    if (upper == "STRING" || upper == "VARCHAR" || upper == "CHAR" || upper == "TEXT") {
      skip_type_params();
      return TypeId::STRING;
    }
    if (upper == "DATE")
      return TypeId::DATE;
    if (upper == "TIMESTAMP" || upper == "TIMESTAMP_LTZ")
      return TypeId::TIMESTAMP;
    if (upper == "VOID" || upper == "NULL")
      return TypeId::NULL_TYPE;
    if (upper == "VARIANT")
      return TypeId::VARIANT;
    if (upper == "ARRAY") {
      expect('<');
      DataType element = parse_type();
      expect('>');
      return DataType::array(element);
    }
    if (upper == "MAP") {
      expect('<');
      DataType key = parse_type();
      expect(',');
      DataType value = parse_type();
      expect('>');
      return DataType::map(key, value);
    }
    if (upper == "STRUCT")
      return parse_struct_body();

    fail("unsupported data type '" + word + "'");
  }

  void check_unique(const std::vector<StructField>& fields) const {
    for (size_t i = 0; i < fields.size(); ++i) {
      for (size_t j = i + 1; j < fields.size(); ++j) {
        if (fields[i].name == fields[j].name)
          fail("duplicate field name '" + fields[i].name + "'");
      }
    }
  }

  std::string_view text_;
  size_t pos_;
};

} // namespace

Schema parse_schema_ddl(std::string_view ddl) { return DdlParser(ddl).parse_schema(); }

DataType parse_data_type(std::string_view text) { return DdlParser(text).parse_single_type(); }

} // namespace csvexpr
