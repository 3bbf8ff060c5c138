#ifndef CSVEXPR_RECORD_WRITER_H
#define CSVEXPR_RECORD_WRITER_H

#include "csvexpr/options.h"
#include "csvexpr/types.h"
#include "csvexpr/value.h"

#include <string>

namespace csvexpr {

// Renders rows of a schema as single CSV records (no terminator). The output
// buffer is reused across calls, so one writer serves one caller at a time.
class RecordWriter {
public:
  // Throws ConfigurationError(UNSUPPORTED_DATA_TYPE) if a field type cannot
  // be rendered.
  RecordWriter(const Schema& schema, const CsvOptions& options);

  std::string write(const Row& row);

  const Schema& schema() const { return schema_; }
  const CsvOptions& options() const { return options_; }

private:
  void append_field(const Value& value, const DataType& type);
  // Text of a non-null value, before quoting.
  std::string render(const Value& value, const DataType& type) const;
  // Nested renderings use "null" for null elements.
  std::string render_nested(const Value& value, const DataType& type) const;
  std::string render_floating(double value, bool is_float) const;
  bool needs_quotes(const std::string& text) const;

  Schema schema_;
  CsvOptions options_;
  std::string buffer_;
};

// Shortest text that reads back as the same value: 1.0, 0.1, 1.0E20, 1.0E-5.
std::string format_double(double value);
std::string format_float(float value);

} // namespace csvexpr

#endif // CSVEXPR_RECORD_WRITER_H
