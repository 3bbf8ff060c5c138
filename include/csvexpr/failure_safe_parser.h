#ifndef CSVEXPR_FAILURE_SAFE_PARSER_H
#define CSVEXPR_FAILURE_SAFE_PARSER_H

#include "csvexpr/debug.h"
#include "csvexpr/error.h"
#include "csvexpr/types.h"
#include "csvexpr/value.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csvexpr {

// Applies the parse mode on top of a raw parser. The raw parser returns rows
// in the raw shape (result schema minus the corrupt record field) and
// reports problems through the collector.
class FailureSafeParser {
public:
  using RawParser = std::function<std::vector<Row>(std::string_view, ErrorCollector&)>;

  FailureSafeParser(RawParser raw_parser, ParseMode mode, Schema result_schema,
                    std::string column_name_of_corrupt_record, const DebugTrace* trace = nullptr);

  // One row in the result schema's shape. nullopt only under DROP_MALFORMED.
  // Throws MalformedRecordException under FAIL_FAST and InternalError if the
  // raw parser yields more than one row.
  std::optional<Row> parse(std::string_view input) const;

  ParseMode mode() const { return mode_; }
  const Schema& result_schema() const { return result_schema_; }
  std::optional<size_t> corrupt_field_index() const { return corrupt_field_index_; }

private:
  // Copies raw values into the result shape, leaving the corrupt slot null.
  Row to_result_row(const Row* raw) const;

  RawParser raw_parser_;
  ParseMode mode_;
  Schema result_schema_;
  std::optional<size_t> corrupt_field_index_;
  std::vector<size_t> raw_positions_; // result index -> raw index, per non-corrupt field
  const DebugTrace* trace_;
};

} // namespace csvexpr

#endif // CSVEXPR_FAILURE_SAFE_PARSER_H
