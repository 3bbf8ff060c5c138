#include "csvexpr/failure_safe_parser.h"

namespace csvexpr {

FailureSafeParser::FailureSafeParser(RawParser raw_parser, ParseMode mode, Schema result_schema,
                                     std::string column_name_of_corrupt_record,
                                     const DebugTrace* trace)
    : raw_parser_(std::move(raw_parser)), mode_(mode), result_schema_(std::move(result_schema)),
      trace_(trace) {
  corrupt_field_index_ = result_schema_.index_of(column_name_of_corrupt_record);
  for (size_t i = 0; i < result_schema_.size(); ++i) {
    if (corrupt_field_index_ && *corrupt_field_index_ == i)
      continue;
    raw_positions_.push_back(i);
  }
}

Row FailureSafeParser::to_result_row(const Row* raw) const {
  Row result(result_schema_.size());
  if (raw == nullptr)
    return result;
  for (size_t r = 0; r < raw_positions_.size() && r < raw->size(); ++r) {
    result[raw_positions_[r]] = (*raw)[r];
  }
  return result;
}

std::optional<Row> FailureSafeParser::parse(std::string_view input) const {
  ErrorCollector errors(mode_);
  std::vector<Row> rows = raw_parser_(input, errors);

  if (rows.size() > 1) {
    throw InternalError("Expected one row from CSV parser, got " + std::to_string(rows.size()));
  }

  const Row* raw = rows.empty() ? nullptr : &rows.front();
  if (raw != nullptr && !errors.has_failures()) {
    return to_result_row(raw);
  }

  // Malformed: no record at all, or a record with errors
  switch (mode_) {
  case ParseMode::PERMISSIVE: {
    Row result = to_result_row(raw);
    if (corrupt_field_index_)
      result[*corrupt_field_index_] = Value::string(std::string(input));
    if (trace_ && trace_->verbose()) {
      const ParseError* failure = errors.first_failure();
      std::string reason = failure != nullptr ? failure->to_string() : std::string("no record");
      trace_->log("PERMISSIVE: recovered malformed record (%zu errors): %s", errors.error_count(),
                  reason.c_str());
    }
    return result;
  }
  case ParseMode::DROP_MALFORMED:
    if (trace_)
      trace_->log("DROPMALFORMED: dropped malformed record (%zu errors)", errors.error_count());
    return std::nullopt;
  case ParseMode::FAIL_FAST:
    break;
  }
  throw MalformedRecordException(std::string(input), mode_, errors.errors());
}

} // namespace csvexpr
