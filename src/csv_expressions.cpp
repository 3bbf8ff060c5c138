#include "csvexpr/csv_expressions.h"

#include "csvexpr/common_defs.h"
#include "csvexpr/debug.h"
#include "csvexpr/failure_safe_parser.h"
#include "csvexpr/record_parser.h"
#include "csvexpr/record_writer.h"
#include "csvexpr/schema_resolver.h"
#include "csvexpr/type_inference.h"
#include "csvexpr/type_support.h"

namespace csvexpr {

namespace {

std::string options_sql(const OptionMap& options) {
  if (options.empty())
    return std::string();
  std::string out = ", map(";
  bool first = true;
  for (const auto& entry : options.entries()) {
    if (!first)
      out += ", ";
    first = false;
    out += to_sql_string_literal(entry.first) + ", " + to_sql_string_literal(entry.second);
  }
  return out + ")";
}

const std::string& require_time_zone(const std::optional<std::string>& tz, const char* name) {
  if (!tz)
    throw InternalError(std::string(name) + " evaluated before a time zone was bound");
  return *tz;
}

ExpressionPtr single_child(std::vector<ExpressionPtr>& children, const char* name) {
  if (children.size() != 1)
    throw InternalError(std::string(name) + " takes exactly one child");
  return std::move(children.front());
}

} // namespace

// ============================================================================
// CsvToStructs
// ============================================================================

struct CsvToStructs::DecodeState {
  DecodeState(CsvOptions opts, ResolvedSchema res, const DebugConfig& debug)
      : options(std::move(opts)), resolved(std::move(res)), trace(debug) {}

  CsvOptions options;
  ResolvedSchema resolved;
  DebugTrace trace;
  std::unique_ptr<FailureSafeParser> parser;
};

CsvToStructs::CsvToStructs(Schema schema, OptionMap options, ExpressionPtr child,
                           std::optional<std::string> time_zone_id,
                           std::optional<Schema> required_schema, const SessionConfig& session)
    : UnaryExpression(std::move(child)), schema_(std::move(schema)),
      nullable_schema_(schema_.as_nullable()), options_(std::move(options)),
      time_zone_id_(std::move(time_zone_id)), required_schema_(std::move(required_schema)),
      session_(session) {}

CsvToStructs::CsvToStructs(const CsvToStructs& other)
    : UnaryExpression(other.child_), schema_(other.schema_),
      nullable_schema_(other.nullable_schema_), options_(other.options_),
      time_zone_id_(other.time_zone_id_), required_schema_(other.required_schema_),
      session_(other.session_) {}

CsvToStructs::~CsvToStructs() = default;

DataType CsvToStructs::data_type() const {
  if (required_schema_)
    return DataType::structure(required_schema_->as_nullable());
  return DataType::structure(nullable_schema_);
}

std::unique_ptr<CsvToStructs::DecodeState> CsvToStructs::build_state() const {
  const std::string& tz = require_time_zone(time_zone_id_, "from_csv");

  CsvOptions parsed(options_, session_.column_pruning, tz,
                    session_.column_name_of_corrupt_record);
  if (parsed.parse_mode != ParseMode::PERMISSIVE && parsed.parse_mode != ParseMode::FAIL_FAST) {
    throw ConfigurationError(ErrorCode::UNSUPPORTED_PARSE_MODE,
                             std::string("from_csv() doesn't support the ") +
                                 parse_mode_to_string(parsed.parse_mode) +
                                 " mode. Acceptable modes are PERMISSIVE and FAILFAST.");
  }

  ResolvedSchema resolved =
      SchemaResolver::resolve(schema_, parsed.column_name_of_corrupt_record,
                              parsed.corrupt_record_explicit, required_schema_);
  SchemaResolver::verify_decodable_schema(resolved.nullable_schema,
                                          parsed.column_name_of_corrupt_record);

  auto state = std::make_unique<DecodeState>(std::move(parsed), std::move(resolved), session_.debug);
  const ResolvedSchema& r = state->resolved;

  state->trace.start_phase("from_csv setup");
  // A record is the whole input string; newlines stay inside it.
  auto raw = std::make_shared<const RecordParser>(
      r.actual_schema, r.actual_required_schema,
      state->options.with_line_separator(CSVEXPR_LINE_SEP_SENTINEL));
  state->parser = std::make_unique<FailureSafeParser>(
      [raw](std::string_view input, ErrorCollector& errors) { return raw->parse(input, errors); },
      state->options.parse_mode, r.required_schema, r.column_name_of_corrupt_record,
      &state->trace);
  state->trace.end_phase();

  state->trace.log("from_csv schema %s, mode %s", r.nullable_schema.sql().c_str(),
                   parse_mode_to_string(state->options.parse_mode));
  if (r.corrupt_field_index) {
    state->trace.log("corrupt record column '%s' at position %zu",
                     r.column_name_of_corrupt_record.c_str(), *r.corrupt_field_index);
  }
  if (state->options.column_pruning && r.actual_required_schema.size() < r.actual_schema.size()) {
    state->trace.log_decision("convert required columns only", "column pruning is enabled");
  }
  return state;
}

void CsvToStructs::prepare() const {
  state_.get([this] { return build_state(); });
}

Value CsvToStructs::eval(const Row& input) const {
  Value csv = child_->eval(input);
  if (csv.is_null())
    return Value::null();
  DecodeState& state = state_.get([this] { return build_state(); });
  std::optional<Row> row = state.parser->parse(csv.as_string());
  if (!row)
    return Value::null();
  return Value::structure(std::move(*row));
}

CompiledEval CsvToStructs::compile() const {
  std::shared_ptr<DecodeState> state = build_state();
  CompiledEval child = compile_or_interpret(child_);
  return [state, child](const Row& input) {
    Value csv = child(input);
    if (csv.is_null())
      return Value::null();
    std::optional<Row> row = state->parser->parse(csv.as_string());
    if (!row)
      return Value::null();
    return Value::structure(std::move(*row));
  };
}

std::string CsvToStructs::to_sql() const {
  return "from_csv(" + child_->to_sql() + ", " + to_sql_string_literal(schema_.to_ddl()) +
         options_sql(options_) + ")";
}

ExpressionPtr CsvToStructs::with_new_children(std::vector<ExpressionPtr> children) const {
  return std::make_shared<CsvToStructs>(schema_, options_, single_child(children, "from_csv"),
                                        time_zone_id_, required_schema_, session_);
}

ExpressionPtr CsvToStructs::clone() const { return std::make_shared<CsvToStructs>(*this); }

ExpressionPtr CsvToStructs::with_time_zone(const std::string& time_zone_id) const {
  return std::make_shared<CsvToStructs>(schema_, options_, child_, time_zone_id,
                                        required_schema_, session_);
}

TypeCheckResult CsvToStructs::check_input_data_types() const {
  DataType input = child_->data_type();
  if (input.id() != TypeId::STRING) {
    return TypeCheckResult::failure(ErrorCode::UNEXPECTED_INPUT_TYPE,
                                    "Parameter 1 requires the \"STRING\" type, however " +
                                        to_sql_expr(*child_) + " has the type " +
                                        to_sql_type(input) + ".",
                                    {{"paramIndex", "first"},
                                     {"requiredType", to_sql_type(TypeId::STRING)},
                                     {"inputSql", to_sql_expr(*child_)},
                                     {"inputType", to_sql_type(input)}});
  }
  return TypeCheckResult::ok();
}

// ============================================================================
// StructsToCsv
// ============================================================================

StructsToCsv::StructsToCsv(OptionMap options, ExpressionPtr child,
                           std::optional<std::string> time_zone_id, const SessionConfig& session)
    : UnaryExpression(std::move(child)), options_(std::move(options)),
      time_zone_id_(std::move(time_zone_id)), session_(session) {}

StructsToCsv::StructsToCsv(const StructsToCsv& other)
    : UnaryExpression(other.child_), options_(other.options_),
      time_zone_id_(other.time_zone_id_), session_(other.session_) {}

StructsToCsv::~StructsToCsv() = default;

std::unique_ptr<RecordWriter> StructsToCsv::build_writer() const {
  const std::string& tz = require_time_zone(time_zone_id_, "to_csv");
  DataType input = child_->data_type();
  if (input.id() != TypeId::STRUCT)
    throw InternalError("to_csv input is not a struct: " + input.to_sql());
  CsvOptions options(options_, session_.column_pruning, tz,
                     session_.column_name_of_corrupt_record);
  DebugTrace trace(session_.debug);
  trace.log("to_csv schema %s, delimiter '%s'", input.struct_schema().sql().c_str(),
            options.delimiter.c_str());
  return std::make_unique<RecordWriter>(input.struct_schema(), options);
}

void StructsToCsv::prepare() const {
  writer_.get([this] { return build_writer(); });
}

Value StructsToCsv::eval(const Row& input) const {
  Value value = child_->eval(input);
  if (value.is_null())
    return Value::null();
  RecordWriter& writer = writer_.get([this] { return build_writer(); });
  return Value::string(writer.write(value.fields()));
}

CompiledEval StructsToCsv::compile() const {
  std::shared_ptr<RecordWriter> writer = build_writer();
  CompiledEval child = compile_or_interpret(child_);
  return [writer, child](const Row& input) {
    Value value = child(input);
    if (value.is_null())
      return Value::null();
    return Value::string(writer->write(value.fields()));
  };
}

std::string StructsToCsv::to_sql() const {
  return "to_csv(" + child_->to_sql() + options_sql(options_) + ")";
}

ExpressionPtr StructsToCsv::with_new_children(std::vector<ExpressionPtr> children) const {
  return std::make_shared<StructsToCsv>(options_, single_child(children, "to_csv"),
                                        time_zone_id_, session_);
}

ExpressionPtr StructsToCsv::clone() const { return std::make_shared<StructsToCsv>(*this); }

ExpressionPtr StructsToCsv::with_time_zone(const std::string& time_zone_id) const {
  return std::make_shared<StructsToCsv>(options_, child_, time_zone_id, session_);
}

TypeCheckResult StructsToCsv::check_input_data_types() const {
  DataType input = child_->data_type();
  if (input.id() == TypeId::STRUCT && is_supported_data_type(input))
    return TypeCheckResult::ok();
  std::string message = "The input of `to_csv` can't be " + to_sql_type(input) + " type data.";
  AnalysisException::Parameters params{
      {"functionName", to_sql_id("to_csv")}, {"dataType", to_sql_type(input)}};
  if (input.id() == TypeId::STRUCT) {
    // Name the nested type that has no text form
    std::string nested = to_sql_type(first_unsupported_type(input));
    message += " Unsupported type: " + nested + ".";
    params.emplace_back("unsupportedType", nested);
  }
  return TypeCheckResult::failure(ErrorCode::UNSUPPORTED_INPUT_TYPE, message, std::move(params));
}

// ============================================================================
// SchemaOfCsv
// ============================================================================

SchemaOfCsv::SchemaOfCsv(ExpressionPtr child, OptionMap options,
                         std::optional<std::string> time_zone_id)
    : UnaryExpression(std::move(child)), options_(std::move(options)),
      time_zone_id_(std::move(time_zone_id)) {}

SchemaOfCsv::SchemaOfCsv(const SchemaOfCsv& other)
    : UnaryExpression(other.child_), options_(other.options_),
      time_zone_id_(other.time_zone_id_) {}

SchemaOfCsv::~SchemaOfCsv() = default;

std::unique_ptr<SchemaOfCsvEvaluator> SchemaOfCsv::build_evaluator() const {
  return std::make_unique<SchemaOfCsvEvaluator>(
      options_, require_time_zone(time_zone_id_, "schema_of_csv"));
}

void SchemaOfCsv::prepare() const {
  evaluator_.get([this] { return build_evaluator(); });
}

Value SchemaOfCsv::eval(const Row& input) const {
  Value csv = child_->eval(input);
  if (csv.is_null())
    throw InternalError("schema_of_csv input evaluated to null");
  const SchemaOfCsvEvaluator& evaluator = evaluator_.get([this] { return build_evaluator(); });
  return Value::string(evaluator.evaluate(csv.as_string()));
}

CompiledEval SchemaOfCsv::compile() const {
  std::shared_ptr<const SchemaOfCsvEvaluator> evaluator = build_evaluator();
  CompiledEval child = compile_or_interpret(child_);
  return [evaluator, child](const Row& input) {
    Value csv = child(input);
    if (csv.is_null())
      throw InternalError("schema_of_csv input evaluated to null");
    return Value::string(evaluator->evaluate(csv.as_string()));
  };
}

std::string SchemaOfCsv::to_sql() const {
  return "schema_of_csv(" + child_->to_sql() + options_sql(options_) + ")";
}

ExpressionPtr SchemaOfCsv::with_new_children(std::vector<ExpressionPtr> children) const {
  return std::make_shared<SchemaOfCsv>(single_child(children, "schema_of_csv"), options_,
                                       time_zone_id_);
}

ExpressionPtr SchemaOfCsv::clone() const { return std::make_shared<SchemaOfCsv>(*this); }

ExpressionPtr SchemaOfCsv::with_time_zone(const std::string& time_zone_id) const {
  return std::make_shared<SchemaOfCsv>(child_, options_, time_zone_id);
}

TypeCheckResult SchemaOfCsv::check_input_data_types() const {
  DataType input = child_->data_type();
  if (!child_->foldable()) {
    return TypeCheckResult::failure(
        ErrorCode::NON_FOLDABLE_INPUT,
        "the input " + to_sql_id("csv") + " should be a foldable " +
            to_sql_type(TypeId::STRING) + " expression; however, got " + to_sql_expr(*child_) +
            ".",
        {{"inputName", to_sql_id("csv")},
         {"inputType", to_sql_type(input)},
         {"inputExpr", to_sql_expr(*child_)}});
  }
  if (child_->eval(Row()).is_null()) {
    return TypeCheckResult::failure(ErrorCode::UNEXPECTED_NULL,
                                    "The " + to_sql_id("csv") + " must not be null.",
                                    {{"exprName", to_sql_id("csv")}});
  }
  if (input.id() != TypeId::STRING) {
    return TypeCheckResult::failure(ErrorCode::UNEXPECTED_INPUT_TYPE,
                                    "Parameter 1 requires the \"STRING\" type, however " +
                                        to_sql_expr(*child_) + " has the type " +
                                        to_sql_type(input) + ".",
                                    {{"paramIndex", "first"},
                                     {"requiredType", to_sql_type(TypeId::STRING)},
                                     {"inputSql", to_sql_expr(*child_)},
                                     {"inputType", to_sql_type(input)}});
  }
  return TypeCheckResult::ok();
}

} // namespace csvexpr
