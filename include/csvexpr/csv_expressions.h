/**
 * @file csv_expressions.h
 * @brief from_csv, to_csv and schema_of_csv expressions.
 *
 * Each expression resolves its options, schemas and codec once, on first use
 * or when bind_expression() prepares it, and reuses them for every row. An
 * instance is confined to one thread at a time; clone() gives an independent
 * copy for another thread.
 */

#ifndef CSVEXPR_CSV_EXPRESSIONS_H
#define CSVEXPR_CSV_EXPRESSIONS_H

#include "csvexpr/expression.h"
#include "csvexpr/lazy_slot.h"
#include "csvexpr/options.h"
#include "csvexpr/types.h"

#include <memory>
#include <optional>
#include <string>

namespace csvexpr {

class RecordWriter;
class SchemaOfCsvEvaluator;

// from_csv(csv, schema[, options]): one CSV record to a struct.
class CsvToStructs : public UnaryExpression,
                     public TypeChecked,
                     public TimeZoneAware,
                     public SchemaBound,
                     public CodeGenerable {
public:
  CsvToStructs(Schema schema, OptionMap options, ExpressionPtr child,
               std::optional<std::string> time_zone_id = std::nullopt,
               std::optional<Schema> required_schema = std::nullopt,
               const SessionConfig& session = SessionConfig());
  CsvToStructs(const CsvToStructs& other);
  ~CsvToStructs() override;

  // The required schema if set, otherwise the declared one; always nullable.
  DataType data_type() const override;
  bool nullable() const override { return child_->nullable(); }
  Value eval(const Row& input) const override;
  std::string pretty_name() const override { return "from_csv"; }
  std::string to_sql() const override;
  ExpressionPtr with_new_children(std::vector<ExpressionPtr> children) const override;
  ExpressionPtr clone() const override;
  void prepare() const override;

  TypeCheckResult check_input_data_types() const override;

  const std::optional<std::string>& time_zone_id() const override { return time_zone_id_; }
  ExpressionPtr with_time_zone(const std::string& time_zone_id) const override;

  // Declared schema, forced nullable.
  const Schema& schema() const override { return nullable_schema_; }

  CompiledEval compile() const override;

  const OptionMap& options() const { return options_; }
  const std::optional<Schema>& required_schema() const { return required_schema_; }
  bool decoder_initialized() const { return state_.initialized(); }

private:
  struct DecodeState;
  std::unique_ptr<DecodeState> build_state() const;

  Schema schema_;
  Schema nullable_schema_;
  OptionMap options_;
  std::optional<std::string> time_zone_id_;
  std::optional<Schema> required_schema_;
  SessionConfig session_;
  LazySlot<DecodeState> state_;
};

// to_csv(struct[, options]): a struct to one CSV record.
class StructsToCsv : public UnaryExpression,
                     public TypeChecked,
                     public TimeZoneAware,
                     public CodeGenerable {
public:
  StructsToCsv(OptionMap options, ExpressionPtr child,
               std::optional<std::string> time_zone_id = std::nullopt,
               const SessionConfig& session = SessionConfig());
  StructsToCsv(const StructsToCsv& other);
  ~StructsToCsv() override;

  DataType data_type() const override { return TypeId::STRING; }
  bool nullable() const override { return true; }
  Value eval(const Row& input) const override;
  std::string pretty_name() const override { return "to_csv"; }
  std::string to_sql() const override;
  ExpressionPtr with_new_children(std::vector<ExpressionPtr> children) const override;
  ExpressionPtr clone() const override;
  void prepare() const override;

  TypeCheckResult check_input_data_types() const override;

  const std::optional<std::string>& time_zone_id() const override { return time_zone_id_; }
  ExpressionPtr with_time_zone(const std::string& time_zone_id) const override;

  CompiledEval compile() const override;

  const OptionMap& options() const { return options_; }
  bool writer_initialized() const { return writer_.initialized(); }

private:
  std::unique_ptr<RecordWriter> build_writer() const;

  OptionMap options_;
  std::optional<std::string> time_zone_id_;
  SessionConfig session_;
  LazySlot<RecordWriter> writer_;
};

// schema_of_csv(csv[, options]): DDL of the schema inferred from a constant.
class SchemaOfCsv : public UnaryExpression,
                    public TypeChecked,
                    public TimeZoneAware,
                    public CodeGenerable {
public:
  SchemaOfCsv(ExpressionPtr child, OptionMap options,
              std::optional<std::string> time_zone_id = std::nullopt);
  SchemaOfCsv(const SchemaOfCsv& other);
  ~SchemaOfCsv() override;

  DataType data_type() const override { return TypeId::STRING; }
  bool nullable() const override { return false; }
  Value eval(const Row& input) const override;
  std::string pretty_name() const override { return "schema_of_csv"; }
  std::string to_sql() const override;
  ExpressionPtr with_new_children(std::vector<ExpressionPtr> children) const override;
  ExpressionPtr clone() const override;
  void prepare() const override;

  // The input must be a constant, non-null string.
  TypeCheckResult check_input_data_types() const override;

  const std::optional<std::string>& time_zone_id() const override { return time_zone_id_; }
  ExpressionPtr with_time_zone(const std::string& time_zone_id) const override;

  CompiledEval compile() const override;

  const OptionMap& options() const { return options_; }

private:
  std::unique_ptr<SchemaOfCsvEvaluator> build_evaluator() const;

  OptionMap options_;
  std::optional<std::string> time_zone_id_;
  LazySlot<SchemaOfCsvEvaluator> evaluator_;
};

} // namespace csvexpr

#endif // CSVEXPR_CSV_EXPRESSIONS_H
