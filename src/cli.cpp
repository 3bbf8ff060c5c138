/**
 * csvexpr - Command-line front end for the from_csv, to_csv and
 * schema_of_csv expressions.
 *
 * Every input line is one value. from_csv decodes it against a schema and
 * prints the resulting struct; to_csv decodes it the same way and re-encodes
 * it with the output options; schema_of_csv prints the inferred schema.
 */

#include "csvexpr/csv_expressions.h"
#include "csvexpr/datetime_format.h"
#include "csvexpr/ddl_parser.h"
#include "csvexpr/debug.h"
#include "csvexpr/error.h"
#include "csvexpr/expression.h"
#include "csvexpr/function_registry.h"
#include "csvexpr/record_writer.h"
#include "csvexpr/time_zone.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace std;
using namespace csvexpr;

constexpr const char* VERSION = "0.1.0";

void printVersion() { cout << "csvexpr version " << VERSION << '\n'; }

void printUsage(const char* prog) {
  cerr << "csvexpr - CSV row codec for SQL expressions\n\n";
  cerr << "Usage: " << prog << " <command> [options] [file]\n\n";
  cerr << "Commands:\n";
  cerr << "  from_csv        Decode each input line against a schema\n";
  cerr << "  to_csv          Decode each line, then encode it with the output options\n";
  cerr << "  schema_of_csv   Infer the schema of each input line\n";
  cerr << "\nArguments:\n";
  cerr << "  file            Path to an input file, or '-' to read from stdin.\n";
  cerr << "                  If omitted, reads from stdin.\n";
  cerr << "\nOptions:\n";
  cerr << "  -s <ddl>        Schema, e.g. \"a INT, b STRING\" (from_csv, to_csv)\n";
  cerr << "  -o <key=value>  CSV option (repeatable). For to_csv these apply to output\n";
  cerr << "  -i <key=value>  Input CSV option for to_csv (repeatable)\n";
  cerr << "  -z <tz>         Session time zone (default: UTC)\n";
  cerr << "  -c <name>       Corrupt record column name (default: _corrupt_record)\n";
  cerr << "  -V              Verbose tracing to stderr\n";
  cerr << "  -T              Print bind and evaluation timings to stderr\n";
  cerr << "  -h              Show this help message\n";
  cerr << "  -v              Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  echo '1,0.8' | " << prog << " from_csv -s 'a INT, b DOUBLE'\n";
  cerr << "  " << prog << " from_csv -s 'a INT, _corrupt_record STRING' -o mode=PERMISSIVE data.csv\n";
  cerr << "  echo '1;x' | " << prog << " to_csv -s 'a INT, b STRING' -i sep=';' -o sep='|'\n";
  cerr << "  echo '1,abc' | " << prog << " schema_of_csv\n";
}

static bool isStdinInput(const char* filename) {
  return filename == nullptr || strcmp(filename, "-") == 0;
}

// Reads all lines, dropping a trailing '\r' from CRLF input.
static bool readLines(const char* filename, vector<string>& lines) {
  auto consume = [&lines](istream& in) {
    string line;
    while (getline(in, line)) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      lines.push_back(std::move(line));
    }
  };
  if (isStdinInput(filename)) {
    consume(cin);
    return true;
  }
  ifstream in(filename, ios::binary);
  if (!in) {
    cerr << "Error: Could not open file '" << filename << "'\n";
    return false;
  }
  consume(in);
  return true;
}

static bool parseOption(const char* arg, vector<pair<string, string>>& out) {
  const char* eq = strchr(arg, '=');
  if (eq == nullptr || eq == arg) {
    cerr << "Error: Option must be key=value, got '" << arg << "'\n";
    return false;
  }
  out.emplace_back(string(arg, eq - arg), string(eq + 1));
  return true;
}

// Display form of a decoded value: dates and timestamps as text, strings
// as is, nested values bracketed.
static string render(const Value& value, const DataType& type, const TimeZone& zone) {
  static const DateTimeFormat date_format("yyyy-MM-dd");
  static const DateTimeFormat timestamp_format("yyyy-MM-dd HH:mm:ss.SSSSSS");

  if (value.is_null())
    return "null";
  switch (type.id()) {
  case TypeId::DATE:
    return date_format.format_date(static_cast<int32_t>(value.as_date()));
  case TypeId::TIMESTAMP:
    return timestamp_format.format_timestamp(value.as_timestamp(), zone);
  case TypeId::USER_DEFINED:
    return render(value, type.sql_type(), zone);
  case TypeId::ARRAY: {
    string out = "[";
    const auto& elements = value.elements();
    for (size_t i = 0; i < elements.size(); ++i) {
      if (i > 0)
        out += ", ";
      out += render(elements[i], type.element_type(), zone);
    }
    return out + "]";
  }
  case TypeId::MAP: {
    string out = "{";
    const auto& keys = value.map_keys();
    const auto& values = value.map_values();
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0)
        out += ", ";
      out += render(keys[i], type.key_type(), zone) + " -> " +
             render(values[i], type.value_type(), zone);
    }
    return out + "}";
  }
  case TypeId::STRUCT: {
    string out = "{";
    const auto& fields = value.fields();
    const Schema& schema = type.struct_schema();
    for (size_t i = 0; i < fields.size() && i < schema.size(); ++i) {
      if (i > 0)
        out += ", ";
      out += render(fields[i], schema.field(i).type, zone);
    }
    return out + "}";
  }
  case TypeId::FLOAT:
  case TypeId::DOUBLE: {
    double d = value.as_double();
    if (std::isnan(d))
      return "NaN";
    if (std::isinf(d))
      return d > 0 ? "Inf" : "-Inf";
    return type.id() == TypeId::FLOAT ? format_float(static_cast<float>(d)) : format_double(d);
  }
  case TypeId::STRING:
    return value.as_string();
  default:
    return value.to_string();
  }
}

struct CliSettings {
  string schema_ddl;
  vector<pair<string, string>> options;
  vector<pair<string, string>> input_options;
  SessionConfig session;
};

// Binds expr and runs it over every line, printing one result per line.
static int runLines(const CliSettings& settings, const ExpressionPtr& expr,
                    const vector<string>& lines, bool render_struct) {
  DebugTrace trace(settings.session.debug);
  TimeZone zone = resolve_time_zone(settings.session.session_time_zone);

  trace.start_phase("bind");
  ExpressionPtr bound = bind_expression(expr, settings.session);
  CompiledEval eval = compile_or_interpret(bound);
  trace.end_phase();
  trace.log("bound %s", bound->to_sql().c_str());

  trace.start_phase("evaluate");
  DataType type = bound->data_type();
  for (const auto& line : lines) {
    Value out = eval(Row{Value::string(line)});
    cout << (render_struct ? render(out, type, zone) : (out.is_null() ? "null" : out.as_string()))
         << '\n';
  }
  trace.end_phase(lines.size());
  trace.print_timing_summary();
  return 0;
}

int cmdFromCsv(const CliSettings& settings, const vector<string>& lines) {
  if (settings.schema_ddl.empty()) {
    cerr << "Error: -s option required for from_csv command\n";
    return 1;
  }
  FunctionRegistry registry(settings.session);
  ExpressionPtr expr = registry.create(
      "from_csv", {std::make_shared<BoundReference>(0, TypeId::STRING),
                   Literal::string(settings.schema_ddl), MapLiteral::from_options(settings.options)});
  return runLines(settings, expr, lines, true);
}

int cmdToCsv(const CliSettings& settings, const vector<string>& lines) {
  if (settings.schema_ddl.empty()) {
    cerr << "Error: -s option required for to_csv command\n";
    return 1;
  }
  FunctionRegistry registry(settings.session);
  ExpressionPtr decoded =
      registry.create("from_csv", {std::make_shared<BoundReference>(0, TypeId::STRING),
                                   Literal::string(settings.schema_ddl),
                                   MapLiteral::from_options(settings.input_options)});
  ExpressionPtr expr =
      registry.create("to_csv", {decoded, MapLiteral::from_options(settings.options)});
  return runLines(settings, expr, lines, false);
}

int cmdSchemaOfCsv(const CliSettings& settings, const vector<string>& lines) {
  FunctionRegistry registry(settings.session);
  DebugTrace trace(settings.session.debug);
  trace.start_phase("infer");
  // The sample must be a constant, so each line gets its own expression.
  for (const auto& line : lines) {
    ExpressionPtr expr = bind_expression(
        registry.create("schema_of_csv",
                        {Literal::string(line), MapLiteral::from_options(settings.options)}),
        settings.session);
    cout << expr->eval(Row()).as_string() << '\n';
  }
  trace.end_phase(lines.size());
  trace.print_timing_summary();
  return 0;
}

int main(int argc, char* argv[]) {
  // Unbuffered so popen() callers see every line.
  setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  string command = argv[1];
  optind = 2;

  CliSettings settings;
  int c;
  while ((c = getopt(argc, argv, "s:o:i:z:c:VThv")) != -1) {
    switch (c) {
    case 's':
      settings.schema_ddl = optarg;
      break;
    case 'o':
      if (!parseOption(optarg, settings.options))
        return 1;
      break;
    case 'i':
      if (!parseOption(optarg, settings.input_options))
        return 1;
      break;
    case 'z':
      settings.session.session_time_zone = optarg;
      break;
    case 'c':
      settings.session.column_name_of_corrupt_record = optarg;
      break;
    case 'V':
      settings.session.debug.verbose = true;
      break;
    case 'T':
      settings.session.debug.timing = true;
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  const char* filename = nullptr;
  if (optind < argc)
    filename = argv[optind];

  if (command != "from_csv" && command != "to_csv" && command != "schema_of_csv") {
    cerr << "Error: Unknown command '" << command << "'\n";
    printUsage(argv[0]);
    return 1;
  }

  vector<string> lines;
  if (!readLines(filename, lines))
    return 1;

  int result = 0;
  try {
    if (command == "from_csv")
      result = cmdFromCsv(settings, lines);
    else if (command == "to_csv")
      result = cmdToCsv(settings, lines);
    else
      result = cmdSchemaOfCsv(settings, lines);
  } catch (const CsvexprException& e) {
    cerr << "Error: [" << error_code_to_string(e.code()) << "] " << e.what() << "\n";
    result = 1;
  } catch (const InternalError& e) {
    cerr << "Internal error: " << e.what() << "\n";
    result = 2;
  }

  std::cout.flush();
  std::cerr.flush();
  fflush(stdout);
  fflush(stderr);
  return result;
}
