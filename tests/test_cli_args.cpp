#include "test_harness.h"

#include <cstdlib>
#include <sstream>
#include <vector>

#include "cli_args.h"

namespace {

bool parse(std::vector<const char*> args, xpratt::cli::CliOptions& options, std::string& error) {
  args.insert(args.begin(), "xpratt");
  return xpratt::cli::parse_cli_args(static_cast<int>(args.size()), const_cast<char**>(args.data()),
                                     options, error);
}

void test_parse_cli_args_accepts_script_flags() {
  xpratt::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--expr-file", "script.xp", "--continue-on-error", "--quiet"}, options, error);
  expect_true(ok, "parse_cli_args accepts script flags");
  expect_str_eq(options.expr_file, "script.xp", "expr-file value parsed");
  expect_true(options.continue_on_error, "continue-on-error parsed");
  expect_true(options.quiet, "quiet parsed");
}

void test_parse_cli_args_defaults() {
  xpratt::cli::CliOptions options;
  std::string error;
  expect_true(parse({"--expr", "1 + 1"}, options, error), "expression only");
  expect_str_eq(options.expr, "1 + 1", "expression");
  expect_str_eq(options.grammar, "2.0", "default grammar");
  expect_str_eq(options.output_mode, "plain", "default mode");
  expect_true(options.static_evaluation, "static evaluation on by default");
  expect_eq(static_cast<size_t>(options.timeout_ms), 5000, "default timeout");
}

void test_parse_cli_args_reads_evaluation_flags() {
  xpratt::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--expr", "$a", "--input", "page.htm", "--html", "--grammar", "3.0", "--var",
                   "$a=1", "--var", "b=x=y", "--mode", "json", "--tree", "--no-static-eval",
                   "--timeout-ms", "250"},
                  options, error);
  expect_true(ok, "evaluation flags accepted");
  expect_str_eq(options.input, "page.htm", "input");
  expect_true(options.html, "html");
  expect_str_eq(options.grammar, "3.0", "grammar");
  expect_eq(options.variables.size(), 2, "two bindings");
  if (options.variables.size() == 2) {
    expect_str_eq(options.variables[0].first, "a", "leading '$' is dropped");
    expect_str_eq(options.variables[1].second, "x=y", "value keeps later '='");
  }
  expect_str_eq(options.output_mode, "json", "mode");
  expect_true(options.print_tree, "tree");
  expect_true(!options.static_evaluation, "static evaluation off");
  expect_eq(static_cast<size_t>(options.timeout_ms), 250, "timeout");
}

void test_parse_cli_args_rejects_missing_value() {
  xpratt::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--expr-file"}, options, error);
  expect_true(!ok, "missing value is rejected");
  expect_true(error.find("Missing value for --expr-file") != std::string::npos,
              "missing value has clear error");
}

void test_parse_cli_args_rejects_unknown_argument() {
  xpratt::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--unknown"}, options, error);
  expect_true(!ok, "unknown argument is rejected");
  expect_str_eq(error, "Unknown argument: --unknown", "unknown argument error");
}

void test_parse_cli_args_rejects_invalid_values() {
  struct Case {
    std::vector<const char*> args;
    const char* error_prefix;
  };
  const std::vector<Case> cases = {
      {{"--expr", "1", "--expr-file", "a.xp"}, "Error: --expr and --expr-file are mutually exclusive"},
      {{"--grammar", "4.0"}, "Invalid --grammar value"},
      {{"--mode", "table"}, "Invalid --mode value"},
      {{"--format", "json"}, "--format is only supported with --lint"},
      {{"--lint", "--format", "xml"}, "Invalid --format value"},
      {{"--var", "=1"}, "Invalid --var value"},
      {{"--var", "$=1"}, "Invalid --var value"},
      {{"--var", "flag"}, "Invalid --var value"},
      {{"--timeout-ms", "0"}, "Invalid --timeout-ms value"},
      {{"--timeout-ms", "12ms"}, "Invalid --timeout-ms value"},
  };
  for (const Case& c : cases) {
    xpratt::cli::CliOptions options;
    std::string error;
    const bool ok = parse(c.args, options, error);
    expect_true(!ok, std::string("rejected: ") + c.error_prefix);
    expect_true(error.rfind(c.error_prefix, 0) == 0, "error message: " + error);
  }
}

void test_parse_cli_args_lint_takes_optional_expression() {
  xpratt::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--lint", "count(//a", "--format", "json"}, options, error);
  expect_true(ok, "lint with an expression");
  expect_true(options.lint, "lint flag");
  expect_str_eq(options.expr, "count(//a", "lint expression");
  expect_str_eq(options.lint_format, "json", "lint format");

  xpratt::cli::CliOptions file_options;
  ok = parse({"--lint", "--expr-file", "a.xp"}, file_options, error);
  expect_true(ok, "lint a file");
  expect_true(file_options.expr.empty(), "flag after --lint is not an expression");
  expect_str_eq(file_options.expr_file, "a.xp", "lint file");
}

void test_environment_grammar_is_overridden_by_flags() {
  setenv("XPRATT_GRAMMAR", "1.0", 1);
  xpratt::cli::CliOptions options;
  xpratt::cli::apply_environment(options);
  expect_str_eq(options.grammar, "1.0", "environment grammar");
  std::string error;
  expect_true(parse({"--grammar", "3"}, options, error), "flag accepted");
  expect_str_eq(options.grammar, "3", "flag wins");
  expect_true(parse({"--grammar", "3.1"}, options, error), "3.1 accepted");
  expect_str_eq(options.grammar, "3.1", "3.1 level");
  unsetenv("XPRATT_GRAMMAR");
}

void test_help_mentions_every_mode() {
  std::ostringstream help;
  xpratt::cli::print_help(help);
  for (const char* flag : {"--expr", "--expr-file", "--input", "--grammar", "--var", "--lint",
                           "--mode", "--tree"}) {
    expect_true(help.str().find(flag) != std::string::npos, std::string("help lists ") + flag);
  }
  std::ostringstream startup;
  xpratt::cli::print_startup_help(startup);
  expect_true(!startup.str().empty(), "startup help");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_accepts_script_flags", test_parse_cli_args_accepts_script_flags});
  tests.push_back({"parse_cli_args_defaults", test_parse_cli_args_defaults});
  tests.push_back({"parse_cli_args_reads_evaluation_flags", test_parse_cli_args_reads_evaluation_flags});
  tests.push_back({"parse_cli_args_rejects_missing_value", test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_unknown_argument",
                   test_parse_cli_args_rejects_unknown_argument});
  tests.push_back({"parse_cli_args_rejects_invalid_values", test_parse_cli_args_rejects_invalid_values});
  tests.push_back({"parse_cli_args_lint_takes_optional_expression",
                   test_parse_cli_args_lint_takes_optional_expression});
  tests.push_back({"environment_grammar_is_overridden_by_flags",
                   test_environment_grammar_is_overridden_by_flags});
  tests.push_back({"help_mentions_every_mode", test_help_mentions_every_mode});
}
