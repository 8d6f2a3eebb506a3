#include "test_harness.h"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "script_runner.h"
#include "test_utils.h"
#include "xpratt/grammar.h"
#include "xpratt/parser.h"
#include "xpratt/token.h"
#include "xpratt/xpath.h"

using namespace xpratt;

namespace {

struct ScriptRun {
  int code = 0;
  std::vector<std::string> executed;
  std::string out;
  std::string err;
};

ScriptRun run(const std::string& script, bool continue_on_error = false, bool quiet = false) {
  Parser parser(xpath_grammar(XPathVersion::V2_0));
  cli::ScriptRunOptions options;
  options.continue_on_error = continue_on_error;
  options.quiet = quiet;
  ScriptRun result;
  std::ostringstream out;
  std::ostringstream err;
  result.code = cli::run_expression_script(
      script, options, parser,
      [&](const Token& root) {
        if (root.symbol() == "count") throw std::runtime_error("executor failed");
        result.executed.push_back(root.tree());
      },
      out, err);
  result.out = out.str();
  result.err = err.str();
  return result;
}

void test_split_one_expression_per_line() {
  const cli::ScriptSplitResult split =
      cli::split_expression_script("1 + 1\n\n  count(//a)   \n(: note :)\n'x'\n");
  expect_true(!split.error_message.has_value(), "no split error");
  expect_eq(split.statements.size(), 3, "three statements");
  if (split.statements.size() != 3) return;
  expect_str_eq(split.statements[0].text, "1 + 1", "first statement");
  expect_eq(split.statements[0].start_pos, 0, "first offset");
  expect_str_eq(split.statements[1].text, "count(//a)", "trailing blanks trimmed");
  expect_eq(split.statements[1].start_pos, 9, "offset skips the indentation");
  expect_str_eq(split.statements[2].text, "'x'", "comment line skipped");
}

void test_split_skips_nested_multiline_comments() {
  const cli::ScriptSplitResult split =
      cli::split_expression_script("(: header\n (: nested :)\n:) 1 to 3\n2 (: inline :)");
  expect_eq(split.statements.size(), 2, "two statements");
  if (split.statements.size() != 2) return;
  expect_str_eq(split.statements[0].text, "1 to 3", "expression after the comment");
  expect_str_eq(split.statements[1].text, "2 (: inline :)", "inline comments stay for the parser");
}

void test_split_reports_unterminated_comment() {
  const cli::ScriptSplitResult split = cli::split_expression_script("1\n  (: open (: :)\n2");
  expect_true(split.error_message.has_value(), "unterminated comment is an error");
  expect_str_eq(split.error_message.value_or(""), "unterminated comment", "split error message");
  expect_eq(split.error_position, 4, "error at the opening delimiter");

  const ScriptRun result = run("1\n  (: open");
  expect_eq(static_cast<size_t>(result.code), 1, "runner fails");
  expect_str_eq(result.err, "Error: unterminated comment at line 2, column 3\n", "runner message");
  expect_true(result.executed.empty(), "nothing executed");
}

void test_run_script_prints_statement_headers() {
  const ScriptRun result = run("1\n2\n");
  expect_eq(static_cast<size_t>(result.code), 0, "success");
  expect_str_eq(result.out, "== stmt 1/2 ==\n== stmt 2/2 ==\n", "headers");
  expect_eq(result.executed.size(), 2, "both executed");

  const ScriptRun quiet = run("1\n2\n", false, true);
  expect_str_eq(quiet.out, "", "quiet hides headers");
  expect_eq(static_cast<size_t>(run("\n(: only a comment :)\n").code), 0, "empty script");
}

void test_run_script_stops_on_first_error() {
  const ScriptRun result = run("1\n1 2\n3");
  expect_eq(static_cast<size_t>(result.code), 1, "error exit");
  expect_eq(result.executed.size(), 1, "stopped after the error");
  expect_true(result.err.find("Error: statement 2/3 at line 2, column 3") != std::string::npos,
              "error location in the script: " + result.err);
  expect_true(result.err.find("ERROR[XPST0003]") != std::string::npos, "diagnostic code");
}

void test_run_script_continue_on_error() {
  const ScriptRun result = run("1 div 0\ncount(/)\n3", true);
  expect_eq(static_cast<size_t>(result.code), 1, "errors still fail the run");
  expect_eq(result.executed.size(), 1, "later statements run");
  if (!result.executed.empty()) expect_str_eq(result.executed.front(), "(3)", "last statement");
  expect_true(result.err.find("Error: statement 1/3 at line 1, column 3") != std::string::npos,
              "static evaluation error position");
  expect_true(result.err.find("ERROR[FOAR0001]") != std::string::npos, "evaluation code");
  expect_true(result.err.find("Error: statement 2/3") != std::string::npos, "executor failure");
  expect_true(result.err.find("executor failed") != std::string::npos, "executor message");
}

void test_run_script_parses_each_statement_once() {
  std::shared_ptr<Grammar> grammar = make_calculator_grammar();
  size_t parses = 0;
  RegisterOptions tick;
  tick.nud = [&parses](TokenPtr self) {
    ++parses;
    return self;
  };
  tick.evaluate = [](const Token&, Context*) { return Value::of(Item(static_cast<int64_t>(1))); };
  grammar->register_symbol("tick", tick);

  Parser parser(grammar);
  std::vector<std::string> trees;
  std::ostringstream out;
  std::ostringstream err;
  const int code = cli::run_expression_script(
      "tick\ntick + 2 * 3\n", cli::ScriptRunOptions{}, parser,
      [&](const Token& root) { trees.push_back(root.tree()); }, out, err);
  expect_eq(static_cast<size_t>(code), 0, "success");
  expect_eq(parses, 2, "one parse per statement");
  expect_eq(trees.size(), 2, "executor receives every root");
  if (trees.size() == 2) expect_str_eq(trees[1], "(+ (tick) (* (2) (3)))", "parsed tree handed over");
}

}  // namespace

void register_script_runner_tests(std::vector<TestCase>& tests) {
  tests.push_back({"split_one_expression_per_line", test_split_one_expression_per_line});
  tests.push_back({"split_skips_nested_multiline_comments", test_split_skips_nested_multiline_comments});
  tests.push_back({"split_reports_unterminated_comment", test_split_reports_unterminated_comment});
  tests.push_back({"run_script_prints_statement_headers", test_run_script_prints_statement_headers});
  tests.push_back({"run_script_stops_on_first_error", test_run_script_stops_on_first_error});
  tests.push_back({"run_script_continue_on_error", test_run_script_continue_on_error});
  tests.push_back({"run_script_parses_each_statement_once", test_run_script_parses_each_statement_once});
}
