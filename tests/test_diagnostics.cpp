#include "test_harness.h"

#include <vector>

#include "xpratt/diagnostics.h"
#include "xpratt/parser.h"
#include "xpratt/version.h"
#include "xpratt/xpath.h"

using namespace xpratt;

namespace {

std::vector<Diagnostic> lint(const std::string& source, XPathVersion version = XPathVersion::V2_0) {
  Parser parser(xpath_grammar(version));
  return lint_expression(parser, source);
}

void test_lint_accepts_valid_expressions() {
  expect_true(lint("count(//item) + 1").empty(), "valid expression");
  expect_true(lint("$x + 1").empty(), "variables need no binding to lint");
  expect_true(lint("position()").empty(), "context functions need no document to lint");
}

void test_lint_syntax_diagnostic_has_stable_code_and_span() {
  const std::vector<Diagnostic> diagnostics = lint("1 2");
  expect_eq(diagnostics.size(), 1, "one syntax diagnostic");
  if (diagnostics.empty()) return;
  const Diagnostic& first = diagnostics.front();
  expect_true(first.severity == DiagnosticSeverity::Error, "syntax severity is error");
  expect_str_eq(first.code, "XPST0003", "syntax code");
  expect_str_eq(first.message, "unexpected literal 2", "syntax message");
  expect_eq(first.span.start_line, 1, "span line");
  expect_eq(first.span.start_col, 3, "span column");
  expect_eq(first.span.byte_start, 2, "span byte start");
  expect_eq(first.span.byte_end, 3, "span byte end");
  expect_true(first.doc_ref.find("XPST0003") != std::string::npos, "doc ref names the code");
  expect_true(has_error_diagnostics(diagnostics), "errors are reported");
}

void test_lint_points_at_the_open_parenthesis() {
  const std::vector<Diagnostic> diagnostics = lint("(1 + 2 3");
  expect_eq(diagnostics.size(), 1, "one diagnostic");
  if (diagnostics.empty()) return;
  const Diagnostic& first = diagnostics.front();
  expect_eq(first.span.start_col, 8, "error at the stray operand");
  expect_str_eq(first.help, "Close the open parenthesis before continuing.", "paren help");
  expect_eq(first.related.size(), 1, "related note");
  if (first.related.empty()) return;
  expect_str_eq(first.related.front().message, "'(' opened here", "related message");
  expect_eq(first.related.front().span.start_col, 1, "related column");
}

void test_lint_reports_empty_sources_and_unknown_symbols() {
  std::vector<Diagnostic> diagnostics = lint("   ");
  expect_eq(diagnostics.size(), 1, "empty source");
  if (!diagnostics.empty()) {
    expect_str_eq(diagnostics.front().message, "source is empty", "empty source message");
    expect_str_eq(diagnostics.front().help, "Provide a non-empty expression.", "empty help");
  }
  diagnostics = lint("1 + #");
  expect_eq(diagnostics.size(), 1, "unknown symbol");
  if (!diagnostics.empty()) {
    expect_str_eq(diagnostics.front().message, "unknown symbol '#'", "unknown symbol message");
    expect_eq(diagnostics.front().span.start_col, 5, "unknown symbol column");
  }
}

void test_lint_reports_static_evaluation_errors() {
  const std::vector<Diagnostic> diagnostics = lint("1 div 0");
  expect_eq(diagnostics.size(), 1, "static evaluation error");
  if (diagnostics.empty()) return;
  expect_str_eq(diagnostics.front().code, "FOAR0001", "division code");
  expect_eq(diagnostics.front().span.start_col, 3, "anchored at the operator");
  expect_str_eq(diagnostics.front().help, "Guard the divisor against zero.", "division help");
  expect_true(lint("1 div 0", XPathVersion::V1_0).empty(), "1.0 division is infinite");
}

void test_diagnostic_text_renderer_contains_help_and_caret() {
  const std::string rendered = render_diagnostics_text(lint("1 +\n  2 3"));
  expect_true(rendered.find("ERROR[XPST0003]: unexpected literal 3") != std::string::npos,
              "text header");
  expect_true(rendered.find(" --> line 2, col 5") != std::string::npos, "text location");
  expect_true(rendered.find("2 |   2 3\n  |     ^") != std::string::npos, "caret frame");
  expect_true(rendered.find("help:") != std::string::npos, "text help");
}

void test_diagnostic_json_renderer_has_stable_fields() {
  const std::string json = render_diagnostics_json(lint("1 2"));
  expect_true(json.rfind("[{\"severity\":\"ERROR\",\"code\":\"XPST0003\"", 0) == 0, "json prefix");
  expect_true(json.find("\"span\":{\"start_line\":1,\"start_col\":3,\"end_line\":1,\"end_col\":4,"
                        "\"byte_start\":2,\"byte_end\":3}") != std::string::npos,
              "json span");
  expect_true(json.find("\"related\":[]") != std::string::npos, "json related");
  expect_str_eq(render_diagnostics_json({}), "[]", "empty json");
  expect_str_eq(json_escape("a\"b\\\n"), "a\\\"b\\\\\\n", "json escape");
}

void test_evaluation_and_runtime_diagnostics() {
  const EvaluationError error("XPDY0002", "context item is absent", 4, 1, 5);
  const Diagnostic d = make_evaluation_diagnostic("1 + .", error);
  expect_str_eq(d.code, "XPDY0002", "evaluation code");
  expect_eq(d.span.start_col, 5, "evaluation column");
  expect_true(d.help.find("--input") != std::string::npos, "evaluation help");

  Parser parser(xpath_grammar(XPathVersion::V2_0));
  std::vector<Diagnostic> runtime = diagnose_failure(parser, "count(//a)", "Failed to open file: x.xml");
  expect_eq(runtime.size(), 1, "runtime diagnostic");
  if (!runtime.empty()) expect_str_eq(runtime.front().code, "XPR-RUN-0002", "io code");
  runtime = diagnose_failure(parser, "count(", "parse failed");
  expect_eq(runtime.size(), 1, "syntax wins over the message");
  if (!runtime.empty()) expect_str_eq(runtime.front().code, "XPST0003", "syntax code");
  expect_str_eq(make_runtime_diagnostic("1", "boom").code, "XPR-RUN-0001", "generic runtime code");
}

void test_version_string_names_the_build() {
  const VersionInfo info = get_version_info();
  expect_true(!info.version.empty(), "version is set");
  const std::string text = version_string();
  expect_true(text.rfind("xpratt " + info.version + " (", 0) == 0, "version prefix");
  expect_true(text.back() == ')', "commit suffix");
}

}  // namespace

void register_diagnostic_tests(std::vector<TestCase>& tests) {
  tests.push_back({"lint_accepts_valid_expressions", test_lint_accepts_valid_expressions});
  tests.push_back({"lint_syntax_diagnostic_has_stable_code_and_span",
                   test_lint_syntax_diagnostic_has_stable_code_and_span});
  tests.push_back({"lint_points_at_the_open_parenthesis", test_lint_points_at_the_open_parenthesis});
  tests.push_back({"lint_reports_empty_sources_and_unknown_symbols",
                   test_lint_reports_empty_sources_and_unknown_symbols});
  tests.push_back({"lint_reports_static_evaluation_errors", test_lint_reports_static_evaluation_errors});
  tests.push_back({"diagnostic_text_renderer_contains_help_and_caret",
                   test_diagnostic_text_renderer_contains_help_and_caret});
  tests.push_back({"diagnostic_json_renderer_has_stable_fields",
                   test_diagnostic_json_renderer_has_stable_fields});
  tests.push_back({"evaluation_and_runtime_diagnostics", test_evaluation_and_runtime_diagnostics});
  tests.push_back({"version_string_names_the_build", test_version_string_names_the_build});
}
