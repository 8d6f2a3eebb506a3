#include "test_harness.h"

#include <string>
#include <vector>

#include "test_utils.h"

using xpratt::XPathVersion;

namespace {

std::string v1(const std::string& expr, const std::string& xml = "") {
  return xpath_result(expr, xml, XPathVersion::V1_0);
}

void test_xpath1_arithmetic_uses_doubles() {
  expect_str_eq(v1("1 + 2 * 3"), "7", "precedence");
  expect_str_eq(v1("7 div 2"), "3.5", "div");
  expect_str_eq(v1("7 mod 3"), "1", "mod");
  expect_str_eq(v1("-3 + 1"), "-2", "unary minus");
  expect_str_eq(v1("--3"), "3", "double negation");
  expect_str_eq(v1("1 div 0"), "INF", "division by zero is infinite");
  expect_str_eq(v1("0 div 0"), "NaN", "zero by zero is NaN");
  expect_str_eq(v1("1 + 'a'"), "NaN", "non-numeric string becomes NaN");
  expect_str_eq(v1("10 - 4 - 3"), "3", "left associative");
}

void test_xpath1_logic_and_comparisons() {
  expect_str_eq(v1("1 = 1 and 2 > 1"), "true", "and");
  expect_str_eq(v1("1 > 2 or 2 >= 2"), "true", "or");
  expect_str_eq(v1("'abc' = 'abc'"), "true", "string equality");
  expect_str_eq(v1("'abc' != 'abd'"), "true", "string inequality");
  expect_str_eq(v1("'10' = 10.0"), "true", "numbers win over strings");
  expect_str_eq(v1("true() = 'x'"), "true", "booleans compare by effective value");
  expect_str_eq(v1("//item/@price > 20", kCatalogXml), "true", "node-set existential comparison");
  expect_str_eq(v1("//item/@price = 7", kCatalogXml), "true", "node-set equality");
  expect_str_eq(v1("//missing = 1", kCatalogXml), "false", "empty node-set compares false");
}

void test_xpath1_string_functions() {
  expect_str_eq(v1("concat('a', 'b', 'c')"), "abc", "concat");
  expect_str_eq(v1("contains('hello', 'ell')"), "true", "contains");
  expect_str_eq(v1("starts-with('hello', 'he')"), "true", "starts-with");
  expect_str_eq(v1("string-length('h\xC3\xA9llo')"), "5", "length counts code points");
  expect_str_eq(v1("normalize-space('  a   b ')"), "a b", "normalize-space");
  expect_str_eq(v1("string(12)"), "12", "string of a number");
  expect_str_eq(v1("string(//item[2]/name)", kCatalogXml), "Lamp", "string of a node");
  expect_str_eq(v1("string-length()", "<a>four</a>"), "4", "context item default");
}

void test_xpath1_numeric_and_boolean_functions() {
  expect_str_eq(v1("round(2.5)"), "3", "round half up");
  expect_str_eq(v1("round(-2.5)"), "-2", "round half up for negatives");
  expect_str_eq(v1("floor(2.7)"), "2", "floor");
  expect_str_eq(v1("ceiling(2.1)"), "3", "ceiling");
  expect_str_eq(v1("number('12')"), "12", "number of a numeric string");
  expect_str_eq(v1("number('abc')"), "NaN", "number of text");
  expect_str_eq(v1("boolean('')"), "false", "empty string is false");
  expect_str_eq(v1("not(//missing)", kCatalogXml), "true", "not of an empty node-set");
  expect_str_eq(v1("true() and not(false())"), "true", "constants");
  expect_str_eq(v1("sum(//item/@price)", kCatalogXml), "42", "sum");
  expect_str_eq(v1("count(//item)", kCatalogXml), "3", "count");
}

void test_xpath1_node_functions() {
  expect_str_eq(v1("name(//item[1])", kCatalogXml), "item", "name of a node");
  expect_str_eq(v1("local-name(/*)", kCatalogXml), "catalog", "local-name of the root element");
  expect_str_eq(v1("name(//missing)", kCatalogXml), "", "name of an empty node-set");
  expect_str_eq(v1("position()", kCatalogXml), "1", "position at the root");
  expect_str_eq(v1("last()", kCatalogXml), "1", "size at the root");
  expect_str_eq(v1("//item[position() = last()]/@id", kCatalogXml), "c3", "position in a predicate");
}

void test_xpath1_concat_takes_any_number_of_arguments() {
  std::string expr = "concat('a'";
  std::string expected = "a";
  for (int i = 0; i < 300; ++i) {
    expr += ", " + std::to_string(i % 10);
    expected += std::to_string(i % 10);
  }
  expr += ")";
  expect_str_eq(v1(expr), expected, "300 arguments");
  expect_str_eq(v1("string-length(" + expr + ")"), "301", "as a nested argument");
}

void test_xpath1_names_may_be_utf8() {
  const std::string xml = "<r><caf\xC3\xA9>1</caf\xC3\xA9><\xC3\xA9t\xC3\xA9>2</\xC3\xA9t\xC3\xA9></r>";
  expect_str_eq(v1("//caf\xC3\xA9", xml), "1", "non-ASCII bytes inside a name");
  expect_str_eq(v1("//\xC3\xA9t\xC3\xA9 + 1", xml), "3", "non-ASCII first character");
  expect_str_eq(v1("name(/r/*[2])", xml), "\xC3\xA9t\xC3\xA9", "names round-trip");
}

void test_xpath1_errors() {
  expect_str_eq(xpath_error_code("concat('a')", "", XPathVersion::V1_0), "XPST0003",
                "arity is checked while parsing");
  expect_str_eq(xpath_error_code("count(1, 2)", "", XPathVersion::V1_0), "XPST0003",
                "too many arguments");
  expect_str_eq(xpath_error_code("unknown-fn(1)", "", XPathVersion::V1_0), "XPST0003",
                "unknown function");
  expect_str_eq(xpath_error_code("$missing", kCatalogXml, XPathVersion::V1_0), "XPST0008",
                "unknown variable");
  expect_str_eq(xpath_error_code("//item", "", XPathVersion::V1_0), "XPDY0002",
                "paths need a context item");
  expect_str_eq(xpath_error_code("1 (: note :)", "", XPathVersion::V1_0), "XPST0003",
                "no comments at level 1.0");
  expect_str_eq(xpath_error_code("1 to 3", "", XPathVersion::V1_0), "XPST0003",
                "range is not part of level 1.0");
  expect_str_eq(xpath_error_code("(1, 2)", "", XPathVersion::V1_0), "XPST0003",
                "sequences are not part of level 1.0");
}

}  // namespace

void register_xpath1_tests(std::vector<TestCase>& tests) {
  tests.push_back({"xpath1_arithmetic_uses_doubles", test_xpath1_arithmetic_uses_doubles});
  tests.push_back({"xpath1_logic_and_comparisons", test_xpath1_logic_and_comparisons});
  tests.push_back({"xpath1_string_functions", test_xpath1_string_functions});
  tests.push_back({"xpath1_numeric_and_boolean_functions", test_xpath1_numeric_and_boolean_functions});
  tests.push_back({"xpath1_node_functions", test_xpath1_node_functions});
  tests.push_back({"xpath1_concat_takes_any_number_of_arguments",
                   test_xpath1_concat_takes_any_number_of_arguments});
  tests.push_back({"xpath1_names_may_be_utf8", test_xpath1_names_may_be_utf8});
  tests.push_back({"xpath1_errors", test_xpath1_errors});
}
