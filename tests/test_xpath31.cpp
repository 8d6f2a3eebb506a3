#include "test_harness.h"

#include <vector>

#include "test_utils.h"

using xpratt::XPathVersion;

namespace {

std::string v31(const std::string& expr, const std::string& xml = "") {
  return xpath_result(expr, xml, XPathVersion::V3_1);
}

std::string v31_error(const std::string& expr) {
  return xpath_error_code(expr, "", XPathVersion::V3_1);
}

void test_xpath31_map_constructor_and_lookup() {
  expect_str_eq(v31("map{'a': 1, 'b': (2, 3)}?b"), "2,3", "NCName key");
  expect_str_eq(v31("map{'a': 1}?z"), "", "missing key");
  expect_str_eq(v31("map{1: 'x', 2: 'y'}?2"), "y", "integer key");
  expect_str_eq(v31("map{'a': 1, 'b': 2}?('b', 'a')"), "2,1", "parenthesized keys");
  expect_str_eq(v31("map{'a': 1, 'b': 2}?*"), "1,2", "wildcard");
  expect_str_eq(v31("map{'a': 1, 'b': 2}"), "map{\"a\":1,\"b\":2}", "rendering");
  expect_str_eq(v31("map{}"), "map{}", "empty map");
  expect_str_eq(v31("map{'k': map{'n': 5}}?k?n"), "5", "chained lookup");
  expect_str_eq(v31("(map{'a': 1}, map{'a': 2})?a"), "1,2", "lookup over a sequence");
  expect_str_eq(v31("(map{'a': 1}, map{'a': 2})[?a = 2]?a"), "2", "unary lookup in a predicate");
  expect_str_eq(v31("map{'id': //item[2]/@id}?id", kCatalogXml), "b2", "node values");
}

void test_xpath31_array_constructors() {
  expect_str_eq(v31("[10, 20, 30]?2"), "20", "square array");
  expect_str_eq(v31("[10, (20, 21)]?*"), "10,20,21", "wildcard flattens members");
  expect_str_eq(v31("[1, 'x', (2, 3)]"), "[1,\"x\",(2,3)]", "member rendering");
  expect_str_eq(v31("[]"), "[]", "empty array");
  expect_str_eq(v31("array{1 to 3}?3"), "3", "curly array");
  expect_str_eq(v31("array:size([1, (2, 3)])"), "2", "square members keep sequences");
  expect_str_eq(v31("array:size(array{(1, 2, 3)})"), "3", "curly members are single items");
  expect_str_eq(v31("array:size([ ])"), "0", "spaced empty array");
  expect_str_eq(v31("array:get([5, 6], 2)"), "6", "array:get");
  expect_str_eq(v31("//item[2]/name", kCatalogXml), "Lamp", "predicates still apply");
  expect_str_eq(v31("(1 to 5)[. > 3]"), "4,5", "filter expressions still apply");
}

void test_xpath31_map_functions() {
  expect_str_eq(v31("map:size(map{'a': 1, 'b': 2})"), "2", "map:size");
  expect_str_eq(v31("map:keys(map{'a': 1, 'b': 2})"), "a,b", "map:keys keeps insertion order");
  expect_str_eq(v31("map:contains(map{'a': ()}, 'a')"), "true", "empty values are present");
  expect_str_eq(v31("map:get(map{'a': 1}, 'b')"), "", "map:get of a missing key");
  expect_str_eq(v31("let $m := map{'n': 3} return $m?n * 2"), "6", "bound maps");
  expect_str_eq(v31("map{'map': 1}?map"), "1", "keyword-like keys");
  expect_str_eq(v31("count(//map)", "<r><map/><array/></r>"), "1", "map stays usable as a name");
}

void test_xpath31_collection_errors() {
  expect_str_eq(v31_error("map{'a': 1, 'a': 2}"), "XQDY0137", "duplicate key");
  expect_str_eq(v31_error("map{(1, 2): 3}"), "XPTY0004", "keys are single items");
  expect_str_eq(v31_error("[1, 2]?3"), "FOAY0001", "array index out of bounds");
  expect_str_eq(v31_error("[1, 2]?0"), "FOAY0001", "array positions start at 1");
  expect_str_eq(v31_error("[1]?a"), "XPTY0004", "array positions are integers");
  expect_str_eq(v31_error("1?a"), "XPTY0004", "lookup on an atomic value");
  expect_str_eq(v31_error("string(map{})"), "FOTY0013", "maps have no string value");
  expect_str_eq(v31_error("map:size([1])"), "XPTY0004", "map function on an array");
  expect_str_eq(v31_error("map{'a' 1}"), "XPST0003", "missing colon");
  expect_str_eq(v31_error("[1, 2"), "XPST0003", "unclosed array");
}

void test_xpath31_stays_out_of_earlier_levels() {
  auto v3 = xpratt::xpath_grammar(XPathVersion::V3_0);
  auto v31_grammar = xpratt::xpath_grammar(XPathVersion::V3_1);
  expect_true(!v3->contains("map") && v31_grammar->contains("map"), "map is a 3.1 symbol");
  expect_str_eq(xpath_error_code("[1, 2]", "", XPathVersion::V3_0), "XPST0003", "no arrays in 3.0");
  expect_str_eq(v31("let $x := 1 return $x || 'a'"), "1a", "3.1 inherits 3.0");
}

}  // namespace

void register_xpath31_tests(std::vector<TestCase>& tests) {
  tests.push_back({"xpath31_map_constructor_and_lookup", test_xpath31_map_constructor_and_lookup});
  tests.push_back({"xpath31_array_constructors", test_xpath31_array_constructors});
  tests.push_back({"xpath31_map_functions", test_xpath31_map_functions});
  tests.push_back({"xpath31_collection_errors", test_xpath31_collection_errors});
  tests.push_back({"xpath31_stays_out_of_earlier_levels", test_xpath31_stays_out_of_earlier_levels});
}
