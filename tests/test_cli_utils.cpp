#include "test_harness.h"

#include <limits>
#include <vector>

#include "cli_utils.h"
#include "render/result_renderer.h"
#include "test_utils.h"
#include "xpratt/context.h"
#include "xpratt/document.h"
#include "xpratt/parser.h"

using namespace xpratt;

namespace {

/// Renders while the document is alive; results only borrow its nodes.
std::string render_catalog(const std::string& expr, std::string (*renderer)(const Sequence&)) {
  Parser parser(xpath_grammar(XPathVersion::V2_0));
  Context context(Document::parse_xml(kCatalogXml));
  return renderer(select_results(*parser.parse(expr), context));
}

void test_line_col_from_offset() {
  const std::string text = "ab\ncd\n";
  auto pos = cli::line_col_from_offset(text, 0);
  expect_eq(pos.first, 1, "first line");
  expect_eq(pos.second, 1, "first column");
  pos = cli::line_col_from_offset(text, 4);
  expect_eq(pos.first, 2, "second line");
  expect_eq(pos.second, 2, "second column");
  pos = cli::line_col_from_offset(text, 100);
  expect_eq(pos.first, 3, "offset clamps to the end");
  expect_eq(pos.second, 1, "column after the last newline");
}

void test_is_valid_utf8() {
  expect_true(cli::is_valid_utf8(""), "empty");
  expect_true(cli::is_valid_utf8("count(//a) = 'h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80'"),
              "multi-byte sequences");
  expect_true(!cli::is_valid_utf8("\xC3"), "truncated sequence");
  expect_true(!cli::is_valid_utf8("\xC0\xAF"), "overlong encoding");
  expect_true(!cli::is_valid_utf8("\xED\xA0\x80"), "surrogate");
  expect_true(!cli::is_valid_utf8("\xF4\x90\x80\x80"), "past U+10FFFF");
  expect_true(!cli::is_valid_utf8("\x80"), "stray continuation byte");
}

void test_looks_like_html_path() {
  expect_true(cli::looks_like_html_path("index.html"), "html");
  expect_true(cli::looks_like_html_path("dir/PAGE.HTM"), "upper-case htm");
  expect_true(!cli::looks_like_html_path("feed.xml"), "xml");
  expect_true(!cli::looks_like_html_path("html"), "bare word");
}

void test_render_plain_results() {
  expect_str_eq(render::render_plain({}), "", "empty sequence");
  const Sequence atomics = {Item(static_cast<int64_t>(3)), Item(std::string("a b")), Item(true),
                            Item(Decimal{2.5L}), Item(0.5)};
  expect_str_eq(render::render_plain(atomics), "3\na b\ntrue\n2.5\n0.5", "atomic lines");
  expect_str_eq(render_catalog("//item[2]/@id | //item[3]", render::render_plain),
                "/catalog/item[2]/@id\n/catalog/item[3]", "nodes render as paths");
  expect_str_eq(render_catalog("/", render::render_plain), "/", "document node");
}

void test_render_json_results() {
  expect_str_eq(render::render_json({}), "[]", "empty array");
  const Sequence atomics = {Item(static_cast<int64_t>(-4)), Item(std::string("say \"hi\"")),
                            Item(false), Item(std::numeric_limits<double>::quiet_NaN()),
                            Item(std::numeric_limits<double>::infinity()), Item(Decimal{1.25L})};
  expect_str_eq(render::render_json(atomics), "[-4,\"say \\\"hi\\\"\",false,\"NaN\",\"INF\",1.25]",
                "atomic values");
  expect_str_eq(render_catalog("//item[1]/@id", render::render_json),
                "[{\"kind\":\"attribute\",\"name\":\"id\",\"path\":\"/catalog/item[1]/@id\"}]",
                "attribute node");
  expect_str_eq(render_catalog("//item[3]/name/text()", render::render_json),
                "[{\"kind\":\"text\",\"name\":null,\"path\":\"/catalog/item[3]/name/text()\"}]",
                "text node");
  expect_str_eq(render_catalog("//comment()", render::render_json),
                "[{\"kind\":\"comment\",\"name\":null,\"path\":\"/catalog/comment()\"}]",
                "comment node");
}

void test_render_json_maps_and_arrays() {
  Parser parser(xpath_grammar(XPathVersion::V3_1));
  Context context;
  const Sequence items = select_results(*parser.parse("map{'a': 1, 'b': [2, (3, 4), ()]}, [ ]"), context);
  expect_str_eq(render::render_json(items), "[{\"a\":1,\"b\":[2,[3,4],[]]},[]]",
                "maps become objects and multi-item members nest");
  expect_str_eq(render::render_plain(items), "map{\"a\":1,\"b\":[2,(3,4),()]}\n[]", "plain rendering");
}

}  // namespace

void register_cli_utils_tests(std::vector<TestCase>& tests) {
  tests.push_back({"line_col_from_offset", test_line_col_from_offset});
  tests.push_back({"is_valid_utf8", test_is_valid_utf8});
  tests.push_back({"looks_like_html_path", test_looks_like_html_path});
  tests.push_back({"render_plain_results", test_render_plain_results});
  tests.push_back({"render_json_results", test_render_json_results});
  tests.push_back({"render_json_maps_and_arrays", test_render_json_maps_and_arrays});
}
