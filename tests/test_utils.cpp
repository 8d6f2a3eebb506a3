#include "test_utils.h"

#include <libxml/tree.h>

#include "xpratt/context.h"
#include "xpratt/document.h"
#include "xpratt/errors.h"
#include "xpratt/parser.h"

using namespace xpratt;

namespace {

int64_t int_operand(const Token& self, size_t index, Context* context) {
  const Value value = self.child(index).evaluate(context);
  if (!value.is_scalar() || !std::holds_alternative<int64_t>(value.item())) {
    throw self.wrong_type("integer operand expected");
  }
  return std::get<int64_t>(value.item());
}

void integer_operator(Grammar& grammar, const std::string& symbol, int bp, bool right,
                      int64_t (*apply)(int64_t, int64_t)) {
  TokenClass& token_class = right ? grammar.infixr(symbol, bp) : grammar.infix(symbol, bp);
  MethodBinder(token_class).evaluate([apply](const Token& self, Context* context) {
    return Value::of(Item(apply(int_operand(self, 0, context), int_operand(self, 1, context))));
  });
}

int64_t power(int64_t base, int64_t exponent) {
  int64_t out = 1;
  for (int64_t i = 0; i < exponent; ++i) out *= base;
  return out;
}

}  // namespace

const char* const kCatalogXml =
    "<catalog>"
    "<item id=\"a1\" price=\"10\"><name>Pen</name><tag>office</tag></item>"
    "<item id=\"b2\" price=\"25\"><name>Lamp</name><tag>home</tag><tag>light</tag></item>"
    "<!-- discontinued -->"
    "<item id=\"c3\" price=\"7\"><name>Cup</name></item>"
    "</catalog>";

std::shared_ptr<Grammar> make_calculator_grammar() {
  auto grammar = std::make_shared<Grammar>("calculator");
  for (const char* symbol : {special::kInteger, special::kDecimal, special::kFloat, special::kString,
                             special::kName}) {
    grammar->literal(symbol);
  }
  integer_operator(*grammar, "+", 10, false, [](int64_t a, int64_t b) { return a + b; });
  integer_operator(*grammar, "-", 10, false, [](int64_t a, int64_t b) { return a - b; });
  integer_operator(*grammar, "*", 20, false, [](int64_t a, int64_t b) { return a * b; });
  integer_operator(*grammar, "/", 20, false, [](int64_t a, int64_t b) { return b == 0 ? 0 : a / b; });
  integer_operator(*grammar, "^", 30, true, power);
  MethodBinder(grammar->prefix("~", 40)).evaluate([](const Token& self, Context* context) {
    return Value::of(Item(-int_operand(self, 0, context)));
  });
  RegisterOptions group;
  group.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    self->append(parser.expression());
    parser.advance({")"}, "expected ')'");
    return self;
  };
  group.evaluate = [](const Token& self, Context* context) { return self.child(0).evaluate(context); };
  grammar->register_symbol("(", group);
  grammar->register_symbol(")");
  grammar->build();
  return grammar;
}

std::string join_items(const Sequence& items, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0) out += separator;
    if (const auto* ref = std::get_if<NodeRef>(&items[i])) {
      xmlChar* content = xmlNodeGetContent(ref->node);
      if (content != nullptr) {
        out += reinterpret_cast<const char*>(content);
        xmlFree(content);
      }
    } else {
      out += render_item(items[i]);
    }
  }
  return out;
}

std::string xpath_result(const std::string& expr, const std::string& xml, XPathVersion version) {
  Parser parser(xpath_grammar(version));
  TokenPtr root = parser.parse(expr);
  if (xml.empty()) {
    Context context;
    return join_items(select_results(*root, context));
  }
  Context context(Document::parse_xml(xml));
  return join_items(select_results(*root, context));
}

std::string xpath_error_code(const std::string& expr, const std::string& xml, XPathVersion version) {
  try {
    xpath_result(expr, xml, version);
  } catch (const Error& err) {
    return err.code();
  }
  return "";
}

std::string xpath_tree(const std::string& expr, XPathVersion version) {
  Parser parser(xpath_grammar(version), ParserOptions{false});
  return parser.parse(expr)->tree();
}
