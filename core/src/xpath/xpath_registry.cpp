#include <mutex>

#include "xpath_internal.h"
#include "xpratt/xpath.h"

namespace xpratt {

namespace {

GrammarOptions xpath_options() {
  GrammarOptions options;
  // Bytes 0x80-0xFF admit UTF-8 encoded names without classifying code points.
  options.name_pattern =
      R"([A-Za-z_\x80-\xFF][A-Za-z0-9_.\-\x80-\xFF]*(?::[A-Za-z_\x80-\xFF][A-Za-z0-9_.\-\x80-\xFF]*)?)";
  return options;
}

}  // namespace

const char* xpath_grammar_name(XPathVersion version) {
  switch (version) {
    case XPathVersion::V1_0:
      return xpath::kXPath1;
    case XPathVersion::V2_0:
      return xpath::kXPath2;
    case XPathVersion::V3_0:
      return xpath::kXPath3;
    case XPathVersion::V3_1:
      return xpath::kXPath31;
  }
  return xpath::kXPath1;
}

bool parse_xpath_version(const std::string& text, XPathVersion& out) {
  if (text == "1" || text == "1.0") {
    out = XPathVersion::V1_0;
  } else if (text == "2" || text == "2.0") {
    out = XPathVersion::V2_0;
  } else if (text == "3" || text == "3.0") {
    out = XPathVersion::V3_0;
  } else if (text == "3.1") {
    out = XPathVersion::V3_1;
  } else {
    return false;
  }
  return true;
}

void register_xpath_grammars(GrammarRegistry& registry) {
  std::shared_ptr<Grammar> xpath1 = registry.define(xpath::kXPath1, xpath_options());
  xpath::register_xpath1_operators(*xpath1);
  xpath::register_xpath1_paths(*xpath1);
  xpath::register_xpath1_functions(*xpath1);
  xpath1->build();

  std::shared_ptr<Grammar> xpath2 = registry.define(xpath::kXPath2, xpath::kXPath1);
  xpath::register_xpath2_symbols(*xpath2);
  xpath2->build();

  std::shared_ptr<Grammar> xpath3 = registry.define(xpath::kXPath3, xpath::kXPath2);
  xpath::register_xpath3_symbols(*xpath3);
  xpath3->build();

  std::shared_ptr<Grammar> xpath31 = registry.define(xpath::kXPath31, xpath::kXPath3);
  xpath::register_xpath31_symbols(*xpath31);
  xpath31->build();
}

GrammarRegistry make_xpath_registry() {
  GrammarRegistry registry;
  register_xpath_grammars(registry);
  return registry;
}

std::shared_ptr<Grammar> xpath_grammar(XPathVersion version) {
  static std::once_flag once;
  static GrammarRegistry registry;
  std::call_once(once, [] { register_xpath_grammars(registry); });
  return registry.get(xpath_grammar_name(version));
}

Sequence select_results(const Token& root, Context& context) {
  return root.select(&context).collect();
}

}  // namespace xpratt
