#include "test_harness.h"

#include <memory>
#include <string>
#include <vector>

#include "test_utils.h"
#include "xpratt/errors.h"
#include "xpratt/grammar.h"
#include "xpratt/parser.h"
#include "xpratt/value.h"

using namespace xpratt;

namespace {

void test_register_symbol_only_raises_binding_powers() {
  Grammar grammar("toy");
  grammar.infix("+", 10);
  RegisterOptions lower;
  lower.lbp = 5;
  grammar.register_symbol("+", lower);
  expect_eq(static_cast<size_t>(grammar.at("+").lbp), 10, "lower lbp is ignored");
  RegisterOptions higher;
  higher.lbp = 15;
  grammar.register_symbol("+", higher);
  expect_eq(static_cast<size_t>(grammar.at("+").lbp), 15, "higher lbp is applied");
  expect_eq(static_cast<size_t>(grammar.at("+").rbp), 10, "rbp untouched");
}

void test_register_symbol_keeps_first_label() {
  Grammar grammar("toy");
  grammar.infix("-", 10);
  grammar.prefix("-", 40);
  const TokenClass& minus = grammar.at("-");
  expect_true(minus.label == Role::Operator, "label chosen at creation is kept");
  expect_true(static_cast<bool>(minus.nud), "prefix added a nud");
  expect_true(static_cast<bool>(minus.led), "infix led survives");
  expect_eq(static_cast<size_t>(minus.lbp), 40, "binding power raised by the prefix");
}

void test_repeated_registration_is_idempotent() {
  std::shared_ptr<Grammar> grammar = make_calculator_grammar();
  const size_t symbols = grammar->size();
  const TokenClass* plus = &grammar->at("+");
  Parser before(grammar);
  const std::string tree = before.parse("1 + 2 * 3")->tree();

  TokenClass& again = grammar->infix("+", 10);
  grammar->infix("+", 10);
  grammar->register_symbol(")");
  grammar->register_symbol(")");
  expect_eq(grammar->size(), symbols, "no symbol added");
  expect_true(&again == plus && &grammar->at("+") == plus, "same class object");
  expect_eq(static_cast<size_t>(plus->lbp), 10, "binding power unchanged");
  expect_true(plus->label == Role::Operator, "label unchanged");

  Parser after(grammar);
  expect_str_eq(after.parse("1 + 2 * 3")->tree(), tree, "same tree");
  expect_str_eq(render_item(after.parse("1 + 2 * 3")->evaluate(nullptr).item()), "7", "same value");
  expect_throws<ParseError>([&] { after.parse("1 +"); }, "same errors");
}

void test_register_symbol_rejects_bad_symbols() {
  Grammar grammar("toy");
  expect_throws<RegistrationError>([&] { grammar.register_symbol(""); }, "empty symbol");
  try {
    grammar.register_symbol("a b");
    expect_true(false, "whitespace symbol must be rejected");
  } catch (const RegistrationError& err) {
    expect_true(err.kind() == RegistrationErrorKind::WhitespaceInSymbol, "whitespace kind");
  }
}

void test_register_class_from_other_grammar_is_rejected() {
  Grammar first("first");
  Grammar second("second");
  TokenClass& plus = first.infix("+", 10);
  second.infix("+", 10);
  try {
    second.register_symbol(plus);
    expect_true(false, "foreign class must be rejected");
  } catch (const RegistrationError& err) {
    expect_true(err.kind() == RegistrationErrorKind::UnregisteredClass, "unregistered class kind");
  }
}

void test_method_binder_bind_requires_existing_method() {
  Grammar grammar("toy");
  MethodBinder binder = grammar.method("marker", 0);
  expect_throws<RegistrationError>(
      [&] { binder.bind("missing", [](const Token&, Context*) { return Value(); }); },
      "bind refuses unknown method names");
  RegisterOptions options;
  options.methods["check"] = [](const Token&, Context*) { return Value::of(Item(false)); };
  grammar.register_symbol("marker", options);
  binder.bind("check", [](const Token&, Context*) { return Value::of(Item(true)); });
  expect_true(static_cast<bool>(grammar.at("marker").methods.at("check")), "bound method kept");
}

void test_class_names_follow_symbols_and_labels() {
  Grammar grammar("toy");
  expect_str_eq(grammar.infix("+", 10).class_name, "PlusSignOperator", "punctuation name");
  expect_str_eq(grammar.infix("!=", 10).class_name, "ExclamationMarkEqualsSignOperator",
                "multi-character punctuation name");
  RegisterOptions axis;
  axis.label = Label({Role::Axis, Role::KindTest});
  expect_str_eq(grammar.register_symbol("attribute", axis).class_name, "AttributeAxisKindTest",
                "multi-role suffix");
  expect_str_eq(symbol_to_class_name("descendant-or-self"), "DescendantOrSelf", "dashed name");
  expect_str_eq(symbol_to_class_name("(integer)"), "Integer", "special symbol name");
  expect_str_eq(symbol_to_class_name("--"), "HyphenMinusHyphenMinus", "dash-only symbol");
}

void test_duplicate_copies_behavior() {
  auto grammar = make_calculator_grammar();
  grammar->duplicate("+", "plus");
  Parser parser(grammar);
  TokenPtr root = parser.parse("2 plus 3");
  expect_str_eq(render_value(root->evaluate()), "5", "duplicate shares evaluate and led");
  expect_eq(static_cast<size_t>(grammar->at("plus").lbp), 10, "duplicate copies binding power");
}

void test_unregister_removes_symbol() {
  auto grammar = make_calculator_grammar();
  grammar->unregister("^");
  expect_true(!grammar->contains("^"), "symbol removed");
  Parser parser(grammar);
  expect_throws<ParseError>([&] { parser.parse("2 ^ 3"); }, "removed symbol no longer parses");
}

void test_derived_grammar_is_isolated() {
  GrammarRegistry registry;
  auto base = registry.define("base");
  base->literal(special::kInteger);
  base->infix("+", 10);
  auto derived = registry.define("derived", "base");
  derived->infix("*", 20);
  derived->infix("+", 30);
  expect_true(!base->contains("*"), "derived additions do not leak into the base");
  expect_eq(static_cast<size_t>(base->at("+").lbp), 10, "base class left untouched");
  expect_eq(static_cast<size_t>(derived->at("+").lbp), 30, "derived class updated");
  expect_true(derived->contains(special::kInteger), "derived inherits base symbols");
}

void test_registry_rejects_duplicate_names() {
  GrammarRegistry registry;
  registry.define("toy");
  try {
    registry.define("toy");
    expect_true(false, "second definition must be rejected");
  } catch (const RegistrationError& err) {
    expect_true(err.kind() == RegistrationErrorKind::DuplicateGrammar, "duplicate kind");
  }
  expect_throws<RegistrationError>([&] { registry.get("missing"); }, "unknown grammar");
  expect_true(registry.find("missing") == nullptr, "find returns null");
  expect_eq(registry.names().size(), 1, "one grammar defined");
}

void test_build_registers_special_symbols() {
  Grammar grammar("toy");
  grammar.build();
  expect_true(grammar.contains(special::kStart), "(start) registered");
  expect_true(grammar.contains(special::kEnd), "(end) registered");
  expect_true(grammar.contains(special::kUnknown), "(unknown) registered");
  expect_true(grammar.is_name_like("abc"), "default name pattern");
  expect_true(!grammar.is_name_like("1abc"), "names can't start with a digit");
}

}  // namespace

void register_grammar_tests(std::vector<TestCase>& tests) {
  tests.push_back({"register_symbol_only_raises_binding_powers",
                   test_register_symbol_only_raises_binding_powers});
  tests.push_back({"register_symbol_keeps_first_label", test_register_symbol_keeps_first_label});
  tests.push_back({"repeated_registration_is_idempotent", test_repeated_registration_is_idempotent});
  tests.push_back({"register_symbol_rejects_bad_symbols", test_register_symbol_rejects_bad_symbols});
  tests.push_back({"register_class_from_other_grammar_is_rejected",
                   test_register_class_from_other_grammar_is_rejected});
  tests.push_back({"method_binder_bind_requires_existing_method",
                   test_method_binder_bind_requires_existing_method});
  tests.push_back({"class_names_follow_symbols_and_labels",
                   test_class_names_follow_symbols_and_labels});
  tests.push_back({"duplicate_copies_behavior", test_duplicate_copies_behavior});
  tests.push_back({"unregister_removes_symbol", test_unregister_removes_symbol});
  tests.push_back({"derived_grammar_is_isolated", test_derived_grammar_is_isolated});
  tests.push_back({"registry_rejects_duplicate_names", test_registry_rejects_duplicate_names});
  tests.push_back({"build_registers_special_symbols", test_build_registers_special_symbols});
}
