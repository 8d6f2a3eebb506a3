#include <functional>
#include <string>

#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

/// Parses "$name <binder> expr (, $name <binder> expr)* <keyword> body".
/// Children are variable/expression pairs followed by the body.
TokenPtr parse_clauses(TokenPtr self, const std::string& binder, const std::string& keyword) {
  Parser& parser = self->parser();
  while (true) {
    parser.expected_next({"$"}, "expected a variable after '" + self->symbol() + "'");
    self->append(parser.expression(bp::kFunction));
    parser.advance({binder}, "expected '" + binder + "' after the variable");
    self->append(parser.expression(bp::kComma));
    if (parser.next_token().symbol() != ",") break;
    parser.advance({","});
  }
  parser.advance({keyword}, "expected '" + keyword + "' in a " + self->symbol() + " expression");
  self->append(parser.expression(bp::kComma));
  return self;
}

std::string variable_name(const Token& variable) {
  return string_value(variable.child(0).value());
}

using BindingVisitor = std::function<bool(Context& bound)>;

/// Binds the variable of clause `clause` to each item of its sequence in turn,
/// then recurses into the next clause. The visitor returns false to stop early.
bool for_each_binding(const Token& self, size_t clause, const Context& context, const BindingVisitor& visit) {
  if (clause * 2 + 1 >= self.arity()) {
    Context bound = context;
    return visit(bound);
  }
  const std::string name = variable_name(self.child(clause * 2));
  Context in_scope = context;
  const Sequence items = evaluate_sequence(self.child(clause * 2 + 1), &in_scope);
  for (const Item& item : items) {
    Context bound = context;
    bound.set_variable(name, Value::of(item));
    if (!for_each_binding(self, clause + 1, bound, visit)) return false;
  }
  return true;
}

const Token& body_of(const Token& self) {
  return self.child(self.arity() - 1);
}

void register_keyword(Grammar& grammar, const std::string& symbol) {
  RegisterOptions keyword;
  keyword.nud = [](TokenPtr self) { return Token::nud(self->as_name()); };
  grammar.register_symbol(symbol, keyword);
}

RegisterOptions binding_options(const std::string& symbol, const std::string& binder, const std::string& keyword) {
  RegisterOptions options;
  options.label = Label(Role::Operator);
  options.pattern = "\\b" + symbol + "(?=\\s*\\$)";
  options.nud = [binder, keyword](TokenPtr self) { return parse_clauses(std::move(self), binder, keyword); };
  return options;
}

void register_quantifier(Grammar& grammar, const std::string& symbol, bool every) {
  RegisterOptions options = binding_options(symbol, "in", "satisfies");
  options.evaluate = [every](const Token& self, Context* context) {
    Context& ctx = require_context(self, context);
    bool found = false;
    for_each_binding(self, 0, ctx, [&self, &found, every](Context& bound) {
      const bool satisfied = effective_boolean_value(self, evaluate_sequence(body_of(self), &bound));
      if (satisfied != every) {
        found = true;
        return false;
      }
      return true;
    });
    return Value::of(Item(every ? !found : found));
  };
  grammar.register_symbol(symbol, options);
}

}  // namespace

void register_quantified_expressions(Grammar& grammar) {
  register_keyword(grammar, "in");
  register_keyword(grammar, "return");
  register_keyword(grammar, "satisfies");

  RegisterOptions for_expression = binding_options("for", "in", "return");
  for_expression.evaluate = [](const Token& self, Context* context) {
    Context& ctx = require_context(self, context);
    Sequence out;
    for_each_binding(self, 0, ctx, [&self, &out](Context& bound) {
      ItemStream results = body_of(self).select(&bound);
      while (auto item = results.next()) out.push_back(std::move(*item));
      return true;
    });
    return Value::list(std::move(out));
  };
  grammar.register_symbol("for", for_expression);

  register_quantifier(grammar, "some", false);
  register_quantifier(grammar, "every", true);
}

void register_let_expression(Grammar& grammar) {
  grammar.register_symbol(":=");

  RegisterOptions let_expression = binding_options("let", ":=", "return");
  let_expression.evaluate = [](const Token& self, Context* context) {
    Context bound = require_context(self, context);
    for (size_t i = 0; i + 1 < self.arity(); i += 2) {
      Value value = self.child(i + 1).evaluate(&bound);
      bound.set_variable(variable_name(self.child(i)), std::move(value));
    }
    return body_of(self).evaluate(&bound);
  };
  grammar.register_symbol("let", let_expression);
}

}  // namespace xpratt::xpath
