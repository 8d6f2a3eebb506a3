#include <cmath>
#include <limits>

#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

struct ComparisonSymbol {
  const char* symbol;
  CompareOp op;
};

constexpr ComparisonSymbol kGeneralComparisons[] = {
    {"=", CompareOp::Eq}, {"!=", CompareOp::Ne}, {"<", CompareOp::Lt},
    {"<=", CompareOp::Le}, {">", CompareOp::Gt}, {">=", CompareOp::Ge},
};

Value unary_operator(const Token& self, Context* context, bool negative) {
  Sequence operand = evaluate_sequence(self.child(0), context);
  if (operand.empty()) {
    if (is_xpath1(self)) return Value::of(Item(std::numeric_limits<double>::quiet_NaN()));
    return Value::empty_list();
  }
  if (operand.size() > 1 && !is_xpath1(self)) {
    throw self.wrong_type("a sequence of more than one item is not allowed as an operand of unary '" +
                          self.symbol() + "'");
  }
  const Item& item = operand.front();
  if (negative) return Value::of(negate(self, item));
  if (is_xpath1(self) || is_node(item)) return Value::of(Item(number_value(item)));
  if (!is_numeric(item)) {
    throw self.wrong_type(std::string("unary '+' is not defined for ") + item_kind_name(item));
  }
  return Value::of(item);
}

void register_additive(Grammar& grammar, const std::string& symbol, ArithOp op) {
  grammar.infix(symbol, bp::kAdditive);
  RegisterOptions options;
  options.nud = [](TokenPtr self) {
    std::vector<TokenPtr> children;
    children.push_back(self->parser().expression(bp::kUnary));
    self->set_children(std::move(children));
    return self;
  };
  const bool negative = op == ArithOp::Sub;
  options.evaluate = [op, negative](const Token& self, Context* context) {
    if (self.arity() == 1) return unary_operator(self, context, negative);
    return arithmetic_operator(self, context, op);
  };
  grammar.register_symbol(symbol, options);
}

}  // namespace

TokenClass& register_keyword_infix(Grammar& grammar, const std::string& symbol, int bp) {
  TokenClass& token_class = grammar.infix(symbol, bp);
  RegisterOptions options;
  options.nud = [](TokenPtr self) { return Token::nud(self->as_name()); };
  return grammar.register_symbol(token_class, options);
}

void register_xpath1_operators(Grammar& grammar) {
  for (const char* symbol : {special::kString, special::kInteger, special::kDecimal, special::kFloat}) {
    grammar.literal(symbol);
  }
  for (const char* symbol : {")", "]", ",", "::"}) grammar.register_symbol(symbol);

  MethodBinder(register_keyword_infix(grammar, "or", bp::kOr))
      .evaluate([](const Token& self, Context* context) {
        if (effective_boolean_value(self, evaluate_sequence(self.child(0), context))) {
          return Value::of(Item(true));
        }
        return Value::of(Item(effective_boolean_value(self, evaluate_sequence(self.child(1), context))));
      });
  MethodBinder(register_keyword_infix(grammar, "and", bp::kAnd))
      .evaluate([](const Token& self, Context* context) {
        if (!effective_boolean_value(self, evaluate_sequence(self.child(0), context))) {
          return Value::of(Item(false));
        }
        return Value::of(Item(effective_boolean_value(self, evaluate_sequence(self.child(1), context))));
      });

  for (const ComparisonSymbol& comparison : kGeneralComparisons) {
    const CompareOp op = comparison.op;
    MethodBinder(grammar.infix(comparison.symbol, bp::kComparison))
        .evaluate([op](const Token& self, Context* context) {
          const Sequence lhs = evaluate_sequence(self.child(0), context);
          const Sequence rhs = evaluate_sequence(self.child(1), context);
          return Value::of(Item(general_compare(self, lhs, rhs, op)));
        });
  }

  register_additive(grammar, "+", ArithOp::Add);
  register_additive(grammar, "-", ArithOp::Sub);
  MethodBinder(register_keyword_infix(grammar, "div", bp::kMultiplicative))
      .evaluate([](const Token& self, Context* context) {
        return arithmetic_operator(self, context, ArithOp::Div);
      });
  MethodBinder(register_keyword_infix(grammar, "mod", bp::kMultiplicative))
      .evaluate([](const Token& self, Context* context) {
        return arithmetic_operator(self, context, ArithOp::Mod);
      });

  MethodBinder(grammar.infix("|", bp::kUnion)).select([](const Token& self, Context* context) {
    Sequence items = evaluate_sequence(self.child(0), context);
    const Sequence rhs = evaluate_sequence(self.child(1), context);
    items.insert(items.end(), rhs.begin(), rhs.end());
    return ItemStream::from(document_order(self, items));
  });

  RegisterOptions parenthesized;
  parenthesized.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    self->append(parser.expression());
    parser.advance({")"}, "expected ')' after a parenthesized expression");
    return self;
  };
  parenthesized.evaluate = [](const Token& self, Context* context) {
    if (self.is_leaf()) return Value::empty_list();
    return self.child(0).evaluate(context);
  };
  parenthesized.select = [](const Token& self, Context* context) {
    if (self.is_leaf()) return ItemStream();
    return self.child(0).select(context);
  };
  grammar.register_symbol("(", parenthesized);

  RegisterOptions variable;
  variable.label = Label(Role::Variable);
  variable.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    parser.expected_next({special::kName}, "expected a variable name after '$'");
    self->append(parser.advance());
    return self;
  };
  variable.evaluate = [](const Token& self, Context* context) {
    Context& ctx = require_context(self, context);
    const std::string name = string_value(self.child(0).value());
    const Value* value = ctx.find_variable(name);
    if (value == nullptr) throw self.error("XPST0008", "unknown variable '$" + name + "'");
    return *value;
  };
  grammar.register_symbol("$", variable);
}

}  // namespace xpratt::xpath
