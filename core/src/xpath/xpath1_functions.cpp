#include <cmath>
#include <limits>

#include "../util/string_util.h"
#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

size_t utf8_length(const std::string& text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++count;
  }
  return count;
}

Value integer_result(size_t value) {
  return Value::of(Item(static_cast<int64_t>(value)));
}

Value string_result(std::string value) {
  return Value::of(Item(std::move(value)));
}

xmlNode* optional_node_argument(const Token& self, Context* context) {
  if (self.arity() == 0) return require_node(self, context);
  const Sequence items = evaluate_sequence(self.child(0), context);
  if (items.empty()) return nullptr;
  xmlNode* node = as_node(items.front());
  if (node == nullptr) {
    throw self.wrong_type(self.symbol() + "() requires a node argument, got " +
                          item_kind_name(items.front()));
  }
  return node;
}

/// Rounding family: doubles in XPath 1.0, type preserving afterwards.
Value rounding_function(const Token& self, Context* context, double (*round_double)(double),
                        long double (*round_decimal)(long double)) {
  const Sequence items = evaluate_sequence(self.child(0), context);
  if (is_xpath1(self)) {
    if (items.empty()) return Value::of(Item(std::numeric_limits<double>::quiet_NaN()));
    return Value::of(Item(round_double(number_value(items.front()))));
  }
  if (items.empty()) return Value::empty_list();
  if (items.size() > 1) throw self.wrong_type(self.symbol() + "() requires a single numeric argument");
  const Item& item = items.front();
  if (is_node(item)) return Value::of(Item(round_double(number_value(item))));
  switch (item.index()) {
    case 1:
      return Value::of(item);
    case 2:
      return Value::of(Item(Decimal{round_decimal(std::get<Decimal>(item).value)}));
    case 3:
      return Value::of(Item(round_double(std::get<double>(item))));
    default:
      throw self.wrong_type(self.symbol() + "() requires a numeric argument, got " +
                            item_kind_name(item));
  }
}

double round_half_up(double value) {
  if (std::isnan(value) || std::isinf(value)) return value;
  return std::floor(value + 0.5);
}

long double round_half_up_decimal(long double value) {
  return std::floor(value + 0.5L);
}

double floor_double(double value) {
  return std::floor(value);
}

long double floor_decimal(long double value) {
  return std::floor(value);
}

double ceiling_double(double value) {
  return std::ceil(value);
}

long double ceiling_decimal(long double value) {
  return std::ceil(value);
}

Value sum_function(const Token& self, Context* context) {
  const Sequence items = evaluate_sequence(self.child(0), context);
  if (is_xpath1(self)) {
    double total = 0;
    for (const Item& item : items) total += number_value(item);
    return Value::of(Item(total));
  }
  Item total(static_cast<int64_t>(0));
  for (const Item& item : items) total = arithmetic(self, ArithOp::Add, total, item);
  return Value::of(total);
}

Value number_function(const Token& self, Context* context) {
  if (self.arity() == 0) return Value::of(Item(number_value(require_item(self, context))));
  const Sequence items = evaluate_sequence(self.child(0), context);
  if (items.empty()) return Value::of(Item(std::numeric_limits<double>::quiet_NaN()));
  if (items.size() > 1 && !is_xpath1(self)) {
    throw self.wrong_type("number() requires a single item");
  }
  return Value::of(Item(number_value(items.front())));
}

}  // namespace

std::string function_pattern(const std::string& name) {
  return "\\b" + regex_escape(name) + "(?=\\s*\\()";
}

TokenClass& register_function(Grammar& grammar, const FunctionSpec& spec) {
  RegisterOptions options;
  options.label = spec.label;
  options.rbp = bp::kFunction;
  options.pattern = function_pattern(spec.name);
  options.side_effects = spec.side_effects;
  const size_t min_args = spec.min_args;
  const size_t max_args = spec.max_args;
  options.nud = [min_args, max_args](TokenPtr self) {
    if (self->label().has(Role::ConstructorFunction)) self->resolve_role(Role::ConstructorFunction);
    Parser& parser = self->parser();
    parser.advance({"("});
    std::vector<TokenPtr> arguments;
    if (parser.next_token().symbol() != ")") {
      while (true) {
        arguments.push_back(parser.expression(bp::kComma));
        if (parser.next_token().symbol() != ",") break;
        parser.advance({","});
      }
    }
    parser.advance({")"}, "expected ',' or ')' in the arguments of " + self->symbol() + "()");
    if (arguments.size() < min_args || arguments.size() > max_args) {
      std::string expected = std::to_string(min_args);
      if (max_args == kUnbounded) {
        expected = "at least " + expected;
      } else if (max_args != min_args) {
        expected += " to " + std::to_string(max_args);
      }
      throw self->wrong_syntax(self->symbol() + "() takes " + expected + " argument(s), got " +
                               std::to_string(arguments.size()));
    }
    self->set_children(std::move(arguments));
    return self;
  };
  options.evaluate = spec.body;
  return grammar.register_symbol(spec.name, options);
}

void register_xpath1_functions(Grammar& grammar) {
  register_function(grammar, {"position", 0, 0, Role::Function, [](const Token& self, Context* context) {
                                require_item(self, context);
                                return integer_result(context->position());
                              }});
  register_function(grammar, {"last", 0, 0, Role::Function, [](const Token& self, Context* context) {
                                require_item(self, context);
                                return integer_result(context->size());
                              }});
  register_function(grammar, {"count", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return integer_result(evaluate_sequence(self.child(0), context).size());
                              }});
  register_function(grammar, {"string", 0, 1, Role::Function, [](const Token& self, Context* context) {
                                return string_result(string_argument(self, 0, context));
                              }});
  register_function(grammar,
                    {"concat", 2, kUnbounded, Role::Function, [](const Token& self, Context* context) {
                       std::string out;
                       for (size_t i = 0; i < self.arity(); ++i) out += string_argument(self, i, context);
                       return string_result(std::move(out));
                     }});
  register_function(grammar, {"contains", 2, 2, Role::Function, [](const Token& self, Context* context) {
                                const std::string haystack = string_argument(self, 0, context);
                                const std::string needle = string_argument(self, 1, context);
                                return Value::of(Item(haystack.find(needle) != std::string::npos));
                              }});
  register_function(grammar,
                    {"starts-with", 2, 2, Role::Function, [](const Token& self, Context* context) {
                       const std::string text = string_argument(self, 0, context);
                       const std::string prefix = string_argument(self, 1, context);
                       return Value::of(Item(text.compare(0, prefix.size(), prefix) == 0));
                     }});
  register_function(grammar,
                    {"string-length", 0, 1, Role::Function, [](const Token& self, Context* context) {
                       return integer_result(utf8_length(string_argument(self, 0, context)));
                     }});
  register_function(grammar,
                    {"normalize-space", 0, 1, Role::Function, [](const Token& self, Context* context) {
                       return string_result(util::normalize_space(string_argument(self, 0, context)));
                     }});
  register_function(grammar, {"not", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return Value::of(Item(
                                    !effective_boolean_value(self, evaluate_sequence(self.child(0), context))));
                              }});
  register_function(grammar, {"true", 0, 0, Role::Function, [](const Token&, Context*) {
                                return Value::of(Item(true));
                              }});
  register_function(grammar, {"false", 0, 0, Role::Function, [](const Token&, Context*) {
                                return Value::of(Item(false));
                              }});
  register_function(grammar, {"boolean", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return Value::of(Item(
                                    effective_boolean_value(self, evaluate_sequence(self.child(0), context))));
                              }});
  register_function(grammar, {"number", 0, 1, Role::Function, number_function});
  register_function(grammar, {"sum", 1, 1, Role::Function, sum_function});
  register_function(grammar, {"name", 0, 1, Role::Function, [](const Token& self, Context* context) {
                                return string_result(node_name(optional_node_argument(self, context)));
                              }});
  register_function(grammar,
                    {"local-name", 0, 1, Role::Function, [](const Token& self, Context* context) {
                       return string_result(node_local_name(optional_node_argument(self, context)));
                     }});
  register_function(grammar, {"floor", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return rounding_function(self, context, floor_double, floor_decimal);
                              }});
  register_function(grammar, {"ceiling", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return rounding_function(self, context, ceiling_double, ceiling_decimal);
                              }});
  register_function(grammar, {"round", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return rounding_function(self, context, round_half_up,
                                                         round_half_up_decimal);
                              }});
}

}  // namespace xpratt::xpath
