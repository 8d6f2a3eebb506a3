#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <regex>
#include <unordered_set>

#include "../util/string_util.h"
#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

struct ComparisonSymbol {
  const char* symbol;
  CompareOp op;
};

constexpr ComparisonSymbol kValueComparisons[] = {
    {"eq", CompareOp::Eq}, {"ne", CompareOp::Ne}, {"lt", CompareOp::Lt},
    {"le", CompareOp::Le}, {"gt", CompareOp::Gt}, {"ge", CompareOp::Ge},
};

const Label kConstructor = Label({Role::Function, Role::ConstructorFunction});

std::shared_ptr<Context> copy_context(Context* context) {
  return context == nullptr ? nullptr : std::make_shared<Context>(*context);
}

/// Lexical xs:integer / xs:decimal checks used by the casts.
bool is_integer_lexical(const std::string& text) {
  static const std::regex kInteger(R"([-+]?\d+)");
  return std::regex_match(text, kInteger);
}

bool is_decimal_lexical(const std::string& text) {
  static const std::regex kDecimal(R"([-+]?(\d+(\.\d*)?|\.\d+))");
  return std::regex_match(text, kDecimal);
}

EvaluationError invalid_cast(const Token& self, const std::string& text, const char* type) {
  return self.error("FORG0001", "invalid value '" + text + "' for xs:" + std::string(type));
}

int64_t range_bound(const Token& self, const Item& item) {
  if (const auto* integer = std::get_if<int64_t>(&item)) return *integer;
  if (is_node(item)) {
    const std::string text = util::trim_ws(string_value(item));
    if (!is_integer_lexical(text)) throw invalid_cast(self, text, "integer");
    errno = 0;
    const long long value = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) throw invalid_cast(self, text, "integer");
    return static_cast<int64_t>(value);
  }
  throw self.wrong_type(std::string("range bounds must be xs:integer, got ") + item_kind_name(item));
}

Item cast_integer(const Token& self, const Item& item) {
  switch (item.index()) {
    case 0:
      return Item(static_cast<int64_t>(std::get<bool>(item) ? 1 : 0));
    case 1:
      return item;
    case 2:
    case 3: {
      const long double value = to_long_double(item);
      if (std::isnan(value) || std::isinf(value)) {
        throw self.wrong_value("cannot convert " + string_value(item) + " to xs:integer");
      }
      if (std::fabs(value) >= 9.2e18L) throw self.error("FOAR0002", "integer overflow");
      return Item(static_cast<int64_t>(std::trunc(value)));
    }
    default: {
      const std::string text = util::trim_ws(string_value(item));
      if (!is_integer_lexical(text)) throw invalid_cast(self, text, "integer");
      errno = 0;
      const long long value = std::strtoll(text.c_str(), nullptr, 10);
      if (errno == ERANGE) throw invalid_cast(self, text, "integer");
      return Item(static_cast<int64_t>(value));
    }
  }
}

Item cast_decimal(const Token& self, const Item& item) {
  switch (item.index()) {
    case 0:
      return Item(Decimal{std::get<bool>(item) ? 1.0L : 0.0L});
    case 1:
    case 2:
      return Item(Decimal{to_long_double(item)});
    case 3: {
      const double value = std::get<double>(item);
      if (std::isnan(value) || std::isinf(value)) {
        throw self.wrong_value("cannot convert " + string_value(item) + " to xs:decimal");
      }
      return Item(Decimal{static_cast<long double>(value)});
    }
    default: {
      const std::string text = util::trim_ws(string_value(item));
      if (!is_decimal_lexical(text)) throw invalid_cast(self, text, "decimal");
      return Item(Decimal{std::strtold(text.c_str(), nullptr)});
    }
  }
}

Item cast_double(const Token& self, const Item& item) {
  if (!std::holds_alternative<std::string>(item) && !is_node(item)) {
    return Item(number_value(item));
  }
  const std::string text = util::trim_ws(string_value(item));
  const double value = parse_number(text);
  if (std::isnan(value) && text != "NaN") throw invalid_cast(self, text, "double");
  return Item(value);
}

Item cast_string(const Token&, const Item& item) {
  return Item(string_value(item));
}

Item cast_boolean(const Token& self, const Item& item) {
  if (const auto* flag = std::get_if<bool>(&item)) return Item(*flag);
  if (is_numeric(item)) {
    const double value = number_value(item);
    return Item(value != 0 && !std::isnan(value));
  }
  const std::string text = util::trim_ws(string_value(item));
  if (text == "true" || text == "1") return Item(true);
  if (text == "false" || text == "0") return Item(false);
  throw invalid_cast(self, text, "boolean");
}

using CastFn = Item (*)(const Token& self, const Item& item);

struct CastTarget {
  const char* type;
  CastFn cast;
};

constexpr CastTarget kCastTargets[] = {
    {"integer", cast_integer}, {"decimal", cast_decimal}, {"double", cast_double},
    {"string", cast_string},   {"boolean", cast_boolean},
};

MethodFn cast_method(CastFn cast) {
  return [cast](const Token& self, Context* context) {
    const std::optional<Item> operand = optional_operand(self, self.child(0), context);
    if (!operand.has_value()) return Value::empty_list();
    return Value::of(cast(self, *operand));
  };
}

void register_constructor(Grammar& grammar, const std::string& name, CastFn cast) {
  FunctionSpec spec;
  spec.name = name;
  spec.min_args = 1;
  spec.max_args = 1;
  spec.label = kConstructor;
  spec.body = [](const Token& self, Context* context) { return self.call_method(kCast, context); };
  TokenClass& token_class = register_function(grammar, spec);
  RegisterOptions options;
  options.methods[kCast] = cast_method(cast);
  grammar.register_symbol(token_class, options);
}

/// Item type and occurrence indicator of a SequenceType such as "xs:integer?".
struct SequenceType {
  std::string item;
  char occurrence = 0;
};

SequenceType split_sequence_type(const std::string& text) {
  SequenceType out;
  out.item = text;
  if (!out.item.empty() && std::string("?*+").find(out.item.back()) != std::string::npos) {
    out.occurrence = out.item.back();
    out.item.pop_back();
  }
  if (out.item.compare(0, 3, "xs:") == 0) out.item.erase(0, 3);
  return out;
}

/// Reads a SequenceType into one '(name)' token whose value is its normalized text.
/// A single type (after "cast as") only takes the '?' indicator.
TokenPtr parse_sequence_type(Parser& parser, bool single_type) {
  const Token& next = parser.next_token();
  std::string text;
  if (next.symbol() == special::kName) {
    text = string_value(next.value());
  } else if (!is_special_symbol(next.symbol()) && parser.grammar().is_name_like(next.symbol())) {
    text = next.symbol();
  } else {
    throw next.wrong_syntax("expected a sequence type");
  }
  TokenPtr type = parser.advance();
  if (parser.next_token().symbol() == "(") {
    parser.advance({"("});
    if (parser.next_token().symbol() == "*") {
      parser.advance({"*"});
      text += "(*)";
    } else {
      text += "()";
    }
    parser.advance({")"}, "expected ')' in a sequence type");
  }
  const std::string indicator = parser.next_token().symbol();
  if (indicator == "?" || (!single_type && (indicator == "*" || indicator == "+"))) {
    parser.advance();
    text += indicator;
  }
  return parser.make_token(special::kName, Item(text), type->span());
}

bool node_matches(const std::string& type, const xmlNode* node) {
  if (type == "node()") return true;
  if (type == "element()") return node->type == XML_ELEMENT_NODE;
  if (type == "attribute()") return is_attribute(node);
  if (type == "text()") return node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE;
  if (type == "comment()") return node->type == XML_COMMENT_NODE;
  if (type == "document-node()") return is_document(node);
  return false;
}

bool item_matches(const Token& self, const std::string& type, const Item& item) {
  if (type == "item()") return true;
  if (const xmlNode* node = as_node(item)) return node_matches(type, node);
  if (const Collection* collection = as_collection(item)) {
    return type == (collection->is_map() ? "map(*)" : "array(*)");
  }
  if (type == "anyAtomicType") return true;
  if (type == "boolean") return std::holds_alternative<bool>(item);
  if (type == "integer") return std::holds_alternative<int64_t>(item);
  if (type == "decimal") return std::holds_alternative<int64_t>(item) || std::holds_alternative<Decimal>(item);
  if (type == "double") return std::holds_alternative<double>(item);
  if (type == "numeric") return is_numeric(item);
  if (type == "string") return std::holds_alternative<std::string>(item);
  static const char* const kKnown[] = {"node()",  "element()",       "attribute()", "text()",
                                       "comment()", "document-node()", "map(*)",      "array(*)"};
  for (const char* known : kKnown) {
    if (type == known) return false;
  }
  throw self.error("XPST0051", "unknown type '" + type + "'");
}

bool instance_of(const Token& self, const Sequence& items, const SequenceType& type) {
  if (type.item == "empty-sequence()") return items.empty();
  switch (type.occurrence) {
    case '?':
      if (items.size() > 1) return false;
      break;
    case '+':
      if (items.empty()) return false;
      break;
    case '*':
      break;
    default:
      if (items.size() != 1) return false;
  }
  for (const Item& item : items) {
    if (!item_matches(self, type.item, item)) return false;
  }
  return true;
}

void register_type_operators(Grammar& grammar) {
  RegisterOptions keyword;
  keyword.nud = [](TokenPtr self) { return Token::nud(self->as_name()); };
  grammar.register_symbol("of", keyword);
  grammar.register_symbol("as", keyword);
  grammar.register_symbol("?");

  auto parse_type_operator = [](const std::string& word, bool single_type) {
    return [word, single_type](TokenPtr self, TokenPtr left) {
      Parser& parser = self->parser();
      parser.advance({word}, "expected '" + word + "' after '" + self->symbol() + "'");
      std::vector<TokenPtr> children;
      children.push_back(std::move(left));
      children.push_back(parse_sequence_type(parser, single_type));
      self->set_children(std::move(children));
      return self;
    };
  };

  MethodBinder(register_keyword_infix(grammar, "instance", bp::kInstance))
      .led(parse_type_operator("of", false))
      .evaluate([](const Token& self, Context* context) {
        const SequenceType type = split_sequence_type(string_value(self.child(1).value()));
        return Value::of(Item(instance_of(self, evaluate_sequence(self.child(0), context), type)));
      });

  MethodBinder(register_keyword_infix(grammar, "cast", bp::kCastAs))
      .led(parse_type_operator("as", true))
      .evaluate([](const Token& self, Context* context) {
        const SequenceType type = split_sequence_type(string_value(self.child(1).value()));
        CastFn cast = nullptr;
        for (const CastTarget& target : kCastTargets) {
          if (type.item == target.type) cast = target.cast;
        }
        if (cast == nullptr) {
          throw self.error("XPST0080", "cannot cast to '" + string_value(self.child(1).value()) + "'");
        }
        const std::optional<Item> operand = optional_operand(self, self.child(0), context);
        if (!operand.has_value()) {
          if (type.occurrence == '?') return Value::empty_list();
          throw self.wrong_type("an empty sequence cannot be cast to xs:" + type.item);
        }
        return Value::of(cast(self, *operand));
      });
}

void register_sequence_operators(Grammar& grammar) {
  MethodBinder(grammar.infix(",", bp::kComma)).select([](const Token& self, Context* context) {
    struct State {
      ItemStream current;
      bool second = false;
      std::shared_ptr<Context> context;
    };
    auto state = std::make_shared<State>();
    state->context = copy_context(context);
    state->current = self.child(0).select(state->context.get());
    const Token* right = &self.child(1);
    return ItemStream([state, right]() -> std::optional<Item> {
      while (true) {
        if (auto item = state->current.next()) return item;
        if (state->second) return std::nullopt;
        state->second = true;
        state->current = right->select(state->context.get());
      }
    });
  });

  RegisterOptions parenthesized;
  parenthesized.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    if (parser.next_token().symbol() == ")") {
      parser.advance({")"});
      return self;
    }
    self->append(parser.expression());
    parser.advance({")"}, "expected ')' after a parenthesized expression");
    return self;
  };
  grammar.register_symbol("(", parenthesized);

  MethodBinder(register_keyword_infix(grammar, "to", bp::kRange))
      .select([](const Token& self, Context* context) {
        const std::optional<Item> lhs = optional_operand(self, self.child(0), context);
        const std::optional<Item> rhs = optional_operand(self, self.child(1), context);
        if (!lhs.has_value() || !rhs.has_value()) return ItemStream();
        const int64_t first = range_bound(self, *lhs);
        const int64_t last = range_bound(self, *rhs);
        if (first > last) return ItemStream();
        auto next = std::make_shared<int64_t>(first);
        auto done = std::make_shared<bool>(false);
        return ItemStream([next, done, last]() -> std::optional<Item> {
          if (*done) return std::nullopt;
          const int64_t value = *next;
          if (value == last) {
            *done = true;
          } else {
            ++*next;
          }
          return Item(value);
        });
      });

  RegisterOptions if_expression;
  if_expression.label = Label(Role::Operator);
  if_expression.pattern = function_pattern("if");
  if_expression.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    parser.advance({"("});
    self->append(parser.expression());
    parser.advance({")"});
    parser.advance({"then"}, "expected 'then' in an if expression");
    self->append(parser.expression(bp::kComma));
    parser.advance({"else"}, "expected 'else' in an if expression");
    self->append(parser.expression(bp::kComma));
    return self;
  };
  if_expression.evaluate = [](const Token& self, Context* context) {
    const bool condition = effective_boolean_value(self, evaluate_sequence(self.child(0), context));
    return self.child(condition ? 1 : 2).evaluate(context);
  };
  if_expression.select = [](const Token& self, Context* context) {
    const bool condition = effective_boolean_value(self, evaluate_sequence(self.child(0), context));
    return self.child(condition ? 1 : 2).select(context);
  };
  grammar.register_symbol("if", if_expression);

  RegisterOptions keyword;
  keyword.nud = [](TokenPtr self) { return Token::nud(self->as_name()); };
  grammar.register_symbol("then", keyword);
  grammar.register_symbol("else", keyword);
}

void register_comparison_operators(Grammar& grammar) {
  for (const ComparisonSymbol& comparison : kValueComparisons) {
    const CompareOp op = comparison.op;
    MethodBinder(register_keyword_infix(grammar, comparison.symbol, bp::kComparison))
        .evaluate([op](const Token& self, Context* context) {
          const std::optional<Item> lhs = optional_operand(self, self.child(0), context);
          const std::optional<Item> rhs = optional_operand(self, self.child(1), context);
          if (!lhs.has_value() || !rhs.has_value()) return Value::empty_list();
          return Value::of(Item(compare_atomics(self, atomize(*lhs), atomize(*rhs), op)));
        });
  }

  MethodBinder(register_keyword_infix(grammar, "idiv", bp::kMultiplicative))
      .evaluate([](const Token& self, Context* context) {
        return arithmetic_operator(self, context, ArithOp::IDiv);
      });
}

/// intersect keeps the nodes found on both sides, except the ones found only on the left.
void register_node_set_operator(Grammar& grammar, const std::string& symbol, bool keep_shared) {
  MethodBinder(register_keyword_infix(grammar, symbol, bp::kIntersect))
      .select([keep_shared](const Token& self, Context* context) {
        const Sequence lhs = document_order(self, evaluate_sequence(self.child(0), context));
        const Sequence rhs = document_order(self, evaluate_sequence(self.child(1), context));
        std::unordered_set<const xmlNode*> right;
        for (const Item& item : rhs) right.insert(as_node(item));
        Sequence out;
        for (const Item& item : lhs) {
          if ((right.count(as_node(item)) != 0) == keep_shared) out.push_back(item);
        }
        return ItemStream::from(std::move(out));
      });
}

void register_set_operators(Grammar& grammar) {
  RegisterOptions union_options;
  union_options.nud = [](TokenPtr self) { return Token::nud(self->as_name()); };
  grammar.duplicate("|", "union", union_options);
  register_node_set_operator(grammar, "intersect", true);
  register_node_set_operator(grammar, "except", false);
}

void register_xpath2_functions(Grammar& grammar) {
  register_function(grammar, {"empty", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return Value::of(Item(!self.child(0).select(context).next().has_value()));
                              }});
  register_function(grammar, {"exists", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                return Value::of(Item(self.child(0).select(context).next().has_value()));
                              }});
  register_function(grammar,
                    {"string-join", 1, 2, Role::Function, [](const Token& self, Context* context) {
                       const Sequence items = evaluate_sequence(self.child(0), context);
                       const std::string separator =
                           self.arity() > 1 ? string_argument(self, 1, context) : std::string();
                       std::string out;
                       for (size_t i = 0; i < items.size(); ++i) {
                         if (i != 0) out += separator;
                         out += string_value(items[i]);
                       }
                       return Value::of(Item(std::move(out)));
                     }});
  register_function(grammar,
                    {"upper-case", 1, 1, Role::Function, [](const Token& self, Context* context) {
                       return Value::of(Item(util::to_upper(string_argument(self, 0, context))));
                     }});
  register_function(grammar,
                    {"lower-case", 1, 1, Role::Function, [](const Token& self, Context* context) {
                       return Value::of(Item(util::to_lower(string_argument(self, 0, context))));
                     }});
  register_function(grammar, {"reverse", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                Sequence items = evaluate_sequence(self.child(0), context);
                                return Value::list(Sequence(items.rbegin(), items.rend()));
                              }});

  FunctionSpec trace;
  trace.name = "trace";
  trace.min_args = 2;
  trace.max_args = 2;
  trace.side_effects = true;
  trace.body = [](const Token& self, Context* context) {
    Value result = Value::list(evaluate_sequence(self.child(0), context));
    const std::string label = string_argument(self, 1, context);
    std::ostream& out = context == nullptr ? std::cerr : context->trace_stream();
    out << label << ": " << render_value(result) << "\n";
    return result;
  };
  register_function(grammar, trace);

  register_constructor(grammar, "integer", cast_integer);
  register_constructor(grammar, "decimal", cast_decimal);
  register_constructor(grammar, "double", cast_double);
}

}  // namespace

void register_xpath2_symbols(Grammar& grammar) {
  grammar.set_comment_delimiters("(:", ":)");
  register_sequence_operators(grammar);
  register_comparison_operators(grammar);
  register_set_operators(grammar);
  register_type_operators(grammar);
  register_quantified_expressions(grammar);
  register_xpath2_functions(grammar);
}

}  // namespace xpratt::xpath
