#include <memory>

#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

struct AxisSymbol {
  const char* name;
  Axis axis;
};

constexpr AxisSymbol kAxes[] = {
    {"child", Axis::Child},
    {"descendant", Axis::Descendant},
    {"descendant-or-self", Axis::DescendantOrSelf},
    {"parent", Axis::Parent},
    {"ancestor", Axis::Ancestor},
    {"ancestor-or-self", Axis::AncestorOrSelf},
    {"following-sibling", Axis::FollowingSibling},
    {"preceding-sibling", Axis::PrecedingSibling},
    {"following", Axis::Following},
    {"preceding", Axis::Preceding},
    {"self", Axis::Self},
};

using NodePredicate = bool (*)(const xmlNode* node);

struct KindTest {
  const char* name;
  NodePredicate matches;
};

bool any_node(const xmlNode*) {
  return true;
}

bool text_node(const xmlNode* node) {
  return node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE;
}

bool comment_node(const xmlNode* node) {
  return node->type == XML_COMMENT_NODE;
}

bool principal_node(const xmlNode* node) {
  return node->type == XML_ELEMENT_NODE || node->type == XML_ATTRIBUTE_NODE;
}

constexpr KindTest kKindTests[] = {
    {"node", any_node},
    {"text", text_node},
    {"comment", comment_node},
};

MethodFn node_test_method(NodePredicate matches) {
  return [matches](const Token& self, Context* context) {
    return Value::of(Item(matches(require_node(self, context))));
  };
}

/// True when the token can start the step that follows '/' or '//'.
bool starts_step(const Token& token, const Grammar& grammar) {
  const std::string& symbol = token.symbol();
  if (symbol == special::kName || symbol == "*" || symbol == "@" || symbol == "." ||
      symbol == "..") {
    return true;
  }
  const Label& label = token.label();
  if (label.has(Role::Axis) || label.has(Role::KindTest) || label.has(Role::Function)) return true;
  return !is_special_symbol(symbol) && grammar.is_name_like(symbol);
}

TokenPtr parse_kind_test(TokenPtr self) {
  Parser& parser = self->parser();
  parser.advance({"("});
  parser.advance({")"}, "kind test " + self->symbol() + "() takes no arguments");
  return self;
}

TokenPtr parse_axis_step(TokenPtr self) {
  Parser& parser = self->parser();
  parser.advance({"::"});
  parser.expected_next({special::kName, "*", "node", "text", "comment", "attribute"},
                       "expected a node test after " + self->symbol() + "::");
  self->append(parser.expression(bp::kStep));
  if (!self->child(0).has_method(kNodeTest)) {
    throw self->child(0).wrong_syntax("expected a node test after " + self->symbol() + "::");
  }
  return self;
}

Sequence root_focus(const Token& self, Context* context) {
  Sequence focus;
  focus.push_back(Item(NodeRef{document_root(require_node(self, context))}));
  return focus;
}

TokenPtr parse_path_nud(TokenPtr self, bool require_step) {
  Parser& parser = self->parser();
  if (starts_step(parser.next_token(), parser.grammar())) {
    self->append(parser.expression(bp::kPath));
  } else if (require_step) {
    throw parser.next_token().wrong_syntax("expected a step after '" + self->symbol() + "'");
  }
  return self;
}

TokenPtr parse_path_led(TokenPtr self, TokenPtr left) {
  std::vector<TokenPtr> children;
  children.push_back(std::move(left));
  children.push_back(self->parser().expression(bp::kPath));
  self->set_children(std::move(children));
  return self;
}

void register_steps(Grammar& grammar) {
  RegisterOptions name;
  name.label = Label(Role::Name);
  name.nud = [](TokenPtr self) {
    if (self->parser().next_token().symbol() == "(") {
      throw self->wrong_syntax("unknown function " + string_value(self->value()) + "()");
    }
    return self;
  };
  name.select = [](const Token& self, Context* context) {
    return axis_stream(self, self, Axis::Child, context);
  };
  name.methods[kNodeTest] = [](const Token& self, Context* context) {
    const xmlNode* node = require_node(self, context);
    return Value::of(Item(principal_node(node) && node_name(node) == string_value(self.value())));
  };
  grammar.register_symbol(special::kName, name);

  MethodBinder(grammar.infix("*", bp::kMultiplicative))
      .nud([](TokenPtr self) { return self; })
      .evaluate([](const Token& self, Context* context) {
        if (self.arity() == 2) return arithmetic_operator(self, context, ArithOp::Mul);
        return Value::list(axis_stream(self, self, Axis::Child, context).collect());
      })
      .select([](const Token& self, Context* context) {
        if (self.arity() == 2) return stream_of(arithmetic_operator(self, context, ArithOp::Mul));
        return axis_stream(self, self, Axis::Child, context);
      });
  RegisterOptions wildcard;
  wildcard.methods[kNodeTest] = node_test_method(principal_node);
  grammar.register_symbol("*", wildcard);

  MethodBinder(grammar.nullary(".")).evaluate([](const Token& self, Context* context) {
    return Value::of(require_item(self, context));
  });
  MethodBinder(grammar.nullary("..")).select([](const Token& self, Context* context) {
    xmlNode* node = require_node(self, context);
    if (node->parent == nullptr) return ItemStream();
    return ItemStream::single(Item(NodeRef{node->parent}));
  });

  RegisterOptions attribute_step;
  attribute_step.label = Label(Role::Axis);
  attribute_step.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    parser.expected_next({special::kName, "*", "node"}, "expected an attribute name after '@'");
    self->append(parser.expression(bp::kStep));
    return self;
  };
  attribute_step.select = [](const Token& self, Context* context) {
    return axis_stream(self, self.child(0), Axis::Attribute, context);
  };
  grammar.register_symbol("@", attribute_step);
}

void register_axes(Grammar& grammar) {
  for (const AxisSymbol& entry : kAxes) {
    const Axis axis = entry.axis;
    RegisterOptions options;
    options.label = Label(Role::Axis);
    options.pattern = "\\b" + regex_escape(entry.name) + "(?=\\s*::)";
    options.nud = parse_axis_step;
    options.select = [axis](const Token& self, Context* context) {
      return axis_stream(self, self.child(0), axis, context);
    };
    grammar.register_symbol(entry.name, options);
  }

  for (const KindTest& entry : kKindTests) {
    RegisterOptions options;
    options.label = Label(Role::KindTest);
    options.pattern = function_pattern(entry.name);
    options.nud = parse_kind_test;
    options.select = [](const Token& self, Context* context) {
      return axis_stream(self, self, Axis::Child, context);
    };
    options.methods[kNodeTest] = node_test_method(entry.matches);
    grammar.register_symbol(entry.name, options);
  }

  // 'attribute' is both an axis name and a kind test; the nud picks the role.
  RegisterOptions attribute;
  attribute.label = Label({Role::Axis, Role::KindTest});
  attribute.pattern = R"(\battribute(?=\s*::|\s*\())";
  attribute.nud = [](TokenPtr self) {
    if (self->parser().next_token().symbol() == "::") {
      self->resolve_role(Role::Axis);
      return parse_axis_step(std::move(self));
    }
    self->resolve_role(Role::KindTest);
    return parse_kind_test(std::move(self));
  };
  attribute.select = [](const Token& self, Context* context) {
    if (self.role() == Role::Axis) return axis_stream(self, self.child(0), Axis::Attribute, context);
    return axis_stream(self, self, Axis::Attribute, context);
  };
  attribute.methods[kNodeTest] = node_test_method(is_attribute);
  grammar.register_symbol("attribute", attribute);
}

void register_path_operators(Grammar& grammar) {
  RegisterOptions slash;
  slash.label = Label(Role::Operator);
  slash.lbp = bp::kPath;
  slash.rbp = bp::kPath;
  slash.nud = [](TokenPtr self) { return parse_path_nud(std::move(self), false); };
  slash.led = parse_path_led;
  slash.select = [](const Token& self, Context* context) {
    Context& ctx = require_context(self, context);
    if (self.is_leaf()) return ItemStream::from(root_focus(self, context));
    if (self.arity() == 1) return map_step(self, root_focus(self, context), self.child(0), ctx);
    return map_step(self, evaluate_sequence(self.child(0), context), self.child(1), ctx);
  };
  grammar.register_symbol("/", slash);

  RegisterOptions double_slash;
  double_slash.label = Label(Role::Operator);
  double_slash.lbp = bp::kPath;
  double_slash.rbp = bp::kPath;
  double_slash.nud = [](TokenPtr self) { return parse_path_nud(std::move(self), true); };
  double_slash.led = parse_path_led;
  double_slash.select = [](const Token& self, Context* context) {
    Context& ctx = require_context(self, context);
    const Sequence focus = self.arity() == 1 ? root_focus(self, context)
                                             : evaluate_sequence(self.child(0), context);
    Sequence expanded;
    for (const Item& item : focus) {
      xmlNode* node = as_node(item);
      if (node == nullptr) {
        throw self.error("XPTY0019", std::string("the left operand of '//' must be a sequence of "
                                                 "nodes, got ") + item_kind_name(item));
      }
      for (xmlNode* descendant : axis_nodes(Axis::DescendantOrSelf, node)) {
        expanded.push_back(Item(NodeRef{descendant}));
      }
    }
    if (focus.size() > 1) expanded = document_order(self, expanded);
    return map_step(self, std::move(expanded), self.child(self.arity() - 1), ctx);
  };
  grammar.register_symbol("//", double_slash);

  RegisterOptions predicate;
  predicate.label = Label(Role::Operator);
  predicate.lbp = bp::kStep;
  predicate.rbp = bp::kStep;
  predicate.led = [](TokenPtr self, TokenPtr left) {
    Parser& parser = self->parser();
    std::vector<TokenPtr> children;
    children.push_back(std::move(left));
    children.push_back(parser.expression());
    self->set_children(std::move(children));
    parser.advance({"]"}, "expected ']' to close a predicate");
    return self;
  };
  predicate.select = [](const Token& self, Context* context) {
    struct State {
      Sequence items;
      size_t index = 0;
      Context base;
    };
    Context& ctx = require_context(self, context);
    auto state = std::make_shared<State>(State{self.child(0).select(context).collect(), 0, ctx});
    const Token* filter = &self.child(1);
    const Token* owner = &self;
    return ItemStream([state, filter, owner]() -> std::optional<Item> {
      while (state->index < state->items.size()) {
        const size_t position = ++state->index;
        const Item& candidate = state->items[position - 1];
        Context focused = state->base.with_focus(candidate, position, state->items.size());
        const Sequence result = evaluate_sequence(*filter, &focused);
        bool keep = false;
        if (result.size() == 1 && is_numeric(result.front())) {
          keep = number_value(result.front()) == static_cast<double>(position);
        } else {
          keep = effective_boolean_value(*owner, result);
        }
        if (keep) return candidate;
      }
      return std::nullopt;
    });
  };
  grammar.register_symbol("[", predicate);
}

}  // namespace

void register_xpath1_paths(Grammar& grammar) {
  register_steps(grammar);
  register_axes(grammar);
  register_path_operators(grammar);
}

}  // namespace xpratt::xpath
