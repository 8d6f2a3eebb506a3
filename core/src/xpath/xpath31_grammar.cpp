#include <memory>
#include <string>
#include <utility>

#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

using CollectionPtr = std::shared_ptr<Collection>;

Value collection_result(CollectionPtr collection) {
  return Value::of(Item(CollectionRef(std::move(collection))));
}

CollectionPtr make_collection(Collection::Kind kind) {
  auto collection = std::make_shared<Collection>();
  collection->kind = kind;
  return collection;
}

/// Single map or array argument of a map:/array: function.
CollectionRef collection_argument(const Token& self, size_t index, Context* context, Collection::Kind kind) {
  const Sequence items = evaluate_sequence(self.child(index), context);
  const char* expected = kind == Collection::Kind::Map ? "map(*)" : "array(*)";
  if (items.size() == 1) {
    const Collection* collection = as_collection(items.front());
    if (collection != nullptr && collection->kind == kind) return std::get<CollectionRef>(items.front());
  }
  throw self.wrong_type(self.symbol() + "() expects a single " + std::string(expected));
}

Item map_key(const Token& self, const Token& operand, Context* context) {
  const std::optional<Item> key = optional_operand(self, operand, context);
  if (!key.has_value()) throw self.wrong_type("a map key must be a single atomic value");
  return atomize(*key);
}

/// 1-based array position; FOAY0001 when it is out of bounds.
size_t array_index(const Token& self, const Collection& array, const Item& key) {
  const auto* position = std::get_if<int64_t>(&key);
  if (position == nullptr) {
    throw self.wrong_type(std::string("array positions must be xs:integer, got ") + item_kind_name(key));
  }
  if (*position < 1 || static_cast<size_t>(*position) > array.size()) {
    throw self.error("FOAY0001", "array index " + std::to_string(*position) + " out of bounds (size " +
                                     std::to_string(array.size()) + ")");
  }
  return static_cast<size_t>(*position - 1);
}

/// Key specifier after '?': an NCName, an integer, '*' or a parenthesized expression.
TokenPtr parse_key_specifier(Parser& parser) {
  const std::string& symbol = parser.next_token().symbol();
  if (symbol == special::kInteger || symbol == "*") return parser.advance();
  if (symbol == "(") return parser.expression(bp::kFunction);
  parser.expected_next({special::kName}, "expected a key after '?'");
  return parser.advance();
}

void append_all(Sequence& out, const Sequence& items) {
  out.insert(out.end(), items.begin(), items.end());
}

void lookup(const Token& self, const Item& target, const Token& key, Context* context, Sequence& out) {
  const Collection* collection = as_collection(target);
  if (collection == nullptr) {
    throw self.wrong_type(std::string("lookup requires a map or an array, got ") + item_kind_name(target));
  }
  if (key.symbol() == "*") {
    for (const Sequence& value : collection->values) append_all(out, value);
    return;
  }
  Sequence keys;
  if (key.symbol() == special::kName) {
    keys.push_back(Item(string_value(key.value())));
  } else {
    keys = evaluate_sequence(key, context);
  }
  for (const Item& raw : keys) {
    const Item atomic = atomize(raw);
    if (collection->is_map()) {
      if (const Sequence* value = collection->find(atomic)) append_all(out, *value);
    } else {
      append_all(out, collection->values[array_index(self, *collection, atomic)]);
    }
  }
}

void register_constructors(Grammar& grammar) {
  for (const char* symbol : {"{", "}", ":"}) grammar.register_symbol(symbol);

  RegisterOptions map_constructor;
  map_constructor.label = Label(Role::Function);
  map_constructor.pattern = "\\bmap(?=\\s*\\{)";
  map_constructor.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    parser.advance({"{"});
    if (parser.next_token().symbol() != "}") {
      while (true) {
        self->append(parser.expression(bp::kComma));
        parser.advance({":"}, "expected ':' after a map key");
        self->append(parser.expression(bp::kComma));
        if (parser.next_token().symbol() != ",") break;
        parser.advance({","});
      }
    }
    parser.advance({"}"}, "expected ',' or '}' in a map constructor");
    return self;
  };
  map_constructor.evaluate = [](const Token& self, Context* context) {
    CollectionPtr map = make_collection(Collection::Kind::Map);
    for (size_t i = 0; i + 1 < self.arity(); i += 2) {
      Item key = map_key(self, self.child(i), context);
      if (map->find(key) != nullptr) {
        throw self.error("XQDY0137", "duplicate map key '" + string_value(key) + "'");
      }
      map->keys.push_back(std::move(key));
      map->values.push_back(evaluate_sequence(self.child(i + 1), context));
    }
    return collection_result(std::move(map));
  };
  grammar.register_symbol("map", map_constructor);

  // array { expr }: every item of the enclosed sequence becomes one member.
  RegisterOptions curly_array;
  curly_array.label = Label(Role::Function);
  curly_array.pattern = "\\barray(?=\\s*\\{)";
  curly_array.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    parser.advance({"{"});
    if (parser.next_token().symbol() != "}") self->append(parser.expression());
    parser.advance({"}"}, "expected '}' to close an array constructor");
    return self;
  };
  curly_array.evaluate = [](const Token& self, Context* context) {
    CollectionPtr array = make_collection(Collection::Kind::Array);
    if (!self.is_leaf()) {
      for (Item& item : evaluate_sequence(self.child(0), context)) {
        array->values.push_back(Sequence{std::move(item)});
      }
    }
    return collection_result(std::move(array));
  };
  grammar.register_symbol("array", curly_array);

  // [a, b]: one member per comma-separated expression. "[]" is also its lexeme
  // for the empty array.
  RegisterOptions square_array;
  square_array.label = Label(Role::Function);
  square_array.nud = [](TokenPtr self) { return self; };
  square_array.evaluate = [](const Token& self, Context* context) {
    CollectionPtr array = make_collection(Collection::Kind::Array);
    for (size_t i = 0; i < self.arity(); ++i) {
      array->values.push_back(evaluate_sequence(self.child(i), context));
    }
    return collection_result(std::move(array));
  };
  grammar.register_symbol("[]", square_array);

  RegisterOptions open_bracket;
  open_bracket.nud = [](TokenPtr self) {
    Parser& parser = self->parser();
    TokenPtr array = parser.make_token("[]", self->span());
    if (parser.next_token().symbol() != "]") {
      while (true) {
        array->append(parser.expression(bp::kComma));
        if (parser.next_token().symbol() != ",") break;
        parser.advance({","});
      }
    }
    parser.advance({"]"}, "expected ',' or ']' in an array constructor");
    return array;
  };
  grammar.register_symbol("[", open_bracket);
}

void register_lookup(Grammar& grammar) {
  RegisterOptions options;
  options.lbp = bp::kStep;
  // ?key applies to the context item.
  options.nud = [](TokenPtr self) {
    self->append(parse_key_specifier(self->parser()));
    return self;
  };
  options.led = [](TokenPtr self, TokenPtr left) {
    std::vector<TokenPtr> children;
    children.push_back(std::move(left));
    children.push_back(parse_key_specifier(self->parser()));
    self->set_children(std::move(children));
    return self;
  };
  options.evaluate = [](const Token& self, Context* context) {
    const Token& key = self.child(self.arity() - 1);
    Sequence out;
    if (self.arity() == 1) {
      lookup(self, require_item(self, context), key, context, out);
    } else {
      for (const Item& target : evaluate_sequence(self.child(0), context)) {
        lookup(self, target, key, context, out);
      }
    }
    return Value::list(std::move(out));
  };
  grammar.register_symbol("?", options);
}

void register_collection_functions(Grammar& grammar) {
  using Kind = Collection::Kind;
  register_function(grammar, {"map:size", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                const CollectionRef map = collection_argument(self, 0, context, Kind::Map);
                                return Value::of(Item(static_cast<int64_t>(map->size())));
                              }});
  register_function(grammar, {"map:keys", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                const CollectionRef map = collection_argument(self, 0, context, Kind::Map);
                                return Value::list(map->keys);
                              }});
  register_function(grammar, {"map:contains", 2, 2, Role::Function, [](const Token& self, Context* context) {
                                const CollectionRef map = collection_argument(self, 0, context, Kind::Map);
                                return Value::of(Item(map->find(map_key(self, self.child(1), context)) != nullptr));
                              }});
  register_function(grammar, {"map:get", 2, 2, Role::Function, [](const Token& self, Context* context) {
                                const CollectionRef map = collection_argument(self, 0, context, Kind::Map);
                                const Sequence* value = map->find(map_key(self, self.child(1), context));
                                return value == nullptr ? Value::empty_list() : Value::list(*value);
                              }});
  register_function(grammar, {"array:size", 1, 1, Role::Function, [](const Token& self, Context* context) {
                                const CollectionRef array = collection_argument(self, 0, context, Kind::Array);
                                return Value::of(Item(static_cast<int64_t>(array->size())));
                              }});
  register_function(grammar, {"array:get", 2, 2, Role::Function, [](const Token& self, Context* context) {
                                const CollectionRef array = collection_argument(self, 0, context, Kind::Array);
                                const Item position = map_key(self, self.child(1), context);
                                return Value::list(array->values[array_index(self, *array, position)]);
                              }});
}

}  // namespace

void register_xpath31_symbols(Grammar& grammar) {
  register_constructors(grammar);
  register_lookup(grammar);
  register_collection_functions(grammar);
}

}  // namespace xpratt::xpath
