#include <memory>

#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

std::string concat_operand(const Token& self, const Token& operand, Context* context) {
  const std::optional<Item> item = optional_operand(self, operand, context);
  return item.has_value() ? string_value(*item) : std::string();
}

}  // namespace

void register_xpath3_symbols(Grammar& grammar) {
  MethodBinder(grammar.infix("||", bp::kConcat)).evaluate([](const Token& self, Context* context) {
    std::string out = concat_operand(self, self.child(0), context);
    out += concat_operand(self, self.child(1), context);
    return Value::of(Item(std::move(out)));
  });

  // Simple map: no deduplication and no reordering of the results. The right
  // operand runs for the next focus item only when more results are pulled.
  MethodBinder(grammar.infix("!", bp::kMap)).select([](const Token& self, Context* context) {
    struct State {
      Sequence focus;
      size_t index = 0;
      Context base;
      std::shared_ptr<Context> focused;
      ItemStream current;
    };
    Context& ctx = require_context(self, context);
    auto state = std::make_shared<State>();
    state->focus = evaluate_sequence(self.child(0), context);
    state->base = ctx;
    const Token* step = &self.child(1);
    return ItemStream([state, step]() -> std::optional<Item> {
      while (true) {
        if (auto item = state->current.next()) return item;
        if (state->index >= state->focus.size()) return std::nullopt;
        const size_t position = ++state->index;
        state->current = ItemStream();
        state->focused = std::make_shared<Context>(
            state->base.with_focus(state->focus[position - 1], position, state->focus.size()));
        state->current = step->select(state->focused.get());
      }
    });
  });

  register_let_expression(grammar);
}

}  // namespace xpratt::xpath
