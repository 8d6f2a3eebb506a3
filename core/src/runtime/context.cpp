#include "xpratt/context.h"

#include <iostream>
#include <utility>

namespace xpratt {

Context::Context() : variables_(std::make_shared<std::map<std::string, Value>>()) {}

Context::Context(std::shared_ptr<Document> document)
    : document_(std::move(document)), variables_(std::make_shared<std::map<std::string, Value>>()) {
  if (document_) {
    root_ = document_->root();
    item_ = Item(root_);
    position_ = 1;
    size_ = 1;
  }
}

Context::Context(NodeRef root)
    : root_(root), variables_(std::make_shared<std::map<std::string, Value>>()) {
  if (root_.node != nullptr) {
    item_ = Item(root_);
    position_ = 1;
    size_ = 1;
  }
}

Context Context::with_focus(Item item, size_t position, size_t size) const {
  Context out = *this;
  out.item_ = std::move(item);
  out.position_ = position;
  out.size_ = size;
  return out;
}

void Context::set_variable(const std::string& name, Value value) {
  // Focused copies share the bindings; copy-on-write keeps earlier copies intact.
  if (variables_.use_count() > 1) {
    variables_ = std::make_shared<std::map<std::string, Value>>(*variables_);
  }
  (*variables_)[name] = std::move(value);
}

const Value* Context::find_variable(const std::string& name) const {
  auto it = variables_->find(name);
  return it == variables_->end() ? nullptr : &it->second;
}

std::ostream& Context::trace_stream() const {
  return trace_ ? *trace_ : std::cerr;
}

}  // namespace xpratt
