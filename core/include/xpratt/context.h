#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "xpratt/document.h"
#include "xpratt/value.h"

namespace xpratt {

/// Dynamic evaluation context: focus (item, position, size), variables and a trace sink.
/// MUST keep the document alive while nodes of it are in focus.
/// Inputs are a document or root node; outputs are focused copies for nested steps.
class Context {
 public:
  Context();
  explicit Context(std::shared_ptr<Document> document);
  explicit Context(NodeRef root);

  /// Current item; empty when there is no focus (no document was given).
  const std::optional<Item>& item() const { return item_; }
  size_t position() const { return position_; }
  size_t size() const { return size_; }
  /// Root node of the context tree, or a null NodeRef without a document.
  NodeRef root() const { return root_; }
  const std::shared_ptr<Document>& document() const { return document_; }

  /// Returns a copy focused on one item of a sequence (1-based position).
  Context with_focus(Item item, size_t position, size_t size) const;

  void set_variable(const std::string& name, Value value);
  const Value* find_variable(const std::string& name) const;
  const std::map<std::string, Value>& variables() const { return *variables_; }

  std::ostream& trace_stream() const;
  void set_trace_stream(std::ostream* stream) { trace_ = stream; }

 private:
  std::shared_ptr<Document> document_;
  NodeRef root_;
  std::optional<Item> item_;
  size_t position_ = 0;
  size_t size_ = 0;
  std::shared_ptr<std::map<std::string, Value>> variables_;
  std::ostream* trace_ = nullptr;
};

}  // namespace xpratt
