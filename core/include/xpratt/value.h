#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct _xmlNode;

namespace xpratt {

/// Non-owning handle to a libxml2 node (element, attribute, text or document).
/// MUST NOT outlive the Document that owns the node.
struct NodeRef {
  _xmlNode* node = nullptr;

  bool operator==(const NodeRef& other) const { return node == other.node; }
  bool operator!=(const NodeRef& other) const { return node != other.node; }
};

/// Exact-notation numeric literal such as 1.0 (kept apart from doubles like 1e0).
struct Decimal {
  long double value = 0;

  bool operator==(const Decimal& other) const { return value == other.value; }
};

struct Collection;
/// Shared handle to an immutable XPath 3.1 map or array.
using CollectionRef = std::shared_ptr<const Collection>;

using Item = std::variant<bool, int64_t, Decimal, double, std::string, NodeRef, CollectionRef>;
using Sequence = std::vector<Item>;

/// XPath 3.1 map or array. Map entries keep insertion order and unique keys;
/// keys are atomic items compared with same_item().
struct Collection {
  enum class Kind { Map, Array };

  Kind kind = Kind::Map;
  /// Map keys, parallel to values; empty for arrays.
  std::vector<Item> keys;
  /// Map values or array members.
  std::vector<Sequence> values;

  bool is_map() const { return kind == Kind::Map; }
  size_t size() const { return values.size(); }
  /// Value stored under a map key, or nullptr.
  const Sequence* find(const Item& key) const;
};

/// Materialized evaluation result: either a single scalar item or a list.
/// MUST keep items() valid for both shapes so callers can treat results uniformly.
class Value {
 public:
  Value() = default;

  static Value of(Item item);
  static Value list(Sequence items);
  static Value empty_list() { return Value(); }

  bool is_scalar() const { return scalar_; }
  bool empty() const { return items_.empty(); }
  size_t size() const { return items_.size(); }
  /// Returns the scalar item; throws std::logic_error for list values.
  const Item& item() const;
  const Sequence& items() const { return items_; }

 private:
  bool scalar_ = false;
  Sequence items_;
};

/// Finite, single-pass lazy sequence produced by Token::select.
/// MUST NOT be restarted; a fresh select() call re-executes the traversal.
class ItemStream {
 public:
  using Pull = std::function<std::optional<Item>()>;

  ItemStream() = default;
  explicit ItemStream(Pull pull) : pull_(std::move(pull)) {}

  static ItemStream from(Sequence items);
  static ItemStream single(Item item);

  std::optional<Item> next();
  Sequence collect();

 private:
  Pull pull_;
  bool done_ = false;
};

const char* item_kind_name(const Item& item);
bool is_node(const Item& item);
/// Map or array handle of the item, or nullptr for nodes and atomics.
const Collection* as_collection(const Item& item);
bool is_numeric(const Item& item);
/// Identity for nodes, value equality for atomics of the same kind.
bool same_item(const Item& lhs, const Item& rhs);
bool same_value(const Value& lhs, const Value& rhs);
/// Renders an item the way XPath string() would, with a readable form for nodes.
std::string render_item(const Item& item);
std::string render_value(const Value& value);
std::string format_double(double value);
std::string format_decimal(long double value);

}  // namespace xpratt
