#include <libxml/xpath.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <regex>
#include <unordered_set>

#include "../util/string_util.h"
#include "xpath_internal.h"

namespace xpratt::xpath {

namespace {

std::string take_xml_string(xmlChar* text) {
  if (text == nullptr) return "";
  std::string out(reinterpret_cast<const char*>(text));
  xmlFree(text);
  return out;
}

EvaluationError cannot_atomize(const Item& item) {
  return EvaluationError("FOTY0013", std::string("cannot atomize ") + item_kind_name(item));
}

bool is_untyped(const Item& item) {
  return is_node(item);
}

template <typename T>
bool compare_values(const T& lhs, const T& rhs, CompareOp op) {
  switch (op) {
    case CompareOp::Eq:
      return lhs == rhs;
    case CompareOp::Ne:
      return lhs != rhs;
    case CompareOp::Lt:
      return lhs < rhs;
    case CompareOp::Le:
      return lhs <= rhs;
    case CompareOp::Gt:
      return lhs > rhs;
    case CompareOp::Ge:
      return lhs >= rhs;
  }
  return false;
}

bool is_relational(CompareOp op) {
  return op != CompareOp::Eq && op != CompareOp::Ne;
}

bool untyped_to_boolean(const Token& self, const std::string& text) {
  const std::string value = util::trim_ws(text);
  if (value == "true" || value == "1") return true;
  if (value == "false" || value == "0") return false;
  throw self.error("FORG0001", "cannot cast '" + value + "' to xs:boolean");
}

bool xpath1_compare_pair(const Item& lhs, const Item& rhs, CompareOp op) {
  if (is_relational(op) || is_numeric(lhs) || is_numeric(rhs)) {
    return compare_values(number_value(lhs), number_value(rhs), op);
  }
  return compare_values(string_value(lhs), string_value(rhs), op);
}

bool xpath2_compare_pair(const Token& self, const Item& lhs, const Item& rhs, CompareOp op) {
  const bool lhs_untyped = is_untyped(lhs);
  const bool rhs_untyped = is_untyped(rhs);
  if (lhs_untyped && rhs_untyped) {
    return compare_values(string_value(lhs), string_value(rhs), op);
  }
  if (lhs_untyped || rhs_untyped) {
    const Item& typed = lhs_untyped ? rhs : lhs;
    const Item& untyped = lhs_untyped ? lhs : rhs;
    Item cast;
    if (is_numeric(typed)) {
      cast = Item(number_value(untyped));
    } else if (std::holds_alternative<bool>(typed)) {
      cast = Item(untyped_to_boolean(self, string_value(untyped)));
    } else {
      cast = Item(string_value(untyped));
    }
    return lhs_untyped ? compare_atomics(self, cast, rhs, op) : compare_atomics(self, lhs, cast, op);
  }
  return compare_atomics(self, lhs, rhs, op);
}

void check_finite(const Token& self, double value) {
  if (std::isnan(value) || std::isinf(value)) {
    throw self.error("FOAR0002", "numeric operation overflow/underflow");
  }
}

Item integer_arithmetic(const Token& self, ArithOp op, int64_t lhs, int64_t rhs) {
  int64_t result = 0;
  switch (op) {
    case ArithOp::Add:
      if (__builtin_add_overflow(lhs, rhs, &result)) throw self.error("FOAR0002", "integer overflow");
      return Item(result);
    case ArithOp::Sub:
      if (__builtin_sub_overflow(lhs, rhs, &result)) throw self.error("FOAR0002", "integer overflow");
      return Item(result);
    case ArithOp::Mul:
      if (__builtin_mul_overflow(lhs, rhs, &result)) throw self.error("FOAR0002", "integer overflow");
      return Item(result);
    case ArithOp::Div:
      if (rhs == 0) throw self.error("FOAR0001", "division by zero");
      return Item(Decimal{static_cast<long double>(lhs) / static_cast<long double>(rhs)});
    case ArithOp::IDiv:
      if (rhs == 0) throw self.error("FOAR0001", "division by zero");
      if (lhs == std::numeric_limits<int64_t>::min() && rhs == -1) {
        throw self.error("FOAR0002", "integer overflow");
      }
      return Item(static_cast<int64_t>(lhs / rhs));
    case ArithOp::Mod:
      if (rhs == 0) throw self.error("FOAR0001", "division by zero");
      if (rhs == -1) return Item(static_cast<int64_t>(0));
      return Item(static_cast<int64_t>(lhs % rhs));
  }
  return Item(result);
}

Item decimal_arithmetic(const Token& self, ArithOp op, long double lhs, long double rhs) {
  switch (op) {
    case ArithOp::Add:
      return Item(Decimal{lhs + rhs});
    case ArithOp::Sub:
      return Item(Decimal{lhs - rhs});
    case ArithOp::Mul:
      return Item(Decimal{lhs * rhs});
    case ArithOp::Div:
      if (rhs == 0) throw self.error("FOAR0001", "division by zero");
      return Item(Decimal{lhs / rhs});
    case ArithOp::IDiv: {
      if (rhs == 0) throw self.error("FOAR0001", "division by zero");
      const long double quotient = std::trunc(lhs / rhs);
      if (std::fabs(quotient) >= 9.2e18L) throw self.error("FOAR0002", "integer overflow");
      return Item(static_cast<int64_t>(quotient));
    }
    case ArithOp::Mod:
      if (rhs == 0) throw self.error("FOAR0001", "division by zero");
      return Item(Decimal{std::fmod(lhs, rhs)});
  }
  return Item(Decimal{0});
}

Item double_arithmetic(const Token& self, ArithOp op, double lhs, double rhs) {
  switch (op) {
    case ArithOp::Add:
      return Item(lhs + rhs);
    case ArithOp::Sub:
      return Item(lhs - rhs);
    case ArithOp::Mul:
      return Item(lhs * rhs);
    case ArithOp::Div:
      return Item(lhs / rhs);
    case ArithOp::IDiv: {
      if (rhs == 0) throw self.error("FOAR0001", "division by zero");
      const double quotient = std::trunc(lhs / rhs);
      check_finite(self, quotient);
      if (std::fabs(quotient) >= 9.2e18) throw self.error("FOAR0002", "integer overflow");
      return Item(static_cast<int64_t>(quotient));
    }
    case ArithOp::Mod:
      return Item(std::fmod(lhs, rhs));
  }
  return Item(0.0);
}

void append_descendants(xmlNode* node, std::vector<xmlNode*>& out) {
  std::vector<xmlNode*> stack;
  for (xmlNode* child = node->last; child != nullptr; child = child->prev) {
    if (is_tree_node(child)) stack.push_back(child);
  }
  while (!stack.empty()) {
    xmlNode* current = stack.back();
    stack.pop_back();
    out.push_back(current);
    if (current->type != XML_ELEMENT_NODE) continue;
    for (xmlNode* child = current->last; child != nullptr; child = child->prev) {
      if (is_tree_node(child)) stack.push_back(child);
    }
  }
}

bool has_children(const xmlNode* node) {
  return node->type == XML_ELEMENT_NODE || is_document(node);
}

}  // namespace

Context& require_context(const Token& self, Context* context) {
  if (context == nullptr) throw self.missing_context();
  return *context;
}

const Item& require_item(const Token& self, Context* context) {
  Context& ctx = require_context(self, context);
  if (!ctx.item().has_value()) throw self.error("XPDY0002", "context item is absent");
  return *ctx.item();
}

xmlNode* require_node(const Token& self, Context* context) {
  xmlNode* node = as_node(require_item(self, context));
  if (node == nullptr) throw self.error("XPTY0020", "context item is not a node");
  return node;
}

bool is_xpath1(const Token& self) {
  return self.has_parser() && self.parser().grammar().name() == kXPath1;
}

Sequence evaluate_sequence(const Token& token, Context* context) {
  return token.evaluate(context).items();
}

xmlNode* as_node(const Item& item) {
  const NodeRef* ref = std::get_if<NodeRef>(&item);
  return ref == nullptr ? nullptr : ref->node;
}

std::string node_name(const xmlNode* node) {
  if (node == nullptr || node->name == nullptr) return "";
  const std::string local = reinterpret_cast<const char*>(node->name);
  const xmlNs* ns = nullptr;
  if (node->type == XML_ELEMENT_NODE) {
    ns = node->ns;
  } else if (node->type == XML_ATTRIBUTE_NODE) {
    ns = reinterpret_cast<const xmlAttr*>(node)->ns;
  } else if (node->type != XML_PI_NODE) {
    return "";
  }
  if (ns != nullptr && ns->prefix != nullptr) {
    return std::string(reinterpret_cast<const char*>(ns->prefix)) + ":" + local;
  }
  return local;
}

std::string node_local_name(const xmlNode* node) {
  if (node == nullptr || node->name == nullptr) return "";
  if (node->type != XML_ELEMENT_NODE && node->type != XML_ATTRIBUTE_NODE && node->type != XML_PI_NODE) {
    return "";
  }
  return reinterpret_cast<const char*>(node->name);
}

std::string node_string_value(const xmlNode* node) {
  if (node == nullptr) return "";
  return take_xml_string(xmlNodeGetContent(node));
}

bool is_document(const xmlNode* node) {
  return node != nullptr &&
         (node->type == XML_DOCUMENT_NODE || node->type == XML_HTML_DOCUMENT_NODE);
}

bool is_tree_node(const xmlNode* node) {
  if (node == nullptr) return false;
  switch (node->type) {
    case XML_ELEMENT_NODE:
    case XML_TEXT_NODE:
    case XML_CDATA_SECTION_NODE:
    case XML_COMMENT_NODE:
    case XML_PI_NODE:
      return true;
    default:
      return false;
  }
}

bool is_attribute(const xmlNode* node) {
  return node != nullptr && node->type == XML_ATTRIBUTE_NODE;
}

xmlNode* document_root(xmlNode* node) {
  if (node == nullptr) return nullptr;
  while (node->parent != nullptr) node = node->parent;
  return node;
}

Item atomize(const Item& item) {
  if (is_node(item)) return Item(node_string_value(as_node(item)));
  if (as_collection(item) != nullptr) throw cannot_atomize(item);
  return item;
}

std::optional<Item> optional_operand(const Token& self, const Token& operand, Context* context) {
  Sequence items = evaluate_sequence(operand, context);
  if (items.empty()) return std::nullopt;
  if (items.size() > 1) {
    throw self.wrong_type("a sequence of more than one item is not allowed as an operand of '" +
                          self.symbol() + "'");
  }
  return std::move(items.front());
}

std::string string_value(const Item& item) {
  if (as_collection(item) != nullptr) throw cannot_atomize(item);
  switch (item.index()) {
    case 0:
      return std::get<bool>(item) ? "true" : "false";
    case 1:
      return std::to_string(std::get<int64_t>(item));
    case 2:
      return format_decimal(std::get<Decimal>(item).value);
    case 3:
      return format_double(std::get<double>(item));
    case 4:
      return std::get<std::string>(item);
    default:
      return node_string_value(as_node(item));
  }
}

double parse_number(const std::string& text) {
  static const std::regex kNumber(R"(^\s*[-+]?(\d+(\.\d*)?|\.\d+)([eE][-+]?\d+)?\s*$)");
  const std::string value = util::trim_ws(text);
  if (value == "INF") return std::numeric_limits<double>::infinity();
  if (value == "-INF") return -std::numeric_limits<double>::infinity();
  if (value == "NaN" || !std::regex_match(value, kNumber)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return std::strtod(value.c_str(), nullptr);
}

double number_value(const Item& item) {
  switch (item.index()) {
    case 0:
      return std::get<bool>(item) ? 1.0 : 0.0;
    case 1:
      return static_cast<double>(std::get<int64_t>(item));
    case 2:
      return static_cast<double>(std::get<Decimal>(item).value);
    case 3:
      return std::get<double>(item);
    default:
      return parse_number(string_value(item));
  }
}

long double to_long_double(const Item& item) {
  if (const auto* integer = std::get_if<int64_t>(&item)) return static_cast<long double>(*integer);
  if (const auto* decimal = std::get_if<Decimal>(&item)) return decimal->value;
  return static_cast<long double>(number_value(item));
}

bool effective_boolean_value(const Token& self, const Sequence& items) {
  if (items.empty()) return false;
  const Item& first = items.front();
  if (is_node(first)) return true;
  if (items.size() > 1) {
    throw self.error("FORG0006", "effective boolean value is not defined for a sequence of two or "
                                 "more items starting with an atomic value");
  }
  switch (first.index()) {
    case 0:
      return std::get<bool>(first);
    case 1:
      return std::get<int64_t>(first) != 0;
    case 2:
      return std::get<Decimal>(first).value != 0;
    case 3: {
      const double value = std::get<double>(first);
      return value != 0 && !std::isnan(value);
    }
    case 4:
      return !std::get<std::string>(first).empty();
    default:
      throw self.error("FORG0006", std::string("effective boolean value is not defined for ") +
                                       item_kind_name(first));
  }
}

ItemStream stream_of(const Value& value) {
  if (value.is_scalar()) return ItemStream::single(value.item());
  return ItemStream::from(value.items());
}

std::string string_argument(const Token& self, size_t index, Context* context) {
  if (index >= self.arity()) return string_value(require_item(self, context));
  const Sequence items = evaluate_sequence(self.child(index), context);
  if (items.empty()) return "";
  if (items.size() > 1 && !is_xpath1(self)) {
    throw self.wrong_type("argument " + std::to_string(index + 1) + " of " + self.symbol() +
                          "() must be a single item");
  }
  return string_value(items.front());
}

bool compare_atomics(const Token& self, const Item& lhs, const Item& rhs, CompareOp op) {
  if (is_numeric(lhs) && is_numeric(rhs)) {
    if (std::holds_alternative<double>(lhs) || std::holds_alternative<double>(rhs)) {
      return compare_values(number_value(lhs), number_value(rhs), op);
    }
    return compare_values(to_long_double(lhs), to_long_double(rhs), op);
  }
  if (std::holds_alternative<std::string>(lhs) && std::holds_alternative<std::string>(rhs)) {
    return compare_values(std::get<std::string>(lhs), std::get<std::string>(rhs), op);
  }
  if (std::holds_alternative<bool>(lhs) && std::holds_alternative<bool>(rhs)) {
    return compare_values(std::get<bool>(lhs), std::get<bool>(rhs), op);
  }
  throw self.wrong_type(std::string("cannot compare ") + item_kind_name(lhs) + " and " +
                        item_kind_name(rhs));
}

bool general_compare(const Token& self, const Sequence& lhs, const Sequence& rhs, CompareOp op) {
  if (is_xpath1(self)) {
    const bool lhs_bool = lhs.size() == 1 && std::holds_alternative<bool>(lhs.front());
    const bool rhs_bool = rhs.size() == 1 && std::holds_alternative<bool>(rhs.front());
    if (lhs_bool || rhs_bool) {
      const bool left = lhs_bool ? std::get<bool>(lhs.front()) : effective_boolean_value(self, lhs);
      const bool right = rhs_bool ? std::get<bool>(rhs.front()) : effective_boolean_value(self, rhs);
      if (is_relational(op)) {
        return compare_values(left ? 1.0 : 0.0, right ? 1.0 : 0.0, op);
      }
      return compare_values(left, right, op);
    }
    for (const Item& left : lhs) {
      for (const Item& right : rhs) {
        if (xpath1_compare_pair(left, right, op)) return true;
      }
    }
    return false;
  }
  for (const Item& left : lhs) {
    for (const Item& right : rhs) {
      if (xpath2_compare_pair(self, left, right, op)) return true;
    }
  }
  return false;
}

Item arithmetic(const Token& self, ArithOp op, const Item& lhs, const Item& rhs) {
  if (is_xpath1(self)) {
    return double_arithmetic(self, op, number_value(lhs), number_value(rhs));
  }
  const Item left = is_node(lhs) ? Item(number_value(lhs)) : lhs;
  const Item right = is_node(rhs) ? Item(number_value(rhs)) : rhs;
  if (!is_numeric(left) || !is_numeric(right)) {
    throw self.wrong_type(std::string("unsupported operand types for '") + self.symbol() + "': " +
                          item_kind_name(left) + " and " + item_kind_name(right));
  }
  if (std::holds_alternative<double>(left) || std::holds_alternative<double>(right)) {
    return double_arithmetic(self, op, number_value(left), number_value(right));
  }
  if (std::holds_alternative<Decimal>(left) || std::holds_alternative<Decimal>(right)) {
    return decimal_arithmetic(self, op, to_long_double(left), to_long_double(right));
  }
  return integer_arithmetic(self, op, std::get<int64_t>(left), std::get<int64_t>(right));
}

Value arithmetic_operator(const Token& self, Context* context, ArithOp op) {
  std::optional<Item> lhs;
  std::optional<Item> rhs;
  if (is_xpath1(self)) {
    const Sequence left = evaluate_sequence(self.child(0), context);
    const Sequence right = evaluate_sequence(self.child(1), context);
    if (left.empty() || right.empty()) {
      return Value::of(Item(std::numeric_limits<double>::quiet_NaN()));
    }
    lhs = left.front();
    rhs = right.front();
  } else {
    lhs = optional_operand(self, self.child(0), context);
    rhs = optional_operand(self, self.child(1), context);
    if (!lhs.has_value() || !rhs.has_value()) return Value::empty_list();
  }
  return Value::of(arithmetic(self, op, *lhs, *rhs));
}

Item negate(const Token& self, const Item& operand) {
  if (is_xpath1(self) || is_node(operand)) return Item(-number_value(operand));
  switch (operand.index()) {
    case 1: {
      const int64_t value = std::get<int64_t>(operand);
      if (value == std::numeric_limits<int64_t>::min()) throw self.error("FOAR0002", "integer overflow");
      return Item(static_cast<int64_t>(-value));
    }
    case 2:
      return Item(Decimal{-std::get<Decimal>(operand).value});
    case 3:
      return Item(-std::get<double>(operand));
    default:
      throw self.wrong_type(std::string("unary '") + self.symbol() + "' is not defined for " +
                            item_kind_name(operand));
  }
}

std::vector<xmlNode*> axis_nodes(Axis axis, xmlNode* node) {
  std::vector<xmlNode*> out;
  if (node == nullptr) return out;
  switch (axis) {
    case Axis::Self:
      out.push_back(node);
      break;
    case Axis::Child:
      if (!has_children(node)) break;
      for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (is_tree_node(child)) out.push_back(child);
      }
      break;
    case Axis::Descendant:
      if (has_children(node)) append_descendants(node, out);
      break;
    case Axis::DescendantOrSelf:
      out.push_back(node);
      if (has_children(node)) append_descendants(node, out);
      break;
    case Axis::Parent:
      if (node->parent != nullptr) out.push_back(node->parent);
      break;
    case Axis::AncestorOrSelf:
      out.push_back(node);
      [[fallthrough]];
    case Axis::Ancestor:
      for (xmlNode* parent = node->parent; parent != nullptr; parent = parent->parent) {
        out.push_back(parent);
      }
      break;
    case Axis::FollowingSibling:
      if (!is_tree_node(node)) break;
      for (xmlNode* sibling = node->next; sibling != nullptr; sibling = sibling->next) {
        if (is_tree_node(sibling)) out.push_back(sibling);
      }
      break;
    case Axis::PrecedingSibling:
      if (!is_tree_node(node)) break;
      for (xmlNode* sibling = node->prev; sibling != nullptr; sibling = sibling->prev) {
        if (is_tree_node(sibling)) out.push_back(sibling);
      }
      break;
    case Axis::Following: {
      xmlNode* current = node;
      if (is_attribute(node)) {
        current = node->parent;
        if (current != nullptr) append_descendants(current, out);
      }
      for (; current != nullptr && !is_document(current); current = current->parent) {
        for (xmlNode* sibling = current->next; sibling != nullptr; sibling = sibling->next) {
          if (!is_tree_node(sibling)) continue;
          out.push_back(sibling);
          if (sibling->type == XML_ELEMENT_NODE) append_descendants(sibling, out);
        }
      }
      break;
    }
    case Axis::Preceding: {
      xmlNode* current = is_attribute(node) ? node->parent : node;
      for (; current != nullptr && !is_document(current); current = current->parent) {
        for (xmlNode* sibling = current->prev; sibling != nullptr; sibling = sibling->prev) {
          if (!is_tree_node(sibling)) continue;
          std::vector<xmlNode*> subtree{sibling};
          if (sibling->type == XML_ELEMENT_NODE) append_descendants(sibling, subtree);
          out.insert(out.end(), subtree.rbegin(), subtree.rend());
        }
      }
      break;
    }
    case Axis::Attribute:
      if (node->type != XML_ELEMENT_NODE) break;
      for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
        out.push_back(reinterpret_cast<xmlNode*>(attr));
      }
      break;
  }
  return out;
}

Sequence document_order(const Token& self, const Sequence& nodes) {
  std::vector<xmlNode*> unique;
  std::unordered_set<const xmlNode*> seen;
  for (const Item& item : nodes) {
    xmlNode* node = as_node(item);
    if (node == nullptr) {
      throw self.wrong_type(std::string("'") + self.symbol() + "' requires node operands, got " +
                            item_kind_name(item));
    }
    if (seen.insert(node).second) unique.push_back(node);
  }
  std::stable_sort(unique.begin(), unique.end(), [](xmlNode* a, xmlNode* b) {
    return a != b && xmlXPathCmpNodes(a, b) == 1;
  });
  Sequence out;
  out.reserve(unique.size());
  for (xmlNode* node : unique) out.push_back(Item(NodeRef{node}));
  return out;
}

namespace {

/// True when every node the step yields lies in the subtree of the focus node.
bool stays_in_subtree(const Token& step) {
  const std::string& symbol = step.symbol();
  if (symbol == special::kName || symbol == "." || symbol == "@" || symbol == "child" ||
      symbol == "descendant" || symbol == "descendant-or-self" || symbol == "self" ||
      symbol == "attribute") {
    return true;
  }
  if (symbol == "*" || step.label().has(Role::KindTest)) return step.is_leaf();
  if (symbol == "[" || symbol == "(" || symbol == "trace") {
    return !step.is_leaf() && stays_in_subtree(step.child(0));
  }
  if (symbol == "/" || symbol == "//") {
    return step.arity() == 2 && stays_in_subtree(step.child(0)) && stays_in_subtree(step.child(1));
  }
  return false;
}

/// True when the step yields distinct nodes in document order for a single focus node.
bool yields_document_order(const Token& step) {
  if (stays_in_subtree(step)) return true;
  const std::string& symbol = step.symbol();
  if (symbol == ".." || symbol == "parent" || symbol == "following" ||
      symbol == "following-sibling" || symbol == "/" || symbol == "//" || symbol == "|" ||
      symbol == "union" || symbol == "intersect" || symbol == "except") {
    return true;
  }
  if (symbol == "[" || symbol == "(" || symbol == "trace") {
    return !step.is_leaf() && yields_document_order(step.child(0));
  }
  return false;
}

bool is_inside(const xmlNode* node, const xmlNode* ancestor) {
  for (const xmlNode* current = node; current != nullptr; current = current->parent) {
    if (current == ancestor) return true;
  }
  return false;
}

/// True when the nodes are in document order and none lies inside an earlier one.
bool disjoint_in_order(const Sequence& focus) {
  for (size_t i = 1; i < focus.size(); ++i) {
    xmlNode* previous = as_node(focus[i - 1]);
    xmlNode* current = as_node(focus[i]);
    if (xmlXPathCmpNodes(previous, current) != 1 || is_inside(current, previous)) return false;
  }
  return true;
}

/// Pull state of one path step. In ordered mode nodes are yielded as the step
/// produces them; otherwise the first node forces the remaining results to be
/// collected and sorted.
class StepMapper {
 public:
  StepMapper(const Token& self, Sequence focus, const Token& step, const Context& context,
             bool ordered)
      : self_(&self), step_(&step), focus_(std::move(focus)), base_(context), ordered_(ordered) {}

  std::optional<Item> next() {
    if (sorted_) {
      if (sorted_index_ >= sorted_items_.size()) return std::nullopt;
      return sorted_items_[sorted_index_++];
    }
    while (auto item = next_raw()) {
      if (!is_node(*item)) {
        if (nodes_) throw mixed_result();
        atomics_ = true;
        return item;
      }
      if (atomics_) throw mixed_result();
      if (!ordered_) {
        sort_remaining(std::move(*item));
        return next();
      }
      nodes_ = true;
      if (seen_.insert(as_node(*item)).second) return item;
    }
    return std::nullopt;
  }

 private:
  std::optional<Item> next_raw() {
    while (true) {
      if (auto item = current_.next()) return item;
      if (index_ >= focus_.size()) return std::nullopt;
      const size_t position = ++index_;
      current_ = ItemStream();
      focused_ = std::make_shared<Context>(
          base_.with_focus(focus_[position - 1], position, focus_.size()));
      current_ = step_->select(focused_.get());
    }
  }

  void sort_remaining(Item first) {
    Sequence nodes;
    nodes.push_back(std::move(first));
    while (auto item = next_raw()) {
      if (!is_node(*item)) throw mixed_result();
      nodes.push_back(std::move(*item));
    }
    sorted_items_ = document_order(*self_, nodes);
    sorted_ = true;
  }

  EvaluationError mixed_result() const {
    return self_->error("XPTY0018", "the result of a path step mixes nodes and atomic values");
  }

  const Token* self_;
  const Token* step_;
  Sequence focus_;
  Context base_;
  bool ordered_;
  size_t index_ = 0;
  ItemStream current_;
  std::shared_ptr<Context> focused_;
  bool nodes_ = false;
  bool atomics_ = false;
  std::unordered_set<const xmlNode*> seen_;
  bool sorted_ = false;
  Sequence sorted_items_;
  size_t sorted_index_ = 0;
};

}  // namespace

ItemStream map_step(const Token& self, Sequence focus, const Token& step, const Context& context) {
  for (const Item& item : focus) {
    if (!is_node(item)) {
      throw self.error("XPTY0019", "the left operand of '" + self.symbol() +
                                       "' must be a sequence of nodes, got " +
                                       item_kind_name(item));
    }
  }
  const bool ordered = focus.size() <= 1 ? yields_document_order(step)
                                          : stays_in_subtree(step) && disjoint_in_order(focus);
  auto mapper = std::make_shared<StepMapper>(self, std::move(focus), step, context, ordered);
  return ItemStream([mapper]() { return mapper->next(); });
}

bool apply_node_test(const Token& test, Context& focused) {
  const Value result = test.call_method(kNodeTest, &focused);
  return !result.empty() && std::holds_alternative<bool>(result.items().front()) &&
         std::get<bool>(result.items().front());
}

ItemStream axis_stream(const Token& self, const Token& test, Axis axis, Context* context) {
  xmlNode* node = require_node(self, context);
  struct State {
    std::vector<xmlNode*> nodes;
    size_t index = 0;
    Context base;
  };
  auto state = std::make_shared<State>(State{axis_nodes(axis, node), 0, *context});
  const Token* node_test = &test;
  return ItemStream([state, node_test]() -> std::optional<Item> {
    while (state->index < state->nodes.size()) {
      const size_t position = ++state->index;
      Item candidate(NodeRef{state->nodes[position - 1]});
      Context focused = state->base.with_focus(candidate, position, state->nodes.size());
      if (apply_node_test(*node_test, focused)) return candidate;
    }
    return std::nullopt;
  });
}

}  // namespace xpratt::xpath
