#include "xpratt/value.h"

#include <libxml/tree.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "../util/string_util.h"

namespace xpratt {

Value Value::of(Item item) {
  Value out;
  out.scalar_ = true;
  out.items_.push_back(std::move(item));
  return out;
}

Value Value::list(Sequence items) {
  Value out;
  out.items_ = std::move(items);
  return out;
}

const Item& Value::item() const {
  if (!scalar_) throw std::logic_error("value is a list, not a single item");
  return items_.front();
}

ItemStream ItemStream::from(Sequence items) {
  auto shared = std::make_shared<Sequence>(std::move(items));
  auto index = std::make_shared<size_t>(0);
  return ItemStream([shared, index]() -> std::optional<Item> {
    if (*index >= shared->size()) return std::nullopt;
    return (*shared)[(*index)++];
  });
}

ItemStream ItemStream::single(Item item) {
  Sequence items;
  items.push_back(std::move(item));
  return from(std::move(items));
}

std::optional<Item> ItemStream::next() {
  if (done_ || !pull_) return std::nullopt;
  std::optional<Item> item = pull_();
  if (!item.has_value()) {
    done_ = true;
    pull_ = nullptr;
  }
  return item;
}

Sequence ItemStream::collect() {
  Sequence out;
  while (auto item = next()) out.push_back(std::move(*item));
  return out;
}

const char* item_kind_name(const Item& item) {
  switch (item.index()) {
    case 0:
      return "xs:boolean";
    case 1:
      return "xs:integer";
    case 2:
      return "xs:decimal";
    case 3:
      return "xs:double";
    case 4:
      return "xs:string";
    case 5:
      return "node()";
    case 6:
      return std::get<CollectionRef>(item)->is_map() ? "map(*)" : "array(*)";
    default:
      return "item()";
  }
}

const Collection* as_collection(const Item& item) {
  const CollectionRef* ref = std::get_if<CollectionRef>(&item);
  return ref == nullptr ? nullptr : ref->get();
}

const Sequence* Collection::find(const Item& key) const {
  for (size_t i = 0; i < keys.size(); ++i) {
    if (same_item(keys[i], key)) return &values[i];
  }
  return nullptr;
}

bool is_node(const Item& item) {
  return std::holds_alternative<NodeRef>(item);
}

bool is_numeric(const Item& item) {
  return std::holds_alternative<int64_t>(item) || std::holds_alternative<Decimal>(item) ||
         std::holds_alternative<double>(item);
}

bool same_item(const Item& lhs, const Item& rhs) {
  if (is_numeric(lhs) && is_numeric(rhs)) {
    if (std::holds_alternative<int64_t>(lhs) && std::holds_alternative<int64_t>(rhs)) {
      return std::get<int64_t>(lhs) == std::get<int64_t>(rhs);
    }
    auto as_long_double = [](const Item& item) -> long double {
      if (const auto* i = std::get_if<int64_t>(&item)) return static_cast<long double>(*i);
      if (const auto* d = std::get_if<Decimal>(&item)) return d->value;
      return static_cast<long double>(std::get<double>(item));
    };
    return as_long_double(lhs) == as_long_double(rhs);
  }
  return lhs == rhs;
}

bool same_value(const Value& lhs, const Value& rhs) {
  if (lhs.size() != rhs.size()) return false;
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (!same_item(lhs.items()[i], rhs.items()[i])) return false;
  }
  return true;
}

std::string format_double(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "INF" : "-INF";
  if (value == 0) return std::signbit(value) ? "-0" : "0";
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.15g", value);
  if (std::strtod(buffer, nullptr) != value) {
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  }
  return util::to_upper(buffer);
}

std::string format_decimal(long double value) {
  if (value == 0) return "0";
  char buffer[80];
  std::snprintf(buffer, sizeof(buffer), "%.18Lf", value);
  std::string out = buffer;
  const size_t dot = out.find('.');
  if (dot != std::string::npos) {
    while (!out.empty() && out.back() == '0') out.pop_back();
    if (!out.empty() && out.back() == '.') out.pop_back();
  }
  if (out == "-0") return "0";
  return out;
}

namespace {

std::string render_member(const Item& item) {
  if (const auto* s = std::get_if<std::string>(&item)) return "\"" + *s + "\"";
  return render_item(item);
}

std::string render_members(const Sequence& items) {
  if (items.size() == 1) return render_member(items.front());
  std::string out = "(";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0) out += ",";
    out += render_member(items[i]);
  }
  return out + ")";
}

std::string render_collection(const Collection& collection) {
  std::string out = collection.is_map() ? "map{" : "[";
  for (size_t i = 0; i < collection.size(); ++i) {
    if (i != 0) out += ",";
    if (collection.is_map()) out += render_member(collection.keys[i]) + ":";
    out += render_members(collection.values[i]);
  }
  return out + (collection.is_map() ? "}" : "]");
}

}  // namespace

std::string render_item(const Item& item) {
  if (const Collection* collection = as_collection(item)) return render_collection(*collection);
  if (const auto* b = std::get_if<bool>(&item)) return *b ? "true" : "false";
  if (const auto* i = std::get_if<int64_t>(&item)) return std::to_string(*i);
  if (const auto* d = std::get_if<Decimal>(&item)) return format_decimal(d->value);
  if (const auto* f = std::get_if<double>(&item)) return format_double(*f);
  if (const auto* s = std::get_if<std::string>(&item)) return *s;
  const NodeRef& ref = std::get<NodeRef>(item);
  if (ref.node == nullptr) return "";
  if (ref.node->type == XML_DOCUMENT_NODE || ref.node->type == XML_HTML_DOCUMENT_NODE) return "/";
  xmlChar* path = xmlGetNodePath(ref.node);
  if (path == nullptr) return "";
  std::string out = reinterpret_cast<const char*>(path);
  xmlFree(path);
  return out;
}

std::string render_value(const Value& value) {
  if (value.is_scalar()) return render_item(value.item());
  std::string out = "(";
  for (size_t i = 0; i < value.size(); ++i) {
    if (i != 0) out += ", ";
    out += render_item(value.items()[i]);
  }
  out += ")";
  return out;
}

}  // namespace xpratt
