#include "result_renderer.h"

#include <cmath>
#include <sstream>

#include <libxml/tree.h>

#include "xpratt/diagnostics.h"

namespace xpratt::render {

namespace {

const char* node_kind(const xmlNode* node) {
  switch (node->type) {
    case XML_ELEMENT_NODE:
      return "element";
    case XML_ATTRIBUTE_NODE:
      return "attribute";
    case XML_TEXT_NODE:
    case XML_CDATA_SECTION_NODE:
      return "text";
    case XML_COMMENT_NODE:
      return "comment";
    case XML_DOCUMENT_NODE:
    case XML_HTML_DOCUMENT_NODE:
      return "document";
    default:
      return "node";
  }
}

void write_number(std::ostringstream& out, double value, const std::string& text) {
  if (std::isnan(value) || std::isinf(value)) {
    out << "\"" << text << "\"";
  } else {
    out << text;
  }
}

void write_item(std::ostringstream& out, const Item& item);

void write_members(std::ostringstream& out, const Sequence& items) {
  if (items.size() == 1) {
    write_item(out, items.front());
    return;
  }
  out << "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out << ",";
    write_item(out, items[i]);
  }
  out << "]";
}

/// Maps become objects keyed by the string value of their keys; arrays become arrays.
void write_collection(std::ostringstream& out, const Collection& collection) {
  out << (collection.is_map() ? "{" : "[");
  for (size_t i = 0; i < collection.size(); ++i) {
    if (i > 0) out << ",";
    if (collection.is_map()) out << "\"" << json_escape(render_item(collection.keys[i])) << "\":";
    write_members(out, collection.values[i]);
  }
  out << (collection.is_map() ? "}" : "]");
}

void write_item(std::ostringstream& out, const Item& item) {
  switch (item.index()) {
    case 0:
      out << (std::get<bool>(item) ? "true" : "false");
      break;
    case 1:
      out << std::get<int64_t>(item);
      break;
    case 2: {
      const long double value = std::get<Decimal>(item).value;
      write_number(out, static_cast<double>(value), format_decimal(value));
      break;
    }
    case 3: {
      const double value = std::get<double>(item);
      write_number(out, value, format_double(value));
      break;
    }
    case 4:
      out << "\"" << json_escape(std::get<std::string>(item)) << "\"";
      break;
    case 6:
      write_collection(out, *std::get<CollectionRef>(item));
      break;
    default: {
      const xmlNode* node = std::get<NodeRef>(item).node;
      if (node == nullptr) {
        out << "null";
        break;
      }
      out << "{\"kind\":\"" << node_kind(node) << "\",\"name\":";
      if (node->name != nullptr && node->type != XML_TEXT_NODE && node->type != XML_COMMENT_NODE) {
        out << "\"" << json_escape(reinterpret_cast<const char*>(node->name)) << "\"";
      } else {
        out << "null";
      }
      out << ",\"path\":\"" << json_escape(render_item(item)) << "\"}";
      break;
    }
  }
}

}  // namespace

std::string render_plain(const Sequence& items) {
  std::ostringstream out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out << "\n";
    out << render_item(items[i]);
  }
  return out.str();
}

std::string render_json(const Sequence& items) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out << ",";
    write_item(out, items[i]);
  }
  out << "]";
  return out.str();
}

}  // namespace xpratt::render
