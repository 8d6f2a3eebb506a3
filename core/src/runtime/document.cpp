#include "xpratt/document.h"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <stdexcept>
#include <utility>

namespace xpratt {

namespace {

std::shared_ptr<xmlDoc> adopt(xmlDocPtr doc) {
  return std::shared_ptr<xmlDoc>(doc, [](xmlDocPtr d) { xmlFreeDoc(d); });
}

std::string last_error_message() {
  const xmlError* error = xmlGetLastError();
  if (error == nullptr || error->message == nullptr) return "malformed document";
  std::string message = error->message;
  while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
    message.pop_back();
  }
  return message + " (line " + std::to_string(error->line) + ")";
}

}  // namespace

Document::Document(std::shared_ptr<xmlDoc> doc, std::string uri)
    : doc_(std::move(doc)), uri_(std::move(uri)) {}

std::shared_ptr<Document> Document::parse_xml(const std::string& text, const std::string& uri) {
  xmlResetLastError();
  xmlDocPtr doc = xmlReadMemory(text.data(),
                                static_cast<int>(text.size()),
                                uri.empty() ? nullptr : uri.c_str(),
                                nullptr,
                                XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET);
  if (!doc) {
    throw std::runtime_error("Failed to parse XML" + (uri.empty() ? std::string() : " " + uri) +
                             ": " + last_error_message());
  }
  return std::shared_ptr<Document>(new Document(adopt(doc), uri));
}

std::shared_ptr<Document> Document::parse_html(const std::string& text, const std::string& uri) {
  htmlDocPtr doc = htmlReadMemory(text.data(),
                                  static_cast<int>(text.size()),
                                  uri.empty() ? nullptr : uri.c_str(),
                                  nullptr,
                                  HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                                      HTML_PARSE_NONET);
  if (!doc) {
    // libxml2 returns no document for empty input; keep an empty tree instead.
    doc = htmlNewDocNoDtD(nullptr, nullptr);
    if (!doc) throw std::runtime_error("Failed to allocate HTML document");
  }
  return std::shared_ptr<Document>(new Document(adopt(doc), uri));
}

NodeRef Document::root() const {
  return NodeRef{reinterpret_cast<xmlNode*>(doc_.get())};
}

}  // namespace xpratt
