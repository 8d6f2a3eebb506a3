#pragma once

#include <memory>
#include <string>

#include "xpratt/value.h"

struct _xmlDoc;

namespace xpratt {

/// Owns one parsed libxml2 document; nodes handed out as NodeRef borrow from it.
class Document {
 public:
  /// Parses XML text; throws std::runtime_error when the text is not well formed.
  static std::shared_ptr<Document> parse_xml(const std::string& text, const std::string& uri = "");
  /// Parses HTML text with libxml2 recovery (never fails on tag soup).
  static std::shared_ptr<Document> parse_html(const std::string& text, const std::string& uri = "");

  /// Document node (the XPath root "/").
  NodeRef root() const;
  const std::string& uri() const { return uri_; }

 private:
  Document(std::shared_ptr<_xmlDoc> doc, std::string uri);

  std::shared_ptr<_xmlDoc> doc_;
  std::string uri_;
};

struct LoadOptions {
  bool html = false;
  int timeout_ms = 5000;
};

/// Reads a whole file; throws std::runtime_error when it cannot be opened.
std::string read_file(const std::string& path);
/// Fetches an http(s) URL. Throws when curl support is not compiled in.
std::string fetch_url(const std::string& url, int timeout_ms);
bool is_url(const std::string& path_or_url);
/// Loads a file or URL and parses it as XML or HTML.
std::shared_ptr<Document> load_document(const std::string& path_or_url, const LoadOptions& options = {});

}  // namespace xpratt
