#include "xpratt/document.h"

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "../util/string_util.h"

#ifdef XPRATT_USE_CURL
#include <curl/curl.h>
#endif

namespace xpratt {

/// Loads file contents for document loading and expression files.
/// MUST throw on IO errors and MUST not perform network access.
std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool is_url(const std::string& path_or_url) {
  const std::string lower = util::to_lower(path_or_url);
  return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

#ifdef XPRATT_USE_CURL
namespace {

struct CurlCleanup {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

/// Appends curl response bytes into a caller-provided buffer.
/// MUST return the full byte count or curl treats it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

std::string normalize_content_type(const char* raw) {
  if (!raw) return "";
  std::string value(raw);
  size_t end = value.find(';');
  if (end != std::string::npos) {
    value = value.substr(0, end);
  }
  return util::to_lower(util::trim_ws(value));
}

void validate_content_type(CURL* curl) {
  const char* raw = nullptr;
  CURLcode info = curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &raw);
  if (info != CURLE_OK) {
    throw std::runtime_error("Failed to read Content-Type for URL");
  }
  std::string content_type = normalize_content_type(raw);
  if (content_type.empty()) {
    throw std::runtime_error("Missing Content-Type for URL");
  }
  if (content_type == "text/html" ||
      content_type == "application/xhtml+xml" ||
      content_type == "application/xml" ||
      content_type == "text/xml") {
    return;
  }
  throw std::runtime_error("Unsupported Content-Type for document fetch: " + content_type);
}

}  // namespace
#endif

/// Fetches URL content when curl is enabled.
/// MUST honor timeout_ms and MUST throw on curl failures.
std::string fetch_url(const std::string& url, int timeout_ms) {
#ifdef XPRATT_USE_CURL
  std::unique_ptr<CURL, CurlCleanup> curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl");
  }
  std::string buffer;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "xpratt/0.1");
  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  validate_content_type(curl.get());
  return buffer;
#else
  (void)url;
  (void)timeout_ms;
  throw std::runtime_error("URL fetching is disabled (libcurl not available)");
#endif
}

std::shared_ptr<Document> load_document(const std::string& path_or_url, const LoadOptions& options) {
  const bool remote = is_url(path_or_url);
  const std::string text = remote ? fetch_url(path_or_url, options.timeout_ms) : read_file(path_or_url);
  if (options.html) return Document::parse_html(text, path_or_url);
  return Document::parse_xml(text, path_or_url);
}

}  // namespace xpratt
