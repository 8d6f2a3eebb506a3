#include <cctype>
#include <cstdio>
#include <string>

#include "../../util/string_util.h"
#include "xpratt/grammar.h"
#include "xpratt/token.h"

namespace xpratt {

namespace {

/// Unicode character names of the printable ASCII punctuation.
const char* ascii_character_name(char c) {
  switch (c) {
    case '!': return "EXCLAMATION MARK";
    case '"': return "QUOTATION MARK";
    case '#': return "NUMBER SIGN";
    case '$': return "DOLLAR SIGN";
    case '%': return "PERCENT SIGN";
    case '&': return "AMPERSAND";
    case '\'': return "APOSTROPHE";
    case '(': return "LEFT PARENTHESIS";
    case ')': return "RIGHT PARENTHESIS";
    case '*': return "ASTERISK";
    case '+': return "PLUS SIGN";
    case ',': return "COMMA";
    case '-': return "HYPHEN-MINUS";
    case '.': return "FULL STOP";
    case '/': return "SOLIDUS";
    case ':': return "COLON";
    case ';': return "SEMICOLON";
    case '<': return "LESS-THAN SIGN";
    case '=': return "EQUALS SIGN";
    case '>': return "GREATER-THAN SIGN";
    case '?': return "QUESTION MARK";
    case '@': return "COMMERCIAL AT";
    case '[': return "LEFT SQUARE BRACKET";
    case '\\': return "REVERSE SOLIDUS";
    case ']': return "RIGHT SQUARE BRACKET";
    case '^': return "CIRCUMFLEX ACCENT";
    case '_': return "LOW LINE";
    case '`': return "GRAVE ACCENT";
    case '{': return "LEFT CURLY BRACKET";
    case '|': return "VERTICAL LINE";
    case '}': return "RIGHT CURLY BRACKET";
    case '~': return "TILDE";
    default: return nullptr;
  }
}

bool is_alnum(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool all_of(const std::string& s, bool (*pred)(char)) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!pred(c)) return false;
  }
  return true;
}

bool is_dash_or_underscore(char c) {
  return c == '-' || c == '_';
}

bool is_identifier(const std::string& s) {
  if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) return false;
  for (char c : s) {
    if (!is_alnum(c) && c != '_') return false;
  }
  return true;
}

std::string strip(std::string s, const std::string& chars) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (chars.find(c) == std::string::npos) out.push_back(c);
  }
  return out;
}

std::string character_fragment(char c) {
  if (is_alnum(c) || c == '_') return std::string(1, c);
  const char* name = ascii_character_name(c);
  if (name == nullptr) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "U%02X", static_cast<unsigned char>(c));
    return buffer;
  }
  return util::title_case(name) + "_";
}

}  // namespace

std::string symbol_to_class_name(const std::string& symbol) {
  if (all_of(symbol, is_alnum)) {
    return util::title_case(symbol);
  }
  if (is_special_symbol(symbol)) {
    return util::title_case(symbol.substr(1, symbol.size() - 2));
  }
  if (all_of(symbol, is_dash_or_underscore)) {
    std::string names;
    for (char c : symbol) {
      if (!names.empty()) names += " ";
      names += ascii_character_name(c);
    }
    return strip(util::title_case(names), " -_");
  }

  std::string value = symbol;
  for (char& c : value) {
    if (c == '-') c = '_';
  }
  if (is_identifier(value)) {
    return strip(util::title_case(value), "_");
  }

  std::string out;
  for (char c : symbol) out += character_fragment(c);
  return strip(out, " -_");
}

}  // namespace xpratt
