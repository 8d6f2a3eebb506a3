#include "xpratt/tokenizer.h"

#include <algorithm>
#include <cctype>
#include <set>

#include "xpratt/errors.h"
#include "xpratt/token.h"

namespace xpratt {

namespace {

constexpr size_t kLiteralGroup = 1;
constexpr size_t kSymbolGroup = 2;
constexpr size_t kNameGroup = 3;
constexpr size_t kUnknownGroup = 4;

bool longer_first(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return a.size() > b.size();
  return a < b;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) out += separator;
    out += parts[i];
  }
  return out;
}

std::regex compile(const std::string& pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error& err) {
    throw RegistrationError(RegistrationErrorKind::BadPattern,
                            "invalid tokenizer pattern: " + std::string(err.what()));
  }
}

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// End offset of the quoted string opening at pos, or npos when it is unterminated.
size_t scan_quoted(const std::string& text, size_t pos) {
  const char quote = text[pos];
  size_t i = pos + 1;
  while (i < text.size()) {
    if (text[i] != quote) {
      ++i;
      continue;
    }
    if (i + 1 < text.size() && text[i + 1] == quote) {
      i += 2;
      continue;
    }
    return i + 1;
  }
  return std::string::npos;
}

}  // namespace

const char* lexeme_kind_name(Lexeme::Kind kind) {
  switch (kind) {
    case Lexeme::Kind::Literal:
      return "literal";
    case Lexeme::Kind::Symbol:
      return "symbol";
    case Lexeme::Kind::Name:
      return "name";
    case Lexeme::Kind::Unknown:
      return "unknown";
  }
  return "unknown";
}

std::string regex_escape(const std::string& text) {
  static const std::string kMeta = "\\^$.|?*+()[]{}-/";
  std::string out;
  out.reserve(text.size() * 2);
  for (char c : text) {
    if (kMeta.find(c) != std::string::npos) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

Tokenizer Tokenizer::build(const std::map<std::string, std::unique_ptr<TokenClass>>& symbol_table,
                           const std::string& literals_pattern,
                           const std::string& name_pattern,
                           const std::string& string_quotes) {
  const std::regex name_regex = compile(name_pattern);

  std::vector<std::string> character_patterns;
  std::vector<std::string> string_patterns;
  std::vector<std::string> name_patterns;
  std::set<std::string> custom_patterns;

  for (const auto& entry : symbol_table) {
    const TokenClass& token_class = *entry.second;
    const std::string& symbol = token_class.symbol;
    if (is_special_symbol(symbol)) continue;
    std::smatch m;
    if (token_class.pattern.has_value()) {
      custom_patterns.insert(*token_class.pattern);
    } else if (std::regex_search(symbol, m, name_regex, std::regex_constants::match_continuous)) {
      name_patterns.push_back(regex_escape(symbol));
    } else if (symbol.size() == 1) {
      character_patterns.push_back(regex_escape(symbol));
    } else {
      string_patterns.push_back(regex_escape(symbol));
    }
  }

  // Sorting on escaped text keeps the relative order of the raw symbols.
  std::sort(string_patterns.begin(), string_patterns.end(), longer_first);
  std::sort(name_patterns.begin(), name_patterns.end(), longer_first);

  std::vector<std::string> symbol_patterns;
  if (!string_patterns.empty()) {
    symbol_patterns.push_back(join(string_patterns, "|"));
  }
  if (!character_patterns.empty()) {
    symbol_patterns.push_back("[" + join(character_patterns, "") + "]");
  }
  if (!name_patterns.empty()) {
    symbol_patterns.push_back("\\b(?:" + join(name_patterns, "|") + ")\\b(?![\\-\\.])");
  }
  if (!custom_patterns.empty()) {
    symbol_patterns.push_back(
        join(std::vector<std::string>(custom_patterns.begin(), custom_patterns.end()), "|"));
  }
  // An empty alternative would match the empty string and stall the lexer.
  std::string symbols = symbol_patterns.empty() ? "(?!)" : join(symbol_patterns, "|");

  Tokenizer tokenizer;
  tokenizer.quotes_ = string_quotes;
  tokenizer.pattern_ = "(" + literals_pattern + ")|(" + symbols + ")|(" + name_pattern +
                       ")|(\\S)";
  tokenizer.regex_ = compile(tokenizer.pattern_);
  if (tokenizer.regex_.mark_count() != 4) {
    throw RegistrationError(RegistrationErrorKind::BadPattern,
                            "tokenizer pattern must have exactly 4 groups, found " +
                                std::to_string(tokenizer.regex_.mark_count()) +
                                " (custom and literal patterns must not capture)");
  }
  return tokenizer;
}

bool Tokenizer::classify(const std::smatch& match, size_t base, Lexeme& out) const {
  const size_t start = base + static_cast<size_t>(match.position(0));
  if (match[kLiteralGroup].matched) {
    out.kind = Lexeme::Kind::Literal;
    out.text = match.str(kLiteralGroup);
  } else if (match[kSymbolGroup].matched) {
    out.kind = Lexeme::Kind::Symbol;
    out.text = match.str(kSymbolGroup);
  } else if (match[kNameGroup].matched) {
    out.kind = Lexeme::Kind::Name;
    out.text = match.str(kNameGroup);
  } else if (match[kUnknownGroup].matched) {
    out.kind = Lexeme::Kind::Unknown;
    out.text = match.str(kUnknownGroup);
  } else {
    return false;
  }
  out.start = start;
  out.end = start + out.text.size();
  return true;
}

bool Tokenizer::next(const std::string& text, size_t& pos, Lexeme& out) const {
  while (pos < text.size() && is_space(text[pos])) ++pos;
  if (pos >= text.size()) return false;

  const size_t start = pos;
  if (quotes_.find(text[start]) != std::string::npos) {
    const size_t end = scan_quoted(text, start);
    if (end == std::string::npos) {
      // An unterminated quote is one unknown character; lexing resumes after it.
      out.kind = Lexeme::Kind::Unknown;
      out.text = text.substr(start, 1);
    } else {
      out.kind = Lexeme::Kind::Literal;
      out.text = text.substr(start, end - start);
    }
    out.start = start;
    out.end = start + out.text.size();
    pos = out.end;
    return true;
  }

  auto flags = std::regex_constants::match_continuous;
  if (start > 0) flags |= std::regex_constants::match_prev_avail;
  std::smatch match;
  const auto first = text.cbegin() + static_cast<std::ptrdiff_t>(start);
  if (std::regex_search(first, text.cend(), match, regex_, flags) && match.length(0) > 0 &&
      classify(match, start, out)) {
    pos = out.end;
    return true;
  }
  out.kind = Lexeme::Kind::Unknown;
  out.text = text.substr(start, 1);
  out.start = start;
  out.end = start + 1;
  pos = out.end;
  return true;
}

std::vector<Lexeme> Tokenizer::tokenize(const std::string& text) const {
  std::vector<Lexeme> out;
  size_t pos = 0;
  Lexeme lexeme;
  while (next(text, pos, lexeme)) out.push_back(lexeme);
  return out;
}

}  // namespace xpratt
