#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace xpratt {

struct TokenClass;

/// Classification of one raw match of the combined tokenizer pattern.
struct Lexeme {
  enum class Kind { Literal, Symbol, Name, Unknown } kind = Kind::Unknown;
  std::string text;
  size_t start = 0;
  size_t end = 0;
};

const char* lexeme_kind_name(Lexeme::Kind kind);

/// Compiled alternation of every registered symbol plus literal/name fallbacks.
/// Whitespace runs and quoted strings are scanned by hand; the regex only sees
/// bounded tokens, anchored at the cursor. Every call makes progress.
/// Inputs are a symbol table snapshot; outputs are matches with four groups.
class Tokenizer {
 public:
  /// Builds the tokenizer from a symbol table.
  /// MUST order multi-character symbols longest-first and MUST reject patterns
  /// that add capture groups (the four-group layout is part of the contract).
  /// Characters in string_quotes open string literals with doubled-quote escapes.
  static Tokenizer build(const std::map<std::string, std::unique_ptr<TokenClass>>& symbol_table,
                         const std::string& literals_pattern,
                         const std::string& name_pattern,
                         const std::string& string_quotes = "'\"");

  const std::string& pattern() const { return pattern_; }
  const std::regex& regex() const { return regex_; }
  const std::string& string_quotes() const { return quotes_; }

  /// Maps a match of regex() to a lexeme; base is the offset the match was anchored at.
  /// Returns false when no group took part in the match.
  bool classify(const std::smatch& match, size_t base, Lexeme& out) const;
  /// Skips whitespace from pos and lexes one lexeme, leaving pos after it.
  /// Returns false at the end of the text.
  bool next(const std::string& text, size_t& pos, Lexeme& out) const;
  /// Lexes a whole string, skipping whitespace. Never throws on any input text.
  std::vector<Lexeme> tokenize(const std::string& text) const;

 private:
  std::string pattern_;
  std::regex regex_;
  std::string quotes_;
};

/// Escapes regex metacharacters so the text matches literally.
std::string regex_escape(const std::string& text);

}  // namespace xpratt
