#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "xpratt/grammar.h"
#include "xpratt/token.h"

namespace xpratt {

enum class ParseState { NotStarted, Lexing, Building, TrailingCheck, Done, Failed };

const char* parse_state_name(ParseState state);

struct ParserOptions {
  /// Evaluates the tree without a context after a successful parse.
  bool static_evaluation = true;
};

/// Pratt driver over one grammar. Holds per-parse cursor state.
/// MUST NOT be shared by concurrent parse() calls; use one Parser per thread.
/// Tokens returned by parse() keep a pointer to this parser and MUST NOT outlive it.
class Parser {
 public:
  explicit Parser(std::shared_ptr<Grammar> grammar, ParserOptions options = {});

  Parser(const Parser&) = delete;
  Parser& operator=(const Parser&) = delete;

  /// Parses a whole expression and returns the root of its tree.
  /// Trailing input after the expression is a ParseError. Cursor state is reset
  /// on every exit path, so the parser is reusable after a failure.
  TokenPtr parse(const std::string& source);

  /// Consumes the lookahead token and lexes the following one.
  /// When symbols are given the lookahead MUST be one of them.
  TokenPtr advance(std::initializer_list<std::string> symbols = {}, const std::string& message = "");
  TokenPtr advance(const std::vector<std::string>& symbols, const std::string& message = "");
  /// Pratt core: nud of the next token, then led while the lookahead binds tighter than rbp.
  TokenPtr expression(int rbp = 0);
  /// Skips raw source up to one of the stop symbols and returns the skipped text.
  std::string advance_until(std::initializer_list<std::string> stop_symbols);
  /// Checks the lookahead symbol without consuming it. A name-like lookahead is
  /// turned into a '(name)' token when '(name)' is accepted.
  void expected_next(std::initializer_list<std::string> symbols, const std::string& message = "");

  const Token& next_token() const { return *next_token_; }
  void replace_next_token(TokenPtr token);
  /// Symbol of the last consumed token ('(start)' before the first advance).
  const std::string& token_symbol() const { return token_symbol_; }
  const SourceSpan& token_span() const { return token_span_; }

  const std::string& source() const { return *source_; }
  std::pair<size_t, size_t> position() const;
  bool is_source_start() const;
  bool is_line_start() const;
  bool is_spaced(bool before = true, bool after = true) const;

  TokenPtr make_token(const std::string& lookup_name, Item value, SourceSpan span);
  TokenPtr make_token(const std::string& lookup_name, SourceSpan span);
  /// Strips the quotes of a string literal and collapses doubled quotes.
  static std::string unescape(const std::string& literal);

  Grammar& grammar() { return *grammar_; }
  const Grammar& grammar() const { return *grammar_; }
  const ParserOptions& options() const { return options_; }
  ParseState state() const { return state_; }

 private:
  class CursorReset;

  void reset();
  void lex_next();
  void skip_comments();
  TokenPtr make_literal(const std::string& text, SourceSpan span);
  void run_static_evaluation(const Token& root) const;

  std::shared_ptr<Grammar> grammar_;
  ParserOptions options_;
  std::shared_ptr<const Tokenizer> tokenizer_;
  std::shared_ptr<const std::string> source_;
  size_t cursor_ = 0;
  TokenPtr next_token_;
  std::string token_symbol_;
  SourceSpan token_span_;
  ParseState state_ = ParseState::NotStarted;
};

}  // namespace xpratt
