#include "xpratt/parser.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#include "../util/string_util.h"

namespace xpratt {

namespace {

bool contains_symbol(const std::vector<std::string>& symbols, const std::string& symbol) {
  return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
}

bool has_exponent(const std::string& literal) {
  return literal.find_first_of("eE") != std::string::npos;
}

}  // namespace

/// Restores the idle cursor on every exit path of parse().
class Parser::CursorReset {
 public:
  explicit CursorReset(Parser& parser) : parser_(parser) {}
  ~CursorReset() { parser_.reset(); }

  CursorReset(const CursorReset&) = delete;
  CursorReset& operator=(const CursorReset&) = delete;

 private:
  Parser& parser_;
};

const char* parse_state_name(ParseState state) {
  switch (state) {
    case ParseState::NotStarted:
      return "not started";
    case ParseState::Lexing:
      return "lexing";
    case ParseState::Building:
      return "expression-building";
    case ParseState::TrailingCheck:
      return "trailing-check";
    case ParseState::Done:
      return "done";
    case ParseState::Failed:
      return "failed";
  }
  return "failed";
}

Parser::Parser(std::shared_ptr<Grammar> grammar, ParserOptions options)
    : grammar_(std::move(grammar)), options_(options) {
  if (!grammar_) throw std::invalid_argument("Parser requires a grammar");
  grammar_->build();
  tokenizer_ = grammar_->tokenizer();
  reset();
}

void Parser::reset() {
  source_ = std::make_shared<const std::string>();
  cursor_ = 0;
  token_symbol_ = special::kStart;
  token_span_ = SourceSpan{};
  next_token_ = make_token(special::kStart, SourceSpan{});
}

TokenPtr Parser::parse(const std::string& source) {
  tokenizer_ = grammar_->tokenizer();
  CursorReset guard(*this);
  try {
    state_ = ParseState::Lexing;
    source_ = std::make_shared<const std::string>(source);
    cursor_ = 0;
    next_token_ = make_token(special::kStart, SourceSpan{});
    advance();

    state_ = ParseState::Building;
    TokenPtr root = expression();

    state_ = ParseState::TrailingCheck;
    next_token_->expected({special::kEnd});
    if (options_.static_evaluation) run_static_evaluation(*root);
    state_ = ParseState::Done;
    return root;
  } catch (const std::exception&) {
    state_ = ParseState::Failed;
    throw;
  }
}

void Parser::run_static_evaluation(const Token& root) const {
  for (const Token* token : root.iter()) {
    if (token->token_class().side_effects) return;
  }
  try {
    root.evaluate(nullptr);
  } catch (const MissingContextError&) {
    // Expected: most expressions need a document or variables.
  }
}

TokenPtr Parser::advance(std::initializer_list<std::string> symbols, const std::string& message) {
  return advance(std::vector<std::string>(symbols), message);
}

TokenPtr Parser::advance(const std::vector<std::string>& symbols, const std::string& message) {
  if (next_token_->symbol() == special::kEnd) {
    throw next_token_->wrong_syntax();
  }
  if (!symbols.empty() && !contains_symbol(symbols, next_token_->symbol())) {
    throw next_token_->wrong_syntax(message);
  }
  TokenPtr current = std::move(next_token_);
  token_symbol_ = current->symbol();
  token_span_ = current->span();
  lex_next();
  skip_comments();
  token_symbol_ = current->symbol();
  token_span_ = current->span();
  return current;
}

void Parser::skip_comments() {
  const GrammarOptions& options = grammar_->options();
  if (options.comment_open.empty()) return;
  while (next_token_->symbol() == options.comment_open) {
    size_t level = 1;
    while (level > 0) {
      advance_until({options.comment_open, options.comment_close});
      if (next_token_->symbol() == options.comment_close) {
        --level;
      } else if (next_token_->symbol() == options.comment_open) {
        ++level;
      } else {
        throw next_token_->wrong_syntax("unterminated comment");
      }
    }
    lex_next();
  }
}

void Parser::lex_next() {
  Lexeme lexeme;
  if (!tokenizer_->next(*source_, cursor_, lexeme)) {
    const size_t size = source_->size();
    next_token_ = make_token(special::kEnd, SourceSpan{size, size});
    return;
  }
  const SourceSpan span{lexeme.start, lexeme.end};
  switch (lexeme.kind) {
    case Lexeme::Kind::Symbol:
      if (grammar_->contains(lexeme.text)) {
        next_token_ = make_token(lexeme.text, Item(lexeme.text), span);
      } else if (grammar_->is_name_like(lexeme.text)) {
        next_token_ = make_token(special::kName, Item(lexeme.text), span);
      } else {
        next_token_ = make_token(special::kUnknown, Item(lexeme.text), span);
        throw next_token_->wrong_syntax();
      }
      return;
    case Lexeme::Kind::Literal:
      next_token_ = make_literal(lexeme.text, span);
      return;
    case Lexeme::Kind::Name:
      next_token_ = make_token(special::kName, Item(lexeme.text), span);
      return;
    case Lexeme::Kind::Unknown:
      next_token_ = make_token(special::kUnknown, Item(lexeme.text), span);
      return;
  }
}

TokenPtr Parser::make_literal(const std::string& text, SourceSpan span) {
  if (text[0] == '\'' || text[0] == '"') {
    return make_token(special::kString, Item(unescape(text)), span);
  }
  char* end = nullptr;
  errno = 0;
  if (has_exponent(text)) {
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      next_token_ = make_token(special::kInvalid, Item(text), span);
      throw next_token_->wrong_syntax();
    }
    return make_token(special::kFloat, Item(value), span);
  }
  if (text.find('.') != std::string::npos) {
    const long double value = std::strtold(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
      next_token_ = make_token(special::kInvalid, Item(text), span);
      throw next_token_->wrong_syntax();
    }
    return make_token(special::kDecimal, Item(Decimal{value}), span);
  }
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (end != text.c_str() + text.size() || errno == ERANGE) {
    next_token_ = make_token(special::kInvalid, Item(text), span);
    throw next_token_->wrong_syntax();
  }
  return make_token(special::kInteger, Item(static_cast<int64_t>(value)), span);
}

TokenPtr Parser::expression(int rbp) {
  TokenPtr left = Token::nud(advance());
  while (rbp < next_token_->lbp()) {
    TokenPtr current = advance();
    left = Token::led(std::move(current), std::move(left));
  }
  return left;
}

std::string Parser::advance_until(std::initializer_list<std::string> stop_symbols) {
  if (stop_symbols.size() == 0) {
    throw std::invalid_argument("advance_until requires at least one stop symbol");
  }
  if (next_token_->symbol() == special::kEnd) {
    throw next_token_->wrong_syntax();
  }
  const std::vector<std::string> stops(stop_symbols);
  token_symbol_ = next_token_->symbol();
  token_span_ = next_token_->span();

  std::string chunk;
  const std::string& text = *source_;
  while (true) {
    const size_t before = cursor_;
    Lexeme lexeme;
    if (!tokenizer_->next(text, cursor_, lexeme)) {
      chunk.append(text, before, std::string::npos);
      next_token_ = make_token(special::kEnd, SourceSpan{text.size(), text.size()});
      break;
    }
    if (lexeme.kind != Lexeme::Kind::Symbol || !contains_symbol(stops, lexeme.text)) {
      chunk.append(text, before, cursor_ - before);
      continue;
    }
    chunk.append(text, before, lexeme.start - before);
    const SourceSpan span{lexeme.start, lexeme.end};
    if (!grammar_->contains(lexeme.text)) {
      next_token_ = make_token(special::kUnknown, Item(lexeme.text), span);
      throw next_token_->wrong_syntax();
    }
    next_token_ = make_token(lexeme.text, span);
    break;
  }
  return chunk;
}

void Parser::expected_next(std::initializer_list<std::string> symbols, const std::string& message) {
  const std::vector<std::string> accepted(symbols);
  const std::string& symbol = next_token_->symbol();
  if (contains_symbol(accepted, symbol)) return;
  if (contains_symbol(accepted, special::kName) && !is_special_symbol(symbol) &&
      grammar_->is_name_like(symbol)) {
    next_token_ = next_token_->as_name();
    return;
  }
  throw next_token_->wrong_syntax(message);
}

void Parser::replace_next_token(TokenPtr token) {
  if (!token) throw std::invalid_argument("replace_next_token requires a token");
  next_token_ = std::move(token);
}

std::pair<size_t, size_t> Parser::position() const {
  const std::string& text = *source_;
  const size_t index = std::min(token_span_.start, text.size());
  const size_t line = 1 + static_cast<size_t>(std::count(text.begin(), text.begin() + index, '\n'));
  if (line == 1) return {1, index + 1};
  return {line, index - text.rfind('\n', index - 1)};
}

bool Parser::is_source_start() const {
  const std::string before = source_->substr(0, std::min(token_span_.start, source_->size()));
  return util::trim_ws(before).empty();
}

bool Parser::is_line_start() const {
  const std::string& text = *source_;
  const size_t index = std::min(token_span_.start, text.size());
  const size_t newline = index == 0 ? std::string::npos : text.rfind('\n', index - 1);
  const size_t line_start = newline == std::string::npos ? 0 : newline + 1;
  return util::trim_ws(text.substr(line_start, index - line_start)).empty();
}

bool Parser::is_spaced(bool before, bool after) const {
  const std::string& text = *source_;
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\n'; };
  const size_t start = token_span_.start;
  const size_t end = token_span_.end;
  if (before && start > 0 && start - 1 < text.size() && blank(text[start - 1])) return true;
  return after && end < text.size() && blank(text[end]);
}

TokenPtr Parser::make_token(const std::string& lookup_name, Item value, SourceSpan span) {
  const TokenClass& token_class = grammar_->at(lookup_name);
  return std::make_unique<Token>(token_class, this, std::move(value), span, source_);
}

TokenPtr Parser::make_token(const std::string& lookup_name, SourceSpan span) {
  const TokenClass& token_class = grammar_->at(lookup_name);
  return std::make_unique<Token>(token_class, this, Item(token_class.symbol), span, source_);
}

std::string Parser::unescape(const std::string& literal) {
  if (literal.size() < 2) return literal;
  const char quote = literal.front();
  const std::string body = literal.substr(1, literal.size() - 2);
  const std::string doubled(2, quote);
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    if (body.compare(i, 2, doubled) == 0) {
      out.push_back(quote);
      ++i;
    } else {
      out.push_back(body[i]);
    }
  }
  return out;
}

}  // namespace xpratt
