#include "xpratt/token.h"

#include <algorithm>
#include <stdexcept>

#include "xpratt/parser.h"

namespace xpratt {

namespace {

constexpr Role kAllRoles[] = {
    Role::Symbol,   Role::Literal,  Role::Operator, Role::PrefixOperator,
    Role::PostfixOperator, Role::Function, Role::ConstructorFunction,
    Role::Axis,     Role::KindTest, Role::Name,     Role::Variable,
};

const std::string& empty_source() {
  static const std::string kEmpty;
  return kEmpty;
}

bool matches_filter(const Token& token, const std::vector<std::string>& symbols) {
  return symbols.empty() ||
         std::find(symbols.begin(), symbols.end(), token.symbol()) != symbols.end();
}

std::string quote(const std::string& s) {
  const char q = (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) ? '"' : '\'';
  return std::string(1, q) + s + std::string(1, q);
}

std::string repr_item(const Item& item) {
  if (const auto* s = std::get_if<std::string>(&item)) return quote(*s);
  return render_item(item);
}

bool is_space_char(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool only_spaces(const std::string& s, size_t begin, size_t end) {
  for (size_t i = begin; i < end && i < s.size(); ++i) {
    if (!is_space_char(s[i])) return false;
  }
  return true;
}

}  // namespace

const char* role_name(Role role) {
  switch (role) {
    case Role::Symbol:
      return "symbol";
    case Role::Literal:
      return "literal";
    case Role::Operator:
      return "operator";
    case Role::PrefixOperator:
      return "prefix operator";
    case Role::PostfixOperator:
      return "postfix operator";
    case Role::Function:
      return "function";
    case Role::ConstructorFunction:
      return "constructor function";
    case Role::Axis:
      return "axis";
    case Role::KindTest:
      return "kind test";
    case Role::Name:
      return "name";
    case Role::Variable:
      return "variable";
  }
  return "symbol";
}

Label::Label(Role role) : bits_(bit(role)) {}

Label::Label(std::initializer_list<Role> roles) {
  for (Role role : roles) bits_ |= bit(role);
  if (bits_ == 0) bits_ = bit(Role::Symbol);
}

bool Label::is_multi() const {
  return (bits_ & (bits_ - 1)) != 0;
}

std::vector<Role> Label::roles() const {
  std::vector<Role> out;
  for (Role role : kAllRoles) {
    if (has(role)) out.push_back(role);
  }
  return out;
}

Role Label::first() const {
  for (Role role : kAllRoles) {
    if (has(role)) return role;
  }
  return Role::Symbol;
}

std::string Label::to_string() const {
  if (!is_multi()) return role_name(first());
  std::string out;
  for (Role role : roles()) {
    if (!out.empty()) out += "__";
    std::string name = role_name(role);
    std::replace(name.begin(), name.end(), ' ', '_');
    out += name;
  }
  return out;
}

bool is_special_symbol(const std::string& symbol) {
  static const char* const kSpecial[] = {
      special::kStart, special::kEnd,     special::kString,  special::kFloat,  special::kDecimal,
      special::kInteger, special::kName,  special::kInvalid, special::kUnknown,
  };
  for (const char* s : kSpecial) {
    if (symbol == s) return true;
  }
  return false;
}

Token::Token(const TokenClass& token_class,
             Parser* parser,
             Item value,
             SourceSpan span,
             std::shared_ptr<const std::string> source)
    : class_(&token_class),
      parser_(parser),
      value_(std::move(value)),
      span_(span),
      source_(std::move(source)) {}

Parser& Token::parser() const {
  if (parser_ == nullptr) {
    throw std::logic_error("token '" + symbol() + "' is not attached to a parser");
  }
  return *parser_;
}

const std::string& Token::source_text() const {
  return source_ ? *source_ : empty_source();
}

void Token::resolve_role(Role role) {
  if (!label().has(role)) {
    throw wrong_syntax("symbol '" + symbol() + "' cannot be used as " + role_name(role));
  }
  resolved_role_ = role;
}

Role Token::role() const {
  return resolved_role_.has_value() ? *resolved_role_ : label().first();
}

const Token& Token::child(size_t index) const {
  if (index >= children_.size()) {
    throw std::out_of_range("token '" + symbol() + "' has no child " + std::to_string(index));
  }
  return *children_[index];
}

Token& Token::child(size_t index) {
  if (index >= children_.size()) {
    throw std::out_of_range("token '" + symbol() + "' has no child " + std::to_string(index));
  }
  return *children_[index];
}

void Token::append(TokenPtr child) {
  children_.push_back(std::move(child));
}

void Token::insert(size_t index, TokenPtr child) {
  index = std::min(index, children_.size());
  children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
}

void Token::set_children(std::vector<TokenPtr> children) {
  children_ = std::move(children);
}

TokenPtr Token::release_child(size_t index) {
  if (index >= children_.size()) {
    throw std::out_of_range("token '" + symbol() + "' has no child " + std::to_string(index));
  }
  TokenPtr out = std::move(children_[index]);
  children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
  return out;
}

TokenPtr Token::nud(TokenPtr self) {
  const TokenClass& cls = self->token_class();
  if (!cls.nud) throw self->wrong_syntax();
  return cls.nud(std::move(self));
}

TokenPtr Token::led(TokenPtr self, TokenPtr left) {
  const TokenClass& cls = self->token_class();
  if (!cls.led) throw self->wrong_syntax();
  return cls.led(std::move(self), std::move(left));
}

Value Token::evaluate(Context* context) const {
  if (class_->evaluate) return class_->evaluate(*this, context);
  if (class_->select) return Value::list(class_->select(*this, context).collect());
  return Value::of(value_);
}

ItemStream Token::select(Context* context) const {
  if (class_->select) return class_->select(*this, context);
  Value result = evaluate(context);
  if (result.is_scalar()) return ItemStream::single(result.item());
  return ItemStream::from(result.items());
}

bool Token::has_method(const std::string& name) const {
  return class_->methods.count(name) != 0;
}

Value Token::call_method(const std::string& name, Context* context) const {
  auto it = class_->methods.find(name);
  if (it == class_->methods.end() || !it->second) {
    throw error("XPST0017", "'" + symbol() + "' has no method '" + name + "'");
  }
  return it->second(*this, context);
}

std::vector<const Token*> Token::iter(std::initializer_list<std::string> symbols) const {
  return iter(std::vector<std::string>(symbols));
}

std::vector<const Token*> Token::iter(const std::vector<std::string>& symbols) const {
  struct Frame {
    const Token* node;
    size_t next;
    bool pending;
  };
  std::vector<const Token*> out;
  auto emit = [&](const Token* token) {
    if (matches_filter(*token, symbols)) out.push_back(token);
  };

  std::vector<Frame> stack;
  Frame current{this, 0, true};
  while (true) {
    if (current.next < current.node->arity()) {
      const Token* tk = current.node->children_[current.next++].get();
      if (current.pending && current.node->arity() == 1) {
        emit(current.node);
        current.pending = false;
      }
      if (tk->is_leaf()) {
        emit(tk);
        if (current.pending) {
          emit(current.node);
          current.pending = false;
        }
        continue;
      }
      stack.push_back(current);
      current = Frame{tk, 0, true};
      continue;
    }
    if (stack.empty()) {
      if (current.pending) emit(current.node);
      return out;
    }
    current = stack.back();
    stack.pop_back();
    if (current.pending) {
      emit(current.node);
      current.pending = false;
    }
  }
}

std::string Token::tree() const {
  const std::string& sym = symbol();
  if (sym == special::kName) return "(" + render_item(value_) + ")";
  if (is_special_symbol(sym)) return "(" + repr_item(value_) + ")";
  if (sym == "(" && arity() == 1) return child(0).tree();

  std::string out = "(";
  if (sym != "(") {
    out += sym;
    if (!is_leaf()) out += " ";
  }
  for (size_t i = 0; i < arity(); ++i) {
    if (i != 0) out += " ";
    out += child(i).tree();
  }
  out += ")";
  return out;
}

std::string Token::source() const {
  const std::string& sym = symbol();
  if (sym == special::kName || sym == special::kDecimal) return render_item(value_);
  if (is_special_symbol(sym)) return repr_item(value_);
  switch (arity()) {
    case 0:
      return sym;
    case 1:
      if (label().has(Role::PostfixOperator)) return child(0).source() + " " + sym;
      return sym + " " + child(0).source();
    case 2:
      return child(0).source() + " " + sym + " " + child(1).source();
    default: {
      std::string out = sym;
      for (const auto& item : children_) out += " " + item->source();
      return out;
    }
  }
}

std::string Token::to_string() const {
  const std::string& sym = symbol();
  if (is_special_symbol(sym)) return value_text() + " " + sym.substr(1, sym.size() - 2);
  return "'" + sym + "' " + label().to_string();
}

std::string Token::value_text() const {
  return repr_item(value_);
}

std::pair<size_t, size_t> Token::position() const {
  const std::string& text = source_text();
  const size_t index = std::min(span_.start, text.size());
  size_t line = 1;
  size_t last_newline = std::string::npos;
  for (size_t i = 0; i < index; ++i) {
    if (text[i] == '\n') {
      ++line;
      last_newline = i;
    }
  }
  if (line == 1) return {1, index + 1};
  return {line, index - last_newline};
}

bool Token::is_source_start() const {
  return only_spaces(source_text(), 0, span_.start);
}

bool Token::is_line_start() const {
  const std::string& text = source_text();
  const size_t index = std::min(span_.start, text.size());
  const size_t newline = index == 0 ? std::string::npos : text.rfind('\n', index - 1);
  const size_t line_start = newline == std::string::npos ? 0 : newline + 1;
  return only_spaces(text, line_start, index);
}

bool Token::is_spaced(bool before, bool after) const {
  const std::string& text = source_text();
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\n'; };
  if (before && span_.start > 0 && span_.start - 1 < text.size() && blank(text[span_.start - 1])) {
    return true;
  }
  return after && span_.end < text.size() && blank(text[span_.end]);
}

TokenPtr Token::as_name() const {
  return parser().make_token(special::kName, Item(symbol()), span_);
}

ParseError Token::wrong_syntax(const std::string& message) const {
  const std::string& sym = symbol();
  SyntaxErrorKind kind = SyntaxErrorKind::Custom;
  std::string text = message;
  if (!message.empty()) {
    kind = SyntaxErrorKind::Custom;
  } else if (!is_special_symbol(sym)) {
    kind = SyntaxErrorKind::UnexpectedSymbol;
    text = "unexpected " + to_string();
  } else if (sym == special::kInvalid) {
    kind = SyntaxErrorKind::InvalidLiteral;
    text = "invalid literal " + value_text();
  } else if (sym == special::kUnknown) {
    kind = SyntaxErrorKind::UnknownSymbol;
    text = "unknown symbol " + value_text();
  } else if (sym == special::kName) {
    kind = SyntaxErrorKind::UnexpectedName;
    text = "unexpected name " + value_text();
  } else if (sym != special::kEnd) {
    kind = SyntaxErrorKind::UnexpectedLiteral;
    text = "unexpected literal " + value_text();
  } else if (has_parser() && parser_->token_symbol() == special::kStart) {
    kind = SyntaxErrorKind::EmptySource;
    text = "source is empty";
  } else {
    kind = SyntaxErrorKind::UnexpectedEnd;
    text = "unexpected end of source";
  }
  const auto pos = position();
  const std::string token_value = sym == special::kEnd ? std::string() : render_item(value_);
  return ParseError(kind, "XPST0003", text, sym, token_value, span_.start, pos.first, pos.second);
}

void Token::expected(std::initializer_list<std::string> symbols, const std::string& message) const {
  if (symbols.size() == 0) return;
  if (std::find(symbols.begin(), symbols.end(), symbol()) == symbols.end()) {
    throw wrong_syntax(message);
  }
}

void Token::unexpected(std::initializer_list<std::string> symbols, const std::string& message) const {
  if (symbols.size() == 0 ||
      std::find(symbols.begin(), symbols.end(), symbol()) != symbols.end()) {
    throw wrong_syntax(message);
  }
}

EvaluationError Token::error(const std::string& code, const std::string& message) const {
  const auto pos = position();
  return EvaluationError(code, message, span_.start, pos.first, pos.second);
}

EvaluationError Token::wrong_type(const std::string& message) const {
  return error("XPTY0004", message);
}

EvaluationError Token::wrong_value(const std::string& message) const {
  return error("FOCA0002", message);
}

MissingContextError Token::missing_context(const std::string& message) const {
  const auto pos = position();
  return MissingContextError("XPDY0002", message, span_.start, pos.first, pos.second);
}

}  // namespace xpratt
