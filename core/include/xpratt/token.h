#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "xpratt/errors.h"
#include "xpratt/value.h"

namespace xpratt {

class Context;
class Parser;
class Token;
struct TokenClass;

using TokenPtr = std::unique_ptr<Token>;

/// Roles a grammar symbol can play.
enum class Role : uint8_t {
  Symbol,
  Literal,
  Operator,
  PrefixOperator,
  PostfixOperator,
  Function,
  ConstructorFunction,
  Axis,
  KindTest,
  Name,
  Variable
};

const char* role_name(Role role);

/// Set of roles attached to a token class.
/// A multi-role label compares equal to each of its roles.
class Label {
 public:
  Label() : Label(Role::Symbol) {}
  Label(Role role);  // NOLINT(google-explicit-constructor)
  Label(std::initializer_list<Role> roles);

  bool has(Role role) const { return (bits_ & bit(role)) != 0; }
  bool is_multi() const;
  std::vector<Role> roles() const;
  Role first() const;
  /// Joins role names with "__" (e.g. "axis__kind_test").
  std::string to_string() const;

  bool operator==(Role role) const { return has(role); }
  bool operator!=(Role role) const { return !has(role); }
  bool operator==(const Label& other) const { return bits_ == other.bits_; }

 private:
  static uint32_t bit(Role role) { return 1u << static_cast<unsigned>(role); }

  uint32_t bits_ = 0;
};

using NudFn = std::function<TokenPtr(TokenPtr self)>;
using LedFn = std::function<TokenPtr(TokenPtr self, TokenPtr left)>;
using EvaluateFn = std::function<Value(const Token& self, Context* context)>;
using SelectFn = std::function<ItemStream(const Token& self, Context* context)>;
using MethodFn = std::function<Value(const Token& self, Context* context)>;

/// Symbol table entry: one per grammar symbol, shared by every token of that symbol.
/// MUST only be mutated through Grammar registration calls.
struct TokenClass {
  std::string symbol;
  std::string lookup_name;
  std::string class_name;
  int lbp = 0;
  int rbp = 0;
  Label label;
  std::optional<std::string> pattern;
  NudFn nud;
  LedFn led;
  EvaluateFn evaluate;
  SelectFn select;
  std::map<std::string, MethodFn> methods;
  bool side_effects = false;
};

struct SourceSpan {
  size_t start = 0;
  size_t end = 0;
};

/// Special symbols of the framework. Their tokens are created by the lexer, not matched by symbol text.
namespace special {
constexpr const char* kStart = "(start)";
constexpr const char* kEnd = "(end)";
constexpr const char* kString = "(string)";
constexpr const char* kFloat = "(float)";
constexpr const char* kDecimal = "(decimal)";
constexpr const char* kInteger = "(integer)";
constexpr const char* kName = "(name)";
constexpr const char* kInvalid = "(invalid)";
constexpr const char* kUnknown = "(unknown)";
}  // namespace special

bool is_special_symbol(const std::string& symbol);

/// One node of the expression tree built by the Pratt loop.
/// MUST own its children exclusively and MUST NOT outlive the Parser that created it.
/// Behavior (nud/led/evaluate/select) is dispatched through the TokenClass slots.
class Token {
 public:
  Token(const TokenClass& token_class,
        Parser* parser,
        Item value,
        SourceSpan span,
        std::shared_ptr<const std::string> source);

  Token(const Token&) = delete;
  Token& operator=(const Token&) = delete;

  const TokenClass& token_class() const { return *class_; }
  const std::string& symbol() const { return class_->symbol; }
  int lbp() const { return class_->lbp; }
  int rbp() const { return class_->rbp; }
  const Label& label() const { return class_->label; }
  const Item& value() const { return value_; }
  void set_value(Item value) { value_ = std::move(value); }
  const SourceSpan& span() const { return span_; }
  Parser& parser() const;
  bool has_parser() const { return parser_ != nullptr; }
  const std::string& source_text() const;

  /// Picks the definitive role of a multi-role token.
  /// MUST be one of the label's roles; throws ParseError otherwise.
  void resolve_role(Role role);
  /// Returns the resolved role, or the first label role when unresolved.
  Role role() const;
  bool role_resolved() const { return resolved_role_.has_value(); }

  size_t arity() const { return children_.size(); }
  bool is_leaf() const { return children_.empty(); }
  const Token& child(size_t index) const;
  Token& child(size_t index);
  const std::vector<TokenPtr>& children() const { return children_; }
  void append(TokenPtr child);
  void insert(size_t index, TokenPtr child);
  void set_children(std::vector<TokenPtr> children);
  TokenPtr release_child(size_t index);

  /// Pratt null denotation: called when the token starts an expression.
  static TokenPtr nud(TokenPtr self);
  /// Pratt left denotation: called when the token follows a parsed operand.
  static TokenPtr led(TokenPtr self, TokenPtr left);

  /// Materialized evaluation; context may be null during static evaluation.
  Value evaluate(Context* context = nullptr) const;
  /// Lazy selection; each call re-executes the traversal.
  ItemStream select(Context* context = nullptr) const;
  bool has_method(const std::string& name) const;
  Value call_method(const std::string& name, Context* context) const;

  /// Depth-first walk without recursion, optionally filtered by symbol.
  /// Unary nodes come before their operand; other nodes after their first child.
  std::vector<const Token*> iter(std::initializer_list<std::string> symbols = {}) const;
  std::vector<const Token*> iter(const std::vector<std::string>& symbols) const;

  std::string tree() const;
  std::string source() const;
  std::string to_string() const;
  /// 1-based (line, column) of the token start; O(n) in the source length.
  std::pair<size_t, size_t> position() const;
  bool is_source_start() const;
  bool is_line_start() const;
  bool is_spaced(bool before = true, bool after = true) const;
  /// Builds a '(name)' token with the same span for ambiguous symbols.
  TokenPtr as_name() const;

  ParseError wrong_syntax(const std::string& message = "") const;
  void expected(std::initializer_list<std::string> symbols, const std::string& message = "") const;
  void unexpected(std::initializer_list<std::string> symbols = {}, const std::string& message = "") const;

  EvaluationError error(const std::string& code, const std::string& message) const;
  EvaluationError wrong_type(const std::string& message = "invalid type") const;
  EvaluationError wrong_value(const std::string& message = "invalid value") const;
  MissingContextError missing_context(const std::string& message = "dynamic context required for evaluate") const;

 private:
  std::string value_text() const;

  const TokenClass* class_;
  Parser* parser_;
  Item value_;
  SourceSpan span_;
  std::shared_ptr<const std::string> source_;
  std::optional<Role> resolved_role_;
  std::vector<TokenPtr> children_;
};

}  // namespace xpratt
