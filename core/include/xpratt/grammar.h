#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "xpratt/token.h"
#include "xpratt/tokenizer.h"

namespace xpratt {

/// Keyword-style arguments of Grammar::register_symbol.
/// Unset fields leave the token class untouched; set callables overwrite.
struct RegisterOptions {
  std::optional<int> lbp;
  std::optional<int> rbp;
  std::optional<Label> label;
  std::optional<std::string> lookup_name;
  std::optional<std::string> pattern;
  std::optional<std::string> class_name;
  std::optional<bool> side_effects;
  NudFn nud;
  LedFn led;
  EvaluateFn evaluate;
  SelectFn select;
  std::map<std::string, MethodFn> methods;
};

struct GrammarOptions {
  std::string literals_pattern =
      R"('(?:[^']|'')*'|"(?:[^"]|"")*"|(?:\d+|\.\d+)(?:\.\d*)?(?:[Ee][+-]?\d+)?)";
  std::string name_pattern = R"([A-Za-z_][A-Za-z0-9_]*)";
  /// Nestable comment delimiters skipped by the parser; empty disables comments.
  std::string comment_open;
  std::string comment_close;
  /// Quote characters whose strings are scanned without the regex.
  std::string string_quotes = "'\"";
};

/// Attaches behavior to a symbol registered by Grammar::method.
class MethodBinder {
 public:
  explicit MethodBinder(TokenClass& token_class) : class_(token_class) {}

  MethodBinder& nud(NudFn fn);
  MethodBinder& led(LedFn fn);
  MethodBinder& evaluate(EvaluateFn fn);
  MethodBinder& select(SelectFn fn);
  /// Replaces an existing named method; throws RegistrationError(NotAMethod) otherwise.
  MethodBinder& bind(const std::string& method_name, MethodFn fn);
  TokenClass& token_class() { return class_; }

 private:
  TokenClass& class_;
};

/// Symbol table plus tokenizer of one language level.
/// MUST be fully registered before concurrent parsing starts; registrations made
/// later are picked up by the next tokenizer() call.
class Grammar {
 public:
  explicit Grammar(std::string name, GrammarOptions options = {});
  /// Derives a new level from a base grammar (deep copy of its symbol table).
  Grammar(std::string name, const Grammar& base);

  Grammar(const Grammar&) = delete;
  Grammar& operator=(const Grammar&) = delete;

  const std::string& name() const { return name_; }
  const GrammarOptions& options() const { return options_; }

  /// Registers or updates a symbol and returns its token class.
  /// MUST only raise binding powers and MUST keep the label chosen at creation.
  /// Throws RegistrationError for empty symbols or symbols with whitespace.
  TokenClass& register_symbol(const std::string& symbol, const RegisterOptions& options = {});
  /// Updates an already registered class; throws if it belongs to another table.
  TokenClass& register_symbol(const TokenClass& token_class, const RegisterOptions& options = {});
  void unregister(const std::string& symbol);

  TokenClass& literal(const std::string& symbol, int bp = 0);
  TokenClass& nullary(const std::string& symbol, int bp = 0);
  TokenClass& prefix(const std::string& symbol, int bp = 0);
  TokenClass& postfix(const std::string& symbol, int bp = 0);
  TokenClass& infix(const std::string& symbol, int bp = 0);
  TokenClass& infixr(const std::string& symbol, int bp = 0);
  MethodBinder method(const std::string& symbol, int bp = 0);
  /// Copies the slots of an existing symbol under a new symbol, then applies options.
  TokenClass& duplicate(const std::string& symbol,
                        const std::string& new_symbol,
                        const RegisterOptions& options = {});

  const TokenClass* find(const std::string& lookup_name) const;
  const TokenClass& at(const std::string& lookup_name) const;
  bool contains(const std::string& lookup_name) const;
  size_t size() const { return table_.size(); }
  std::vector<std::string> symbols() const;

  /// Registers both delimiters as symbols and enables comment skipping.
  void set_comment_delimiters(const std::string& open, const std::string& close);

  /// Registers the special symbols and compiles the tokenizer.
  void build();
  /// Returns the tokenizer, rebuilding it when the symbol set changed.
  std::shared_ptr<const Tokenizer> tokenizer();
  uint64_t revision() const { return revision_; }

  /// True when the name pattern matches a prefix of the text.
  bool is_name_like(const std::string& text) const;

 private:
  TokenClass& update(TokenClass& token_class, const RegisterOptions& options);
  void touch() { ++revision_; }

  std::string name_;
  GrammarOptions options_;
  std::regex name_regex_;
  std::map<std::string, std::unique_ptr<TokenClass>> table_;
  uint64_t revision_ = 0;
  std::mutex tokenizer_mutex_;
  std::shared_ptr<const Tokenizer> tokenizer_;
  uint64_t tokenizer_revision_ = 0;
};

/// Converts a symbol into a deterministic class-name fragment ("+" -> "PlusSign").
std::string symbol_to_class_name(const std::string& symbol);

/// Explicit owner of the grammars of an application.
/// MUST reject a second definition under the same name.
class GrammarRegistry {
 public:
  std::shared_ptr<Grammar> define(const std::string& name, GrammarOptions options = {});
  std::shared_ptr<Grammar> define(const std::string& name, const std::string& base_name);
  std::shared_ptr<Grammar> get(const std::string& name) const;
  std::shared_ptr<Grammar> find(const std::string& name) const;
  std::vector<std::string> names() const;

 private:
  std::map<std::string, std::shared_ptr<Grammar>> grammars_;
};

}  // namespace xpratt
