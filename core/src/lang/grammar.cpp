#include "xpratt/grammar.h"

#include <algorithm>
#include <utility>

#include "../util/string_util.h"
#include "xpratt/errors.h"
#include "xpratt/parser.h"

namespace xpratt {

namespace {

std::regex compile_name_pattern(const std::string& pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& err) {
    throw RegistrationError(RegistrationErrorKind::BadPattern,
                            "invalid name pattern '" + pattern + "': " + err.what());
  }
}

std::string label_class_suffix(const Label& label) {
  std::string out;
  for (char c : util::title_case(label.to_string())) {
    if (c != ' ' && c != '_') out.push_back(c);
  }
  return out;
}

}  // namespace

MethodBinder& MethodBinder::nud(NudFn fn) {
  class_.nud = std::move(fn);
  return *this;
}

MethodBinder& MethodBinder::led(LedFn fn) {
  class_.led = std::move(fn);
  return *this;
}

MethodBinder& MethodBinder::evaluate(EvaluateFn fn) {
  class_.evaluate = std::move(fn);
  return *this;
}

MethodBinder& MethodBinder::select(SelectFn fn) {
  class_.select = std::move(fn);
  return *this;
}

MethodBinder& MethodBinder::bind(const std::string& method_name, MethodFn fn) {
  auto it = class_.methods.find(method_name);
  if (it == class_.methods.end()) {
    throw RegistrationError(RegistrationErrorKind::NotAMethod,
                            "'" + method_name + "' is not a method of " + class_.class_name);
  }
  it->second = std::move(fn);
  return *this;
}

Grammar::Grammar(std::string name, GrammarOptions options)
    : name_(std::move(name)),
      options_(std::move(options)),
      name_regex_(compile_name_pattern(options_.name_pattern)) {}

Grammar::Grammar(std::string name, const Grammar& base)
    : name_(std::move(name)), options_(base.options_), name_regex_(base.name_regex_) {
  for (const auto& entry : base.table_) {
    table_.emplace(entry.first, std::make_unique<TokenClass>(*entry.second));
  }
  revision_ = 1;
}

TokenClass& Grammar::register_symbol(const std::string& symbol, const RegisterOptions& options) {
  if (symbol.empty()) {
    throw RegistrationError(RegistrationErrorKind::WrongArgument, "a symbol can't be empty");
  }
  if (util::has_whitespace(symbol)) {
    throw RegistrationError(RegistrationErrorKind::WhitespaceInSymbol,
                            "'" + symbol + "': a symbol can't contain whitespaces");
  }
  const std::string lookup_name = options.lookup_name.value_or(symbol);
  auto it = table_.find(lookup_name);
  if (it == table_.end()) {
    auto token_class = std::make_unique<TokenClass>();
    token_class->symbol = symbol;
    token_class->lookup_name = lookup_name;
    token_class->label = options.label.value_or(Label(Role::Symbol));
    token_class->pattern = options.pattern;
    token_class->class_name = options.class_name.value_or(
        symbol_to_class_name(symbol) + label_class_suffix(token_class->label));
    it = table_.emplace(lookup_name, std::move(token_class)).first;
    touch();
  }
  return update(*it->second, options);
}

TokenClass& Grammar::register_symbol(const TokenClass& token_class, const RegisterOptions& options) {
  auto it = table_.find(token_class.lookup_name);
  if (it == table_.end() || it->second.get() != &token_class) {
    throw RegistrationError(RegistrationErrorKind::UnregisteredClass,
                            "token class " + token_class.class_name + " is not registered in '" +
                                name_ + "'");
  }
  return update(*it->second, options);
}

TokenClass& Grammar::update(TokenClass& token_class, const RegisterOptions& options) {
  if (options.lbp.has_value() && *options.lbp > token_class.lbp) token_class.lbp = *options.lbp;
  if (options.rbp.has_value() && *options.rbp > token_class.rbp) token_class.rbp = *options.rbp;
  if (options.pattern.has_value() && token_class.pattern != options.pattern) {
    token_class.pattern = options.pattern;
    touch();
  }
  if (options.side_effects.has_value()) token_class.side_effects = *options.side_effects;
  if (options.nud) token_class.nud = options.nud;
  if (options.led) token_class.led = options.led;
  if (options.evaluate) token_class.evaluate = options.evaluate;
  if (options.select) token_class.select = options.select;
  for (const auto& method : options.methods) {
    token_class.methods[method.first] = method.second;
  }
  return token_class;
}

void Grammar::unregister(const std::string& symbol) {
  if (table_.erase(util::trim_ws(symbol)) != 0) touch();
}

TokenClass& Grammar::literal(const std::string& symbol, int bp) {
  RegisterOptions options;
  options.label = Label(Role::Literal);
  options.lbp = bp;
  options.nud = [](TokenPtr self) { return self; };
  options.evaluate = [](const Token& self, Context*) { return Value::of(self.value()); };
  return register_symbol(symbol, options);
}

TokenClass& Grammar::nullary(const std::string& symbol, int bp) {
  RegisterOptions options;
  options.label = Label(Role::Operator);
  options.lbp = bp;
  options.nud = [](TokenPtr self) { return self; };
  return register_symbol(symbol, options);
}

TokenClass& Grammar::prefix(const std::string& symbol, int bp) {
  RegisterOptions options;
  options.label = Label(Role::PrefixOperator);
  options.lbp = bp;
  options.rbp = bp;
  options.nud = [bp](TokenPtr self) {
    std::vector<TokenPtr> children;
    children.push_back(self->parser().expression(bp));
    self->set_children(std::move(children));
    return self;
  };
  return register_symbol(symbol, options);
}

TokenClass& Grammar::postfix(const std::string& symbol, int bp) {
  RegisterOptions options;
  options.label = Label(Role::PostfixOperator);
  options.lbp = bp;
  options.rbp = bp;
  options.led = [](TokenPtr self, TokenPtr left) {
    std::vector<TokenPtr> children;
    children.push_back(std::move(left));
    self->set_children(std::move(children));
    return self;
  };
  return register_symbol(symbol, options);
}

TokenClass& Grammar::infix(const std::string& symbol, int bp) {
  RegisterOptions options;
  options.label = Label(Role::Operator);
  options.lbp = bp;
  options.rbp = bp;
  options.led = [bp](TokenPtr self, TokenPtr left) {
    std::vector<TokenPtr> children;
    children.push_back(std::move(left));
    children.push_back(self->parser().expression(bp));
    self->set_children(std::move(children));
    return self;
  };
  return register_symbol(symbol, options);
}

TokenClass& Grammar::infixr(const std::string& symbol, int bp) {
  RegisterOptions options;
  options.label = Label(Role::Operator);
  options.lbp = bp;
  options.rbp = bp - 1;
  options.led = [bp](TokenPtr self, TokenPtr left) {
    std::vector<TokenPtr> children;
    children.push_back(std::move(left));
    children.push_back(self->parser().expression(bp - 1));
    self->set_children(std::move(children));
    return self;
  };
  return register_symbol(symbol, options);
}

MethodBinder Grammar::method(const std::string& symbol, int bp) {
  RegisterOptions options;
  options.label = Label(Role::Operator);
  options.lbp = bp;
  options.rbp = bp;
  return MethodBinder(register_symbol(symbol, options));
}

TokenClass& Grammar::duplicate(const std::string& symbol,
                               const std::string& new_symbol,
                               const RegisterOptions& options) {
  const TokenClass& source = at(symbol);
  TokenClass& target = register_symbol(new_symbol, RegisterOptions{});
  target.lbp = source.lbp;
  target.rbp = source.rbp;
  target.label = source.label;
  target.nud = source.nud;
  target.led = source.led;
  target.evaluate = source.evaluate;
  target.select = source.select;
  target.methods = source.methods;
  target.side_effects = source.side_effects;
  return update(target, options);
}

const TokenClass* Grammar::find(const std::string& lookup_name) const {
  auto it = table_.find(lookup_name);
  return it == table_.end() ? nullptr : it->second.get();
}

const TokenClass& Grammar::at(const std::string& lookup_name) const {
  const TokenClass* token_class = find(lookup_name);
  if (token_class == nullptr) {
    throw RegistrationError(RegistrationErrorKind::WrongArgument,
                            "symbol '" + lookup_name + "' is not registered in '" + name_ + "'");
  }
  return *token_class;
}

bool Grammar::contains(const std::string& lookup_name) const {
  return table_.count(lookup_name) != 0;
}

std::vector<std::string> Grammar::symbols() const {
  std::vector<std::string> out;
  out.reserve(table_.size());
  for (const auto& entry : table_) out.push_back(entry.first);
  return out;
}

void Grammar::set_comment_delimiters(const std::string& open, const std::string& close) {
  register_symbol(open);
  register_symbol(close);
  options_.comment_open = open;
  options_.comment_close = close;
}

void Grammar::build() {
  for (const char* symbol : {special::kStart, special::kEnd, special::kInvalid, special::kUnknown}) {
    if (!contains(symbol)) register_symbol(symbol);
  }
  tokenizer();
}

std::shared_ptr<const Tokenizer> Grammar::tokenizer() {
  std::lock_guard<std::mutex> lock(tokenizer_mutex_);
  if (!tokenizer_ || tokenizer_revision_ != revision_) {
    tokenizer_ = std::make_shared<const Tokenizer>(
        Tokenizer::build(table_, options_.literals_pattern, options_.name_pattern,
                         options_.string_quotes));
    tokenizer_revision_ = revision_;
  }
  return tokenizer_;
}

bool Grammar::is_name_like(const std::string& text) const {
  std::smatch m;
  return std::regex_search(text, m, name_regex_, std::regex_constants::match_continuous);
}

std::shared_ptr<Grammar> GrammarRegistry::define(const std::string& name, GrammarOptions options) {
  if (grammars_.count(name) != 0) {
    throw RegistrationError(RegistrationErrorKind::DuplicateGrammar,
                            "grammar '" + name + "' is already defined");
  }
  auto grammar = std::make_shared<Grammar>(name, std::move(options));
  grammars_.emplace(name, grammar);
  return grammar;
}

std::shared_ptr<Grammar> GrammarRegistry::define(const std::string& name,
                                                 const std::string& base_name) {
  if (grammars_.count(name) != 0) {
    throw RegistrationError(RegistrationErrorKind::DuplicateGrammar,
                            "grammar '" + name + "' is already defined");
  }
  std::shared_ptr<Grammar> base = get(base_name);
  auto grammar = std::make_shared<Grammar>(name, *base);
  grammars_.emplace(name, grammar);
  return grammar;
}

std::shared_ptr<Grammar> GrammarRegistry::get(const std::string& name) const {
  auto grammar = find(name);
  if (!grammar) {
    throw RegistrationError(RegistrationErrorKind::WrongArgument,
                            "grammar '" + name + "' is not defined");
  }
  return grammar;
}

std::shared_ptr<Grammar> GrammarRegistry::find(const std::string& name) const {
  auto it = grammars_.find(name);
  return it == grammars_.end() ? nullptr : it->second;
}

std::vector<std::string> GrammarRegistry::names() const {
  std::vector<std::string> out;
  for (const auto& entry : grammars_) out.push_back(entry.first);
  return out;
}

}  // namespace xpratt
