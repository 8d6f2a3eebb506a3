#pragma once

#include <memory>
#include <string>

#include "xpratt/context.h"
#include "xpratt/grammar.h"
#include "xpratt/parser.h"
#include "xpratt/value.h"

namespace xpratt {

enum class XPathVersion { V1_0, V2_0, V3_0, V3_1 };

/// Registry name of a level ("xpath1", "xpath2", "xpath3", "xpath31").
const char* xpath_grammar_name(XPathVersion version);
/// Accepts "1", "1.0", "2", "2.0", "3", "3.0", "3.1"; returns false for anything else.
bool parse_xpath_version(const std::string& text, XPathVersion& out);

/// Defines xpath1, then xpath2 derived from it, xpath3 derived from xpath2 and
/// xpath31 derived from xpath3.
/// Throws RegistrationError(DuplicateGrammar) when any of them already exists.
void register_xpath_grammars(GrammarRegistry& registry);
GrammarRegistry make_xpath_registry();
/// Process-wide grammar of one level, built on first use.
std::shared_ptr<Grammar> xpath_grammar(XPathVersion version);

/// Runs select() on a parsed expression and materializes the items.
Sequence select_results(const Token& root, Context& context);

}  // namespace xpratt
