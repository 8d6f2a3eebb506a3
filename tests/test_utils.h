#pragma once

#include <memory>
#include <string>

#include "xpratt/grammar.h"
#include "xpratt/value.h"
#include "xpratt/xpath.h"

/// Integer calculator: literals, (name), + - at 10, * / at 20, ^ (right) at 30,
/// prefix ~ at 40 and parentheses.
std::shared_ptr<xpratt::Grammar> make_calculator_grammar();

extern const char* const kCatalogXml;

/// Strings of a result: string values for nodes, render_item() for atomics.
std::string join_items(const xpratt::Sequence& items, const std::string& separator = ",");

/// Parses expr with the given level and selects against xml (no document when empty).
std::string xpath_result(const std::string& expr,
                         const std::string& xml = "",
                         xpratt::XPathVersion version = xpratt::XPathVersion::V2_0);
/// Code of the xpratt::Error raised by xpath_result, or "" when it succeeds.
std::string xpath_error_code(const std::string& expr,
                             const std::string& xml = "",
                             xpratt::XPathVersion version = xpratt::XPathVersion::V2_0);
/// tree() of the parsed expression.
std::string xpath_tree(const std::string& expr,
                       xpratt::XPathVersion version = xpratt::XPathVersion::V2_0);
