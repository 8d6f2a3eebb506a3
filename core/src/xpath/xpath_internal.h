#pragma once

#include <libxml/tree.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "xpratt/context.h"
#include "xpratt/grammar.h"
#include "xpratt/parser.h"
#include "xpratt/token.h"
#include "xpratt/value.h"

namespace xpratt::xpath {

constexpr const char* kXPath1 = "xpath1";
constexpr const char* kXPath2 = "xpath2";
constexpr const char* kXPath3 = "xpath3";
constexpr const char* kXPath31 = "xpath31";

/// Binding powers shared by every level.
namespace bp {
constexpr int kComma = 5;
constexpr int kOr = 20;
constexpr int kAnd = 25;
constexpr int kComparison = 30;
constexpr int kConcat = 32;
constexpr int kRange = 35;
constexpr int kAdditive = 40;
constexpr int kMultiplicative = 45;
constexpr int kUnion = 50;
constexpr int kIntersect = 55;
constexpr int kInstance = 60;
constexpr int kCastAs = 65;
constexpr int kUnary = 70;
constexpr int kMap = 72;
constexpr int kPath = 75;
constexpr int kStep = 80;
constexpr int kFunction = 90;
}  // namespace bp

enum class Axis {
  Child,
  Descendant,
  DescendantOrSelf,
  Parent,
  Ancestor,
  AncestorOrSelf,
  FollowingSibling,
  PrecedingSibling,
  Following,
  Preceding,
  Self,
  Attribute,
};

enum class CompareOp { Eq, Ne, Lt, Le, Gt, Ge };
enum class ArithOp { Add, Sub, Mul, Div, IDiv, Mod };

/// Name of the named method every node test token provides.
constexpr const char* kNodeTest = "node_test";
/// Name of the named method of constructor functions.
constexpr const char* kCast = "cast";

// Context access. A null context raises MissingContextError so static evaluation skips.
Context& require_context(const Token& self, Context* context);
const Item& require_item(const Token& self, Context* context);
xmlNode* require_node(const Token& self, Context* context);
bool is_xpath1(const Token& self);

// Sequences and atomization.
Sequence evaluate_sequence(const Token& token, Context* context);
xmlNode* as_node(const Item& item);
std::string node_name(const xmlNode* node);
std::string node_local_name(const xmlNode* node);
std::string node_string_value(const xmlNode* node);
bool is_document(const xmlNode* node);
bool is_tree_node(const xmlNode* node);
bool is_attribute(const xmlNode* node);
xmlNode* document_root(xmlNode* node);
Item atomize(const Item& item);
/// Operand that MUST be empty or a single item (node or atomic); throws XPTY0004 otherwise.
std::optional<Item> optional_operand(const Token& self, const Token& operand, Context* context);
std::string string_value(const Item& item);
double number_value(const Item& item);
long double to_long_double(const Item& item);
bool effective_boolean_value(const Token& self, const Sequence& items);
ItemStream stream_of(const Value& value);
std::string string_argument(const Token& self, size_t index, Context* context);

// Comparison and arithmetic.
bool general_compare(const Token& self, const Sequence& lhs, const Sequence& rhs, CompareOp op);
bool compare_atomics(const Token& self, const Item& lhs, const Item& rhs, CompareOp op);
Item arithmetic(const Token& self, ArithOp op, const Item& lhs, const Item& rhs);
Item negate(const Token& self, const Item& operand);
/// Binary arithmetic on the two children of an operator token.
/// Empty operands give NaN in XPath 1.0 and the empty sequence afterwards.
Value arithmetic_operator(const Token& self, Context* context, ArithOp op);
/// Parses a lexical number the way number() and xs:double casts do; NaN when invalid.
double parse_number(const std::string& text);

// Node sequences.
/// Nodes of an axis in axis order: reverse axes run nearest node first.
std::vector<xmlNode*> axis_nodes(Axis axis, xmlNode* node);
/// Removes duplicate nodes and sorts the rest in document order.
Sequence document_order(const Token& self, const Sequence& nodes);
/// Lazily applies a step expression to every node of a focus sequence.
/// Node results come out distinct and in document order; the step runs for the
/// next focus node only when more results are pulled, unless sorting is needed.
ItemStream map_step(const Token& self, Sequence focus, const Token& step, const Context& context);
bool apply_node_test(const Token& test, Context& focused);
/// Lazily yields the nodes of an axis of the context node that pass the node test.
ItemStream axis_stream(const Token& self, const Token& test, Axis axis, Context* context);

// Grammar helpers.
using FunctionBody = std::function<Value(const Token& self, Context* context)>;

struct FunctionSpec {
  std::string name;
  size_t min_args = 0;
  size_t max_args = 0;
  Label label = Label(Role::Function);
  FunctionBody body;
  bool side_effects = false;
};

/// Registers a function symbol recognized only when followed by '('.
TokenClass& register_function(Grammar& grammar, const FunctionSpec& spec);
/// Registers a name-like keyword whose nud falls back to a '(name)' token.
TokenClass& register_keyword_infix(Grammar& grammar, const std::string& symbol, int bp);
std::string function_pattern(const std::string& name);

void register_xpath1_operators(Grammar& grammar);
void register_xpath1_paths(Grammar& grammar);
void register_xpath1_functions(Grammar& grammar);
void register_xpath2_symbols(Grammar& grammar);
void register_xpath3_symbols(Grammar& grammar);
void register_xpath31_symbols(Grammar& grammar);

/// for, some and every: "$name in expr" clauses followed by return/satisfies.
void register_quantified_expressions(Grammar& grammar);
/// let: "$name := expr" clauses followed by return.
void register_let_expression(Grammar& grammar);

}  // namespace xpratt::xpath
