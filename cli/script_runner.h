#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace xpratt {
class Parser;
class Token;
}

namespace xpratt::cli {

struct ScriptStatement {
  std::string text;
  size_t start_pos = 0;
};

struct ScriptSplitResult {
  std::vector<ScriptStatement> statements;
  std::optional<std::string> error_message;
  size_t error_position = 0;
};

struct ScriptRunOptions {
  bool continue_on_error = false;
  bool quiet = false;
};

/// Receives the parsed root of one statement.
using ScriptExecutor = std::function<void(const Token& root)>;

/// Splits an expression file into one expression per line.
/// MUST skip blank lines and leading (: ... :) comments (which may span lines)
/// and MUST preserve statement start offsets.
ScriptSplitResult split_expression_script(const std::string& script);
/// Parses every statement once with the given parser, then hands its root to the executor.
/// MUST stop on first error unless continue_on_error is enabled.
int run_expression_script(const std::string& script,
                          const ScriptRunOptions& options,
                          Parser& parser,
                          const ScriptExecutor& execute_statement,
                          std::ostream& out,
                          std::ostream& err);

}  // namespace xpratt::cli
