#include "script_runner.h"

#include <stdexcept>

#include "cli_utils.h"
#include "xpratt/diagnostics.h"
#include "xpratt/parser.h"
#include "xpratt/token.h"

namespace xpratt::cli {

namespace {

bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/// Skips a nested (: ... :) comment starting at pos; returns npos when unterminated.
size_t skip_comment(const std::string& script, size_t pos) {
  int depth = 0;
  while (pos + 1 < script.size()) {
    if (script[pos] == '(' && script[pos + 1] == ':') {
      ++depth;
      pos += 2;
    } else if (script[pos] == ':' && script[pos + 1] == ')') {
      pos += 2;
      if (--depth == 0) return pos;
    } else {
      ++pos;
    }
  }
  return std::string::npos;
}

void report_statement_error(const std::string& script,
                            size_t error_pos,
                            size_t index,
                            size_t total,
                            const std::vector<Diagnostic>& diagnostics,
                            std::ostream& err) {
  auto [line, col] = line_col_from_offset(script, error_pos);
  err << "Error: statement " << index << "/" << total << " at line " << line << ", column "
      << col << "\n";
  err << render_diagnostics_text(diagnostics) << "\n";
}

}  // namespace

ScriptSplitResult split_expression_script(const std::string& script) {
  ScriptSplitResult out;
  size_t pos = 0;
  while (pos < script.size()) {
    if (is_blank(script[pos])) {
      ++pos;
      continue;
    }
    if (script.compare(pos, 2, "(:") == 0) {
      const size_t end = skip_comment(script, pos);
      if (end == std::string::npos) {
        out.error_message = "unterminated comment";
        out.error_position = pos;
        return out;
      }
      pos = end;
      continue;
    }
    size_t line_end = script.find('\n', pos);
    if (line_end == std::string::npos) line_end = script.size();
    size_t text_end = line_end;
    while (text_end > pos && is_blank(script[text_end - 1])) --text_end;
    out.statements.push_back(ScriptStatement{script.substr(pos, text_end - pos), pos});
    pos = line_end;
  }
  return out;
}

int run_expression_script(const std::string& script,
                          const ScriptRunOptions& options,
                          Parser& parser,
                          const ScriptExecutor& execute_statement,
                          std::ostream& out,
                          std::ostream& err) {
  ScriptSplitResult split = split_expression_script(script);
  if (split.error_message.has_value()) {
    auto [line, col] = line_col_from_offset(script, split.error_position);
    err << "Error: " << *split.error_message << " at line " << line << ", column " << col << "\n";
    return 1;
  }
  if (split.statements.empty()) {
    return 0;
  }

  bool had_error = false;
  const size_t total = split.statements.size();
  for (size_t i = 0; i < total; ++i) {
    const ScriptStatement& statement = split.statements[i];
    const size_t statement_index = i + 1;
    if (!options.quiet) {
      out << "== stmt " << statement_index << "/" << total << " ==\n";
    }

    TokenPtr root;
    try {
      root = parser.parse(statement.text);
    } catch (const ParseError& ex) {
      std::vector<Diagnostic> diagnostics;
      diagnostics.push_back(make_syntax_diagnostic(statement.text, ex));
      report_statement_error(script, statement.start_pos + ex.byte_pos(), statement_index, total,
                             diagnostics, err);
      had_error = true;
      if (!options.continue_on_error) return 1;
      continue;
    } catch (const EvaluationError& ex) {
      std::vector<Diagnostic> diagnostics;
      diagnostics.push_back(make_evaluation_diagnostic(statement.text, ex));
      const size_t offset = ex.has_position() ? ex.byte_pos() : 0;
      report_statement_error(script, statement.start_pos + offset, statement_index, total,
                             diagnostics, err);
      had_error = true;
      if (!options.continue_on_error) return 1;
      continue;
    }

    try {
      execute_statement(*root);
    } catch (const EvaluationError& ex) {
      std::vector<Diagnostic> diagnostics;
      diagnostics.push_back(make_evaluation_diagnostic(statement.text, ex));
      const size_t offset = ex.has_position() ? ex.byte_pos() : 0;
      report_statement_error(script, statement.start_pos + offset, statement_index, total,
                             diagnostics, err);
      had_error = true;
      if (!options.continue_on_error) return 1;
    } catch (const std::exception& ex) {
      report_statement_error(script, statement.start_pos, statement_index, total,
                             diagnose_failure(parser, statement.text, ex.what()), err);
      had_error = true;
      if (!options.continue_on_error) return 1;
    }
  }

  return had_error ? 1 : 0;
}

}  // namespace xpratt::cli
