#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "xpratt/errors.h"

namespace xpratt {

class Parser;

/// Classifies diagnostic urgency for linting and evaluation error rendering.
/// MUST remain stable for text/JSON outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Describes a source span in both byte offsets and line/column coordinates.
/// MUST use 1-based line/column values; byte offsets are 0-based.
struct DiagnosticSpan {
  size_t start_line = 1;
  size_t start_col = 1;
  size_t end_line = 1;
  size_t end_col = 1;
  size_t byte_start = 0;
  size_t byte_end = 0;
};

struct DiagnosticRelated {
  std::string message;
  DiagnosticSpan span;
};

/// Structured report for a syntax, evaluation or runtime failure of one expression.
/// MUST include a stable error code, actionable help and a docs pointer.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  std::string doc_ref;
  DiagnosticSpan span;
  std::string snippet;
  std::vector<DiagnosticRelated> related;
};

DiagnosticSpan span_from_bytes(const std::string& source, size_t byte_start, size_t byte_end);

/// Builds a syntax diagnostic from a caught parse error.
/// MUST anchor the span at the offending token.
Diagnostic make_syntax_diagnostic(const std::string& source, const ParseError& error);
/// Builds a syntax diagnostic anchored at a byte position.
Diagnostic make_syntax_diagnostic(const std::string& source,
                                  const std::string& message,
                                  size_t error_byte);
/// Builds a diagnostic for a type, value or dynamic error.
/// Errors raised by the static pass keep their token position.
Diagnostic make_evaluation_diagnostic(const std::string& source, const EvaluationError& error);
/// Builds a diagnostic for IO and other failures that carry no error code.
Diagnostic make_runtime_diagnostic(const std::string& source, const std::string& message);

/// Renders diagnostics in a human-readable multi-block text format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a JSON array with stable key order.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

/// Parses (and statically evaluates) only; returns an empty list for valid expressions.
/// MUST NOT throw for syntax or evaluation errors.
std::vector<Diagnostic> lint_expression(Parser& parser, const std::string& source);
/// Maps a caught failure message to diagnostics, re-parsing to locate syntax errors.
/// MUST avoid throwing and return at least one diagnostic.
std::vector<Diagnostic> diagnose_failure(Parser& parser,
                                         const std::string& source,
                                         const std::string& message);

std::string json_escape(const std::string& text);

}  // namespace xpratt
