#include "xpratt/diagnostics.h"

#include <algorithm>
#include <optional>
#include <sstream>
#include <string_view>

#include "../util/string_util.h"
#include "xpratt/parser.h"

namespace xpratt {

namespace {

constexpr const char* kErrorDocBase = "https://www.w3.org/TR/xpath-31/#ERR";
constexpr const char* kCliDoc = "README.md#command-line";

bool contains_icase(std::string_view haystack, std::string_view needle) {
  return util::to_lower(std::string(haystack)).find(util::to_lower(std::string(needle))) !=
         std::string::npos;
}

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

std::string render_code_frame(const std::string& source,
                              const DiagnosticSpan& span,
                              const std::string& label) {
  if (source.empty()) return "";
  size_t line_start = 0;
  size_t current_line = 1;
  while (current_line < span.start_line && line_start < source.size()) {
    size_t nl = source.find('\n', line_start);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
    ++current_line;
  }
  size_t line_end = source.find('\n', line_start);
  if (line_end == std::string::npos) line_end = source.size();
  std::string line_text = source.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();

  const size_t caret_start = span.start_col > 0 ? span.start_col - 1 : 0;
  size_t caret_width = 1;
  if (span.start_line == span.end_line && span.end_col > span.start_col) {
    caret_width = span.end_col - span.start_col;
  }
  if (caret_start > line_text.size()) return "";
  if (caret_start + caret_width > line_text.size() + 1) {
    caret_width = std::max<size_t>(1, line_text.size() > caret_start ? line_text.size() - caret_start : 1);
  }
  const size_t line_digits = std::to_string(span.start_line).size();

  std::ostringstream out;
  out << " --> line " << span.start_line << ", col " << span.start_col << "\n";
  out << std::string(line_digits, ' ') << " |\n";
  out << span.start_line << " | " << line_text << "\n";
  out << std::string(line_digits, ' ') << " | " << std::string(caret_start, ' ')
      << std::string(caret_width, '^');
  if (!label.empty()) out << " " << label;
  return out.str();
}

/// Byte offset of the innermost bracket still open before `limit`, if any.
std::optional<size_t> unclosed_bracket(const std::string& source, size_t limit, char open, char close) {
  std::vector<size_t> stack;
  char quote = 0;
  for (size_t i = 0; i < std::min(limit, source.size()); ++i) {
    const char c = source[i];
    if (quote != 0) {
      if (c == quote) quote = 0;
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == open) {
      stack.push_back(i);
    } else if (c == close && !stack.empty()) {
      stack.pop_back();
    }
  }
  if (stack.empty()) return std::nullopt;
  return stack.back();
}

std::string syntax_help(SyntaxErrorKind kind, const std::string& message) {
  if (contains_icase(message, "expected ')'") || contains_icase(message, "expected ',' or ')'")) {
    return "Close the open parenthesis before continuing.";
  }
  if (contains_icase(message, "expected ']'")) return "Close the predicate with ']'.";
  if (contains_icase(message, "unknown function")) {
    return "Check the function name and the grammar level (--grammar) it needs.";
  }
  if (contains_icase(message, "argument(s)")) return "Pass the number of arguments the function accepts.";
  if (contains_icase(message, "unterminated comment")) return "Close the comment with ':)'.";
  switch (kind) {
    case SyntaxErrorKind::EmptySource:
      return "Provide a non-empty expression.";
    case SyntaxErrorKind::UnexpectedEnd:
      return "The expression ends too early; complete the last operator or step.";
    case SyntaxErrorKind::InvalidLiteral:
      return "Fix the numeric or string literal.";
    case SyntaxErrorKind::UnknownSymbol:
      return "Remove the character or quote it inside a string literal.";
    case SyntaxErrorKind::UnexpectedName:
    case SyntaxErrorKind::UnexpectedLiteral:
    case SyntaxErrorKind::UnexpectedSymbol:
      return "Check operator placement; an operand or operator may be missing before this token.";
    case SyntaxErrorKind::Custom:
      break;
  }
  return "Check the expression syntax near the highlighted token.";
}

std::string evaluation_help(const std::string& code) {
  if (code == "XPTY0004") return "Check the operand types; convert values with string(), number() or a constructor.";
  if (code == "XPDY0002") return "Provide an input document (--input) or bind the referenced variables (--var).";
  if (code == "XPST0008") return "Bind the variable with --var name=value.";
  if (code == "XPST0017") return "Check the function name and the number of arguments.";
  if (code == "XPTY0019" || code == "XPTY0020") return "Path steps need nodes on their left side.";
  if (code == "XPTY0018") return "A path must return either only nodes or only atomic values.";
  if (code == "FORG0006") return "Use exists(), empty() or a predicate instead of a sequence in a boolean context.";
  if (code == "FOAR0001") return "Guard the divisor against zero.";
  if (code == "FOAR0002") return "The value is outside the supported numeric range.";
  if (code == "FORG0001" || code == "FOCA0002") return "Check the lexical form of the value being cast.";
  return "Review the highlighted expression.";
}

bool is_xpath_code(const std::string& code) {
  return code.size() == 8 && (code.rfind("XP", 0) == 0 || code.rfind("FO", 0) == 0);
}

bool looks_like_runtime_io(std::string_view message) {
  return contains_icase(message, "Failed to open file") ||
         contains_icase(message, "Failed to fetch URL") ||
         contains_icase(message, "URL fetching is disabled") ||
         contains_icase(message, "Unsupported Content-Type") ||
         contains_icase(message, "not well formed");
}

}  // namespace

DiagnosticSpan span_from_bytes(const std::string& source, size_t byte_start, size_t byte_end) {
  DiagnosticSpan span;
  const size_t size = source.size();
  if (size == 0) return span;
  span.byte_start = std::min(byte_start, size - 1);
  span.byte_end = std::min(std::max(byte_end, span.byte_start + 1), size);

  size_t line = 1;
  size_t col = 1;
  for (size_t i = 0; i < span.byte_start; ++i) {
    if (source[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.start_line = line;
  span.start_col = col;
  for (size_t i = span.byte_start; i < span.byte_end; ++i) {
    if (source[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.end_line = line;
  span.end_col = col;
  return span;
}

Diagnostic make_syntax_diagnostic(const std::string& source,
                                  const std::string& message,
                                  size_t error_byte) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.code = "XPST0003";
  d.message = message;
  d.help = syntax_help(SyntaxErrorKind::Custom, message);
  d.doc_ref = std::string(kErrorDocBase) + d.code;
  d.span = span_from_bytes(source, error_byte, error_byte + 1);
  d.snippet = render_code_frame(source, d.span, "");

  const bool wants_paren = contains_icase(message, "')'");
  const bool wants_bracket = contains_icase(message, "']'");
  if (wants_paren || wants_bracket) {
    const char open = wants_paren ? '(' : '[';
    const char close = wants_paren ? ')' : ']';
    if (auto pos = unclosed_bracket(source, error_byte, open, close); pos.has_value()) {
      DiagnosticRelated related;
      related.message = std::string("'") + open + "' opened here";
      related.span = span_from_bytes(source, *pos, *pos + 1);
      d.related.push_back(std::move(related));
    }
  }
  return d;
}

Diagnostic make_syntax_diagnostic(const std::string& source, const ParseError& error) {
  Diagnostic d = make_syntax_diagnostic(source, error.detail(), error.byte_pos());
  d.code = error.code();
  d.doc_ref = std::string(kErrorDocBase) + d.code;
  d.help = syntax_help(error.kind(), error.detail());
  if (!error.token_value().empty() && error.symbol() != "(end)") {
    d.span = span_from_bytes(source, error.byte_pos(), error.byte_pos() + error.token_value().size());
    d.snippet = render_code_frame(source, d.span, "");
  }
  return d;
}

Diagnostic make_evaluation_diagnostic(const std::string& source, const EvaluationError& error) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.code = error.code();
  d.message = error.detail();
  d.help = evaluation_help(error.code());
  d.doc_ref = is_xpath_code(error.code()) ? std::string(kErrorDocBase) + error.code() : kCliDoc;
  d.span = error.has_position() ? span_from_bytes(source, error.byte_pos(), error.byte_pos() + 1)
                                : span_from_bytes(source, 0, 1);
  d.snippet = render_code_frame(source, d.span, "");
  return d;
}

Diagnostic make_runtime_diagnostic(const std::string& source, const std::string& message) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = message;
  d.span = span_from_bytes(source, 0, source.size());
  d.code = "XPR-RUN-0001";
  d.help = "Check the input and the expression before retrying.";
  d.doc_ref = kCliDoc;
  if (looks_like_runtime_io(message)) {
    d.code = "XPR-RUN-0002";
    d.help = "Verify the input path/URL, its content and the file/network permissions.";
  }
  d.snippet = render_code_frame(source, d.span, "");
  return d;
}

std::string json_escape(const std::string& text) {
  std::ostringstream out;
  for (char c : text) {
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        out << c;
        break;
    }
  }
  return out.str();
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    if (!d.snippet.empty()) out << d.snippet << "\n";
    for (const auto& related : d.related) {
      out << "note: " << related.message << " (line " << related.span.start_line << ", col "
          << related.span.start_col << ")\n";
    }
    out << "help: " << d.help << "\n";
    if (i + 1 < diagnostics.size()) out << "\n\n";
  }
  return out.str();
}

namespace {

void write_span_json(std::ostringstream& out, const DiagnosticSpan& span) {
  out << "\"span\":{"
      << "\"start_line\":" << span.start_line << ","
      << "\"start_col\":" << span.start_col << ","
      << "\"end_line\":" << span.end_line << ","
      << "\"end_col\":" << span.end_col << ","
      << "\"byte_start\":" << span.byte_start << ","
      << "\"byte_end\":" << span.byte_end << "}";
}

}  // namespace

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    if (i != 0) out << ",";
    out << "{";
    out << "\"severity\":\"" << json_escape(severity_name(d.severity)) << "\",";
    out << "\"code\":\"" << json_escape(d.code) << "\",";
    out << "\"message\":\"" << json_escape(d.message) << "\",";
    out << "\"help\":\"" << json_escape(d.help) << "\",";
    out << "\"doc_ref\":\"" << json_escape(d.doc_ref) << "\",";
    write_span_json(out, d.span);
    out << ",";
    out << "\"snippet\":\"" << json_escape(d.snippet) << "\",";
    out << "\"related\":[";
    for (size_t j = 0; j < d.related.size(); ++j) {
      if (j != 0) out << ",";
      out << "{\"message\":\"" << json_escape(d.related[j].message) << "\",";
      write_span_json(out, d.related[j].span);
      out << "}";
    }
    out << "]";
    out << "}";
  }
  out << "]";
  return out.str();
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}

std::vector<Diagnostic> lint_expression(Parser& parser, const std::string& source) {
  std::vector<Diagnostic> out;
  try {
    parser.parse(source);
  } catch (const ParseError& error) {
    out.push_back(make_syntax_diagnostic(source, error));
  } catch (const EvaluationError& error) {
    out.push_back(make_evaluation_diagnostic(source, error));
  } catch (const std::exception& error) {
    out.push_back(make_runtime_diagnostic(source, error.what()));
  }
  return out;
}

std::vector<Diagnostic> diagnose_failure(Parser& parser,
                                         const std::string& source,
                                         const std::string& message) {
  std::vector<Diagnostic> out = lint_expression(parser, source);
  if (!out.empty()) return out;
  out.push_back(make_runtime_diagnostic(source, message));
  return out;
}

}  // namespace xpratt
