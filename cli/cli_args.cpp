#include "cli_args.h"

#include <cstdlib>
#include <string>

#include "xpratt/xpath.h"

namespace xpratt::cli {

namespace {

bool take_value(int argc, char** argv, int& i, const std::string& flag, std::string& out,
                std::string& error) {
  if (i + 1 >= argc) {
    error = "Missing value for " + flag;
    return false;
  }
  out = argv[++i];
  return true;
}

bool parse_timeout(const std::string& text, int& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (end != text.c_str() + text.size() || value <= 0 || value > 3600000) return false;
  out = static_cast<int>(value);
  return true;
}

}  // namespace

void print_startup_help(std::ostream& os) {
  os << "xpratt - Pratt parser playground for XPath expressions\n\n";
  os << "Usage:\n";
  os << "  xpratt --expr <expr> [--input <path|url>] [--html]\n";
  os << "  xpratt --expr-file <file> [--input <path|url>]\n";
  os << "         [--continue-on-error] [--quiet]\n";
  os << "  xpratt --lint \"<expr>\" [--format text|json]\n";
  os << "  xpratt --grammar 1.0|2.0|3.0|3.1\n";
  os << "  xpratt --var name=value\n";
  os << "  xpratt --mode plain|json\n";
  os << "  xpratt --tree\n";
  os << "  xpratt --version\n\n";
  os << "Notes:\n";
  os << "  - If --input is omitted, XML (or HTML with --html) is read from stdin when it is not a terminal.\n";
  os << "  - URLs are supported when libcurl is available.\n";
  os << "  - XPRATT_GRAMMAR sets the default grammar level.\n";
  os << "  - Exit codes: 0=success, 1=parse/evaluation error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  xpratt --expr \"1 + 2 * 3\"\n";
  os << "  xpratt --expr \"count(//item[@id])\" --input ./data/catalog.xml\n";
  os << "  xpratt --lint \"//a[@href\"\n";
  os << "  xpratt --grammar 3.0 --expr \"(1 to 3) ! (. * 2)\"\n";
}

void print_help(std::ostream& os) {
  os << "Usage: xpratt --expr <expr> [--input <path|url>] [--html]\n";
  os << "       xpratt --expr-file <file> [--input <path|url>]\n";
  os << "              [--continue-on-error] [--quiet]\n";
  os << "       xpratt --lint \"<expr>\" [--format text|json]\n";
  os << "       xpratt --grammar 1.0|2.0|3.0|3.1\n";
  os << "       xpratt --var name=value (repeatable)\n";
  os << "       xpratt --mode plain|json\n";
  os << "       xpratt --tree\n";
  os << "       xpratt --no-static-eval\n";
  os << "       xpratt --timeout-ms <n>\n";
  os << "       xpratt --version\n";
  os << "If --input is omitted, the document is read from stdin when stdin is not a terminal.\n";
  os << "Expression files hold one expression per line; blank lines and (: ... :) lines are skipped.\n";
  os << "--tree prints the parsed token tree before the results.\n";
  os << "--lint parses and statically evaluates without reading a document.\n";
  os << "--format json emits lint diagnostics as a JSON array.\n";
  os << "Exit codes: 0=success, 1=parse/evaluation error, 2=CLI/IO usage error.\n";
}

void apply_environment(CliOptions& options) {
  const char* grammar = std::getenv("XPRATT_GRAMMAR");
  if (grammar != nullptr && *grammar != '\0') options.grammar = grammar;
}

bool parse_variable_binding(const std::string& text, std::string& name, std::string& value) {
  const size_t eq = text.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  name = text.substr(0, eq);
  if (!name.empty() && name[0] == '$') name.erase(0, 1);
  if (name.empty()) return false;
  value = text.substr(eq + 1);
  return true;
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--expr") {
      if (!take_value(argc, argv, i, arg, options.expr, error)) return false;
    } else if (arg == "--expr-file") {
      if (!take_value(argc, argv, i, arg, options.expr_file, error)) return false;
    } else if (arg == "--input") {
      if (!take_value(argc, argv, i, arg, options.input, error)) return false;
    } else if (arg == "--html") {
      options.html = true;
    } else if (arg == "--grammar") {
      if (!take_value(argc, argv, i, arg, options.grammar, error)) return false;
    } else if (arg == "--var") {
      std::string binding;
      if (!take_value(argc, argv, i, arg, binding, error)) return false;
      std::string name;
      std::string value;
      if (!parse_variable_binding(binding, name, value)) {
        error = "Invalid --var value (use name=value): " + binding;
        return false;
      }
      options.variables.emplace_back(name, value);
    } else if (arg == "--mode") {
      if (!take_value(argc, argv, i, arg, options.output_mode, error)) return false;
    } else if (arg == "--tree") {
      options.print_tree = true;
    } else if (arg == "--no-static-eval") {
      options.static_evaluation = false;
    } else if (arg == "--timeout-ms") {
      std::string value;
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      if (!parse_timeout(value, options.timeout_ms)) {
        error = "Invalid --timeout-ms value: " + value;
        return false;
      }
    } else if (arg == "--lint") {
      options.lint = true;
      if (i + 1 < argc) {
        std::string maybe_expr = argv[i + 1];
        if (!maybe_expr.empty() && maybe_expr.rfind("--", 0) != 0) {
          options.expr = maybe_expr;
          ++i;
        }
      }
    } else if (arg == "--format") {
      if (!take_value(argc, argv, i, arg, options.lint_format, error)) return false;
    } else if (arg == "--help") {
      options.show_help = true;
    } else if (arg == "--version") {
      options.show_version = true;
    } else if (arg == "--continue-on-error") {
      options.continue_on_error = true;
    } else if (arg == "--quiet") {
      options.quiet = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!options.expr.empty() && !options.expr_file.empty()) {
    error = "Error: --expr and --expr-file are mutually exclusive";
    return false;
  }
  XPathVersion version;
  if (!parse_xpath_version(options.grammar, version)) {
    error = "Invalid --grammar value (use 1.0|2.0|3.0|3.1): " + options.grammar;
    return false;
  }
  if (options.output_mode != "plain" && options.output_mode != "json") {
    error = "Invalid --mode value (use plain|json)";
    return false;
  }
  if (!options.lint && options.lint_format != "text") {
    error = "--format is only supported with --lint";
    return false;
  }
  if (options.lint_format != "text" && options.lint_format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  return true;
}

}  // namespace xpratt::cli
