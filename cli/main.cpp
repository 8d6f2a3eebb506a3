#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_args.h"
#include "cli_utils.h"
#include "render/result_renderer.h"
#include "script_runner.h"
#include "util/string_util.h"
#include "xpratt/context.h"
#include "xpratt/diagnostics.h"
#include "xpratt/document.h"
#include "xpratt/parser.h"
#include "xpratt/version.h"
#include "xpratt/xpath.h"

using namespace xpratt::cli;

namespace {

/// Loads the document named by --input, or the piped stdin when there is one.
/// Returns nullptr when no document is available; throws on IO or parse failure.
std::shared_ptr<xpratt::Document> load_input(const CliOptions& options) {
  if (!options.input.empty()) {
    xpratt::LoadOptions load;
    load.html = options.html || looks_like_html_path(options.input);
    load.timeout_ms = options.timeout_ms;
    return xpratt::load_document(options.input, load);
  }
  if (stdin_is_terminal()) return nullptr;
  const std::string text = read_stdin();
  if (xpratt::util::trim_ws(text).empty()) return nullptr;
  if (options.html) return xpratt::Document::parse_html(text, "stdin");
  return xpratt::Document::parse_xml(text, "stdin");
}

void print_results(const xpratt::Sequence& items, const CliOptions& options) {
  if (options.output_mode == "json") {
    std::cout << xpratt::render::render_json(items) << std::endl;
    return;
  }
  if (!items.empty()) std::cout << xpratt::render::render_plain(items) << std::endl;
}

std::vector<xpratt::Diagnostic> lint_statements(xpratt::Parser& parser, const std::string& script,
                                                bool from_file) {
  std::vector<xpratt::Diagnostic> diagnostics;
  if (!from_file) return xpratt::lint_expression(parser, script);
  ScriptSplitResult split = split_expression_script(script);
  if (split.error_message.has_value()) {
    diagnostics.push_back(
        xpratt::make_syntax_diagnostic(script, *split.error_message, split.error_position));
    return diagnostics;
  }
  const size_t total = split.statements.size();
  for (size_t i = 0; i < total; ++i) {
    std::vector<xpratt::Diagnostic> statement_diags =
        xpratt::lint_expression(parser, split.statements[i].text);
    if (total > 1) {
      for (auto& diag : statement_diags) {
        diag.message = "statement " + std::to_string(i + 1) + "/" + std::to_string(total) + ": " +
                       diag.message;
      }
    }
    diagnostics.insert(diagnostics.end(), statement_diags.begin(), statement_diags.end());
  }
  return diagnostics;
}

}  // namespace

/// Entry point that parses CLI options and dispatches to lint, single-expression or file mode.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
/// Inputs are argc/argv; outputs are process status with IO side effects.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }
  apply_environment(options);

  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << xpratt::version_string() << std::endl;
    return 0;
  }

  xpratt::XPathVersion version = xpratt::XPathVersion::V2_0;
  if (!xpratt::parse_xpath_version(options.grammar, version)) {
    std::cerr << "Invalid --grammar value (use 1.0|2.0|3.0|3.1): " << options.grammar << "\n";
    return 2;
  }
  xpratt::ParserOptions parser_options;
  parser_options.static_evaluation = options.static_evaluation;

  try {
    xpratt::Parser parser(xpratt::xpath_grammar(version), parser_options);

    std::string script = options.expr;
    const bool from_file = !options.expr_file.empty();
    if (from_file) {
      try {
        script = xpratt::read_file(options.expr_file);
      } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 2;
      }
      if (!is_valid_utf8(script)) {
        std::cerr << "Error: expression file is not valid UTF-8: " << options.expr_file
                  << std::endl;
        return 2;
      }
    }

    if (options.lint) {
      if (script.empty() && !from_file) {
        std::cerr << "Missing expression for --lint (use --lint \"...\" or --expr/--expr-file)\n";
        return 2;
      }
      std::vector<xpratt::Diagnostic> diagnostics = lint_statements(parser, script, from_file);
      if (options.lint_format == "json") {
        std::cout << xpratt::render_diagnostics_json(diagnostics) << std::endl;
      } else if (diagnostics.empty()) {
        std::cout << "No diagnostics." << std::endl;
      } else {
        std::cout << xpratt::render_diagnostics_text(diagnostics) << std::endl;
      }
      return xpratt::has_error_diagnostics(diagnostics) ? 1 : 0;
    }

    if (script.empty() && !from_file) {
      std::cerr << "Missing --expr or --expr-file\n";
      return 2;
    }

    std::shared_ptr<xpratt::Document> document;
    try {
      document = load_input(options);
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 2;
    }
    xpratt::Context context = document ? xpratt::Context(document) : xpratt::Context();
    for (const auto& [name, value] : options.variables) {
      context.set_variable(name, xpratt::Value::of(xpratt::Item(value)));
    }

    auto execute = [&](const xpratt::Token& root) {
      if (options.print_tree) std::cout << root.tree() << std::endl;
      print_results(xpratt::select_results(root, context), options);
    };

    if (from_file) {
      ScriptRunOptions run_options;
      run_options.continue_on_error = options.continue_on_error;
      run_options.quiet = options.quiet;
      return run_expression_script(script, run_options, parser, execute, std::cout, std::cerr);
    }

    std::vector<xpratt::Diagnostic> diagnostics;
    try {
      execute(*parser.parse(script));
      return 0;
    } catch (const xpratt::ParseError& ex) {
      diagnostics.push_back(xpratt::make_syntax_diagnostic(script, ex));
    } catch (const xpratt::EvaluationError& ex) {
      diagnostics.push_back(xpratt::make_evaluation_diagnostic(script, ex));
    } catch (const std::exception& ex) {
      diagnostics = xpratt::diagnose_failure(parser, script, ex.what());
    }
    std::cerr << xpratt::render_diagnostics_text(diagnostics) << std::endl;
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }
}
