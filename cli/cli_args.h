#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace xpratt::cli {

struct CliOptions {
  std::string expr;
  std::string expr_file;
  std::string input;
  bool html = false;
  std::string grammar = "2.0";
  std::vector<std::pair<std::string, std::string>> variables;
  std::string output_mode = "plain";
  bool print_tree = false;
  bool static_evaluation = true;
  int timeout_ms = 5000;
  bool continue_on_error = false;
  bool quiet = false;
  bool lint = false;
  std::string lint_format = "text";
  bool show_help = false;
  bool show_version = false;
};

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
void print_startup_help(std::ostream& os);
/// Prints the explicit help requested by --help.
void print_help(std::ostream& os);
/// Applies XPRATT_GRAMMAR to the defaults; flags parsed afterwards win.
void apply_environment(CliOptions& options);
/// Splits "name=value" of a --var flag; returns false without '=' or with an empty name.
bool parse_variable_binding(const std::string& text, std::string& name, std::string& value);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace xpratt::cli
