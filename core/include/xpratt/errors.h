#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace xpratt {

/// Base class of every error raised by the library.
/// MUST carry a stable code so diagnostics and tests can match on it.
/// Inputs are code/message; what() returns the decorated message.
class Error : public std::runtime_error {
 public:
  Error(std::string code, const std::string& message);
  Error(std::string code, const std::string& message, const std::string& decorated);

  const std::string& code() const { return code_; }
  /// Returns the message without position decoration.
  const std::string& detail() const { return detail_; }

 private:
  std::string code_;
  std::string detail_;
};

enum class SyntaxErrorKind {
  UnexpectedSymbol,
  UnexpectedEnd,
  EmptySource,
  InvalidLiteral,
  UnknownSymbol,
  UnexpectedName,
  UnexpectedLiteral,
  Custom
};

/// Raised when source text cannot be parsed.
/// MUST identify the offending token and its 1-based line/column.
class ParseError : public Error {
 public:
  ParseError(SyntaxErrorKind kind,
             std::string code,
             const std::string& message,
             std::string symbol,
             std::string token_value,
             size_t byte_pos,
             size_t line,
             size_t column);

  SyntaxErrorKind kind() const { return kind_; }
  const std::string& symbol() const { return symbol_; }
  const std::string& token_value() const { return token_value_; }
  size_t byte_pos() const { return byte_pos_; }
  size_t line() const { return line_; }
  size_t column() const { return column_; }

 private:
  SyntaxErrorKind kind_;
  std::string symbol_;
  std::string token_value_;
  size_t byte_pos_ = 0;
  size_t line_ = 1;
  size_t column_ = 1;
};

enum class RegistrationErrorKind {
  DuplicateGrammar,
  WhitespaceInSymbol,
  WrongArgument,
  UnregisteredClass,
  NotAMethod,
  BadPattern
};

/// Raised while building a grammar, never while parsing.
class RegistrationError : public Error {
 public:
  RegistrationError(RegistrationErrorKind kind, const std::string& message);

  RegistrationErrorKind kind() const { return kind_; }

 private:
  RegistrationErrorKind kind_;
};

/// Raised by evaluate()/select() for type, value and dynamic errors.
/// MUST keep the token position when one is known so callers can point at it.
class EvaluationError : public Error {
 public:
  EvaluationError(std::string code, const std::string& message);
  EvaluationError(std::string code,
                  const std::string& message,
                  size_t byte_pos,
                  size_t line,
                  size_t column);

  bool has_position() const { return has_position_; }
  size_t byte_pos() const { return byte_pos_; }
  size_t line() const { return line_; }
  size_t column() const { return column_; }

 private:
  bool has_position_ = false;
  size_t byte_pos_ = 0;
  size_t line_ = 1;
  size_t column_ = 1;
};

/// Raised when evaluation needs a dynamic context that was not supplied.
/// The static evaluation pass of Parser::parse swallows exactly this type.
class MissingContextError : public EvaluationError {
 public:
  using EvaluationError::EvaluationError;
};

const char* syntax_error_kind_name(SyntaxErrorKind kind);
const char* registration_error_kind_name(RegistrationErrorKind kind);

}  // namespace xpratt
