#include "xpratt/errors.h"

#include <utility>

namespace xpratt {

namespace {

std::string with_position(const std::string& code,
                          const std::string& message,
                          size_t line,
                          size_t column) {
  return code + " at line " + std::to_string(line) + ", column " + std::to_string(column) +
         ": " + message;
}

}  // namespace

Error::Error(std::string code, const std::string& message)
    : std::runtime_error(code + ": " + message), code_(std::move(code)), detail_(message) {}

Error::Error(std::string code, const std::string& message, const std::string& decorated)
    : std::runtime_error(decorated), code_(std::move(code)), detail_(message) {}

ParseError::ParseError(SyntaxErrorKind kind,
                       std::string code,
                       const std::string& message,
                       std::string symbol,
                       std::string token_value,
                       size_t byte_pos,
                       size_t line,
                       size_t column)
    : Error(code, message, with_position(code, message, line, column)),
      kind_(kind),
      symbol_(std::move(symbol)),
      token_value_(std::move(token_value)),
      byte_pos_(byte_pos),
      line_(line),
      column_(column) {}

RegistrationError::RegistrationError(RegistrationErrorKind kind, const std::string& message)
    : Error(registration_error_kind_name(kind), message), kind_(kind) {}

EvaluationError::EvaluationError(std::string code, const std::string& message)
    : Error(std::move(code), message) {}

EvaluationError::EvaluationError(std::string code,
                                 const std::string& message,
                                 size_t byte_pos,
                                 size_t line,
                                 size_t column)
    : Error(code, message, with_position(code, message, line, column)),
      has_position_(true),
      byte_pos_(byte_pos),
      line_(line),
      column_(column) {}

const char* syntax_error_kind_name(SyntaxErrorKind kind) {
  switch (kind) {
    case SyntaxErrorKind::UnexpectedSymbol:
      return "unexpected-symbol";
    case SyntaxErrorKind::UnexpectedEnd:
      return "unexpected-end";
    case SyntaxErrorKind::EmptySource:
      return "empty-source";
    case SyntaxErrorKind::InvalidLiteral:
      return "invalid-literal";
    case SyntaxErrorKind::UnknownSymbol:
      return "unknown-symbol";
    case SyntaxErrorKind::UnexpectedName:
      return "unexpected-name";
    case SyntaxErrorKind::UnexpectedLiteral:
      return "unexpected-literal";
    case SyntaxErrorKind::Custom:
      return "custom";
  }
  return "custom";
}

const char* registration_error_kind_name(RegistrationErrorKind kind) {
  switch (kind) {
    case RegistrationErrorKind::DuplicateGrammar:
      return "duplicate-grammar";
    case RegistrationErrorKind::WhitespaceInSymbol:
      return "whitespace-in-symbol";
    case RegistrationErrorKind::WrongArgument:
      return "wrong-argument";
    case RegistrationErrorKind::UnregisteredClass:
      return "unregistered-class";
    case RegistrationErrorKind::NotAMethod:
      return "not-a-method";
    case RegistrationErrorKind::BadPattern:
      return "bad-pattern";
  }
  return "wrong-argument";
}

}  // namespace xpratt
