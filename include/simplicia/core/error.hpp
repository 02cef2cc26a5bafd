#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace simplicia {

/// \brief Failure categories surfaced by the library.
enum class ErrorKind {
  IncompatibleIdentification,
  DegenerateSimplex,
  VertexNotFound,
  ConflictingMapping,
  UnboundIdentifier,
  NotAValue,
  NotAnOperator,
  NotAFunction,
  NotAVariable,
  ArityMismatch,
  TypeMismatch,
  MappingMisuse,
  EmptyComplex,
  DuplicateVertex,
  LoopBoundExceeded,
  CallDepthExceeded,
  UninitializedAddress,
  ParseError,
  Io
};

/**
 * \brief Stable lowercase name for an error kind.
 * \param kind Error kind.
 * \return Name used in diagnostics and JSON output.
 */
inline std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::IncompatibleIdentification:
    return "incompatible identification";
  case ErrorKind::DegenerateSimplex:
    return "degenerate simplex";
  case ErrorKind::VertexNotFound:
    return "vertex not found";
  case ErrorKind::ConflictingMapping:
    return "conflicting mapping";
  case ErrorKind::UnboundIdentifier:
    return "unbound identifier";
  case ErrorKind::NotAValue:
    return "not a value";
  case ErrorKind::NotAnOperator:
    return "not an operator";
  case ErrorKind::NotAFunction:
    return "not a function";
  case ErrorKind::NotAVariable:
    return "not a variable";
  case ErrorKind::ArityMismatch:
    return "arity mismatch";
  case ErrorKind::TypeMismatch:
    return "type mismatch";
  case ErrorKind::MappingMisuse:
    return "mapping misuse";
  case ErrorKind::EmptyComplex:
    return "empty complex";
  case ErrorKind::DuplicateVertex:
    return "duplicate vertex";
  case ErrorKind::LoopBoundExceeded:
    return "loop bound exceeded";
  case ErrorKind::CallDepthExceeded:
    return "call depth exceeded";
  case ErrorKind::UninitializedAddress:
    return "uninitialized address";
  case ErrorKind::ParseError:
    return "parse error";
  case ErrorKind::Io:
    return "io";
  }
  return "unknown";
}

/// \brief Base exception for every failure raised by simplicia.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

/// \brief Rejections raised by union, glue, join and pick_vertex.
class AlgebraError : public Error {
public:
  using Error::Error;
};

/// \brief Lookup, dispatch, arity and control-flow failures of the evaluator.
class EvalError : public Error {
public:
  using Error::Error;
};

/// \brief Syntax error in program text, with a 1-based source position.
class ParseError : public Error {
public:
  ParseError(const std::string &message, std::size_t line, std::size_t column)
      : Error(ErrorKind::ParseError,
              fmt::format("{}:{}: {}", line, column, message)),
        line_(line), column_(column) {}

  [[nodiscard]] std::size_t line() const noexcept { return line_; }
  [[nodiscard]] std::size_t column() const noexcept { return column_; }

private:
  std::size_t line_;
  std::size_t column_;
};

} // namespace simplicia
