#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <simplicia/data/complex.hpp>

/// \file
/// \brief Abstract syntax consumed by the evaluator.

namespace simplicia::lang::ast {

using data::VertexMapping;
using data::VertexName;

struct Expr;

struct Identifier {
  std::string name;
};

/// \brief `[v1, ..., vn]`; an empty list denotes the empty complex.
struct ComplexLiteral {
  std::vector<VertexName> vertices;
};

struct IntLiteral {
  std::int64_t value = 0;
};

struct BoolLiteral {
  bool value = false;
};

/// \brief `op(args...) [mapping {a -> b, ...}]`.
struct OpCall {
  std::string op;
  std::vector<Expr> args;
  std::optional<VertexMapping> mapping;
};

/// \brief Call of a user-defined function.
struct FunCall {
  std::string name;
  std::vector<Expr> args;
};

struct Expr {
  using Node = std::variant<Identifier, ComplexLiteral, IntLiteral, BoolLiteral, OpCall, FunCall>;
  Node node;
};

struct Command;
using CommandSeq = std::vector<Command>;

/// \brief `complex name = expr`.
struct ComplexDecl {
  std::string name;
  Expr expr;
};

/// \brief `vertex name`.
struct VertexDecl {
  std::string name;
};

/// \brief `name <- expr`.
struct Assign {
  std::string name;
  Expr expr;
};

struct If {
  Expr cond;
  CommandSeq then_branch;
  CommandSeq else_branch;
};

struct While {
  Expr cond;
  CommandSeq body;
};

/// \brief `function name(params...) = body`.
struct FunctionDecl {
  std::string name;
  std::vector<std::string> params;
  Expr body;
};

struct Command {
  using Node = std::variant<ComplexDecl, VertexDecl, Assign, If, While, FunctionDecl>;
  Node node;
};

using Program = CommandSeq;

// Builders used by hosts that construct trees directly.

inline Expr ident(std::string name) { return Expr{Identifier{std::move(name)}}; }

inline Expr literal(std::vector<VertexName> vertices) {
  return Expr{ComplexLiteral{std::move(vertices)}};
}

inline Expr integer(std::int64_t value) { return Expr{IntLiteral{value}}; }

inline Expr boolean(bool value) { return Expr{BoolLiteral{value}}; }

inline Expr op(std::string name, std::vector<Expr> args,
               std::optional<VertexMapping> mapping = std::nullopt) {
  return Expr{OpCall{std::move(name), std::move(args), std::move(mapping)}};
}

inline Expr call(std::string name, std::vector<Expr> args) {
  return Expr{FunCall{std::move(name), std::move(args)}};
}

inline Command complex_decl(std::string name, Expr expr) {
  return Command{ComplexDecl{std::move(name), std::move(expr)}};
}

inline Command vertex_decl(std::string name) { return Command{VertexDecl{std::move(name)}}; }

inline Command assign(std::string name, Expr expr) {
  return Command{Assign{std::move(name), std::move(expr)}};
}

inline Command if_then_else(Expr cond, CommandSeq then_branch, CommandSeq else_branch = {}) {
  return Command{If{std::move(cond), std::move(then_branch), std::move(else_branch)}};
}

inline Command while_do(Expr cond, CommandSeq body) {
  return Command{While{std::move(cond), std::move(body)}};
}

inline Command function_decl(std::string name, std::vector<std::string> params, Expr body) {
  return Command{FunctionDecl{std::move(name), std::move(params), std::move(body)}};
}

} // namespace simplicia::lang::ast
