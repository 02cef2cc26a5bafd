#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/core/config.hpp>
#include <simplicia/core/error.hpp>
#include <simplicia/data/complex.hpp>
#include <simplicia/lang/ast.hpp>
#include <simplicia/lang/operators.hpp>
#include <simplicia/lang/state.hpp>
#include <simplicia/lang/value.hpp>

namespace simplicia::lang {

/// \brief Environment holding every built-in operator under its own name.
inline Environment initial_environment() {
  Environment env;
  for (Operator &op : builtin_operators()) {
    std::string name = operator_name(op);
    env = env.bind(std::move(name), DVal(std::move(op)));
  }
  return env;
}

inline State initial_state(const core::EvalOptions &options = {}) {
  State state;
  state.options = options;
  return state;
}

/// \brief Result of running a whole program.
struct RunResult {
  Environment env;
  State state;
};

namespace detail {

inline DVal to_denotable(EVal value) {
  return std::visit([](auto &&v) -> DVal { return DVal(std::move(v)); }, std::move(value));
}

inline Complex singleton(const VertexName &v) { return Complex::from_vertices({v}); }

// Vertex tokens bound by `vertex` stand for their synthesized name.
inline VertexName resolve_vertex(const VertexName &token, const Environment &env) {
  const DVal *bound = env.find(token);
  const auto *raw = bound != nullptr ? std::get_if<RawVertex>(&bound->as_variant()) : nullptr;
  return raw != nullptr ? raw->name : token;
}

inline std::vector<VertexName> resolve_literal(const ast::ComplexLiteral &literal,
                                               const Environment &env) {
  std::vector<VertexName> out;
  out.reserve(literal.vertices.size());
  for (const VertexName &token : literal.vertices) {
    out.push_back(resolve_vertex(token, env));
  }
  return out;
}

inline std::optional<data::VertexMapping>
resolve_mapping(const std::optional<data::VertexMapping> &mapping, const Environment &env) {
  if (!mapping.has_value()) {
    return std::nullopt;
  }
  data::VertexMapping out;
  out.reserve(mapping->size());
  for (const auto &[source, target] : *mapping) {
    out.emplace_back(resolve_vertex(source, env), resolve_vertex(target, env));
  }
  return out;
}

inline std::int64_t require_condition(const EVal &value, const char *construct) {
  const auto truth = as_integer(value);
  if (!truth.has_value()) {
    throw EvalError(ErrorKind::TypeMismatch,
                    fmt::format("{} condition must be an int, got {}", construct, kind_name(value)));
  }
  return *truth;
}

inline const Complex &require_complex_result(const EVal &value, const std::string &target) {
  const auto *c = std::get_if<Complex>(&value);
  if (c == nullptr) {
    throw EvalError(ErrorKind::TypeMismatch,
                    fmt::format("expression assigned to '{}' is a {}, not a complex", target,
                                kind_name(value)));
  }
  return *c;
}

template <typename... Args>
void trace(const State &state, fmt::format_string<Args...> format, Args &&...args) {
  if (!state.options.trace) {
    return;
  }
  fmt::print(stderr, "[Eval] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

inline EVal evaluate_expr(const ast::Expr &expr, const Environment &env, const State &state,
                          std::size_t depth);

inline std::vector<EVal> evaluate_args(const std::vector<ast::Expr> &args, const Environment &env,
                                       const State &state, std::size_t depth) {
  std::vector<EVal> values;
  values.reserve(args.size());
  for (const ast::Expr &arg : args) {
    values.push_back(evaluate_expr(arg, env, state, depth));
  }
  return values;
}

inline EVal evaluate_identifier(const ast::Identifier &id, const Environment &env,
                                const State &state) {
  const DVal &bound = lookup(env, id.name);
  return std::visit(
      [&](const auto &v) -> EVal {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Loc>) {
          return state.store.access(v);
        } else if constexpr (std::is_same_v<T, RawVertex>) {
          return singleton(v.name);
        } else if constexpr (std::is_same_v<T, Operator>) {
          throw EvalError(ErrorKind::NotAValue,
                          fmt::format("identifier '{}' names an operator, not a value", id.name));
        } else {
          return v;
        }
      },
      bound.as_variant());
}

inline EVal evaluate_call(const ast::FunCall &call, const Environment &env, const State &state,
                          std::size_t depth) {
  const DVal &bound = lookup(env, call.name);
  const auto *closure = std::get_if<Closure>(&bound.as_variant());
  if (closure == nullptr) {
    throw EvalError(ErrorKind::NotAFunction,
                    fmt::format("'{}' is not a function ({})", call.name, describe(bound)));
  }

  const auto &params = closure->function->params;
  if (call.args.size() != params.size()) {
    throw EvalError(ErrorKind::ArityMismatch,
                    fmt::format("function {} expects {} args, got {}", call.name, params.size(),
                                call.args.size()));
  }
  if (depth + 1 > state.options.max_call_depth) {
    throw EvalError(ErrorKind::CallDepthExceeded,
                    fmt::format("call to {} exceeds the maximum call depth of {}", call.name,
                                state.options.max_call_depth));
  }

  std::vector<EVal> values = evaluate_args(call.args, env, state, depth);

  Environment call_env = closure->env;
  for (std::size_t i = 0; i < params.size(); ++i) {
    call_env = call_env.bind(params[i], to_denotable(std::move(values[i])));
  }
  return evaluate_expr(closure->function->body, call_env, state, depth + 1);
}

inline EVal evaluate_expr(const ast::Expr &expr, const Environment &env, const State &state,
                          std::size_t depth) {
  return std::visit(
      [&](const auto &node) -> EVal {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::Identifier>) {
          return evaluate_identifier(node, env, state);
        } else if constexpr (std::is_same_v<T, ast::ComplexLiteral>) {
          return Complex::from_vertices(resolve_literal(node, env));
        } else if constexpr (std::is_same_v<T, ast::IntLiteral>) {
          return node.value;
        } else if constexpr (std::is_same_v<T, ast::BoolLiteral>) {
          return node.value;
        } else if constexpr (std::is_same_v<T, ast::OpCall>) {
          const DVal &bound = lookup(env, node.op);
          const auto *op = std::get_if<Operator>(&bound.as_variant());
          if (op == nullptr) {
            throw EvalError(ErrorKind::NotAnOperator,
                            fmt::format("'{}' is not an operator ({})", node.op, describe(bound)));
          }
          return apply(*op, evaluate_args(node.args, env, state, depth),
                       resolve_mapping(node.mapping, env), state);
        } else {
          return evaluate_call(node, env, state, depth);
        }
      },
      expr.node);
}

} // namespace detail

/**
 * \brief Evaluate an expression.
 *
 * Evaluation never mutates `state`: it only reads the store and the vertex
 * declaration order.
 * \throws EvalError, AlgebraError.
 */
inline EVal evaluate_expr(const ast::Expr &expr, const Environment &env, const State &state) {
  return detail::evaluate_expr(expr, env, state, 0);
}

inline Environment execute_command_seq(const ast::CommandSeq &seq, const Environment &env,
                                       State &state);

/**
 * \brief Execute one command, threading `state` and returning the new environment.
 *
 * `if` and `while` blocks run under the enclosing environment; cells they
 * allocate are dropped when the block (or loop iteration) ends, while
 * assignments to older cells persist.
 */
inline Environment execute_command(const ast::Command &cmd, const Environment &env,
                                   State &state) {
  return std::visit(
      [&](const auto &node) -> Environment {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::ComplexDecl>) {
          const EVal value = evaluate_expr(node.expr, env, state);
          const Complex &complex = detail::require_complex_result(value, node.name);
          ensure_vertices_order(state, complex.vertices());
          const Loc loc = state.store.allocate(complex);
          detail::trace(state, "complex {} = @{} (dim {})", node.name, loc.addr,
                        complex.dimension());
          return env.bind(node.name, loc);
        } else if constexpr (std::is_same_v<T, ast::VertexDecl>) {
          VertexName fresh = fresh_vertex(state);
          detail::trace(state, "vertex {} = {}", node.name, fresh);
          return env.bind(node.name, RawVertex{std::move(fresh)});
        } else if constexpr (std::is_same_v<T, ast::Assign>) {
          const DVal &bound = lookup(env, node.name);
          const auto *loc = std::get_if<Loc>(&bound.as_variant());
          if (loc == nullptr) {
            throw EvalError(ErrorKind::NotAVariable,
                            fmt::format("identifier '{}' is not a variable ({})", node.name,
                                        describe(bound)));
          }
          const EVal value = evaluate_expr(node.expr, env, state);
          state.store.update(*loc, detail::require_complex_result(value, node.name));
          detail::trace(state, "{} <- @{}", node.name, loc->addr);
          return env;
        } else if constexpr (std::is_same_v<T, ast::If>) {
          const std::int64_t cond =
              detail::require_condition(evaluate_expr(node.cond, env, state), "if");
          detail::trace(state, "if condition = {}", cond);
          const std::size_t high_water = state.store.next_address();
          execute_command_seq(cond != 0 ? node.then_branch : node.else_branch, env, state);
          state.store.rollback(high_water);
          return env;
        } else if constexpr (std::is_same_v<T, ast::While>) {
          std::size_t iterations = 0;
          while (detail::require_condition(evaluate_expr(node.cond, env, state), "while") != 0) {
            if (iterations >= state.options.max_loop_iterations) {
              throw EvalError(ErrorKind::LoopBoundExceeded,
                              fmt::format("while loop exceeded {} iterations, possible infinite loop",
                                          state.options.max_loop_iterations));
            }
            const std::size_t high_water = state.store.next_address();
            execute_command_seq(node.body, env, state);
            state.store.rollback(high_water);
            ++iterations;
          }
          detail::trace(state, "while finished after {} iterations", iterations);
          return env;
        } else {
          // The closure sees the environment before its own binding.
          Closure closure{std::make_shared<const ast::FunctionDecl>(node), env};
          detail::trace(state, "function {}({})", node.name, fmt::join(node.params, ", "));
          return env.bind(node.name, std::move(closure));
        }
      },
      cmd.node);
}

inline Environment execute_command_seq(const ast::CommandSeq &seq, const Environment &env,
                                       State &state) {
  Environment current = env;
  for (const ast::Command &cmd : seq) {
    current = execute_command(cmd, current, state);
  }
  return current;
}

/// \brief Run `program` from the initial environment with fresh state.
inline RunResult eval_program(const ast::Program &program,
                              const core::EvalOptions &options = {}) {
  RunResult result{initial_environment(), initial_state(options)};
  result.env = execute_command_seq(program, result.env, result.state);
  return result;
}

/// \brief Complexes reachable through store-bound names, ascending by name.
inline std::vector<std::pair<std::string, Complex>> stored_complexes(const RunResult &run) {
  std::vector<std::pair<std::string, Complex>> out;
  for (const auto &[name, value] : run.env.bindings()) {
    if (const auto *loc = std::get_if<Loc>(&value->as_variant())) {
      out.emplace_back(name, run.state.store.access(*loc));
    }
  }
  return out;
}

} // namespace simplicia::lang
