#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/core/error.hpp>
#include <simplicia/data/complex.hpp>
#include <simplicia/lang/ast.hpp>
#include <simplicia/lang/state.hpp>
#include <simplicia/ops/algebra.hpp>

namespace simplicia::lang {

/// \brief Argument and result shapes declared by an operator.
enum class Shape { Complex, Integer };

inline const char *to_string(Shape shape) {
  return shape == Shape::Complex ? "complex" : "int";
}

/// \brief `union`, `join`, `glue`, `pick_vert`: produce a complex.
struct ConstructiveOperator {
  using FoldFn = Complex (*)(const Complex &, const Complex &);
  using GlueFn = Complex (*)(const Complex &, const Complex &, const data::VertexMapping &);
  using PickFn = Complex (*)(const Complex &, const ops::VertexOrder &);

  std::string name;
  std::variant<FoldFn, GlueFn, PickFn> fn;
  std::vector<Shape> arg_shapes;
  Shape result = Shape::Complex;
};

/// \brief `dim`, `num_vert`, `num_simp`, `euler`, `betti`: measure a complex.
struct ObservationalOperator {
  using MeasureFn = int (*)(const Complex &);
  using DegreeFn = int (*)(const Complex &, int);

  std::string name;
  std::variant<MeasureFn, DegreeFn> fn;
  std::vector<Shape> arg_shapes;
  Shape result = Shape::Integer;
};

/// \brief Integer arithmetic, comparison and logic.
struct ArithmeticOperator {
  using UnaryFn = std::int64_t (*)(std::int64_t);
  using BinaryFn = std::int64_t (*)(std::int64_t, std::int64_t);

  std::string name;
  std::variant<UnaryFn, BinaryFn> fn;
  std::vector<Shape> arg_shapes;
  Shape result = Shape::Integer;
};

using Operator = std::variant<ConstructiveOperator, ObservationalOperator, ArithmeticOperator>;

inline const std::string &operator_name(const Operator &op) {
  return std::visit([](const auto &o) -> const std::string & { return o.name; }, op);
}

struct RawVertex {
  VertexName name;
};

struct DVal;
struct EnvNode;

/**
 * \brief Persistent identifier-to-value map.
 *
 * `bind` returns a new environment that shares every older binding with its
 * parent, so scopes snapshot in O(1) and a parent never observes a child's
 * bindings. Newer bindings shadow older ones.
 */
class Environment {
public:
  [[nodiscard]] Environment bind(std::string name, DVal value) const;

  /// \brief Bound value or `nullptr`.
  [[nodiscard]] const DVal *find(const std::string &name) const;

  [[nodiscard]] bool contains(const std::string &name) const { return find(name) != nullptr; }

  /// \brief Visible bindings (shadowed ones omitted), ascending by name.
  [[nodiscard]] std::vector<std::pair<std::string, const DVal *>> bindings() const;

private:
  std::shared_ptr<const EnvNode> head_;
};

/// \brief A function value with the environment of its declaration.
struct Closure {
  std::shared_ptr<const ast::FunctionDecl> function;
  Environment env;
};

/// \brief Expression values.
using EVal = std::variant<Complex, std::int64_t, bool, Closure>;

/// \brief Denotable values: anything an identifier can be bound to.
struct DVal : std::variant<Loc, RawVertex, Complex, std::int64_t, bool, Closure, Operator> {
  using Base = std::variant<Loc, RawVertex, Complex, std::int64_t, bool, Closure, Operator>;
  using Base::Base;

  [[nodiscard]] const Base &as_variant() const { return *this; }
};

struct EnvNode {
  std::string name;
  DVal value;
  std::shared_ptr<const EnvNode> next;
};

inline Environment Environment::bind(std::string name, DVal value) const {
  Environment out;
  out.head_ = std::make_shared<const EnvNode>(EnvNode{std::move(name), std::move(value), head_});
  return out;
}

inline const DVal *Environment::find(const std::string &name) const {
  for (const EnvNode *node = head_.get(); node != nullptr; node = node->next.get()) {
    if (node->name == name) {
      return &node->value;
    }
  }
  return nullptr;
}

inline std::vector<std::pair<std::string, const DVal *>> Environment::bindings() const {
  std::map<std::string, const DVal *> visible;
  for (const EnvNode *node = head_.get(); node != nullptr; node = node->next.get()) {
    visible.emplace(node->name, &node->value);
  }
  return {visible.begin(), visible.end()};
}

/**
 * \brief Value bound to `name`.
 * \throws EvalError (`UnboundIdentifier`).
 */
inline const DVal &lookup(const Environment &env, const std::string &name) {
  const DVal *value = env.find(name);
  if (value == nullptr) {
    throw EvalError(ErrorKind::UnboundIdentifier,
                    fmt::format("identifier '{}' not found in environment", name));
  }
  return *value;
}

/// \brief Kind name of an expression value, for diagnostics.
inline const char *kind_name(const EVal &value) {
  return std::visit(
      [](const auto &v) -> const char * {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Complex>) {
          return "complex";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return "int";
        } else if constexpr (std::is_same_v<T, bool>) {
          return "bool";
        } else {
          return "function";
        }
      },
      value);
}

/// \brief One-line rendering of a denotable value, e.g. `@3` or `op union`.
inline std::string describe(const DVal &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Loc>) {
          return fmt::format("@{}", v.addr);
        } else if constexpr (std::is_same_v<T, RawVertex>) {
          return fmt::format("vertex {}", v.name);
        } else if constexpr (std::is_same_v<T, Complex>) {
          return fmt::format("complex (dim {})", v.dimension());
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Closure>) {
          return fmt::format("function {}({})", v.function->name,
                             fmt::join(v.function->params, ", "));
        } else {
          return fmt::format("op {}", operator_name(v));
        }
      },
      value.as_variant());
}

} // namespace simplicia::lang
