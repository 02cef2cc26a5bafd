#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/core/error.hpp>
#include <simplicia/lang/state.hpp>
#include <simplicia/lang/value.hpp>
#include <simplicia/ops/algebra.hpp>
#include <simplicia/ops/homology.hpp>

namespace simplicia::lang {

namespace arith {

// Two's-complement wraparound on overflow.
inline std::int64_t add(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}
inline std::int64_t sub(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}
inline std::int64_t mul(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
}
inline std::int64_t land(std::int64_t a, std::int64_t b) { return (a != 0 && b != 0) ? 1 : 0; }
inline std::int64_t lor(std::int64_t a, std::int64_t b) { return (a != 0 || b != 0) ? 1 : 0; }
inline std::int64_t lnot(std::int64_t a) { return a == 0 ? 1 : 0; }
inline std::int64_t greater(std::int64_t a, std::int64_t b) { return a > b ? 1 : 0; }
inline std::int64_t less(std::int64_t a, std::int64_t b) { return a < b ? 1 : 0; }
inline std::int64_t leq(std::int64_t a, std::int64_t b) { return a <= b ? 1 : 0; }
inline std::int64_t geq(std::int64_t a, std::int64_t b) { return a >= b ? 1 : 0; }

} // namespace arith

namespace detail {

inline int dimension_of(const Complex &c) { return c.dimension(); }

inline void reject_mapping(const std::string &name, const std::optional<data::VertexMapping> &mapping) {
  if (mapping.has_value()) {
    throw EvalError(ErrorKind::MappingMisuse, fmt::format("{} does not accept a mapping", name));
  }
}

inline void require_arity(const std::string &name, const std::vector<EVal> &args,
                          std::size_t expected) {
  if (args.size() != expected) {
    throw EvalError(ErrorKind::ArityMismatch,
                    fmt::format("{} expects {} argument{}, got {}", name, expected,
                                expected == 1 ? "" : "s", args.size()));
  }
}

inline const Complex &require_complex(const std::string &name, const EVal &arg, std::size_t index) {
  const Complex *c = std::get_if<Complex>(&arg);
  if (c == nullptr) {
    throw EvalError(ErrorKind::TypeMismatch,
                    fmt::format("{} expects a complex as argument {}, got {}", name, index + 1,
                                kind_name(arg)));
  }
  return *c;
}

} // namespace detail

/// \brief Integer view of a scalar; booleans read as `0`/`1`.
inline std::optional<std::int64_t> as_integer(const EVal &value) {
  if (const auto *i = std::get_if<std::int64_t>(&value)) {
    return *i;
  }
  if (const auto *b = std::get_if<bool>(&value)) {
    return *b ? 1 : 0;
  }
  return std::nullopt;
}

/**
 * \brief Apply a constructive operator.
 *
 * `glue` needs a mapping and exactly two complexes, `pick_vert` exactly one
 * complex. Folding operators take one or more complexes and combine them
 * left to right.
 */
inline EVal apply(const ConstructiveOperator &op, const std::vector<EVal> &args,
                  const std::optional<data::VertexMapping> &mapping, const State &state) {
  using Fold = ConstructiveOperator::FoldFn;
  using Glue = ConstructiveOperator::GlueFn;

  return std::visit(
      [&](auto fn) -> EVal {
        using Fn = decltype(fn);
        if constexpr (std::is_same_v<Fn, Glue>) {
          if (!mapping.has_value()) {
            throw EvalError(ErrorKind::MappingMisuse, fmt::format("{} requires a mapping", op.name));
          }
          detail::require_arity(op.name, args, 2);
          return fn(detail::require_complex(op.name, args[0], 0),
                    detail::require_complex(op.name, args[1], 1), *mapping);
        } else if constexpr (std::is_same_v<Fn, Fold>) {
          detail::reject_mapping(op.name, mapping);
          if (args.empty()) {
            throw EvalError(ErrorKind::ArityMismatch,
                            fmt::format("{} expects at least one argument", op.name));
          }
          Complex acc = detail::require_complex(op.name, args[0], 0);
          for (std::size_t i = 1; i < args.size(); ++i) {
            acc = fn(acc, detail::require_complex(op.name, args[i], i));
          }
          return acc;
        } else {
          detail::reject_mapping(op.name, mapping);
          detail::require_arity(op.name, args, 1);
          return fn(detail::require_complex(op.name, args[0], 0), state.vertices_order);
        }
      },
      op.fn);
}

/// \brief Apply an observational operator to one complex (plus a degree for `betti`).
inline EVal apply(const ObservationalOperator &op, const std::vector<EVal> &args,
                  const std::optional<data::VertexMapping> &mapping, const State &) {
  detail::reject_mapping(op.name, mapping);

  return std::visit(
      [&](auto fn) -> EVal {
        using Fn = decltype(fn);
        if constexpr (std::is_same_v<Fn, ObservationalOperator::DegreeFn>) {
          detail::require_arity(op.name, args, 2);
          const Complex &c = detail::require_complex(op.name, args[0], 0);
          const auto degree = as_integer(args[1]);
          if (!degree.has_value()) {
            throw EvalError(ErrorKind::TypeMismatch,
                            fmt::format("{} expects an int as argument 2, got {}", op.name,
                                        kind_name(args[1])));
          }
          // Out-of-range degrees are 0, checked before narrowing to int.
          if (*degree < 0 || *degree > c.dimension()) {
            return std::int64_t{0};
          }
          return static_cast<std::int64_t>(fn(c, static_cast<int>(*degree)));
        } else {
          detail::require_arity(op.name, args, 1);
          return static_cast<std::int64_t>(fn(detail::require_complex(op.name, args[0], 0)));
        }
      },
      op.fn);
}

/// \brief Apply an integer operator; arity is fixed by its declared shapes.
inline EVal apply(const ArithmeticOperator &op, const std::vector<EVal> &args,
                  const std::optional<data::VertexMapping> &mapping, const State &) {
  detail::reject_mapping(op.name, mapping);
  detail::require_arity(op.name, args, op.arg_shapes.size());

  std::vector<std::int64_t> ints;
  ints.reserve(args.size());
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto value = as_integer(args[i]);
    if (!value.has_value()) {
      throw EvalError(ErrorKind::TypeMismatch,
                      fmt::format("{} expects int arguments, argument {} is a {}", op.name, i + 1,
                                  kind_name(args[i])));
    }
    ints.push_back(*value);
  }

  return std::visit(
      [&](auto fn) -> EVal {
        using Fn = decltype(fn);
        if constexpr (std::is_same_v<Fn, ArithmeticOperator::UnaryFn>) {
          return fn(ints[0]);
        } else {
          return fn(ints[0], ints[1]);
        }
      },
      op.fn);
}

inline EVal apply(const Operator &op, const std::vector<EVal> &args,
                  const std::optional<data::VertexMapping> &mapping, const State &state) {
  return std::visit([&](const auto &o) { return apply(o, args, mapping, state); }, op);
}

/// \brief Every built-in operator, in binding order.
inline std::vector<Operator> builtin_operators() {
  using C = ConstructiveOperator;
  using O = ObservationalOperator;
  using A = ArithmeticOperator;
  const std::vector<Shape> cc = {Shape::Complex, Shape::Complex};
  const std::vector<Shape> c = {Shape::Complex};
  const std::vector<Shape> ii = {Shape::Integer, Shape::Integer};
  const std::vector<Shape> i = {Shape::Integer};

  return {
      C{"union", C::FoldFn{&ops::complex_union}, cc},
      C{"join", C::FoldFn{&ops::join}, cc},
      C{"glue", C::GlueFn{&ops::glue}, cc},
      C{"pick_vert", C::PickFn{&ops::pick_vertex}, c},

      O{"dim", O::MeasureFn{&detail::dimension_of}, c},
      O{"num_vert", O::MeasureFn{&ops::num_vertices}, c},
      O{"num_simp", O::MeasureFn{&ops::num_simplices}, c},
      O{"euler", O::MeasureFn{&ops::euler_characteristic}, c},
      O{"betti", O::DegreeFn{&ops::betti}, {Shape::Complex, Shape::Integer}},

      A{"add", A::BinaryFn{&arith::add}, ii},
      A{"sub", A::BinaryFn{&arith::sub}, ii},
      A{"mul", A::BinaryFn{&arith::mul}, ii},
      A{"and", A::BinaryFn{&arith::land}, ii},
      A{"or", A::BinaryFn{&arith::lor}, ii},
      A{"not", A::UnaryFn{&arith::lnot}, i},
      A{"greater", A::BinaryFn{&arith::greater}, ii},
      A{"less", A::BinaryFn{&arith::less}, ii},
      A{"leq", A::BinaryFn{&arith::leq}, ii},
      A{"geq", A::BinaryFn{&arith::geq}, ii},
  };
}

inline std::set<std::string> builtin_operator_names() {
  std::set<std::string> names;
  for (const Operator &op : builtin_operators()) {
    names.insert(operator_name(op));
  }
  return names;
}

/// \brief `name(shape, ...) -> shape`, for diagnostics and listings.
inline std::string signature(const Operator &op) {
  return std::visit(
      [](const auto &o) {
        std::vector<std::string> shapes;
        for (Shape s : o.arg_shapes) {
          shapes.emplace_back(to_string(s));
        }
        return fmt::format("{}({}) -> {}", o.name, fmt::join(shapes, ", "), to_string(o.result));
      },
      op);
}

} // namespace simplicia::lang
