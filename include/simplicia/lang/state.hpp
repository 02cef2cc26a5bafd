#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <simplicia/core/config.hpp>
#include <simplicia/core/error.hpp>
#include <simplicia/data/complex.hpp>
#include <simplicia/ops/algebra.hpp>

namespace simplicia::lang {

using data::Complex;
using data::VertexName;

// A Loc is an index into the Store.
struct Loc {
  std::size_t addr = 0;

  constexpr bool operator==(const Loc &other) const = default;
};

// Mutable cells holding complex values. Addresses grow monotonically; a block
// may roll the store back to a saved high-water mark, discarding every cell
// allocated after it.
class Store {
public:
  [[nodiscard]] std::size_t size() const { return cells.size(); }

  /// \brief Next address `allocate` will hand out.
  [[nodiscard]] std::size_t next_address() const { return cells.size(); }

  Loc allocate(Complex value) {
    cells.push_back(std::move(value));
    return Loc{cells.size() - 1};
  }

  const Complex &access(Loc loc) const {
    if (loc.addr >= cells.size()) {
      throw EvalError(ErrorKind::UninitializedAddress,
                      fmt::format("address @{} was never allocated", loc.addr));
    }
    return cells[loc.addr];
  }

  void update(Loc loc, Complex value) {
    if (loc.addr >= cells.size()) {
      throw EvalError(ErrorKind::UninitializedAddress,
                      fmt::format("cannot assign to unallocated address @{}", loc.addr));
    }
    cells[loc.addr] = std::move(value);
  }

  // Drop every cell at or above `high_water`. Cells below it keep their
  // (possibly mutated) contents.
  void rollback(std::size_t high_water) {
    if (high_water < cells.size()) {
      cells.resize(high_water);
    }
  }

private:
  std::vector<Complex> cells;
};

/// \brief Everything a run threads from command to command.
struct State {
  Store store;
  /// \brief Declaration index of every registered vertex name.
  ops::VertexOrder vertices_order;
  /// \brief Counter behind `__v<n>` fresh vertex names.
  std::size_t new_vertex_id = 0;
  core::EvalOptions options;
};

/**
 * \brief Register unseen `vertices` at the end of the declaration order.
 *
 * Names already registered keep their index.
 */
inline void ensure_vertices_order(State &state, const std::set<VertexName> &vertices) {
  for (const VertexName &v : vertices) {
    if (state.vertices_order.find(v) == state.vertices_order.end()) {
      const std::size_t next = state.vertices_order.size();
      state.vertices_order.emplace(v, next);
    }
  }
}

/**
 * \brief Synthesize a never-used `__v<n>` name and register it.
 *
 * Candidates already present in the declaration order are skipped.
 */
inline VertexName fresh_vertex(State &state) {
  VertexName candidate = fmt::format("__v{}", state.new_vertex_id++);
  while (state.vertices_order.find(candidate) != state.vertices_order.end()) {
    candidate = fmt::format("__v{}", state.new_vertex_id++);
  }
  const std::size_t next = state.vertices_order.size();
  state.vertices_order.emplace(candidate, next);
  return candidate;
}

} // namespace simplicia::lang
