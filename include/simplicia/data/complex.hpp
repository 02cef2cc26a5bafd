#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/core/error.hpp>
#include <simplicia/core/union_find.hpp>

namespace simplicia::data {

using VertexName = std::string;

/// \brief A face: a non-empty set of vertex names.
using Simplex = std::set<VertexName>;
using SimplexSet = std::set<Simplex>;
using VertexUnionFind = core::UnionFind<VertexName>;

/// \brief Ordered `(source, target)` vertex pairs; repeated sources are kept.
using VertexMapping = std::vector<std::pair<VertexName, VertexName>>;

namespace detail {

inline void combinations_recursive(const std::vector<VertexName> &items, std::size_t k,
                                   std::size_t start, std::vector<VertexName> &current,
                                   SimplexSet &out) {
  if (current.size() == k) {
    out.emplace(current.begin(), current.end());
    return;
  }
  for (std::size_t i = start; i + (k - current.size()) <= items.size(); ++i) {
    current.push_back(items[i]);
    combinations_recursive(items, k, i + 1, current, out);
    current.pop_back();
  }
}

} // namespace detail

/**
 * \brief All non-empty faces of `simplex`, the simplex itself included.
 * \param simplex Source simplex.
 * \param out Destination set; faces are inserted, existing content is kept.
 */
inline void collect_faces(const Simplex &simplex, SimplexSet &out) {
  const std::vector<VertexName> items(simplex.begin(), simplex.end());
  std::vector<VertexName> current;
  current.reserve(items.size());
  for (std::size_t k = 1; k <= items.size(); ++k) {
    detail::combinations_recursive(items, k, 0, current, out);
  }
}

/**
 * \brief Immutable simplicial complex with vertex identifications.
 *
 * Stores the maximal simplices and a union-find scoping the identified
 * vertices. Dimension, vertex set and face set are derived on demand.
 */
class Complex {
public:
  Complex() = default;

  Complex(SimplexSet maximal_simplices, VertexUnionFind uf)
      : maximal_(std::move(maximal_simplices)), uf_(std::move(uf)) {
    for (const Simplex &simplex : maximal_) {
      for (const VertexName &v : simplex) {
        uf_.add(v);
      }
    }
  }

  /**
   * \brief One simplex spanned by `vertices`, each vertex its own class.
   *
   * An empty list yields the empty complex.
   * \throws AlgebraError (`DuplicateVertex`) when a name repeats.
   */
  static Complex from_vertices(const std::vector<VertexName> &vertices) {
    VertexUnionFind uf;
    Simplex simplex;
    for (const VertexName &v : vertices) {
      if (!simplex.insert(v).second) {
        throw AlgebraError(ErrorKind::DuplicateVertex,
                           fmt::format("duplicate vertex '{}' in complex literal [{}]", v,
                                       fmt::join(vertices, ", ")));
      }
      uf.add(v);
    }

    SimplexSet maximal;
    if (!simplex.empty()) {
      maximal.insert(std::move(simplex));
    }
    return Complex(std::move(maximal), std::move(uf));
  }

  [[nodiscard]] const SimplexSet &maximal_simplices() const { return maximal_; }

  [[nodiscard]] const VertexUnionFind &uf() const { return uf_; }

  [[nodiscard]] bool empty() const { return maximal_.empty(); }

  /// \brief Largest simplex size minus one, `-1` for the empty complex.
  [[nodiscard]] int dimension() const {
    int dim = -1;
    for (const Simplex &simplex : maximal_) {
      dim = std::max(dim, static_cast<int>(simplex.size()) - 1);
    }
    return dim;
  }

  /// \brief Union of all maximal simplices.
  [[nodiscard]] std::set<VertexName> vertices() const {
    std::set<VertexName> out;
    for (const Simplex &simplex : maximal_) {
      out.insert(simplex.begin(), simplex.end());
    }
    return out;
  }

  [[nodiscard]] bool has_vertex(const VertexName &v) const {
    for (const Simplex &simplex : maximal_) {
      if (simplex.count(v) != 0) {
        return true;
      }
    }
    return false;
  }

  /// \brief Every face of every maximal simplex.
  [[nodiscard]] SimplexSet simplices() const {
    SimplexSet out;
    for (const Simplex &simplex : maximal_) {
      collect_faces(simplex, out);
    }
    return out;
  }

  /// \brief Position of each vertex in a stable (ascending name) enumeration.
  [[nodiscard]] std::map<VertexName, std::size_t> vertex_order() const {
    std::map<VertexName, std::size_t> order;
    std::size_t next = 0;
    for (const VertexName &v : vertices()) {
      order.emplace(v, next++);
    }
    return order;
  }

  [[nodiscard]] VertexUnionFind::Classes classes() const { return uf_.get_classes(); }

  /// \brief Whether `v` and `w` denote the same point in this complex.
  [[nodiscard]] bool identifies(const VertexName &v, const VertexName &w) const {
    return uf_.same_class(v, w);
  }

private:
  SimplexSet maximal_;
  VertexUnionFind uf_;
};

} // namespace simplicia::data
