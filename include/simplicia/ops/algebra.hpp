#pragma once

#include <cstddef>
#include <map>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/core/error.hpp>
#include <simplicia/data/complex.hpp>

namespace simplicia::ops {

using data::Complex;
using data::Simplex;
using data::SimplexSet;
using data::VertexMapping;
using data::VertexName;
using data::VertexUnionFind;

/// \brief Global declaration index of each registered vertex name.
using VertexOrder = std::map<VertexName, std::size_t>;

/**
 * \brief Image of `simplex` under the identifications of `uf`.
 * \param simplex Source simplex.
 * \param uf Identification structure; unseen vertices are added.
 * \param op Operation name used in the error message.
 * \throws AlgebraError (`DegenerateSimplex`) when two vertices of the simplex
 * land in one class.
 */
inline Simplex canonicalize(const Simplex &simplex, VertexUnionFind &uf, std::string_view op) {
  Simplex canon;
  for (const VertexName &v : simplex) {
    canon.insert(uf.find(v));
  }
  if (canon.size() != simplex.size()) {
    throw AlgebraError(ErrorKind::DegenerateSimplex,
                       fmt::format("{}(): simplex {{{}}} collapsed to {{{}}} after vertex "
                                   "identifications",
                                   op, fmt::join(simplex, ", "), fmt::join(canon, ", ")));
  }
  return canon;
}

/**
 * \brief Require every pair of shared vertices to be identified alike in both
 * complexes.
 * \throws AlgebraError (`IncompatibleIdentification`).
 */
inline void check_shared_identifications(const Complex &k1, const Complex &k2,
                                         std::string_view op) {
  const auto v1 = k1.vertices();
  const auto v2 = k2.vertices();
  std::vector<VertexName> common;
  for (const VertexName &v : v1) {
    if (v2.count(v) != 0) {
      common.push_back(v);
    }
  }

  for (std::size_t i = 0; i < common.size(); ++i) {
    for (std::size_t j = i + 1; j < common.size(); ++j) {
      const VertexName &v = common[i];
      const VertexName &w = common[j];
      const bool eq1 = k1.identifies(v, w);
      const bool eq2 = k2.identifies(v, w);
      if (eq1 != eq2) {
        throw AlgebraError(ErrorKind::IncompatibleIdentification,
                           fmt::format("{}(): '{}' and '{}' are identified in the {} "
                                       "complex but not in the {}",
                                       op, v, w, eq1 ? "first" : "second",
                                       eq1 ? "second" : "first"));
      }
    }
  }
}

/**
 * \brief Union of two complexes.
 *
 * Shared vertices must be identified the same way in both inputs. The result
 * holds the canonical images of every maximal simplex of either input.
 * \throws AlgebraError (`IncompatibleIdentification`, `DegenerateSimplex`).
 */
inline Complex complex_union(const Complex &k1, const Complex &k2) {
  check_shared_identifications(k1, k2, "union");

  VertexUnionFind uf = k1.uf().merge(k2.uf());
  SimplexSet simplices;
  for (const SimplexSet *source : {&k1.maximal_simplices(), &k2.maximal_simplices()}) {
    for (const Simplex &simplex : *source) {
      simplices.insert(canonicalize(simplex, uf, "union"));
    }
  }
  return Complex(std::move(simplices), std::move(uf));
}

/**
 * \brief Glue `k2` onto `k1` by identifying mapped vertex classes.
 *
 * Keys are vertices of `k1`, values vertices of `k2`; any member of a class
 * may stand for the class. The mapping must be a bijection between the
 * classes it touches and must agree with the identifications already present.
 * Vertices shared by both inputs follow the same rule as `complex_union`, so
 * an empty mapping behaves exactly like a union.
 * \throws AlgebraError (`VertexNotFound`, `ConflictingMapping`,
 * `IncompatibleIdentification`, `DegenerateSimplex`).
 */
inline Complex glue(const Complex &k1, const Complex &k2, const VertexMapping &mapping) {
  const VertexUnionFind &uf1 = k1.uf();
  const VertexUnionFind &uf2 = k2.uf();

  for (const auto &[a, b] : mapping) {
    if (!k1.has_vertex(a) && !(uf1.contains(a) && k1.has_vertex(uf1.representative(a)))) {
      throw AlgebraError(ErrorKind::VertexNotFound,
                         fmt::format("glue(): vertex '{}' is not in the first complex", a));
    }
    if (!k2.has_vertex(b) && !(uf2.contains(b) && k2.has_vertex(uf2.representative(b)))) {
      throw AlgebraError(ErrorKind::VertexNotFound,
                         fmt::format("glue(): vertex '{}' is not in the second complex", b));
    }
  }

  std::map<VertexName, VertexName> forward;
  std::map<VertexName, VertexName> backward;
  for (const auto &[a, b] : mapping) {
    const VertexName ra = uf1.representative(a);
    const VertexName rb = uf2.representative(b);

    const auto fwd = forward.find(ra);
    if (fwd != forward.end() && fwd->second != rb) {
      throw AlgebraError(ErrorKind::ConflictingMapping,
                         fmt::format("glue(): class of '{}' is mapped to both '{}' and '{}'",
                                     a, fwd->second, rb));
    }
    const auto bwd = backward.find(rb);
    if (bwd != backward.end() && bwd->second != ra) {
      throw AlgebraError(ErrorKind::ConflictingMapping,
                         fmt::format("glue(): classes '{}' and '{}' are both mapped to '{}'",
                                     bwd->second, ra, b));
    }
    forward.emplace(ra, rb);
    backward.emplace(rb, ra);
  }

  for (std::size_t i = 0; i < mapping.size(); ++i) {
    for (std::size_t j = i + 1; j < mapping.size(); ++j) {
      const auto &[a1, b1] = mapping[i];
      const auto &[a2, b2] = mapping[j];
      const bool eq1 = uf1.same_class(a1, a2);
      const bool eq2 = uf2.same_class(b1, b2);
      if (eq1 != eq2) {
        throw AlgebraError(ErrorKind::IncompatibleIdentification,
                           fmt::format("glue(): '{}' ~ '{}' is {}true in the first complex "
                                       "but '{}' ~ '{}' is {}true in the second",
                                       a1, a2, eq1 ? "" : "not ", b1, b2, eq2 ? "" : "not "));
      }
    }
  }

  check_shared_identifications(k1, k2, "glue");

  VertexUnionFind uf = uf1.merge(uf2);
  for (const auto &[a, b] : mapping) {
    uf.attach(a, b);
  }

  SimplexSet simplices;
  for (const SimplexSet *source : {&k1.maximal_simplices(), &k2.maximal_simplices()}) {
    for (const Simplex &simplex : *source) {
      simplices.insert(canonicalize(simplex, uf, "glue"));
    }
  }
  return Complex(std::move(simplices), std::move(uf));
}

/**
 * \brief Join: every maximal simplex of `k1` spans with every one of `k2`.
 * \throws AlgebraError (`DegenerateSimplex`).
 */
inline Complex join(const Complex &k1, const Complex &k2) {
  VertexUnionFind uf = k1.uf().merge(k2.uf());

  SimplexSet simplices;
  for (const Simplex &s : k1.maximal_simplices()) {
    for (const Simplex &t : k2.maximal_simplices()) {
      Simplex spanned = s;
      spanned.insert(t.begin(), t.end());
      simplices.insert(canonicalize(spanned, uf, "join"));
    }
  }
  return Complex(std::move(simplices), std::move(uf));
}

/**
 * \brief Most recently declared vertex of `c`, as a one-vertex complex.
 *
 * The result keeps the whole identification class of the picked vertex.
 * Vertices absent from `order` lose to every registered vertex; among
 * themselves the lexically greatest wins.
 * \throws AlgebraError (`EmptyComplex`).
 */
inline Complex pick_vertex(const Complex &c, const VertexOrder &order) {
  const auto vertices = c.vertices();
  if (vertices.empty()) {
    throw AlgebraError(ErrorKind::EmptyComplex, "pick_vert(): cannot pick a vertex from an "
                                                "empty complex");
  }

  const auto later = [&](const VertexName &a, const VertexName &b) {
    const auto ia = order.find(a);
    const auto ib = order.find(b);
    if (ia == order.end() || ib == order.end()) {
      if (ia != order.end()) {
        return true;
      }
      if (ib != order.end()) {
        return false;
      }
      return a > b;
    }
    return ia->second > ib->second;
  };

  VertexName picked = *vertices.begin();
  for (const VertexName &v : vertices) {
    if (later(v, picked)) {
      picked = v;
    }
  }

  const VertexName canonical = c.uf().representative(picked);
  VertexUnionFind uf;
  uf.add(canonical);
  for (const VertexName &member : c.uf().class_of(picked)) {
    uf.unite(canonical, member);
  }

  SimplexSet simplices;
  simplices.insert(Simplex{canonical});
  return Complex(std::move(simplices), std::move(uf));
}

/// \brief Number of faces of every dimension.
inline int num_simplices(const Complex &c) { return static_cast<int>(c.simplices().size()); }

inline int num_vertices(const Complex &c) { return static_cast<int>(c.vertices().size()); }

} // namespace simplicia::ops
