#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include <simplicia/data/complex.hpp>

namespace simplicia::ops {

/// \brief Dense matrix over GF(2); every entry is `0` or `1`.
using Gf2Matrix = Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic>;

/// \brief Faces bucketed by dimension (`|face| - 1`).
using SkeletonMap = std::map<int, std::vector<data::Simplex>>;

/**
 * \brief Every face of `complex`, grouped by dimension.
 *
 * Within a bucket, faces follow the ascending order of `data::SimplexSet`.
 */
inline SkeletonMap skeleton_map(const data::Complex &complex) {
  SkeletonMap skeleton;
  for (const data::Simplex &face : complex.simplices()) {
    skeleton[static_cast<int>(face.size()) - 1].push_back(face);
  }
  return skeleton;
}

inline std::vector<data::Simplex> k_simplices(const SkeletonMap &skeleton, int k) {
  const auto it = skeleton.find(k);
  if (it == skeleton.end()) {
    return {};
  }
  return it->second;
}

inline std::vector<data::Simplex> k_simplices(const data::Complex &complex, int k) {
  return k_simplices(skeleton_map(complex), k);
}

/**
 * \brief Vertices of `simplex` sorted by the complex-wide `order`.
 */
inline std::vector<data::VertexName>
ordered(const data::Simplex &simplex, const std::map<data::VertexName, std::size_t> &order) {
  std::vector<std::pair<std::size_t, data::VertexName>> keyed;
  keyed.reserve(simplex.size());
  for (const data::VertexName &v : simplex) {
    const auto it = order.find(v);
    keyed.emplace_back(it == order.end() ? order.size() : it->second, v);
  }
  std::sort(keyed.begin(), keyed.end());

  std::vector<data::VertexName> out;
  out.reserve(keyed.size());
  for (auto &entry : keyed) {
    out.push_back(std::move(entry.second));
  }
  return out;
}

/**
 * \brief Boundary matrix `d_k : C_k -> C_{k-1}` over GF(2).
 *
 * Rows index `(k-1)`-faces and columns index `k`-faces, both in skeleton
 * order. Entries accumulate by XOR.
 * \param skeleton Faces by dimension of one complex.
 * \param order Fixed vertex ordering of that complex.
 * \param k Degree; `k <= 0` yields a matrix with no rows.
 */
inline Gf2Matrix boundary_matrix(const SkeletonMap &skeleton,
                                 const std::map<data::VertexName, std::size_t> &order, int k) {
  const std::vector<data::Simplex> cols = k_simplices(skeleton, k);
  const std::vector<data::Simplex> rows = k <= 0 ? std::vector<data::Simplex>{}
                                                 : k_simplices(skeleton, k - 1);

  std::map<data::Simplex, Eigen::Index> row_index;
  for (std::size_t r = 0; r < rows.size(); ++r) {
    row_index.emplace(rows[r], static_cast<Eigen::Index>(r));
  }

  Gf2Matrix m = Gf2Matrix::Zero(static_cast<Eigen::Index>(rows.size()),
                                static_cast<Eigen::Index>(cols.size()));
  if (rows.empty()) {
    return m;
  }

  for (std::size_t c = 0; c < cols.size(); ++c) {
    const std::vector<data::VertexName> verts = ordered(cols[c], order);
    for (std::size_t i = 0; i < verts.size(); ++i) {
      data::Simplex face;
      for (std::size_t j = 0; j < verts.size(); ++j) {
        if (j != i) {
          face.insert(verts[j]);
        }
      }
      const auto it = row_index.find(face);
      if (it != row_index.end()) {
        m(it->second, static_cast<Eigen::Index>(c)) ^= 1;
      }
    }
  }
  return m;
}

inline Gf2Matrix boundary_matrix(const data::Complex &complex, int k) {
  return boundary_matrix(skeleton_map(complex), complex.vertex_order(), k);
}

/**
 * \brief Rank over GF(2) by forward elimination with row swaps.
 * \param m Matrix with entries read modulo 2; taken by value and reduced in place.
 */
inline int rank_mod2(Gf2Matrix m) {
  const Eigen::Index rows = m.rows();
  const Eigen::Index cols = m.cols();
  for (Eigen::Index r = 0; r < rows; ++r) {
    for (Eigen::Index c = 0; c < cols; ++c) {
      m(r, c) &= 1;
    }
  }

  Eigen::Index rank = 0;
  for (Eigen::Index col = 0; col < cols && rank < rows; ++col) {
    Eigen::Index pivot = -1;
    for (Eigen::Index r = rank; r < rows; ++r) {
      if (m(r, col) != 0) {
        pivot = r;
        break;
      }
    }
    if (pivot < 0) {
      continue;
    }

    if (pivot != rank) {
      m.row(pivot).swap(m.row(rank));
    }
    for (Eigen::Index r = rank + 1; r < rows; ++r) {
      if (m(r, col) == 0) {
        continue;
      }
      for (Eigen::Index c = col; c < cols; ++c) {
        m(r, c) ^= m(rank, c);
      }
    }
    ++rank;
  }
  return static_cast<int>(rank);
}

/**
 * \brief Betti number `b_k` over GF(2).
 *
 * `b_k = (#k-faces - rank d_k) - rank d_{k+1}` with `d_0 = 0` and
 * `d_j = 0` for `j > dim`. Degrees outside `[0, dim]` give `0`.
 */
inline int betti(const data::Complex &complex, int k) {
  const int dim = complex.dimension();
  if (k < 0 || k > dim) {
    return 0;
  }

  const SkeletonMap skeleton = skeleton_map(complex);
  const auto order = complex.vertex_order();

  const int faces_k = static_cast<int>(k_simplices(skeleton, k).size());
  const int rank_dk = k == 0 ? 0 : rank_mod2(boundary_matrix(skeleton, order, k));
  const int rank_dk1 = k + 1 > dim ? 0 : rank_mod2(boundary_matrix(skeleton, order, k + 1));
  return (faces_k - rank_dk) - rank_dk1;
}

/// \brief Betti numbers for degrees `0..dim`; empty for the empty complex.
inline std::vector<int> compute_homology(const data::Complex &complex) {
  const int dim = complex.dimension();
  const SkeletonMap skeleton = skeleton_map(complex);
  const auto order = complex.vertex_order();

  std::vector<int> ranks;
  ranks.reserve(static_cast<std::size_t>(dim + 2));
  for (int k = 0; k <= dim + 1; ++k) {
    ranks.push_back(k == 0 ? 0 : rank_mod2(boundary_matrix(skeleton, order, k)));
  }

  std::vector<int> out;
  out.reserve(static_cast<std::size_t>(dim + 1));
  for (int k = 0; k <= dim; ++k) {
    const int faces_k = static_cast<int>(k_simplices(skeleton, k).size());
    out.push_back(faces_k - ranks[static_cast<std::size_t>(k)] -
                  ranks[static_cast<std::size_t>(k + 1)]);
  }
  return out;
}

/// \brief Alternating sum of face counts by dimension.
inline int euler_characteristic(const data::Complex &complex) {
  int chi = 0;
  for (const auto &[dim, faces] : skeleton_map(complex)) {
    const int count = static_cast<int>(faces.size());
    chi += (dim % 2 == 0) ? count : -count;
  }
  return chi;
}

} // namespace simplicia::ops
