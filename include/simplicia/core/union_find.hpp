#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace simplicia::core {

/**
 * \brief Disjoint-set forest with union-by-rank and path compression.
 *
 * `T` must be totally ordered. Every element ever referenced through `add`,
 * `find` or `unite` stays in the structure for its lifetime.
 */
template <typename T> class UnionFind {
public:
  using value_type = T;
  using Classes = std::map<T, std::set<T>>;

  /// \brief Insert `x` as a singleton class. No-op if already present.
  void add(const T &x) {
    if (parent_.find(x) == parent_.end()) {
      parent_.emplace(x, x);
      rank_.emplace(x, 0);
    }
  }

  [[nodiscard]] bool contains(const T &x) const { return parent_.find(x) != parent_.end(); }

  [[nodiscard]] std::size_t size() const { return parent_.size(); }

  [[nodiscard]] bool empty() const { return parent_.empty(); }

  /**
   * \brief Canonical representative of `x`, adding `x` when unseen.
   *
   * Compresses the path from `x` to its root.
   */
  T find(const T &x) {
    add(x);

    T root = x;
    while (true) {
      const T &next = parent_.at(root);
      if (next == root) {
        break;
      }
      root = next;
    }

    T cursor = x;
    while (!(cursor == root)) {
      T &slot = parent_.at(cursor);
      T next = slot;
      slot = root;
      cursor = next;
    }
    return root;
  }

  /**
   * \brief Representative of `x` without modifying the forest.
   * \return `x` itself when it was never added.
   */
  [[nodiscard]] T representative(const T &x) const {
    auto it = parent_.find(x);
    if (it == parent_.end()) {
      return x;
    }
    T root = x;
    while (!(it->second == root)) {
      root = it->second;
      it = parent_.find(root);
    }
    return root;
  }

  /// \brief Whether `x` and `y` lie in the same class.
  [[nodiscard]] bool same_class(const T &x, const T &y) const {
    return representative(x) == representative(y);
  }

  /**
   * \brief Merge the classes of `x` and `y` by rank.
   * \return Representative of the merged class.
   */
  T unite(const T &x, const T &y) {
    const T rx = find(x);
    const T ry = find(y);
    if (rx == ry) {
      return rx;
    }

    int &rank_x = rank_.at(rx);
    int &rank_y = rank_.at(ry);
    if (rank_x < rank_y) {
      parent_.at(rx) = ry;
      return ry;
    }
    if (rank_x > rank_y) {
      parent_.at(ry) = rx;
      return rx;
    }
    parent_.at(ry) = rx;
    ++rank_x;
    return rx;
  }

  /// \brief Representative to members, over every element in the structure.
  [[nodiscard]] Classes get_classes() const {
    Classes out;
    for (const auto &entry : parent_) {
      out[representative(entry.first)].insert(entry.first);
    }
    return out;
  }

  /// \brief Members of the class containing `x` (just `{x}` when unseen).
  [[nodiscard]] std::set<T> class_of(const T &x) const {
    const T rep = representative(x);
    std::set<T> out;
    for (const auto &entry : parent_) {
      if (representative(entry.first) == rep) {
        out.insert(entry.first);
      }
    }
    if (out.empty()) {
      out.insert(x);
    }
    return out;
  }

  /// \brief Every element, in ascending order.
  [[nodiscard]] std::vector<T> elements() const {
    std::vector<T> out;
    out.reserve(parent_.size());
    for (const auto &entry : parent_) {
      out.push_back(entry.first);
    }
    return out;
  }

  /**
   * \brief Merge the class of `other` into the class of `keep`.
   *
   * Unlike `unite`, the root of `keep` always stays the representative.
   * \return Representative of the merged class.
   */
  T attach(const T &keep, const T &other) {
    const T rk = find(keep);
    const T ro = find(other);
    if (rk == ro) {
      return rk;
    }
    parent_.at(ro) = rk;
    int &rank_k = rank_.at(rk);
    rank_k = std::max(rank_k, rank_.at(ro) + 1);
    return rk;
  }

  /**
   * \brief Union of two partitions.
   *
   * The result holds every element of both inputs and relates two elements
   * iff they are connected by a chain of relations taken from either input.
   * Every class of the result that contains an element of this structure is
   * represented by one of this structure's representatives. Classes made only
   * of `other`'s elements keep `other`'s representative.
   */
  [[nodiscard]] UnionFind merge(const UnionFind &other) const {
    UnionFind out;
    for (const auto &entry : parent_) {
      out.add(entry.first);
    }
    for (const auto &entry : other.parent_) {
      out.add(entry.first);
    }

    for (const auto &entry : parent_) {
      out.attach(representative(entry.first), entry.first);
    }
    for (const auto &entry : other.parent_) {
      const T root = out.find(entry.first);
      const T other_root = out.find(other.representative(entry.first));
      if (contains(root) && !contains(other_root)) {
        out.attach(root, other_root);
      } else {
        out.attach(other_root, root);
      }
    }
    return out;
  }

private:
  std::map<T, T> parent_;
  std::map<T, int> rank_;
};

} // namespace simplicia::core
