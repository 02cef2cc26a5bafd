#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <vector>

#include <simplicia/ops/algebra.hpp>
#include <simplicia/ops/homology.hpp>

#include "support/synthetic_complexes.hpp"

using simplicia::data::Complex;
using simplicia::ops::Gf2Matrix;
namespace ops = simplicia::ops;
namespace ts = simplicia::test_support;

static int alternating_betti_sum(const Complex &k) {
  int sum = 0;
  const std::vector<int> betti = ops::compute_homology(k);
  for (std::size_t i = 0; i < betti.size(); ++i) {
    sum += (i % 2 == 0) ? betti[i] : -betti[i];
  }
  return sum;
}

TEST_CASE("GF(2) rank by forward elimination") {
  SUBCASE("Dependent rows over GF(2)") {
    Gf2Matrix m(3, 3);
    m << 1, 1, 0,
         0, 1, 1,
         1, 0, 1;
    CHECK(ops::rank_mod2(m) == 2);
  }

  SUBCASE("Identity needs a row swap to stay full rank") {
    Gf2Matrix m(3, 3);
    m << 0, 1, 0,
         1, 0, 0,
         0, 0, 1;
    CHECK(ops::rank_mod2(m) == 3);
  }

  SUBCASE("Entries are read modulo two") {
    Gf2Matrix m(2, 2);
    m << 2, 1,
         0, 3;
    CHECK(ops::rank_mod2(m) == 1);
  }

  SUBCASE("Empty and zero matrices") {
    CHECK(ops::rank_mod2(Gf2Matrix(0, 4)) == 0);
    CHECK(ops::rank_mod2(Gf2Matrix::Zero(3, 5)) == 0);
  }
}

TEST_CASE("Boundary matrices of the filled triangle") {
  const Complex k = ts::make_filled_triangle();

  const Gf2Matrix d0 = ops::boundary_matrix(k, 0);
  CHECK(d0.rows() == 0);
  CHECK(d0.cols() == 3);

  const Gf2Matrix d1 = ops::boundary_matrix(k, 1);
  CHECK(d1.rows() == 3);
  CHECK(d1.cols() == 3);
  for (Eigen::Index c = 0; c < d1.cols(); ++c) {
    CHECK(d1.col(c).cast<int>().sum() == 2);
  }

  const Gf2Matrix d2 = ops::boundary_matrix(k, 2);
  CHECK(d2.rows() == 3);
  CHECK(d2.cols() == 1);
  CHECK(d2.cast<int>().sum() == 3);

  const Gf2Matrix d3 = ops::boundary_matrix(k, 3);
  CHECK(d3.rows() == 1);
  CHECK(d3.cols() == 0);

  // d1 * d2 = 0 over GF(2).
  const Eigen::MatrixXi product = d1.cast<int>() * d2.cast<int>();
  for (Eigen::Index r = 0; r < product.rows(); ++r) {
    CHECK(product(r, 0) % 2 == 0);
  }
}

TEST_CASE("Hollow and filled triangles") {
  const Complex hollow = ts::make_hollow_triangle();
  CHECK(ops::betti(hollow, 0) == 1);
  CHECK(ops::betti(hollow, 1) == 1);

  const Complex filled = ts::make_filled_triangle();
  CHECK(ops::betti(filled, 0) == 1);
  CHECK(ops::betti(filled, 1) == 0);
  CHECK(ops::betti(filled, 2) == 0);
}

TEST_CASE("Out-of-range degrees give zero") {
  const Complex filled = ts::make_filled_triangle();
  CHECK(ops::betti(filled, -1) == 0);
  CHECK(ops::betti(filled, 3) == 0);
  CHECK(ops::betti(filled, 100) == 0);

  const Complex empty = Complex::from_vertices({});
  CHECK(ops::betti(empty, 0) == 0);
  CHECK(ops::compute_homology(empty).empty());
  CHECK(ops::euler_characteristic(empty) == 0);
}

TEST_CASE("Disconnected points") {
  const Complex k = ops::complex_union(ts::simplex({"a"}), ts::simplex({"b"}));
  CHECK(ops::compute_homology(k) == std::vector<int>{2});
}

TEST_CASE("Standard surfaces") {
  SUBCASE("Circle") {
    const Complex circle = ts::make_circle(6);
    CHECK(ops::compute_homology(circle) == std::vector<int>{1, 1});
    CHECK(ops::euler_characteristic(circle) == 0);
  }

  SUBCASE("Octahedral sphere") {
    const Complex sphere = ts::make_octahedron();
    CHECK(sphere.vertices().size() == 6);
    CHECK(ops::compute_homology(sphere) == std::vector<int>{1, 0, 1});
    CHECK(ops::euler_characteristic(sphere) == 2);
  }

  SUBCASE("Seven-vertex torus") {
    const Complex torus = ts::make_torus();
    CHECK(torus.maximal_simplices().size() == 14);
    CHECK(ops::compute_homology(torus) == std::vector<int>{1, 2, 1});
    CHECK(ops::euler_characteristic(torus) == 0);
  }

  SUBCASE("Cone over a circle is contractible") {
    const Complex cone = ops::join(ts::make_circle(5), ts::simplex({"apex"}));
    CHECK(ops::compute_homology(cone) == std::vector<int>{1, 0, 0});
  }
}

TEST_CASE("Euler characteristic matches the alternating Betti sum") {
  for (const Complex &k : {ts::make_hollow_triangle(), ts::make_filled_triangle(),
                           ts::make_circle(4), ts::make_octahedron(), ts::make_torus()}) {
    CHECK(ops::euler_characteristic(k) == alternating_betti_sum(k));
  }
}

TEST_CASE("Homology sees through glued identifications") {
  const Complex path = ops::complex_union(ts::simplex({"a", "b"}), ts::simplex({"b", "c"}));
  CHECK(ops::compute_homology(path) == std::vector<int>{1, 0});

  const Complex loop =
      ops::glue(path, ts::simplex({"c2", "a2"}), {{"c", "c2"}, {"a", "a2"}});
  CHECK(ops::compute_homology(loop) == std::vector<int>{1, 1});
}
