#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <set>
#include <string>

#include <simplicia/data/complex.hpp>

#include "support/test_env.hpp"

using simplicia::ErrorKind;
using simplicia::data::Complex;
using simplicia::data::Simplex;
using simplicia::test_support::error_kind;

TEST_CASE("A literal simplex spans all of its faces") {
  const Complex k = Complex::from_vertices({"a", "b", "c"});

  CHECK(k.dimension() == 2);
  CHECK(k.vertices() == std::set<std::string>{"a", "b", "c"});
  CHECK(k.maximal_simplices().size() == 1);
  CHECK(k.simplices().size() == 7);
  CHECK(k.simplices().count(Simplex{"a", "c"}) == 1);
  CHECK(k.has_vertex("b"));
  CHECK_FALSE(k.has_vertex("d"));
  CHECK(k.classes().size() == 3);
}

TEST_CASE("A tetrahedron has fifteen faces") {
  const Complex k = Complex::from_vertices({"p", "q", "r", "s"});
  CHECK(k.dimension() == 3);
  CHECK(k.simplices().size() == 15);
}

TEST_CASE("The empty literal is the empty complex") {
  const Complex k = Complex::from_vertices({});
  CHECK(k.empty());
  CHECK(k.dimension() == -1);
  CHECK(k.vertices().empty());
  CHECK(k.simplices().empty());
}

TEST_CASE("Repeated vertices in a literal are rejected") {
  CHECK(error_kind([] { (void)Complex::from_vertices({"a", "b", "a"}); }) ==
        ErrorKind::DuplicateVertex);
}

TEST_CASE("Vertex order enumerates vertices by name") {
  const Complex k = Complex::from_vertices({"c", "a", "b"});
  const auto order = k.vertex_order();
  CHECK(order.at("a") == 0);
  CHECK(order.at("b") == 1);
  CHECK(order.at("c") == 2);
}

TEST_CASE("Constructor registers simplex vertices in the union-find") {
  simplicia::data::VertexUnionFind uf;
  uf.unite("a", "z");
  const Complex k({Simplex{"a", "b"}}, uf);
  CHECK(k.uf().contains("b"));
  CHECK(k.identifies("a", "z"));
  CHECK_FALSE(k.identifies("a", "b"));
  CHECK(k.vertices() == std::set<std::string>{"a", "b"});
}
