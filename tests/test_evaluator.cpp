#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <set>
#include <string>
#include <variant>

#include <simplicia/lang/evaluator.hpp>

#include "support/test_env.hpp"

using simplicia::ErrorKind;
using simplicia::data::Complex;
using simplicia::data::Simplex;
using simplicia::data::SimplexSet;
using simplicia::test_support::error_kind;
using simplicia::test_support::observe;
using simplicia::test_support::run_source;
using simplicia::test_support::stored;
namespace lang = simplicia::lang;
namespace ast = simplicia::lang::ast;

using Names = std::set<std::string>;

static std::optional<ErrorKind> run_error(const char *source,
                                          const simplicia::core::EvalOptions &options = {}) {
  return error_kind([&] { (void)run_source(source, options); });
}

TEST_CASE("Declared complexes round-trip through observers") {
  const auto run = run_source("complex K = [a, b, c]");
  CHECK(observe(run, "dim(K)") == 2);
  CHECK(observe(run, "num_vert(K)") == 3);
  CHECK(observe(run, "num_simp(K)") == 7);
  CHECK(observe(run, "euler(K)") == 1);
  CHECK(observe(run, "betti(K, 0)") == 1);
}

TEST_CASE("betti outside the int range is zero") {
  const auto run = run_source("complex K = [a, b, c]");
  CHECK(observe(run, "betti(K, 4294967296)") == 0);
  CHECK(observe(run, "betti(K, -4294967295)") == 0);
  CHECK(observe(run, "betti(K, 3)") == 0);
  CHECK(observe(run, "betti(K, -1)") == 0);
}

TEST_CASE("Union and glue scenarios") {
  SUBCASE("Union") {
    const auto run = run_source(R"(
      complex K = [a, b, c]
      complex L = [c, d]
      complex U = union(K, L)
    )");
    const Complex u = stored(run, "U");
    CHECK(u.dimension() == 2);
    CHECK(u.vertices() == Names{"a", "b", "c", "d"});
    CHECK(u.maximal_simplices() == SimplexSet{Simplex{"a", "b", "c"}, Simplex{"c", "d"}});
  }

  SUBCASE("Glue") {
    const auto run = run_source(R"(
      complex K = [a, b, c]
      complex L = [d, e]
      complex G = glue(K, L) mapping { c -> d }
    )");
    const Complex g = stored(run, "G");
    CHECK(g.classes().size() == 4);
    CHECK(g.identifies("c", "d"));
    CHECK(g.maximal_simplices() == SimplexSet{Simplex{"a", "b", "c"}, Simplex{"c", "e"}});
  }

  SUBCASE("Non-injective glue") {
    CHECK(run_error(R"(
      complex K = [a, b, c]
      complex L = [d, e]
      complex G = glue(K, L) mapping { a -> d, b -> d }
    )") == ErrorKind::ConflictingMapping);
  }
}

TEST_CASE("Folding operators accept one or more complexes") {
  const auto run = run_source(R"(
    complex A = union([a], [b], [c])
    complex B = union([x, y])
    complex C = join([p], [q], [r])
  )");
  CHECK(observe(run, "num_vert(A)") == 3);
  CHECK(stored(run, "B").maximal_simplices() == SimplexSet{Simplex{"x", "y"}});
  CHECK(observe(run, "dim(C)") == 2);
}

TEST_CASE("Conditional branches roll back allocations but keep assignments") {
  const auto run = run_source(R"(
    complex K = [a, b]
    if 1 then
      complex Tmp = [x]
      K <- union(K, [c])
    else
      K <- [z]
    endif
    complex M = [m]
  )");

  CHECK(stored(run, "K").vertices() == Names{"a", "b", "c"});
  CHECK(error_kind([&] { (void)lang::lookup(run.env, "Tmp"); }) == ErrorKind::UnboundIdentifier);

  // The address used by Tmp is handed out again.
  const auto &m = std::get<lang::Loc>(lang::lookup(run.env, "M").as_variant());
  CHECK(m.addr == 1);
  CHECK(run.state.store.size() == 2);
}

TEST_CASE("Else branch runs on a zero condition") {
  const auto run = run_source(R"(
    complex K = [a]
    if sub(dim(K), 0) then
      K <- [t]
    else
      K <- [e]
    endif
  )");
  CHECK(stored(run, "K").vertices() == Names{"e"});
}

TEST_CASE("Booleans act as integers in conditions and arithmetic") {
  const auto run = run_source(R"(
    complex K = [a]
    if true then K <- [b] endif
    if false then K <- [c] endif
  )");
  CHECK(stored(run, "K").vertices() == Names{"b"});
  CHECK(observe(run, "add(true, 2)") == 3);
  CHECK(observe(run, "and(true, 0)") == 0);
}

TEST_CASE("Arithmetic and comparison operators") {
  const auto run = run_source("");
  CHECK(observe(run, "add(2, mul(3, 4))") == 14);
  CHECK(observe(run, "sub(2, 5)") == -3);
  CHECK(observe(run, "and(3, 1)") == 1);
  CHECK(observe(run, "or(0, 0)") == 0);
  CHECK(observe(run, "not(0)") == 1);
  CHECK(observe(run, "greater(3, 2)") == 1);
  CHECK(observe(run, "less(3, 2)") == 0);
  CHECK(observe(run, "leq(2, 2)") == 1);
  CHECK(observe(run, "geq(1, 2)") == 0);
}

TEST_CASE("While loops thread state and drop per-iteration allocations") {
  const auto run = run_source(R"(
    complex Acc = [s]
    while less(num_vert(Acc), 4) do
      vertex n
      complex Scratch = [n]
      Acc <- join(Acc, Scratch)
    endwhile
  )");
  CHECK(observe(run, "num_vert(Acc)") == 4);
  CHECK(observe(run, "dim(Acc)") == 3);
  CHECK(run.state.store.size() == 1);
  CHECK(run.state.new_vertex_id == 3);
}

TEST_CASE("Loops past the iteration ceiling fail") {
  simplicia::core::EvalOptions options;
  options.max_loop_iterations = 5;

  CHECK(run_error("while 1 do endwhile", options) == ErrorKind::LoopBoundExceeded);

  // Exactly at the ceiling is fine.
  const auto run = run_source(R"(
    complex Acc = [s]
    while less(num_vert(Acc), 6) do
      vertex n
      Acc <- join(Acc, [n])
    endwhile
  )",
                              options);
  CHECK(observe(run, "num_vert(Acc)") == 6);
}

TEST_CASE("Vertex declarations bind fresh names") {
  const auto run = run_source(R"(
    complex K = [__v0]
    vertex v
    vertex w
    complex L = [v, a]
    complex P = w
  )");
  const auto &v = std::get<lang::RawVertex>(lang::lookup(run.env, "v").as_variant());
  const auto &w = std::get<lang::RawVertex>(lang::lookup(run.env, "w").as_variant());
  CHECK(v.name == "__v1");
  CHECK(w.name == "__v2");
  CHECK(stored(run, "L").vertices() == Names{"__v1", "a"});
  CHECK(stored(run, "P").vertices() == Names{"__v2"});
  CHECK(run.state.vertices_order.at("__v0") < run.state.vertices_order.at("__v1"));
}

TEST_CASE("pick_vert uses the declaration order") {
  const auto run = run_source(R"(
    complex A = [p, q]
    complex B = [r]
    complex U = union(B, A)
    complex P = pick_vert(U)
    complex Q = pick_vert(union(A, [zz]))
  )");
  CHECK(stored(run, "P").vertices() == Names{"r"});
  CHECK(stored(run, "Q").vertices() == Names{"q"});
  CHECK(run_error("complex E = []\ncomplex P = pick_vert(E)") == ErrorKind::EmptyComplex);
}

TEST_CASE("Functions close over their defining environment") {
  SUBCASE("Arguments are bound lexically") {
    const auto run = run_source(R"(
      function cone(K, apex) = join(K, apex)
      complex C = cone([a, b], [t])
    )");
    CHECK(observe(run, "dim(C)") == 2);
  }

  SUBCASE("Names bound after the declaration are invisible") {
    CHECK(run_error(R"(
      function f(K) = union(K, Later)
      complex Later = [l]
      complex X = f([a])
    )") == ErrorKind::UnboundIdentifier);
  }

  SUBCASE("Captured addresses observe later assignments") {
    const auto run = run_source(R"(
      complex K = [a]
      function current() = K
      K <- [b]
      complex M = current()
    )");
    CHECK(stored(run, "M").vertices() == Names{"b"});
  }

  SUBCASE("Function values pass as arguments") {
    const auto run = run_source(R"(
      function double(K) = union(K, K)
      function twice(g, K) = g(g(K))
      complex X = twice(double, [a, b])
    )");
    CHECK(stored(run, "X").vertices() == Names{"a", "b"});
  }
}

TEST_CASE("A function cannot name itself in its own body") {
  CHECK(run_error(R"(
    function f(K) = f(K)
    complex X = f([a])
  )") == ErrorKind::UnboundIdentifier);
}

TEST_CASE("Recursion through passed closures is bounded") {
  simplicia::core::EvalOptions options;
  options.max_call_depth = 50;
  CHECK(run_error(R"(
    function loop(g, K) = g(g, K)
    complex X = loop(loop, [a])
  )",
                  options) == ErrorKind::CallDepthExceeded);
}

TEST_CASE("Lookup and dispatch failures") {
  CHECK(run_error("complex K = Missing") == ErrorKind::UnboundIdentifier);
  CHECK(run_error("complex K = union") == ErrorKind::NotAValue);
  CHECK(run_error("complex K = [a]\ncomplex L = K(K)") == ErrorKind::NotAFunction);
  CHECK(run_error("complex K = [a]\ncomplex L = K([a]) mapping { a -> a }") ==
        ErrorKind::NotAnOperator);
  CHECK(run_error("vertex v\nv <- [a]") == ErrorKind::NotAVariable);
  CHECK(run_error("Missing <- [a]") == ErrorKind::UnboundIdentifier);
}

TEST_CASE("Arity and type failures") {
  CHECK(run_error("function f(K) = K\ncomplex X = f([a], [b])") == ErrorKind::ArityMismatch);
  CHECK(run_error("complex X = pick_vert([a], [b])") == ErrorKind::ArityMismatch);
  CHECK(run_error("complex X = union()") == ErrorKind::ArityMismatch);
  CHECK(run_error("complex X = [a]\nif betti(X) then endif") == ErrorKind::ArityMismatch);
  CHECK(run_error("if not(1, 2) then endif") == ErrorKind::ArityMismatch);

  CHECK(run_error("complex X = dim([a])") == ErrorKind::TypeMismatch);
  CHECK(run_error("complex X = union([a], 3)") == ErrorKind::TypeMismatch);
  CHECK(run_error("if [a] then endif") == ErrorKind::TypeMismatch);
  CHECK(run_error("if add([a], 1) then endif") == ErrorKind::TypeMismatch);
  CHECK(run_error("if betti([a], [b]) then endif") == ErrorKind::TypeMismatch);
}

TEST_CASE("Mapping misuse") {
  CHECK(run_error("complex X = union([a], [b]) mapping { a -> b }") ==
        ErrorKind::MappingMisuse);
  CHECK(run_error("if dim([a]) mapping { a -> a } then endif") == ErrorKind::MappingMisuse);

  // The parser never produces glue without a mapping, so build the tree directly.
  const ast::Program program = {
      ast::complex_decl("G", ast::op("glue", {ast::literal({"a"}), ast::literal({"b"})}))};
  CHECK(error_kind([&] { (void)lang::eval_program(program); }) == ErrorKind::MappingMisuse);
}

TEST_CASE("Complex literals reject repeated vertices") {
  CHECK(run_error("complex K = [a, b, a]") == ErrorKind::DuplicateVertex);
}

TEST_CASE("Expression evaluation leaves state untouched") {
  const auto run = run_source("complex K = [a, b]");
  const auto expr = ast::op("union", {ast::ident("K"), ast::literal({"fresh"})});
  const lang::EVal value = lang::evaluate_expr(expr, run.env, run.state);

  CHECK(std::get<Complex>(value).vertices() == Names{"a", "b", "fresh"});
  CHECK(run.state.store.size() == 1);
  CHECK(run.state.vertices_order.count("fresh") == 0);
}

TEST_CASE("Store addresses beyond the high-water mark are uninitialized") {
  lang::Store store;
  const lang::Loc kept = store.allocate(Complex::from_vertices({"a"}));
  const lang::Loc dropped = store.allocate(Complex::from_vertices({"b"}));
  store.rollback(1);

  CHECK(store.access(kept).vertices() == Names{"a"});
  CHECK(error_kind([&] { (void)store.access(dropped); }) == ErrorKind::UninitializedAddress);
  CHECK(error_kind([&] { store.update(dropped, Complex{}); }) ==
        ErrorKind::UninitializedAddress);
  CHECK(store.allocate(Complex{}).addr == 1);
}

TEST_CASE("Initial environment binds every built-in operator") {
  const lang::Environment env = lang::initial_environment();
  for (const char *name : {"union", "join", "glue", "pick_vert", "dim", "num_vert", "num_simp",
                           "euler", "betti", "add", "sub", "mul", "and", "or", "not",
                           "greater", "less", "leq", "geq"}) {
    const lang::DVal *value = env.find(name);
    REQUIRE(value != nullptr);
    CHECK(std::holds_alternative<lang::Operator>(value->as_variant()));
  }
}

TEST_CASE("Operator signatures") {
  std::set<std::string> signatures;
  for (const lang::Operator &op : lang::builtin_operators()) {
    signatures.insert(lang::signature(op));
  }
  CHECK(signatures.count("glue(complex, complex) -> complex") == 1);
  CHECK(signatures.count("betti(complex, int) -> int") == 1);
  CHECK(signatures.count("not(int) -> int") == 1);
  CHECK(signatures.size() == lang::builtin_operator_names().size());
}

TEST_CASE("Environments are persistent") {
  const lang::Environment base = lang::Environment{}.bind("x", std::int64_t{1});
  const lang::Environment child = base.bind("x", std::int64_t{2}).bind("y", true);

  CHECK(std::get<std::int64_t>(base.find("x")->as_variant()) == 1);
  CHECK(std::get<std::int64_t>(child.find("x")->as_variant()) == 2);
  CHECK_FALSE(base.contains("y"));
  CHECK(child.bindings().size() == 2);
}

TEST_CASE("Tracing does not change results") {
  simplicia::core::EvalOptions options;
  options.trace = true;
  const auto run = run_source(R"(
    complex K = [a]
    if 1 then K <- [b] endif
    function id(X) = X
  )",
                              options);
  CHECK(stored(run, "K").vertices() == Names{"b"});
}

TEST_CASE("Mapping tokens bound by vertex stand for their synthesized names") {
  const auto run = run_source(R"(
    vertex v
    vertex w
    complex K = [v, a]
    complex L = [w, y]
    complex G = glue(K, L) mapping { v -> w }
  )");
  const Complex glued = stored(run, "G");
  CHECK(glued.vertices() == Names{"__v0", "a", "y"});
  CHECK(glued.identifies("__v0", "__v1"));
  CHECK(glued.uf().representative("__v1") == "__v0");

  CHECK(run_error(R"(
    vertex v
    complex K = [v, a]
    complex G = glue(K, [x]) mapping { z -> x }
  )") == ErrorKind::VertexNotFound);
}
