#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <simplicia/data/complex.hpp>
#include <simplicia/lang/evaluator.hpp>
#include <simplicia/lang/parser.hpp>
#include <simplicia/ops/algebra.hpp>
#include <simplicia/ops/homology.hpp>

using simplicia::data::Complex;
namespace ops = simplicia::ops;
namespace lang = simplicia::lang;

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() {
    unsetenv("SIMPLICIA_TRACE");
  }
} kBenchEnvSetup;

Complex generate_circle(int n) {
  Complex circle = Complex::from_vertices({});
  for (int i = 0; i < n; ++i) {
    circle = ops::complex_union(
        circle, Complex::from_vertices({fmt::format("v{}", i), fmt::format("v{}", (i + 1) % n)}));
  }
  return circle;
}

// Strip of triangles {i, i+1, i+2}; contractible, dimension 2.
Complex generate_strip(int n) {
  Complex strip = Complex::from_vertices({});
  for (int i = 0; i + 2 < n; ++i) {
    strip = ops::complex_union(strip, Complex::from_vertices({fmt::format("s{}", i),
                                                             fmt::format("s{}", i + 1),
                                                             fmt::format("s{}", i + 2)}));
  }
  return strip;
}

std::string loop_program(int iterations) {
  return fmt::format(R"(
    complex Acc = [root]
    while less(num_vert(Acc), {}) do
      vertex n
      Acc <- union(Acc, join(pick_vert(Acc), [n]))
    endwhile
  )",
                     iterations + 1);
}

void bench_rank_mod2_circle(benchmark::State &state) {
  const Complex circle = generate_circle(static_cast<int>(state.range(0)));
  const ops::Gf2Matrix d1 = ops::boundary_matrix(circle, 1);

  for (auto _ : state) {
    int rank = ops::rank_mod2(d1);
    benchmark::DoNotOptimize(rank);
  }
}

void bench_boundary_matrix_strip(benchmark::State &state) {
  const Complex strip = generate_strip(static_cast<int>(state.range(0)));

  for (auto _ : state) {
    const ops::Gf2Matrix d2 = ops::boundary_matrix(strip, 2);
    benchmark::DoNotOptimize(d2.data());
  }
}

void bench_compute_homology_cone(benchmark::State &state) {
  const Complex cone =
      ops::join(generate_circle(static_cast<int>(state.range(0))), Complex::from_vertices({"apex"}));

  for (auto _ : state) {
    std::vector<int> betti = ops::compute_homology(cone);
    benchmark::DoNotOptimize(betti.data());
  }
}

void bench_glue_circle(benchmark::State &state) {
  const int n = static_cast<int>(state.range(0));
  const Complex path = generate_strip(n);
  const Complex handle = Complex::from_vertices({"h0", "h1"});

  for (auto _ : state) {
    Complex glued =
        ops::glue(path, handle, {{"s0", "h0"}, {fmt::format("s{}", n - 1), "h1"}});
    benchmark::DoNotOptimize(glued);
  }
}

void bench_eval_while_loop(benchmark::State &state) {
  const lang::ast::Program program = lang::parse_program(loop_program(static_cast<int>(state.range(0))));

  for (auto _ : state) {
    lang::RunResult run = lang::eval_program(program);
    std::size_t cells = run.state.store.size();
    benchmark::DoNotOptimize(cells);
  }
}

} // namespace

BENCHMARK(bench_rank_mod2_circle)->Arg(64)->Arg(256);
BENCHMARK(bench_boundary_matrix_strip)->Arg(64)->Arg(256);
BENCHMARK(bench_compute_homology_cone)->Arg(16)->Arg(64);
BENCHMARK(bench_glue_circle)->Arg(64)->Arg(256);
BENCHMARK(bench_eval_while_loop)->Arg(16)->Arg(64);

BENCHMARK_MAIN();
