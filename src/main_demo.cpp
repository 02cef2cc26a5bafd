#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/simplicia.hpp>

using namespace simplicia;

static const char *kDemoProgram = R"(
// Basic simplices
complex T = [A, B, C]
complex E = [C, D]
complex P = [F]

// Algebra
complex U1 = union(T, E)
complex U2 = union(U1, P)
complex J = join(E, P)
complex G = glue(T, [X, Y]) mapping { C -> X }
complex Last = pick_vert(U2)

// Fresh vertices and closures
vertex w
complex Cone = join(T, [w])
function cone(K, apex) = join(K, apex)
complex Cone2 = cone(E, [Q])

// Hollow triangle via glue
complex H = glue(union([a, b], [b, c]), [c2, a2]) mapping { c -> c2, a -> a2 }

// Conditional: allocations inside a branch are dropped, assignments persist
complex X = T
if greater(dim(X), 1) then
  complex Tmp = union(X, P)
  X <- Tmp
else
  X <- E
endif

// Bounded loop
complex Acc = [S]
complex Newest = pick_vert(union(Acc, [R]))
while less(num_vert(Acc), 4) do
  vertex n
  Acc <- join(Acc, [n])
endwhile
)";

static void print_vertex_order(const lang::State &state) {
  std::vector<std::pair<std::size_t, std::string>> order;
  for (const auto &[name, index] : state.vertices_order) {
    order.emplace_back(index, name);
  }
  std::sort(order.begin(), order.end());
  std::vector<std::string> names;
  for (const auto &entry : order) {
    names.push_back(entry.second);
  }
  fmt::print("vertex order: [{}]\n", fmt::join(names, ", "));
}

int main() {
  fmt::print("===== DEMO PROGRAM =====\n{}\n========================\n\n", kDemoProgram);

  try {
    const lang::ast::Program program = lang::parse_program(kDemoProgram);
    const lang::RunResult run = lang::eval_program(program, core::eval_options_from_env());

    fmt::print("Environment:\n");
    for (const auto &[name, value] : run.env.bindings()) {
      fmt::print("  {:<10} {}\n", name, lang::describe(*value));
    }

    fmt::print("\nStore ({} cells):\n", run.state.store.size());
    for (const auto &[name, complex] : lang::stored_complexes(run)) {
      fmt::print("  {:<10} {}\n", name, io::write_complex_json(complex));
      fmt::print("  {:<10} betti [{}], euler {}\n", "", fmt::join(ops::compute_homology(complex), ", "),
                 ops::euler_characteristic(complex));
    }

    fmt::print("\n");
    print_vertex_order(run.state);
  } catch (const Error &e) {
    fmt::print(stderr, "[Eval] {} error: {}\n", to_string(e.kind()), e.what());
    return 1;
  }
  return 0;
}
