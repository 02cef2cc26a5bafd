#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/core/config.hpp>
#include <simplicia/core/error.hpp>
#include <simplicia/io/exporter.hpp>
#include <simplicia/io/importer.hpp>
#include <simplicia/lang/evaluator.hpp>
#include <simplicia/ops/homology.hpp>

using namespace simplicia;

struct Config {
  std::string program;
  std::string json_path;
  bool homology = false;
  bool help = false;
  bool list_operators = false;
  core::EvalOptions options = core::eval_options_from_env();
};

static void print_usage() {
  fmt::print("Usage: ./build/simplicia <program> [options]\n"
             "  --json <path>\n"
             "  --homology\n"
             "  --max-iterations <int>\n"
             "  --max-call-depth <int>\n"
             "  --trace\n"
             "  --list-operators\n");
}

static std::size_t parse_count(const char *name, const char *text) {
  char *end = nullptr;
  const long long value = std::strtoll(text, &end, 10);
  if (end == text || *end != '\0' || value <= 0) {
    fmt::print(stderr, "Invalid value for {}: {}\n", name, text);
    std::exit(2);
  }
  return static_cast<std::size_t>(value);
}

static bool parse_args(int argc, char **argv, Config &cfg) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto require_value = [&](const char *name) -> const char * {
      if (i + 1 >= argc) {
        fmt::print(stderr, "Missing value for {}\n", name);
        std::exit(2);
      }
      ++i;
      return argv[i];
    };

    if (arg == "--help" || arg == "-h") {
      cfg.help = true;
      return false;
    }
    if (arg == "--json") {
      cfg.json_path = require_value("--json");
      continue;
    }
    if (arg == "--homology") {
      cfg.homology = true;
      continue;
    }
    if (arg == "--max-iterations") {
      cfg.options.max_loop_iterations =
          parse_count("--max-iterations", require_value("--max-iterations"));
      continue;
    }
    if (arg == "--max-call-depth") {
      cfg.options.max_call_depth =
          parse_count("--max-call-depth", require_value("--max-call-depth"));
      continue;
    }
    if (arg == "--trace") {
      cfg.options.trace = true;
      continue;
    }
    if (arg == "--list-operators") {
      cfg.list_operators = true;
      continue;
    }
    if (!arg.empty() && arg[0] != '-' && cfg.program.empty()) {
      cfg.program = arg;
      continue;
    }
    fmt::print(stderr, "Unknown argument: {}\n", arg);
    return false;
  }

  if (cfg.program.empty() && !cfg.list_operators) {
    fmt::print(stderr, "Missing program path\n");
    return false;
  }
  return true;
}

static void print_complex(const std::string &name, const data::Complex &complex, bool homology) {
  const io::ComplexSummary summary = io::summarize(complex);
  fmt::print("{}: dim {}\n", name, summary.dimension);
  for (const auto &simplex : summary.simplices) {
    fmt::print("  [{}]\n", fmt::join(simplex, ", "));
  }
  for (const auto &[rep, members] : summary.classes) {
    if (members.size() > 1) {
      fmt::print("  {} ~ {{{}}}\n", rep, fmt::join(members, ", "));
    }
  }
  if (homology) {
    fmt::print("  betti: [{}]  euler: {}\n", fmt::join(ops::compute_homology(complex), ", "),
               ops::euler_characteristic(complex));
  }
}

int main(int argc, char **argv) {
  Config cfg;
  if (!parse_args(argc, argv, cfg)) {
    print_usage();
    return cfg.help ? 0 : 2;
  }

  if (cfg.list_operators) {
    for (const lang::Operator &op : lang::builtin_operators()) {
      fmt::print("{}\n", lang::signature(op));
    }
    if (cfg.program.empty()) {
      return 0;
    }
  }

  try {
    const lang::ast::Program program = io::load_program(cfg.program);
    const lang::RunResult run = lang::eval_program(program, cfg.options);

    for (const auto &[name, complex] : lang::stored_complexes(run)) {
      print_complex(name, complex, cfg.homology);
    }

    if (!cfg.json_path.empty()) {
      io::export_json(cfg.json_path, io::write_program_json(run, cfg.homology));
    }
  } catch (const Error &e) {
    fmt::print(stderr, "[Eval] {} error: {}\n", to_string(e.kind()), e.what());
    if (cfg.json_path.empty() || e.kind() == ErrorKind::Io) {
      return 1;
    }
    try {
      io::export_json(cfg.json_path, io::write_error_json(e.what()));
    } catch (const Error &io_error) {
      fmt::print(stderr, "[IO] {}\n", io_error.what());
    }
    return 1;
  }
  return 0;
}
