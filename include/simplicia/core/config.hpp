#pragma once

#include <cstddef>
#include <cstdlib>
#include <string>

namespace simplicia::core {

/// \brief Default ceiling on iterations of a single `while` command.
inline constexpr std::size_t kDefaultMaxLoopIterations = 10'000'000;

/// \brief Default ceiling on nested function calls.
inline constexpr std::size_t kDefaultMaxCallDepth = 1000;

/// \brief Per-run evaluator limits and diagnostics.
struct EvalOptions {
  std::size_t max_loop_iterations = kDefaultMaxLoopIterations;
  std::size_t max_call_depth = kDefaultMaxCallDepth;
  bool trace = false;
};

/**
 * \brief Parse a positive count from environment variable `name`.
 * \param name Variable name.
 * \param fallback Value returned when unset, malformed or non-positive.
 * \return Parsed count or `fallback`.
 */
inline std::size_t positive_count_from_env(const char *name, std::size_t fallback) {
  const char *raw = std::getenv(name);
  if (raw == nullptr) {
    return fallback;
  }

  char *end = nullptr;
  const long long requested = std::strtoll(raw, &end, 10);
  if (end == raw || *end != '\0' || requested <= 0) {
    return fallback;
  }
  return static_cast<std::size_t>(requested);
}

/**
 * \brief Truthiness of a flag variable (`1`, `true`, `on`, `yes`).
 * \param name Variable name.
 * \return `true` when the variable is set to an affirmative value.
 */
inline bool flag_from_env(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr) {
    return false;
  }

  std::string value(raw);
  for (char &c : value) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return value == "1" || value == "true" || value == "on" || value == "yes";
}

/**
 * \brief Build evaluator options from `SIMPLICIA_MAX_LOOP_ITERATIONS`,
 * `SIMPLICIA_MAX_CALL_DEPTH` and `SIMPLICIA_TRACE`.
 * \return Options with defaults for anything unset.
 */
inline EvalOptions eval_options_from_env() {
  EvalOptions options;
  options.max_loop_iterations =
      positive_count_from_env("SIMPLICIA_MAX_LOOP_ITERATIONS", kDefaultMaxLoopIterations);
  options.max_call_depth =
      positive_count_from_env("SIMPLICIA_MAX_CALL_DEPTH", kDefaultMaxCallDepth);
  options.trace = flag_from_env("SIMPLICIA_TRACE");
  return options;
}

} // namespace simplicia::core
