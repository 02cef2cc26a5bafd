#pragma once

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <simplicia/core/error.hpp>
#include <simplicia/data/complex.hpp>
#include <simplicia/lang/evaluator.hpp>
#include <simplicia/ops/homology.hpp>

namespace simplicia::io {

using data::Complex;
using data::VertexName;

/// \brief Plain-data view of a complex; every list is sorted.
struct ComplexSummary {
  int dimension = -1;
  std::vector<std::vector<VertexName>> simplices;
  std::vector<VertexName> vertices;
  std::map<VertexName, std::vector<VertexName>> classes;
};

inline ComplexSummary summarize(const Complex &complex) {
  ComplexSummary summary;
  summary.dimension = complex.dimension();
  for (const data::Simplex &simplex : complex.maximal_simplices()) {
    summary.simplices.emplace_back(simplex.begin(), simplex.end());
  }
  const std::set<VertexName> vertices = complex.vertices();
  summary.vertices.assign(vertices.begin(), vertices.end());
  for (const auto &[rep, members] : complex.classes()) {
    summary.classes.emplace(rep, std::vector<VertexName>(members.begin(), members.end()));
  }
  return summary;
}

/**
 * \brief Undirected edges between canonical vertices of every maximal simplex.
 *
 * Pairs are ordered `(low, high)`, deduplicated and sorted. Vertices that
 * collapse to the same class contribute no edge.
 */
inline std::vector<std::pair<VertexName, VertexName>> canonical_edges(const Complex &complex) {
  std::set<std::pair<VertexName, VertexName>> edges;
  for (const data::Simplex &simplex : complex.maximal_simplices()) {
    std::vector<VertexName> canon;
    for (const VertexName &v : simplex) {
      canon.push_back(complex.uf().representative(v));
    }
    for (std::size_t i = 0; i < canon.size(); ++i) {
      for (std::size_t j = i + 1; j < canon.size(); ++j) {
        if (canon[i] != canon[j]) {
          edges.insert(std::minmax(canon[i], canon[j]));
        }
      }
    }
  }
  return {edges.begin(), edges.end()};
}

namespace detail {

inline void append_json_string(fmt::memory_buffer &out, std::string_view text) {
  out.push_back('"');
  for (const char c : text) {
    switch (c) {
    case '"':
      fmt::format_to(std::back_inserter(out), "\\\"");
      break;
    case '\\':
      fmt::format_to(std::back_inserter(out), "\\\\");
      break;
    case '\n':
      fmt::format_to(std::back_inserter(out), "\\n");
      break;
    case '\t':
      fmt::format_to(std::back_inserter(out), "\\t");
      break;
    case '\r':
      fmt::format_to(std::back_inserter(out), "\\r");
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out.push_back(c);
      }
    }
  }
  out.push_back('"');
}

inline void append_name_list(fmt::memory_buffer &out, const std::vector<VertexName> &names) {
  out.push_back('[');
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    append_json_string(out, names[i]);
  }
  out.push_back(']');
}

inline void append_complex(fmt::memory_buffer &out, const Complex &complex,
                           bool include_homology) {
  const ComplexSummary summary = summarize(complex);
  fmt::format_to(std::back_inserter(out), "{{\"dimension\":{},\"simplices\":[",
                 summary.dimension);
  for (std::size_t i = 0; i < summary.simplices.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    append_name_list(out, summary.simplices[i]);
  }
  fmt::format_to(std::back_inserter(out), "],\"vertices\":");
  append_name_list(out, summary.vertices);
  fmt::format_to(std::back_inserter(out), ",\"classes\":{{");
  bool first = true;
  for (const auto &[rep, members] : summary.classes) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    append_json_string(out, rep);
    out.push_back(':');
    append_name_list(out, members);
  }
  out.push_back('}');
  if (include_homology) {
    fmt::format_to(std::back_inserter(out), ",\"betti\":[{}]",
                   fmt::join(ops::compute_homology(complex), ","));
  }
  out.push_back('}');
}

} // namespace detail

/// \brief `{"dimension", "simplices", "vertices", "classes"}` (plus `"betti"` on request).
inline std::string write_complex_json(const Complex &complex, bool include_homology = false) {
  fmt::memory_buffer out;
  detail::append_complex(out, complex, include_homology);
  return fmt::to_string(out);
}

/// \brief `{"success": true, "complexes": {name: complex, ...}}` for every stored name.
inline std::string write_program_json(const lang::RunResult &run, bool include_homology = false) {
  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out), "{{\"success\":true,\"complexes\":{{");
  bool first = true;
  for (const auto &[name, complex] : lang::stored_complexes(run)) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    detail::append_json_string(out, name);
    out.push_back(':');
    detail::append_complex(out, complex, include_homology);
  }
  fmt::format_to(std::back_inserter(out), "}}}}");
  return fmt::to_string(out);
}

inline std::string write_error_json(std::string_view message) {
  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out), "{{\"success\":false,\"error\":");
  detail::append_json_string(out, message);
  out.push_back('}');
  return fmt::to_string(out);
}

/**
 * \brief Write a JSON document to `path`.
 * \throws Error (`Io`) when the file cannot be written.
 */
inline void export_json(const std::filesystem::path &path, const std::string &json) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw Error(ErrorKind::Io, fmt::format("cannot open {} for writing", path.string()));
  }
  file << json << "\n";
  if (!file) {
    throw Error(ErrorKind::Io, fmt::format("failed writing {}", path.string()));
  }
  fmt::print(stderr, "[IO] Exported {}\n", path.string());
}

} // namespace simplicia::io
