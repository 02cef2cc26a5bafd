#pragma once

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <fmt/core.h>

#include <simplicia/core/error.hpp>
#include <simplicia/lang/ast.hpp>
#include <simplicia/lang/parser.hpp>

namespace simplicia::io {

/**
 * \brief Read a whole source file.
 * \throws Error (`Io`) if the file is missing or unreadable.
 */
inline std::string read_source(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw Error(ErrorKind::Io, "File not found: " + path.string());
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

inline lang::ast::Program load_program(const std::filesystem::path &path) {
  fmt::print(stderr, "[IO] Loading {}...\n", path.filename().string());
  return lang::parse_program(read_source(path));
}

} // namespace simplicia::io
