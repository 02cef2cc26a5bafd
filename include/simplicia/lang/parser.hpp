#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include <simplicia/core/error.hpp>
#include <simplicia/lang/ast.hpp>
#include <simplicia/lang/operators.hpp>

/// \file
/// \brief Lexer and recursive-descent parser for the complex language.

namespace simplicia::lang {

enum class TokenKind { Identifier, Integer, Symbol, End };

struct Token {
  TokenKind kind = TokenKind::End;
  std::string text;
  std::size_t line = 1;
  std::size_t column = 1;
};

inline const char *to_string(TokenKind kind) {
  switch (kind) {
  case TokenKind::Identifier:
    return "identifier";
  case TokenKind::Integer:
    return "integer";
  case TokenKind::Symbol:
    return "symbol";
  case TokenKind::End:
    return "end of input";
  }
  return "token";
}

/**
 * \brief Split source text into tokens.
 *
 * Identifiers are `[A-Za-z_][A-Za-z0-9_]*`, integers an optional `-` and
 * digits. `//` comments run to the end of the line.
 * \throws ParseError on any other character.
 */
inline std::vector<Token> tokenize(std::string_view source) {
  std::vector<Token> tokens;
  std::size_t i = 0;
  std::size_t line = 1;
  std::size_t column = 1;

  auto advance = [&](std::size_t n) {
    for (std::size_t k = 0; k < n && i < source.size(); ++k, ++i) {
      if (source[i] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
  };
  auto is_ident_start = [](char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
  };
  auto is_ident_char = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  };
  auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

  while (i < source.size()) {
    const char c = source[i];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      advance(1);
      continue;
    }
    if (source.substr(i, 2) == "//") {
      while (i < source.size() && source[i] != '\n') {
        advance(1);
      }
      continue;
    }

    Token token;
    token.line = line;
    token.column = column;
    const std::size_t start = i;

    if (is_ident_start(c)) {
      std::size_t end = i;
      while (end < source.size() && is_ident_char(source[end])) {
        ++end;
      }
      token.kind = TokenKind::Identifier;
      token.text = std::string(source.substr(start, end - start));
      advance(end - start);
    } else if (is_digit(c) || (c == '-' && i + 1 < source.size() && is_digit(source[i + 1]))) {
      std::size_t end = i + 1;
      while (end < source.size() && is_digit(source[end])) {
        ++end;
      }
      token.kind = TokenKind::Integer;
      token.text = std::string(source.substr(start, end - start));
      advance(end - start);
    } else if (source.substr(i, 2) == "<-" || source.substr(i, 2) == "->") {
      token.kind = TokenKind::Symbol;
      token.text = std::string(source.substr(i, 2));
      advance(2);
    } else if (std::string_view("()[]{},=").find(c) != std::string_view::npos) {
      token.kind = TokenKind::Symbol;
      token.text = std::string(1, c);
      advance(1);
    } else {
      throw ParseError(fmt::format("unexpected character '{}'", c), line, column);
    }
    tokens.push_back(std::move(token));
  }

  Token end;
  end.line = line;
  end.column = column;
  tokens.push_back(std::move(end));
  return tokens;
}

/**
 * \brief Recursive-descent parser producing an `ast::Program`.
 *
 * Calls to a built-in operator name, or calls carrying a `mapping` block,
 * become `OpCall`; every other call becomes `FunCall`. Unknown names are left
 * for the evaluator to reject.
 */
class Parser {
public:
  explicit Parser(std::string_view source)
      : tokens_(tokenize(source)), operators_(builtin_operator_names()) {}

  ast::Program parse_program() {
    ast::Program program = parse_commands({});
    if (!at_end()) {
      fail(fmt::format("expected a command, found '{}'", peek().text));
    }
    return program;
  }

private:
  static bool is_keyword(const std::string &word) {
    static const std::set<std::string> keywords = {
        "complex", "vertex", "if",       "then",    "else",  "endif", "while",
        "do",      "endwhile", "function", "mapping", "true", "false"};
    return keywords.count(word) > 0;
  }

  [[nodiscard]] const Token &peek(std::size_t ahead = 0) const {
    const std::size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[index];
  }

  [[nodiscard]] bool at_end() const { return peek().kind == TokenKind::End; }

  [[nodiscard]] bool check(std::string_view symbol) const {
    const Token &t = peek();
    return t.kind != TokenKind::End && t.kind != TokenKind::Integer && t.text == symbol;
  }

  bool accept(std::string_view symbol) {
    if (check(symbol)) {
      ++pos_;
      return true;
    }
    return false;
  }

  [[noreturn]] void fail(const std::string &message) const {
    throw ParseError(message, peek().line, peek().column);
  }

  void expect(std::string_view symbol) {
    if (!accept(symbol)) {
      const Token &t = peek();
      fail(fmt::format("expected '{}', found {}", symbol,
                       t.kind == TokenKind::End ? std::string("end of input")
                                                : fmt::format("'{}'", t.text)));
    }
  }

  std::string expect_identifier(const char *what) {
    const Token &t = peek();
    if (t.kind != TokenKind::Identifier || is_keyword(t.text)) {
      fail(fmt::format("expected {} name, found {}", what,
                       t.kind == TokenKind::End ? std::string("end of input")
                                                : fmt::format("'{}'", t.text)));
    }
    ++pos_;
    return t.text;
  }

  // Commands up to (not including) one of `terminators` or end of input.
  ast::CommandSeq parse_commands(const std::set<std::string> &terminators) {
    ast::CommandSeq seq;
    while (!at_end()) {
      const Token &t = peek();
      if (t.kind == TokenKind::Identifier && terminators.count(t.text) > 0) {
        break;
      }
      seq.push_back(parse_command());
    }
    return seq;
  }

  ast::Command parse_command() {
    if (accept("complex")) {
      std::string name = expect_identifier("complex");
      expect("=");
      return ast::complex_decl(std::move(name), parse_expr());
    }
    if (accept("vertex")) {
      return ast::vertex_decl(expect_identifier("vertex"));
    }
    if (accept("if")) {
      ast::Expr cond = parse_expr();
      expect("then");
      ast::CommandSeq then_branch = parse_commands({"else", "endif"});
      ast::CommandSeq else_branch;
      if (accept("else")) {
        else_branch = parse_commands({"endif"});
      }
      expect("endif");
      return ast::if_then_else(std::move(cond), std::move(then_branch), std::move(else_branch));
    }
    if (accept("while")) {
      ast::Expr cond = parse_expr();
      expect("do");
      ast::CommandSeq body = parse_commands({"endwhile"});
      expect("endwhile");
      return ast::while_do(std::move(cond), std::move(body));
    }
    if (accept("function")) {
      std::string name = expect_identifier("function");
      expect("(");
      std::vector<std::string> params;
      if (!check(")")) {
        do {
          params.push_back(expect_identifier("parameter"));
        } while (accept(","));
      }
      expect(")");
      expect("=");
      return ast::function_decl(std::move(name), std::move(params), parse_expr());
    }

    if (peek().kind == TokenKind::Identifier && !is_keyword(peek().text) &&
        peek(1).kind == TokenKind::Symbol && peek(1).text == "<-") {
      std::string name = peek().text;
      pos_ += 2;
      return ast::assign(std::move(name), parse_expr());
    }

    fail(fmt::format("expected a command, found {}",
                     at_end() ? std::string("end of input") : fmt::format("'{}'", peek().text)));
  }

  ast::Expr parse_expr() {
    const Token t = peek();
    if (t.kind == TokenKind::Integer) {
      ++pos_;
      try {
        return ast::integer(std::stoll(t.text));
      } catch (const std::out_of_range &) {
        throw ParseError(fmt::format("integer literal {} is out of range", t.text), t.line,
                         t.column);
      }
    }
    if (accept("true")) {
      return ast::boolean(true);
    }
    if (accept("false")) {
      return ast::boolean(false);
    }
    if (accept("[")) {
      std::vector<VertexName> vertices;
      if (!check("]")) {
        do {
          vertices.push_back(expect_identifier("vertex"));
        } while (accept(","));
      }
      expect("]");
      return ast::literal(std::move(vertices));
    }

    std::string name = expect_identifier("identifier or operator");
    if (!accept("(")) {
      return ast::ident(std::move(name));
    }

    std::vector<ast::Expr> args;
    if (!check(")")) {
      do {
        args.push_back(parse_expr());
      } while (accept(","));
    }
    expect(")");

    std::optional<data::VertexMapping> mapping;
    if (accept("mapping")) {
      mapping = parse_mapping();
    }
    if (mapping.has_value() || operators_.count(name) > 0) {
      return ast::op(std::move(name), std::move(args), std::move(mapping));
    }
    return ast::call(std::move(name), std::move(args));
  }

  data::VertexMapping parse_mapping() {
    expect("{");
    data::VertexMapping mapping;
    if (!check("}")) {
      do {
        std::string source = expect_identifier("vertex");
        expect("->");
        std::string target = expect_identifier("vertex");
        mapping.emplace_back(std::move(source), std::move(target));
      } while (accept(","));
    }
    expect("}");
    return mapping;
  }

  std::vector<Token> tokens_;
  std::set<std::string> operators_;
  std::size_t pos_ = 0;
};

/// \throws ParseError with the 1-based line and column of the offending token.
inline ast::Program parse_program(std::string_view source) {
  return Parser(source).parse_program();
}

} // namespace simplicia::lang
