/*
 * Paren - prefix-notation to C call syntax compiler
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "paren/ast.hpp"
#include "paren/exceptions.hpp"
#include "paren/lexer.hpp"

#include <cstddef>
#include <vector>

/**
 * \file parser.hpp
 * Recursive descent parser for prefix-notation source
 *
 * \ingroup frontend
 */


namespace prn {

/**
 * Parser building a source syntax tree from lexer tokens
 *
 * Grammar:
 * ```
 * program    := expression*
 * expression := NUMBER | STRING | '(' NAME expression* ')'
 * ```
 *
 * \ingroup frontend
 */
class parser {
  public:
  // Parse all tokens into a program
  ast::program
  parse(const std::vector<token> &tokens);

  /**
   * Parse a single expression starting at \p pos
   *
   * On success \p pos is advanced past the expression; on failure it is left
   * untouched.
   */
  ast::expression
  parse_expression(const std::vector<token> &tokens, size_t &pos);

  private:
  ast::expression
  _parse_expression(const std::vector<token> &tokens, size_t &pos);

  ast::call_expression
  _parse_call(const std::vector<token> &tokens, size_t &pos);
}; // class prn::parser


/**
 * Exception class for parser errors
 *
 * \ingroup frontend
 */
struct parse_error: public bad_code {
  using bad_code::bad_code;
};


/**
 * Tokens ended in the middle of an expression
 *
 * \ingroup frontend
 */
struct incomplete_input: public parse_error {
  using parse_error::parse_error;
};

} // namespace prn
