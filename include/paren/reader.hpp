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
#include "paren/lexer.hpp"
#include "paren/parser.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

/**
 * \file reader.hpp
 * Incremental reader of prefix-notation source
 *
 * \ingroup frontend
 */


namespace prn {

/**
 * Utility class allowing gradual parsing of text fragments into expressions
 *
 * Expressions become available as soon as their closing parenthesis has been
 * read; an unfinished trailing expression waits for further fragments. Tokens
 * never span fragments, so a string literal must be complete within one.
 * Token locations count offsets from the beginning of the first fragment.
 *
 * \ingroup frontend
 */
class reader {
  public:
  explicit reader(const lexer &lexer, std::string source_name = "<input>");

  void
  operator << (const std::string &input);

  bool
  operator >> (ast::expression &result);

  // Whether an unfinished expression is waiting for more input
  // (tokens of malformed input are dropped when the error is thrown)
  bool
  pending() const noexcept
  { return not m_tokens.empty(); }

  private:
  lexer m_lexer;
  parser m_parser;
  std::string m_source_name;
  size_t m_offset;
  std::vector<token> m_tokens;
  std::deque<ast::expression> m_expressions;
}; // class prn::reader

} // namespace prn
