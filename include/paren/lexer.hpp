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

#include "paren/exceptions.hpp"
#include "paren/source_location.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file lexer.hpp
 * Lexical analysis of prefix-notation source
 *
 * \ingroup frontend
 */


namespace prn {

enum class token_kind {
  PAREN,  // ( or )
  NUMBER, // 1, 2, ...
  STRING, // "hello"
  NAME,   // add, subtract, etc.
};

std::string_view
token_kind_name(token_kind kind);


/**
 * Token produced by the lexer
 *
 * \ingroup frontend
 */
struct token {
  token_kind kind;
  std::string text; ///< Token text; string tokens hold it without quotes
  source_location location;

  bool
  is_lparen() const noexcept
  { return kind == token_kind::PAREN and text == "("; }

  bool
  is_rparen() const noexcept
  { return kind == token_kind::PAREN and text == ")"; }

  // Locations are not compared
  bool
  operator == (const token &other) const
  { return kind == other.kind and text == other.text; }
};


struct lexer_options {
  /**
   * Scan a run of digits as a single number token
   *
   * Off by default: every digit is a number token of its own, so "42" reads
   * as two numbers.
   */
  bool multidigit_numbers = false;
};


/**
 * Lexer for prefix-notation source
 *
 * Scans the input left to right without backtracking and stops on the first
 * character it can't classify.
 *
 * \ingroup frontend
 */
class lexer {
  public:
  lexer() = default;

  explicit lexer(const lexer_options &options)
  : m_options {options}
  { }

  const lexer_options&
  options() const noexcept
  { return m_options; }

  // Tokenize the input string
  std::vector<token>
  tokenize(const std::string &input,
           const std::string &source_name = "<string>") const;

  // Tokenize the input stream
  std::vector<token>
  tokenize(std::istream &input,
           const std::string &source_name = "<stream>") const;

  private:
  lexer_options m_options;
}; // class prn::lexer


/**
 * Exception class for lexer errors
 *
 * \ingroup frontend
 */
struct lex_error: public bad_code {
  using bad_code::bad_code;
};

} // namespace prn
