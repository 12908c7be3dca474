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


#include "paren/lexer.hpp"
#include "paren/logging.hpp"

#include <cctype>
#include <exception>
#include <sstream>


static bool
_is_digit(int c)
{ return c >= '0' and c <= '9'; }


static bool
_is_letter(int c)
{ return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z'); }


std::string_view
prn::token_kind_name(token_kind kind)
{
  switch (kind)
  {
    case token_kind::PAREN: return "paren";
    case token_kind::NUMBER: return "number";
    case token_kind::STRING: return "string";
    case token_kind::NAME: return "name";
  }
  std::terminate();
}


std::vector<prn::token>
prn::lexer::tokenize(const std::string &input,
                     const std::string &source_name) const
{
  std::istringstream iss {input};
  return tokenize(iss, source_name);
}


std::vector<prn::token>
prn::lexer::tokenize(std::istream &input, const std::string &source_name) const
{
  std::vector<token> tokens;
  size_t current_pos = 0;

  char c;
  while (input.get(c))
  {
    const size_t start = current_pos++;

    // Handle parentheses
    if (c == '(' or c == ')')
    {
      source_location loc = {source_name, start, current_pos};
      tokens.push_back({token_kind::PAREN, std::string(1, c), loc});
      continue;
    }

    // Skip whitespace
    if (std::isspace(static_cast<unsigned char>(c)))
      continue;

    // Handle numbers
    if (_is_digit(c))
    {
      std::string digits(1, c);
      if (m_options.multidigit_numbers)
      {
        while (_is_digit(input.peek()))
        {
          digits += static_cast<char>(input.get());
          current_pos++;
        }
      }
      source_location loc = {source_name, start, current_pos};
      tokens.push_back({token_kind::NUMBER, digits, loc});
      continue;
    }

    // Handle strings
    if (c == '"')
    {
      std::string str;
      bool terminated = false;
      while (input.get(c))
      {
        current_pos++;
        if (c == '"')
        {
          terminated = true;
          break;
        }
        str += c;
      }

      source_location loc = {source_name, start, current_pos};
      if (not terminated)
        throw lex_error {"Unterminated string literal", loc};
      tokens.push_back({token_kind::STRING, str, loc});
      continue;
    }

    // Handle names
    if (_is_letter(c))
    {
      std::string name(1, c);
      while (_is_letter(input.peek()))
      {
        name += static_cast<char>(input.get());
        current_pos++;
      }
      source_location loc = {source_name, start, current_pos};
      tokens.push_back({token_kind::NAME, name, loc});
      continue;
    }

    throw lex_error {
        std::format("Unexpected character '{}' at offset {}", c, start),
        source_location {source_name, start, current_pos}};
  }

  debug("lexer produced {} tokens from {}", tokens.size(), source_name);
  return tokens;
}
