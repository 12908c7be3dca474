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


#include "paren/reader.hpp"
#include "paren/logging.hpp"

#include <iterator>
#include <utility>


prn::reader::reader(const lexer &lexer, std::string source_name)
: m_lexer {lexer},
  m_source_name {std::move(source_name)},
  m_offset {0}
{ }


void
prn::reader::operator << (const std::string &input)
{
  // Convert input string into tokens positioned after all previous fragments
  // (a fragment that fails to tokenize still takes up its offsets)
  const size_t offset = m_offset;
  m_offset += input.size();
  std::vector<token> tokens = m_lexer.tokenize(input, m_source_name);
  for (token &tok : tokens)
  {
    tok.location.start += offset;
    tok.location.end += offset;
  }
  m_tokens.insert(m_tokens.end(), std::make_move_iterator(tokens.begin()),
                  std::make_move_iterator(tokens.end()));

  // Parse all available expressions from accumulated tokens
  size_t cursor = 0;
  try
  {
    while (cursor < m_tokens.size())
      m_expressions.push_back(m_parser.parse_expression(m_tokens, cursor));
  }
  catch (const incomplete_input &)
  { // Not enough tokens to produce an expression
    debug("reader is waiting for more input ({} tokens pending)",
          m_tokens.size() - cursor);
  }
  catch (const parse_error &)
  { // Discard malformed input so that reading can go on after the error
    m_tokens.clear();
    throw;
  }

  // Erase consumed tokens
  m_tokens.erase(m_tokens.begin(), m_tokens.begin() + cursor);
}


bool
prn::reader::operator >> (ast::expression &result)
{
  if (m_expressions.empty())
    return false;
  result = std::move(m_expressions.front());
  m_expressions.pop_front();
  return true;
}
