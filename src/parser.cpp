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


#include "paren/parser.hpp"
#include "paren/format.hpp" // IWYU pragma: keep
#include "paren/logging.hpp"


prn::ast::program
prn::parser::parse(const std::vector<token> &tokens)
{
  ast::program program;
  size_t pos = 0;
  while (pos < tokens.size())
    program.body.push_back(parse_expression(tokens, pos));

  debug("parser produced {} top-level expressions", program.body.size());
  return program;
}


prn::ast::expression
prn::parser::parse_expression(const std::vector<token> &tokens, size_t &pos)
{
  // Wrap actual parser to preserve `pos` argument upon exception
  size_t proxypos = pos;
  ast::expression result = _parse_expression(tokens, proxypos);
  pos = proxypos;
  return result;
}


prn::ast::expression
prn::parser::_parse_expression(const std::vector<token> &tokens, size_t &pos)
{
  if (pos >= tokens.size())
    throw incomplete_input {"Unexpected end of input"};

  const token &tok = tokens[pos];
  switch (tok.kind)
  {
    case token_kind::NUMBER:
      pos++;
      return ast::number_literal {tok.text, tok.location};

    case token_kind::STRING:
      pos++;
      return ast::string_literal {tok.text, tok.location};

    case token_kind::PAREN:
      if (tok.is_lparen())
        return _parse_call(tokens, pos);
      break;

    case token_kind::NAME:
      break;
  }

  throw parse_error {std::format("Unexpected token {}", tok), tok.location};
}


prn::ast::call_expression
prn::parser::_parse_call(const std::vector<token> &tokens, size_t &pos)
{
  const token &lparen = tokens[pos++];

  // Call name
  if (pos >= tokens.size())
    throw incomplete_input {"Unexpected end of input, expected call name",
                            lparen.location};
  const token &name = tokens[pos];
  if (name.kind != token_kind::NAME)
    throw parse_error {std::format("Expected call name, got {}", name),
                       name.location};
  pos++;

  // Parameters up to the closing parenthesis
  ast::call_expression call {name.text, {}, lparen.location};
  while (true)
  {
    if (pos >= tokens.size())
      throw incomplete_input {
          std::format("Unexpected end of input, missing ')' to close call to {}",
                      call.name),
          span(lparen.location, tokens.back().location)};

    if (tokens[pos].is_rparen())
      break;

    call.params.push_back(_parse_expression(tokens, pos));
  }

  call.location = span(lparen.location, tokens[pos].location);
  pos++; // Skip closing paren
  return call;
}
