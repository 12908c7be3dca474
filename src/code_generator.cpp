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


#include "paren/code_generator.hpp"

#include <string_view>
#include <variant>
#include <vector>


template <typename T>
static std::string
_join(const std::vector<T> &nodes, std::string_view separator)
{
  std::string result;
  for (bool first = true; const T &node : nodes)
  {
    if (not first)
      result += separator;
    result += prn::generate(node);
    first = false;
  }
  return result;
}


std::string
prn::generate(const target::program &program)
{ return _join(program.body, "\n"); }


std::string
prn::generate(const target::node &node)
{
  if (node.valueless_by_exception())
    throw codegen_error {"Can't generate code for a valueless node"};
  return std::visit([](const auto &x) { return generate(x); }, node);
}


std::string
prn::generate(const target::expression_statement &stmt)
{ return generate(stmt.expression) + ";"; }


std::string
prn::generate(const target::call_expression &call)
{
  return generate(call.callee) + "(" + _join(call.arguments, ", ") + ")";
}


std::string
prn::generate(const target::identifier &ident)
{ return ident.name; }


std::string
prn::generate(const target::number_literal &number)
{ return number.value; }


std::string
prn::generate(const target::string_literal &string)
{ return "\"" + string.value + "\""; }
