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
#include "paren/target_ast.hpp"

#include <ostream>
#include <string>
#include <vector>

/**
 * \file pretty_print.hpp
 * Human readable dumps of the intermediate compilation products
 *
 * Trees are printed one node per line, children indented by two spaces
 * under their parent:
 * ```
 * Program
 *   CallExpression add
 *     NumberLiteral 2
 * ```
 *
 * \ingroup utils
 */


namespace prn {

// One token per line: kind followed by the token text
[[nodiscard]] std::string
pprint(const std::vector<token> &tokens);

[[nodiscard]] std::string
pprint(const ast::program &program);

[[nodiscard]] std::string
pprint(const target::program &program);


namespace ast {

inline std::ostream&
operator << (std::ostream &os, const program &program)
{ return os << pprint(program); }

} // namespace prn::ast


namespace target {

inline std::ostream&
operator << (std::ostream &os, const program &program)
{ return os << pprint(program); }

} // namespace prn::target

} // namespace prn
