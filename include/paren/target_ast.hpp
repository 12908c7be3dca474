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

#include <string>
#include <variant>
#include <vector>

/**
 * \file target_ast.hpp
 * Syntax tree of the emitted C-style call syntax
 *
 * \ingroup backend
 */


namespace prn::target {

struct program;
struct expression_statement;
struct call_expression;
struct identifier;
struct number_literal;
struct string_literal;

using node = std::variant<expression_statement, call_expression, identifier,
                          number_literal, string_literal>;

/**
 * Node enclosing the one being visited; empty for the root program
 */
using parent = std::variant<std::monostate, const program *,
                            const expression_statement *,
                            const call_expression *>;


inline bool
operator == (const call_expression &a, const call_expression &b);

inline bool
operator == (const expression_statement &a, const expression_statement &b);


struct identifier {
  std::string name;
};


struct number_literal {
  std::string value;
};


struct string_literal {
  std::string value;
};


struct call_expression {
  identifier callee;
  std::vector<node> arguments;
};


/**
 * Call in statement position, rendered with a trailing semicolon
 */
struct expression_statement {
  call_expression expression;
};


struct program {
  std::vector<node> body;
};


inline bool
operator == (const identifier &a, const identifier &b)
{ return a.name == b.name; }

inline bool
operator == (const number_literal &a, const number_literal &b)
{ return a.value == b.value; }

inline bool
operator == (const string_literal &a, const string_literal &b)
{ return a.value == b.value; }

inline bool
operator == (const call_expression &a, const call_expression &b)
{ return a.callee == b.callee and a.arguments == b.arguments; }

inline bool
operator == (const expression_statement &a, const expression_statement &b)
{ return a.expression == b.expression; }

inline bool
operator == (const program &a, const program &b)
{ return a.body == b.body; }

} // namespace prn::target
