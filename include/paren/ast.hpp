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

#include "paren/source_location.hpp"

#include <string>
#include <variant>
#include <vector>

/**
 * \file ast.hpp
 * Syntax tree of the prefix-notation source language
 *
 * Nodes are plain values. Every node except the program carries the location
 * of the source text it was parsed from; locations take no part in node
 * comparison.
 *
 * \ingroup frontend
 */


namespace prn::ast {

struct program;
struct call_expression;
struct number_literal;
struct string_literal;

using expression = std::variant<call_expression, number_literal, string_literal>;

/**
 * Node enclosing the one being visited; empty for the root program
 */
using parent =
    std::variant<std::monostate, const program *, const call_expression *>;


/**
 * Number as written in the source; never converted to a numeric type
 */
struct number_literal {
  std::string value;
  source_location location;

  bool
  operator == (const number_literal &other) const
  { return value == other.value; }
};


/**
 * String literal content without the surrounding quotes
 */
struct string_literal {
  std::string value;
  source_location location;

  bool
  operator == (const string_literal &other) const
  { return value == other.value; }
};


/**
 * `(name params...)`
 */
struct call_expression {
  std::string name;
  std::vector<expression> params;
  source_location location;

  bool
  operator == (const call_expression &other) const
  { return name == other.name and params == other.params; }
};


struct program {
  std::vector<expression> body;

  bool
  operator == (const program &other) const
  { return body == other.body; }
};

} // namespace prn::ast
