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
#include "paren/target_ast.hpp"

#include <string>

/**
 * \file code_generator.hpp
 * Rendering of the target syntax tree as C-style call syntax
 *
 * \ingroup backend
 */


namespace prn {

/**
 * Render program statements, one per line (no trailing newline)
 *
 * \ingroup backend
 */
[[nodiscard]] std::string
generate(const target::program &program);

[[nodiscard]] std::string
generate(const target::node &node);

// `callee(args...);`
[[nodiscard]] std::string
generate(const target::expression_statement &stmt);

// `callee(arg1, arg2, ...)`
[[nodiscard]] std::string
generate(const target::call_expression &call);

[[nodiscard]] std::string
generate(const target::identifier &ident);

[[nodiscard]] std::string
generate(const target::number_literal &number);

[[nodiscard]] std::string
generate(const target::string_literal &string);


/**
 * Exception thrown when a node can't be rendered
 *
 * \ingroup backend
 */
struct codegen_error: public bad_code {
  using bad_code::bad_code;
};

} // namespace prn
