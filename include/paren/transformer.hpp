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
#include "paren/target_ast.hpp"

/**
 * \file transformer.hpp
 * Lowering of the source syntax tree into the target syntax tree
 *
 * \ingroup backend
 */


namespace prn {

/**
 * Lower a source program into a target program.
 *
 * - `(name args...)` in statement position becomes an expression statement
 *   wrapping a call of identifier `name`;
 * - nested calls become calls in argument position;
 * - number and string literals are carried over as is.
 *
 * The source tree is not modified.
 *
 * \ingroup backend
 */
[[nodiscard]] target::program
transform(const ast::program &program);

} // namespace prn
