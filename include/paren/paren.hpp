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
#include "paren/code_generator.hpp"
#include "paren/lexer.hpp"
#include "paren/parser.hpp"
#include "paren/target_ast.hpp"
#include "paren/transformer.hpp"

#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


namespace prn {

// Compilation steps:
// 1. source text -> [lexer] -> tokens
// 2. tokens -> [parser] -> source AST
// 3. source AST -> [transformer] -> target AST
// 4. target AST -> [code generator] -> output text
//
// Each step stores its product in a `compilation`, so that a driver can stop
// after any of them and inspect the intermediate result.

enum class stage {
  tokens,
  ast,
  target,
  code,
};

std::string_view
stage_name(stage s);

stage
parse_stage(std::string_view name);


struct compilation {
  std::string source_name = "<string>";
  std::optional<std::vector<token>> tokens;
  std::optional<ast::program> source_ast;
  std::optional<target::program> target_ast;
  std::optional<std::string> output;
};


/**
 * Exception thrown when a compilation step is run before the step producing
 * its input
 */
struct pipeline_error: public std::logic_error {
  using logic_error::logic_error;
};


void
run_lexer(compilation &comp, const lexer &lexer, const std::string &input);

void
run_lexer(compilation &comp, const lexer &lexer, std::istream &input);

void
run_parser(compilation &comp, parser &parser);

void
run_transformer(compilation &comp);

void
run_code_generator(compilation &comp);

/**
 * Run all steps following tokenization up to and including \p last
 */
void
run_pipeline(compilation &comp, stage last);


/**
 * Compile prefix-notation source into C-style call syntax
 *
 * Usage example:
 * ```
 * compile("(add 2 (subtract 4 2))") // -> "add(2, subtract(4, 2));"
 * ```
 */
[[nodiscard]] std::string
compile(const std::string &input, const lexer_options &options = {});

} // namespace prn
