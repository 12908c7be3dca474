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


#include "paren/paren.hpp"
#include "paren/logging.hpp"
#include "paren/utilities/execution_timer.hpp"

#include <exception>


template <typename T>
static inline T &
_access(std::optional<T> &opt, std::string_view fail_message)
{
  if (not opt.has_value())
    throw prn::pipeline_error {std::string {fail_message}};
  return opt.value();
}


std::string_view
prn::stage_name(stage s)
{
  switch (s)
  {
    case stage::tokens: return "tokens";
    case stage::ast: return "ast";
    case stage::target: return "target";
    case stage::code: return "code";
  }
  std::terminate();
}


prn::stage
prn::parse_stage(std::string_view name)
{
  if (name == "tokens")
    return stage::tokens;
  if (name == "ast")
    return stage::ast;
  if (name == "target")
    return stage::target;
  if (name == "code")
    return stage::code;
  throw std::runtime_error {std::format("Invalid stage name ({})", name)};
}


void
prn::run_lexer(compilation &comp, const lexer &lexer, const std::string &input)
{
  PAREN_FUNCTION_BENCHMARK

  debug("\e[1mrunning lexer\e[0m on {}", comp.source_name);
  comp.tokens = lexer.tokenize(input, comp.source_name);
}


void
prn::run_lexer(compilation &comp, const lexer &lexer, std::istream &input)
{
  PAREN_FUNCTION_BENCHMARK

  debug("\e[1mrunning lexer\e[0m on {}", comp.source_name);
  comp.tokens = lexer.tokenize(input, comp.source_name);
}


void
prn::run_parser(compilation &comp, parser &parser)
{
  PAREN_FUNCTION_BENCHMARK

  const std::vector<token> &tokens =
      _access(comp.tokens, "Can't run parser, compilation is missing tokens");
  debug("\e[1mrunning parser\e[0m");
  comp.source_ast = parser.parse(tokens);
}


void
prn::run_transformer(compilation &comp)
{
  PAREN_FUNCTION_BENCHMARK

  const ast::program &source = _access(
      comp.source_ast, "Can't run transformer, compilation is missing AST");
  debug("\e[1mrunning transformer\e[0m");
  comp.target_ast = transform(source);
}


void
prn::run_code_generator(compilation &comp)
{
  PAREN_FUNCTION_BENCHMARK

  const target::program &target =
      _access(comp.target_ast,
              "Can't generate code, compilation is missing target AST");
  debug("\e[1mrunning code generator\e[0m");
  comp.output = generate(target);
}


void
prn::run_pipeline(compilation &comp, stage last)
{
  if (last == stage::tokens)
    return;

  parser parser;
  run_parser(comp, parser);
  if (last == stage::ast)
    return;

  run_transformer(comp);
  if (last == stage::target)
    return;

  run_code_generator(comp);
}


std::string
prn::compile(const std::string &input, const lexer_options &options)
{
  compilation comp;
  run_lexer(comp, lexer {options}, input);
  run_pipeline(comp, stage::code);
  return std::move(*comp.output);
}
