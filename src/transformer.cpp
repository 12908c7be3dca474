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


#include "paren/transformer.hpp"
#include "paren/logging.hpp"
#include "paren/traverser.hpp"

#include <variant>
#include <vector>


namespace {

// Collection the lowered node is appended to
using destination = std::vector<prn::target::node> *;


struct lowering_visitor {
  void
  enter(const prn::ast::number_literal &x, const prn::ast::parent &,
        destination &out)
  {
    out->push_back(prn::target::number_literal {x.value});
    nnodes += 1;
  }

  void
  enter(const prn::ast::string_literal &x, const prn::ast::parent &,
        destination &out)
  {
    out->push_back(prn::target::string_literal {x.value});
    nnodes += 1;
  }

  void
  enter(const prn::ast::call_expression &x, const prn::ast::parent &parent,
        destination &out)
  {
    using namespace prn::target;

    call_expression call {identifier {x.name}, {}};
    nnodes += 1;

    // Arguments of the call are lowered into the new call
    if (std::holds_alternative<const prn::ast::call_expression *>(parent))
    {
      auto &newcall = std::get<call_expression>(out->emplace_back(std::move(call)));
      out = &newcall.arguments;
    }
    else
    {
      auto &stmt = std::get<expression_statement>(
          out->emplace_back(expression_statement {std::move(call)}));
      out = &stmt.expression.arguments;
    }
  }

  size_t nnodes = 0;
}; // struct lowering_visitor

} // anonymous namespace


prn::target::program
prn::transform(const ast::program &program)
{
  target::program result;
  lowering_visitor visitor;
  traverse(program, visitor, destination {&result.body});

  debug("transformer lowered {} nodes", visitor.nnodes);
  return result;
}
