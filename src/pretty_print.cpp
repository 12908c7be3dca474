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


#include "paren/pretty_print.hpp"
#include "paren/format.hpp"
#include "paren/traverser.hpp"

#include <sstream>


namespace {

class tree_printer {
  public:
  tree_printer(std::ostream &os): m_os {os} { }

  template <typename Node, typename Parent>
  void
  enter(const Node &node, const Parent &)
  {
    for (int i = 0; i < m_depth; ++i)
      m_os << "  ";
    _print_node(node);
    m_os << "\n";
    m_depth += 1;
  }

  template <typename Node, typename Parent>
  void
  exit(const Node &, const Parent &)
  { m_depth -= 1; }

  private:
  void
  _print_node(const prn::ast::program &)
  { m_os << "Program"; }

  void
  _print_node(const prn::ast::call_expression &x)
  { m_os << "CallExpression " << x.name; }

  void
  _print_node(const prn::ast::number_literal &x)
  { m_os << "NumberLiteral " << x.value; }

  void
  _print_node(const prn::ast::string_literal &x)
  { m_os << "StringLiteral \"" << x.value << "\""; }

  void
  _print_node(const prn::target::program &)
  { m_os << "Program"; }

  void
  _print_node(const prn::target::expression_statement &)
  { m_os << "ExpressionStatement"; }

  void
  _print_node(const prn::target::call_expression &x)
  { m_os << "CallExpression " << x.callee.name; }

  void
  _print_node(const prn::target::identifier &x)
  { m_os << "Identifier " << x.name; }

  void
  _print_node(const prn::target::number_literal &x)
  { m_os << "NumberLiteral " << x.value; }

  void
  _print_node(const prn::target::string_literal &x)
  { m_os << "StringLiteral \"" << x.value << "\""; }

  std::ostream &m_os;
  int m_depth = 0;
}; // class tree_printer

} // anonymous namespace


std::string
prn::pprint(const std::vector<token> &tokens)
{
  std::ostringstream buf;
  for (const token &tok : tokens)
    buf << std::format("{:6} {:t}\n", token_kind_name(tok.kind), tok);
  return buf.str();
}


std::string
prn::pprint(const ast::program &program)
{
  std::ostringstream buf;
  traverse(program, tree_printer {buf});
  return buf.str();
}


std::string
prn::pprint(const target::program &program)
{
  std::ostringstream buf;
  traverse(program, tree_printer {buf});
  return buf.str();
}
