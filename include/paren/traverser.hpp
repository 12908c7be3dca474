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
#include "paren/exceptions.hpp"
#include "paren/target_ast.hpp"

#include <span>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * \file traverser.hpp
 * Generic depth-first traversal of syntax trees
 *
 * \ingroup frontend
 */


namespace prn {

/**
 * Exception thrown when a node can't be traversed
 *
 * \ingroup frontend
 */
struct traversal_error: public bad_code {
  using bad_code::bad_code;
};


namespace detail {

template <typename T>
struct is_variant: std::false_type { };

template <typename ...T>
struct is_variant<std::variant<T...>>: std::true_type { };


inline const std::vector<ast::expression>&
children(const ast::program &x)
{ return x.body; }

inline const std::vector<ast::expression>&
children(const ast::call_expression &x)
{ return x.params; }

inline const std::vector<target::node>&
children(const target::program &x)
{ return x.body; }

inline const std::vector<target::node>&
children(const target::call_expression &x)
{ return x.arguments; }

inline std::span<const target::call_expression, 1>
children(const target::expression_statement &x)
{ return std::span<const target::call_expression, 1> {&x.expression, 1}; }


template <typename Parent, typename Visitor, typename Context>
class walker {
  public:
  walker(Visitor &visitor): m_visitor {visitor} { }

  template <typename Node>
  void
  walk(const Node &node, const Parent &parent, Context context)
  {
    if constexpr (is_variant<Node>::value)
    {
      if (node.valueless_by_exception())
        throw traversal_error {"Can't traverse a valueless node"};
      std::visit([&](const auto &alt) { walk(alt, parent, context); }, node);
    }
    else
    {
      _enter(node, parent, context);
      if constexpr (requires { children(node); })
      {
        const Parent self {&node};
        for (const auto &child : children(node))
          walk(child, self, context);
      }
      _exit(node, parent, context);
    }
  }

  private:
  template <typename Node>
  void
  _enter(const Node &node, const Parent &parent, Context &context)
  {
    if constexpr (requires { m_visitor.enter(node, parent, context); })
      m_visitor.enter(node, parent, context);
    else if constexpr (requires { m_visitor.enter(node, parent); })
      m_visitor.enter(node, parent);
  }

  template <typename Node>
  void
  _exit(const Node &node, const Parent &parent, Context &context)
  {
    if constexpr (requires { m_visitor.exit(node, parent, context); })
      m_visitor.exit(node, parent, context);
    else if constexpr (requires { m_visitor.exit(node, parent); })
      m_visitor.exit(node, parent);
  }

  Visitor &m_visitor;
}; // class prn::detail::walker

} // namespace prn::detail


/**
 * Walk a source syntax tree depth first.
 *
 * For every node the traverser calls `visitor.enter(node, parent)`, then walks
 * the children of the node from left to right, then calls
 * `visitor.exit(node, parent)`. Both hooks are optional and are looked up per
 * node type: a visitor only declares overloads for the nodes it is interested
 * in. `parent` is empty (`std::monostate`) for the root.
 *
 * A hook may also accept a third argument, `Context &context`. Each node gets
 * its own copy of the context of its parent; whatever `enter` assigns to it is
 * what the children of the node receive. The root gets \p context.
 *
 * Usage example:
 * ```
 * struct call_counter {
 *   void
 *   enter(const ast::call_expression &, const ast::parent &)
 *   { ncalls += 1; }
 *
 *   size_t ncalls = 0;
 * };
 *
 * call_counter counter;
 * traverse(program, counter);
 * ```
 *
 * \ingroup frontend
 */
template <typename Visitor, typename Context = std::monostate>
void
traverse(const ast::program &root, Visitor &&visitor, Context context = {})
{
  using walker = detail::walker<ast::parent, std::remove_reference_t<Visitor>,
                                Context>;
  walker {visitor}.walk(root, ast::parent {}, std::move(context));
}


/**
 * Walk a target syntax tree depth first.
 *
 * Same as the source tree overload. Children of an expression statement are
 * its call; children of a call are its arguments (the callee is not visited).
 *
 * \ingroup frontend
 */
template <typename Visitor, typename Context = std::monostate>
void
traverse(const target::program &root, Visitor &&visitor, Context context = {})
{
  using walker = detail::walker<target::parent,
                                std::remove_reference_t<Visitor>, Context>;
  walker {visitor}.walk(root, target::parent {}, std::move(context));
}

} // namespace prn
