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

#include "paren/lexer.hpp"
#include "paren/source_location.hpp"

#include <algorithm>
#include <format>
#include <string>

/**
 * \file format.hpp
 * Formatting utilities
 *
 * This file defines `std::formatter` specializations for tokens and source
 * locations so they can be used directly in log records and error messages.
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for prn::token
 *
 * The default style gives `kind 'text'`; with `t` only the token text is
 * written, as it appeared in the source (string tokens get their quotes
 * back).
 *
 * \ingroup utils
 */
template <>
struct formatter<prn::token, char> {
  bool text_only = false;

  template <class ParseContext>
  constexpr typename ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == 't')
    {
      text_only = true;
      it++;
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for prn::token"};
    return it;
  }

  template <class FmtContext>
  typename FmtContext::iterator
  format(const prn::token &tok, FmtContext &ctx) const
  {
    const std::string text =
        tok.kind == prn::token_kind::STRING ? "\"" + tok.text + "\"" : tok.text;
    if (text_only)
      return std::ranges::copy(text, ctx.out()).out;
    return std::format_to(ctx.out(), "{} '{}'", prn::token_kind_name(tok.kind),
                          text);
  }
};


/**
 * Formatter for prn::source_location, written as `source:start-end`
 *
 * \ingroup utils
 */
template <>
struct formatter<prn::source_location, char> {
  template <class ParseContext>
  constexpr typename ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it != '}')
      throw std::format_error {
          "Invalid format arguments for prn::source_location"};
    return it;
  }

  template <class FmtContext>
  typename FmtContext::iterator
  format(const prn::source_location &loc, FmtContext &ctx) const
  { return std::format_to(ctx.out(), "{}:{}-{}", loc.source, loc.start, loc.end); }
};

} // namespace std
