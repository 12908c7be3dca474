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

#include <cstddef>
#include <string>
#include <string_view>

/**
 * \file source_location.hpp
 * Source location tracking for tokens and syntax trees
 *
 * \ingroup frontend
 */

namespace prn {

/**
 * Structure representing a location in the input stream
 *
 * \ingroup frontend
 */
struct source_location {
  source_location() = default;

  source_location(std::string_view source, size_t start, size_t end)
  : source {source},
    start {start},
    end {end}
  { }

  bool
  operator == (const source_location &other) const
  { return source == other.source and start == other.start and end == other.end; }

  std::string source; ///< Source name (filepath or "<string>")
  size_t start = 0; ///< Start offset in the input stream
  size_t end = 0;   ///< End offset in the input stream
};


/**
 * Location covering both \p first and \p last
 *
 * Both locations are expected to refer to the same source.
 */
[[nodiscard]] inline source_location
span(const source_location &first, const source_location &last)
{ return {first.source, first.start, last.end}; }


/**
 * Display a fragment of a file according to location with surrounding context
 * and highlighting of the location region
 *
 * Sources with names enclosed in angle brackets (e.g. "<string>") are not
 * files; for them only the offsets are reported.
 *
 * \param location Source location to display
 * \param context_lines Number of context lines to show before and after the location
 * \return Formatted string with the file fragment and highlighting
 */
[[nodiscard]] std::string
display_location(const source_location &location, size_t context_lines = 2,
                 std::string_view hlstyle = "\e[38;5;1;1m",
                 std::string_view ctxstyle = "",
                 std::string_view endstyle = "\e[0m");

} // namespace prn
