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


#include "paren/source_location.hpp"
#include "paren/logging.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>


static std::string_view
_safe_substr(std::string_view str, size_t start, size_t count)
{
  start = std::min(start, str.size());
  return str.substr(start, count);
}


// Offsets of the first character of each line
static std::vector<size_t>
_line_offsets(std::string_view content)
{
  std::vector<size_t> offsets {0};
  for (size_t i = 0; i < content.size(); ++i)
  {
    if (content[i] == '\n')
      offsets.push_back(i + 1);
  }
  return offsets;
}


// Index of the line containing offset `pos`
static size_t
_line_of(const std::vector<size_t> &offsets, size_t pos)
{
  const auto it = std::upper_bound(offsets.begin(), offsets.end(), pos);
  return std::distance(offsets.begin(), it) - 1;
}


std::string
prn::display_location(const source_location &location, size_t context_lines,
                      std::string_view hlstyle, std::string_view ctxstyle,
                      std::string_view endstyle)
{
  // If the source is not a file, report offsets only
  if (location.source.empty() or location.source[0] == '<')
    return std::format("in {}: offset {} to {}", location.source,
                       location.start, location.end);

  std::ifstream file {location.source, std::ios_base::binary};
  if (not file.is_open())
    return std::format("Could not open file: {}", location.source);

  const std::string content {std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>()};
  if (location.start > content.size() or location.end > content.size())
    return std::format("<invalid location in {}>", location.source);

  const std::vector<size_t> offsets = _line_offsets(content);
  const size_t start_line = _line_of(offsets, location.start);
  const size_t end_line = _line_of(offsets, location.end == location.start
                                                ? location.end
                                                : location.end - 1);

  // Expand line range with context lines
  const size_t display_start =
      start_line > context_lines ? start_line - context_lines : 0;
  const size_t display_end =
      std::min(end_line + context_lines, offsets.size() - 1);

  std::ostringstream output;
  output << std::format("in {}:{}:{} to {}:{}\n", location.source,
                        start_line + 1, location.start - offsets[start_line] + 1,
                        end_line + 1, location.end - offsets[end_line] + 1);

  for (size_t i = display_start; i <= display_end; ++i)
  {
    const size_t line_start = offsets[i];
    size_t line_end = i + 1 < offsets.size() ? offsets[i + 1] - 1 : content.size();
    if (line_end > line_start and content[line_end - 1] == '\r')
      line_end--; // CRLF line endings
    const std::string_view line =
        _safe_substr(content, line_start, line_end - line_start);

    output << std::format("{:4d} | ", i + 1) << ctxstyle;

    if (i < start_line or i > end_line)
    { // Regular line, no highlighting
      output << line << endstyle << "\n";
      continue;
    }

    // Highlighted columns of this line
    const size_t hlstart =
        i == start_line ? location.start - line_start : 0;
    const size_t hlend =
        i == end_line ? std::min(location.end - line_start, line.size())
                      : line.size();

    output << _safe_substr(line, 0, hlstart);
    output << endstyle << hlstyle;
    output << _safe_substr(line, hlstart, hlend - hlstart);
    output << endstyle << ctxstyle;
    output << _safe_substr(line, hlend, std::string_view::npos);
    output << endstyle << "\n";
  }

  return output.str();
}
