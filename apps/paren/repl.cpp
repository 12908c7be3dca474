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


#include "repl.hpp"

#include "paren/traverser.hpp"

#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <vector>

// Readline headers
#include <readline/readline.h>
#include <readline/history.h>


static const char history_file[] = ".paren_history";

// Call names seen so far, offered for autocompletion
static std::set<std::string> used_names;


// Helper function to read a line with prompt using readline
bool
prompt_line(const std::string &prompt, std::string &line)
{
  char *input = readline(prompt.c_str());

  // EOF or error
  if (!input)
    return false;

  line = input;

  if (not line.empty())
    add_history(input);

  free(input);
  return true;
}


// Readline completion function
static char *
_name_generator(const char *text, int state)
{
  static std::vector<std::string> matching_names;
  static size_t name_index;

  // If this is a new word to complete, collect the candidates
  if (state == 0)
  {
    matching_names.clear();
    name_index = 0;

    const size_t prefixlen = strlen(text);
    for (const std::string &name : used_names)
    {
      if (name.compare(0, prefixlen, text) == 0)
        matching_names.push_back(name);
    }
  }

  if (name_index < matching_names.size())
    return strdup(matching_names[name_index++].c_str());

  // No more matches
  return nullptr;
}


static char **
_paren_completion(const char *text, [[maybe_unused]] int start,
                  [[maybe_unused]] int end)
{
  // Don't do filename completion even if our generator finds no matches
  rl_attempted_completion_over = 1;
  return rl_completion_matches(text, _name_generator);
}


void
init_readline()
{
  rl_readline_name = "paren";
  rl_attempted_completion_function = _paren_completion;
  rl_bind_key('\t', rl_complete);
  read_history(history_file);
}


void
cleanup_readline()
{
  write_history(history_file);
  history_truncate_file(history_file, 500);
}


namespace {

struct name_collector {
  void
  enter(const prn::ast::call_expression &call, const prn::ast::parent &)
  { used_names.insert(call.name); }
};

} // anonymous namespace


void
extract_names(const prn::ast::expression &expr)
{
  // Wrap into a program to reuse the traverser
  const prn::ast::program program {{expr}};
  prn::traverse(program, name_collector {});
}
