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

#include "paren/paren.hpp"
#include "paren/logging.hpp"
#include "paren/pretty_print.hpp"
#include "paren/reader.hpp"
#include "paren/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace std {
namespace fs = std::filesystem;
}


// Text of the last stage the compilation went through
static std::string
render_stage(const prn::compilation &comp, prn::stage last)
{
  switch (last)
  {
    case prn::stage::tokens: return prn::pprint(comp.tokens.value());
    case prn::stage::ast: return prn::pprint(comp.source_ast.value());
    case prn::stage::target: return prn::pprint(comp.target_ast.value());
    case prn::stage::code: return comp.output.value() + "\n";
  }
  std::terminate();
}


static void
read_compile_print_loop(const prn::lexer &lexer)
{
  using namespace prn;

  init_readline();

  reader reader {lexer};
  for (std::string line; prompt_line(reader.pending() ? "| " : "> ", line);
       line.clear())
  {
    try
    {
      // Feed new piece of text into the reader
      reader << line + "\n";

      // Compile every completed expression
      ast::expression expr;
      while (reader >> expr)
      {
        extract_names(expr);

        ast::program program;
        program.body.push_back(std::move(expr));
        std::cout << generate(transform(program)) << std::endl;
      }
    }
    catch (const bad_code &exn)
    {
      std::cout << exn.display() << std::endl;
    }
  }

  cleanup_readline();
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace prn;

  std::string verbosity {loglevel_name(loglevel::info)};
  std::vector<std::string> flags;
  std::string emit {stage_name(stage::code)};
  std::string opath;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help", "produce help message")
    ("input-file", po::value<std::fs::path>(), "input file to compile")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity level (silent, error, warning, info, debug)")
    ("flag,f", po::value<std::vector<std::string>>(&flags), "enable optional behaviour (MultiDigitNumbers)")
    ("emit,e", po::value<std::string>(&emit), "stage to print (tokens, ast, target, code)")
    ("output,o", po::value<std::string>(&opath), "write result to the specified file")
    ("timing", "report execution time of compilation stages");

  po::positional_options_description posdesc;
  posdesc.add("input-file", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [input-file]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  stage last;
  try
  {
    loglevel = parse_loglevel(verbosity);
    last = parse_stage(emit);
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }

  // Set global flags
  for (const std::string &flag : flags)
    global_flags.emplace(flag);

  lexer_options lexopts;
  lexopts.multidigit_numbers = global_flags.contains("MultiDigitNumbers");
  const lexer lexer {lexopts};

  const bool timing = varmap.contains("timing");

  // Without an input file run the REPL
  if (not varmap.contains("input-file"))
  {
    read_compile_print_loop(lexer);
    if (timing)
      execution_timer::report_global_stats();
    return EXIT_SUCCESS;
  }

  const std::fs::path inputpath = varmap["input-file"].as<std::fs::path>();
  std::ifstream inputfile {inputpath, std::ios::binary};
  if (not inputfile.is_open())
  {
    error("Could not open input file '{}'", inputpath.c_str());
    return EXIT_FAILURE;
  }

  compilation comp;
  comp.source_name = inputpath.string();
  try
  {
    info("compiling {} up to {}", comp.source_name, stage_name(last));
    run_lexer(comp, lexer, inputfile);
    run_pipeline(comp, last);
  }
  catch (const bad_code &exn)
  {
    error("{}", exn.display());
    if (timing)
      execution_timer::report_global_stats();
    return EXIT_FAILURE;
  }

  if (timing)
    execution_timer::report_global_stats();

  const std::string result = render_stage(comp, last);
  if (opath.empty())
    std::cout << result;
  else if (std::ofstream ofile {opath})
  {
    ofile << result;
    info("result written to {}", opath);
  }
  else
  {
    error("Could not open output file '{}'", opath);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
