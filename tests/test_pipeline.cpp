#include "paren/paren.hpp"
#include "paren/logging.hpp"
#include "paren/utilities/execution_timer.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

// Test the canonical example
TEST(PipelineTest, CompileNestedCall)
{
  EXPECT_EQ(prn::compile("(add 2 (subtract 4 2))"), "add(2, subtract(4, 2));");
}

// Test compiling several statements
TEST(PipelineTest, CompileProgram)
{
  const std::string source =
      "(print \"hello\")\n"
      "(add 1 (mul 2 3) (neg 4))\n"
      "(exit)\n";
  EXPECT_EQ(prn::compile(source),
            "print(\"hello\");\n"
            "add(1, mul(2, 3), neg(4));\n"
            "exit();");
}

// Literal text reaches the output unchanged
TEST(PipelineTest, LiteralsAreVerbatim)
{
  EXPECT_EQ(prn::compile("(say \"Hello,   World!\" 0)"),
            "say(\"Hello,   World!\", 0);");
}

// Multi-digit numerals are split into digits by default
TEST(PipelineTest, SingleDigitNumbers)
{
  EXPECT_EQ(prn::compile("(add 42 1)"), "add(4, 2, 1);");
  EXPECT_EQ(prn::compile("42"), "4\n2");

  prn::lexer_options options;
  options.multidigit_numbers = true;
  EXPECT_EQ(prn::compile("(add 42 1)", options), "add(42, 1);");
}

// Test that empty input gives empty output
TEST(PipelineTest, EmptyInput)
{
  EXPECT_EQ(prn::compile(""), "");
}

// Test propagation of failures
TEST(PipelineTest, Errors)
{
  EXPECT_THROW((void)prn::compile("(add 2"), prn::parse_error);
  EXPECT_THROW((void)prn::compile("(add 2 #)"), prn::lex_error);
  EXPECT_THROW((void)prn::compile("(1 2)"), prn::parse_error);
}

// Test running the stages one by one
TEST(PipelineTest, Stages)
{
  prn::compilation comp;
  comp.source_name = "<test>";

  prn::run_lexer(comp, prn::lexer {}, "(f 1)");
  ASSERT_TRUE(comp.tokens.has_value());
  EXPECT_EQ(comp.tokens->size(), 4u);
  EXPECT_EQ(comp.tokens->at(1).location.source, "<test>");

  prn::run_pipeline(comp, prn::stage::ast);
  ASSERT_TRUE(comp.source_ast.has_value());
  EXPECT_FALSE(comp.target_ast.has_value());

  prn::run_transformer(comp);
  ASSERT_TRUE(comp.target_ast.has_value());
  EXPECT_FALSE(comp.output.has_value());

  prn::run_code_generator(comp);
  ASSERT_TRUE(comp.output.has_value());
  EXPECT_EQ(*comp.output, "f(1);");
}

// Test reading the source from a stream
TEST(PipelineTest, StreamInput)
{
  prn::compilation comp;
  std::istringstream input {"(f \"a\")\n(g)"};
  prn::run_lexer(comp, prn::lexer {}, input);
  prn::run_pipeline(comp, prn::stage::code);
  EXPECT_EQ(comp.output, "f(\"a\");\ng();");
}

// Test steps run out of order
TEST(PipelineTest, MissingStage)
{
  prn::compilation comp;
  prn::parser parser;
  EXPECT_THROW(prn::run_parser(comp, parser), prn::pipeline_error);
  EXPECT_THROW(prn::run_transformer(comp), prn::pipeline_error);
  EXPECT_THROW(prn::run_code_generator(comp), prn::pipeline_error);
}

// Test stage names used on the command line
TEST(PipelineTest, StageNames)
{
  for (prn::stage s : {prn::stage::tokens, prn::stage::ast, prn::stage::target,
                       prn::stage::code})
    EXPECT_EQ(prn::parse_stage(prn::stage_name(s)), s);
  EXPECT_THROW(prn::parse_stage("assembly"), std::runtime_error);
}

// Stages are timed under the names of the step functions
TEST(PipelineTest, Timing)
{
  prn::execution_timer::reset_global_stats();
  prn::execution_timer timer {"compile"};
  (void)prn::compile("(f 1)");
  timer.stop();

  EXPECT_GT(timer.elapsed<std::chrono::nanoseconds>().count(), 0);
  prn::loglevel = prn::loglevel::silent;
  EXPECT_NO_THROW(prn::execution_timer::report_global_stats());

  // Statistics stay usable after a failed compilation
  EXPECT_THROW((void)prn::compile("(add 2"), prn::parse_error);
  EXPECT_NO_THROW(prn::execution_timer::report_global_stats());
  prn::loglevel = prn::loglevel::warning;
}

// Test compiling on several threads at once
TEST(PipelineTest, ConcurrentCompile)
{
  constexpr int nthreads = 4;
  constexpr int ncompilations = 200;

  std::vector<int> nmatches(nthreads, 0);
  std::vector<std::thread> threads;
  for (int t = 0; t < nthreads; ++t)
  {
    threads.emplace_back([&nmatches, t] {
      for (int i = 0; i < ncompilations; ++i)
      {
        if (prn::compile("(add 2 (subtract 4 2))") == "add(2, subtract(4, 2));")
          nmatches[t] += 1;
      }
    });
  }
  for (std::thread &thread : threads)
    thread.join();

  for (int t = 0; t < nthreads; ++t)
    EXPECT_EQ(nmatches[t], ncompilations);
}

} // anonymous namespace
