#include "paren/parser.hpp"
#include "paren/lexer.hpp"
#include "paren/pretty_print.hpp"

#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <vector>

namespace {

namespace ast = prn::ast;

ast::program
parse(const std::string &input)
{
  const std::vector<prn::token> tokens = prn::lexer {}.tokenize(input);
  return prn::parser {}.parse(tokens);
}

ast::number_literal
num(const std::string &value)
{ return {value, {}}; }

ast::string_literal
str(const std::string &value)
{ return {value, {}}; }

ast::call_expression
call(const std::string &name, std::vector<ast::expression> params)
{ return {name, std::move(params), {}}; }


// Test parsing a nested call
TEST(ParserTest, NestedCall)
{
  const ast::program program = parse("(add 2 (subtract 4 2))");

  ASSERT_EQ(program.body.size(), 1u);
  const auto &add = std::get<ast::call_expression>(program.body[0]);
  EXPECT_EQ(add.name, "add");
  ASSERT_EQ(add.params.size(), 2u);
  EXPECT_EQ(std::get<ast::number_literal>(add.params[0]).value, "2");

  const auto &subtract = std::get<ast::call_expression>(add.params[1]);
  EXPECT_EQ(subtract.name, "subtract");
  ASSERT_EQ(subtract.params.size(), 2u);
  EXPECT_EQ(std::get<ast::number_literal>(subtract.params[0]).value, "4");
  EXPECT_EQ(std::get<ast::number_literal>(subtract.params[1]).value, "2");
}

// Test comparison against a hand-built tree
TEST(ParserTest, StructuralEquality)
{
  const ast::program expected {{
      call("concat", {str("a"), call("upper", {str("b")}), num("1")}),
      call("print", {}),
  }};
  EXPECT_EQ(parse("(concat \"a\" (upper \"b\") 1) (print)"), expected);
}

// Test parsing several top-level forms
TEST(ParserTest, MultipleTopLevelForms)
{
  const ast::program program = parse("(a 1) (b \"x\")\n(c)");

  ASSERT_EQ(program.body.size(), 3u);
  EXPECT_EQ(std::get<ast::call_expression>(program.body[0]).name, "a");
  EXPECT_EQ(std::get<ast::call_expression>(program.body[1]).name, "b");
  EXPECT_EQ(std::get<ast::call_expression>(program.body[2]).name, "c");
  EXPECT_TRUE(std::get<ast::call_expression>(program.body[2]).params.empty());
}

// Literals are valid top-level expressions
TEST(ParserTest, TopLevelLiterals)
{
  const ast::program program = parse("42 \"s\"");

  ASSERT_EQ(program.body.size(), 3u);
  EXPECT_EQ(program.body[0], ast::expression {num("4")});
  EXPECT_EQ(program.body[1], ast::expression {num("2")});
  EXPECT_EQ(program.body[2], ast::expression {str("s")});
}

// Test that empty input gives an empty program
TEST(ParserTest, EmptyProgram)
{
  EXPECT_TRUE(parse("").body.empty());
  EXPECT_TRUE(parse("  \n ").body.empty());
}

// Test node locations
TEST(ParserTest, Locations)
{
  const ast::program program = parse("(f 1 (g \"x\"))");

  const auto &f = std::get<ast::call_expression>(program.body[0]);
  EXPECT_EQ(f.location.start, 0u);
  EXPECT_EQ(f.location.end, 13u);

  const auto &one = std::get<ast::number_literal>(f.params[0]);
  EXPECT_EQ(one.location.start, 3u);
  EXPECT_EQ(one.location.end, 4u);

  const auto &g = std::get<ast::call_expression>(f.params[1]);
  EXPECT_EQ(g.location.start, 5u);
  EXPECT_EQ(g.location.end, 12u);
}

// Test missing closing parenthesis
TEST(ParserTest, UnbalancedParens)
{
  EXPECT_THROW(parse("(add 2"), prn::incomplete_input);
  EXPECT_THROW(parse("(add 2 (subtract 4 2)"), prn::incomplete_input);
  EXPECT_THROW(parse("("), prn::incomplete_input);
}

// Incomplete input is a parse error too
TEST(ParserTest, IncompleteInputIsParseError)
{
  EXPECT_THROW(parse("(add 2"), prn::parse_error);
}

// Test call without a name
TEST(ParserTest, MissingCallName)
{
  try
  {
    parse("(2 3)");
    FAIL() << "parse_error expected";
  }
  catch (const prn::incomplete_input &)
  {
    FAIL() << "complete input reported as incomplete";
  }
  catch (const prn::parse_error &exn)
  {
    EXPECT_NE(std::string(exn.what()).find("call name"), std::string::npos);
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->start, 1u);
  }

  EXPECT_THROW(parse("(() 1)"), prn::parse_error);
  EXPECT_THROW(parse("(\"f\" 1)"), prn::parse_error);
}

// Test tokens that can't start an expression
TEST(ParserTest, UnexpectedToken)
{
  EXPECT_THROW(parse(")"), prn::parse_error);
  EXPECT_THROW(parse("(add 1))"), prn::parse_error);
  EXPECT_THROW(parse("add"), prn::parse_error);
  EXPECT_THROW(parse("(add x)"), prn::parse_error);
}

// Test that the cursor stays in place when an expression can't be parsed
TEST(ParserTest, CursorPreservedOnFailure)
{
  const std::vector<prn::token> tokens = prn::lexer {}.tokenize("(a 1) (b 2");
  prn::parser parser;

  size_t pos = 0;
  const ast::expression first = parser.parse_expression(tokens, pos);
  EXPECT_EQ(std::get<ast::call_expression>(first).name, "a");
  EXPECT_EQ(pos, 4u);

  EXPECT_THROW(parser.parse_expression(tokens, pos), prn::incomplete_input);
  EXPECT_EQ(pos, 4u);
}

} // anonymous namespace
