#include "paren/lexer.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace {

using prn::token_kind;

std::vector<prn::token>
tokenize(const std::string &input, bool multidigit = false)
{
  prn::lexer_options options;
  options.multidigit_numbers = multidigit;
  return prn::lexer {options}.tokenize(input);
}

// Test tokenizing a nested call
TEST(LexerTest, NestedCall)
{
  const std::vector<prn::token> tokens = tokenize("(add 2 (subtract 4 2))");

  const std::vector<prn::token> expected = {
      {token_kind::PAREN, "(", {}},      {token_kind::NAME, "add", {}},
      {token_kind::NUMBER, "2", {}},     {token_kind::PAREN, "(", {}},
      {token_kind::NAME, "subtract", {}}, {token_kind::NUMBER, "4", {}},
      {token_kind::NUMBER, "2", {}},     {token_kind::PAREN, ")", {}},
      {token_kind::PAREN, ")", {}},
  };
  EXPECT_EQ(tokens, expected);
}

// Test that whitespace of any kind only separates tokens
TEST(LexerTest, Whitespace)
{
  const std::vector<prn::token> tokens = tokenize(" \t(add\n\n  1\r\n2 )  ");

  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_TRUE(tokens[0].is_lparen());
  EXPECT_EQ(tokens[1].text, "add");
  EXPECT_EQ(tokens[2].text, "1");
  EXPECT_EQ(tokens[3].text, "2");
  EXPECT_TRUE(tokens[4].is_rparen());
}

// Test empty and whitespace-only input
TEST(LexerTest, EmptyInput)
{
  EXPECT_TRUE(tokenize("").empty());
  EXPECT_TRUE(tokenize("   \n\t ").empty());
}

// Every digit is a separate number unless asked otherwise
TEST(LexerTest, SingleDigitNumbers)
{
  const std::vector<prn::token> tokens = tokenize("42");

  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].kind, token_kind::NUMBER);
  EXPECT_EQ(tokens[0].text, "4");
  EXPECT_EQ(tokens[1].kind, token_kind::NUMBER);
  EXPECT_EQ(tokens[1].text, "2");
  EXPECT_EQ(tokens[1].location.start, 1u);
  EXPECT_EQ(tokens[1].location.end, 2u);
}

// Test the option to scan runs of digits as one number
TEST(LexerTest, MultiDigitNumbers)
{
  const std::vector<prn::token> tokens = tokenize("(add 42 7)", true);

  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[2].kind, token_kind::NUMBER);
  EXPECT_EQ(tokens[2].text, "42");
  EXPECT_EQ(tokens[2].location.start, 5u);
  EXPECT_EQ(tokens[2].location.end, 7u);
  EXPECT_EQ(tokens[3].text, "7");
}

// Test string literals
TEST(LexerTest, Strings)
{
  const std::vector<prn::token> tokens = tokenize("(concat \"hello, world\" \"\")");

  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[2].kind, token_kind::STRING);
  EXPECT_EQ(tokens[2].text, "hello, world");
  EXPECT_EQ(tokens[2].location.start, 8u);
  EXPECT_EQ(tokens[2].location.end, 22u);
  EXPECT_EQ(tokens[3].kind, token_kind::STRING);
  EXPECT_EQ(tokens[3].text, "");
}

// Any character, including parentheses, is taken verbatim inside a string
TEST(LexerTest, StringContentIsVerbatim)
{
  const std::vector<prn::token> tokens = tokenize("\"(a) #1\\n\"");

  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].text, "(a) #1\\n");
}

// Test names made of letters in either case
TEST(LexerTest, Names)
{
  const std::vector<prn::token> tokens = tokenize("AddTwo x1");

  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0].kind, token_kind::NAME);
  EXPECT_EQ(tokens[0].text, "AddTwo");
  EXPECT_EQ(tokens[1].kind, token_kind::NAME);
  EXPECT_EQ(tokens[1].text, "x");
  EXPECT_EQ(tokens[2].kind, token_kind::NUMBER);
  EXPECT_EQ(tokens[2].text, "1");
}

// Test token locations
TEST(LexerTest, Locations)
{
  const std::vector<prn::token> tokens = tokenize("(add 2)");

  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0].location, prn::source_location("<string>", 0, 1));
  EXPECT_EQ(tokens[1].location, prn::source_location("<string>", 1, 4));
  EXPECT_EQ(tokens[2].location, prn::source_location("<string>", 5, 6));
  EXPECT_EQ(tokens[3].location, prn::source_location("<string>", 6, 7));
}

// Test tokenizing from a stream
TEST(LexerTest, TokenizeStream)
{
  std::istringstream input {"(print \"hi\")"};
  const std::vector<prn::token> tokens = prn::lexer {}.tokenize(input, "test.prn");

  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[2].text, "hi");
  EXPECT_EQ(tokens[2].location.source, "test.prn");
}

// Test rejection of unknown characters
TEST(LexerTest, UnexpectedCharacter)
{
  try
  {
    tokenize("(add 2 #)");
    FAIL() << "lex_error expected";
  }
  catch (const prn::lex_error &exn)
  {
    EXPECT_NE(std::string(exn.what()).find("'#'"), std::string::npos);
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->start, 7u);
    EXPECT_EQ(exn.location()->end, 8u);
  }
}

// Test that punctuation common in other Lisps is rejected as well
TEST(LexerTest, NoQuotesOrSymbols)
{
  EXPECT_THROW(tokenize("'(a)"), prn::lex_error);
  EXPECT_THROW(tokenize("(+ 1 2)"), prn::lex_error);
  EXPECT_THROW(tokenize("(add 1.5)"), prn::lex_error);
}

// Test unterminated string literal
TEST(LexerTest, UnterminatedString)
{
  try
  {
    tokenize("(print \"hello)");
    FAIL() << "lex_error expected";
  }
  catch (const prn::lex_error &exn)
  {
    EXPECT_NE(std::string(exn.what()).find("Unterminated"), std::string::npos);
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->start, 7u);
  }
}

} // anonymous namespace
