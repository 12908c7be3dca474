#include "paren/code_generator.hpp"
#include "paren/target_ast.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace {

namespace target = prn::target;

struct throwing_text {
  operator std::string () const
  { throw std::runtime_error {"no text"}; }
};


// Test rendering of every node type
TEST(CodeGeneratorTest, Leaves)
{
  EXPECT_EQ(prn::generate(target::identifier {"print"}), "print");
  EXPECT_EQ(prn::generate(target::number_literal {"7"}), "7");
  EXPECT_EQ(prn::generate(target::string_literal {"hi there"}), "\"hi there\"");
  EXPECT_EQ(prn::generate(target::string_literal {""}), "\"\"");
}

// Number text is written exactly as given
TEST(CodeGeneratorTest, NumbersAreVerbatim)
{
  EXPECT_EQ(prn::generate(target::number_literal {"007"}), "007");
}

// Test calls and statements
TEST(CodeGeneratorTest, Calls)
{
  const target::call_expression call {
      {"add"},
      {target::number_literal {"2"},
       target::call_expression {{"subtract"},
                                {target::number_literal {"4"},
                                 target::number_literal {"2"}}}}};

  EXPECT_EQ(prn::generate(call), "add(2, subtract(4, 2))");
  EXPECT_EQ(prn::generate(target::expression_statement {call}),
            "add(2, subtract(4, 2));");
  EXPECT_EQ(prn::generate(target::call_expression {{"f"}, {}}), "f()");
}

// Test joining of program statements
TEST(CodeGeneratorTest, Program)
{
  const target::program program {{
      target::expression_statement {{{"a"}, {target::string_literal {"x"}}}},
      target::expression_statement {{{"b"}, {}}},
      target::number_literal {"5"},
  }};

  EXPECT_EQ(prn::generate(program), "a(\"x\");\nb();\n5");
  EXPECT_EQ(prn::generate(target::program {}), "");
}

// Test generic node dispatch
TEST(CodeGeneratorTest, NodeDispatch)
{
  const target::node node = target::identifier {"x"};
  EXPECT_EQ(prn::generate(node), "x");
}

// Test the guard against nodes left empty by a failed assignment
TEST(CodeGeneratorTest, ValuelessNode)
{
  target::node node = target::number_literal {"1"};
  EXPECT_THROW(node.emplace<target::string_literal>(throwing_text {}),
               std::runtime_error);
  ASSERT_TRUE(node.valueless_by_exception());

  EXPECT_THROW((void)prn::generate(node), prn::codegen_error);
}

} // anonymous namespace
