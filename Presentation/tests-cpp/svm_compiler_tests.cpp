#include <gtest/gtest.h>
#include "../../Application/svm-compiler/compiler.hpp"
#include <limits>

using svm::Instruction;
using svm::Op;

static svm::Program compile_ok(const char* src){
  svm::Compiler c;
  auto res = c.compile(std::string(src));
  EXPECT_TRUE(res.diags.empty());
  return res.program;
}

TEST(Compiler, MapsEveryFixedToken){
  auto p = compile_ok("+ - * / load store jmp cjmp . dup swap = < >");
  std::vector<Op> want = {Op::Add, Op::Sub, Op::Mul, Op::Div, Op::Load, Op::Store, Op::Jmp,
                          Op::CJmp, Op::Put, Op::Dup, Op::Swap, Op::Eq, Op::Lt, Op::Gt};
  ASSERT_EQ(p.size(), want.size());
  for (size_t i = 0; i < want.size(); ++i) EXPECT_EQ(p[i].op, want[i]) << "at " << i;
}

TEST(Compiler, Literals){
  auto p = compile_ok("0 42 -7 +5 9223372036854775807 -9223372036854775808");
  ASSERT_EQ(p.size(), 6u);
  EXPECT_EQ(p[0], Instruction::lit(0));
  EXPECT_EQ(p[1], Instruction::lit(42));
  EXPECT_EQ(p[2], Instruction::lit(-7));
  EXPECT_EQ(p[3], Instruction::lit(5));
  EXPECT_EQ(p[4], Instruction::lit(9223372036854775807LL));
  EXPECT_EQ(p[5].arg, std::numeric_limits<long long>::min());
}

TEST(Compiler, MinusAloneIsSubtraction){
  auto p = compile_ok("- -1");
  ASSERT_EQ(p.size(), 2u);
  EXPECT_EQ(p[0].op, Op::Sub);
  EXPECT_EQ(p[1], Instruction::lit(-1));
}

TEST(Compiler, Labels){
  auto p = compile_ok("0: 1: 12:");
  ASSERT_EQ(p.size(), 3u);
  EXPECT_EQ(p[0], Instruction::label(0));
  EXPECT_EQ(p[1], Instruction::label(1));
  EXPECT_EQ(p[2], Instruction::label(12));
}

TEST(Compiler, ReportsMalformedTokensWithPosition){
  svm::Compiler c;
  auto res = c.compile(std::string("1 2 +\n  exit label0: -3: : 99999999999999999999"));
  ASSERT_EQ(res.diags.size(), 5u);
  EXPECT_EQ(res.diags[0], "[line 2:3] malformed token 'exit'");
  EXPECT_NE(res.diags[1].find("'label0:'"), std::string::npos);
  EXPECT_NE(res.diags[2].find("'-3:'"), std::string::npos);
  EXPECT_NE(res.diags[3].find("':'"), std::string::npos);
  EXPECT_NE(res.diags[4].find("99999999999999999999"), std::string::npos);
}

TEST(Compiler, CompileOrThrowCarriesDiagnostics){
  try {
    svm::compileOrThrow("1 foo 2 bar");
    FAIL() << "expected CompileError";
  } catch (const svm::CompileError& e) {
    ASSERT_EQ(e.diagnostics().size(), 2u);
    EXPECT_NE(std::string(e.what()).find("foo"), std::string::npos);
  }
}

TEST(Compiler, ListingRecompilesToSameProgram){
  const char* src = "10 0 store 0: 0 load . 1 0 load - 0 store 0 load 0 cjmp 0";
  auto p = compile_ok(src);
  EXPECT_EQ(svm::to_source(p), src);
  EXPECT_EQ(compile_ok(svm::to_source(p).c_str()), p);
}

TEST(Compiler, ProgramJson){
  auto j = svm::dump_program_json(compile_ok("7 0: ."));
  ASSERT_EQ(j.size(), 3u);
  EXPECT_EQ(j[0]["op"], "lit");
  EXPECT_EQ(j[0]["arg"], 7);
  EXPECT_EQ(j[1]["op"], "label");
  EXPECT_EQ(j[2]["ip"], 2);
  EXPECT_FALSE(j[2].contains("arg"));
}
