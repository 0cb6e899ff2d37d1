#include <gtest/gtest.h>
#include "../../Domain/svm-lang/lexer.hpp"

TEST(Lexer, EmptySourceYieldsOnlyEof){
  svm::Lexer lx("");
  auto toks = lx.Lex();
  ASSERT_EQ(toks.size(), 1u);
  EXPECT_EQ(toks[0].kind, svm::TokenKind::Eof);
}

TEST(Lexer, SplitsOnAnyWhitespace){
  svm::Lexer lx("  10\t0 store\r\n0:\n\n  .  ");
  auto toks = lx.Lex();
  ASSERT_EQ(toks.size(), 6u);
  EXPECT_EQ(toks[0].lexeme, "10");
  EXPECT_EQ(toks[1].lexeme, "0");
  EXPECT_EQ(toks[2].lexeme, "store");
  EXPECT_EQ(toks[3].lexeme, "0:");
  EXPECT_EQ(toks[4].lexeme, ".");
  EXPECT_EQ(toks[5].kind, svm::TokenKind::Eof);
}

TEST(Lexer, TracksLineAndColumn){
  svm::Lexer lx("1 2 +\n  dup .");
  auto toks = lx.Lex();
  ASSERT_EQ(toks.size(), 6u);
  EXPECT_EQ(toks[2].line, 1u);
  EXPECT_EQ(toks[2].col, 5u);
  EXPECT_EQ(toks[3].lexeme, "dup");
  EXPECT_EQ(toks[3].line, 2u);
  EXPECT_EQ(toks[3].col, 3u);
  EXPECT_EQ(toks[4].col, 7u);
}

TEST(Lexer, NoOperatorSplittingInsideWords){
  svm::Lexer lx("1+2 <=");
  auto toks = lx.Lex();
  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(toks[0].lexeme, "1+2");
  EXPECT_EQ(toks[1].lexeme, "<=");
}
